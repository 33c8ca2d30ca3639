/* C interface of the emulated host kernel driver core.
 *
 * The layout of the records and the semantics of the entry points follow the
 * Linux driver model (include/linux/device.h, i2c.h, platform_device.h,
 * mod_devicetable.h, rtc.h and firmware.h).
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <errno.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef unsigned long kernel_ulong_t;

// Driver requests probing to be retried later.
#ifndef EPROBE_DEFER
#define EPROBE_DEFER 517
#endif

#define MAX_ERRNO 4095

static inline void *ERR_PTR(long error) { return (void *)error; }

static inline long PTR_ERR(const void *ptr) { return (long)ptr; }

static inline int IS_ERR(const void *ptr) {
  return (unsigned long)ptr >= (unsigned long)-MAX_ERRNO;
}

static inline int IS_ERR_OR_NULL(const void *ptr) {
  return !ptr || IS_ERR(ptr);
}

// Modules

struct module {
  const char *name;
};

// Device tree / Open Firmware

#define OF_NAME_SIZE 32
#define OF_TYPE_SIZE 32
#define OF_COMPATIBLE_SIZE 128

struct of_device_id {
  char name[OF_NAME_SIZE];
  char type[OF_TYPE_SIZE];
  char compatible[OF_COMPATIBLE_SIZE];
  const void *data; // Used by devbind to store the context offset
};

struct device_node {
  char full_name[OF_NAME_SIZE];
  char compatible[OF_COMPATIBLE_SIZE];
};

// Driver core

struct device;
struct device_driver;
struct device_private;

struct bus_type {
  const char *name;
  int (*match)(struct device *dev, struct device_driver *drv);
  int (*probe)(struct device *dev);
  int (*remove)(struct device *dev);
};

struct device_driver {
  const char *name;
  struct bus_type *bus;
  struct module *owner;
  const struct of_device_id *of_match_table;
};

struct device {
  struct device *parent;
  struct device_private *p; // Private to the host
  const char *init_name;
  struct bus_type *bus;
  struct device_driver *driver;
  void *driver_data; // Private-data slot, see dev_{get,set}_drvdata()
  struct device_node *of_node;
  void (*release)(struct device *dev);
};

void device_initialize(struct device *dev);
int device_add(struct device *dev);
void device_del(struct device *dev);
int device_register(struct device *dev);
void device_unregister(struct device *dev);

struct device *get_device(struct device *dev);
void put_device(struct device *dev);

const char *dev_name(const struct device *dev);
int dev_set_name(struct device *dev, const char *name);

void *dev_get_drvdata(const struct device *dev);
void dev_set_drvdata(struct device *dev, void *data);

int driver_register(struct device_driver *drv);
void driver_unregister(struct device_driver *drv);

// Device-managed resources, released in reverse order on unbind
int devm_add_action(struct device *dev, void (*action)(void *), void *data);
void devm_remove_action(struct device *dev, void (*action)(void *), void *data);
int devm_release_action(struct device *dev, void (*action)(void *), void *data);

// OF matching

const struct of_device_id *of_match_device(const struct of_device_id *matches,
                                           const struct device *dev);

// I2C

#define I2C_NAME_SIZE 20

#define I2C_CLIENT_TEN 0x10 // We have a ten bit chip address

struct i2c_device_id {
  char name[I2C_NAME_SIZE];
  kernel_ulong_t driver_data; // Used by devbind to store the context offset
};

struct i2c_client {
  unsigned short flags;
  unsigned short addr; // 7-bit addresses are stored in the lower 7 bits
  char name[I2C_NAME_SIZE];
  struct device dev;
};

struct i2c_driver {
  int (*probe_new)(struct i2c_client *client);
  int (*remove)(struct i2c_client *client);
  struct device_driver driver;
  const struct i2c_device_id *id_table;
};

struct i2c_board_info {
  char type[I2C_NAME_SIZE];
  unsigned short flags;
  unsigned short addr;
  const char *of_compatible;
};

extern struct bus_type i2c_bus_type;

int i2c_register_driver(struct module *owner, struct i2c_driver *driver);
void i2c_del_driver(struct i2c_driver *driver);

const struct i2c_device_id *i2c_match_id(const struct i2c_device_id *id,
                                         const struct i2c_client *client);

struct i2c_client *i2c_new_client_device(struct device *parent,
                                         const struct i2c_board_info *info);
void i2c_unregister_device(struct i2c_client *client);

static inline void *i2c_get_clientdata(const struct i2c_client *client) {
  return dev_get_drvdata(&client->dev);
}

static inline void i2c_set_clientdata(struct i2c_client *client, void *data) {
  dev_set_drvdata(&client->dev, data);
}

// Platform bus

#define PLATFORM_NAME_SIZE 24
#define PLATFORM_DEVID_NONE (-1)

struct platform_device {
  char name[PLATFORM_NAME_SIZE];
  int id;
  struct device dev;
};

struct platform_driver {
  int (*probe)(struct platform_device *pdev);
  int (*remove)(struct platform_device *pdev);
  struct device_driver driver;
};

extern struct bus_type platform_bus_type;

int __platform_driver_register(struct platform_driver *drv,
                               struct module *owner);
void platform_driver_unregister(struct platform_driver *drv);

struct platform_device *platform_device_register_simple(const char *name,
                                                        int id,
                                                        const char *of_compatible);
void platform_device_unregister(struct platform_device *pdev);

static inline void *platform_get_drvdata(const struct platform_device *pdev) {
  return dev_get_drvdata(&pdev->dev);
}

static inline void platform_set_drvdata(struct platform_device *pdev,
                                        void *data) {
  dev_set_drvdata(&pdev->dev, data);
}

// Real time clocks

struct rtc_time {
  int tm_sec;
  int tm_min;
  int tm_hour;
  int tm_mday;
  int tm_mon;
  int tm_year;
  int tm_wday;
  int tm_yday;
  int tm_isdst;
};

struct rtc_class_ops {
  int (*read_time)(struct device *dev, struct rtc_time *tm);
  int (*set_time)(struct device *dev, struct rtc_time *tm);
};

struct rtc_device {
  struct device dev;
  int id;
  int registered;
  const struct rtc_class_ops *ops;
};

struct rtc_device *devm_rtc_allocate_device(struct device *parent);
int devm_rtc_register_device(struct rtc_device *rtc);
void rtc_device_unregister(struct rtc_device *rtc);

int rtc_read_time(struct rtc_device *rtc, struct rtc_time *tm);
int rtc_set_time(struct rtc_device *rtc, struct rtc_time *tm);

struct rtc_device *rtc_class_open(const char *name);
void rtc_class_close(struct rtc_device *rtc);

// Firmware loading

struct firmware {
  size_t size;
  const uint8_t *data;
  void *priv; // Private to the host
};

int request_firmware(const struct firmware **fw, const char *name,
                     struct device *device);
int firmware_request_nowarn(const struct firmware **fw, const char *name,
                            struct device *device);
int request_firmware_direct(const struct firmware **fw, const char *name,
                            struct device *device);
void release_firmware(const struct firmware *fw);

#ifdef __cplusplus
} // extern "C"
#endif
