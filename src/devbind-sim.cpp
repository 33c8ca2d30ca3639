/* Run an emulated system and report the driver bindings.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

#include <unistd.h>

#include <devbind/config_class.hpp>
#include <devbind/exceptions.hpp>
#include <devbind/kernel/module.hpp>
#include <devbind/log.hpp>
#include <devbind/plugin.hpp>
#include <devbind/simulation.hpp>
#include <devbind/tool.hpp>

namespace devbind {
namespace tools {

class Sim : public Tool {

public:
  Sim(int argc, char *argv[]) : Tool(argc, argv, "sim"), listModules(false) {}

protected:
  std::string uri;
  bool listModules;

  void handler(int signal, siginfo_t *, void *) {
    logger->info("Received {} signal. Terminating...", strsignal(signal));

    exit(EXIT_FAILURE);
  }

  void usage() {
    std::cout << "Usage: devbind-sim [OPTIONS] CONFIG" << std::endl
              << "  CONFIG  is the path to a configuration file or '-' for "
                 "stdin"
              << std::endl
              << "  OPTIONS is one or more of the following options:"
              << std::endl
              << "    -l      list the available modules" << std::endl
              << "    -d LVL  set logging level" << std::endl
              << "    -h      show this usage information" << std::endl
              << "    -V      show the version of the tool" << std::endl
              << std::endl;

    printCopyright();
  }

  void parse() {
    int c;
    while ((c = getopt(argc, argv, "hVld:")) != -1) {
      switch (c) {
      case 'V':
        printVersion();
        exit(EXIT_SUCCESS);

      case 'l':
        listModules = true;
        break;

      case 'd':
        Log::getInstance().setLevel(optarg);
        break;

      case 'h':
      case '?':
        usage();
        exit(c == '?' ? EXIT_FAILURE : EXIT_SUCCESS);
      }
    }

    if (listModules)
      return;

    if (argc != optind + 1) {
      usage();
      exit(EXIT_FAILURE);
    }

    uri = argv[optind];
  }

  int main() {
    if (listModules) {
      if (plugin::registry)
        plugin::registry->dump<kernel::ModuleFactory>();

      return 0;
    }

    Config cfg(uri);
    Simulation sim;

    sim.parse(cfg.root);
    sim.start();
    sim.dump();
    sim.stop();

    return 0;
  }
};

} // namespace tools
} // namespace devbind

int main(int argc, char *argv[]) {
  devbind::tools::Sim t(argc, argv);

  return t.run();
}
