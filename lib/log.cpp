/* Logging.
 *
 * SPDX-FileCopyrightText: 2014-2023 Institute for Automation of Complex Power Systems, RWTH Aachen University
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>

#include <fnmatch.h>
#include <syslog.h>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>

#include <devbind/exceptions.hpp>
#include <devbind/log.hpp>

using namespace devbind;

Log::Log(Level lvl) : level(lvl), pattern("%H:%M:%S %^%l%$ %n: %v") {
  char *p = getenv("DEVBIND_LOG_PREFIX");
  if (p)
    prefix = p;

  sinks = std::make_shared<DistSink::element_type>();

  setLevel(level);
  setFormatter(pattern, prefix);

  // Default sink
  sink = std::make_shared<DefaultSink::element_type>();
  addSink(sink);
}

Logger Log::getNewLogger(const std::string &name) {
  Logger logger = spdlog::get(name);

  if (not logger) {
    logger = std::make_shared<Logger::element_type>(name, sinks);

    logger->set_level(level);

    for (auto &expr : expressions) {
      int flags = 0;
#ifdef FNM_EXTMATCH
      // musl-libc doesnt support this flag yet
      flags |= FNM_EXTMATCH;
#endif
      if (!fnmatch(expr.name.c_str(), name.c_str(), flags))
        logger->set_level(expr.level);
    }

    spdlog::register_logger(logger);
  }

  return logger;
}

Log::Expression::Expression(json_t *json) {
  int ret;

  const char *nme;
  const char *lvl;

  json_error_t err;

  ret = json_unpack_ex(json, &err, JSON_STRICT, "{ s: s, s: s }", "name", &nme,
                       "level", &lvl);
  if (ret)
    throw ConfigError(json, err, "logging-expressions");

  level = spdlog::level::from_str(lvl);
  name = nme;
}

void Log::parse(json_t *json) {
  const char *lvl = nullptr;
  const char *path = nullptr;
  const char *pat = nullptr;

  int syslog = 0;
  int ret;

  json_error_t err;
  json_t *json_expressions = nullptr;

  ret = json_unpack_ex(json, &err, JSON_STRICT,
                       "{ s?: s, s?: s, s?: o, s?: b, s?: s }", "level", &lvl,
                       "file", &path, "expressions", &json_expressions,
                       "syslog", &syslog, "pattern", &pat);
  if (ret)
    throw ConfigError(json, err, "logging");

  if (lvl)
    setLevel(lvl);

  if (pat)
    setFormatter(pat, prefix);

  if (path) {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
    addSink(sink);
  }

  if (syslog) {
    auto sink = std::make_shared<spdlog::sinks::syslog_sink_mt>(
        "devbind", LOG_PID, LOG_DAEMON, true);
    addSink(sink);
  }

  if (json_expressions) {
    if (!json_is_array(json_expressions))
      throw ConfigError(json_expressions, "logging-expressions",
                        "The 'expressions' setting must be a list of objects.");

    size_t i;
    json_t *json_expression;

    // cppcheck-suppress unknownMacro
    json_array_foreach(json_expressions, i, json_expression)
        expressions.emplace_back(json_expression);

    // Apply expressions to loggers which have been created before
    spdlog::apply_all([this](Logger logger) {
      for (auto &expr : expressions) {
        if (!fnmatch(expr.name.c_str(), logger->name().c_str(), 0))
          logger->set_level(expr.level);
      }
    });
  }
}

void Log::setFormatter(const std::string &pat, const std::string &pfx) {
  pattern = pat;
  prefix = pfx;

  formatter = std::make_shared<spdlog::pattern_formatter>(
      prefix + pattern, spdlog::pattern_time_type::utc);

  sinks->set_formatter(formatter->clone());
}

void Log::setLevel(Level lvl) {
  level = lvl;

  sinks->set_level(lvl);

  spdlog::apply_all([lvl](Logger logger) { logger->set_level(lvl); });
}

void Log::setLevel(const std::string &lvl) {
  auto l = spdlog::level::from_str(lvl);
  if (l == Level::off && lvl != "off")
    throw RuntimeError("Invalid log level {}", lvl);

  setLevel(l);
}

Log::Level Log::getLevel() const { return level; }
