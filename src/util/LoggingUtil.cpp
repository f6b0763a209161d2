#include "util/LoggingUtil.hpp"

#include "util/Exception.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace util {

int Logging::kTimestampPrefixLength;

spdlog::level::level_enum Logging::parse_level(const std::string& name) {
  if (name == "trace") return spdlog::level::trace;
  if (name == "debug") return spdlog::level::debug;
  if (name == "info") return spdlog::level::info;
  if (name == "warn") return spdlog::level::warn;
  if (name == "error") return spdlog::level::err;
  throw CleanException("Unknown log level \"{}\" (expected trace, debug, info, warn, or error)",
                       name);
}

void Logging::init(const Params& params) {
  std::vector<spdlog::sink_ptr> sinks;

  const char* format = params.omit_timestamps ? "%v" : "%Y-%m-%d %H:%M:%S.%f %v";

  if (params.omit_timestamps) {
    kTimestampPrefixLength = 0;
  } else {
    kTimestampPrefixLength = 27;  // "2024-03-12 17:13:11.259615 "
  }

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console_sink->set_pattern(format);
  sinks.push_back(console_sink);

  if (!params.log_filename.empty()) {
    auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(params.log_filename, !params.append_mode);
    file_sink->set_pattern(format);
    sinks.push_back(file_sink);
  }

  auto logger = std::make_shared<spdlog::logger>("multi_sink", sinks.begin(), sinks.end());
  spdlog::set_default_logger(logger);

  spdlog::flush_on(spdlog::level::warn);
  spdlog::set_level(parse_level(params.log_level));
}

}  // namespace util
