#include "Log.h"

#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Scrim::Log {

spdlog::level::level_enum levelFromName(std::string_view name) {
  if (name == "trace")
    return spdlog::level::trace;
  if (name == "debug")
    return spdlog::level::debug;
  if (name == "warn" || name == "warning")
    return spdlog::level::warn;
  if (name == "error")
    return spdlog::level::err;
  if (name == "off")
    return spdlog::level::off;
  return spdlog::level::info;
}

void Init(const LogSettings &settings) {
  namespace fs = std::filesystem;

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!settings.file.empty()) {
    const fs::path p(settings.file);
    std::error_code ec;
    if (p.has_parent_path())
      fs::create_directories(p.parent_path(), ec);
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(p.string(), true));
  }

  auto logger =
      std::make_shared<spdlog::logger>("scrim", sinks.begin(), sinks.end());
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%T] [%^%l%$] %v");
  spdlog::set_level(levelFromName(settings.level));
  spdlog::flush_on(spdlog::level::info);
}

} // namespace Scrim::Log
