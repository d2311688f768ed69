#include "EngineConfig.h"

#include "io/FileUtil.h"

#include <filesystem>
#include <nlohmann/json.hpp>

namespace Scrim {

using json = nlohmann::json;

static float num(const json &obj, const char *key, float def) {
  const auto it = obj.find(key);
  if (it == obj.end() || !it->is_number())
    return def;
  return it->get<float>();
}

static std::string str(const json &obj, const char *key,
                       const std::string &def) {
  const auto it = obj.find(key);
  if (it == obj.end() || !it->is_string())
    return def;
  return it->get<std::string>();
}

static const json &section(const json &root, const char *key) {
  static const json empty = json::object();
  const auto it = root.find(key);
  if (it == root.end() || !it->is_object())
    return empty;
  return *it;
}

std::optional<EngineConfig> EngineConfigIO::parse(std::string_view text) {
  const json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object())
    return std::nullopt;

  EngineConfig cfg{};

  const json &log = section(j, "log");
  cfg.log.level = str(log, "level", cfg.log.level);
  cfg.log.file = str(log, "file", cfg.log.file);

  const json &layout = section(j, "layout");
  LayoutHeuristics &l = cfg.layout;
  l.charWidthFactor = num(layout, "charWidthFactor", l.charWidthFactor);
  l.boldCharWidthFactor =
      num(layout, "boldCharWidthFactor", l.boldCharWidthFactor);
  l.lineHeightFactor = num(layout, "lineHeightFactor", l.lineHeightFactor);
  l.defaultFontSizePx = num(layout, "defaultFontSizePx", l.defaultFontSizePx);
  l.fallbackAnchorX = num(layout, "fallbackAnchorX", l.fallbackAnchorX);
  l.fallbackAnchorY = num(layout, "fallbackAnchorY", l.fallbackAnchorY);

  const json &manip = section(j, "manipulation");
  ManipulationSettings &m = cfg.manipulation;
  m.minScale = num(manip, "minScale", m.minScale);
  m.minLocalExtentPx = num(manip, "minLocalExtentPx", m.minLocalExtentPx);
  m.handleHitRadiusPx = num(manip, "handleHitRadiusPx", m.handleHitRadiusPx);
  m.rotateHandleOffsetPx =
      num(manip, "rotateHandleOffsetPx", m.rotateHandleOffsetPx);

  return cfg;
}

std::optional<EngineConfig> EngineConfigIO::load(const std::string &absPath) {
  std::string text;
  if (!FileUtil::readTextFile(absPath, text))
    return std::nullopt;

  auto cfg = parse(text);
  if (!cfg)
    return std::nullopt;

  // Relative log files live next to the config.
  if (!cfg->log.file.empty() &&
      std::filesystem::path(cfg->log.file).is_relative()) {
    const std::string dir = FileUtil::directoryOf(absPath);
    if (!dir.empty())
      cfg->log.file = (std::filesystem::path(dir) / cfg->log.file).string();
  }
  return cfg;
}

} // namespace Scrim
