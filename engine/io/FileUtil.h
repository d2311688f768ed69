#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Scrim::FileUtil {

bool readFileBytes(const std::string &path, std::vector<uint8_t> &out);
bool readTextFile(const std::string &path, std::string &out);

std::string directoryOf(const std::string &path);

} // namespace Scrim::FileUtil
