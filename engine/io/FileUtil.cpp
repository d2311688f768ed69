#include "FileUtil.h"

#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;

namespace Scrim::FileUtil {

bool readFileBytes(const std::string &path, std::vector<uint8_t> &out) {
  out.clear();
  FILE *f = std::fopen(path.c_str(), "rb");
  if (!f)
    return false;

  std::fseek(f, 0, SEEK_END);
  const long sz = std::ftell(f);
  std::fseek(f, 0, SEEK_SET);

  if (sz < 0) {
    std::fclose(f);
    return false;
  }

  out.resize((size_t)sz);
  if (sz > 0) {
    const size_t read = std::fread(out.data(), 1, (size_t)sz, f);
    std::fclose(f);
    return read == (size_t)sz;
  }

  std::fclose(f);
  return true;
}

bool readTextFile(const std::string &path, std::string &out) {
  std::vector<uint8_t> bytes;
  if (!readFileBytes(path, bytes))
    return false;
  out.assign((const char *)bytes.data(), bytes.size());
  return true;
}

std::string directoryOf(const std::string &path) {
  fs::path p(path);
  return p.parent_path().string();
}

} // namespace Scrim::FileUtil
