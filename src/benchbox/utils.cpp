#include "utils.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <algorithm>

#include <spdlog/spdlog.h>

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, {} bytes", path.c_str(), content.size());
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size())) {
      spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permissions of {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

std::string Trim(const std::string& str) {
  constexpr char kWhites[] = " \n\r\t\x0b\x0c";
  size_t begin = str.find_first_not_of(kWhites);
  if (begin == std::string::npos) return "";
  size_t end = str.find_last_not_of(kWhites);
  return str.substr(begin, end - begin + 1);
}

std::string ToLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

ScopedTempDir::ScopedTempDir(const fs::path& root, const std::string& prefix) {
  if (!CreateDirs(root)) return;
  std::string tmpl = (root / (prefix + "XXXXXX")).string();
  if (!mkdtemp(tmpl.data())) {
    spdlog::warn("Failed creating temporary directory in {}: {}", root.c_str(), strerror(errno));
    return;
  }
  path_ = tmpl;
  spdlog::debug("Created temporary directory {}", path_.c_str());
}

ScopedTempDir::~ScopedTempDir() {
  if (!path_.empty()) RemoveAll(path_);
}
