#ifndef BENCHBOX_UTILS_H_
#define BENCHBOX_UTILS_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm644 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::others_read;

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);

// strip leading and trailing whitespace
std::string Trim(const std::string&);
std::string ToLower(std::string);

// A uniquely named directory that is removed with everything inside it on destruction.
class ScopedTempDir {
  fs::path path_;
 public:
  // creates root/prefixXXXXXX; path() is empty on failure
  ScopedTempDir(const fs::path& root, const std::string& prefix);
  ~ScopedTempDir();
  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const fs::path& path() const { return path_; }
  explicit operator bool() const { return !path_.empty(); }
};

#endif  // BENCHBOX_UTILS_H_
