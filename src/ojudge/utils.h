#ifndef OJUDGE_UTILS_H_
#define OJUDGE_UTILS_H_

#include <string>
#include <filesystem>

#include <ojudge/utils.h>

namespace fs = std::filesystem;

constexpr fs::perms kPerm666 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::group_write |
    fs::perms::others_read | fs::perms::others_write;

bool MountTmpfs(const fs::path&, long size_kib);
bool Umount(const fs::path&);
bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);

// These functions resolve symlinks
bool Copy(const fs::path& from, const fs::path& to, fs::perms = fs::perms::unknown);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);
// reads at most max_bytes (0 = everything); false if the file cannot be opened
bool ReadFile(const fs::path&, std::string& content, size_t max_bytes = 0);

#endif  // OJUDGE_UTILS_H_
