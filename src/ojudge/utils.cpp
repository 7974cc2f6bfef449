#include "utils.h"

#include <sys/mount.h>
#include <mutex>
#include <atomic>
#include <algorithm>
#include <chrono>
#include <random>
#include <cstring>
#include <fstream>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace {

std::atomic_long run_id_seq = 0;
std::atomic_long submission_id_seq = 0;

} // namespace

long GetUniqueRunId() {
  return ++run_id_seq;
}

std::string GenerateSubmissionId() {
  static std::mutex mtx;
  static std::mt19937_64 rng(std::random_device{}());
  uint64_t rnd;
  {
    std::lock_guard lck(mtx);
    rnd = rng();
  }
  uint64_t seconds = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  uint64_t seq = ++submission_id_seq;
  return fmt::format("{:08x}{:06x}{:010x}",
      seconds & 0xffffffffULL, seq & 0xffffffULL, rnd & 0xffffffffffULL);
}

int64_t CurrentTimestamp() {
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG2(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageName, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG3(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageExtension, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG1(Status, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* StatusName, Status, ENUM_STATUS_)
#undef X

#define X(...) X_RETURN_ARG2(Outcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeName, Outcome, ENUM_OUTCOME_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

std::optional<Language> ParseLanguage(const std::string& str) {
#define X(name, tag, ext) if (str == tag) return Language::name;
  ENUM_LANGUAGE_
#undef X
  if (str == "c++") return Language::CPP;
  if (str == "python3") return Language::PYTHON;
  if (str == "js") return Language::JAVASCRIPT;
  return std::nullopt;
}

std::optional<Status> ParseStatus(const std::string& str) {
#define X(name) if (str == #name) return Status::name;
  ENUM_STATUS_
#undef X
  return std::nullopt;
}

std::optional<Outcome> ParseOutcome(const std::string& str) {
#define X(name, desc) if (str == desc) return Outcome::name;
  ENUM_OUTCOME_
#undef X
  return std::nullopt;
}

bool IsTerminal(Status status) {
  return status != Status::PENDING && status != Status::PROCESSING;
}

bool IsValidTransition(Status from, Status to) {
  if (from == Status::PENDING) return to == Status::PROCESSING;
  if (from == Status::PROCESSING) return IsTerminal(to);
  return false;
}

bool IsFailure(Outcome outcome) {
  return outcome >= Outcome::WRONG_ANSWER;
}

Status OutcomeToStatus(Outcome outcome) {
  switch (outcome) {
    case Outcome::OK: [[fallthrough]];
    case Outcome::PASSED: return Status::ACCEPTED;
    case Outcome::WRONG_ANSWER: return Status::WRONG_ANSWER;
    case Outcome::MEMORY_LIMIT_EXCEEDED: return Status::MEMORY_LIMIT_EXCEEDED;
    case Outcome::TIME_LIMIT_EXCEEDED: return Status::TIME_LIMIT_EXCEEDED;
    case Outcome::RUNTIME_ERROR: return Status::RUNTIME_ERROR;
    case Outcome::COMPILATION_ERROR: return Status::COMPILATION_ERROR;
  }
  __builtin_unreachable();
}

bool MountTmpfs(const fs::path& path, long size_kib) {
  spdlog::debug("Mount tmpfs on {}, size {}", path.c_str(), size_kib);
  bool ret = 0 == mount("tmpfs", path.c_str(), "tmpfs", 0,
                        ("size=" + std::to_string(size_kib) + 'k').c_str());
  if (!ret) spdlog::warn("Failed mounting tmpfs on {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool Umount(const fs::path& path) {
  spdlog::debug("Umount {}", path.c_str());
  bool ret = 0 == umount(path.c_str());
  if (!ret) spdlog::warn("Failed unmounting {}: {}", path.c_str(), strerror(errno));
  return ret;
}

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

bool Copy(const fs::path& from, const fs::path& to, fs::perms perms) {
  spdlog::debug("Copy file {} -> {}", from.c_str(), to.c_str());
  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(to, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed copying {} -> {}: {}", from.c_str(), to.c_str(), ec.message());
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {} size={}", path.c_str(), content.size());
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout.write(content.data(), content.size()) || !fout.flush()) {
      spdlog::warn("Failed writing {}", path.c_str());
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permission of {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool ReadFile(const fs::path& path, std::string& content, size_t max_bytes) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return false;
  content.clear();
  constexpr size_t kBufSize = 65536;
  char buf[kBufSize];
  while (fin) {
    size_t want = kBufSize;
    if (max_bytes) {
      if (content.size() >= max_bytes) break;
      want = std::min(want, max_bytes - content.size());
    }
    fin.read(buf, want);
    content.append(buf, fin.gcount());
  }
  return true;
}
