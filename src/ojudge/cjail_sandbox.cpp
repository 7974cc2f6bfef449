#include <ojudge/sandbox.h>

#include <signal.h>
#include <sys/wait.h>
#include <regex>
#include <algorithm>
#include <cstring>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <ojudge/errors.h>
#include "tasks.h"
#include "paths.h"
#include "utils.h"

namespace {

constexpr size_t kMaxMsgLen = 4000;
constexpr size_t kMaxStderrLen = 64 * 1024;

inline long ToUs(const struct timeval& v) {
  return ((long)v.tv_sec * 1'000'000 + v.tv_usec) * (long double)kTimeMultiplier;
}

inline void CheckSandboxError(const struct cjail_result& res, const char* phase) {
  // timekill = -1 means SandboxExec error (see sandbox_exec.cpp, sandbox_main.cpp)
  if (res.timekill == -1) {
    throw InfrastructureFailure(fmt::format("{} sandbox failed: {}", phase, strerror(res.oomkill)));
  }
}

std::vector<fs::path> CompiledFiles(long id, Language lang) {
  if (lang != Language::JAVA) return {CompileBoxOutput(id, lang)};
  // nested and anonymous classes end up in their own class files
  std::vector<fs::path> ret;
  std::error_code ec;
  for (auto& entry : fs::directory_iterator(Workdir(CompileBoxPath(id)), ec)) {
    if (entry.path().extension() == ".class") ret.push_back(entry.path());
  }
  if (ec) throw InfrastructureFailure("cannot list compiled classes: " + ec.message());
  return ret;
}

// Scratch box of one execution; unmounted and destroyed when it goes out of scope
class ExecuteBox {
  fs::path box_, workdir_;
  bool mounted_;
 public:
  ExecuteBox(long id, int index) :
      box_(ExecuteBoxPath(id, index)), workdir_(Workdir(ExecuteBoxPath(id, index))), mounted_(false) {}
  ~ExecuteBox() {
    if (mounted_) Umount(workdir_);
    RemoveAll(box_);
  }
  ExecuteBox(const ExecuteBox&) = delete;
  ExecuteBox& operator=(const ExecuteBox&) = delete;

  // tmpfs bounds the total size of files written by the program
  bool Prepare(long tmpfs_size_kib) {
    if (!CreateDirs(workdir_)) return false;
    if (!(mounted_ = MountTmpfs(workdir_, tmpfs_size_kib))) return false;
    std::error_code ec;
    fs::permissions(workdir_, fs::perms::all, ec);
    return !ec;
  }
};

} // namespace

RunResult CJailSandbox::Compile(long id, Language lang, const std::string& code) {
  static const std::regex kFilterRegex(
      "(^|\\n)In file included from[\\S\\s]*?(\\n/workdir/prog|$)");
  static const std::string kFilterReplace = "$1[Error messages from headers removed]$2";

  if (!CreateDirs(Workdir(CompileBoxPath(id)), fs::perms::all) ||
      !WriteFile(CompileBoxInput(id, lang), code, kPerm666)) {
    throw InfrastructureFailure("cannot prepare compile box");
  }
  struct cjail_result res = RunCompile(id, lang);
  CheckSandboxError(res, "compile");

  RunResult ret;
  ret.exit_status = res.info.si_status;
  ret.wall_time_ms = ToUs(res.time) / 1000;
  ret.cpu_time_ms = (ToUs(res.rus.ru_utime) + ToUs(res.rus.ru_stime)) / 1000;
  ret.peak_memory_kb = res.rus.ru_maxrss;
  if (res.timekill || res.oomkill > 0 || res.info.si_code != CLD_EXITED || res.info.si_status != 0 ||
      !fs::is_regular_file(CompileBoxOutput(id, lang))) {
    ret.outcome = Outcome::COMPILATION_ERROR;
    std::string message;
    fs::path path = CompileBoxMessage(id);
    std::error_code ec;
    size_t total_length = fs::file_size(path, ec);
    if (!ec && ReadFile(path, message, kMaxMsgLen)) {
      message = std::regex_replace(message, kFilterRegex, kFilterReplace);
      if (total_length > kMaxMsgLen) {
        message += "\n[Error message truncated after " + std::to_string(kMaxMsgLen) + " bytes]";
      }
    }
    if (res.timekill) {
      message += "\n[Compilation time limit exceeded]";
    } else if (res.oomkill > 0) {
      message += "\n[Compilation memory limit exceeded]";
    }
    spdlog::info("Compilation failed: id={} lang={} code={} status={}",
                 id, LanguageName(lang), res.info.si_code, res.info.si_status);
    spdlog::debug("Message: {}", message);
    ret.error = std::move(message);
  } else {
    spdlog::info("Compilation successful: id={} lang={}", id, LanguageName(lang));
  }
  return ret;
}

RunResult CJailSandbox::Execute(long id, int index, Language lang, const std::string& input, const ExecLimits& lim) {
  long output_kb = lim.output_kb && lim.output_kb < kMaxOutput ? lim.output_kb : kMaxOutput;
  std::vector<fs::path> programs = CompiledFiles(id, lang);
  ExecuteBox box(id, index);
  {
    std::error_code ec;
    long tmpfs_size_kib = (input.size() / 4096 + 1) * 4 + std::min(output_kb * 2, kMaxOutput);
    for (auto& i : programs) {
      tmpfs_size_kib += (fs::file_size(i, ec) / 4096 + 1) * 4;
      if (ec) throw InfrastructureFailure("cannot stat compiled program: " + ec.message());
    }
    if (!box.Prepare(tmpfs_size_kib)) throw InfrastructureFailure("cannot prepare execute box");
  }
  fs::path dest_dir = ExecuteBoxProgram(id, index, lang).parent_path();
  for (auto& i : programs) {
    if (!Copy(i, dest_dir / i.filename(), ExecuteBoxProgramPerm(lang))) {
      throw InfrastructureFailure("cannot copy program into execute box");
    }
  }
  if (!WriteFile(ExecuteBoxInput(id, index), input, kPerm666)) {
    throw InfrastructureFailure("cannot write input into execute box");
  }

  struct cjail_result res = RunExecute(id, index, lang, lim);
  CheckSandboxError(res, "execute");

  ExecutionStats stats;
  stats.time_killed = res.timekill > 0;
  // oomkill = -1 means failed to read oom (see cjail/cjail.h)
  stats.oom_killed = res.oomkill > 0;
  stats.signaled = res.info.si_code == CLD_KILLED || res.info.si_code == CLD_DUMPED;
  stats.signal = stats.signaled ? res.info.si_status : 0;
  stats.exit_status = stats.signaled ? 0 : res.info.si_status;
  stats.cpu_time_us = ToUs(res.rus.ru_utime) + ToUs(res.rus.ru_stime);
  stats.wall_time_us = ToUs(res.time);
  stats.peak_memory_kb = res.rus.ru_maxrss;

  RunResult ret;
  ret.outcome = ClassifyExecution(stats, lim);
  ret.exit_status = stats.signaled ? 128 + stats.signal : stats.exit_status;
  ret.cpu_time_ms = stats.cpu_time_us / 1000;
  ret.wall_time_ms = stats.wall_time_us / 1000;
  ret.peak_memory_kb = stats.peak_memory_kb;
  // a missing output file just means the program wrote nothing
  if (!ReadFile(ExecuteBoxOutput(id, index), ret.output, output_kb * 1024)) ret.output.clear();
  if (!ReadFile(ExecuteBoxError(id, index), ret.error, kMaxStderrLen)) ret.error.clear();
  spdlog::info("Execute finished: id={} index={} code={} status={} outcome={} time={} wall={} rss={}",
               id, index, res.info.si_code, res.info.si_status, OutcomeName(ret.outcome),
               stats.cpu_time_us, stats.wall_time_us, stats.peak_memory_kb);
  return ret;
}

void CJailSandbox::Release(long id) {
  RemoveAll(SubmissionRunPath(id));
}
