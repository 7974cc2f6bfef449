#include <ojudge/sandbox.h>

#include <signal.h>

#include <spdlog/spdlog.h>
#include "utils.h"

long kMaxRSS = 2 * 1024 * 1024; // 2G
long kMaxOutput = 64 * 1024; // 64M
double kTimeMultiplier = 1.0;
long kDefaultTimeLimitMs = 2000;
long kDefaultMemoryLimitKb = 256 * 1024;

ExecLimits ProblemLimits(const Problem& problem) {
  ExecLimits lim;
  lim.time_ms = problem.time_limit_ms > 0 ? problem.time_limit_ms : kDefaultTimeLimitMs;
  lim.memory_kb = problem.memory_limit_kb > 0 ? problem.memory_limit_kb : kDefaultMemoryLimitKb;
  lim.output_kb = 0;
  return lim;
}

Outcome ClassifyExecution(const ExecutionStats& st, const ExecLimits& lim) {
  if (st.oom_killed) return Outcome::MEMORY_LIMIT_EXCEEDED;
  // checked before signals: a process killed by RLIMIT_CPU or by the supervisor is still TLE
  if (st.time_killed || st.cpu_time_us > lim.time_ms * 1000L) return Outcome::TIME_LIMIT_EXCEEDED;
  if (st.signaled && st.signal == SIGXFSZ) return Outcome::RUNTIME_ERROR; // output limit
  // MLE will likely cause SIGSEGV or std::bad_alloc (SIGABRT), so we check it before signals
  if (lim.memory_kb && st.peak_memory_kb > lim.memory_kb) return Outcome::MEMORY_LIMIT_EXCEEDED;
  if (st.signaled || st.exit_status != 0) return Outcome::RUNTIME_ERROR;
  return Outcome::OK;
}

RunResult Sandbox::Run(Language lang, const std::string& code, const std::string& input, const ExecLimits& lim) {
  long id = GetUniqueRunId();
  struct ReleaseGuard {
    Sandbox& sandbox;
    long id;
    ~ReleaseGuard() { sandbox.Release(id); }
  } guard{*this, id};
  RunResult res = Compile(id, lang, code);
  if (res.outcome == Outcome::COMPILATION_ERROR) return res;
  return Execute(id, 1, lang, input, lim);
}
