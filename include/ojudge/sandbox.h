#ifndef INCLUDE_OJUDGE_SANDBOX_H_
#define INCLUDE_OJUDGE_SANDBOX_H_

#include <string>

#include "submission.h"

// KiB
extern long kMaxRSS;
extern long kMaxOutput;
// Real time * kTimeMultiplier = Indicated time
extern double kTimeMultiplier;
// used when a problem leaves its limits unset
extern long kDefaultTimeLimitMs;
extern long kDefaultMemoryLimitKb;

struct ExecLimits {
  long time_ms;
  long memory_kb;
  long output_kb; // 0 = kMaxOutput
};

ExecLimits ProblemLimits(const Problem&);

// What the sandbox observed about one finished process
struct ExecutionStats {
  bool time_killed;
  bool oom_killed;
  bool signaled;
  int signal;
  int exit_status;
  long cpu_time_us, wall_time_us;
  long peak_memory_kb;
};

// Never returns PASSED/WRONG_ANSWER/COMPILATION_ERROR; OK means the output is ready to be compared.
// Anything beyond the time limit is TIME_LIMIT_EXCEEDED regardless of how the process died.
Outcome ClassifyExecution(const ExecutionStats&, const ExecLimits&);

struct RunResult {
  Outcome outcome;
  std::string output, error; // stdout & stderr; for compilation, error holds the diagnostics
  int exit_status;
  long cpu_time_ms, wall_time_ms;
  long peak_memory_kb;

  RunResult() :
      outcome(Outcome::OK), exit_status(0),
      cpu_time_ms(0), wall_time_ms(0), peak_memory_kb(0) {}
};

// A run is one grading attempt of one submission. Compile prepares the program of the run; every
// Execute gets a fresh scratch box, so nothing leaks between test cases. Release removes everything
// belonging to the run.
// Implementations throw InfrastructureFailure if a process could not be run at all.
class Sandbox {
 public:
  virtual ~Sandbox() = default;

  // outcome is OK or COMPILATION_ERROR
  virtual RunResult Compile(long run_id, Language, const std::string& code) = 0;
  // index is the 1-based execution index within the run
  virtual RunResult Execute(long run_id, int index, Language, const std::string& input, const ExecLimits&) = 0;
  virtual void Release(long run_id) = 0;

  // compile + execute once + release
  RunResult Run(Language, const std::string& code, const std::string& input, const ExecLimits&);
};

// cjail-backed sandbox; requires root and the sandbox-exec helper in the data directory
class CJailSandbox : public Sandbox {
 public:
  RunResult Compile(long run_id, Language, const std::string& code) override;
  RunResult Execute(long run_id, int index, Language, const std::string& input, const ExecLimits&) override;
  void Release(long run_id) override;
};

#endif  // INCLUDE_OJUDGE_SANDBOX_H_
