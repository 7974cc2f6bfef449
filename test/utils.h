#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <mutex>
#include <atomic>
#include <string>
#include <unordered_map>

#include <gtest/gtest.h>
#include <ojudge/sandbox.h>
#include <ojudge/reporter.h>

// In-process Sandbox driven by keywords in the submitted code:
//   "syntax error"   compilation fails
//   "wrong"          prints the input followed by "x"
//   "raise-on <s>"   exits with status 1 when the trimmed input is <s>
//   "sleep"          exceeds the time limit
//   "alloc"          exceeds the memory limit
//   "infra"          throws InfrastructureFailure (only the first `infra_failures` times if set)
// Anything else echoes its input.
class ScriptedSandbox : public Sandbox {
  std::mutex mtx_;
  std::unordered_map<long, std::string> programs_;

 public:
  std::atomic_int compiles{0};
  std::atomic_int executions{0};
  std::atomic_int releases{0};
  // -1 = every time
  std::atomic_int infra_failures{-1};

  RunResult Compile(long run_id, Language, const std::string& code) override;
  RunResult Execute(long run_id, int index, Language, const std::string& input, const ExecLimits&) override;
  void Release(long run_id) override;
};

class AssertVerdictReporter {
  bool has_overall_result_;

 public:
  Status expect_status;
  std::atomic_int test_results{0};

  explicit AssertVerdictReporter(Status status) :
      has_overall_result_(false), expect_status(status) {}
  ~AssertVerdictReporter() { EXPECT_TRUE(has_overall_result_); }

  Reporter GetReporter() {
    Reporter reporter;
    reporter.ReportTestResult = [&](const std::string&, const TestResult&) { test_results++; };
    reporter.ReportOverallResult = [&](const Submission&, const AggregateResult& res) {
      EXPECT_EQ(res.status, expect_status);
      has_overall_result_ = true;
    };
    return reporter;
  }
};

std::string Trimmed(const std::string&);

#endif // TEST_UTILS_H_
