#ifndef INCLUDE_OJUDGE_GRADING_H_
#define INCLUDE_OJUDGE_GRADING_H_

#include <chrono>
#include <string>
#include <vector>
#include <optional>

#include "compare.h"
#include "sandbox.h"
#include "submission.h"

struct Reporter;

struct TestResult {
  int index; // 1-based execution index
  int sequence_number;
  bool is_sample;
  Outcome outcome;
  long time_ms;
  long memory_kb;
  int exit_status;
  bool counted;
  std::string output, error;

  TestResult() :
      index(0), sequence_number(0), is_sample(false), outcome(Outcome::OK),
      time_ms(0), memory_kb(0), exit_status(0), counted(true) {}
};

struct AggregateResult {
  Status status;
  std::vector<TestResult> tests;
  int passed, total;
  long runtime_ms, memory_kb; // max over counted tests
  long points, total_points;
  int failed_test; // index of the verdict-determining test; 0 if none
  std::string compile_message;

  AggregateResult() :
      status(Status::PENDING), passed(0), total(0),
      runtime_ms(0), memory_kb(0), points(0), total_points(0), failed_test(0) {}
};

struct GradeInput {
  std::string submission_id;
  Language language;
  std::string code;
  ExecLimits limits;
  std::vector<TestCase> tests; // any order; graded by ascending sequence number
};

struct GradeOptions {
  Comparator compare;
  // without it, hidden tests after the first failure are not run
  bool run_all_tests;
  // keep running sample tests after the first failure (not counted toward the verdict)
  bool continue_samples;
  std::optional<std::chrono::steady_clock::time_point> deadline;

  GradeOptions() : run_all_tests(false), continue_samples(false) {}
};

// Compiles once and runs each test through the sandbox, appending status artifacts as it goes.
// Grading outcomes are data in the result; InfrastructureFailure propagates.
AggregateResult Grade(Sandbox&, const GradeInput&, const GradeOptions&, const Reporter* = nullptr);

#endif  // INCLUDE_OJUDGE_GRADING_H_
