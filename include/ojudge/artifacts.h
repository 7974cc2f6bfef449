#ifndef INCLUDE_OJUDGE_ARTIFACTS_H_
#define INCLUDE_OJUDGE_ARTIFACTS_H_

#include <string>
#include <vector>
#include <optional>

#include "submission.h"

// One line of the status artifact. A compilation failure is recorded with index 0.
struct TestStatusRecord {
  int index;
  int sequence_number;
  bool sample;
  Outcome outcome;
  long time_ms;
  long memory_kb;
  int exit_status;
  bool counted; // false if it ran after the verdict was already decided

  TestStatusRecord() :
      index(0), sequence_number(0), sample(false), outcome(Outcome::OK),
      time_ms(0), memory_kb(0), exit_status(0), counted(true) {}
};

// Artifacts live under kSubmissionRoot, partitioned by submission id.
// Writers throw InfrastructureFailure; readers return nullopt/empty if absent.
void WriteCode(const std::string& id, Language lang, const std::string& code);
std::optional<std::string> ReadCode(const std::string& id, Language lang);

void WriteOutput(const std::string& id, int index, const std::string& output, const std::string& error);
std::optional<std::string> ReadOutput(const std::string& id, int index);

void WriteCompileMessage(const std::string& id, const std::string& message);
std::string ReadCompileMessage(const std::string& id);

// Appended and flushed as each test completes
void AppendTestStatus(const std::string& id, const TestStatusRecord&);
// Skips a torn trailing line left by a crash
std::vector<TestStatusRecord> ReadTestStatus(const std::string& id);

// Copy of the verdict-determining test case as graded, so later edits of the problem do not
// change what a finished submission shows
void WriteFailedTest(const std::string& id, const TestCase&);
std::optional<TestCase> ReadFailedTest(const std::string& id);

// Drops everything produced by grading, keeping the code
void ResetGradingArtifacts(const std::string& id);

#endif  // INCLUDE_OJUDGE_ARTIFACTS_H_
