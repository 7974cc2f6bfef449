#ifndef INCLUDE_OJUDGE_API_H_
#define INCLUDE_OJUDGE_API_H_

#include <mutex>
#include <chrono>
#include <string>
#include <vector>
#include <optional>
#include <condition_variable>

#include "artifacts.h"
#include "database.h"
#include "dispatcher.h"
#include "submission.h"

// Verified identity handed over by the authentication layer
struct Identity {
  std::string user_id;
  bool is_admin;
};

struct FailedTestDetail {
  int index;
  int sequence_number;
  bool is_sample;
  Outcome outcome;
  std::string notes;
  // only for sample tests or administrators
  std::optional<std::string> input, expected_output, actual_output;
};

struct SubmissionDetails {
  Submission record;
  std::string code;
  std::vector<TestStatusRecord> tests;
  std::optional<FailedTestDetail> failed;
  std::string compile_message;
};

struct ApiOptions {
  size_t max_code_bytes;

  ApiOptions() : max_code_bytes(65536) {}
};

class SubmissionService {
  Database& db_;
  Dispatcher& dispatcher_;
  ApiOptions opt_;
  std::mutex notify_mtx_;
  std::condition_variable notify_cv_;
  unsigned long finalized_count_;

  std::string CreateAndEnqueue(Submission&& sub, const std::string& code);

 public:
  SubmissionService(Database&, Dispatcher&, ApiOptions = ApiOptions());

  // Throws ValidationError on empty/oversized code, unsupported language or unknown problem
  std::string Submit(const Identity&, const std::string& problem_id,
                     const std::string& language, const std::string& code);
  // Throws NotFound, or Forbidden if the requester is neither the owner nor an administrator
  SubmissionDetails GetDetails(const Identity&, const std::string& id);
  // Non-administrators only see their own submissions; asking for another user's is Forbidden
  std::vector<Submission> List(const Identity&, SubmissionFilter);
  // Administrators only; re-submits the code of a FAILED submission as a new one.
  // Throws ValidationError if the submission is not FAILED.
  std::string Requeue(const Identity&, const std::string& id);

  // Acceptance counters and complexity distributions; throws NotFound for an unknown problem
  ProblemStats GetProblemStats(const std::string& problem_id);

  // Long-poll helper; true if the submission is terminal before the timeout. Throws NotFound.
  bool WaitForTerminal(const std::string& id, std::chrono::milliseconds timeout);
  // Hook for Reporter::ReportFinalized
  void NotifyFinalized();
};

#endif  // INCLUDE_OJUDGE_API_H_
