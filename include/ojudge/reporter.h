#ifndef INCLUDE_OJUDGE_REPORTER_H_
#define INCLUDE_OJUDGE_REPORTER_H_

#include <string>
#include <functional>

#include "grading.h"
#include "submission.h"

struct Reporter {
  // these functions should not block
  std::function<void(const Submission&)> ReportStartProcessing;
  std::function<void(const std::string& submission_id, const TestResult&)> ReportTestResult;
  std::function<void(const Submission&, const AggregateResult&)> ReportOverallResult;
  // called with the stored record once it is terminal (including FAILED)
  std::function<void(const Submission&, size_t queue_size)> ReportFinalized;
};

#endif  // INCLUDE_OJUDGE_REPORTER_H_
