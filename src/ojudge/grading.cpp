#include <ojudge/grading.h>

#include <algorithm>

#include <spdlog/spdlog.h>

#include <ojudge/errors.h>
#include <ojudge/reporter.h>
#include <ojudge/artifacts.h>
#include "utils.h"

namespace {

struct ReleaseGuard {
  Sandbox& sandbox;
  long run_id;
  ~ReleaseGuard() { sandbox.Release(run_id); }
};

TestStatusRecord ToStatusRecord(const TestResult& res) {
  TestStatusRecord rec;
  rec.index = res.index;
  rec.sequence_number = res.sequence_number;
  rec.sample = res.is_sample;
  rec.outcome = res.outcome;
  rec.time_ms = res.time_ms;
  rec.memory_kb = res.memory_kb;
  rec.exit_status = res.exit_status;
  rec.counted = res.counted;
  return rec;
}

} // namespace

AggregateResult Grade(Sandbox& sandbox, const GradeInput& input, const GradeOptions& opt,
                      const Reporter* reporter) {
  const std::string& id = input.submission_id;
  std::vector<const TestCase*> tests;
  for (auto& i : input.tests) tests.push_back(&i);
  std::stable_sort(tests.begin(), tests.end(), [](const TestCase* a, const TestCase* b) {
    return a->sequence_number < b->sequence_number;
  });
  for (size_t i = 1; i < tests.size(); i++) {
    if (tests[i]->sequence_number == tests[i - 1]->sequence_number) {
      throw InfrastructureFailure(
          "duplicate test sequence number " + std::to_string(tests[i]->sequence_number));
    }
  }

  Comparator compare = opt.compare ? opt.compare : MakeComparator("exact");
  AggregateResult res;
  res.total = tests.size();
  for (auto& i : tests) res.total_points += i->points;

  long run_id = GetUniqueRunId();
  ReleaseGuard guard{sandbox, run_id};

  spdlog::info("Grading submission {}: run={} tests={}", id, run_id, tests.size());
  RunResult compile = sandbox.Compile(run_id, input.language, input.code);
  if (compile.outcome != Outcome::OK) {
    res.status = Status::COMPILATION_ERROR;
    res.compile_message = compile.error;
    WriteCompileMessage(id, compile.error);
    TestStatusRecord rec;
    rec.outcome = Outcome::COMPILATION_ERROR;
    AppendTestStatus(id, rec);
    spdlog::info("Submission {}: compilation error", id);
    return res;
  }

  std::optional<TestResult> decisive;
  const TestCase* decisive_tc = nullptr;
  int index = 0;
  for (auto& tc : tests) {
    if (decisive && !opt.run_all_tests && !(opt.continue_samples && tc->is_sample)) continue;
    TestResult result;
    result.index = ++index;
    result.sequence_number = tc->sequence_number;
    result.is_sample = tc->is_sample;
    result.counted = !decisive || opt.run_all_tests;

    bool deadline_hit = opt.deadline && std::chrono::steady_clock::now() >= *opt.deadline;
    if (deadline_hit) {
      spdlog::warn("Submission {}: deadline reached before test {}", id, tc->sequence_number);
      result.outcome = Outcome::TIME_LIMIT_EXCEEDED;
      result.exit_status = -1;
    } else {
      RunResult run = sandbox.Execute(run_id, result.index, input.language, tc->input, input.limits);
      result.outcome = run.outcome;
      if (result.outcome == Outcome::OK) {
        result.outcome = compare(run.output, tc->expected_output) ?
            Outcome::PASSED : Outcome::WRONG_ANSWER;
      }
      result.time_ms = run.cpu_time_ms;
      result.memory_kb = run.peak_memory_kb;
      result.exit_status = run.exit_status;
      result.output = std::move(run.output);
      result.error = std::move(run.error);
    }
    spdlog::debug("Submission {}: test {} (seq {}) -> {} time={}ms mem={}KiB", id, result.index,
                  result.sequence_number, OutcomeName(result.outcome), result.time_ms, result.memory_kb);

    WriteOutput(id, result.index, result.output, result.error);
    AppendTestStatus(id, ToStatusRecord(result));
    if (reporter && reporter->ReportTestResult) reporter->ReportTestResult(id, result);

    if (result.counted) {
      res.runtime_ms = std::max(res.runtime_ms, result.time_ms);
      res.memory_kb = std::max(res.memory_kb, result.memory_kb);
      if (result.outcome == Outcome::PASSED) {
        res.passed++;
        res.points += tc->points;
      } else if (IsFailure(result.outcome) && (!decisive || result.outcome > decisive->outcome)) {
        // strict comparison: ties go to the earliest test
        decisive = result;
        decisive_tc = tc;
      }
    }
    res.tests.push_back(std::move(result));
    if (deadline_hit) break;
  }

  if (decisive) {
    res.status = OutcomeToStatus(decisive->outcome);
    res.failed_test = decisive->index;
    WriteFailedTest(id, *decisive_tc);
  } else {
    res.status = Status::ACCEPTED;
  }
  spdlog::info("Submission {}: {} passed={}/{}", id, StatusName(res.status), res.passed, res.total);
  return res;
}
