#include <fstream>
#include <gtest/gtest.h>
#include <ojudge/paths.h>
#include <ojudge/errors.h>
#include <ojudge/grading.h>
#include <ojudge/artifacts.h>

#include "example_problem.h"

namespace {

const char kSubmissionId[] = "0123456789abcdef01234567";

std::vector<TestCase> MakeTests(std::initializer_list<std::pair<int, bool>> seq_sample) {
  std::vector<TestCase> ret;
  for (auto& [seq, sample] : seq_sample) {
    TestCase tc;
    tc.sequence_number = seq;
    tc.input = tc.expected_output = std::to_string(seq) + '\n';
    tc.is_sample = sample;
    tc.points = seq * 10;
    ret.push_back(tc);
  }
  return ret;
}

} // namespace

class GradingTest : public ExampleProblem {
 protected:
  GradeInput Input(const std::string& code, std::vector<TestCase>&& tests) {
    GradeInput input;
    input.submission_id = kSubmissionId;
    input.language = Language::CPP;
    input.code = code;
    input.limits = {1000, 65536, 0};
    input.tests = std::move(tests);
    return input;
  }

  GradeOptions options;
};

TEST_F(GradingTest, Accepted) {
  auto res = Grade(sandbox, Input("echo", MakeTests({{1, true}, {2, false}, {3, false}})), options);
  EXPECT_EQ(res.status, Status::ACCEPTED);
  EXPECT_EQ(res.passed, 3);
  EXPECT_EQ(res.total, 3);
  EXPECT_EQ(res.points, 60);
  EXPECT_EQ(res.total_points, 60);
  EXPECT_EQ(res.failed_test, 0);
  EXPECT_EQ(sandbox.compiles.load(), 1);
  EXPECT_EQ(sandbox.executions.load(), 3);
  EXPECT_EQ(sandbox.releases.load(), 1);

  auto status = ReadTestStatus(kSubmissionId);
  ASSERT_EQ(status.size(), 3u);
  for (int i = 0; i < 3; i++) {
    EXPECT_EQ(status[i].index, i + 1);
    EXPECT_EQ(status[i].outcome, Outcome::PASSED);
    EXPECT_TRUE(status[i].counted);
  }
  EXPECT_EQ(ReadOutput(kSubmissionId, 2).value_or(""), "2\n");
  EXPECT_FALSE(fs::exists(SubmissionError(kSubmissionId, 2)));
}

TEST_F(GradingTest, RuntimeErrorStopsAtFirstFailure) {
  auto res = Grade(sandbox, Input("raise-on 2", MakeTests({{1, false}, {2, false}, {3, false}})), options);
  EXPECT_EQ(res.status, Status::RUNTIME_ERROR);
  EXPECT_EQ(res.passed, 1);
  EXPECT_EQ(res.total, 3);
  EXPECT_EQ(res.failed_test, 2);
  EXPECT_EQ(sandbox.executions.load(), 2);
  ASSERT_EQ(res.tests.size(), 2u);
  EXPECT_EQ(res.tests[1].outcome, Outcome::RUNTIME_ERROR);
  EXPECT_EQ(res.tests[1].exit_status, 1);
  EXPECT_TRUE(fs::exists(SubmissionError(kSubmissionId, 2)));
}

TEST_F(GradingTest, CompileErrorRunsNothing) {
  auto res = Grade(sandbox, Input("syntax error", MakeTests({{1, false}, {2, false}})), options);
  EXPECT_EQ(res.status, Status::COMPILATION_ERROR);
  EXPECT_EQ(sandbox.executions.load(), 0);
  EXPECT_EQ(res.passed, 0);
  EXPECT_TRUE(res.tests.empty());
  EXPECT_NE(ReadCompileMessage(kSubmissionId).find("syntax error"), std::string::npos);
  auto status = ReadTestStatus(kSubmissionId);
  ASSERT_EQ(status.size(), 1u);
  EXPECT_EQ(status[0].index, 0);
  EXPECT_EQ(status[0].outcome, Outcome::COMPILATION_ERROR);
}

TEST_F(GradingTest, RunsInSequenceOrder) {
  std::vector<int> order;
  Reporter reporter;
  reporter.ReportTestResult = [&](const std::string&, const TestResult& res) {
    order.push_back(res.sequence_number);
  };
  auto res = Grade(sandbox, Input("echo", MakeTests({{30, false}, {10, true}, {20, false}})),
                   options, &reporter);
  EXPECT_EQ(res.status, Status::ACCEPTED);
  EXPECT_EQ(order, std::vector<int>({10, 20, 30}));
  EXPECT_EQ(res.tests[0].index, 1);
  EXPECT_EQ(res.tests[0].sequence_number, 10);
}

TEST_F(GradingTest, WrongAnswer) {
  auto res = Grade(sandbox, Input("wrong", MakeTests({{1, true}, {2, false}})), options);
  EXPECT_EQ(res.status, Status::WRONG_ANSWER);
  EXPECT_EQ(res.failed_test, 1);
  EXPECT_EQ(sandbox.executions.load(), 1);
}

TEST_F(GradingTest, LimitOutcomes) {
  EXPECT_EQ(Grade(sandbox, Input("sleep", MakeTests({{1, false}})), options).status,
            Status::TIME_LIMIT_EXCEEDED);
  EXPECT_EQ(Grade(sandbox, Input("alloc", MakeTests({{1, false}})), options).status,
            Status::MEMORY_LIMIT_EXCEEDED);
}

TEST_F(GradingTest, ContinueSamplesAfterFailure) {
  options.continue_samples = true;
  auto res = Grade(sandbox, Input("raise-on 2",
                   MakeTests({{1, true}, {2, false}, {3, true}, {4, false}})), options);
  EXPECT_EQ(res.status, Status::RUNTIME_ERROR);
  EXPECT_EQ(res.failed_test, 2);
  EXPECT_EQ(res.passed, 1);
  EXPECT_EQ(sandbox.executions.load(), 3);
  ASSERT_EQ(res.tests.size(), 3u);
  EXPECT_EQ(res.tests[2].sequence_number, 3);
  EXPECT_EQ(res.tests[2].outcome, Outcome::PASSED);
  EXPECT_FALSE(res.tests[2].counted);
  EXPECT_FALSE(ReadTestStatus(kSubmissionId).back().counted);
}

TEST_F(GradingTest, RunAllTestsUsesPrecedence) {
  options.run_all_tests = true;
  auto res = Grade(sandbox, Input("wrong raise-on 3",
                   MakeTests({{1, false}, {2, false}, {3, false}, {4, false}})), options);
  EXPECT_EQ(sandbox.executions.load(), 4);
  EXPECT_EQ(res.status, Status::RUNTIME_ERROR);
  EXPECT_EQ(res.failed_test, 3);
  EXPECT_EQ(res.passed, 0);
}

TEST_F(GradingTest, RunAllTestsTieGoesToEarliest) {
  options.run_all_tests = true;
  auto res = Grade(sandbox, Input("wrong", MakeTests({{1, false}, {2, false}})), options);
  EXPECT_EQ(res.status, Status::WRONG_ANSWER);
  EXPECT_EQ(res.failed_test, 1);
  EXPECT_EQ(sandbox.executions.load(), 2);
}

TEST_F(GradingTest, DeadlineReached) {
  options.deadline = std::chrono::steady_clock::now() - std::chrono::milliseconds(1);
  auto res = Grade(sandbox, Input("echo", MakeTests({{1, false}, {2, false}})), options);
  EXPECT_EQ(res.status, Status::TIME_LIMIT_EXCEEDED);
  EXPECT_EQ(sandbox.executions.load(), 0);
  ASSERT_EQ(res.tests.size(), 1u);
  EXPECT_EQ(res.tests[0].exit_status, -1);
}

TEST_F(GradingTest, DuplicateSequenceNumber) {
  EXPECT_THROW(Grade(sandbox, Input("echo", MakeTests({{1, false}, {1, false}})), options),
               InfrastructureFailure);
  EXPECT_EQ(sandbox.compiles.load(), 0);
}

TEST_F(GradingTest, InfrastructureFailurePropagates) {
  EXPECT_THROW(Grade(sandbox, Input("infra", MakeTests({{1, false}})), options), InfrastructureFailure);
  EXPECT_EQ(sandbox.releases.load(), 1);
}

TEST_F(GradingTest, ToleratesTornStatusLine) {
  Grade(sandbox, Input("echo", MakeTests({{1, false}})), options);
  {
    std::ofstream fout(SubmissionStatusFile(kSubmissionId), std::ios::app);
    fout << "{\"index\": 2, \"sequ";
  }
  EXPECT_EQ(ReadTestStatus(kSubmissionId).size(), 1u);
}
