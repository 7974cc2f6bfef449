#include "example_problem.h"

#include <cstdlib>
#include <string>
#include <ojudge/paths.h>
#include <ojudge/utils.h>
#include <ojudge/artifacts.h>

void ExampleProblem::SetUp() {
  {
    char root_tmp[256] = "/tmp/ojudge_test_XXXXXX";
    if (!mkdtemp(root_tmp)) throw std::runtime_error("Failed to create");
    root = root_tmp;
  }
  saved_box_root_ = kBoxRoot;
  saved_submission_root_ = kSubmissionRoot;
  kBoxRoot = root / "box";
  kSubmissionRoot = root / "submissions";
  fs::create_directories(kBoxRoot);
  fs::create_directories(kSubmissionRoot);
  db = std::make_unique<Database>(root / "db.sqlite");
}

void ExampleProblem::TearDown() {
  db.reset();
  kBoxRoot = saved_box_root_;
  kSubmissionRoot = saved_submission_root_;
  fs::remove_all(root);
}

void ExampleProblem::AddProblem(const std::string& problem_id, int td_num, int samples,
                                const std::string& comparator) {
  std::vector<std::pair<std::string, std::string>> tds;
  for (int i = 1; i <= td_num; i++) tds.emplace_back(std::to_string(i) + '\n', std::to_string(i) + '\n');
  AddProblem(problem_id, tds, samples, comparator);
}

void ExampleProblem::AddProblem(const std::string& problem_id,
                                const std::vector<std::pair<std::string, std::string>>& tds,
                                int samples, const std::string& comparator) {
  Problem problem;
  problem.problem_id = problem_id;
  problem.time_limit_ms = 1000;
  problem.memory_limit_kb = 65536;
  problem.comparator = comparator;
  db->PutProblem(problem);
  std::vector<TestCase> cases;
  for (int i = 0; i < (int)tds.size(); i++) {
    TestCase tc;
    tc.problem_id = problem_id;
    tc.sequence_number = i + 1;
    tc.input = tds[i].first;
    tc.expected_output = tds[i].second;
    tc.is_sample = i < samples;
    tc.points = 10;
    tc.notes = "case " + std::to_string(i + 1);
    cases.push_back(tc);
  }
  db->PutTestCases(problem_id, cases);
}

std::string ExampleProblem::CreateSubmission(const std::string& user_id, const std::string& problem_id,
                                             const std::string& code, Language lang) {
  Submission sub;
  sub.id = GenerateSubmissionId();
  sub.user_id = user_id;
  sub.problem_id = problem_id;
  sub.language = lang;
  WriteCode(sub.id, lang, code);
  return db->CreatePending(sub);
}
