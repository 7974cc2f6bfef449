#include <map>
#include <thread>
#include <atomic>
#include <gtest/gtest.h>
#include <ojudge/utils.h>
#include <ojudge/errors.h>
#include <ojudge/database.h>

#include "example_problem.h"

namespace {

Submission NewSubmission(const std::string& user, const std::string& problem, int64_t time) {
  Submission sub;
  sub.user_id = user;
  sub.problem_id = problem;
  sub.language = Language::PYTHON;
  sub.submitted_at = time;
  return sub;
}

} // namespace

class DatabaseTest : public ExampleProblem {};

TEST_F(DatabaseTest, CreatePending) {
  std::string id = db->CreatePending(NewSubmission("alice", "p1", 0));
  ASSERT_EQ(id.size(), 24u);
  EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
  auto sub = db->Get(id);
  ASSERT_TRUE(sub);
  EXPECT_EQ(sub->status, Status::PENDING);
  EXPECT_EQ(sub->user_id, "alice");
  EXPECT_EQ(sub->problem_id, "p1");
  EXPECT_EQ(sub->language, Language::PYTHON);
  EXPECT_GT(sub->submitted_at, 0);
  EXPECT_FALSE(db->Get("ffffffffffffffffffffffff"));
}

TEST_F(DatabaseTest, TransitionRace) {
  std::string id = db->CreatePending(NewSubmission("alice", "p1", 0));
  std::atomic_int winners = 0;
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; i++) {
    threads.emplace_back([&] {
      if (db->Transition(id, Status::PENDING, Status::PROCESSING)) winners++;
    });
  }
  for (auto& i : threads) i.join();
  EXPECT_EQ(winners.load(), 1);
  EXPECT_EQ(db->Get(id)->status, Status::PROCESSING);
}

TEST_F(DatabaseTest, IllegalTransitions) {
  std::string id = db->CreatePending(NewSubmission("alice", "p1", 0));
  EXPECT_FALSE(db->Transition(id, Status::PENDING, Status::ACCEPTED));
  EXPECT_FALSE(db->Transition(id, Status::PROCESSING, Status::ACCEPTED));
  EXPECT_EQ(db->Get(id)->status, Status::PENDING);
  ASSERT_TRUE(db->Transition(id, Status::PENDING, Status::PROCESSING));
  ASSERT_TRUE(db->Transition(id, Status::PROCESSING, Status::WRONG_ANSWER));
  EXPECT_FALSE(db->Transition(id, Status::WRONG_ANSWER, Status::PROCESSING));
  EXPECT_FALSE(db->Transition(id, Status::PROCESSING, Status::ACCEPTED));
  EXPECT_EQ(db->Get(id)->status, Status::WRONG_ANSWER);
}

TEST_F(DatabaseTest, TerminalFields) {
  std::string id = db->CreatePending(NewSubmission("alice", "p1", 0));
  ASSERT_TRUE(db->Transition(id, Status::PENDING, Status::PROCESSING));
  Submission fields;
  fields.runtime_ms = 12;
  fields.memory_kb = 3456;
  fields.test_cases_passed = 2;
  fields.test_cases_total = 5;
  fields.points = 20;
  fields.total_points = 50;
  fields.failed_test = 3;
  ASSERT_TRUE(db->Transition(id, Status::PROCESSING, Status::TIME_LIMIT_EXCEEDED, fields));
  auto sub = db->Get(id);
  EXPECT_EQ(sub->status, Status::TIME_LIMIT_EXCEEDED);
  EXPECT_EQ(sub->runtime_ms, 12);
  EXPECT_EQ(sub->memory_kb, 3456);
  EXPECT_EQ(sub->test_cases_passed, 2);
  EXPECT_EQ(sub->test_cases_total, 5);
  EXPECT_EQ(sub->points, 20);
  EXPECT_EQ(sub->total_points, 50);
  EXPECT_EQ(sub->failed_test, 3);
  EXPECT_GE(sub->updated_at, sub->submitted_at);
}

TEST_F(DatabaseTest, ListFiltersAndPages) {
  std::vector<std::string> alice;
  for (int i = 0; i < 5; i++) {
    alice.push_back(db->CreatePending(NewSubmission("alice", i < 2 ? "p2" : "p1", 1000 + i)));
  }
  for (int i = 0; i < 3; i++) db->CreatePending(NewSubmission("bob", "p1", 2000 + i));

  SubmissionFilter filter;
  filter.user_id = "alice";
  auto list = db->List(filter);
  ASSERT_EQ(list.size(), 5u);
  EXPECT_EQ(list.front().id, alice.back()); // newest first
  EXPECT_EQ(list.back().id, alice.front());

  filter.problem_id = "p2";
  EXPECT_EQ(db->List(filter).size(), 2u);

  filter = SubmissionFilter();
  filter.limit = 3;
  filter.page = 3;
  list = db->List(filter);
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list.back().id, alice.front());

  filter.page = 4;
  EXPECT_TRUE(db->List(filter).empty());

  filter = SubmissionFilter();
  filter.status = Status::ACCEPTED;
  EXPECT_TRUE(db->List(filter).empty());
  filter.status = Status::PENDING;
  filter.language = Language::PYTHON;
  EXPECT_EQ(db->List(filter).size(), 8u);

  filter = SubmissionFilter();
  filter.limit = Database::kMaxPageSize + 1;
  EXPECT_THROW(db->List(filter), ValidationError);
  filter.limit = 10;
  filter.page = 0;
  EXPECT_THROW(db->List(filter), ValidationError);
}

TEST_F(DatabaseTest, ListCombinedFiltersPaged) {
  std::vector<std::string> wanted;
  for (int i = 0; i < 12; i++) {
    Submission sub = NewSubmission(i % 2 ? "bob" : "alice", i % 3 ? "p1" : "p2", 1000 + i);
    if (i % 4 == 0) sub.language = Language::CPP;
    std::string id = db->CreatePending(sub);
    if (i % 2 == 0 && i % 3 && i % 4) wanted.push_back(id); // alice, p1, python
  }
  for (int i = 0; i < 12; i += 5) {
    // noise: other statuses for alice
    std::string id = db->CreatePending(NewSubmission("alice", "p1", 3000 + i));
    ASSERT_TRUE(db->Transition(id, Status::PENDING, Status::PROCESSING));
  }
  ASSERT_EQ(wanted.size(), 2u);

  SubmissionFilter filter;
  filter.user_id = "alice";
  filter.problem_id = "p1";
  filter.status = Status::PENDING;
  filter.language = Language::PYTHON;
  filter.limit = 1;
  auto first = db->List(filter);
  ASSERT_EQ(first.size(), 1u);
  EXPECT_EQ(first[0].id, wanted[1]);
  filter.page = 2;
  auto second = db->List(filter);
  ASSERT_EQ(second.size(), 1u);
  EXPECT_EQ(second[0].id, wanted[0]);
  filter.page = 3;
  EXPECT_TRUE(db->List(filter).empty());

  filter = SubmissionFilter();
  filter.status = Status::PROCESSING;
  EXPECT_EQ(db->List(filter).size(), 3u);
}

TEST_F(DatabaseTest, ProblemStatsFollowVerdicts) {
  auto judge = [&](const std::string& problem, Status verdict, const std::string& time_cx = "",
                   const std::string& memory_cx = "") {
    std::string id = db->CreatePending(NewSubmission("alice", problem, 0));
    EXPECT_TRUE(db->Transition(id, Status::PENDING, Status::PROCESSING));
    Submission fields;
    fields.time_complexity = time_cx;
    fields.memory_complexity = memory_cx;
    EXPECT_TRUE(db->Transition(id, Status::PROCESSING, verdict, fields));
    return id;
  };
  auto stats = db->GetProblemStats("p1");
  EXPECT_EQ(stats.judged, 0);
  EXPECT_EQ(stats.AcceptanceRate(), 0);

  judge("p1", Status::ACCEPTED, "O(n)", "O(1)");
  judge("p1", Status::ACCEPTED, "O(n)", "O(n)");
  judge("p1", Status::ACCEPTED);
  judge("p1", Status::WRONG_ANSWER);
  judge("p1", Status::FAILED);
  judge("p2", Status::ACCEPTED, "O(1)", "O(1)");
  std::string lost = judge("p1", Status::TIME_LIMIT_EXCEEDED);
  // a lost compare-and-set changes nothing
  EXPECT_FALSE(db->Transition(lost, Status::PROCESSING, Status::ACCEPTED));

  stats = db->GetProblemStats("p1");
  EXPECT_EQ(stats.problem_id, "p1");
  EXPECT_EQ(stats.judged, 5);
  EXPECT_EQ(stats.accepted, 3);
  EXPECT_DOUBLE_EQ(stats.AcceptanceRate(), 60.0);
  EXPECT_GT(stats.updated_at, 0);
  EXPECT_EQ(stats.time_complexity, (std::map<std::string, long>{{"O(n)", 2}}));
  EXPECT_EQ(stats.memory_complexity, (std::map<std::string, long>{{"O(1)", 1}, {"O(n)", 1}}));

  EXPECT_EQ(db->GetProblemStats("p2").judged, 1);
  EXPECT_EQ(db->GetProblemStats("p3").judged, 0);
}

TEST_F(DatabaseTest, ListByStatusOldestFirst) {
  std::string newer = db->CreatePending(NewSubmission("alice", "p1", 2000));
  std::string older = db->CreatePending(NewSubmission("bob", "p1", 1000));
  auto list = db->ListByStatus(Status::PENDING);
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list[0].id, older);
  EXPECT_EQ(list[1].id, newer);
  EXPECT_TRUE(db->ListByStatus(Status::FAILED).empty());
}

TEST_F(DatabaseTest, ProblemAndTestCases) {
  EXPECT_FALSE(db->GetProblem("p1"));
  AddProblem("p1", 3, 1, "white-diff");
  auto problem = db->GetProblem("p1");
  ASSERT_TRUE(problem);
  EXPECT_EQ(problem->comparator, "white-diff");
  EXPECT_EQ(problem->time_limit_ms, 1000);

  auto tests = db->GetTestCases("p1");
  ASSERT_EQ(tests.size(), 3u);
  EXPECT_EQ(tests[0].sequence_number, 1);
  EXPECT_TRUE(tests[0].is_sample);
  EXPECT_FALSE(tests[1].is_sample);
  EXPECT_EQ(tests[2].input, "3\n");
  EXPECT_EQ(tests[2].notes, "case 3");

  // replaced as a whole
  AddProblem("p1", 2);
  EXPECT_EQ(db->GetTestCases("p1").size(), 2u);

  std::vector<TestCase> dup(2);
  dup[0].sequence_number = dup[1].sequence_number = 7;
  EXPECT_THROW(db->PutTestCases("p1", dup), ValidationError);
  EXPECT_EQ(db->GetTestCases("p1").size(), 2u);
}

TEST_F(DatabaseTest, Reopen) {
  std::string id = db->CreatePending(NewSubmission("alice", "p1", 0));
  db = std::make_unique<Database>(root / "db.sqlite");
  auto sub = db->Get(id);
  ASSERT_TRUE(sub);
  EXPECT_EQ(sub->user_id, "alice");
}
