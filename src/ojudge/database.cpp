#include <ojudge/database.h>

#include <set>

#include <spdlog/spdlog.h>
#include <sqlite_orm/sqlite_orm.h>

#include <ojudge/utils.h>
#include <ojudge/errors.h>

namespace {

// enums are stored as their integer values
struct SubmissionRow {
  std::string id;
  std::string user_id;
  std::string problem_id;
  int language;
  int status;
  int64_t submitted_at;
  int64_t updated_at;
  long runtime_ms;
  long memory_kb;
  int test_cases_passed;
  int test_cases_total;
  long points;
  long total_points;
  int failed_test;
  std::string time_complexity;
  std::string memory_complexity;
  std::string requeued_from;
};

struct ProblemRow {
  std::string problem_id;
  long time_limit_ms;
  long memory_limit_kb;
  std::string comparator;
};

struct TestCaseRow {
  int id;
  std::string problem_id;
  int sequence_number;
  std::string input;
  std::string expected_output;
  bool is_sample;
  int points;
  std::string notes;
};

// counters over terminal verdicts other than FAILED
struct ProblemStatsRow {
  std::string problem_id;
  long judged;
  long accepted;
  int64_t updated_at;
};

enum ComplexityKind { kTimeComplexity = 0, kMemoryComplexity = 1 };

struct ComplexityCountRow {
  int id;
  std::string problem_id;
  int kind;
  std::string complexity;
  long count;
};

inline auto InitStorage(const std::filesystem::path& path) {
  using namespace sqlite_orm;
  auto storage = make_storage(path.string(),
      make_index("idx_submissions_status", &SubmissionRow::status, &SubmissionRow::submitted_at),
      make_index("idx_submissions_user", &SubmissionRow::user_id, &SubmissionRow::submitted_at),
      make_unique_index("idx_testcases_problem_seq",
                        &TestCaseRow::problem_id, &TestCaseRow::sequence_number),
      make_unique_index("idx_complexity_problem_kind",
                        &ComplexityCountRow::problem_id, &ComplexityCountRow::kind,
                        &ComplexityCountRow::complexity),
      make_table("submissions",
                 make_column("id", &SubmissionRow::id, primary_key()),
                 make_column("user_id", &SubmissionRow::user_id),
                 make_column("problem_id", &SubmissionRow::problem_id),
                 make_column("language", &SubmissionRow::language),
                 make_column("status", &SubmissionRow::status),
                 make_column("submitted_at", &SubmissionRow::submitted_at),
                 make_column("updated_at", &SubmissionRow::updated_at),
                 make_column("runtime_ms", &SubmissionRow::runtime_ms, default_value(0)),
                 make_column("memory_kb", &SubmissionRow::memory_kb, default_value(0)),
                 make_column("test_cases_passed", &SubmissionRow::test_cases_passed, default_value(0)),
                 make_column("test_cases_total", &SubmissionRow::test_cases_total, default_value(0)),
                 make_column("points", &SubmissionRow::points, default_value(0)),
                 make_column("total_points", &SubmissionRow::total_points, default_value(0)),
                 make_column("failed_test", &SubmissionRow::failed_test, default_value(0)),
                 make_column("time_complexity", &SubmissionRow::time_complexity, default_value("")),
                 make_column("memory_complexity", &SubmissionRow::memory_complexity, default_value("")),
                 make_column("requeued_from", &SubmissionRow::requeued_from, default_value(""))),
      make_table("problems",
                 make_column("problem_id", &ProblemRow::problem_id, primary_key()),
                 make_column("time_limit_ms", &ProblemRow::time_limit_ms, default_value(0)),
                 make_column("memory_limit_kb", &ProblemRow::memory_limit_kb, default_value(0)),
                 make_column("comparator", &ProblemRow::comparator, default_value("exact"))),
      make_table("testcases",
                 make_column("id", &TestCaseRow::id, primary_key().autoincrement()),
                 make_column("problem_id", &TestCaseRow::problem_id),
                 make_column("sequence_number", &TestCaseRow::sequence_number),
                 make_column("input", &TestCaseRow::input),
                 make_column("expected_output", &TestCaseRow::expected_output),
                 make_column("is_sample", &TestCaseRow::is_sample, default_value(false)),
                 make_column("points", &TestCaseRow::points, default_value(0)),
                 make_column("notes", &TestCaseRow::notes, default_value(""))),
      make_table("problem_stats",
                 make_column("problem_id", &ProblemStatsRow::problem_id, primary_key()),
                 make_column("judged", &ProblemStatsRow::judged, default_value(0)),
                 make_column("accepted", &ProblemStatsRow::accepted, default_value(0)),
                 make_column("updated_at", &ProblemStatsRow::updated_at, default_value(0))),
      make_table("complexity_counts",
                 make_column("id", &ComplexityCountRow::id, primary_key().autoincrement()),
                 make_column("problem_id", &ComplexityCountRow::problem_id),
                 make_column("kind", &ComplexityCountRow::kind),
                 make_column("complexity", &ComplexityCountRow::complexity),
                 make_column("count", &ComplexityCountRow::count, default_value(0))));
  storage.sync_schema(true);
  // Transition relies on changes() of the same connection
  storage.open_forever();
  storage.busy_timeout(5000);
  return storage;
}

SubmissionRow ToRow(const Submission& sub) {
  return {
    sub.id, sub.user_id, sub.problem_id, (int)sub.language, (int)sub.status,
    sub.submitted_at, sub.updated_at, sub.runtime_ms, sub.memory_kb,
    sub.test_cases_passed, sub.test_cases_total, sub.points, sub.total_points,
    sub.failed_test, sub.time_complexity, sub.memory_complexity, sub.requeued_from,
  };
}

Submission FromRow(SubmissionRow&& row) {
  Submission sub;
  sub.id = std::move(row.id);
  sub.user_id = std::move(row.user_id);
  sub.problem_id = std::move(row.problem_id);
  sub.language = (Language)row.language;
  sub.status = (Status)row.status;
  sub.submitted_at = row.submitted_at;
  sub.updated_at = row.updated_at;
  sub.runtime_ms = row.runtime_ms;
  sub.memory_kb = row.memory_kb;
  sub.test_cases_passed = row.test_cases_passed;
  sub.test_cases_total = row.test_cases_total;
  sub.points = row.points;
  sub.total_points = row.total_points;
  sub.failed_test = row.failed_test;
  sub.time_complexity = std::move(row.time_complexity);
  sub.memory_complexity = std::move(row.memory_complexity);
  sub.requeued_from = std::move(row.requeued_from);
  return sub;
}

} // namespace

struct Database::Storage {
  decltype(InitStorage(std::filesystem::path())) db;

  // Folds a stored verdict into the per-problem counters; caller holds the transaction
  void RecordVerdict(const std::string& id, Status status, const Submission& fields, int64_t now) {
    using namespace sqlite_orm;
    if (status == Status::FAILED) return;
    auto problem = db.select(&SubmissionRow::problem_id, where(c(&SubmissionRow::id) == id));
    if (problem.empty()) return;
    const std::string& problem_id = problem.front();
    bool accepted = status == Status::ACCEPTED;
    if (auto row = db.get_pointer<ProblemStatsRow>(problem_id)) {
      row->judged++;
      if (accepted) row->accepted++;
      row->updated_at = now;
      db.update(*row);
    } else {
      db.replace(ProblemStatsRow{problem_id, 1, accepted ? 1 : 0, now});
    }
    if (!accepted) return;
    for (auto [kind, complexity] : {std::make_pair(kTimeComplexity, &fields.time_complexity),
                                    std::make_pair(kMemoryComplexity, &fields.memory_complexity)}) {
      if (complexity->empty()) continue;
      auto rows = db.get_all<ComplexityCountRow>(
          where(c(&ComplexityCountRow::problem_id) == problem_id &&
                c(&ComplexityCountRow::kind) == (int)kind &&
                c(&ComplexityCountRow::complexity) == *complexity));
      if (rows.empty()) {
        db.insert(ComplexityCountRow{0, problem_id, (int)kind, *complexity, 1});
      } else {
        rows.front().count++;
        db.update(rows.front());
      }
    }
  }
};

Database::Database(const std::filesystem::path& path) :
    db_(std::make_unique<Storage>(InitStorage(path))) {
  spdlog::info("Database opened: {}", path.string());
}

Database::~Database() = default;

std::string Database::CreatePending(Submission sub) {
  if (sub.id.empty()) sub.id = GenerateSubmissionId();
  if (!sub.submitted_at) sub.submitted_at = CurrentTimestamp();
  sub.updated_at = sub.submitted_at;
  sub.status = Status::PENDING;
  std::lock_guard lck(mtx_);
  db_->db.replace(ToRow(sub));
  spdlog::debug("Submission {} created: user={} problem={} language={}",
                sub.id, sub.user_id, sub.problem_id, LanguageName(sub.language));
  return sub.id;
}

bool Database::Transition(const std::string& id, Status from, Status to, const Submission& fields) {
  using namespace sqlite_orm;
  if (!IsValidTransition(from, to)) {
    spdlog::warn("Rejected transition of {}: {} -> {}", id, StatusName(from), StatusName(to));
    return false;
  }
  int64_t now = CurrentTimestamp();
  std::lock_guard lck(mtx_);
  auto cond = where(c(&SubmissionRow::id) == id && c(&SubmissionRow::status) == (int)from);
  bool ok = false;
  if (IsTerminal(to)) {
    // the verdict and the problem counters are stored together or not at all
    db_->db.transaction([&] {
      db_->db.update_all(set(c(&SubmissionRow::status) = (int)to,
                             c(&SubmissionRow::updated_at) = now,
                             c(&SubmissionRow::runtime_ms) = fields.runtime_ms,
                             c(&SubmissionRow::memory_kb) = fields.memory_kb,
                             c(&SubmissionRow::test_cases_passed) = fields.test_cases_passed,
                             c(&SubmissionRow::test_cases_total) = fields.test_cases_total,
                             c(&SubmissionRow::points) = fields.points,
                             c(&SubmissionRow::total_points) = fields.total_points,
                             c(&SubmissionRow::failed_test) = fields.failed_test,
                             c(&SubmissionRow::time_complexity) = fields.time_complexity,
                             c(&SubmissionRow::memory_complexity) = fields.memory_complexity),
                         cond);
      ok = db_->db.changes() > 0;
      if (ok) db_->RecordVerdict(id, to, fields, now);
      return true;
    });
  } else {
    db_->db.update_all(set(c(&SubmissionRow::status) = (int)to,
                           c(&SubmissionRow::updated_at) = now),
                       cond);
    ok = db_->db.changes() > 0;
  }
  if (ok) {
    spdlog::debug("Submission {}: {} -> {}", id, StatusName(from), StatusName(to));
  } else {
    spdlog::debug("Submission {}: transition {} -> {} lost", id, StatusName(from), StatusName(to));
  }
  return ok;
}

std::optional<Submission> Database::Get(const std::string& id) {
  std::lock_guard lck(mtx_);
  auto ptr = db_->db.get_pointer<SubmissionRow>(id);
  if (!ptr) return std::nullopt;
  return FromRow(std::move(*ptr));
}

std::vector<Submission> Database::List(const SubmissionFilter& filter) {
  using namespace sqlite_orm;
  if (filter.page < 1) throw ValidationError("page must be positive");
  if (filter.limit < 1 || filter.limit > kMaxPageSize) {
    throw ValidationError("limit must be between 1 and " + std::to_string(kMaxPageSize));
  }
  int64_t skip = int64_t(filter.page - 1) * filter.limit;
  // only the requested filters go into the WHERE clause, so SQLite can pick the matching index
  auto query = [&](auto cond) {
    return db_->db.get_all<SubmissionRow>(
        where(cond), order_by(&SubmissionRow::submitted_at).desc(),
        limit(filter.limit, offset(skip)));
  };
  auto by_language = [&](auto cond) {
    if (!filter.language) return query(cond);
    return query(cond && c(&SubmissionRow::language) == (int)*filter.language);
  };
  auto by_status = [&](auto cond) {
    if (!filter.status) return by_language(cond);
    return by_language(cond && c(&SubmissionRow::status) == (int)*filter.status);
  };
  auto by_problem = [&](auto cond) {
    if (filter.problem_id.empty()) return by_status(cond);
    return by_status(cond && c(&SubmissionRow::problem_id) == filter.problem_id);
  };
  std::lock_guard lck(mtx_);
  auto rows = filter.user_id.empty() ?
      by_problem(c(&SubmissionRow::submitted_at) >= 0) :
      by_problem(c(&SubmissionRow::user_id) == filter.user_id);
  std::vector<Submission> ret;
  for (auto& row : rows) ret.push_back(FromRow(std::move(row)));
  return ret;
}

std::vector<Submission> Database::ListByStatus(Status status) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  auto rows = db_->db.get_all<SubmissionRow>(
      where(c(&SubmissionRow::status) == (int)status),
      order_by(&SubmissionRow::submitted_at).asc());
  std::vector<Submission> ret;
  for (auto& row : rows) ret.push_back(FromRow(std::move(row)));
  return ret;
}

void Database::PutProblem(const Problem& problem) {
  if (problem.problem_id.empty()) throw ValidationError("empty problem id");
  std::lock_guard lck(mtx_);
  db_->db.replace(ProblemRow{problem.problem_id, problem.time_limit_ms,
                             problem.memory_limit_kb, problem.comparator});
}

std::optional<Problem> Database::GetProblem(const std::string& problem_id) {
  std::lock_guard lck(mtx_);
  auto ptr = db_->db.get_pointer<ProblemRow>(problem_id);
  if (!ptr) return std::nullopt;
  Problem problem;
  problem.problem_id = std::move(ptr->problem_id);
  problem.time_limit_ms = ptr->time_limit_ms;
  problem.memory_limit_kb = ptr->memory_limit_kb;
  problem.comparator = std::move(ptr->comparator);
  return problem;
}

void Database::PutTestCases(const std::string& problem_id, const std::vector<TestCase>& cases) {
  using namespace sqlite_orm;
  std::set<int> seen;
  for (auto& i : cases) {
    if (!seen.insert(i.sequence_number).second) {
      throw ValidationError("duplicate sequence number " + std::to_string(i.sequence_number));
    }
  }
  std::lock_guard lck(mtx_);
  db_->db.transaction([&] {
    db_->db.remove_all<TestCaseRow>(where(c(&TestCaseRow::problem_id) == problem_id));
    for (auto& i : cases) {
      db_->db.insert(TestCaseRow{0, problem_id, i.sequence_number, i.input, i.expected_output,
                                 i.is_sample, i.points, i.notes});
    }
    return true;
  });
  spdlog::info("Problem {}: {} test cases stored", problem_id, cases.size());
}

std::vector<TestCase> Database::GetTestCases(const std::string& problem_id) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  auto rows = db_->db.get_all<TestCaseRow>(
      where(c(&TestCaseRow::problem_id) == problem_id),
      order_by(&TestCaseRow::sequence_number));
  std::vector<TestCase> ret;
  for (auto& row : rows) {
    TestCase tc;
    tc.problem_id = std::move(row.problem_id);
    tc.sequence_number = row.sequence_number;
    tc.input = std::move(row.input);
    tc.expected_output = std::move(row.expected_output);
    tc.is_sample = row.is_sample;
    tc.points = row.points;
    tc.notes = std::move(row.notes);
    ret.push_back(std::move(tc));
  }
  return ret;
}

ProblemStats Database::GetProblemStats(const std::string& problem_id) {
  using namespace sqlite_orm;
  ProblemStats stats;
  stats.problem_id = problem_id;
  std::lock_guard lck(mtx_);
  if (auto row = db_->db.get_pointer<ProblemStatsRow>(problem_id)) {
    stats.judged = row->judged;
    stats.accepted = row->accepted;
    stats.updated_at = row->updated_at;
  }
  for (auto& row : db_->db.get_all<ComplexityCountRow>(
           where(c(&ComplexityCountRow::problem_id) == problem_id))) {
    auto& dist = row.kind == kTimeComplexity ? stats.time_complexity : stats.memory_complexity;
    dist[row.complexity] = row.count;
  }
  return stats;
}
