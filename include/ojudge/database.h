#ifndef INCLUDE_OJUDGE_DATABASE_H_
#define INCLUDE_OJUDGE_DATABASE_H_

#include <map>
#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include "submission.h"

struct SubmissionFilter {
  std::string user_id, problem_id; // empty = any
  std::optional<Status> status;
  std::optional<Language> language;
  int page; // 1-based
  int limit;

  SubmissionFilter() : page(1), limit(50) {}
};

// Aggregated over stored verdicts; FAILED submissions are not counted
struct ProblemStats {
  std::string problem_id;
  long judged;
  long accepted;
  // complexity -> count of ACCEPTED submissions given that classification
  std::map<std::string, long> time_complexity, memory_complexity;
  int64_t updated_at;

  ProblemStats() : judged(0), accepted(0), updated_at(0) {}
  // percentage; 0 if nothing was judged
  double AcceptanceRate() const { return judged ? accepted * 100.0 / judged : 0; }
};

// Structured records (submissions, problems, test cases) in SQLite.
// All methods are thread-safe.
class Database {
  struct Storage;
  std::mutex mtx_;
  std::unique_ptr<Storage> db_;

 public:
  static constexpr int kMaxPageSize = 100;

  explicit Database(const std::filesystem::path&);
  ~Database();

  // Stores sub as PENDING, filling id and timestamps if unset; returns the id
  std::string CreatePending(Submission sub);
  // Compare-and-set on status. The aggregate fields of `fields` are written along with `to`,
  // and a terminal verdict updates the problem's stats in the same transaction.
  // Returns false (conflict) if the stored status is not `from` or the transition is illegal.
  bool Transition(const std::string& id, Status from, Status to, const Submission& fields = Submission());
  std::optional<Submission> Get(const std::string& id);
  // newest first
  std::vector<Submission> List(const SubmissionFilter&);
  // oldest first
  std::vector<Submission> ListByStatus(Status);

  void PutProblem(const Problem&);
  std::optional<Problem> GetProblem(const std::string& problem_id);
  // Replaces the whole set; throws ValidationError on duplicate sequence numbers
  void PutTestCases(const std::string& problem_id, const std::vector<TestCase>&);
  // ordered by sequence number
  std::vector<TestCase> GetTestCases(const std::string& problem_id);
  // zeros if nothing was judged yet
  ProblemStats GetProblemStats(const std::string& problem_id);
};

#endif  // INCLUDE_OJUDGE_DATABASE_H_
