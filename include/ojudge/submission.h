#ifndef INCLUDE_OJUDGE_SUBMISSION_H_
#define INCLUDE_OJUDGE_SUBMISSION_H_

#include <string>
#include <vector>
#include <cstdint>

// tag, code extension
#define ENUM_LANGUAGE_ \
  X(CPP, "cpp", ".cpp") \
  X(C, "c", ".c") \
  X(PYTHON, "python", ".py") \
  X(JAVASCRIPT, "javascript", ".js") \
  X(JAVA, "java", ".java")
enum class Language {
#define X(name, tag, ext) name,
  ENUM_LANGUAGE_
#undef X
};

// PENDING and PROCESSING are the only non-terminal states
#define ENUM_STATUS_ \
  X(PENDING) \
  X(PROCESSING) \
  X(ACCEPTED) \
  X(WRONG_ANSWER) \
  X(TIME_LIMIT_EXCEEDED) \
  X(MEMORY_LIMIT_EXCEEDED) \
  X(RUNTIME_ERROR) \
  X(COMPILATION_ERROR) \
  X(FAILED)
enum class Status {
#define X(name) name,
  ENUM_STATUS_
#undef X
};

// Per-test outcome. Failing outcomes are ordered by precedence: the max wins when several fail.
#define ENUM_OUTCOME_ \
  X(OK, "OK") /* ran within limits; not compared yet */ \
  X(PASSED, "PASSED") \
  X(WRONG_ANSWER, "WRONG_ANSWER") \
  X(MEMORY_LIMIT_EXCEEDED, "MEMORY_LIMIT_EXCEEDED") \
  X(TIME_LIMIT_EXCEEDED, "TIME_LIMIT_EXCEEDED") \
  X(RUNTIME_ERROR, "RUNTIME_ERROR") \
  X(COMPILATION_ERROR, "COMPILATION_ERROR")
enum class Outcome {
#define X(name, str) name,
  ENUM_OUTCOME_
#undef X
};

struct Submission {
  std::string id;
  std::string user_id;
  std::string problem_id;
  Language language;
  Status status;
  int64_t submitted_at; // UNIX timestamp, microseconds
  int64_t updated_at;
  // aggregate result
  long runtime_ms;
  long memory_kb;
  int test_cases_passed;
  int test_cases_total;
  long points;
  long total_points;
  int failed_test; // 1-based execution index of the verdict-determining test; 0 if none
  std::string time_complexity, memory_complexity;
  std::string requeued_from;

  Submission() :
      language(Language::CPP),
      status(Status::PENDING),
      submitted_at(0), updated_at(0),
      runtime_ms(0), memory_kb(0),
      test_cases_passed(0), test_cases_total(0),
      points(0), total_points(0),
      failed_test(0) {}
};

struct Problem {
  std::string problem_id;
  long time_limit_ms; // 0 = default
  long memory_limit_kb; // 0 = default
  std::string comparator; // see MakeComparator

  Problem() : time_limit_ms(0), memory_limit_kb(0), comparator("exact") {}
};

struct TestCase {
  std::string problem_id;
  int sequence_number;
  std::string input, expected_output;
  bool is_sample;
  int points;
  std::string notes;

  TestCase() : sequence_number(0), is_sample(false), points(0) {}
};

#endif  // INCLUDE_OJUDGE_SUBMISSION_H_
