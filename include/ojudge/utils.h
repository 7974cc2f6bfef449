#ifndef INCLUDE_OJUDGE_UTILS_H_
#define INCLUDE_OJUDGE_UTILS_H_

#include <string>
#include <optional>

#include "submission.h"

// use for box directory management; unique in a run even if a submission is graded twice
long GetUniqueRunId();
// opaque submission id, 24 hex digits
std::string GenerateSubmissionId();
// UNIX timestamp, microseconds
int64_t CurrentTimestamp();

const char* LanguageName(Language);
const char* LanguageExtension(Language);
// accepts aliases (c++, python3, js); nullopt if unsupported
std::optional<Language> ParseLanguage(const std::string&);

const char* StatusName(Status);
std::optional<Status> ParseStatus(const std::string&);
bool IsTerminal(Status);
bool IsValidTransition(Status from, Status to);

const char* OutcomeName(Outcome);
std::optional<Outcome> ParseOutcome(const std::string&);
bool IsFailure(Outcome);
Status OutcomeToStatus(Outcome);

#endif  // INCLUDE_OJUDGE_UTILS_H_
