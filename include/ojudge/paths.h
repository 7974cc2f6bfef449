#ifndef INCLUDE_OJUDGE_PATHS_H_
#define INCLUDE_OJUDGE_PATHS_H_

#include <string>
#include <filesystem>

#include "submission.h"

namespace fs = std::filesystem;

extern fs::path kBoxRoot;
extern fs::path kSubmissionRoot;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

// artifact layout, one directory per submission
fs::path SubmissionDir(const std::string& id);
fs::path SubmissionCode(const std::string& id, Language lang);
// n is the 1-based execution index
fs::path SubmissionOutput(const std::string& id, int n);
fs::path SubmissionError(const std::string& id, int n);
fs::path SubmissionCompileMessage(const std::string& id);
fs::path SubmissionStatusFile(const std::string& id);
fs::path SubmissionFailedTest(const std::string& id);

#endif  // INCLUDE_OJUDGE_PATHS_H_
