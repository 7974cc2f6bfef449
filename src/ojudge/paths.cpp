#include "paths.h"

#include "utils.h"

fs::path kBoxRoot = "/tmp/ojudge_box";
fs::path kSubmissionRoot = "/var/lib/ojudge/submissions";

namespace internal {
fs::path kDataDir = fs::path(OJUDGE_DATA_DIR);
} // internal

const char kWorkdirRelative[] = "workdir";
fs::path Workdir(fs::path&& path) {
  path /= kWorkdirRelative;
  return path;
}

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

// Java requires the file name to match the public class
inline std::string CompileCodeName(Language lang) {
  if (lang == Language::JAVA) return std::string("Main") + LanguageExtension(lang);
  return std::string("prog") + LanguageExtension(lang);
}

// javascript has no compiled form, so it needs to be the same name as CompileCodeName
inline std::string CompileResultName(Language lang) {
  switch (lang) {
    case Language::CPP: [[fallthrough]];
    case Language::C: return "prog";
    case Language::PYTHON: return "prog.pyc";
    case Language::JAVASCRIPT: return "prog.js";
    case Language::JAVA: return "Main.class";
  }
  __builtin_unreachable();
}

inline fs::path BoxRoot(fs::path root, bool inside_box) {
  return inside_box ? fs::path("/") : root;
}

} // namespace

fs::path SubmissionDir(const std::string& id) {
  return kSubmissionRoot / id;
}
fs::path SubmissionCode(const std::string& id, Language lang) {
  return SubmissionDir(id) / (std::string("code") + LanguageExtension(lang));
}
fs::path SubmissionOutput(const std::string& id, int n) {
  return SubmissionDir(id) / ("output_" + std::to_string(n) + ".txt");
}
fs::path SubmissionError(const std::string& id, int n) {
  return SubmissionDir(id) / ("stderr_" + std::to_string(n) + ".txt");
}
fs::path SubmissionCompileMessage(const std::string& id) {
  return SubmissionDir(id) / "compile.txt";
}
fs::path SubmissionStatusFile(const std::string& id) {
  return SubmissionDir(id) / "testcasesStatus.txt";
}
fs::path SubmissionFailedTest(const std::string& id) {
  return SubmissionDir(id) / "failed_test.json";
}

fs::path SubmissionRunPath(long id) {
  return kBoxRoot / PadInt(id, 6);
}

fs::path CompileBoxPath(long id) {
  return SubmissionRunPath(id) / "compile";
}
fs::path CompileBoxInput(long id, Language lang, bool inside_box) {
  return Workdir(BoxRoot(CompileBoxPath(id), inside_box)) / CompileCodeName(lang);
}
fs::path CompileBoxOutput(long id, Language lang, bool inside_box) {
  return Workdir(BoxRoot(CompileBoxPath(id), inside_box)) / CompileResultName(lang);
}
fs::path CompileBoxMessage(long id, bool inside_box) {
  return Workdir(BoxRoot(CompileBoxPath(id), inside_box)) / "message";
}

fs::path ExecuteBoxPath(long id, int index) {
  return SubmissionRunPath(id) / ("execute" + PadInt(index, 3));
}
fs::path ExecuteBoxProgram(long id, int index, Language lang, bool inside_box) {
  return Workdir(BoxRoot(ExecuteBoxPath(id, index), inside_box)) / CompileResultName(lang);
}
fs::perms ExecuteBoxProgramPerm(Language lang) {
  switch (lang) {
    case Language::CPP: [[fallthrough]];
    case Language::C:
      return fs::perms::owner_all | fs::perms::group_exec | fs::perms::others_exec; // 711
    case Language::PYTHON: [[fallthrough]];
    case Language::JAVASCRIPT: [[fallthrough]];
    case Language::JAVA:
      return fs::perms::owner_all | fs::perms::group_read | fs::perms::others_read; // 744
  }
  __builtin_unreachable();
}
fs::path ExecuteBoxInput(long id, int index, bool inside_box) {
  return Workdir(BoxRoot(ExecuteBoxPath(id, index), inside_box)) / "input";
}
fs::path ExecuteBoxOutput(long id, int index, bool inside_box) {
  return Workdir(BoxRoot(ExecuteBoxPath(id, index), inside_box)) / "output";
}
fs::path ExecuteBoxError(long id, int index, bool inside_box) {
  return Workdir(BoxRoot(ExecuteBoxPath(id, index), inside_box)) / "error";
}

fs::path SandboxExecPath() {
  return internal::kDataDir / "sandbox-exec";
}
fs::path LockFilePath() {
  return internal::kDataDir / "lock";
}
