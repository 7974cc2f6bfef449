#ifndef OJUDGE_PATHS_H_
#define OJUDGE_PATHS_H_

#include <ojudge/paths.h>
#include <ojudge/submission.h>

extern const char kWorkdirRelative[];
fs::path Workdir(fs::path&&);

// for sandbox
// if inside_box = true, id (and index of Execute) is not used
// those calls will have id (and index) marked as -1
fs::path SubmissionRunPath(long id);
fs::path CompileBoxPath(long id);
fs::path CompileBoxInput(long id, Language lang, bool inside_box = false);
fs::path CompileBoxOutput(long id, Language lang, bool inside_box = false);
fs::path CompileBoxMessage(long id, bool inside_box = false);
fs::path ExecuteBoxPath(long id, int index);
fs::path ExecuteBoxProgram(long id, int index, Language lang, bool inside_box = false);
fs::perms ExecuteBoxProgramPerm(Language lang);
fs::path ExecuteBoxInput(long id, int index, bool inside_box = false);
fs::path ExecuteBoxOutput(long id, int index, bool inside_box = false);
fs::path ExecuteBoxError(long id, int index, bool inside_box = false);

fs::path SandboxExecPath();
fs::path LockFilePath();

#endif  // OJUDGE_PATHS_H_
