#ifndef OJUDGE_TASKS_H_
#define OJUDGE_TASKS_H_

#include <cjail/cjail.h>
#include <ojudge/sandbox.h>
#include <ojudge/submission.h>

// Invoke sandbox with correct settings for one phase of a run.
// The box must already be prepared; results are classified in cjail_sandbox.cpp.
struct cjail_result RunCompile(long run_id, Language lang);
struct cjail_result RunExecute(long run_id, int index, Language lang, const ExecLimits& lim);

#endif // OJUDGE_TASKS_H_
