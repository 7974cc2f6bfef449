#ifndef OJUDGE_SANDBOX_EXEC_H_
#define OJUDGE_SANDBOX_EXEC_H_

#include "sandbox.h"

// We separate this from sandbox.h because this function needs libojudge and logging,
//   while we need to keep sandbox.h as small as possible

// Runs cjail in a freshly exec'd sandbox-exec helper, so every jailed process starts from a
//   single-threaded parent. Safe to call from several worker threads at once.
// before SandboxExec:
// 1. create the box and its workdir
// 2. take a unique uid&gid from the pool
// 3. write the input file and assign proper permission
// timekill = -1 in the result means the sandbox itself failed; oomkill then holds errno
struct cjail_result SandboxExec(const SandboxOptions&);

#endif  // OJUDGE_SANDBOX_EXEC_H_
