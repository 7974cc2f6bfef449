#include "tasks.h"

#include <mutex>
#include <vector>
#include <cstdlib>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <ojudge/errors.h>
#include "paths.h"
#include "utils.h"
#include "sandbox_exec.h"

namespace {

constexpr int kUidBase = 50000, kUidPoolSize = 100;

// Every concurrently running jail gets its own uid, so processes of different runs
//   cannot signal or ptrace each other
class UidPool {
  std::mutex mtx_;
  std::vector<int> pool_;
 public:
  UidPool() {
    for (int i = 0; i < kUidPoolSize; i++) pool_.push_back(i + kUidBase);
  }
  int Take() {
    std::lock_guard lck(mtx_);
    if (pool_.empty()) throw InfrastructureFailure("sandbox uid pool exhausted");
    int uid = pool_.back();
    pool_.pop_back();
    return uid;
  }
  void Return(int uid) {
    std::lock_guard lck(mtx_);
    pool_.push_back(uid);
  }
} uid_pool;

class UidLease {
  int uid_;
 public:
  UidLease() : uid_(uid_pool.Take()) {}
  ~UidLease() { uid_pool.Return(uid_); }
  UidLease(const UidLease&) = delete;
  UidLease& operator=(const UidLease&) = delete;
  int Get() const { return uid_; }
};

std::vector<std::string> GccCompileCommand(Language lang, const std::string& input, const std::string& output) {
  std::vector<std::string> ret;
  if (lang == Language::CPP) {
    ret = {"/usr/bin/env", "g++", "-std=c++17", "-O2", "-w"};
  } else {
    ret = {"/usr/bin/env", "gcc", "-std=c17", "-O2", "-w"};
  }
  ret.insert(ret.end(), {"-o", output, input});
  if (lang == Language::C) ret.push_back("-lm");
  return ret;
}

std::vector<std::string> ExecuteCommand(Language lang, const std::string& program, const ExecLimits& lim) {
  switch (lang) {
    case Language::CPP: [[fallthrough]];
    case Language::C: return {program};
    case Language::PYTHON: return {"/usr/bin/env", "python3", program};
    case Language::JAVASCRIPT: return {"/usr/bin/env", "node", program};
    case Language::JAVA: {
      std::string dir = fs::path(program).parent_path();
      return {"/usr/bin/env", "java", "-Xmx" + std::to_string(lim.memory_kb) + "k", "-Xss64m",
              "-cp", dir, "Main"};
    }
  }
  __builtin_unreachable();
}

// JVM and node start helper threads, which count against the process limit
inline int ProcessLimit(Language lang) {
  switch (lang) {
    case Language::JAVA: [[fallthrough]];
    case Language::JAVASCRIPT: return 64;
    default: return 1;
  }
}

inline std::vector<std::string> PathEnv() {
  if (char* path = getenv("PATH")) return {std::string("PATH=") + path};
  return {"PATH=/usr/local/bin:/usr/bin:/bin"};
}

} // namespace

struct cjail_result RunCompile(long id, Language lang) {
  spdlog::debug("Generating compile settings: id={} lang={}", id, LanguageName(lang));
  std::string input = CompileBoxInput(-1, lang, true);
  std::string output = CompileBoxOutput(-1, lang, true);

  SandboxOptions opt;
  opt.boxdir = CompileBoxPath(id);
  switch (lang) {
    case Language::CPP: [[fallthrough]];
    case Language::C:
      opt.command = GccCompileCommand(lang, input, output); break;
    case Language::PYTHON: {
      // note: we assume input & output name has no quotes here
      std::string script = ("import py_compile;py_compile.compile(\'\'\'" +
                            input + "\'\'\',\'\'\'" + output + "\'\'\',doraise=True)");
      opt.command = {"/usr/bin/env", "python3", "-c", script};
      break;
    }
    case Language::JAVASCRIPT:
      opt.command = {"/usr/bin/env", "node", "--check", input}; break;
    case Language::JAVA:
      opt.command = {"/usr/bin/env", "javac", "-encoding", "UTF-8", "-d", Workdir("/"), input}; break;
  }
  opt.envs = PathEnv();
  opt.workdir = Workdir("/");
  opt.output = CompileBoxMessage(-1, true);
  opt.error = opt.output;
  UidLease uid;
  opt.uid = opt.gid = uid.Get();
  opt.wall_time = 60L * 1'000'000;
  opt.wall_time /= kTimeMultiplier;
  opt.rss = kMaxRSS;
  opt.proc_num = 64;
  opt.fsize = kMaxOutput;
  opt.dirs = {"/usr", "/var/lib", "/lib", "/lib64", "/etc/alternatives", "/bin"};
  opt.FilterDirs();
  return SandboxExec(opt);
}

struct cjail_result RunExecute(long id, int index, Language lang, const ExecLimits& lim) {
  spdlog::debug("Generating execute settings: id={} index={} lang={}", id, index, LanguageName(lang));
  std::string program = ExecuteBoxProgram(-1, -1, lang, true);

  SandboxOptions opt;
  opt.boxdir = ExecuteBoxPath(id, index);
  opt.command = ExecuteCommand(lang, program, lim);
  opt.envs = PathEnv();
  opt.workdir = Workdir("/");
  UidLease uid;
  opt.uid = opt.gid = uid.Get();
  long lim_time = lim.time_ms * 1000;
  opt.wall_time = std::max(long(lim_time * 1.2), lim_time + 1'000'000);
  opt.cpu_time = lim_time + 50'000; // a little bit of margin just in case
  opt.wall_time /= kTimeMultiplier;
  opt.cpu_time /= kTimeMultiplier;
  if (opt.cpu_time <= 0) opt.cpu_time = 1; // avoid being regarded as no limit
  opt.rss = lim.memory_kb + 1024; // add some margin so we can determine whether it is MLE
  if (lim.memory_kb == 0 || opt.rss > kMaxRSS) opt.rss = kMaxRSS;
  opt.proc_num = ProcessLimit(lang);
  // file limit is not needed since we have already limited the total size by mounting tmpfs
  opt.fsize = lim.output_kb;
  if (opt.fsize == 0 || opt.fsize > kMaxOutput) opt.fsize = kMaxOutput;
  opt.dirs = {"/usr", "/lib", "/lib64", "/etc/alternatives", "/bin"};
  opt.input = ExecuteBoxInput(-1, -1, true);
  opt.output = ExecuteBoxOutput(-1, -1, true);
  opt.error = ExecuteBoxError(-1, -1, true);
  // Output file is accounted in cgroups, so we need to extend RSS limit
  // MLE check will still be done by the original limit
  opt.rss += opt.fsize;
  opt.FilterDirs();
  return SandboxExec(opt);
}
