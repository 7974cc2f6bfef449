#include "utils.h"

#include <ojudge/errors.h>

std::string Trimmed(const std::string& str) {
  constexpr char kWhites[] = " \n\r\t";
  size_t begin = str.find_first_not_of(kWhites);
  if (begin == std::string::npos) return "";
  return str.substr(begin, str.find_last_not_of(kWhites) - begin + 1);
}

RunResult ScriptedSandbox::Compile(long run_id, Language, const std::string& code) {
  compiles++;
  RunResult res;
  if (code.find("syntax error") != std::string::npos) {
    res.outcome = Outcome::COMPILATION_ERROR;
    res.exit_status = 1;
    res.error = "prog.cpp:1:1: error: syntax error";
    return res;
  }
  std::lock_guard lck(mtx_);
  programs_[run_id] = code;
  return res;
}

RunResult ScriptedSandbox::Execute(long run_id, int, Language, const std::string& input,
                                   const ExecLimits& lim) {
  std::string code;
  {
    std::lock_guard lck(mtx_);
    auto it = programs_.find(run_id);
    if (it == programs_.end()) throw InfrastructureFailure("run not compiled");
    code = it->second;
  }
  executions++;
  if (code.find("infra") != std::string::npos) {
    int left = infra_failures.load();
    if (left < 0 || (left > 0 && infra_failures.compare_exchange_strong(left, left - 1))) {
      throw InfrastructureFailure("cannot spawn process");
    }
  }
  RunResult res;
  res.cpu_time_ms = res.wall_time_ms = 1;
  res.peak_memory_kb = 1024;
  if (code.find("sleep") != std::string::npos) {
    res.outcome = Outcome::TIME_LIMIT_EXCEEDED;
    res.cpu_time_ms = res.wall_time_ms = lim.time_ms + 1;
    res.exit_status = 128 + 9;
    return res;
  }
  if (code.find("alloc") != std::string::npos) {
    res.outcome = Outcome::MEMORY_LIMIT_EXCEEDED;
    res.peak_memory_kb = lim.memory_kb + 1;
    res.exit_status = 128 + 9;
    return res;
  }
  if (size_t pos = code.find("raise-on "); pos != std::string::npos) {
    std::string token = code.substr(pos + 9);
    token = token.substr(0, token.find_first_of(" \n"));
    if (Trimmed(input) == token) {
      res.outcome = Outcome::RUNTIME_ERROR;
      res.exit_status = 1;
      res.error = "Traceback: ValueError";
      return res;
    }
  }
  res.output = input;
  if (code.find("wrong") != std::string::npos) res.output += "x";
  return res;
}

void ScriptedSandbox::Release(long run_id) {
  releases++;
  std::lock_guard lck(mtx_);
  programs_.erase(run_id);
}
