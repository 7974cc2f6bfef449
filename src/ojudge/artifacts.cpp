#include <ojudge/artifacts.h>

#include <mutex>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <ojudge/errors.h>
#include "paths.h"
#include "utils.h"

namespace {

// ids become directory names
void CheckId(const std::string& id) {
  if (id.empty() || id == "." || id == ".." || id.find('/') != std::string::npos ||
      id.find('\0') != std::string::npos) {
    throw ValidationError("invalid submission id: " + id);
  }
}

fs::path PrepareDir(const std::string& id) {
  CheckId(id);
  fs::path dir = SubmissionDir(id);
  if (!CreateDirs(dir)) throw InfrastructureFailure("cannot create " + dir.string());
  return dir;
}

void WriteOrThrow(const fs::path& path, const std::string& content) {
  if (!WriteFile(path, content)) throw InfrastructureFailure("cannot write " + path.string());
}

std::optional<std::string> ReadIfExists(const fs::path& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) return std::nullopt;
  std::string content;
  if (!ReadFile(path, content)) return std::nullopt;
  return content;
}

// appends to one status file are serialized
std::mutex status_mtx;

} // namespace

void WriteCode(const std::string& id, Language lang, const std::string& code) {
  PrepareDir(id);
  WriteOrThrow(SubmissionCode(id, lang), code);
}

std::optional<std::string> ReadCode(const std::string& id, Language lang) {
  CheckId(id);
  return ReadIfExists(SubmissionCode(id, lang));
}

void WriteOutput(const std::string& id, int index, const std::string& output, const std::string& error) {
  PrepareDir(id);
  WriteOrThrow(SubmissionOutput(id, index), output);
  if (!error.empty()) WriteOrThrow(SubmissionError(id, index), error);
}

std::optional<std::string> ReadOutput(const std::string& id, int index) {
  CheckId(id);
  return ReadIfExists(SubmissionOutput(id, index));
}

void WriteCompileMessage(const std::string& id, const std::string& message) {
  PrepareDir(id);
  WriteOrThrow(SubmissionCompileMessage(id), message);
}

std::string ReadCompileMessage(const std::string& id) {
  CheckId(id);
  return ReadIfExists(SubmissionCompileMessage(id)).value_or("");
}

void AppendTestStatus(const std::string& id, const TestStatusRecord& rec) {
  PrepareDir(id);
  nlohmann::json line;
  if (rec.index == 0) {
    line = {
      {"phase", "compile"},
      {"index", 0},
      {"outcome", OutcomeName(rec.outcome)},
    };
  } else {
    line = {
      {"index", rec.index},
      {"sequence_number", rec.sequence_number},
      {"sample", rec.sample},
      {"outcome", OutcomeName(rec.outcome)},
      {"time_ms", rec.time_ms},
      {"memory_kb", rec.memory_kb},
      {"exit_status", rec.exit_status},
      {"counted", rec.counted},
    };
  }
  fs::path path = SubmissionStatusFile(id);
  std::lock_guard lck(status_mtx);
  std::ofstream fout(path, std::ios::app);
  if (!(fout << line.dump() << '\n') || !fout.flush()) {
    throw InfrastructureFailure("cannot append to " + path.string());
  }
}

std::vector<TestStatusRecord> ReadTestStatus(const std::string& id) {
  CheckId(id);
  std::vector<TestStatusRecord> ret;
  std::ifstream fin(SubmissionStatusFile(id));
  for (std::string line; std::getline(fin, line);) {
    if (line.empty()) continue;
    nlohmann::json obj = nlohmann::json::parse(line, nullptr, false);
    if (obj.is_discarded() || !obj.is_object()) {
      spdlog::warn("Skipping malformed status line of {}", id);
      continue;
    }
    try {
      TestStatusRecord rec;
      rec.index = obj.at("index").get<int>();
      auto outcome = ParseOutcome(obj.at("outcome").get<std::string>());
      if (!outcome) throw std::out_of_range("unknown outcome");
      rec.outcome = *outcome;
      if (rec.index != 0) {
        rec.sequence_number = obj.at("sequence_number").get<int>();
        rec.sample = obj.at("sample").get<bool>();
        rec.time_ms = obj.at("time_ms").get<long>();
        rec.memory_kb = obj.at("memory_kb").get<long>();
        rec.exit_status = obj.at("exit_status").get<int>();
        rec.counted = obj.value("counted", true);
      }
      ret.push_back(rec);
    } catch (const std::exception& e) {
      spdlog::warn("Skipping malformed status line of {}: {}", id, e.what());
    }
  }
  return ret;
}

void WriteFailedTest(const std::string& id, const TestCase& tc) {
  PrepareDir(id);
  nlohmann::json obj = {
    {"problem_id", tc.problem_id},
    {"sequence_number", tc.sequence_number},
    {"sample", tc.is_sample},
    {"points", tc.points},
    {"notes", tc.notes},
    {"input", tc.input},
    {"expected_output", tc.expected_output},
  };
  WriteOrThrow(SubmissionFailedTest(id), obj.dump());
}

std::optional<TestCase> ReadFailedTest(const std::string& id) {
  CheckId(id);
  auto content = ReadIfExists(SubmissionFailedTest(id));
  if (!content) return std::nullopt;
  try {
    auto obj = nlohmann::json::parse(*content);
    TestCase tc;
    tc.problem_id = obj.at("problem_id").get<std::string>();
    tc.sequence_number = obj.at("sequence_number").get<int>();
    tc.is_sample = obj.at("sample").get<bool>();
    tc.points = obj.at("points").get<int>();
    tc.notes = obj.at("notes").get<std::string>();
    tc.input = obj.at("input").get<std::string>();
    tc.expected_output = obj.at("expected_output").get<std::string>();
    return tc;
  } catch (const nlohmann::json::exception& e) {
    spdlog::warn("Malformed failed test record of {}: {}", id, e.what());
    return std::nullopt;
  }
}

void ResetGradingArtifacts(const std::string& id) {
  CheckId(id);
  std::error_code ec;
  for (auto& entry : fs::directory_iterator(SubmissionDir(id), ec)) {
    std::string name = entry.path().filename().string();
    if (name.rfind("code", 0) == 0) continue;
    RemoveAll(entry.path());
  }
}
