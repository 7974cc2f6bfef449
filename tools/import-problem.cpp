// Loads a problem definition into the record store:
// {
//   "problem_id": "p1", "time_limit_ms": 1000, "memory_limit_kb": 262144, "comparator": "exact",
//   "test_cases": [
//     {"sequence_number": 1, "input": "1 2\n", "expected_output": "3\n", "is_sample": true},
//     {"sequence_number": 2, "input_file": "2.in", "output_file": "2.out", "points": 10, "notes": "big"}
//   ]
// }
// *_file paths are relative to the definition file.
#include <fstream>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>

#include <ojudge/errors.h>
#include <ojudge/compare.h>
#include <ojudge/database.h>

namespace fs = std::filesystem;

namespace {

std::string ReadContent(const nlohmann::json& obj, const char* key, const char* file_key,
                        const fs::path& base) {
  if (auto it = obj.find(key); it != obj.end()) return it->get<std::string>();
  if (auto it = obj.find(file_key); it != obj.end()) {
    fs::path path = base / it->get<std::string>();
    std::ifstream fin(path, std::ios::binary);
    if (!fin) throw ValidationError("cannot read " + path.string());
    return std::string(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  }
  throw ValidationError(std::string("test case needs ") + key + " or " + file_key);
}

} // namespace

int main(int argc, char** argv) {
  argparse::ArgumentParser parser(argc ? argv[0] : "ojudge-import-problem");
  parser.add_argument("-d", "--database")
    .required().default_value(std::string("/var/lib/ojudge/ojudge.sqlite"))
    .help("Path of the record store");
  parser.add_argument("-v", "--verbose")
    .default_value(false).implicit_value(true)
    .help("Verbose output");
  parser.add_argument("definition")
    .help("Problem definition (JSON)");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 1;
  }
  spdlog::set_level(parser["--verbose"] == true ? spdlog::level::debug : spdlog::level::info);

  fs::path definition = parser.get<std::string>("definition");
  try {
    nlohmann::json json;
    {
      std::ifstream fin(definition);
      if (!fin) throw ValidationError("cannot open " + definition.string());
      fin >> json;
    }
    Problem problem;
    problem.problem_id = json.at("problem_id").get<std::string>();
    problem.time_limit_ms = json.value("time_limit_ms", 0L);
    problem.memory_limit_kb = json.value("memory_limit_kb", 0L);
    problem.comparator = json.value("comparator", std::string("exact"));
    MakeComparator(problem.comparator); // reject bad specs before storing

    fs::path base = definition.parent_path();
    std::vector<TestCase> tests;
    for (auto& i : json.at("test_cases")) {
      TestCase tc;
      tc.problem_id = problem.problem_id;
      tc.sequence_number = i.value("sequence_number", (int)tests.size() + 1);
      tc.input = ReadContent(i, "input", "input_file", base);
      tc.expected_output = ReadContent(i, "expected_output", "output_file", base);
      tc.is_sample = i.value("is_sample", false);
      tc.points = i.value("points", 0);
      tc.notes = i.value("notes", std::string());
      tests.push_back(std::move(tc));
    }

    Database db(parser.get<std::string>("--database"));
    db.PutProblem(problem);
    db.PutTestCases(problem.problem_id, tests);
    spdlog::info("Imported problem {}: {} test cases", problem.problem_id, tests.size());
  } catch (const nlohmann::json::exception& err) {
    spdlog::error("Malformed definition {}: {}", definition.string(), err.what());
    return 1;
  } catch (const std::exception& err) {
    spdlog::error("Import failed: {}", err.what());
    return 1;
  }
  return 0;
}
