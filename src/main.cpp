#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <thread>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <ojudge/api.h>
#include <ojudge/logger.h>
#include <ojudge/sandbox.h>
#include <ojudge/database.h>
#include <ojudge/dispatcher.h>
#include "ojudge/paths.h"
#include "ojudge/utils.h"
#include "server_io.h"

namespace {

bool to_lock = true;
fs::path database_path = "/var/lib/ojudge/ojudge.sqlite";
std::string listen_host = "127.0.0.1";
int listen_port = 8080;
DispatcherOptions dispatcher_opt;
ApiOptions api_opt;
ServerOptions server_opt;

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string box_root = ini[""]["box_root"] | "";
  std::string submission_root = ini[""]["submission_root"] | "";
  std::string database = ini[""]["database"] | "";
  if (box_root.size()) kBoxRoot = box_root;
  if (submission_root.size()) kSubmissionRoot = submission_root;
  if (database.size()) database_path = database;
  dispatcher_opt.workers = ini[""]["parallel"] | dispatcher_opt.workers;
  dispatcher_opt.max_queue = ini[""]["max_submission_queue_size"] | dispatcher_opt.max_queue;
  dispatcher_opt.rescan_interval = std::chrono::seconds(
      ini[""]["rescan_interval_s"] | (long)dispatcher_opt.rescan_interval.count());
  dispatcher_opt.submission_deadline = std::chrono::seconds(ini[""]["submission_deadline_s"] | 0L);
  dispatcher_opt.infrastructure_retries =
      ini[""]["infrastructure_retries"] | dispatcher_opt.infrastructure_retries;
  dispatcher_opt.continue_samples =
      ini[""]["continue_samples_after_failure"] | dispatcher_opt.continue_samples;
  dispatcher_opt.run_all_tests = ini[""]["run_all_tests"] | dispatcher_opt.run_all_tests;
  api_opt.max_code_bytes = ini[""]["max_code_bytes"] | api_opt.max_code_bytes;
  kDefaultTimeLimitMs = ini[""]["default_time_limit_ms"] | kDefaultTimeLimitMs;
  kDefaultMemoryLimitKb = (ini[""]["default_memory_limit_mb"] | (kDefaultMemoryLimitKb / 1024)) * 1024;
  kMaxRSS = (ini[""]["max_rss_per_task_mb"] | (kMaxRSS / 1024)) * 1024;
  kMaxOutput = (ini[""]["max_output_per_task_mb"] | (kMaxOutput / 1024)) * 1024;
  kTimeMultiplier = ini[""]["time_multiplier"] | kTimeMultiplier;
  listen_host = ini[""]["listen_host"] | listen_host;
  listen_port = ini[""]["listen_port"] | listen_port;
  server_opt.threads = ini[""]["http_threads"] | server_opt.threads;
  server_opt.max_long_polls = ini[""]["max_long_polls"] | server_opt.max_long_polls;
  kMaxWaitSeconds = ini[""]["max_wait_s"] | kMaxWaitSeconds;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "ojudge");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/ojudge.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of grading workers");
  parser.add_argument("-m", "--time-multiplier")
    .scan<'g', double>()
    .help("Ratio of real time to indicated time");
  parser.add_argument("--port")
    .scan<'d', int>()
    .help("Port of the HTTP API");
  parser.add_argument("--no-lock")
    .default_value(false)
    .implicit_value(true)
    .help("Not check for other running instances");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<int>("--parallel")) {
    dispatcher_opt.workers = val.value();
  }
  if (auto val = parser.present<double>("--time-multiplier")) {
    kTimeMultiplier = val.value();
  }
  if (auto val = parser.present<int>("--port")) {
    listen_port = val.value();
  }
  to_lock = parser["--no-lock"] == false;
}

bool LockFile() {
  fs::path lock_file = LockFilePath();
  int fd = open(lock_file.c_str(), O_RDWR | O_CREAT, 0644);
  if (fd < 0) return false;
  struct flock lock{};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = lock.l_len = 0;
  if (fcntl(fd, F_SETLK, &lock) < 0) return false;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  if (geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 1;
  }
  ParseArgs(argc, argv);
  if (to_lock && !LockFile()) {
    spdlog::error("Another judge instance is running.");
    return 1;
  }
  if (!CreateDirs(kBoxRoot) || !CreateDirs(kSubmissionRoot) ||
      !CreateDirs(database_path.parent_path())) {
    spdlog::error("Failed to prepare working directories");
    return 1;
  }

  // handled by sigwait below; must be blocked before any thread starts
  sigset_t sigs;
  sigemptyset(&sigs);
  sigaddset(&sigs, SIGINT);
  sigaddset(&sigs, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

  Database db(database_path);
  CJailSandbox sandbox;
  SubmissionService* service_ptr = nullptr;
  dispatcher_opt.reporter.ReportFinalized = [&service_ptr](const Submission& sub, size_t queue_size) {
    spdlog::info("Submission finished: id={} status={} passed={}/{} queue={}", sub.id,
                 StatusName(sub.status), sub.test_cases_passed, sub.test_cases_total, queue_size);
    if (service_ptr) service_ptr->NotifyFinalized();
  };
  Dispatcher dispatcher(db, sandbox, dispatcher_opt);
  SubmissionService service(db, dispatcher, api_opt);
  service_ptr = &service;
  dispatcher.Start();

  ApiServer server(service, dispatcher, server_opt);
  bool listen_ok = true;
  std::thread server_thread([&] {
    if (!server.Listen(listen_host, listen_port)) {
      spdlog::error("Failed to listen on {}:{}", listen_host, listen_port);
      listen_ok = false;
      kill(getpid(), SIGTERM);
    }
  });

  int sig = 0;
  sigwait(&sigs, &sig);
  spdlog::warn("Received signal {}, shutting down", sig);
  server.Stop();
  server_thread.join();
  dispatcher.Stop();
  return listen_ok ? 0 : 1;
}
