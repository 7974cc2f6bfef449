#include "server_io.h"

#include <optional>
#include <algorithm>

#include <spdlog/spdlog.h>

#include <ojudge/utils.h>
#include <ojudge/errors.h>
#include "http_utils.h"

int kMaxWaitSeconds = 60;

namespace {

using http_utils::SetJSON;
using http_utils::SetError;

std::optional<Identity> GetIdentity(const httplib::Request& req) {
  std::string user_id = req.get_header_value("X-User-Id");
  if (user_id.empty()) return std::nullopt;
  std::string admin = req.get_header_value("X-User-Admin");
  return Identity{user_id, admin == "1" || admin == "true"};
}

int IntParam(const httplib::Request& req, const char* name, int default_value) {
  if (!req.has_param(name)) return default_value;
  std::string str = req.get_param_value(name);
  try {
    size_t pos;
    int val = std::stoi(str, &pos);
    if (pos != str.size()) throw std::invalid_argument(name);
    return val;
  } catch (const std::logic_error&) {
    throw ValidationError(std::string("invalid ") + name + ": " + str);
  }
}

nlohmann::json TestJSON(const TestStatusRecord& rec) {
  return {
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

} // namespace

nlohmann::json SubmissionJSON(const Submission& sub) {
  return {
    {"id", sub.id},
    {"user_id", sub.user_id},
    {"problem_id", sub.problem_id},
    {"language", LanguageName(sub.language)},
    {"status", StatusName(sub.status)},
    {"submitted_at", sub.submitted_at},
    {"updated_at", sub.updated_at},
    {"runtime_ms", sub.runtime_ms},
    {"memory_kb", sub.memory_kb},
    {"test_cases_passed", sub.test_cases_passed},
    {"test_cases_total", sub.test_cases_total},
    {"points", sub.points},
    {"total_points", sub.total_points},
    {"failed_test", sub.failed_test},
    {"time_complexity", sub.time_complexity},
    {"memory_complexity", sub.memory_complexity},
    {"requeued_from", sub.requeued_from},
  };
}

nlohmann::json DetailsJSON(const SubmissionDetails& details) {
  nlohmann::json ret = SubmissionJSON(details.record);
  ret["code"] = details.code;
  ret["tests"] = nlohmann::json::array();
  for (auto& i : details.tests) ret["tests"].push_back(TestJSON(i));
  if (details.failed) {
    auto& failed = *details.failed;
    nlohmann::json obj = {
      {"index", failed.index},
      {"sequence_number", failed.sequence_number},
      {"sample", failed.is_sample},
      {"outcome", OutcomeName(failed.outcome)},
      {"notes", failed.notes},
    };
    if (failed.input) obj["input"] = *failed.input;
    if (failed.expected_output) obj["expected_output"] = *failed.expected_output;
    if (failed.actual_output) obj["actual_output"] = *failed.actual_output;
    ret["failed_test_detail"] = obj;
  } else {
    ret["failed_test_detail"] = nullptr;
  }
  if (details.record.status == Status::COMPILATION_ERROR) {
    ret["compile_message"] = details.compile_message;
  }
  return ret;
}

nlohmann::json ProblemStatsJSON(const ProblemStats& stats) {
  return {
    {"problem_id", stats.problem_id},
    {"judged", stats.judged},
    {"accepted", stats.accepted},
    {"acceptance_rate", stats.AcceptanceRate()},
    {"time_complexity_distribution", stats.time_complexity},
    {"memory_complexity_distribution", stats.memory_complexity},
    {"updated_at", stats.updated_at},
  };
}

ApiServer::ApiServer(SubmissionService& service, Dispatcher& dispatcher, ServerOptions opt) :
    service_(service), dispatcher_(dispatcher), opt_(opt), long_polls_(0) {
  if (opt_.threads < 2) opt_.threads = 2;
  // at least one thread is never held by a long poll
  opt_.max_long_polls = std::clamp(opt_.max_long_polls, 0, opt_.threads - 1);
  size_t threads = opt_.threads;
  server_.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
  SetupRoutes();
}

void ApiServer::SetupRoutes() {
  server_.set_logger(http_utils::LogRequest);

  server_.Post("/submit", [this](const httplib::Request& req, httplib::Response& res) {
    HandleRequest(req, res, [&] {
      auto identity = GetIdentity(req);
      if (!identity) return SetError(res, 401, "missing identity");
      auto body = nlohmann::json::parse(req.body);
      std::string id = service_.Submit(*identity,
          body.at("problem_id").get<std::string>(),
          body.at("language").get<std::string>(),
          body.at("code").get<std::string>());
      SetJSON(res, 202, {{"submission_id", id}});
    });
  });

  server_.Get("/submission/([0-9A-Za-z]+)", [this](const httplib::Request& req, httplib::Response& res) {
    HandleRequest(req, res, [&] {
      auto identity = GetIdentity(req);
      if (!identity) return SetError(res, 401, "missing identity");
      std::string id = req.matches[1];
      SubmissionDetails details = service_.GetDetails(*identity, id);
      int wait = IntParam(req, "wait", 0);
      if (wait < 0) throw ValidationError("invalid wait");
      if (wait && !IsTerminal(details.record.status)) {
        struct PollSlot {
          std::atomic_int& count;
          bool taken;
          PollSlot(std::atomic_int& n, int max) : count(n), taken(++n <= max) {
            if (!taken) count--;
          }
          ~PollSlot() { if (taken) count--; }
        } slot(long_polls_, opt_.max_long_polls);
        if (slot.taken) {
          service_.WaitForTerminal(id, std::chrono::seconds(std::min(wait, kMaxWaitSeconds)));
          details = service_.GetDetails(*identity, id);
        } else {
          spdlog::debug("Long-poll budget exhausted; answering {} at once", id);
        }
      }
      SetJSON(res, 200, DetailsJSON(details));
    });
  });

  server_.Get("/submissions", [this](const httplib::Request& req, httplib::Response& res) {
    HandleRequest(req, res, [&] {
      auto identity = GetIdentity(req);
      if (!identity) return SetError(res, 401, "missing identity");
      SubmissionFilter filter;
      filter.user_id = req.get_param_value("user_id");
      filter.problem_id = req.get_param_value("problem_id");
      if (req.has_param("status")) {
        filter.status = ParseStatus(req.get_param_value("status"));
        if (!filter.status) throw ValidationError("unknown status: " + req.get_param_value("status"));
      }
      if (req.has_param("language")) {
        filter.language = ParseLanguage(req.get_param_value("language"));
        if (!filter.language) {
          throw ValidationError("unsupported language: " + req.get_param_value("language"));
        }
      }
      filter.page = IntParam(req, "page", filter.page);
      filter.limit = IntParam(req, "limit", filter.limit);
      nlohmann::json list = nlohmann::json::array();
      for (auto& i : service_.List(*identity, filter)) list.push_back(SubmissionJSON(i));
      SetJSON(res, 200, {{"page", filter.page}, {"limit", filter.limit}, {"submissions", list}});
    });
  });

  server_.Post("/submission/([0-9A-Za-z]+)/requeue",
               [this](const httplib::Request& req, httplib::Response& res) {
    HandleRequest(req, res, [&] {
      auto identity = GetIdentity(req);
      if (!identity) return SetError(res, 401, "missing identity");
      std::string id = service_.Requeue(*identity, req.matches[1]);
      SetJSON(res, 202, {{"submission_id", id}});
    });
  });

  server_.Get("/problem/([^/]+)/stats", [this](const httplib::Request& req, httplib::Response& res) {
    HandleRequest(req, res, [&] {
      if (!GetIdentity(req)) return SetError(res, 401, "missing identity");
      SetJSON(res, 200, ProblemStatsJSON(service_.GetProblemStats(req.matches[1])));
    });
  });

  server_.Get("/status", [this](const httplib::Request& req, httplib::Response& res) {
    HandleRequest(req, res, [&] {
      SetJSON(res, 200, {
        {"queue_size", dispatcher_.QueueSize()},
        {"workers", dispatcher_.Workers()},
      });
    });
  });
}

bool ApiServer::Listen(const std::string& host, int port) {
  spdlog::info("Listening on {}:{}", host, port);
  return server_.listen(host, port);
}

int ApiServer::BindToAnyPort(const std::string& host) {
  return server_.bind_to_any_port(host);
}

bool ApiServer::ListenAfterBind() {
  return server_.listen_after_bind();
}

void ApiServer::Stop() {
  server_.stop();
}
