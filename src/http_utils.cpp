#include "http_utils.h"
#include <fmt/ranges.h>

namespace http_utils {

std::string FormatOneParam(const httplib::Params& params) {
  if (params.empty()) return "(none)";
  return fmt::format("{}", params);
}

bool IsSuccess(int code) {
  return code >= 200 && code < 299;
}

void LogRequest(const httplib::Request& req, const httplib::Response& res) {
  if (IsSuccess(res.status)) {
    spdlog::debug("{} {} params {} -> {}", req.method, req.path, FormatOneParam(req.params), res.status);
  } else {
    spdlog::info("{} {} params {} -> {}", req.method, req.path, FormatOneParam(req.params), res.status);
  }
}

void SetJSON(httplib::Response& res, int status, const nlohmann::json& body) {
  res.status = status;
  res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                  "application/json");
}

void SetError(httplib::Response& res, int status, const std::string& message) {
  SetJSON(res, status, {{"error", message}});
}

} // namespace http_utils
