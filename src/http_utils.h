#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Log HTTP requests and map errors to responses

#include <string>
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <ojudge/errors.h>

namespace http_utils {

std::string FormatOneParam(const httplib::Params&);

bool IsSuccess(int code);

// installed with httplib::Server::set_logger
void LogRequest(const httplib::Request&, const httplib::Response&);

void SetJSON(httplib::Response&, int status, const nlohmann::json&);
void SetError(httplib::Response&, int status, const std::string& message);

} // namespace http_utils

// Runs a route handler, turning the exceptions of the submission API into status codes
template <class Func>
void HandleRequest(const httplib::Request& req, httplib::Response& res, Func&& func) {
  using http_utils::SetError;
  try {
    func();
  } catch (const ValidationError& err) {
    SetError(res, 400, err.what());
  } catch (const nlohmann::json::exception& err) {
    SetError(res, 400, std::string("malformed request: ") + err.what());
  } catch (const NotFound& err) {
    SetError(res, 404, err.what());
  } catch (const Forbidden& err) {
    SetError(res, 403, err.what());
  } catch (const std::exception& err) {
    spdlog::error("{} {} failed: {}", req.method, req.path, err.what());
    SetError(res, 500, "internal error");
  }
}

#endif  // HTTP_UTILS_H_
