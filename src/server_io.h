#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <atomic>
#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <ojudge/api.h>
#include <ojudge/dispatcher.h>

// longest long-poll a client may ask for
extern int kMaxWaitSeconds;

nlohmann::json SubmissionJSON(const Submission&);
nlohmann::json DetailsJSON(const SubmissionDetails&);
nlohmann::json ProblemStatsJSON(const ProblemStats&);

struct ServerOptions {
  int threads;
  // long polls beyond this answer at once, keeping threads free for other requests
  int max_long_polls;

  ServerOptions() : threads(16), max_long_polls(8) {}
};

// HTTP front end of the submission API. The caller is expected to sit behind an authenticating
// proxy that sets X-User-Id (and X-User-Admin: 1 for administrators).
class ApiServer {
  SubmissionService& service_;
  Dispatcher& dispatcher_;
  ServerOptions opt_;
  httplib::Server server_;
  std::atomic_int long_polls_;

  void SetupRoutes();

 public:
  ApiServer(SubmissionService&, Dispatcher&, ServerOptions = ServerOptions());

  // These block until Stop() is called
  bool Listen(const std::string& host, int port);
  bool ListenAfterBind();
  // returns the port, or -1 on failure
  int BindToAnyPort(const std::string& host);
  void Stop();
};

#endif  // SERVER_IO_H_
