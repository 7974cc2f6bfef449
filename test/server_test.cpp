#include <atomic>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "server_io.h"
#include "example_problem.h"

class ServerTest : public ExampleProblem {
 protected:
  std::unique_ptr<Dispatcher> dispatcher;
  std::unique_ptr<SubmissionService> service;
  std::unique_ptr<ApiServer> server;
  std::unique_ptr<httplib::Client> cli;
  std::thread server_thread;
  ServerOptions server_opt;
  int port = -1;

  const httplib::Headers kAlice{{"X-User-Id", "alice"}};
  const httplib::Headers kBob{{"X-User-Id", "bob"}};
  const httplib::Headers kAdmin{{"X-User-Id", "root"}, {"X-User-Admin", "1"}};

  void SetUp() override {
    ExampleProblem::SetUp();
    AddProblem("p1", 2, 1);
    DispatcherOptions opt;
    opt.rescan_interval = std::chrono::seconds(0);
    opt.reporter.ReportFinalized = [this](const Submission&, size_t) { service->NotifyFinalized(); };
    dispatcher = std::make_unique<Dispatcher>(*db, sandbox, opt);
    service = std::make_unique<SubmissionService>(*db, *dispatcher);
    server = std::make_unique<ApiServer>(*service, *dispatcher, server_opt);
    port = server->BindToAnyPort("127.0.0.1");
    ASSERT_GT(port, 0);
    server_thread = std::thread([this] { server->ListenAfterBind(); });
    cli = std::make_unique<httplib::Client>("127.0.0.1", port);
  }

  void TearDown() override {
    if (server) server->Stop();
    if (server_thread.joinable()) server_thread.join();
    dispatcher->Stop();
    server.reset();
    service.reset();
    dispatcher.reset();
    ExampleProblem::TearDown();
  }

  std::string Submit(const httplib::Headers& who, const std::string& code) {
    nlohmann::json body{{"problem_id", "p1"}, {"language", "cpp"}, {"code", code}};
    auto res = cli->Post("/submit", who, body.dump(), "application/json");
    EXPECT_TRUE(res);
    if (!res) return "";
    EXPECT_EQ(res->status, 202);
    return nlohmann::json::parse(res->body).at("submission_id").get<std::string>();
  }
};

TEST_F(ServerTest, SubmitErrors) {
  nlohmann::json body{{"problem_id", "p1"}, {"language", "cpp"}, {"code", "echo"}};
  auto res = cli->Post("/submit", body.dump(), "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 401);

  res = cli->Post("/submit", kAlice, "{not json", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);

  res = cli->Post("/submit", kAlice, nlohmann::json{{"problem_id", "p1"}}.dump(), "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);

  body["language"] = "cobol";
  res = cli->Post("/submit", kAlice, body.dump(), "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_TRUE(nlohmann::json::parse(res->body).contains("error"));
}

TEST_F(ServerTest, GetSubmission) {
  std::string id = Submit(kAlice, "raise-on 2");
  ASSERT_TRUE(dispatcher->ProcessSubmission(id));

  auto res = cli->Get(("/submission/" + id).c_str(), kAlice);
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200);
  auto json = nlohmann::json::parse(res->body);
  EXPECT_EQ(json["status"], "RUNTIME_ERROR");
  EXPECT_EQ(json["code"], "raise-on 2");
  EXPECT_EQ(json["test_cases_passed"], 1);
  EXPECT_EQ(json["test_cases_total"], 2);
  EXPECT_EQ(json["tests"].size(), 2u);
  EXPECT_EQ(json["failed_test_detail"]["sequence_number"], 2);
  EXPECT_FALSE(json["failed_test_detail"].contains("input"));

  res = cli->Get(("/submission/" + id).c_str(), kBob);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 403);
  res = cli->Get("/submission/ffffffffffffffffffffffff", kAlice);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
}

TEST_F(ServerTest, LongPoll) {
  std::string id = Submit(kAlice, "echo");
  dispatcher->Start();
  auto res = cli->Get(("/submission/" + id + "?wait=30").c_str(), kAlice);
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200);
  EXPECT_EQ(nlohmann::json::parse(res->body)["status"], "ACCEPTED");
}

TEST_F(ServerTest, ListAndStatus) {
  Submit(kAlice, "echo");
  Submit(kBob, "echo");
  auto res = cli->Get("/submissions", kAlice);
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200);
  EXPECT_EQ(nlohmann::json::parse(res->body)["submissions"].size(), 1u);

  res = cli->Get("/submissions?status=DONE", kAdmin);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  res = cli->Get("/submissions?limit=500", kAdmin);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  res = cli->Get("/submissions?user_id=bob", kAlice);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 403);

  res = cli->Get("/status");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200);
  auto json = nlohmann::json::parse(res->body);
  EXPECT_EQ(json["queue_size"], 2);
  EXPECT_EQ(json["workers"], 1);
}

TEST_F(ServerTest, Requeue) {
  std::string id = Submit(kAlice, "infra");
  ASSERT_TRUE(dispatcher->ProcessSubmission(id));
  auto res = cli->Post(("/submission/" + id + "/requeue").c_str(), kAlice, "", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 403);
  res = cli->Post(("/submission/" + id + "/requeue").c_str(), kAdmin, "", "application/json");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 202);
  std::string new_id = nlohmann::json::parse(res->body)["submission_id"].get<std::string>();
  EXPECT_NE(new_id, id);
}

TEST_F(ServerTest, ProblemStats) {
  ASSERT_TRUE(dispatcher->ProcessSubmission(Submit(kAlice, "echo")));
  ASSERT_TRUE(dispatcher->ProcessSubmission(Submit(kAlice, "wrong")));
  auto res = cli->Get("/problem/p1/stats", kBob);
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200);
  auto json = nlohmann::json::parse(res->body);
  EXPECT_EQ(json["judged"], 2);
  EXPECT_EQ(json["accepted"], 1);
  EXPECT_DOUBLE_EQ(json["acceptance_rate"].get<double>(), 50.0);

  res = cli->Get("/problem/nope/stats", kBob);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
}

class ServerBusyTest : public ServerTest {
 protected:
  void SetUp() override {
    server_opt.threads = 4;
    server_opt.max_long_polls = 2;
    ServerTest::SetUp();
  }
};

TEST_F(ServerBusyTest, SubmitWhileClientsWait) {
  std::string id = Submit(kAlice, "echo");
  ASSERT_FALSE(id.empty());
  constexpr int kPolls = 8;
  std::atomic_int answered = 0;
  std::vector<std::thread> polls;
  for (int i = 0; i < kPolls; i++) {
    polls.emplace_back([&] {
      httplib::Client client("127.0.0.1", port);
      client.set_read_timeout(30, 0);
      auto res = client.Get(("/submission/" + id + "?wait=20").c_str(), kAlice);
      if (res && res->status == 200) answered++;
    });
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(300));

  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(Submit(kBob, "echo").empty());
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));

  // grading the first submission releases the clients still waiting on it
  dispatcher->Start();
  for (auto& i : polls) i.join();
  EXPECT_EQ(answered.load(), kPolls);
}
