#ifndef INCLUDE_OJUDGE_DISPATCHER_H_
#define INCLUDE_OJUDGE_DISPATCHER_H_

#include <mutex>
#include <deque>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <optional>
#include <functional>
#include <unordered_set>
#include <condition_variable>

#include "reporter.h"
#include "grading.h"
#include "database.h"
#include "sandbox.h"

// FIFO of submission ids with duplicate suppression. Durability comes from the PENDING status in
// the record store; the queue only holds references.
class SubmissionQueue {
  mutable std::mutex mtx_;
  std::condition_variable cv_, idle_cv_;
  std::deque<std::string> queue_;
  std::unordered_set<std::string> queued_;
  size_t max_size_;
  size_t in_flight_;
  bool closed_;

 public:
  // 0 = no limit
  explicit SubmissionQueue(size_t max_size = 0);

  // false if full, closed or already queued
  bool Push(const std::string& id);
  // Blocks until an id is available; nullopt once closed. Each popped id must be followed by Done().
  std::optional<std::string> Pop();
  void Done();
  void Close();
  size_t Size() const;
  // Blocks until the queue is empty and nothing popped is still in flight
  void WaitIdle();
};

// (time complexity, memory complexity)
using ComplexityClassifier = std::function<std::pair<std::string, std::string>(
    const Submission&, const std::string& code, const AggregateResult&)>;

struct DispatcherOptions {
  int workers;
  size_t max_queue; // 0 = no limit
  std::chrono::seconds rescan_interval;
  std::chrono::milliseconds submission_deadline; // 0 = none
  // 0: an infrastructure failure marks the submission FAILED at once and an operator requeues it
  int infrastructure_retries;
  bool continue_samples;
  bool run_all_tests;
  ComplexityClassifier classify; // only called for ACCEPTED submissions
  Reporter reporter;

  DispatcherOptions() :
      workers(1), max_queue(0), rescan_interval(10), submission_deadline(0),
      infrastructure_retries(0), continue_samples(false), run_all_tests(false) {}
};

class Dispatcher {
  Database& db_;
  Sandbox& sandbox_;
  DispatcherOptions opt_;
  SubmissionQueue queue_;
  std::vector<std::thread> workers_;
  std::thread rescan_thread_;
  std::mutex stop_mtx_;
  std::condition_variable stop_cv_;
  bool started_, stopping_;

  void WorkerLoop();
  void RescanLoop();
  // Never throw; failures are logged
  void MarkFailed(const std::string& id);
  void Finalize(const std::string& id);
  // InfrastructureFailure is retried up to infrastructure_retries times
  AggregateResult GradeWithRetries(const Submission&);
  // Throws if the PROCESSING -> verdict transition cannot be stored
  void StoreVerdict(const Submission&, const AggregateResult&);

 public:
  Dispatcher(Database&, Sandbox&, DispatcherOptions = DispatcherOptions());
  ~Dispatcher();
  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  // Recovers outstanding work, then starts the workers and the re-scan thread
  void Start();
  // Workers finish their current submission; queued ids stay PENDING in the store
  void Stop();

  // false if the queue rejected it; the submission stays PENDING for the next re-scan
  bool Enqueue(const std::string& id);
  // Enqueues every PENDING submission, oldest first; returns how many were newly queued
  size_t RecoverPending();
  // PROCESSING rows with no live worker (after a crash) become FAILED; returns how many
  size_t FailStaleProcessing();

  // Runs one submission to a terminal status on the calling thread.
  // Returns false without side effects if another worker already owns it.
  bool ProcessSubmission(const std::string& id);

  size_t QueueSize() const { return queue_.Size(); }
  int Workers() const { return opt_.workers; }
  void WaitIdle() { queue_.WaitIdle(); }
};

#endif  // INCLUDE_OJUDGE_DISPATCHER_H_
