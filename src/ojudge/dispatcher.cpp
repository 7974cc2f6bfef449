#include <ojudge/dispatcher.h>

#include <spdlog/spdlog.h>

#include <ojudge/utils.h>
#include <ojudge/errors.h>
#include <ojudge/artifacts.h>

SubmissionQueue::SubmissionQueue(size_t max_size) :
    max_size_(max_size), in_flight_(0), closed_(false) {}

bool SubmissionQueue::Push(const std::string& id) {
  {
    std::lock_guard lck(mtx_);
    if (closed_ || queued_.count(id)) return false;
    if (max_size_ && queue_.size() >= max_size_) return false;
    queue_.push_back(id);
    queued_.insert(id);
  }
  cv_.notify_one();
  return true;
}

std::optional<std::string> SubmissionQueue::Pop() {
  std::unique_lock lck(mtx_);
  cv_.wait(lck, [this]{ return closed_ || !queue_.empty(); });
  if (closed_) return std::nullopt;
  std::string id = std::move(queue_.front());
  queue_.pop_front();
  queued_.erase(id);
  in_flight_++;
  return id;
}

void SubmissionQueue::Done() {
  std::lock_guard lck(mtx_);
  in_flight_--;
  if (queue_.empty() && !in_flight_) idle_cv_.notify_all();
}

void SubmissionQueue::Close() {
  {
    std::lock_guard lck(mtx_);
    closed_ = true;
    queue_.clear();
    queued_.clear();
  }
  cv_.notify_all();
  idle_cv_.notify_all();
}

size_t SubmissionQueue::Size() const {
  std::lock_guard lck(mtx_);
  return queue_.size();
}

void SubmissionQueue::WaitIdle() {
  std::unique_lock lck(mtx_);
  idle_cv_.wait(lck, [this]{ return queue_.empty() && !in_flight_; });
}

Dispatcher::Dispatcher(Database& db, Sandbox& sandbox, DispatcherOptions opt) :
    db_(db), sandbox_(sandbox), opt_(std::move(opt)), queue_(opt_.max_queue),
    started_(false), stopping_(false) {
  if (opt_.workers < 1) opt_.workers = 1;
}

Dispatcher::~Dispatcher() {
  Stop();
}

void Dispatcher::Start() {
  if (started_) return;
  size_t failed = FailStaleProcessing();
  size_t recovered = RecoverPending();
  spdlog::info("Dispatcher starting: workers={} stale={} recovered={}",
               opt_.workers, failed, recovered);
  started_ = true;
  for (int i = 0; i < opt_.workers; i++) workers_.emplace_back(&Dispatcher::WorkerLoop, this);
  if (opt_.rescan_interval.count() > 0) rescan_thread_ = std::thread(&Dispatcher::RescanLoop, this);
}

void Dispatcher::Stop() {
  {
    std::lock_guard lck(stop_mtx_);
    if (stopping_) return;
    stopping_ = true;
  }
  stop_cv_.notify_all();
  queue_.Close();
  if (rescan_thread_.joinable()) rescan_thread_.join();
  for (auto& i : workers_) i.join();
  workers_.clear();
  if (started_) spdlog::info("Dispatcher stopped");
}

bool Dispatcher::Enqueue(const std::string& id) {
  bool ok = queue_.Push(id);
  if (ok) {
    spdlog::debug("Submission {} enqueued, queue size {}", id, queue_.Size());
  } else {
    spdlog::info("Submission {} not enqueued; left PENDING for re-scan", id);
  }
  return ok;
}

size_t Dispatcher::RecoverPending() {
  size_t count = 0;
  for (auto& sub : db_.ListByStatus(Status::PENDING)) {
    if (queue_.Push(sub.id)) count++;
  }
  if (count) spdlog::info("Enqueued {} pending submissions", count);
  return count;
}

size_t Dispatcher::FailStaleProcessing() {
  size_t count = 0;
  for (auto& sub : db_.ListByStatus(Status::PROCESSING)) {
    if (db_.Transition(sub.id, Status::PROCESSING, Status::FAILED)) {
      spdlog::warn("Submission {} was left PROCESSING; marked FAILED", sub.id);
      count++;
    }
  }
  return count;
}

void Dispatcher::WorkerLoop() {
  while (auto id = queue_.Pop()) {
    try {
      ProcessSubmission(*id);
    } catch (const std::exception& e) {
      spdlog::error("Worker error on submission {}: {}", *id, e.what());
    }
    queue_.Done();
  }
}

void Dispatcher::RescanLoop() {
  std::unique_lock lck(stop_mtx_);
  while (!stop_cv_.wait_for(lck, opt_.rescan_interval, [this]{ return stopping_; })) {
    lck.unlock();
    try {
      RecoverPending();
    } catch (const std::exception& e) {
      spdlog::error("Re-scan failed: {}", e.what());
    }
    lck.lock();
  }
}

void Dispatcher::MarkFailed(const std::string& id) {
  try {
    if (!db_.Transition(id, Status::PROCESSING, Status::FAILED)) {
      spdlog::error("Submission {}: cannot mark FAILED", id);
    }
  } catch (const std::exception& e) {
    spdlog::error("Submission {}: cannot mark FAILED: {}", id, e.what());
  }
}

void Dispatcher::Finalize(const std::string& id) {
  if (!opt_.reporter.ReportFinalized) return;
  try {
    if (auto sub = db_.Get(id)) opt_.reporter.ReportFinalized(*sub, queue_.Size());
  } catch (const std::exception& e) {
    spdlog::error("Submission {}: finalize report failed: {}", id, e.what());
  }
}

AggregateResult Dispatcher::GradeWithRetries(const Submission& sub) {
  const std::string& id = sub.id;
  std::optional<std::chrono::steady_clock::time_point> deadline;
  if (opt_.submission_deadline.count() > 0) {
    deadline = std::chrono::steady_clock::now() + opt_.submission_deadline;
  }
  for (int attempt = 0;; attempt++) {
    try {
      auto problem = db_.GetProblem(sub.problem_id);
      if (!problem) throw InfrastructureFailure("problem " + sub.problem_id + " not found");
      GradeInput input;
      input.tests = db_.GetTestCases(sub.problem_id);
      if (input.tests.empty()) {
        throw InfrastructureFailure("problem " + sub.problem_id + " has no test cases");
      }
      auto code = ReadCode(id, sub.language);
      if (!code) throw InfrastructureFailure("code of submission " + id + " is missing");
      input.submission_id = id;
      input.language = sub.language;
      input.code = std::move(*code);
      input.limits = ProblemLimits(*problem);

      GradeOptions gopt;
      gopt.compare = MakeComparator(problem->comparator);
      gopt.run_all_tests = opt_.run_all_tests;
      gopt.continue_samples = opt_.continue_samples;
      gopt.deadline = deadline;
      return Grade(sandbox_, input, gopt, &opt_.reporter);
    } catch (const InfrastructureFailure& e) {
      if (attempt >= opt_.infrastructure_retries) throw;
      spdlog::warn("Submission {}: attempt {} failed: {}; retrying", id, attempt + 1, e.what());
      ResetGradingArtifacts(id);
    }
  }
}

void Dispatcher::StoreVerdict(const Submission& sub, const AggregateResult& res) {
  const std::string& id = sub.id;
  Submission fields;
  fields.runtime_ms = res.runtime_ms;
  fields.memory_kb = res.memory_kb;
  fields.test_cases_passed = res.passed;
  fields.test_cases_total = res.total;
  fields.points = res.points;
  fields.total_points = res.total_points;
  fields.failed_test = res.failed_test;
  if (res.status == Status::ACCEPTED && opt_.classify) {
    try {
      auto [time_cx, memory_cx] = opt_.classify(sub, ReadCode(id, sub.language).value_or(""), res);
      fields.time_complexity = std::move(time_cx);
      fields.memory_complexity = std::move(memory_cx);
    } catch (const std::exception& e) {
      spdlog::warn("Submission {}: complexity classification failed: {}", id, e.what());
    }
  }
  if (!db_.Transition(id, Status::PROCESSING, res.status, fields)) {
    throw InfrastructureFailure(std::string("cannot store verdict ") + StatusName(res.status));
  }
}

bool Dispatcher::ProcessSubmission(const std::string& id) {
  auto sub = db_.Get(id);
  if (!sub) {
    spdlog::warn("Submission {} not found", id);
    return false;
  }
  if (sub->status != Status::PENDING || !db_.Transition(id, Status::PENDING, Status::PROCESSING)) {
    spdlog::debug("Submission {} already taken", id);
    return false;
  }
  sub->status = Status::PROCESSING;

  // from here on the submission is ours and must end terminal
  bool stored = false;
  try {
    if (opt_.reporter.ReportStartProcessing) opt_.reporter.ReportStartProcessing(*sub);
    AggregateResult res = GradeWithRetries(*sub);
    StoreVerdict(*sub, res);
    stored = true;
    if (opt_.reporter.ReportOverallResult) opt_.reporter.ReportOverallResult(*sub, res);
  } catch (const std::exception& e) {
    spdlog::error("Submission {} failed: {}", id, e.what());
    if (!stored) MarkFailed(id);
  }
  Finalize(id);
  return true;
}
