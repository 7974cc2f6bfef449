#include <ojudge/api.h>

#include <spdlog/spdlog.h>

#include <ojudge/utils.h>
#include <ojudge/errors.h>

namespace {

bool IsBlank(const std::string& str) {
  return str.find_first_not_of(" \n\r\t\x0b\x0c") == std::string::npos;
}

} // namespace

SubmissionService::SubmissionService(Database& db, Dispatcher& dispatcher, ApiOptions opt) :
    db_(db), dispatcher_(dispatcher), opt_(opt), finalized_count_(0) {}

std::string SubmissionService::CreateAndEnqueue(Submission&& sub, const std::string& code) {
  sub.id = GenerateSubmissionId();
  // the record must never exist without its code, and the queue entry never without its record
  WriteCode(sub.id, sub.language, code);
  std::string id = db_.CreatePending(std::move(sub));
  dispatcher_.Enqueue(id);
  return id;
}

std::string SubmissionService::Submit(const Identity& identity, const std::string& problem_id,
                                      const std::string& language, const std::string& code) {
  if (identity.user_id.empty()) throw ValidationError("missing user");
  auto lang = ParseLanguage(language);
  if (!lang) throw ValidationError("unsupported language: " + language);
  if (IsBlank(code)) throw ValidationError("empty code");
  if (code.size() > opt_.max_code_bytes) {
    throw ValidationError("code exceeds " + std::to_string(opt_.max_code_bytes) + " bytes");
  }
  if (problem_id.empty() || !db_.GetProblem(problem_id)) {
    throw ValidationError("unknown problem: " + problem_id);
  }
  Submission sub;
  sub.user_id = identity.user_id;
  sub.problem_id = problem_id;
  sub.language = *lang;
  std::string id = CreateAndEnqueue(std::move(sub), code);
  spdlog::info("Submission {} received: user={} problem={} language={} size={}",
               id, identity.user_id, problem_id, LanguageName(*lang), code.size());
  return id;
}

SubmissionDetails SubmissionService::GetDetails(const Identity& identity, const std::string& id) {
  auto sub = db_.Get(id);
  if (!sub) throw NotFound("submission " + id + " not found");
  if (!identity.is_admin && sub->user_id != identity.user_id) {
    throw Forbidden("submission " + id + " belongs to another user");
  }
  SubmissionDetails details;
  details.record = *sub;
  details.code = ReadCode(id, sub->language).value_or("");
  for (auto& rec : ReadTestStatus(id)) {
    if (rec.index) details.tests.push_back(rec);
  }
  if (sub->status == Status::COMPILATION_ERROR) details.compile_message = ReadCompileMessage(id);

  if (IsTerminal(sub->status) && sub->failed_test > 0) {
    for (auto& rec : details.tests) {
      if (rec.index != sub->failed_test) continue;
      FailedTestDetail failed;
      failed.index = rec.index;
      failed.sequence_number = rec.sequence_number;
      failed.is_sample = rec.sample;
      failed.outcome = rec.outcome;
      // the copy taken at grading time; the problem may have been re-imported since
      if (auto tc = ReadFailedTest(id); tc && tc->sequence_number == rec.sequence_number) {
        failed.notes = tc->notes;
        if (rec.sample || identity.is_admin) {
          failed.input = tc->input;
          failed.expected_output = tc->expected_output;
          failed.actual_output = ReadOutput(id, rec.index).value_or("");
        }
      }
      details.failed = std::move(failed);
      break;
    }
  }
  return details;
}

std::vector<Submission> SubmissionService::List(const Identity& identity, SubmissionFilter filter) {
  if (!identity.is_admin) {
    if (!filter.user_id.empty() && filter.user_id != identity.user_id) {
      throw Forbidden("cannot list submissions of another user");
    }
    filter.user_id = identity.user_id;
  }
  return db_.List(filter);
}

std::string SubmissionService::Requeue(const Identity& identity, const std::string& id) {
  if (!identity.is_admin) throw Forbidden("requeue requires an administrator");
  auto sub = db_.Get(id);
  if (!sub) throw NotFound("submission " + id + " not found");
  if (sub->status != Status::FAILED) {
    throw ValidationError(std::string("submission is ") + StatusName(sub->status) + ", not FAILED");
  }
  auto code = ReadCode(id, sub->language);
  if (!code) throw InfrastructureFailure("code of submission " + id + " is missing");
  Submission copy;
  copy.user_id = sub->user_id;
  copy.problem_id = sub->problem_id;
  copy.language = sub->language;
  copy.requeued_from = id;
  std::string new_id = CreateAndEnqueue(std::move(copy), *code);
  spdlog::info("Submission {} requeued as {} by {}", id, new_id, identity.user_id);
  return new_id;
}

ProblemStats SubmissionService::GetProblemStats(const std::string& problem_id) {
  if (!db_.GetProblem(problem_id)) throw NotFound("problem " + problem_id + " not found");
  return db_.GetProblemStats(problem_id);
}

bool SubmissionService::WaitForTerminal(const std::string& id, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  std::unique_lock lck(notify_mtx_);
  while (true) {
    unsigned long seen = finalized_count_;
    lck.unlock();
    auto sub = db_.Get(id);
    if (!sub) throw NotFound("submission " + id + " not found");
    if (IsTerminal(sub->status)) return true;
    lck.lock();
    if (!notify_cv_.wait_until(lck, deadline, [&]{ return finalized_count_ != seen; })) {
      return false;
    }
  }
}

void SubmissionService::NotifyFinalized() {
  {
    std::lock_guard lck(notify_mtx_);
    finalized_count_++;
  }
  notify_cv_.notify_all();
}
