#include "execution_bridge.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace toolserver {
namespace {

static int64_t ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
}

// Runs on the mutation context. Nothing thrown by the work may escape into
// the queue loop.
static void RunGuarded(const std::function<std::string()>& work, PendingInvocation* pending, bool* stored) {
  bool ok = false;
  try {
    auto value = work();
    ok = pending->Complete(std::move(value));
  } catch (const std::exception& e) {
    ok = pending->Fail(e.what());
  } catch (...) {
    ok = pending->Fail("unknown exception");
  }
  if (stored) *stored = ok;
}

}  // namespace

WorkQueueContext::~WorkQueueContext() {
  Stop();
}

void WorkQueueContext::Start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (running_) return;
  running_ = true;
  stopping_ = false;
  thread_ = std::thread([this]() { Loop(); });
  thread_id_ = thread_.get_id();
}

void WorkQueueContext::Stop() {
  std::thread t;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!running_) return;
    stopping_ = true;
    t = std::move(thread_);
  }
  cv_.notify_all();
  if (t.joinable()) t.join();
  std::lock_guard<std::mutex> lock(mu_);
  running_ = false;
  thread_id_ = std::thread::id();
}

bool WorkQueueContext::Submit(std::function<void()> work) {
  if (!work) return false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!running_ || stopping_) return false;
    queue_.push_back(std::move(work));
  }
  cv_.notify_one();
  return true;
}

bool WorkQueueContext::IsMutationThread() const {
  std::lock_guard<std::mutex> lock(mu_);
  return running_ && std::this_thread::get_id() == thread_id_;
}

size_t WorkQueueContext::Pending() const {
  std::lock_guard<std::mutex> lock(mu_);
  return queue_.size();
}

void WorkQueueContext::Loop() {
  for (;;) {
    std::function<void()> work;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) return;
      work = std::move(queue_.front());
      queue_.pop_front();
    }
    try {
      work();
    } catch (const std::exception& e) {
      std::cout << "[bridge] mutation work threw: " << e.what() << "\n";
    } catch (...) {
      std::cout << "[bridge] mutation work threw a non-standard exception\n";
    }
  }
}

const char* InvocationStateName(InvocationState state) {
  switch (state) {
    case InvocationState::Completed:
      return "completed";
    case InvocationState::Failed:
      return "failed";
    case InvocationState::TimedOut:
      return "timed_out";
    case InvocationState::Rejected:
      return "rejected";
  }
  return "unknown";
}

bool PendingInvocation::Set(bool failed, std::string text) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (done_ || abandoned_) return false;
    done_ = true;
    failed_ = failed;
    if (failed) {
      error_ = std::move(text);
    } else {
      value_ = std::move(text);
    }
  }
  cv_.notify_all();
  return true;
}

bool PendingInvocation::Complete(std::string value) {
  return Set(false, std::move(value));
}

bool PendingInvocation::Fail(std::string error) {
  return Set(true, std::move(error));
}

bool PendingInvocation::WaitFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mu_);
  if (cv_.wait_for(lock, timeout, [this]() { return done_; })) return true;
  abandoned_ = true;
  return false;
}

bool PendingInvocation::Done() const {
  std::lock_guard<std::mutex> lock(mu_);
  return done_;
}

bool PendingInvocation::Abandoned() const {
  std::lock_guard<std::mutex> lock(mu_);
  return abandoned_;
}

bool PendingInvocation::Failed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return failed_;
}

std::string PendingInvocation::TakeValue() {
  std::lock_guard<std::mutex> lock(mu_);
  return std::move(value_);
}

std::string PendingInvocation::TakeError() {
  std::lock_guard<std::mutex> lock(mu_);
  return std::move(error_);
}

ExecutionBridge::ExecutionBridge(IMutationContext* context) : context_(context) {}

InvocationOutcome ExecutionBridge::Run(std::function<std::string()> work, std::chrono::milliseconds timeout) {
  const auto start = std::chrono::steady_clock::now();
  submitted_++;
  InvocationOutcome out;

  auto finish = [&](PendingInvocation* pending) {
    if (pending->Failed()) {
      out.state = InvocationState::Failed;
      out.error = pending->TakeError();
      failed_++;
    } else {
      out.state = InvocationState::Completed;
      out.value = pending->TakeValue();
      completed_++;
    }
    out.elapsed_ms = ElapsedMs(start);
    return out;
  };

  if (!context_ || !work) {
    rejected_++;
    out.state = InvocationState::Rejected;
    out.error = "mutation context unavailable";
    return out;
  }

  if (context_->IsMutationThread()) {
    PendingInvocation inline_pending;
    RunGuarded(work, &inline_pending, nullptr);
    return finish(&inline_pending);
  }

  auto pending = std::make_shared<PendingInvocation>();
  auto late = late_results_;
  const bool accepted = context_->Submit([pending, late, work = std::move(work)]() {
    bool stored = false;
    RunGuarded(work, pending.get(), &stored);
    if (!stored) {
      (*late)++;
      std::cout << "[bridge] late result dropped (waiter timed out)\n";
    }
  });
  if (!accepted) {
    rejected_++;
    out.state = InvocationState::Rejected;
    out.error = "mutation context is not accepting work";
    out.elapsed_ms = ElapsedMs(start);
    return out;
  }

  if (!pending->WaitFor(timeout)) {
    timed_out_++;
    out.state = InvocationState::TimedOut;
    out.error = "timeout waiting for mutation context after " + std::to_string(timeout.count()) + " ms";
    out.elapsed_ms = ElapsedMs(start);
    return out;
  }
  return finish(pending.get());
}

BridgeStats ExecutionBridge::Stats() const {
  BridgeStats s;
  s.submitted = submitted_.load();
  s.completed = completed_.load();
  s.failed = failed_.load();
  s.timed_out = timed_out_.load();
  s.rejected = rejected_.load();
  s.late_results = late_results_->load();
  return s;
}

}  // namespace toolserver
