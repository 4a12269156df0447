#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace toolserver {

// The host's "run on the mutation context" primitive. Submit returns
// immediately; accepted work runs later, exactly once, in submission order.
class IMutationContext {
 public:
  virtual ~IMutationContext() = default;

  virtual bool Submit(std::function<void()> work) = 0;
  virtual bool IsMutationThread() const = 0;
  virtual size_t Pending() const { return 0; }
};

// A dedicated thread draining a FIFO queue. Stop() runs whatever is already
// queued, then joins; later submissions are refused.
class WorkQueueContext : public IMutationContext {
 public:
  WorkQueueContext() = default;
  ~WorkQueueContext() override;
  WorkQueueContext(const WorkQueueContext&) = delete;
  WorkQueueContext& operator=(const WorkQueueContext&) = delete;

  void Start();
  void Stop();

  bool Submit(std::function<void()> work) override;
  bool IsMutationThread() const override;
  size_t Pending() const override;

 private:
  void Loop();

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> queue_;
  bool running_ = false;
  bool stopping_ = false;
  std::thread::id thread_id_;
  std::thread thread_;
};

enum class InvocationState { Completed, Failed, TimedOut, Rejected };

const char* InvocationStateName(InvocationState state);

struct InvocationOutcome {
  InvocationState state = InvocationState::Completed;
  std::string value;
  std::string error;
  int64_t elapsed_ms = 0;
};

// Single-assignment result cell plus completion signal shared between the
// waiting request thread and the mutation context. The first Complete/Fail
// wins; anything after that, including a write into a cell whose waiter
// already timed out, is dropped.
class PendingInvocation {
 public:
  bool Complete(std::string value);
  bool Fail(std::string error);

  // True once a result is available, false on timeout. A timed-out wait marks
  // the cell abandoned.
  bool WaitFor(std::chrono::milliseconds timeout);

  bool Done() const;
  bool Abandoned() const;
  bool Failed() const;
  std::string TakeValue();
  std::string TakeError();

 private:
  bool Set(bool failed, std::string text);

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool done_ = false;
  bool failed_ = false;
  bool abandoned_ = false;
  std::string value_;
  std::string error_;
};

struct BridgeStats {
  uint64_t submitted = 0;
  uint64_t completed = 0;
  uint64_t failed = 0;
  uint64_t timed_out = 0;
  uint64_t rejected = 0;
  uint64_t late_results = 0;
};

class ExecutionBridge {
 public:
  explicit ExecutionBridge(IMutationContext* context);

  // Blocks the calling thread until the work has run on the mutation context
  // or the timeout expires. Exceptions thrown by the work become Failed.
  // Calls made from the mutation thread itself run inline.
  InvocationOutcome Run(std::function<std::string()> work, std::chrono::milliseconds timeout);

  BridgeStats Stats() const;
  IMutationContext* Context() const { return context_; }

 private:
  IMutationContext* context_;
  std::atomic<uint64_t> submitted_{0};
  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> timed_out_{0};
  std::atomic<uint64_t> rejected_{0};
  std::shared_ptr<std::atomic<uint64_t>> late_results_ = std::make_shared<std::atomic<uint64_t>>(0);
};

}  // namespace toolserver
