#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <queue>
#include <string>
#include <vector>

namespace tidewater {

struct SimContext;
class ProcessError;

// A logically concurrent simulation process, written as an explicit state machine.
//
// step() runs one synchronous slice at the scheduler's current time and returns the
// wait (>= 0 hours) before the next slice, or std::nullopt once the process is done.
// Entity state may only be touched inside step(), never across a wait.
class Process {
 public:
  virtual ~Process() = default;

  // "consumption", "delivery", "resupply".
  virtual const char* kind() const = 0;
  virtual std::string ship_id() const { return {}; }
  virtual std::string customer_id() const { return {}; }

  virtual std::optional<double> step(SimContext& ctx) = 0;
};

// Cooperative single-threaded scheduler over virtual time.
//
// Pending resumptions are ordered by (wake_time, submission sequence), so processes
// woken at the same instant run in the order they were queued.
class Scheduler {
 public:
  using FailureHandler = std::function<void(const Process&, const ProcessError&)>;

  double now() const { return now_; }

  // Queue the first step of `p` at now(), behind everything already due at now().
  void start(std::unique_ptr<Process> p);

  // Resume every entry due at or before `until`, then move the clock to `until`.
  // Entries within float rounding of `until` count as due and run at `until`.
  // Entries beyond `until` stay queued.
  void run_until(SimContext& ctx, double until);

  // Drop every pending resumption (the horizon was reached).
  void discard_pending();

  // Called when a step throws ProcessError; the failing process is dropped afterwards.
  void set_failure_handler(FailureHandler handler) { on_failure_ = std::move(handler); }

  std::size_t pending() const { return queue_.size(); }
  std::size_t live_processes() const { return slots_.size() - free_slots_.size(); }
  std::uint64_t steps_run() const { return steps_run_; }

 private:
  struct Entry {
    double wake_time{0.0};
    std::uint64_t seq{0};
    std::size_t slot{0};
  };

  struct Later {
    bool operator()(const Entry& a, const Entry& b) const {
      if (a.wake_time != b.wake_time) return a.wake_time > b.wake_time;
      return a.seq > b.seq;
    }
  };

  void enqueue(double wake_time, std::size_t slot);
  void retire(std::size_t slot);

  std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
  std::vector<std::unique_ptr<Process>> slots_;
  std::vector<std::size_t> free_slots_;
  FailureHandler on_failure_;
  double now_{0.0};
  std::uint64_t next_seq_{0};
  std::uint64_t steps_run_{0};
};

} // namespace tidewater
