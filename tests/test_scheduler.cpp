#include <cmath>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "tidewater/core/context.h"
#include "tidewater/core/errors.h"
#include "tidewater/core/scheduler.h"

#define TW_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

using tidewater::Process;
using tidewater::SimContext;

struct Trace {
  std::vector<std::pair<double, std::string>> steps;
};

// Records each resumption, then waits the next delay in `waits` (done when exhausted).
class ScriptedProcess final : public Process {
 public:
  ScriptedProcess(std::string name, std::vector<double> waits, Trace* trace)
      : name_(std::move(name)), waits_(std::move(waits)), trace_(trace) {}

  const char* kind() const override { return "scripted"; }

  std::optional<double> step(SimContext& ctx) override {
    trace_->steps.emplace_back(ctx.now(), name_);
    if (next_ >= waits_.size()) return std::nullopt;
    return waits_[next_++];
  }

 private:
  std::string name_;
  std::vector<double> waits_;
  std::size_t next_{0};
  Trace* trace_{nullptr};
};

class FailingProcess final : public Process {
 public:
  explicit FailingProcess(double wait) : wait_(wait) {}

  const char* kind() const override { return "failing"; }
  std::string ship_id() const override { return "ship_9"; }

  std::optional<double> step(SimContext& ctx) override {
    if (!waited_) {
      waited_ = true;
      return wait_;
    }
    throw tidewater::RouteNotFound(ctx.params.port_location, "nowhere");
  }

 private:
  double wait_{0.0};
  bool waited_{false};
};

class BadWaitProcess final : public Process {
 public:
  const char* kind() const override { return "bad_wait"; }
  std::optional<double> step(SimContext&) override { return -1.0; }
};

// Spawns a child at the current instant on its first step.
class SpawningProcess final : public Process {
 public:
  explicit SpawningProcess(Trace* trace) : trace_(trace) {}

  const char* kind() const override { return "spawner"; }

  std::optional<double> step(SimContext& ctx) override {
    trace_->steps.emplace_back(ctx.now(), "spawner");
    ctx.start(std::make_unique<ScriptedProcess>("child", std::vector<double>{}, trace_));
    return std::nullopt;
  }

 private:
  Trace* trace_{nullptr};
};

struct Harness {
  tidewater::SimParams params;
  tidewater::DistanceMatrix distances;
  tidewater::SimState state;
  tidewater::Scheduler scheduler;

  SimContext ctx() { return SimContext{params, distances, state, scheduler}; }
};

} // namespace

int test_scheduler() {
  using tidewater::Scheduler;

  // Earliest wake time first; equal wake times resume in submission order.
  {
    Harness h;
    Trace trace;
    h.scheduler.start(std::make_unique<ScriptedProcess>("a", std::vector<double>{2.0, 2.0}, &trace));
    h.scheduler.start(std::make_unique<ScriptedProcess>("b", std::vector<double>{1.0, 3.0}, &trace));
    h.scheduler.start(std::make_unique<ScriptedProcess>("c", std::vector<double>{4.0}, &trace));

    SimContext ctx = h.ctx();
    h.scheduler.run_until(ctx, 10.0);

    const std::vector<std::pair<double, std::string>> expected = {
        {0.0, "a"}, {0.0, "b"}, {0.0, "c"}, {1.0, "b"}, {2.0, "a"}, {4.0, "c"}, {4.0, "b"}, {4.0, "a"},
    };
    TW_ASSERT(trace.steps == expected);
    TW_ASSERT(h.scheduler.pending() == 0);
    TW_ASSERT(h.scheduler.live_processes() == 0);
    TW_ASSERT(h.scheduler.now() == 10.0);
  }

  // The horizon is inclusive; later resumptions stay queued until discarded.
  {
    Harness h;
    Trace trace;
    h.scheduler.start(std::make_unique<ScriptedProcess>("tick", std::vector<double>(20, 1.0), &trace));

    SimContext ctx = h.ctx();
    h.scheduler.run_until(ctx, 3.0);
    TW_ASSERT(trace.steps.size() == 4); // t = 0, 1, 2, 3
    TW_ASSERT(trace.steps.back().first == 3.0);
    TW_ASSERT(h.scheduler.pending() == 1);

    // Incremental advance continues where it left off.
    h.scheduler.run_until(ctx, 5.5);
    TW_ASSERT(trace.steps.size() == 6);
    TW_ASSERT(h.scheduler.now() == 5.5);

    h.scheduler.discard_pending();
    TW_ASSERT(h.scheduler.pending() == 0);
    TW_ASSERT(h.scheduler.live_processes() == 0);
  }

  // 0.1 + 0.1 + 0.1 overshoots 0.3 by an ulp; the third tick still lands on the horizon.
  {
    Harness h;
    Trace trace;
    h.scheduler.start(std::make_unique<ScriptedProcess>("tick", std::vector<double>(10, 0.1), &trace));

    SimContext ctx = h.ctx();
    h.scheduler.run_until(ctx, 0.3);
    TW_ASSERT(trace.steps.size() == 4); // t = 0, 0.1, 0.2, 0.3
    TW_ASSERT(trace.steps.back().first == 0.3);
    TW_ASSERT(h.scheduler.pending() == 1);
    TW_ASSERT(h.scheduler.now() == 0.3);
  }

  // A process started mid-step runs at the same instant, after its parent.
  {
    Harness h;
    Trace trace;
    h.scheduler.start(std::make_unique<SpawningProcess>(&trace));
    h.scheduler.start(std::make_unique<ScriptedProcess>("sibling", std::vector<double>{}, &trace));

    SimContext ctx = h.ctx();
    h.scheduler.run_until(ctx, 0.0);
    TW_ASSERT(trace.steps.size() == 3);
    TW_ASSERT(trace.steps[0].second == "spawner");
    TW_ASSERT(trace.steps[1].second == "sibling");
    TW_ASSERT(trace.steps[2].second == "child");
  }

  // A ProcessError drops only the failing process.
  {
    Harness h;
    Trace trace;
    std::vector<std::string> failures;
    h.scheduler.set_failure_handler([&](const Process& p, const tidewater::ProcessError& e) {
      failures.push_back(std::string(p.kind()) + "|" + p.ship_id() + "|" + e.what());
    });
    h.scheduler.start(std::make_unique<FailingProcess>(2.0));
    h.scheduler.start(std::make_unique<ScriptedProcess>("survivor", std::vector<double>(10, 1.0), &trace));
    h.scheduler.start(std::make_unique<BadWaitProcess>());

    SimContext ctx = h.ctx();
    h.scheduler.run_until(ctx, 6.0);

    TW_ASSERT(failures.size() == 2);
    TW_ASSERT(failures[0].find("bad_wait||") == 0);
    TW_ASSERT(failures[1] == "failing|ship_9|No route found from port_main to nowhere");
    TW_ASSERT(trace.steps.size() == 7); // t = 0..6
    TW_ASSERT(h.scheduler.live_processes() == 1);
  }

  return 0;
}
