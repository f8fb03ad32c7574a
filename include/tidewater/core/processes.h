#pragma once

#include <optional>
#include <string>

#include "tidewater/core/scheduler.h"

namespace tidewater {

// Per-customer demand loop: every time_step, consume and ask for a delivery when
// days of supply fall below the resupply threshold. Never finishes on its own.
class ConsumptionProcess final : public Process {
 public:
  explicit ConsumptionProcess(std::string customer_id);

  const char* kind() const override { return "consumption"; }
  std::string customer_id() const override { return customer_id_; }
  std::optional<double> step(SimContext& ctx) override;

 private:
  enum class Phase { Start, Tick };

  std::string customer_id_;
  Phase phase_{Phase::Start};
};

// One trip: travel to the customer, unload, then either go idle or chain a resupply.
class DeliveryProcess final : public Process {
 public:
  DeliveryProcess(std::string ship_id, std::string customer_id, double needed);

  const char* kind() const override { return "delivery"; }
  std::string ship_id() const override { return ship_id_; }
  std::string customer_id() const override { return customer_id_; }
  std::optional<double> step(SimContext& ctx) override;

 private:
  enum class Phase { Depart, Arrive, Unload };

  std::string ship_id_;
  std::string customer_id_;
  double needed_{0.0};
  double delivery_amount_{0.0};
  Phase phase_{Phase::Depart};
};

// Return to port, wait out the turnaround, top the hold off, go idle.
class ResupplyProcess final : public Process {
 public:
  explicit ResupplyProcess(std::string ship_id);

  const char* kind() const override { return "resupply"; }
  std::string ship_id() const override { return ship_id_; }
  std::optional<double> step(SimContext& ctx) override;

 private:
  enum class Phase { Depart, AtPort, Turnaround, Loaded };

  double arrive_at_port(SimContext& ctx);

  std::string ship_id_;
  Phase phase_{Phase::Depart};
};

} // namespace tidewater
