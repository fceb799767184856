#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "obstacle_avoidance/avoidance_policy.hpp"
#include "obstacle_avoidance/command_clamper.hpp"
#include "obstacle_avoidance/config.hpp"
#include "obstacle_avoidance/range_preprocessor.hpp"

enum class CycleStatus { INITIALIZING, INVALID_SCAN, COMMAND_ISSUED };

const char *status_name(CycleStatus status);

// Outcome of one tick
struct CycleReport
{
  CycleStatus status = CycleStatus::INITIALIZING;
  DecisionTier tier = DecisionTier::CLEAR;         // valid when COMMAND_ISSUED
  ClearanceSnapshot clearance;                     // valid when COMMAND_ISSUED
  std::optional<ControlCommand> command;           // what goes to the command sink
  std::string error;                               // set when INVALID_SCAN
};

// Latest-scan buffer plus the serial control cycle. update_scan() may be
// called from any thread; tick() always works on one complete scan.
class ControlLoop
{
public:
  struct Params {
    RangePreprocessor::Params preprocessor;
    AvoidancePolicy::Params policy;
    CommandClamper::Limits limits;
    double startup_delay = cfg::STARTUP_DELAY;  // seconds
  };

  ControlLoop(const Params &params, double start_time);

  // Replace the buffered scan wholesale
  void update_scan(std::shared_ptr<const RangeScan> scan);

  // One control cycle at `now` (seconds). An invalid scan repeats the last command.
  CycleReport tick(double now);

  bool has_scan() const;
  const AvoidancePolicy &policy() const { return policy_; }

private:
  Params params_;
  double start_time_;

  RangePreprocessor preprocessor_;
  AvoidancePolicy policy_;
  CommandClamper clamper_;

  mutable std::mutex scan_mutex_;
  std::shared_ptr<const RangeScan> latest_scan_;
  bool data_available_ = false;

  std::optional<ControlCommand> last_cmd_;
};
