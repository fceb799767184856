#include "obstacle_avoidance/control_loop.hpp"

#include <utility>

const char *status_name(CycleStatus status)
{
  switch (status) {
    case CycleStatus::INITIALIZING:   return "INITIALIZING";
    case CycleStatus::INVALID_SCAN:   return "INVALID_SCAN";
    case CycleStatus::COMMAND_ISSUED: return "COMMAND_ISSUED";
  }
  return "UNKNOWN";
}

ControlLoop::ControlLoop(const Params &params, double start_time)
: params_(params),
  start_time_(start_time),
  preprocessor_(params.preprocessor),
  policy_(params.policy),
  clamper_(params.limits)
{
}

void ControlLoop::update_scan(std::shared_ptr<const RangeScan> scan)
{
  if (!scan) {
    return;
  }
  std::lock_guard<std::mutex> lock(scan_mutex_);
  latest_scan_ = std::move(scan);
  data_available_ = true;
}

bool ControlLoop::has_scan() const
{
  std::lock_guard<std::mutex> lock(scan_mutex_);
  return data_available_;
}

CycleReport ControlLoop::tick(double now)
{
  CycleReport report;

  if (now - start_time_ < params_.startup_delay) {
    return report;
  }

  std::shared_ptr<const RangeScan> scan;
  {
    std::lock_guard<std::mutex> lock(scan_mutex_);
    if (!data_available_) {
      return report;
    }
    scan = latest_scan_;
  }

  std::optional<ClearanceSnapshot> clearance = preprocessor_.try_preprocess(*scan, report.error);
  if (!clearance) {
    report.status = CycleStatus::INVALID_SCAN;
    report.command = last_cmd_;
    return report;
  }

  const ControlCommand raw = policy_.decide(*clearance, now);

  report.status = CycleStatus::COMMAND_ISSUED;
  report.tier = policy_.last_tier();
  report.clearance = *clearance;
  report.command = clamper_.clamp(raw);
  last_cmd_ = report.command;
  return report;
}
