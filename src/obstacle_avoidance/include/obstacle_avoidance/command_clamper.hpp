#pragma once

#include "obstacle_avoidance/avoidance_policy.hpp"
#include "obstacle_avoidance/config.hpp"

// One-sided saturation: values above the cap are cut, nothing is floored
class CommandClamper
{
public:
  struct Limits {
    double max_linear  = cfg::MAX_LINEAR_VEL;
    double max_angular = cfg::MAX_ANGULAR_VEL;
  };

  explicit CommandClamper(const Limits &limits);

  ControlCommand clamp(const ControlCommand &cmd) const;

  const Limits &limits() const { return limits_; }

private:
  Limits limits_;
};
