#include "obstacle_avoidance/command_clamper.hpp"

#include <algorithm>

CommandClamper::CommandClamper(const Limits &limits)
: limits_(limits)
{
}

ControlCommand CommandClamper::clamp(const ControlCommand &cmd) const
{
  ControlCommand out = cmd;
  out.linear.x = std::min(limits_.max_linear, cmd.linear.x);
  out.angular.z = std::min(limits_.max_angular, cmd.angular.z);
  return out;
}
