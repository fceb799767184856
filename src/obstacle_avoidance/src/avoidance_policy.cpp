#include "obstacle_avoidance/avoidance_policy.hpp"

const char *tier_name(DecisionTier tier)
{
  switch (tier) {
    case DecisionTier::COLLISION_IMMINENT: return "COLLISION_IMMINENT";
    case DecisionTier::CAUTION:            return "CAUTION";
    case DecisionTier::CLEAR:              return "CLEAR";
  }
  return "UNKNOWN";
}

AvoidancePolicy::AvoidancePolicy(const Params &params)
: params_(params),
  pid_lat_(params.lateral),
  pid_lon_(params.longitudinal)
{
}

DecisionTier AvoidancePolicy::select_tier(const ClearanceSnapshot &clearance, const Params &params)
{
  auto in_caution_band = [&params](double d) {
    return d >= params.collision_distance && d < params.caution_distance;
  };

  if (clearance.oblique_left < params.collision_distance ||
      clearance.oblique_right < params.collision_distance) {
    return DecisionTier::COLLISION_IMMINENT;
  }
  if (in_caution_band(clearance.oblique_left) || in_caution_band(clearance.oblique_right)) {
    return DecisionTier::CAUTION;
  }
  return DecisionTier::CLEAR;
}

double AvoidancePolicy::steer(double error, double timestamp)
{
  if (auto u = pid_lat_.control(error, timestamp)) {
    lat_out_ = *u;
  }
  return lat_out_;
}

double AvoidancePolicy::regulate_speed(double error, double timestamp)
{
  if (auto u = pid_lon_.control(error, timestamp)) {
    lon_out_ = *u;
  }
  return lon_out_;
}

ControlCommand AvoidancePolicy::decide(const ClearanceSnapshot &clearance, double timestamp)
{
  ControlCommand cmd;

  const DecisionTier tier = select_tier(clearance, params_);
  const double lateral_error = clearance.left - clearance.right;

  switch (tier) {
    case DecisionTier::COLLISION_IMMINENT:
      // Crawl and turn hard away from the near side
      cmd.linear.x = params_.crawl_speed;
      cmd.angular.z = steer(params_.collision_steering_gain * lateral_error, timestamp);
      break;

    case DecisionTier::CAUTION:
      cmd.linear.x = regulate_speed(clearance.front, timestamp);
      cmd.angular.z = steer(lateral_error, timestamp);
      break;

    case DecisionTier::CLEAR:
      cmd.linear.x = params_.cruise_speed;
      cmd.angular.z = steer(lateral_error, timestamp);
      break;
  }

  // Log tier only if it changed
  if (!tier_logged_ || tier != last_tier_) {
    RCLCPP_INFO(rclcpp::get_logger("avoidance_policy"), "Tier: %s", tier_name(tier));
    tier_logged_ = true;
  }
  last_tier_ = tier;

  return cmd;
}
