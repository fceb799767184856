#pragma once

#include <geometry_msgs/msg/twist.hpp>
#include <rclcpp/rclcpp.hpp>  // for logging

#include "obstacle_avoidance/config.hpp"
#include "obstacle_avoidance/pid_controller.hpp"
#include "obstacle_avoidance/range_preprocessor.hpp"

// linear.x in m/s, angular.z in rad/s
using ControlCommand = geometry_msgs::msg::Twist;

enum class DecisionTier { COLLISION_IMMINENT, CAUTION, CLEAR };

const char *tier_name(DecisionTier tier);

class AvoidancePolicy
{
public:
  struct Params {
    double collision_distance      = cfg::COLLISION_DISTANCE;
    double caution_distance        = cfg::CAUTION_DISTANCE;
    double crawl_speed             = cfg::CRAWL_SPEED;
    double cruise_speed            = cfg::CRUISE_SPEED;
    double collision_steering_gain = cfg::COLLISION_STEERING_GAIN;
    PIDController::Gains lateral{cfg::LAT_KP, cfg::LAT_KI, cfg::LAT_KD, cfg::LAT_WINDOW};
    PIDController::Gains longitudinal{cfg::LON_KP, cfg::LON_KI, cfg::LON_KD, cfg::LON_WINDOW};
  };

  explicit AvoidancePolicy(const Params &params);

  // Pure tier selection on the oblique clearances
  static DecisionTier select_tier(const ClearanceSnapshot &clearance, const Params &params);

  // Unsaturated command; a channel whose PID skips the step repeats its last output
  ControlCommand decide(const ClearanceSnapshot &clearance, double timestamp);

  DecisionTier last_tier() const { return last_tier_; }
  const PIDController &lateral() const { return pid_lat_; }
  const PIDController &longitudinal() const { return pid_lon_; }

private:
  double steer(double error, double timestamp);
  double regulate_speed(double error, double timestamp);

  Params params_;
  PIDController pid_lat_;
  PIDController pid_lon_;

  double lat_out_ = 0.0;
  double lon_out_ = 0.0;

  DecisionTier last_tier_ = DecisionTier::CLEAR;
  bool tier_logged_ = false;
};
