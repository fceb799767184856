#pragma once

#include <cstddef>

// Default tuning for the TurtleBot3 Burger. Every value here can be overridden
// through the node parameters of the same (lower case) name.
namespace cfg {
  // Ranging (meters, degrees)
  inline constexpr double MAX_RANGE          = 3.5;
  inline constexpr std::size_t SCAN_SAMPLES  = 360;
  inline constexpr double FRONT_SECTOR_DEG   = 20.0;
  inline constexpr double OBLIQUE_SECTOR_DEG = 70.0;
  inline constexpr double SIDE_SECTOR_DEG    = 55.0;
  inline constexpr double SIDE_OFFSET_DEG    = 30.0;

  // Tier thresholds on the oblique sectors (meters)
  inline constexpr double COLLISION_DISTANCE = 0.5;
  inline constexpr double CAUTION_DISTANCE   = 1.0;

  // Fixed tier velocities (m/s)
  inline constexpr double CRAWL_SPEED  = 0.005;
  inline constexpr double CRUISE_SPEED = 0.2;

  // Lateral error amplification when a collision is imminent
  inline constexpr double COLLISION_STEERING_GAIN = 16.0;

  // Lateral (steering) PID
  inline constexpr double LAT_KP = 0.22;
  inline constexpr double LAT_KI = 0.01;
  inline constexpr double LAT_KD = 0.3;
  inline constexpr std::size_t LAT_WINDOW = 10;

  // Longitudinal (speed) PID
  inline constexpr double LON_KP = 0.11;
  inline constexpr double LON_KI = 0.001;
  inline constexpr double LON_KD = 0.01;
  inline constexpr std::size_t LON_WINDOW = 10;

  // Actuation envelope
  inline constexpr double MAX_LINEAR_VEL  = 0.22;  // m/s
  inline constexpr double MAX_ANGULAR_VEL = 2.84;  // rad/s

  // Loop timing (seconds)
  inline constexpr double STARTUP_DELAY  = 4.0;
  inline constexpr double CONTROL_PERIOD = 0.001;
}
