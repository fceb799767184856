#include "obstacle_avoidance/pid_controller.hpp"

#include <cmath>
#include <stdexcept>

PIDController::PIDController(const Gains &gains)
: gains_(gains),
  err_hist_(gains.window, 0.0)
{
  if (!std::isfinite(gains.kp) || !std::isfinite(gains.ki) || !std::isfinite(gains.kd)) {
    throw std::invalid_argument("PIDController: gains must be finite");
  }
}

std::optional<double> PIDController::control(double error, double timestamp)
{
  // No time base yet: remember where we are and produce nothing
  if (!has_prev_) {
    if (!std::isfinite(timestamp)) {
      return std::nullopt;
    }
    err_prev_ = error;
    t_prev_ = timestamp;
    has_prev_ = true;
    return std::nullopt;
  }

  const double dt = timestamp - t_prev_;
  if (!(dt > 0.0)) {
    return std::nullopt;
  }

  // Rolling window: once full, the oldest error leaves the integral
  if (gains_.window > 0) {
    if (count_ == gains_.window) {
      err_int_ -= err_hist_[head_];
      err_hist_[head_] = error;
      head_ = (head_ + 1) % gains_.window;
    } else {
      err_hist_[(head_ + count_) % gains_.window] = error;
      ++count_;
    }
    err_int_ += error;
  }

  const double err_dif = error - err_prev_;
  const double u = gains_.kp * error
                 + gains_.ki * err_int_ * dt
                 + gains_.kd * err_dif / dt;

  err_prev_ = error;
  t_prev_ = timestamp;
  return u;
}
