#pragma once

#include <cstddef>
#include <optional>
#include <vector>

// PID with a sliding-window integral: only the last `window` errors are summed
class PIDController
{
public:
  struct Gains {
    double kp;
    double ki;
    double kd;
    std::size_t window;  // number of errors kept for the integral
  };

  explicit PIDController(const Gains &gains);

  // std::nullopt on the first call (which only records error and time) and
  // whenever the timestamp does not advance
  std::optional<double> control(double error, double timestamp);

  double integral() const { return err_int_; }
  double previous_error() const { return err_prev_; }
  double previous_timestamp() const { return t_prev_; }
  std::size_t history_size() const { return count_; }
  bool primed() const { return has_prev_; }
  const Gains &gains() const { return gains_; }

private:
  Gains gains_;

  // Ring buffer of the last gains_.window errors
  std::vector<double> err_hist_;
  std::size_t head_ = 0;   // slot of the oldest error
  std::size_t count_ = 0;

  double err_int_ = 0.0;
  double err_prev_ = 0.0;
  double t_prev_ = 0.0;
  bool has_prev_ = false;
};
