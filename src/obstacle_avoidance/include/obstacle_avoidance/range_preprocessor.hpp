#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "obstacle_avoidance/config.hpp"

// One full rotation of ranges, index 0 on the forward axis
using RangeScan = std::vector<float>;

class InvalidScanError : public std::runtime_error
{
public:
  explicit InvalidScanError(const std::string &what)
  : std::runtime_error(what) {}
};

// Sector clearances for one control cycle (meters)
struct ClearanceSnapshot
{
  double front = 0.0;
  double oblique_left = 0.0;
  double oblique_right = 0.0;
  double left = 0.0;
  double right = 0.0;
  double closest = 0.0;
};

class RangePreprocessor
{
public:
  struct Params {
    double max_range          = cfg::MAX_RANGE;
    std::size_t scan_samples  = cfg::SCAN_SAMPLES;
    double front_sector_deg   = cfg::FRONT_SECTOR_DEG;
    double oblique_sector_deg = cfg::OBLIQUE_SECTOR_DEG;
    double side_sector_deg    = cfg::SIDE_SECTOR_DEG;
    double side_offset_deg    = cfg::SIDE_OFFSET_DEG;
  };

  // Half-open, possibly wrapping, index range [begin, begin + length)
  struct Sector {
    std::size_t begin;
    std::size_t length;
  };

  explicit RangePreprocessor(const Params &params);

  // Throws InvalidScanError on a length mismatch or a negative sample
  ClearanceSnapshot preprocess(const RangeScan &scan) const;

  // Same checks without throwing: std::nullopt and `error` set on a bad scan
  std::optional<ClearanceSnapshot> try_preprocess(const RangeScan &scan, std::string &error) const;

  const Params &params() const { return params_; }

private:
  std::size_t to_samples(double deg) const;
  double sector_mean(const std::vector<double> &ranges, const Sector &sector) const;

  Params params_;

  Sector front_first_;
  Sector front_last_;
  Sector oblique_left_;
  Sector oblique_right_;
  Sector left_;
  Sector right_;
};
