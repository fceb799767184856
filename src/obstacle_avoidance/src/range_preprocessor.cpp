#include "obstacle_avoidance/range_preprocessor.hpp"

#include <algorithm>
#include <cmath>
#include <string>

using namespace std;

RangePreprocessor::RangePreprocessor(const Params &params)
: params_(params)
{
  if (params_.scan_samples == 0) {
    throw invalid_argument("RangePreprocessor: scan_samples must be positive");
  }
  if (!(params_.max_range > 0.0)) {
    throw invalid_argument("RangePreprocessor: max_range must be positive");
  }
  if (params_.side_offset_deg < 0.0) {
    throw invalid_argument("RangePreprocessor: side_offset_deg must not be negative");
  }

  const size_t n = params_.scan_samples;
  const size_t front = to_samples(params_.front_sector_deg);
  const size_t oblique = to_samples(params_.oblique_sector_deg);
  const size_t side = to_samples(params_.side_sector_deg);
  const size_t offset = static_cast<size_t>(lround(params_.side_offset_deg * n / 360.0));

  if (offset + side > n) {
    throw invalid_argument("RangePreprocessor: side sectors extend past the scan");
  }

  front_first_   = {0, front};
  front_last_    = {n - front, front};
  oblique_left_  = {0, oblique};
  oblique_right_ = {n - oblique, oblique};
  left_          = {offset, side};
  right_         = {n - offset - side, side};
}

size_t RangePreprocessor::to_samples(double deg) const
{
  if (!(deg > 0.0) || deg > 360.0) {
    throw invalid_argument("RangePreprocessor: sector width must be in (0, 360] degrees");
  }
  const long samples = lround(deg * params_.scan_samples / 360.0);
  if (samples < 1) {
    throw invalid_argument("RangePreprocessor: sector narrower than one sample");
  }
  return static_cast<size_t>(samples);
}

double RangePreprocessor::sector_mean(const vector<double> &ranges, const Sector &sector) const
{
  const size_t n = ranges.size();
  double sum = 0.0;
  for (size_t i = 0; i < sector.length; ++i) {
    sum += ranges[(sector.begin + i) % n];
  }
  return sum / static_cast<double>(sector.length);
}

ClearanceSnapshot RangePreprocessor::preprocess(const RangeScan &scan) const
{
  string error;
  optional<ClearanceSnapshot> snapshot = try_preprocess(scan, error);
  if (!snapshot) {
    throw InvalidScanError(error);
  }
  return *snapshot;
}

optional<ClearanceSnapshot> RangePreprocessor::try_preprocess(const RangeScan &scan,
                                                               string &error) const
{
  if (scan.size() != params_.scan_samples) {
    error = "expected " + to_string(params_.scan_samples) +
            " samples, got " + to_string(scan.size());
    return nullopt;
  }

  vector<double> ranges(scan.size());
  for (size_t i = 0; i < scan.size(); ++i) {
    double r = scan[i];
    // No return (nan), beyond range (+inf) and below range_min (-inf) all read as open
    if (isnan(r) || isinf(r)) {
      r = params_.max_range;
    } else if (r < 0.0) {
      error = "negative range " + to_string(r) + " at index " + to_string(i);
      return nullopt;
    }
    ranges[i] = min(r, params_.max_range);
  }

  ClearanceSnapshot snapshot;
  // Inherited weighting: the trailing slice only counts for half
  snapshot.front = sector_mean(ranges, front_first_) + sector_mean(ranges, front_last_) / 2.0;
  snapshot.oblique_left  = sector_mean(ranges, oblique_left_);
  snapshot.oblique_right = sector_mean(ranges, oblique_right_);
  snapshot.left  = sector_mean(ranges, left_);
  snapshot.right = sector_mean(ranges, right_);
  snapshot.closest = *min_element(ranges.begin(), ranges.end());
  return snapshot;
}
