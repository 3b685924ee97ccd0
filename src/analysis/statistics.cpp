#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <optional>
#include <vector>

namespace insights {
namespace stats {

double mean(const std::vector<double> &values) {
  if (values.empty())
    return 0.0;
  return std::accumulate(values.begin(), values.end(), 0.0) /
         static_cast<double>(values.size());
}

double population_std_dev(const std::vector<double> &values, double mean) {
  if (values.empty())
    return 0.0;

  double sum_sq = 0.0;
  for (double v : values) {
    const double diff = v - mean;
    sum_sq += diff * diff;
  }
  return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

std::optional<LinearFit> fit_against_index(const std::vector<double> &values) {
  const double n = static_cast<double>(values.size());
  double sum_x = 0.0, sum_y = 0.0, sum_xy = 0.0, sum_x2 = 0.0;

  for (size_t i = 0; i < values.size(); ++i) {
    const double x = static_cast<double>(i);
    sum_x += x;
    sum_y += values[i];
    sum_xy += x * values[i];
    sum_x2 += x * x;
  }

  const double denominator = n * sum_x2 - sum_x * sum_x;
  if (denominator == 0.0)
    return std::nullopt;

  LinearFit fit;
  fit.slope = (n * sum_xy - sum_x * sum_y) / denominator;
  fit.intercept = (sum_y - fit.slope * sum_x) / n;
  return fit;
}

double pearson_correlation(const std::vector<double> &x,
                           const std::vector<double> &y) {
  const size_t count = std::min(x.size(), y.size());
  if (count == 0)
    return 0.0;

  const double n = static_cast<double>(count);
  double sum_x = 0.0, sum_y = 0.0, sum_xy = 0.0, sum_x2 = 0.0, sum_y2 = 0.0;
  for (size_t i = 0; i < count; ++i) {
    sum_x += x[i];
    sum_y += y[i];
    sum_xy += x[i] * y[i];
    sum_x2 += x[i] * x[i];
    sum_y2 += y[i] * y[i];
  }

  const double numerator = n * sum_xy - sum_x * sum_y;
  const double denominator =
      std::sqrt((n * sum_x2 - sum_x * sum_x) * (n * sum_y2 - sum_y * sum_y));

  // Rounding can push the product of variances slightly negative for
  // near-constant input, which sqrt turns into NaN.
  if (denominator == 0.0 || std::isnan(denominator))
    return 0.0;
  return std::clamp(numerator / denominator, -1.0, 1.0);
}

} // namespace stats
} // namespace insights
