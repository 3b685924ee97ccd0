#ifndef STATISTICS_HPP
#define STATISTICS_HPP

#include <optional>
#include <vector>

namespace insights {
namespace stats {

struct LinearFit {
  double slope;
  double intercept;
};

// Arithmetic mean; 0 for an empty input.
double mean(const std::vector<double> &values);

// Population standard deviation (denominator n) around a precomputed mean.
double population_std_dev(const std::vector<double> &values, double mean);

/**
 * Ordinary least squares fit of values against their index 0..n-1.
 * Returns nullopt when fewer than two values make the slope undefined.
 */
std::optional<LinearFit> fit_against_index(const std::vector<double> &values);

/**
 * Pearson correlation coefficient of two equal-length vectors.
 * A zero denominator (constant input) or empty input yields 0.
 */
double pearson_correlation(const std::vector<double> &x,
                           const std::vector<double> &y);

} // namespace stats
} // namespace insights

#endif // STATISTICS_HPP
