#pragma once

#include <cstddef>
#include <vector>

using Series = std::vector<double>;

// Whole-series transforms. Missing values are NaN and are skipped by the
// window statistics.

// Mean of the last `window` values, defined as soon as one value is present.
Series rolling_mean(const Series& xs, size_t window);

// Sample standard deviation of the last `window` values, NaN until
// `min_periods` present values are in the window.
Series rolling_std(const Series& xs, size_t window, size_t min_periods);

/**
 * @brief Recursive exponential smoothing, unadjusted.
 *
 * y[0] is the first present observation, then
 *   y[t] = ((1 - alpha) * y[t-1] + alpha * x[t])
 * A missing x[t] keeps y but decays the weight of the previous value, so the
 * next present observation is weighted against the decayed history. Output is
 * NaN until `min_periods` present observations have been seen.
 */
Series ewm(const Series& xs, double alpha, size_t min_periods);

// alpha = 2 / (span + 1), defined from the first observation.
Series ema(const Series& xs, int span);

// alpha = 1 / period, NaN until `period` observations.
Series wilder(const Series& xs, int period);

// x[t] - x[t-1]; NaN at t = 0.
Series diff(const Series& xs);

// x[t] / x[t-k] - 1; NaN for t < k.
Series pct_change(const Series& xs, size_t k);

/**
 * Fraction of the trailing `window` values (current one included) that are
 * <= the current value. The denominator is the number of rows in the window,
 * missing ones included. NaN when the current value is missing.
 */
Series rolling_rank_pct(const Series& xs, size_t window);

// Median over present values, NaN when there are none.
double median(const Series& xs);

// Median of x[0..t] for every t, missing values skipped.
Series expanding_median(const Series& xs);
