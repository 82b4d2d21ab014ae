#include "ind/rolling.h"
#include "util/math.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <queue>

inline size_t window_start(size_t i, size_t window) {
  return i + 1 >= window ? i + 1 - window : 0;
}

Series rolling_mean(const Series& xs, size_t window) {
  Series out(xs.size(), NaN);

  for (size_t i = 0; i < xs.size(); ++i) {
    double sum = 0.0;
    size_t count = 0;
    for (size_t j = window_start(i, window); j <= i; ++j) {
      if (missing(xs[j]))
        continue;
      sum += xs[j];
      count++;
    }
    if (count > 0)
      out[i] = sum / count;
  }

  return out;
}

Series rolling_std(const Series& xs, size_t window, size_t min_periods) {
  Series out(xs.size(), NaN);
  min_periods = std::max<size_t>(min_periods, 2);

  for (size_t i = 0; i < xs.size(); ++i) {
    auto start = window_start(i, window);

    double sum = 0.0;
    size_t count = 0;
    for (size_t j = start; j <= i; ++j) {
      if (missing(xs[j]))
        continue;
      sum += xs[j];
      count++;
    }
    if (count < min_periods)
      continue;

    double mean = sum / count;
    double sq = 0.0;
    for (size_t j = start; j <= i; ++j) {
      if (missing(xs[j]))
        continue;
      sq += (xs[j] - mean) * (xs[j] - mean);
    }
    out[i] = std::sqrt(sq / (count - 1));
  }

  return out;
}

Series ewm(const Series& xs, double alpha, size_t min_periods) {
  Series out(xs.size(), NaN);
  min_periods = std::max<size_t>(min_periods, 1);

  double weighted = NaN;
  double old_wt = 1.0;
  size_t nobs = 0;

  for (size_t i = 0; i < xs.size(); ++i) {
    auto cur = xs[i];
    bool is_obs = !missing(cur);
    nobs += is_obs;

    if (!missing(weighted)) {
      old_wt *= 1.0 - alpha;
      if (is_obs) {
        if (weighted != cur)
          weighted = (old_wt * weighted + alpha * cur) / (old_wt + alpha);
        old_wt = 1.0;
      }
    } else if (is_obs) {
      weighted = cur;
    }

    if (nobs >= min_periods)
      out[i] = weighted;
  }

  return out;
}

Series ema(const Series& xs, int span) {
  return ewm(xs, 2.0 / (span + 1), 1);
}

Series wilder(const Series& xs, int period) {
  return ewm(xs, 1.0 / period, period);
}

Series diff(const Series& xs) {
  Series out(xs.size(), NaN);
  for (size_t i = 1; i < xs.size(); ++i)
    out[i] = xs[i] - xs[i - 1];
  return out;
}

Series pct_change(const Series& xs, size_t k) {
  Series out(xs.size(), NaN);
  for (size_t i = k; i < xs.size(); ++i)
    out[i] = xs[i] / xs[i - k] - 1.0;
  return out;
}

Series rolling_rank_pct(const Series& xs, size_t window) {
  Series out(xs.size(), NaN);

  for (size_t i = 0; i < xs.size(); ++i) {
    auto cur = xs[i];
    if (missing(cur))
      continue;

    auto start = window_start(i, window);
    size_t below = 0;
    for (size_t j = start; j <= i; ++j)
      below += xs[j] <= cur;

    out[i] = static_cast<double>(below) / (i - start + 1);
  }

  return out;
}

double median(const Series& xs) {
  Series vals;
  vals.reserve(xs.size());
  for (auto x : xs)
    if (!missing(x))
      vals.push_back(x);

  if (vals.empty())
    return NaN;

  auto n = vals.size();
  auto mid = vals.begin() + n / 2;
  std::nth_element(vals.begin(), mid, vals.end());
  if (n % 2 == 1)
    return *mid;

  auto lower = *std::max_element(vals.begin(), mid);
  return (lower + *mid) / 2;
}

Series expanding_median(const Series& xs) {
  Series out(xs.size(), NaN);

  // lo holds the smaller half (max on top), hi the larger half
  std::priority_queue<double> lo;
  std::priority_queue<double, std::vector<double>, std::greater<double>> hi;

  for (size_t i = 0; i < xs.size(); ++i) {
    auto x = xs[i];
    if (!missing(x)) {
      if (lo.empty() || x <= lo.top())
        lo.push(x);
      else
        hi.push(x);

      if (lo.size() > hi.size() + 1) {
        hi.push(lo.top());
        lo.pop();
      } else if (hi.size() > lo.size()) {
        lo.push(hi.top());
        hi.pop();
      }
    }

    if (lo.empty())
      continue;
    out[i] = lo.size() > hi.size() ? lo.top() : (lo.top() + hi.top()) / 2;
  }

  return out;
}
