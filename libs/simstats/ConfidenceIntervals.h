// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __CONFIDENCE_INTERVALS_H
#define __CONFIDENCE_INTERVALS_H 1

#include <limits>
#include "SampleMoments.h"

namespace simcompare
{
  struct ConfidenceInterval
  {
    double lower = std::numeric_limits<double>::quiet_NaN();
    double upper = std::numeric_limits<double>::quiet_NaN();

    bool contains(double value) const
    {
      return lower <= value && value <= upper;
    }

    double getWidth() const
    {
      return upper - lower;
    }
  };

  /**
   * @brief Confidence intervals for the mean of a sample at level 1 - alpha.
   *
   * Both intervals collapse to [mean, mean] when the sample has zero
   * variance or a single observation.
   */
  class ConfidenceIntervals
  {
  public:
    // mean +/- t(1 - alpha/2, n - 1) * s / sqrt(n)
    static ConfidenceInterval tInterval(const SampleMoments& moments, double alpha);

    /**
     * @brief Willink's skewness-adjusted interval.
     *
     * With mu3 = n * sum((x - mean)^3) / ((n - 1)(n - 2)),
     * a = mu3 / (6 sqrt(n) s^3) and G(r) = (cbrt(1 + 6a(r - a)) - 1) / (2a),
     * the interval is [mean - G(t) s / sqrt(n), mean - G(-t) s / sqrt(n)]
     * where t is the t-interval quantile. Reduces to tInterval when a is 0
     * or n < 3.
     *
     * R. Willink, "A confidence interval and test for the mean of an
     * asymmetric distribution", Comm. Statist. Theory Methods 34 (2005).
     */
    static ConfidenceInterval willinkInterval(const SampleMoments& moments, double alpha);

    // t(1 - alpha/2, n - 1); throws InvalidParameterException unless 0 < alpha < 1.
    static double criticalT(double alpha, std::size_t n);

  private:
    ConfidenceIntervals() = delete;
  };
}

#endif // __CONFIDENCE_INTERVALS_H
