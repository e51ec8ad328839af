// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __SAMPLE_MOMENTS_H
#define __SAMPLE_MOMENTS_H 1

#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/skewness.hpp>

namespace simcompare
{
  /**
   * @brief First three moments of a sample, computed in one pass with
   * Boost.Accumulators.
   *
   * variance is the unbiased (n - 1) estimator; skewness is the plain
   * moment ratio m3 / m2^(3/2). A sample whose values are all identical has
   * variance exactly 0, mean equal to that value and NaN skewness.
   */
  struct SampleMoments
  {
    std::size_t count = 0;
    double mean = std::numeric_limits<double>::quiet_NaN();
    double variance = std::numeric_limits<double>::quiet_NaN();
    double skewness = std::numeric_limits<double>::quiet_NaN();
    double minimum = std::numeric_limits<double>::quiet_NaN();
    double maximum = std::numeric_limits<double>::quiet_NaN();

    bool isConstant() const
    {
      return count > 0 && minimum == maximum;
    }

    double getStdDev() const
    {
      return std::sqrt(variance);
    }

    // Sum of cubed deviations from the mean.
    double getSumCubedDeviations() const
    {
      if (isConstant())
	return 0.0;

      const double n = static_cast<double>(count);
      const double m2 = variance * (n - 1.0) / n;
      return n * skewness * std::pow(m2, 1.5);
    }
  };

  inline SampleMoments computeSampleMoments(const std::vector<double>& values)
  {
    using namespace boost::accumulators;

    SampleMoments moments;
    moments.count = values.size();
    if (values.empty())
      return moments;

    accumulator_set<double, stats<tag::min, tag::max, tag::mean,
				  tag::variance, tag::skewness>> acc;
    for (double v : values)
      acc(v);

    moments.minimum = min(acc);
    moments.maximum = max(acc);

    if (moments.isConstant())
      {
	moments.mean = values.front();
	moments.variance = 0.0;
	return moments;
      }

    const double n = static_cast<double>(values.size());
    moments.mean = mean(acc);
    // boost's variance divides by n
    moments.variance = variance(acc) * n / (n - 1.0);
    moments.skewness = skewness(acc);
    return moments;
  }
}

#endif // __SAMPLE_MOMENTS_H
