// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ConfidenceIntervals.h"
#include "SimStatsException.h"
#include <cmath>
#include <string>
#include <boost/math/distributions/students_t.hpp>

namespace simcompare
{
  namespace
  {
    ConfidenceInterval degenerate(double mean)
    {
      return ConfidenceInterval{mean, mean};
    }
  }

  double ConfidenceIntervals::criticalT(double alpha, std::size_t n)
  {
    if (!(alpha > 0.0 && alpha < 1.0))
      throw InvalidParameterException("Significance level must lie in (0, 1); got "
				      + std::to_string(alpha));
    if (n < 2)
      throw InvalidParameterException("t quantile needs at least two observations");

    boost::math::students_t dist(static_cast<double>(n - 1));
    return boost::math::quantile(dist, 1.0 - alpha / 2.0);
  }

  ConfidenceInterval ConfidenceIntervals::tInterval(const SampleMoments& moments, double alpha)
  {
    if (moments.count == 0)
      throw InvalidParameterException("tInterval: empty sample");

    if (moments.count < 2 || moments.variance == 0.0)
      return degenerate(moments.mean);

    const double t = criticalT(alpha, moments.count);
    const double halfWidth = t * moments.getStdDev() / std::sqrt(static_cast<double>(moments.count));
    return ConfidenceInterval{moments.mean - halfWidth, moments.mean + halfWidth};
  }

  ConfidenceInterval ConfidenceIntervals::willinkInterval(const SampleMoments& moments, double alpha)
  {
    if (moments.count == 0)
      throw InvalidParameterException("willinkInterval: empty sample");

    if (moments.count < 2 || moments.variance == 0.0)
      return degenerate(moments.mean);

    if (moments.count < 3)
      return tInterval(moments, alpha);

    const double n = static_cast<double>(moments.count);
    const double s = moments.getStdDev();
    const double mu3 = n * moments.getSumCubedDeviations() / ((n - 1.0) * (n - 2.0));
    const double a = mu3 / (6.0 * std::sqrt(n) * s * s * s);

    if (a == 0.0 || !std::isfinite(a))
      return tInterval(moments, alpha);

    const double t = criticalT(alpha, moments.count);
    auto g = [a](double r) {
      return (std::cbrt(1.0 + 6.0 * a * (r - a)) - 1.0) / (2.0 * a);
    };

    const double scale = s / std::sqrt(n);
    return ConfidenceInterval{moments.mean - g(t) * scale, moments.mean - g(-t) * scale};
  }
}
