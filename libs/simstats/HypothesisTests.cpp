// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "HypothesisTests.h"
#include "SampleMoments.h"
#include "SimStatsException.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <boost/math/distributions/chi_squared.hpp>
#include <boost/math/distributions/fisher_f.hpp>
#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/students_t.hpp>

namespace simcompare
{
  namespace
  {
    const double NaN = std::numeric_limits<double>::quiet_NaN();

    void requireGroups(const std::vector<std::vector<double>>& groups, const char* testName)
    {
      if (groups.size() < 2)
	throw ArgumentMismatchException(std::string(testName) + " needs at least two groups");

      for (const auto& g : groups)
	if (g.empty())
	  throw InvalidParameterException(std::string(testName) + ": empty group");
    }

    // Number of ways to choose k of the ranks 1..n with each possible sum.
    std::vector<double> rankSumCounts(std::size_t n, std::size_t k)
    {
      const std::size_t maxSum = n * (n + 1) / 2;
      std::vector<std::vector<double>> ways(k + 1, std::vector<double>(maxSum + 1, 0.0));
      ways[0][0] = 1.0;

      for (std::size_t r = 1; r <= n; ++r)
	for (std::size_t j = std::min(r, k); j >= 1; --j)
	  for (std::size_t s = maxSum; s >= r; --s)
	    ways[j][s] += ways[j - 1][s - r];

      return ways[k];
    }
  }

  std::vector<double> HypothesisTests::rank(const std::vector<double>& values, double& tieCorrection)
  {
    const std::size_t n = values.size();
    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
		     [&values](std::size_t a, std::size_t b) { return values[a] < values[b]; });

    std::vector<double> ranks(n, 0.0);
    tieCorrection = 0.0;

    std::size_t i = 0;
    while (i < n)
      {
	std::size_t j = i + 1;
	while (j < n && values[order[j]] == values[order[i]])
	  ++j;

	// positions i..j-1 share the average of ranks i+1..j
	const double midRank = (static_cast<double>(i + 1) + static_cast<double>(j)) / 2.0;
	for (std::size_t k = i; k < j; ++k)
	  ranks[order[k]] = midRank;

	const double t = static_cast<double>(j - i);
	tieCorrection += t * t * t - t;
	i = j;
      }

    return ranks;
  }

  TestOutcome HypothesisTests::studentTTest(const std::vector<double>& x,
					    const std::vector<double>& y)
  {
    if (x.empty() || y.empty())
      throw InvalidParameterException("studentTTest: both samples must be non-empty");

    TestOutcome outcome;
    const double nx = static_cast<double>(x.size());
    const double ny = static_cast<double>(y.size());
    const double df = nx + ny - 2.0;
    if (df < 1.0)
      return outcome;

    const SampleMoments mx = computeSampleMoments(x);
    const SampleMoments my = computeSampleMoments(y);
    const double vx = x.size() > 1 ? mx.variance : 0.0;
    const double vy = y.size() > 1 ? my.variance : 0.0;

    const double pooled = ((nx - 1.0) * vx + (ny - 1.0) * vy) / df;
    const double stdErr = std::sqrt(pooled * (1.0 / nx + 1.0 / ny));
    const double diff = mx.mean - my.mean;

    if (stdErr == 0.0)
      {
	if (diff == 0.0)
	  return outcome;
	outcome.statistic = diff > 0 ? std::numeric_limits<double>::infinity()
	  : -std::numeric_limits<double>::infinity();
	outcome.pValue = 0.0;
	return outcome;
      }

    outcome.statistic = diff / stdErr;
    boost::math::students_t dist(df);
    outcome.pValue = 2.0 * boost::math::cdf(boost::math::complement(dist, std::fabs(outcome.statistic)));
    outcome.pValue = std::min(outcome.pValue, 1.0);
    return outcome;
  }

  TestOutcome HypothesisTests::mannWhitneyTest(const std::vector<double>& x,
					       const std::vector<double>& y)
  {
    if (x.empty() || y.empty())
      throw InvalidParameterException("mannWhitneyTest: both samples must be non-empty");

    std::vector<double> combined(x);
    combined.insert(combined.end(), y.begin(), y.end());

    double tieCorrection = 0.0;
    const std::vector<double> ranks = rank(combined, tieCorrection);

    const std::size_t nx = x.size();
    const std::size_t ny = y.size();
    const std::size_t n = nx + ny;

    const double rankSumX = std::accumulate(ranks.begin(), ranks.begin() + static_cast<std::ptrdiff_t>(nx), 0.0);

    TestOutcome outcome;
    outcome.statistic = rankSumX;

    if (tieCorrection == 0.0 && std::min(nx, ny) < 10 && n < 20)
      {
	const std::vector<double> counts = rankSumCounts(n, nx);
	const double total = std::accumulate(counts.begin(), counts.end(), 0.0);
	const std::size_t observed = static_cast<std::size_t>(std::lround(rankSumX));

	double lower = 0.0;
	double upper = 0.0;
	for (std::size_t s = 0; s < counts.size(); ++s)
	  {
	    if (s <= observed)
	      lower += counts[s];
	    if (s >= observed)
	      upper += counts[s];
	  }

	outcome.pValue = std::min(1.0, 2.0 * std::min(lower, upper) / total);
	return outcome;
      }

    const double dnx = static_cast<double>(nx);
    const double dny = static_cast<double>(ny);
    const double dn = static_cast<double>(n);

    const double u = rankSumX - dnx * (dnx + 1.0) / 2.0;
    const double meanU = dnx * dny / 2.0;
    const double varU = dnx * dny / 12.0 * ((dn + 1.0) - tieCorrection / (dn * (dn - 1.0)));
    if (varU <= 0.0)
      {
	outcome.statistic = NaN;
	return outcome;
      }

    const double delta = u - meanU;
    const double continuity = delta > 0 ? 0.5 : (delta < 0 ? -0.5 : 0.0);
    const double z = (delta - continuity) / std::sqrt(varU);

    boost::math::normal standardNormal;
    outcome.pValue = std::min(1.0, 2.0 * boost::math::cdf(standardNormal, -std::fabs(z)));
    return outcome;
  }

  TestOutcome HypothesisTests::oneWayAnova(const std::vector<std::vector<double>>& groups)
  {
    requireGroups(groups, "oneWayAnova");

    std::size_t total = 0;
    double grandSum = 0.0;
    std::vector<SampleMoments> moments;
    moments.reserve(groups.size());

    for (const auto& g : groups)
      {
	moments.push_back(computeSampleMoments(g));
	total += g.size();
	grandSum += std::accumulate(g.begin(), g.end(), 0.0);
      }

    TestOutcome outcome;
    const double k = static_cast<double>(groups.size());
    const double n = static_cast<double>(total);
    const double dfBetween = k - 1.0;
    const double dfWithin = n - k;
    if (dfWithin < 1.0)
      return outcome;

    const double grandMean = grandSum / n;
    double ssBetween = 0.0;
    double ssWithin = 0.0;
    bool equalMeans = true;

    for (std::size_t i = 0; i < groups.size(); ++i)
      {
	const double ni = static_cast<double>(groups[i].size());
	const double d = moments[i].mean - grandMean;
	ssBetween += ni * d * d;
	if (groups[i].size() > 1)
	  ssWithin += moments[i].variance * (ni - 1.0);
	if (moments[i].mean != moments[0].mean)
	  equalMeans = false;
      }

    const double msWithin = ssWithin / dfWithin;
    if (msWithin == 0.0)
      {
	if (equalMeans)
	  return outcome;
	outcome.statistic = std::numeric_limits<double>::infinity();
	outcome.pValue = 0.0;
	return outcome;
      }

    outcome.statistic = (ssBetween / dfBetween) / msWithin;
    boost::math::fisher_f dist(dfBetween, dfWithin);
    outcome.pValue = boost::math::cdf(boost::math::complement(dist, outcome.statistic));
    return outcome;
  }

  TestOutcome HypothesisTests::kruskalWallisTest(const std::vector<std::vector<double>>& groups)
  {
    requireGroups(groups, "kruskalWallisTest");

    std::vector<double> combined;
    for (const auto& g : groups)
      combined.insert(combined.end(), g.begin(), g.end());

    double tieCorrection = 0.0;
    const std::vector<double> ranks = rank(combined, tieCorrection);

    const double n = static_cast<double>(combined.size());
    const double correction = 1.0 - tieCorrection / (n * n * n - n);

    TestOutcome outcome;
    if (correction <= 0.0)
      return outcome;

    double h = 0.0;
    std::size_t offset = 0;
    for (const auto& g : groups)
      {
	const auto first = ranks.begin() + static_cast<std::ptrdiff_t>(offset);
	const double rankSum = std::accumulate(first, first + static_cast<std::ptrdiff_t>(g.size()), 0.0);
	h += rankSum * rankSum / static_cast<double>(g.size());
	offset += g.size();
      }

    h = 12.0 / (n * (n + 1.0)) * h - 3.0 * (n + 1.0);
    h = std::max(h, 0.0) / correction;

    outcome.statistic = h;
    boost::math::chi_squared dist(static_cast<double>(groups.size() - 1));
    outcome.pValue = boost::math::cdf(boost::math::complement(dist, h));
    return outcome;
  }
}
