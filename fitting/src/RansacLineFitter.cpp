//
// Created by dylan on 3/3/26.
//

#include "RansacLineFitter.h"
#include <sstream>
#include <utility>

RansacLineFitter::RansacLineFitter(int minSamples, double residualThreshold,
                                   int maxTrials, unsigned long seed)
    : minSamples_(minSamples),
      residualThreshold_(residualThreshold),
      maxTrials_(maxTrials),
      rng_(static_cast<UInt_t>(seed))
{
    if (minSamples_ < 2)
        throw std::invalid_argument("RansacLineFitter: minSamples must be at least 2");
    if (!(residualThreshold_ > 0))
        throw std::invalid_argument("RansacLineFitter: residual threshold must be positive");
    if (maxTrials_ < 1)
        throw std::invalid_argument("RansacLineFitter: maxTrials must be at least 1");
    if (static_cast<UInt_t>(seed) == 0)
        throw std::invalid_argument("RansacLineFitter: seed must be non-zero in its low 32 bits");
}

std::vector<bool> RansacLineFitter::fit(const std::vector<TVector3>& points)
{
    return fit(points, std::vector<bool>(points.size(), true));
}

std::vector<bool> RansacLineFitter::fit(const std::vector<TVector3>& points,
                                        const std::vector<bool>& mask)
{
    if (points.size() != mask.size())
        throw std::invalid_argument("RansacLineFitter: points and mask differ in size");

    bestModel_ = LineModel();
    bestTrial_ = -1;
    bestInliers_ = 0;

    std::vector<std::size_t> usable;
    for (std::size_t i = 0; i < points.size(); ++i)
        if (mask[i]) usable.push_back(i);

    const std::size_t nSample = static_cast<std::size_t>(minSamples_);
    if (usable.size() < nSample) {
        std::ostringstream msg;
        msg << "RansacLineFitter: " << usable.size() << " points given, "
            << minSamples_ << " needed";
        throw InsufficientDataError(msg.str());
    }

    std::vector<bool> best(points.size(), false);
    std::vector<bool> inliers(points.size(), false);
    std::vector<std::size_t> order(usable);
    std::vector<TVector3> sample(nSample);
    const std::size_t n = order.size();

    for (int trial = 0; trial < maxTrials_; ++trial) {
        // Partial Fisher-Yates shuffle: the first nSample entries of order
        // become a uniform draw without replacement.
        for (std::size_t k = 0; k < nSample; ++k) {
            std::size_t j = k + rng_.Integer(static_cast<UInt_t>(n - k));
            std::swap(order[k], order[j]);
            sample[k] = points[order[k]];
        }

        LineModel model = fitLine(sample);
        if (!model.isValid()) continue;

        std::size_t count = 0;
        for (std::size_t i : usable) {
            inliers[i] = model.distance(points[i]) < residualThreshold_;
            if (inliers[i]) ++count;
        }

        if (count > bestInliers_) {
            bestInliers_ = count;
            bestTrial_ = trial;
            bestModel_ = model;
            best = inliers;
        }
    }

    return best;
}
