//
// Created by dylan on 3/3/26.
//

#ifndef RANSACLINEFITTER_H
#define RANSACLINEFITTER_H

#include "LineModel.h"

#include <stdexcept>
#include <string>
#include <vector>

#include "TRandom3.h"
#include "TVector3.h"

class InsufficientDataError : public std::runtime_error {
public:
    explicit InsufficientDataError(const std::string& what) : std::runtime_error(what) {}
};

/// Random sample consensus fit of a straight line.
///
/// Every trial draws minSamples distinct points, fits a line through them and
/// counts the points closer than the residual threshold.  After maxTrials
/// trials the inliers of the best trial are returned; the earliest trial
/// wins a tie in inlier count.  Trials whose sample points all coincide give
/// no model but still count as trials.
///
/// Each fitter owns its random engine, so fitters used on different threads
/// never share state.  Only the low 32 bits of the seed are used and they must
/// be non-zero since TRandom3 replaces a zero seed with a time dependent one.
class RansacLineFitter {
public:
    RansacLineFitter(int minSamples, double residualThreshold, int maxTrials,
                     unsigned long seed);

    // Inlier flags over the full point vector.  Only points with mask[i] set
    // take part.  Throws InsufficientDataError with fewer than minSamples
    // usable points.
    std::vector<bool> fit(const std::vector<TVector3>& points,
                          const std::vector<bool>& mask);
    std::vector<bool> fit(const std::vector<TVector3>& points);

    // Results of the last fit.
    const LineModel& getBestModel() const { return bestModel_; }
    int getBestTrial() const { return bestTrial_; }
    std::size_t getBestInlierCount() const { return bestInliers_; }

private:
    int minSamples_;
    double residualThreshold_;
    int maxTrials_;
    TRandom3 rng_;

    LineModel bestModel_;
    int bestTrial_ = -1;
    std::size_t bestInliers_ = 0;
};

#endif
