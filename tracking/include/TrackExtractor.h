//
// Created by dylan on 3/5/26.
//

#ifndef TRACKEXTRACTOR_H
#define TRACKEXTRACTOR_H

#include "ConfigManager.h"
#include "DensityClusterer.h"
#include "RansacLineFitter.h"

#include <vector>

#include "TVector3.h"

struct TrackAssignment {
    std::vector<int> trackIds;   // per hit, -1 when unassigned
    int nTracks = 0;             // ids 0 .. nTracks-1 were handed out
    int nRounds = 0;
};

/// Iterative cluster / fit / split search for straight tracks in one event.
///
/// Every round clusters the hits that are still eligible, fits a line with
/// RANSAC to each cluster large enough for it, re-clusters the inliers to
/// separate groups the line happens to join, and gives every resulting
/// group a new id.  Hits with an id leave the eligible set.  The search
/// stops when a round finds only noise, when no eligible hit is left, or
/// after maxIterations rounds; hits still without an id stay at -1.
class TrackExtractor {
public:
    static constexpr int kUnassigned = -1;

    TrackExtractor(const TrackletParams& params, unsigned long seed, bool verbose = false);

    // valid flags which entries of xyz are real hits.
    TrackAssignment extract(const std::vector<TVector3>& xyz, const std::vector<bool>& valid);

private:
    enum class Phase { kCluster, kFit, kSplit, kAssign, kEndRound, kDone };

    TrackletParams params_;
    DensityClusterer clusterer_;
    RansacLineFitter fitter_;
    bool verbose_;
};

#endif
