//
// Created by dylan on 3/2/26.
//

#ifndef DENSITYCLUSTERER_H
#define DENSITYCLUSTERER_H

#include <vector>

#include "TVector3.h"

/// Density-based (DBSCAN) clustering of 3D points with a cartesian metric.
///
/// A point is a core point when its closed eps-neighborhood, the point
/// itself included, holds at least minSamples points.  Clusters are the
/// connected components of core points plus the points in their
/// neighborhoods; everything else is noise (label -1).  Labels are numbered
/// in the order the first core point of each cluster appears in the input,
/// and a border point shared by two clusters stays with the first one that
/// reaches it, so the labeling only depends on the input order.
class DensityClusterer {
public:
    static constexpr int kNoise = -1;

    DensityClusterer(double eps, int minSamples);

    // Label every point; points with mask[i] == false are ignored and
    // labeled as noise.
    std::vector<int> cluster(const std::vector<TVector3>& points,
                             const std::vector<bool>& mask) const;

    // Number of distinct non-noise labels.
    static int countClusters(const std::vector<int>& labels);

private:
    double eps_;
    int minSamples_;
};

#endif
