//
// Created by dylan on 3/2/26.
//

#include "DensityClusterer.h"
#include <algorithm>
#include <stdexcept>

DensityClusterer::DensityClusterer(double eps, int minSamples)
    : eps_(eps), minSamples_(minSamples)
{
    if (!(eps_ > 0)) throw std::invalid_argument("DensityClusterer: eps must be positive");
    if (minSamples_ < 1) throw std::invalid_argument("DensityClusterer: minSamples must be at least 1");
}

std::vector<int> DensityClusterer::cluster(const std::vector<TVector3>& points,
                                           const std::vector<bool>& mask) const
{
    if (points.size() != mask.size())
        throw std::invalid_argument("DensityClusterer: points and mask differ in size");

    std::vector<int> labels(points.size(), kNoise);

    std::vector<std::size_t> active;
    for (std::size_t i = 0; i < points.size(); ++i)
        if (mask[i]) active.push_back(i);
    if (active.empty()) return labels;

    // Neighborhoods in terms of positions in "active".  The point itself is
    // included, which makes minSamples count it.
    const double eps2 = eps_ * eps_;
    const std::size_t n = active.size();
    std::vector<std::vector<std::size_t>> neighbors(n);
    for (std::size_t a = 0; a < n; ++a) {
        neighbors[a].push_back(a);
        for (std::size_t b = a + 1; b < n; ++b) {
            if ((points[active[a]] - points[active[b]]).Mag2() <= eps2) {
                neighbors[a].push_back(b);
                neighbors[b].push_back(a);
            }
        }
    }

    std::vector<bool> core(n);
    for (std::size_t a = 0; a < n; ++a)
        core[a] = neighbors[a].size() >= static_cast<std::size_t>(minSamples_);

    std::vector<int> local(n, kNoise);
    int nextLabel = 0;
    std::vector<std::size_t> stack;
    for (std::size_t seed = 0; seed < n; ++seed) {
        if (local[seed] != kNoise || !core[seed]) continue;

        // Grow the cluster through core points only; border points get the
        // label but do not expand it.
        local[seed] = nextLabel;
        stack.assign(1, seed);
        while (!stack.empty()) {
            const std::size_t p = stack.back();
            stack.pop_back();
            for (std::size_t q : neighbors[p]) {
                if (local[q] != kNoise) continue;
                local[q] = nextLabel;
                if (core[q]) stack.push_back(q);
            }
        }
        ++nextLabel;
    }

    for (std::size_t a = 0; a < n; ++a)
        labels[active[a]] = local[a];
    return labels;
}

int DensityClusterer::countClusters(const std::vector<int>& labels)
{
    int maxLabel = kNoise;
    for (int label : labels) maxLabel = std::max(maxLabel, label);
    return maxLabel + 1;
}
