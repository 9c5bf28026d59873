//
// Created by dylan on 3/5/26.
//

#include "TrackExtractor.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>

TrackExtractor::TrackExtractor(const TrackletParams& params, unsigned long seed, bool verbose)
    : params_(params),
      clusterer_(params.dbscanEps, params.dbscanMinSamples),
      fitter_(params.ransacMinSamples, params.ransacResidualThreshold, params.ransacMaxTrials, seed),
      verbose_(verbose)
{
    if (params_.maxIterations < 1)
        throw std::invalid_argument("TrackExtractor: maxIterations must be at least 1");
}

TrackAssignment TrackExtractor::extract(const std::vector<TVector3>& xyz,
                                        const std::vector<bool>& valid)
{
    if (xyz.size() != valid.size())
        throw std::invalid_argument("TrackExtractor: positions and validity flags differ in size");

    const std::size_t nHits = xyz.size();
    TrackAssignment result;
    result.trackIds.assign(nHits, kUnassigned);

    std::vector<bool> eligible(valid);
    int currentId = -1;

    std::vector<int> labels;       // CLUSTER output for the round
    int nLabels = 0;
    int label = 0;                 // cluster being handled
    std::vector<bool> candidate;   // members of that cluster, then its inliers
    std::vector<int> subLabels;    // SPLIT output

    auto anyEligible = [&eligible]() {
        return std::find(eligible.begin(), eligible.end(), true) != eligible.end();
    };

    Phase phase = anyEligible() ? Phase::kCluster : Phase::kDone;
    while (phase != Phase::kDone) {
        switch (phase) {
        case Phase::kCluster: {
            ++result.nRounds;
            labels = clusterer_.cluster(xyz, eligible);
            nLabels = DensityClusterer::countClusters(labels);
            label = 0;
            if (verbose_) {
                std::cout << "  round " << result.nRounds << ": "
                          << std::count(eligible.begin(), eligible.end(), true)
                          << " eligible hits, " << nLabels << " clusters\n";
            }
            phase = Phase::kFit;
            break;
        }
        case Phase::kFit: {
            if (label >= nLabels) {
                phase = Phase::kEndRound;
                break;
            }
            candidate.assign(nHits, false);
            std::size_t size = 0;
            for (std::size_t i = 0; i < nHits; ++i) {
                if (labels[i] == label) {
                    candidate[i] = true;
                    ++size;
                }
            }
            // too small for a line fit, go to the next cluster
            if (size <= static_cast<std::size_t>(params_.ransacMinSamples)) {
                ++label;
                break;
            }
            candidate = fitter_.fit(xyz, candidate);
            if (fitter_.getBestInlierCount() < 1) {
                ++label;
                break;
            }
            phase = Phase::kSplit;
            break;
        }
        case Phase::kSplit:
            // A line can cross several separate groups of hits
            subLabels = clusterer_.cluster(xyz, candidate);
            phase = Phase::kAssign;
            break;
        case Phase::kAssign: {
            const int nSub = DensityClusterer::countClusters(subLabels);
            for (int sub = 0; sub < nSub; ++sub) {
                ++currentId;
                for (std::size_t i = 0; i < nHits; ++i) {
                    if (subLabels[i] != sub) continue;
                    result.trackIds[i] = currentId;
                    eligible[i] = false;
                }
            }
            ++label;
            phase = Phase::kFit;
            break;
        }
        case Phase::kEndRound:
            if (nLabels == 0 || !anyEligible() || result.nRounds >= params_.maxIterations)
                phase = Phase::kDone;
            else
                phase = Phase::kCluster;
            break;
        case Phase::kDone:
            break;
        }
    }

    result.nTracks = currentId + 1;
    return result;
}
