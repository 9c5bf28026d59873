#include <ConfigManager.h>
#include <TrackExtractor.h>
#include <TrackParameterCalculator.h>

#include <tut/tut.hpp>
#include <TMath.h>
#include <TRandom3.h>
#include <TVector3.h>

#include <algorithm>
#include <vector>

namespace tut {
    struct baseTrackExtractor {
        baseTrackExtractor() {
            fParams.dbscanEps = 2.0;
            fParams.dbscanMinSamples = 3;
            fParams.ransacMinSamples = 2;
            fParams.ransacResidualThreshold = 0.5;
            fParams.ransacMaxTrials = 50;
            fParams.maxIterations = 5;
            for (int i = 0; i < 10; ++i) {
                fLine.push_back(TVector3(i, 0, 0));
            }
        }
        ~baseTrackExtractor() {
            // Run after each test.
        }

        // Tracks from an id assignment, with one unit of charge per hit.
        std::vector<Track> Tracks(const std::vector<TVector3>& points,
                                  const std::vector<int>& ids) {
            std::vector<Hit> hits(points.size());
            for (std::size_t i = 0; i < points.size(); ++i) {
                hits[i].id = i;
                hits[i].q = 1.0;
            }
            TrackParameterCalculator calc;
            return calc.calculate(hits, points, ids);
        }

        TrackletParams fParams;
        std::vector<TVector3> fLine;
    };

    // Declare the test
    typedef test_group<baseTrackExtractor>::object testTrackExtractor;
    test_group<baseTrackExtractor> groupTrackExtractor("TrackExtractor");

    // Ten colinear hits make exactly one track.
    template<> template<> void testTrackExtractor::test<1> () {
        TrackExtractor extractor(fParams, 12345);
        std::vector<bool> valid(fLine.size(), true);
        TrackAssignment result = extractor.extract(fLine, valid);
        ensure_equals("One id handed out", result.nTracks, 1);
        for (std::size_t i = 0; i < fLine.size(); ++i) {
            ensure_equals("Every hit on track 0", result.trackIds[i], 0);
        }
        ensure_equals("Done in one round", result.nRounds, 1);

        std::vector<Track> tracks = Tracks(fLine, result.trackIds);
        ensure_equals("One track", tracks.size(), 1u);
        ensure_equals("Ten hits", tracks[0].nhit, 10L);
        ensure_distance("Length", tracks[0].length, 9.0, 1E-6);
        ensure_distance("Theta", tracks[0].theta, TMath::PiOver2(), 1E-6);
        ensure_distance("Phi", tracks[0].phi, 0.0, 1E-6);
        for (int k = 0; k < 3; ++k) {
            ensure_distance("Residual", tracks[0].residual[k], 0.0, 1E-6);
        }
    }

    // Isolated hits do not end up on the track.
    template<> template<> void testTrackExtractor::test<2> () {
        std::vector<TVector3> points(fLine);
        points.push_back(TVector3(50, 50, 0));
        points.push_back(TVector3(-40, 10, 5));
        points.push_back(TVector3(4, 30, -8));
        points.push_back(TVector3(20, -20, 20));
        points.push_back(TVector3(4.5, 0, 9));
        std::vector<bool> valid(points.size(), true);

        TrackExtractor extractor(fParams, 12345);
        TrackAssignment result = extractor.extract(points, valid);
        for (std::size_t i = fLine.size(); i < points.size(); ++i) {
            ensure_equals("Noise hit unassigned", result.trackIds[i],
                          TrackExtractor::kUnassigned);
        }

        std::vector<Track> tracks = Tracks(points, result.trackIds);
        ensure_equals("One track", tracks.size(), 1u);
        ensure_equals("Ten hits", tracks[0].nhit, 10L);
    }

    // One valid hit, or none, gives nothing.
    template<> template<> void testTrackExtractor::test<3> () {
        TrackExtractor extractor(fParams, 12345);

        std::vector<TVector3> single(1, TVector3(1, 2, 3));
        TrackAssignment result = extractor.extract(single, std::vector<bool>(1, true));
        ensure_equals("Single hit unassigned", result.trackIds[0],
                      TrackExtractor::kUnassigned);
        ensure_equals("No tracks", Tracks(single, result.trackIds).size(), 0u);

        std::vector<bool> valid(fLine.size(), false);
        result = extractor.extract(fLine, valid);
        ensure_equals("No rounds without valid hits", result.nRounds, 0);
        ensure_equals("No ids", result.nTracks, 0);
    }

    // Invalid hits are never assigned.
    template<> template<> void testTrackExtractor::test<4> () {
        std::vector<bool> valid(fLine.size(), true);
        valid[4] = false;
        TrackExtractor extractor(fParams, 12345);
        TrackAssignment result = extractor.extract(fLine, valid);
        ensure_equals("Invalid hit", result.trackIds[4], TrackExtractor::kUnassigned);
        ensure_equals("Valid hit", result.trackIds[0], 0);
    }

    // A line through two separate groups is split.  Ids follow the order
    // in which the groups are found.
    template<> template<> void testTrackExtractor::test<5> () {
        std::vector<TVector3> points;
        for (int i = 0; i < 5; ++i) points.push_back(TVector3(i, 0, 0));
        for (int i = 8; i < 13; ++i) points.push_back(TVector3(i, 0, 0));
        // Bridge that joins both groups into one cluster.
        for (int i = 5; i < 8; ++i) points.push_back(TVector3(i, 1.5, 0));
        std::vector<bool> valid(points.size(), true);

        TrackExtractor extractor(fParams, 777);
        TrackAssignment result = extractor.extract(points, valid);
        ensure_equals("Three ids", result.nTracks, 3);
        for (int i = 0; i < 5; ++i) {
            ensure_equals("First group", result.trackIds[i], 0);
        }
        for (int i = 5; i < 10; ++i) {
            ensure_equals("Second group", result.trackIds[i], 1);
        }
        for (int i = 10; i < 13; ++i) {
            ensure_equals("Bridge found in the next round", result.trackIds[i], 2);
        }
        ensure_equals("Two rounds", result.nRounds, 2);
    }

    // Every valid hit has at most one id, ids are handed out in order and
    // none is skipped or reused.
    template<> template<> void testTrackExtractor::test<6> () {
        std::vector<TVector3> points;
        for (int i = 0; i < 8; ++i) points.push_back(TVector3(i, 0, 0));
        for (int i = 0; i < 8; ++i) points.push_back(TVector3(30, i, 10));
        for (int i = 0; i < 8; ++i) points.push_back(TVector3(-30, -30, i));
        std::vector<bool> valid(points.size(), true);

        TrackExtractor extractor(fParams, 31);
        TrackAssignment result = extractor.extract(points, valid);
        ensure_equals("Three tracks", result.nTracks, 3);
        std::vector<int> seen;
        for (int id : result.trackIds) {
            ensure("Id in range", id >= -1 && id < result.nTracks);
            if (id >= 0 && std::find(seen.begin(), seen.end(), id) == seen.end()) {
                seen.push_back(id);
            }
        }
        ensure_equals("Every id used", seen.size(), 3u);
        for (std::size_t i = 0; i < seen.size(); ++i) {
            ensure_equals("First appearance in id order", seen[i], static_cast<int>(i));
        }
    }

    // A dense cloud with no line stops at the round limit with nothing
    // assigned.
    template<> template<> void testTrackExtractor::test<7> () {
        TRandom3 rng(7);
        std::vector<TVector3> cloud;
        for (int i = 0; i < 200; ++i) {
            cloud.push_back(TVector3(rng.Uniform(10), rng.Uniform(10), rng.Uniform(10)));
        }
        std::vector<bool> valid(cloud.size(), true);

        TrackletParams params;
        params.dbscanEps = 3.0;
        params.dbscanMinSamples = 3;
        params.ransacMinSamples = 2;
        params.ransacResidualThreshold = 1E-6;
        params.ransacMaxTrials = 20;
        params.maxIterations = 4;

        TrackExtractor extractor(params, 5);
        TrackAssignment result = extractor.extract(cloud, valid);
        ensure_equals("Stopped at the limit", result.nRounds, 4);
        ensure_equals("No ids", result.nTracks, 0);
        for (int id : result.trackIds) {
            ensure_equals("Unassigned", id, TrackExtractor::kUnassigned);
        }
    }

    // The same seed reproduces the same assignment.
    template<> template<> void testTrackExtractor::test<8> () {
        TRandom3 rng(11);
        std::vector<TVector3> points;
        for (int i = 0; i < 40; ++i) {
            points.push_back(TVector3(i*0.8, 0.5*i + rng.Gaus(0, 0.2), rng.Gaus(0, 0.2)));
        }
        for (int i = 0; i < 60; ++i) {
            points.push_back(TVector3(rng.Uniform(30), rng.Uniform(20), rng.Uniform(-5, 5)));
        }
        std::vector<bool> valid(points.size(), true);

        TrackletParams params(fParams);
        params.dbscanEps = 1.5;

        TrackExtractor first(params, 2718);
        TrackExtractor second(params, 2718);
        TrackAssignment a = first.extract(points, valid);
        TrackAssignment b = second.extract(points, valid);
        ensure("Same ids", a.trackIds == b.trackIds);
        ensure_equals("Same rounds", a.nRounds, b.nRounds);

        std::vector<Track> ta = Tracks(points, a.trackIds);
        std::vector<Track> tb = Tracks(points, b.trackIds);
        ensure_equals("Same track count", ta.size(), tb.size());
        for (std::size_t i = 0; i < ta.size(); ++i) {
            ensure_equals("Same theta", ta[i].theta, tb[i].theta);
            ensure_equals("Same length", ta[i].length, tb[i].length);
        }
    }
};

// Local Variables:
// mode:c++
// c-basic-offset:4
// End:
