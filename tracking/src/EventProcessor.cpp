//
// Created by dylan on 3/6/26.
//

#include "EventProcessor.h"
#include "TrackExtractor.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_set>

#include "TROOT.h"

EventProcessor::EventProcessor(const DriftGeometry& geometry, const TrackletParams& params,
                               bool verbose)
    : projector_(geometry), params_(params), verbose_(verbose)
{}

unsigned long EventProcessor::eventSeed(unsigned long seed, uint64_t eventId)
{
    // splitmix64 finaliser over the combined value
    uint64_t z = static_cast<uint64_t>(seed) + 0x9e3779b97f4a7c15ULL * (eventId + 1);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    z = z ^ (z >> 31);
    // TRandom3 takes 32 bits
    const unsigned long s = static_cast<unsigned long>((z ^ (z >> 32)) & 0xffffffffULL);
    return s == 0 ? 1 : s;
}

EventTracklets EventProcessor::processEvent(const Event& event) const
{
    return processEvent(event, verbose_);
}

EventTracklets EventProcessor::processEvent(const Event& event, bool verbose) const
{
    if (event.t0.eventId != event.eventId) {
        std::ostringstream msg;
        msg << "Event " << event.eventId << " carries the t0 of event " << event.t0.eventId;
        throw InputMismatchError(msg.str());
    }

    EventTracklets out;
    out.eventId = event.eventId;

    std::vector<bool> valid(event.hits.size());
    for (std::size_t i = 0; i < event.hits.size(); ++i) {
        valid[i] = event.hits[i].valid;
        if (valid[i]) ++out.nValidHits;
    }
    if (out.nValidHits == 0) return out;

    const std::vector<TVector3> xyz = projector_.projectEvent(event.hits, event.t0);

    if (verbose) std::cout << "Event " << event.eventId << ": " << out.nValidHits << " hits\n";

    TrackExtractor extractor(params_, eventSeed(params_.seed, event.eventId), verbose);
    const TrackAssignment assignment = extractor.extract(xyz, valid);
    out.nRounds = assignment.nRounds;

    out.tracks = calculator_.calculate(event.hits, xyz, assignment.trackIds);

    std::unordered_set<int> kept;
    for (const Track& t : out.tracks) kept.insert(static_cast<int>(t.id));
    for (std::size_t i = 0; i < event.hits.size(); ++i) {
        const int id = assignment.trackIds[i];
        if (id < 0 || !event.hits[i].valid || !kept.count(id)) continue;
        out.hitTracks.emplace_back(static_cast<uint32_t>(id), event.hits[i].id);
    }

    if (verbose) {
        std::cout << "  " << out.tracks.size() << " tracklets after "
                  << out.nRounds << " rounds\n";
    }
    return out;
}

std::vector<EventTracklets> EventProcessor::processEvents(const std::vector<Event>& events,
                                                          int nThreads) const
{
    std::vector<EventTracklets> results(events.size());
    if (events.empty()) return results;

    const std::size_t nWorkers = std::min<std::size_t>(std::max(nThreads, 1), events.size());
    if (nWorkers == 1) {
        for (std::size_t i = 0; i < events.size(); ++i)
            results[i] = processEvent(events[i], verbose_);
        return results;
    }

    // TPrincipal and TRandom3 are used from every worker
    ROOT::EnableThreadSafety();

    std::atomic<std::size_t> next(0);
    std::exception_ptr firstError;
    std::mutex errorMutex;

    // Per-round printout from several threads would interleave
    auto worker = [&]() {
        for (std::size_t i = next++; i < events.size(); i = next++) {
            try {
                results[i] = processEvent(events[i], false);
            } catch (const std::exception&) {
                std::lock_guard<std::mutex> lock(errorMutex);
                if (!firstError) firstError = std::current_exception();
                next = events.size();
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(nWorkers);
    for (std::size_t w = 0; w < nWorkers; ++w) workers.emplace_back(worker);
    for (std::thread& t : workers) t.join();

    if (firstError) std::rethrow_exception(firstError);
    return results;
}
