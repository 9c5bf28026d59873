//
// Created by dylan on 3/6/26.
//

#ifndef EVENTPROCESSOR_H
#define EVENTPROCESSOR_H

#include "ConfigManager.h"
#include "DriftGeometry.h"
#include "EventData.h"
#include "HitProjector.h"
#include "TrackParameterCalculator.h"

#include <cstdint>
#include <vector>

class EventProcessor {
public:
    EventProcessor(const DriftGeometry& geometry, const TrackletParams& params,
                   bool verbose = false);

    // Projection, track search and track parameters for one event.  Track
    // ids in the result are local to the event.
    EventTracklets processEvent(const Event& event) const;

    // Events are independent and are spread over nThreads workers; the
    // results keep the input order.  The first exception thrown by any
    // event is rethrown once all workers are done.  With more than one
    // worker ROOT::EnableThreadSafety() is called first.
    std::vector<EventTracklets> processEvents(const std::vector<Event>& events,
                                              int nThreads = 1) const;

    // Fitter seed of one event, derived from the configured seed and the
    // event id only.  Fits in 32 bits and is never zero.
    static unsigned long eventSeed(unsigned long seed, uint64_t eventId);

private:
    EventTracklets processEvent(const Event& event, bool verbose) const;

    HitProjector projector_;
    TrackParameterCalculator calculator_;
    TrackletParams params_;
    bool verbose_;
};

#endif
