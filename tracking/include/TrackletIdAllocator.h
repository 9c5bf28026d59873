//
// Created by dylan on 3/6/26.
//

#ifndef TRACKLETIDALLOCATOR_H
#define TRACKLETIDALLOCATOR_H

#include "EventData.h"

#include <cstdint>
#include <vector>

// Hands out run-wide tracklet ids.  Ids only move forward, so it must see
// the events in their final order, after all of them are reconstructed.
class TrackletIdAllocator {
public:
    explicit TrackletIdAllocator(uint32_t firstId = 0) : nextId_(firstId) {}

    // Replace the event-local ids of the tracks and of the hit relation.
    void assign(EventTracklets& event);
    void assign(std::vector<EventTracklets>& events);

    uint32_t getNextId() const { return nextId_; }

private:
    uint32_t nextId_;
};

#endif
