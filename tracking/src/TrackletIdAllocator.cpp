//
// Created by dylan on 3/6/26.
//

#include "TrackletIdAllocator.h"
#include <sstream>
#include <stdexcept>
#include <unordered_map>

void TrackletIdAllocator::assign(EventTracklets& event)
{
    std::unordered_map<uint32_t, uint32_t> globalIds;
    for (Track& t : event.tracks) {
        const uint32_t global = nextId_++;
        globalIds[t.id] = global;
        t.id = global;
    }

    for (auto& rel : event.hitTracks) {
        auto it = globalIds.find(rel.first);
        if (it == globalIds.end()) {
            std::ostringstream msg;
            msg << "Hit " << rel.second << " of event " << event.eventId
                << " refers to unknown tracklet " << rel.first;
            throw std::logic_error(msg.str());
        }
        rel.first = it->second;
    }
}

void TrackletIdAllocator::assign(std::vector<EventTracklets>& events)
{
    for (EventTracklets& ev : events) assign(ev);
}
