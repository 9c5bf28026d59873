//
// Created by dylan on 3/2/26.
//

#ifndef EVENTDATA_H
#define EVENTDATA_H

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Hits and t0 records that do not line up event by event.
class InputMismatchError : public std::runtime_error {
public:
    explicit InputMismatchError(const std::string& what) : std::runtime_error(what) {}
};

struct Hit {
    bool valid = true;       // false for empty slots in the event's hit list
    uint64_t id = 0;
    double ts = 0.0;         // timestamp [ticks]
    double q = 0.0;          // charge
    unsigned int ioGroup = 0;
    unsigned int ioChannel = 0;
    double px = 0.0;         // mm
    double py = 0.0;         // mm
};

struct EventT0 {
    uint64_t eventId = 0;
    double ts = 0.0;         // ticks
};

struct Event {
    uint64_t eventId = 0;
    EventT0 t0;
    std::vector<Hit> hits;
};

struct Track {
    uint32_t id = 0;
    double theta = 0.0;
    double phi = 0.0;
    double xp = 0.0;
    double yp = 0.0;
    long nhit = 0;
    double q = 0.0;
    double tsStart = 0.0;
    double tsEnd = 0.0;
    std::array<double, 3> residual{{0.0, 0.0, 0.0}};
    double length = 0.0;
    std::array<double, 3> start{{0.0, 0.0, 0.0}};
    std::array<double, 3> end{{0.0, 0.0, 0.0}};
};

// Reconstruction output of one event. Track ids and the first element of
// each hitTracks pair are event-local until TrackletIdAllocator runs.
struct EventTracklets {
    uint64_t eventId = 0;
    std::vector<Track> tracks;
    std::vector<std::pair<uint32_t, uint64_t>> hitTracks;  // (track id, hit id)
    std::size_t nValidHits = 0;
    int nRounds = 0;
};

#endif
