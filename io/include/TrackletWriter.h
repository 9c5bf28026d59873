//
// Created by dylan on 3/9/26.
//

#ifndef TRACKLETWRITER_H
#define TRACKLETWRITER_H

#include "ConfigManager.h"
#include "EventData.h"

#include <string>
#include <vector>

class TrackletWriter {
public:
    explicit TrackletWriter(const std::string& outputFileName);

    // Writes the tracklets, the tracklet -> hit and event -> tracklet
    // relations and the reconstruction parameters.  The ids must already be
    // global.  Returns the number of tracklets written.
    // Throws std::runtime_error if the file cannot be created.
    long write(const std::vector<EventTracklets>& events,
               const TrackletParams& params) const;

private:
    std::string outputFileName_;
};

#endif
