//
// Created by dylan on 3/9/26.
//

#ifndef HITREADER_H
#define HITREADER_H

#include "EventData.h"

#include <string>
#include <vector>

// Reads the per-hit tree and the per-event t0 tree of a ROOT file and
// groups the hits by event.
class HitReader {
public:
    HitReader(const std::string& inputFileName,
              const std::string& hitsTreeName = "hits",
              const std::string& t0TreeName = "t0");

    // Events in t0 order, hits in file order within an event.  Throws
    // std::runtime_error when the file or a tree cannot be read and
    // InputMismatchError when hits and t0 do not pair up.
    std::vector<Event> readEvents() const;

private:
    std::string inputFileName_;
    std::string hitsTreeName_;
    std::string t0TreeName_;
};

#endif
