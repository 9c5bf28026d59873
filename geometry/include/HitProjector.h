//
// Created by dylan on 3/2/26.
//

#ifndef HITPROJECTOR_H
#define HITPROJECTOR_H

#include "DriftGeometry.h"
#include "EventData.h"

#include <stdexcept>
#include <string>
#include <vector>

#include "TVector3.h"

class GeometryError : public std::runtime_error {
public:
    explicit GeometryError(const std::string& what) : std::runtime_error(what) {}
};

class HitProjector {
public:
    explicit HitProjector(const DriftGeometry& geometry);

    // Drift distance [mm] for a hit recorded at hitTs relative to t0Ts.
    double driftDistance(double hitTs, double t0Ts) const;

    // 3D position of one hit. No validation of the lookup result.
    TVector3 project(const Hit& hit, const EventT0& t0) const;

    // Positions for every slot of the event. Invalid slots are left at the
    // origin; a non-finite position of a valid hit throws GeometryError.
    std::vector<TVector3> projectEvent(const std::vector<Hit>& hits, const EventT0& t0) const;

private:
    const DriftGeometry& geometry_;
};

#endif
