//
// Created by dylan on 3/3/26.
//

#ifndef LINEMODEL_H
#define LINEMODEL_H

#include <vector>

#include "TVector3.h"

// Infinite 3D line through origin along a unit direction.  A default
// constructed model has a null direction and is not valid.
struct LineModel {
    TVector3 origin;
    TVector3 direction;

    bool isValid() const { return direction.Mag2() > 0; }

    // Signed position of the projection of p along the line.
    double projection(const TVector3& p) const { return (p - origin).Dot(direction); }

    // Closest point on the line to p.
    TVector3 closestPoint(const TVector3& p) const { return origin + projection(p) * direction; }

    // Perpendicular distance of p to the line.
    double distance(const TVector3& p) const { return (p - closestPoint(p)).Mag(); }
};

// Mean position of the points.
TVector3 centroid(const std::vector<TVector3>& points);

// Centroid and unit leading principal axis of the points.  The axis sign is
// chosen so that its largest magnitude component is positive.  Needs at
// least two points; a null axis is returned when all points coincide.
LineModel principalAxis(const std::vector<TVector3>& points);

// Line through the points: exact for two points, least squares (principal
// axis through the centroid) for more.  Returns an invalid model when the
// points coincide or fewer than two are given.
LineModel fitLine(const std::vector<TVector3>& points);

#endif
