//
// Created by dylan on 3/4/26.
//

#ifndef TRACKPARAMETERCALCULATOR_H
#define TRACKPARAMETERCALCULATOR_H

#include "EventData.h"
#include "LineModel.h"

#include <array>
#include <utility>
#include <vector>

#include "TVector3.h"

class TrackParameterCalculator {
public:
    static constexpr long kMinHits = 2;

    // One Track per local id with at least kMinHits valid member hits, in
    // increasing id order.  hits, xyz and trackIds are parallel; an id of -1
    // means the hit is not on a track.  Throws std::invalid_argument when
    // the three vectors differ in size.
    std::vector<Track> calculate(const std::vector<Hit>& hits,
                                 const std::vector<TVector3>& xyz,
                                 const std::vector<int>& trackIds) const;

    // Parameters of one track from its member hits and positions.
    Track computeTrack(int id, const std::vector<const Hit*>& members,
                       const std::vector<TVector3>& points) const;

    // Extreme projections onto the axis, clipped to the bounding box of the
    // points.  Returns (r_min, r_max).
    static std::pair<TVector3, TVector3> projectedLimits(const LineModel& line,
                                                         const std::vector<TVector3>& points);

    // Mean absolute (x, y, z) distance of the points to the line.
    static std::array<double, 3> trackResidual(const LineModel& line,
                                               const std::vector<TVector3>& points);

    // Angle of the axis w.r.t. the z axis.
    static double theta(const TVector3& axis);
    // Orientation of the axis about the z axis.
    static double phi(const TVector3& axis);
    // (x, y) where the line crosses z = 0; the centroid (x, y) when the line
    // is parallel to that plane.
    static std::pair<double, double> xyp(const LineModel& line);
};

#endif
