//
// Created by dylan on 3/4/26.
//

#include "TrackParameterCalculator.h"
#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

std::vector<Track> TrackParameterCalculator::calculate(const std::vector<Hit>& hits,
                                                       const std::vector<TVector3>& xyz,
                                                       const std::vector<int>& trackIds) const
{
    if (hits.size() != xyz.size() || hits.size() != trackIds.size())
        throw std::invalid_argument("TrackParameterCalculator: hits, positions and track ids differ in size");

    std::vector<Track> tracks;

    // group members by id, std::map keeps the ids ordered
    std::map<int, std::vector<std::size_t>> members;
    for (std::size_t i = 0; i < hits.size(); ++i) {
        if (trackIds[i] < 0 || !hits[i].valid) continue;
        members[trackIds[i]].push_back(i);
    }

    for (const auto& [id, indices] : members) {
        if (static_cast<long>(indices.size()) < kMinHits) continue;

        std::vector<const Hit*> memberHits;
        std::vector<TVector3> points;
        memberHits.reserve(indices.size());
        points.reserve(indices.size());
        for (std::size_t i : indices) {
            memberHits.push_back(&hits[i]);
            points.push_back(xyz[i]);
        }
        tracks.push_back(computeTrack(id, memberHits, points));
    }
    return tracks;
}

Track TrackParameterCalculator::computeTrack(int id, const std::vector<const Hit*>& members,
                                             const std::vector<TVector3>& points) const
{
    const LineModel line = principalAxis(points);
    const auto [rMin, rMax] = projectedLimits(line, points);
    const auto [xp, yp] = xyp(line);

    Track t;
    t.id = static_cast<uint32_t>(id);
    t.theta = theta(line.direction);
    t.phi = phi(line.direction);
    t.xp = xp;
    t.yp = yp;
    t.nhit = static_cast<long>(members.size());
    t.residual = trackResidual(line, points);
    t.length = (rMax - rMin).Mag();
    rMin.GetXYZ(t.start.data());
    rMax.GetXYZ(t.end.data());

    t.q = 0;
    t.tsStart = members.front()->ts;
    t.tsEnd = members.front()->ts;
    for (const Hit* h : members) {
        t.q += h->q;
        t.tsStart = std::min(t.tsStart, h->ts);
        t.tsEnd = std::max(t.tsEnd, h->ts);
    }
    return t;
}

std::pair<TVector3, TVector3> TrackParameterCalculator::projectedLimits(
    const LineModel& line, const std::vector<TVector3>& points)
{
    TVector3 lo = points.front();
    TVector3 hi = points.front();
    double sMin = line.projection(points.front());
    double sMax = sMin;
    for (const TVector3& p : points) {
        for (int k = 0; k < 3; ++k) {
            lo[k] = std::min(lo[k], p[k]);
            hi[k] = std::max(hi[k], p[k]);
        }
        const double s = line.projection(p);
        sMin = std::min(sMin, s);
        sMax = std::max(sMax, s);
    }

    TVector3 rMin = line.origin + sMin * line.direction;
    TVector3 rMax = line.origin + sMax * line.direction;
    for (int k = 0; k < 3; ++k) {
        rMin[k] = std::clamp(rMin[k], lo[k], hi[k]);
        rMax[k] = std::clamp(rMax[k], lo[k], hi[k]);
    }
    return {rMin, rMax};
}

std::array<double, 3> TrackParameterCalculator::trackResidual(const LineModel& line,
                                                              const std::vector<TVector3>& points)
{
    std::array<double, 3> res{{0.0, 0.0, 0.0}};
    if (points.empty()) return res;
    for (const TVector3& p : points) {
        const TVector3 d = p - line.closestPoint(p);
        for (int k = 0; k < 3; ++k) res[k] += std::fabs(d[k]);
    }
    for (double& r : res) r /= points.size();
    return res;
}

double TrackParameterCalculator::theta(const TVector3& axis)
{
    return std::atan2(std::hypot(axis.X(), axis.Y()), axis.Z());
}

double TrackParameterCalculator::phi(const TVector3& axis)
{
    return std::atan2(axis.Y(), axis.X());
}

std::pair<double, double> TrackParameterCalculator::xyp(const LineModel& line)
{
    if (line.direction.Z() == 0) return {line.origin.X(), line.origin.Y()};
    const double s = -line.origin.Z() / line.direction.Z();
    const TVector3 p = line.origin + s * line.direction;
    return {p.X(), p.Y()};
}
