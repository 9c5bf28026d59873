//
// Created by dylan on 3/2/26.
//

#include "HitProjector.h"
#include <cmath>
#include <sstream>

HitProjector::HitProjector(const DriftGeometry& geometry)
    : geometry_(geometry)
{}

double HitProjector::driftDistance(double hitTs, double t0Ts) const
{
    const double driftTime = hitTs - t0Ts;
    return driftTime * (geometry_.driftVelocity() * geometry_.tickDuration());
}

TVector3 HitProjector::project(const Hit& hit, const EventT0& t0) const
{
    const double z = geometry_.zCoordinate(hit.ioGroup, hit.ioChannel,
                                           driftDistance(hit.ts, t0.ts));
    return TVector3(hit.px, hit.py, z);
}

std::vector<TVector3> HitProjector::projectEvent(const std::vector<Hit>& hits,
                                                 const EventT0& t0) const
{
    std::vector<TVector3> xyz(hits.size());
    for (std::size_t i = 0; i < hits.size(); ++i) {
        if (!hits[i].valid) continue;
        xyz[i] = project(hits[i], t0);
        if (!std::isfinite(xyz[i].X()) || !std::isfinite(xyz[i].Y()) || !std::isfinite(xyz[i].Z())) {
            std::ostringstream msg;
            msg << "Non-finite position for hit " << hits[i].id
                << " (io_group " << hits[i].ioGroup
                << ", io_channel " << hits[i].ioChannel
                << ") in event " << t0.eventId;
            throw GeometryError(msg.str());
        }
    }
    return xyz;
}
