//
// Created by dylan on 3/2/26.
//

#ifndef DRIFTGEOMETRY_H
#define DRIFTGEOMETRY_H

// Detector geometry and drift constants needed to turn a hit timestamp into
// a position along the drift axis.
class DriftGeometry {
public:
    virtual ~DriftGeometry() = default;

    // z coordinate [mm] of a charge collected on (ioGroup, ioChannel) after
    // drifting driftDistance [mm]. NaN when the channel is unknown.
    virtual double zCoordinate(unsigned int ioGroup, unsigned int ioChannel,
                               double driftDistance) const = 0;

    virtual double driftVelocity() const = 0;  // mm/us
    virtual double tickDuration() const = 0;   // us per tick
};

#endif
