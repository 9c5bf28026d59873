//
// Created by dylan on 3/2/26.
//

#ifndef TILEGEOMETRY_H
#define TILEGEOMETRY_H

#include "DriftGeometry.h"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

struct TileInfo {
    int tileId = -1;
    double anodeZ = 0.0;      // mm
    int driftDirection = 1;   // +1 or -1 along z
};

class TileGeometry : public DriftGeometry {
public:
    TileGeometry(double driftVelocity, double tickDuration);

    // CSV columns: io_group,io_channel,tile_id,anode_z,drift_direction
    bool loadFromCSV(const std::string& filename);

    void addChannel(unsigned int ioGroup, unsigned int ioChannel, const TileInfo& tile);

    // Lookup by (io_group, io_channel)
    const TileInfo* getTileInfo(unsigned int ioGroup, unsigned int ioChannel) const;

    std::size_t getChannelCount() const { return mapping_.size(); }
    const std::vector<int>& getTileIds() const { return tileIds_; }

    double zCoordinate(unsigned int ioGroup, unsigned int ioChannel,
                       double driftDistance) const override;
    double driftVelocity() const override { return driftVelocity_; }
    double tickDuration() const override { return tickDuration_; }

private:
    double driftVelocity_;
    double tickDuration_;

    std::unordered_map<uint64_t, TileInfo> mapping_;  // key = io_group << 32 | io_channel
    std::vector<int> tileIds_;

    static uint64_t channelKey(unsigned int ioGroup, unsigned int ioChannel);

    // Helper
    static std::vector<std::string> split(const std::string& s, char delim);
};

#endif
