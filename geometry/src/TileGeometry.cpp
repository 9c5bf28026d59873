//
// Created by dylan on 3/2/26.
//

#include "TileGeometry.h"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <iostream>
#include <limits>
#include <stdexcept>

TileGeometry::TileGeometry(double driftVelocity, double tickDuration)
    : driftVelocity_(driftVelocity), tickDuration_(tickDuration)
{}

uint64_t TileGeometry::channelKey(unsigned int ioGroup, unsigned int ioChannel)
{
    return (static_cast<uint64_t>(ioGroup) << 32) | ioChannel;
}

std::vector<std::string> TileGeometry::split(const std::string& s, char delim)
{
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, delim))
        out.push_back(item);
    return out;
}

bool TileGeometry::loadFromCSV(const std::string& filename)
{
    std::ifstream infile(filename);
    if (!infile.is_open()) {
        std::cerr << "ERROR: Cannot open tile map file " << filename << "\n";
        return false;
    }

    std::string line;
    bool isHeader = true;

    while (std::getline(infile, line)) {
        if (line.empty()) continue;

        // Skip header row
        if (isHeader) {
            isHeader = false;
            continue;
        }

        auto cols = split(line, ',');
        if (cols.size() < 5) {
            std::cerr << "WARNING: Bad line, skipping: " << line << "\n";
            continue;
        }

        long long group = 0;
        long long channel = 0;
        TileInfo info;
        try {
            group               = std::stoll(cols[0]);
            channel             = std::stoll(cols[1]);
            info.tileId         = std::stoi(cols[2]);
            info.anodeZ         = std::stod(cols[3]);
            info.driftDirection = std::stoi(cols[4]);
        } catch (const std::logic_error&) {
            std::cerr << "WARNING: Unparsable line, skipping: " << line << "\n";
            continue;
        }

        const long long maxId = std::numeric_limits<unsigned int>::max();
        if (group < 0 || group > maxId || channel < 0 || channel > maxId) {
            std::cerr << "WARNING: io_group or io_channel out of range, skipping: " << line << "\n";
            continue;
        }

        if (info.driftDirection != 1 && info.driftDirection != -1) {
            std::cerr << "WARNING: Drift direction must be +1 or -1, skipping: " << line << "\n";
            continue;
        }

        addChannel(static_cast<unsigned int>(group), static_cast<unsigned int>(channel), info);
    }

    return true;
}

void TileGeometry::addChannel(unsigned int ioGroup, unsigned int ioChannel, const TileInfo& tile)
{
    mapping_[channelKey(ioGroup, ioChannel)] = tile;
    if (std::find(tileIds_.begin(), tileIds_.end(), tile.tileId) == tileIds_.end())
        tileIds_.push_back(tile.tileId);
}

const TileInfo* TileGeometry::getTileInfo(unsigned int ioGroup, unsigned int ioChannel) const
{
    auto it = mapping_.find(channelKey(ioGroup, ioChannel));
    return (it == mapping_.end() ? nullptr : &it->second);
}

double TileGeometry::zCoordinate(unsigned int ioGroup, unsigned int ioChannel,
                                 double driftDistance) const
{
    const TileInfo* tile = getTileInfo(ioGroup, ioChannel);
    if (!tile) return std::numeric_limits<double>::quiet_NaN();
    return tile->anodeZ + tile->driftDirection * driftDistance;
}
