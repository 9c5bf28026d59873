//
// Created by dylan on 3/10/26.
//

#include <iostream>
#include <string>
#include <filesystem>
#include <stdexcept>

#include "ConfigManager.h"
#include "EventProcessor.h"
#include "HitReader.h"
#include "TileGeometry.h"
#include "TrackletIdAllocator.h"
#include "TrackletWriter.h"

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <config.yaml> <input.root> [output.root]" << std::endl;
        return 1;
    }
    std::string configFile = argv[1];
    std::string inputFile = argv[2];

    try {
        ConfigManager config(configFile);

        std::string outputFile = (std::filesystem::path(config.getOutputDir()) / "tracklets.root").string();
        if (argc >= 4) outputFile = argv[3];

        const TrackletParams params = config.getTrackletParams();
        const GeometryParams geoParams = config.getGeometryParams();
        const int threads = config.getThreads();
        const bool verbose = config.isVerbose();

        // ------------------------------------------------------------------
        // Geometry
        // ------------------------------------------------------------------
        if (geoParams.tileMapFile.empty()) {
            throw std::runtime_error("geometry.tile_map is not set in " + configFile);
        }
        TileGeometry geometry(geoParams.driftVelocity, geoParams.tickDuration);
        if (!geometry.loadFromCSV(geoParams.tileMapFile)) {
            throw std::runtime_error("Failed to load tile map " + geoParams.tileMapFile);
        }
        std::cout << "Tile map: " << geometry.getChannelCount() << " channels on "
                  << geometry.getTileIds().size() << " tiles\n";

        // ------------------------------------------------------------------
        // Input
        // ------------------------------------------------------------------
        HitReader reader(inputFile, config.getHitsTreeName(), config.getT0TreeName());
        std::vector<Event> events = reader.readEvents();

        std::size_t nHits = 0;
        for (const auto& ev : events) nHits += ev.hits.size();
        std::cout << "Events = " << events.size() << ", hit slots = " << nHits << "\n";

        // ------------------------------------------------------------------
        // Reconstruction
        // ------------------------------------------------------------------
        EventProcessor processor(geometry, params, verbose);
        std::vector<EventTracklets> results = processor.processEvents(events, threads);

        TrackletIdAllocator allocator(config.getFirstTrackletId());
        allocator.assign(results);

        if (verbose && threads > 1) {
            for (const auto& r : results) {
                std::cout << "Event " << r.eventId << ": " << r.nValidHits << " hits, "
                          << r.tracks.size() << " tracklets after " << r.nRounds << " rounds\n";
            }
        }

        // ------------------------------------------------------------------
        // Output
        // ------------------------------------------------------------------
        TrackletWriter writer(outputFile);
        long nTracklets = writer.write(results, params);

        std::cout << "Reconstruction finished, tracklets: " << nTracklets
                  << " written to " << outputFile << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "reconstruct_tracklets error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
