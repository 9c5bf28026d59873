//
// Created by dn277127 on 2025-12-02.
//

// src/ConfigManager.cpp
#include "../include/ConfigManager.h"

#include <filesystem>
#include <stdexcept>

namespace {

template <typename T>
T getOr(const YAML::Node &section, const char *key, const T &fallback) {
    if (!section || !section.IsMap()) return fallback;
    const YAML::Node value = section[key];
    return value ? value.as<T>() : fallback;
}

}

ConfigManager::ConfigManager(const std::string &fname) {
    cfg = YAML::LoadFile(fname);
    baseDir = std::filesystem::path(fname).parent_path().string();
    if (baseDir.empty()) baseDir = ".";
    validate();
}

ConfigManager::ConfigManager(const YAML::Node &node, const std::string &baseDir)
    : cfg(node), baseDir(baseDir)
{
    validate();
}

TrackletParams ConfigManager::getTrackletParams() const {
    TrackletParams defaults;
    const YAML::Node t = cfg["tracklets"];

    TrackletParams p;
    p.dbscanEps               = getOr(t, "dbscan_eps", defaults.dbscanEps);
    p.dbscanMinSamples        = getOr(t, "dbscan_min_samples", defaults.dbscanMinSamples);
    p.ransacMinSamples        = getOr(t, "ransac_min_samples", defaults.ransacMinSamples);
    p.ransacResidualThreshold = getOr(t, "ransac_residual_threshold", defaults.ransacResidualThreshold);
    p.ransacMaxTrials         = getOr(t, "ransac_max_trials", defaults.ransacMaxTrials);
    p.maxIterations           = getOr(t, "max_iterations", defaults.maxIterations);
    p.seed                    = getOr(t, "seed", defaults.seed);
    return p;
}

GeometryParams ConfigManager::getGeometryParams() const {
    GeometryParams defaults;
    const YAML::Node g = cfg["geometry"];

    GeometryParams p;
    p.driftVelocity = getOr(g, "drift_velocity", defaults.driftVelocity);
    p.tickDuration  = getOr(g, "tick_duration", defaults.tickDuration);

    std::string tileMap = getOr(g, "tile_map", std::string());
    if (!tileMap.empty()) {
        std::filesystem::path path(tileMap);
        if (path.is_relative()) path = std::filesystem::path(baseDir) / path;
        p.tileMapFile = path.string();
    }
    return p;
}

std::string ConfigManager::getHitsTreeName() const {
    return getOr(cfg["io"], "hits_tree", std::string("hits"));
}

std::string ConfigManager::getT0TreeName() const {
    return getOr(cfg["io"], "t0_tree", std::string("t0"));
}

std::string ConfigManager::getOutputDir() const {
    return getOr(cfg["io"], "output_dir", std::string("."));
}

int ConfigManager::getThreads() const {
    return getOr(cfg["processing"], "threads", 1);
}

unsigned int ConfigManager::getFirstTrackletId() const {
    return getOr(cfg["processing"], "first_tracklet_id", 0u);
}

bool ConfigManager::isVerbose() const {
    return getOr(cfg["processing"], "verbose", false);
}

void ConfigManager::validate() const {
    const TrackletParams p = getTrackletParams();
    if (!(p.dbscanEps > 0))
        throw std::invalid_argument("tracklets.dbscan_eps must be positive");
    if (p.dbscanMinSamples < 1)
        throw std::invalid_argument("tracklets.dbscan_min_samples must be at least 1");
    if (p.ransacMinSamples < 2)
        throw std::invalid_argument("tracklets.ransac_min_samples must be at least 2");
    if (!(p.ransacResidualThreshold > 0))
        throw std::invalid_argument("tracklets.ransac_residual_threshold must be positive");
    if (p.ransacMaxTrials < 1)
        throw std::invalid_argument("tracklets.ransac_max_trials must be at least 1");
    if (p.maxIterations < 1)
        throw std::invalid_argument("tracklets.max_iterations must be at least 1");

    const GeometryParams g = getGeometryParams();
    if (!(g.driftVelocity > 0) || !(g.tickDuration > 0))
        throw std::invalid_argument("geometry.drift_velocity and geometry.tick_duration must be positive");

    if (getThreads() < 1)
        throw std::invalid_argument("processing.threads must be at least 1");
}
