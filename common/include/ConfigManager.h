//
// Created by dn277127 on 2025-12-02.
//

// include/ConfigManager.h
#pragma once
#include <string>
#include <yaml-cpp/yaml.h>

struct TrackletParams {
    double dbscanEps = 25.0;            // mm
    int dbscanMinSamples = 5;
    int ransacMinSamples = 2;
    double ransacResidualThreshold = 8.0;  // mm
    int ransacMaxTrials = 100;
    int maxIterations = 100;
    unsigned long seed = 12345;
};

struct GeometryParams {
    std::string tileMapFile;            // resolved against the config directory
    double driftVelocity = 1.6;         // mm/us
    double tickDuration = 0.1;          // us per tick
};

class ConfigManager {
public:
    // Throws YAML::Exception on a missing or malformed file and
    // std::invalid_argument on out of range values.
    explicit ConfigManager(const std::string &fname);

    // Build from an already parsed node, paths resolve against baseDir.
    explicit ConfigManager(const YAML::Node &node, const std::string &baseDir = ".");

    TrackletParams getTrackletParams() const;
    GeometryParams getGeometryParams() const;

    std::string getHitsTreeName() const;
    std::string getT0TreeName() const;
    std::string getOutputDir() const;

    int getThreads() const;
    unsigned int getFirstTrackletId() const;
    bool isVerbose() const;

private:
    YAML::Node cfg;
    std::string baseDir;

    void validate() const;
};
