#pragma once

#include <chrono>
#include <cstddef>
#include <set>
#include <string>

#include <QString>

#include <nlohmann/json.hpp>

class QCommandLineParser;

namespace matchwatch {

struct CaptureRegion {
    int top = 0;
    int left = 0;
    int width = 0;
    int height = 0;
};

struct StateSourceConfig {
    std::string seriesId;
    std::string apiKey;
    std::string url = "https://api-op.grid.gg/live-data-feed/series-state/graphql";
    std::string playerType = "GamePlayerStateValorant";
    std::string inventoryField = "inventory";
    std::chrono::milliseconds requestTimeout{30000};
};

struct PollerConfig {
    std::chrono::milliseconds pollInterval{5000};
    std::chrono::milliseconds errorBackoff{1000};
};

struct DetectorConfig {
    std::set<std::string> premiumWeapons{"Vandal", "Phantom", "Operator"};
};

struct HistoryConfig {
    std::size_t windowSize = 50;
    std::string filePath;
};

struct VisionConfig {
    bool enabled = true;
    CaptureRegion killFeed{40, 1240, 640, 260};
    CaptureRegion roundEnd{260, 350, 1220, 340};
    double scaleFactor = 0.5;
    std::chrono::milliseconds captureDelay{10};
    std::chrono::milliseconds errorBackoff{1000};
};

struct ClassifierConfig {
    std::string url = "http://localhost:11434/api/generate";
    std::string model = "qwen3-vl:2b";
    double inferenceHz = 2.0;
    std::chrono::milliseconds cooldown{2000};
    std::chrono::milliseconds frameWait{2000};
    int jpegQuality = 80;
};

struct ApiConfig {
    bool enabled = true;
    // Empty means $XDG_RUNTIME_DIR/matchwatch.sock.
    std::string socketName;
};

// Everything the pipeline needs, injected at construction. No component reads
// process-wide defaults on its own.
struct WatchConfig {
    StateSourceConfig state;
    PollerConfig poller;
    DetectorConfig detector;
    HistoryConfig history;
    VisionConfig vision;
    ClassifierConfig classifier;
    ApiConfig api;
    bool trace = false;
};

WatchConfig defaultConfig();
QString defaultHistoryFilePath();

// Each layer overrides the previous one: defaults, file, environment, command line.
void applyConfigJson(WatchConfig &config, const nlohmann::json &root);
void applyConfigFile(WatchConfig &config, const QString &path);
void applyEnvironment(WatchConfig &config);

void addCommandLineOptions(QCommandLineParser &parser);
void applyCommandLine(WatchConfig &config, const QCommandLineParser &parser);

// Throws ConfigError describing the first invalid field.
void validateConfig(const WatchConfig &config);

// Full resolution chain for the daemon. Throws ConfigError.
WatchConfig loadConfig(const QCommandLineParser &parser);

} // namespace matchwatch
