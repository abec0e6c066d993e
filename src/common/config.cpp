#include "common/config.hpp"

#include <QCommandLineParser>
#include <QDir>
#include <QFile>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace matchwatch {

namespace {

CaptureRegion regionFromJson(const nlohmann::json &j, const CaptureRegion &fallback)
{
    if (!j.is_object()) {
        throw ConfigError("capture region must be an object");
    }
    CaptureRegion region = fallback;
    region.top = j.value("top", fallback.top);
    region.left = j.value("left", fallback.left);
    region.width = j.value("width", fallback.width);
    region.height = j.value("height", fallback.height);
    return region;
}

std::chrono::milliseconds millisValue(const nlohmann::json &j, const char *key,
                                      std::chrono::milliseconds fallback)
{
    if (!j.contains(key)) {
        return fallback;
    }
    if (!j.at(key).is_number_integer()) {
        throw ConfigError(std::string(key) + " must be an integer number of milliseconds");
    }
    return std::chrono::milliseconds(j.at(key).get<long long>());
}

long long parseInteger(const QCommandLineParser &parser, const QString &name)
{
    bool ok = false;
    const long long value = parser.value(name).toLongLong(&ok);
    if (!ok) {
        throw ConfigError("--" + name.toStdString() + " expects an integer");
    }
    return value;
}

double parseDouble(const QCommandLineParser &parser, const QString &name)
{
    bool ok = false;
    const double value = parser.value(name).toDouble(&ok);
    if (!ok) {
        throw ConfigError("--" + name.toStdString() + " expects a number");
    }
    return value;
}

void validateRegion(const CaptureRegion &region, const char *name)
{
    if (region.width <= 0 || region.height <= 0) {
        throw ConfigError(std::string(name) + " region needs a positive width and height");
    }
    if (region.top < 0 || region.left < 0) {
        throw ConfigError(std::string(name) + " region must not start off screen");
    }
}

} // namespace

QString defaultHistoryFilePath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/matchwatch/history.json");
    }
    return home + QStringLiteral("/.local/share/matchwatch/history.json");
}

WatchConfig defaultConfig()
{
    WatchConfig config;
    config.history.filePath = defaultHistoryFilePath().toStdString();
    return config;
}

void applyConfigJson(WatchConfig &config, const nlohmann::json &root)
{
    if (!root.is_object()) {
        throw ConfigError("config root must be a JSON object");
    }

    try {
        if (root.contains("state")) {
            const auto &state = root.at("state");
            config.state.seriesId = state.value("series_id", config.state.seriesId);
            config.state.apiKey = state.value("api_key", config.state.apiKey);
            config.state.url = state.value("url", config.state.url);
            config.state.playerType = state.value("player_type", config.state.playerType);
            config.state.inventoryField =
                state.value("inventory_field", config.state.inventoryField);
            config.state.requestTimeout =
                millisValue(state, "request_timeout_ms", config.state.requestTimeout);
        }

        if (root.contains("poller")) {
            const auto &poller = root.at("poller");
            config.poller.pollInterval =
                millisValue(poller, "interval_ms", config.poller.pollInterval);
            config.poller.errorBackoff =
                millisValue(poller, "error_backoff_ms", config.poller.errorBackoff);
        }

        if (root.contains("detector")) {
            const auto &detector = root.at("detector");
            if (detector.contains("premium_weapons")) {
                config.detector.premiumWeapons =
                    detector.at("premium_weapons").get<std::set<std::string>>();
            }
        }

        if (root.contains("history")) {
            const auto &history = root.at("history");
            config.history.windowSize =
                history.value("window_size", config.history.windowSize);
            config.history.filePath = history.value("file", config.history.filePath);
        }

        if (root.contains("vision")) {
            const auto &vision = root.at("vision");
            config.vision.enabled = vision.value("enabled", config.vision.enabled);
            if (vision.contains("kill_feed")) {
                config.vision.killFeed =
                    regionFromJson(vision.at("kill_feed"), config.vision.killFeed);
            }
            if (vision.contains("round_end")) {
                config.vision.roundEnd =
                    regionFromJson(vision.at("round_end"), config.vision.roundEnd);
            }
            config.vision.scaleFactor =
                vision.value("scale_factor", config.vision.scaleFactor);
            config.vision.captureDelay =
                millisValue(vision, "capture_delay_ms", config.vision.captureDelay);
        }

        if (root.contains("classifier")) {
            const auto &classifier = root.at("classifier");
            config.classifier.url = classifier.value("url", config.classifier.url);
            config.classifier.model = classifier.value("model", config.classifier.model);
            config.classifier.inferenceHz =
                classifier.value("inference_hz", config.classifier.inferenceHz);
            config.classifier.cooldown =
                millisValue(classifier, "cooldown_ms", config.classifier.cooldown);
            config.classifier.jpegQuality =
                classifier.value("jpeg_quality", config.classifier.jpegQuality);
        }

        if (root.contains("api")) {
            const auto &api = root.at("api");
            config.api.enabled = api.value("enabled", config.api.enabled);
            config.api.socketName = api.value("socket", config.api.socketName);
        }
    } catch (const nlohmann::json::exception &ex) {
        throw ConfigError(std::string("invalid config value: ") + ex.what());
    }
}

void applyConfigFile(WatchConfig &config, const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw ConfigError("cannot open config file " + path.toStdString());
    }

    const auto parsed = nlohmann::json::parse(file.readAll().toStdString(), nullptr, false);
    if (parsed.is_discarded()) {
        throw ConfigError("config file " + path.toStdString() + " is not valid JSON");
    }
    applyConfigJson(config, parsed);
}

void applyEnvironment(WatchConfig &config)
{
    const QString seriesId = qEnvironmentVariable("MATCHWATCH_SERIES_ID");
    if (!seriesId.isEmpty()) {
        config.state.seriesId = seriesId.trimmed().toStdString();
    }
    const QString apiKey = qEnvironmentVariable("MATCHWATCH_API_KEY");
    if (!apiKey.isEmpty()) {
        config.state.apiKey = apiKey.trimmed().toStdString();
    }
    const QString stateUrl = qEnvironmentVariable("MATCHWATCH_STATE_URL");
    if (!stateUrl.isEmpty()) {
        config.state.url = stateUrl.toStdString();
    }
    const QString classifierUrl = qEnvironmentVariable("MATCHWATCH_CLASSIFIER_URL");
    if (!classifierUrl.isEmpty()) {
        config.classifier.url = classifierUrl.toStdString();
    }
    const QString classifierModel = qEnvironmentVariable("MATCHWATCH_CLASSIFIER_MODEL");
    if (!classifierModel.isEmpty()) {
        config.classifier.model = classifierModel.toStdString();
    }
    if (qEnvironmentVariableIntValue("MATCHWATCH_TRACE") == 1) {
        config.trace = true;
    }
}

void addCommandLineOptions(QCommandLineParser &parser)
{
    parser.addOptions({
        {QStringLiteral("config"), QStringLiteral("JSON configuration file."), QStringLiteral("path")},
        {QStringLiteral("series-id"), QStringLiteral("Series to monitor."), QStringLiteral("id")},
        {QStringLiteral("api-key"), QStringLiteral("State service API key."), QStringLiteral("key")},
        {QStringLiteral("poll-interval-ms"), QStringLiteral("State poll interval."), QStringLiteral("ms")},
        {QStringLiteral("inference-hz"), QStringLiteral("Visual classification frequency."), QStringLiteral("hz")},
        {QStringLiteral("cooldown-ms"), QStringLiteral("Repeat suppression for visual events."), QStringLiteral("ms")},
        {QStringLiteral("history-size"), QStringLiteral("Snapshots kept in the rolling window."), QStringLiteral("count")},
        {QStringLiteral("history-file"), QStringLiteral("Persisted history location."), QStringLiteral("path")},
        {QStringLiteral("scale-factor"), QStringLiteral("Downscale applied to the composite frame."), QStringLiteral("factor")},
        {QStringLiteral("no-vision"), QStringLiteral("Disable the screen capture channel.")},
        {QStringLiteral("trace"), QStringLiteral("Enable verbose trace logging.")},
    });
}

void applyCommandLine(WatchConfig &config, const QCommandLineParser &parser)
{
    if (parser.isSet(QStringLiteral("series-id"))) {
        config.state.seriesId = parser.value(QStringLiteral("series-id")).trimmed().toStdString();
    }
    if (parser.isSet(QStringLiteral("api-key"))) {
        config.state.apiKey = parser.value(QStringLiteral("api-key")).trimmed().toStdString();
    }
    if (parser.isSet(QStringLiteral("poll-interval-ms"))) {
        config.poller.pollInterval =
            std::chrono::milliseconds(parseInteger(parser, QStringLiteral("poll-interval-ms")));
    }
    if (parser.isSet(QStringLiteral("inference-hz"))) {
        config.classifier.inferenceHz = parseDouble(parser, QStringLiteral("inference-hz"));
    }
    if (parser.isSet(QStringLiteral("cooldown-ms"))) {
        config.classifier.cooldown =
            std::chrono::milliseconds(parseInteger(parser, QStringLiteral("cooldown-ms")));
    }
    if (parser.isSet(QStringLiteral("history-size"))) {
        const long long size = parseInteger(parser, QStringLiteral("history-size"));
        if (size < 1) {
            throw ConfigError("--history-size must be at least 1");
        }
        config.history.windowSize = static_cast<std::size_t>(size);
    }
    if (parser.isSet(QStringLiteral("history-file"))) {
        config.history.filePath = parser.value(QStringLiteral("history-file")).toStdString();
    }
    if (parser.isSet(QStringLiteral("scale-factor"))) {
        config.vision.scaleFactor = parseDouble(parser, QStringLiteral("scale-factor"));
    }
    if (parser.isSet(QStringLiteral("no-vision"))) {
        config.vision.enabled = false;
    }
    if (parser.isSet(QStringLiteral("trace"))) {
        config.trace = true;
    }
}

void validateConfig(const WatchConfig &config)
{
    if (config.state.seriesId.empty()) {
        throw ConfigError("a series id is required (--series-id or MATCHWATCH_SERIES_ID)");
    }
    if (config.state.url.empty()) {
        throw ConfigError("state service url must not be empty");
    }
    if (config.state.requestTimeout.count() <= 0) {
        throw ConfigError("state request timeout must be positive");
    }
    if (config.poller.pollInterval.count() <= 0) {
        throw ConfigError("poll interval must be positive");
    }
    if (config.poller.errorBackoff.count() < 0) {
        throw ConfigError("poll error backoff must not be negative");
    }
    if (config.history.windowSize < 1) {
        throw ConfigError("history window must hold at least one snapshot");
    }
    if (config.history.filePath.empty()) {
        throw ConfigError("history file path must not be empty");
    }

    if (config.vision.enabled) {
        validateRegion(config.vision.killFeed, "kill feed");
        validateRegion(config.vision.roundEnd, "round end");
        if (!(config.vision.scaleFactor > 0.0 && config.vision.scaleFactor <= 1.0)) {
            throw ConfigError("scale factor must be in (0, 1]");
        }
        if (config.vision.captureDelay.count() < 0) {
            throw ConfigError("capture delay must not be negative");
        }
        if (!(config.classifier.inferenceHz > 0.0)) {
            throw ConfigError("inference frequency must be positive");
        }
        if (config.classifier.cooldown.count() < 0) {
            throw ConfigError("event cooldown must not be negative");
        }
        if (config.classifier.jpegQuality < 1 || config.classifier.jpegQuality > 100) {
            throw ConfigError("jpeg quality must be within 1..100");
        }
        if (config.classifier.url.empty()) {
            throw ConfigError("classifier url must not be empty");
        }
    }
}

WatchConfig loadConfig(const QCommandLineParser &parser)
{
    WatchConfig config = defaultConfig();

    QString configPath = parser.value(QStringLiteral("config"));
    if (configPath.isEmpty()) {
        configPath = qEnvironmentVariable("MATCHWATCH_CONFIG");
    }
    if (!configPath.isEmpty()) {
        applyConfigFile(config, configPath);
    }

    applyEnvironment(config);
    applyCommandLine(config, parser);
    validateConfig(config);

    MWLOG_DEBUG(QStringLiteral("Config"),
                QStringLiteral("loadConfig"),
                QStringLiteral("config_resolved"),
                QStringLiteral("startup"),
                QStringLiteral("defaults_file_env_cli"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"seriesId", config.state.seriesId},
                                {"configFile", configPath.toStdString()},
                                {"pollIntervalMs", config.poller.pollInterval.count()},
                                {"visionEnabled", config.vision.enabled},
                                {"historyFile", config.history.filePath}}));
    return config;
}

} // namespace matchwatch
