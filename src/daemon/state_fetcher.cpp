#include "daemon/state_fetcher.hpp"

#include <chrono>
#include <utility>

#include "common/errors.hpp"
#include "common/http_utils.hpp"
#include "common/logging.hpp"
#include "daemon/series_state_parser.hpp"

namespace matchwatch {

namespace {

constexpr std::size_t kMaxErrorDetail = 500;

std::string truncated(const std::string &text)
{
    return text.size() > kMaxErrorDetail ? text.substr(0, kMaxErrorDetail) : text;
}

} // namespace

SeriesStateClient::SeriesStateClient(StateSourceConfig config)
    : m_config(std::move(config))
    , m_query(buildSeriesStateQuery(m_config.playerType, m_config.inventoryField))
{
}

nlohmann::json SeriesStateClient::requestSeriesState(const std::string &seriesId)
{
    const nlohmann::json payload{
        {"query", m_query},
        {"operationName", "MidRoundState"},
        {"variables", {{"seriesId", seriesId}}}
    };

    HttpResponse response;
    try {
        response = postJson(m_config.url,
                            QByteArray::fromStdString(payload.dump()),
                            {{"x-api-key", m_config.apiKey}},
                            m_config.requestTimeout);
    } catch (const std::runtime_error &ex) {
        throw FetchError(ex.what());
    }

    if (response.statusCode != 200) {
        throw FetchError("HTTP " + std::to_string(response.statusCode) + ": "
                         + truncated(response.body.toStdString()));
    }

    const auto parsed = nlohmann::json::parse(response.body.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw FetchError("invalid JSON in series-state response");
    }
    if (parsed.contains("errors") && parsed.at("errors").is_array()
        && !parsed.at("errors").empty()) {
        throw FetchError(truncated(parsed.at("errors").dump()));
    }

    const auto data = parsed.find("data");
    if (data == parsed.end() || !data->is_object() || !data->contains("seriesState")
        || !data->at("seriesState").is_object()) {
        throw FetchError("response has no seriesState");
    }
    return data->at("seriesState");
}

std::optional<Snapshot> SeriesStateClient::fetchSnapshot(const std::string &seriesId)
{
    nlohmann::json seriesState;
    try {
        seriesState = requestSeriesState(seriesId);
    } catch (const FetchError &ex) {
        MWLOG_WARN(QStringLiteral("SeriesStateClient"),
                   QStringLiteral("fetchSnapshot"),
                   QStringLiteral("series_state_failed"),
                   QStringLiteral("fetch_error"),
                   QStringLiteral("graphql"),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"seriesId", seriesId}, {"error", ex.what()}}));
        return std::nullopt;
    }

    auto snapshot = parseSeriesState(seriesState, m_config.inventoryField,
                                     std::chrono::system_clock::now());
    if (!snapshot.has_value()) {
        MWLOG_DEBUG(QStringLiteral("SeriesStateClient"),
                    QStringLiteral("fetchSnapshot"),
                    QStringLiteral("series_state_empty"),
                    QStringLiteral("no_players"),
                    QStringLiteral("graphql"),
                    logging::defaultWho(),
                    logging::currentCorrelationId(),
                    (nlohmann::json{{"seriesId", seriesId}}));
        return std::nullopt;
    }
    if (snapshot->seriesId.empty()) {
        snapshot->seriesId = seriesId;
    }
    return snapshot;
}

} // namespace matchwatch
