#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/models.hpp"

namespace matchwatch {

class StateFetcher
{
public:
    virtual ~StateFetcher() = default;

    // One request against the state source. std::nullopt means "no data this
    // tick" (transport failure, malformed payload or no players).
    virtual std::optional<Snapshot> fetchSnapshot(const std::string &seriesId) = 0;
};

/**
 * SeriesStateClient polls the live series-state GraphQL endpoint and
 * normalizes the first populated game into a Snapshot.
 */
class SeriesStateClient : public StateFetcher
{
public:
    explicit SeriesStateClient(StateSourceConfig config);

    std::optional<Snapshot> fetchSnapshot(const std::string &seriesId) override;

    const std::string &query() const { return m_query; }

private:
    // Returns the `seriesState` object. Throws FetchError.
    nlohmann::json requestSeriesState(const std::string &seriesId);

    StateSourceConfig m_config;
    std::string m_query;
};

} // namespace matchwatch
