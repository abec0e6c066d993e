#include "daemon/series_state_parser.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <tuple>
#include <vector>

#include "daemon/region_grid.hpp"

namespace matchwatch {

namespace {

constexpr const char *kValorantTeamType = "GameTeamStateValorant";

std::optional<double> toNumber(const nlohmann::json &value)
{
    if (value.is_number()) {
        const double number = value.get<double>();
        if (!std::isfinite(number)) {
            return std::nullopt;
        }
        return number;
    }
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        if (text.empty()) {
            return std::nullopt;
        }
        try {
            std::size_t consumed = 0;
            const double parsed = std::stod(text, &consumed);
            // stod accepts "nan" and "inf"; neither is a usable field value.
            if (consumed != text.size() || !std::isfinite(parsed)) {
                return std::nullopt;
            }
            return parsed;
        } catch (const std::exception &) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<double> numberField(const nlohmann::json &object, const char *key)
{
    if (!object.is_object() || !object.contains(key)) {
        return std::nullopt;
    }
    return toNumber(object.at(key));
}

long long integerField(const nlohmann::json &object, const char *key)
{
    const auto value = numberField(object, key);
    if (!value.has_value()) {
        return 0;
    }
    constexpr double kMin = static_cast<double>(std::numeric_limits<long long>::min());
    // The largest double strictly below 2^63.
    constexpr double kMax = 9223372036854774784.0;
    return static_cast<long long>(std::min(std::max(*value, kMin), kMax));
}

std::string stringField(const nlohmann::json &object, const char *key)
{
    if (!object.is_object() || !object.contains(key) || !object.at(key).is_string()) {
        return {};
    }
    return object.at(key).get<std::string>();
}

std::string trimmed(const std::string &value)
{
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

bool isValorantTeam(const nlohmann::json &team)
{
    return team.is_object() && stringField(team, "__typename") == kValorantTeamType;
}

const nlohmann::json &arrayField(const nlohmann::json &object, const char *key)
{
    static const nlohmann::json empty = nlohmann::json::array();
    if (!object.is_object() || !object.contains(key) || !object.at(key).is_array()) {
        return empty;
    }
    return object.at(key);
}

std::optional<Coordinate> playerCoordinate(const nlohmann::json &player)
{
    if (!player.contains("position") || !player.at("position").is_object()) {
        return std::nullopt;
    }
    const auto &position = player.at("position");
    const auto x = numberField(position, "x");
    const auto y = numberField(position, "y");
    if (!x.has_value() || !y.has_value()) {
        return std::nullopt;
    }
    return Coordinate{*x, *y};
}

bool gameHasPlayers(const nlohmann::json &game)
{
    for (const auto &team : arrayField(game, "teams")) {
        if (isValorantTeam(team) && !arrayField(team, "players").empty()) {
            return true;
        }
    }
    return false;
}

} // namespace

std::string buildSeriesStateQuery(const std::string &playerType,
                                  const std::string &inventoryField)
{
    return "query MidRoundState($seriesId: ID!) {\n"
           "  seriesState(id: $seriesId) {\n"
           "    id\n"
           "    games {\n"
           "      id\n"
           "      teams {\n"
           "        __typename\n"
           "        ... on GameTeamStateValorant {\n"
           "          id\n"
           "          name\n"
           "          side\n"
           "          players {\n"
           "            __typename\n"
           "            ... on " + playerType + " {\n"
           "              id\n"
           "              name\n"
           "              alive\n"
           "              participationStatus\n"
           "              currentHealth\n"
           "              maxHealth\n"
           "              currentArmor\n"
           "              position { x y }\n"
           "              character { name }\n"
           "              " + inventoryField + " {\n"
           "                items { id name quantity equipped stashed }\n"
           "              }\n"
           "            }\n"
           "          }\n"
           "        }\n"
           "      }\n"
           "    }\n"
           "  }\n"
           "}\n";
}

std::optional<std::string> extractWeaponFromInventory(const nlohmann::json &inventory)
{
    const auto &items = arrayField(inventory, "items");
    if (items.empty()) {
        return std::nullopt;
    }

    std::optional<std::tuple<long long, long long, std::string>> best;
    std::optional<std::string> fallback;

    for (const auto &item : items) {
        if (!item.is_object()) {
            continue;
        }
        const std::string name = trimmed(stringField(item, "name"));
        if (name.empty()) {
            continue;
        }
        if (!fallback.has_value()) {
            fallback = name;
        }

        const long long equipped = integerField(item, "equipped");
        const long long quantity = integerField(item, "quantity");
        if (equipped > 0) {
            auto candidate = std::make_tuple(equipped, quantity, name);
            if (!best.has_value() || candidate > *best) {
                best = std::move(candidate);
            }
        }
    }

    if (best.has_value()) {
        return std::get<2>(*best);
    }
    return fallback;
}

std::optional<Snapshot> parseSeriesState(const nlohmann::json &seriesState,
                                         const std::string &inventoryField,
                                         std::chrono::system_clock::time_point capturedAt)
{
    if (!seriesState.is_object()) {
        return std::nullopt;
    }

    const nlohmann::json *game = nullptr;
    for (const auto &candidate : arrayField(seriesState, "games")) {
        if (gameHasPlayers(candidate)) {
            game = &candidate;
            break;
        }
    }
    if (!game) {
        return std::nullopt;
    }

    std::vector<Coordinate> coordinates;
    for (const auto &team : arrayField(*game, "teams")) {
        if (!isValorantTeam(team)) {
            continue;
        }
        for (const auto &player : arrayField(team, "players")) {
            if (auto coordinate = playerCoordinate(player)) {
                coordinates.push_back(*coordinate);
            }
        }
    }
    const auto bounds = computeBounds(coordinates);

    Snapshot snapshot;
    snapshot.seriesId = stringField(seriesState, "id");
    snapshot.gameId = stringField(*game, "id");
    snapshot.timestamp = capturedAt;

    for (const auto &team : arrayField(*game, "teams")) {
        if (!isValorantTeam(team)) {
            continue;
        }
        const std::string teamName = stringField(team, "name");
        const std::string side = stringField(team, "side");

        for (const auto &entry : arrayField(team, "players")) {
            if (!entry.is_object()) {
                continue;
            }

            PlayerState player;
            player.name = stringField(entry, "name");
            player.id = stringField(entry, "id");
            if (player.id.empty()) {
                player.id = player.name;
            }
            if (player.id.empty()) {
                continue;
            }
            player.teamName = teamName;
            player.side = side;
            if (entry.contains("character") && entry.at("character").is_object()) {
                player.agent = stringField(entry.at("character"), "name");
            }
            player.alive = entry.contains("alive") && entry.at("alive").is_boolean()
                && entry.at("alive").get<bool>();
            player.hpBucket = healthBucket(numberField(entry, "currentHealth"),
                                           numberField(entry, "maxHealth"));
            player.armorBucket = armorBucket(numberField(entry, "currentArmor"));

            std::optional<double> x;
            std::optional<double> y;
            if (const auto coordinate = playerCoordinate(entry)) {
                x = coordinate->x;
                y = coordinate->y;
            }
            player.position = regionLabels(x, y, bounds);

            if (entry.contains(inventoryField)) {
                player.weapon = extractWeaponFromInventory(entry.at(inventoryField));
            }

            const std::string id = player.id;
            snapshot.players[id] = std::move(player);
        }
    }

    if (snapshot.players.empty()) {
        return std::nullopt;
    }
    return snapshot;
}

} // namespace matchwatch
