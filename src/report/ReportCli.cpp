#include "report/ReportCli.hpp"

#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"
#include "daemon/history_store.hpp"
#include "daemon/snapshot_summary.hpp"

namespace matchwatch {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  matchwatch-report history [--file PATH] [--format markdown|json|text]\n"
        "  matchwatch-report summary [--file PATH] [--format markdown|json]\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

QString getHistoryFile(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--file"));
    if (value.isEmpty()) {
        return defaultHistoryFilePath();
    }
    return value;
}

std::string weaponText(const std::optional<std::string> &weapon)
{
    return weapon.value_or("-");
}

struct GameSummary {
    std::string seriesId;
    std::string gameId;
    std::size_t entries = 0;
    std::chrono::system_clock::time_point first;
    std::chrono::system_clock::time_point last;
    std::size_t players = 0;
    std::size_t aliveAtLast = 0;
    std::size_t deaths = 0;
    std::size_t weaponChanges = 0;
};

// Entries are grouped by game in file order. Transitions are only counted
// between consecutive entries of the same game.
std::vector<GameSummary> summarize(const std::vector<HistoryEntry> &entries)
{
    std::vector<GameSummary> games;
    std::map<std::string, std::size_t> indexByGame;
    std::map<std::string, const HistoryEntry *> previousByGame;

    for (const auto &entry : entries) {
        const std::string key = entry.seriesId + "/" + entry.gameId;
        auto found = indexByGame.find(key);
        if (found == indexByGame.end()) {
            GameSummary summary;
            summary.seriesId = entry.seriesId;
            summary.gameId = entry.gameId;
            summary.first = entry.timestamp;
            games.push_back(summary);
            found = indexByGame.emplace(key, games.size() - 1).first;
        }

        GameSummary &summary = games[found->second];
        ++summary.entries;
        summary.last = entry.timestamp;
        summary.players = entry.players.size();
        summary.aliveAtLast = 0;
        for (const auto &[id, record] : entry.players) {
            if (record.alive) {
                ++summary.aliveAtLast;
            }
        }

        const auto previous = previousByGame.find(key);
        if (previous != previousByGame.end()) {
            for (const auto &[id, record] : entry.players) {
                const auto before = previous->second->players.find(id);
                if (before == previous->second->players.end()) {
                    continue;
                }
                if (before->second.alive && !record.alive) {
                    ++summary.deaths;
                }
                if (record.weapon.has_value() && !record.weapon->empty()
                    && record.weapon != before->second.weapon) {
                    ++summary.weaponChanges;
                }
            }
        }
        previousByGame[key] = &entry;
    }
    return games;
}

void renderHistoryMarkdown(const std::vector<HistoryEntry> &entries, const QString &path)
{
    std::cout << "# Matchwatch History Report\n\n";
    std::cout << "File: " << path.toStdString() << "\n";
    std::cout << "Total snapshots: " << entries.size() << "\n\n";
    std::cout << "## Snapshots\n\n";

    if (entries.empty()) {
        std::cout << "No snapshots recorded.\n";
        return;
    }

    for (std::size_t i = 0; i < entries.size(); ++i) {
        const HistoryEntry &entry = entries[i];
        std::cout << "### " << i << ". " << toIso8601Utc(entry.timestamp)
                  << " (game " << entry.gameId << ")\n\n";
        std::cout << "| Player | Alive | HP | Weapon |\n";
        std::cout << "|---|---|---|---|\n";
        for (const auto &[id, record] : entry.players) {
            std::cout << "| " << id << " | " << (record.alive ? "yes" : "no") << " | "
                      << record.hpBucket << " | " << weaponText(record.weapon) << " |\n";
        }
        std::cout << "\n";
    }
}

void renderHistoryJson(const std::vector<HistoryEntry> &entries, const QString &path)
{
    nlohmann::json payload;
    payload["file"] = path.toStdString();
    payload["totalEntries"] = entries.size();
    payload["entries"] = entries;

    std::cout << payload.dump(2) << std::endl;
}

void renderSummaryMarkdown(const std::vector<GameSummary> &games, std::size_t totalEntries)
{
    std::cout << "# Matchwatch Summary Report\n\n";
    std::cout << "Total snapshots: " << totalEntries << "\n";
    std::cout << "Games: " << games.size() << "\n\n";

    if (games.empty()) {
        std::cout << "No snapshots recorded.\n";
        return;
    }

    for (const auto &game : games) {
        std::cout << "## Game " << game.gameId << " (series " << game.seriesId << ")\n\n";
        std::cout << "- Snapshots: " << game.entries << "\n";
        std::cout << "- Period: " << toIso8601Utc(game.first) << " -> "
                  << toIso8601Utc(game.last) << "\n";
        std::cout << "- Alive at last snapshot: " << game.aliveAtLast << "/" << game.players
                  << "\n";
        std::cout << "- Deaths observed: " << game.deaths << "\n";
        std::cout << "- Weapon changes observed: " << game.weaponChanges << "\n\n";
    }
}

void renderSummaryJson(const std::vector<GameSummary> &games, std::size_t totalEntries)
{
    nlohmann::json payload;
    payload["totalEntries"] = totalEntries;
    payload["games"] = nlohmann::json::array();
    for (const auto &game : games) {
        payload["games"].push_back({
            {"seriesId", game.seriesId},
            {"gameId", game.gameId},
            {"entries", game.entries},
            {"first", toIso8601Utc(game.first)},
            {"last", toIso8601Utc(game.last)},
            {"players", game.players},
            {"aliveAtLast", game.aliveAtLast},
            {"deaths", game.deaths},
            {"weaponChanges", game.weaponChanges}
        });
    }

    std::cout << payload.dump(2) << std::endl;
}

} // namespace

int ReportCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    MWLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("run"),
               QStringLiteral("report_cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", command.toStdString()}}));
    if (command == QStringLiteral("history")) {
        return runHistoryReport(args);
    }
    if (command == QStringLiteral("summary")) {
        return runSummaryReport(args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int ReportCli::runHistoryReport(const QStringList &args)
{
    const QString format = getFormat(args);
    if (format != QStringLiteral("markdown") && format != QStringLiteral("json")
        && format != QStringLiteral("text")) {
        std::cerr << "Invalid format. Use markdown, json or text." << std::endl;
        return 1;
    }

    const QString path = getHistoryFile(args);
    std::string error;
    const auto entries = loadHistoryFile(path, &error);
    if (!entries.has_value()) {
        std::cerr << error << std::endl;
        return 1;
    }

    MWLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("runHistoryReport"),
               QStringLiteral("report_history"),
               QStringLiteral("user_invocation"),
               QStringLiteral("history_file"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"entries", entries->size()},
                               {"format", format.toStdString()}}));
    if (format == QStringLiteral("json")) {
        renderHistoryJson(*entries, path);
    } else if (format == QStringLiteral("text")) {
        std::cout << renderHistoryText(*entries);
    } else {
        renderHistoryMarkdown(*entries, path);
    }
    return 0;
}

int ReportCli::runSummaryReport(const QStringList &args)
{
    const QString format = getFormat(args);
    if (format != QStringLiteral("markdown") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    const QString path = getHistoryFile(args);
    std::string error;
    const auto entries = loadHistoryFile(path, &error);
    if (!entries.has_value()) {
        std::cerr << error << std::endl;
        return 1;
    }

    const auto games = summarize(*entries);
    MWLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("runSummaryReport"),
               QStringLiteral("report_summary"),
               QStringLiteral("user_invocation"),
               QStringLiteral("history_file"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"entries", entries->size()},
                               {"games", games.size()},
                               {"format", format.toStdString()}}));
    if (format == QStringLiteral("json")) {
        renderSummaryJson(games, entries->size());
    } else {
        renderSummaryMarkdown(games, entries->size());
    }
    return 0;
}

} // namespace matchwatch
