#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "report/ReportCli.hpp"
#include "daemon/history_store.hpp"

class ReportCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testHistoryJson();
    void testHistoryMarkdownAndText();
    void testSummaryJson();
    void testSummaryMarkdown();
    void testErrors();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    QString m_historyPath;

    int runCli(const QStringList &args, std::string &out);
};

namespace {

matchwatch::Snapshot makeSnapshot(const std::string &gameId, int second, bool bAlive,
                                  const std::string &bWeapon)
{
    matchwatch::Snapshot snapshot;
    snapshot.seriesId = "series-1";
    snapshot.gameId = gameId;
    snapshot.timestamp = std::chrono::system_clock::time_point{}
        + std::chrono::seconds(1700000000 + second);

    matchwatch::PlayerState a;
    a.id = "a";
    a.alive = true;
    a.hpBucket = matchwatch::HealthBucket::Full;
    snapshot.players["a"] = a;

    matchwatch::PlayerState b;
    b.id = "b";
    b.alive = bAlive;
    b.hpBucket = bAlive ? matchwatch::HealthBucket::Damaged : matchwatch::HealthBucket::Critical;
    b.weapon = bWeapon;
    snapshot.players["b"] = b;
    return snapshot;
}

} // namespace

void ReportCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());

    // Written to the default location so commands without --file find it.
    matchwatch::HistoryConfig config;
    config.filePath = matchwatch::defaultHistoryFilePath().toStdString();
    matchwatch::HistoryStore store(config);
    QVERIFY(store.append(makeSnapshot("game-1", 0, true, "Classic")));
    QVERIFY(store.append(makeSnapshot("game-1", 5, true, "Vandal")));
    QVERIFY(store.append(makeSnapshot("game-1", 10, false, "Vandal")));
    QVERIFY(store.append(makeSnapshot("game-2", 20, true, "Sheriff")));
    QCOMPARE(store.writeFailures(), static_cast<size_t>(0));
    m_historyPath = store.filePath();
}

void ReportCliTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

int ReportCliTests::runCli(const QStringList &args, std::string &out)
{
    std::stringstream buffer;
    auto *oldBuf = std::cout.rdbuf(buffer.rdbuf());
    auto *oldErr = std::cerr.rdbuf(buffer.rdbuf());

    matchwatch::ReportCli cli;
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : args) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }

    const int result = cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());

    std::cout.rdbuf(oldBuf);
    std::cerr.rdbuf(oldErr);
    out = buffer.str();
    return result;
}

void ReportCliTests::testHistoryJson()
{
    std::string output;
    const int code = runCli({"matchwatch-report", "history", "--format", "json"}, output);
    QCOMPARE(code, 0);

    const auto parsed = nlohmann::json::parse(output);
    QCOMPARE(parsed.at("totalEntries").get<int>(), 4);
    QCOMPARE(QString::fromStdString(parsed.at("file").get<std::string>()), m_historyPath);
    const auto &entries = parsed.at("entries");
    QCOMPARE(entries.size(), static_cast<size_t>(4));
    QCOMPARE(QString::fromStdString(entries.at(3).at("game_id").get<std::string>()),
             QStringLiteral("game-2"));
}

void ReportCliTests::testHistoryMarkdownAndText()
{
    std::string output;
    QCOMPARE(runCli({"matchwatch-report", "history", "--file", m_historyPath}, output), 0);
    const QString markdown = QString::fromStdString(output);
    QVERIFY(markdown.startsWith(QStringLiteral("# Matchwatch History Report")));
    QVERIFY(markdown.contains(QStringLiteral("| Player | Alive | HP | Weapon |")));
    QVERIFY(markdown.contains(QStringLiteral("2023-11-14T22:13:30.000Z")));

    QCOMPARE(runCli({"matchwatch-report", "history", "--format", "text"}, output), 0);
    const QString text = QString::fromStdString(output);
    QVERIFY(text.startsWith(QStringLiteral("Snapshot 0 (2023-11-14T22:13:20.000Z):")));
    QVERIFY(text.contains(QStringLiteral("  - b: HP=critical, Weapon=Vandal, Alive=false")));
}

void ReportCliTests::testSummaryJson()
{
    std::string output;
    QCOMPARE(runCli({"matchwatch-report", "summary", "--format", "JSON"}, output), 0);

    const auto parsed = nlohmann::json::parse(output);
    QCOMPARE(parsed.at("totalEntries").get<int>(), 4);
    const auto &games = parsed.at("games");
    QCOMPARE(games.size(), static_cast<size_t>(2));

    const auto &first = games.at(0);
    QCOMPARE(QString::fromStdString(first.at("gameId").get<std::string>()), QStringLiteral("game-1"));
    QCOMPARE(first.at("entries").get<int>(), 3);
    QCOMPARE(first.at("deaths").get<int>(), 1);
    QCOMPARE(first.at("weaponChanges").get<int>(), 1);
    QCOMPARE(first.at("aliveAtLast").get<int>(), 1);
    QCOMPARE(first.at("players").get<int>(), 2);
    QCOMPARE(QString::fromStdString(first.at("first").get<std::string>()),
             QStringLiteral("2023-11-14T22:13:20.000Z"));

    QCOMPARE(games.at(1).at("entries").get<int>(), 1);
    QCOMPARE(games.at(1).at("deaths").get<int>(), 0);
}

void ReportCliTests::testSummaryMarkdown()
{
    std::string output;
    QCOMPARE(runCli({"matchwatch-report", "summary"}, output), 0);
    const QString markdown = QString::fromStdString(output);
    QVERIFY(markdown.startsWith(QStringLiteral("# Matchwatch Summary Report")));
    QVERIFY(markdown.contains(QStringLiteral("## Game game-1 (series series-1)")));
    QVERIFY(markdown.contains(QStringLiteral("- Deaths observed: 1")));
}

void ReportCliTests::testErrors()
{
    std::string output;
    QCOMPARE(runCli({"matchwatch-report"}, output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("Usage:")));

    QCOMPARE(runCli({"matchwatch-report", "timeline"}, output), 1);
    QCOMPARE(runCli({"matchwatch-report", "history", "--format", "yaml"}, output), 1);
    QCOMPARE(runCli({"matchwatch-report", "summary", "--format", "text"}, output), 1);

    const QString missing = m_tempDir.filePath(QStringLiteral("nope.json"));
    QCOMPARE(runCli({"matchwatch-report", "history", "--file", missing}, output), 1);
    QVERIFY(QString::fromStdString(output).contains(QStringLiteral("not found")));
}

QTEST_GUILESS_MAIN(ReportCliTests)
#include "test_report_cli.moc"
