#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>

#include "common/cancellation_token.hpp"
#include "daemon/history_store.hpp"
#include "daemon/state_poller.hpp"
#include "daemon/tactical_event_detector.hpp"

namespace {

using Step = std::function<std::optional<matchwatch::Snapshot>()>;

// Replays a scripted sequence of fetch outcomes, then keeps returning nothing.
class ScriptedFetcher : public matchwatch::StateFetcher
{
public:
    explicit ScriptedFetcher(std::deque<Step> steps)
        : m_steps(std::move(steps))
    {
    }

    std::optional<matchwatch::Snapshot> fetchSnapshot(const std::string &seriesId) override
    {
        Step step;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_calls;
            lastSeriesId = seriesId;
            if (m_steps.empty()) {
                return std::nullopt;
            }
            step = std::move(m_steps.front());
            m_steps.pop_front();
        }
        return step();
    }

    std::size_t calls() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

    std::string lastSeriesId;

private:
    mutable std::mutex m_mutex;
    std::deque<Step> m_steps;
    std::size_t m_calls = 0;
};

matchwatch::PlayerState makePlayer(const std::string &id, const std::string &team, bool alive,
                                   std::optional<std::string> weapon = std::nullopt)
{
    matchwatch::PlayerState player;
    player.id = id;
    player.name = id;
    player.teamName = team;
    player.alive = alive;
    player.weapon = std::move(weapon);
    player.position.region = "R4C4";
    player.position.quadrant = "NE";
    return player;
}

matchwatch::Snapshot makeSnapshot(const std::vector<matchwatch::PlayerState> &players)
{
    matchwatch::Snapshot snapshot;
    snapshot.seriesId = "series-7";
    snapshot.gameId = "game-1";
    snapshot.timestamp = std::chrono::system_clock::now();
    for (const auto &player : players) {
        snapshot.players[player.id] = player;
    }
    return snapshot;
}

Step returns(const matchwatch::Snapshot &snapshot)
{
    return [snapshot]() { return std::optional<matchwatch::Snapshot>(snapshot); };
}

Step nothing()
{
    return []() { return std::optional<matchwatch::Snapshot>(); };
}

Step throws()
{
    return []() -> std::optional<matchwatch::Snapshot> {
        throw std::runtime_error("connection reset");
    };
}

} // namespace

class StatePollerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void testAcceptedTickUpdatesPipeline();
    void testEmptyFetchKeepsPrevious();
    void testExceptionMarksTickFailed();
    void testPollSequence();
    void testLoopSurvivesFailuresAndStops();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    int m_case = 0;

    matchwatch::PollerConfig fastConfig() const;
    matchwatch::HistoryConfig historyConfig();
};

void StatePollerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void StatePollerTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void StatePollerTests::init()
{
    ++m_case;
}

matchwatch::PollerConfig StatePollerTests::fastConfig() const
{
    matchwatch::PollerConfig config;
    config.pollInterval = std::chrono::milliseconds(5);
    config.errorBackoff = std::chrono::milliseconds(5);
    return config;
}

matchwatch::HistoryConfig StatePollerTests::historyConfig()
{
    matchwatch::HistoryConfig config;
    config.filePath = m_tempDir.filePath(QStringLiteral("history-%1.json").arg(m_case)).toStdString();
    return config;
}

void StatePollerTests::testAcceptedTickUpdatesPipeline()
{
    ScriptedFetcher fetcher({returns(makeSnapshot({makePlayer("a", "Alpha", true)}))});
    matchwatch::TacticalEventDetector detector(matchwatch::DetectorConfig{});
    matchwatch::HistoryStore history(historyConfig());
    matchwatch::CancellationToken token;
    matchwatch::StatePoller poller("series-7", fastConfig(), fetcher, detector, history, token);

    QCOMPARE(poller.runTick(), matchwatch::TickResult::Accepted);
    QCOMPARE(QString::fromStdString(fetcher.lastSeriesId), QStringLiteral("series-7"));
    QVERIFY(poller.previousSnapshot().has_value());
    QCOMPARE(history.size(), static_cast<size_t>(1));
    QCOMPARE(history.readPersisted().size(), static_cast<size_t>(1));
    QCOMPARE(poller.acceptedCount(), static_cast<size_t>(1));
}

void StatePollerTests::testEmptyFetchKeepsPrevious()
{
    ScriptedFetcher fetcher({
        returns(makeSnapshot({makePlayer("a", "Alpha", true), makePlayer("b", "Bravo", true)})),
        nothing(),
        returns(makeSnapshot({}))
    });
    matchwatch::TacticalEventDetector detector(matchwatch::DetectorConfig{});
    matchwatch::HistoryStore history(historyConfig());
    matchwatch::CancellationToken token;
    matchwatch::StatePoller poller("series-7", fastConfig(), fetcher, detector, history, token);

    QCOMPARE(poller.runTick(), matchwatch::TickResult::Accepted);
    QCOMPARE(poller.runTick(), matchwatch::TickResult::Skipped);
    QCOMPARE(poller.runTick(), matchwatch::TickResult::Skipped);

    QVERIFY(poller.previousSnapshot().has_value());
    QCOMPARE(poller.previousSnapshot()->players.size(), static_cast<size_t>(2));
    QCOMPARE(history.size(), static_cast<size_t>(1));
    QCOMPARE(poller.skippedCount(), static_cast<size_t>(2));
}

void StatePollerTests::testExceptionMarksTickFailed()
{
    ScriptedFetcher fetcher({throws(), returns(makeSnapshot({makePlayer("a", "Alpha", true)}))});
    matchwatch::TacticalEventDetector detector(matchwatch::DetectorConfig{});
    matchwatch::HistoryStore history(historyConfig());
    matchwatch::CancellationToken token;
    matchwatch::StatePoller poller("series-7", fastConfig(), fetcher, detector, history, token);

    QCOMPARE(poller.runTick(), matchwatch::TickResult::Failed);
    QVERIFY(!poller.previousSnapshot().has_value());
    QCOMPARE(poller.runTick(), matchwatch::TickResult::Accepted);
    QCOMPARE(poller.failedCount(), static_cast<size_t>(1));
}

void StatePollerTests::testPollSequence()
{
    // Four players; one dies between the first two polls, a premium weapon
    // appears on the third, the fourth poll returns nothing.
    const auto s1 = makeSnapshot({makePlayer("a", "Alpha", true, std::string("Classic")),
                                  makePlayer("b", "Alpha", true),
                                  makePlayer("c", "Bravo", true),
                                  makePlayer("d", "Bravo", true)});
    const auto s2 = makeSnapshot({makePlayer("a", "Alpha", true, std::string("Classic")),
                                  makePlayer("b", "Alpha", true),
                                  makePlayer("c", "Bravo", false),
                                  makePlayer("d", "Bravo", true)});
    const auto s3 = makeSnapshot({makePlayer("a", "Alpha", true, std::string("Vandal")),
                                  makePlayer("b", "Alpha", true),
                                  makePlayer("c", "Bravo", false),
                                  makePlayer("d", "Bravo", false)});

    ScriptedFetcher fetcher({returns(s1), returns(s2), returns(s3), nothing()});
    matchwatch::TacticalEventDetector detector(matchwatch::DetectorConfig{});
    matchwatch::HistoryStore history(historyConfig());
    matchwatch::CancellationToken token;
    matchwatch::StatePoller poller("series-7", fastConfig(), fetcher, detector, history, token);

    QCOMPARE(poller.runTick(), matchwatch::TickResult::Accepted);
    QVERIFY(detector.tacticalConclusions().empty());

    QCOMPARE(poller.runTick(), matchwatch::TickResult::Accepted);
    QCOMPARE(detector.eventLogSize(), static_cast<size_t>(1));

    QCOMPARE(poller.runTick(), matchwatch::TickResult::Accepted);
    // The second death is not a first death.
    QCOMPARE(detector.eventLogSize(), static_cast<size_t>(1));

    QCOMPARE(poller.runTick(), matchwatch::TickResult::Skipped);

    const auto conclusions = detector.tacticalConclusions();
    QCOMPARE(conclusions.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(conclusions[0]),
             QStringLiteral("Entry engagement lost by Bravo at R4C4."));
    QCOMPARE(QString::fromStdString(conclusions[1]),
             QStringLiteral("a upgraded to Vandal. Strength increased."));
    QCOMPARE(history.size(), static_cast<size_t>(3));
    QCOMPARE(history.readPersisted().size(), static_cast<size_t>(3));
}

void StatePollerTests::testLoopSurvivesFailuresAndStops()
{
    ScriptedFetcher fetcher({throws(), throws(), nothing(),
                             returns(makeSnapshot({makePlayer("a", "Alpha", true)}))});
    matchwatch::TacticalEventDetector detector(matchwatch::DetectorConfig{});
    matchwatch::HistoryStore history(historyConfig());
    matchwatch::CancellationToken token;
    matchwatch::StatePoller poller("series-7", fastConfig(), fetcher, detector, history, token);

    poller.start();
    QVERIFY(QTest::qWaitFor([&]() { return poller.acceptedCount() == 1; }, 5000));
    QVERIFY(poller.isRunning());
    QCOMPARE(poller.failedCount(), static_cast<size_t>(2));

    token.requestStop();
    poller.wait();
    QVERIFY(!poller.isRunning());
    QVERIFY(fetcher.calls() >= 4);
    QCOMPARE(history.size(), static_cast<size_t>(1));
}

QTEST_GUILESS_MAIN(StatePollerTests)
#include "test_state_poller.moc"
