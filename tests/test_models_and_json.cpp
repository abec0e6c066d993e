#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

class ModelsJsonTests : public QObject
{
    Q_OBJECT
private slots:
    void testTimestampFormat();
    void testSnapshotRoundTrip();
    void testTacticalEventRoundTrip();
    void testVisualEventRoundTrip();
    void testHistoryEntryProjection();
    void testMissingFieldsDefaults();

private:
    static qint64 toMillis(std::chrono::system_clock::time_point t)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            t.time_since_epoch()).count();
    }
};

void ModelsJsonTests::testTimestampFormat()
{
    const auto t = std::chrono::system_clock::time_point{} + std::chrono::milliseconds(1700000000123LL);
    QCOMPARE(QString::fromStdString(matchwatch::toIso8601Utc(t)),
             QStringLiteral("2023-11-14T22:13:20.123Z"));
    QCOMPARE(toMillis(matchwatch::fromIso8601Utc("2023-11-14T22:13:20.123Z")), toMillis(t));
    QCOMPARE(toMillis(matchwatch::fromIso8601Utc("2023-11-14T22:13:20Z")), 1700000000000LL);
    QCOMPARE(toMillis(matchwatch::fromIso8601Utc("garbage")), 0LL);
}

void ModelsJsonTests::testSnapshotRoundTrip()
{
    matchwatch::Snapshot snapshot;
    snapshot.seriesId = "series-1";
    snapshot.gameId = "game-3";
    snapshot.timestamp = std::chrono::system_clock::now();

    matchwatch::PlayerState player;
    player.id = "p1";
    player.name = "Ace";
    player.teamName = "Alpha";
    player.side = "attacker";
    player.agent = "sova";
    player.alive = true;
    player.hpBucket = matchwatch::HealthBucket::Damaged;
    player.armorBucket = matchwatch::ArmorBucket::Light;
    player.weapon = "Phantom";
    player.position.x = 120.5;
    player.position.y = -40.0;
    player.position.region = "R3C2";
    player.position.xBand = "B2";
    player.position.yBand = "B3";
    player.position.quadrant = "SW";
    snapshot.players[player.id] = player;

    nlohmann::json j = snapshot;
    QCOMPARE(QString::fromStdString(j.at("players").at("p1").at("hp_bucket").get<std::string>()),
             QStringLiteral("damaged"));
    QCOMPARE(QString::fromStdString(j.at("players").at("p1").at("position").at("region_rc").get<std::string>()),
             QStringLiteral("R3C2"));

    const auto parsed = j.get<matchwatch::Snapshot>();
    QCOMPARE(QString::fromStdString(parsed.gameId), QStringLiteral("game-3"));
    QCOMPARE(toMillis(parsed.timestamp), toMillis(snapshot.timestamp));
    const auto &back = parsed.players.at("p1");
    QCOMPARE(QString::fromStdString(back.teamName), QStringLiteral("Alpha"));
    QCOMPARE(back.hpBucket, matchwatch::HealthBucket::Damaged);
    QCOMPARE(back.armorBucket, matchwatch::ArmorBucket::Light);
    QCOMPARE(QString::fromStdString(*back.weapon), QStringLiteral("Phantom"));
    QCOMPARE(*back.position.x, 120.5);
    QCOMPARE(QString::fromStdString(back.position.yBand), QStringLiteral("B3"));
}

void ModelsJsonTests::testTacticalEventRoundTrip()
{
    matchwatch::TacticalEvent event;
    event.eventType = "FIRST_DEATH";
    event.timestamp = std::chrono::system_clock::now();
    event.description = "First death of the round: Ace (Alpha)";
    event.metadata = {{"player", "Ace"}, {"team", "Alpha"}};

    nlohmann::json j = event;
    QCOMPARE(QString::fromStdString(j.at("event_type").get<std::string>()), QStringLiteral("FIRST_DEATH"));

    const auto parsed = j.get<matchwatch::TacticalEvent>();
    QCOMPARE(QString::fromStdString(parsed.description), QString::fromStdString(event.description));
    QCOMPARE(parsed.metadata.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(parsed.metadata.at("team")), QStringLiteral("Alpha"));
}

void ModelsJsonTests::testVisualEventRoundTrip()
{
    matchwatch::VisualEvent event;
    event.label = matchwatch::VisualLabel::RoundEnd;
    event.timestamp = std::chrono::system_clock::now();
    event.detail = "ROUND_END";

    nlohmann::json j = event;
    QCOMPARE(QString::fromStdString(j.at("label").get<std::string>()), QStringLiteral("ROUND_END"));
    QCOMPARE(j.get<matchwatch::VisualEvent>().label, matchwatch::VisualLabel::RoundEnd);

    nlohmann::json error = {{"label", "ERROR"}, {"detail", "ERROR: timeout"}};
    QCOMPARE(error.get<matchwatch::VisualEvent>().label, matchwatch::VisualLabel::Error);
}

void ModelsJsonTests::testHistoryEntryProjection()
{
    matchwatch::Snapshot snapshot;
    snapshot.seriesId = "series-1";
    snapshot.gameId = "game-1";
    snapshot.timestamp = std::chrono::system_clock::now();

    matchwatch::PlayerState player;
    player.id = "p1";
    player.alive = false;
    player.hpBucket = matchwatch::HealthBucket::Critical;
    snapshot.players["p1"] = player;

    const matchwatch::HistoryEntry entry = matchwatch::toHistoryEntry(snapshot);
    nlohmann::json j = entry;
    const auto &record = j.at("players").at("p1");
    QCOMPARE(record.size(), static_cast<size_t>(3));
    QCOMPARE(record.at("alive").get<bool>(), false);
    QCOMPARE(QString::fromStdString(record.at("hp_bucket").get<std::string>()), QStringLiteral("critical"));
    QVERIFY(record.at("weapon").is_null());

    const auto parsed = j.get<matchwatch::HistoryEntry>();
    QVERIFY(!parsed.players.at("p1").weapon.has_value());
    QCOMPARE(toMillis(parsed.timestamp), toMillis(snapshot.timestamp));
}

void ModelsJsonTests::testMissingFieldsDefaults()
{
    const auto player = nlohmann::json::object().get<matchwatch::PlayerState>();
    QVERIFY(player.id.empty());
    QVERIFY(!player.alive);
    QCOMPARE(player.hpBucket, matchwatch::HealthBucket::Unknown);
    QCOMPARE(player.armorBucket, matchwatch::ArmorBucket::Unknown);
    QVERIFY(!player.weapon.has_value());
    QCOMPARE(QString::fromStdString(player.position.region), QStringLiteral("Unknown"));

    const auto entry = nlohmann::json{{"players", {{"p1", nlohmann::json::object()}}}}
                           .get<matchwatch::HistoryEntry>();
    QCOMPARE(QString::fromStdString(entry.players.at("p1").hpBucket), QStringLiteral("unknown"));

    const auto event = nlohmann::json{{"label", 3}}.get<matchwatch::VisualEvent>();
    QCOMPARE(event.label, matchwatch::VisualLabel::NoEvent);
}

QTEST_GUILESS_MAIN(ModelsJsonTests)
#include "test_models_and_json.moc"
