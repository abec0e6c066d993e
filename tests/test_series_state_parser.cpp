#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "daemon/series_state_parser.hpp"

namespace {

nlohmann::json player(const std::string &id, const std::string &name, bool alive,
                      double x, double y, const nlohmann::json &items)
{
    return nlohmann::json{
        {"__typename", "GamePlayerStateValorant"},
        {"id", id},
        {"name", name},
        {"alive", alive},
        {"currentHealth", alive ? 100 : 0},
        {"maxHealth", 100},
        {"currentArmor", 50},
        {"position", {{"x", x}, {"y", y}}},
        {"character", {{"name", "jett"}}},
        {"inventory", {{"items", items}}}
    };
}

nlohmann::json seriesState()
{
    const nlohmann::json rifle = nlohmann::json::array({
        {{"id", "1"}, {"name", "Classic"}, {"quantity", 1}, {"equipped", 0}},
        {{"id", "2"}, {"name", "Vandal"}, {"quantity", 1}, {"equipped", 1}}
    });
    const nlohmann::json sidearm = nlohmann::json::array({
        {{"id", "3"}, {"name", "Sheriff"}, {"quantity", 1}, {"equipped", 0}}
    });

    return nlohmann::json{
        {"id", "series-9"},
        {"games", nlohmann::json::array({
            {{"id", "game-empty"}, {"teams", nlohmann::json::array()}},
            {{"id", "game-1"},
             {"teams", nlohmann::json::array({
                 {{"__typename", "GameTeamStateValorant"},
                  {"name", "Alpha"},
                  {"side", "attacker"},
                  {"players", nlohmann::json::array({
                      player("p1", "Ace", true, 0.0, 0.0, rifle),
                      player("p2", "Bolt", false, 800.0, 800.0, sidearm)
                  })}},
                 {{"__typename", "GameTeamStateOther"},
                  {"name", "Ignored"},
                  {"players", nlohmann::json::array({
                      player("p9", "Ghost", true, 5000.0, 5000.0, rifle)
                  })}}
             })}}
        })}
    };
}

} // namespace

class SeriesStateParserTests : public QObject
{
    Q_OBJECT
private slots:
    void testParsesFirstPopulatedGame();
    void testPlayerFields();
    void testWeaponSelection();
    void testRejectsStateWithoutPlayers();
    void testPlayerIdFallsBackToName();
    void testQueryUsesInjectedNames();
    void testNonFiniteInventoryNumbers();
    void testNonFiniteCoordinateIsUnknown();
};

void SeriesStateParserTests::testParsesFirstPopulatedGame()
{
    const auto now = std::chrono::system_clock::now();
    const auto snapshot = matchwatch::parseSeriesState(seriesState(), "inventory", now);
    QVERIFY(snapshot.has_value());
    QCOMPARE(QString::fromStdString(snapshot->seriesId), QStringLiteral("series-9"));
    QCOMPARE(QString::fromStdString(snapshot->gameId), QStringLiteral("game-1"));
    QCOMPARE(snapshot->players.size(), static_cast<size_t>(2));
    QVERIFY(snapshot->players.count("p9") == 0);
    QVERIFY(snapshot->timestamp == now);
}

void SeriesStateParserTests::testPlayerFields()
{
    const auto snapshot = matchwatch::parseSeriesState(seriesState(), "inventory",
                                                       std::chrono::system_clock::now());
    QVERIFY(snapshot.has_value());

    const auto &ace = snapshot->players.at("p1");
    QCOMPARE(QString::fromStdString(ace.name), QStringLiteral("Ace"));
    QCOMPARE(QString::fromStdString(ace.teamName), QStringLiteral("Alpha"));
    QCOMPARE(QString::fromStdString(ace.side), QStringLiteral("attacker"));
    QCOMPARE(QString::fromStdString(ace.agent), QStringLiteral("jett"));
    QVERIFY(ace.alive);
    QVERIFY(ace.hpBucket == matchwatch::HealthBucket::Full);
    QVERIFY(ace.armorBucket == matchwatch::ArmorBucket::Heavy);
    // Bounds come from the Valorant teams only, so (0,0) is the south-west corner.
    QCOMPARE(QString::fromStdString(ace.position.region), QStringLiteral("R1C1"));
    QCOMPARE(QString::fromStdString(ace.position.quadrant), QStringLiteral("SW"));

    const auto &bolt = snapshot->players.at("p2");
    QVERIFY(!bolt.alive);
    QVERIFY(bolt.hpBucket == matchwatch::HealthBucket::Critical);
    QCOMPARE(QString::fromStdString(bolt.position.region), QStringLiteral("R8C8"));
    QCOMPARE(QString::fromStdString(bolt.position.quadrant), QStringLiteral("NE"));
}

void SeriesStateParserTests::testWeaponSelection()
{
    const auto snapshot = matchwatch::parseSeriesState(seriesState(), "inventory",
                                                       std::chrono::system_clock::now());
    QVERIFY(snapshot.has_value());
    QCOMPARE(QString::fromStdString(*snapshot->players.at("p1").weapon), QStringLiteral("Vandal"));
    // Nothing equipped: first named item.
    QCOMPARE(QString::fromStdString(*snapshot->players.at("p2").weapon), QStringLiteral("Sheriff"));

    const nlohmann::json inventory{{"items", nlohmann::json::array({
        {{"name", "  "}, {"equipped", 1}},
        {{"name", "Ghost"}, {"equipped", 1}, {"quantity", 1}},
        {{"name", "Spectre"}, {"equipped", 1}, {"quantity", 2}},
        {{"name", "Phantom"}, {"equipped", "2"}, {"quantity", 1}}
    })}};
    QCOMPARE(QString::fromStdString(*matchwatch::extractWeaponFromInventory(inventory)),
             QStringLiteral("Phantom"));

    QVERIFY(!matchwatch::extractWeaponFromInventory(nlohmann::json::object()).has_value());
    QVERIFY(!matchwatch::extractWeaponFromInventory(nullptr).has_value());
}

void SeriesStateParserTests::testRejectsStateWithoutPlayers()
{
    const auto now = std::chrono::system_clock::now();
    QVERIFY(!matchwatch::parseSeriesState(nullptr, "inventory", now).has_value());
    QVERIFY(!matchwatch::parseSeriesState(nlohmann::json{{"id", "s"}}, "inventory", now).has_value());

    const nlohmann::json noPlayers{
        {"id", "s"},
        {"games", nlohmann::json::array({
            {{"id", "g"}, {"teams", nlohmann::json::array({
                {{"__typename", "GameTeamStateValorant"}, {"players", nlohmann::json::array()}}
            })}}
        })}
    };
    QVERIFY(!matchwatch::parseSeriesState(noPlayers, "inventory", now).has_value());
}

void SeriesStateParserTests::testPlayerIdFallsBackToName()
{
    nlohmann::json state = seriesState();
    state["games"][1]["teams"][0]["players"][0].erase("id");

    const auto snapshot = matchwatch::parseSeriesState(state, "inventory",
                                                       std::chrono::system_clock::now());
    QVERIFY(snapshot.has_value());
    QVERIFY(snapshot->players.count("Ace") == 1);
    QCOMPARE(QString::fromStdString(snapshot->players.at("Ace").id), QStringLiteral("Ace"));
}

void SeriesStateParserTests::testQueryUsesInjectedNames()
{
    const QString query = QString::fromStdString(
        matchwatch::buildSeriesStateQuery("GamePlayerStateCustom", "loadout"));
    QVERIFY(query.contains(QStringLiteral("... on GamePlayerStateCustom")));
    QVERIFY(query.contains(QStringLiteral("loadout {")));
    QVERIFY(query.contains(QStringLiteral("seriesState(id: $seriesId)")));
}

void SeriesStateParserTests::testNonFiniteInventoryNumbers()
{
    const nlohmann::json inventory{
        {"items", nlohmann::json::array({
            {{"name", "Ghost"}, {"quantity", 1}, {"equipped", "inf"}},
            {{"name", "Spectre"}, {"quantity", "nan"}, {"equipped", 1}}
        })}
    };
    const auto weapon = matchwatch::extractWeaponFromInventory(inventory);
    QVERIFY(weapon.has_value());
    QCOMPARE(QString::fromStdString(*weapon), QStringLiteral("Spectre"));

    const nlohmann::json huge{
        {"items", nlohmann::json::array({
            {{"name", "Ares"}, {"quantity", 5}, {"equipped", 1}},
            {{"name", "Odin"}, {"quantity", 1e300}, {"equipped", 1}}
        })}
    };
    const auto clamped = matchwatch::extractWeaponFromInventory(huge);
    QVERIFY(clamped.has_value());
    QCOMPARE(QString::fromStdString(*clamped), QStringLiteral("Odin"));
}

void SeriesStateParserTests::testNonFiniteCoordinateIsUnknown()
{
    nlohmann::json state = seriesState();
    state["games"][1]["teams"][0]["players"][0]["position"]["x"] = "nan";
    state["games"][1]["teams"][0]["players"][1]["position"]["y"] = "inf";

    const auto snapshot = matchwatch::parseSeriesState(state, "inventory",
                                                       std::chrono::system_clock::now());
    QVERIFY(snapshot.has_value());
    const auto &ace = snapshot->players.at("p1").position;
    QVERIFY(!ace.x.has_value());
    QCOMPARE(QString::fromStdString(ace.region), QStringLiteral("Unknown"));
    QCOMPARE(QString::fromStdString(snapshot->players.at("p2").position.region),
             QStringLiteral("Unknown"));
}

QTEST_GUILESS_MAIN(SeriesStateParserTests)
#include "test_series_state_parser.moc"
