// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "TestPathFinder.h"

#include "../src/global/HideQDebug.h"
#include "../src/map/Map.h"
#include "../src/map/room.h"
#include "../src/mapdata/shortestpath.h"
#include "../src/pathmachine/AutoWalk.h"

#include <tuple>
#include <utility>
#include <vector>

#include <QDebug>
#include <QtTest/QtTest>

namespace { // anonymous

using Route = std::vector<QString>;

RoomId visit(Map &map, const QString &direction, const Room &candidate)
{
    if (!direction.isEmpty()) {
        map.setLastDirection(direction);
    }
    return map.addOrUpdateRoom(candidate).getId();
}

const Room g_alpha{"Alpha Court", "The court.", {"north", "east", "down"}};
const Room g_beta{"Beta Hall", "A hall.", {"south", "north"}};
const Room g_gamma{"Gamma Tower", "A tower.", {"south"}};
const Room g_delta{"Delta Yard", "A yard.", {"west"}};

//        C
//        |
//        B
//        |
//        A -- D     (A also has an unexplored exit down)
struct NODISCARD TreeMap final
{
    Map map;
    RoomId a, b, c, d;

    TreeMap()
    {
        a = visit(map, "", g_alpha);
        b = visit(map, "north", g_beta);
        c = visit(map, "north", g_gamma);
        std::ignore = visit(map, "south", g_beta);
        std::ignore = visit(map, "south", g_alpha);
        d = visit(map, "east", g_delta);
        std::ignore = visit(map, "west", g_alpha);
    }
};

NODISCARD Room makeRoom(const QString &id,
                        const QString &title,
                        const std::vector<std::pair<QString, QString>> &exits)
{
    Room room{title, title + ".", {}};
    room.setId(RoomId{id});
    for (const auto &[dir, to] : exits) {
        room.setExit(dir, ExitTarget{RoomId{to}});
    }
    return room;
}

//   Y -- T
//   |    |
//   O -- X
NODISCARD Map diamondMap()
{
    Map map;
    map.insertRoom(makeRoom("o", "Origin", {{"north", "y"}, {"east", "x"}}));
    map.insertRoom(makeRoom("x", "East Corner", {{"west", "o"}, {"north", "t"}}));
    map.insertRoom(makeRoom("y", "North Corner", {{"south", "o"}, {"east", "t"}}));
    map.insertRoom(makeRoom("t", "Target", {{"south", "x"}, {"west", "y"}}));
    map.setRoomNumbering({RoomId{"o"}, RoomId{"x"}, RoomId{"y"}, RoomId{"t"}});
    map.restorePosition(RoomId{"o"}, INVALID_ROOMID, QString{});
    return map;
}

} // namespace

TestPathFinder::TestPathFinder() = default;

TestPathFinder::~TestPathFinder() = default;

void TestPathFinder::searchTest()
{
    dmqt::HideQDebug forThisTest;
    const TreeMap tree;
    QCOMPARE(tree.map.getRoomsCount(), size_t{4});
    QCOMPARE(tree.map.getCurrentRoomId(), tree.a);

    const std::vector<SPNode> nodes = shortestPathSearch(tree.map, tree.a, 1);
    QCOMPARE(nodes.size(), size_t{3});
    QCOMPARE(nodes[0].room, tree.a);
    QCOMPARE(nodes[0].parent, -1);
    QCOMPARE(nodes[0].dist, 0);
    // canonical order: north before east; the unexplored down exit is ignored
    QCOMPARE(nodes[1].room, tree.b);
    QCOMPARE(nodes[1].lastdir, QString("north"));
    QCOMPARE(nodes[1].parent, 0);
    QCOMPARE(nodes[2].room, tree.d);
    QCOMPARE(nodes[2].lastdir, QString("east"));

    QCOMPARE(shortestPathSearch(tree.map, tree.a).size(), size_t{4});
    QCOMPARE(shortestPathSearch(tree.map, tree.a, 0).size(), size_t{1});
    QVERIFY(shortestPathSearch(tree.map, RoomId{"missing"}).empty());

    // stops at the target
    const auto toB = shortestPathSearch(tree.map, tree.a, -1, tree.b);
    QCOMPARE(toB.back().room, tree.b);
    QCOMPARE(toB.size(), size_t{2});
}

void TestPathFinder::distanceTest()
{
    dmqt::HideQDebug forThisTest;
    TreeMap tree;
    QCOMPARE(bfsDistance(tree.map, tree.a, tree.a), std::optional<int>{0});
    QCOMPARE(bfsDistance(tree.map, tree.a, tree.c), std::optional<int>{2});
    QCOMPARE(bfsDistance(tree.map, tree.c, tree.d), std::optional<int>{3});
    QVERIFY(!bfsDistance(tree.map, tree.a, INVALID_ROOMID).has_value());

    tree.map.insertRoom(makeRoom("island", "Lonely Island", {}));
    QVERIFY(!bfsDistance(tree.map, tree.a, RoomId{"island"}).has_value());
    QVERIFY(!bfsDistance(tree.map, RoomId{"island"}, tree.a).has_value());
}

void TestPathFinder::findPathTest()
{
    dmqt::HideQDebug forThisTest;
    const TreeMap tree;
    const PathFinder finder{tree.map};

    QCOMPARE(finder.findPath(tree.c).value(), (Route{"north", "north"}));
    QCOMPARE(finder.findPath(tree.d).value(), (Route{"east"}));

    const auto here = finder.findPath(tree.a);
    QVERIFY(here.has_value());
    QVERIFY(here->empty());

    QVERIFY(!finder.findPath(RoomId{"missing"}).has_value());
    QVERIFY(!finder.findPath(INVALID_ROOMID).has_value());

    const auto steps = finder.findPathWithRooms(tree.c);
    QVERIFY(steps.has_value());
    QCOMPARE(steps->size(), size_t{2});
    QCOMPARE(steps->at(0).direction, QString("north"));
    QCOMPARE(steps->at(0).roomTitle, QString("Beta Hall"));
    QCOMPARE(steps->at(1).direction, QString("north"));
    QCOMPARE(steps->at(1).roomTitle, QString("Gamma Tower"));

    // nothing to start from
    const Map empty;
    QVERIFY(!PathFinder{empty}.findPath(tree.c).has_value());
}

void TestPathFinder::walkBackTest()
{
    dmqt::HideQDebug forThisTest;

    // only ever walked north; the way back comes from the reverse links
    Map map;
    const RoomId a = visit(map, "", Room{"Low Gate", "A gate.", {"north"}});
    const RoomId b = visit(map, "north", Room{"Middle Stair", "A stair.", {"north", "south"}});
    const RoomId c = visit(map, "north", Room{"High Landing", "A landing.", {"south"}});
    QCOMPARE(map.getCurrentRoomId(), c);

    const PathFinder finder{map};
    QCOMPARE(finder.findPath(a).value(), (Route{"south", "south"}));
    QCOMPARE(finder.findPath(b).value(), (Route{"south"}));

    const auto steps = finder.findPathWithRooms(a);
    QVERIFY(steps.has_value());
    QCOMPARE(steps->size(), size_t{2});
    QCOMPARE(steps->at(0).roomTitle, QString("Middle Stair"));
    QCOMPARE(steps->at(1).roomTitle, QString("Low Gate"));
}

void TestPathFinder::canonicalTieBreakTest()
{
    const Map map = diamondMap();
    const PathFinder finder{map};
    // both routes take two steps; north is explored before east
    QCOMPARE(finder.findPath(RoomId{"t"}).value(), (Route{"north", "east"}));
    // and the result doesn't change between calls
    QCOMPARE(finder.findPath(RoomId{"t"}).value(), (Route{"north", "east"}));
}

void TestPathFinder::nearbyRoomsTest()
{
    dmqt::HideQDebug forThisTest;
    const TreeMap tree;
    const PathFinder finder{tree.map};

    const auto titles = [](const std::vector<NearbyRoom> &rooms) {
        QStringList result;
        for (const NearbyRoom &n : rooms) {
            result.append(QString("%1:%2").arg(n.room->getTitle()).arg(n.distance));
        }
        return result;
    };

    QCOMPARE(titles(finder.findNearbyRooms(1).value()),
             (QStringList{"Beta Hall:1", "Delta Yard:1"}));
    QCOMPARE(titles(finder.findNearbyRooms(5).value()),
             (QStringList{"Beta Hall:1", "Delta Yard:1", "Gamma Tower:2"}));

    const auto none = finder.findNearbyRooms(0);
    QVERIFY(none.has_value());
    QVERIFY(none->empty());

    const Map empty;
    QVERIFY(!PathFinder{empty}.findNearbyRooms(3).has_value());
}

void TestPathFinder::danglingExitTest()
{
    dmqt::HideQDebug forThisTest{dmqt::HideQDebugOptions{true, true, true}};
    Map map;
    map.insertRoom(makeRoom("o", "Origin", {{"north", "gone"}, {"east", "x"}}));
    map.insertRoom(makeRoom("x", "East Corner", {{"west", "o"}}));
    map.restorePosition(RoomId{"o"}, INVALID_ROOMID, QString{});

    QCOMPARE(shortestPathSearch(map, RoomId{"o"}).size(), size_t{2});
    QVERIFY(!PathFinder{map}.findPath(RoomId{"gone"}).has_value());
    QCOMPARE(PathFinder{map}.findPath(RoomId{"x"}).value(), (Route{"east"}));
}

void TestPathFinder::autoWalkStartTest()
{
    dmqt::HideQDebug forThisTest;
    TreeMap tree;
    AutoWalk walk;
    QVERIFY(!walk.isActive());

    QVERIFY(walk.start(tree.map, RoomId{"missing"}) == AutoWalkStartEnum::NO_SUCH_ROOM);
    QVERIFY(walk.start(tree.map, tree.a) == AutoWalkStartEnum::ALREADY_THERE);
    QVERIFY(!walk.isActive());

    tree.map.insertRoom(makeRoom("island", "Lonely Island", {}));
    QVERIFY(walk.start(tree.map, RoomId{"island"}) == AutoWalkStartEnum::NO_ROUTE);
    QVERIFY(!walk.isActive());

    QVERIFY(walk.start(tree.map, tree.c) == AutoWalkStartEnum::STARTED);
    QVERIFY(walk.isActive());
    QCOMPARE(walk.getPlan(), (Route{"north", "north"}));
    QCOMPARE(walk.getTargetId(), tree.c);
    QCOMPARE(walk.getTargetTitle(), QString("Gamma Tower"));
    QCOMPARE(walk.getRemainingSteps(), size_t{2});
    QVERIFY(!walk.getLastAttemptedDirection().has_value());

    walk.cancel();
    QVERIFY(!walk.isActive());
    QVERIFY(walk.getPlan().empty());
    QVERIFY(!walk.nextStep().has_value());
    QVERIFY(walk.onMoveFailed(tree.map) == AutoWalkFailureEnum::NOT_WALKING);
}

void TestPathFinder::autoWalkStepsTest()
{
    dmqt::HideQDebug forThisTest;
    TreeMap tree;
    AutoWalk walk;
    QVERIFY(walk.start(tree.map, tree.c) == AutoWalkStartEnum::STARTED);

    QCOMPARE(walk.nextStep(), std::optional<QString>{"north"});
    QCOMPARE(walk.getLastAttemptedDirection(), std::optional<QString>{"north"});
    QCOMPARE(walk.getRemainingSteps(), size_t{1});
    std::ignore = visit(tree.map, "north", g_beta);
    QVERIFY(!walk.checkArrival(tree.map));
    QVERIFY(walk.isActive());

    QCOMPARE(walk.nextStep(), std::optional<QString>{"north"});
    std::ignore = visit(tree.map, "north", g_gamma);
    QVERIFY(walk.checkArrival(tree.map));
    QVERIFY(!walk.isActive());
    QVERIFY(!walk.nextStep().has_value());

    // a plan that runs out without arriving ends by itself
    QVERIFY(walk.start(tree.map, tree.b) == AutoWalkStartEnum::STARTED);
    QCOMPARE(walk.nextStep(), std::optional<QString>{"south"});
    QVERIFY(!walk.nextStep().has_value());
    QVERIFY(!walk.isActive());
}

void TestPathFinder::autoWalkReplanTest()
{
    dmqt::HideQDebug forThisTest;
    Map map = diamondMap();
    AutoWalk walk{true};
    QVERIFY(walk.start(map, RoomId{"t"}) == AutoWalkStartEnum::STARTED);
    QCOMPARE(walk.nextStep(), std::optional<QString>{"north"});

    // the game refused: the north exit of the origin is gone for good
    QVERIFY(walk.onMoveFailed(map) == AutoWalkFailureEnum::REPLANNED);
    QVERIFY(!map.getRoom(RoomId{"o"}).hasExit("north"));
    QVERIFY(walk.isActive());
    QCOMPARE(walk.getPlan(), (Route{"east", "north"}));
    QCOMPARE(walk.getTargetId(), RoomId{"t"});
    QCOMPARE(walk.nextStep(), std::optional<QString>{"east"});

    // and once more: no route is left
    QVERIFY(walk.onMoveFailed(map) == AutoWalkFailureEnum::ABORTED);
    QVERIFY(!walk.isActive());
    QVERIFY(map.getRoom(RoomId{"o"}).getExits().empty());
}

void TestPathFinder::autoWalkAbortTest()
{
    dmqt::HideQDebug forThisTest;
    Map map = diamondMap();
    AutoWalk walk{false};
    QVERIFY(walk.start(map, RoomId{"t"}) == AutoWalkStartEnum::STARTED);
    QCOMPARE(walk.nextStep(), std::optional<QString>{"north"});

    QVERIFY(walk.onMoveFailed(map) == AutoWalkFailureEnum::ABORTED);
    QVERIFY(!walk.isActive());
    QVERIFY(!map.getRoom(RoomId{"o"}).hasExit("north"));
    QVERIFY(map.getRoom(RoomId{"o"}).hasExit("east"));
}

QTEST_MAIN(TestPathFinder)
