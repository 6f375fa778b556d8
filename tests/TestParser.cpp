// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "TestParser.h"

#include "../src/global/HideQDebug.h"
#include "../src/parser/RoomTextParser.h"
#include "../src/parser/lineparsers.h"

#include <vector>

#include <QDebug>
#include <QString>
#include <QtTest/QtTest>

namespace { // anonymous
using Exits = std::vector<QString>;

NODISCARD Exits exitsOf(const QString &line)
{
    const auto exits = RoomTextParser::parseExitsLine(line);
    if (!exits) {
        QTest::qFail(qPrintable("not an exits line: " + line), __FILE__, __LINE__);
        return {};
    }
    return exits.value();
}
} // namespace

TestParser::TestParser() = default;

TestParser::~TestParser() = default;

void TestParser::exitsLineTest()
{
    QCOMPARE(exitsOf("Exits: north, south"), (Exits{"north", "south"}));
    QCOMPARE(exitsOf("[ Exits: n e ]"), (Exits{"north", "east"}));
    QCOMPARE(exitsOf("Obvious exits: north and up"), (Exits{"north", "up"}));
    QCOMPARE(exitsOf("exit: west"), (Exits{"west"}));
    QCOMPARE(exitsOf("Exits: north, north"), (Exits{"north"}));

    // letter lists vs. words
    QCOMPARE(exitsOf("Exits: NSE"), (Exits{"north", "south", "east"}));
    QCOMPARE(exitsOf("Exits: NE"), (Exits{"north", "east"}));
    QCOMPARE(exitsOf("Exits: sw"), (Exits{"south", "west"}));
    QCOMPARE(exitsOf("Exits: northeast"), (Exits{"northeast"}));
    QCOMPARE(exitsOf("Exits: down"), (Exits{"down"}));
    QCOMPARE(exitsOf("Exits: sw, se"), (Exits{"southwest", "southeast"}));

    // an exits line without any direction we know
    const auto none = RoomTextParser::parseExitsLine("Exits: none");
    QVERIFY(none.has_value());
    QVERIFY(none->empty());

    QVERIFY(!RoomTextParser::parseExitsLine("You see an exit to the north.").has_value());
    QVERIFY(!RoomTextParser::parseExitsLine("").has_value());
}

void TestParser::roomTitleTest()
{
    QVERIFY(RoomTextParser::isRoomTitle("The Temple Square"));
    QVERIFY(RoomTextParser::isRoomTitle("  Dark Forest Path  "));
    QVERIFY(!RoomTextParser::isRoomTitle("Hall"));
    QVERIFY(!RoomTextParser::isRoomTitle("You are standing here"));
    QVERIFY(!RoomTextParser::isRoomTitle("A small room"));
    QVERIFY(!RoomTextParser::isRoomTitle("the dark room"));
    QVERIFY(!RoomTextParser::isRoomTitle("One two three four five six seven eight nine"));
    QVERIFY(!RoomTextParser::isRoomTitle(""));

    QVERIFY(RoomTextParser::isStatusOrCombatLine("A small dog is here."));
    QVERIFY(RoomTextParser::isStatusOrCombatLine("You feel better."));
    QVERIFY(RoomTextParser::isStatusOrCombatLine("The corpse of a rat lies here."));
    QVERIFY(!RoomTextParser::isStatusOrCombatLine("The road winds on."));
}

void TestParser::plainRoomTest()
{
    const QStringList lines{
        "119H 108V >",
        "\033[1;36mThe Temple Square\033[0m",
        "You are standing in the middle of the square. Pigeons are everywhere.",
        "A fountain gurgles.",
        "Exits: north, east",
        "119H 108V >",
    };

    const auto info = RoomTextParser::parseRoomInfo(lines);
    QVERIFY(info.has_value());
    QCOMPARE(info->title, QString("The Temple Square"));
    QCOMPARE(info->description,
             QString("You are standing in the middle of the square. Pigeons are everywhere. "
                     "A fountain gurgles."));
    QCOMPARE(info->exits, (Exits{"north", "east"}));
    QVERIFY(!info->isBracketed);
    QCOMPARE(info->bracketStartIdx, -1);
    QVERIFY(info->debugInfo.isEmpty());
}

void TestParser::statusLinesTest()
{
    const QStringList lines{
        "you hear noises in the distance",
        "Dark Forest Path",
        "Trees tower over the path.",
        "A small rabbit is here.",
        "You feel hungry.",
        "Exits: south",
    };

    const auto info = RoomTextParser::parseRoomInfo(lines);
    QVERIFY(info.has_value());
    QCOMPARE(info->title, QString("Dark Forest Path"));
    QCOMPARE(info->description, QString("Trees tower over the path."));
    QCOMPARE(info->exits, (Exits{"south"}));
}

void TestParser::lineBudgetTest()
{
    const QStringList lines{
        "Long Hallway",
        "the walls are bare.",
        "dust covers the floor.",
        "a draft blows.",
        "Exits: north",
    };

    {
        const auto info = RoomTextParser::parseRoomInfo(lines);
        QVERIFY(info.has_value());
        QCOMPARE(info->title, QString("Long Hallway"));
        QCOMPARE(info->description,
                 QString("the walls are bare. dust covers the floor. a draft blows."));
    }

    {
        RoomParserOptions options;
        options.backwardLineBudget = 2;
        const auto info = RoomTextParser::parseRoomInfo(lines, options);
        QVERIFY(info.has_value());
        // nothing title-like within reach, so the first line is used
        QCOMPARE(info->title, QString("dust covers the floor."));
        QCOMPARE(info->description, QString("a draft blows."));
    }
}

void TestParser::roomBoundaryTest()
{
    {
        const QStringList lines{
            "Old Room Title",
            "old text",
            "",
            "",
            "New Room Title",
            "new text",
            "Exits: south",
        };
        const auto info = RoomTextParser::parseRoomInfo(lines);
        QVERIFY(info.has_value());
        QCOMPARE(info->title, QString("New Room Title"));
        QCOMPARE(info->description, QString("new text"));
    }

    {
        // the most recent room wins, and an older exits line ends it
        const QStringList lines{
            "Old Room Title",
            "Exits: north",
            "New Room Title",
            "Exits: south",
        };
        const auto info = RoomTextParser::parseRoomInfo(lines);
        QVERIFY(info.has_value());
        QCOMPARE(info->title, QString("New Room Title"));
        QVERIFY(info->description.isEmpty());
        QCOMPARE(info->exits, (Exits{"south"}));
    }

    {
        // a single blank line is part of the room
        const QStringList lines{
            "Quiet Garden",
            "",
            "Flowers bloom.",
            "Exits: west",
        };
        const auto info = RoomTextParser::parseRoomInfo(lines);
        QVERIFY(info.has_value());
        QCOMPARE(info->title, QString("Quiet Garden"));
        QCOMPARE(info->description, QString("Flowers bloom."));
    }

    QVERIFY(!RoomTextParser::parseRoomInfo(QStringList{}).has_value());
    QVERIFY(!RoomTextParser::parseRoomInfo(QStringList{"Exits: north"}).has_value());
    QVERIFY(!RoomTextParser::parseRoomInfo(QStringList{"Some Room", "Exits: none"}).has_value());
}

void TestParser::bracketedRoomTest()
{
    {
        const QStringList lines{
            "20H 30V >",
            "--<",
            "Temple Square",
            "    You are standing in the temple square.",
            ">-- Exits:NSE",
        };
        const auto info = RoomTextParser::parseRoomInfo(lines);
        QVERIFY(info.has_value());
        QVERIFY(info->isBracketed);
        QCOMPARE(info->bracketStartIdx, 1);
        QCOMPARE(info->bracketEndIdx, 4);
        QCOMPARE(info->title, QString("Temple Square"));
        QCOMPARE(info->description, QString("You are standing in the temple square."));
        QCOMPARE(info->exits, (Exits{"north", "south", "east"}));
    }

    {
        // exits on a line of their own after the marker
        const QStringList lines{
            "--<",
            "Dark Cave",
            "It is dark.",
            ">--",
            "Exits: down",
            "20H 30V >",
        };
        const auto info = RoomTextParser::parseRoomInfo(lines);
        QVERIFY(info.has_value());
        QCOMPARE(info->title, QString("Dark Cave"));
        QCOMPARE(info->exits, (Exits{"down"}));
    }

    {
        // two letters on the marker line are two exits, never a diagonal
        const QStringList lines{
            "--<",
            "Hall Of Doors",
            "Doors everywhere.",
            ">-- Exits:NE",
        };
        const auto info = RoomTextParser::parseRoomInfo(lines);
        QVERIFY(info.has_value());
        QCOMPARE(info->title, QString("Hall Of Doors"));
        QCOMPARE(info->exits, (Exits{"north", "east"}));

        const auto only = RoomTextParser::parseBarsoomRoomOnly(lines);
        QVERIFY(only.has_value());
        QCOMPARE(only->exits, (Exits{"north", "east"}));
    }
}

void TestParser::bracketedRoomWithoutExitsTest()
{
    const QStringList lines{
        "--<",
        "Sealed Vault",
        "There is no way out.",
        ">--",
        "20H 30V >",
    };

    QVERIFY(!RoomTextParser::parseRoomInfo(lines).has_value());

    const auto info = RoomTextParser::parseBarsoomRoomOnly(lines);
    QVERIFY(info.has_value());
    QCOMPARE(info->title, QString("Sealed Vault"));
    QVERIFY(info->exits.empty());
    QCOMPARE(info->bracketStartIdx, 0);
    QCOMPARE(info->bracketEndIdx, 3);

    QVERIFY(!RoomTextParser::parseBarsoomRoomOnly(QStringList{"Plain Room", "Exits: north"}).has_value());
    QVERIFY(!RoomTextParser::parseBarsoomRoomOnly(QStringList{">-- Exits: north"}).has_value());
}

void TestParser::compactPromptTest()
{
    {
        const QStringList lines{
            "Narrow Bridge",
            "The bridge sways in the wind.",
            "< 20H 30V Exits:E(W) >",
        };
        const auto info = RoomTextParser::parseRoomInfo(lines);
        QVERIFY(info.has_value());
        QCOMPARE(info->title, QString("Narrow Bridge"));
        QCOMPARE(info->description, QString("The bridge sways in the wind."));
        QCOMPARE(info->exits, (Exits{"east", "west"}));
    }

    // a closed door in the middle still counts
    QCOMPARE(exitsOf("Exits:N(S)E>"), (Exits{"north", "south", "east"}));
    {
        const QStringList lines{
            "Guard Post",
            "A wooden booth beside the road.",
            "20H 30V Exits:N(S)E>",
        };
        const auto info = RoomTextParser::parseRoomInfo(lines);
        QVERIFY(info.has_value());
        QCOMPARE(info->title, QString("Guard Post"));
        QCOMPARE(info->exits, (Exits{"north", "south", "east"}));
    }
}

void TestParser::traceTest()
{
    const QStringList lines{"Some Room", "with nothing else"};

    QString trace;
    QVERIFY(!RoomTextParser::parseRoomInfo(lines, RoomParserOptions{}, &trace).has_value());
    QVERIFY(trace.contains("no exits line"));

    RoomParserOptions options;
    options.debugTrace = true;
    const auto info = RoomTextParser::parseRoomInfo(QStringList{"Some Room", "Exits: up"}, options);
    QVERIFY(info.has_value());
    QVERIFY(info->debugInfo.contains("[mapper]"));
}

void TestParser::inventoryTest()
{
    {
        const QStringList lines{
            "You are carrying:",
            "a rusty key",
            "You are carrying:",
            "a sword",
            "",
            "a shield",
            "20H 30V >",
        };
        const auto items = InventoryParser::parse(lines);
        QVERIFY(items.has_value());
        QCOMPARE(items.value(), (QStringList{"a sword", "a shield"}));
    }

    {
        const QStringList lines{"You are carrying:", "Nothing."};
        QVERIFY(!InventoryParser::parse(lines).has_value());
    }

    QVERIFY(!InventoryParser::parse(QStringList{"20H 30V >"}).has_value());

    {
        const auto items = InventoryParser::parse(QStringList{"you are carrying:", "20H 30V >"});
        QVERIFY(items.has_value());
        QVERIFY(items->isEmpty());
    }
}

void TestParser::moveFailedTest()
{
    QVERIFY(MoveFailedParser::parse("Alas, you cannot go that way..."));
    QVERIFY(MoveFailedParser::parse("\033[0mYou cannot go that way."));
    QVERIFY(!MoveFailedParser::parse("You go north."));
}

void TestParser::recallTest()
{
    QVERIFY(RecallParser::parse("You recall to the temple."));
    QVERIFY(RecallParser::parse("RECALL"));
    QVERIFY(!RecallParser::parse("You walk north."));
}

QTEST_MAIN(TestParser)
