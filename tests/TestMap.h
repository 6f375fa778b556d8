#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "../src/global/macros.h"

#include <QObject>

class NODISCARD_QOBJECT TestMap final : public QObject
{
    Q_OBJECT

public:
    TestMap();
    ~TestMap() final;

private Q_SLOTS:
    static void firstSentenceTest();
    static void roomIdTest();
    static void exitTargetTest();
    static void roomTest();
    static void lookupTest();
    static void linkRoomsTest();
    static void revisitTest();
    static void identicalRoomsTest();
    static void asymmetricExitTest();
    static void removeExitTest();
    static void numberingTest();
    static void findRoomsTest();
};
