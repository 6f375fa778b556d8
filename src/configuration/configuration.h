#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "../global/RuleOf5.h"
#include "../global/macros.h"

#include <QSettings>
#include <QString>

#define SUBGROUP() \
    friend class Configuration; \
    void read(const QSettings &conf); \
    void write(QSettings &conf) const

class NODISCARD Configuration final
{
public:
    void read();
    void write() const;
    void reset();

public:
    struct NODISCARD ParserSettings final
    {
        // how far above the exits line a room may start
        int backwardLineBudget = 15;
        // size of the rolling window of received lines
        int recentLines = 30;
        bool debugTrace = false;

    private:
        SUBGROUP();
    } parser;

    struct NODISCARD MapSettings final
    {
        int nearbyDistance = 5;
        int legendViewportWidth = 30;
        int legendViewportHeight = 15;
        bool saveAfterEveryRoom = true;

    private:
        SUBGROUP();
    } map;

    struct NODISCARD AutoWalkSettings final
    {
        bool replanOnFailure = true;

    private:
        SUBGROUP();
    } autoWalk;

public:
    NODISCARD QString getSettingsFileName() const;

public:
    DELETE_CTORS_AND_ASSIGN_OPS(Configuration);

private:
    Configuration();
    friend Configuration &setConfig();
};

#undef SUBGROUP

/// Must be called before you can call setConfig() or getConfig().
/// Please don't try to cheat it. Only call this function from main().
void setEnteredMain();
/// Returns a reference to the application configuration object.
NODISCARD Configuration &setConfig();
NODISCARD const Configuration &getConfig();
