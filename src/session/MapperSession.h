#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "../global/macros.h"
#include "../map/Map.h"
#include "../mapstorage/jsonmapstorage.h"
#include "../parser/RoomTextParser.h"
#include "../pathmachine/AutoWalk.h"

#include <optional>

#include <QString>
#include <QStringList>

class Configuration;

struct NODISCARD SessionOptions final
{
    RoomParserOptions parser;
    int recentLines = 30;
    bool saveAfterEveryRoom = true;
    bool replanOnFailure = true;

    NODISCARD static SessionOptions fromConfig(const Configuration &config);
};

// What happened while processing one batch of received text.
struct NODISCARD SessionUpdate final
{
    std::optional<RoomId> mergedRoomId;
    bool moveFailed = false;
    bool recallSkipped = false;
    // parser trace, when enabled
    QString debugInfo;
};

/**
 * Connects the mapper to the game's input and output.
 *
 * Movement commands are remembered until the game's answer contains a room,
 * which is then merged into the map through that direction. A refused move
 * deletes the exit instead, and a recall teleport suppresses the link.
 */
class NODISCARD MapperSession final
{
private:
    Map m_map;
    SessionOptions m_options;
    std::optional<JsonMapStorage> m_storage;
    QStringList m_recentLines;
    QString m_pendingMovement;
    bool m_skipNextRoom = false;
    AutoWalk m_autoWalk;
    std::optional<QStringList> m_inventory;

public:
    explicit MapperSession(Map map = Map{}, SessionOptions options = SessionOptions{});

public:
    // Saves go to this storage (after every merged room, if enabled).
    void setStorage(std::optional<JsonMapStorage> storage) { m_storage = std::move(storage); }
    // Returns false (and logs) if the map could not be written.
    bool save() const;

public:
    void onCommandSent(const QString &command);
    SessionUpdate onTextReceived(const QString &text);

public:
    NODISCARD AutoWalkStartEnum startAutoWalk(const RoomId &target);
    // Marks the next route step as sent and returns it.
    NODISCARD std::optional<QString> takeAutoWalkStep();
    void cancelAutoWalk() { m_autoWalk.cancel(); }

public:
    NODISCARD const Map &getMap() const { return m_map; }
    NODISCARD const AutoWalk &getAutoWalk() const { return m_autoWalk; }
    NODISCARD const QStringList &getRecentLines() const { return m_recentLines; }
    NODISCARD const QString &getPendingMovement() const { return m_pendingMovement; }
    NODISCARD const std::optional<QStringList> &getInventory() const { return m_inventory; }

private:
    void handleMoveFailed(SessionUpdate &update);
    void detectAndUpdateRoom(SessionUpdate &update);
    void trimRecentLines();
};
