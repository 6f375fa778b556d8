// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "MapperSession.h"

#include "../configuration/configuration.h"
#include "../global/logging.h"
#include "../global/parserutils.h"
#include "../map/ExitDirection.h"
#include "../map/room.h"
#include "../parser/lineparsers.h"

#include <algorithm>
#include <tuple>

SessionOptions SessionOptions::fromConfig(const Configuration &config)
{
    SessionOptions options;
    options.parser.backwardLineBudget = config.parser.backwardLineBudget;
    options.parser.debugTrace = config.parser.debugTrace;
    options.recentLines = config.parser.recentLines;
    options.saveAfterEveryRoom = config.map.saveAfterEveryRoom;
    options.replanOnFailure = config.autoWalk.replanOnFailure;
    return options;
}

MapperSession::MapperSession(Map map, SessionOptions options)
    : m_map{std::move(map)}
    , m_options{options}
    , m_autoWalk{options.replanOnFailure}
{}

bool MapperSession::save() const
{
    if (!m_storage) {
        return false;
    }
    try {
        m_storage->save(m_map);
        return true;
    } catch (const MapStorageError &ex) {
        // the map in memory is still fine; the next save may succeed
        DMLOG_WARNING() << "Failed to save the map: " << ex.what();
        return false;
    }
}

void MapperSession::onCommandSent(const QString &command)
{
    const QString dir = Directions::detectMovement(command);
    if (dir.isEmpty()) {
        return;
    }
    m_pendingMovement = dir;
    // everything from here on is the answer to this move
    m_recentLines.clear();
}

SessionUpdate MapperSession::onTextReceived(const QString &text)
{
    SessionUpdate update;

    QStringList lines = text.split(QChar{u'\n'});
    if (!lines.isEmpty() && lines.last().isEmpty()) {
        lines.removeLast();
    }

    for (QString &line : lines) {
        if (line.endsWith(QChar{u'\r'})) {
            line.chop(1);
        }
        ParserUtils::removeAnsiMarksInPlace(line);
        m_recentLines.append(line);

        if (RecallParser::parse(line)) {
            m_skipNextRoom = true;
        }
        if (MoveFailedParser::parse(line)) {
            handleMoveFailed(update);
        }
    }
    trimRecentLines();

    if (auto inventory = InventoryParser::parse(m_recentLines)) {
        m_inventory = std::move(inventory);
    }

    detectAndUpdateRoom(update);
    return update;
}

void MapperSession::trimRecentLines()
{
    const int keep = std::max(1, m_options.recentLines);
    if (m_recentLines.size() > keep) {
        m_recentLines = m_recentLines.mid(m_recentLines.size() - keep);
    }
}

void MapperSession::handleMoveFailed(SessionUpdate &update)
{
    if (m_pendingMovement.isEmpty() && !m_autoWalk.isActive()) {
        return;
    }
    update.moveFailed = true;

    if (m_autoWalk.isActive()) {
        // removes the exit it just tried, then replans or gives up
        std::ignore = m_autoWalk.onMoveFailed(m_map);
    } else if (m_map.removeExit(m_pendingMovement)) {
        DMLOG_INFO() << "Cannot go " << m_pendingMovement << "; exit removed";
    }
    m_pendingMovement.clear();
    save();
}

void MapperSession::detectAndUpdateRoom(SessionUpdate &update)
{
    if (m_pendingMovement.isEmpty()) {
        return;
    }

    if (m_skipNextRoom) {
        m_skipNextRoom = false;
        m_pendingMovement.clear();
        update.recallSkipped = true;
        DMLOG_DEBUG() << "Skipped room detection after recall";
        return;
    }

    QString trace;
    const auto info = RoomTextParser::parseRoomInfo(m_recentLines,
                                                    m_options.parser,
                                                    m_options.parser.debugTrace ? &trace : nullptr);
    update.debugInfo = trace;
    if (!info || info->title.isEmpty()) {
        // the room may still be on its way
        return;
    }

    const Room candidate{info->title, info->description, info->exits};
    m_map.setLastDirection(m_pendingMovement);
    m_pendingMovement.clear();

    const Room &room = m_map.addOrUpdateRoom(candidate);
    update.mergedRoomId = room.getId();
    std::ignore = m_autoWalk.checkArrival(m_map);
    m_recentLines.clear();

    if (m_options.saveAfterEveryRoom) {
        save();
    }
}

AutoWalkStartEnum MapperSession::startAutoWalk(const RoomId &target)
{
    return m_autoWalk.start(m_map, target);
}

std::optional<QString> MapperSession::takeAutoWalkStep()
{
    auto step = m_autoWalk.nextStep();
    if (step) {
        onCommandSent(step.value());
    }
    return step;
}
