// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "AutoWalk.h"

#include "../global/logging.h"
#include "../map/Map.h"
#include "../map/room.h"
#include "../mapdata/shortestpath.h"

AutoWalkStartEnum AutoWalk::start(const Map &map, const RoomId &target)
{
    cancel();

    const Room *const targetRoom = map.findRoom(target);
    if (targetRoom == nullptr) {
        return AutoWalkStartEnum::NO_SUCH_ROOM;
    }

    auto path = PathFinder{map}.findPath(target);
    if (!path) {
        DMLOG_INFO() << "No route to \"" << targetRoom->getTitle() << "\"";
        return AutoWalkStartEnum::NO_ROUTE;
    }
    if (path->empty()) {
        return AutoWalkStartEnum::ALREADY_THERE;
    }

    m_plan = std::move(path.value());
    m_nextStep = 0;
    m_targetId = target;
    m_targetTitle = targetRoom->getTitle();
    m_active = true;
    DMLOG_INFO() << "Auto-walking to \"" << m_targetTitle << "\" (" << m_plan.size() << " steps)";
    return AutoWalkStartEnum::STARTED;
}

std::optional<QString> AutoWalk::nextStep()
{
    if (!m_active) {
        return std::nullopt;
    }
    if (m_nextStep >= m_plan.size()) {
        cancel();
        return std::nullopt;
    }
    return m_plan[m_nextStep++];
}

std::optional<QString> AutoWalk::getLastAttemptedDirection() const
{
    if (m_nextStep == 0 || m_nextStep > m_plan.size()) {
        return std::nullopt;
    }
    return m_plan[m_nextStep - 1];
}

AutoWalkFailureEnum AutoWalk::onMoveFailed(Map &map)
{
    if (!m_active) {
        return AutoWalkFailureEnum::NOT_WALKING;
    }

    if (const auto lastDir = getLastAttemptedDirection()) {
        if (map.removeExit(lastDir.value())) {
            DMLOG_INFO() << "Auto-walk: removed the failed exit " << lastDir.value();
        }
    }

    const RoomId target = m_targetId;
    const QString title = m_targetTitle;
    cancel();

    if (!m_replanOnFailure) {
        DMLOG_INFO() << "Auto-walk to \"" << title << "\" aborted";
        return AutoWalkFailureEnum::ABORTED;
    }

    DMLOG_INFO() << "Auto-walk: replanning the route to \"" << title << "\"";
    if (start(map, target) != AutoWalkStartEnum::STARTED) {
        DMLOG_INFO() << "Auto-walk to \"" << title << "\" aborted; no route left";
        return AutoWalkFailureEnum::ABORTED;
    }
    return AutoWalkFailureEnum::REPLANNED;
}

bool AutoWalk::checkArrival(const Map &map)
{
    if (!m_active || map.getCurrentRoomId() != m_targetId) {
        return false;
    }
    DMLOG_INFO() << "Auto-walk arrived at \"" << m_targetTitle << "\"";
    cancel();
    return true;
}

void AutoWalk::cancel()
{
    m_plan.clear();
    m_nextStep = 0;
    m_targetId = INVALID_ROOMID;
    m_targetTitle.clear();
    m_active = false;
}
