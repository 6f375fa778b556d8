#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "../global/macros.h"
#include "../map/roomid.h"

#include <cstdint>
#include <optional>
#include <vector>

#include <QString>

class Map;

enum class NODISCARD AutoWalkStartEnum : uint8_t { STARTED, ALREADY_THERE, NO_ROUTE, NO_SUCH_ROOM };
enum class NODISCARD AutoWalkFailureEnum : uint8_t { NOT_WALKING, REPLANNED, ABORTED };

/**
 * Walks a precomputed route towards a target room, one direction at a time.
 *
 * When the game refuses a step, the exit that was tried is removed from the
 * current room so no later route uses it, and the walk is replanned from
 * where the player actually is (or aborted if nothing leads there anymore).
 */
class NODISCARD AutoWalk final
{
private:
    std::vector<QString> m_plan;
    size_t m_nextStep = 0;
    RoomId m_targetId;
    QString m_targetTitle;
    bool m_active = false;
    bool m_replanOnFailure = true;

public:
    explicit AutoWalk(bool replanOnFailure = true)
        : m_replanOnFailure{replanOnFailure}
    {}

public:
    NODISCARD AutoWalkStartEnum start(const Map &map, const RoomId &target);
    // The direction to send next, or nullopt when the route is used up.
    NODISCARD std::optional<QString> nextStep();
    NODISCARD AutoWalkFailureEnum onMoveFailed(Map &map);
    // Stops the walk once the player stands in the target room.
    // Returns true if that just happened.
    bool checkArrival(const Map &map);
    void cancel();

public:
    NODISCARD bool isActive() const { return m_active; }
    NODISCARD const std::vector<QString> &getPlan() const { return m_plan; }
    NODISCARD size_t getRemainingSteps() const { return m_plan.size() - m_nextStep; }
    NODISCARD const RoomId &getTargetId() const { return m_targetId; }
    NODISCARD const QString &getTargetTitle() const { return m_targetTitle; }
    // The direction most recently handed out by nextStep(), if any.
    NODISCARD std::optional<QString> getLastAttemptedDirection() const;
};
