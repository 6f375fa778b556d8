#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "../global/RuleOf5.h"
#include "../global/macros.h"
#include "room.h"
#include "roomid.h"

#include <map>
#include <optional>
#include <vector>

#include <QString>

// The world graph: every discovered room, owned by value and indexed by id,
// plus the player's position in it.
//
// Rooms only refer to each other by id, so the whole graph can be copied
// and serialized without fixing up pointers.
class NODISCARD Map final
{
public:
    using RoomMap = std::map<RoomId, Room>;

private:
    RoomMap m_rooms;
    RoomId m_currentRoomId;
    RoomId m_previousRoomId;
    QString m_lastDirection;
    // The last direction is only used for the first merge after it was set;
    // the value itself is kept (and saved) until overwritten.
    bool m_lastDirectionConsumed = true;
    std::vector<RoomId> m_roomNumbering;

public:
    Map() = default;
    DEFAULT_RULE_OF_5(Map);

public:
    NODISCARD size_t getRoomsCount() const { return m_rooms.size(); }
    NODISCARD bool empty() const { return m_rooms.empty(); }
    NODISCARD const RoomMap &getRooms() const { return m_rooms; }

public:
    // Semantics: find*() returns nullptr when the room doesn't exist;
    // get*() throws InvalidMapOperation instead.
    NODISCARD const Room *findRoom(const RoomId &id) const;
    NODISCARD const Room &getRoom(const RoomId &id) const;
    NODISCARD const Room *getCurrentRoom() const { return findRoom(m_currentRoomId); }

private:
    NODISCARD Room *findRoomMutable(const RoomId &id);

public:
    NODISCARD const RoomId &getCurrentRoomId() const { return m_currentRoomId; }
    NODISCARD const RoomId &getPreviousRoomId() const { return m_previousRoomId; }
    NODISCARD const QString &getLastDirection() const { return m_lastDirection; }
    NODISCARD bool hasPendingDirection() const
    {
        return !m_lastDirectionConsumed && !m_lastDirection.isEmpty();
    }

    // Records the direction of the movement command that was just sent;
    // the next addOrUpdateRoom() links the rooms through it.
    void setLastDirection(const QString &direction);

public:
    // Decides whether the candidate is a room we have seen before or a new
    // one, links it to the room we came from, and moves the player there.
    // Returns the resolved room.
    //
    // Throws std::invalid_argument if the candidate has no title.
    const Room &addOrUpdateRoom(const Room &candidate) CAN_THROW;

    // Deletes an exit of the current room entirely, e.g. after the game said
    // that there's no way out in that direction. Returns false if there was
    // no current room or no such exit.
    bool removeExit(const QString &direction);

public:
    NODISCARD const std::vector<RoomId> &getRoomNumbering() const { return m_roomNumbering; }
    // 1-based; 0 means the room isn't numbered.
    NODISCARD int getRoomNumber(const RoomId &id) const;
    NODISCARD const Room *getRoomByNumber(int number) const;
    // The first room ever discovered; distances in room ids are measured from it.
    NODISCARD RoomId getOriginRoomId() const;

    // Rooms whose search text contains every whitespace-separated term of the
    // query, ordered by room number (unnumbered rooms last).
    NODISCARD std::vector<const Room *> findRooms(const QString &query) const;

public:
    // Used by the storage to rebuild a saved map; none of these link anything.
    void insertRoom(Room room);
    void setRoomNumbering(std::vector<RoomId> numbering);
    void restorePosition(const RoomId &current, const RoomId &previous, const QString &lastDirection);

private:
    NODISCARD std::optional<RoomId> findKnownExitRevisit(const Room &candidate) const;
    NODISCARD int computeCandidateDistance() const;
    void linkRooms(const RoomId &from, const RoomId &to, const QString &direction);
    const Room &finishMerge(const RoomId &resolved);
};
