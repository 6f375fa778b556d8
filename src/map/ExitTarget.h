#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "../global/RuleOf5.h"
#include "roomid.h"

#include <variant>

// The destination side of an exit that is known to exist.
//
// A room's exit map has three states per direction:
//   - key absent:            the direction has never been observed,
//   - ExitTarget unexplored: the exit exists but nobody has walked it yet,
//   - ExitTarget to a room:  the exit leads to a known room.
class NODISCARD ExitTarget final
{
public:
    struct NODISCARD Unexplored final
    {
        NODISCARD bool operator==(const Unexplored &) const { return true; }
    };

private:
    std::variant<Unexplored, RoomId> m_data;

public:
    ExitTarget()
        : m_data{Unexplored{}}
    {}
    explicit ExitTarget(const RoomId &to);
    DEFAULT_RULE_OF_5(ExitTarget);

public:
    NODISCARD static ExitTarget unexplored() { return ExitTarget{}; }

public:
    NODISCARD bool isExplored() const { return std::holds_alternative<RoomId>(m_data); }
    NODISCARD bool isUnexplored() const { return !isExplored(); }
    // Throws std::bad_variant_access if the exit is unexplored.
    NODISCARD const RoomId &getRoomId() const { return std::get<RoomId>(m_data); }
    // Returns INVALID_ROOMID for an unexplored exit.
    NODISCARD const RoomId &getRoomIdOrInvalid() const;
    NODISCARD bool leadsTo(const RoomId &id) const;

public:
    NODISCARD bool operator==(const ExitTarget &rhs) const { return m_data == rhs.m_data; }
    NODISCARD bool operator!=(const ExitTarget &rhs) const { return !(*this == rhs); }
};
