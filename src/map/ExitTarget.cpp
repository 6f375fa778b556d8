// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "ExitTarget.h"

ExitTarget::ExitTarget(const RoomId &to)
{
    // an empty id is how the storage format spells "unexplored"
    if (to.isEmpty()) {
        m_data = Unexplored{};
    } else {
        m_data = to;
    }
}

const RoomId &ExitTarget::getRoomIdOrInvalid() const
{
    if (const RoomId *const id = std::get_if<RoomId>(&m_data)) {
        return *id;
    }
    return INVALID_ROOMID;
}

bool ExitTarget::leadsTo(const RoomId &id) const
{
    return isExplored() && !id.isEmpty() && getRoomId() == id;
}
