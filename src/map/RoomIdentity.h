#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "../global/macros.h"
#include "roomid.h"

#include <optional>
#include <vector>

#include <QString>

// Content-addressed room identity.
//
// An id reads "title|first sentence|sorted,exits" (title and sentence
// lowercased), optionally suffixed with "|distance" where distance is the
// BFS hop count from the session's first room. Identical-looking rooms at
// different distances therefore get different ids; identical rooms that a
// loop brings back to the same distance band still collide.
namespace RoomIdentity {

static constexpr const int NO_DISTANCE = -1;

// Up to and including the first ". ", "! " or "? "; else up to the first
// newline; else the whole (trimmed) text.
NODISCARD extern QString extractFirstSentence(const QString &description);

// The part of the id that only depends on the room's text and exit set.
NODISCARD extern QString contentSignature(const QString &title,
                                          const QString &description,
                                          std::vector<QString> exitDirections);

// A negative distance leaves the distance component off.
NODISCARD extern RoomId generateRoomId(const QString &title,
                                       const QString &description,
                                       const std::vector<QString> &exitDirections,
                                       int distance = NO_DISTANCE);

// Splits a trailing "|<integer>" component off an id.
NODISCARD extern QString stripDistance(const RoomId &id);
NODISCARD extern std::optional<int> distanceOf(const RoomId &id);

} // namespace RoomIdentity
