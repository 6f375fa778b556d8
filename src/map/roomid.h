#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "../global/macros.h"

#include <cstddef>
#include <functional>
#include <utility>

#include <QHashFunctions>
#include <QString>

// Content-addressed room identifier. An empty id means "no room".
struct NODISCARD RoomId final
{
private:
    QString m_value;

public:
    RoomId() = default;
    explicit RoomId(QString value)
        : m_value{std::move(value)}
    {}

    NODISCARD const QString &toQString() const { return m_value; }
    NODISCARD bool isEmpty() const { return m_value.isEmpty(); }
    explicit operator bool() const { return !isEmpty(); }

    NODISCARD bool operator==(const RoomId &rhs) const { return m_value == rhs.m_value; }
    NODISCARD bool operator!=(const RoomId &rhs) const { return !(*this == rhs); }
    NODISCARD bool operator<(const RoomId &rhs) const { return m_value < rhs.m_value; }
};

inline const RoomId INVALID_ROOMID{};

namespace std {
template<>
struct hash<RoomId>
{
    std::size_t operator()(const RoomId &id) const noexcept
    {
        return static_cast<std::size_t>(qHash(id.toQString()));
    }
};
} // namespace std
