// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "RoomIdentity.h"

#include <algorithm>

#include <QStringList>

namespace RoomIdentity {

static constexpr const QChar SEPARATOR{u'|'};

QString extractFirstSentence(const QString &input)
{
    const QString description = input.trimmed();
    if (description.isEmpty()) {
        return QString{};
    }

    for (const char *const terminator : {". ", "! ", "? "}) {
        const auto idx = description.indexOf(QLatin1String(terminator));
        if (idx != -1) {
            return description.left(idx + 1).trimmed();
        }
    }

    const auto newline = description.indexOf(QChar::LineFeed);
    if (newline != -1) {
        return description.left(newline).trimmed();
    }

    return description;
}

QString contentSignature(const QString &title,
                         const QString &description,
                         std::vector<QString> exitDirections)
{
    std::sort(exitDirections.begin(), exitDirections.end());

    QStringList exits;
    exits.reserve(static_cast<int>(exitDirections.size()));
    for (const QString &dir : exitDirections) {
        exits.append(dir);
    }

    return title.toLower() + SEPARATOR + extractFirstSentence(description).toLower() + SEPARATOR
           + exits.join(QChar{u','});
}

RoomId generateRoomId(const QString &title,
                      const QString &description,
                      const std::vector<QString> &exitDirections,
                      const int distance)
{
    QString id = contentSignature(title, description, exitDirections);
    if (distance >= 0) {
        id += SEPARATOR + QString::number(distance);
    }
    return RoomId{id};
}

std::optional<int> distanceOf(const RoomId &id)
{
    const QString &str = id.toQString();
    const auto lastSep = str.lastIndexOf(SEPARATOR);
    if (lastSep <= 0 || lastSep >= str.length() - 1) {
        return std::nullopt;
    }

    bool ok = false;
    const int value = str.mid(lastSep + 1).toInt(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

QString stripDistance(const RoomId &id)
{
    const QString &str = id.toQString();
    if (!distanceOf(id)) {
        return str;
    }
    return str.left(str.lastIndexOf(SEPARATOR));
}

} // namespace RoomIdentity
