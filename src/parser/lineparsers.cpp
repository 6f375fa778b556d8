// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "lineparsers.h"

#include "../global/parserutils.h"

#include <QRegularExpression>
#include <QString>

std::optional<QStringList> InventoryParser::parse(const QStringList &lines)
{
    static const QRegularExpression header{R"(^you are carrying:\s*$)",
                                           QRegularExpression::CaseInsensitiveOption};

    int headerIdx = -1;
    for (int i = static_cast<int>(lines.size()) - 1; i >= 0; --i) {
        if (header.match(ParserUtils::cleanLine(lines.at(i))).hasMatch()) {
            headerIdx = i;
            break;
        }
    }
    if (headerIdx < 0) {
        return std::nullopt;
    }

    QStringList items;
    for (int i = headerIdx + 1; i < static_cast<int>(lines.size()); ++i) {
        const QString line = ParserUtils::cleanLine(lines.at(i));
        if (ParserUtils::isPromptLine(line)) {
            return items;
        }
        if (!line.isEmpty()) {
            items.append(line);
        }
    }

    // the list may still be arriving
    return std::nullopt;
}

bool MoveFailedParser::parse(const QString &line)
{
    // "Alas, you cannot go that way..." and its variants
    return ParserUtils::stripAnsi(line).contains(QStringLiteral("cannot go that way"));
}

bool RecallParser::parse(const QString &line)
{
    return ParserUtils::stripAnsi(line).contains(QStringLiteral("recall"), Qt::CaseInsensitive);
}
