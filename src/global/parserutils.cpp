// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "parserutils.h"

#include <cassert>

#include <QRegularExpression>
#include <QString>

namespace ParserUtils {

QString &removeAnsiMarksInPlace(QString &str)
{
    static const QRegularExpression ansi("\x1B\\[[0-9;:]*[A-Za-z]");
    str.remove(ansi);
    return str;
}

QString stripAnsi(const QString &str)
{
    QString copy = str;
    return removeAnsiMarksInPlace(copy);
}

QString cleanLine(const QString &str)
{
    return stripAnsi(str).trimmed();
}

bool isPromptLine(const QString &line)
{
    if (!line.endsWith(QChar{u'>'})) {
        return false;
    }
    return line.contains(QStringLiteral("H ")) && line.contains(QStringLiteral("V "));
}

bool isWhitespaceNormalized(const QString &str)
{
    bool last_was_space = false;
    for (const QChar c : str) {
        if (c == QChar::Space) {
            if (last_was_space) {
                return false;
            }
            last_was_space = true;
        } else if (c.isSpace()) {
            return false;
        } else {
            last_was_space = false;
        }
    }
    return true;
}

QString normalizeWhitespace(QString str)
{
    if (!isWhitespaceNormalized(str)) {
        str = str.simplified();
        assert(isWhitespaceNormalized(str));
    }
    return str;
}

} // namespace ParserUtils
