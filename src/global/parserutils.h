#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "macros.h"

class QString;

namespace ParserUtils {
QString &removeAnsiMarksInPlace(QString &str);
NODISCARD QString stripAnsi(const QString &str);

// Strips ANSI and surrounding whitespace in one go; most line tests want both.
NODISCARD QString cleanLine(const QString &str);

// A game prompt ends with '>' and shows at least the hit and move points,
// e.g. "119H 108V 2345X >". Expects an already cleaned line.
NODISCARD bool isPromptLine(const QString &line);

NODISCARD bool isWhitespaceNormalized(const QString &str);
NODISCARD QString normalizeWhitespace(QString str);

} // namespace ParserUtils
