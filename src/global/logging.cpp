// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "logging.h"

#include <QByteArray>

namespace dm {

AbstractDebugOStream::AbstractDebugOStream(QDebug &&os)
    : m_debug(os)
{}

AbstractDebugOStream::~AbstractDebugOStream()
{
    const auto str_utf8 = std::move(m_os_utf8).str();
    if (str_utf8.empty()) {
        return;
    }

    auto &debug = m_debug;
    debug.noquote();
    debug.nospace();

    // QT logging doesn't expect a newline at the end,
    // so we'll only add newlines between lines.
    std::string_view rest{str_utf8};
    bool needsNewline = false;
    while (!rest.empty()) {
        const auto pos = rest.find('\n');
        auto line = rest.substr(0, pos);
        rest = (pos == std::string_view::npos) ? std::string_view{} : rest.substr(pos + 1);

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (needsNewline) {
            debug << '\n';
        }
        if (!line.empty()) {
            debug << QString::fromUtf8(line.data(), static_cast<int>(line.size()));
        }
        needsNewline = true;
    }
}

void AbstractDebugOStream::writeUtf8(const std::string_view sv)
{
    m_os_utf8 << sv;
}

DebugOstream::~DebugOstream() = default;
InfoOstream::~InfoOstream() = default;
WarningOstream::~WarningOstream() = default;

} // namespace dm
