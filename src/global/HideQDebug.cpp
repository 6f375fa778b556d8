// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "HideQDebug.h"

#include <cstdio>
#include <cstdlib>
#include <mutex>

#include <QString>

namespace dmqt {

namespace { // anonymous
std::mutex g_mutex;
HideQDebug *g_top = nullptr;
} // namespace

HideQDebug::HideQDebug(const HideQDebugOptions options)
    : m_options{options}
{
    std::lock_guard<std::mutex> lock{g_mutex};
    m_prev = g_top;
    g_top = this;
    m_prevHandler = qInstallMessageHandler(&HideQDebug::messageOutput);
}

HideQDebug::~HideQDebug()
{
    std::lock_guard<std::mutex> lock{g_mutex};
    if (g_top != this) {
        // out-of-order destruction would leave a dangling handler
        std::abort();
    }
    g_top = m_prev;
    qInstallMessageHandler(m_prevHandler);
}

bool HideQDebug::hides(const QtMsgType type) const
{
    switch (type) {
    case QtDebugMsg:
        return m_options.hideDebug;
    case QtInfoMsg:
        return m_options.hideInfo;
    case QtWarningMsg:
        return m_options.hideWarning;
    case QtCriticalMsg:
    case QtFatalMsg:
        break;
    }
    return false;
}

void HideQDebug::messageOutput(const QtMsgType type,
                               const QMessageLogContext &context,
                               const QString &msg)
{
    QtMessageHandler next = nullptr;
    {
        std::lock_guard<std::mutex> lock{g_mutex};
        for (const HideQDebug *it = g_top; it != nullptr; it = it->m_prev) {
            if (it->hides(type)) {
                return;
            }
            if (it->m_prev == nullptr) {
                next = it->m_prevHandler;
            }
        }
    }

    if (next != nullptr) {
        next(type, context, msg);
    } else {
        const QString formatted = qFormatLogMessage(type, context, msg);
        std::fprintf(stderr, "%s\n", qPrintable(formatted));
    }
}

} // namespace dmqt
