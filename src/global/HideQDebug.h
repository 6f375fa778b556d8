#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "RuleOf5.h"
#include "macros.h"

#include <QtGlobal>

namespace dmqt {

struct NODISCARD HideQDebugOptions final
{
    bool hideDebug = true;
    bool hideInfo = true;
    bool hideWarning = false;
};

// Suppresses the selected Qt message types for the lifetime of the object.
//
// Objects must be destroyed in reverse order of construction (i.e. scoped);
// each one installs its own message handler and restores the previous one.
//
// // pseudocode
// void someFunction()
// {
//   {
//      HideQDebug forThisScope;
//      qInfo() << "this will be hidden";
//      qWarning() << "this will be shown";
//   }
//   qInfo() << "this will be shown";
// }
//
class NODISCARD HideQDebug final
{
private:
    HideQDebugOptions m_options;
    QtMessageHandler m_prevHandler = nullptr;
    HideQDebug *m_prev = nullptr;

public:
    explicit HideQDebug(HideQDebugOptions options = HideQDebugOptions{});
    ~HideQDebug();
    DELETE_CTORS_AND_ASSIGN_OPS(HideQDebug);

private:
    static void messageOutput(QtMsgType type, const QMessageLogContext &context, const QString &msg);
    NODISCARD bool hides(QtMsgType type) const;
};

} // namespace dmqt
