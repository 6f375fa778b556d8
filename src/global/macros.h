#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

// These macros only exist to keep clang-format from losing its mind
// when it encounters c++11 attributes.

/* This is the default for most functions, but it serves to document cases where exceptions are
 * possible in classes that users might expect to be purely noexcept. */
#define CAN_THROW noexcept(false)

#define NODISCARD [[nodiscard]]

#if defined(__clang__) && !defined(Q_MOC_RUN)
// This macro allows classes to be defined NODISCARD for the regular compiler
// but omit the attribute because the MOC compiler can't understand it.
#define NODISCARD_QOBJECT NODISCARD
#else
#define NODISCARD_QOBJECT
#endif
