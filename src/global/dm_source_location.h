#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "macros.h"

#include <cstdint>

namespace dm {
// REVISIT: replace this with C++20's std::source_location once the project moves to C++20.
struct NODISCARD source_location final
{
    const char *m_file_name = "";
    const char *m_function_name = "";
    std::uint_least32_t m_line = 0;

    NODISCARD const char *file_name() const { return this->m_file_name; }
    NODISCARD const char *function_name() const { return this->m_function_name; }
    NODISCARD std::uint_least32_t line() const { return this->m_line; }
};
} // namespace dm

#define DM_SOURCE_LOCATION() (dm::source_location{__FILE__, __FUNCTION__, __LINE__})
