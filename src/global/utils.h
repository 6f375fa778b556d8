#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "NullPointerException.h"
#include "macros.h"

#include <optional>
#include <type_traits>

namespace utils {
template<typename T>
NODISCARD T clampPositive(const T x, const T fallback)
{
    static_assert(std::is_arithmetic_v<T>);
    return (x > T{0}) ? x : fallback;
}
} // namespace utils

template<typename T>
inline T &deref(T *const ptr)
{
    if (ptr == nullptr)
        throw NullPointerException();
    return *ptr;
}
template<typename T>
inline T &deref(std::optional<T> &ptr)
{
    // note: this can throw bad_optional_access
    return ptr.value();
}
template<typename T>
inline const T &deref(const std::optional<T> &ptr)
{
    // note: this can throw bad_optional_access
    return ptr.value();
}
