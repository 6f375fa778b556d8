#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include <stdexcept>

#include "RuleOf5.h"
#include "macros.h"

struct NODISCARD NullPointerException final : public std::runtime_error
{
    NullPointerException();
    ~NullPointerException() override;
    DEFAULT_CTORS_AND_ASSIGN_OPS(NullPointerException);
};
