// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "NullPointerException.h"

NullPointerException::NullPointerException()
    : std::runtime_error("NullPointerException")
{}

NullPointerException::~NullPointerException() = default;
