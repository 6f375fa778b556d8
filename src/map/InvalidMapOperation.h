#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "../global/macros.h"

#include <stdexcept>
#include <string>

#include <QString>

// Thrown by the get*() lookups of Map when the requested room does not exist.
struct NODISCARD InvalidMapOperation : public std::runtime_error
{
    explicit InvalidMapOperation(const std::string &message = "InvalidMapOperation");
    explicit InvalidMapOperation(const QString &message);
    ~InvalidMapOperation() override;
};
