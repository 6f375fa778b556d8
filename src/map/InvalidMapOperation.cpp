// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The DikuMapper Authors

#include "InvalidMapOperation.h"

InvalidMapOperation::InvalidMapOperation(const std::string &message)
    : std::runtime_error{message}
{}

InvalidMapOperation::InvalidMapOperation(const QString &message)
    : InvalidMapOperation{message.toStdString()}
{}

InvalidMapOperation::~InvalidMapOperation() = default;
