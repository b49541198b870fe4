// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "types.hh"
#include "http.hh"
#include "backend.hh"
#include "device.hh"
#include "config.hh"
