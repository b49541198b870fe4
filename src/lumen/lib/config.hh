// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"
#include "backend.hh"
#include "types.hh"

namespace LM {

struct lm_Config {
    lm_BackendConfig backend;
    lm_AppInfo app;

    // Replaces the built-in catalog when not empty
    HeapArray<lm_Guid> generics;

    BlockAllocator str_alloc;

    Span<const lm_Guid> GetGenericDevices() const { return generics.len ? (Span<const lm_Guid>)generics : lm_KnownGenericDevices; }
};

struct lm_PredefinedColor {
    const char *name;
    RgbColor rgb;
};

extern const Span<const lm_PredefinedColor> lm_PredefinedColors;

bool lm_LoadConfig(StreamReader *st, lm_Config *out_config);
bool lm_LoadConfig(const char *filename, lm_Config *out_config);

bool lm_ParseColor(Span<const char> str, RgbColor *out_color);

}
