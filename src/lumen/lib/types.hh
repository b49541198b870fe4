// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"

namespace LM {

enum class lm_Result {
    Success,
    InitError,
    CallError,
    EffectError,
    Unsupported,
    UnsupportedDevice,
    InvalidState
};
static const char *const lm_ResultNames[] = {
    "Success",
    "BackendInitError",
    "BackendCallError",
    "EffectCreateError",
    "UnsupportedOperation",
    "UnsupportedDevice",
    "InvalidState"
};

// Result codes reported by the SDK (native calls and control plane bodies)
static const int64_t lm_SdkSuccess = 0;
static const int64_t lm_SdkFailed = 0x80004005;

struct lm_CallError {
    char endpoint[512] = {};
    char request[64] = {}; // HTTP method or native function
    int status = -1;

    bool has_code = false;
    int64_t code = 0;
};

struct lm_Guid {
    uint32_t data1;
    uint16_t data2;
    uint16_t data3;
    uint8_t data4[8];

    bool IsNone() const;

    bool operator==(const lm_Guid &other) const { return !memcmp(this, &other, LM_SIZE(*this)); }
    bool operator!=(const lm_Guid &other) const { return !(*this == other); }

    void Format(FunctionRef<void(Span<const char>)> append) const;
};
static_assert(LM_SIZE(lm_Guid) == 16);

// Sentinel for "no effect active", backends never hand this out
static const lm_Guid lm_NoEffect = {};

bool lm_ParseGuid(Span<const char> str, lm_Guid *out_guid, bool log = true);

enum class lm_DeviceCategory {
    Keyboard,
    Mouse,
    Mousepad,
    Headset,
    Keypad,
    ChromaLink,
    Generic
};
static const char *const lm_DeviceCategoryNames[] = {
    "Keyboard",
    "Mouse",
    "Mousepad",
    "Headset",
    "Keypad",
    "ChromaLink",
    "Generic"
};

struct lm_DeviceLayout {
    int rows;
    int columns;

    Size GetCount() const { return (Size)rows * columns; }
};
static const lm_DeviceLayout lm_DeviceLayouts[] = {
    { 6, 22 }, // Keyboard
    { 9, 7 },  // Mouse
    { 1, 15 }, // Mousepad
    { 1, 5 },  // Headset
    { 4, 5 },  // Keypad
    { 1, 5 },  // ChromaLink
    { 0, 0 }   // Generic
};

#define LM_MAX_LEDS (6 * 22)

struct RgbColor {
    uint8_t red;
    uint8_t green;
    uint8_t blue;

    bool operator==(const RgbColor &other) const
        { return red == other.red && green == other.green && blue == other.blue; }
    bool operator!=(const RgbColor &other) const { return !(*this == other); }
};

static const RgbColor lm_Black = { 0, 0, 0 };

// SDK colors are laid out as 0x00BBGGRR
static inline uint32_t lm_EncodeSdkColor(RgbColor color)
{
    return (uint32_t)color.red | ((uint32_t)color.green << 8) | ((uint32_t)color.blue << 16);
}
static inline RgbColor lm_DecodeSdkColor(uint32_t value)
{
    RgbColor color = { (uint8_t)(value & 0xFF), (uint8_t)((value >> 8) & 0xFF), (uint8_t)((value >> 16) & 0xFF) };
    return color;
}

enum class lm_EffectKind {
    None,
    Static,
    Custom
};
static const char *const lm_EffectKindNames[] = {
    "None",
    "Static",
    "Custom"
};

struct lm_EffectData {
    lm_EffectKind kind = lm_EffectKind::None;

    // One color for Static effects, the whole layout (row major) for Custom ones
    LocalArray<RgbColor, LM_MAX_LEDS> colors;
};

lm_EffectData lm_MakeStaticEffect(RgbColor color);
lm_EffectData lm_MakeCustomEffect(Span<const RgbColor> colors);

bool lm_CheckEffect(lm_DeviceCategory category, const lm_EffectData &effect);

enum class lm_AppCategory {
    Application,
    Game
};
static const char *const lm_AppCategoryNames[] = {
    "Application",
    "Game"
};

struct lm_AppInfo {
    const char *title = "Lumen";
    const char *description = "Lighting control";
    const char *author = "Lumen";
    const char *contact = "https://koromix.dev/";

    lm_AppCategory category = lm_AppCategory::Application;
    unsigned int devices = (1u << (int)lm_DeviceCategory::Generic) - 1;
};

struct lm_DeviceInfo {
    int type = 0;
    bool connected = false;
};

enum class lm_Capability {
    QueryDevice,
    EventNotifications,
    GenericDevices
};
static const char *const lm_CapabilityNames[] = {
    "QueryDevice",
    "EventNotifications",
    "GenericDevices"
};

extern const Span<const lm_Guid> lm_KnownGenericDevices;

}
