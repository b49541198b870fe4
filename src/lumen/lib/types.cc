// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "types.hh"

namespace LM {

static const lm_Guid KnownGenericDevices[] = {
    { 0x2EA1BB63, 0xCA28, 0x428D, { 0x9F, 0x06, 0x19, 0x6B, 0x88, 0x33, 0x0B, 0xBB } }, // BlackWidow Chroma
    { 0xED1C1B82, 0xBFBE, 0x418F, { 0xB4, 0x9D, 0xD0, 0x3F, 0x05, 0xB1, 0x49, 0xDF } }, // BlackWidow Chroma TE
    { 0x18C63E9B, 0xF19A, 0x4D73, { 0x8D, 0x66, 0x98, 0x5C, 0x92, 0x2C, 0x1E, 0x2E } }, // DeathStalker Chroma
    { 0xAEC50D91, 0xB1F1, 0x452F, { 0x8E, 0x16, 0x7B, 0x73, 0xF3, 0x76, 0xFD, 0xF3 } }, // DeathAdder Chroma
    { 0xFF8A5929, 0x4512, 0x4257, { 0x8D, 0x59, 0xC6, 0x47, 0xBF, 0x99, 0x35, 0xD0 } }, // Mamba Chroma
    { 0x7EC00450, 0xE0EE, 0x4289, { 0x89, 0xD5, 0x0D, 0x87, 0x9C, 0x19, 0x06, 0x1A } }, // Mamba Chroma TE
    { 0x80F95A94, 0x73D2, 0x48CA, { 0xAE, 0x9A, 0x09, 0x86, 0x78, 0x9A, 0x9A, 0xF2 } }, // Firefly
    { 0xCD1E09A5, 0xD5E6, 0x4A6C, { 0xA9, 0x3B, 0xE6, 0xD9, 0xBF, 0x1D, 0x20, 0x92 } }, // Kraken 7.1 Chroma
    { 0x9D24B0AB, 0x0162, 0x466C, { 0x96, 0x40, 0x7A, 0x92, 0x4A, 0xA4, 0xD9, 0xFD } }, // Orbweaver Chroma
    { 0x00F0545C, 0xE180, 0x4AD1, { 0x8E, 0x8A, 0x41, 0x90, 0x61, 0xCE, 0x50, 0x5E } }  // Tartarus Chroma
};
const Span<const lm_Guid> lm_KnownGenericDevices = KnownGenericDevices;

bool lm_Guid::IsNone() const
{
    return *this == lm_NoEffect;
}

void lm_Guid::Format(FunctionRef<void(Span<const char>)> append) const
{
    char buf[64];

    Fmt(buf, "%1-%2-%3-%4%5-%6%7%8%9%10%11",
        FmtHexSmall(data1, 8), FmtHexSmall(data2, 4), FmtHexSmall(data3, 4),
        FmtHexSmall(data4[0], 2), FmtHexSmall(data4[1], 2),
        FmtHexSmall(data4[2], 2), FmtHexSmall(data4[3], 2), FmtHexSmall(data4[4], 2),
        FmtHexSmall(data4[5], 2), FmtHexSmall(data4[6], 2), FmtHexSmall(data4[7], 2));

    append(buf);
}

static inline int ParseHexadecimalChar(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    } else if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    } else if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    } else {
        return -1;
    }
}

bool lm_ParseGuid(Span<const char> str, lm_Guid *out_guid, bool log)
{
    Span<const char> remain = TrimStr(str);

    // Registry style
    if (remain.len >= 2 && remain[0] == '{' && remain[remain.len - 1] == '}') {
        remain = remain.Take(1, remain.len - 2);
    }

    uint8_t raw[16];
    Size digits = 0;

    if (remain.len != 36)
        goto malformed;

    for (Size i = 0; i < remain.len; i++) {
        char c = remain[i];

        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-')
                goto malformed;
            continue;
        }

        int value = ParseHexadecimalChar(c);
        if (value < 0)
            goto malformed;

        if (digits % 2) {
            raw[digits / 2] |= (uint8_t)value;
        } else {
            raw[digits / 2] = (uint8_t)(value << 4);
        }
        digits++;
    }
    LM_ASSERT(digits == 32);

    out_guid->data1 = ((uint32_t)raw[0] << 24) | ((uint32_t)raw[1] << 16) | ((uint32_t)raw[2] << 8) | raw[3];
    out_guid->data2 = (uint16_t)((raw[4] << 8) | raw[5]);
    out_guid->data3 = (uint16_t)((raw[6] << 8) | raw[7]);
    MemCpy(out_guid->data4, raw + 8, 8);

    return true;

malformed:
    if (log) {
        LogError("Malformed identifier '%1'", str);
    }
    return false;
}

lm_EffectData lm_MakeStaticEffect(RgbColor color)
{
    lm_EffectData effect;

    effect.kind = lm_EffectKind::Static;
    effect.colors.Append(color);

    return effect;
}

lm_EffectData lm_MakeCustomEffect(Span<const RgbColor> colors)
{
    LM_ASSERT(colors.len <= LM_MAX_LEDS);

    lm_EffectData effect;

    effect.kind = lm_EffectKind::Custom;
    effect.colors.Append(colors);

    return effect;
}

bool lm_CheckEffect(lm_DeviceCategory category, const lm_EffectData &effect)
{
    switch (effect.kind) {
        case lm_EffectKind::None: {
            if (effect.colors.len) {
                LogError("Effect None does not take any color");
                return false;
            }
        } break;

        case lm_EffectKind::Static: {
            if (effect.colors.len != 1) {
                LogError("Static effect needs exactly one color");
                return false;
            }
        } break;

        case lm_EffectKind::Custom: {
            const lm_DeviceLayout &layout = lm_DeviceLayouts[(int)category];

            if (!layout.GetCount()) {
                LogError("Custom effects are not supported for %1 devices", lm_DeviceCategoryNames[(int)category]);
                return false;
            }
            if (effect.colors.len != layout.GetCount()) {
                LogError("Custom %1 effect needs %2 colors (%3x%4), got %5",
                         lm_DeviceCategoryNames[(int)category], layout.GetCount(), layout.rows, layout.columns,
                         effect.colors.len);
                return false;
            }
        } break;
    }

    return true;
}

}
