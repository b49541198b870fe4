// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "config.hh"

namespace LM {

static const lm_PredefinedColor ColorTable[] = {
    { "Black",      { 0, 0, 0 } },
    { "White",      { 255, 255, 255 } },
    { "LightGray",  { 200, 200, 200 } },
    { "Gray",       { 130, 130, 130 } },
    { "DarkGray",   { 80, 80, 80 } },
    { "Red",        { 255, 0, 0 } },
    { "Maroon",     { 128, 0, 0 } },
    { "Orange",     { 255, 165, 0 } },
    { "Gold",       { 255, 215, 0 } },
    { "Yellow",     { 255, 255, 0 } },
    { "Lime",       { 0, 255, 0 } },
    { "Green",      { 0, 128, 0 } },
    { "Cyan",       { 0, 255, 255 } },
    { "SkyBlue",    { 135, 206, 235 } },
    { "Blue",       { 0, 0, 255 } },
    { "Navy",       { 0, 0, 128 } },
    { "Purple",     { 128, 0, 128 } },
    { "Violet",     { 238, 130, 238 } },
    { "Magenta",    { 255, 0, 255 } },
    { "Pink",       { 255, 192, 203 } },
    { "Brown",      { 165, 42, 42 } },
    { "RazerGreen", { 68, 214, 44 } }
};
const Span<const lm_PredefinedColor> lm_PredefinedColors = ColorTable;

static bool CheckEndpoint(Span<const char> url)
{
    if (!StartsWith(url, "http://") && !StartsWith(url, "https://")) {
        LogError("Endpoint must start with http:// or https://");
        return false;
    }

    return true;
}

static bool ParseDeviceMask(Span<const char> str, unsigned int *out_mask)
{
    unsigned int mask = 0;

    while (str.len) {
        Span<const char> part = TrimStr(SplitStrAny(str, " ,", &str));

        if (part.len) {
            lm_DeviceCategory category;

            if (!OptionToEnumI(lm_DeviceCategoryNames, part, &category) || category == lm_DeviceCategory::Generic) {
                LogError("Invalid device category '%1'", part);
                return false;
            }

            mask |= 1u << (int)category;
        }
    }

    if (!mask) {
        LogError("Application must support at least one device category");
        return false;
    }

    *out_mask = mask;
    return true;
}

bool lm_LoadConfig(StreamReader *st, lm_Config *out_config)
{
    lm_Config config;

    IniParser ini(st);
    ini.PushLogFilter();
    LM_DEFER { PopLogFilter(); };

    bool valid = true;
    {
        IniProperty prop;
        while (ini.Next(&prop)) {
            if (prop.section == "Backend") {
                do {
                    if (prop.key == "Type") {
                        if (!OptionToEnumI(lm_BackendTypeNames, prop.value, &config.backend.type)) {
                            LogError("Invalid backend type '%1'", prop.value);
                            valid = false;
                        }
                    } else if (prop.key == "Endpoint") {
                        if (CheckEndpoint(prop.value)) {
                            config.backend.endpoint = DuplicateString(prop.value, &config.str_alloc).ptr;
                        } else {
                            valid = false;
                        }
                    } else if (prop.key == "HeartbeatInterval") {
                        if (ParseInt(prop.value, &config.backend.heartbeat_interval)) {
                            if (config.backend.heartbeat_interval <= 0) {
                                LogError("HeartbeatInterval must be positive");
                                valid = false;
                            }
                        } else {
                            valid = false;
                        }
                    } else if (prop.key == "Library") {
                        config.backend.library = DuplicateString(prop.value, &config.str_alloc).ptr;
                    } else {
                        LogError("Unknown attribute '%1'", prop.key);
                        valid = false;
                    }
                } while (ini.NextInSection(&prop));
            } else if (prop.section == "Application") {
                do {
                    if (prop.key == "Title") {
                        config.app.title = DuplicateString(prop.value, &config.str_alloc).ptr;
                    } else if (prop.key == "Description") {
                        config.app.description = DuplicateString(prop.value, &config.str_alloc).ptr;
                    } else if (prop.key == "Author") {
                        config.app.author = DuplicateString(prop.value, &config.str_alloc).ptr;
                    } else if (prop.key == "Contact") {
                        config.app.contact = DuplicateString(prop.value, &config.str_alloc).ptr;
                    } else if (prop.key == "Category") {
                        if (!OptionToEnumI(lm_AppCategoryNames, prop.value, &config.app.category)) {
                            LogError("Invalid application category '%1'", prop.value);
                            valid = false;
                        }
                    } else if (prop.key == "Devices") {
                        valid &= ParseDeviceMask(prop.value, &config.app.devices);
                    } else {
                        LogError("Unknown attribute '%1'", prop.key);
                        valid = false;
                    }
                } while (ini.NextInSection(&prop));
            } else if (prop.section == "Generic") {
                do {
                    if (prop.key == "Device") {
                        lm_Guid id = {};

                        if (lm_ParseGuid(prop.value, &id)) {
                            config.generics.Append(id);
                        } else {
                            valid = false;
                        }
                    } else {
                        LogError("Unknown attribute '%1'", prop.key);
                        valid = false;
                    }
                } while (ini.NextInSection(&prop));
            } else if (!prop.section.len) {
                LogError("Property is outside section");
                return false;
            } else {
                LogError("Unknown section '%1'", prop.section);
                while (ini.NextInSection(&prop));
                valid = false;
            }
        }
    }
    if (!ini.IsValid() || !valid)
        return false;

    std::swap(*out_config, config);
    return true;
}

bool lm_LoadConfig(const char *filename, lm_Config *out_config)
{
    StreamReader st(filename);
    return lm_LoadConfig(&st, out_config);
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

bool lm_ParseColor(Span<const char> str, RgbColor *out_color)
{
    // Try predefined colors first
    {
        const lm_PredefinedColor *color = std::find_if(lm_PredefinedColors.begin(), lm_PredefinedColors.end(),
                                                       [&](const lm_PredefinedColor &color) { return TestStrI(color.name, str); });

        if (color != lm_PredefinedColors.end()) {
            *out_color = color->rgb;
            return true;
        }
    }

    Span<const char> remain = str;

    if (remain.len && remain[0] == '#') {
        remain.ptr++;
        remain.len--;
    } else if (remain.len != 6) {
        LogError("Unknown color '%1'", str);
        return false;
    }

    if (remain.len != 6 || !std::all_of(remain.begin(), remain.end(), [](char c) { return ParseHexadecimalChar(c) >= 0; })) {
        LogError("Malformed hexadecimal color '%1'", str);
        return false;
    }

    out_color->red = (uint8_t)((ParseHexadecimalChar(remain[0]) << 4) | ParseHexadecimalChar(remain[1]));
    out_color->green = (uint8_t)((ParseHexadecimalChar(remain[2]) << 4) | ParseHexadecimalChar(remain[3]));
    out_color->blue = (uint8_t)((ParseHexadecimalChar(remain[4]) << 4) | ParseHexadecimalChar(remain[5]));

    return true;
}

}
