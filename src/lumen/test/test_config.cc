// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "lib/native/test/test.hh"
#include "src/lumen/lib/liblumen.hh"

namespace LM {

static bool LoadConfigText(const char *text, lm_Config *out_config)
{
    StreamReader st(MakeSpan(text, (Size)strlen(text)), "<test>");
    return lm_LoadConfig(&st, out_config);
}

TEST_FUNCTION("lumen/LoadConfig")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    // Defaults
    {
        lm_Config config;

        TEST(LoadConfigText("", &config));
        TEST(config.backend.type == lm_BackendType::Rest);
        TEST_STR(config.backend.endpoint, "http://localhost:54235");
        TEST_EQ(config.backend.heartbeat_interval, 1000);
        TEST(!config.backend.library);
        TEST(config.app.category == lm_AppCategory::Application);
        TEST_EQ(config.app.devices, 0x3Fu);
        TEST_EQ(config.GetGenericDevices().len, lm_KnownGenericDevices.len);
    }

    {
        static const char text[] = R"(
[Backend]
Type = native
Endpoint = https://127.0.0.1:8443/
HeartbeatInterval = 250
Library = /opt/chroma/libchroma.so

# Application metadata sent with the handshake
[Application]
Title = Desk Lights
Description = Lights up the desk
Author = Jane Doe
Contact = jane@example.com
Category = Game
Devices = Keyboard, ChromaLink

[Generic]
Device = {5C6B3E5F-D3AB-4A46-9D61-1FCB70E7D9B1}
Device = 2ea1bb63-ca28-428d-9f06-196b88330bbb
)";

        lm_Config config;

        TEST(LoadConfigText(text, &config));
        TEST(config.backend.type == lm_BackendType::Native);
        TEST_STR(config.backend.endpoint, "https://127.0.0.1:8443/");
        TEST_EQ(config.backend.heartbeat_interval, 250);
        TEST_STR(config.backend.library, "/opt/chroma/libchroma.so");

        TEST_STR(config.app.title, "Desk Lights");
        TEST_STR(config.app.description, "Lights up the desk");
        TEST_STR(config.app.author, "Jane Doe");
        TEST_STR(config.app.contact, "jane@example.com");
        TEST(config.app.category == lm_AppCategory::Game);
        TEST_EQ(config.app.devices, (1u << (int)lm_DeviceCategory::Keyboard) | (1u << (int)lm_DeviceCategory::ChromaLink));

        // Configured list replaces the built-in catalog
        Span<const lm_Guid> generics = config.GetGenericDevices();

        TEST_EQ(generics.len, 2);
        TEST_EQ(generics[0].data1, 0x5C6B3E5Fu);
        TEST(generics[1] == lm_KnownGenericDevices[0]);
    }
}

TEST_FUNCTION("lumen/LoadConfigErrors")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    static const char *const invalid[] = {
        "[Backend]\nType = Bluetooth\n",
        "[Backend]\nEndpoint = localhost:54235\n",
        "[Backend]\nHeartbeatInterval = 0\n",
        "[Backend]\nHeartbeatInterval = -5\n",
        "[Backend]\nHeartbeatInterval = 1s\n",
        "[Backend]\nPort = 54235\n",
        "[Application]\nCategory = Utility\n",
        "[Application]\nDevices = Keyboard, Generic\n",
        "[Application]\nDevices = Keyboard, Speaker\n",
        "[Application]\nDevices = ,\n",
        "[Generic]\nDevice = not-a-guid\n",
        "[Generic]\nName = Lamp\n",
        "[Devices]\nKeyboard = 1\n",
        "Title = Orphan\n",
        "[Backend\nType = Rest\n"
    };

    for (const char *text: invalid) {
        lm_Config config;
        config.app.title = "Untouched";

        bool valid = LoadConfigText(text, &config);

        TEST_EX(!valid, "Config '%1' was accepted", text);
        TEST_STR(config.app.title, "Untouched");
    }
}

TEST_FUNCTION("lumen/ParseColor")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    RgbColor color = {};

    TEST(lm_ParseColor("Red", &color));
    TEST(color == RgbColor({ 255, 0, 0 }));
    TEST(lm_ParseColor("razergreen", &color));
    TEST(color == RgbColor({ 68, 214, 44 }));
    TEST(lm_ParseColor("BLACK", &color));
    TEST(color == lm_Black);

    TEST(lm_ParseColor("#FF8000", &color));
    TEST(color == RgbColor({ 255, 128, 0 }));
    TEST(lm_ParseColor("0a0B0c", &color));
    TEST(color == RgbColor({ 10, 11, 12 }));

    color = { 1, 2, 3 };
    TEST(!lm_ParseColor("", &color));
    TEST(!lm_ParseColor("#FF80", &color));
    TEST(!lm_ParseColor("#FF80000", &color));
    TEST(!lm_ParseColor("#GG0000", &color));
    TEST(!lm_ParseColor("Crimson", &color));
    TEST(color == RgbColor({ 1, 2, 3 }));
}

}
