// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "lib/native/test/test.hh"
#include "src/lumen/lib/liblumen.hh"
#include "fake_http.hh"

namespace LM {

static const char *const LinkUrl = "http://localhost:54236/chromalink";
static const char *const EffectUrl = "http://localhost:54236/effect";

static const char *const CategoryUrls[] = {
    "http://localhost:54236/keyboard",
    "http://localhost:54236/mouse",
    "http://localhost:54236/mousepad",
    "http://localhost:54236/headset",
    "http://localhost:54236/keypad",
    "http://localhost:54236/chromalink"
};

static std::unique_ptr<lm_Backend> StartFakeSession(FakeServer *server)
{
    server->SetRoute(lm_HttpMethod::Post, "http://localhost:54235/razer/chromasdk", 200, R"({"session": 1, "uri": "http://localhost:54236"})");
    server->SetRoute(lm_HttpMethod::Delete, "http://localhost:54236/", 200, R"({"result": 0})");
    server->SetRoute(lm_HttpMethod::Put, EffectUrl, 200, R"({"result": 0})");
    for (const char *url: CategoryUrls) {
        server->SetRoute(lm_HttpMethod::Post, url, 200, R"({"result": 0, "id": "a0a0a0a0-0000-4000-8000-000000000001"})");
    }

    lm_BackendConfig config;
    config.heartbeat_interval = 60000;

    std::unique_ptr<lm_Backend> backend = lm_OpenRestBackend(config, std::make_unique<FakeHttpClient>(server));

    lm_AppInfo app;
    if (backend->Initialize(app) != lm_Result::Success)
        return nullptr;
    server->ClearRequests();

    return backend;
}

TEST_FUNCTION("lumen/LinkDevice")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    FakeServer server;
    std::unique_ptr<lm_Backend> backend = StartFakeSession(&server);
    TEST(backend);
    if (!backend)
        return;

    RgbColor red = { 255, 0, 0 };
    RgbColor green = { 0, 255, 0 };

    lm_LinkDevice link(backend.get());
    TEST_EQ(link.GetSize(), 5);

    for (Size i = 0; i < link.GetSize(); i++) {
        TEST(!link.IsSet(i));
    }

    // Single position write sends the whole strip
    {
        TEST(link.SetColor(3, red) == lm_Result::Success);

        TEST_EQ(server.CountRequests(lm_HttpMethod::Post, LinkUrl), 1);
        TEST_STR(server.GetRequest(0).body, R"({"effect":"CHROMA_CUSTOM","param":[0,0,0,255,0]})");

        TEST(link.GetColor(3) == red);
        TEST(link.IsSet(3));
        for (Size i = 0; i < 3; i++) {
            TEST(link.GetColor(i) == lm_Black);
        }
        TEST(link.GetColor(4) == lm_Black);
    }

    // Failed writes leave the buffer untouched
    {
        server.SetRoute(lm_HttpMethod::Post, LinkUrl, 200, R"({"result": false})");

        TEST(link.SetColor(1, green) == lm_Result::EffectError);
        TEST(link.GetColor(1) == lm_Black);
        TEST(link.GetColor(3) == red);

        server.SetRoute(lm_HttpMethod::Post, LinkUrl, 200, R"({"result": 0, "id": "a0a0a0a0-0000-4000-8000-000000000002"})");
    }

    // Out of range positions never reach the backend
    {
        Size count = server.CountRequests();

        TEST(link.SetColor(5, green) == lm_Result::EffectError);
        TEST(link.SetColor(-1, green) == lm_Result::EffectError);
        TEST_EQ(server.CountRequests(), count);

        TEST(link.GetColor(5) == lm_Black);
        TEST(link.GetColor(-1) == lm_Black);
        TEST(!link.IsSet(5));
        TEST(!link.IsSet(-1));
    }

    // Whole strip
    {
        TEST(link.SetAll(green) == lm_Result::Success);
        TEST_STR(server.GetRequest(server.CountRequests() - 2).body, R"({"effect":"CHROMA_STATIC","param":{"color":65280}})");

        for (Size i = 0; i < link.GetSize(); i++) {
            TEST(link.GetColor(i) == green);
        }
    }

    {
        RgbColor colors[5] = { red, red, lm_Black, green, lm_Black };

        TEST(link.SetCustom(colors) == lm_Result::Success);
        TEST_STR(server.GetRequest(server.CountRequests() - 2).body, R"({"effect":"CHROMA_CUSTOM","param":[255,255,0,65280,0]})");
        TEST(link.GetColor(1) == red);
        TEST(!link.IsSet(2));
    }

    {
        TEST(link.Clear() == lm_Result::Success);

        for (Size i = 0; i < link.GetSize(); i++) {
            TEST(!link.IsSet(i));
        }
    }
}

TEST_FUNCTION("lumen/ClearDevice")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    FakeServer server;
    std::unique_ptr<lm_Backend> backend = StartFakeSession(&server);
    TEST(backend);
    if (!backend)
        return;

    lm_DeviceDirectory directory(backend.get());

    lm_Guid expected = {};
    lm_ParseGuid("a0a0a0a0-0000-4000-8000-000000000001", &expected);

    for (Size i = 0; i < LM_LEN(CategoryUrls); i++) {
        lm_DeviceCategory category = (lm_DeviceCategory)i;
        lm_Device *device = directory.Open(category);

        TEST(device->GetCategory() == category);

        server.ClearRequests();
        TEST(device->Clear() == lm_Result::Success);
        TEST_EQ(server.CountRequests(), 2);
        FakeRequest clear = server.GetRequest(0);

        server.ClearRequests();
        TEST(device->SetEffect(lm_EffectKind::None) == lm_Result::Success);
        TEST_EQ(server.CountRequests(), 2);
        FakeRequest none = server.GetRequest(0);

        TEST_STR(clear.url, CategoryUrls[i]);
        TEST_STR(clear.url, none.url);
        TEST_STR(clear.body, none.body);
        TEST_STR(clear.body, R"({"effect":"CHROMA_NONE"})");

        TEST(device->GetCurrentEffect() == expected);
    }

    // Single color everywhere
    {
        lm_Device *headset = directory.Open(lm_DeviceCategory::Headset);

        server.ClearRequests();
        TEST(headset->SetAll({ 0, 0, 255 }) == lm_Result::Success);
        TEST_STR(server.GetRequest(0).body, R"({"effect":"CHROMA_STATIC","param":{"color":16711680}})");
    }

    // Custom effects must match the layout
    {
        lm_Device *keypad = directory.Open(lm_DeviceCategory::Keypad);
        RgbColor colors[21] = {};

        server.ClearRequests();
        TEST(keypad->SetCustom(MakeSpan(colors, 21)) == lm_Result::EffectError);
        TEST(keypad->SetCustom(MakeSpan(colors, 19)) == lm_Result::EffectError);
        TEST_EQ(server.CountRequests(), 0);

        TEST(keypad->SetCustom(MakeSpan(colors, 20)) == lm_Result::Success);
        TEST_STR(server.GetRequest(0).body, R"({"effect":"CHROMA_CUSTOM","param":[[0,0,0,0,0],[0,0,0,0,0],[0,0,0,0,0],[0,0,0,0,0]]})");
    }
}

TEST_FUNCTION("lumen/GenericDevice")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    FakeServer server;
    std::unique_ptr<lm_Backend> backend = StartFakeSession(&server);
    TEST(backend);
    if (!backend)
        return;

    lm_Guid custom = {};
    lm_ParseGuid("5c6b3e5f-d3ab-4a46-9d61-1fcb70e7d9b1", &custom);

    // Built-in allow-list
    {
        lm_DeviceDirectory directory(backend.get());
        lm_GenericDevice *device = nullptr;

        TEST(directory.IsAllowed(lm_KnownGenericDevices[0]));
        TEST(!directory.IsAllowed(custom));

        TEST(directory.OpenGeneric(custom, &device) == lm_Result::UnsupportedDevice);
        TEST(!device);

        TEST(directory.OpenGeneric(lm_KnownGenericDevices[0], &device) == lm_Result::Success);
        TEST(device && device->GetDeviceId() == lm_KnownGenericDevices[0]);
        TEST(device->GetCategory() == lm_DeviceCategory::Generic);

        lm_GenericDevice *again = nullptr;
        TEST(directory.OpenGeneric(lm_KnownGenericDevices[0], &again) == lm_Result::Success);
        TEST(again == device);

        // Not something the control plane can do
        RgbColor colors[4] = {};

        TEST(device->SetAll({ 255, 255, 255 }) == lm_Result::Unsupported);
        TEST(device->SetStatic({ 255, 255, 255 }) == lm_Result::Unsupported);
        TEST(device->SetCustom(colors) == lm_Result::Unsupported);
        TEST(device->GetCurrentEffect().IsNone());
        TEST_EQ(server.CountRequests(), 0);
    }

    // Injected allow-list replaces the built-in one
    {
        lm_DeviceDirectory directory(backend.get(), Span<const lm_Guid>(&custom, 1));
        lm_GenericDevice *device = nullptr;

        TEST(directory.IsAllowed(custom));
        TEST(!directory.IsAllowed(lm_KnownGenericDevices[0]));

        TEST(directory.OpenGeneric(lm_KnownGenericDevices[0], &device) == lm_Result::UnsupportedDevice);
        TEST(directory.OpenGeneric(custom, &device) == lm_Result::Success);
    }
}

TEST_FUNCTION("lumen/DeviceDirectory")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    FakeServer server;
    std::unique_ptr<lm_Backend> backend = StartFakeSession(&server);
    TEST(backend);
    if (!backend)
        return;

    lm_DeviceDirectory directory(backend.get());

    lm_Device *keyboard = directory.Open(lm_DeviceCategory::Keyboard);
    TEST(directory.Open(lm_DeviceCategory::Keyboard) == keyboard);
    TEST(directory.Open(lm_DeviceCategory::Mouse) != keyboard);

    lm_LinkDevice *link = directory.OpenLink();
    TEST(link->GetCategory() == lm_DeviceCategory::ChromaLink);
    TEST(directory.Open(lm_DeviceCategory::ChromaLink) == link);

    // Generic devices only open by identifier
    {
        Size count = server.CountRequests();

        TEST(!directory.Open(lm_DeviceCategory::Generic));
        TEST_EQ(server.CountRequests(), count);
    }

    // Close clears whatever was lit, and only that
    {
        TEST(keyboard->SetStatic({ 255, 0, 0 }) == lm_Result::Success);
        server.ClearRequests();

        directory.Close();

        TEST_EQ(server.CountRequests(lm_HttpMethod::Post, CategoryUrls[0]), 1);
        TEST_EQ(server.CountRequests(lm_HttpMethod::Post, CategoryUrls[1]), 0);
        TEST_EQ(server.CountRequests(lm_HttpMethod::Post, LinkUrl), 0);
        TEST_STR(server.GetRequest(0).body, R"({"effect":"CHROMA_NONE"})");
    }

    // Closing after the session is gone is quiet
    {
        lm_Device *mouse = directory.Open(lm_DeviceCategory::Mouse);
        TEST(mouse->SetStatic({ 0, 255, 0 }) == lm_Result::Success);

        TEST(backend->Uninitialize() == lm_Result::Success);
        server.ClearRequests();

        directory.Close();
        TEST_EQ(server.CountRequests(), 0);
    }
}

TEST_FUNCTION("lumen/DeviceNotInitialized")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    FakeServer server;

    lm_BackendConfig config;
    std::unique_ptr<lm_Backend> backend = lm_OpenRestBackend(config, std::make_unique<FakeHttpClient>(&server));

    lm_DeviceDirectory directory(backend.get());
    lm_LinkDevice *link = directory.OpenLink();

    TEST(link->SetColor(0, { 255, 0, 0 }) == lm_Result::InvalidState);
    TEST(!link->IsSet(0));
    TEST(directory.Open(lm_DeviceCategory::Mouse)->SetAll({ 255, 0, 0 }) == lm_Result::InvalidState);
    TEST_EQ(server.CountRequests(), 0);
}

}
