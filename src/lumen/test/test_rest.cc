// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "lib/native/test/test.hh"
#include "src/lumen/lib/liblumen.hh"
#include "fake_http.hh"

namespace LM {

static const char *const HandshakeUrl = "http://localhost:54235/razer/chromasdk";
static const char *const TeardownUrl = "http://localhost:54236/";
static const char *const HeartbeatUrl = "http://localhost:54236/heartbeat";
static const char *const EffectUrl = "http://localhost:54236/effect";
static const char *const KeyboardUrl = "http://localhost:54236/keyboard";
static const char *const MouseUrl = "http://localhost:54236/mouse";
static const char *const MousepadUrl = "http://localhost:54236/mousepad";

static const char *const FirstEffect = "11111111-1111-1111-1111-111111111111";

static const RgbColor Red = { 255, 0, 0 };

static void SetupControlPlane(FakeServer *server)
{
    static const char *const paths[] = { "keyboard", "mouse", "mousepad", "headset", "keypad", "chromalink" };

    char url[256];

    server->SetRoute(lm_HttpMethod::Post, HandshakeUrl, 200, R"({"session": 5, "uri": "http://localhost:54236"})");
    server->SetRoute(lm_HttpMethod::Delete, TeardownUrl, 200, R"({"result": 0})");
    server->SetRoute(lm_HttpMethod::Put, HeartbeatUrl, 200, R"({"tick": 42})");
    server->SetRoute(lm_HttpMethod::Put, EffectUrl, 200, R"({"result": true})");
    server->SetRoute(lm_HttpMethod::Delete, EffectUrl, 200, R"({"result": true})");

    for (const char *path: paths) {
        Fmt(url, "http://localhost:54236/%1", path);
        server->SetRoute(lm_HttpMethod::Post, url, 200, R"({"result": true, "effectId": "11111111-1111-1111-1111-111111111111"})");
    }
}

static std::unique_ptr<lm_Backend> OpenFakeBackend(FakeServer *server, int heartbeat_interval = 60000)
{
    lm_BackendConfig config;
    config.heartbeat_interval = heartbeat_interval;

    return lm_OpenRestBackend(config, std::make_unique<FakeHttpClient>(server));
}

template <typename Func>
static bool WaitUntil(Func func, int64_t timeout = 5000)
{
    int64_t start = GetMonotonicClock();

    while (!func()) {
        if (GetMonotonicClock() - start > timeout)
            return false;
        WaitDelay(5);
    }

    return true;
}

TEST_FUNCTION("lumen/RestHandshake")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    FakeServer server;
    SetupControlPlane(&server);

    std::unique_ptr<lm_Backend> backend = OpenFakeBackend(&server);
    TEST(backend->GetType() == lm_BackendType::Rest);

    lm_AppInfo app;
    app.title = "Test App";
    app.category = lm_AppCategory::Game;

    TEST(backend->Initialize(app) == lm_Result::Success);
    TEST(backend->IsHealthy());
    TEST_EQ(server.CountRequests(), 1);

    FakeRequest handshake = server.GetRequest(0);

    TEST(handshake.method == lm_HttpMethod::Post);
    TEST_STR(handshake.url, HandshakeUrl);
    TEST(strstr(handshake.body, R"("title":"Test App")"));
    TEST(strstr(handshake.body, R"("device_supported":["keyboard","mouse","mousepad","headset","keypad","chromalink"])"));
    TEST(strstr(handshake.body, R"("category":"game")"));

    // Everything else goes to the address handed out by the handshake
    {
        lm_Guid id = {};

        TEST(backend->CreateEffect(lm_DeviceCategory::Keyboard, lm_MakeStaticEffect(Red), &id) == lm_Result::Success);
        TEST_STR(server.GetLastRequest().url, KeyboardUrl);

        TEST(backend->SetEffect(id) == lm_Result::Success);
        TEST_STR(server.GetLastRequest().url, EffectUrl);
    }

    TEST(backend->Initialize(app) == lm_Result::InvalidState);
    TEST_EQ(server.CountRequests(lm_HttpMethod::Post, HandshakeUrl), 1);
}

TEST_FUNCTION("lumen/RestHandshakeFailure")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    FakeServer server;
    SetupControlPlane(&server);

    std::unique_ptr<lm_Backend> backend = OpenFakeBackend(&server, 10);
    lm_AppInfo app;

    // Transfer failure
    {
        server.SetRoute(lm_HttpMethod::Post, HandshakeUrl, -1, nullptr);

        lm_CallError err;
        TEST(backend->Initialize(app, &err) == lm_Result::InitError);
        TEST_EQ(err.status, -1);
        TEST_STR(err.endpoint, HandshakeUrl);
        TEST_STR(err.request, "POST");
    }

    // HTTP error
    {
        server.SetRoute(lm_HttpMethod::Post, HandshakeUrl, 500, "Internal error");

        lm_CallError err;
        TEST(backend->Initialize(app, &err) == lm_Result::InitError);
        TEST_EQ(err.status, 500);
    }

    // Unusable payloads
    {
        static const char *const bodies[] = {
            "",
            "null",
            "{",
            R"({"session": 5})",
            R"({"uri": "http://localhost:54236"})",
            R"({"session": 5, "uri": "ftp://localhost:54236"})",
            R"({"session": 5, "uri": "not an address"})"
        };

        for (const char *body: bodies) {
            server.SetRoute(lm_HttpMethod::Post, HandshakeUrl, 200, body);

            lm_CallError err;
            lm_Result ret = backend->Initialize(app, &err);

            TEST_EX(ret == lm_Result::InitError, "Handshake with '%1' returned %2", body, lm_ResultNames[(int)ret]);
        }
    }

    // Keep-alive was never armed
    WaitDelay(50);
    TEST_EQ(server.CountRequests(lm_HttpMethod::Put, HeartbeatUrl), 0);
    TEST_EQ(server.CountRequests(), 9);

    // Failures leave the backend ready for another attempt
    server.SetRoute(lm_HttpMethod::Post, HandshakeUrl, 200, R"({"sessionid": 8, "uri": "http://localhost:54236/"})");
    TEST(backend->Initialize(app) == lm_Result::Success);

    {
        lm_Guid id = {};

        TEST(backend->CreateEffect(lm_DeviceCategory::Mouse, lm_MakeStaticEffect(Red), &id) == lm_Result::Success);
        TEST_STR(server.GetLastRequest().url, MouseUrl);
    }
}

TEST_FUNCTION("lumen/RestNotInitialized")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    FakeServer server;
    SetupControlPlane(&server);

    std::unique_ptr<lm_Backend> backend = OpenFakeBackend(&server);

    lm_Guid id = {};
    lm_ParseGuid(FirstEffect, &id);

    TEST(backend->CreateEffect(lm_DeviceCategory::Keyboard, lm_MakeStaticEffect(Red), &id) == lm_Result::InvalidState);
    TEST(backend->SetEffect(id) == lm_Result::InvalidState);
    TEST(backend->DeleteEffect(id) == lm_Result::InvalidState);
    TEST(backend->Uninitialize() == lm_Result::InvalidState);

    TEST_EQ(server.CountRequests(), 0);
}

TEST_FUNCTION("lumen/RestTeardown")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    FakeServer server;
    SetupControlPlane(&server);

    // Graceful
    {
        std::unique_ptr<lm_Backend> backend = OpenFakeBackend(&server);
        lm_AppInfo app;

        TEST(backend->Initialize(app) == lm_Result::Success);
        server.ClearRequests();

        lm_CallError err;
        TEST(backend->Uninitialize(&err) == lm_Result::Success);
        TEST_EQ(server.CountRequests(), 1);
        TEST(server.GetLastRequest().method == lm_HttpMethod::Delete);
        TEST_STR(server.GetLastRequest().url, TeardownUrl);

        // Second teardown has nothing left to do
        TEST(backend->Uninitialize(&err) == lm_Result::Success);
        backend->Dispose();
        backend->Dispose();
        TEST_EQ(server.CountRequests(), 1);

        // Disposed is terminal
        lm_Guid id = {};
        TEST(backend->Initialize(app) == lm_Result::InvalidState);
        TEST(backend->CreateEffect(lm_DeviceCategory::Keyboard, lm_MakeStaticEffect(Red), &id) == lm_Result::InvalidState);
        TEST_EQ(server.CountRequests(), 1);
    }

    // Unconditional
    {
        std::unique_ptr<lm_Backend> backend = OpenFakeBackend(&server);
        lm_AppInfo app;

        TEST(backend->Initialize(app) == lm_Result::Success);
        server.ClearRequests();

        backend->Dispose();
        backend->Dispose();
        TEST(backend->Uninitialize() == lm_Result::Success);
        TEST_EQ(server.CountRequests(), 0);
    }

    // Disposing a backend that never started
    {
        std::unique_ptr<lm_Backend> backend = OpenFakeBackend(&server);
        lm_AppInfo app;

        server.ClearRequests();

        backend->Dispose();
        TEST(backend->Initialize(app) == lm_Result::InvalidState);
        TEST_EQ(server.CountRequests(), 0);
    }
}

TEST_FUNCTION("lumen/RestTeardownFailure")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    FakeServer server;
    SetupControlPlane(&server);

    // Rejected by the control plane
    {
        server.SetRoute(lm_HttpMethod::Delete, TeardownUrl, 200, R"({"result": false})");

        std::unique_ptr<lm_Backend> backend = OpenFakeBackend(&server);
        lm_AppInfo app;

        TEST(backend->Initialize(app) == lm_Result::Success);

        lm_CallError err;
        TEST(backend->Uninitialize(&err) == lm_Result::CallError);
        TEST_EQ(err.status, 200);
        TEST(err.has_code);
        TEST_EQ(err.code, lm_SdkFailed);
        TEST_STR(err.request, "DELETE");

        // The session is dropped anyway
        server.ClearRequests();

        lm_Guid id = {};
        TEST(backend->Uninitialize() == lm_Result::Success);
        TEST(backend->CreateEffect(lm_DeviceCategory::Keyboard, lm_MakeStaticEffect(Red), &id) == lm_Result::InvalidState);
        TEST_EQ(server.CountRequests(), 0);
    }

    // HTTP error
    {
        server.SetRoute(lm_HttpMethod::Delete, TeardownUrl, 503, nullptr);

        std::unique_ptr<lm_Backend> backend = OpenFakeBackend(&server);
        lm_AppInfo app;

        TEST(backend->Initialize(app) == lm_Result::Success);

        lm_CallError err;
        TEST(backend->Uninitialize(&err) == lm_Result::CallError);
        TEST_EQ(err.status, 503);
        TEST(!err.has_code);
    }
}

TEST_FUNCTION("lumen/RestCreateEffect")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    FakeServer server;
    SetupControlPlane(&server);

    std::unique_ptr<lm_Backend> backend = OpenFakeBackend(&server);
    lm_AppInfo app;

    TEST(backend->Initialize(app) == lm_Result::Success);
    server.ClearRequests();

    lm_Guid expected = {};
    lm_ParseGuid(FirstEffect, &expected);

    lm_Device device(backend.get(), lm_DeviceCategory::Keyboard);
    TEST(device.GetCurrentEffect().IsNone());

    lm_CallError err;
    TEST(device.SetStatic(Red, &err) == lm_Result::Success);
    TEST(device.GetCurrentEffect() == expected);

    TEST_EQ(server.CountRequests(), 2);
    {
        FakeRequest create = server.GetRequest(0);
        FakeRequest activate = server.GetRequest(1);

        TEST(create.method == lm_HttpMethod::Post);
        TEST_STR(create.url, KeyboardUrl);
        TEST_STR(create.body, R"({"effect":"CHROMA_STATIC","param":{"color":255}})");

        TEST(activate.method == lm_HttpMethod::Put);
        TEST_STR(activate.url, EffectUrl);
        TEST_STR(activate.body, R"({"id":"11111111-1111-1111-1111-111111111111"})");
    }

    // Some control plane versions use "id" and integer results
    {
        server.SetRoute(lm_HttpMethod::Post, KeyboardUrl, 200, R"({"result": 0, "id": "{22222222-2222-2222-2222-222222222222}"})");

        lm_Guid next = {};
        lm_ParseGuid("22222222-2222-2222-2222-222222222222", &next);

        TEST(device.SetEffect(lm_EffectKind::None) == lm_Result::Success);
        TEST(device.GetCurrentEffect() == next);
    }

    // Replacing an effect does not delete the previous one
    TEST_EQ(server.CountRequests(lm_HttpMethod::Delete, EffectUrl), 0);

    // Explicit deletion
    {
        TEST(backend->DeleteEffect(expected) == lm_Result::Success);

        FakeRequest request = server.GetLastRequest();

        TEST(request.method == lm_HttpMethod::Delete);
        TEST_STR(request.url, EffectUrl);
        TEST_STR(request.body, R"({"id":"11111111-1111-1111-1111-111111111111"})");
    }
}

TEST_FUNCTION("lumen/RestEffectEncoding")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    FakeServer server;
    SetupControlPlane(&server);

    std::unique_ptr<lm_Backend> backend = OpenFakeBackend(&server);
    lm_AppInfo app;

    TEST(backend->Initialize(app) == lm_Result::Success);

    lm_Guid id = {};

    {
        lm_EffectData effect;

        TEST(backend->CreateEffect(lm_DeviceCategory::Headset, effect, &id) == lm_Result::Success);
        TEST_STR(server.GetLastRequest().body, R"({"effect":"CHROMA_NONE"})");
    }

    // Grids are sent as rows
    {
        RgbColor colors[LM_MAX_LEDS] = {};
        const lm_DeviceLayout &layout = lm_DeviceLayouts[(int)lm_DeviceCategory::Keyboard];

        for (int i = 0; i < layout.rows; i++) {
            for (int j = 0; j < layout.columns; j++) {
                colors[i * layout.columns + j] = { (uint8_t)i, 0, (uint8_t)j };
            }
        }

        lm_EffectData effect = lm_MakeCustomEffect(MakeSpan(colors, layout.GetCount()));
        TEST(backend->CreateEffect(lm_DeviceCategory::Keyboard, effect, &id) == lm_Result::Success);

        HeapArray<char> expected;
        Fmt(&expected, R"({"effect":"CHROMA_CUSTOM","param":[)");
        for (int i = 0; i < layout.rows; i++) {
            Fmt(&expected, "%1[", i ? "," : "");
            for (int j = 0; j < layout.columns; j++) {
                Fmt(&expected, "%1%2", j ? "," : "", (j << 16) | i);
            }
            Fmt(&expected, "]");
        }
        Fmt(&expected, "]}");

        TEST_STR(server.GetLastRequest().body, expected);
    }

    // Single row layouts are sent flat
    {
        RgbColor colors[15] = {};
        colors[14] = { 0, 0, 255 };

        lm_EffectData effect = lm_MakeCustomEffect(colors);
        TEST(backend->CreateEffect(lm_DeviceCategory::Mousepad, effect, &id) == lm_Result::Success);

        TEST_STR(server.GetLastRequest().url, MousepadUrl);
        TEST_STR(server.GetLastRequest().body, R"({"effect":"CHROMA_CUSTOM","param":[0,0,0,0,0,0,0,0,0,0,0,0,0,0,16711680]})");
    }

    // Invalid effects never reach the control plane
    {
        Size count = server.CountRequests();

        RgbColor colors[3] = {};
        TEST(backend->CreateEffect(lm_DeviceCategory::Headset, lm_MakeCustomEffect(colors), &id) == lm_Result::EffectError);
        TEST_EQ(server.CountRequests(), count);
    }
}

TEST_FUNCTION("lumen/RestLogicalFailure")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    FakeServer server;
    SetupControlPlane(&server);

    std::unique_ptr<lm_Backend> backend = OpenFakeBackend(&server);
    lm_AppInfo app;

    TEST(backend->Initialize(app) == lm_Result::Success);

    lm_Device device(backend.get(), lm_DeviceCategory::Keyboard);
    TEST(device.SetStatic(Red) == lm_Result::Success);

    lm_Guid previous = device.GetCurrentEffect();
    TEST(!previous.IsNone());

    // Accepted but failed
    {
        server.SetRoute(lm_HttpMethod::Post, KeyboardUrl, 200, R"({"result": false, "effectId": null})");

        lm_CallError err;
        TEST(device.SetStatic(Red, &err) == lm_Result::EffectError);
        TEST_EQ(err.status, 200);
        TEST(err.has_code);
        TEST_STR(err.endpoint, KeyboardUrl);
    }

    // Transport level
    {
        server.SetRoute(lm_HttpMethod::Post, KeyboardUrl, 500, R"({"result": 87})");

        lm_CallError err;
        TEST(device.SetStatic(Red, &err) == lm_Result::CallError);
        TEST_EQ(err.status, 500);
        TEST(err.has_code);
        TEST_EQ(err.code, 87);
    }

    {
        server.SetRoute(lm_HttpMethod::Post, KeyboardUrl, -1, nullptr);

        lm_CallError err;
        TEST(device.SetStatic(Red, &err) == lm_Result::CallError);
        TEST_EQ(err.status, -1);
        TEST(!err.has_code);
    }

    // More logical failures
    {
        static const char *const bodies[] = {
            R"({"result": 87})",
            R"({"result": true})",
            R"({"result": true, "effectId": null})",
            R"({"effectId": "11111111-1111-1111-1111-111111111111"})",
            R"({"result": true, "effectId": "garbage"})",
            "null",
            ""
        };

        for (const char *body: bodies) {
            server.SetRoute(lm_HttpMethod::Post, KeyboardUrl, 200, body);

            lm_Result ret = device.SetStatic(Red);
            TEST_EX(ret == lm_Result::EffectError, "Create with '%1' returned %2", body, lm_ResultNames[(int)ret]);
        }
    }

    // Activation failures
    {
        server.SetRoute(lm_HttpMethod::Post, KeyboardUrl, 200, R"({"result": true, "effectId": "33333333-3333-3333-3333-333333333333"})");
        server.SetRoute(lm_HttpMethod::Put, EffectUrl, 200, R"({"result": false})");
        TEST(device.SetStatic(Red) == lm_Result::EffectError);

        server.SetRoute(lm_HttpMethod::Put, EffectUrl, 404, nullptr);
        TEST(device.SetStatic(Red) == lm_Result::CallError);
    }

    // Failed calls never touch the current effect
    TEST(device.GetCurrentEffect() == previous);

    {
        server.SetRoute(lm_HttpMethod::Delete, EffectUrl, 200, R"({"result": false})");
        TEST(backend->DeleteEffect(previous) == lm_Result::EffectError);
    }
}

TEST_FUNCTION("lumen/RestUnsupported")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    FakeServer server;
    SetupControlPlane(&server);

    std::unique_ptr<lm_Backend> backend = OpenFakeBackend(&server);

    TEST(!backend->IsSupported(lm_Capability::QueryDevice));
    TEST(!backend->IsSupported(lm_Capability::EventNotifications));
    TEST(!backend->IsSupported(lm_Capability::GenericDevices));

    const auto check = [&]() {
        lm_Guid device = lm_KnownGenericDevices[0];
        lm_DeviceInfo info;
        lm_Guid id = {};
        int handle = 0;

        for (int i = 0; i < 3; i++) {
            TEST(backend->QueryDevice(device, &info) == lm_Result::Unsupported);
            TEST(backend->RegisterEventNotifications(&handle) == lm_Result::Unsupported);
            TEST(backend->UnregisterEventNotifications() == lm_Result::Unsupported);
            TEST(backend->CreateDeviceEffect(device, lm_MakeStaticEffect(Red), &id) == lm_Result::Unsupported);
            TEST(backend->CreateEffect(lm_DeviceCategory::Generic, lm_MakeStaticEffect(Red), &id) == lm_Result::Unsupported);
        }
    };

    check();
    TEST_EQ(server.CountRequests(), 0);

    lm_AppInfo app;
    TEST(backend->Initialize(app) == lm_Result::Success);
    server.ClearRequests();

    check();
    TEST_EQ(server.CountRequests(), 0);

    backend->Dispose();

    check();
    TEST_EQ(server.CountRequests(), 0);
}

TEST_FUNCTION("lumen/RestHeartbeat")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    FakeServer server;
    SetupControlPlane(&server);

    std::unique_ptr<lm_Backend> backend = OpenFakeBackend(&server, 200);
    lm_AppInfo app;

    // Nothing ticks before the session exists
    WaitDelay(300);
    TEST_EQ(server.CountRequests(lm_HttpMethod::Put, HeartbeatUrl), 0);

    TEST(backend->Initialize(app) == lm_Result::Success);

    // First tick comes after one full period
    TEST_EQ(server.CountRequests(lm_HttpMethod::Put, HeartbeatUrl), 0);

    TEST(WaitUntil([&]() { return server.CountRequests(lm_HttpMethod::Put, HeartbeatUrl) >= 2; }));
    TEST(backend->IsHealthy());

    backend->Dispose();

    // Nothing ticks after dispose returns
    Size count = server.CountRequests(lm_HttpMethod::Put, HeartbeatUrl);
    WaitDelay(500);
    TEST_EQ(server.CountRequests(lm_HttpMethod::Put, HeartbeatUrl), count);
}

TEST_FUNCTION("lumen/RestHeartbeatFailure")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    FakeServer server;
    SetupControlPlane(&server);
    server.SetRoute(lm_HttpMethod::Put, HeartbeatUrl, 500, "{}");

    std::unique_ptr<lm_Backend> backend = OpenFakeBackend(&server, 20);
    lm_AppInfo app;

    std::atomic_int calls { 0 };
    backend->SetHealthCallback([&](const lm_CallError &err) {
        if (err.status == 500) {
            calls++;
        }
    });

    TEST(backend->Initialize(app) == lm_Result::Success);

    TEST(WaitUntil([&]() { return calls == 1; }));
    TEST(!backend->IsHealthy());

    lm_CallError err;
    TEST(backend->GetHealthError(&err));
    TEST_EQ(err.status, 500);
    TEST_STR(err.request, "PUT");
    TEST_STR(err.endpoint, HeartbeatUrl);

    // Keep-alive gives up after the first failure
    WaitDelay(200);
    TEST_EQ(server.CountRequests(lm_HttpMethod::Put, HeartbeatUrl), 1);
    TEST_EQ(calls.load(), 1);

    // Foreground calls still work and report their own outcome
    TEST(backend->Uninitialize() == lm_Result::Success);
}

TEST_FUNCTION("lumen/RestHealthCallbackDispose")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    FakeServer server;
    SetupControlPlane(&server);
    server.SetRoute(lm_HttpMethod::Put, HeartbeatUrl, 500, "{}");

    lm_AppInfo app;

    // Dispose from the callback, owner destroys the backend right away
    {
        std::unique_ptr<lm_Backend> backend = OpenFakeBackend(&server, 20);
        lm_Backend *ptr = backend.get();

        std::atomic_bool disposed { false };
        backend->SetHealthCallback([&, ptr](const lm_CallError &) {
            ptr->Dispose();
            disposed = true;
        });

        TEST(backend->Initialize(app) == lm_Result::Success);
        TEST(WaitUntil([&]() { return disposed.load(); }));

        backend.reset();
    }

    // Callback drops the last owner itself
    {
        std::unique_ptr<lm_Backend> backend = OpenFakeBackend(&server, 20);

        std::atomic_bool destroyed { false };
        backend->SetHealthCallback([&](const lm_CallError &) {
            backend.reset();
            destroyed = true;
        });

        TEST(backend->Initialize(app) == lm_Result::Success);
        TEST(WaitUntil([&]() { return destroyed.load(); }));
        TEST(!backend);
    }

    // Let detached keep-alive threads run out
    WaitDelay(100);

    TEST_EQ(server.CountRequests(lm_HttpMethod::Put, HeartbeatUrl), 2);
    TEST_EQ(server.CountRequests(lm_HttpMethod::Delete, TeardownUrl), 0);
}

TEST_FUNCTION("lumen/RestHeartbeatDuringTeardown")
{
    PushLogFilter([](LogLevel, const char *, const char *, FunctionRef<LogFunc>) {});
    LM_DEFER { PopLogFilter(); };

    std::atomic_bool in_flight { false };
    std::atomic_bool teardown { false };

    FakeServer server;
    SetupControlPlane(&server);
    server.SetRoute(lm_HttpMethod::Put, HeartbeatUrl, 500, "{}");

    // Hold the first tick until the session is being torn down, then fail it
    server.SetHook([&](lm_HttpMethod method, const char *url) {
        if (method == lm_HttpMethod::Put && TestStr(url, HeartbeatUrl)) {
            in_flight = true;
            WaitUntil([&]() { return teardown.load(); });
        } else if (method == lm_HttpMethod::Delete && TestStr(url, TeardownUrl)) {
            teardown = true;
        }
    });

    std::unique_ptr<lm_Backend> backend = OpenFakeBackend(&server, 20);
    lm_AppInfo app;

    std::atomic_int calls { 0 };
    backend->SetHealthCallback([&](const lm_CallError &) { calls++; });

    TEST(backend->Initialize(app) == lm_Result::Success);
    TEST(WaitUntil([&]() { return in_flight.load(); }));

    TEST(backend->Uninitialize() == lm_Result::Success);

    TEST(backend->IsHealthy());
    TEST_EQ(calls.load(), 0);
    TEST_EQ(server.CountRequests(lm_HttpMethod::Put, HeartbeatUrl), 1);
}

}
