// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "lib/native/wrap/json.hh"
#include "backend.hh"
#include "http.hh"

#include <chrono>
#include <condition_variable>
#include <shared_mutex>
#include <thread>

namespace LM {

static const char *const HandshakePath = "/razer/chromasdk";

static const char *const CategoryPaths[] = {
    "/keyboard",
    "/mouse",
    "/mousepad",
    "/headset",
    "/keypad",
    "/chromalink"
};
static const char *const CategoryWireNames[] = {
    "keyboard",
    "mouse",
    "mousepad",
    "headset",
    "keypad",
    "chromalink"
};
static const char *const EffectWireNames[] = {
    "CHROMA_NONE",
    "CHROMA_STATIC",
    "CHROMA_CUSTOM"
};

// Immutable once published, swapped as a whole on session transitions
struct RestSession: public RetainObject<RestSession> {
    int64_t id = -1;
    const char *address = nullptr;

    std::shared_ptr<lm_HttpClient> http;

    BlockAllocator str_alloc;
};

// Owned jointly by the backend and its keep-alive thread, which may outlive the backend
// when the health callback disposes or destroys it
struct HeartbeatControl: public RetainObject<HeartbeatControl> {
    int interval = 0;

    std::mutex mutex;
    std::condition_variable cv;
    bool stop = false;
};

enum class RestState {
    Uninitialized,
    Initializing,
    Active,
    Disposed
};

struct RestReply {
    bool null = true;

    bool has_result = false;
    bool result = false;
    int64_t code = 0;

    bool has_id = false;
    lm_Guid id = {};

    int64_t session = -1;
    const char *uri = nullptr;
    int64_t tick = -1;
};

class RestBackend: public lm_Backend {
    const char *endpoint;
    int heartbeat_interval;

    std::shared_ptr<lm_HttpClient> http;

    std::mutex state_mutex;
    RestState state = RestState::Uninitialized;

    std::shared_mutex session_mutex;
    RetainPtr<const RestSession> session;

    RetainPtr<HeartbeatControl> heartbeat;
    std::thread heartbeat_thread;

    BlockAllocator str_alloc;

public:
    RestBackend(const lm_BackendConfig &config, std::unique_ptr<lm_HttpClient> http);
    ~RestBackend();

    lm_BackendType GetType() const override { return lm_BackendType::Rest; }
    bool IsSupported(lm_Capability cap) const override;

    lm_Result Initialize(const lm_AppInfo &app, lm_CallError *out_err = nullptr) override;
    lm_Result Uninitialize(lm_CallError *out_err = nullptr) override;
    void Dispose() override;

    lm_Result CreateEffect(lm_DeviceCategory category, const lm_EffectData &effect,
                           lm_Guid *out_id, lm_CallError *out_err = nullptr) override;
    lm_Result CreateDeviceEffect(const lm_Guid &device, const lm_EffectData &effect,
                                 lm_Guid *out_id, lm_CallError *out_err = nullptr) override;
    lm_Result SetEffect(const lm_Guid &id, lm_CallError *out_err = nullptr) override;
    lm_Result DeleteEffect(const lm_Guid &id, lm_CallError *out_err = nullptr) override;

    lm_Result QueryDevice(const lm_Guid &device, lm_DeviceInfo *out_info,
                          lm_CallError *out_err = nullptr) override;
    lm_Result RegisterEventNotifications(void *handle, lm_CallError *out_err = nullptr) override;
    lm_Result UnregisterEventNotifications(lm_CallError *out_err = nullptr) override;

private:
    RetainPtr<const RestSession> GetSession();

    lm_Result Call(lm_HttpMethod method, const char *path, Span<const char> body, lm_Result logical,
                   Allocator *alloc, RestReply *out_reply, lm_CallError *out_err);
    lm_Result Call(const RestSession &session, lm_HttpMethod method, const char *path, Span<const char> body,
                   lm_Result logical, bool check_result, Allocator *alloc, RestReply *out_reply, lm_CallError *out_err);

    void StopHeartbeat();
    std::thread Shutdown();
    void JoinHeartbeat(std::thread *thread);

    void RunHeartbeat(RetainPtr<HeartbeatControl> ctl);
    bool SendHeartbeat(HeartbeatControl *ctl);
};

static bool ParseReply(Span<const uint8_t> body, Allocator *alloc, RestReply *out_reply)
{
    RestReply reply;

    if (!TrimStr(body.As<const char>()).len) {
        *out_reply = reply;
        return true;
    }

    json_Parser json(body.As<const char>(), "<response>", alloc);

    json.PushLogFilter();
    LM_DEFER { PopLogFilter(); };

    if (json.PeekToken() == json_TokenType::Null) {
        json.ParseNull();
        *out_reply = reply;

        return json.IsValid();
    }

    reply.null = false;

    for (json.ParseObject(); json.InObject(); ) {
        Span<const char> key = json.ParseKey();

        if (key == "result") {
            if (json.PeekToken() == json_TokenType::Bool) {
                json.ParseBool(&reply.result);
                reply.code = reply.result ? lm_SdkSuccess : lm_SdkFailed;
            } else {
                json.ParseInt(&reply.code);
                reply.result = (reply.code == lm_SdkSuccess);
            }
            reply.has_result = true;
        } else if (key == "effectId" || key == "id") {
            reply.has_id = true;

            if (!json.SkipNull()) {
                Span<const char> str = {};
                if (json.ParseString(&str) && !lm_ParseGuid(str, &reply.id))
                    return false;
            }
        } else if (key == "session" || key == "sessionid") {
            json.ParseInt(&reply.session);
        } else if (key == "uri") {
            json.ParseString(&reply.uri);
        } else if (key == "tick") {
            json.ParseInt(&reply.tick);
        } else {
            json.Skip();
        }
    }
    if (!json.IsValid())
        return false;

    *out_reply = reply;
    return true;
}

static void EncodeAppInfo(const lm_AppInfo &app, HeapArray<char> *out_buf)
{
    json_Writer json(out_buf);

    json.StartObject();

    json.Key("title"); json.String(app.title);
    json.Key("description"); json.String(app.description);
    json.Key("author"); json.StartObject();
        json.Key("name"); json.String(app.author);
        json.Key("contact"); json.String(app.contact);
    json.EndObject();
    json.Key("device_supported"); json.StartArray();
    for (Size i = 0; i < LM_LEN(CategoryWireNames); i++) {
        if (app.devices & (1u << i)) {
            json.String(CategoryWireNames[i]);
        }
    }
    json.EndArray();
    json.Key("category"); json.String(app.category == lm_AppCategory::Game ? "game" : "application");

    json.EndObject();
}

static void EncodeEffect(lm_DeviceCategory category, const lm_EffectData &effect, HeapArray<char> *out_buf)
{
    json_Writer json(out_buf);

    json.StartObject();
    json.Key("effect"); json.String(EffectWireNames[(int)effect.kind]);

    switch (effect.kind) {
        case lm_EffectKind::None: {} break;

        case lm_EffectKind::Static: {
            json.Key("param"); json.StartObject();
            json.Key("color"); json.Uint(lm_EncodeSdkColor(effect.colors[0]));
            json.EndObject();
        } break;

        case lm_EffectKind::Custom: {
            const lm_DeviceLayout &layout = lm_DeviceLayouts[(int)category];

            json.Key("param");

            if (layout.rows > 1) {
                json.StartArray();
                for (int i = 0; i < layout.rows; i++) {
                    json.StartArray();
                    for (int j = 0; j < layout.columns; j++) {
                        json.Uint(lm_EncodeSdkColor(effect.colors[i * layout.columns + j]));
                    }
                    json.EndArray();
                }
                json.EndArray();
            } else {
                json.StartArray();
                for (const RgbColor &color: effect.colors) {
                    json.Uint(lm_EncodeSdkColor(color));
                }
                json.EndArray();
            }
        } break;
    }

    json.EndObject();
}

static void EncodeEffectId(const lm_Guid &id, HeapArray<char> *out_buf)
{
    char str[64];
    Fmt(str, "%1", FmtCustom(id));

    json_Writer json(out_buf);

    json.StartObject();
    json.Key("id"); json.String(str);
    json.EndObject();
}

static Span<const char> NormalizeAddress(const char *address, Allocator *alloc)
{
    Span<const char> trimmed = TrimStrRight(TrimStr(address), "/");
    return DuplicateString(trimmed, alloc);
}

RestBackend::RestBackend(const lm_BackendConfig &config, std::unique_ptr<lm_HttpClient> http)
    : heartbeat_interval(config.heartbeat_interval), http(std::move(http))
{
    LM_ASSERT(this->http);
    LM_ASSERT(config.endpoint);
    LM_ASSERT(config.heartbeat_interval > 0);

    endpoint = NormalizeAddress(config.endpoint, &str_alloc).ptr;

    LogDebug("Control plane endpoint is %1", endpoint);
}

RestBackend::~RestBackend()
{
    Dispose();
}

bool RestBackend::IsSupported(lm_Capability cap) const
{
    switch (cap) {
        case lm_Capability::QueryDevice:
        case lm_Capability::EventNotifications:
        case lm_Capability::GenericDevices: return false;
    }

    LM_UNREACHABLE();
}

lm_Result RestBackend::Initialize(const lm_AppInfo &app, lm_CallError *out_err)
{
    std::lock_guard<std::mutex> lock(state_mutex);

    switch (state) {
        case RestState::Uninitialized: {} break;
        case RestState::Initializing:
        case RestState::Active: {
            LogError("Session is already initialized");
            return lm_Result::InvalidState;
        } break;
        case RestState::Disposed: {
            LogError("Backend has been disposed");
            return lm_Result::InvalidState;
        } break;
    }

    state = RestState::Initializing;
    LM_DEFER_N(err_guard) { state = RestState::Uninitialized; };

    BlockAllocator temp_alloc;

    const char *url = Fmt(&temp_alloc, "%1%2", endpoint, HandshakePath).ptr;
    LogInfo("Initializing session via %1", url);

    HeapArray<char> body;
    EncodeAppInfo(app, &body);

    HeapArray<uint8_t> response;
    int status = http->Perform(lm_HttpMethod::Post, url, body, &response);

    lm_FillCallError(url, "POST", status >= 0 ? status : -1, out_err);

    if (status < 0) {
        LogError("Failed to reach control plane at %1", endpoint);
        return lm_Result::InitError;
    }
    if (status < 200 || status >= 300) {
        LogError("Failed to initialize session: HTTP status %1", status);
        return lm_Result::InitError;
    }

    RestReply reply;
    if (!ParseReply(response, &temp_alloc, &reply))
        return lm_Result::InitError;
    if (reply.null) {
        LogError("Control plane returned no session data");
        return lm_Result::InitError;
    }
    if (reply.session < 0 || !reply.uri) {
        LogError("Control plane returned incomplete session data");
        return lm_Result::InitError;
    }
    if (!lm_CheckHttpAddress(reply.uri))
        return lm_Result::InitError;

    RestSession *ptr = new RestSession;
    RetainPtr<const RestSession> new_session(ptr, +[](RestSession *session) { delete session; });

    ptr->id = reply.session;
    ptr->address = NormalizeAddress(reply.uri, &ptr->str_alloc).ptr;
    ptr->http = http;

    // Publish the whole session at once, readers never see a half-switched address
    {
        std::unique_lock<std::shared_mutex> lock_session(session_mutex);
        session = new_session;
    }
    ResetHealth();

    LogInfo("New session %1 at %2", ptr->id, ptr->address);

    // Arm keep-alive timer, first tick after one full period
    {
        LM_ASSERT(!heartbeat_thread.joinable());

        HeartbeatControl *ctl = new HeartbeatControl;
        heartbeat = RetainPtr<HeartbeatControl>(ctl, +[](HeartbeatControl *ctl) { delete ctl; });

        ctl->interval = heartbeat_interval;
        heartbeat_thread = std::thread([this, ctl = heartbeat]() { RunHeartbeat(ctl); });
    }

    state = RestState::Active;
    err_guard.Disable();

    return lm_Result::Success;
}

lm_Result RestBackend::Uninitialize(lm_CallError *out_err)
{
    std::thread thread;
    lm_Result ret;

    {
        std::lock_guard<std::mutex> lock(state_mutex);

        if (state == RestState::Disposed)
            return lm_Result::Success;
        if (state != RestState::Active) {
            LogError("Cannot uninitialize without an active session");
            return lm_Result::InvalidState;
        }

        RetainPtr<const RestSession> current = GetSession();
        LM_ASSERT(current);

        // Ticks still in flight must not mistake the teardown for a lost session
        StopHeartbeat();

        BlockAllocator temp_alloc;
        RestReply reply;

        ret = Call(*current, lm_HttpMethod::Delete, "/", {}, lm_Result::CallError, true, &temp_alloc, &reply, out_err);

        if (ret == lm_Result::Success) {
            LogInfo("Closed session %1", current->id);
        } else {
            LogError("Teardown of session %1 failed, dropping it anyway", current->id);
        }

        thread = Shutdown();
    }

    JoinHeartbeat(&thread);
    return ret;
}

void RestBackend::Dispose()
{
    std::thread thread;

    {
        std::lock_guard<std::mutex> lock(state_mutex);

        if (state == RestState::Disposed)
            return;

        thread = Shutdown();
    }

    JoinHeartbeat(&thread);
}

lm_Result RestBackend::CreateEffect(lm_DeviceCategory category, const lm_EffectData &effect,
                                    lm_Guid *out_id, lm_CallError *out_err)
{
    if (category == lm_DeviceCategory::Generic) {
        LogError("Control plane does not support generic device effects");
        return lm_Result::Unsupported;
    }
    if (!lm_CheckEffect(category, effect))
        return lm_Result::EffectError;

    BlockAllocator temp_alloc;

    HeapArray<char> body;
    EncodeEffect(category, effect, &body);

    RestReply reply;
    lm_Result ret = Call(lm_HttpMethod::Post, CategoryPaths[(int)category], body, lm_Result::EffectError,
                         &temp_alloc, &reply, out_err);
    if (ret != lm_Result::Success)
        return ret;

    if (!reply.has_id || reply.id.IsNone()) {
        LogError("Control plane created %1 effect without identifier", lm_DeviceCategoryNames[(int)category]);
        return lm_Result::EffectError;
    }

    *out_id = reply.id;
    return lm_Result::Success;
}

lm_Result RestBackend::CreateDeviceEffect(const lm_Guid &, const lm_EffectData &, lm_Guid *, lm_CallError *)
{
    LogError("Control plane does not support generic device effects");
    return lm_Result::Unsupported;
}

lm_Result RestBackend::SetEffect(const lm_Guid &id, lm_CallError *out_err)
{
    BlockAllocator temp_alloc;

    HeapArray<char> body;
    EncodeEffectId(id, &body);

    RestReply reply;
    return Call(lm_HttpMethod::Put, "/effect", body, lm_Result::EffectError, &temp_alloc, &reply, out_err);
}

lm_Result RestBackend::DeleteEffect(const lm_Guid &id, lm_CallError *out_err)
{
    BlockAllocator temp_alloc;

    HeapArray<char> body;
    EncodeEffectId(id, &body);

    RestReply reply;
    return Call(lm_HttpMethod::Delete, "/effect", body, lm_Result::EffectError, &temp_alloc, &reply, out_err);
}

lm_Result RestBackend::QueryDevice(const lm_Guid &, lm_DeviceInfo *, lm_CallError *)
{
    LogError("Control plane does not support device queries");
    return lm_Result::Unsupported;
}

lm_Result RestBackend::RegisterEventNotifications(void *, lm_CallError *)
{
    LogError("Control plane does not support event notifications");
    return lm_Result::Unsupported;
}

lm_Result RestBackend::UnregisterEventNotifications(lm_CallError *)
{
    LogError("Control plane does not support event notifications");
    return lm_Result::Unsupported;
}

RetainPtr<const RestSession> RestBackend::GetSession()
{
    std::shared_lock<std::shared_mutex> lock(session_mutex);
    return session;
}

lm_Result RestBackend::Call(lm_HttpMethod method, const char *path, Span<const char> body, lm_Result logical,
                            Allocator *alloc, RestReply *out_reply, lm_CallError *out_err)
{
    RetainPtr<const RestSession> current = GetSession();

    if (!current) {
        std::lock_guard<std::mutex> lock(state_mutex);

        if (state == RestState::Disposed) {
            LogError("Backend has been disposed");
        } else {
            LogError("Session is not initialized");
        }
        return lm_Result::InvalidState;
    }

    return Call(*current, method, path, body, logical, true, alloc, out_reply, out_err);
}

lm_Result RestBackend::Call(const RestSession &session, lm_HttpMethod method, const char *path, Span<const char> body,
                            lm_Result logical, bool check_result, Allocator *alloc, RestReply *out_reply, lm_CallError *out_err)
{
    const char *method_name = lm_HttpMethodNames[(int)method];
    const char *url = Fmt(alloc, "%1%2", session.address, path).ptr;

    HeapArray<uint8_t> response;
    int status = session.http->Perform(method, url, body, &response);

    lm_CallError err;
    lm_FillCallError(url, method_name, status >= 0 ? status : -1, &err);
    LM_DEFER {
        if (out_err) {
            *out_err = err;
        }
    };

    if (status < 0) {
        LogError("Call to %1 %2 failed", method_name, url);
        return lm_Result::CallError;
    }

    RestReply reply;
    bool parsed = ParseReply(response, alloc, &reply);

    if (parsed && reply.has_result) {
        err.has_code = true;
        err.code = reply.code;
    }

    if (status < 200 || status >= 300) {
        LogError("Call to %1 %2 failed with HTTP status %3", method_name, url, status);
        return lm_Result::CallError;
    }
    if (!parsed) {
        LogError("Call to %1 %2 returned malformed data", method_name, url);
        return logical;
    }
    if (reply.null) {
        LogError("Call to %1 %2 returned no data", method_name, url);
        return logical;
    }
    if (check_result && !reply.result) {
        if (reply.has_result) {
            LogError("Call to %1 %2 reported failure (result 0x%3)", method_name, url, FmtHex((uint32_t)reply.code, 8));
        } else {
            LogError("Call to %1 %2 returned no result", method_name, url);
        }
        return logical;
    }

    *out_reply = reply;
    return lm_Result::Success;
}

void RestBackend::StopHeartbeat()
{
    if (!heartbeat)
        return;

    {
        std::lock_guard<std::mutex> lock(heartbeat->mutex);
        heartbeat->stop = true;
    }
    heartbeat->cv.notify_all();
}

// Must be called with state_mutex held, join the returned thread once it is released
std::thread RestBackend::Shutdown()
{
    StopHeartbeat();

    std::thread thread = std::move(heartbeat_thread);
    heartbeat = {};

    // In-flight calls keep their own reference to the session (and the transport)
    {
        std::unique_lock<std::shared_mutex> lock(session_mutex);
        session = {};
    }
    http.reset();

    state = RestState::Disposed;

    return thread;
}

void RestBackend::JoinHeartbeat(std::thread *thread)
{
    if (!thread->joinable())
        return;

    // Dispose() may run from the health callback, on the heartbeat thread itself.
    // The detached thread only touches its HeartbeatControl after that.
    if (thread->get_id() == std::this_thread::get_id()) {
        thread->detach();
    } else {
        thread->join();
    }
}

void RestBackend::RunHeartbeat(RetainPtr<HeartbeatControl> ctl)
{
    std::unique_lock<std::mutex> lock(ctl->mutex);

    for (;;) {
        bool stop = ctl->cv.wait_for(lock, std::chrono::milliseconds(ctl->interval),
                                     [&]() { return ctl->stop; });
        if (stop)
            break;

        lock.unlock();
        bool success = SendHeartbeat(ctl.GetRaw());
        lock.lock();

        // The session is gone (and maybe the backend too), leave without touching this
        if (!success)
            break;
    }
}

bool RestBackend::SendHeartbeat(HeartbeatControl *ctl)
{
    RetainPtr<const RestSession> current = GetSession();
    if (!current)
        return false;

    BlockAllocator temp_alloc;

    LogDebug("Sending heartbeat for session %1", current->id);

    RestReply reply;
    lm_CallError err;
    lm_Result ret = Call(*current, lm_HttpMethod::Put, "/heartbeat", {}, lm_Result::CallError, false,
                         &temp_alloc, &reply, &err);

    if (ret != lm_Result::Success) {
        bool stopping;
        {
            std::lock_guard<std::mutex> lock(ctl->mutex);
            stopping = ctl->stop;
        }

        if (stopping) {
            LogDebug("Ignoring failed heartbeat of session %1 during teardown", current->id);
            return false;
        }

        LogError("Keep-alive of session %1 failed, session is no longer healthy", current->id);

        // Last use of this, the callback is allowed to dispose or destroy the backend
        ReportFailure(err);

        return false;
    }

    LogDebug("Heartbeat complete, tick: %1", reply.tick);
    return true;
}

std::unique_ptr<lm_Backend> lm_OpenRestBackend(const lm_BackendConfig &config, std::unique_ptr<lm_HttpClient> http)
{
    std::unique_ptr<lm_Backend> backend = std::make_unique<RestBackend>(config, std::move(http));
    return backend;
}

}
