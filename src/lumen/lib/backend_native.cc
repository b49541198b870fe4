// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "backend.hh"

#if defined(_WIN32)
    #if !defined(NOMINMAX)
        #define NOMINMAX
    #endif
    #if !defined(WIN32_LEAN_AND_MEAN)
        #define WIN32_LEAN_AND_MEAN
    #endif
    #include <windows.h>
#else
    #include <dlfcn.h>
#endif

namespace LM {

// Functions exported by the SDK library, GUIDs travel by value
typedef int32_t SdkInitFunc();
typedef int32_t SdkUnInitFunc();
typedef int32_t SdkCreateCategoryEffectFunc(int type, const void *param, lm_Guid *out_id);
typedef int32_t SdkCreateEffectFunc(lm_Guid device, int type, const void *param, lm_Guid *out_id);
typedef int32_t SdkSetEffectFunc(lm_Guid id);
typedef int32_t SdkDeleteEffectFunc(lm_Guid id);
typedef int32_t SdkQueryDeviceFunc(lm_Guid device, void *out_info);
typedef int32_t SdkRegisterEventNotificationFunc(void *handle);
typedef int32_t SdkUnregisterEventNotificationFunc();

// Indexed by lm_DeviceCategory (except Generic)
static const char *const CreateFunctionNames[] = {
    "CreateKeyboardEffect",
    "CreateMouseEffect",
    "CreateMousepadEffect",
    "CreateHeadsetEffect",
    "CreateKeypadEffect",
    "CreateChromaLinkEffect"
};

// SDK effect type values for None, Static and Custom, they differ for each category
static const int EffectTypes[][3] = {
    { 0, 4, 2 }, // Keyboard
    { 0, 6, 8 }, // Mouse (CUSTOM2, the 9x7 grid)
    { 0, 4, 2 }, // Mousepad
    { 0, 1, 4 }, // Headset
    { 0, 5, 2 }, // Keypad
    { 0, 2, 1 }, // ChromaLink
    { 0, 6, 7 }  // Generic
};
static_assert(LM_LEN(EffectTypes) == LM_LEN(lm_DeviceCategoryNames));

static const int32_t MouseAllLeds = 0xFFFF;

#pragma pack(push, 8)
struct SdkStaticParam {
    uint32_t color;
};
struct SdkMouseStaticParam {
    int32_t led;
    uint32_t color;
};
struct SdkGenericStaticParam {
    size_t size;
    uint32_t param;
    uint32_t color;
};
struct SdkDeviceInfo {
    int32_t type;
    uint32_t connected;
};
#pragma pack(pop)

struct SdkModule {
#if defined(_WIN32)
    HMODULE h = nullptr;
#else
    void *h = nullptr;
#endif

    ~SdkModule() { Close(); }

    bool Open(const char *filename, bool log = true);
    void Close();

    void *Find(const char *name) const;
};

bool SdkModule::Open(const char *filename, bool log)
{
    LM_ASSERT(!h);

#if defined(_WIN32)
    h = LoadLibraryA(filename);

    if (!h) {
        if (log) {
            LogError("Failed to load SDK library '%1': error %2", filename, (unsigned int)GetLastError());
        }
        return false;
    }
#else
    h = dlopen(filename, RTLD_NOW | RTLD_LOCAL);

    if (!h) {
        if (log) {
            const char *msg = dlerror();

            if (msg && StartsWith(msg, filename)) {
                msg += strlen(filename);
            }
            while (msg && msg[0] && strchr(": ", msg[0])) {
                msg++;
            }

            LogError("Failed to load SDK library '%1': %2", filename, msg ? msg : "unknown error");
        }
        return false;
    }
#endif

    return true;
}

void SdkModule::Close()
{
    if (!h)
        return;

#if defined(_WIN32)
    FreeLibrary(h);
#else
    dlclose(h);
#endif
    h = nullptr;
}

void *SdkModule::Find(const char *name) const
{
#if defined(_WIN32)
    return (void *)GetProcAddress(h, name);
#else
    return dlsym(h, name);
#endif
}

enum class NativeState {
    Loaded,
    Active,
    Disposed
};

class NativeBackend: public lm_Backend {
    BlockAllocator str_alloc;
    const char *library;

    SdkModule module;

    SdkInitFunc *init = nullptr;
    SdkUnInitFunc *uninit = nullptr;
    SdkCreateCategoryEffectFunc *create_category_effects[LM_LEN(CreateFunctionNames)] = {};
    SdkCreateEffectFunc *create_effect = nullptr;
    SdkSetEffectFunc *set_effect = nullptr;
    SdkDeleteEffectFunc *delete_effect = nullptr;
    SdkQueryDeviceFunc *query_device = nullptr;
    SdkRegisterEventNotificationFunc *register_events = nullptr;
    SdkUnregisterEventNotificationFunc *unregister_events = nullptr;

    // The SDK makes no promise about thread safety
    std::mutex mutex;
    NativeState state = NativeState::Loaded;

public:
    NativeBackend(const char *library) : library(DuplicateString(library, &str_alloc).ptr) {}
    ~NativeBackend();

    bool Load();

    lm_BackendType GetType() const override { return lm_BackendType::Native; }
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
    bool CheckActive();
    bool CheckCall(const char *func, int32_t ret, lm_CallError *out_err);
};

NativeBackend::~NativeBackend()
{
    Dispose();
}

bool NativeBackend::Load()
{
    if (!module.Open(library))
        return false;

    bool valid = true;

    const auto find = [&](const char *name, auto **out_ptr) {
        void *ptr = module.Find(name);

        if (!ptr) {
            LogError("Missing function '%1' in SDK library '%2'", name, library);
            valid = false;
        }

        *out_ptr = (std::remove_reference_t<decltype(**out_ptr)> *)ptr;
    };

    find("Init", &init);
    find("UnInit", &uninit);
    for (Size i = 0; i < LM_LEN(CreateFunctionNames); i++) {
        find(CreateFunctionNames[i], &create_category_effects[i]);
    }
    find("CreateEffect", &create_effect);
    find("SetEffect", &set_effect);
    find("DeleteEffect", &delete_effect);

    // Older SDK builds lack these, they are optional
    query_device = (SdkQueryDeviceFunc *)module.Find("QueryDevice");
    register_events = (SdkRegisterEventNotificationFunc *)module.Find("RegisterEventNotification");
    unregister_events = (SdkUnregisterEventNotificationFunc *)module.Find("UnregisterEventNotification");

    if (!valid) {
        module.Close();
        return false;
    }

    LogDebug("Loaded SDK library '%1'", library);
    return true;
}

bool NativeBackend::IsSupported(lm_Capability cap) const
{
    switch (cap) {
        case lm_Capability::QueryDevice: return query_device;
        case lm_Capability::EventNotifications: return register_events && unregister_events;
        case lm_Capability::GenericDevices: return true;
    }

    LM_UNREACHABLE();
}

lm_Result NativeBackend::Initialize(const lm_AppInfo &app, lm_CallError *out_err)
{
    std::lock_guard<std::mutex> lock(mutex);

    switch (state) {
        case NativeState::Loaded: {} break;
        case NativeState::Active: {
            LogError("SDK is already initialized");
            return lm_Result::InvalidState;
        } break;
        case NativeState::Disposed: {
            LogError("Backend has been disposed");
            return lm_Result::InvalidState;
        } break;
    }

    LogInfo("Initializing SDK for '%1'", app.title);

    int32_t ret = init();
    if (!CheckCall("Init", ret, out_err))
        return lm_Result::InitError;

    ResetHealth();
    state = NativeState::Active;

    return lm_Result::Success;
}

lm_Result NativeBackend::Uninitialize(lm_CallError *out_err)
{
    std::lock_guard<std::mutex> lock(mutex);

    if (state == NativeState::Disposed)
        return lm_Result::Success;
    if (state != NativeState::Active) {
        LogError("Cannot uninitialize without an active session");
        return lm_Result::InvalidState;
    }

    int32_t ret = uninit();
    bool success = CheckCall("UnInit", ret, out_err);

    module.Close();
    state = NativeState::Disposed;

    return success ? lm_Result::Success : lm_Result::CallError;
}

void NativeBackend::Dispose()
{
    std::lock_guard<std::mutex> lock(mutex);

    if (state == NativeState::Disposed)
        return;

    if (state == NativeState::Active) {
        int32_t ret = uninit();

        if (ret != (int32_t)lm_SdkSuccess) {
            LogDebug("SDK shutdown returned 0x%1", FmtHex((uint32_t)ret, 8));
        }
    }

    module.Close();
    state = NativeState::Disposed;
}

lm_Result NativeBackend::CreateEffect(lm_DeviceCategory category, const lm_EffectData &effect,
                                      lm_Guid *out_id, lm_CallError *out_err)
{
    if (category == lm_DeviceCategory::Generic) {
        LogError("Use device effects for generic devices");
        return lm_Result::Unsupported;
    }
    if (!lm_CheckEffect(category, effect))
        return lm_Result::EffectError;

    std::lock_guard<std::mutex> lock(mutex);

    if (!CheckActive())
        return lm_Result::InvalidState;

    int type = EffectTypes[(int)category][(int)effect.kind];

    SdkStaticParam static_param = {};
    SdkMouseStaticParam mouse_param = {};
    uint32_t custom_param[LM_MAX_LEDS];
    const void *param = nullptr;

    switch (effect.kind) {
        case lm_EffectKind::None: {} break;

        case lm_EffectKind::Static: {
            if (category == lm_DeviceCategory::Mouse) {
                mouse_param.led = MouseAllLeds;
                mouse_param.color = lm_EncodeSdkColor(effect.colors[0]);
                param = &mouse_param;
            } else {
                static_param.color = lm_EncodeSdkColor(effect.colors[0]);
                param = &static_param;
            }
        } break;

        case lm_EffectKind::Custom: {
            for (Size i = 0; i < effect.colors.len; i++) {
                custom_param[i] = lm_EncodeSdkColor(effect.colors[i]);
            }
            param = custom_param;
        } break;
    }

    lm_Guid id = {};
    int32_t ret = create_category_effects[(int)category](type, param, &id);

    if (!CheckCall(CreateFunctionNames[(int)category], ret, out_err))
        return lm_Result::EffectError;
    if (id.IsNone()) {
        LogError("SDK created %1 effect without identifier", lm_DeviceCategoryNames[(int)category]);
        return lm_Result::EffectError;
    }

    *out_id = id;
    return lm_Result::Success;
}

lm_Result NativeBackend::CreateDeviceEffect(const lm_Guid &device, const lm_EffectData &effect,
                                            lm_Guid *out_id, lm_CallError *out_err)
{
    if (!lm_CheckEffect(lm_DeviceCategory::Generic, effect))
        return lm_Result::EffectError;

    std::lock_guard<std::mutex> lock(mutex);

    if (!CheckActive())
        return lm_Result::InvalidState;

    int type = EffectTypes[(int)lm_DeviceCategory::Generic][(int)effect.kind];

    SdkGenericStaticParam static_param = {};
    const void *param = nullptr;

    if (effect.kind == lm_EffectKind::Static) {
        static_param.size = LM_SIZE(static_param);
        static_param.color = lm_EncodeSdkColor(effect.colors[0]);
        param = &static_param;
    }

    lm_Guid id = {};
    int32_t ret = create_effect(device, type, param, &id);

    if (!CheckCall("CreateEffect", ret, out_err))
        return lm_Result::EffectError;
    if (id.IsNone()) {
        LogError("SDK created device effect without identifier");
        return lm_Result::EffectError;
    }

    *out_id = id;
    return lm_Result::Success;
}

lm_Result NativeBackend::SetEffect(const lm_Guid &id, lm_CallError *out_err)
{
    std::lock_guard<std::mutex> lock(mutex);

    if (!CheckActive())
        return lm_Result::InvalidState;

    int32_t ret = set_effect(id);
    if (!CheckCall("SetEffect", ret, out_err))
        return lm_Result::EffectError;

    return lm_Result::Success;
}

lm_Result NativeBackend::DeleteEffect(const lm_Guid &id, lm_CallError *out_err)
{
    std::lock_guard<std::mutex> lock(mutex);

    if (!CheckActive())
        return lm_Result::InvalidState;

    int32_t ret = delete_effect(id);
    if (!CheckCall("DeleteEffect", ret, out_err))
        return lm_Result::EffectError;

    return lm_Result::Success;
}

lm_Result NativeBackend::QueryDevice(const lm_Guid &device, lm_DeviceInfo *out_info, lm_CallError *out_err)
{
    if (!query_device) {
        LogError("This SDK build cannot query devices");
        return lm_Result::Unsupported;
    }

    std::lock_guard<std::mutex> lock(mutex);

    if (!CheckActive())
        return lm_Result::InvalidState;

    SdkDeviceInfo info = {};
    int32_t ret = query_device(device, &info);

    if (!CheckCall("QueryDevice", ret, out_err))
        return lm_Result::CallError;

    out_info->type = info.type;
    out_info->connected = info.connected;

    return lm_Result::Success;
}

lm_Result NativeBackend::RegisterEventNotifications(void *handle, lm_CallError *out_err)
{
    if (!register_events || !unregister_events) {
        LogError("This SDK build does not support event notifications");
        return lm_Result::Unsupported;
    }

    std::lock_guard<std::mutex> lock(mutex);

    if (!CheckActive())
        return lm_Result::InvalidState;

    int32_t ret = register_events(handle);
    if (!CheckCall("RegisterEventNotification", ret, out_err))
        return lm_Result::CallError;

    return lm_Result::Success;
}

lm_Result NativeBackend::UnregisterEventNotifications(lm_CallError *out_err)
{
    if (!register_events || !unregister_events) {
        LogError("This SDK build does not support event notifications");
        return lm_Result::Unsupported;
    }

    std::lock_guard<std::mutex> lock(mutex);

    if (!CheckActive())
        return lm_Result::InvalidState;

    int32_t ret = unregister_events();
    if (!CheckCall("UnregisterEventNotification", ret, out_err))
        return lm_Result::CallError;

    return lm_Result::Success;
}

bool NativeBackend::CheckActive()
{
    switch (state) {
        case NativeState::Loaded: {
            LogError("SDK is not initialized");
            return false;
        } break;
        case NativeState::Active: return true;
        case NativeState::Disposed: {
            LogError("Backend has been disposed");
            return false;
        } break;
    }

    LM_UNREACHABLE();
}

bool NativeBackend::CheckCall(const char *func, int32_t ret, lm_CallError *out_err)
{
    if (ret == (int32_t)lm_SdkSuccess)
        return true;

    LogError("SDK function %1() failed with code 0x%2", func, FmtHex((uint32_t)ret, 8));

    if (out_err) {
        lm_FillCallError(library, func, -1, out_err);
        out_err->has_code = true;
        out_err->code = ret;
    }

    return false;
}

std::unique_ptr<lm_Backend> lm_OpenNativeBackend(const char *library)
{
    std::unique_ptr<NativeBackend> backend = std::make_unique<NativeBackend>(library);

    if (!backend->Load())
        return nullptr;

    return backend;
}

#if defined(_WIN32)

static bool ReadRegistryDword(const char *key, const char *name, uint32_t *out_value)
{
    DWORD value = 0;
    DWORD len = LM_SIZE(value);

    if (RegGetValueA(HKEY_LOCAL_MACHINE, key, name, RRF_RT_REG_DWORD, nullptr, &value, &len))
        return false;

    *out_value = (uint32_t)value;
    return true;
}

#endif

bool lm_DetectSdk(const char *library, lm_SdkVersion *out_version, bool *out_known)
{
    *out_version = {};
    *out_known = false;

#if defined(_WIN32)
    #if defined(_WIN64)
        const char *key = "SOFTWARE\\WOW6432Node\\Razer Chroma SDK";
    #else
        const char *key = "SOFTWARE\\Razer Chroma SDK";
    #endif

    uint32_t enabled = 0;

    if (ReadRegistryDword(key, "Enable", &enabled)) {
        uint32_t major = 0;
        uint32_t minor = 0;
        uint32_t revision = 0;

        ReadRegistryDword(key, "MajorVersion", &major);
        ReadRegistryDword(key, "MinorVersion", &minor);
        ReadRegistryDword(key, "RevisionNumber", &revision);

        out_version->major = (int)major;
        out_version->minor = (int)minor;
        out_version->revision = (int)revision;
        *out_known = true;

        if (!enabled) {
            LogDebug("SDK %1.%2.%3 is installed but disabled", major, minor, revision);
            return false;
        }
    }
#endif

    SdkModule module;
    if (!module.Open(library, false)) {
        LogDebug("SDK library '%1' cannot be loaded", library);
        return false;
    }

    return true;
}

}
