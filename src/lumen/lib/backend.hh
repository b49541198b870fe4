// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"
#include "types.hh"

namespace LM {

class lm_HttpClient;

enum class lm_BackendType {
    Rest,
    Native
};
static const char *const lm_BackendTypeNames[] = {
    "Rest",
    "Native"
};

struct lm_BackendConfig {
    lm_BackendType type = lm_BackendType::Rest;

    const char *endpoint = "http://localhost:54235";
    int heartbeat_interval = 1000;

    const char *library = nullptr; // Platform default if NULL
};

const char *lm_GetDefaultLibrary();

typedef void lm_HealthFunc(const lm_CallError &err);

class lm_Backend {
    mutable std::mutex health_mutex;
    bool healthy = true;
    lm_CallError health_error;
    std::function<lm_HealthFunc> health_func;

public:
    virtual ~lm_Backend() = default;

    virtual lm_BackendType GetType() const = 0;
    virtual bool IsSupported(lm_Capability cap) const = 0;

    virtual lm_Result Initialize(const lm_AppInfo &app, lm_CallError *out_err = nullptr) = 0;
    // Graceful teardown, calling it again once done is a no-op
    virtual lm_Result Uninitialize(lm_CallError *out_err = nullptr) = 0;
    // Unconditional and idempotent teardown, nothing works afterwards
    virtual void Dispose() = 0;

    virtual lm_Result CreateEffect(lm_DeviceCategory category, const lm_EffectData &effect,
                                   lm_Guid *out_id, lm_CallError *out_err = nullptr) = 0;
    virtual lm_Result CreateDeviceEffect(const lm_Guid &device, const lm_EffectData &effect,
                                         lm_Guid *out_id, lm_CallError *out_err = nullptr) = 0;
    virtual lm_Result SetEffect(const lm_Guid &id, lm_CallError *out_err = nullptr) = 0;
    virtual lm_Result DeleteEffect(const lm_Guid &id, lm_CallError *out_err = nullptr) = 0;

    virtual lm_Result QueryDevice(const lm_Guid &device, lm_DeviceInfo *out_info,
                                  lm_CallError *out_err = nullptr) = 0;
    virtual lm_Result RegisterEventNotifications(void *handle, lm_CallError *out_err = nullptr) = 0;
    virtual lm_Result UnregisterEventNotifications(lm_CallError *out_err = nullptr) = 0;

    // Failures that happen off the caller's stack (such as keep-alive calls) land here
    bool IsHealthy() const;
    bool GetHealthError(lm_CallError *out_err) const;
    void SetHealthCallback(const std::function<lm_HealthFunc> &func);

protected:
    void ReportFailure(const lm_CallError &err);
    void ResetHealth();
};

std::unique_ptr<lm_Backend> lm_OpenBackend(const lm_BackendConfig &config);

std::unique_ptr<lm_Backend> lm_OpenRestBackend(const lm_BackendConfig &config, std::unique_ptr<lm_HttpClient> http);
std::unique_ptr<lm_Backend> lm_OpenNativeBackend(const char *library);

struct lm_SdkVersion {
    int major = 0;
    int minor = 0;
    int revision = 0;
};

// Returns true if the SDK library can be loaded and is enabled
bool lm_DetectSdk(const char *library, lm_SdkVersion *out_version, bool *out_known);

void lm_FillCallError(const char *endpoint, const char *request, int status, lm_CallError *out_err);

}
