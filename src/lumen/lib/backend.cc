// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "backend.hh"
#include "http.hh"

namespace LM {

const char *lm_GetDefaultLibrary()
{
#if defined(_WIN32)
    #if defined(_WIN64)
        return "RzChromaSDK64.dll";
    #else
        return "RzChromaSDK.dll";
    #endif
#elif defined(__APPLE__)
    return "libRzChromaSDK.dylib";
#else
    return "libRzChromaSDK.so";
#endif
}

bool lm_Backend::IsHealthy() const
{
    std::lock_guard<std::mutex> lock(health_mutex);
    return healthy;
}

bool lm_Backend::GetHealthError(lm_CallError *out_err) const
{
    std::lock_guard<std::mutex> lock(health_mutex);

    if (healthy)
        return false;

    *out_err = health_error;
    return true;
}

void lm_Backend::SetHealthCallback(const std::function<lm_HealthFunc> &func)
{
    std::lock_guard<std::mutex> lock(health_mutex);
    health_func = func;
}

void lm_Backend::ReportFailure(const lm_CallError &err)
{
    std::function<lm_HealthFunc> func;

    {
        std::lock_guard<std::mutex> lock(health_mutex);

        healthy = false;
        health_error = err;
        func = health_func;
    }

    // Run outside the lock, the callback may very well query the backend
    if (func) {
        func(err);
    }
}

void lm_Backend::ResetHealth()
{
    std::lock_guard<std::mutex> lock(health_mutex);

    healthy = true;
    health_error = {};
}

void lm_FillCallError(const char *endpoint, const char *request, int status, lm_CallError *out_err)
{
    if (!out_err)
        return;

    CopyString(endpoint, out_err->endpoint);
    CopyString(request, out_err->request);
    out_err->status = status;
    out_err->has_code = false;
    out_err->code = 0;
}

std::unique_ptr<lm_Backend> lm_OpenBackend(const lm_BackendConfig &config)
{
    switch (config.type) {
        case lm_BackendType::Rest: {
            std::unique_ptr<lm_HttpClient> http = lm_CreateCurlClient();
            return lm_OpenRestBackend(config, std::move(http));
        } break;

        case lm_BackendType::Native: {
            const char *library = config.library ? config.library : lm_GetDefaultLibrary();
            return lm_OpenNativeBackend(library);
        } break;
    }

    LM_UNREACHABLE();
}

}
