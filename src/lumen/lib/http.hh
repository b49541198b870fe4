// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"

namespace LM {

enum class lm_HttpMethod {
    Get,
    Post,
    Put,
    Delete
};
static const char *const lm_HttpMethodNames[] = {
    "GET",
    "POST",
    "PUT",
    "DELETE"
};

class lm_HttpClient {
public:
    virtual ~lm_HttpClient() = default;

    // Returns the HTTP status, or a negative value if the transfer failed (already logged).
    // Implementations must be safe to call from several threads at once.
    virtual int Perform(lm_HttpMethod method, const char *url, Span<const char> body,
                        HeapArray<uint8_t> *out_body) = 0;
};

std::unique_ptr<lm_HttpClient> lm_CreateCurlClient();

// Accepts absolute http:// and https:// URLs with a host, logs the reason otherwise
bool lm_CheckHttpAddress(const char *address);

}
