// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"
#include "types.hh"

namespace LM {

class lm_Backend;

// SetEffect() calls on the same device run one at a time, in no particular
// order. The last one to run wins.
class lm_Device {
protected:
    lm_Backend *backend;
    lm_DeviceCategory category;

    mutable std::mutex mutex;
    lm_Guid current = {};

public:
    lm_Device(lm_Backend *backend, lm_DeviceCategory category);
    virtual ~lm_Device() = default;

    lm_DeviceCategory GetCategory() const { return category; }
    lm_Guid GetCurrentEffect() const;

    lm_Result SetEffect(lm_EffectKind kind, lm_CallError *out_err = nullptr);
    virtual lm_Result SetEffect(const lm_EffectData &effect, lm_CallError *out_err = nullptr);

    lm_Result SetStatic(RgbColor color, lm_CallError *out_err = nullptr);
    lm_Result SetCustom(Span<const RgbColor> colors, lm_CallError *out_err = nullptr);
    virtual lm_Result SetAll(RgbColor color, lm_CallError *out_err = nullptr);

    lm_Result Clear(lm_CallError *out_err = nullptr) { return SetEffect(lm_EffectKind::None, out_err); }

protected:
    virtual lm_Result CreateEffect(const lm_EffectData &effect, lm_Guid *out_id, lm_CallError *out_err);

    // Call with mutex held
    lm_Result Apply(const lm_EffectData &effect, lm_CallError *out_err);
};

class lm_LinkDevice: public lm_Device {
    RgbColor colors[5] = {};

public:
    lm_LinkDevice(lm_Backend *backend) : lm_Device(backend, lm_DeviceCategory::ChromaLink) {}

    Size GetSize() const { return LM_LEN(colors); }

    RgbColor GetColor(Size idx) const;
    bool IsSet(Size idx) const;

    // Each write submits the whole buffer as a new custom effect
    lm_Result SetColor(Size idx, RgbColor color, lm_CallError *out_err = nullptr);

    lm_Result SetEffect(const lm_EffectData &effect, lm_CallError *out_err = nullptr) override;
    lm_Result SetAll(RgbColor color, lm_CallError *out_err = nullptr) override;

    using lm_Device::SetEffect;
};

class lm_GenericDevice: public lm_Device {
    lm_Guid device_id;

public:
    lm_GenericDevice(lm_Backend *backend, const lm_Guid &device_id)
        : lm_Device(backend, lm_DeviceCategory::Generic), device_id(device_id) {}

    const lm_Guid &GetDeviceId() const { return device_id; }

    lm_Result SetAll(RgbColor color, lm_CallError *out_err = nullptr) override;

protected:
    lm_Result CreateEffect(const lm_EffectData &effect, lm_Guid *out_id, lm_CallError *out_err) override;
};

class lm_DeviceDirectory {
    lm_Backend *backend;

    HeapArray<lm_Guid> allowed;

    std::mutex mutex;
    std::unique_ptr<lm_Device> devices[LM_LEN(lm_DeviceCategoryNames) - 1];
    HeapArray<std::unique_ptr<lm_GenericDevice>> generics;

public:
    lm_DeviceDirectory(lm_Backend *backend, Span<const lm_Guid> allowed = lm_KnownGenericDevices);
    ~lm_DeviceDirectory();

    bool IsAllowed(const lm_Guid &device_id) const;

    // Devices stay owned by the directory, the same instance is returned on each call
    // Returns nullptr for Generic, use OpenGeneric() instead
    lm_Device *Open(lm_DeviceCategory category);
    lm_LinkDevice *OpenLink() { return (lm_LinkDevice *)Open(lm_DeviceCategory::ChromaLink); }
    lm_Result OpenGeneric(const lm_Guid &device_id, lm_GenericDevice **out_device);

    // Best effort, devices are cleared but failures are only logged
    void Close();
};

}
