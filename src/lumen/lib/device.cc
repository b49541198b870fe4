// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "backend.hh"
#include "device.hh"

namespace LM {

lm_Device::lm_Device(lm_Backend *backend, lm_DeviceCategory category)
    : backend(backend), category(category)
{
    LM_ASSERT(backend);
}

lm_Guid lm_Device::GetCurrentEffect() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return current;
}

lm_Result lm_Device::SetEffect(lm_EffectKind kind, lm_CallError *out_err)
{
    lm_EffectData effect;
    effect.kind = kind;

    return SetEffect(effect, out_err);
}

lm_Result lm_Device::SetEffect(const lm_EffectData &effect, lm_CallError *out_err)
{
    std::lock_guard<std::mutex> lock(mutex);
    return Apply(effect, out_err);
}

lm_Result lm_Device::SetStatic(RgbColor color, lm_CallError *out_err)
{
    lm_EffectData effect = lm_MakeStaticEffect(color);
    return SetEffect(effect, out_err);
}

lm_Result lm_Device::SetCustom(Span<const RgbColor> colors, lm_CallError *out_err)
{
    if (colors.len > LM_MAX_LEDS) {
        LogError("Too many colors for custom %1 effect", lm_DeviceCategoryNames[(int)category]);
        return lm_Result::EffectError;
    }

    lm_EffectData effect = lm_MakeCustomEffect(colors);
    return SetEffect(effect, out_err);
}

lm_Result lm_Device::SetAll(RgbColor color, lm_CallError *out_err)
{
    return SetStatic(color, out_err);
}

lm_Result lm_Device::CreateEffect(const lm_EffectData &effect, lm_Guid *out_id, lm_CallError *out_err)
{
    return backend->CreateEffect(category, effect, out_id, out_err);
}

lm_Result lm_Device::Apply(const lm_EffectData &effect, lm_CallError *out_err)
{
    lm_Guid id = {};

    lm_Result ret = CreateEffect(effect, &id, out_err);
    if (ret != lm_Result::Success)
        return ret;

    // The previous effect is left alone, activating the new one replaces it on the device
    ret = backend->SetEffect(id, out_err);
    if (ret != lm_Result::Success)
        return ret;

    current = id;
    return lm_Result::Success;
}

RgbColor lm_LinkDevice::GetColor(Size idx) const
{
    if (idx < 0 || idx >= LM_LEN(colors)) {
        LogError("Link position %1 is out of range (0 to %2)", idx, LM_LEN(colors) - 1);
        return lm_Black;
    }

    std::lock_guard<std::mutex> lock(mutex);
    return colors[idx];
}

bool lm_LinkDevice::IsSet(Size idx) const
{
    return GetColor(idx) != lm_Black;
}

lm_Result lm_LinkDevice::SetColor(Size idx, RgbColor color, lm_CallError *out_err)
{
    if (idx < 0 || idx >= LM_LEN(colors)) {
        LogError("Link position %1 is out of range (0 to %2)", idx, LM_LEN(colors) - 1);
        return lm_Result::EffectError;
    }

    std::lock_guard<std::mutex> lock(mutex);

    RgbColor prev = colors[idx];
    colors[idx] = color;

    lm_EffectData effect = lm_MakeCustomEffect(colors);

    lm_Result ret = Apply(effect, out_err);
    if (ret != lm_Result::Success) {
        colors[idx] = prev;
        return ret;
    }

    return lm_Result::Success;
}

lm_Result lm_LinkDevice::SetEffect(const lm_EffectData &effect, lm_CallError *out_err)
{
    std::lock_guard<std::mutex> lock(mutex);

    lm_Result ret = Apply(effect, out_err);
    if (ret != lm_Result::Success)
        return ret;

    // Keep the local buffer in sync with what the device shows
    switch (effect.kind) {
        case lm_EffectKind::None: {
            for (RgbColor &color: colors) {
                color = lm_Black;
            }
        } break;
        case lm_EffectKind::Static: {
            for (RgbColor &color: colors) {
                color = effect.colors[0];
            }
        } break;
        case lm_EffectKind::Custom: {
            MemCpy(colors, effect.colors.data, LM_SIZE(colors));
        } break;
    }

    return lm_Result::Success;
}

lm_Result lm_LinkDevice::SetAll(RgbColor color, lm_CallError *out_err)
{
    lm_EffectData effect = lm_MakeStaticEffect(color);
    return SetEffect(effect, out_err);
}

lm_Result lm_GenericDevice::SetAll(RgbColor, lm_CallError *)
{
    LogError("Generic devices have no known layout, cannot set all LEDs");
    return lm_Result::Unsupported;
}

lm_Result lm_GenericDevice::CreateEffect(const lm_EffectData &effect, lm_Guid *out_id, lm_CallError *out_err)
{
    if (effect.kind == lm_EffectKind::Custom) {
        LogError("Generic devices do not support custom effects");
        return lm_Result::Unsupported;
    }

    return backend->CreateDeviceEffect(device_id, effect, out_id, out_err);
}

lm_DeviceDirectory::lm_DeviceDirectory(lm_Backend *backend, Span<const lm_Guid> allowed)
    : backend(backend)
{
    LM_ASSERT(backend);
    this->allowed.Append(allowed);
}

lm_DeviceDirectory::~lm_DeviceDirectory()
{
    Close();
}

bool lm_DeviceDirectory::IsAllowed(const lm_Guid &device_id) const
{
    for (const lm_Guid &id: allowed) {
        if (id == device_id)
            return true;
    }

    return false;
}

lm_Device *lm_DeviceDirectory::Open(lm_DeviceCategory category)
{
    if (category == lm_DeviceCategory::Generic) {
        LogError("Generic devices must be opened by identifier");
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(mutex);

    std::unique_ptr<lm_Device> *ptr = &devices[(int)category];

    if (!*ptr) {
        if (category == lm_DeviceCategory::ChromaLink) {
            *ptr = std::make_unique<lm_LinkDevice>(backend);
        } else {
            *ptr = std::make_unique<lm_Device>(backend, category);
        }

        LogDebug("Opened %1 device", lm_DeviceCategoryNames[(int)category]);
    }

    return ptr->get();
}

lm_Result lm_DeviceDirectory::OpenGeneric(const lm_Guid &device_id, lm_GenericDevice **out_device)
{
    if (!IsAllowed(device_id)) {
        LogError("Device %1 is not a known generic device", FmtCustom(device_id));
        return lm_Result::UnsupportedDevice;
    }

    std::lock_guard<std::mutex> lock(mutex);

    for (const std::unique_ptr<lm_GenericDevice> &device: generics) {
        if (device->GetDeviceId() == device_id) {
            *out_device = device.get();
            return lm_Result::Success;
        }
    }

    std::unique_ptr<lm_GenericDevice> device = std::make_unique<lm_GenericDevice>(backend, device_id);
    *out_device = device.get();
    generics.Append(std::move(device));

    LogDebug("Opened generic device %1", FmtCustom(device_id));

    return lm_Result::Success;
}

void lm_DeviceDirectory::Close()
{
    std::lock_guard<std::mutex> lock(mutex);

    const auto clear = [&](lm_Device *device) {
        if (device->GetCurrentEffect().IsNone())
            return;

        lm_Result ret = device->Clear();

        if (ret != lm_Result::Success) {
            LogDebug("Could not clear %1 device on close: %2",
                     lm_DeviceCategoryNames[(int)device->GetCategory()], lm_ResultNames[(int)ret]);
        }
    };

    for (std::unique_ptr<lm_Device> &device: devices) {
        if (device) {
            clear(device.get());
            device.reset();
        }
    }
    for (std::unique_ptr<lm_GenericDevice> &device: generics) {
        clear(device.get());
    }
    generics.Clear();
}

}
