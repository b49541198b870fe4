// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "src/lumen/lib/liblumen.hh"

#if !defined(LUMEN_VERSION)
    #define LUMEN_VERSION "dev"
#endif

extern "C" const char *AppTarget = "lumen";
extern "C" const char *AppVersion = LUMEN_VERSION;

namespace LM {

static const char *const DefaultConfigFilename = "lumen.ini";

static bool LoadConfigFile(const char *filename, lm_Config *out_config)
{
    if (!filename) {
        if (!TestFile(DefaultConfigFilename))
            return true;
        filename = DefaultConfigFilename;
    }

    LogDebug("Loading configuration from '%1'", filename);
    return lm_LoadConfig(filename, out_config);
}

static std::unique_ptr<lm_Backend> StartBackend(const lm_Config &config)
{
    std::unique_ptr<lm_Backend> backend = lm_OpenBackend(config.backend);
    if (!backend)
        return nullptr;

    backend->SetHealthCallback([](const lm_CallError &err) {
        if (err.status >= 0) {
            LogError("Lighting session was lost (%1 %2: HTTP %3)", err.request, err.endpoint, err.status);
        } else {
            LogError("Lighting session was lost (%1 %2)", err.request, err.endpoint);
        }
    });

    if (backend->Initialize(config.app) != lm_Result::Success)
        return nullptr;

    return backend;
}

static bool StopBackend(lm_Backend *backend, int64_t hold)
{
    if (hold > 0) {
        LogInfo("Holding effects for %1 ms", hold);
        WaitDelay(hold);
    }

    bool success = backend->IsHealthy();

    lm_Result ret = backend->Uninitialize();
    success &= (ret == lm_Result::Success);

    return success;
}

static bool ParseCategory(Span<const char> str, lm_DeviceCategory *out_category)
{
    if (!OptionToEnumI(lm_DeviceCategoryNames, str, out_category) || *out_category == lm_DeviceCategory::Generic) {
        LogError("Unknown device category '%1'", str);
        return false;
    }

    return true;
}

static void PrintCategories(StreamWriter *st)
{
    for (Size i = 0; i < LM_LEN(lm_DeviceCategoryNames) - 1; i++) {
        const lm_DeviceLayout &layout = lm_DeviceLayouts[i];
        PrintLn(st, "    %!..+%1%!0 %!D..(%2x%3)%!0", FmtPad(lm_DeviceCategoryNames[i], 18), layout.rows, layout.columns);
    }
}

static int RunSet(Span<const char *> arguments)
{
    // Options
    const char *config_filename = nullptr;
    HeapArray<lm_DeviceCategory> categories;
    HeapArray<lm_Guid> generics;
    int64_t hold = 0;
    RgbColor color = {};

    const auto print_usage = [=](StreamWriter *st) {
        PrintLn(st,
R"(Usage: %!..+%1 set [option...] color%!0

Options:

    %!..+-C, --config_file filename%!0     Set configuration file
                                   %!D..(default: %2 if it exists)%!0
    %!..+-d, --device category%!0          Set device category (repeatable)
                                   %!D..(default: all categories of the application)%!0
    %!..+-g, --generic identifier%!0       Set generic device (repeatable)
        %!..+--hold ms%!0                  Keep session alive for some time

Supported categories:
)", AppTarget, DefaultConfigFilename);
        PrintCategories(st);
        PrintLn(st, R"(
A few predefined color names can be used (such as Red), or you can use
hexadecimal RGB color codes. Don't forget the quotes or your shell may not
like the hash character.

Predefined color names:
)");
        for (const lm_PredefinedColor &color: lm_PredefinedColors) {
            PrintLn(st, "    %!..+%1%!0    %!D..#%2%3%4%!0", FmtPad(color.name, 27), FmtHexSmall(color.rgb.red, 2),
                                                                                  FmtHexSmall(color.rgb.green, 2),
                                                                                  FmtHexSmall(color.rgb.blue, 2));
        }
    };

    // Parse options
    {
        OptionParser opt(arguments);

        while (opt.Next()) {
            if (opt.Test("--help")) {
                print_usage(StdOut);
                return 0;
            } else if (opt.Test("-C", "--config_file", OptionType::Value)) {
                config_filename = opt.current_value;
            } else if (opt.Test("-d", "--device", OptionType::Value)) {
                lm_DeviceCategory category;
                if (!ParseCategory(opt.current_value, &category))
                    return 1;
                categories.Append(category);
            } else if (opt.Test("-g", "--generic", OptionType::Value)) {
                lm_Guid id = {};
                if (!lm_ParseGuid(opt.current_value, &id))
                    return 1;
                generics.Append(id);
            } else if (opt.Test("--hold", OptionType::Value)) {
                if (!ParseInt(opt.current_value, &hold))
                    return 1;
            } else {
                opt.LogUnknownError();
                return 1;
            }
        }

        const char *str = opt.ConsumeNonOption();
        if (!str) {
            LogError("Missing color");
            return 1;
        }
        if (!lm_ParseColor(str, &color))
            return 1;

        opt.LogUnusedArguments();
    }

    lm_Config config;
    if (!LoadConfigFile(config_filename, &config))
        return 1;

    if (!categories.len && !generics.len) {
        for (Size i = 0; i < LM_LEN(lm_DeviceCategoryNames) - 1; i++) {
            if (config.app.devices & (1u << i)) {
                categories.Append((lm_DeviceCategory)i);
            }
        }
    }

    std::unique_ptr<lm_Backend> backend = StartBackend(config);
    if (!backend)
        return 1;

    bool success = true;
    {
        lm_DeviceDirectory directory(backend.get(), config.GetGenericDevices());

        for (lm_DeviceCategory category: categories) {
            lm_Device *device = directory.Open(category);
            success &= (device->SetAll(color) == lm_Result::Success);
        }

        if (generics.len && !backend->IsSupported(lm_Capability::GenericDevices)) {
            LogError("The %1 backend cannot drive generic devices", lm_BackendTypeNames[(int)backend->GetType()]);
            success = false;
        } else {
            for (const lm_Guid &id: generics) {
                lm_GenericDevice *device;
                if (directory.OpenGeneric(id, &device) != lm_Result::Success) {
                    success = false;
                    continue;
                }

                success &= (device->SetStatic(color) == lm_Result::Success);
            }
        }

        success &= StopBackend(backend.get(), hold);
    }

    if (!success)
        return 1;

    LogInfo("Done!");
    return 0;
}

static int RunLink(Span<const char *> arguments)
{
    // Options
    const char *config_filename = nullptr;
    int64_t hold = 0;
    int64_t idx = -1;
    RgbColor color = {};

    const auto print_usage = [=](StreamWriter *st) {
        PrintLn(st,
R"(Usage: %!..+%1 link [option...] index color%!0

Options:

    %!..+-C, --config_file filename%!0     Set configuration file
                                   %!D..(default: %2 if it exists)%!0
        %!..+--hold ms%!0                  Keep session alive for some time

Link devices have %3 positions, numbered from 0.)", AppTarget, DefaultConfigFilename,
                                                   lm_DeviceLayouts[(int)lm_DeviceCategory::ChromaLink].GetCount());
    };

    // Parse options
    {
        OptionParser opt(arguments);

        while (opt.Next()) {
            if (opt.Test("--help")) {
                print_usage(StdOut);
                return 0;
            } else if (opt.Test("-C", "--config_file", OptionType::Value)) {
                config_filename = opt.current_value;
            } else if (opt.Test("--hold", OptionType::Value)) {
                if (!ParseInt(opt.current_value, &hold))
                    return 1;
            } else {
                opt.LogUnknownError();
                return 1;
            }
        }

        const char *idx_str = opt.ConsumeNonOption();
        const char *color_str = opt.ConsumeNonOption();

        if (!idx_str || !color_str) {
            LogError("Missing index or color");
            return 1;
        }
        if (!ParseInt(idx_str, &idx))
            return 1;
        if (!lm_ParseColor(color_str, &color))
            return 1;

        opt.LogUnusedArguments();
    }

    lm_Config config;
    if (!LoadConfigFile(config_filename, &config))
        return 1;

    std::unique_ptr<lm_Backend> backend = StartBackend(config);
    if (!backend)
        return 1;

    bool success = true;
    {
        lm_DeviceDirectory directory(backend.get(), config.GetGenericDevices());
        lm_LinkDevice *link = directory.OpenLink();

        success &= (link->SetColor((Size)idx, color) == lm_Result::Success);
        success &= StopBackend(backend.get(), hold);
    }

    if (!success)
        return 1;

    LogInfo("Done!");
    return 0;
}

static int RunClear(Span<const char *> arguments)
{
    // Options
    const char *config_filename = nullptr;
    HeapArray<lm_DeviceCategory> categories;

    const auto print_usage = [=](StreamWriter *st) {
        PrintLn(st,
R"(Usage: %!..+%1 clear [option...]%!0

Options:

    %!..+-C, --config_file filename%!0     Set configuration file
                                   %!D..(default: %2 if it exists)%!0
    %!..+-d, --device category%!0          Clear device category (repeatable)
                                   %!D..(default: all categories of the application)%!0

Supported categories:
)", AppTarget, DefaultConfigFilename);
        PrintCategories(st);
    };

    // Parse options
    {
        OptionParser opt(arguments);

        while (opt.Next()) {
            if (opt.Test("--help")) {
                print_usage(StdOut);
                return 0;
            } else if (opt.Test("-C", "--config_file", OptionType::Value)) {
                config_filename = opt.current_value;
            } else if (opt.Test("-d", "--device", OptionType::Value)) {
                lm_DeviceCategory category;
                if (!ParseCategory(opt.current_value, &category))
                    return 1;
                categories.Append(category);
            } else {
                opt.LogUnknownError();
                return 1;
            }
        }

        opt.LogUnusedArguments();
    }

    lm_Config config;
    if (!LoadConfigFile(config_filename, &config))
        return 1;

    if (!categories.len) {
        for (Size i = 0; i < LM_LEN(lm_DeviceCategoryNames) - 1; i++) {
            if (config.app.devices & (1u << i)) {
                categories.Append((lm_DeviceCategory)i);
            }
        }
    }

    std::unique_ptr<lm_Backend> backend = StartBackend(config);
    if (!backend)
        return 1;

    bool success = true;
    {
        lm_DeviceDirectory directory(backend.get(), config.GetGenericDevices());

        for (lm_DeviceCategory category: categories) {
            lm_Device *device = directory.Open(category);
            success &= (device->Clear() == lm_Result::Success);
        }

        success &= StopBackend(backend.get(), 0);
    }

    if (!success)
        return 1;

    LogInfo("Done!");
    return 0;
}

static int RunDetect(Span<const char *> arguments)
{
    // Options
    const char *config_filename = nullptr;

    const auto print_usage = [=](StreamWriter *st) {
        PrintLn(st,
R"(Usage: %!..+%1 detect [option...]%!0

Options:

    %!..+-C, --config_file filename%!0     Set configuration file
                                   %!D..(default: %2 if it exists)%!0

Check whether the native SDK library can be used.)", AppTarget, DefaultConfigFilename);
    };

    // Parse options
    {
        OptionParser opt(arguments);

        while (opt.Next()) {
            if (opt.Test("--help")) {
                print_usage(StdOut);
                return 0;
            } else if (opt.Test("-C", "--config_file", OptionType::Value)) {
                config_filename = opt.current_value;
            } else {
                opt.LogUnknownError();
                return 1;
            }
        }

        opt.LogUnusedArguments();
    }

    lm_Config config;
    if (!LoadConfigFile(config_filename, &config))
        return 1;

    const char *library = config.backend.library ? config.backend.library : lm_GetDefaultLibrary();

    lm_SdkVersion version = {};
    bool known = false;
    bool available = lm_DetectSdk(library, &version, &known);

    PrintLn("Library: %!..+%1%!0", library);
    if (known) {
        PrintLn("Version: %!..+%1.%2.%3%!0", version.major, version.minor, version.revision);
    } else {
        PrintLn("Version: %!D..unknown%!0");
    }
    if (available) {
        PrintLn("Status:  %!G..available%!0");
    } else {
        PrintLn("Status:  %!R..unavailable%!0");
    }

    return available ? 0 : 1;
}

int Main(int argc, char **argv)
{
    // Options
    const auto print_usage = [](StreamWriter *st) {
        PrintLn(st,
R"(Usage: %!..+%1 command [arg...]%!0

Commands:

    %!..+set%!0                            Set all LEDs of one or more devices
    %!..+link%!0                           Set one position of a link device
    %!..+clear%!0                          Clear effects
    %!..+detect%!0                         Check native SDK availability

Use %!..+%1 help command%!0 or %!..+%1 command --help%!0 for more specific help.)", AppTarget);
    };

    if (argc < 2) {
        print_usage(StdErr);
        PrintLn(StdErr);
        LogError("No command provided");
        return 1;
    }

    const char *cmd = argv[1];
    Span<const char *> arguments((const char **)argv + 2, argc - 2);

    // Handle help and version arguments
    if (TestStr(cmd, "--help") || TestStr(cmd, "help")) {
        if (arguments.len && arguments[0][0] != '-') {
            cmd = arguments[0];
            arguments[0] = "--help";
        } else {
            print_usage(StdOut);
            return 0;
        }
    } else if (TestStr(cmd, "--version")) {
        PrintLn("%!R..%1%!0 %!..+%2%!0", AppTarget, AppVersion);
        return 0;
    }

    if (TestStr(cmd, "set")) {
        return RunSet(arguments);
    } else if (TestStr(cmd, "link")) {
        return RunLink(arguments);
    } else if (TestStr(cmd, "clear")) {
        return RunClear(arguments);
    } else if (TestStr(cmd, "detect")) {
        return RunDetect(arguments);
    } else {
        LogError("Unknown command '%1'", cmd);
        return 1;
    }
}

}

// C++ namespaces are stupid
int main(int argc, char **argv) { return LM::RunApp(argc, argv); }
