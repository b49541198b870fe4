// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "base.hh"

#include <chrono>
#include <errno.h>
#include <limits.h>
#include <thread>
#if defined(_WIN32)
    #if !defined(NOMINMAX)
        #define NOMINMAX
    #endif
    #if !defined(WIN32_LEAN_AND_MEAN)
        #define WIN32_LEAN_AND_MEAN
    #endif
    #include <windows.h>
    #include <fcntl.h>
    #include <io.h>
    #include <sys/stat.h>

    #define STDOUT_FILENO 1
    #define STDERR_FILENO 2
#else
    #include <fcntl.h>
    #include <signal.h>
    #include <sys/stat.h>
    #include <unistd.h>
#endif

namespace LM {

extern "C" void AssertMessage(const char *filename, int line, const char *cond)
{
    Print(StdErr, "%1:%2: Assertion '%3' failed\n", filename, line, cond);
    StdErr->Flush();
}

// ------------------------------------------------------------------------
// Allocators
// ------------------------------------------------------------------------

class MallocAllocator final: public Allocator {
public:
    void *Allocate(Size size) override
    {
        void *ptr = malloc((size_t)std::max(size, (Size)1));
        if (!ptr)
            LM_BAD_ALLOC();
        return ptr;
    }

    void *Resize(void *ptr, Size, Size new_size) override
    {
        if (!new_size) {
            free(ptr);
            return nullptr;
        }

        void *new_ptr = realloc(ptr, (size_t)new_size);
        if (!new_ptr)
            LM_BAD_ALLOC();
        return new_ptr;
    }

    void Release(const void *ptr, Size) override { free((void *)ptr); }
};

Allocator *GetDefaultAllocator()
{
    // Never destroyed, global containers may release memory during static destruction
    static Allocator *alloc = new MallocAllocator;
    return alloc;
}

static inline Size RoundUp8(Size size)
{
    return (size + 7) & ~(Size)7;
}

BlockAllocator &BlockAllocator::operator=(BlockAllocator &&other)
{
    if (this != &other) {
        ReleaseAll();

        block_size = other.block_size;
        head = other.head;
        last = other.last;

        other.head = nullptr;
        other.last = nullptr;
    }

    return *this;
}

void *BlockAllocator::Allocate(Size size)
{
    LM_ASSERT(size >= 0);

    Size needed = RoundUp8(size);

    if (needed > block_size / 2) {
        Block *block = AddBlock(needed, !head);
        block->used = needed;

        return block->data;
    }

    if (!head || head->used + needed > head->size) {
        AddBlock(block_size, true);
    }

    last = head->data + head->used;
    head->used += needed;

    return last;
}

void *BlockAllocator::Resize(void *ptr, Size old_size, Size new_size)
{
    LM_ASSERT(old_size >= 0 && new_size >= 0);

    if (!ptr)
        return Allocate(new_size);
    if (!new_size) {
        Release(ptr, old_size);
        return nullptr;
    }

    // The most recent allocation can grow or shrink in place
    if (ptr == last) {
        Size used = (Size)(last - head->data) + RoundUp8(new_size);

        if (used <= head->size) {
            head->used = used;
            return ptr;
        }
    }

    void *new_ptr = Allocate(new_size);
    MemCpy(new_ptr, ptr, std::min(old_size, new_size));
    Release(ptr, old_size);

    return new_ptr;
}

void BlockAllocator::Release(const void *ptr, Size)
{
    // Only the latest allocation gives its space back, the rest waits for ReleaseAll()
    if (ptr && ptr == last) {
        head->used = (Size)(last - head->data);
        last = nullptr;
    }
}

void BlockAllocator::ReleaseAll()
{
    while (head) {
        Block *next = head->next;
        free(head);
        head = next;
    }

    last = nullptr;
}

BlockAllocator::Block *BlockAllocator::AddBlock(Size size, bool front)
{
    Block *block = (Block *)malloc(sizeof(Block) + (size_t)size);
    if (!block)
        LM_BAD_ALLOC();

    block->size = size;
    block->used = 0;

    if (front) {
        block->next = head;
        head = block;
        last = nullptr;
    } else {
        // Dedicated blocks go behind the current one, which may still have room
        block->next = head->next;
        head->next = block;
    }

    return block;
}

// ------------------------------------------------------------------------
// Strings
// ------------------------------------------------------------------------

bool CopyString(Span<const char> str, Span<char> buf)
{
    LM_ASSERT(buf.len > 0);

    Size copy_len = std::min(str.len, buf.len - 1);

    MemCpy(buf.ptr, str.ptr, copy_len);
    buf.ptr[copy_len] = 0;

    return copy_len == str.len;
}

Span<char> DuplicateString(Span<const char> str, Allocator *alloc)
{
    LM_ASSERT(alloc);

    char *copy = (char *)alloc->Allocate(str.len + 1);

    MemCpy(copy, str.ptr, str.len);
    copy[str.len] = 0;

    return MakeSpan(copy, str.len);
}

// ------------------------------------------------------------------------
// Format
// ------------------------------------------------------------------------

static Span<const char> FormatUnsigned(uint64_t value, int base, bool upper, char out_buf[32])
{
    const char *digits = upper ? "0123456789ABCDEF" : "0123456789abcdef";

    char *ptr = out_buf + 32;
    do {
        *--ptr = digits[value % (uint64_t)base];
        value /= (uint64_t)base;
    } while (value);

    return MakeSpan((const char *)ptr, out_buf + 32 - ptr);
}

static void AppendRepeat(char c, Size count, FunctionRef<void(Span<const char>)> append)
{
    for (Size i = 0; i < count; i++) {
        append(c);
    }
}

static void AppendSafe(Span<const char> str, FunctionRef<void(Span<const char>)> append)
{
    Size start = 0;

    for (Size i = 0; i < str.len; i++) {
        uint8_t c = (uint8_t)str.ptr[i];

        if ((c < ' ' && c != '\t') || c == 0x7F) {
            append(str.Take(start, i - start));
            start = i + 1;
        }
    }

    append(str.Take(start, str.len - start));
}

static void FormatArg(const FmtArg &arg, FunctionRef<void(Span<const char>)> append)
{
    char buf[32];

    switch (arg.type) {
        case FmtType::Str: { append(arg.u.str); } break;
        case FmtType::PadStr: {
            append(arg.u.str);
            AppendRepeat(arg.padding, arg.pad - arg.u.str.len, append);
        } break;
        case FmtType::SafeStr: { AppendSafe(arg.u.str, append); } break;

        case FmtType::Char: { append(arg.u.ch); } break;
        case FmtType::SafeChar: { AppendSafe(arg.u.ch, append); } break;

        case FmtType::Bool: { append(arg.u.b ? "true" : "false"); } break;

        case FmtType::Integer: {
            uint64_t magnitude = arg.u.i < 0 ? 0 - (uint64_t)arg.u.i : (uint64_t)arg.u.i;
            Span<const char> digits = FormatUnsigned(magnitude, 10, false, buf);

            if (arg.u.i < 0) {
                append('-');
            }
            AppendRepeat(arg.padding, arg.pad - digits.len - (arg.u.i < 0), append);
            append(digits);
        } break;
        case FmtType::Unsigned:
        case FmtType::Hex:
        case FmtType::SmallHex: {
            int base = (arg.type == FmtType::Unsigned) ? 10 : 16;
            Span<const char> digits = FormatUnsigned(arg.u.u, base, arg.type == FmtType::Hex, buf);

            AppendRepeat(arg.padding, arg.pad - digits.len, append);
            append(digits);
        } break;

        case FmtType::Custom: { arg.u.custom.Format(append); } break;
    }
}

// Handles %!XYS (foreground, background, style) and %!0, returns the length consumed
// after the '!'. Colors use the letters drgybmcw, uppercase for the bright variant.
static Size FormatAnsi(const char *spec, bool vt100, FunctionRef<void(Span<const char>)> append)
{
    static const char ColorLetters[] = "drgybmcw";

    if (spec[0] == '0') {
        if (vt100) {
            append("\x1B[0m");
        }
        return 1;
    }
    if (!spec[0] || !spec[1] || !spec[2])
        return (Size)strnlen(spec, 3);

    char seq[32];
    LocalArray<char, 32> codes;

    for (int i = 0; i < 2; i++) {
        char c = spec[i];
        const char *found = c ? strchr(ColorLetters, LowerAscii(c)) : nullptr;

        if (found) {
            bool bright = (c >= 'A' && c <= 'Z');
            int code = (i ? 40 : 30) + (bright ? 60 : 0) + (int)(found - ColorLetters);

            codes.Append(Fmt(codes.TakeAvailable(), ";%1", code));
        }
    }

    switch (spec[2]) {
        case '+': { codes.Append(Span<const char>(";1")); } break;
        case '-': { codes.Append(Span<const char>(";2")); } break;
        case '_': { codes.Append(Span<const char>(";4")); } break;
        case '^': { codes.Append(Span<const char>(";7")); } break;
    }

    if (vt100) {
        Span<const char> params = codes.len ? Span<const char>(codes.data + 1, codes.len - 1) : Span<const char>("0");
        append(Fmt(seq, "\x1B[%1m", params));
    }

    return 3;
}

static void DoFormat(const char *fmt, Span<const FmtArg> args, bool vt100,
                     FunctionRef<void(Span<const char>)> append)
{
    const char *ptr = fmt;

    while (ptr[0]) {
        const char *marker = strchr(ptr, '%');

        if (!marker) {
            append(ptr);
            break;
        }
        append(MakeSpan(ptr, marker - ptr));

        if (marker[1] >= '0' && marker[1] <= '9') {
            Size idx = 0;

            ptr = marker + 1;
            while (ptr[0] >= '0' && ptr[0] <= '9') {
                idx = idx * 10 + (ptr[0] - '0');
                ptr++;
            }

            if (idx >= 1 && idx <= args.len) {
                FormatArg(args[idx - 1], append);
            } else {
                append(MakeSpan(marker, ptr - marker));
            }
        } else if (marker[1] == '!') {
            ptr = marker + 2 + FormatAnsi(marker + 2, vt100, append);
        } else if (marker[1] == '%') {
            append('%');
            ptr = marker + 2;
        } else {
            append('%');
            ptr = marker + 1;
        }
    }
}

Span<char> FmtFmt(const char *fmt, Span<const FmtArg> args, bool vt100, Span<char> out_buf)
{
    LM_ASSERT(out_buf.len > 0);

    Size len = 0;

    // Excess output is dropped, the buffer always ends with a NUL byte
    DoFormat(fmt, args, vt100, [&](Span<const char> frag) {
        Size copy_len = std::min(frag.len, out_buf.len - 1 - len);

        MemCpy(out_buf.ptr + len, frag.ptr, copy_len);
        len += copy_len;
    });
    out_buf.ptr[len] = 0;

    return out_buf.Take(0, len);
}

Span<char> FmtFmt(const char *fmt, Span<const FmtArg> args, bool vt100, HeapArray<char> *out_buf)
{
    Size start = out_buf->len;

    DoFormat(fmt, args, vt100, [&](Span<const char> frag) { out_buf->Append(frag); });
    out_buf->Grow(1);
    out_buf->ptr[out_buf->len] = 0;

    return out_buf->Take(start, out_buf->len - start);
}

Span<char> FmtFmt(const char *fmt, Span<const FmtArg> args, bool vt100, Allocator *alloc)
{
    HeapArray<char> buf;
    FmtFmt(fmt, args, vt100, &buf);

    return DuplicateString(buf, alloc);
}

void PrintFmt(const char *fmt, Span<const FmtArg> args, StreamWriter *st)
{
    DoFormat(fmt, args, st->IsVt100(), [&](Span<const char> frag) { st->Write(frag); });
}

void PrintLn(StreamWriter *st)
{
    st->Write('\n');
}

void PrintLn()
{
    PrintLn(StdOut);
}

// ------------------------------------------------------------------------
// Logging
// ------------------------------------------------------------------------

static std::function<LogFunc> log_handler = DefaultLogHandler;
static bool log_vt100 = FileIsVt100(STDERR_FILENO);

static thread_local HeapArray<std::function<LogFilterFunc>> log_filters;

static void RunLogFilters(Size count, LogLevel level, const char *ctx, const char *msg)
{
    if (!count) {
        log_handler(level, ctx, msg);
        return;
    }

    log_filters[count - 1](level, ctx, msg, [&](LogLevel next_level, const char *next_ctx, const char *next_msg) {
        RunLogFilters(count - 1, next_level, next_ctx, next_msg);
    });
}

void LogFmt(LogLevel level, const char *ctx, const char *fmt, Span<const FmtArg> args)
{
    static thread_local bool busy = false;

    // Messages logged from inside a filter or the handler are dropped
    if (busy)
        return;
    busy = true;
    LM_DEFER { busy = false; };

    char msg[2048];
    Span<char> str = FmtFmt(fmt, args, log_vt100, msg);

    if (str.len == LM_SIZE(msg) - 1) {
        CopyString("... [truncated]", MakeSpan(msg + LM_SIZE(msg) - 16, 16));
    }

    RunLogFilters(log_filters.len, level, ctx, msg);
}

void SetLogHandler(const std::function<LogFunc> &func, bool vt100)
{
    log_handler = func;
    log_vt100 = vt100;
}

void DefaultLogHandler(LogLevel level, const char *ctx, const char *msg)
{
    const char *style = "%!D..";

    switch (level)  {
        case LogLevel::Debug:
        case LogLevel::Info: {} break;
        case LogLevel::Warning: { style = "%!M.."; } break;
        case LogLevel::Error: { style = "%!R.."; } break;
    }

    char fmt[32];
    Fmt(fmt, "%1%%1%%!0%%2\n", style);

    Print(StdErr, fmt, ctx ? ctx : "", msg);
}

void PushLogFilter(const std::function<LogFilterFunc> &func)
{
    log_filters.Append(func);
}

void PopLogFilter()
{
    LM_ASSERT(log_filters.len > 0);
    log_filters.RemoveFrom(log_filters.len - 1);
}

// ------------------------------------------------------------------------
// System
// ------------------------------------------------------------------------

int64_t GetMonotonicClock()
{
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

void WaitDelay(int64_t delay)
{
    LM_ASSERT(delay >= 0);
    std::this_thread::sleep_for(std::chrono::milliseconds(delay));
}

bool TestFile(const char *filename)
{
#if defined(_WIN32)
    struct __stat64 sb;
    return !_stat64(filename, &sb);
#else
    struct stat sb;
    return !stat(filename, &sb);
#endif
}

bool FileIsVt100(int fd)
{
    const char *term = getenv("TERM");

    if (getenv("NO_COLOR") || (term && TestStr(term, "dumb")))
        return false;

#if defined(_WIN32)
    if (!_isatty(fd))
        return false;

    HANDLE h = (HANDLE)_get_osfhandle(fd);
    DWORD mode;

    return GetConsoleMode(h, &mode) && SetConsoleMode(h, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
#else
    return isatty(fd);
#endif
}

const char *GetPathName(const char *path)
{
    const char *name = path;

    for (const char *ptr = path; *ptr; ptr++) {
        if (strchr(LM_PATH_SEPARATORS, *ptr)) {
            name = ptr + 1;
        }
    }

    return name;
}

static bool MatchGlob(const char *str, const char *pattern)
{
    for (; pattern[0]; pattern++, str++) {
        if (pattern[0] == '*') {
            for (const char *it = str;; it++) {
                if (MatchGlob(it, pattern + 1))
                    return true;
                if (!it[0])
                    return false;
            }
        }

        if (!str[0] || (pattern[0] != '?' && pattern[0] != str[0]))
            return false;
    }

    return !str[0];
}

bool MatchPathSpec(const char *path, const char *spec)
{
    for (const char *ptr = path; *ptr; ptr++) {
        bool boundary = (ptr == path) || strchr(LM_PATH_SEPARATORS, ptr[-1]);

        if (boundary && MatchGlob(ptr, spec))
            return true;
    }

    return !path[0] && MatchGlob(path, spec);
}

static InitHelper *init_list;

InitHelper::InitHelper(const char *name)
    : next(init_list), name(name)
{
    init_list = this;
}

void InitApp()
{
#if defined(_WIN32)
    SetConsoleOutputCP(CP_UTF8);
#else
    // A dropped HTTP connection must not kill the process
    signal(SIGPIPE, SIG_IGN);
#endif

    for (InitHelper *helper = init_list; helper; helper = helper->next) {
        LogDebug("Init %1", helper->name);
        helper->Run();
    }
    init_list = nullptr;
}

// ------------------------------------------------------------------------
// Streams
// ------------------------------------------------------------------------

StreamWriter *const StdOut = new StreamWriter(STDOUT_FILENO, "<stdout>");
StreamWriter *const StdErr = new StreamWriter(STDERR_FILENO, "<stderr>");

LM_EXIT(FlushStd)
{
    StdOut->Flush();
    StdErr->Flush();
}

StreamReader::StreamReader(const char *filename)
    : filename(filename)
{
#if defined(_WIN32)
    fd = _open(filename, _O_RDONLY | _O_BINARY | _O_NOINHERIT);
#else
    fd = open(filename, O_RDONLY | O_CLOEXEC);
#endif

    if (fd < 0) {
        LogError("Cannot open '%1': %2", filename, strerror(errno));
        error = true;
    }
}

StreamReader::~StreamReader()
{
    if (fd >= 0) {
#if defined(_WIN32)
        _close(fd);
#else
        close(fd);
#endif
    }
}

Size StreamReader::Read(Span<uint8_t> out_buf)
{
    if (error)
        return -1;

    if (fd < 0) {
        Size len = std::min(out_buf.len, buf.len - offset);

        MemCpy(out_buf.ptr, buf.ptr + offset, len);
        offset += len;

        return len;
    }

#if defined(_WIN32)
    Size len = _read(fd, out_buf.ptr, (unsigned int)std::min(out_buf.len, (Size)INT_MAX));
#else
    Size len;
    do {
        len = read(fd, out_buf.ptr, (size_t)out_buf.len);
    } while (len < 0 && errno == EINTR);
#endif

    if (len < 0) {
        LogError("Failed to read '%1': %2", filename, strerror(errno));
        error = true;
    }

    return len;
}

StreamWriter::StreamWriter(int fd, const char *filename)
    : filename(filename), fd(fd), vt100(FileIsVt100(fd))
{
}

bool StreamWriter::Write(Span<const uint8_t> data)
{
    std::lock_guard<std::mutex> lock(mutex);

    while (data.len) {
        Span<uint8_t> available = buf.TakeAvailable();

        if (!available.len && !FlushBuffer())
            return false;

        Size copy_len = std::min(data.len, available.len);
        buf.Append(data.Take(0, copy_len));
        data = data.Take(copy_len, data.len - copy_len);
    }

    // Line buffered, so that log lines from different threads do not mix
    if (buf.len && memchr(buf.data, '\n', (size_t)buf.len))
        return FlushBuffer();

    return !error;
}

bool StreamWriter::Flush()
{
    std::lock_guard<std::mutex> lock(mutex);
    return FlushBuffer();
}

bool StreamWriter::FlushBuffer()
{
    if (error)
        return false;

    Span<const uint8_t> remain = buf;

    while (remain.len) {
#if defined(_WIN32)
        Size len = _write(fd, remain.ptr, (unsigned int)remain.len);
#else
        Size len = write(fd, remain.ptr, (size_t)remain.len);
        if (len < 0 && errno == EINTR)
            continue;
#endif

        if (len < 0) {
            // Logging would come back here for stderr
            error = true;
            return false;
        }

        remain = remain.Take(len, remain.len - len);
    }

    buf.Clear();
    return true;
}

// ------------------------------------------------------------------------
// INI
// ------------------------------------------------------------------------

bool IniParser::Load()
{
    loaded = true;

    for (;;) {
        text.Grow(Kibibytes(4) + 1);

        Size len = st->Read(MakeSpan(text.end(), Kibibytes(4)));
        if (len < 0)
            return false;
        if (!len)
            break;

        text.len += len;
    }

    // Room for the NUL written after the last value
    text.Grow(1);
    text.ptr[text.len] = 0;
    remain = text;

    return true;
}

IniParser::LineType IniParser::ParseLine(IniProperty *out_prop)
{
    if (error || (!loaded && !Load())) {
        error = true;
        return LineType::End;
    }

    while (remain.len) {
        Size end = 0;
        while (end < remain.len && remain.ptr[end] != '\n') {
            end++;
        }

        Span<char> line = remain.Take(0, end);
        Size next = std::min(end + 1, remain.len);
        remain = remain.Take(next, remain.len - next);
        line_number++;

        Span<const char> trimmed = TrimStr(line);

        if (!trimmed.len || trimmed[0] == ';' || trimmed[0] == '#')
            continue;

        if (trimmed[0] == '[') {
            if (trimmed.len < 2 || trimmed[trimmed.len - 1] != ']') {
                LogError("Malformed [section] line");
                error = true;
                return LineType::End;
            }

            Span<const char> name = TrimStr(trimmed.Take(1, trimmed.len - 2));
            if (!name.len) {
                LogError("Empty section name");
                error = true;
                return LineType::End;
            }

            section.RemoveFrom(0);
            section.Append(name);
            section.Append('\0');
            section.len--;

            return LineType::Section;
        }

        Span<const char> value;
        Span<const char> key = TrimStr(SplitStrAny(trimmed, "=", &value));

        if (!key.len || key.len == trimmed.len) {
            LogError("Expected [section] or <key> = <value> pair");
            error = true;
            return LineType::End;
        }
        value = TrimStr(value);

        // Both spans point into our own copy of the text
        ((char *)key.ptr)[key.len] = 0;
        ((char *)value.ptr)[value.len] = 0;

        out_prop->section = section;
        out_prop->key = key;
        out_prop->value = value;

        return LineType::Property;
    }

    return LineType::End;
}

bool IniParser::Next(IniProperty *out_prop)
{
    LineType type;
    do {
        type = ParseLine(out_prop);
    } while (type == LineType::Section);

    return type == LineType::Property;
}

bool IniParser::NextInSection(IniProperty *out_prop)
{
    return ParseLine(out_prop) == LineType::Property;
}

void IniParser::PushLogFilter()
{
    LM::PushLogFilter([this](LogLevel level, const char *, const char *msg, FunctionRef<LogFunc> next) {
        char ctx[512];

        if (line_number) {
            Fmt(ctx, "%1(%2): ", st->GetFileName(), line_number);
        } else {
            Fmt(ctx, "%1: ", st->GetFileName());
        }

        next(level, ctx, msg);
    });
}

// ------------------------------------------------------------------------
// Options
// ------------------------------------------------------------------------

static inline bool IsOption(const char *arg)
{
    return arg[0] == '-' && arg[1];
}

const char *OptionParser::Next()
{
    current_option = nullptr;
    current_value = nullptr;
    test_failed = false;

    // Park non-options after the limit, in their original order
    Size first = pos;
    while (first < limit && !IsOption(args[first])) {
        first++;
    }
    std::rotate(args.ptr + pos, args.ptr + first, args.end());
    limit -= first - pos;

    if (pos >= limit)
        return nullptr;

    const char *arg = args[pos++];

    if (TestStr(arg, "--")) {
        // Everything after '--' is a non-option, and comes after those parked earlier
        std::rotate(args.ptr + pos, args.ptr + limit, args.end());
        limit = pos;

        return nullptr;
    }

    if (arg[1] == '-') {
        const char *equal = strchr(arg, '=');

        if (equal) {
            Size len = std::min((Size)(equal - arg), LM_SIZE(buf) - 1);

            CopyString(MakeSpan(arg, len), buf);
            current_option = buf;
            current_value = equal + 1;
        } else {
            current_option = arg;
        }
    } else if (arg[2]) {
        // Short option with attached value, such as -C/etc/lumen.ini
        buf[0] = '-';
        buf[1] = arg[1];
        buf[2] = 0;

        current_option = buf;
        current_value = arg + 2;
    } else {
        current_option = arg;
    }

    return current_option;
}

bool OptionParser::Test(const char *test1, const char *test2, OptionType type)
{
    LM_ASSERT(current_option);

    if (!TestStr(current_option, test1) && !(test2 && TestStr(current_option, test2)))
        return false;

    switch (type) {
        case OptionType::NoValue: {
            if (current_value) {
                LogError("Option '%1' does not support values", current_option);
                test_failed = true;
                return false;
            }
        } break;

        case OptionType::Value: {
            if (!current_value && pos < limit && !IsOption(args[pos])) {
                current_value = args[pos++];
            }
            if (!current_value) {
                LogError("Option '%1' requires a value", current_option);
                test_failed = true;
                return false;
            }
        } break;
    }

    return true;
}

const char *OptionParser::ConsumeNonOption()
{
    if (pos >= args.len || (pos < limit && IsOption(args[pos])))
        return nullptr;

    return args[pos++];
}

void OptionParser::LogUnknownError() const
{
    if (!test_failed) {
        LogError("Unknown option '%1'", current_option);
    }
}

void OptionParser::LogUnusedArguments() const
{
    if (pos < args.len) {
        LogWarning("Unused command-line arguments");
    }
}

}
