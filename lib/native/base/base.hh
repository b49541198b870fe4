// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include <algorithm>
#include <atomic>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <memory>
#include <mutex>
#include <new>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <type_traits>
#include <utility>

namespace LM {

// ------------------------------------------------------------------------
// Basics
// ------------------------------------------------------------------------

#if !defined(NDEBUG)
    #define LM_DEBUG
#endif

typedef ptrdiff_t Size;

class StreamWriter;

// Defined by each executable, next to main()
extern "C" const char *AppTarget;
extern "C" const char *AppVersion;

extern StreamWriter *const StdOut;
extern StreamWriter *const StdErr;

#define LM_STRINGIFY_(a) #a
#define LM_STRINGIFY(a) LM_STRINGIFY_(a)
#define LM_CONCAT_(a, b) a ## b
#define LM_CONCAT(a, b) LM_CONCAT_(a, b)
#define LM_UNIQUE_NAME(prefix) LM_CONCAT(prefix, __LINE__)

#if defined(_MSC_VER)
    #define LM_PUSH_NO_WARNINGS __pragma(warning(push, 0))
    #define LM_POP_NO_WARNINGS __pragma(warning(pop))
#else
    #define LM_PUSH_NO_WARNINGS \
        _Pragma("GCC diagnostic push") \
        _Pragma("GCC diagnostic ignored \"-Wall\"") \
        _Pragma("GCC diagnostic ignored \"-Wextra\"") \
        _Pragma("GCC diagnostic ignored \"-Wunused-parameter\"")
    #define LM_POP_NO_WARNINGS _Pragma("GCC diagnostic pop")
#endif

extern "C" void AssertMessage(const char *filename, int line, const char *cond);

#define LM_BAD_ALLOC() \
    do { \
        throw std::bad_alloc(); \
    } while (false)

#define LM_CRITICAL(Cond, ...) \
    do { \
        if (!(Cond)) [[unlikely]] { \
            LM::PrintLn(LM::StdErr, __VA_ARGS__); \
            abort(); \
        } \
    } while (false)

#if defined(LM_DEBUG)
    #define LM_ASSERT(Cond) \
        do { \
            if (!(Cond)) [[unlikely]] { \
                LM::AssertMessage(__FILE__, __LINE__, #Cond); \
                abort(); \
            } \
        } while (false)
    #define LM_UNREACHABLE() \
        do { \
            LM::AssertMessage(__FILE__, __LINE__, "Unreachable code"); \
            abort(); \
        } while (false)
#else
    #define LM_ASSERT(Cond) \
        do { \
            (void)sizeof(Cond); \
        } while (false)
    #if defined(_MSC_VER)
        #define LM_UNREACHABLE() __assume(0)
    #else
        #define LM_UNREACHABLE() __builtin_unreachable()
    #endif
#endif

#define LM_DELETE_COPY(Cls) \
    Cls(const Cls&) = delete; \
    Cls &operator=(const Cls&) = delete;

#define LM_SIZE(Type) ((LM::Size)sizeof(Type))
#define LM_LEN(Array) ((LM::Size)std::size(Array))

constexpr Size Kibibytes(Size len) { return len * 1024; }

static inline void *MemCpy(void *dest, const void *src, Size len)
{
    LM_ASSERT(len >= 0);

    // memcpy() wants valid pointers even for empty copies
    return len ? memcpy(dest, src, (size_t)len) : dest;
}

template <typename Fun>
class DeferGuard {
    LM_DELETE_COPY(DeferGuard)

    Fun func;
    bool armed = true;

public:
    DeferGuard(Fun &&func) : func(std::move(func)) {}
    DeferGuard(DeferGuard &&other) : func(std::move(other.func)), armed(other.armed) { other.armed = false; }
    ~DeferGuard()
    {
        if (armed) {
            func();
        }
    }

    void Disable() { armed = false; }
};

struct DeferGuardMaker {
    template <typename Fun>
    DeferGuard<Fun> operator+(Fun &&func) const { return DeferGuard<Fun>(std::forward<Fun>(func)); }
};

// LM_DEFER { ... }; runs the block when leaving the scope, use LM_DEFER_N(Name)
// to get a guard that can be disabled with Name.Disable().
#define LM_DEFER \
    auto LM_UNIQUE_NAME(defer) = LM::DeferGuardMaker() + [&]()
#define LM_DEFER_N(Name) \
    auto Name = LM::DeferGuardMaker() + [&]()

// Non-owning callable reference, must not outlive the referenced callable
template <typename Fn> class FunctionRef;
template <typename Ret, typename... Params>
class FunctionRef<Ret(Params...)> {
    Ret (*thunk)(void *callable, Params... params) = nullptr;
    void *callable = nullptr;

public:
    FunctionRef() = default;

    template <typename Callable,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<Callable>, FunctionRef>>>
    FunctionRef(Callable &&func)
        : thunk([](void *callable, Params... params) -> Ret {
              return (*(std::remove_reference_t<Callable> *)callable)(std::forward<Params>(params)...);
          }),
          callable((void *)&func) {}

    Ret operator()(Params... params) const { return thunk(callable, std::forward<Params>(params)...); }

    bool IsValid() const { return thunk; }
};

// ------------------------------------------------------------------------
// Spans and allocators
// ------------------------------------------------------------------------

// Stays trivial (no default member values) so that it can live in unions
template <typename T>
struct Span {
    T *ptr;
    Size len;

    Span() = default;
    constexpr Span(T *ptr, Size len) : ptr(ptr), len(len) {}
    constexpr Span(std::initializer_list<T> l) : ptr(l.begin()), len((Size)l.size()) {}
    template <Size N>
    constexpr Span(T (&arr)[N]) : ptr(arr), len(N) {}

    constexpr T *begin() const { return ptr; }
    constexpr T *end() const { return ptr + len; }

    constexpr bool IsValid() const { return ptr; }

    constexpr T &operator[](Size idx) const
    {
        LM_ASSERT(idx >= 0 && idx < len);
        return ptr[idx];
    }

    constexpr operator Span<const T>() const { return Span<const T>(ptr, len); }

    constexpr Span Take(Size offset, Size sub_len) const
    {
        LM_ASSERT(offset >= 0 && sub_len >= 0 && offset + sub_len <= len);
        return Span(ptr + offset, sub_len);
    }

    template <typename U>
    constexpr Span<U> As() const { return Span<U>((U *)ptr, len); }
};

// Strings are measured up to the NUL terminator, including fixed-size char arrays
template <>
struct Span<const char> {
    const char *ptr;
    Size len;

    Span() = default;
    constexpr Span(const char &c) : ptr(&c), len(1) {}
    constexpr Span(const char *ptr, Size len) : ptr(ptr), len(len) {}
    constexpr Span(const char *const &str)
        : ptr(str), len(str ? (Size)std::char_traits<char>::length(str) : 0) {}
    template <Size N>
    Span(const char (&arr)[N]) : ptr(arr), len((Size)strnlen(arr, N)) {}

    constexpr const char *begin() const { return ptr; }
    constexpr const char *end() const { return ptr + len; }

    constexpr bool IsValid() const { return ptr; }

    constexpr char operator[](Size idx) const
    {
        LM_ASSERT(idx >= 0 && idx < len);
        return ptr[idx];
    }

    constexpr bool operator==(Span<const char> other) const;
    constexpr bool operator!=(Span<const char> other) const { return !(*this == other); }

    constexpr Span Take(Size offset, Size sub_len) const
    {
        LM_ASSERT(offset >= 0 && sub_len >= 0 && offset + sub_len <= len);
        return Span(ptr + offset, sub_len);
    }

    template <typename U>
    constexpr Span<U> As() const { return Span<U>((U *)ptr, len); }
};

template <typename T>
static constexpr inline Span<T> MakeSpan(T *ptr, Size len)
{
    return Span<T>(ptr, len);
}
template <typename T, Size N>
static constexpr inline Span<T> MakeSpan(T (&arr)[N])
{
    return Span<T>(arr, N);
}

class Allocator {
    LM_DELETE_COPY(Allocator)

public:
    Allocator() = default;
    virtual ~Allocator() = default;

    virtual void *Allocate(Size size) = 0;
    virtual void *Resize(void *ptr, Size old_size, Size new_size) = 0;
    virtual void Release(const void *ptr, Size size) = 0;
};

// malloc() based, used when a container has no explicit allocator
Allocator *GetDefaultAllocator();

// Hands out memory from 4 kiB blocks, which are only given back all at once
// by ReleaseAll() or the destructor. Big requests get a block of their own.
class BlockAllocator final: public Allocator {
    struct Block {
        Block *next;
        Size size;
        Size used;
        uint8_t data[];
    };

    Size block_size;

    Block *head = nullptr;
    uint8_t *last = nullptr;

public:
    BlockAllocator(Size block_size = Kibibytes(4)) : block_size(block_size) { LM_ASSERT(block_size > 0); }
    ~BlockAllocator() override { ReleaseAll(); }

    BlockAllocator(BlockAllocator &&other) { *this = std::move(other); }
    BlockAllocator &operator=(BlockAllocator &&other);

    void *Allocate(Size size) override;
    void *Resize(void *ptr, Size old_size, Size new_size) override;
    void Release(const void *ptr, Size size) override;

    void ReleaseAll();

private:
    Block *AddBlock(Size size, bool front);
};

// ------------------------------------------------------------------------
// Reference counting
// ------------------------------------------------------------------------

template <typename T> class RetainPtr;

// Base class for objects shared through RetainPtr, the deleter is provided by
// the first RetainPtr that takes the object
template <typename T>
class RetainObject {
    mutable std::atomic_int refcount { 0 };
    mutable void (*delete_func)(T *) = nullptr;

    template <typename U> friend class RetainPtr;
};

template <typename T>
class RetainPtr {
    typedef std::remove_const_t<T> BareType;

    T *p = nullptr;

public:
    RetainPtr() = default;
    RetainPtr(T *p, void (*delete_func)(BareType *))
        : p(p)
    {
        LM_ASSERT(p && delete_func);

        p->delete_func = delete_func;
        p->refcount++;
    }
    RetainPtr(const RetainPtr &other) : p(other.p)
    {
        if (p) {
            p->refcount++;
        }
    }
    ~RetainPtr() { Drop(); }

    RetainPtr &operator=(const RetainPtr &other)
    {
        if (other.p) {
            other.p->refcount++;
        }
        Drop();
        p = other.p;

        return *this;
    }

    operator bool() const { return p; }

    T &operator*() const
    {
        LM_ASSERT(p);
        return *p;
    }
    T *operator->() const { return p; }
    T *GetRaw() const { return p; }

private:
    void Drop()
    {
        if (p && !--p->refcount) {
            p->delete_func((BareType *)p);
        }
        p = nullptr;
    }
};

// ------------------------------------------------------------------------
// Strings
// ------------------------------------------------------------------------

static constexpr inline char LowerAscii(char c)
{
    return (c >= 'A' && c <= 'Z') ? (char)(c + ('a' - 'A')) : c;
}

static constexpr inline bool TestStr(Span<const char> str1, Span<const char> str2)
{
    if (str1.len != str2.len)
        return false;

    for (Size i = 0; i < str1.len; i++) {
        if (str1.ptr[i] != str2.ptr[i])
            return false;
    }

    return true;
}

constexpr inline bool Span<const char>::operator==(Span<const char> other) const
{
    return TestStr(*this, other);
}

// ASCII case-insensitive
static constexpr inline bool TestStrI(Span<const char> str1, Span<const char> str2)
{
    if (str1.len != str2.len)
        return false;

    for (Size i = 0; i < str1.len; i++) {
        if (LowerAscii(str1.ptr[i]) != LowerAscii(str2.ptr[i]))
            return false;
    }

    return true;
}

static inline int CmpStr(Span<const char> str1, Span<const char> str2)
{
    Size common = std::min(str1.len, str2.len);

    int delta = common ? memcmp(str1.ptr, str2.ptr, (size_t)common) : 0;
    if (!delta && str1.len != str2.len) {
        delta = (str1.len < str2.len) ? -1 : 1;
    }

    return delta;
}

static inline bool StartsWith(Span<const char> str, Span<const char> prefix)
{
    return str.len >= prefix.len && TestStr(str.Take(0, prefix.len), prefix);
}

// Returns the part before the first separator, and sets out_remainder to what follows it
static inline Span<const char> SplitStrAny(Span<const char> str, const char *split_chars,
                                           Span<const char> *out_remainder = nullptr)
{
    Size end = 0;
    while (end < str.len && !strchr(split_chars, str.ptr[end])) {
        end++;
    }

    if (out_remainder) {
        Size next = std::min(end + 1, str.len);
        *out_remainder = str.Take(next, str.len - next);
    }
    return str.Take(0, end);
}

static inline Span<const char> TrimStrLeft(Span<const char> str, const char *trim_chars = " \t\r\n")
{
    Size skip = 0;
    while (skip < str.len && str.ptr[skip] && strchr(trim_chars, str.ptr[skip])) {
        skip++;
    }
    return str.Take(skip, str.len - skip);
}

static inline Span<const char> TrimStrRight(Span<const char> str, const char *trim_chars = " \t\r\n")
{
    Size keep = str.len;
    while (keep && str.ptr[keep - 1] && strchr(trim_chars, str.ptr[keep - 1])) {
        keep--;
    }
    return str.Take(0, keep);
}

static inline Span<const char> TrimStr(Span<const char> str, const char *trim_chars = " \t\r\n")
{
    return TrimStrLeft(TrimStrRight(str, trim_chars), trim_chars);
}

// Always NUL-terminates buf, returns false if str had to be truncated
bool CopyString(Span<const char> str, Span<char> buf);
Span<char> DuplicateString(Span<const char> str, Allocator *alloc);

// ------------------------------------------------------------------------
// Collections
// ------------------------------------------------------------------------

template <typename T, Size N>
class LocalArray {
public:
    T data[N];
    Size len = 0;

    LocalArray() = default;

    T *begin() { return data; }
    const T *begin() const { return data; }
    T *end() { return data + len; }
    const T *end() const { return data + len; }

    operator Span<T>() { return Span<T>(data, len); }
    operator Span<const T>() const { return Span<const T>(data, len); }

    T &operator[](Size idx)
    {
        LM_ASSERT(idx >= 0 && idx < len);
        return data[idx];
    }
    const T &operator[](Size idx) const
    {
        LM_ASSERT(idx >= 0 && idx < len);
        return data[idx];
    }

    T *Append(const T &value)
    {
        LM_ASSERT(len < N);

        data[len] = value;
        return data + len++;
    }
    T *Append(Span<const T> values)
    {
        LM_ASSERT(values.len <= N - len);

        T *first = data + len;
        std::copy(values.begin(), values.end(), first);
        len += values.len;

        return first;
    }

    void Clear() { len = 0; }

    Span<T> TakeAvailable() { return Span<T>(data + len, N - len); }
};

// Growable array, elements live in memory obtained from the allocator (or malloc)
template <typename T>
class HeapArray {
public:
    T *ptr = nullptr;
    Size len = 0;
    Size capacity = 0;
    Allocator *allocator = nullptr;

    HeapArray() = default;
    HeapArray(Allocator *alloc) : allocator(alloc) {}
    ~HeapArray() { Clear(); }

    HeapArray(HeapArray &&other) { *this = std::move(other); }
    HeapArray &operator=(HeapArray &&other)
    {
        if (this != &other) {
            Clear();

            std::swap(ptr, other.ptr);
            std::swap(len, other.len);
            std::swap(capacity, other.capacity);
            std::swap(allocator, other.allocator);
        }
        return *this;
    }
    HeapArray(const HeapArray &other) { *this = other; }
    HeapArray &operator=(const HeapArray &other)
    {
        if (this != &other) {
            RemoveFrom(0);
            Append(other);
        }
        return *this;
    }

    operator Span<T>() { return Span<T>(ptr, len); }
    operator Span<const T>() const { return Span<const T>(ptr, len); }

    T *begin() { return ptr; }
    const T *begin() const { return ptr; }
    T *end() { return ptr + len; }
    const T *end() const { return ptr + len; }

    T &operator[](Size idx)
    {
        LM_ASSERT(idx >= 0 && idx < len);
        return ptr[idx];
    }
    const T &operator[](Size idx) const
    {
        LM_ASSERT(idx >= 0 && idx < len);
        return ptr[idx];
    }

    // Makes room for at least count more elements, and returns the first free slot
    T *Grow(Size count = 1)
    {
        LM_ASSERT(count >= 0);

        if (count > capacity - len) {
            Size new_capacity = std::max(std::max(capacity * 2, len + count), (Size)8);
            Reallocate(new_capacity);
        }

        return ptr + len;
    }

    T *Append(const T &value)
    {
        Grow();
        new (ptr + len) T(value);
        return ptr + len++;
    }
    T *Append(T &&value)
    {
        Grow();
        new (ptr + len) T(std::move(value));
        return ptr + len++;
    }
    T *Append(Span<const T> values)
    {
        Grow(values.len);

        T *first = ptr + len;
        for (const T &value: values) {
            new (ptr + len++) T(value);
        }
        return first;
    }
    T *AppendDefault(Size count = 1)
    {
        Grow(count);

        T *first = ptr + len;
        for (Size i = 0; i < count; i++) {
            new (ptr + len++) T();
        }
        return first;
    }

    void RemoveFrom(Size first)
    {
        LM_ASSERT(first >= 0 && first <= len);

        if constexpr (!std::is_trivially_destructible_v<T>) {
            for (Size i = first; i < len; i++) {
                ptr[i].~T();
            }
        }
        len = first;
    }

    void Clear()
    {
        RemoveFrom(0);
        Reallocate(0);
    }

    Span<T> Take() const { return Span<T>(ptr, len); }
    Span<T> Take(Size offset, Size sub_len) const { return Take().Take(offset, sub_len); }
    Span<T> TakeAvailable() const { return Span<T>(ptr + len, capacity - len); }

    template <typename U = T>
    Span<U> As() const { return Span<U>((U *)ptr, len); }

private:
    void Reallocate(Size new_capacity)
    {
        if (new_capacity == capacity)
            return;

        Allocator *alloc = allocator ? allocator : GetDefaultAllocator();

        if constexpr (std::is_trivially_copyable_v<T>) {
            ptr = (T *)alloc->Resize(ptr, capacity * LM_SIZE(T), new_capacity * LM_SIZE(T));
        } else {
            T *new_ptr = new_capacity ? (T *)alloc->Allocate(new_capacity * LM_SIZE(T)) : nullptr;

            for (Size i = 0; i < len; i++) {
                new (new_ptr + i) T(std::move(ptr[i]));
                ptr[i].~T();
            }
            alloc->Release(ptr, capacity * LM_SIZE(T));

            ptr = new_ptr;
        }
        capacity = new_capacity;
    }
};

// ------------------------------------------------------------------------
// Format
// ------------------------------------------------------------------------

enum class FmtType {
    Str,
    PadStr,
    SafeStr,
    Char,
    SafeChar,
    Bool,
    Integer,
    Unsigned,
    Hex,
    SmallHex,
    Custom
};

// Formats any object with a Format(FunctionRef<void(Span<const char>)>) method
class FmtCustom {
    typedef void FormatFunc(const void *obj, FunctionRef<void(Span<const char>)> append);

    const void *obj;
    FormatFunc *func;

public:
    FmtCustom() = default;

    template <typename T>
    explicit FmtCustom(const T &obj)
        : obj(&obj), func([](const void *obj, FunctionRef<void(Span<const char>)> append) {
              ((const T *)obj)->Format(append);
          }) {}

    void Format(FunctionRef<void(Span<const char>)> append) const { func(obj, append); }
};

class FmtArg {
public:
    FmtType type;
    union {
        Span<const char> str;
        char ch;
        bool b;
        int64_t i;
        uint64_t u;
        FmtCustom custom;
    } u;

    int pad = 0;
    char padding = ' ';

    FmtArg(std::nullptr_t) : FmtArg(FmtType::Str) { u.str = "(null)"; }
    FmtArg(const char *str) : FmtArg(FmtType::Str) { u.str = str ? str : "(null)"; }
    FmtArg(Span<const char> str) : FmtArg(FmtType::Str) { u.str = str; }
    FmtArg(char c) : FmtArg(FmtType::Char) { u.ch = c; }
    FmtArg(bool b) : FmtArg(FmtType::Bool) { u.b = b; }
    FmtArg(const FmtCustom &custom) : FmtArg(FmtType::Custom) { u.custom = custom; }
    FmtArg(const void *ptr) : FmtArg(FmtType::Hex) { u.u = (uint64_t)(uintptr_t)ptr; }

    template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
    FmtArg(T value) : FmtArg(std::is_signed_v<T> ? FmtType::Integer : FmtType::Unsigned)
    {
        if constexpr (std::is_signed_v<T>) {
            u.i = (int64_t)value;
        } else {
            u.u = (uint64_t)value;
        }
    }

protected:
    FmtArg(FmtType type) : type(type) {}
};

// Used for log arguments, control characters in strings are dropped
class FmtSafe: public FmtArg {
public:
    template <typename T>
    FmtSafe(const T &value) : FmtArg(value)
    {
        if (type == FmtType::Str) {
            type = FmtType::SafeStr;
        } else if (type == FmtType::Char) {
            type = FmtType::SafeChar;
        }
    }
};

static inline FmtArg FmtHex(uint64_t value, int pad = 0)
{
    FmtArg arg(value);
    arg.type = FmtType::Hex;
    arg.pad = pad;
    arg.padding = '0';
    return arg;
}
static inline FmtArg FmtHexSmall(uint64_t value, int pad = 0)
{
    FmtArg arg = FmtHex(value, pad);
    arg.type = FmtType::SmallHex;
    return arg;
}
static inline FmtArg FmtPad(Span<const char> str, int pad)
{
    FmtArg arg(str);
    arg.type = FmtType::PadStr;
    arg.pad = pad;
    return arg;
}

// Markers: %1 to %N for arguments, %% for a percent sign, and %!XYS for ANSI
// styling on terminals (foreground, background, style) with %!0 to reset.
Span<char> FmtFmt(const char *fmt, Span<const FmtArg> args, bool vt100, Span<char> out_buf);
Span<char> FmtFmt(const char *fmt, Span<const FmtArg> args, bool vt100, HeapArray<char> *out_buf);
Span<char> FmtFmt(const char *fmt, Span<const FmtArg> args, bool vt100, Allocator *alloc);
void PrintFmt(const char *fmt, Span<const FmtArg> args, StreamWriter *st);

template <typename Out, typename... Args>
auto Fmt(Out &&out, const char *fmt, Args... args)
{
    const FmtArg fmt_args[] = { FmtArg(nullptr), FmtArg(args)... };
    return FmtFmt(fmt, MakeSpan(fmt_args + 1, LM_LEN(fmt_args) - 1), false, std::forward<Out>(out));
}

template <typename... Args>
void Print(StreamWriter *st, const char *fmt, Args... args)
{
    const FmtArg fmt_args[] = { FmtArg(nullptr), FmtArg(args)... };
    PrintFmt(fmt, MakeSpan(fmt_args + 1, LM_LEN(fmt_args) - 1), st);
}
template <typename... Args>
void Print(const char *fmt, Args... args)
{
    Print(StdOut, fmt, args...);
}

void PrintLn(StreamWriter *st);
void PrintLn();
template <typename... Args>
void PrintLn(StreamWriter *st, const char *fmt, Args... args)
{
    Print(st, fmt, args...);
    PrintLn(st);
}
template <typename... Args>
void PrintLn(const char *fmt, Args... args)
{
    PrintLn(StdOut, fmt, args...);
}

// ------------------------------------------------------------------------
// Logging
// ------------------------------------------------------------------------

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

typedef void LogFunc(LogLevel level, const char *ctx, const char *msg);
typedef void LogFilterFunc(LogLevel level, const char *ctx, const char *msg, FunctionRef<LogFunc> next);

void LogFmt(LogLevel level, const char *ctx, const char *fmt, Span<const FmtArg> args);

template <typename... Args>
static inline void Log(LogLevel level, const char *ctx, const char *fmt, Args... args)
{
    const FmtArg fmt_args[] = { FmtArg(nullptr), FmtSafe(args)... };
    LogFmt(level, ctx, fmt, MakeSpan(fmt_args + 1, LM_LEN(fmt_args) - 1));
}

#if defined(LM_DEBUG)
    template <typename... Args>
    static inline void LogDebug(const char *fmt, Args... args) { Log(LogLevel::Debug, "Debug: ", fmt, args...); }
#else
    template <typename... Args>
    static inline void LogDebug(const char *, Args...) {}
#endif
template <typename... Args>
static inline void LogInfo(const char *fmt, Args... args) { Log(LogLevel::Info, nullptr, fmt, args...); }
template <typename... Args>
static inline void LogWarning(const char *fmt, Args... args) { Log(LogLevel::Warning, "Warning: ", fmt, args...); }
template <typename... Args>
static inline void LogError(const char *fmt, Args... args) { Log(LogLevel::Error, "Error: ", fmt, args...); }

void SetLogHandler(const std::function<LogFunc> &func, bool vt100);
void DefaultLogHandler(LogLevel level, const char *ctx, const char *msg);

// Filters are per-thread, the last one pushed sees messages first
void PushLogFilter(const std::function<LogFilterFunc> &func);
void PopLogFilter();

// ------------------------------------------------------------------------
// System
// ------------------------------------------------------------------------

#if defined(_WIN32)
    #define LM_PATH_SEPARATORS "\\/"
#else
    #define LM_PATH_SEPARATORS "/"
#endif

int64_t GetMonotonicClock();
void WaitDelay(int64_t delay);

bool TestFile(const char *filename);
bool FileIsVt100(int fd);

const char *GetPathName(const char *path);

// Matches spec ('*' and '?' wildcards) against the path or any of its trailing components
bool MatchPathSpec(const char *path, const char *spec);

class InitHelper {
public:
    InitHelper *next;
    const char *name;

    InitHelper(const char *name);
    virtual void Run() = 0;
};

// LM_INIT(Name) { ... } runs before Main(), LM_EXIT(Name) { ... } when the process exits
#define LM_INIT_(ClassName, Name) \
    class ClassName: public LM::InitHelper { \
    public: \
        ClassName() : InitHelper(Name) {} \
        void Run() override; \
    }; \
    static ClassName LM_UNIQUE_NAME(init_); \
    void ClassName::Run()
#define LM_INIT(Name) LM_INIT_(LM_CONCAT(InitHelper_, Name), #Name)

#define LM_EXIT_(ClassName) \
    struct ClassName { \
        ~ClassName(); \
    }; \
    static ClassName LM_UNIQUE_NAME(exit_); \
    ClassName::~ClassName()
#define LM_EXIT(Name) LM_EXIT_(LM_CONCAT(ExitHelper_, Name))

void InitApp();

int Main(int argc, char **argv);

static inline int RunApp(int argc, char **argv)
{
    LM_CRITICAL(argc >= 1, "First argument is missing");

    InitApp();
    return Main(argc, argv);
}

// ------------------------------------------------------------------------
// Parsing
// ------------------------------------------------------------------------

enum class ParseFlag {
    Log = 1 << 0,
    End = 1 << 1
};
#define LM_DEFAULT_PARSE_FLAGS ((int)LM::ParseFlag::Log | (int)LM::ParseFlag::End)

template <typename T>
bool ParseInt(Span<const char> str, T *out_value, unsigned int flags = LM_DEFAULT_PARSE_FLAGS,
              Span<const char> *out_remaining = nullptr)
{
    static_assert(std::is_integral_v<T>);

    Size pos = 0;
    bool negative = false;

    if (str.len && (str[0] == '+' || (std::is_signed_v<T> && str[0] == '-'))) {
        negative = (str[0] == '-');
        pos++;
    }

    uint64_t limit = (uint64_t)std::numeric_limits<T>::max() + negative;
    uint64_t value = 0;
    Size digits = pos;

    for (; pos < str.len && str[pos] >= '0' && str[pos] <= '9'; pos++) {
        unsigned int digit = (unsigned int)(str[pos] - '0');

        if (value > (limit - digit) / 10) [[unlikely]] {
            if (flags & (int)ParseFlag::Log) {
                LogError("Integer overflow for number '%1'", str);
            }
            return false;
        }

        value = value * 10 + digit;
    }

    if (pos == digits || ((flags & (int)ParseFlag::End) && pos < str.len)) [[unlikely]] {
        if (flags & (int)ParseFlag::Log) {
            LogError("Malformed integer number '%1'", str);
        }
        return false;
    }

    *out_value = negative ? (T)(0 - value) : (T)value;
    if (out_remaining) {
        *out_remaining = str.Take(pos, str.len - pos);
    }
    return true;
}

template <typename T>
bool OptionToEnumI(Span<const char *const> options, Span<const char> str, T *out_value)
{
    static_assert(std::is_enum_v<T>);

    for (Size i = 0; i < options.len; i++) {
        if (TestStrI(options[i], str)) {
            *out_value = (T)i;
            return true;
        }
    }

    return false;
}

// ------------------------------------------------------------------------
// Streams
// ------------------------------------------------------------------------

class StreamReader {
    LM_DELETE_COPY(StreamReader)

    const char *filename = nullptr;
    bool error = false;

    // Memory source, or file source when fd >= 0
    Span<const uint8_t> buf = {};
    Size offset = 0;
    int fd = -1;

public:
    StreamReader(Span<const uint8_t> buf, const char *filename = "<memory>")
        : filename(filename), buf(buf) {}
    StreamReader(Span<const char> buf, const char *filename = "<memory>")
        : filename(filename), buf(buf.As<const uint8_t>()) {}
    StreamReader(const char *filename);
    ~StreamReader();

    const char *GetFileName() const { return filename; }
    bool IsValid() const { return !error; }

    // Returns 0 at the end, and -1 on error (already logged)
    Size Read(Span<uint8_t> out_buf);
    Size Read(Span<char> out_buf) { return Read(out_buf.As<uint8_t>()); }
};

// Line-buffered writer on a file descriptor, safe to share between threads
class StreamWriter {
    LM_DELETE_COPY(StreamWriter)

    const char *filename;
    int fd;
    bool vt100;
    bool error = false;

    std::mutex mutex;
    LocalArray<uint8_t, 4096> buf;

public:
    StreamWriter(int fd, const char *filename);
    ~StreamWriter() { Flush(); }

    const char *GetFileName() const { return filename; }
    bool IsVt100() const { return vt100; }
    bool IsValid() const { return !error; }

    bool Write(Span<const uint8_t> data);
    bool Write(Span<const char> data) { return Write(data.As<const uint8_t>()); }
    bool Write(char c) { return Write(MakeSpan(&c, 1)); }

    bool Flush();

private:
    bool FlushBuffer();
};

// ------------------------------------------------------------------------
// INI
// ------------------------------------------------------------------------

struct IniProperty {
    Span<const char> section;
    Span<const char> key;
    Span<const char> value;
};

// Reads the whole stream on first use, properties point into the parser's copy.
// Keys and values are NUL-terminated.
class IniParser {
    LM_DELETE_COPY(IniParser)

    enum class LineType {
        Section,
        Property,
        End
    };

    StreamReader *st;

    HeapArray<char> text;
    Span<char> remain = {};
    bool loaded = false;
    int line_number = 0;

    HeapArray<char> section;

    bool error = false;

public:
    IniParser(StreamReader *st) : st(st) {}

    const char *GetFileName() const { return st->GetFileName(); }
    bool IsValid() const { return !error && st->IsValid(); }

    // Next() crosses sections, NextInSection() stops at the next section header
    bool Next(IniProperty *out_prop);
    bool NextInSection(IniProperty *out_prop);

    // Prefixes log messages with the current file and line
    void PushLogFilter();

private:
    bool Load();
    LineType ParseLine(IniProperty *out_prop);
};

// ------------------------------------------------------------------------
// Options
// ------------------------------------------------------------------------

enum class OptionType {
    NoValue,
    Value
};

// Non-options can be mixed with options, they are moved to the end and can be
// retrieved with ConsumeNonOption() once Next() returns nullptr
class OptionParser {
    LM_DELETE_COPY(OptionParser)

    Span<const char *> args;
    Size pos = 0;
    Size limit;

    char buf[80];
    bool test_failed = false;

public:
    const char *current_option = nullptr;
    const char *current_value = nullptr;

    OptionParser(Span<const char *> args) : args(args), limit(args.len) {}
    OptionParser(int argc, char **argv)
        : args((const char **)argv + 1, argc - 1), limit(argc - 1) {}

    const char *Next();

    bool Test(const char *test1, const char *test2, OptionType type = OptionType::NoValue);
    bool Test(const char *test1, OptionType type = OptionType::NoValue) { return Test(test1, nullptr, type); }

    const char *ConsumeNonOption();

    void LogUnknownError() const;
    void LogUnusedArguments() const;
};

}
