// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#pragma once

#include "lib/native/base/base.hh"
LM_PUSH_NO_WARNINGS
#define RAPIDJSON_NO_SIZETYPEDEFINE
namespace rapidjson { typedef LM::Size SizeType; }
#include <rapidjson/reader.h>
#include <rapidjson/writer.h>
#include <rapidjson/error/en.h>
LM_POP_NO_WARNINGS

namespace LM {

// Input stream over a complete in-memory document, tracks the position for error messages
class json_TextStream {
    Span<const char> text;
    Size offset = 0;

    int line_number = 1;
    int line_offset = 1;

public:
    typedef char Ch;

    json_TextStream(Span<const char> text) : text(text) {}

    char Peek() const { return offset < text.len ? text.ptr[offset] : 0; }
    char Take();
    size_t Tell() const { return (size_t)offset; }

    // Not implemented
    void Put(char) {}
    void Flush() {}
    char *PutBegin() { return nullptr; }
    Size PutEnd(char *) { return 0; }

    int GetLineNumber() const { return line_number; }
    int GetLineOffset() const { return line_offset; }
};

enum class json_TokenType {
    Invalid,

    StartObject,
    EndObject,
    StartArray,
    EndArray,

    Null,
    Bool,
    Number,
    String,

    Key
};
static const char *const json_TokenTypeNames[] = {
    "Invalid",

    "Object",
    "End of object",
    "Array",
    "End of array",

    "Null",
    "Boolean",
    "Number",
    "String",

    "Key"
};

// Pull parser, strings and keys are copied into the allocator given to the constructor
class json_Parser {
    LM_DELETE_COPY(json_Parser)

    struct Handler {
        Allocator *allocator;

        json_TokenType token = json_TokenType::Invalid;
        union {
            bool b;
            Span<const char> str;
        } u = {};

        bool StartObject() { token = json_TokenType::StartObject; return true; }
        bool EndObject(Size) { token = json_TokenType::EndObject; return true; }
        bool StartArray() { token = json_TokenType::StartArray; return true; }
        bool EndArray(Size) { token = json_TokenType::EndArray; return true; }

        bool Null() { token = json_TokenType::Null; return true; }
        bool Bool(bool b);
        bool Double(double) { LM_UNREACHABLE(); }
        bool Int(int) { LM_UNREACHABLE(); }
        bool Int64(int64_t) { LM_UNREACHABLE(); }
        bool Uint(unsigned int) { LM_UNREACHABLE(); }
        bool Uint64(uint64_t) { LM_UNREACHABLE(); }
        bool RawNumber(const char *str, Size len, bool) { return Text(json_TokenType::Number, str, len); }
        bool String(const char *str, Size len, bool) { return Text(json_TokenType::String, str, len); }
        bool Key(const char *key, Size len, bool) { return Text(json_TokenType::Key, key, len); }

        bool Text(json_TokenType type, const char *str, Size len);
    };

    const char *filename;
    json_TextStream st;
    Handler handler;
    rapidjson::Reader reader;

    int depth = 0;
    bool error = false;

public:
    json_Parser(Span<const char> text, const char *filename, Allocator *alloc);

    const char *GetFileName() const { return filename; }
    bool IsValid() const { return !error; }

    bool ParseObject();
    bool InObject();
    Span<const char> ParseKey();

    bool ParseNull();
    bool ParseBool(bool *out_value);
    bool ParseInt(int64_t *out_value);
    bool ParseString(Span<const char> *out_str);
    bool ParseString(const char **out_str);

    // Skips the next value, including nested objects and arrays
    bool Skip();
    bool SkipNull();

    void PushLogFilter();

    json_TokenType PeekToken();
    bool ConsumeToken(json_TokenType token);
};

// Output stream for rapidjson::Writer, appends to a buffer that stays NUL-terminated
class json_BufferStream {
    HeapArray<char> *buf;

public:
    typedef char Ch;

    json_BufferStream(HeapArray<char> *buf) : buf(buf) {}

    void Put(char c) { buf->Append(c); }
    void Flush()
    {
        buf->Grow(1);
        buf->ptr[buf->len] = 0;
    }
};

class json_Writer: public rapidjson::Writer<json_BufferStream> {
    LM_DELETE_COPY(json_Writer)

    json_BufferStream stream;

public:
    json_Writer(HeapArray<char> *out_buf)
        : rapidjson::Writer<json_BufferStream>(stream), stream(out_buf) {}
};

}
