// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 Niels Martignène <niels.martignene@protonmail.com>

#include "lib/native/base/base.hh"
#include "json.hh"

namespace LM {

char json_TextStream::Take()
{
    char c = Peek();

    if (offset < text.len) {
        offset++;

        if (c == '\n') {
            line_number++;
            line_offset = 1;
        } else {
            line_offset++;
        }
    }

    return c;
}

bool json_Parser::Handler::Bool(bool b)
{
    token = json_TokenType::Bool;
    u.b = b;
    return true;
}

bool json_Parser::Handler::Text(json_TokenType type, const char *str, Size len)
{
    token = type;
    u.str = DuplicateString(MakeSpan(str, len), allocator);
    return true;
}

json_Parser::json_Parser(Span<const char> text, const char *filename, Allocator *alloc)
    : filename(filename), st(text), handler({ alloc })
{
    LM_ASSERT(alloc);
    reader.IterativeParseInit();
}

bool json_Parser::ParseObject()
{
    if (!ConsumeToken(json_TokenType::StartObject))
        return false;

    if (depth >= 16) [[unlikely]] {
        LogError("Excessive depth for JSON object or array");
        error = true;
        return false;
    }

    depth++;
    return true;
}

bool json_Parser::InObject()
{
    if (PeekToken() == json_TokenType::EndObject) {
        depth--;
        handler.token = json_TokenType::Invalid;

        return false;
    }

    return !error;
}

Span<const char> json_Parser::ParseKey()
{
    if (ConsumeToken(json_TokenType::Key)) {
        return handler.u.str;
    } else {
        return {};
    }
}

bool json_Parser::ParseNull()
{
    return ConsumeToken(json_TokenType::Null);
}

bool json_Parser::ParseBool(bool *out_value)
{
    if (!ConsumeToken(json_TokenType::Bool))
        return false;

    *out_value = handler.u.b;
    return true;
}

bool json_Parser::ParseInt(int64_t *out_value)
{
    if (!ConsumeToken(json_TokenType::Number))
        return false;

    error |= !LM::ParseInt(handler.u.str, out_value);
    return !error;
}

bool json_Parser::ParseString(Span<const char> *out_str)
{
    if (!ConsumeToken(json_TokenType::String))
        return false;

    *out_str = handler.u.str;
    return true;
}

bool json_Parser::ParseString(const char **out_str)
{
    if (!ConsumeToken(json_TokenType::String))
        return false;

    *out_str = handler.u.str.ptr;
    return true;
}

bool json_Parser::Skip()
{
    Size nesting = 0;

    // A pending key goes away with its value
    if (PeekToken() == json_TokenType::Key) {
        handler.token = json_TokenType::Invalid;
    }

    do {
        switch (PeekToken()) {
            case json_TokenType::Invalid: return false;

            case json_TokenType::StartObject:
            case json_TokenType::StartArray: { nesting++; } break;
            case json_TokenType::EndObject:
            case json_TokenType::EndArray: { nesting--; } break;

            case json_TokenType::Key:
            case json_TokenType::Null:
            case json_TokenType::Bool:
            case json_TokenType::Number:
            case json_TokenType::String: {} break;
        }

        handler.token = json_TokenType::Invalid;
    } while (nesting > 0);

    return !error;
}

bool json_Parser::SkipNull()
{
    if (PeekToken() != json_TokenType::Null)
        return false;

    handler.token = json_TokenType::Invalid;
    return true;
}

void json_Parser::PushLogFilter()
{
    LM::PushLogFilter([this](LogLevel level, const char *, const char *msg, FunctionRef<LogFunc> next) {
        char ctx[512];
        Fmt(ctx, "%1(%2:%3): ", filename, st.GetLineNumber(), st.GetLineOffset());

        next(level, ctx, msg);
    });
}

json_TokenType json_Parser::PeekToken()
{
    if (error) [[unlikely]]
        return json_TokenType::Invalid;

    if (handler.token == json_TokenType::Invalid) {
        const unsigned int flags = rapidjson::kParseNumbersAsStringsFlag | rapidjson::kParseStopWhenDoneFlag;

        if (!reader.IterativeParseNext<flags>(st, handler) && reader.HasParseError()) {
            LogError("%1", GetParseError_En(reader.GetParseErrorCode()));
            error = true;
        }
    }

    return handler.token;
}

bool json_Parser::ConsumeToken(json_TokenType token)
{
    if (PeekToken() != token && !error) {
        LogError("Unexpected token '%1', expected '%2'",
                 json_TokenTypeNames[(int)handler.token], json_TokenTypeNames[(int)token]);
        error = true;
    }

    handler.token = json_TokenType::Invalid;
    return !error;
}

}
