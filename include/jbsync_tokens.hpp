// jbsync_tokens.hpp - JBeam Sync - SJSON Token Stream
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef JBSYNC_TOKENS_HPP
#define JBSYNC_TOKENS_HPP

#include "jbsync_core.hpp"

#include <cstdio>
#include <cstdlib>
#include <cctype>

namespace jbsync
{
//========================================================================
// Tokens
//========================================================================

    enum class token_kind
    {
        object_open,
        object_close,
        array_open,
        array_close,
        string,
        number,
        literal,    // true, false, null
        colon,
        wsc         // whitespace, comments and commas
    };

    struct token
    {
        token_kind  kind;
        std::string text;           // raw source text; strings are stored escaped and unquoted
        int         precision {0};  // decimal digits of a number literal
    };

    // The flat, order-preserving token sequence of one SJSON text
    using document = std::vector<token>;

//========================================================================
// Token stream API
//========================================================================

    enum class parse_error_kind
    {
        unexpected_character,
        unterminated_string,
        unterminated_comment,
        invalid_number,
        unbalanced_brackets,
        misplaced_token,
        unexpected_end
    };

    using parse_error   = error<parse_error_kind>;
    using parse_context = context<document, parse_error>;

    parse_context parse(std::string_view text);

    std::string stringify(document const & doc);
    std::string stringify(document const & doc, size_t first, size_t last);

    struct number_text
    {
        std::string text;
        int         precision;
    };

    // Natural decimal rendering, capped at four decimals
    number_text format_number(double v);
    int decimal_precision(std::string_view literal);

    std::string decode_string(std::string_view escaped);
    std::string encode_string(std::string_view raw);

//========================================================================
// Token helpers
//========================================================================

    inline bool is_wsc(token const & t)    { return t.kind == token_kind::wsc; }
    inline bool is_open(token const & t)   { return t.kind == token_kind::object_open || t.kind == token_kind::array_open; }
    inline bool is_close(token const & t)  { return t.kind == token_kind::object_close || t.kind == token_kind::array_close; }
    inline bool is_scalar(token const & t)
    {
        return t.kind == token_kind::string
            || t.kind == token_kind::number
            || t.kind == token_kind::literal;
    }

    inline token make_wsc(std::string_view text) { return token{ token_kind::wsc, std::string(text) }; }
    inline token make_punct(token_kind kind)    { return token{ kind, {} }; }
    inline token make_string(std::string_view raw) { return token{ token_kind::string, encode_string(raw) }; }

    inline token make_number(double v)
    {
        auto nt = format_number(v);
        return token{ token_kind::number, std::move(nt.text), nt.precision };
    }

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        struct tokenizer_impl
        {
            std::string_view src;
            size_t pos {0};
            parse_context ctx;

            enum class want { key, colon, value };

            struct frame
            {
                bool is_object;
                want state;
            };

            std::vector<frame> stack;
            bool root_done {false};

            void run();

            void lex_wsc();
            bool lex_string();
            bool lex_number();
            bool lex_word();

            bool accept_value_start(token_kind kind);
            bool accept_colon();
            bool accept_close(token_kind kind);

            source_location location_of(size_t at) const;
            void add_error(parse_error_kind kind, size_t at, std::string message);
        };

//---------------------------------------------------------------------------

        inline source_location tokenizer_impl::location_of(size_t at) const
        {
            source_location loc { 1, 1 };
            for (size_t i = 0; i < at && i < src.size(); ++i)
            {
                if (src[i] == '\n') { ++loc.line; loc.column = 1; }
                else ++loc.column;
            }
            return loc;
        }

//---------------------------------------------------------------------------

        inline void tokenizer_impl::add_error(parse_error_kind kind, size_t at, std::string message)
        {
            ctx.errors.push_back({ kind, location_of(at), std::move(message) });
        }

//---------------------------------------------------------------------------

        inline void tokenizer_impl::run()
        {
            while (pos < src.size() && !ctx.has_errors())
            {
                char c = src[pos];

                if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ',' || c == '/')
                {
                    lex_wsc();
                    continue;
                }

                size_t start = pos;

                switch (c)
                {
                    case '{':
                    case '[':
                    {
                        auto kind = c == '{' ? token_kind::object_open : token_kind::array_open;
                        if (!accept_value_start(kind)) return;
                        ctx.result.push_back(make_punct(kind));
                        stack.push_back({ c == '{', want::key });
                        ++pos;
                        break;
                    }
                    case '}':
                    case ']':
                    {
                        auto kind = c == '}' ? token_kind::object_close : token_kind::array_close;
                        if (!accept_close(kind)) return;
                        ctx.result.push_back(make_punct(kind));
                        ++pos;
                        break;
                    }
                    case ':':
                        if (!accept_colon()) return;
                        ctx.result.push_back(make_punct(token_kind::colon));
                        ++pos;
                        break;
                    case '"':
                        if (!lex_string()) return;
                        break;
                    default:
                        if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+' || c == '.')
                        {
                            if (!lex_number()) return;
                        }
                        else if (std::isalpha(static_cast<unsigned char>(c)))
                        {
                            if (!lex_word()) return;
                        }
                        else
                        {
                            add_error(parse_error_kind::unexpected_character, start,
                                std::string("unexpected character '") + c + "'");
                            return;
                        }
                }
            }

            if (ctx.has_errors())
                return;

            if (!stack.empty())
                add_error(parse_error_kind::unexpected_end, pos, "unclosed container at end of input");
            else if (!root_done)
                add_error(parse_error_kind::unexpected_end, pos, "no value in input");
        }

//---------------------------------------------------------------------------

        inline void tokenizer_impl::lex_wsc()
        {
            size_t start = pos;

            while (pos < src.size())
            {
                char c = src[pos];

                if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == ',')
                {
                    ++pos;
                }
                else if (c == '/' && pos + 1 < src.size() && src[pos + 1] == '/')
                {
                    size_t nl = src.find('\n', pos);
                    pos = nl == std::string_view::npos ? src.size() : nl;
                }
                else if (c == '/' && pos + 1 < src.size() && src[pos + 1] == '*')
                {
                    size_t end = src.find("*/", pos + 2);
                    if (end == std::string_view::npos)
                    {
                        add_error(parse_error_kind::unterminated_comment, pos, "unterminated block comment");
                        return;
                    }
                    pos = end + 2;
                }
                else
                    break;
            }

            if (pos == start)
            {
                add_error(parse_error_kind::unexpected_character, pos, "unexpected character '/'");
                return;
            }

            // Consecutive runs never split; the previous token is never wsc here
            ctx.result.push_back(make_wsc(src.substr(start, pos - start)));
        }

//---------------------------------------------------------------------------

        inline bool tokenizer_impl::lex_string()
        {
            size_t start = pos;
            size_t j = pos + 1;

            while (j < src.size() && src[j] != '"')
                j += src[j] == '\\' ? 2 : 1;

            if (j >= src.size())
            {
                add_error(parse_error_kind::unterminated_string, start, "unterminated string");
                return false;
            }

            if (!accept_value_start(token_kind::string))
                return false;

            ctx.result.push_back(token{ token_kind::string, std::string(src.substr(start + 1, j - start - 1)) });
            pos = j + 1;
            return true;
        }

//---------------------------------------------------------------------------

        inline bool tokenizer_impl::lex_number()
        {
            size_t start = pos;
            size_t j = pos;
            size_t mantissa_digits = 0;

            if (src[j] == '-' || src[j] == '+') ++j;
            while (j < src.size() && std::isdigit(static_cast<unsigned char>(src[j]))) { ++j; ++mantissa_digits; }
            if (j < src.size() && src[j] == '.')
            {
                ++j;
                while (j < src.size() && std::isdigit(static_cast<unsigned char>(src[j]))) { ++j; ++mantissa_digits; }
            }
            if (mantissa_digits > 0 && j < src.size() && (src[j] == 'e' || src[j] == 'E'))
            {
                size_t k = j + 1;
                if (k < src.size() && (src[k] == '-' || src[k] == '+')) ++k;
                if (k < src.size() && std::isdigit(static_cast<unsigned char>(src[k])))
                {
                    while (k < src.size() && std::isdigit(static_cast<unsigned char>(src[k]))) ++k;
                    j = k;
                }
            }

            bool trailing_junk = j < src.size()
                && (std::isalnum(static_cast<unsigned char>(src[j])) || src[j] == '.' || src[j] == '_');

            if (mantissa_digits == 0 || trailing_junk)
            {
                add_error(parse_error_kind::invalid_number, start, "invalid number literal");
                return false;
            }

            if (!accept_value_start(token_kind::number))
                return false;

            auto literal = src.substr(start, j - start);
            ctx.result.push_back(token{ token_kind::number, std::string(literal), decimal_precision(literal) });
            pos = j;
            return true;
        }

//---------------------------------------------------------------------------

        inline bool tokenizer_impl::lex_word()
        {
            size_t start = pos;
            size_t j = pos;
            while (j < src.size() && (std::isalnum(static_cast<unsigned char>(src[j])) || src[j] == '_'))
                ++j;

            auto word = src.substr(start, j - start);
            if (word != "true" && word != "false" && word != "null")
            {
                add_error(parse_error_kind::unexpected_character, start,
                    "unexpected identifier '" + std::string(word) + "'");
                return false;
            }

            if (!accept_value_start(token_kind::literal))
                return false;

            ctx.result.push_back(token{ token_kind::literal, std::string(word) });
            pos = j;
            return true;
        }

//---------------------------------------------------------------------------

        inline bool tokenizer_impl::accept_value_start(token_kind kind)
        {
            if (stack.empty())
            {
                if (root_done)
                {
                    add_error(parse_error_kind::misplaced_token, pos, "more than one top-level value");
                    return false;
                }
                if (kind != token_kind::object_open && kind != token_kind::array_open)
                    root_done = true;
                return true;
            }

            auto & top = stack.back();
            if (!top.is_object)
                return true;

            switch (top.state)
            {
                case want::key:
                    if (kind != token_kind::string)
                    {
                        add_error(parse_error_kind::misplaced_token, pos, "expected a quoted key");
                        return false;
                    }
                    top.state = want::colon;
                    return true;
                case want::colon:
                    add_error(parse_error_kind::misplaced_token, pos, "expected ':' after key");
                    return false;
                case want::value:
                    top.state = want::key;
                    return true;
            }
            return true;
        }

//---------------------------------------------------------------------------

        inline bool tokenizer_impl::accept_colon()
        {
            if (stack.empty() || !stack.back().is_object || stack.back().state != want::colon)
            {
                add_error(parse_error_kind::misplaced_token, pos, "unexpected ':'");
                return false;
            }
            stack.back().state = want::value;
            return true;
        }

//---------------------------------------------------------------------------

        inline bool tokenizer_impl::accept_close(token_kind kind)
        {
            bool closes_object = kind == token_kind::object_close;

            if (stack.empty() || stack.back().is_object != closes_object)
            {
                add_error(parse_error_kind::unbalanced_brackets, pos, "mismatched closing bracket");
                return false;
            }
            if (closes_object && stack.back().state != want::key)
            {
                add_error(parse_error_kind::misplaced_token, pos, "key without value");
                return false;
            }

            stack.pop_back();
            if (stack.empty())
                root_done = true;
            return true;
        }
    }

//========================================================================
// Token stream implementation
//========================================================================

    inline parse_context parse(std::string_view text)
    {
        detail::tokenizer_impl impl;
        impl.src = text;
        impl.run();
        return std::move(impl.ctx);
    }

//---------------------------------------------------------------------------

    inline std::string stringify(document const & doc, size_t first, size_t last)
    {
        std::string out;
        last = std::min(last, doc.size());

        for (size_t i = first; i < last; ++i)
        {
            auto const & t = doc[i];
            switch (t.kind)
            {
                case token_kind::object_open:  out += '{'; break;
                case token_kind::object_close: out += '}'; break;
                case token_kind::array_open:   out += '['; break;
                case token_kind::array_close:  out += ']'; break;
                case token_kind::colon:        out += ':'; break;
                case token_kind::string:
                    out += '"';
                    out += t.text;
                    out += '"';
                    break;
                default:
                    out += t.text;
            }
        }
        return out;
    }

    inline std::string stringify(document const & doc)
    {
        return stringify(doc, 0, doc.size());
    }

//---------------------------------------------------------------------------

    inline int decimal_precision(std::string_view literal)
    {
        size_t dot = literal.find('.');
        if (dot == std::string_view::npos)
            return 0;

        int digits = 0;
        for (size_t i = dot + 1; i < literal.size() && std::isdigit(static_cast<unsigned char>(literal[i])); ++i)
            ++digits;
        return digits;
    }

//---------------------------------------------------------------------------

    inline number_text format_number(double v)
    {
        double rounded = std::round(v * 10000.0) / 10000.0;
        if (rounded == 0.0)
            rounded = 0.0;

        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.4f", rounded);
        std::string s(buf);

        size_t dot = s.find('.');
        if (dot != std::string::npos)
        {
            size_t end = s.find_last_not_of('0');
            if (end == dot) --end;
            s.erase(end + 1);
        }
        if (s == "-0")
            s = "0";

        return { s, decimal_precision(s) };
    }

//---------------------------------------------------------------------------

    inline std::string decode_string(std::string_view escaped)
    {
        std::string out;
        out.reserve(escaped.size());

        for (size_t i = 0; i < escaped.size(); ++i)
        {
            char c = escaped[i];
            if (c != '\\' || i + 1 >= escaped.size())
            {
                out += c;
                continue;
            }

            char e = escaped[++i];
            switch (e)
            {
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'u':
                {
                    if (i + 4 >= escaped.size())
                    {
                        out += "\\u";
                        break;
                    }
                    unsigned cp = static_cast<unsigned>(std::strtoul(std::string(escaped.substr(i + 1, 4)).c_str(), nullptr, 16));
                    i += 4;
                    if (cp < 0x80)
                        out += static_cast<char>(cp);
                    else if (cp < 0x800)
                    {
                        out += static_cast<char>(0xC0 | (cp >> 6));
                        out += static_cast<char>(0x80 | (cp & 0x3F));
                    }
                    else
                    {
                        out += static_cast<char>(0xE0 | (cp >> 12));
                        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                        out += static_cast<char>(0x80 | (cp & 0x3F));
                    }
                    break;
                }
                default: out += e;  // \" \\ \/
            }
        }
        return out;
    }

//---------------------------------------------------------------------------

    inline std::string encode_string(std::string_view raw)
    {
        std::string out;
        out.reserve(raw.size());

        for (char c : raw)
        {
            switch (c)
            {
                case '"':  out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20)
                    {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                        out += buf;
                    }
                    else
                        out += c;
            }
        }
        return out;
    }

} // namespace jbsync

#endif
