/*
 * canif
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

#ifndef CANIF_HPP
#define CANIF_HPP

#pragma once
#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <initializer_list>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#ifdef _MSC_VER
    #define CANIF_FORCEINLINE __forceinline
#else
    #define CANIF_FORCEINLINE __attribute__((always_inline)) inline
#endif

namespace canif::detail {

    struct CharMask256 {
        std::uint64_t w[4] {};

        static consteval CharMask256 make_space() {
            CharMask256 m {};
            auto set = [&](const unsigned c) {
                m.w[c >> 6] |= 1ull << (c & 63);
            };
            set(' ');
            set('\n');
            set('\r');
            set('\t');
            set('\f');
            set('\v');
            return m;
        }

        static consteval CharMask256 make_digit() {
            CharMask256 m {};
            for (unsigned c = '0'; c <= '9'; ++c)
                m.w[c >> 6] |= 1ull << (c & 63);
            return m;
        }

        static consteval CharMask256 make_hex() {
            CharMask256 m {};
            auto set = [&](const unsigned c) {
                m.w[c >> 6] |= 1ull << (c & 63);
            };
            for (unsigned c = '0'; c <= '9'; ++c)
                set(c);
            for (unsigned c = 'a'; c <= 'f'; ++c)
                set(c);
            for (unsigned c = 'A'; c <= 'F'; ++c)
                set(c);
            return m;
        }

        // \w: ascii alphanumerics, underscore, and every byte of a multi-byte utf-8 sequence
        static consteval CharMask256 make_word() {
            CharMask256 m {};
            auto set = [&](const unsigned c) {
                m.w[c >> 6] |= 1ull << (c & 63);
            };
            for (unsigned c = '0'; c <= '9'; ++c)
                set(c);
            for (unsigned c = 'a'; c <= 'z'; ++c)
                set(c);
            for (unsigned c = 'A'; c <= 'Z'; ++c)
                set(c);
            set('_');
            for (unsigned c = 0x80; c <= 0xFF; ++c)
                set(c);
            return m;
        }

        [[nodiscard]] static constexpr bool test(const CharMask256& m, const unsigned char c) noexcept {
            return (m.w[c >> 6] >> (c & 63)) & 1ull;
        }
    };

    inline constexpr CharMask256 kSpaceMask = CharMask256::make_space();
    inline constexpr CharMask256 kDigitMask = CharMask256::make_digit();
    inline constexpr CharMask256 kHexMask = CharMask256::make_hex();
    inline constexpr CharMask256 kWordMask = CharMask256::make_word();

    inline constexpr char kHexDigits[] = "0123456789abcdef";

    [[nodiscard]] CANIF_FORCEINLINE constexpr bool is_space(const char c) noexcept {
        return CharMask256::test(kSpaceMask, static_cast<unsigned char>(c));
    }

    [[nodiscard]] CANIF_FORCEINLINE constexpr bool is_digit(const char c) noexcept {
        return CharMask256::test(kDigitMask, static_cast<unsigned char>(c));
    }

    [[nodiscard]] CANIF_FORCEINLINE constexpr bool is_hex(const char c) noexcept {
        return CharMask256::test(kHexMask, static_cast<unsigned char>(c));
    }

    [[nodiscard]] CANIF_FORCEINLINE constexpr bool is_word(const char c) noexcept {
        return CharMask256::test(kWordMask, static_cast<unsigned char>(c));
    }

    [[nodiscard]] CANIF_FORCEINLINE constexpr unsigned hex_value(const char c) noexcept {
        if (c >= '0' && c <= '9')
            return static_cast<unsigned>(c - '0');
        if (c >= 'a' && c <= 'f')
            return static_cast<unsigned>(c - 'a' + 10);
        return static_cast<unsigned>(c - 'A' + 10);
    }

    [[nodiscard]] inline bool parse_hex(const std::string_view s, std::uint32_t& out) noexcept {
        out = 0;
        for (const char c : s) {
            if (!is_hex(c))
                return false;
            out = out << 4 | hex_value(c);
        }
        return true;
    }

    [[nodiscard]] CANIF_FORCEINLINE std::size_t utf8_encode(char* out, const std::uint32_t cp) noexcept {
        if (cp > 0x10FFFFu)
            return 0;
        if (cp >= 0xD800u && cp <= 0xDFFFu)
            return 0;

        if (cp <= 0x7F) {
            out[0] = static_cast<char>(cp);
            return 1;
        }
        if (cp <= 0x7FF) {
            out[0] = static_cast<char>(0xC0 | cp >> 6);
            out[1] = static_cast<char>(0x80 | (cp & 0x3F));
            return 2;
        }
        if (cp <= 0xFFFF) {
            out[0] = static_cast<char>(0xE0 | cp >> 12);
            out[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out[2] = static_cast<char>(0x80 | (cp & 0x3F));
            return 3;
        }
        out[0] = static_cast<char>(0xF0 | cp >> 18);
        out[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out[3] = static_cast<char>(0x80 | (cp & 0x3F));
        return 4;
    }

    inline constexpr std::uint32_t kReplacementChar = 0xFFFDu;

    inline void append_codepoint(std::string& out, const std::uint32_t cp) {
        char tmp[4];
        auto n = utf8_encode(tmp, cp);
        if (n == 0)
            n = utf8_encode(tmp, kReplacementChar);
        out.append(tmp, n);
    }

    // Decodes one utf-8 sequence starting at p. Invalid input yields U+FFFD and consumes a single byte.
    [[nodiscard]] inline std::uint32_t utf8_decode(const char*& p, const char* e) noexcept {
        const auto c0 = static_cast<unsigned char>(*p);
        if (c0 < 0x80) {
            ++p;
            return c0;
        }

        std::size_t len = 0;
        std::uint32_t cp = 0;
        if ((c0 & 0xE0u) == 0xC0u) {
            len = 2;
            cp = c0 & 0x1Fu;
        } else if ((c0 & 0xF0u) == 0xE0u) {
            len = 3;
            cp = c0 & 0x0Fu;
        } else if ((c0 & 0xF8u) == 0xF0u) {
            len = 4;
            cp = c0 & 0x07u;
        } else {
            ++p;
            return kReplacementChar;
        }

        if (static_cast<std::size_t>(e - p) < len) {
            ++p;
            return kReplacementChar;
        }

        for (std::size_t i = 1; i < len; ++i) {
            const auto c = static_cast<unsigned char>(p[i]);
            if ((c & 0xC0u) != 0x80u) {
                ++p;
                return kReplacementChar;
            }
            cp = cp << 6 | (c & 0x3Fu);
        }

        p += len;
        if (cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu))
            return kReplacementChar;
        return cp;
    }

    // Longest prefix of s holding at most max_chars code points.
    [[nodiscard]] inline std::string_view utf8_prefix(const std::string_view s, const std::size_t max_chars) noexcept {
        const char* p = s.data();
        const char* const e = p + s.size();
        for (std::size_t n = 0; n < max_chars && p < e; ++n)
            (void)utf8_decode(p, e);
        return s.substr(0, static_cast<std::size_t>(p - s.data()));
    }

    // Quotes a snippet of input the way python's repr() does, for diagnostics.
    [[nodiscard]] inline std::string quote_snippet(const std::string_view s) {
        const bool has_single = s.find('\'') != std::string_view::npos;
        const bool has_double = s.find('"') != std::string_view::npos;
        const char q = has_single && !has_double ? '"' : '\'';

        std::string out;
        out.reserve(s.size() + 2);
        out.push_back(q);
        for (const char ch : s) {
            const auto c = static_cast<unsigned char>(ch);
            switch (c) {
            case '\\':
                out.append("\\\\");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\r':
                out.append("\\r");
                break;
            case '\t':
                out.append("\\t");
                break;
            default:
                if (c == static_cast<unsigned char>(q)) {
                    out.push_back('\\');
                    out.push_back(ch);
                } else if (c < 0x20 || c == 0x7F) {
                    out.append("\\x");
                    out.push_back(kHexDigits[c >> 4]);
                    out.push_back(kHexDigits[c & 0xF]);
                } else {
                    out.push_back(ch);
                }
                break;
            }
        }
        out.push_back(q);
        return out;
    }

    // Decodes the backslash escapes shared by string and regex literals. Unknown escapes are kept as written.
    [[nodiscard]] inline std::string decode_escapes(const std::string_view raw) {
        std::string out;
        out.reserve(raw.size());

        std::size_t i = 0;
        const auto n = raw.size();
        while (i < n) {
            const char c = raw[i];
            if (c != '\\' || i + 1 >= n) {
                out.push_back(c);
                ++i;
                continue;
            }

            const char esc = raw[i + 1];
            switch (esc) {
            case '\\':
            case '"':
            case '\'':
            case '/':
                out.push_back(esc);
                i += 2;
                continue;
            case 'b':
                out.push_back('\b');
                i += 2;
                continue;
            case 'f':
                out.push_back('\f');
                i += 2;
                continue;
            case 'n':
                out.push_back('\n');
                i += 2;
                continue;
            case 'r':
                out.push_back('\r');
                i += 2;
                continue;
            case 't':
                out.push_back('\t');
                i += 2;
                continue;
            case 'u': {
                std::uint32_t cp = 0;
                if (i + 6 > n || !parse_hex(raw.substr(i + 2, 4), cp))
                    break;
                i += 6;

                if (cp >= 0xD800u && cp <= 0xDBFFu && i + 6 <= n && raw[i] == '\\' && raw[i + 1] == 'u') {
                    std::uint32_t lo = 0;
                    if (parse_hex(raw.substr(i + 2, 4), lo) && lo >= 0xDC00u && lo <= 0xDFFFu) {
                        cp = 0x10000u + ((cp - 0xD800u) << 10) + (lo - 0xDC00u);
                        i += 6;
                    }
                }

                append_codepoint(out, cp);
                continue;
            }
            case 'x': {
                std::uint32_t cp = 0;
                if (i + 4 > n || !parse_hex(raw.substr(i + 2, 2), cp))
                    break;
                i += 4;
                append_codepoint(out, cp);
                continue;
            }
            default:
                break;
            }

            out.push_back(c);
            ++i;
        }

        return out;
    }

    inline void append_u_escape(std::string& out, const std::uint32_t unit) {
        out.append("\\u");
        out.push_back(kHexDigits[(unit >> 12) & 0xF]);
        out.push_back(kHexDigits[(unit >> 8) & 0xF]);
        out.push_back(kHexDigits[(unit >> 4) & 0xF]);
        out.push_back(kHexDigits[unit & 0xF]);
    }

    inline void append_json_string(std::string& out, const std::string_view s, const bool ensure_ascii) {
        out.push_back('"');

        const char* p = s.data();
        const char* const e = p + s.size();
        while (p < e) {
            const auto c = static_cast<unsigned char>(*p);

            // Invalid utf-8 becomes U+FFFD in both modes; JSON text must be valid utf-8.
            if (c >= 0x80) {
                const std::uint32_t cp = utf8_decode(p, e);
                if (!ensure_ascii) {
                    append_codepoint(out, cp);
                    continue;
                }
                if (cp >= 0x10000u) {
                    const std::uint32_t v = cp - 0x10000u;
                    append_u_escape(out, 0xD800u + (v >> 10));
                    append_u_escape(out, 0xDC00u + (v & 0x3FFu));
                } else {
                    append_u_escape(out, cp);
                }
                continue;
            }

            ++p;
            switch (c) {
            case '"':
                out.append("\\\"");
                break;
            case '\\':
                out.append("\\\\");
                break;
            case '\b':
                out.append("\\b");
                break;
            case '\f':
                out.append("\\f");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\r':
                out.append("\\r");
                break;
            case '\t':
                out.append("\\t");
                break;
            default:
                if (c < 0x20)
                    append_u_escape(out, c);
                else
                    out.push_back(static_cast<char>(c));
                break;
            }
        }

        out.push_back('"');
    }

    [[nodiscard]] inline std::string json_string(const std::string_view s, const bool ensure_ascii = false) {
        std::string out;
        out.reserve(s.size() + 2);
        append_json_string(out, s, ensure_ascii);
        return out;
    }

    // Number literals are [+-]?\d+(\.\d+)?([eE][+-]?\d+)?; JSON forbids the '+' sign and leading zeros.
    [[nodiscard]] inline std::string json_number(const std::string_view raw) {
        std::string out;
        out.reserve(raw.size());

        std::size_t i = 0;
        if (i < raw.size() && (raw[i] == '+' || raw[i] == '-')) {
            if (raw[i] == '-')
                out.push_back('-');
            ++i;
        }
        while (i + 1 < raw.size() && raw[i] == '0' && is_digit(raw[i + 1]))
            ++i;

        out.append(raw.substr(i));
        return out;
    }

    [[nodiscard]] inline bool is_float_literal(const std::string_view raw) noexcept {
        return raw.find_first_of(".eE") != std::string_view::npos;
    }

} // namespace canif::detail

namespace canif {

    static constexpr std::uint32_t kDefaultMaxDepth = 512;

    enum class ErrorCode : std::uint8_t {
        None,
        UnexpectedToken,
        ExpectedExpression,
        ExpectedKey,
        PositionalAfterKeyword,
        TrailingContent,
        DepthExceeded,
        BuilderInvalidState,
        BuilderMissingValue,
        BuilderDanglingKey,
        WriterFailed,
    };

    struct ParseError {
        ErrorCode code {ErrorCode::None};
        std::size_t position {};
        std::string message {};
        std::string_view input {};

        CANIF_FORCEINLINE void set(const ErrorCode c, const std::size_t pos, std::string msg) {
            if (code == ErrorCode::None) {
                code = c;
                position = pos;
                message = std::move(msg);
            }
        }

        CANIF_FORCEINLINE void reset() {
            code = ErrorCode::None;
            position = 0;
            message.clear();
            input = {};
        }

        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] CANIF_FORCEINLINE constexpr bool ok() const noexcept {
            return code == ErrorCode::None;
        }

        [[nodiscard]] CANIF_FORCEINLINE constexpr explicit operator bool() const noexcept {
            return ok();
        }
    };

    [[nodiscard]] constexpr const char* error_code_name(const ErrorCode c) noexcept {
        switch (c) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::UnexpectedToken:
            return "UnexpectedToken";
        case ErrorCode::ExpectedExpression:
            return "ExpectedExpression";
        case ErrorCode::ExpectedKey:
            return "ExpectedKey";
        case ErrorCode::PositionalAfterKeyword:
            return "PositionalAfterKeyword";
        case ErrorCode::TrailingContent:
            return "TrailingContent";
        case ErrorCode::DepthExceeded:
            return "DepthExceeded";
        case ErrorCode::BuilderInvalidState:
            return "BuilderInvalidState";
        case ErrorCode::BuilderMissingValue:
            return "BuilderMissingValue";
        case ErrorCode::BuilderDanglingKey:
            return "BuilderDanglingKey";
        case ErrorCode::WriterFailed:
            return "WriterFailed";
        }
        return "Unknown";
    }

    struct ErrorLocation {
        std::size_t offset {};
        std::size_t line {1};
        // counted in code points, so a caret lines up under utf-8 text
        std::size_t column {1};
    };

    [[nodiscard]] inline ErrorLocation locate_error(const std::string_view input, const ParseError& e) noexcept {
        ErrorLocation loc {};
        if (e.code == ErrorCode::None)
            return loc;

        loc.offset = std::min(e.position, input.size());
        const auto before = input.substr(0, loc.offset);
        loc.line += static_cast<std::size_t>(std::count(before.begin(), before.end(), '\n'));

        const auto nl = before.rfind('\n');
        const char* p = before.data() + (nl == std::string_view::npos ? 0 : nl + 1);
        const char* const end = before.data() + before.size();
        while (p < end) {
            (void)detail::utf8_decode(p, end);
            ++loc.column;
        }
        return loc;
    }

    /*
     * "line L, column C: message" followed by the offending source line and a caret under the column.
     * Long lines are cut to kErrorContext code points on each side of the caret.
     */
    inline constexpr std::size_t kErrorContext = 60;

    [[nodiscard]] inline std::string format_error(const std::string_view input, const ParseError& e) {
        if (e.code == ErrorCode::None)
            return {};

        const auto loc = locate_error(input, e);

        const auto nl = loc.offset ? input.rfind('\n', loc.offset - 1) : std::string_view::npos;
        const auto line_begin = nl == std::string_view::npos ? 0 : nl + 1;
        auto line_end = input.find('\n', loc.offset);
        if (line_end == std::string_view::npos)
            line_end = input.size();

        auto left = input.substr(line_begin, loc.offset - line_begin);
        const bool cut_left = loc.column - 1 > kErrorContext;
        if (cut_left)
            left.remove_prefix(detail::utf8_prefix(left, loc.column - 1 - kErrorContext).size());

        const auto rest = input.substr(loc.offset, line_end - loc.offset);
        const auto right = detail::utf8_prefix(rest, kErrorContext);

        std::string out = "line " + std::to_string(loc.line) + ", column " + std::to_string(loc.column) + ": " + e.message + "\n";

        out.append(4, ' ');
        if (cut_left)
            out.append("...");
        out.append(left);
        out.append(right);
        if (right.size() < rest.size())
            out.append("...");
        out.push_back('\n');

        // tabs are kept so the caret stays aligned in a terminal
        out.append(cut_left ? 7 : 4, ' ');
        const char* p = left.data();
        const char* const end = left.data() + left.size();
        while (p < end)
            out.push_back(detail::utf8_decode(p, end) == '\t' ? '\t' : ' ');
        out.append("^\n");
        return out;
    }

    inline std::string ParseError::to_string() const {
        if (code == ErrorCode::None)
            return {};
        return "Position " + std::to_string(position) + ": " + message;
    }

    struct ParserOptions {
        std::uint32_t max_depth = kDefaultMaxDepth;
    };

    struct PrinterOptions {
        // 0 prints every document on a single line
        std::uint32_t indent = 4;
        bool trailing_commas = true;
        // JSON output only
        bool ensure_ascii = false;
    };

    enum class Pattern : std::uint8_t {
        Number,
        Bool,
        Null,
        NamedConstant,
        DoubleQuotedString,
        SingleQuotedString,
        Regex,
        PythonRepr,
        Identifier,
        FunctionCall,
        End
    };

    [[nodiscard]] constexpr const char* pattern_name(const Pattern p) noexcept {
        switch (p) {
        case Pattern::Number:
            return "number";
        case Pattern::Bool:
            return "bool";
        case Pattern::Null:
            return "null";
        case Pattern::NamedConstant:
            return "named constant";
        case Pattern::DoubleQuotedString:
            return "double-quoted string";
        case Pattern::SingleQuotedString:
            return "single-quoted string";
        case Pattern::Regex:
            return "regex literal";
        case Pattern::PythonRepr:
            return "python repr";
        case Pattern::Identifier:
            return "identifier";
        case Pattern::FunctionCall:
            return "function call";
        case Pattern::End:
            return "end of input";
        }
        return "token";
    }

    struct Match {
        std::size_t begin {};
        std::size_t end {};
        std::string_view text {};
        // strings: contents; regex: pattern, flags; function call: name
        std::string_view groups[2] {};

        [[nodiscard]] constexpr std::string_view group(const std::size_t i) const noexcept {
            return i == 0 ? text : groups[i - 1];
        }
    };

    inline constexpr std::string_view kPositionalAfterKeyword = "positional argument follows keyword argument";

    class Lexer {
    public:
        static constexpr std::size_t kSnippetChars = 30;

        explicit Lexer(const std::string_view text): text_(text) {
            err_.input = text;
            skip();
        }

        // Advances past whitespace and // comments.
        void skip() noexcept {
            pos_ = skip_from(pos_);
        }

        [[nodiscard]] bool pop(const std::string_view token, const bool checked = false, const bool do_skip = true) {
            if (text_.substr(pos_).starts_with(token)) {
                pos_ += token.size();
                if (do_skip)
                    skip();
                return true;
            }
            if (checked)
                return expected(describe(token));
            return false;
        }

        [[nodiscard]] std::optional<Match> pop(const Pattern p, const bool checked = false, const bool do_skip = true) {
            auto m = match(p, pos_);
            if (m) {
                pos_ = m->end;
                if (do_skip)
                    skip();
            } else if (checked) {
                (void)expected(pattern_name(p), p == Pattern::End ? ErrorCode::TrailingContent : ErrorCode::UnexpectedToken);
            }
            return m;
        }

        [[nodiscard]] bool peek(const std::string_view token) const noexcept {
            return text_.substr(pos_).starts_with(token);
        }

        [[nodiscard]] std::optional<Match> peek(const Pattern p) const {
            return match(p, pos_);
        }

        // True when `token` follows a peeked match, ignoring whitespace and comments in between.
        [[nodiscard]] bool followed_by(const Match& m, const std::string_view token) const noexcept {
            return text_.substr(skip_from(m.end)).starts_with(token);
        }

        // Commits a match obtained from peek().
        void consume(const Match& m, const bool do_skip = true) noexcept {
            if (m.end > pos_)
                pos_ = m.end;
            if (do_skip)
                skip();
        }

        [[nodiscard]] CANIF_FORCEINLINE bool at_end() const noexcept {
            return pos_ >= text_.size();
        }

        [[nodiscard]] bool end(const bool checked = false) {
            return pop(Pattern::End, checked).has_value();
        }

        // Writes every unconsumed byte of input, verbatim.
        template <class Sink>
        [[nodiscard]] bool flush_remainder(Sink& sink) const {
            return sink.puts(remainder());
        }

        [[nodiscard]] bool fail(const ErrorCode c, std::string message) {
            err_.set(c, pos_, std::move(message));
            return false;
        }

        // Records "expected <what>, found '<next 30 chars>'" at the current position.
        [[nodiscard]] bool expected(const std::string_view what, const ErrorCode c = ErrorCode::UnexpectedToken) {
            std::string message = "expected ";
            message.append(what);
            message.append(", found ");
            message.append(detail::quote_snippet(detail::utf8_prefix(remainder(), kSnippetChars)));
            return fail(c, std::move(message));
        }

        [[nodiscard]] CANIF_FORCEINLINE std::size_t position() const noexcept {
            return pos_;
        }

        [[nodiscard]] CANIF_FORCEINLINE std::string_view text() const noexcept {
            return text_;
        }

        [[nodiscard]] CANIF_FORCEINLINE std::string_view remainder() const noexcept {
            return text_.substr(std::min(pos_, text_.size()));
        }

        [[nodiscard]] CANIF_FORCEINLINE bool ok() const noexcept {
            return err_.ok();
        }

        [[nodiscard]] CANIF_FORCEINLINE const ParseError& error() const noexcept {
            return err_;
        }

    private:
        [[nodiscard]] static std::string describe(const std::string_view token) {
            if (!token.empty() && std::all_of(token.begin(), token.end(), detail::is_word))
                return std::string(token);
            return "`" + std::string(token) + "`";
        }

        [[nodiscard]] CANIF_FORCEINLINE char at(const std::size_t i) const noexcept {
            return i < text_.size() ? text_[i] : '\0';
        }

        [[nodiscard]] std::size_t skip_from(std::size_t p) const noexcept {
            const auto n = text_.size();
            while (p < n) {
                if (detail::is_space(text_[p])) {
                    ++p;
                } else if (text_[p] == '/' && at(p + 1) == '/') {
                    p += 2;
                    while (p < n && text_[p] != '\n')
                        ++p;
                } else {
                    break;
                }
            }
            return p;
        }

        [[nodiscard]] std::size_t scan_digits(std::size_t p) const noexcept {
            while (p < text_.size() && detail::is_digit(text_[p]))
                ++p;
            return p;
        }

        [[nodiscard]] std::size_t scan_word(std::size_t p) const noexcept {
            while (p < text_.size() && detail::is_word(text_[p]))
                ++p;
            return p;
        }

        [[nodiscard]] std::size_t scan_space(std::size_t p) const noexcept {
            while (p < text_.size() && detail::is_space(text_[p]))
                ++p;
            return p;
        }

        [[nodiscard]] Match make_match(const std::size_t b, const std::size_t e) const noexcept {
            Match m {};
            m.begin = b;
            m.end = e;
            m.text = text_.substr(b, e - b);
            return m;
        }

        // One of `words` at p, not followed by a word character.
        [[nodiscard]] std::size_t match_word(const std::size_t p, const std::initializer_list<std::string_view> words) const noexcept {
            const auto rest = text_.substr(p);
            for (const auto w : words) {
                if (rest.starts_with(w) && !detail::is_word(at(p + w.size())))
                    return p + w.size();
            }
            return std::string_view::npos;
        }

        [[nodiscard]] std::size_t match_bool(const std::size_t p) const noexcept {
            return match_word(p, {"true", "True", "false", "False"});
        }

        [[nodiscard]] std::size_t match_null(const std::size_t p) const noexcept {
            return match_word(p, {"null", "None"});
        }

        [[nodiscard]] std::size_t match_constant(const std::size_t p) const noexcept {
            return match_word(p, {"undefined", "NotImplemented"});
        }

        // [+-]?\d+(\.\d+)?([eE][+-]?\d+)?
        [[nodiscard]] std::optional<Match> match_number(const std::size_t start) const {
            auto p = start;
            if (at(p) == '+' || at(p) == '-')
                ++p;

            const auto int_end = scan_digits(p);
            if (int_end == p)
                return std::nullopt;
            p = int_end;

            if (at(p) == '.') {
                if (const auto frac_end = scan_digits(p + 1); frac_end > p + 1)
                    p = frac_end;
            }

            if (at(p) == 'e' || at(p) == 'E') {
                auto q = p + 1;
                if (at(q) == '+' || at(q) == '-')
                    ++q;
                if (const auto exp_end = scan_digits(q); exp_end > q)
                    p = exp_end;
            }

            return make_match(start, p);
        }

        // Body of a quoted literal: anything but backslash and the delimiter, or a backslash and one non-newline char.
        [[nodiscard]] std::size_t scan_quoted_body(std::size_t p, const char delimiter) const noexcept {
            const auto n = text_.size();
            while (p < n) {
                const char c = text_[p];
                if (c == delimiter)
                    return p;
                if (c == '\\') {
                    if (p + 1 >= n || text_[p + 1] == '\n')
                        return std::string_view::npos;
                    p += 2;
                    continue;
                }
                ++p;
            }
            return std::string_view::npos;
        }

        [[nodiscard]] std::optional<Match> match_quoted(const std::size_t start, const char quote) const {
            if (at(start) != quote)
                return std::nullopt;

            const auto close = scan_quoted_body(start + 1, quote);
            if (close == std::string_view::npos)
                return std::nullopt;

            auto m = make_match(start, close + 1);
            m.groups[0] = text_.substr(start + 1, close - start - 1);
            return m;
        }

        // /pattern/flags
        [[nodiscard]] std::optional<Match> match_regex(const std::size_t start) const {
            if (at(start) != '/')
                return std::nullopt;

            const auto close = scan_quoted_body(start + 1, '/');
            if (close == std::string_view::npos)
                return std::nullopt;

            const auto flags_end = scan_word(close + 1);
            auto m = make_match(start, flags_end);
            m.groups[0] = text_.substr(start + 1, close - start - 1);
            m.groups[1] = text_.substr(close + 1, flags_end - close - 1);
            return m;
        }

        // <word ...>, where the body may hold quoted strings and must be at least two characters long
        [[nodiscard]] std::optional<Match> match_python_repr(const std::size_t start) const {
            if (at(start) != '<')
                return std::nullopt;

            auto p = start + 1;
            const auto word_end = scan_word(p);
            if (word_end == p)
                return std::nullopt;

            std::size_t body = word_end - p;
            p = word_end;

            const auto n = text_.size();
            while (p < n) {
                const char c = text_[p];
                if (c == '>') {
                    if (body < 2)
                        return std::nullopt;
                    return make_match(start, p + 1);
                }
                if (c == '"' || c == '\'') {
                    const auto close = scan_quoted_body(p + 1, c);
                    if (close == std::string_view::npos)
                        return std::nullopt;
                    body += close + 1 - p;
                    p = close + 1;
                    continue;
                }
                ++body;
                ++p;
            }
            return std::nullopt;
        }

        // \$?\w+ that does not start with a digit or spell a bool, null or named constant
        [[nodiscard]] std::optional<Match> match_identifier(const std::size_t start) const {
            if (detail::is_digit(at(start)))
                return std::nullopt;
            if (match_bool(start) != std::string_view::npos || match_null(start) != std::string_view::npos || match_constant(start) != std::string_view::npos)
                return std::nullopt;

            auto p = start;
            if (at(p) == '$')
                ++p;

            const auto word_end = scan_word(p);
            if (word_end == p)
                return std::nullopt;

            return make_match(start, word_end);
        }

        // \w+(\.\w+)*\s*\( starting at p; returns the end of the name
        [[nodiscard]] std::size_t match_call_name(std::size_t p) const noexcept {
            const auto word_end = scan_word(p);
            if (word_end == p)
                return std::string_view::npos;
            p = word_end;

            while (at(p) == '.' && detail::is_word(at(p + 1)))
                p = scan_word(p + 1);

            return p;
        }

        // (new\s+)?name\s*(
        [[nodiscard]] std::optional<Match> match_function_call(const std::size_t start) const {
            auto name_end = std::string_view::npos;

            if (text_.substr(start).starts_with("new") && detail::is_space(at(start + 3)))
                name_end = match_call_name(scan_space(start + 3));

            for (auto attempt = 0; attempt < 2; ++attempt) {
                if (name_end != std::string_view::npos) {
                    if (const auto paren = scan_space(name_end); at(paren) == '(') {
                        auto m = make_match(start, paren + 1);
                        m.groups[0] = text_.substr(start, name_end - start);
                        return m;
                    }
                }
                name_end = match_call_name(start);
            }
            return std::nullopt;
        }

        [[nodiscard]] std::optional<Match> match(const Pattern p, const std::size_t pos) const {
            switch (p) {
            case Pattern::Number:
                return match_number(pos);
            case Pattern::Bool:
                if (const auto e = match_bool(pos); e != std::string_view::npos)
                    return make_match(pos, e);
                return std::nullopt;
            case Pattern::Null:
                if (const auto e = match_null(pos); e != std::string_view::npos)
                    return make_match(pos, e);
                return std::nullopt;
            case Pattern::NamedConstant:
                if (const auto e = match_constant(pos); e != std::string_view::npos)
                    return make_match(pos, e);
                return std::nullopt;
            case Pattern::DoubleQuotedString:
                return match_quoted(pos, '"');
            case Pattern::SingleQuotedString:
                return match_quoted(pos, '\'');
            case Pattern::Regex:
                return match_regex(pos);
            case Pattern::PythonRepr:
                return match_python_repr(pos);
            case Pattern::Identifier:
                return match_identifier(pos);
            case Pattern::FunctionCall:
                return match_function_call(pos);
            case Pattern::End:
                if (pos >= text_.size())
                    return make_match(pos, pos);
                return std::nullopt;
            }
            return std::nullopt;
        }

        std::string_view text_ {};
        std::size_t pos_ {};
        ParseError err_ {};
    };

    enum class ArrayKind : std::uint8_t {
        List,
        Tuple
    };

    enum class NamedConstant : std::uint8_t {
        Undefined,
        NotImplemented
    };

    [[nodiscard]] constexpr std::optional<NamedConstant> named_constant_from(const std::string_view raw) noexcept {
        if (raw == "undefined")
            return NamedConstant::Undefined;
        if (raw == "NotImplemented")
            return NamedConstant::NotImplemented;
        return std::nullopt;
    }

    // JSON encoding of a named constant
    [[nodiscard]] constexpr std::string_view named_constant_tag(const NamedConstant c) noexcept {
        switch (c) {
        case NamedConstant::Undefined:
            return "$undefined";
        case NamedConstant::NotImplemented:
            return "$NotImplemented";
        }
        return "$undefined";
    }

    /*
     * Receives the parser's events. Each callback returns false to abort the parse; the reason is then
     * available from error().
     *
     * Scalars arrive with their raw source text next to the decoded value. Composites are bracketed by
     * begin/end events, and every element is followed by its separator event (on_array_element,
     * on_mapping_key/on_mapping_value, on_set_element, on_positional_argument, ...). An empty array slot
     * is an on_array_empty_slot event standing in for a value.
     */
    class Builder {
    public:
        virtual ~Builder() = default;

        virtual bool on_float(std::string_view raw, double value) = 0;
        virtual bool on_integer(std::string_view raw, std::int64_t value) = 0;
        virtual bool on_bool(std::string_view raw, bool value) = 0;
        virtual bool on_null(std::string_view raw) = 0;
        virtual bool on_named_constant(std::string_view raw, NamedConstant value) = 0;
        virtual bool on_string(std::string_view raw, std::string_view value) = 0;
        virtual bool on_regex(std::string_view raw, std::string_view pattern, std::string_view flags) = 0;
        virtual bool on_python_repr(std::string_view raw) = 0;
        virtual bool on_identifier(std::string_view name) = 0;

        virtual bool on_document_begin() = 0;
        virtual bool on_document_end() = 0;

        virtual bool on_array_begin(ArrayKind kind) = 0;
        virtual bool on_array_element() = 0;
        virtual bool on_array_empty_slot() = 0;
        virtual bool on_array_end() = 0;

        virtual bool on_mapping_begin() = 0;
        virtual bool on_mapping_key() = 0;
        virtual bool on_mapping_value() = 0;
        virtual bool on_mapping_end() = 0;

        virtual bool on_set_begin() = 0;
        virtual bool on_set_element() = 0;
        virtual bool on_set_end() = 0;

        virtual bool on_call_begin(std::string_view name) = 0;
        virtual bool on_positional_argument() = 0;
        virtual bool on_positional_arguments_end() = 0;
        virtual bool on_keyword_arguments_begin() = 0;
        virtual bool on_keyword_argument_key() = 0;
        virtual bool on_keyword_argument_value() = 0;
        virtual bool on_keyword_arguments_end() = 0;
        virtual bool on_call_end() = 0;

        // Writes out anything buffered but not yet emitted. Used when a parse fails midway.
        virtual bool flush() = 0;

        [[nodiscard]] CANIF_FORCEINLINE bool ok() const noexcept {
            return err_.ok();
        }

        [[nodiscard]] CANIF_FORCEINLINE const ParseError& error() const noexcept {
            return err_;
        }

    protected:
        CANIF_FORCEINLINE bool fail(const ErrorCode c) {
            err_.set(c, 0, error_code_name(c));
            return false;
        }

        ParseError err_ {};
    };

    // Accepts everything; used for validation.
    class NullBuilder : public Builder {
    public:
        bool on_float(std::string_view, double) override {
            return true;
        }
        bool on_integer(std::string_view, std::int64_t) override {
            return true;
        }
        bool on_bool(std::string_view, bool) override {
            return true;
        }
        bool on_null(std::string_view) override {
            return true;
        }
        bool on_named_constant(std::string_view, NamedConstant) override {
            return true;
        }
        bool on_string(std::string_view, std::string_view) override {
            return true;
        }
        bool on_regex(std::string_view, std::string_view, std::string_view) override {
            return true;
        }
        bool on_python_repr(std::string_view) override {
            return true;
        }
        bool on_identifier(std::string_view) override {
            return true;
        }
        bool on_document_begin() override {
            return true;
        }
        bool on_document_end() override {
            return true;
        }
        bool on_array_begin(ArrayKind) override {
            return true;
        }
        bool on_array_element() override {
            return true;
        }
        bool on_array_empty_slot() override {
            return true;
        }
        bool on_array_end() override {
            return true;
        }
        bool on_mapping_begin() override {
            return true;
        }
        bool on_mapping_key() override {
            return true;
        }
        bool on_mapping_value() override {
            return true;
        }
        bool on_mapping_end() override {
            return true;
        }
        bool on_set_begin() override {
            return true;
        }
        bool on_set_element() override {
            return true;
        }
        bool on_set_end() override {
            return true;
        }
        bool on_call_begin(std::string_view) override {
            return true;
        }
        bool on_positional_argument() override {
            return true;
        }
        bool on_positional_arguments_end() override {
            return true;
        }
        bool on_keyword_arguments_begin() override {
            return true;
        }
        bool on_keyword_argument_key() override {
            return true;
        }
        bool on_keyword_argument_value() override {
            return true;
        }
        bool on_keyword_arguments_end() override {
            return true;
        }
        bool on_call_end() override {
            return true;
        }
        bool flush() override {
            return true;
        }
    };

    enum class Event : std::uint8_t {
        Float,
        Integer,
        Bool,
        Null,
        NamedConstant,
        String,
        Regex,
        PythonRepr,
        Identifier,
        DocumentBegin,
        DocumentEnd,
        ArrayBegin,
        ArrayElement,
        ArrayEmptySlot,
        ArrayEnd,
        MappingBegin,
        MappingKey,
        MappingValue,
        MappingEnd,
        SetBegin,
        SetElement,
        SetEnd,
        CallBegin,
        PositionalArgument,
        PositionalArgumentsEnd,
        KeywordArgumentsBegin,
        KeywordArgumentKey,
        KeywordArgumentValue,
        KeywordArgumentsEnd,
        CallEnd
    };

    struct RecordedCall {
        Event event {};
        std::string raw {};
        // decoded string, regex pattern or function name
        std::string text {};
        std::string flags {};
        std::int64_t integer {};
        double number {};
        bool boolean {};
        ArrayKind kind {ArrayKind::List};
        NamedConstant constant {NamedConstant::Undefined};
    };

    /*
     * Stands in for a builder while the parser reads ahead: every event is stored with its arguments
     * and can later be replayed, unchanged and in order, into another builder (possibly another
     * Recorder).
     */
    class Recorder final : public Builder {
    public:
        [[nodiscard]] CANIF_FORCEINLINE std::size_t size() const noexcept {
            return calls_.size();
        }

        [[nodiscard]] CANIF_FORCEINLINE bool empty() const noexcept {
            return calls_.empty();
        }

        [[nodiscard]] CANIF_FORCEINLINE const RecordedCall& operator[](const std::size_t i) const noexcept {
            return calls_[i];
        }

        [[nodiscard]] CANIF_FORCEINLINE const std::vector<RecordedCall>& calls() const noexcept {
            return calls_;
        }

        void clear() noexcept {
            calls_.clear();
        }

        [[nodiscard]] bool replay(Builder& host) const {
            for (const auto& c : calls_) {
                if (!dispatch(host, c))
                    return false;
            }
            return true;
        }

        bool on_float(const std::string_view raw, const double value) override {
            auto& c = record(Event::Float);
            c.raw = raw;
            c.number = value;
            return true;
        }

        bool on_integer(const std::string_view raw, const std::int64_t value) override {
            auto& c = record(Event::Integer);
            c.raw = raw;
            c.integer = value;
            return true;
        }

        bool on_bool(const std::string_view raw, const bool value) override {
            auto& c = record(Event::Bool);
            c.raw = raw;
            c.boolean = value;
            return true;
        }

        bool on_null(const std::string_view raw) override {
            record(Event::Null).raw = raw;
            return true;
        }

        bool on_named_constant(const std::string_view raw, const NamedConstant value) override {
            auto& c = record(Event::NamedConstant);
            c.raw = raw;
            c.constant = value;
            return true;
        }

        bool on_string(const std::string_view raw, const std::string_view value) override {
            auto& c = record(Event::String);
            c.raw = raw;
            c.text = value;
            return true;
        }

        bool on_regex(const std::string_view raw, const std::string_view pattern, const std::string_view flags) override {
            auto& c = record(Event::Regex);
            c.raw = raw;
            c.text = pattern;
            c.flags = flags;
            return true;
        }

        bool on_python_repr(const std::string_view raw) override {
            record(Event::PythonRepr).raw = raw;
            return true;
        }

        bool on_identifier(const std::string_view name) override {
            record(Event::Identifier).text = name;
            return true;
        }

        bool on_document_begin() override {
            return record_simple(Event::DocumentBegin);
        }
        bool on_document_end() override {
            return record_simple(Event::DocumentEnd);
        }

        bool on_array_begin(const ArrayKind kind) override {
            record(Event::ArrayBegin).kind = kind;
            return true;
        }
        bool on_array_element() override {
            return record_simple(Event::ArrayElement);
        }
        bool on_array_empty_slot() override {
            return record_simple(Event::ArrayEmptySlot);
        }
        bool on_array_end() override {
            return record_simple(Event::ArrayEnd);
        }

        bool on_mapping_begin() override {
            return record_simple(Event::MappingBegin);
        }
        bool on_mapping_key() override {
            return record_simple(Event::MappingKey);
        }
        bool on_mapping_value() override {
            return record_simple(Event::MappingValue);
        }
        bool on_mapping_end() override {
            return record_simple(Event::MappingEnd);
        }

        bool on_set_begin() override {
            return record_simple(Event::SetBegin);
        }
        bool on_set_element() override {
            return record_simple(Event::SetElement);
        }
        bool on_set_end() override {
            return record_simple(Event::SetEnd);
        }

        bool on_call_begin(const std::string_view name) override {
            record(Event::CallBegin).text = name;
            return true;
        }
        bool on_positional_argument() override {
            return record_simple(Event::PositionalArgument);
        }
        bool on_positional_arguments_end() override {
            return record_simple(Event::PositionalArgumentsEnd);
        }
        bool on_keyword_arguments_begin() override {
            return record_simple(Event::KeywordArgumentsBegin);
        }
        bool on_keyword_argument_key() override {
            return record_simple(Event::KeywordArgumentKey);
        }
        bool on_keyword_argument_value() override {
            return record_simple(Event::KeywordArgumentValue);
        }
        bool on_keyword_arguments_end() override {
            return record_simple(Event::KeywordArgumentsEnd);
        }
        bool on_call_end() override {
            return record_simple(Event::CallEnd);
        }

        // nothing is ever written by a recorder
        bool flush() override {
            return true;
        }

    private:
        RecordedCall& record(const Event e) {
            auto& c = calls_.emplace_back();
            c.event = e;
            return c;
        }

        bool record_simple(const Event e) {
            (void)record(e);
            return true;
        }

        [[nodiscard]] static bool dispatch(Builder& b, const RecordedCall& c) {
            switch (c.event) {
            case Event::Float:
                return b.on_float(c.raw, c.number);
            case Event::Integer:
                return b.on_integer(c.raw, c.integer);
            case Event::Bool:
                return b.on_bool(c.raw, c.boolean);
            case Event::Null:
                return b.on_null(c.raw);
            case Event::NamedConstant:
                return b.on_named_constant(c.raw, c.constant);
            case Event::String:
                return b.on_string(c.raw, c.text);
            case Event::Regex:
                return b.on_regex(c.raw, c.text, c.flags);
            case Event::PythonRepr:
                return b.on_python_repr(c.raw);
            case Event::Identifier:
                return b.on_identifier(c.text);
            case Event::DocumentBegin:
                return b.on_document_begin();
            case Event::DocumentEnd:
                return b.on_document_end();
            case Event::ArrayBegin:
                return b.on_array_begin(c.kind);
            case Event::ArrayElement:
                return b.on_array_element();
            case Event::ArrayEmptySlot:
                return b.on_array_empty_slot();
            case Event::ArrayEnd:
                return b.on_array_end();
            case Event::MappingBegin:
                return b.on_mapping_begin();
            case Event::MappingKey:
                return b.on_mapping_key();
            case Event::MappingValue:
                return b.on_mapping_value();
            case Event::MappingEnd:
                return b.on_mapping_end();
            case Event::SetBegin:
                return b.on_set_begin();
            case Event::SetElement:
                return b.on_set_element();
            case Event::SetEnd:
                return b.on_set_end();
            case Event::CallBegin:
                return b.on_call_begin(c.text);
            case Event::PositionalArgument:
                return b.on_positional_argument();
            case Event::PositionalArgumentsEnd:
                return b.on_positional_arguments_end();
            case Event::KeywordArgumentsBegin:
                return b.on_keyword_arguments_begin();
            case Event::KeywordArgumentKey:
                return b.on_keyword_argument_key();
            case Event::KeywordArgumentValue:
                return b.on_keyword_argument_value();
            case Event::KeywordArgumentsEnd:
                return b.on_keyword_arguments_end();
            case Event::CallEnd:
                return b.on_call_end();
            }
            return false;
        }

        std::vector<RecordedCall> calls_ {};
    };

    /*
     * Recursive-descent parser. Pulls tokens from the lexer and reports what it finds to the builder as it
     * goes; nothing is kept in memory except the few events recorded while deciding whether braces hold
     * a set or a mapping.
     *
     * Errors are not recovered: the first failure is recorded in the lexer's ParseError and every rule
     * returns false from there up.
     */
    class Parser {
    public:
        enum class Result : std::uint8_t {
            NoMatch,
            Matched,
            Failed
        };

        Parser(Lexer& lexer, Builder& builder, const ParserOptions opt = {}): lexer_(lexer), builder_(&builder), opt_(opt) { }

        [[nodiscard]] bool document() {
            if (!builder_->on_document_begin())
                return builder_failed();
            if (!expect_expression())
                return false;
            if (!builder_->on_document_end())
                return builder_failed();
            return true;
        }

        // Ordered choice over every kind of value; the first alternative that matches wins.
        [[nodiscard]] Result expression(const bool checked = false, const bool is_mapping_key = false) {
            if (lexer_.peek("["))
                return done(parse_list());

            if (lexer_.peek("("))
                return done(parse_tuple());

            if (lexer_.peek("{"))
                return done(parse_braces());

            if (lexer_.peek("'"))
                return done(parse_string(Pattern::SingleQuotedString));

            if (lexer_.peek("\""))
                return done(parse_string(Pattern::DoubleQuotedString));

            if (lexer_.peek("/"))
                return done(parse_regex());

            if (lexer_.peek("<")) {
                const auto m = lexer_.pop(Pattern::PythonRepr, true);
                if (!m)
                    return Result::Failed;
                return done(emitted(builder_->on_python_repr(m->text)));
            }

            if (const auto m = lexer_.pop(Pattern::Number))
                return done(parse_number(m->text));

            if (const auto m = lexer_.pop(Pattern::Bool))
                return done(emitted(builder_->on_bool(m->text, m->text[0] == 't' || m->text[0] == 'T')));

            if (const auto m = lexer_.pop(Pattern::Null))
                return done(emitted(builder_->on_null(m->text)));

            if (const auto m = lexer_.pop(Pattern::NamedConstant))
                return done(emitted(builder_->on_named_constant(m->text, named_constant_from(m->text).value_or(NamedConstant::Undefined))));

            if (const auto m = lexer_.peek(Pattern::FunctionCall))
                return done(parse_call(*m));

            if (const auto m = lexer_.pop(Pattern::Identifier)) {
                // unquoted mapping keys are plain strings
                if (is_mapping_key)
                    return done(emitted(builder_->on_string(m->text, m->text)));
                return done(emitted(builder_->on_identifier(m->text)));
            }

            if (checked) {
                if (is_mapping_key)
                    (void)lexer_.expected("key", ErrorCode::ExpectedKey);
                else
                    (void)lexer_.expected("expression", ErrorCode::ExpectedExpression);
                return Result::Failed;
            }
            return Result::NoMatch;
        }

        [[nodiscard]] CANIF_FORCEINLINE const ParseError& error() const noexcept {
            return lexer_.error();
        }

        [[nodiscard]] CANIF_FORCEINLINE bool ok() const noexcept {
            return lexer_.ok();
        }

    private:
        using Callback = bool (Builder::*)();

        // Routes builder events into a recorder for the lifetime of the scope.
        class RecordingScope {
        public:
            RecordingScope(Parser& p, Recorder& r): p_(p), previous_(p.builder_) {
                p_.builder_ = &r;
            }
            ~RecordingScope() {
                p_.builder_ = previous_;
            }

            RecordingScope(const RecordingScope&) = delete;
            RecordingScope& operator=(const RecordingScope&) = delete;

        private:
            Parser& p_;
            Builder* previous_;
        };

        [[nodiscard]] static CANIF_FORCEINLINE Result done(const bool ok) noexcept {
            return ok ? Result::Matched : Result::Failed;
        }

        [[nodiscard]] CANIF_FORCEINLINE bool expect_expression(const bool is_mapping_key = false) {
            return expression(true, is_mapping_key) == Result::Matched;
        }

        [[nodiscard]] bool builder_failed() {
            const auto code = builder_->ok() ? ErrorCode::BuilderInvalidState : builder_->error().code;
            return lexer_.fail(code, std::string("builder rejected event: ") + error_code_name(code));
        }

        [[nodiscard]] CANIF_FORCEINLINE bool emitted(const bool ok) {
            return ok || builder_failed();
        }

        // Checked before the opening token is consumed, so recovery can still echo it.
        [[nodiscard]] bool enter() {
            if (++depth_ > opt_.max_depth)
                return lexer_.fail(ErrorCode::DepthExceeded, "maximum nesting depth of " + std::to_string(opt_.max_depth) + " exceeded");
            return true;
        }

        [[nodiscard]] CANIF_FORCEINLINE bool leave() noexcept {
            --depth_;
            return true;
        }

        // "new   Foo" is reported as "new Foo"
        [[nodiscard]] static std::string call_name(const std::string_view raw) {
            std::string out;
            out.reserve(raw.size());
            for (std::size_t i = 0; i < raw.size(); ++i) {
                if (detail::is_space(raw[i])) {
                    while (i + 1 < raw.size() && detail::is_space(raw[i + 1]))
                        ++i;
                    out.push_back(' ');
                } else {
                    out.push_back(raw[i]);
                }
            }
            return out;
        }

        [[nodiscard]] bool parse_number(const std::string_view raw) {
            // from_chars rejects an explicit '+'
            const auto digits = raw[0] == '+' ? raw.substr(1) : raw;

            if (!detail::is_float_literal(raw)) {
                std::int64_t iv = 0;
                const auto [p, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), iv);
                if (ec == std::errc {} && p == digits.data() + digits.size())
                    return emitted(builder_->on_integer(raw, iv));
                // too large for int64: keep the literal, report it as a float
            }

            double dv = 0.0;
            const auto [p, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), dv);
            if (ec == std::errc::result_out_of_range)
                dv = std::strtod(std::string(digits).c_str(), nullptr);

            return emitted(builder_->on_float(raw, dv));
        }

        [[nodiscard]] bool parse_string(const Pattern quoted) {
            const auto m = lexer_.pop(quoted, true);
            if (!m)
                return false;
            const auto value = detail::decode_escapes(m->groups[0]);
            return emitted(builder_->on_string(m->text, value));
        }

        // Regex literals stay uncompiled: pattern and flags are handed over as strings.
        [[nodiscard]] bool parse_regex() {
            const auto m = lexer_.pop(Pattern::Regex, true);
            if (!m)
                return false;
            const auto pattern = detail::decode_escapes(m->groups[0]);
            return emitted(builder_->on_regex(m->text, pattern, m->groups[1]));
        }

        [[nodiscard]] bool parse_list() {
            if (!enter() || !lexer_.pop("[", true))
                return false;
            if (!builder_->on_array_begin(ArrayKind::List))
                return builder_failed();
            if (!comma_separated_list("]", &Builder::on_array_element, false, true))
                return false;
            if (!builder_->on_array_end())
                return builder_failed();
            return leave();
        }

        // A one-element tuple needs its comma: (1,)
        [[nodiscard]] bool parse_tuple() {
            if (!enter() || !lexer_.pop("(", true))
                return false;
            if (!builder_->on_array_begin(ArrayKind::Tuple))
                return builder_failed();
            if (!comma_separated_list(")", &Builder::on_array_element, true, false))
                return false;
            if (!builder_->on_array_end())
                return builder_failed();
            return leave();
        }

        [[nodiscard]] bool comma_separated_list(const std::string_view end_token, const Callback element, const bool needs_comma, const bool allow_empty_slots) {
            std::uint32_t elements = 0;
            while (!lexer_.peek(end_token)) {
                if (allow_empty_slots && lexer_.pop(",")) {
                    if (!builder_->on_array_empty_slot() || !(builder_->*element)())
                        return builder_failed();
                    continue;
                }

                if (!expect_expression())
                    return false;
                if (lexer_.peek(",") || lexer_.peek(end_token)) {
                    if (!(builder_->*element)())
                        return builder_failed();
                }

                ++elements;
                if (!lexer_.pop(",", needs_comma && elements == 1)) {
                    if (!lexer_.ok())
                        return false;
                    break;
                }
            }
            return lexer_.pop(end_token, true);
        }

        /*
         * After '{' we can't tell a set from a mapping until the first element has been read, so it is
         * parsed into a recorder. A ',' or '}' after it makes a set; anything else must be the ':' of a
         * mapping. The recorded events are then replayed as the set's first element or the mapping's
         * first key.
         *
         * Nested braces each replay into the enclosing recorder, so a first element n braces deep is
         * copied n times. max_depth bounds that cost.
         */
        [[nodiscard]] bool parse_braces() {
            if (!enter() || !lexer_.pop("{", true))
                return false;

            if (lexer_.pop("}")) {
                if (!builder_->on_mapping_begin() || !builder_->on_mapping_end())
                    return builder_failed();
                return leave();
            }

            Recorder recorder;
            auto first = Result::NoMatch;
            {
                RecordingScope scope(*this, recorder);
                first = expression(false, true);
            }

            if (first == Result::Failed) {
                // echo what was consumed so streaming output stays complete; the syntax error is what gets reported
                if (builder_->on_mapping_begin())
                    (void)recorder.replay(*builder_);
                return false;
            }

            const bool have_element = first == Result::Matched;
            if (have_element && (lexer_.pop(",") || lexer_.peek("}"))) {
                if (!continue_set(recorder))
                    return false;
            } else if (!continue_mapping(have_element, recorder)) {
                return false;
            }
            return leave();
        }

        [[nodiscard]] bool continue_set(const Recorder& recorder) {
            if (!builder_->on_set_begin())
                return builder_failed();

            // {a}: the bare word was read as a string key, but as a set element it is an identifier
            if (recorder.size() == 1 && recorder[0].event == Event::String && recorder[0].raw == recorder[0].text) {
                if (!builder_->on_identifier(recorder[0].raw))
                    return builder_failed();
            } else if (!recorder.replay(*builder_)) {
                return builder_failed();
            }

            if (!builder_->on_set_element())
                return builder_failed();
            if (!comma_separated_list("}", &Builder::on_set_element, false, false))
                return false;
            if (!builder_->on_set_end())
                return builder_failed();
            return true;
        }

        [[nodiscard]] bool mapping_pair() {
            if (!lexer_.pop(":", true))
                return false;
            if (!builder_->on_mapping_key())
                return builder_failed();
            return expect_expression();
        }

        [[nodiscard]] bool continue_mapping(const bool first_key_parsed, const Recorder& recorder) {
            if (!builder_->on_mapping_begin())
                return builder_failed();
            if (!recorder.replay(*builder_))
                return builder_failed();

            if (!first_key_parsed && !expect_expression(true))
                return false;
            if (!mapping_pair())
                return false;

            if (lexer_.pop(",")) {
                if (!builder_->on_mapping_value())
                    return builder_failed();

                while (!lexer_.peek("}")) {
                    if (!expect_expression(true) || !mapping_pair())
                        return false;
                    if (lexer_.peek(",") || lexer_.peek("}")) {
                        if (!builder_->on_mapping_value())
                            return builder_failed();
                    }
                    if (!lexer_.pop(","))
                        break;
                }
            } else if (lexer_.peek("}")) {
                if (!builder_->on_mapping_value())
                    return builder_failed();
            }

            if (!lexer_.pop("}", true))
                return false;
            if (!builder_->on_mapping_end())
                return builder_failed();
            return true;
        }

        /*
         * name(positional..., key=value...). An identifier directly followed by '=' starts a keyword
         * argument; once one has been seen, every later argument must be a keyword argument too.
         */
        [[nodiscard]] bool parse_call(const Match& head) {
            if (!enter())
                return false;
            lexer_.consume(head);
            if (!builder_->on_call_begin(call_name(head.group(1))))
                return builder_failed();

            auto have_keywords = false;
            while (!lexer_.peek(")")) {
                if (!have_keywords && lexer_.pop(",")) {
                    if (!builder_->on_array_empty_slot() || !builder_->on_positional_argument())
                        return builder_failed();
                    continue;
                }

                if (const auto key = lexer_.peek(Pattern::Identifier); key && lexer_.followed_by(*key, "=")) {
                    lexer_.consume(*key);
                    if (!lexer_.pop("=", true))
                        return false;

                    if (!have_keywords) {
                        have_keywords = true;
                        if (!builder_->on_positional_arguments_end() || !builder_->on_keyword_arguments_begin())
                            return builder_failed();
                    }

                    if (!builder_->on_string(key->text, key->text) || !builder_->on_keyword_argument_key())
                        return builder_failed();
                    if (!expect_expression())
                        return false;
                    if (lexer_.peek(",") || lexer_.peek(")")) {
                        if (!builder_->on_keyword_argument_value())
                            return builder_failed();
                    }
                } else if (have_keywords) {
                    return lexer_.fail(ErrorCode::PositionalAfterKeyword, std::string(kPositionalAfterKeyword));
                } else {
                    if (!expect_expression())
                        return false;
                    if (lexer_.peek(",") || lexer_.peek(")")) {
                        if (!builder_->on_positional_argument())
                            return builder_failed();
                    }
                }

                if (!lexer_.pop(","))
                    break;
            }

            if (!lexer_.pop(")", true))
                return false;

            const bool closed = have_keywords ? builder_->on_keyword_arguments_end() : builder_->on_positional_arguments_end();
            if (!closed || !builder_->on_call_end())
                return builder_failed();
            return leave();
        }

        Lexer& lexer_;
        Builder* builder_;
        ParserOptions opt_ {};
        std::uint32_t depth_ {};
    };

    struct StringSink {
        std::string out;

        [[nodiscard]] CANIF_FORCEINLINE bool put(const char c) {
            out.push_back(c);
            return true;
        }
        [[nodiscard]] CANIF_FORCEINLINE bool puts(const std::string_view s) {
            out.append(s);
            return true;
        }
        [[nodiscard]] CANIF_FORCEINLINE bool puts(const char* s) {
            out.append(s);
            return true;
        }

        [[nodiscard]] CANIF_FORCEINLINE std::string finish() {
            return std::move(out);
        }
    };

    // Writes straight through to a stream the caller keeps alive.
    struct StreamSink {
        std::ostream* os {};

        [[nodiscard]] CANIF_FORCEINLINE bool put(const char c) {
            os->put(c);
            return os->good();
        }
        [[nodiscard]] CANIF_FORCEINLINE bool puts(const std::string_view s) {
            os->write(s.data(), static_cast<std::streamsize>(s.size()));
            return os->good();
        }
        [[nodiscard]] CANIF_FORCEINLINE bool puts(const char* s) {
            return puts(std::string_view {s});
        }

        [[nodiscard]] bool finish() {
            os->flush();
            return os->good();
        }
    };

    enum class Type : std::uint8_t {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object
    };

    enum class NumberKind : std::uint8_t {
        Integer,
        Double
    };

    struct Number {
        NumberKind kind {NumberKind::Double};
        union {
            std::int64_t i;
            double d;
        };

        constexpr Number() noexcept: d(0.0) { }

        static constexpr Number from_i64(const std::int64_t v) noexcept {
            Number n;
            n.kind = NumberKind::Integer;
            n.i = v;
            return n;
        }

        static constexpr Number from_double(const double v) noexcept {
            Number n;
            n.kind = NumberKind::Double;
            n.d = v;
            return n;
        }

        [[nodiscard]] constexpr double as_double() const noexcept {
            return kind == NumberKind::Integer ? static_cast<double>(i) : d;
        }
    };

    /*
     * Owning JSON tree produced by ValueBuilder.
     *
     * Numbers carry the literal they were parsed from, so re-encoding prints "5.12e-1" rather than
     * the shortest form of the decoded double. Objects keep keys in insertion order; setting an
     * existing key replaces its value in place.
     */
    class Value {
    public:
        struct Member;

        Value() noexcept;
        Value(const Value&);
        Value(Value&&) noexcept;
        Value& operator=(const Value&);
        Value& operator=(Value&&) noexcept;
        ~Value();

        [[nodiscard]] static Value make_bool(const bool v) {
            Value out;
            out.type_ = Type::Bool;
            out.b_ = v;
            return out;
        }

        [[nodiscard]] static Value make_integer(const std::int64_t v, const std::string_view raw = {}) {
            Value out;
            out.type_ = Type::Number;
            out.num_ = Number::from_i64(v);
            out.raw_ = raw.empty() ? std::to_string(v) : std::string(raw);
            return out;
        }

        // Without a literal, the double is written in its shortest round-trip form.
        [[nodiscard]] static Value make_double(const double v, const std::string_view raw = {}) {
            Value out;
            out.type_ = Type::Number;
            out.num_ = Number::from_double(v);
            out.raw_ = raw;
            return out;
        }

        [[nodiscard]] static Value make_string(std::string s) {
            Value out;
            out.type_ = Type::String;
            out.str_ = std::move(s);
            return out;
        }

        [[nodiscard]] static Value make_array(std::vector<Value> items = {}) {
            Value out;
            out.type_ = Type::Array;
            out.items_ = std::move(items);
            return out;
        }

        [[nodiscard]] static Value make_object() {
            Value out;
            out.type_ = Type::Object;
            return out;
        }

        [[nodiscard]] CANIF_FORCEINLINE Type type() const noexcept {
            return type_;
        }

        [[nodiscard]] CANIF_FORCEINLINE bool is_null() const noexcept {
            return type_ == Type::Null;
        }
        [[nodiscard]] CANIF_FORCEINLINE bool is_bool() const noexcept {
            return type_ == Type::Bool;
        }
        [[nodiscard]] CANIF_FORCEINLINE bool is_number() const noexcept {
            return type_ == Type::Number;
        }
        [[nodiscard]] CANIF_FORCEINLINE bool is_string() const noexcept {
            return type_ == Type::String;
        }
        [[nodiscard]] CANIF_FORCEINLINE bool is_array() const noexcept {
            return type_ == Type::Array;
        }
        [[nodiscard]] CANIF_FORCEINLINE bool is_object() const noexcept {
            return type_ == Type::Object;
        }

        [[nodiscard]] CANIF_FORCEINLINE std::optional<std::string_view> try_string() const noexcept {
            if (type_ == Type::String)
                return std::string_view {str_};
            return std::nullopt;
        }
        [[nodiscard]] CANIF_FORCEINLINE std::optional<bool> try_bool() const noexcept {
            if (type_ == Type::Bool)
                return b_;
            return std::nullopt;
        }
        [[nodiscard]] CANIF_FORCEINLINE std::optional<std::int64_t> try_i64() const noexcept {
            if (type_ == Type::Number && num_.kind == NumberKind::Integer)
                return num_.i;
            return std::nullopt;
        }
        [[nodiscard]] CANIF_FORCEINLINE std::optional<double> try_double() const noexcept {
            if (type_ != Type::Number)
                return std::nullopt;
            return num_.as_double();
        }

        [[nodiscard]] CANIF_FORCEINLINE std::string_view as_string(const std::string_view def = {}) const noexcept {
            return type_ == Type::String ? std::string_view {str_} : def;
        }
        [[nodiscard]] CANIF_FORCEINLINE double as_double(const double def = 0.0) const noexcept {
            return type_ == Type::Number ? num_.as_double() : def;
        }
        [[nodiscard]] CANIF_FORCEINLINE std::int64_t as_i64(const std::int64_t def = 0) const noexcept {
            return type_ == Type::Number && num_.kind == NumberKind::Integer ? num_.i : def;
        }
        [[nodiscard]] CANIF_FORCEINLINE bool as_bool(const bool def = false) const noexcept {
            return type_ == Type::Bool ? b_ : def;
        }

        [[nodiscard]] CANIF_FORCEINLINE const Number& number() const noexcept {
            return num_;
        }

        // Source literal of a number; empty for doubles built without one.
        [[nodiscard]] CANIF_FORCEINLINE std::string_view raw_number() const noexcept {
            return raw_;
        }

        [[nodiscard]] CANIF_FORCEINLINE const std::vector<Value>& items() const noexcept {
            return items_;
        }

        [[nodiscard]] CANIF_FORCEINLINE const Value* at(const std::size_t i) const noexcept {
            return type_ == Type::Array && i < items_.size() ? &items_[i] : nullptr;
        }

        void push_back(Value v) {
            items_.push_back(std::move(v));
        }

        [[nodiscard]] std::size_t size() const noexcept;
        [[nodiscard]] const std::vector<Member>& members() const noexcept;
        [[nodiscard]] const Value* find(std::string_view key) const noexcept;
        [[nodiscard]] Value* find(std::string_view key) noexcept;
        void set(std::string key, Value v);

        [[nodiscard]] bool operator==(const Value& other) const;

    private:
        Type type_ {Type::Null};
        bool b_ {};
        Number num_ {};
        std::string str_ {};
        std::string raw_ {};
        std::vector<Value> items_ {};
        std::vector<Member> members_ {};
    };

    struct Value::Member {
        std::string key;
        Value value;
    };

    inline Value::Value() noexcept = default;
    inline Value::Value(const Value&) = default;
    inline Value::Value(Value&&) noexcept = default;
    inline Value& Value::operator=(const Value&) = default;
    inline Value& Value::operator=(Value&&) noexcept = default;
    inline Value::~Value() = default;

    inline std::size_t Value::size() const noexcept {
        switch (type_) {
        case Type::Array:
            return items_.size();
        case Type::Object:
            return members_.size();
        default:
            return 0;
        }
    }

    inline const std::vector<Value::Member>& Value::members() const noexcept {
        return members_;
    }

    inline const Value* Value::find(const std::string_view key) const noexcept {
        if (type_ != Type::Object)
            return nullptr;
        for (const auto& m : members_) {
            if (m.key == key)
                return &m.value;
        }
        return nullptr;
    }

    inline Value* Value::find(const std::string_view key) noexcept {
        return const_cast<Value*>(std::as_const(*this).find(key));
    }

    inline void Value::set(std::string key, Value v) {
        if (auto* existing = find(key)) {
            *existing = std::move(v);
            return;
        }
        members_.push_back(Member {std::move(key), std::move(v)});
    }

    inline bool Value::operator==(const Value& other) const {
        if (type_ != other.type_)
            return false;

        switch (type_) {
        case Type::Null:
            return true;
        case Type::Bool:
            return b_ == other.b_;
        case Type::Number:
            if (num_.kind == NumberKind::Integer && other.num_.kind == NumberKind::Integer)
                return num_.i == other.num_.i;
            return num_.as_double() == other.num_.as_double();
        case Type::String:
            return str_ == other.str_;
        case Type::Array:
            return items_ == other.items_;
        case Type::Object:
            if (members_.size() != other.members_.size())
                return false;
            for (const auto& m : members_) {
                const auto* o = other.find(m.key);
                if (!o || !(m.value == *o))
                    return false;
            }
            return true;
        }
        return false;
    }

    /*
     * Serialises a Value as JSON in the printers' layout: with an indent, one element per line and no
     * trailing commas; flat, ", " and ": " separators.
     */
    template <class Sink>
    class JsonWriterCore {
    public:
        JsonWriterCore(Sink sink, const PrinterOptions opt, const std::size_t max_depth = kDefaultMaxDepth, ParseError* err = nullptr)
            : sink_(std::move(sink)), opt_(opt), max_depth_(max_depth), err_(err) {
            if (err_)
                err_->reset();
        }

        [[nodiscard]] bool write(const Value& v) {
            switch (v.type()) {
            case Type::Null:
                return puts("null");
            case Type::Bool:
                return puts(v.as_bool() ? "true" : "false");
            case Type::Number:
                return write_number(v);
            case Type::String:
                return puts(detail::json_string(v.as_string(), opt_.ensure_ascii));
            case Type::Array:
            case Type::Object:
                return write_container(v);
            }
            return true;
        }

        [[nodiscard]] CANIF_FORCEINLINE auto finish() {
            return sink_.finish();
        }

    private:
        CANIF_FORCEINLINE void set_err(const ErrorCode c, std::string msg) const {
            if (err_)
                err_->set(c, 0, std::move(msg));
        }

        [[nodiscard]] CANIF_FORCEINLINE bool fail_write() const {
            set_err(ErrorCode::WriterFailed, "output sink rejected a write");
            return false;
        }

        [[nodiscard]] CANIF_FORCEINLINE bool put(const char c) {
            if (!sink_.put(c))
                return fail_write();
            return true;
        }

        [[nodiscard]] CANIF_FORCEINLINE bool puts(const std::string_view s) {
            if (!sink_.puts(s))
                return fail_write();
            return true;
        }

        [[nodiscard]] bool newline() {
            if (!opt_.indent)
                return true;

            if (!put('\n'))
                return false;

            for (std::size_t i = 0; i < indent_; ++i) {
                if (!put(' '))
                    return false;
            }
            return true;
        }

        [[nodiscard]] bool separator(const std::size_t i) {
            if (i && !put(','))
                return false;
            if (opt_.indent)
                return newline();
            return !i || put(' ');
        }

        [[nodiscard]] bool write_number(const Value& v) {
            if (const auto raw = v.raw_number(); !raw.empty())
                return puts(detail::json_number(raw));

            const double d = v.as_double();
            if (d != d || d == std::numeric_limits<double>::infinity() || d == -std::numeric_limits<double>::infinity()) {
                set_err(ErrorCode::WriterFailed, "non-finite number has no JSON representation");
                return false;
            }

            char tmp[32];
            auto [p, ec] = std::to_chars(tmp, tmp + sizeof(tmp), d);
            if (ec != std::errc {})
                return fail_write();
            return puts(std::string_view {tmp, static_cast<std::size_t>(p - tmp)});
        }

        [[nodiscard]] bool write_container(const Value& v) {
            if (depth_ + 1 > max_depth_) {
                set_err(ErrorCode::DepthExceeded, "maximum nesting depth exceeded while encoding");
                return false;
            }

            ++depth_;
            indent_ += opt_.indent;

            auto epilog = [this]() noexcept {
                indent_ -= opt_.indent;
                --depth_;
            };

            const bool is_array = v.is_array();
            if (!put(is_array ? '[' : '{')) {
                epilog();
                return false;
            }

            const std::size_t count = v.size();
            for (std::size_t i = 0; i < count; ++i) {
                if (!separator(i)) {
                    epilog();
                    return false;
                }

                if (is_array) {
                    if (!write(v.items()[i])) {
                        epilog();
                        return false;
                    }
                    continue;
                }

                const auto& m = v.members()[i];
                if (!puts(detail::json_string(m.key, opt_.ensure_ascii)) || !puts(": ") || !write(m.value)) {
                    epilog();
                    return false;
                }
            }

            epilog();
            if (count && !newline())
                return false;
            return put(is_array ? ']' : '}');
        }

        Sink sink_;
        PrinterOptions opt_ {};
        std::size_t indent_ {};

        std::size_t max_depth_ {};
        std::size_t depth_ {};

        ParseError* err_ {};
    };

    [[nodiscard]] inline std::string encode(const Value& v, const PrinterOptions opt, ParseError* err) {
        JsonWriterCore core(StringSink {}, opt, kDefaultMaxDepth, err);
        if (!core.write(v))
            return {};
        return core.finish();
    }

    [[nodiscard]] inline std::string encode(const Value& v, const bool pretty = false) {
        PrinterOptions opt {};
        if (!pretty)
            opt.indent = 0;
        return encode(v, opt, nullptr);
    }

    namespace detail {

        // Text used when a non-string value ends up as an object key.
        [[nodiscard]] inline std::string key_text(const Value& v) {
            if (const auto s = v.try_string())
                return std::string(*s);
            return encode(v, false);
        }

        inline constexpr std::string_view kIdentifierPrefix = "$$";

        [[nodiscard]] inline std::string call_tag(const std::string_view name) {
            if (name == "Date")
                return "$date";
            if (name == "ObjectId")
                return "$oid";
            return std::string(kIdentifierPrefix) + std::string(name);
        }

    } // namespace detail

    /*
     * Builds a Value from parser events, keeping one accumulator frame per open composite. Closing a
     * composite folds its frame into a finished Value which then waits in the pending slot until the
     * parent's separator event claims it.
     *
     * Encodings for what JSON cannot express: a set is {"$set": [...]}, an identifier "$$name", a regex
     * {"$regex": ..., "$options": ...}, a python repr "$repr<...>", and a call {"$$name": [args]} with
     * keyword arguments under "$kwargs". Date(x) and ObjectId(x) become {"$date": x} and {"$oid": x};
     * OrderedDict([(k, v), ...]) becomes an object.
     */
    class ValueBuilder final : public Builder {
    public:
        struct Options {
            bool unwrap_special_calls = true;
        };

        ValueBuilder() = default;
        explicit ValueBuilder(const Options opt): opt_(opt) { }

        [[nodiscard]] CANIF_FORCEINLINE const Value& root() const noexcept {
            return root_;
        }

        [[nodiscard]] Value take_root() noexcept {
            return std::move(root_);
        }

        bool on_float(const std::string_view raw, const double value) override {
            return push_value(Value::make_double(value, raw));
        }

        bool on_integer(const std::string_view raw, const std::int64_t value) override {
            return push_value(Value::make_integer(value, raw));
        }

        bool on_bool(std::string_view, const bool value) override {
            return push_value(Value::make_bool(value));
        }

        bool on_null(std::string_view) override {
            return push_value(Value {});
        }

        bool on_named_constant(std::string_view, const NamedConstant value) override {
            return push_value(Value::make_string(std::string(named_constant_tag(value))));
        }

        bool on_string(std::string_view, const std::string_view value) override {
            return push_value(Value::make_string(std::string(value)));
        }

        bool on_regex(std::string_view, const std::string_view pattern, const std::string_view flags) override {
            auto v = Value::make_object();
            v.set("$regex", Value::make_string(std::string(pattern)));
            if (!flags.empty())
                v.set("$options", Value::make_string(std::string(flags)));
            return push_value(std::move(v));
        }

        bool on_python_repr(const std::string_view raw) override {
            return push_value(Value::make_string("$repr" + std::string(raw)));
        }

        bool on_identifier(const std::string_view name) override {
            return push_value(Value::make_string(std::string(detail::kIdentifierPrefix) + std::string(name)));
        }

        bool on_document_begin() override {
            stack_.clear();
            pending_.reset();
            root_ = {};
            return true;
        }

        bool on_document_end() override {
            if (!stack_.empty())
                return fail(ErrorCode::BuilderInvalidState);
            if (!pending_)
                return fail(ErrorCode::BuilderMissingValue);
            root_ = std::move(*pending_);
            pending_.reset();
            return true;
        }

        bool on_array_begin(ArrayKind) override {
            return open(Frame::Kind::Array);
        }

        bool on_array_element() override {
            return append_to(Frame::Kind::Array);
        }

        bool on_array_empty_slot() override {
            return push_value(Value {});
        }

        bool on_array_end() override {
            if (!top_is(Frame::Kind::Array) || pending_)
                return fail(ErrorCode::BuilderInvalidState);
            auto items = std::move(stack_.back().items);
            stack_.pop_back();
            return push_value(Value::make_array(std::move(items)));
        }

        bool on_mapping_begin() override {
            return open(Frame::Kind::Mapping);
        }

        bool on_mapping_key() override {
            return take_key(Frame::Kind::Mapping);
        }

        bool on_mapping_value() override {
            return take_member(Frame::Kind::Mapping);
        }

        bool on_mapping_end() override {
            if (!top_is(Frame::Kind::Mapping))
                return fail(ErrorCode::BuilderInvalidState);
            if (stack_.back().key)
                return fail(ErrorCode::BuilderDanglingKey);
            if (pending_)
                return fail(ErrorCode::BuilderInvalidState);
            auto object = std::move(stack_.back().object);
            stack_.pop_back();
            return push_value(std::move(object));
        }

        bool on_set_begin() override {
            return open(Frame::Kind::Set);
        }

        bool on_set_element() override {
            return append_to(Frame::Kind::Set);
        }

        bool on_set_end() override {
            if (!top_is(Frame::Kind::Set) || pending_)
                return fail(ErrorCode::BuilderInvalidState);
            auto v = Value::make_object();
            v.set("$set", Value::make_array(std::move(stack_.back().items)));
            stack_.pop_back();
            return push_value(std::move(v));
        }

        bool on_call_begin(const std::string_view name) override {
            if (!open(Frame::Kind::Call))
                return false;
            stack_.back().name = name;
            return true;
        }

        bool on_positional_argument() override {
            if (top_is(Frame::Kind::Call) && stack_.back().has_keywords)
                return fail(ErrorCode::BuilderInvalidState);
            return append_to(Frame::Kind::Call);
        }

        bool on_positional_arguments_end() override {
            if (!top_is(Frame::Kind::Call) || pending_)
                return fail(ErrorCode::BuilderInvalidState);
            return true;
        }

        bool on_keyword_arguments_begin() override {
            if (!top_is(Frame::Kind::Call) || pending_)
                return fail(ErrorCode::BuilderInvalidState);
            stack_.back().has_keywords = true;
            return true;
        }

        bool on_keyword_argument_key() override {
            return take_key(Frame::Kind::Call);
        }

        bool on_keyword_argument_value() override {
            return take_member(Frame::Kind::Call);
        }

        bool on_keyword_arguments_end() override {
            if (!top_is(Frame::Kind::Call))
                return fail(ErrorCode::BuilderInvalidState);
            if (stack_.back().key)
                return fail(ErrorCode::BuilderDanglingKey);
            return true;
        }

        bool on_call_end() override {
            if (!top_is(Frame::Kind::Call) || pending_)
                return fail(ErrorCode::BuilderInvalidState);
            if (stack_.back().key)
                return fail(ErrorCode::BuilderDanglingKey);
            auto frame = std::move(stack_.back());
            stack_.pop_back();
            return push_value(finish_call(std::move(frame)));
        }

        bool flush() override {
            return true;
        }

    private:
        struct Frame {
            enum class Kind : std::uint8_t {
                Array,
                Mapping,
                Set,
                Call
            };

            Kind kind {Kind::Array};
            std::vector<Value> items {};
            // mapping members, or keyword arguments of a call
            Value object {Value::make_object()};
            std::optional<std::string> key {};
            std::string name {};
            bool has_keywords {};
        };

        [[nodiscard]] CANIF_FORCEINLINE bool top_is(const Frame::Kind k) const noexcept {
            return !stack_.empty() && stack_.back().kind == k;
        }

        [[nodiscard]] bool push_value(Value v) {
            if (pending_)
                return fail(ErrorCode::BuilderInvalidState);
            pending_ = std::move(v);
            return true;
        }

        [[nodiscard]] bool open(const Frame::Kind k) {
            if (pending_)
                return fail(ErrorCode::BuilderInvalidState);
            Frame f {};
            f.kind = k;
            stack_.push_back(std::move(f));
            return true;
        }

        [[nodiscard]] bool append_to(const Frame::Kind k) {
            if (!top_is(k))
                return fail(ErrorCode::BuilderInvalidState);
            if (!pending_)
                return fail(ErrorCode::BuilderMissingValue);
            stack_.back().items.push_back(std::move(*pending_));
            pending_.reset();
            return true;
        }

        [[nodiscard]] bool take_key(const Frame::Kind k) {
            if (!top_is(k) || stack_.back().key)
                return fail(ErrorCode::BuilderInvalidState);
            if (!pending_)
                return fail(ErrorCode::BuilderMissingValue);
            stack_.back().key = detail::key_text(*pending_);
            pending_.reset();
            return true;
        }

        [[nodiscard]] bool take_member(const Frame::Kind k) {
            if (!top_is(k) || !stack_.back().key)
                return fail(ErrorCode::BuilderInvalidState);
            if (!pending_)
                return fail(ErrorCode::BuilderMissingValue);
            auto& f = stack_.back();
            f.object.set(std::move(*f.key), std::move(*pending_));
            f.key.reset();
            pending_.reset();
            return true;
        }

        // OrderedDict(), OrderedDict({...}) and OrderedDict([(k, v), ...]) fold into a plain object.
        [[nodiscard]] static std::optional<Value> fold_ordered_dict(const std::vector<Value>& args) {
            if (args.empty())
                return Value::make_object();
            if (args.size() != 1)
                return std::nullopt;

            const auto& arg = args[0];
            if (arg.is_object())
                return arg;
            if (!arg.is_array())
                return std::nullopt;

            auto out = Value::make_object();
            for (const auto& pair : arg.items()) {
                if (!pair.is_array() || pair.size() != 2)
                    return std::nullopt;
                out.set(detail::key_text(pair.items()[0]), pair.items()[1]);
            }
            return out;
        }

        [[nodiscard]] Value finish_call(Frame f) const {
            if (opt_.unwrap_special_calls && !f.has_keywords) {
                if ((f.name == "Date" || f.name == "ObjectId") && f.items.size() == 1) {
                    auto out = Value::make_object();
                    out.set(detail::call_tag(f.name), std::move(f.items[0]));
                    return out;
                }
                if (f.name == "OrderedDict") {
                    if (auto folded = fold_ordered_dict(f.items))
                        return std::move(*folded);
                }
            }

            auto out = Value::make_object();
            out.set(detail::call_tag(f.name), Value::make_array(std::move(f.items)));
            if (f.has_keywords)
                out.set("$kwargs", std::move(f.object));
            return out;
        }

        Options opt_ {};
        std::vector<Frame> stack_ {};
        std::optional<Value> pending_ {};
        Value root_ {};
    };

    /*
     * Streaming pretty-printer. Output is written as events arrive; the only thing held back is the
     * spacer, the separator (comma, newline and indentation) owed before the next token. It is written
     * when more content follows, or replaced by the closing layout when the scope ends, so no byte is
     * ever taken back.
     *
     * Holes and one-element tuples force a trailing comma even when trailing commas are off, so that
     * `[1,]`, `[1,,]` and `(1,)` keep their meaning.
     */
    template <class Sink>
    class PrettyPrinter : public Builder {
    public:
        explicit PrettyPrinter(Sink sink, const PrinterOptions opt = {}): sink_(std::move(sink)), opt_(opt) { }

        [[nodiscard]] CANIF_FORCEINLINE Sink& sink() noexcept {
            return sink_;
        }

        [[nodiscard]] CANIF_FORCEINLINE const PrinterOptions& options() const noexcept {
            return opt_;
        }

        [[nodiscard]] CANIF_FORCEINLINE auto finish() {
            return sink_.finish();
        }

        // Ends a document. Bypasses the spacer, which is always empty between documents.
        [[nodiscard]] bool newline() {
            return write("\n");
        }

        bool flush() override {
            if (spacer_.empty())
                return true;
            const std::string pending = std::move(spacer_);
            spacer_.clear();
            return write(pending);
        }

        bool on_document_begin() override {
            return true;
        }

        bool on_document_end() override {
            if (!stack_.empty())
                return fail(ErrorCode::BuilderInvalidState);
            return true;
        }

        bool on_array_begin(const ArrayKind kind) override {
            return open(kind == ArrayKind::Tuple ? Scope::Tuple : Scope::List, kind == ArrayKind::Tuple ? "(" : "[");
        }

        bool on_array_element() override {
            return element();
        }

        // Nothing is printed for a hole; the pending separator is.
        bool on_array_empty_slot() override {
            if (stack_.empty())
                return fail(ErrorCode::BuilderInvalidState);
            stack_.back().pending_hole = true;
            return print("");
        }

        bool on_array_end() override {
            if (stack_.empty() || (stack_.back().scope != Scope::List && stack_.back().scope != Scope::Tuple))
                return fail(ErrorCode::BuilderInvalidState);
            return close(stack_.back().scope == Scope::Tuple ? ")" : "]");
        }

        bool on_mapping_begin() override {
            return open(Scope::Mapping, "{");
        }

        bool on_mapping_key() override {
            return print(": ");
        }

        bool on_mapping_value() override {
            return element();
        }

        bool on_mapping_end() override {
            if (stack_.empty() || stack_.back().scope != Scope::Mapping)
                return fail(ErrorCode::BuilderInvalidState);
            return close("}");
        }

    protected:
        enum class Scope : std::uint8_t {
            List,
            Tuple,
            Mapping,
            Set,
            Call
        };

        struct Frame {
            Scope scope {Scope::List};
            std::uint32_t count {};
            // an empty slot was printed since the last separator
            bool pending_hole {};
            bool ended_with_hole {};
        };

        virtual bool write(const std::string_view text) {
            if (!sink_.puts(text))
                return fail(ErrorCode::WriterFailed);
            return true;
        }

        [[nodiscard]] virtual std::uint32_t indent() const noexcept {
            return opt_.indent;
        }

        [[nodiscard]] bool print(const std::string_view text) {
            if (!spacer_.empty()) {
                const std::string pending = std::move(spacer_);
                spacer_.clear();
                if (!write(pending))
                    return false;
            }
            return text.empty() || write(text);
        }

        [[nodiscard]] std::string indent_string() const {
            const auto width = indent();
            if (width == 0)
                return {};
            return "\n" + std::string(static_cast<std::size_t>(width) * stack_.size(), ' ');
        }

        [[nodiscard]] bool open(const Scope scope, const std::string_view text) {
            if (!print(text))
                return false;
            stack_.push_back(Frame {scope});
            spacer_ = indent_string();
            return true;
        }

        [[nodiscard]] bool element() {
            if (stack_.empty())
                return fail(ErrorCode::BuilderInvalidState);

            auto& f = stack_.back();
            ++f.count;
            f.ended_with_hole = f.pending_hole;
            f.pending_hole = false;

            spacer_ = indent() ? "," + indent_string() : ", ";
            return true;
        }

        [[nodiscard]] bool close(const std::string_view text) {
            const Frame f = stack_.back();
            stack_.pop_back();

            const bool forced = f.ended_with_hole || (f.scope == Scope::Tuple && f.count == 1);
            if (indent() == 0)
                spacer_ = forced ? "," : "";
            else if (f.count == 0)
                spacer_.clear();
            else
                spacer_ = (opt_.trailing_commas || forced ? "," : "") + indent_string();

            return print(text);
        }

        Sink sink_;
        PrinterOptions opt_ {};
        std::vector<Frame> stack_ {};
        std::string spacer_ {};
    };

    // Prints every token as it was spelled in the input; only layout changes.
    template <class Sink>
    class VerbatimPrinter final : public PrettyPrinter<Sink> {
        using Base = PrettyPrinter<Sink>;
        using Scope = typename Base::Scope;

    public:
        using Base::Base;

        bool on_float(const std::string_view raw, double) override {
            return this->print(raw);
        }
        bool on_integer(const std::string_view raw, std::int64_t) override {
            return this->print(raw);
        }
        bool on_bool(const std::string_view raw, bool) override {
            return this->print(raw);
        }
        bool on_null(const std::string_view raw) override {
            return this->print(raw);
        }
        bool on_named_constant(const std::string_view raw, NamedConstant) override {
            return this->print(raw);
        }
        bool on_string(const std::string_view raw, std::string_view) override {
            return this->print(raw);
        }
        bool on_regex(const std::string_view raw, std::string_view, std::string_view) override {
            return this->print(raw);
        }
        bool on_python_repr(const std::string_view raw) override {
            return this->print(raw);
        }
        bool on_identifier(const std::string_view name) override {
            return this->print(name);
        }

        bool on_set_begin() override {
            return this->open(Scope::Set, "{");
        }
        bool on_set_element() override {
            return this->element();
        }
        bool on_set_end() override {
            if (this->stack_.empty() || this->stack_.back().scope != Scope::Set)
                return this->fail(ErrorCode::BuilderInvalidState);
            return this->close("}");
        }

        bool on_call_begin(const std::string_view name) override {
            return this->print(name) && this->open(Scope::Call, "(");
        }
        bool on_positional_argument() override {
            return this->element();
        }
        bool on_positional_arguments_end() override {
            return true;
        }
        bool on_keyword_arguments_begin() override {
            return true;
        }
        bool on_keyword_argument_key() override {
            return this->print("=");
        }
        bool on_keyword_argument_value() override {
            return this->element();
        }
        bool on_keyword_arguments_end() override {
            return true;
        }
        bool on_call_end() override {
            if (this->stack_.empty() || this->stack_.back().scope != Scope::Call)
                return this->fail(ErrorCode::BuilderInvalidState);
            return this->close(")");
        }
    };

    /*
     * Prints strictly valid JSON. Constructs JSON has no syntax for are rewritten into the same tagged
     * encodings ValueBuilder produces, except that Date and ObjectId arguments are never unwrapped.
     *
     * Mapping keys are printed into a capture buffer first: a key that did not come out as a JSON
     * string (a number, a tuple, ...) is then quoted as a whole.
     */
    template <class Sink>
    class JsonPrinter final : public PrettyPrinter<Sink> {
        using Base = PrettyPrinter<Sink>;

    public:
        explicit JsonPrinter(Sink sink, const PrinterOptions opt = {}): Base(std::move(sink), json_options(opt)) { }

        bool on_float(const std::string_view raw, double) override {
            return this->print(detail::json_number(raw));
        }
        bool on_integer(const std::string_view raw, std::int64_t) override {
            return this->print(detail::json_number(raw));
        }
        bool on_bool(std::string_view, const bool value) override {
            return this->print(value ? "true" : "false");
        }
        bool on_null(std::string_view) override {
            return this->print("null");
        }
        bool on_named_constant(std::string_view, const NamedConstant value) override {
            return print_string(named_constant_tag(value));
        }
        bool on_string(std::string_view, const std::string_view value) override {
            return print_string(value);
        }

        bool on_regex(std::string_view, const std::string_view pattern, const std::string_view flags) override {
            if (!on_mapping_begin() || !tagged("$regex") || !print_string(pattern) || !on_mapping_value())
                return false;
            if (!flags.empty()) {
                if (!tagged("$options") || !print_string(flags) || !on_mapping_value())
                    return false;
            }
            return on_mapping_end();
        }

        bool on_python_repr(const std::string_view raw) override {
            return print_string("$repr" + std::string(raw));
        }

        bool on_identifier(const std::string_view name) override {
            return print_string(std::string(detail::kIdentifierPrefix) + std::string(name));
        }

        // tuples print as lists
        bool on_array_begin(ArrayKind) override {
            return Base::on_array_begin(ArrayKind::List);
        }

        bool on_array_empty_slot() override {
            return this->print("null");
        }

        bool on_mapping_begin() override {
            return Base::on_mapping_begin() && begin_key();
        }

        bool on_mapping_key() override {
            if (captures_.empty())
                return this->fail(ErrorCode::BuilderInvalidState);

            auto key = std::move(captures_.back());
            captures_.pop_back();
            this->spacer_ = std::move(key.spacer);

            if (key.text.empty())
                return this->fail(ErrorCode::BuilderMissingValue);

            const bool quoted = key.text.front() == '"';
            return this->print(quoted ? key.text : detail::json_string(key.text, this->opt_.ensure_ascii)) && Base::on_mapping_key();
        }

        bool on_mapping_value() override {
            return Base::on_mapping_value() && begin_key();
        }

        bool on_mapping_end() override {
            if (captures_.empty())
                return this->fail(ErrorCode::BuilderInvalidState);

            auto key = std::move(captures_.back());
            captures_.pop_back();
            if (!key.text.empty())
                return this->fail(ErrorCode::BuilderDanglingKey);
            this->spacer_ = std::move(key.spacer);

            return Base::on_mapping_end();
        }

        bool on_set_begin() override {
            return on_mapping_begin() && tagged("$set") && Base::on_array_begin(ArrayKind::List);
        }
        bool on_set_element() override {
            return Base::on_array_element();
        }
        bool on_set_end() override {
            return Base::on_array_end() && on_mapping_value() && on_mapping_end();
        }

        bool on_call_begin(const std::string_view name) override {
            return on_mapping_begin() && tagged(detail::call_tag(name)) && Base::on_array_begin(ArrayKind::List);
        }
        bool on_positional_argument() override {
            return Base::on_array_element();
        }
        bool on_positional_arguments_end() override {
            return Base::on_array_end() && on_mapping_value();
        }
        bool on_keyword_arguments_begin() override {
            return tagged("$kwargs") && on_mapping_begin();
        }
        bool on_keyword_argument_key() override {
            return on_mapping_key();
        }
        bool on_keyword_argument_value() override {
            return on_mapping_value();
        }
        bool on_keyword_arguments_end() override {
            return on_mapping_end() && on_mapping_value();
        }
        bool on_call_end() override {
            return on_mapping_end();
        }

        // Writes out half-captured keys as well, in the order they were started.
        bool flush() override {
            auto captures = std::move(captures_);
            captures_.clear();
            for (const auto& c : captures) {
                if (!Base::write(c.spacer) || !Base::write(c.text))
                    return false;
            }
            return Base::flush();
        }

    protected:
        bool write(const std::string_view text) override {
            if (captures_.empty())
                return Base::write(text);
            captures_.back().text.append(text);
            return true;
        }

        // keys are always printed flat
        [[nodiscard]] std::uint32_t indent() const noexcept override {
            return captures_.empty() ? Base::indent() : 0;
        }

    private:
        struct Capture {
            // separator owed before the key, held back while it is captured
            std::string spacer;
            std::string text;
        };

        [[nodiscard]] static PrinterOptions json_options(PrinterOptions opt) noexcept {
            opt.trailing_commas = false;
            return opt;
        }

        [[nodiscard]] bool print_string(const std::string_view value) {
            return this->print(detail::json_string(value, this->opt_.ensure_ascii));
        }

        // A key written by the printer itself, followed by its colon.
        [[nodiscard]] bool tagged(const std::string_view key) {
            return print_string(key) && on_mapping_key();
        }

        [[nodiscard]] bool begin_key() {
            captures_.push_back(Capture {std::move(this->spacer_), {}});
            this->spacer_.clear();
            return true;
        }

        std::vector<Capture> captures_ {};
    };

    /*
     * Runs the parser over `text`, printing every document followed by a newline. Without
     * `single_document` the input may hold any number of documents, including none.
     *
     * On failure, whatever was already formatted stays in the sink, followed by the unparsed rest of the
     * input exactly as it was, so the output still holds all of the input.
     */
    template <class Sink>
    [[nodiscard]] ParseError translate(PrettyPrinter<Sink>& printer, const std::string_view text, const bool single_document = false, const ParserOptions opt = {}) {
        Lexer lexer(text);
        Parser parser(lexer, printer, opt);

        const auto recover = [&]() {
            ParseError err = lexer.ok() ? printer.error() : lexer.error();
            err.input = text;
            if (!printer.flush() || !lexer.flush_remainder(printer.sink()))
                err.set(ErrorCode::WriterFailed, lexer.position(), "failed to echo the unparsed input");
            return err;
        };

        if (single_document) {
            if (!parser.document() || !printer.newline() || !lexer.end(true))
                return recover();
            return lexer.error();
        }

        while (!lexer.at_end()) {
            if (!parser.document() || !printer.newline())
                return recover();
        }
        return lexer.error();
    }

    // Parses exactly one document; anything but whitespace and comments after it is an error.
    [[nodiscard]] inline ParseError parse_to_value(const std::string_view text, Value& out, const ParserOptions opt = {}) {
        Lexer lexer(text);
        ValueBuilder builder;
        Parser parser(lexer, builder, opt);

        if (!parser.document() || !lexer.end(true))
            return lexer.error();

        out = builder.take_root();
        return lexer.error();
    }

    [[nodiscard]] inline ParseError validate(const std::string_view text, const ParserOptions opt = {}) {
        Lexer lexer(text);
        NullBuilder builder;
        Parser parser(lexer, builder, opt);

        if (!parser.document() || !lexer.end(true))
            return lexer.error();
        return {};
    }

    // A parsed document. error().input refers to the text passed to parse(), which must outlive it.
    class Document {
    public:
        [[nodiscard]] static Document parse(const std::string_view text, const ParserOptions opt = {}) {
            Document doc;
            doc.err_ = parse_to_value(text, doc.root_, opt);
            return doc;
        }

        [[nodiscard]] CANIF_FORCEINLINE const Value& root() const noexcept {
            return root_;
        }

        [[nodiscard]] CANIF_FORCEINLINE Value take_root() noexcept {
            return std::move(root_);
        }

        [[nodiscard]] CANIF_FORCEINLINE const ParseError& error() const noexcept {
            return err_;
        }

        [[nodiscard]] CANIF_FORCEINLINE bool ok() const noexcept {
            return err_.ok();
        }

        [[nodiscard]] CANIF_FORCEINLINE explicit operator bool() const noexcept {
            return ok();
        }

    private:
        Document() = default;

        Value root_ {};
        ParseError err_ {};
    };

    // Reformats `text` into a string; on a syntax error the string holds the recovered output.
    template <template <class> class Printer = VerbatimPrinter>
    [[nodiscard]] std::string reformat(const std::string_view text, const PrinterOptions popt = {}, ParseError* err = nullptr, const bool single_document = false) {
        Printer<StringSink> printer(StringSink {}, popt);
        auto e = translate(printer, text, single_document);
        if (err)
            *err = std::move(e);
        return printer.finish();
    }

} // namespace canif

#endif // CANIF_HPP
