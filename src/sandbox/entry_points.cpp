#include "sandbox/entry_points.hpp"

#include <codegrader/logging.hpp>

#include <fmt/ranges.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/reverse.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codegrader {

namespace {

enum class ScanState { Code, LineComment, BlockComment, SingleQuoted, DoubleQuoted, Template, RegexLiteral };

bool is_word_char(char chr) {
    const auto uchr = static_cast<unsigned char>(chr);

    // Bytes of multi-byte UTF-8 sequences are treated as part of an identifier
    return (uchr >= 'a' && uchr <= 'z') || (uchr >= 'A' && uchr <= 'Z') || (uchr >= '0' && uchr <= '9') ||
           uchr == '_' || uchr == '$' || uchr >= 0x80;
}

bool is_identifier(std::string_view text) {
    return !text.empty() && is_word_char(text.front()) && !(text.front() >= '0' && text.front() <= '9');
}

/// Whether a '/' following ``prev_token`` starts a regular expression literal rather than a division
bool starts_regex_literal(std::string_view prev_token) {
    static constexpr std::string_view OPERAND_EXPECTED_AFTER = "(,=:[!&|?{};+-*%<>~^";

    static constexpr std::array<std::string_view, 13> KEYWORDS = {
        {"return", "typeof", "case", "do", "else", "in", "instanceof", "new", "void", "delete", "throw", "yield",
         "await"}};

    if (prev_token.empty()) {
        return true;
    }

    if (prev_token.size() == 1 && !is_word_char(prev_token.front())) {
        return OPERAND_EXPECTED_AFTER.find(prev_token.front()) != std::string_view::npos;
    }

    return ranges::any_of(KEYWORDS, [prev_token](std::string_view keyword) { return keyword == prev_token; });
}

struct Token
{
    std::string_view text;
    std::size_t offset;
};

/// Splits masked code into identifier-like words and single punctuators, with "=>" kept whole
std::vector<Token> tokenize(std::string_view code) {
    std::vector<Token> tokens;

    std::size_t pos = 0;
    while (pos < code.size()) {
        const char chr = code[pos];

        if (chr == ' ' || chr == '\n' || chr == '\t' || chr == '\r' || chr == '\f' || chr == '\v') {
            ++pos;
            continue;
        }

        std::size_t end = pos + 1;

        if (is_word_char(chr)) {
            while (end < code.size() && is_word_char(code[end])) {
                ++end;
            }
        } else if (chr == '=' && end < code.size() && code[end] == '>') {
            ++end;
        }

        tokens.push_back({.text = code.substr(pos, end - pos), .offset = pos});
        pos = end;
    }

    return tokens;
}

/// Whether the tokens starting at ``idx`` are the right-hand side of a function binding:
/// ``function``, ``(...) =>`` or ``arg =>``, optionally preceded by ``async``
bool binds_function(const std::vector<Token>& tokens, std::size_t idx) {
    const auto text_at = [&tokens](std::size_t i) { return i < tokens.size() ? tokens[i].text : std::string_view{}; };

    if (text_at(idx) == "async" && text_at(idx + 1) != "=>") {
        ++idx;
    }

    if (text_at(idx) == "function") {
        return true;
    }

    if (is_identifier(text_at(idx))) {
        return text_at(idx + 1) == "=>";
    }

    if (text_at(idx) != "(") {
        return false;
    }

    int depth = 0;
    for (; idx < tokens.size(); ++idx) {
        if (tokens[idx].text == "(") {
            ++depth;
        } else if (tokens[idx].text == ")" && --depth == 0) {
            return text_at(idx + 1) == "=>";
        }
    }

    return false;
}

} // namespace

std::string mask_nested_code(std::string_view source) {
    std::string masked(source.size(), ' ');

    ScanState state = ScanState::Code;
    int brace_depth = 0;
    int template_expr_depth = 0;
    bool in_regex_class = false;

    // Last significant token of code, used to tell a regex literal from a division
    std::string_view prev_token;

    for (std::size_t i = 0; i < source.size(); ++i) {
        const char chr = source[i];
        const char next = i + 1 < source.size() ? source[i + 1] : '\0';

        if (chr == '\n') {
            masked[i] = '\n';
        }

        switch (state) {
        case ScanState::Code:
            if (chr == '/' && next == '/') {
                state = ScanState::LineComment;
                ++i;
            } else if (chr == '/' && next == '*') {
                state = ScanState::BlockComment;
                ++i;
            } else if (chr == '/' && starts_regex_literal(prev_token)) {
                state = ScanState::RegexLiteral;
                in_regex_class = false;
            } else if (chr == '\'') {
                state = ScanState::SingleQuoted;
            } else if (chr == '"') {
                state = ScanState::DoubleQuoted;
            } else if (chr == '`') {
                state = ScanState::Template;
            } else if (chr == '{') {
                ++brace_depth;
            } else if (chr == '}') {
                brace_depth = brace_depth > 0 ? brace_depth - 1 : 0;
            } else if (is_word_char(chr)) {
                std::size_t end = i + 1;
                while (end < source.size() && is_word_char(source[end])) {
                    ++end;
                }

                if (brace_depth == 0) {
                    masked.replace(i, end - i, source.substr(i, end - i));
                }

                prev_token = source.substr(i, end - i);
                i = end - 1;
                break;
            } else if (brace_depth == 0 && chr != '\n') {
                masked[i] = chr;
            }

            // Literals count as operands; comments and whitespace are not tokens
            if (state == ScanState::Code || state == ScanState::SingleQuoted || state == ScanState::DoubleQuoted ||
                state == ScanState::Template) {
                if (chr != ' ' && chr != '\n' && chr != '\t' && chr != '\r') {
                    prev_token = source.substr(i, 1);
                }
            }
            break;

        case ScanState::LineComment:
            if (chr == '\n') {
                state = ScanState::Code;
            }
            break;

        case ScanState::BlockComment:
            if (chr == '*' && next == '/') {
                state = ScanState::Code;
                ++i;
            }
            break;

        case ScanState::SingleQuoted:
        case ScanState::DoubleQuoted:
            if (chr == '\\') {
                ++i;
            } else if (chr == '\n' || chr == (state == ScanState::SingleQuoted ? '\'' : '"')) {
                // A newline ends an unterminated literal; the parser will complain about it, not us
                state = ScanState::Code;
            }
            break;

        case ScanState::Template:
            if (chr == '\\') {
                ++i;
            } else if (chr == '$' && next == '{') {
                ++template_expr_depth;
                ++i;
            } else if (chr == '{' && template_expr_depth > 0) {
                ++template_expr_depth;
            } else if (chr == '}' && template_expr_depth > 0) {
                --template_expr_depth;
            } else if (chr == '`' && template_expr_depth == 0) {
                state = ScanState::Code;
            }
            break;

        case ScanState::RegexLiteral:
            if (chr == '\\') {
                ++i;
            } else if (chr == '[') {
                in_regex_class = true;
            } else if (chr == ']') {
                in_regex_class = false;
            } else if (chr == '\n' || (chr == '/' && !in_regex_class)) {
                state = ScanState::Code;
                // The closing slash stands in for the literal so that a following '/' is a division
                prev_token = source.substr(i, 1);
                if (chr == '\n') {
                    prev_token = {};
                }
            }
            break;
        }
    }

    return masked;
}

std::vector<std::string> find_entry_candidates(std::string_view source) {
    const std::string masked = mask_nested_code(source);
    const std::vector<Token> tokens = tokenize(masked);

    const auto text_at = [&tokens](std::size_t i) { return i < tokens.size() ? tokens[i].text : std::string_view{}; };

    // (offset, name) in source order
    std::vector<std::pair<std::size_t, std::string>> found;

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const std::string_view text = tokens[i].text;

        // Member accesses such as `obj.function` or `x.const` are not declarations
        if (i > 0 && tokens[i - 1].text == ".") {
            continue;
        }

        if (text == "function") {
            std::size_t name_idx = i + 1;
            if (text_at(name_idx) == "*") {
                ++name_idx;
            }

            if (is_identifier(text_at(name_idx)) && text_at(name_idx + 1) == "(") {
                found.emplace_back(tokens[name_idx].offset, std::string{tokens[name_idx].text});
            }
        } else if (text == "const" || text == "let" || text == "var") {
            if (is_identifier(text_at(i + 1)) && text_at(i + 2) == "=" && binds_function(tokens, i + 3)) {
                found.emplace_back(tokens[i + 1].offset, std::string{tokens[i + 1].text});
            }
        }
    }

    // Keep only the last declaration of each name, preserving source order
    std::vector<std::string> names;
    for (auto iter = found.rbegin(); iter != found.rend(); ++iter) {
        if (ranges::find(names, iter->second) == names.end()) {
            names.push_back(iter->second);
        }
    }
    ranges::reverse(names);

    LOG_TRACE("Entry candidates: {}", names);

    return names;
}

} // namespace codegrader
