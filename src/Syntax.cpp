/**
 * @file Syntax.cpp
 * @brief Token helpers for the syntax tree
 */

#include "stackyaml/Syntax.hpp"
#include "stackyaml/Parse.hpp"

#include <cstdio>

namespace stackyaml {

std::string describe(const Token& token) {
    switch (token.type) {
        case TokenType::DocumentStart: return "document start '---'";
        case TokenType::DocumentEnd:   return "document end '...'";
        case TokenType::SequenceEntry: return "sequence entry '-'";
        case TokenType::MappingValue:  return "':'";
        case TokenType::FlowEntry:     return "','";
        case TokenType::MappingStart:  return "'{'";
        case TokenType::MappingEnd:    return "'}'";
        case TokenType::SequenceStart: return "'['";
        case TokenType::SequenceEnd:   return "']'";
        case TokenType::Scalar:        return "scalar '" + token.value + "'";
        case TokenType::StreamEnd:     return "end of document";
    }
    return "token";
}

const char* kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::Null:     return "null";
        case NodeKind::Scalar:   return "scalar";
        case NodeKind::Mapping:  return "mapping";
        case NodeKind::Sequence: return "sequence";
    }
    return "unknown";
}

Token make_synthetic_token(TokenType type, std::string text, int column) {
    Token token;
    token.type = type;
    token.value = text;
    token.text = std::move(text);
    token.position.column = column < 0 ? 0 : column;
    token.synthetic = true;
    return token;
}

Token make_scalar_token(const std::string& value, int column) {
    if (is_plain_safe(value)) {
        return make_synthetic_token(TokenType::Scalar, value, column);
    }
    Token token = make_synthetic_token(TokenType::Scalar, quote_scalar(value), column);
    token.style = ScalarStyle::DoubleQuoted;
    token.value = value;
    return token;
}

namespace {
    bool is_space(char c) {
        return c == ' ' || c == '\t';
    }

    bool is_flow_indicator(char c) {
        return c == ',' || c == '[' || c == ']' || c == '{' || c == '}';
    }
}

bool is_plain_safe(const std::string& text) {
    if (text.empty()) return false;
    if (is_space(text.front()) || is_space(text.back())) return false;

    const char first = text.front();
    switch (first) {
        case '#': case '&': case '*': case '!': case '|': case '>':
        case '\'': case '"': case '%': case '@': case '`':
        case ',': case '[': case ']': case '{': case '}':
            return false;
        case '-': case '?': case ':':
            // "-1" is fine, "- x" and a lone "-" are not
            if (text.size() == 1 || is_space(text[1])) return false;
            break;
        default:
            break;
    }
    if (text.size() >= 3 && (text.compare(0, 3, "---") == 0 || text.compare(0, 3, "...") == 0)) {
        return false;
    }

    for (size_t i = 0; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (c < 0x20 || c == 0x7f) return false;
        if (text[i] == ':' && (i + 1 == text.size() || is_space(text[i + 1]) ||
                               is_flow_indicator(text[i + 1]))) {
            return false;
        }
        if (text[i] == '#' && i > 0 && is_space(text[i - 1])) return false;
        if (is_flow_indicator(text[i])) return false;
    }

    // Plain text that reads back as a number, bool or null must be quoted
    return resolve_plain_scalar(text).is_string();
}

std::string quote_scalar(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '"';
    for (char ch : value) {
        switch (ch) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            case '\0': out += "\\0"; break;
            default: {
                const unsigned char c = static_cast<unsigned char>(ch);
                if (c < 0x20 || c == 0x7f) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02X", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += ch;
                }
                break;
            }
        }
    }
    out += '"';
    return out;
}

} // namespace stackyaml
