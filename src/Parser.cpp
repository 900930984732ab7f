/**
 * @file Parser.cpp
 * @brief Scanner and recursive-descent parser
 *
 * The scanner attaches all whitespace and comments to tokens so that the
 * printer can reproduce the input byte for byte. The parser builds the
 * tree from token columns; block structure is decided by indentation.
 */

#include "stackyaml/Parser.hpp"
#include "stackyaml/Errors.hpp"

#include <utility>

namespace stackyaml {

namespace {

constexpr int MAX_NESTING_DEPTH = 256;

bool is_flow_indicator(char c) {
    return c == ',' || c == '[' || c == ']' || c == '{' || c == '}';
}

void append_utf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

void rtrim_blanks(std::string& s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.pop_back();
}

// ============================================================================
// Scanner
// ============================================================================

class Scanner {
public:
    explicit Scanner(const std::string& source) : src_(source) {}

    std::vector<Token> run() {
        while (true) {
            std::string leading = scan_leading();
            Position pos{line_, static_cast<int>(pos_ - line_start_)};
            const bool first = last_token_line_ < line_;

            if (eof(pos_)) {
                Token end;
                end.type = TokenType::StreamEnd;
                end.leading = std::move(leading);
                end.position = pos;
                end.first_on_line = first;
                tokens_.push_back(std::move(end));
                break;
            }

            if (first) {
                line_indent_ = pos.column;
                content_indent_ = -1;
                if (flow_level_ == 0) {
                    for (size_t i = line_start_; i < pos_; ++i) {
                        if (src_[i] == '\t') {
                            fail(i, "tab characters must not be used for indentation");
                        }
                    }
                }
            }

            Token token = scan_token();
            if (content_indent_ < 0 && token.type != TokenType::SequenceEntry) {
                content_indent_ = pos.column;
            }
            token.leading = std::move(leading);
            token.position = pos;
            token.first_on_line = first;
            last_token_line_ = line_;
            last_token_end_ = pos_;
            token.trailing = scan_trailing();
            tokens_.push_back(std::move(token));
        }
        return std::move(tokens_);
    }

private:
    const std::string& src_;
    size_t pos_ = 0;
    int line_ = 1;
    size_t line_start_ = 0;
    int flow_level_ = 0;
    int last_token_line_ = 0;
    size_t last_token_end_ = 0;
    int line_indent_ = 0;
    int content_indent_ = -1;   ///< column of the first non-dash token on the line
    std::vector<Token> tokens_;

    bool eof(size_t i) const { return i >= src_.size(); }

    char at(size_t i) const { return i < src_.size() ? src_[i] : '\0'; }

    bool is_break(size_t i) const {
        return at(i) == '\n' || (at(i) == '\r' && at(i + 1) == '\n');
    }

    size_t break_length(size_t i) const {
        return at(i) == '\r' ? 2 : 1;
    }

    bool is_blank_or_end(size_t i) const {
        return eof(i) || at(i) == ' ' || at(i) == '\t' || is_break(i);
    }

    void advance_to(size_t end) {
        for (size_t i = pos_; i < end; ++i) {
            if (src_[i] == '\n') {
                ++line_;
                line_start_ = i + 1;
            }
        }
        pos_ = end;
    }

    [[noreturn]] void fail(size_t index, const std::string& message) const {
        int line = 1;
        size_t line_begin = 0;
        for (size_t i = 0; i < index && i < src_.size(); ++i) {
            if (src_[i] == '\n') {
                ++line;
                line_begin = i + 1;
            }
        }
        throw ParseError(line, static_cast<int>(index - line_begin) + 1, message);
    }

    std::string scan_leading() {
        const size_t start = pos_;
        while (!eof(pos_)) {
            const char c = at(pos_);
            if (c == ' ' || c == '\t') {
                ++pos_;
            } else if (c == '#') {
                while (!eof(pos_) && !is_break(pos_)) ++pos_;
            } else if (is_break(pos_)) {
                advance_to(pos_ + break_length(pos_));
            } else if (c == '\r') {
                ++pos_;
            } else {
                break;
            }
        }
        return src_.substr(start, pos_ - start);
    }

    std::string scan_trailing() {
        size_t i = pos_;
        while (at(i) == ' ' || at(i) == '\t') ++i;
        if (at(i) == '#') {
            while (!eof(i) && !is_break(i)) ++i;
        } else if (!eof(i) && !is_break(i)) {
            return "";
        }
        std::string trailing = src_.substr(pos_, i - pos_);
        pos_ = i;
        return trailing;
    }

    Token take(TokenType type, size_t length) {
        Token token;
        token.type = type;
        token.text = src_.substr(pos_, length);
        token.value = token.text;
        advance_to(pos_ + length);
        return token;
    }

    bool follows_quoted_scalar() const {
        if (tokens_.empty() || last_token_end_ != pos_) return false;
        const Token& prev = tokens_.back();
        return prev.type == TokenType::Scalar &&
               (prev.style == ScalarStyle::SingleQuoted || prev.style == ScalarStyle::DoubleQuoted);
    }

    Token scan_token() {
        const char c = at(pos_);

        if (flow_level_ == 0 && pos_ == line_start_ && is_blank_or_end(pos_ + 3)) {
            if (src_.compare(pos_, 3, "---") == 0) return take(TokenType::DocumentStart, 3);
            if (src_.compare(pos_, 3, "...") == 0) return take(TokenType::DocumentEnd, 3);
        }

        switch (c) {
            case '-':
                if (is_blank_or_end(pos_ + 1)) {
                    if (flow_level_ > 0) {
                        fail(pos_, "block sequence entries are not allowed in flow context");
                    }
                    return take(TokenType::SequenceEntry, 1);
                }
                break;
            case ':':
                if (is_blank_or_end(pos_ + 1) ||
                    (flow_level_ > 0 && (is_flow_indicator(at(pos_ + 1)) || follows_quoted_scalar()))) {
                    return take(TokenType::MappingValue, 1);
                }
                break;
            case '?':
                if (is_blank_or_end(pos_ + 1)) {
                    fail(pos_, "complex mapping keys are not supported");
                }
                break;
            case '{':
                ++flow_level_;
                return take(TokenType::MappingStart, 1);
            case '[':
                ++flow_level_;
                return take(TokenType::SequenceStart, 1);
            case '}':
            case ']':
                if (flow_level_ == 0) {
                    fail(pos_, std::string("unexpected '") + c + "'");
                }
                --flow_level_;
                return take(c == '}' ? TokenType::MappingEnd : TokenType::SequenceEnd, 1);
            case ',':
                if (flow_level_ == 0) {
                    fail(pos_, "unexpected ',' outside a flow collection");
                }
                return take(TokenType::FlowEntry, 1);
            case '&':
                fail(pos_, "anchors are not supported");
            case '*':
                fail(pos_, "aliases are not supported");
            case '!':
                fail(pos_, "tags are not supported");
            case '%':
                fail(pos_, pos_ == line_start_ ? "directives are not supported"
                                               : "'%' cannot start a plain scalar");
            case '@':
            case '`':
                fail(pos_, std::string("reserved indicator '") + c + "' cannot start a plain scalar");
            case '|':
            case '>':
                if (flow_level_ > 0) {
                    fail(pos_, "block scalars are not allowed in flow context");
                }
                return scan_block_scalar();
            case '\'':
                return scan_single_quoted();
            case '"':
                return scan_double_quoted();
            default:
                break;
        }
        return scan_plain();
    }

    // End of plain scalar content on the line starting at from
    size_t plain_line_end(size_t from) const {
        size_t end = from;
        size_t i = from;
        while (!eof(i) && !is_break(i)) {
            const char ch = at(i);
            if (ch == ':' && (is_blank_or_end(i + 1) ||
                              (flow_level_ > 0 && is_flow_indicator(at(i + 1))))) {
                break;
            }
            if (ch == '#' && i > from && (at(i - 1) == ' ' || at(i - 1) == '\t')) break;
            if (flow_level_ > 0 && is_flow_indicator(ch)) break;
            if (ch == '\r') break;
            ++i;
            if (ch != ' ' && ch != '\t') end = i;
        }
        return end;
    }

    Token scan_plain() {
        const size_t start = pos_;
        size_t end = plain_line_end(start);
        if (end == start) {
            fail(start, "unexpected character");
        }
        std::string value = src_.substr(start, end - start);

        // Continuation lines indented past the enclosing block fold into the scalar
        int parent_indent = content_indent_ >= 0 ? content_indent_ : line_indent_;
        if (content_indent_ < 0 && static_cast<int>(start - line_start_) == line_indent_) {
            parent_indent = line_indent_ - 1;
        }
        while (true) {
            size_t i = end;
            while (at(i) == ' ' || at(i) == '\t') ++i;
            if (!is_break(i)) break;

            int breaks = 0;
            int indent = 0;
            size_t k = i;
            while (is_break(k)) {
                ++breaks;
                k += break_length(k);
                indent = 0;
                while (at(k) == ' ') {
                    ++indent;
                    ++k;
                }
                while (at(k) == ' ' || at(k) == '\t') ++k;
            }

            if (eof(k) || at(k) == '#') break;
            if (flow_level_ == 0 && indent <= parent_indent) break;
            if (indent == 0 && is_blank_or_end(k + 3) &&
                (src_.compare(k, 3, "---") == 0 || src_.compare(k, 3, "...") == 0)) {
                break;
            }
            if (flow_level_ > 0 && is_flow_indicator(at(k))) break;

            const size_t segment_end = plain_line_end(k);
            if (segment_end == k) break;

            if (breaks == 1) {
                value += ' ';
            } else {
                value.append(static_cast<size_t>(breaks - 1), '\n');
            }
            value.append(src_, k, segment_end - k);
            end = segment_end;
        }

        Token token = take(TokenType::Scalar, end - start);
        token.style = ScalarStyle::Plain;
        token.value = std::move(value);
        return token;
    }

    // Folds a line break inside a quoted scalar; returns the index after it
    size_t fold_break(size_t i, std::string& value) const {
        rtrim_blanks(value);
        i += break_length(i);
        int blank_lines = 0;
        while (true) {
            size_t j = i;
            while (at(j) == ' ' || at(j) == '\t') ++j;
            if (is_break(j)) {
                ++blank_lines;
                i = j + break_length(j);
                continue;
            }
            i = j;
            break;
        }
        if (blank_lines == 0) {
            value += ' ';
        } else {
            value.append(static_cast<size_t>(blank_lines), '\n');
        }
        return i;
    }

    Token scan_single_quoted() {
        const size_t start = pos_;
        size_t i = pos_ + 1;
        std::string value;
        while (true) {
            if (eof(i)) fail(start, "unterminated single-quoted scalar");
            const char ch = at(i);
            if (ch == '\'') {
                if (at(i + 1) == '\'') {
                    value += '\'';
                    i += 2;
                    continue;
                }
                ++i;
                break;
            }
            if (is_break(i)) {
                i = fold_break(i, value);
                continue;
            }
            value += ch;
            ++i;
        }

        Token token = take(TokenType::Scalar, i - start);
        token.style = ScalarStyle::SingleQuoted;
        token.value = std::move(value);
        return token;
    }

    unsigned long read_hex(size_t i, int digits) const {
        unsigned long cp = 0;
        for (int k = 0; k < digits; ++k) {
            const char h = at(i + static_cast<size_t>(k));
            cp <<= 4;
            if (h >= '0' && h <= '9') cp |= static_cast<unsigned long>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned long>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned long>(h - 'A' + 10);
            else fail(i + static_cast<size_t>(k), "invalid hexadecimal escape");
        }
        return cp;
    }

    Token scan_double_quoted() {
        const size_t start = pos_;
        size_t i = pos_ + 1;
        std::string value;
        while (true) {
            if (eof(i)) fail(start, "unterminated double-quoted scalar");
            const char ch = at(i);
            if (ch == '"') {
                ++i;
                break;
            }
            if (is_break(i)) {
                i = fold_break(i, value);
                continue;
            }
            if (ch != '\\') {
                value += ch;
                ++i;
                continue;
            }

            const char esc = at(i + 1);
            if (is_break(i + 1)) {
                // Escaped line break joins lines without a space
                i += 1 + break_length(i + 1);
                while (at(i) == ' ' || at(i) == '\t') ++i;
                continue;
            }
            i += 2;
            switch (esc) {
                case '0':  value += '\0'; break;
                case 'a':  value += '\a'; break;
                case 'b':  value += '\b'; break;
                case 't':
                case '\t': value += '\t'; break;
                case 'n':  value += '\n'; break;
                case 'v':  value += '\v'; break;
                case 'f':  value += '\f'; break;
                case 'r':  value += '\r'; break;
                case 'e':  value += '\x1b'; break;
                case ' ':  value += ' '; break;
                case '"':  value += '"'; break;
                case '/':  value += '/'; break;
                case '\\': value += '\\'; break;
                case 'N':  append_utf8(value, 0x85); break;
                case '_':  append_utf8(value, 0xA0); break;
                case 'L':  append_utf8(value, 0x2028); break;
                case 'P':  append_utf8(value, 0x2029); break;
                case 'x':  append_utf8(value, read_hex(i, 2)); i += 2; break;
                case 'u':  append_utf8(value, read_hex(i, 4)); i += 4; break;
                case 'U':  append_utf8(value, read_hex(i, 8)); i += 8; break;
                default:
                    fail(i - 2, std::string("invalid escape sequence '\\") + esc + "'");
            }
        }

        Token token = take(TokenType::Scalar, i - start);
        token.style = ScalarStyle::DoubleQuoted;
        token.value = std::move(value);
        return token;
    }

    Token scan_block_scalar() {
        const size_t start = pos_;
        const bool literal = at(pos_) == '|';
        size_t i = pos_ + 1;

        char chomp = 0;
        int explicit_indent = 0;
        for (int k = 0; k < 2; ++k) {
            const char ch = at(i);
            if ((ch == '+' || ch == '-') && chomp == 0) {
                chomp = ch;
                ++i;
            } else if (ch >= '1' && ch <= '9' && explicit_indent == 0) {
                explicit_indent = ch - '0';
                ++i;
            }
        }
        const size_t indicators_end = i;
        while (at(i) == ' ' || at(i) == '\t') ++i;
        if (at(i) == '#' && i > indicators_end) {
            while (!eof(i) && !is_break(i)) ++i;
        }
        if (!eof(i) && !is_break(i)) {
            fail(i, "invalid block scalar header");
        }

        int content_indent = explicit_indent > 0 ? line_indent_ + explicit_indent : -1;
        size_t content_end = i;
        size_t cursor = i;
        std::vector<std::string> lines;
        int pending_blank = 0;

        while (is_break(cursor)) {
            const size_t line_begin = cursor + break_length(cursor);
            size_t j = line_begin;
            while (at(j) == ' ') ++j;
            size_t k = j;
            while (at(k) == ' ' || at(k) == '\t') ++k;

            if (eof(k) || is_break(k)) {
                ++pending_blank;
                cursor = k;
                continue;
            }

            const int indent = static_cast<int>(j - line_begin);
            if (content_indent < 0) {
                if (indent <= line_indent_) break;
                content_indent = indent;
            }
            if (indent < content_indent) break;

            size_t line_end = k;
            while (!eof(line_end) && !is_break(line_end)) ++line_end;

            lines.insert(lines.end(), static_cast<size_t>(pending_blank), std::string());
            pending_blank = 0;
            lines.push_back(src_.substr(line_begin + static_cast<size_t>(content_indent),
                                        line_end - line_begin - static_cast<size_t>(content_indent)));
            content_end = line_end;
            cursor = line_end;
        }

        std::string value;
        if (literal) {
            for (size_t n = 0; n < lines.size(); ++n) {
                if (n > 0) value += '\n';
                value += lines[n];
            }
        } else {
            for (size_t n = 0; n < lines.size(); ++n) {
                const std::string& line = lines[n];
                if (n > 0) {
                    const std::string& prev = lines[n - 1];
                    const bool prev_normal = !prev.empty() && prev[0] != ' ' && prev[0] != '\t';
                    const bool cur_normal = !line.empty() && line[0] != ' ' && line[0] != '\t';
                    if (prev_normal && cur_normal) {
                        value += ' ';
                    } else if (!(prev_normal && line.empty())) {
                        value += '\n';
                    }
                }
                value += line;
            }
        }

        const bool ends_with_break = is_break(content_end);
        if (!lines.empty() && ends_with_break && chomp != '-') {
            value += '\n';
        }
        if (chomp == '+') {
            value.append(static_cast<size_t>(pending_blank), '\n');
        }

        Token token = take(TokenType::Scalar, content_end - start);
        token.style = literal ? ScalarStyle::Literal : ScalarStyle::Folded;
        token.value = std::move(value);
        return token;
    }
};

// ============================================================================
// Parser
// ============================================================================

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    std::unique_ptr<File> parse() {
        auto file = std::make_unique<File>();

        while (peek().type != TokenType::StreamEnd) {
            DocumentNode doc;
            if (peek().type == TokenType::DocumentStart) {
                doc.start = take();
            }

            if (is_document_boundary(peek())) {
                doc.body = std::make_unique<NullNode>();
            } else {
                doc.body = parse_block_node(-1);
            }

            if (peek().type == TokenType::DocumentEnd) {
                doc.end = take();
            } else if (peek().type != TokenType::StreamEnd &&
                       peek().type != TokenType::DocumentStart) {
                fail(peek(), "unexpected " + describe(peek()));
            }
            file->documents.push_back(std::move(doc));
        }

        file->trailing = peek().leading;
        return file;
    }

private:
    std::vector<Token> tokens_;
    size_t index_ = 0;
    int depth_ = 0;

    // Counts open collections for the lifetime of one parse_* call
    class NestingGuard {
    public:
        NestingGuard(Parser& parser, const Token& at) : parser_(parser) {
            if (parser_.depth_ >= MAX_NESTING_DEPTH) {
                parser_.fail(at, "nesting too deep");
            }
            ++parser_.depth_;
        }
        ~NestingGuard() { --parser_.depth_; }

        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;

    private:
        Parser& parser_;
    };

    const Token& peek(size_t ahead = 0) const {
        const size_t i = index_ + ahead;
        return i < tokens_.size() ? tokens_[i] : tokens_.back();
    }

    Token take() {
        Token token = std::move(tokens_[index_]);
        if (index_ + 1 < tokens_.size()) ++index_;
        return token;
    }

    [[noreturn]] void fail(const Token& at, const std::string& message) const {
        throw ParseError(at.position.line, at.position.column + 1, message);
    }

    static bool is_document_boundary(const Token& token) {
        return token.type == TokenType::StreamEnd ||
               token.type == TokenType::DocumentStart ||
               token.type == TokenType::DocumentEnd;
    }

    std::unique_ptr<ScalarNode> parse_scalar() {
        return std::make_unique<ScalarNode>(take());
    }

    void reject_collection_key() const {
        if (peek().type == TokenType::MappingValue) {
            fail(peek(), "collections cannot be used as mapping keys");
        }
    }

    std::unique_ptr<Node> parse_block_node(int parent_indent) {
        const Token& t = peek();
        switch (t.type) {
            case TokenType::Scalar:
                if (peek(1).type == TokenType::MappingValue && !peek(1).first_on_line) {
                    if (t.position.column <= parent_indent) {
                        fail(t, "bad indentation of a mapping entry");
                    }
                    return parse_block_mapping(t.position.column);
                }
                return parse_scalar();
            case TokenType::SequenceEntry:
                return parse_block_sequence(t.position.column);
            case TokenType::MappingStart: {
                auto node = parse_flow_mapping();
                reject_collection_key();
                return node;
            }
            case TokenType::SequenceStart: {
                auto node = parse_flow_sequence();
                reject_collection_key();
                return node;
            }
            default:
                fail(t, "unexpected " + describe(t));
        }
    }

    // Reports content that is indented deeper than the block it follows
    void check_block_end(int indent, const char* what) const {
        const Token& t = peek();
        if (is_document_boundary(t) || !t.first_on_line) return;
        if (t.position.column > indent) {
            fail(t, std::string("bad indentation of ") + what);
        }
    }

    std::unique_ptr<MappingNode> parse_block_mapping(int indent) {
        NestingGuard guard(*this, peek());
        auto mapping = std::make_unique<MappingNode>();

        while (peek().type == TokenType::Scalar) {
            const Token& key = peek();
            if (!mapping->entries.empty() &&
                (!key.first_on_line || key.position.column != indent)) {
                break;
            }
            if (peek(1).type != TokenType::MappingValue) {
                fail(key, "could not find expected ':'");
            }
            if (key.style == ScalarStyle::Literal || key.style == ScalarStyle::Folded) {
                fail(key, "block scalars cannot be used as mapping keys");
            }
            if (key.text.find('\n') != std::string::npos) {
                fail(key, "mapping keys must fit on a single line");
            }

            MappingEntry entry;
            entry.key = parse_scalar();
            entry.colon = take();
            entry.value = parse_mapping_value(indent);
            mapping->entries.push_back(std::move(entry));
        }

        const Token& t = peek();
        if (t.first_on_line && t.position.column == indent &&
            t.type == TokenType::SequenceEntry) {
            fail(t, "block sequence entries are not allowed in a mapping");
        }
        check_block_end(indent, "a mapping entry");
        return mapping;
    }

    std::unique_ptr<Node> parse_mapping_value(int indent) {
        const Token& t = peek();
        if (is_document_boundary(t)) {
            return std::make_unique<NullNode>();
        }

        if (!t.first_on_line) {
            switch (t.type) {
                case TokenType::Scalar:
                    if (peek(1).type == TokenType::MappingValue && !peek(1).first_on_line) {
                        fail(peek(1), "mapping values are not allowed in this context");
                    }
                    return parse_scalar();
                case TokenType::MappingStart:
                case TokenType::SequenceStart:
                    return parse_block_node(indent);
                case TokenType::SequenceEntry:
                    fail(t, "block sequence entries are not allowed in this context");
                default:
                    return std::make_unique<NullNode>();
            }
        }

        if (t.type == TokenType::SequenceEntry && t.position.column == indent) {
            return parse_block_sequence(indent);
        }
        if (t.position.column > indent) {
            return parse_block_node(indent);
        }
        return std::make_unique<NullNode>();
    }

    std::unique_ptr<SequenceNode> parse_block_sequence(int indent) {
        NestingGuard guard(*this, peek());
        auto seq = std::make_unique<SequenceNode>();

        while (peek().type == TokenType::SequenceEntry && peek().position.column == indent &&
               (seq->items.empty() || peek().first_on_line)) {
            SequenceItem item;
            item.dash = take();

            const Token& t = peek();
            if (is_document_boundary(t)) {
                item.value = std::make_unique<NullNode>();
            } else if (!t.first_on_line || t.position.column > indent) {
                item.value = parse_block_node(indent);
            } else {
                item.value = std::make_unique<NullNode>();
            }
            seq->items.push_back(std::move(item));
        }

        check_block_end(indent, "a sequence entry");
        return seq;
    }

    std::unique_ptr<Node> parse_flow_node() {
        switch (peek().type) {
            case TokenType::Scalar:
                return parse_scalar();
            case TokenType::MappingStart:
                return parse_flow_mapping();
            case TokenType::SequenceStart:
                return parse_flow_sequence();
            default:
                fail(peek(), "unexpected " + describe(peek()));
        }
    }

    std::unique_ptr<MappingNode> parse_flow_mapping() {
        NestingGuard guard(*this, peek());
        auto mapping = std::make_unique<MappingNode>();
        mapping->flow = true;
        mapping->open = take();

        while (true) {
            const Token& t = peek();
            if (t.type == TokenType::MappingEnd) {
                mapping->close = take();
                break;
            }
            if (t.type == TokenType::StreamEnd) {
                fail(t, "unterminated flow mapping");
            }
            if (t.type != TokenType::Scalar) {
                fail(t, "expected a mapping key, found " + describe(t));
            }

            if (t.text.find('\n') != std::string::npos) {
                fail(t, "mapping keys must fit on a single line");
            }

            MappingEntry entry;
            entry.key = parse_scalar();
            if (peek().type != TokenType::MappingValue) {
                fail(peek(), "could not find expected ':'");
            }
            entry.colon = take();

            const TokenType next = peek().type;
            if (next == TokenType::FlowEntry || next == TokenType::MappingEnd) {
                entry.value = std::make_unique<NullNode>();
            } else {
                entry.value = parse_flow_node();
            }

            if (peek().type == TokenType::FlowEntry) {
                entry.comma = take();
            } else if (peek().type != TokenType::MappingEnd) {
                fail(peek(), "expected ',' or '}', found " + describe(peek()));
            }
            mapping->entries.push_back(std::move(entry));
        }
        return mapping;
    }

    std::unique_ptr<SequenceNode> parse_flow_sequence() {
        NestingGuard guard(*this, peek());
        auto seq = std::make_unique<SequenceNode>();
        seq->flow = true;
        seq->open = take();

        while (true) {
            const Token& t = peek();
            if (t.type == TokenType::SequenceEnd) {
                seq->close = take();
                break;
            }
            if (t.type == TokenType::StreamEnd) {
                fail(t, "unterminated flow sequence");
            }

            SequenceItem item;
            item.value = parse_flow_node();
            if (peek().type == TokenType::MappingValue) {
                fail(peek(), "mappings inside flow sequences are not supported");
            }

            if (peek().type == TokenType::FlowEntry) {
                item.comma = take();
            } else if (peek().type != TokenType::SequenceEnd) {
                fail(peek(), "expected ',' or ']', found " + describe(peek()));
            }
            seq->items.push_back(std::move(item));
        }
        return seq;
    }
};

} // anonymous namespace

std::vector<Token> scan_tokens(const std::string& source) {
    return Scanner(source).run();
}

std::unique_ptr<File> parse_file(const std::string& source) {
    auto file = Parser(scan_tokens(source)).parse();
    const size_t nl = source.find('\n');
    if (nl != std::string::npos && nl > 0 && source[nl - 1] == '\r') {
        file->line_break = "\r\n";
    }
    return file;
}

} // namespace stackyaml
