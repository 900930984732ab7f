/**
 * @file Printer.cpp
 * @brief Implementation of tree serialization
 */

#include "stackyaml/Printer.hpp"

#include <algorithm>
#include <utility>

namespace stackyaml {

std::string Printer::print(const File& file) {
    reset(file.line_break);
    for (const auto& doc : file.documents) {
        write_document(doc);
    }
    out_ += file.trailing;
    return std::move(out_);
}

std::string Printer::print(const DocumentNode& document) {
    reset("\n");
    write_document(document);
    return std::move(out_);
}

std::string Printer::print(const Node& node) {
    reset("\n");
    write_node(node, Context::Block);
    return std::move(out_);
}

void Printer::reset(const std::string& line_break) {
    out_.clear();
    line_break_ = line_break;
    comment_open_ = false;
    trailing_at_ = 0;
    token_end_ = 0;
}

void Printer::write_token(const Token& token) {
    if (!token.synthetic) {
        out_ += token.leading;
    }
    out_ += token.text;
    trailing_at_ = out_.size();
    out_ += token.trailing;
    token_end_ = out_.size();
    comment_open_ = token.trailing.find('#') != std::string::npos;
}

void Printer::begin_line(int column) {
    if (!out_.empty() && out_.back() != '\n') {
        out_ += line_break_;
    }
    out_.append(static_cast<size_t>(std::max(column, 0)), ' ');
    comment_open_ = false;
}

// Synthetic text in flow context must not land inside an inline comment
void Printer::close_comment() {
    if (comment_open_) {
        out_ += line_break_;
        comment_open_ = false;
    }
}

void Printer::write_document(const DocumentNode& document) {
    if (document.start) write_token(*document.start);
    if (document.body) write_node(*document.body, Context::Block);
    if (document.end) write_token(*document.end);
}

void Printer::write_node(const Node& node, Context context) {
    switch (node.kind()) {
        case NodeKind::Null:
            break;
        case NodeKind::Scalar:
            write_scalar(static_cast<const ScalarNode&>(node), context);
            break;
        case NodeKind::Mapping:
            write_mapping(static_cast<const MappingNode&>(node), context);
            break;
        case NodeKind::Sequence:
            write_sequence(static_cast<const SequenceNode&>(node), context);
            break;
    }
}

void Printer::write_value(const Node& node, Context context) {
    if (const ScalarNode* scalar = as_scalar(&node)) {
        if (scalar->token.synthetic) {
            if (context == Context::Flow) close_comment();
            out_ += ' ';
        }
        write_scalar(*scalar, context);
        return;
    }
    if (const MappingNode* mapping = as_mapping(&node)) {
        if (context == Context::Flow && !mapping->open) {
            close_comment();
            out_ += ' ';
        }
    }
    write_node(node, context);
}

void Printer::write_scalar(const ScalarNode& node, Context) {
    write_token(node.token);
}

void Printer::write_mapping(const MappingNode& mapping, Context context) {
    const bool all_synthetic = !mapping.entries.empty() &&
        std::all_of(mapping.entries.begin(), mapping.entries.end(),
                    [](const MappingEntry& e) { return e.key->token.synthetic; });

    if (context == Context::Block && (!mapping.flow || all_synthetic)) {
        if (!mapping.flow && mapping.entries.empty()) {
            write_empty_block(mapping);
            return;
        }
        if (mapping.flow) {
            // `{}` rewritten in block style: keep what preceded the brace and
            // an inline comment after it, drop the braces
            if (mapping.open) {
                std::string lead = mapping.open->leading;
                while (!lead.empty() && (lead.back() == ' ' || lead.back() == '\t')) {
                    lead.pop_back();
                }
                out_ += lead;
            }
            if (mapping.close && mapping.close->trailing.find('#') != std::string::npos) {
                out_ += mapping.close->trailing;
            }
        }
        write_block_entries(mapping);
        return;
    }

    if (mapping.open) write_token(*mapping.open);
    else out_ += '{';

    write_flow_entries(mapping);

    if (mapping.close) write_token(*mapping.close);
    else out_ += '}';
}

void Printer::write_block_entries(const MappingNode& mapping) {
    bool trivia_written = mapping.removed_trivia.empty();
    for (const auto& entry : mapping.entries) {
        const Token& key = entry.key->token;
        if (key.synthetic) {
            if (!trivia_written) {
                out_ += mapping.removed_trivia;
                trivia_written = true;
            }
            begin_line(key.position.column);
        }
        write_token(key);
        write_token(entry.colon);
        write_value(*entry.value, Context::Block);
    }
    if (!trivia_written) {
        out_ += mapping.removed_trivia;
        comment_open_ = out_.back() != '\n';
    }
}

// `{}` goes right after the parent key, ahead of any inline comment there
void Printer::write_empty_block(const MappingNode& mapping) {
    std::string kept = mapping.removed_trivia;
    if (out_.empty() || out_.back() == '\n') {
        if (out_.empty()) {
            kept.erase(0, kept.find_first_not_of("\r\n"));
        }
        out_ += kept;
        if (!kept.empty() && out_.back() != '\n') out_ += line_break_;
        out_ += "{}";
        comment_open_ = false;
        return;
    }

    const size_t at = out_.size() == token_end_ ? trailing_at_ : out_.size();
    out_.insert(at, " {}");
    if (!kept.empty()) {
        out_ += kept;
        comment_open_ = out_.back() != '\n';
    }
}

void Printer::write_flow_entries(const MappingNode& mapping) {
    for (size_t i = 0; i < mapping.entries.size(); ++i) {
        const MappingEntry& entry = mapping.entries[i];
        const Token& key = entry.key->token;
        if (key.synthetic) close_comment();
        if (key.synthetic && !out_.empty()) {
            const char last = out_.back();
            if (last != '{' && last != ' ' && last != '\n') out_ += ' ';
        }
        write_token(key);
        write_token(entry.colon);
        write_value(*entry.value, Context::Flow);

        if (entry.comma) {
            write_token(*entry.comma);
        } else if (i + 1 < mapping.entries.size()) {
            close_comment();
            out_ += ',';
        }
    }
}

void Printer::write_sequence(const SequenceNode& seq, Context) {
    if (seq.flow) {
        if (seq.open) write_token(*seq.open);
        for (const auto& item : seq.items) {
            write_node(*item.value, Context::Flow);
            if (item.comma) write_token(*item.comma);
        }
        if (seq.close) write_token(*seq.close);
        return;
    }

    for (const auto& item : seq.items) {
        if (item.dash) write_token(*item.dash);
        write_value(*item.value, Context::Block);
    }
}

} // namespace stackyaml
