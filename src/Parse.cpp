/**
 * @file Parse.cpp
 * @brief Implementation of scalar resolution
 */

#include "stackyaml/Parse.hpp"
#include <limits>
#include <regex>
#include <stdexcept>

namespace stackyaml {

namespace {
    bool is_one_of(const std::string& str, std::initializer_list<const char*> words) {
        for (const char* w : words) {
            if (str == w) return true;
        }
        return false;
    }
}

Json resolve_plain_scalar(const std::string& text) {
    // R1: Null
    if (text.empty() || is_one_of(text, {"null", "Null", "NULL", "~"})) {
        return nullptr;
    }

    // R2: Boolean
    if (is_one_of(text, {"true", "True", "TRUE"})) {
        return true;
    }
    if (is_one_of(text, {"false", "False", "FALSE"})) {
        return false;
    }

    static const std::regex int_pattern("^[-+]?[0-9]+$");
    static const std::regex float_pattern(
        "^[-+]?(\\.[0-9]+|[0-9]+(\\.[0-9]*)?)([eE][-+]?[0-9]+)?$");

    // R3: Integer
    if (std::regex_match(text, int_pattern)) {
        try {
            size_t pos = 0;
            long long val = std::stoll(text, &pos);
            if (pos == text.size()) {
                return static_cast<int64_t>(val);
            }
        } catch (const std::out_of_range&) {
            // Too large for int64, fall through to float
        }
    }

    // R4: Float
    if (is_one_of(text, {".inf", ".Inf", ".INF", "+.inf", "+.Inf", "+.INF"})) {
        return std::numeric_limits<double>::infinity();
    }
    if (is_one_of(text, {"-.inf", "-.Inf", "-.INF"})) {
        return -std::numeric_limits<double>::infinity();
    }
    if (is_one_of(text, {".nan", ".NaN", ".NAN"})) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (std::regex_match(text, float_pattern)) {
        try {
            size_t pos = 0;
            double val = std::stod(text, &pos);
            if (pos == text.size()) {
                return val;
            }
        } catch (const std::out_of_range&) {
            // Not representable, keep as string
        }
    }

    // R5: String
    return text;
}

Json resolve_scalar(const ScalarNode& node) {
    if (node.token.style == ScalarStyle::Plain) {
        return resolve_plain_scalar(node.value());
    }
    return node.value();
}

Json node_to_json(const Node& node) {
    switch (node.kind()) {
        case NodeKind::Null:
            return nullptr;

        case NodeKind::Scalar:
            return resolve_scalar(static_cast<const ScalarNode&>(node));

        case NodeKind::Mapping: {
            const auto& mapping = static_cast<const MappingNode&>(node);
            Json obj = Json::object();
            for (const auto& entry : mapping.entries) {
                const std::string& key = entry.key->value();
                if (obj.contains(key)) continue;
                obj[key] = node_to_json(*entry.value);
            }
            return obj;
        }

        case NodeKind::Sequence: {
            const auto& seq = static_cast<const SequenceNode&>(node);
            Json arr = Json::array();
            for (const auto& item : seq.items) {
                arr.push_back(node_to_json(*item.value));
            }
            return arr;
        }
    }
    return nullptr;
}

} // namespace stackyaml
