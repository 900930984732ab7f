/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path resolution
 */

#include "stackyaml/DotPath.hpp"
#include "stackyaml/Mutator.hpp"
#include <sstream>

namespace stackyaml {

std::vector<std::string> split_dot_path(const std::string& path) {
    if (path.empty()) {
        return {};
    }

    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            segments.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    segments.push_back(current);

    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    if (segments.empty()) {
        return "";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

bool is_index_segment(const std::string& segment) {
    return segment.find('[') != std::string::npos ||
           segment.find(']') != std::string::npos;
}

namespace {

// Shared walk for the const and mutable overloads of resolve_mapping
template <typename MappingT>
MappingT& walk_mappings(MappingT& root, const std::string& path) {
    const auto segments = split_dot_path(path);

    // Reject the whole path before walking any of it
    for (const auto& seg : segments) {
        if (seg.empty()) {
            throw UnsupportedPathError(path, seg, "empty path segment");
        }
        if (is_index_segment(seg)) {
            throw UnsupportedPathError(path, seg, "list indexing is not supported");
        }
    }

    MappingT* current = &root;
    for (const auto& seg : segments) {
        auto* entry = find_entry(*current, seg);
        if (entry == nullptr) {
            throw KeyNotFoundError(path, seg);
        }

        MappingT* next = as_mapping(entry->value.get());
        if (next == nullptr) {
            throw TypeMismatchError(path, seg, "mapping", kind_name(entry->value->kind()));
        }
        current = next;
    }

    return *current;
}

} // anonymous namespace

const MappingNode& resolve_mapping(const MappingNode& root, const std::string& path) {
    return walk_mappings(root, path);
}

MappingNode& resolve_mapping(MappingNode& root, const std::string& path) {
    return walk_mappings(root, path);
}

} // namespace stackyaml
