#pragma once

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace pulse_rag {

// An issue report as submitted by a caller. Only `content` is required.
struct RawDocument {
    std::string content;
    std::optional<std::string> module;
    std::optional<std::string> sub_module;
    std::optional<std::string> issue_type;
    std::optional<std::string> sub_issue_type;
    std::optional<std::string> source;

    // Throws ValidationError when a known key holds a non-string value.
    static RawDocument from_json(const nlohmann::json& j);
};

// A stored issue report. Never modified after it is appended.
struct Document {
    std::string content;
    std::string module;
    std::string sub_module;
    std::string issue_type;
    std::string sub_issue_type;
    std::string source = "Unknown";
    long position = -1;

    // Field lookup by JSON key name, used by metadata filters.
    std::optional<std::string> field(const std::string& name) const;

    nlohmann::json to_json() const;
    static Document from_json(const nlohmann::json& j);
};

using MetadataFilter = std::map<std::string, std::string>;

// Exact-match conjunction. A key the document doesn't have never matches.
bool matches_filter(const Document& doc, const MetadataFilter& filter);

bool is_blank(const std::string& text);

} // namespace pulse_rag
