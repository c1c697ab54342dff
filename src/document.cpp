#include "document.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>

namespace pulse_rag {

using json = nlohmann::json;

namespace {

std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw ValidationError(std::string("Field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

} // namespace

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

RawDocument RawDocument::from_json(const json& j) {
    if (!j.is_object()) throw ValidationError("Each document must be a JSON object");

    RawDocument doc;
    doc.content = optional_string(j, "content").value_or("");
    doc.module = optional_string(j, "module");
    doc.sub_module = optional_string(j, "sub_module");
    doc.issue_type = optional_string(j, "issue_type");
    doc.sub_issue_type = optional_string(j, "sub_issue_type");
    doc.source = optional_string(j, "source");
    return doc;
}

std::optional<std::string> Document::field(const std::string& name) const {
    if (name == "content") return content;
    if (name == "module") return module;
    if (name == "sub_module") return sub_module;
    if (name == "issue_type") return issue_type;
    if (name == "sub_issue_type") return sub_issue_type;
    if (name == "source") return source;
    return std::nullopt;
}

json Document::to_json() const {
    return json{
        {"content", content},
        {"module", module},
        {"sub_module", sub_module},
        {"issue_type", issue_type},
        {"sub_issue_type", sub_issue_type},
        {"source", source},
        {"position", position}
    };
}

Document Document::from_json(const json& j) {
    Document doc;
    doc.content = j.at("content").get<std::string>();
    doc.module = j.value("module", "");
    doc.sub_module = j.value("sub_module", "");
    doc.issue_type = j.value("issue_type", "");
    doc.sub_issue_type = j.value("sub_issue_type", "");
    doc.source = j.value("source", "Unknown");
    doc.position = j.at("position").get<long>();
    return doc;
}

bool matches_filter(const Document& doc, const MetadataFilter& filter) {
    for (const auto& [key, expected] : filter) {
        auto actual = doc.field(key);
        if (!actual || *actual != expected) return false;
    }
    return true;
}

} // namespace pulse_rag
