#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "document.hpp"

namespace pulse_rag {

// Positional record list kept in lockstep with VectorIndex. Not
// internally synchronized.
class DocumentStore {
public:
    // Stamps doc.position with the next slot and stores it.
    long append(Document doc);

    // Throws std::out_of_range.
    const Document& get(long position) const;

    long count() const { return static_cast<long>(documents_.size()); }
    void clear() { documents_.clear(); }

    nlohmann::json to_json() const;

    void save(const std::string& path) const;
    // All-or-nothing: on any parse error or misnumbered position the store
    // is left untouched and the error is rethrown.
    void load(const std::string& path);

private:
    std::vector<Document> documents_;
};

} // namespace pulse_rag
