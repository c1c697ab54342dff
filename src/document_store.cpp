#include "document_store.hpp"
#include <fstream>
#include <stdexcept>

namespace pulse_rag {

using json = nlohmann::json;

long DocumentStore::append(Document doc) {
    doc.position = count();
    documents_.push_back(std::move(doc));
    return documents_.back().position;
}

const Document& DocumentStore::get(long position) const {
    if (position < 0 || position >= count()) {
        throw std::out_of_range("No document at position " + std::to_string(position));
    }
    return documents_[position];
}

json DocumentStore::to_json() const {
    json list = json::array();
    for (const auto& doc : documents_) {
        list.push_back(doc.to_json());
    }
    return list;
}

void DocumentStore::save(const std::string& path) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out) throw std::runtime_error("Cannot open " + path + " for writing");
    out << to_json().dump(2);
    out.flush();
    if (!out) throw std::runtime_error("Failed writing " + path);
}

void DocumentStore::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot open " + path);

    json list = json::parse(in);
    if (!list.is_array()) throw std::runtime_error(path + " does not hold a document array");

    std::vector<Document> loaded;
    loaded.reserve(list.size());
    for (const auto& item : list) {
        Document doc = Document::from_json(item);
        if (doc.position != static_cast<long>(loaded.size())) {
            throw std::runtime_error("Document at index " + std::to_string(loaded.size()) +
                                     " claims position " + std::to_string(doc.position));
        }
        loaded.push_back(std::move(doc));
    }
    documents_ = std::move(loaded);
}

} // namespace pulse_rag
