#include "snapshot_store.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

namespace pulse_rag {

using json = nlohmann::json;

namespace {

constexpr const char* kGenerationPrefix = "gen-";

// "gen-12" -> 12. Anything else is not ours.
std::optional<uint64_t> parse_generation(const std::string& name) {
    const std::string prefix = kGenerationPrefix;
    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    std::string digits = name.substr(prefix.size());
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    try {
        return std::stoull(digits);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<json> read_manifest(const fs::path& path) {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    try {
        json manifest = json::parse(in);
        if (!manifest.is_object() || !manifest.contains("generation")) return std::nullopt;
        return manifest;
    } catch (const json::exception& e) {
        spdlog::warn("⚠️ Unreadable snapshot manifest {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

} // namespace

SnapshotStore::SnapshotStore(fs::path dir, std::string model_name)
    : dir_(std::move(dir)), model_name_(std::move(model_name)) {}

fs::path SnapshotStore::generation_dir(uint64_t generation) const {
    return dir_ / (kGenerationPrefix + std::to_string(generation));
}

std::optional<uint64_t> SnapshotStore::current_generation() const {
    auto manifest = read_manifest(manifest_path());
    if (!manifest) return std::nullopt;
    try {
        return (*manifest)["generation"].get<uint64_t>();
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

bool SnapshotStore::exists() const {
    return current_generation().has_value();
}

void SnapshotStore::save(const VectorIndex& index, const DocumentStore& documents) const {
    uint64_t next = 0;
    fs::path gen_dir;
    try {
        fs::create_directories(dir_);

        // Past every generation on disk, including ones a crashed save left behind.
        next = current_generation().value_or(0);
        for (const auto& path : generation_dirs()) {
            next = std::max(next, parse_generation(path.filename().string()).value_or(0));
        }
        ++next;

        gen_dir = generation_dir(next);
        fs::create_directory(gen_dir);
        index.save((gen_dir / kIndexFile).string());
        documents.save((gen_dir / kDocumentsFile).string());

        json manifest = {
            {"generation", next},
            {"model", model_name_},
            {"dimension", index.dimension()},
            {"documents", documents.count()}
        };
        const fs::path manifest_tmp = fs::path(manifest_path().string() + ".tmp");
        {
            std::ofstream out(manifest_tmp, std::ios::trunc);
            out << manifest.dump(2);
            out.flush();
            if (!out) throw std::runtime_error("Failed writing " + manifest_tmp.string());
        }
        fs::rename(manifest_tmp, manifest_path());
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(fs::path(manifest_path().string() + ".tmp"), ec);
        if (!gen_dir.empty()) fs::remove_all(gen_dir, ec);
        throw PersistenceError("Failed to save snapshot to " + dir_.string() + ": " + e.what());
    }

    prune_except(next);
    spdlog::info("💾 Saved snapshot with {} documents to {}", documents.count(), gen_dir.string());
}

bool SnapshotStore::load(VectorIndex& index, DocumentStore& documents) const {
    index.clear();
    documents.clear();

    auto manifest = read_manifest(manifest_path());
    if (!manifest) {
        spdlog::info("No snapshot at {}. Starting with an empty index.", dir_.string());
        return false;
    }

    uint64_t generation = 0;
    std::string model;
    long expected_count = 0;
    try {
        generation = (*manifest)["generation"].get<uint64_t>();
        model = manifest->value("model", "");
        expected_count = manifest->value("documents", 0L);
    } catch (const json::exception& e) {
        spdlog::warn("⚠️ Snapshot manifest in {} is malformed ({}). Starting with an empty index.", dir_.string(), e.what());
        return false;
    }

    if (model != model_name_) {
        spdlog::warn("⚠️ Snapshot in {} was built by model '{}', not '{}'. Starting with an empty index.",
                     dir_.string(), model, model_name_);
        return false;
    }

    const fs::path gen_dir = generation_dir(generation);
    VectorIndex loaded_index(index.dimension());
    DocumentStore loaded_docs;
    try {
        loaded_index.load((gen_dir / kIndexFile).string());
        loaded_docs.load((gen_dir / kDocumentsFile).string());
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Snapshot at {} is unreadable ({}). Starting with an empty index.", gen_dir.string(), e.what());
        return false;
    }

    if (loaded_index.size() != loaded_docs.count() || loaded_docs.count() != expected_count) {
        spdlog::warn("⚠️ Snapshot at {} is inconsistent: {} vectors, {} documents, manifest says {}. Starting with an empty index.",
                     gen_dir.string(), loaded_index.size(), loaded_docs.count(), expected_count);
        return false;
    }

    index = std::move(loaded_index);
    documents = std::move(loaded_docs);
    spdlog::info("✅ Loaded snapshot generation {} with {} documents from {}", generation, documents.count(), dir_.string());
    return true;
}

void SnapshotStore::remove() const {
    std::error_code ec;
    fs::remove(manifest_path(), ec);
    if (ec) throw PersistenceError("Failed to remove " + manifest_path().string() + ": " + ec.message());

    for (const auto& path : generation_dirs()) {
        fs::remove_all(path, ec);
        if (ec) throw PersistenceError("Failed to remove " + path.string() + ": " + ec.message());
    }
}

std::vector<fs::path> SnapshotStore::generation_dirs() const {
    std::vector<fs::path> found;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return found;
    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (parse_generation(entry.path().filename().string())) found.push_back(entry.path());
    }
    return found;
}

void SnapshotStore::prune_except(uint64_t generation) const {
    for (const auto& path : generation_dirs()) {
        if (parse_generation(path.filename().string()) == generation) continue;
        std::error_code ec;
        fs::remove_all(path, ec);
        if (ec) spdlog::warn("⚠️ Could not prune old snapshot {}: {}", path.string(), ec.message());
    }
}

} // namespace pulse_rag
