#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "document_store.hpp"
#include "vector_index.hpp"

namespace pulse_rag {

/**
 * The on-disk pairing of a VectorIndex and its DocumentStore.
 *
 * Layout under `dir`:
 *   snapshot.json           manifest: generation, model, dimension, count
 *   gen-<N>/faiss_index.bin FAISS write_index output
 *   gen-<N>/documents.json  document array, position == array index
 *
 * A save writes a complete new generation directory and then publishes it
 * by renaming a fresh manifest over the old one. Until that rename the
 * previous generation stays the live snapshot. Older generations are
 * pruned after a successful publish.
 *
 * A snapshot is only loaded by a store created for the same model.
 */
class SnapshotStore {
public:
    SnapshotStore(std::filesystem::path dir, std::string model_name);

    // Throws PersistenceError. The previous snapshot is untouched on failure.
    void save(const VectorIndex& index, const DocumentStore& documents) const;

    // Returns false (with both collections empty) when there is no usable
    // snapshot. Never throws for a missing, corrupt or foreign snapshot.
    bool load(VectorIndex& index, DocumentStore& documents) const;

    // Unpublishes the manifest, then deletes every generation. Throws PersistenceError.
    void remove() const;

    bool exists() const;
    const std::filesystem::path& dir() const { return dir_; }
    const std::string& model_name() const { return model_name_; }
    std::filesystem::path manifest_path() const { return dir_ / "snapshot.json"; }

    // Generation named by the current manifest, nullopt if there is none.
    std::optional<uint64_t> current_generation() const;
    std::filesystem::path generation_dir(uint64_t generation) const;

    static constexpr const char* kIndexFile = "faiss_index.bin";
    static constexpr const char* kDocumentsFile = "documents.json";

private:
    std::vector<std::filesystem::path> generation_dirs() const;
    void prune_except(uint64_t generation) const;

    std::filesystem::path dir_;
    std::string model_name_;
};

} // namespace pulse_rag
