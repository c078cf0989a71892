#pragma once
#include "chunker.hpp"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <atomic>
#include <optional>
#include <cstdint>

struct StoredChunk {
    std::string id;
    std::string document_id;
    int page{0};
    size_t start{0};
    size_t end{0};
    std::string text;
};

struct ScoredChunk {
    StoredChunk chunk;
    float score{0.0f};
};

struct ManifestEntry {
    std::string document_id;
    std::string content_hash;
    std::int64_t mtime{0};
    std::vector<std::string> chunk_ids;
};

using Manifest = std::map<std::string, ManifestEntry>;

struct EmbeddedChunk {
    Chunk chunk;
    std::vector<float> vector;
};

// Durable chunk vectors plus the manifest, in one SQLite file.
// Writes are serialized on a single connection; reads use pooled read-only
// connections and see the last committed state.
class VectorIndex {
public:
    explicit VectorIndex(const std::string& db_path);
    ~VectorIndex();
    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    void upsert(const Chunk& chunk, const std::vector<float>& vector);
    void delete_by_document(const std::string& document_id);
    void manifest_set(const ManifestEntry& entry);
    void manifest_erase(const std::string& document_id);

    // Replaces every chunk of entry.document_id and its manifest entry in one transaction.
    void commit_document(const ManifestEntry& entry, const std::vector<EmbeddedChunk>& chunks);
    // Deletes the document's chunks and manifest entry in one transaction.
    void remove_document(const std::string& document_id);
    void clear();
    // Drops chunks without a manifest entry and manifest entries whose chunks are missing.
    size_t prune_orphans();
    void meta_set(const std::string& key, const std::string& value);

    // Top k by cosine similarity, ties by chunk id ascending.
    std::vector<ScoredChunk> search(const std::vector<float>& query, int k) const;
    Manifest manifest_get() const;
    std::optional<ManifestEntry> manifest_entry(const std::string& document_id) const;
    std::vector<std::string> chunk_ids_for(const std::string& document_id) const;
    std::optional<StoredChunk> get_chunk(const std::string& id) const;
    size_t chunk_count() const;
    size_t document_count() const;
    std::optional<std::string> meta_get(const std::string& key) const;
    // Throws IndexCorruption when SQLite's quick_check reports a problem.
    void check_integrity() const;
    int dimension() const { return dim_.load(); }
    // Rows changed through the writer connection since open.
    int write_count() const;

    // Exclusive flock on "<db_path>.lock", held across processes for one reindex or clear.
    // Returns false when another holder has it.
    bool try_lock_pass();
    void unlock_pass();

    const std::string& path() const { return db_path_; }

private:
    class Transaction;
    class ReaderLease;

    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();
    int load_dimension();

    void upsert_locked(const Chunk& chunk, const std::vector<float>& vector);
    void delete_by_document_locked(const std::string& document_id);
    void manifest_set_locked(const ManifestEntry& entry);
    void manifest_erase_locked(const std::string& document_id);
    void meta_set_locked(const std::string& key, const std::string& value);

    struct sqlite3* open_reader() const;
    void release_reader(struct sqlite3* db) const;

    std::string db_path_;
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_stmt_ {nullptr};
    struct sqlite3_stmt* delete_by_doc_stmt_ {nullptr};
    struct sqlite3_stmt* manifest_upsert_stmt_ {nullptr};
    struct sqlite3_stmt* manifest_delete_stmt_ {nullptr};
    struct sqlite3_stmt* meta_upsert_stmt_ {nullptr};
    mutable std::mutex write_mtx_;
    std::atomic<int> dim_{0};

    static constexpr size_t kMaxIdleReaders = 4;
    std::mutex pass_mtx_;
    int pass_fd_{-1};

    mutable std::mutex reader_mtx_;
    mutable std::vector<struct sqlite3*> idle_readers_;
};
