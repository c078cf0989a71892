#include "../include/store.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <cstring>
#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

using json = nlohmann::json;

[[noreturn]] static void throw_sqlite(sqlite3* db, int rc, const std::string& what) {
    std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    int primary = rc & 0xFF;
    if (primary == SQLITE_CORRUPT || primary == SQLITE_NOTADB) throw IndexCorruption(msg);
    throw DocQaError("SQLite error in " + msg);
}

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static void bind_blob(sqlite3_stmt* st, int idx, const std::vector<float>& v) {
    sqlite3_bind_blob(st, idx, v.data(), (int)(v.size() * sizeof(float)), SQLITE_TRANSIENT);
}

static std::string col_text(sqlite3_stmt* st, int idx) {
    const unsigned char* p = sqlite3_column_text(st, idx);
    return p ? std::string(reinterpret_cast<const char*>(p), (size_t)sqlite3_column_bytes(st, idx)) : std::string();
}

static void step_done(sqlite3* db, sqlite3_stmt* st, const char* what) {
    int rc = sqlite3_step(st);
    sqlite3_reset(st);
    sqlite3_clear_bindings(st);
    if (rc != SQLITE_DONE) throw_sqlite(db, rc, what);
}

namespace {
// Finalizes on scope exit.
struct Stmt {
    sqlite3* db{nullptr};
    sqlite3_stmt* st{nullptr};
    Stmt(sqlite3* d, const char* sql) : db(d) {
        int rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
        if (rc != SQLITE_OK) throw_sqlite(db, rc, "prepare");
    }
    ~Stmt() { if (st) sqlite3_finalize(st); }
    Stmt(const Stmt&) = delete;
    Stmt& operator=(const Stmt&) = delete;
    // true while rows remain
    bool row() {
        int rc = sqlite3_step(st);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw_sqlite(db, rc, "step");
    }
};
}

static StoredChunk read_chunk(sqlite3_stmt* st) {
    StoredChunk c;
    c.id = col_text(st, 0);
    c.document_id = col_text(st, 1);
    c.page = sqlite3_column_int(st, 2);
    c.start = (size_t)sqlite3_column_int64(st, 3);
    c.end = (size_t)sqlite3_column_int64(st, 4);
    c.text = col_text(st, 5);
    return c;
}

static ManifestEntry read_manifest(sqlite3_stmt* st) {
    ManifestEntry e;
    e.document_id = col_text(st, 0);
    e.content_hash = col_text(st, 1);
    e.mtime = sqlite3_column_int64(st, 2);
    try {
        e.chunk_ids = json::parse(col_text(st, 3)).get<std::vector<std::string>>();
    } catch (const json::exception& ex) {
        throw IndexCorruption("manifest entry for " + e.document_id + " has unreadable chunk ids: " + ex.what());
    }
    return e;
}

static const char* kChunkCols = "id, doc_id, page, start_offset, end_offset, text";

// BEGIN IMMEDIATE on construction, ROLLBACK unless commit() ran.
class VectorIndex::Transaction {
public:
    explicit Transaction(VectorIndex& idx) : idx_(idx) { idx_.exec("BEGIN IMMEDIATE;"); }
    ~Transaction() {
        if (!done_) sqlite3_exec(idx_.db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
    void commit() {
        idx_.exec("COMMIT;");
        done_ = true;
    }
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

private:
    VectorIndex& idx_;
    bool done_{false};
};

// Borrows a read-only connection from the pool for one scope.
class VectorIndex::ReaderLease {
public:
    explicit ReaderLease(const VectorIndex& idx) : db(idx.open_reader()), idx_(idx) {}
    ~ReaderLease() { idx_.release_reader(db); }
    ReaderLease(const ReaderLease&) = delete;
    ReaderLease& operator=(const ReaderLease&) = delete;

    sqlite3* db;

private:
    const VectorIndex& idx_;
};

VectorIndex::VectorIndex(const std::string& db_path) : db_path_(db_path) {
    int rc = sqlite3_open_v2(db_path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw DocQaError("Failed to open SQLite DB " + db_path + ": " + msg);
    }
    try {
        init();
        prepare_statements();
        dim_ = load_dimension();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

VectorIndex::~VectorIndex() {
    unlock_pass();
    close_statements();
    for (auto* r : idle_readers_) sqlite3_close(r);
    if (db_) sqlite3_close(db_);
}

void VectorIndex::init() {
    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=FULL;");
    exec("CREATE TABLE IF NOT EXISTS chunks (\n"
         "  id TEXT PRIMARY KEY,\n"
         "  doc_id TEXT NOT NULL,\n"
         "  page INTEGER NOT NULL,\n"
         "  start_offset INTEGER NOT NULL,\n"
         "  end_offset INTEGER NOT NULL,\n"
         "  text TEXT NOT NULL,\n"
         "  vector BLOB NOT NULL\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_chunks_doc_id ON chunks(doc_id);");
    exec("CREATE TABLE IF NOT EXISTS manifest (\n"
         "  doc_id TEXT PRIMARY KEY,\n"
         "  content_hash TEXT NOT NULL,\n"
         "  mtime INTEGER NOT NULL,\n"
         "  chunk_ids TEXT NOT NULL\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS meta (key TEXT PRIMARY KEY, value TEXT NOT NULL);");
}

void VectorIndex::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        int primary = rc & 0xFF;
        if (primary == SQLITE_CORRUPT || primary == SQLITE_NOTADB) throw IndexCorruption(msg);
        throw DocQaError("SQLite error: " + msg);
    }
}

void VectorIndex::prepare_statements() {
    struct Def { sqlite3_stmt** out; const char* sql; };
    const Def defs[] = {
        {&insert_stmt_, "INSERT OR REPLACE INTO chunks \n"
                        "(id, doc_id, page, start_offset, end_offset, text, vector) \n"
                        "VALUES (?, ?, ?, ?, ?, ?, ?);"},
        {&delete_by_doc_stmt_, "DELETE FROM chunks WHERE doc_id = ?;"},
        {&manifest_upsert_stmt_, "INSERT OR REPLACE INTO manifest (doc_id, content_hash, mtime, chunk_ids) "
                                 "VALUES (?, ?, ?, ?);"},
        {&manifest_delete_stmt_, "DELETE FROM manifest WHERE doc_id = ?;"},
        {&meta_upsert_stmt_, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);"},
    };
    for (const auto& d : defs) {
        int rc = sqlite3_prepare_v2(db_, d.sql, -1, d.out, nullptr);
        if (rc != SQLITE_OK) throw_sqlite(db_, rc, "prepare");
    }
}

void VectorIndex::close_statements() {
    for (auto** st : {&insert_stmt_, &delete_by_doc_stmt_, &manifest_upsert_stmt_,
                      &manifest_delete_stmt_, &meta_upsert_stmt_}) {
        if (*st) { sqlite3_finalize(*st); *st = nullptr; }
    }
}

int VectorIndex::load_dimension() {
    Stmt q(db_, "SELECT value FROM meta WHERE key = 'dimension';");
    if (!q.row()) return 0;
    try {
        return std::stoi(col_text(q.st, 0));
    } catch (const std::exception&) {
        throw IndexCorruption("meta dimension is not a number");
    }
}

sqlite3* VectorIndex::open_reader() const {
    {
        std::lock_guard<std::mutex> lock(reader_mtx_);
        if (!idle_readers_.empty()) {
            sqlite3* r = idle_readers_.back();
            idle_readers_.pop_back();
            return r;
        }
    }
    sqlite3* r = nullptr;
    int rc = sqlite3_open_v2(db_path_.c_str(), &r, SQLITE_OPEN_READONLY | SQLITE_OPEN_NOMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = r ? sqlite3_errmsg(r) : sqlite3_errstr(rc);
        sqlite3_close(r);
        throw DocQaError("Failed to open reader on " + db_path_ + ": " + msg);
    }
    sqlite3_busy_timeout(r, 5000);
    return r;
}

void VectorIndex::release_reader(sqlite3* db) const {
    std::lock_guard<std::mutex> lock(reader_mtx_);
    if (idle_readers_.size() < kMaxIdleReaders) idle_readers_.push_back(db);
    else sqlite3_close(db);
}

void VectorIndex::upsert_locked(const Chunk& chunk, const std::vector<float>& vector) {
    if (vector.empty()) throw std::invalid_argument("empty embedding for chunk " + chunk.id);
    int dim = dim_.load();
    if (dim == 0) {
        meta_set_locked("dimension", std::to_string(vector.size()));
        dim_ = (int)vector.size();
    } else if ((int)vector.size() != dim) {
        throw std::invalid_argument("embedding dimension " + std::to_string(vector.size()) +
                                    " does not match index dimension " + std::to_string(dim));
    }
    std::vector<float> unit = vector;
    normalize(unit);
    bind_text(insert_stmt_, 1, chunk.id);
    bind_text(insert_stmt_, 2, chunk.document_id);
    sqlite3_bind_int(insert_stmt_, 3, chunk.page);
    sqlite3_bind_int64(insert_stmt_, 4, (sqlite3_int64)chunk.start);
    sqlite3_bind_int64(insert_stmt_, 5, (sqlite3_int64)chunk.end);
    bind_text(insert_stmt_, 6, chunk.text);
    bind_blob(insert_stmt_, 7, unit);
    step_done(db_, insert_stmt_, "insert chunk");
}

void VectorIndex::delete_by_document_locked(const std::string& document_id) {
    bind_text(delete_by_doc_stmt_, 1, document_id);
    step_done(db_, delete_by_doc_stmt_, "delete chunks by document");
}

void VectorIndex::manifest_set_locked(const ManifestEntry& entry) {
    bind_text(manifest_upsert_stmt_, 1, entry.document_id);
    bind_text(manifest_upsert_stmt_, 2, entry.content_hash);
    sqlite3_bind_int64(manifest_upsert_stmt_, 3, (sqlite3_int64)entry.mtime);
    bind_text(manifest_upsert_stmt_, 4, json(entry.chunk_ids).dump());
    step_done(db_, manifest_upsert_stmt_, "write manifest");
}

void VectorIndex::manifest_erase_locked(const std::string& document_id) {
    bind_text(manifest_delete_stmt_, 1, document_id);
    step_done(db_, manifest_delete_stmt_, "erase manifest");
}

void VectorIndex::meta_set_locked(const std::string& key, const std::string& value) {
    bind_text(meta_upsert_stmt_, 1, key);
    bind_text(meta_upsert_stmt_, 2, value);
    step_done(db_, meta_upsert_stmt_, "write meta");
}

void VectorIndex::upsert(const Chunk& chunk, const std::vector<float>& vector) {
    std::lock_guard<std::mutex> lock(write_mtx_);
    try {
        Transaction tx(*this);
        upsert_locked(chunk, vector);
        tx.commit();
    } catch (...) {
        dim_ = load_dimension();
        throw;
    }
}

void VectorIndex::delete_by_document(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(write_mtx_);
    delete_by_document_locked(document_id);
}

void VectorIndex::manifest_set(const ManifestEntry& entry) {
    std::lock_guard<std::mutex> lock(write_mtx_);
    manifest_set_locked(entry);
}

void VectorIndex::manifest_erase(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(write_mtx_);
    manifest_erase_locked(document_id);
}

void VectorIndex::meta_set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(write_mtx_);
    meta_set_locked(key, value);
}

void VectorIndex::commit_document(const ManifestEntry& entry, const std::vector<EmbeddedChunk>& chunks) {
    for (const auto& ec : chunks) {
        if (ec.chunk.document_id != entry.document_id) {
            throw std::invalid_argument("chunk " + ec.chunk.id + " does not belong to " + entry.document_id);
        }
    }
    std::lock_guard<std::mutex> lock(write_mtx_);
    try {
        Transaction tx(*this);
        delete_by_document_locked(entry.document_id);
        for (const auto& ec : chunks) upsert_locked(ec.chunk, ec.vector);
        manifest_set_locked(entry);
        tx.commit();
    } catch (...) {
        dim_ = load_dimension();
        throw;
    }
}

void VectorIndex::remove_document(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(write_mtx_);
    Transaction tx(*this);
    delete_by_document_locked(document_id);
    manifest_erase_locked(document_id);
    tx.commit();
}

void VectorIndex::clear() {
    std::lock_guard<std::mutex> lock(write_mtx_);
    Transaction tx(*this);
    exec("DELETE FROM chunks;");
    exec("DELETE FROM manifest;");
    exec("DELETE FROM meta;");
    tx.commit();
    dim_ = 0;
}

size_t VectorIndex::prune_orphans() {
    std::lock_guard<std::mutex> lock(write_mtx_);

    size_t orphans = 0;
    {
        Stmt q(db_, "SELECT COUNT(*) FROM chunks WHERE doc_id NOT IN (SELECT doc_id FROM manifest);");
        if (q.row()) orphans = (size_t)sqlite3_column_int64(q.st, 0);
    }
    std::vector<std::string> phantoms;
    {
        Stmt q(db_, "SELECT m.doc_id, m.content_hash, m.mtime, m.chunk_ids, "
                    "(SELECT COUNT(*) FROM chunks c WHERE c.doc_id = m.doc_id) FROM manifest m;");
        while (q.row()) {
            auto e = read_manifest(q.st);
            if ((size_t)sqlite3_column_int64(q.st, 4) != e.chunk_ids.size()) phantoms.push_back(e.document_id);
        }
    }
    if (orphans == 0 && phantoms.empty()) return 0;

    Transaction tx(*this);
    if (orphans) exec("DELETE FROM chunks WHERE doc_id NOT IN (SELECT doc_id FROM manifest);");
    for (const auto& id : phantoms) {
        delete_by_document_locked(id);
        manifest_erase_locked(id);
    }
    tx.commit();
    log_line(LogLevel::Warn, "store", "pruned " + std::to_string(orphans) + " orphan chunks and " +
             std::to_string(phantoms.size()) + " incomplete manifest entries");
    return orphans + phantoms.size();
}

std::vector<ScoredChunk> VectorIndex::search(const std::vector<float>& query, int k) const {
    if (k <= 0) throw std::invalid_argument("k must be positive");
    std::vector<ScoredChunk> out;
    ReaderLease r(*this);
    Stmt q(r.db, "SELECT id, doc_id, page, start_offset, end_offset, text, vector FROM chunks;");
    std::vector<float> unit = query;
    normalize(unit);
    while (q.row()) {
        const void* blob = sqlite3_column_blob(q.st, 6);
        int bytes = sqlite3_column_bytes(q.st, 6);
        if (bytes <= 0 || bytes % (int)sizeof(float) != 0) {
            throw IndexCorruption("vector blob of " + std::to_string(bytes) + " bytes");
        }
        std::vector<float> vec(bytes / (int)sizeof(float));
        std::memcpy(vec.data(), blob, bytes);
        if (vec.size() != unit.size()) {
            throw std::invalid_argument("query dimension " + std::to_string(unit.size()) +
                                        " does not match index dimension " + std::to_string(vec.size()) +
                                        "; was the embedding model changed without a forced reindex?");
        }
        out.push_back({read_chunk(q.st), dot_product(vec, unit)});
    }
    auto better = [](const ScoredChunk& a, const ScoredChunk& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.chunk.id < b.chunk.id;
    };
    size_t keep = std::min<size_t>((size_t)k, out.size());
    std::partial_sort(out.begin(), out.begin() + keep, out.end(), better);
    out.resize(keep);
    return out;
}

Manifest VectorIndex::manifest_get() const {
    Manifest m;
    ReaderLease r(*this);
    Stmt q(r.db, "SELECT doc_id, content_hash, mtime, chunk_ids FROM manifest ORDER BY doc_id;");
    while (q.row()) {
        auto e = read_manifest(q.st);
        m.emplace(e.document_id, std::move(e));
    }
    return m;
}

std::optional<ManifestEntry> VectorIndex::manifest_entry(const std::string& document_id) const {
    ReaderLease r(*this);
    Stmt q(r.db, "SELECT doc_id, content_hash, mtime, chunk_ids FROM manifest WHERE doc_id = ?;");
    bind_text(q.st, 1, document_id);
    if (!q.row()) return std::nullopt;
    return read_manifest(q.st);
}

std::vector<std::string> VectorIndex::chunk_ids_for(const std::string& document_id) const {
    std::vector<std::string> ids;
    ReaderLease r(*this);
    Stmt q(r.db, "SELECT id FROM chunks WHERE doc_id = ? ORDER BY id;");
    bind_text(q.st, 1, document_id);
    while (q.row()) ids.push_back(col_text(q.st, 0));
    return ids;
}

std::optional<StoredChunk> VectorIndex::get_chunk(const std::string& id) const {
    ReaderLease r(*this);
    std::string sql = std::string("SELECT ") + kChunkCols + " FROM chunks WHERE id = ?;";
    Stmt q(r.db, sql.c_str());
    bind_text(q.st, 1, id);
    if (!q.row()) return std::nullopt;
    return read_chunk(q.st);
}

size_t VectorIndex::chunk_count() const {
    ReaderLease r(*this);
    Stmt q(r.db, "SELECT COUNT(*) FROM chunks;");
    return q.row() ? (size_t)sqlite3_column_int64(q.st, 0) : 0;
}

size_t VectorIndex::document_count() const {
    ReaderLease r(*this);
    Stmt q(r.db, "SELECT COUNT(*) FROM manifest;");
    return q.row() ? (size_t)sqlite3_column_int64(q.st, 0) : 0;
}

std::optional<std::string> VectorIndex::meta_get(const std::string& key) const {
    ReaderLease r(*this);
    Stmt q(r.db, "SELECT value FROM meta WHERE key = ?;");
    bind_text(q.st, 1, key);
    if (!q.row()) return std::nullopt;
    return col_text(q.st, 0);
}

void VectorIndex::check_integrity() const {
    ReaderLease r(*this);
    Stmt q(r.db, "PRAGMA quick_check;");
    std::string first;
    if (q.row()) first = col_text(q.st, 0);
    if (first != "ok") throw IndexCorruption("quick_check: " + first);
    Stmt m(r.db, "SELECT doc_id, content_hash, mtime, chunk_ids FROM manifest;");
    while (m.row()) read_manifest(m.st);
}

int VectorIndex::write_count() const {
    std::lock_guard<std::mutex> lock(write_mtx_);
    return sqlite3_total_changes(db_);
}

bool VectorIndex::try_lock_pass() {
    std::lock_guard<std::mutex> lock(pass_mtx_);
    if (pass_fd_ >= 0) return false;
    std::string lock_path = db_path_ + ".lock";
    int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) throw DocQaError("Failed to open " + lock_path + ": " + std::strerror(errno));
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) return false;
        throw DocQaError("Failed to lock " + lock_path + ": " + std::strerror(err));
    }
    pass_fd_ = fd;
    return true;
}

void VectorIndex::unlock_pass() {
    std::lock_guard<std::mutex> lock(pass_mtx_);
    if (pass_fd_ < 0) return;
    ::flock(pass_fd_, LOCK_UN);
    ::close(pass_fd_);
    pass_fd_ = -1;
}
