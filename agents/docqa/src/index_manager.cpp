#include "../include/index_manager.hpp"
#include "../include/chunker.hpp"
#include "../include/errors.hpp"
#include <algorithm>
#include <set>

const char* to_string(IndexState s) {
    switch (s) {
    case IndexState::Idle: return "idle";
    case IndexState::Scanning: return "scanning";
    case IndexState::Diffing: return "diffing";
    case IndexState::Applying: return "applying";
    }
    return "unknown";
}

ReindexPlan plan_reindex(const ScanResult& scan, const Manifest& manifest) {
    ReindexPlan plan;
    std::set<std::string> seen;
    for (const auto& doc : scan.documents) {
        seen.insert(doc.id);
        auto it = manifest.find(doc.id);
        if (it == manifest.end()) plan.added.push_back(doc);
        else if (it->second.content_hash != doc.content_hash) plan.changed.push_back(doc);
        else plan.unchanged.push_back(doc.id);
    }
    for (const auto& id : scan.unreadable) {
        if (seen.insert(id).second) plan.skipped.push_back(id);
    }
    for (const auto& kv : manifest) {
        if (!seen.count(kv.first)) plan.removed.push_back(kv.first);
    }
    auto by_id = [](const DocumentInfo& a, const DocumentInfo& b){ return a.id < b.id; };
    std::sort(plan.added.begin(), plan.added.end(), by_id);
    std::sort(plan.changed.begin(), plan.changed.end(), by_id);
    std::sort(plan.unchanged.begin(), plan.unchanged.end());
    std::sort(plan.skipped.begin(), plan.skipped.end());
    return plan;
}

// Marks the manager busy and holds the index's pass lock for one pass; throws
// ReindexInProgress when this manager, or any other process on the same database, is running one.
class IndexManager::PassGuard {
public:
    explicit PassGuard(IndexManager& m) : m_(m) {
        bool expected = false;
        if (!m_.busy_.compare_exchange_strong(expected, true)) throw ReindexInProgress();
        bool locked = false;
        try {
            locked = m_.index_.try_lock_pass();
        } catch (...) {
            m_.busy_ = false;
            throw;
        }
        if (!locked) {
            m_.busy_ = false;
            throw ReindexInProgress();
        }
    }
    ~PassGuard() {
        m_.index_.unlock_pass();
        m_.state_ = IndexState::Idle;
        m_.busy_ = false;
    }
    PassGuard(const PassGuard&) = delete;
    PassGuard& operator=(const PassGuard&) = delete;

private:
    IndexManager& m_;
};

IndexManager::IndexManager(DocumentSource& source, EmbeddingGateway& embedder, VectorIndex& index,
                           IndexOptions opts, RetryPolicy retry)
    : source_(source), embedder_(embedder), index_(index), opts_(std::move(opts)), retry_(retry) {}

ReindexReport IndexManager::reindex(bool force, const CancelToken* cancel) {
    PassGuard guard(*this);
    return run_pass(force, cancel);
}

std::future<ReindexReport> IndexManager::reindex_async(bool force, std::shared_ptr<CancelToken> cancel) {
    auto guard = std::make_shared<PassGuard>(*this);
    return std::async(std::launch::async, [this, guard, force, cancel]() mutable {
        auto held = std::move(guard);
        return run_pass(force, cancel.get());
    });
}

void IndexManager::clear() {
    PassGuard guard(*this);
    index_.clear();
    log_line(LogLevel::Info, "index", "index cleared");
}

size_t IndexManager::index_document(const DocumentInfo& doc, const CancelToken* cancel) {
    std::vector<Chunk> chunks;
    for (const auto& page : source_.pages(doc)) {
        auto part = chunk_page(doc.id, doc.content_hash, page.number, page.text,
                               opts_.chunk_chars, opts_.chunk_overlap);
        for (auto& c : part) chunks.push_back(std::move(c));
    }

    std::vector<EmbeddedChunk> embedded;
    embedded.reserve(chunks.size());
    const size_t batch = (size_t)std::max(1, opts_.embed_batch);
    for (size_t i = 0; i < chunks.size(); i += batch) {
        if (is_cancelled(cancel)) throw OperationCancelled();
        size_t end = std::min(chunks.size(), i + batch);
        std::vector<std::string> texts;
        for (size_t j = i; j < end; ++j) texts.push_back(chunks[j].text);
        auto vecs = embed_with_retry(embedder_, texts, retry_, cancel);
        for (size_t j = i; j < end; ++j) embedded.push_back({chunks[j], std::move(vecs[j - i])});
    }

    ManifestEntry entry;
    entry.document_id = doc.id;
    entry.content_hash = doc.content_hash;
    entry.mtime = doc.mtime;
    for (const auto& c : chunks) entry.chunk_ids.push_back(c.id);
    index_.commit_document(entry, embedded);
    return embedded.size();
}

ReindexReport IndexManager::run_pass(bool force, const CancelToken* cancel) {
    ReindexReport report;
    const std::string model = embedder_.model_id();

    state_ = IndexState::Scanning;
    auto scan = source_.scan();
    log_line(LogLevel::Info, "index", "scanned " + std::to_string(scan.documents.size()) + " documents in " +
             source_.root().string());

    state_ = IndexState::Diffing;
    auto stored_model = index_.meta_get("embed_model");
    if (!force && stored_model && *stored_model != model) {
        log_line(LogLevel::Warn, "index", "index was built with " + *stored_model + ", now " + model +
                 "; rebuilding from scratch");
        force = true;
    }
    report.forced = force;
    if (force) {
        index_.clear();
        stored_model.reset();
    } else {
        index_.prune_orphans();
    }
    auto plan = plan_reindex(scan, index_.manifest_get());
    for (auto& d : plan.added) report.added.push_back(d.id);
    for (auto& d : plan.changed) report.changed.push_back(d.id);
    report.removed = plan.removed;
    report.unchanged = plan.unchanged;
    report.skipped = plan.skipped;

    state_ = IndexState::Applying;
    if (!plan.added.empty() || !plan.changed.empty()) {
        if (!stored_model || *stored_model != model) index_.meta_set("embed_model", model);
    }

    struct Work {
        std::string id;
        const DocumentInfo* doc; // null for removals
    };
    std::vector<Work> work;
    for (auto& d : plan.added) work.push_back({d.id, &d});
    for (auto& d : plan.changed) work.push_back({d.id, &d});
    for (auto& id : plan.removed) work.push_back({id, nullptr});
    std::sort(work.begin(), work.end(), [](const Work& a, const Work& b){ return a.id < b.id; });

    for (size_t i = 0; i < work.size(); ++i) {
        const auto& w = work[i];
        try {
            if (is_cancelled(cancel)) throw OperationCancelled();
            if (w.doc) {
                size_t n = index_document(*w.doc, cancel);
                report.chunks_written += n;
                log_line(LogLevel::Info, "index", "indexed " + w.id + " (" + std::to_string(n) + " chunks)");
            } else {
                index_.remove_document(w.id);
                log_line(LogLevel::Info, "index", "removed " + w.id);
            }
            report.succeeded.push_back(w.id);
        } catch (const OperationCancelled&) {
            report.cancelled = true;
            for (size_t j = i; j < work.size(); ++j) report.not_reached.push_back(work[j].id);
            log_line(LogLevel::Warn, "index", "pass cancelled; " + std::to_string(report.not_reached.size()) +
                     " documents not reached");
            break;
        } catch (const IndexCorruption&) {
            throw;
        } catch (const TransientError& e) {
            log_line(LogLevel::Error, "index", "IndexingFailed for " + w.id + ": " + e.what());
            report.failed.push_back({w.id, std::string("IndexingFailed: ") + e.what(), true});
        } catch (const std::exception& e) {
            log_line(LogLevel::Error, "index", "skipping " + w.id + ": " + e.what());
            report.failed.push_back({w.id, e.what(), false});
        }
    }

    log_line(LogLevel::Info, "index", "pass done: " + std::to_string(report.added.size()) + " added, " +
             std::to_string(report.changed.size()) + " changed, " + std::to_string(report.removed.size()) +
             " removed, " + std::to_string(report.unchanged.size()) + " unchanged, " +
             std::to_string(report.failed.size()) + " failed, " + std::to_string(report.chunks_written) +
             " chunks written");
    return report;
}
