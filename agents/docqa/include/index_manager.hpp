#pragma once
#include "config.hpp"
#include "source.hpp"
#include "embed.hpp"
#include "store.hpp"
#include "util.hpp"
#include <string>
#include <vector>
#include <atomic>
#include <future>
#include <memory>

enum class IndexState { Idle, Scanning, Diffing, Applying };

const char* to_string(IndexState s);

struct ReindexPlan {
    std::vector<DocumentInfo> added;
    std::vector<DocumentInfo> changed;
    std::vector<std::string> removed;
    std::vector<std::string> unchanged;
    std::vector<std::string> skipped; // unreadable during the scan; left as indexed
};

// Classifies every scanned or manifest document. Pure; all lists sorted by id.
ReindexPlan plan_reindex(const ScanResult& scan, const Manifest& manifest);

struct DocumentFailure {
    std::string document_id;
    std::string reason;
    bool transient{false};
};

struct ReindexReport {
    bool forced{false};
    bool cancelled{false};
    std::vector<std::string> added;
    std::vector<std::string> changed;
    std::vector<std::string> removed;
    std::vector<std::string> unchanged;
    std::vector<std::string> skipped;
    std::vector<std::string> succeeded;
    std::vector<DocumentFailure> failed;
    std::vector<std::string> not_reached; // left untouched because the pass was cancelled
    size_t chunks_written{0};
};

// Brings the VectorIndex in sync with the watched folder. One pass at a time.
class IndexManager {
public:
    IndexManager(DocumentSource& source, EmbeddingGateway& embedder, VectorIndex& index,
                 IndexOptions opts, RetryPolicy retry);

    // Throws ReindexInProgress if a pass or clear() is running.
    ReindexReport reindex(bool force, const CancelToken* cancel = nullptr);
    // The in-progress check happens here, before the background pass starts.
    std::future<ReindexReport> reindex_async(bool force, std::shared_ptr<CancelToken> cancel = nullptr);
    void clear();

    IndexState state() const { return state_.load(); }
    bool busy() const { return busy_.load(); }

private:
    class PassGuard;

    ReindexReport run_pass(bool force, const CancelToken* cancel);
    size_t index_document(const DocumentInfo& doc, const CancelToken* cancel);

    DocumentSource& source_;
    EmbeddingGateway& embedder_;
    VectorIndex& index_;
    IndexOptions opts_;
    RetryPolicy retry_;
    std::atomic<bool> busy_{false};
    std::atomic<IndexState> state_{IndexState::Idle};
};
