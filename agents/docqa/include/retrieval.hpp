#pragma once
#include "config.hpp"
#include "embed.hpp"
#include "store.hpp"
#include "util.hpp"
#include <string>
#include <vector>

struct Citation {
    std::string document_id;
    int page{0};
    bool operator==(const Citation& o) const { return document_id == o.document_id && page == o.page; }
};

struct QueryResult {
    std::vector<ScoredChunk> ranked; // search hits above the relevance floor, best first
    std::vector<ScoredChunk> used;   // prefix of ranked that fit the context budget
    std::string context;
    std::vector<Citation> citations; // of used, in order of first appearance
    bool empty() const { return used.empty(); }
};

// Context block for one hit, "[n] name (page p)" then the text.
std::string format_context_block(int n, const StoredChunk& chunk);

// Fills the budget from ranked, best first; pure so the budget rules can be tested alone.
QueryResult assemble_context(std::vector<ScoredChunk> ranked, int context_chars);

class RetrievalEngine {
public:
    RetrievalEngine(EmbeddingGateway& embedder, const VectorIndex& index,
                    RetrievalOptions opts, RetryPolicy retry);

    // A blank query returns an empty result without embedding anything.
    QueryResult retrieve(const std::string& query, int k, const CancelToken* cancel = nullptr) const;
    QueryResult retrieve(const std::string& query, const CancelToken* cancel = nullptr) const;

    const RetrievalOptions& options() const { return opts_; }

private:
    EmbeddingGateway& embedder_;
    const VectorIndex& index_;
    RetrievalOptions opts_;
    RetryPolicy retry_;
};
