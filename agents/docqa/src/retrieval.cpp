#include "../include/retrieval.hpp"
#include "../include/errors.hpp"
#include <filesystem>
#include <stdexcept>

std::string format_context_block(int n, const StoredChunk& chunk) {
    auto name = std::filesystem::path(chunk.document_id).filename().string();
    return "[" + std::to_string(n) + "] " + name + " (page " + std::to_string(chunk.page) + ")\n---\n" +
           chunk.text + "\n\n";
}

QueryResult assemble_context(std::vector<ScoredChunk> ranked, int context_chars) {
    QueryResult res;
    const size_t budget = context_chars > 0 ? (size_t)context_chars : 0;
    for (const auto& hit : ranked) {
        int n = (int)res.used.size() + 1;
        auto block = format_context_block(n, hit.chunk);
        if (res.context.size() + block.size() > budget) {
            if (!res.used.empty()) break;
            // The best hit alone is over budget: keep as much of its text as fits.
            auto head = format_context_block(n, StoredChunk{hit.chunk.id, hit.chunk.document_id,
                                                            hit.chunk.page, 0, 0, ""});
            if (head.size() >= budget) break;
            ScoredChunk cut = hit;
            size_t keep = budget - head.size();
            while (keep > 0 && (static_cast<unsigned char>(hit.chunk.text[keep]) & 0xC0) == 0x80) --keep;
            if (keep == 0) break;
            cut.chunk.text = hit.chunk.text.substr(0, keep);
            cut.chunk.end = cut.chunk.start + cut.chunk.text.size();
            block = format_context_block(n, cut.chunk);
            res.context += block;
            res.used.push_back(std::move(cut));
            break;
        }
        res.context += block;
        res.used.push_back(hit);
    }
    for (const auto& u : res.used) {
        Citation c{u.chunk.document_id, u.chunk.page};
        bool dup = false;
        for (const auto& have : res.citations) {
            if (have == c) { dup = true; break; }
        }
        if (!dup) res.citations.push_back(std::move(c));
    }
    res.ranked = std::move(ranked);
    return res;
}

RetrievalEngine::RetrievalEngine(EmbeddingGateway& embedder, const VectorIndex& index,
                                 RetrievalOptions opts, RetryPolicy retry)
    : embedder_(embedder), index_(index), opts_(opts), retry_(retry) {}

QueryResult RetrievalEngine::retrieve(const std::string& query, const CancelToken* cancel) const {
    return retrieve(query, opts_.top_k, cancel);
}

QueryResult RetrievalEngine::retrieve(const std::string& query, int k, const CancelToken* cancel) const {
    if (k <= 0) throw std::invalid_argument("k must be positive");
    if (is_blank(query)) {
        log_line(LogLevel::Debug, "query", "blank query, nothing to retrieve");
        return QueryResult{};
    }
    auto vecs = embed_with_retry(embedder_, {query}, retry_, cancel);
    if (is_cancelled(cancel)) throw OperationCancelled();

    auto hits = index_.search(vecs.front(), k);
    std::vector<ScoredChunk> ranked;
    for (auto& h : hits) {
        if (opts_.min_score <= -1.0f || h.score >= opts_.min_score) ranked.push_back(std::move(h));
    }
    auto res = assemble_context(std::move(ranked), opts_.context_chars);
    if (log_enabled(LogLevel::Debug)) {
        log_line(LogLevel::Debug, "query", "retrieved " + std::to_string(res.ranked.size()) + " hits, " +
                 std::to_string(res.used.size()) + " in context, " + std::to_string(res.citations.size()) +
                 " citations");
    }
    return res;
}
