#pragma once
#include "config.hpp"
#include "source.hpp"
#include "embed.hpp"
#include "generate.hpp"
#include "store.hpp"
#include "index_manager.hpp"
#include "retrieval.hpp"
#include "util.hpp"
#include <string>
#include <vector>
#include <optional>
#include <memory>

enum class AnswerStatus { Grounded, NoGrounding };

struct Answer {
    AnswerStatus status{AnswerStatus::NoGrounding};
    std::string text;
    std::vector<Citation> citations;
    QueryResult retrieval;
};

enum class PageMode { Raw, Explain, Translate };

// "raw" | "explain" (or "解釋") | "translate" (or "翻譯"); throws std::invalid_argument.
PageMode parse_page_mode(const std::string& name);
const char* to_string(PageMode mode);

struct PageInspection {
    std::string document_id;
    int page{0};
    int page_count{0};
    std::string raw;
    std::optional<std::string> transformed;
};

extern const char* const kNoGroundingText;

std::string answer_instruction();
std::string page_instruction(PageMode mode, const std::string& language);

// Grounded answers over retrieval, plus direct page access.
class QueryOrchestrator {
public:
    QueryOrchestrator(const RetrievalEngine& retrieval, GenerationClient& generator, DocumentSource& source,
                      LlmConfig llm, RetryPolicy retry);

    Answer answer(const std::string& query, const std::vector<ChatTurn>& history = {},
                  const CancelToken* cancel = nullptr);
    // Throws DocumentNotFound or PageOutOfRange; the index is never touched.
    PageInspection inspect_page(const std::string& document_id, int page, PageMode mode,
                                const CancelToken* cancel = nullptr);

private:
    std::string generate(const GenerationRequest& req, const char* what, const CancelToken* cancel);

    const RetrievalEngine& retrieval_;
    GenerationClient& generator_;
    DocumentSource& source_;
    LlmConfig llm_;
    RetryPolicy retry_;
};

struct Collaborators {
    std::shared_ptr<TextExtractor> extractor;
    std::shared_ptr<EmbeddingGateway> embedder;
    std::shared_ptr<GenerationClient> generator;
};

// Command-line extraction plus Ollama embedding and chat.
Collaborators default_collaborators(const DocQaConfig& cfg);

struct IndexStatus {
    size_t documents{0};
    size_t chunks{0};
    int dimension{0};
    std::string embed_model;
    IndexState state{IndexState::Idle};
};

// The control surface: reindex, clear, answer, inspect_page.
class DocQaService {
public:
    DocQaService(const DocQaConfig& cfg, Collaborators collaborators);

    ReindexReport reindex(bool force, const CancelToken* cancel = nullptr);
    std::future<ReindexReport> reindex_async(bool force, std::shared_ptr<CancelToken> cancel = nullptr);
    void clear();
    Answer answer(const std::string& query, const std::vector<ChatTurn>& history = {},
                  const CancelToken* cancel = nullptr);
    PageInspection inspect_page(const std::string& document_id, int page, PageMode mode,
                                const CancelToken* cancel = nullptr);
    IndexStatus status() const;

    const VectorIndex& index() const { return *index_; }
    const DocQaConfig& config() const { return cfg_; }

private:
    DocQaConfig cfg_;
    Collaborators collab_;
    std::unique_ptr<DocumentSource> source_;
    std::unique_ptr<VectorIndex> index_;
    std::unique_ptr<IndexManager> manager_;
    std::unique_ptr<RetrievalEngine> retrieval_;
    std::unique_ptr<QueryOrchestrator> orchestrator_;
};
