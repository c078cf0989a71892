#include "../include/rag.hpp"
#include "../include/errors.hpp"
#include "../include/retry.hpp"
#include <filesystem>
#include <stdexcept>

const char* const kNoGroundingText =
    "No grounding available: the indexed documents contain nothing relevant to this question.";

PageMode parse_page_mode(const std::string& name) {
    auto n = to_lower(trim(name));
    if (n.empty() || n == "raw") return PageMode::Raw;
    if (n == "explain" || n == "\xE8\xA7\xA3\xE9\x87\x8B") return PageMode::Explain;
    if (n == "translate" || n == "\xE7\xBF\xBB\xE8\xAD\xAF") return PageMode::Translate;
    throw std::invalid_argument("unknown page mode: " + name);
}

const char* to_string(PageMode mode) {
    switch (mode) {
    case PageMode::Raw: return "raw";
    case PageMode::Explain: return "explain";
    case PageMode::Translate: return "translate";
    }
    return "unknown";
}

std::string answer_instruction() {
    return "You are an assistant for question-answering tasks. Answer only from the numbered context "
           "passages below. If they do not contain the answer, say that you don't know. Cite the "
           "passages you used as [n]. Keep the answer concise.";
}

std::string page_instruction(PageMode mode, const std::string& language) {
    if (mode == PageMode::Translate) {
        return "You are a helpful assistant. Translate the following text to " + language +
               " and provide a concise summary.";
    }
    return "You are a helpful assistant. Explain the following page concisely, in the language it is "
           "written in, covering its main points.";
}

QueryOrchestrator::QueryOrchestrator(const RetrievalEngine& retrieval, GenerationClient& generator,
                                     DocumentSource& source, LlmConfig llm, RetryPolicy retry)
    : retrieval_(retrieval), generator_(generator), source_(source), llm_(std::move(llm)), retry_(retry) {}

std::string QueryOrchestrator::generate(const GenerationRequest& req, const char* what, const CancelToken* cancel) {
    return with_retry(retry_, what, cancel, [&]{ return generator_.generate(req); });
}

Answer QueryOrchestrator::answer(const std::string& query, const std::vector<ChatTurn>& history,
                                 const CancelToken* cancel) {
    Answer ans;
    ans.retrieval = retrieval_.retrieve(query, cancel);
    if (ans.retrieval.empty()) {
        log_line(LogLevel::Info, "query", "no grounding for query");
        ans.status = AnswerStatus::NoGrounding;
        ans.text = kNoGroundingText;
        return ans;
    }
    if (is_cancelled(cancel)) throw OperationCancelled();

    GenerationRequest req;
    req.instruction = answer_instruction();
    req.context = ans.retrieval.context;
    req.history = history;
    req.prompt = query;
    ans.text = generate(req, "generate answer", cancel);
    ans.status = AnswerStatus::Grounded;
    ans.citations = ans.retrieval.citations;
    return ans;
}

PageInspection QueryOrchestrator::inspect_page(const std::string& document_id, int page, PageMode mode,
                                               const CancelToken* cancel) {
    auto doc = source_.resolve(document_id);
    auto pages = source_.pages(doc);

    PageInspection out;
    out.document_id = doc.id;
    out.page = page;
    out.page_count = (int)pages.size();
    if (page < 1 || page > out.page_count) throw PageOutOfRange(doc.id, page, out.page_count);
    out.raw = pages[(size_t)page - 1].text;

    if (mode != PageMode::Raw) {
        GenerationRequest req;
        req.instruction = page_instruction(mode, llm_.translate_language);
        req.prompt = "Text:\n" + out.raw;
        out.transformed = generate(req, mode == PageMode::Translate ? "translate page" : "explain page", cancel);
    }
    return out;
}

Collaborators default_collaborators(const DocQaConfig& cfg) {
    Collaborators c;
    c.extractor = std::make_shared<CommandTextExtractor>(cfg.extractor);
    c.embedder = std::make_shared<OllamaEmbeddingGateway>(cfg.embed);
    c.generator = std::make_shared<OllamaChatClient>(cfg.llm);
    return c;
}

DocQaService::DocQaService(const DocQaConfig& cfg, Collaborators collaborators)
    : cfg_(cfg), collab_(std::move(collaborators)) {
    validate_config(cfg_);
    if (!collab_.extractor || !collab_.embedder || !collab_.generator) {
        throw std::invalid_argument("DocQaService needs an extractor, an embedder and a generator");
    }
    auto db_dir = std::filesystem::path(cfg_.index.db_path).parent_path();
    if (!db_dir.empty()) std::filesystem::create_directories(db_dir);

    source_ = std::make_unique<DocumentSource>(cfg_.index.data_dir, cfg_.index.exts, collab_.extractor);
    index_ = std::make_unique<VectorIndex>(cfg_.index.db_path);
    manager_ = std::make_unique<IndexManager>(*source_, *collab_.embedder, *index_, cfg_.index, cfg_.retry);
    retrieval_ = std::make_unique<RetrievalEngine>(*collab_.embedder, *index_, cfg_.retrieval, cfg_.retry);
    orchestrator_ = std::make_unique<QueryOrchestrator>(*retrieval_, *collab_.generator, *source_,
                                                        cfg_.llm, cfg_.retry);
}

ReindexReport DocQaService::reindex(bool force, const CancelToken* cancel) {
    return manager_->reindex(force, cancel);
}

std::future<ReindexReport> DocQaService::reindex_async(bool force, std::shared_ptr<CancelToken> cancel) {
    return manager_->reindex_async(force, std::move(cancel));
}

void DocQaService::clear() {
    manager_->clear();
}

Answer DocQaService::answer(const std::string& query, const std::vector<ChatTurn>& history,
                            const CancelToken* cancel) {
    return orchestrator_->answer(query, history, cancel);
}

PageInspection DocQaService::inspect_page(const std::string& document_id, int page, PageMode mode,
                                          const CancelToken* cancel) {
    return orchestrator_->inspect_page(document_id, page, mode, cancel);
}

IndexStatus DocQaService::status() const {
    IndexStatus s;
    s.documents = index_->document_count();
    s.chunks = index_->chunk_count();
    s.dimension = index_->dimension();
    s.embed_model = index_->meta_get("embed_model").value_or("");
    s.state = manager_->state();
    return s;
}
