#include "../include/config.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

template <typename T>
static void read_if(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) out = it->get<T>();
}

void apply_json_config(DocQaConfig& cfg, const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::string("config is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) throw std::invalid_argument("config root must be a JSON object");

    try {
        read_if(j, "data_dir", cfg.index.data_dir);
        read_if(j, "db_path", cfg.index.db_path);
        read_if(j, "extensions", cfg.index.exts);
        read_if(j, "chunk_chars", cfg.index.chunk_chars);
        read_if(j, "chunk_overlap", cfg.index.chunk_overlap);
        read_if(j, "embed_batch", cfg.index.embed_batch);

        if (j.contains("ollama_url")) {
            cfg.embed.ollama_url = j["ollama_url"].get<std::string>();
            cfg.llm.ollama_url = cfg.embed.ollama_url;
        }
        read_if(j, "embed_model", cfg.embed.embed_model);
        read_if(j, "embed_timeout_ms", cfg.embed.timeout_ms);
        read_if(j, "llm_model", cfg.llm.llm_model);
        read_if(j, "llm_timeout_ms", cfg.llm.timeout_ms);
        read_if(j, "translate_language", cfg.llm.translate_language);

        read_if(j, "top_k", cfg.retrieval.top_k);
        read_if(j, "context_chars", cfg.retrieval.context_chars);
        read_if(j, "min_score", cfg.retrieval.min_score);

        if (j.contains("retry")) {
            const auto& r = j["retry"];
            read_if(r, "max_attempts", cfg.retry.max_attempts);
            read_if(r, "initial_backoff_ms", cfg.retry.initial_backoff_ms);
            read_if(r, "max_backoff_ms", cfg.retry.max_backoff_ms);
            read_if(r, "multiplier", cfg.retry.multiplier);
        }
        if (j.contains("pdf_command")) cfg.extractor.commands[".pdf"] = j["pdf_command"].get<std::string>();
        if (j.contains("docx_command")) cfg.extractor.commands[".docx"] = j["docx_command"].get<std::string>();
        read_if(j, "log_level", cfg.log_level);
    } catch (const json::type_error& e) {
        throw std::invalid_argument(std::string("config has a value of the wrong type: ") + e.what());
    }
}

void apply_env_config(DocQaConfig& cfg) {
    cfg.index.data_dir = getenv_or("DOCQA_DATA_DIR", cfg.index.data_dir);
    cfg.index.db_path = getenv_or("DOCQA_DB_PATH", cfg.index.db_path);
    cfg.embed.ollama_url = getenv_or("OLLAMA_URL", cfg.embed.ollama_url);
    cfg.llm.ollama_url = getenv_or("OLLAMA_URL", cfg.llm.ollama_url);
    cfg.embed.embed_model = getenv_or("DOCQA_EMBED_MODEL", cfg.embed.embed_model);
    cfg.llm.llm_model = getenv_or("DOCQA_LLM_MODEL", cfg.llm.llm_model);
    cfg.log_level = getenv_or("DOCQA_LOG_LEVEL", cfg.log_level);
    auto k = getenv_or("DOCQA_TOP_K", "");
    if (!k.empty()) {
        try {
            cfg.retrieval.top_k = std::stoi(k);
        } catch (const std::exception&) {
            throw std::invalid_argument("DOCQA_TOP_K is not an integer: " + k);
        }
    }
}

DocQaConfig load_config(const std::optional<std::string>& json_path) {
    DocQaConfig cfg;
    if (json_path) {
        std::ifstream f(*json_path);
        if (!f) throw std::invalid_argument("cannot open config file " + *json_path);
        std::ostringstream ss;
        ss << f.rdbuf();
        apply_json_config(cfg, ss.str());
    }
    apply_env_config(cfg);
    return cfg;
}

void validate_config(const DocQaConfig& cfg) {
    if (cfg.index.chunk_chars <= 0) throw std::invalid_argument("chunk_chars must be positive");
    if (cfg.index.chunk_overlap < 0 || cfg.index.chunk_overlap >= cfg.index.chunk_chars) {
        throw std::invalid_argument("chunk_overlap must be in [0, chunk_chars)");
    }
    if (cfg.index.embed_batch <= 0) throw std::invalid_argument("embed_batch must be positive");
    if (cfg.retrieval.top_k <= 0) throw std::invalid_argument("top_k must be positive");
    if (cfg.retrieval.context_chars <= 0) throw std::invalid_argument("context_chars must be positive");
    if (cfg.retry.max_attempts < 1) throw std::invalid_argument("retry.max_attempts must be at least 1");
    if (cfg.retry.initial_backoff_ms < 0 || cfg.retry.max_backoff_ms < 0) {
        throw std::invalid_argument("retry backoff must not be negative");
    }
    if (cfg.retry.multiplier < 1.0) throw std::invalid_argument("retry.multiplier must be >= 1");
    if (cfg.embed.timeout_ms <= 0 || cfg.llm.timeout_ms <= 0) {
        throw std::invalid_argument("timeouts must be positive");
    }
    if (cfg.index.exts.empty()) throw std::invalid_argument("extensions must not be empty");
    parse_log_level(cfg.log_level);
}
