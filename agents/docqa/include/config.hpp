#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>

struct EmbedConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string embed_model{"all-minilm"};
    int timeout_ms{120000};
};

struct LlmConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string llm_model{"gemma3:4b"};
    int timeout_ms{240000};
    std::string translate_language{"Traditional Chinese (\xE7\xB9\x81\xE9\xAB\x94\xE4\xB8\xAD\xE6\x96\x87)"};
};

// Bounded retry with exponential backoff for collaborator calls.
struct RetryPolicy {
    int max_attempts{4};
    int initial_backoff_ms{500};
    int max_backoff_ms{8000};
    double multiplier{2.0};
};

struct IndexOptions {
    std::string data_dir{"./rag_data"};
    std::string db_path{"./rag_data/docqa.db"};
    std::vector<std::string> exts{".pdf", ".docx"};
    int chunk_chars{1000};
    int chunk_overlap{200};
    int embed_batch{16};
};

struct RetrievalOptions {
    int top_k{3};
    int context_chars{6000};
    float min_score{-1.0f}; // cosine floor; -1 keeps every hit
};

struct ExtractorConfig {
    // {path} is replaced with the shell-quoted file path.
    std::map<std::string, std::string> commands{
        {".pdf", "pdftotext -layout -enc UTF-8 {path} -"},
        {".docx", "docx2txt {path} -"},
    };
};

struct DocQaConfig {
    EmbedConfig embed;
    LlmConfig llm;
    RetryPolicy retry;
    IndexOptions index;
    RetrievalOptions retrieval;
    ExtractorConfig extractor;
    std::string log_level{"info"};
};

// Defaults, then the optional JSON file, then environment variables.
DocQaConfig load_config(const std::optional<std::string>& json_path);
void apply_json_config(DocQaConfig& cfg, const std::string& json_text);
void apply_env_config(DocQaConfig& cfg);
// Throws std::invalid_argument describing the first bad setting.
void validate_config(const DocQaConfig& cfg);
