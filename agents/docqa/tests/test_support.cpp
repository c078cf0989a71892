#include "test_support.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <cctype>
#include <cstdint>
#include <chrono>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

TempDir::TempDir() {
    std::random_device rd;
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    for (int i = 0; i < 16; ++i) {
        auto name = "docqa-test-" + std::to_string(stamp) + "-" + std::to_string(rd());
        auto p = fs::temp_directory_path() / name;
        if (fs::create_directory(p)) {
            path_ = p;
            return;
        }
    }
    throw std::runtime_error("cannot create a temp directory");
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void write_file(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("cannot write " + p.string());
    f << content;
}

fs::path write_doc(const fs::path& dir, const std::string& name, const std::vector<std::string>& pages) {
    std::string body;
    for (size_t i = 0; i < pages.size(); ++i) {
        if (i) body += '\f';
        body += pages[i];
    }
    auto p = dir / name;
    write_file(p, body);
    return p;
}

RetryPolicy fast_retry(int max_attempts) {
    RetryPolicy r;
    r.max_attempts = max_attempts;
    r.initial_backoff_ms = 1;
    r.max_backoff_ms = 2;
    r.multiplier = 2.0;
    return r;
}

std::vector<std::string> FormFeedExtractor::extract_pages(const fs::path& path) {
    ++calls;
    if (failing.count(path.filename().string())) throw SourceReadError(path.string(), "unreadable test file");
    std::ifstream f(path, std::ios::binary);
    if (!f) throw SourceReadError(path.string(), "cannot open");
    std::ostringstream ss;
    ss << f.rdbuf();
    return split_pages(ss.str());
}

std::vector<float> BagOfWordsEmbedder::vectorize(const std::string& text) {
    std::vector<float> v(kDim, 0.0f);
    std::string word;
    auto flush = [&] {
        if (word.empty()) return;
        uint32_t h = 2166136261u;
        for (unsigned char c : word) {
            h ^= c;
            h *= 16777619u;
        }
        v[h % kDim] += 1.0f;
        word.clear();
    };
    for (unsigned char c : text) {
        if (std::isalnum(c)) word += (char)std::tolower(c);
        else flush();
    }
    flush();
    return v;
}

std::vector<std::vector<float>> BagOfWordsEmbedder::embed(const std::vector<std::string>& texts) {
    ++calls;
    if (on_embed) on_embed();
    if (transient_failures.load() > 0) {
        --transient_failures;
        throw EmbeddingTransientError("simulated timeout");
    }
    std::vector<std::vector<float>> out;
    for (const auto& t : texts) {
        if (!permanent_marker.empty() && t.find(permanent_marker) != std::string::npos) {
            throw EmbeddingPermanentError("simulated rejection");
        }
        out.push_back(vectorize(t));
    }
    return out;
}

std::string BagOfWordsEmbedder::model_id() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return model_;
}

void BagOfWordsEmbedder::set_model(const std::string& m) {
    std::lock_guard<std::mutex> lock(mtx_);
    model_ = m;
}

std::string RecordingGenerator::generate(const GenerationRequest& req) {
    std::lock_guard<std::mutex> lock(mtx_);
    requests_.push_back(req);
    if (transient_failures.load() > 0) {
        --transient_failures;
        throw GenerationTransientError("simulated overload");
    }
    return reply_prefix + req.prompt;
}

std::vector<GenerationRequest> RecordingGenerator::requests() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return requests_;
}

size_t RecordingGenerator::call_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return requests_.size();
}

DocQaConfig test_config(const TempDir& dir) {
    DocQaConfig cfg;
    cfg.index.data_dir = (dir / "docs").string();
    cfg.index.db_path = (dir / "db" / "docqa.db").string();
    cfg.retry = fast_retry();
    cfg.log_level = "error";
    set_log_level(LogLevel::Error);
    fs::create_directories(dir / "docs");
    return cfg;
}
