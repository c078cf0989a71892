#include "../include/source.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <cstdio>
#include <chrono>
#include <algorithm>

namespace fs = std::filesystem;

namespace {
struct Pipe {
    FILE* f{nullptr};
    explicit Pipe(const std::string& cmd) { f = popen(cmd.c_str(), "r"); }
    ~Pipe() { if (f) pclose(f); }
    int close() {
        int rc = pclose(f);
        f = nullptr;
        return rc;
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
};
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::vector<std::string> split_pages(const std::string& text) {
    std::vector<std::string> pages;
    size_t pos = 0;
    while (true) {
        size_t ff = text.find('\f', pos);
        if (ff == std::string::npos) {
            // A converter terminates the last page with \f; nothing follows it.
            if (pos < text.size() || pages.empty()) pages.push_back(text.substr(pos));
            break;
        }
        pages.push_back(text.substr(pos, ff - pos));
        pos = ff + 1;
    }
    return pages;
}

CommandTextExtractor::CommandTextExtractor(ExtractorConfig cfg) : cfg_(std::move(cfg)) {}

std::vector<std::string> CommandTextExtractor::extract_pages(const fs::path& path) {
    auto ext = to_lower(path.extension().string());
    auto it = cfg_.commands.find(ext);
    if (it == cfg_.commands.end()) throw SourceReadError(path.string(), "no extractor for " + ext);

    std::string cmd = it->second;
    auto at = cmd.find("{path}");
    if (at == std::string::npos) throw SourceReadError(path.string(), "extractor command lacks {path}");
    cmd.replace(at, 6, shell_quote(path.string()));

    log_line(LogLevel::Debug, "source", "running: " + cmd);
    Pipe pipe(cmd);
    if (!pipe.f) throw SourceReadError(path.string(), "cannot start extractor");
    std::string out;
    char buf[1 << 14];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), pipe.f)) > 0) out.append(buf, n);
    int rc = pipe.close();
    if (rc != 0) throw SourceReadError(path.string(), "extractor exited with status " + std::to_string(rc));
    return split_pages(out);
}

DocumentSource::DocumentSource(const fs::path& root, std::vector<std::string> exts,
                               std::shared_ptr<TextExtractor> extractor)
    : root_(fs::absolute(root).lexically_normal()), exts_(std::move(exts)), extractor_(std::move(extractor)) {
    if (!extractor_) throw std::invalid_argument("DocumentSource requires a text extractor");
}

DocumentInfo DocumentSource::describe(const fs::path& p) const {
    DocumentInfo d;
    d.id = fs::absolute(p).lexically_normal().string();
    d.filename = p.filename().string();
    d.content_hash = sha1_file(p);
    auto t = fs::last_write_time(p);
    d.mtime = std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
    return d;
}

ScanResult DocumentSource::scan() const {
    ScanResult res;
    if (!fs::is_directory(root_)) {
        throw SourceReadError(root_.string(), "watched folder does not exist");
    }
    for (auto& p : list_files(root_, exts_)) {
        try {
            res.documents.push_back(describe(p));
        } catch (const std::exception& e) {
            log_line(LogLevel::Warn, "source", "skipping " + p.string() + ": " + e.what());
            res.unreadable.push_back(fs::absolute(p).lexically_normal().string());
        }
    }
    std::sort(res.documents.begin(), res.documents.end(),
              [](const DocumentInfo& a, const DocumentInfo& b){ return a.id < b.id; });
    return res;
}

std::vector<Page> DocumentSource::pages(const DocumentInfo& doc) {
    {
        std::lock_guard<std::mutex> lock(cache_mtx_);
        auto it = cache_.find(doc.id);
        if (it != cache_.end() && it->second.content_hash == doc.content_hash) return it->second.pages;
    }

    std::vector<std::string> texts;
    try {
        texts = extractor_->extract_pages(fs::path(doc.id));
    } catch (const SourceReadError&) {
        throw;
    } catch (const std::exception& e) {
        throw SourceReadError(doc.id, e.what());
    }
    std::vector<Page> pages;
    pages.reserve(texts.size());
    for (size_t i = 0; i < texts.size(); ++i) pages.push_back({(int)i + 1, std::move(texts[i])});

    std::lock_guard<std::mutex> lock(cache_mtx_);
    if (!cache_.count(doc.id)) {
        if (cache_order_.size() >= kCacheDocs) {
            cache_.erase(cache_order_.front());
            cache_order_.pop_front();
        }
        cache_order_.push_back(doc.id);
    }
    cache_[doc.id] = CachedPages{doc.content_hash, pages};
    return pages;
}

DocumentInfo DocumentSource::resolve(const std::string& id_or_name) const {
    if (!fs::is_directory(root_)) {
        throw SourceReadError(root_.string(), "watched folder does not exist");
    }
    auto wanted = fs::path(id_or_name);
    const bool by_path = wanted.is_absolute();
    const std::string id = by_path ? wanted.lexically_normal().string() : std::string();

    std::vector<fs::path> matches;
    for (auto& p : list_files(root_, exts_)) {
        bool hit = by_path ? fs::absolute(p).lexically_normal().string() == id
                           : p.filename().string() == id_or_name;
        if (hit) matches.push_back(p);
    }
    if (matches.empty()) throw DocumentNotFound("document not found: " + id_or_name);
    if (matches.size() > 1) throw DocumentNotFound("document name is ambiguous: " + id_or_name);
    // only the match is hashed
    try {
        return describe(matches.front());
    } catch (const std::exception& e) {
        throw SourceReadError(matches.front().string(), e.what());
    }
}
