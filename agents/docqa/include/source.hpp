#pragma once
#include "config.hpp"
#include <string>
#include <vector>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <cstdint>
#include <filesystem>

struct Page {
    int number{0}; // 1-based
    std::string text;
};

struct DocumentInfo {
    std::string id; // absolute path
    std::string filename;
    std::string content_hash;
    std::int64_t mtime{0}; // seconds on the filesystem clock
};

// External text extraction collaborator.
class TextExtractor {
public:
    virtual ~TextExtractor() = default;
    // Page texts in order. Throws SourceReadError.
    virtual std::vector<std::string> extract_pages(const std::filesystem::path& path) = 0;
};

// Runs an external converter per extension and splits its stdout on form feeds.
class CommandTextExtractor : public TextExtractor {
public:
    explicit CommandTextExtractor(ExtractorConfig cfg);
    std::vector<std::string> extract_pages(const std::filesystem::path& path) override;

private:
    ExtractorConfig cfg_;
};

std::string shell_quote(const std::string& s);
std::vector<std::string> split_pages(const std::string& text);

struct ScanResult {
    std::vector<DocumentInfo> documents; // sorted by id
    std::vector<std::string> unreadable; // ids whose content could not be hashed
};

class DocumentSource {
public:
    DocumentSource(const std::filesystem::path& root, std::vector<std::string> exts,
                   std::shared_ptr<TextExtractor> extractor);

    ScanResult scan() const;

    // Extracted pages of doc, cached by content hash. Throws SourceReadError.
    std::vector<Page> pages(const DocumentInfo& doc);

    // Accepts an absolute path or, when unique in the folder, a bare file name.
    DocumentInfo resolve(const std::string& id_or_name) const;

    const std::filesystem::path& root() const { return root_; }

private:
    DocumentInfo describe(const std::filesystem::path& p) const;

    static constexpr size_t kCacheDocs = 16;

    std::filesystem::path root_;
    std::vector<std::string> exts_;
    std::shared_ptr<TextExtractor> extractor_;

    struct CachedPages {
        std::string content_hash;
        std::vector<Page> pages;
    };
    std::mutex cache_mtx_;
    std::map<std::string, CachedPages> cache_;
    std::deque<std::string> cache_order_;
};
