#pragma once
#include <stdexcept>
#include <string>

// Base of every error raised by the core.
class DocQaError : public std::runtime_error {
public:
    explicit DocQaError(const std::string& msg) : std::runtime_error(msg) {}
};

// Retrying the same call later may succeed.
class TransientError : public DocQaError {
public:
    explicit TransientError(const std::string& msg) : DocQaError(msg) {}
};

class SourceReadError : public DocQaError {
public:
    SourceReadError(const std::string& path, const std::string& why)
        : DocQaError("cannot read " + path + ": " + why), path_(path) {}
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class EmbeddingTransientError : public TransientError {
public:
    explicit EmbeddingTransientError(const std::string& msg) : TransientError("embedding: " + msg) {}
};

class EmbeddingPermanentError : public DocQaError {
public:
    explicit EmbeddingPermanentError(const std::string& msg) : DocQaError("embedding: " + msg) {}
};

class GenerationTransientError : public TransientError {
public:
    explicit GenerationTransientError(const std::string& msg) : TransientError("generation: " + msg) {}
};

class GenerationPermanentError : public DocQaError {
public:
    explicit GenerationPermanentError(const std::string& msg) : DocQaError("generation: " + msg) {}
};

class IndexCorruption : public DocQaError {
public:
    explicit IndexCorruption(const std::string& msg)
        : DocQaError("index corrupted: " + msg + " (run a forced reindex to rebuild)") {}
};

class DocumentNotFound : public DocQaError {
public:
    explicit DocumentNotFound(const std::string& msg) : DocQaError(msg) {}
};

class PageOutOfRange : public DocQaError {
public:
    PageOutOfRange(const std::string& doc, int page, int page_count)
        : DocQaError("page " + std::to_string(page) + " out of range for " + doc +
                     " (1.." + std::to_string(page_count) + ")"),
          page_(page), page_count_(page_count) {}
    int page() const { return page_; }
    int page_count() const { return page_count_; }

private:
    int page_;
    int page_count_;
};

class ReindexInProgress : public DocQaError {
public:
    ReindexInProgress() : DocQaError("reindex in progress") {}
};

class OperationCancelled : public DocQaError {
public:
    OperationCancelled() : DocQaError("operation cancelled") {}
};
