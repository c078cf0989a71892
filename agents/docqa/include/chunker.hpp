#pragma once
#include <string>
#include <vector>

struct Chunk {
    std::string id;
    std::string document_id;
    int page{0};
    size_t start{0}; // byte offsets into the page text, [start, end)
    size_t end{0};
    std::string text;
};

struct ChunkSpan {
    size_t start{0};
    size_t end{0};
};

// Splits text into left-to-right spans of at most max_size bytes; consecutive spans
// share overlap bytes (a little more when a UTF-8 sequence straddles the boundary).
// Blank text yields no spans.
std::vector<ChunkSpan> split_spans(const std::string& text, int max_size, int overlap);

std::string make_chunk_id(const std::string& document_id, const std::string& content_hash,
                          int page, size_t start);

std::vector<Chunk> chunk_page(const std::string& document_id, const std::string& content_hash,
                              int page, const std::string& text, int max_size, int overlap);
