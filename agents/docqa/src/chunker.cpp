#include "../include/chunker.hpp"
#include "../include/util.hpp"
#include <stdexcept>
#include <cctype>

static bool is_continuation(const std::string& s, size_t i) {
    return i < s.size() && (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80;
}

// Moves pos back onto the first byte of a UTF-8 sequence, but never to or below floor.
static size_t snap_back(const std::string& s, size_t pos, size_t floor) {
    size_t p = pos;
    while (p > floor && is_continuation(s, p)) --p;
    return p > floor ? p : pos;
}

static bool space_at(const std::string& s, size_t i) {
    return std::isspace(static_cast<unsigned char>(s[i])) != 0;
}

// Best split in (floor, limit]: after a paragraph break, then after a sentence end,
// then after any whitespace, else a hard split at limit.
static size_t find_split(const std::string& s, size_t floor, size_t limit) {
    for (size_t i = limit; i > floor + 1; --i) {
        if (s[i - 1] == '\n' && s[i - 2] == '\n') return i;
    }
    for (size_t i = limit; i > floor + 1; --i) {
        char p = s[i - 2];
        if ((p == '.' || p == '!' || p == '?') && space_at(s, i - 1)) return i;
    }
    for (size_t i = limit; i > floor; --i) {
        if (space_at(s, i - 1)) return i;
    }
    return snap_back(s, limit, floor);
}

std::vector<ChunkSpan> split_spans(const std::string& text, int max_size, int overlap) {
    if (max_size <= 0) throw std::invalid_argument("chunk max_size must be positive");
    if (overlap < 0 || overlap >= max_size) throw std::invalid_argument("chunk overlap must be in [0, max_size)");

    std::vector<ChunkSpan> spans;
    if (is_blank(text)) return spans;

    const size_t n = text.size();
    const size_t max = (size_t)max_size;
    const size_t ov = (size_t)overlap;
    size_t start = 0;
    while (true) {
        if (n - start <= max) {
            spans.push_back({start, n});
            break;
        }
        // The split must land past start + overlap so the next chunk starts after this one.
        size_t end = find_split(text, start + ov, start + max);
        spans.push_back({start, end});
        start = snap_back(text, end - ov, start);
    }
    return spans;
}

std::string make_chunk_id(const std::string& document_id, const std::string& content_hash,
                          int page, size_t start) {
    return sha1_hex(document_id + '\n' + content_hash + '\n' + std::to_string(page) + '\n' +
                    std::to_string(start));
}

std::vector<Chunk> chunk_page(const std::string& document_id, const std::string& content_hash,
                              int page, const std::string& text, int max_size, int overlap) {
    std::vector<Chunk> out;
    for (const auto& span : split_spans(text, max_size, overlap)) {
        Chunk c;
        c.id = make_chunk_id(document_id, content_hash, page, span.start);
        c.document_id = document_id;
        c.page = page;
        c.start = span.start;
        c.end = span.end;
        c.text = text.substr(span.start, span.end - span.start);
        out.push_back(std::move(c));
    }
    return out;
}
