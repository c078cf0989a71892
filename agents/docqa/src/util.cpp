#include "../include/util.hpp"
#include <openssl/evp.h>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <unordered_set>
#include <mutex>
#include <cmath>
#include <cctype>
#include <stdexcept>

static std::atomic<int> g_log_level{static_cast<int>(LogLevel::Info)};
static std::mutex g_log_mtx;

namespace {
struct DigestCtx {
    EVP_MD_CTX* ctx{nullptr};
    DigestCtx() {
        ctx = EVP_MD_CTX_new();
        if (!ctx || EVP_DigestInit_ex(ctx, EVP_sha1(), nullptr) != 1) {
            if (ctx) EVP_MD_CTX_free(ctx);
            throw std::runtime_error("EVP sha1 init failed");
        }
    }
    ~DigestCtx() { EVP_MD_CTX_free(ctx); }
    void update(const void* data, size_t n) {
        if (EVP_DigestUpdate(ctx, data, n) != 1) throw std::runtime_error("EVP sha1 update failed");
    }
    std::string hex() {
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx, md, &len) != 1) throw std::runtime_error("EVP sha1 final failed");
        std::ostringstream oss;
        for (unsigned int i = 0; i < len; ++i) {
            oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
        }
        return oss.str();
    }
};
}

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return (v && *v) ? std::string(v) : def;
}

std::string sha1_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open " + p.string());
    DigestCtx d;
    char buf[1 << 16];
    while (f) {
        f.read(buf, sizeof(buf));
        std::streamsize n = f.gcount();
        if (n > 0) d.update(buf, (size_t)n);
    }
    if (f.bad()) throw std::runtime_error("read error on " + p.string());
    return d.hex();
}

std::string sha1_hex(const std::string& data) {
    DigestCtx d;
    d.update(data.data(), data.size());
    return d.hex();
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c) != 0; });
}

// Regular files directly under root whose lowercase extension is listed.
std::vector<std::filesystem::path> list_files(const std::filesystem::path& root,
                                              const std::vector<std::string>& exts) {
    std::vector<std::filesystem::path> out;
    std::unordered_set<std::string> extset;
    for (auto& e : exts) extset.insert(to_lower(e));
    std::error_code ec;
    for (auto& entry : std::filesystem::directory_iterator(root, ec)) {
        std::error_code fec;
        if (!entry.is_regular_file(fec)) continue;
        auto ext = to_lower(entry.path().extension().string());
        if (extset.count(ext)) out.push_back(entry.path());
    }
    if (ec) throw std::runtime_error("cannot list " + root.string() + ": " + ec.message());
    std::sort(out.begin(), out.end());
    return out;
}

float dot_product(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0f;
    double dot = 0.0;
    for (size_t i = 0; i < a.size(); ++i) dot += (double)a[i] * (double)b[i];
    return (float)dot;
}

void normalize(std::vector<float>& v) {
    double n = 0.0;
    for (float x : v) n += (double)x * (double)x;
    if (n == 0.0) return;
    double inv = 1.0 / std::sqrt(n);
    for (auto& x : v) x = (float)(x * inv);
}

void set_log_level(LogLevel level) {
    g_log_level.store(static_cast<int>(level));
}

LogLevel parse_log_level(const std::string& name) {
    auto n = to_lower(name);
    if (n == "debug") return LogLevel::Debug;
    if (n == "info") return LogLevel::Info;
    if (n == "warn" || n == "warning") return LogLevel::Warn;
    if (n == "error") return LogLevel::Error;
    throw std::invalid_argument("unknown log level: " + name);
}

bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= g_log_level.load();
}

void log_line(LogLevel level, const std::string& tag, const std::string& msg) {
    if (!log_enabled(level)) return;
    std::lock_guard<std::mutex> lock(g_log_mtx);
    if (level == LogLevel::Error) {
        std::cerr << "[ERROR] [" << tag << "] " << msg << "\n";
    } else if (level == LogLevel::Warn) {
        std::cerr << "[WARN] [" << tag << "] " << msg << "\n";
    } else {
        std::cerr << "[" << tag << "] " << msg << "\n";
    }
}
