#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include <atomic>

std::string getenv_or(const char* key, const std::string& def);
std::string sha1_file(const std::filesystem::path& p);
std::string sha1_hex(const std::string& data);
std::vector<std::filesystem::path> list_files(const std::filesystem::path& root,
                                              const std::vector<std::string>& exts);
std::string to_lower(std::string s);
std::string trim(const std::string& s);
bool is_blank(const std::string& s);
float dot_product(const std::vector<float>& a, const std::vector<float>& b);
void normalize(std::vector<float>& v);

enum class LogLevel { Debug = 0, Info, Warn, Error };

void set_log_level(LogLevel level);
LogLevel parse_log_level(const std::string& name);
bool log_enabled(LogLevel level);
// Writes "[tag] msg" to stderr when level passes the filter; Warn and Error get a prefix.
void log_line(LogLevel level, const std::string& tag, const std::string& msg);

// Cooperative cancellation flag shared between a caller and a running operation.
class CancelToken {
public:
    void cancel() { flag_.store(true); }
    bool cancelled() const { return flag_.load(); }

private:
    std::atomic<bool> flag_{false};
};

inline bool is_cancelled(const CancelToken* token) {
    return token && token->cancelled();
}
