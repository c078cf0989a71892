#include "../include/chat.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <cctype>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <vector>

static std::string display_name(const std::string& doc_id) {
    return std::filesystem::path(doc_id).filename().string();
}

static bool is_page_number(const std::string& s) {
    if (s.empty() || s.size() > 9) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}

void print_answer(std::ostream& out, const Answer& ans) {
    out << "\n==== Answer ====\n\n" << ans.text << "\n\n";
    if (ans.status == AnswerStatus::NoGrounding) return;
    out << "==== Sources ====\n";
    int i = 1;
    for (auto& c : ans.citations) {
        out << "[" << i++ << "] " << display_name(c.document_id) << " (Page " << c.page << ") - "
            << c.document_id << "\n";
    }
}

void print_page(std::ostream& out, const PageInspection& p) {
    out << "\n==== " << display_name(p.document_id) << " page " << p.page << "/" << p.page_count
        << " ====\n\n" << p.raw << "\n";
    if (p.transformed) out << "\n==== AI output ====\n\n" << *p.transformed << "\n";
}

void print_report(std::ostream& out, const ReindexReport& r) {
    out << "[OK] Reindex" << (r.forced ? " (forced)" : "") << ": " << r.added.size() << " added, "
        << r.changed.size() << " changed, " << r.removed.size() << " removed, " << r.unchanged.size()
        << " unchanged, " << r.skipped.size() << " skipped, " << r.chunks_written << " chunks written\n";
    for (auto& f : r.failed) out << "[FAILED] " << f.document_id << ": " << f.reason << "\n";
    if (r.cancelled) out << "[CANCELLED] " << r.not_reached.size() << " documents not reached\n";
}

// page <doc> <n> [<n> ...] [mode]
static void chat_page_command(DocQaService& svc, std::istringstream& in, std::ostream& out, std::ostream& err) {
    std::string doc, word, mode;
    std::vector<int> pages;
    in >> doc;
    while (in >> word) {
        if (!mode.empty()) {
            pages.clear();
            break;
        }
        if (is_page_number(word)) pages.push_back(std::stoi(word));
        else mode = word;
    }
    if (doc.empty() || pages.empty()) {
        out << "usage: page <doc> <n> [<n> ...] [explain|translate]\n";
        return;
    }
    auto m = parse_page_mode(mode);
    for (int n : pages) {
        try {
            print_page(out, svc.inspect_page(doc, n, m));
        } catch (const PageOutOfRange& e) {
            err << "[ERROR] " << e.what() << "\n";
        }
    }
}

int run_chat(DocQaService& svc, std::istream& in, std::ostream& out, std::ostream& err) {
    std::vector<ChatTurn> history;
    out << "\n=== DocQA ready (type 'exit' to quit) ===\n"
        << "  - ask a question\n"
        << "  - 'page <doc> <n> [<n> ...]' to view raw page text\n"
        << "  - 'page <doc> <n> explain|translate' to have the page explained or translated\n"
        << "  - 'reindex' to pick up changed documents\n"
        << "  - 'clear' to empty the index\n\n";
    std::string line;
    while (out << "> " << std::flush, std::getline(in, line)) {
        auto text = trim(line);
        if (text.empty()) continue;
        auto lower = to_lower(text);
        if (lower == "exit" || lower == "quit" || lower == "q") break;
        try {
            std::istringstream words(text);
            std::string word;
            words >> word;
            if (to_lower(word) == "page") {
                chat_page_command(svc, words, out, err);
            } else if (lower == "reindex") {
                print_report(out, svc.reindex(false));
            } else if (lower == "clear" || lower == "clear_db" || lower == "reset_db" || lower == "clean_db") {
                svc.clear();
                out << "[OK] Index cleared. Run 'reindex' to rebuild it.\n";
            } else {
                auto ans = svc.answer(text, history);
                print_answer(out, ans);
                history.push_back({"user", text});
                history.push_back({"assistant", ans.text});
            }
        } catch (const TransientError& e) {
            err << "[ERROR] " << e.what() << " (temporary, try again)\n";
        } catch (const std::exception& e) {
            err << "[ERROR] " << e.what() << "\n";
        }
    }
    return 0;
}
