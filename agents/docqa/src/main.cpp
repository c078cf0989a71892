#include "../include/rag.hpp"
#include "../include/chat.hpp"
#include "../include/config.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <iostream>
#include <optional>

static void usage() {
    std::cerr << "docqa_cli usage:\n"
              << "  reindex [--force]\n"
              << "  clear\n"
              << "  ask --question \"...\" [--top-k N]\n"
              << "  page --doc <path|name> --page N [--mode raw|explain|translate]\n"
              << "  status\n"
              << "  chat\n"
              << "common flags: [--config <file.json>] [--dir <folder>] [--db <dbfile>] [--ollama <url>]\n"
              << "              [--embed-model <name>] [--llm <name>]\n";
}

struct CliArgs {
    std::string cmd;
    std::optional<std::string> config_path;
    bool force{false};
    std::string question;
    std::string doc;
    int page{0};
    std::string mode{"raw"};
    int top_k{0};
    std::string dir, db, ollama, embed_model, llm_model;
};

static bool parse_args(int argc, char** argv, CliArgs& a) {
    if (argc < 2) return false;
    a.cmd = argv[1];
    for (int i = 2; i < argc; ++i) {
        std::string s = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("missing value for " + s);
            return argv[++i];
        };
        if (s == "--config") a.config_path = next();
        else if (s == "--force") a.force = true;
        else if (s == "--question") a.question = next();
        else if (s == "--doc") a.doc = next();
        else if (s == "--page") a.page = std::stoi(next());
        else if (s == "--mode") a.mode = next();
        else if (s == "--top-k") a.top_k = std::stoi(next());
        else if (s == "--dir") a.dir = next();
        else if (s == "--db") a.db = next();
        else if (s == "--ollama") a.ollama = next();
        else if (s == "--embed-model") a.embed_model = next();
        else if (s == "--llm") a.llm_model = next();
        else throw std::invalid_argument("unknown flag " + s);
    }
    return true;
}

int main(int argc, char** argv) {
    CliArgs a;
    try {
        if (!parse_args(argc, argv, a)) { usage(); return 2; }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        usage();
        return 2;
    }

    try {
        DocQaConfig cfg = load_config(a.config_path);
        if (!a.dir.empty()) cfg.index.data_dir = a.dir;
        if (!a.db.empty()) cfg.index.db_path = a.db;
        if (!a.ollama.empty()) { cfg.embed.ollama_url = a.ollama; cfg.llm.ollama_url = a.ollama; }
        if (!a.embed_model.empty()) cfg.embed.embed_model = a.embed_model;
        if (!a.llm_model.empty()) cfg.llm.llm_model = a.llm_model;
        if (a.top_k > 0) cfg.retrieval.top_k = a.top_k;
        validate_config(cfg);
        set_log_level(parse_log_level(cfg.log_level));

        if (a.cmd == "ask" && a.question.empty()) { usage(); return 2; }
        if (a.cmd == "page" && (a.doc.empty() || a.page == 0)) { usage(); return 2; }

        DocQaService svc(cfg, default_collaborators(cfg));
        if (a.cmd == "reindex") {
            print_report(std::cout, svc.reindex(a.force));
            return 0;
        } else if (a.cmd == "clear") {
            svc.clear();
            std::cout << "[OK] Index cleared.\n";
            return 0;
        } else if (a.cmd == "ask") {
            print_answer(std::cout, svc.answer(a.question));
            return 0;
        } else if (a.cmd == "page") {
            print_page(std::cout, svc.inspect_page(a.doc, a.page, parse_page_mode(a.mode)));
            return 0;
        } else if (a.cmd == "status") {
            auto s = svc.status();
            std::cout << "documents: " << s.documents << "\nchunks: " << s.chunks << "\ndimension: "
                      << s.dimension << "\nembed model: " << (s.embed_model.empty() ? "-" : s.embed_model)
                      << "\ndata dir: " << cfg.index.data_dir << "\ndb: " << cfg.index.db_path << "\n";
            return 0;
        } else if (a.cmd == "chat") {
            return run_chat(svc, std::cin, std::cout, std::cerr);
        } else {
            usage();
            return 2;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
