#include "../include/generate.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

OllamaChatClient::OllamaChatClient(LlmConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.ollama_url.empty() && cfg_.ollama_url.back() == '/') cfg_.ollama_url.pop_back();
}

std::string OllamaChatClient::generate(const GenerationRequest& req) {
    std::string system = req.instruction;
    if (!req.context.empty()) system += "\n\n" + req.context;

    json messages = json::array({json{{"role", "system"}, {"content", system}}});
    for (auto& t : req.history) messages.push_back(json{{"role", t.role}, {"content", t.content}});
    messages.push_back(json{{"role", "user"}, {"content", req.prompt}});

    json body = {
        {"model", cfg_.llm_model},
        {"messages", messages},
        {"stream", false}
    };
    HttpResponse r;
    try {
        r = http_post_json(cfg_.ollama_url + "/api/chat", body.dump(), cfg_.timeout_ms);
    } catch (const HttpTransportError& e) {
        throw GenerationTransientError(e.what());
    }
    return parse_chat_response(r);
}

std::string parse_chat_response(const HttpResponse& r) {
    auto outcome = classify_status(r.status);
    if (outcome != HttpOutcome::Ok) {
        std::string msg = "status " + std::to_string(r.status) + ": " + r.body.substr(0, 200);
        if (outcome == HttpOutcome::Transient) throw GenerationTransientError(msg);
        throw GenerationPermanentError(msg);
    }
    try {
        auto data = json::parse(r.body);
        return data.at("message").at("content").get<std::string>();
    } catch (const json::exception& e) {
        throw GenerationPermanentError(std::string("malformed response: ") + e.what());
    }
}
