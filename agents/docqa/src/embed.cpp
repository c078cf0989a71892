#include "../include/embed.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/retry.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

OllamaEmbeddingGateway::OllamaEmbeddingGateway(EmbedConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.ollama_url.empty() && cfg_.ollama_url.back() == '/') cfg_.ollama_url.pop_back();
}

std::string OllamaEmbeddingGateway::model_id() const {
    return "ollama:" + cfg_.embed_model;
}

std::vector<std::vector<float>> OllamaEmbeddingGateway::embed(const std::vector<std::string>& texts) {
    if (texts.empty()) return {};
    json body = {
        {"model", cfg_.embed_model},
        {"input", texts}
    };
    HttpResponse r;
    try {
        r = http_post_json(cfg_.ollama_url + "/api/embed", body.dump(), cfg_.timeout_ms);
    } catch (const HttpTransportError& e) {
        throw EmbeddingTransientError(e.what());
    }
    return parse_embed_response(r);
}

std::vector<std::vector<float>> parse_embed_response(const HttpResponse& r) {
    auto outcome = classify_status(r.status);
    if (outcome != HttpOutcome::Ok) {
        std::string msg = "status " + std::to_string(r.status) + ": " + r.body.substr(0, 200);
        if (outcome == HttpOutcome::Transient) throw EmbeddingTransientError(msg);
        throw EmbeddingPermanentError(msg);
    }

    std::vector<std::vector<float>> out;
    try {
        auto data = json::parse(r.body);
        for (auto& row : data.at("embeddings")) out.push_back(row.get<std::vector<float>>());
    } catch (const json::exception& e) {
        throw EmbeddingPermanentError(std::string("malformed response: ") + e.what());
    }
    return out;
}

std::vector<std::vector<float>> embed_with_retry(EmbeddingGateway& gateway,
                                                 const std::vector<std::string>& texts,
                                                 const RetryPolicy& policy,
                                                 const CancelToken* cancel) {
    auto vecs = with_retry(policy, "embed batch of " + std::to_string(texts.size()), cancel,
                           [&]{ return gateway.embed(texts); });
    if (vecs.size() != texts.size()) {
        throw EmbeddingPermanentError("expected " + std::to_string(texts.size()) + " vectors, got " +
                                      std::to_string(vecs.size()));
    }
    for (auto& v : vecs) {
        if (v.empty() || v.size() != vecs.front().size()) {
            throw EmbeddingPermanentError("vectors in one batch differ in dimension");
        }
    }
    return vecs;
}
