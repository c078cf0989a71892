#pragma once
#include "config.hpp"
#include "http.hpp"
#include "util.hpp"
#include <string>
#include <vector>

// External embedding collaborator.
class EmbeddingGateway {
public:
    virtual ~EmbeddingGateway() = default;
    // One vector per input, same order and dimension.
    // Throws EmbeddingTransientError or EmbeddingPermanentError.
    virtual std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) = 0;
    // Vectors from different model ids are not comparable.
    virtual std::string model_id() const = 0;
};

class OllamaEmbeddingGateway : public EmbeddingGateway {
public:
    explicit OllamaEmbeddingGateway(EmbedConfig cfg);
    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override;
    std::string model_id() const override;

private:
    EmbedConfig cfg_;
};

// Maps an /api/embed response to vectors or to the transient/permanent error it stands for.
std::vector<std::vector<float>> parse_embed_response(const HttpResponse& r);

// embed() under the retry policy, plus a shape check of the answer.
std::vector<std::vector<float>> embed_with_retry(EmbeddingGateway& gateway,
                                                 const std::vector<std::string>& texts,
                                                 const RetryPolicy& policy,
                                                 const CancelToken* cancel = nullptr);
