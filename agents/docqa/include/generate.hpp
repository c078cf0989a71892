#pragma once
#include "config.hpp"
#include "http.hpp"
#include <string>
#include <vector>

struct ChatTurn {
    std::string role; // "user" | "assistant"
    std::string content;
};

struct GenerationRequest {
    std::string instruction;
    std::string context;
    std::vector<ChatTurn> history;
    std::string prompt;
};

// External generation collaborator.
class GenerationClient {
public:
    virtual ~GenerationClient() = default;
    // Throws GenerationTransientError or GenerationPermanentError.
    virtual std::string generate(const GenerationRequest& req) = 0;
};

class OllamaChatClient : public GenerationClient {
public:
    explicit OllamaChatClient(LlmConfig cfg);
    std::string generate(const GenerationRequest& req) override;

private:
    LlmConfig cfg_;
};

// Reply text of an /api/chat response; throws the transient or permanent error it stands for.
std::string parse_chat_response(const HttpResponse& r);
