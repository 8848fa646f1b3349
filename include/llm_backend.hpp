#pragma once

#include "cancellation.hpp"
#include "curl_request.hpp"
#include "prompt_composer.hpp"
#include <chrono>
#include <functional>
#include <iosfwd>
#include <random>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

// Remote text generation: turns a composed request into raw candidate text.
class Generator {
public:
    virtual ~Generator() = default;
    virtual std::string generate(const GenerationRequest& request) = 0;
};

struct RetryPolicy {
    int max_attempts = 4;
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{16000};
    // Fraction of each delay that may be shaved off at random.
    double jitter = 0.25;
    // Covers every attempt and every backoff delay.
    std::chrono::milliseconds total_timeout{120000};

    // random_fraction is in [0, 1).
    std::chrono::milliseconds backoff_delay(int attempt, double random_fraction) const;
};

// OpenAI-compatible chat completions client with retry, backoff and a total
// deadline. Attempts are strictly sequential and resend the same body.
class OpenAIBackend : public Generator {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    OpenAIBackend(std::string api_key, std::string api_base, HttpTransport& transport, const CancellationToken& cancel,
                  RetryPolicy policy = RetryPolicy());

    std::string generate(const GenerationRequest& request) override;

    void set_temperature(double temperature) { temperature_ = temperature; }
    // Replaces the interruptible sleep used between attempts. Unset by default.
    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    void set_diagnostics(std::ostream* out) { diagnostics_ = out; }

    nlohmann::json build_payload(const GenerationRequest& request) const;

private:
    std::string api_key;
    std::string api_base;
    HttpTransport& transport_;
    const CancellationToken& cancel_;
    RetryPolicy policy_;
    double temperature_ = 0.2;
    Sleeper sleeper_;
    std::ostream* diagnostics_ = nullptr;
    std::mt19937 rng_;

    void validate_api_key() const;
    std::string handle_chat_response(const HttpResponse& response) const;
    void interruptible_sleep(std::chrono::milliseconds delay) const;
};
