#include "llm_backend.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <ostream>
#include <thread>

namespace {

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

const milliseconds SLEEP_SLICE{50};
const std::chrono::seconds MAX_RETRY_AFTER{86400};

bool is_transient(long status) {
    return status == 429 || (status >= 500 && status <= 599);
}

std::optional<milliseconds> parse_retry_after(const HttpResponse& response) {
    auto it = response.headers.find("retry-after");
    if (it == response.headers.end() || it->second.empty()) {
        return std::nullopt;
    }
    const std::string& value = it->second;
    if (!std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    // Capped at a day before converting; the caller caps it again at max_backoff.
    if (value.size() > 9) {
        return std::chrono::duration_cast<milliseconds>(MAX_RETRY_AFTER);
    }
    std::chrono::seconds seconds(std::stoll(value));
    return std::chrono::duration_cast<milliseconds>(std::min(seconds, MAX_RETRY_AFTER));
}

std::string api_error_message(const std::string& body) {
    try {
        nlohmann::json j = nlohmann::json::parse(body);
        if (j.contains("error") && j["error"].is_object() && j["error"].contains("message") &&
            j["error"]["message"].is_string()) {
            return j["error"]["message"].get<std::string>();
        }
    } catch (const nlohmann::json::exception&) {
        // not JSON, no detail to report
    }
    return "";
}

std::string timeout_message(milliseconds budget, const std::string& last_failure) {
    std::string msg = "Generation did not finish within " + std::to_string(budget.count()) + "ms";
    if (!last_failure.empty()) {
        msg += " (last failure: " + last_failure + ")";
    }
    return msg;
}

} // namespace

milliseconds RetryPolicy::backoff_delay(int attempt, double random_fraction) const {
    double base = static_cast<double>(initial_backoff.count()) * std::pow(2.0, attempt - 1);
    base = std::min(base, static_cast<double>(max_backoff.count()));
    double delay = base * (1.0 - jitter * random_fraction);
    return milliseconds(static_cast<long long>(delay));
}

OpenAIBackend::OpenAIBackend(std::string api_key, std::string api_base, HttpTransport& transport,
                             const CancellationToken& cancel, RetryPolicy policy)
    : api_key(std::move(api_key)),
      api_base(std::move(api_base)),
      transport_(transport),
      cancel_(cancel),
      policy_(policy),
      rng_(std::random_device{}()) {}

void OpenAIBackend::validate_api_key() const {
    if (api_key.empty()) {
        throw AuthError("API key is empty");
    }
    bool malformed = std::any_of(api_key.begin(), api_key.end(), [](unsigned char c) {
        return std::isspace(c) || std::iscntrl(c);
    });
    if (malformed) {
        throw AuthError("API key is malformed (contains whitespace or control characters)");
    }
}

nlohmann::json OpenAIBackend::build_payload(const GenerationRequest& request) const {
    const ModelConfig& model = model_config(request.model);
    nlohmann::json payload = {
        {"model", model.backend_model},
        {"messages", {
            {{"role", "system"}, {"content", request.instructions}},
            {{"role", "user"}, {"content", request.user_content()}}
        }},
        {"max_tokens", model.max_output_tokens}
    };
    if (temperature_ >= 0.0) {
        payload["temperature"] = temperature_;
    }
    return payload;
}

std::string OpenAIBackend::generate(const GenerationRequest& request) {
    validate_api_key();

    HttpRequest http_request;
    http_request.url = api_base + "/chat/completions";
    http_request.headers = {"Authorization: Bearer " + api_key, "Content-Type: application/json"};
    http_request.body = build_payload(request).dump();

    const auto deadline = Clock::now() + policy_.total_timeout;
    std::uniform_real_distribution<double> fraction(0.0, 1.0);
    long last_status = 0;
    std::string last_failure;

    for (int attempt = 1;; ++attempt) {
        if (cancel_.cancelled()) {
            throw CancelledError();
        }
        auto remaining = std::chrono::duration_cast<milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            throw TimeoutError(timeout_message(policy_.total_timeout, last_failure));
        }

        std::optional<milliseconds> retry_after;
        try {
            HttpResponse response = transport_.post(http_request, remaining);
            if (response.status >= 200 && response.status <= 299) {
                return handle_chat_response(response);
            }
            if (response.status == 401 || response.status == 403) {
                throw AuthError("The service refused the API key (HTTP " + std::to_string(response.status) + ")");
            }
            if (!is_transient(response.status)) {
                std::string detail = api_error_message(response.body);
                throw RequestRejectedError("Request rejected (HTTP " + std::to_string(response.status) + ")" +
                                           (detail.empty() ? "" : ": " + detail), response.body);
            }
            last_status = response.status;
            last_failure = "HTTP " + std::to_string(response.status);
            if (response.status == 429) {
                retry_after = parse_retry_after(response);
            }
        } catch (const TransportError& e) {
            if (e.timed_out()) {
                throw TimeoutError(timeout_message(policy_.total_timeout, last_failure));
            }
            last_status = 0;
            last_failure = e.what();
        }

        if (attempt >= policy_.max_attempts) {
            throw TransientServiceError("Service unavailable after " + std::to_string(attempt) +
                                        " attempts (last failure: " + last_failure + ")", last_status);
        }

        milliseconds delay = retry_after ? std::min(*retry_after, policy_.max_backoff)
                                         : policy_.backoff_delay(attempt, fraction(rng_));
        if (Clock::now() + delay >= deadline) {
            throw TimeoutError(timeout_message(policy_.total_timeout, last_failure));
        }
        if (diagnostics_) {
            *diagnostics_ << "Attempt " << attempt << " failed (" << last_failure << "), retrying in "
                          << delay.count() << "ms" << std::endl;
        }
        if (sleeper_) {
            sleeper_(delay);
        } else {
            interruptible_sleep(delay);
        }
    }
}

std::string OpenAIBackend::handle_chat_response(const HttpResponse& response) const {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::exception& e) {
        throw MalformedResponseError("Response is not valid JSON: " + std::string(e.what()), response.body);
    }
    if (j.contains("error") && !j["error"].is_null()) {
        std::string detail = api_error_message(response.body);
        throw RequestRejectedError("API error" + (detail.empty() ? "" : ": " + detail), response.body);
    }
    // OpenAI format
    if (j.contains("choices") && j["choices"].is_array() && !j["choices"].empty()) {
        const auto& choice = j["choices"][0];
        if (choice.is_object() && choice.contains("message") && choice["message"].is_object()) {
            const auto& message = choice["message"];
            if (message.contains("content") && message["content"].is_string()) {
                return message["content"].get<std::string>();
            }
        }
    }
    // Anthropic format
    else if (j.contains("content") && j["content"].is_array() && !j["content"].empty()) {
        const auto& block = j["content"][0];
        if (block.is_object() && block.contains("text") && block["text"].is_string()) {
            return block["text"].get<std::string>();
        }
    }
    throw MalformedResponseError("Response has no generated text", response.body);
}

void OpenAIBackend::interruptible_sleep(milliseconds delay) const {
    const auto until = Clock::now() + delay;
    while (Clock::now() < until) {
        if (cancel_.cancelled()) {
            throw CancelledError();
        }
        auto left = std::chrono::duration_cast<milliseconds>(until - Clock::now());
        std::this_thread::sleep_for(std::min(left, SLEEP_SLICE));
    }
    if (cancel_.cancelled()) {
        throw CancelledError();
    }
}
