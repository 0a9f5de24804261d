#pragma once

#include <authfetch/auth/credential_header_policy.h>
#include <authfetch/core/types.h>
#include <authfetch/http/http_transport.h>
#include <authfetch/http/retry_policy.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace authfetch::http {

// Sleeps for the given delay; returns false when interrupted by the stop token.
using SleepFunction = std::function<bool(std::chrono::duration<double>, std::stop_token)>;

bool interruptibleSleep(std::chrono::duration<double> delay, std::stop_token stop);

struct ExecutorOptions {
    RetryPolicy retry{};
    // URLs longer than this are sent as POST with the query moved into the body.
    std::size_t postUrlLength{2000};
    int maxRedirects{10};
    TransportOptions transport{};
};

struct ExecuteRequest {
    std::string url;
    // Form-encoded body; when set the request is a POST.
    std::optional<std::string> formBody;
    std::vector<Header> headers;
    auth::AuthorizationSpec auth;
};

enum class ExecutionStatus {
    Success,          // 2xx, body delivered to the sink
    PermanentFailure, // 401/403, never retried
    ConsentRequired,  // body recognized as a consent/EULA refusal
    ExhaustedRetries  // every attempt failed transiently
};

const char* executionStatusName(ExecutionStatus status);

struct ExecutionResult {
    ExecutionStatus status{ExecutionStatus::ExhaustedRetries};
    // Final response of the last attempt; absent when that attempt failed in transport.
    std::optional<HttpResponse> response;
    std::optional<Error> lastError;
    int attempts{0};
    // Body bytes delivered to the sink by the successful attempt.
    std::uint64_t bytesWritten{0};
    // URL that was actually requested after any long-URL rewrite.
    std::string requestUrl;
    HttpMethod method{HttpMethod::Get};
};

/**
 * Issues a request with bounded retries, exponential backoff, manual redirect following
 * and per-hop credential policy.
 *
 * Attempt states: Attempting(n) -> Succeeded | FailedPermanent | ConsentRequired |
 * RetryScheduled(n) -> Attempting(n+1) ... -> Exhausted.
 *
 * The Error branch is reserved for cancellation, a malformed retry policy, sink I/O
 * failures and invalid input; HTTP-level outcomes are reported through ExecutionResult.
 */
class RetryingRequestExecutor {
public:
    RetryingRequestExecutor(std::shared_ptr<IHttpTransport> transport,
                            auth::CredentialHeaderPolicy policy, ExecutorOptions options,
                            SleepFunction sleep = {});

    Result<ExecutionResult> execute(const ExecuteRequest& request, IResponseSink& sink,
                                    std::stop_token stop = {});

    // Applies the long-URL rewrite: GET url?query -> POST url with query as form body.
    [[nodiscard]] HttpRequest buildRequest(const ExecuteRequest& request) const;

    [[nodiscard]] const ExecutorOptions& options() const noexcept { return options_; }

private:
    Result<HttpResponse> performAttempt(const HttpRequest& initial,
                                        const auth::AuthorizationSpec& auth,
                                        const BodySink& sink, std::stop_token stop);

    std::shared_ptr<IHttpTransport> transport_;
    auth::CredentialHeaderPolicy policy_;
    ExecutorOptions options_;
    SleepFunction sleep_;
};

} // namespace authfetch::http
