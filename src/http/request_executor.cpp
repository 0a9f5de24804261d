#include <authfetch/auth/consent_error.h>
#include <authfetch/http/request_executor.h>
#include <authfetch/http/url.h>
#include <authfetch/logging/logging.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <map>
#include <mutex>

namespace authfetch::http {

namespace {

// Cookies set during one redirect chain, replayed on later hops of the same chain.
class CookieJar {
public:
    void store(const std::string& requestUrl, const std::vector<Header>& responseHeaders) {
        auto host = urlHost(requestUrl);
        if (!host)
            return;
        for (const auto& h : responseHeaders) {
            if (!iequals(h.name, "Set-Cookie"))
                continue;
            const auto semi = h.value.find(';');
            const auto pair = h.value.substr(0, semi);
            const auto eq = pair.find('=');
            if (eq == std::string::npos || eq == 0)
                continue;
            Entry e;
            e.domain = *host;
            e.hostOnly = true;
            if (semi != std::string::npos) {
                for (const auto& attr : splitAttributes(h.value.substr(semi + 1))) {
                    if (iequals(attr.first, "Domain") && !attr.second.empty()) {
                        auto d = attr.second;
                        if (d.front() == '.')
                            d.erase(0, 1);
                        std::transform(d.begin(), d.end(), d.begin(),
                                       [](unsigned char c) { return std::tolower(c); });
                        e.domain = d;
                        e.hostOnly = false;
                    }
                }
            }
            cookies_[{e.domain, pair.substr(0, eq)}] = Entry{e.domain, e.hostOnly,
                                                             pair.substr(eq + 1)};
        }
    }

    void attach(HttpRequest& request) const {
        auto host = urlHost(request.url);
        if (!host || cookies_.empty())
            return;
        std::string line;
        for (const auto& [key, entry] : cookies_) {
            const bool match =
                *host == entry.domain ||
                (!entry.hostOnly && host->size() > entry.domain.size() &&
                 host->compare(host->size() - entry.domain.size() - 1,
                               entry.domain.size() + 1, "." + entry.domain) == 0);
            if (!match)
                continue;
            if (!line.empty())
                line += "; ";
            line += key.second + "=" + entry.value;
        }
        if (line.empty())
            return;
        if (auto existing = findHeader(request.headers, "Cookie"); existing && !existing->empty())
            line = *existing + "; " + line;
        setHeader(request.headers, "Cookie", std::move(line));
    }

private:
    struct Entry {
        std::string domain;
        bool hostOnly{true};
        std::string value;
    };

    static std::vector<std::pair<std::string, std::string>> splitAttributes(const std::string& s) {
        std::vector<std::pair<std::string, std::string>> out;
        size_t start = 0;
        while (start < s.size()) {
            auto semi = s.find(';', start);
            auto item = s.substr(start, semi == std::string::npos ? std::string::npos
                                                                  : semi - start);
            auto eq = item.find('=');
            auto trimmed = [](std::string v) {
                const auto b = v.find_first_not_of(' ');
                const auto e = v.find_last_not_of(' ');
                return b == std::string::npos ? std::string{} : v.substr(b, e - b + 1);
            };
            if (eq == std::string::npos)
                out.emplace_back(trimmed(item), std::string{});
            else
                out.emplace_back(trimmed(item.substr(0, eq)), trimmed(item.substr(eq + 1)));
            if (semi == std::string::npos)
                break;
            start = semi + 1;
        }
        return out;
    }

    std::map<std::pair<std::string, std::string>, Entry> cookies_;
};

bool rewritesToGet(long status, HttpMethod method) {
    if (status == 303)
        return true;
    return (status == 301 || status == 302) && method == HttpMethod::Post;
}

} // namespace

bool interruptibleSleep(std::chrono::duration<double> delay, std::stop_token stop) {
    if (stop.stop_requested())
        return false;
    if (delay.count() <= 0)
        return true;
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(m);
    cv.wait_for(lock, stop, std::chrono::duration_cast<std::chrono::milliseconds>(delay),
                [] { return false; });
    return !stop.stop_requested();
}

const char* executionStatusName(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Success:
            return "success";
        case ExecutionStatus::PermanentFailure:
            return "permanent_failure";
        case ExecutionStatus::ConsentRequired:
            return "consent_required";
        case ExecutionStatus::ExhaustedRetries:
            return "exhausted";
    }
    return "unknown";
}

RetryingRequestExecutor::RetryingRequestExecutor(std::shared_ptr<IHttpTransport> transport,
                                                 auth::CredentialHeaderPolicy policy,
                                                 ExecutorOptions options, SleepFunction sleep)
    : transport_(std::move(transport)), policy_(std::move(policy)), options_(std::move(options)),
      sleep_(sleep ? std::move(sleep) : SleepFunction(interruptibleSleep)) {}

HttpRequest RetryingRequestExecutor::buildRequest(const ExecuteRequest& request) const {
    HttpRequest out;
    out.url = request.url;
    out.headers = request.headers;
    if (request.formBody) {
        out.method = HttpMethod::Post;
        out.body = *request.formBody;
    } else if (request.url.size() > options_.postUrlLength) {
        auto [base, query] = splitQuery(request.url);
        if (!query.empty()) {
            spdlog::debug("URL length {} exceeds {}; sending query as POST body",
                          request.url.size(), options_.postUrlLength);
            out.method = HttpMethod::Post;
            out.url = std::move(base);
            out.body = std::move(query);
        }
    }
    if (out.method == HttpMethod::Post && !findHeader(out.headers, kContentTypeHeader))
        out.headers.push_back(Header{kContentTypeHeader, kFormUrlEncoded});
    return out;
}

Result<HttpResponse> RetryingRequestExecutor::performAttempt(const HttpRequest& initial,
                                                             const auth::AuthorizationSpec& auth,
                                                             const BodySink& sink,
                                                             std::stop_token stop) {
    HttpRequest current = initial;
    CookieJar jar;
    for (int hop = 0;; ++hop) {
        HttpRequest wire = current;
        policy_.apply(wire, auth);
        jar.attach(wire);

        auto sent = transport_->send(wire, options_.transport, sink, stop);
        if (!sent)
            return sent.error();
        auto response = std::move(sent).value();
        jar.store(wire.url, response.headers);

        if (!current.followRedirects || !response.isRedirect())
            return response;
        const auto location = response.header("Location");
        if (!location || location->empty())
            return response;
        if (hop >= options_.maxRedirects) {
            return Error{ErrorCode::NetworkError,
                         "too many redirects (max " + std::to_string(options_.maxRedirects) + ")"};
        }
        auto next = resolveReference(current.url, *location);
        if (!next)
            return next.error();
        spdlog::debug("HTTP {} redirect {} -> {}", response.status,
                      logging::redactUrl(current.url), logging::redactUrl(next.value()));
        if (rewritesToGet(response.status, current.method)) {
            current.method = HttpMethod::Get;
            current.body.reset();
            removeHeader(current.headers, kContentTypeHeader);
        }
        current.url = std::move(next).value();
    }
}

Result<ExecutionResult> RetryingRequestExecutor::execute(const ExecuteRequest& request,
                                                         IResponseSink& sink,
                                                         std::stop_token stop) {
    if (auto valid = options_.retry.validate(); !valid)
        return valid.error();
    if (!transport_)
        return Error{ErrorCode::ConfigurationError, "request executor has no transport"};
    if (request.url.empty())
        return Error{ErrorCode::InvalidArgument, "request URL is empty"};

    const HttpRequest initial = buildRequest(request);
    ExecutionResult result;
    result.requestUrl = initial.url;
    result.method = initial.method;
    const auto redacted = logging::redactUrl(initial.url);
    const int maxAttempts = options_.retry.maxAttempts;

    // A reused sink may already hold data; retries only discard what this call wrote.
    const std::uint64_t mark = sink.bytesWritten();
    std::uint64_t attemptBytes = 0;
    BodySink bodySink = [&sink, &attemptBytes](ByteSpan bytes) {
        auto written = sink.write(bytes);
        if (written)
            attemptBytes += bytes.size();
        return written;
    };

    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        if (stop.stop_requested())
            return Error{ErrorCode::OperationCancelled, "download cancelled"};
        result.attempts = attempt;
        attemptBytes = 0;

        auto outcome = performAttempt(initial, request.auth, bodySink, stop);
        if (!outcome) {
            const auto& err = outcome.error();
            if (err.code == ErrorCode::OperationCancelled || err.code == ErrorCode::WriteError)
                return err;
            result.response.reset();
            result.lastError = err;
            logging::logEvent(spdlog::level::warn, "download.attempt",
                              {{"attempt", attempt},
                               {"maxAttempts", maxAttempts},
                               {"method", methodName(initial.method)},
                               {"url", redacted},
                               {"outcome", "transport_error"},
                               {"error", err.message}});
        } else {
            auto response = std::move(outcome).value();
            const long status = response.status;
            result.lastError.reset();
            result.response = std::move(response);

            std::optional<ExecutionStatus> terminal;
            if (result.response->ok()) {
                terminal = ExecutionStatus::Success;
            } else if (status == 401 || status == 403) {
                terminal = ExecutionStatus::PermanentFailure;
            } else if (auth::translateConsentError(result.response->body)) {
                terminal = ExecutionStatus::ConsentRequired;
            }

            logging::logEvent(terminal && *terminal == ExecutionStatus::Success
                                  ? spdlog::level::debug
                                  : spdlog::level::warn,
                              "download.attempt",
                              {{"attempt", attempt},
                               {"maxAttempts", maxAttempts},
                               {"method", methodName(initial.method)},
                               {"url", redacted},
                               {"status", status},
                               {"outcome", terminal ? executionStatusName(*terminal)
                                                    : "transient_failure"}});
            if (terminal) {
                result.status = *terminal;
                if (*terminal == ExecutionStatus::Success)
                    result.bytesWritten = attemptBytes;
                return result;
            }
        }

        if (attemptBytes > 0) {
            if (auto rewound = sink.rewind(mark); !rewound)
                return rewound.error();
        }
        if (attempt == maxAttempts)
            break;

        const auto delay = options_.retry.delayFor(attempt);
        logging::logEvent(spdlog::level::info, "download.retry_scheduled",
                          {{"attempt", attempt},
                           {"nextAttempt", attempt + 1},
                           {"delaySeconds", delay.count()},
                           {"url", redacted}});
        if (!sleep_(delay, stop))
            return Error{ErrorCode::OperationCancelled, "download cancelled during backoff"};
    }

    result.status = ExecutionStatus::ExhaustedRetries;
    logging::logEvent(spdlog::level::err, "download.exhausted",
                      {{"attempts", result.attempts},
                       {"url", redacted},
                       {"status", result.response ? result.response->status : 0L},
                       {"error", result.lastError ? result.lastError->message : std::string{}}});
    return result;
}

} // namespace authfetch::http
