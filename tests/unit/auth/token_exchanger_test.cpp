#include <gtest/gtest.h>
#include <authfetch/auth/token_exchanger.h>
#include <authfetch/http/url.h>

#include "../../authfetch_common/fake_http_transport.h"

#include <atomic>
#include <chrono>
#include <stop_token>
#include <thread>
#include <vector>

using namespace authfetch;
using namespace authfetch::auth;
using authfetch::http::findHeader;
using authfetch::test::FakeHttpTransport;
using authfetch::test::makeRedirect;
using authfetch::test::makeResponse;

namespace {

OAuthClientConfig oauthConfig() {
    return OAuthClientConfig{"https://urs.example.gov/", "client-1",
                             "https://app.example.com/oauth2/redirect", {"app", "secret"}};
}

} // namespace

class TokenExchangerTest : public ::testing::Test {
protected:
    void SetUp() override { transport_ = std::make_shared<FakeHttpTransport>(); }

    void scriptSuccessfulExchange(const std::string& token = "tok1") {
        transport_->enqueueResponse(makeRedirect(
            302, "https://app.example.com/oauth2/redirect?code=ABC123&state=xyz"));
        transport_->enqueueResponse(200, R"({"access_token":")" + token +
                                             R"(","token_type":"Bearer","expires_in":3600})");
    }

    std::shared_ptr<FakeHttpTransport> transport_;
};

TEST_F(TokenExchangerTest, ExchangesCodeForAccessToken) {
    scriptSuccessfulExchange();
    TokenExchanger exchanger(oauthConfig(), transport_);

    auto token = exchanger.exchange(Credential("usertoken"));
    ASSERT_TRUE(token) << token.error().message;
    EXPECT_EQ(token.value().value.reveal(), "tok1");
    EXPECT_EQ(token.value().sourceCredential.reveal(), "usertoken");

    const auto requests = transport_->requests();
    ASSERT_EQ(requests.size(), 2u);

    const auto& authorize = requests[0];
    EXPECT_EQ(authorize.method, http::HttpMethod::Get);
    EXPECT_FALSE(authorize.followRedirects);
    EXPECT_EQ(authorize.url, "https://urs.example.gov/oauth/authorize?response_type=code"
                             "&client_id=client-1"
                             "&redirect_uri=https%3A%2F%2Fapp.example.com%2Foauth2%2Fredirect");
    EXPECT_EQ(findHeader(authorize.headers, "Authorization").value_or(""),
              "Bearer usertoken, Basic YXBwOnNlY3JldA==");

    const auto& tokenReq = requests[1];
    EXPECT_EQ(tokenReq.method, http::HttpMethod::Post);
    EXPECT_EQ(tokenReq.url, "https://urs.example.gov/oauth/token");
    EXPECT_EQ(tokenReq.body.value_or(""),
              "grant_type=authorization_code&code=ABC123"
              "&redirect_uri=https%3A%2F%2Fapp.example.com%2Foauth2%2Fredirect");
    EXPECT_EQ(findHeader(tokenReq.headers, "Authorization").value_or(""),
              "Basic YXBwOnNlY3JldA==");
    EXPECT_EQ(findHeader(tokenReq.headers, "content-type").value_or(""),
              "application/x-www-form-urlencoded");
}

TEST_F(TokenExchangerTest, SecondCallIsServedFromCache) {
    scriptSuccessfulExchange();
    TokenExchanger exchanger(oauthConfig(), transport_);

    ASSERT_TRUE(exchanger.exchange(Credential("usertoken")));
    auto again = exchanger.exchange(Credential("usertoken"));
    ASSERT_TRUE(again);
    EXPECT_EQ(again.value().value.reveal(), "tok1");
    EXPECT_EQ(transport_->requestCount(), 2u);
    EXPECT_EQ(exchanger.cachedTokenCount(), 1u);
}

TEST_F(TokenExchangerTest, DistinctCredentialsAreCachedSeparately) {
    scriptSuccessfulExchange("tokA");
    scriptSuccessfulExchange("tokB");
    TokenExchanger exchanger(oauthConfig(), transport_);

    EXPECT_EQ(exchanger.exchange(Credential("a")).value().value.reveal(), "tokA");
    EXPECT_EQ(exchanger.exchange(Credential("b")).value().value.reveal(), "tokB");
    EXPECT_EQ(exchanger.cachedTokenCount(), 2u);
    EXPECT_EQ(transport_->requestCount(), 4u);
}

TEST_F(TokenExchangerTest, FailsWhenAuthorizeDoesNotRedirect) {
    transport_->enqueueResponse(200, "<html>login</html>");
    TokenExchanger exchanger(oauthConfig(), transport_);
    auto r = exchanger.exchange(Credential("u"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::TokenExchangeFailed);
    EXPECT_EQ(exchanger.cachedTokenCount(), 0u);
}

TEST_F(TokenExchangerTest, FailsWhenRedirectHasNoCode) {
    transport_->enqueueResponse(
        makeRedirect(302, "https://app.example.com/oauth2/redirect?error=access_denied"));
    TokenExchanger exchanger(oauthConfig(), transport_);
    auto r = exchanger.exchange(Credential("u"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::TokenExchangeFailed);
    EXPECT_EQ(transport_->requestCount(), 1u);
}

TEST_F(TokenExchangerTest, LocationHeaderNameIsCaseInsensitive) {
    transport_->enqueueResponse(
        makeResponse(303, {}, {{"location", "https://app.example.com/cb?code=lower"}}));
    transport_->enqueueResponse(200, R"({"access_token":"t"})");
    TokenExchanger exchanger(oauthConfig(), transport_);
    auto r = exchanger.exchange(Credential("u"));
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_NE(transport_->requests()[1].body->find("code=lower"), std::string::npos);
}

TEST_F(TokenExchangerTest, FailsOnNon2xxTokenResponse) {
    transport_->enqueueResponse(makeRedirect(302, "https://app.example.com/cb?code=C"));
    transport_->enqueueResponse(400, R"({"error":"invalid_grant"})");
    TokenExchanger exchanger(oauthConfig(), transport_);
    auto r = exchanger.exchange(Credential("u"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::TokenExchangeFailed);
    EXPECT_EQ(transport_->requestCount(), 2u);
}

TEST_F(TokenExchangerTest, FailsWhenAccessTokenMissing) {
    transport_->enqueueResponse(makeRedirect(302, "https://app.example.com/cb?code=C"));
    transport_->enqueueResponse(200, R"({"token_type":"Bearer"})");
    TokenExchanger exchanger(oauthConfig(), transport_);
    auto r = exchanger.exchange(Credential("u"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::TokenExchangeFailed);
}

TEST_F(TokenExchangerTest, TransportFailureIsNotRetried) {
    transport_->enqueueError(ErrorCode::NetworkError, "connection refused");
    TokenExchanger exchanger(oauthConfig(), transport_);
    auto r = exchanger.exchange(Credential("u"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::TokenExchangeFailed);
    EXPECT_EQ(transport_->requestCount(), 1u);
}

TEST_F(TokenExchangerTest, FailedExchangeIsNotCached) {
    transport_->enqueueResponse(500, "oops");
    scriptSuccessfulExchange();
    TokenExchanger exchanger(oauthConfig(), transport_);
    EXPECT_FALSE(exchanger.exchange(Credential("u")));
    auto second = exchanger.exchange(Credential("u"));
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value().value.reveal(), "tok1");
}

TEST_F(TokenExchangerTest, ConcurrentCallersShareOneExchange) {
    std::atomic<int> authorizeCalls{0};
    transport_->setHandler([&](const http::HttpRequest& req) -> Result<http::HttpResponse> {
        if (req.url.find("/oauth/authorize") != std::string::npos) {
            ++authorizeCalls;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            return makeRedirect(302, "https://app.example.com/cb?code=C");
        }
        return makeResponse(200, R"({"access_token":"shared"})");
    });
    TokenExchanger exchanger(oauthConfig(), transport_);

    std::vector<std::thread> threads;
    std::vector<std::string> tokens(8);
    for (size_t i = 0; i < tokens.size(); ++i) {
        threads.emplace_back([&, i] {
            auto r = exchanger.exchange(Credential("same-user"));
            tokens[i] = r ? r.value().value.reveal() : std::string("error");
        });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(authorizeCalls.load(), 1);
    for (const auto& t : tokens)
        EXPECT_EQ(t, "shared");
}

TEST_F(TokenExchangerTest, WaiterTakesOverWhenLeaderIsCancelled) {
    std::atomic<int> authorizeCalls{0};
    std::atomic<bool> leaderEntered{false};
    std::atomic<bool> releaseLeader{false};
    transport_->setHandler([&](const http::HttpRequest& req) -> Result<http::HttpResponse> {
        if (req.url.find("/oauth/authorize") != std::string::npos) {
            if (++authorizeCalls == 1) {
                leaderEntered = true;
                while (!releaseLeader)
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                return Error{ErrorCode::OperationCancelled, "cancelled"};
            }
            return makeRedirect(302, "https://app.example.com/cb?code=C2");
        }
        return makeResponse(200, R"({"access_token":"for-waiter"})");
    });
    TokenExchanger exchanger(oauthConfig(), transport_);

    std::stop_source leaderStop;
    Result<ExchangedToken> leaderResult{Error{ErrorCode::Unknown, "not run"}};
    std::thread leader([&] {
        leaderResult = exchanger.exchange(Credential("same-user"), leaderStop.get_token());
    });
    while (!leaderEntered)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));

    Result<ExchangedToken> waiterResult{Error{ErrorCode::Unknown, "not run"}};
    std::thread waiter([&] { waiterResult = exchanger.exchange(Credential("same-user")); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    leaderStop.request_stop();
    releaseLeader = true;
    leader.join();
    waiter.join();

    ASSERT_FALSE(leaderResult);
    EXPECT_EQ(leaderResult.error().code, ErrorCode::OperationCancelled);
    ASSERT_TRUE(waiterResult) << waiterResult.error().message;
    EXPECT_EQ(waiterResult.value().value.reveal(), "for-waiter");
    EXPECT_EQ(authorizeCalls.load(), 2);
    EXPECT_EQ(exchanger.cachedTokenCount(), 1u);
}

TEST_F(TokenExchangerTest, WaiterHonoursItsOwnStopToken) {
    std::atomic<bool> leaderEntered{false};
    std::atomic<bool> releaseLeader{false};
    transport_->setHandler([&](const http::HttpRequest& req) -> Result<http::HttpResponse> {
        if (req.url.find("/oauth/authorize") != std::string::npos) {
            leaderEntered = true;
            while (!releaseLeader)
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            return makeRedirect(302, "https://app.example.com/cb?code=C");
        }
        return makeResponse(200, R"({"access_token":"leader-token"})");
    });
    TokenExchanger exchanger(oauthConfig(), transport_);

    Result<ExchangedToken> leaderResult{Error{ErrorCode::Unknown, "not run"}};
    std::thread leader([&] { leaderResult = exchanger.exchange(Credential("same-user")); });
    while (!leaderEntered)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));

    std::stop_source waiterStop;
    waiterStop.request_stop();
    auto waiterResult = exchanger.exchange(Credential("same-user"), waiterStop.get_token());
    ASSERT_FALSE(waiterResult);
    EXPECT_EQ(waiterResult.error().code, ErrorCode::OperationCancelled);

    releaseLeader = true;
    leader.join();
    ASSERT_TRUE(leaderResult) << leaderResult.error().message;
    EXPECT_EQ(leaderResult.value().value.reveal(), "leader-token");
}

TEST_F(TokenExchangerTest, RejectsEmptyCredential) {
    TokenExchanger exchanger(oauthConfig(), transport_);
    auto r = exchanger.exchange(Credential(""));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(transport_->requestCount(), 0u);
}
