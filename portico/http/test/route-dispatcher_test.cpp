#include "portico/route-dispatcher.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "portico/http-constants.hpp"
#include "portico/http-method.hpp"
#include "portico/http-request.hpp"
#include "portico/http-response.hpp"
#include "portico/http-status-code.hpp"
#include "portico/interceptor.hpp"
#include "portico/route-table.hpp"

namespace portico {

namespace {

RequestHandler Reply(std::string body) {
  return [body = std::move(body)](const HttpRequest&) { return HttpResponse(http::StatusCodeOK).body(body); };
}

Interceptor Tag(std::string name) {
  return [name = std::move(name)](RequestHandler next) -> RequestHandler {
    return [name, next = std::move(next)](const HttpRequest& req) {
      auto resp = next(req);
      return std::move(resp).body(name + "(" + std::string(resp.body()) + ")");
    };
  };
}

}  // namespace

class RouteDispatcherTest : public ::testing::Test {
 protected:
  HttpResponse dispatch(http::Method method, std::string_view target) {
    if (!dispatcher) {
      table = builder.compile();
      dispatcher = std::make_unique<RouteDispatcher>(*table, common);
    }
    request = HttpRequest(method, target);
    return dispatcher->dispatch(request);
  }

  RouteTableBuilder builder;
  std::vector<Interceptor> common;
  std::shared_ptr<const RouteTable> table;
  std::unique_ptr<RouteDispatcher> dispatcher;
  HttpRequest request;
};

TEST_F(RouteDispatcherTest, PingPong) {
  builder.registerEndpoint("/", http::Method::GET, Reply("PONG"));

  auto resp = dispatch(http::Method::GET, "/");
  EXPECT_EQ(resp.statusCode(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "PONG");

  resp = dispatch(http::Method::POST, "/");
  EXPECT_EQ(resp.statusCode(), http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(resp.headerValue(http::Allow).value_or(""), "GET");

  resp = dispatch(http::Method::GET, "/missing");
  EXPECT_EQ(resp.statusCode(), http::StatusCodeNotFound);
  EXPECT_FALSE(resp.headerValue(http::Allow));
}

TEST_F(RouteDispatcherTest, AllowHeaderIsSortedLexicographically) {
  for (auto method : {http::Method::PUT, http::Method::GET, http::Method::DELETE, http::Method::PATCH,
                      http::Method::OPTIONS}) {
    builder.registerEndpoint("/res", method, Reply("x"));
  }
  const auto resp = dispatch(http::Method::POST, "/res");
  EXPECT_EQ(resp.statusCode(), http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(resp.headerValue(http::Allow).value_or(""), "DELETE, GET, OPTIONS, PATCH, PUT");
}

TEST_F(RouteDispatcherTest, InterceptorOrderIsCommonThenEndpointThenTerminal) {
  common = {Tag("common1"), Tag("common2")};
  builder.registerEndpoint("/chain", http::Method::GET, Endpoint{{Tag("own")}, Reply("terminal")});
  builder.registerEndpoint("/plain", http::Method::GET, Reply("terminal"));

  EXPECT_EQ(dispatch(http::Method::GET, "/chain").body(), "common1(common2(own(terminal)))");
  EXPECT_EQ(dispatch(http::Method::GET, "/plain").body(), "common1(common2(terminal))");
}

TEST_F(RouteDispatcherTest, CommonInterceptorsDoNotApplyToUnroutedRequests) {
  int nbCalls = 0;
  common = {[&nbCalls](RequestHandler next) -> RequestHandler {
    return [&nbCalls, next = std::move(next)](const HttpRequest& req) {
      ++nbCalls;
      return next(req);
    };
  }};
  builder.registerEndpoint("/", http::Method::GET, Reply("x"));
  EXPECT_EQ(dispatch(http::Method::GET, "/nope").statusCode(), http::StatusCodeNotFound);
  EXPECT_EQ(dispatch(http::Method::PUT, "/").statusCode(), http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(nbCalls, 0);
  EXPECT_EQ(dispatch(http::Method::GET, "/").statusCode(), http::StatusCodeOK);
  EXPECT_EQ(nbCalls, 1);
}

TEST_F(RouteDispatcherTest, PathParameters) {
  builder.registerEndpoint("/users/{userId}/posts/{postId}", http::Method::GET, [](const HttpRequest& req) {
    return HttpResponse().body(std::string(req.pathParam("userId").value_or("")) + "/" +
                               std::string(req.pathParam("postId").value_or("")));
  });
  const auto resp = dispatch(http::Method::GET, "/users/42/posts/abc?verbose=1");
  EXPECT_EQ(resp.statusCode(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "42/abc");
  ASSERT_EQ(request.pathParams().size(), 2U);
  EXPECT_EQ(request.pathParams()[0].first, "userId");
  EXPECT_FALSE(request.pathParam("unknown"));

  EXPECT_EQ(dispatch(http::Method::GET, "/users//posts/abc").statusCode(), http::StatusCodeNotFound);
  EXPECT_EQ(dispatch(http::Method::GET, "/users/42/posts").statusCode(), http::StatusCodeNotFound);
}

TEST_F(RouteDispatcherTest, LiteralSegmentsWinOverParameters) {
  builder.registerEndpoint("/users/{id}", http::Method::GET, Reply("param"));
  builder.registerEndpoint("/users/me", http::Method::GET, Reply("literal"));
  builder.registerEndpoint("/{kind}/me", http::Method::GET, Reply("late-literal"));

  EXPECT_EQ(dispatch(http::Method::GET, "/users/me").body(), "literal");
  EXPECT_EQ(dispatch(http::Method::GET, "/users/7").body(), "param");
  EXPECT_EQ(dispatch(http::Method::GET, "/groups/me").body(), "late-literal");
}

TEST_F(RouteDispatcherTest, MethodNotAllowedUnionsOverlappingPatterns) {
  builder.registerEndpoint("/files/{name}", http::Method::PUT, Reply("put"));
  builder.registerEndpoint("/files/readme", http::Method::GET, Reply("get"));

  EXPECT_EQ(dispatch(http::Method::PUT, "/files/readme").body(), "put");
  const auto resp = dispatch(http::Method::DELETE, "/files/readme");
  EXPECT_EQ(resp.statusCode(), http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(resp.headerValue(http::Allow).value_or(""), "GET, PUT");
}

TEST_F(RouteDispatcherTest, HeadFallsBackToGet) {
  builder.registerEndpoint("/doc", http::Method::GET, Reply("content"));
  EXPECT_EQ(dispatch(http::Method::HEAD, "/doc").statusCode(), http::StatusCodeOK);

  builder = RouteTableBuilder();
  dispatcher.reset();
  builder.registerEndpoint("/doc", http::Method::POST, Reply("content"));
  const auto resp = dispatch(http::Method::HEAD, "/doc");
  EXPECT_EQ(resp.statusCode(), http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(resp.headerValue(http::Allow).value_or(""), "POST");
}

TEST_F(RouteDispatcherTest, TrailingSlashAndCaseAreStrict) {
  builder.registerEndpoint("/api/status", http::Method::GET, Reply("ok"));
  EXPECT_EQ(dispatch(http::Method::GET, "/api/status").statusCode(), http::StatusCodeOK);
  EXPECT_EQ(dispatch(http::Method::GET, "/api/status/").statusCode(), http::StatusCodeNotFound);
  EXPECT_EQ(dispatch(http::Method::GET, "/API/status").statusCode(), http::StatusCodeNotFound);
  EXPECT_EQ(dispatch(http::Method::GET, "/api").statusCode(), http::StatusCodeNotFound);
}

TEST_F(RouteDispatcherTest, NotImplementedEndpoint) {
  builder.registerEndpoint("/later", http::Method::PATCH);
  EXPECT_EQ(dispatch(http::Method::PATCH, "/later").statusCode(), http::StatusCodeNotImplemented);
}

TEST_F(RouteDispatcherTest, HandlerExceptionsPropagate) {
  builder.registerEndpoint("/boom", http::Method::GET,
                           [](const HttpRequest&) -> HttpResponse { throw std::runtime_error("boom"); });
  EXPECT_THROW(dispatch(http::Method::GET, "/boom"), std::runtime_error);
}

TEST_F(RouteDispatcherTest, ConcurrentMatching) {
  builder.registerEndpoint("/a/{x}", http::Method::GET, Reply("a"));
  builder.registerEndpoint("/b", http::Method::POST, Reply("b"));
  table = builder.compile();
  dispatcher = std::make_unique<RouteDispatcher>(*table, common);

  std::atomic<int> nbErrors{0};
  {
    std::vector<std::jthread> threads;
    for (int threadPos = 0; threadPos < 8; ++threadPos) {
      threads.emplace_back([this, &nbErrors] {
        for (int iter = 0; iter < 1000; ++iter) {
          HttpRequest req(http::Method::GET, "/a/" + std::to_string(iter));
          if (dispatcher->dispatch(req).body() != "a" || req.pathParam("x") != std::to_string(iter)) {
            ++nbErrors;
          }
          HttpRequest wrongMethod(http::Method::GET, "/b");
          if (dispatcher->dispatch(wrongMethod).statusCode() != http::StatusCodeMethodNotAllowed) {
            ++nbErrors;
          }
        }
      });
    }
  }
  EXPECT_EQ(nbErrors.load(), 0);
}

}  // namespace portico
