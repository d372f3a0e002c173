#include <gtest/gtest.h>

#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "portico/http-constants.hpp"
#include "portico/http-method.hpp"
#include "portico/http-request.hpp"
#include "portico/http-response.hpp"
#include "portico/http-status-code.hpp"
#include "portico/interceptor.hpp"
#include "portico/route-table.hpp"
#include "portico/server-options.hpp"
#include "portico/test-server.hpp"
#include "portico/test-util.hpp"

using namespace portico;

namespace {

std::mutex gTraceMutex;
std::vector<std::string> gTrace;

void Trace(std::string step) {
  std::scoped_lock lock(gTraceMutex);
  gTrace.push_back(std::move(step));
}

std::vector<std::string> TakeTrace() {
  std::scoped_lock lock(gTraceMutex);
  return std::exchange(gTrace, {});
}

Interceptor Tracing(std::string name) {
  return [name = std::move(name)](RequestHandler next) -> RequestHandler {
    return [name, next = std::move(next)](const HttpRequest& req) {
      Trace(name + ">");
      HttpResponse resp = next(req);
      Trace("<" + name);
      return resp;
    };
  };
}

Interceptor RequireToken() {
  return [](RequestHandler next) -> RequestHandler {
    return [next = std::move(next)](const HttpRequest& req) {
      if (req.headerValueOrEmpty("X-Token") != "secret") {
        return HttpResponse(http::StatusCodeUnauthorized).body("token required");
      }
      return next(req);
    };
  };
}

void RegisterRoutes(RouteTableBuilder& builder) {
  builder.registerEndpoint("/ping", http::Method::GET, [](const HttpRequest&) { return HttpResponse().body("PONG"); });
  builder.registerEndpoint("/items", http::Method::POST, [](const HttpRequest& req) {
    return HttpResponse(http::StatusCodeCreated).body(std::string(req.body()));
  });
  builder.registerEndpoint("/items", http::Method::PUT, [](const HttpRequest&) { return HttpResponse(); });
  builder.registerEndpoint("/items", http::Method::DELETE, [](const HttpRequest&) { return HttpResponse(); });
  builder.registerEndpoint("/items/{id}", http::Method::GET, [](const HttpRequest& req) {
    return HttpResponse().body(std::string("item ") + std::string(req.pathParam("id").value_or("?")));
  });
  builder.registerEndpoint("/users/{user}/posts/{post}", http::Method::GET, [](const HttpRequest& req) {
    return HttpResponse().body(std::string(req.pathParam("user").value_or("?")) + "/" +
                               std::string(req.pathParam("post").value_or("?")));
  });
  builder.registerEndpoint("/users/me/posts/{post}", http::Method::GET,
                           [](const HttpRequest&) { return HttpResponse().body("mine"); });
  builder.registerEndpoint("/query", http::Method::GET,
                           [](const HttpRequest& req) { return HttpResponse().body(std::string(req.query())); });
  builder.registerEndpoint("/todo", http::Method::PATCH);
  builder.registerEndpoint("/traced", http::Method::GET,
                           Endpoint{{Tracing("endpoint")}, [](const HttpRequest&) {
                                      Trace("handler");
                                      return HttpResponse().body("traced");
                                    }});
  builder.registerEndpoint("/secret", "GET", Endpoint{{RequireToken()}, [](const HttpRequest&) {
                                                        return HttpResponse().body("the secret");
                                                      }});
}

test::TestServer ts(ServerOptions{}
                        .withConfig(test::PlainTestConfig())
                        .withCommonInterceptor(Tracing("common"))
                        .withEndpoints(&RegisterRoutes));

test::ParsedResponse Request(std::string_view method, std::string_view target, std::string body = {}) {
  test::RequestOptions opt;
  opt.method = method;
  opt.target = target;
  opt.body = std::move(body);
  return test::fetch(ts.port(), opt);
}

}  // namespace

TEST(HttpRouting, BasicPathDispatch) {
  auto resp = Request("GET", "/ping");
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.reason, "OK");
  EXPECT_EQ(resp.body, "PONG");
  EXPECT_EQ(resp.header(http::ContentType).value_or(""), http::ContentTypeTextPlain);

  resp = Request("POST", "/items", "payload");
  EXPECT_EQ(resp.statusCode, http::StatusCodeCreated);
  EXPECT_EQ(resp.body, "payload");
}

TEST(HttpRouting, UnknownPathIs404) {
  auto resp = Request("GET", "/nope");
  EXPECT_EQ(resp.statusCode, http::StatusCodeNotFound);
  EXPECT_FALSE(resp.header(http::Allow));

  // Paths are matched exactly, including trailing slashes
  EXPECT_EQ(Request("GET", "/ping/").statusCode, http::StatusCodeNotFound);
  EXPECT_EQ(Request("GET", "/PING").statusCode, http::StatusCodeNotFound);
}

TEST(HttpRouting, MethodNotAllowedListsSortedMethods) {
  auto resp = Request("GET", "/items");
  EXPECT_EQ(resp.statusCode, http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(resp.header(http::Allow).value_or(""), "DELETE, POST, PUT");

  resp = Request("POST", "/ping");
  EXPECT_EQ(resp.statusCode, http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(resp.header(http::Allow).value_or(""), "GET");
}

TEST(HttpRouting, EndpointWithoutHandlerIs501) {
  EXPECT_EQ(Request("PATCH", "/todo").statusCode, http::StatusCodeNotImplemented);
  auto resp = Request("GET", "/todo");
  EXPECT_EQ(resp.statusCode, http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(resp.header(http::Allow).value_or(""), "PATCH");
}

TEST(HttpRouting, PathParameters) {
  EXPECT_EQ(Request("GET", "/items/42").body, "item 42");
  EXPECT_EQ(Request("GET", "/users/alice/posts/7").body, "alice/7");
  EXPECT_EQ(Request("GET", "/items/").statusCode, http::StatusCodeNotFound);
  EXPECT_EQ(Request("GET", "/items/42/extra").statusCode, http::StatusCodeNotFound);
}

TEST(HttpRouting, LiteralSegmentsWinOverParameters) {
  EXPECT_EQ(Request("GET", "/users/me/posts/3").body, "mine");
  EXPECT_EQ(Request("GET", "/users/you/posts/3").body, "you/3");
}

TEST(HttpRouting, QueryStringIsNotPartOfThePath) {
  auto resp = Request("GET", "/query?a=1&b=two");
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, "a=1&b=two");
}

TEST(HttpRouting, HeadFallsBackToGet) {
  // No body: the announced Content-Length cannot be consumed, so the raw bytes are checked.
  test::RequestOptions opt;
  opt.method = "HEAD";
  opt.target = "/ping";
  const std::string raw = test::requestOrThrow(ts.port(), opt);
  EXPECT_TRUE(raw.starts_with("HTTP/1.1 200 OK\r\n")) << raw;
  EXPECT_NE(raw.find("Content-Length: 4\r\n"), std::string::npos) << raw;
  EXPECT_TRUE(raw.ends_with(http::DoubleCRLF)) << raw;
  EXPECT_EQ(raw.find("PONG"), std::string::npos);

  opt.target = "/items";
  EXPECT_TRUE(test::requestOrThrow(ts.port(), opt).starts_with("HTTP/1.1 405"));
}

TEST(HttpRouting, InterceptorOrder) {
  TakeTrace();
  EXPECT_EQ(Request("GET", "/traced").body, "traced");
  const std::vector<std::string> expected{"common>", "endpoint>", "handler", "<endpoint", "<common"};
  EXPECT_EQ(TakeTrace(), expected);
}

TEST(HttpRouting, CommonInterceptorsDoNotRunForUnmatchedRequests) {
  TakeTrace();
  EXPECT_EQ(Request("GET", "/nope").statusCode, http::StatusCodeNotFound);
  EXPECT_EQ(Request("GET", "/items").statusCode, http::StatusCodeMethodNotAllowed);
  EXPECT_TRUE(TakeTrace().empty());
}

TEST(HttpRouting, InterceptorCanShortCircuit) {
  auto resp = Request("GET", "/secret");
  EXPECT_EQ(resp.statusCode, http::StatusCodeUnauthorized);
  EXPECT_EQ(resp.body, "token required");

  test::RequestOptions opt;
  opt.target = "/secret";
  opt.headers.emplace_back("X-Token", "secret");
  resp = test::fetch(ts.port(), opt);
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, "the secret");
}
