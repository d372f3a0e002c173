#include "portico/route-table.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "portico/http-method.hpp"
#include "portico/http-request.hpp"
#include "portico/http-response.hpp"
#include "portico/http-status-code.hpp"
#include "portico/interceptor.hpp"

namespace portico {

namespace {

HttpResponse Ok(const HttpRequest&) { return HttpResponse(http::StatusCodeOK).body("first"); }

HttpResponse Other(const HttpRequest&) { return HttpResponse(http::StatusCodeOK).body("second"); }

}  // namespace

TEST(RouteTableBuilder, RegisterAndCompile) {
  RouteTableBuilder builder;
  builder.registerEndpoint("/", http::Method::GET, Ok).registerEndpoint("/items/{id}", "DELETE");
  auto table = builder.compile();
  ASSERT_NE(table, nullptr);
  EXPECT_EQ(table->nbEndpoints(), 2U);
  EXPECT_EQ(table->routes().size(), 2U);

  const Endpoint* endpoint = table->find("/", http::Method::GET);
  ASSERT_NE(endpoint, nullptr);
  EXPECT_EQ(endpoint->handler(HttpRequest(http::Method::GET, "/")).body(), "first");
  EXPECT_EQ(table->find("/", http::Method::POST), nullptr);
  EXPECT_EQ(table->find("/missing", http::Method::GET), nullptr);
}

TEST(RouteTableBuilder, MissingHandlerAnswersNotImplemented) {
  RouteTableBuilder builder;
  builder.registerEndpoint("/todo", http::Method::POST);
  builder.registerEndpoint("/todo", http::Method::PUT, Endpoint{{}, RequestHandler{}});
  auto table = builder.compile();
  for (auto method : {http::Method::POST, http::Method::PUT}) {
    const Endpoint* endpoint = table->find("/todo", method);
    ASSERT_NE(endpoint, nullptr);
    ASSERT_TRUE(endpoint->handler);
    EXPECT_EQ(endpoint->handler(HttpRequest(method, "/todo")).statusCode(), http::StatusCodeNotImplemented);
  }
}

TEST(RouteTableBuilder, DuplicateRegistrationThrowsAndKeepsFirst) {
  RouteTableBuilder builder;
  builder.registerEndpoint("/dup", http::Method::GET, Ok);
  try {
    builder.registerEndpoint("/dup", "GET", Endpoint{{}, Other});
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument& ex) {
    EXPECT_STREQ(ex.what(), "method \"GET\" already registered for path \"/dup\"");
  }
  // another method on the same path is fine
  builder.registerEndpoint("/dup", http::Method::POST, Other);

  auto table = builder.compile();
  EXPECT_EQ(table->nbEndpoints(), 2U);
  EXPECT_EQ(table->find("/dup", http::Method::GET)->handler(HttpRequest(http::Method::GET, "/dup")).body(), "first");
}

TEST(RouteTableBuilder, InvalidPathThrows) {
  RouteTableBuilder builder;
  try {
    builder.registerEndpoint("/a//b", http::Method::GET, Ok);
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument& ex) {
    EXPECT_STREQ(ex.what(), "endpoint path \"/a//b\" is not correctly formatted (the path parts cannot be empty)");
  }
  EXPECT_THROW(builder.registerEndpoint("", http::Method::GET, Ok), std::invalid_argument);
  EXPECT_THROW(builder.registerEndpoint("/trailing/", "GET"), std::invalid_argument);
  EXPECT_EQ(builder.compile()->nbEndpoints(), 0U);
}

TEST(RouteTableBuilder, InvalidMethodThrows) {
  RouteTableBuilder builder;
  try {
    builder.registerEndpoint("/x", "FETCH");
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument& ex) {
    EXPECT_STREQ(ex.what(), "http method \"FETCH\" is invalid");
  }
  EXPECT_THROW(builder.registerEndpoint("/x", "get"), std::invalid_argument);
  EXPECT_THROW(builder.registerEndpoint("/x", ""), std::invalid_argument);
  EXPECT_THROW(builder.registerEndpoint("/x", static_cast<http::Method>(3)), std::invalid_argument);
  EXPECT_THROW(builder.registerEndpoint("/x", static_cast<http::Method>(1 << 12)), std::invalid_argument);
}

TEST(RouteTableBuilder, EveryStandardMethodTokenIsAccepted) {
  RouteTableBuilder builder;
  for (const char* method : {"GET", "POST", "HEAD", "PUT", "PATCH", "DELETE", "CONNECT", "OPTIONS", "TRACE"}) {
    EXPECT_NO_THROW(builder.registerEndpoint("/all", method)) << method;
  }
  EXPECT_EQ(builder.compile()->nbEndpoints(), static_cast<std::size_t>(http::kNbMethods));
}

TEST(RouteTableBuilder, RegistrationAfterCompileThrows) {
  RouteTableBuilder builder;
  builder.registerEndpoint("/", http::Method::GET, Ok);
  auto table = builder.compile();
  EXPECT_TRUE(builder.isCompiled());
  EXPECT_THROW(builder.registerEndpoint("/late", http::Method::GET, Ok), std::logic_error);
  EXPECT_THROW(builder.registerEndpoint("/late", "GET"), std::logic_error);
  EXPECT_EQ(builder.compile(), table);
  EXPECT_EQ(table->nbEndpoints(), 1U);
}

TEST(RouteTableBuilder, TablesOnlyComeFromCompile) {
  static_assert(!std::is_constructible_v<RouteTable, RouteTable::PathMap>);
  static_assert(!std::is_default_constructible_v<RouteTable>);

  RouteTableBuilder builder;
  builder.registerEndpoint("/a", http::Method::GET, Ok);
  builder.registerEndpoint("/a", http::Method::PUT, Ok);
  const std::shared_ptr<const RouteTable> table = builder.compile();
  ASSERT_NE(table, nullptr);
  EXPECT_EQ(table.use_count(), 2);
  EXPECT_NE(table->find("/a", http::Method::PUT), nullptr);
  EXPECT_EQ(table->find("/a", http::Method::POST), nullptr);
}

TEST(RouteTableBuilder, CompiledTableIsIndependentFromCallerData) {
  RouteTableBuilder builder;
  std::vector<Interceptor> interceptors{[](RequestHandler next) { return next; }};
  Endpoint endpoint{interceptors, Ok};
  builder.registerEndpoint("/frozen", http::Method::GET, endpoint);
  interceptors.clear();
  endpoint.interceptors.clear();
  endpoint.handler = Other;

  auto table = builder.compile();
  const Endpoint* registered = table->find("/frozen", http::Method::GET);
  ASSERT_NE(registered, nullptr);
  EXPECT_EQ(registered->interceptors.size(), 1U);
  EXPECT_EQ(registered->handler(HttpRequest(http::Method::GET, "/frozen")).body(), "first");
}

TEST(RouteTableBuilder, EndpointProviderRegistersEndpoints) {
  class HealthProvider : public EndpointProvider {
   public:
    void registerEndpoints(RouteTableBuilder& builder) override {
      builder.registerEndpoint("/health", http::Method::GET, Ok);
      builder.registerEndpoint("/health", http::Method::HEAD, Ok);
    }
  };

  RouteTableBuilder builder;
  HealthProvider provider;
  provider.registerEndpoints(builder);
  EXPECT_EQ(builder.compile()->nbEndpoints(), 2U);
}

}  // namespace portico
