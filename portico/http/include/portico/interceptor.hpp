#pragma once

#include <functional>
#include <span>

#include "portico/http-request.hpp"
#include "portico/http-response.hpp"

namespace portico {

// Terminal request handler: produces the response of a request.
using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

// Cross-cutting behavior wrapped around a handler (logging, authentication, metrics...).
// It receives the next handler of the chain and returns the handler to invoke in its place,
// which decides per request whether to call 'next'.
// Example:
//   Interceptor requireToken = [](RequestHandler next) -> RequestHandler {
//     return [next = std::move(next)](const HttpRequest& req) {
//       if (!req.headerValue("X-Token")) {
//         return HttpResponse(http::StatusCodeUnauthorized);
//       }
//       return next(req);
//     };
//   };
using Interceptor = std::function<RequestHandler(RequestHandler next)>;

// Composes 'interceptors' around 'terminal', once. The first interceptor is the outermost one:
// it runs first and observes the response last.
//  - An empty list returns 'terminal' itself.
//  - Empty interceptors in the list are skipped.
//  - Throws std::invalid_argument if 'terminal' is empty, or if an interceptor returns an empty handler.
RequestHandler MakeChain(std::span<const Interceptor> interceptors, RequestHandler terminal);

}  // namespace portico
