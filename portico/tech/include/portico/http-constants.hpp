#pragma once

#include <cstddef>
#include <string_view>

#include "portico/http-status-code.hpp"

namespace portico::http {

// Header field names are case-insensitive (RFC 9110 §5.1). They are stored here in their canonical
// form for emission; parsing code compares them with CaseInsensitiveEqual.

// Version
inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Standard Header Field Names
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Expect = "Expect";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

// Common Header Values (lowercase tokens, compared case-insensitively)
inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view close = "close";
inline constexpr std::string_view chunked = "chunked";
inline constexpr std::string_view h100_continue = "100-continue";

inline constexpr std::string_view HTTP11_100_CONTINUE = "HTTP/1.1 100 Continue\r\n\r\n";

// Reason Phrases
inline constexpr std::string_view ReasonOK = "OK";                                               // 200
inline constexpr std::string_view ReasonCreated = "Created";                                     // 201
inline constexpr std::string_view ReasonAccepted = "Accepted";                                   // 202
inline constexpr std::string_view ReasonNoContent = "No Content";                                // 204
inline constexpr std::string_view ReasonBadRequest = "Bad Request";                              // 400
inline constexpr std::string_view ReasonUnauthorized = "Unauthorized";                           // 401
inline constexpr std::string_view ReasonNotFound = "Not Found";                                  // 404
inline constexpr std::string_view ReasonMethodNotAllowed = "Method Not Allowed";                 // 405
inline constexpr std::string_view ReasonRequestTimeout = "Request Timeout";                      // 408
inline constexpr std::string_view ReasonPayloadTooLarge = "Payload Too Large";                   // 413
inline constexpr std::string_view ReasonHeadersTooLarge = "Request Header Fields Too Large";     // 431
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";           // 500
inline constexpr std::string_view ReasonNotImplemented = "Not Implemented";                      // 501
inline constexpr std::string_view ReasonHTTPVersionNotSupported = "HTTP Version Not Supported";  // 505

// Content type
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";

// Return the canonical reason phrase for the status codes the server emits, empty for others.
constexpr std::string_view ReasonPhraseFor(http::StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeCreated:
      return ReasonCreated;
    case StatusCodeAccepted:
      return ReasonAccepted;
    case StatusCodeNoContent:
      return ReasonNoContent;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeUnauthorized:
      return ReasonUnauthorized;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeMethodNotAllowed:
      return ReasonMethodNotAllowed;
    case StatusCodeRequestTimeout:
      return ReasonRequestTimeout;
    case StatusCodePayloadTooLarge:
      return ReasonPayloadTooLarge;
    case StatusCodeRequestHeaderFieldsTooLarge:
      return ReasonHeadersTooLarge;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    case StatusCodeNotImplemented:
      return ReasonNotImplemented;
    case StatusCodeHTTPVersionNotSupported:
      return ReasonHTTPVersionNotSupported;
    default:
      return {};
  }
}

}  // namespace portico::http
