#pragma once

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <memory>
#include <new>

namespace portico {

// Function pointer deleters keep each alias the size of one pointer.
using SslCtxPtr = std::unique_ptr<SSL_CTX, decltype(&::SSL_CTX_free)>;
using SslPtr = std::unique_ptr<SSL, decltype(&::SSL_free)>;
using BioPtr = std::unique_ptr<BIO, decltype(&::BIO_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&::X509_free)>;
using PKeyPtr = std::unique_ptr<EVP_PKEY, decltype(&::EVP_PKEY_free)>;

// The Make* helpers throw std::bad_alloc when OpenSSL returns nullptr.
inline BioPtr MakeBio(BIO* bio) {
  if (bio == nullptr) {
    throw std::bad_alloc();
  }
  return {bio, ::BIO_free};
}

inline BioPtr MakeMemBio(const void* data, int len) { return MakeBio(::BIO_new_mem_buf(data, len)); }

inline BioPtr MakeMemoryBio() { return MakeBio(::BIO_new(::BIO_s_mem())); }

inline SslCtxPtr MakeSslCtx(SSL_CTX* ctx) {
  if (ctx == nullptr) {
    throw std::bad_alloc();
  }
  return {ctx, ::SSL_CTX_free};
}

inline SslPtr MakeSsl(SSL* ssl) {
  if (ssl == nullptr) {
    throw std::bad_alloc();
  }
  return {ssl, ::SSL_free};
}

}  // namespace portico
