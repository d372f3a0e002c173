#include "portico/test-tls-helper.hpp"

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <atomic>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

#include "portico/tls-raii.hpp"

namespace portico::test {

namespace {

using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&::EVP_PKEY_CTX_free)>;

std::atomic<long> gSerial{1};

PKeyPtr GenerateKey(KeyAlgorithm alg) {
  const bool rsa = alg == KeyAlgorithm::Rsa2048;
  PkeyCtxPtr kctx(::EVP_PKEY_CTX_new_from_name(nullptr, rsa ? "RSA" : "EC", nullptr), ::EVP_PKEY_CTX_free);
  if (kctx == nullptr || ::EVP_PKEY_keygen_init(kctx.get()) != 1) {
    throw std::runtime_error("EVP_PKEY_keygen_init failed");
  }
  if (rsa) {
    if (::EVP_PKEY_CTX_set_rsa_keygen_bits(kctx.get(), 2048) != 1) {
      throw std::runtime_error("EVP_PKEY_CTX_set_rsa_keygen_bits failed");
    }
  } else if (::EVP_PKEY_CTX_set_ec_paramgen_curve_nid(kctx.get(), NID_X9_62_prime256v1) != 1) {
    throw std::runtime_error("EVP_PKEY_CTX_set_ec_paramgen_curve_nid failed");
  }
  EVP_PKEY* pkey = nullptr;
  if (::EVP_PKEY_keygen(kctx.get(), &pkey) != 1) {
    throw std::runtime_error("EVP_PKEY_keygen failed");
  }
  return {pkey, ::EVP_PKEY_free};
}

X509Ptr NewCertificate(const char* commonName, int validSeconds, EVP_PKEY* pkey) {
  X509Ptr x509(::X509_new(), ::X509_free);
  if (!x509) {
    throw std::bad_alloc();
  }
  ::X509_set_version(x509.get(), 2);
  ::ASN1_INTEGER_set(::X509_get_serialNumber(x509.get()), gSerial.fetch_add(1));
  ::X509_gmtime_adj(::X509_getm_notBefore(x509.get()), -60);
  ::X509_gmtime_adj(::X509_getm_notAfter(x509.get()), validSeconds);
  ::X509_set_pubkey(x509.get(), pkey);
  X509_NAME* name = ::X509_get_subject_name(x509.get());
  ::X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("PorticoTest"), -1, -1,
                               0);
  ::X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>(commonName), -1, -1,
                               0);
  return x509;
}

void AddExtension(X509* cert, X509* issuer, int nid, const char* value) {
  X509V3_CTX ctx;
  X509V3_set_ctx_nodb(&ctx);
  ::X509V3_set_ctx(&ctx, issuer, cert, nullptr, nullptr, 0);
  X509_EXTENSION* ext = ::X509V3_EXT_conf_nid(nullptr, &ctx, nid, value);
  if (ext == nullptr) {
    throw std::runtime_error("X509V3_EXT_conf_nid failed");
  }
  const int ret = ::X509_add_ext(cert, ext, -1);
  ::X509_EXTENSION_free(ext);
  if (ret != 1) {
    throw std::runtime_error("X509_add_ext failed");
  }
}

CertKeyPem ToPem(X509* x509, EVP_PKEY* pkey) {
  CertKeyPem out;
  {
    auto bio = MakeMemoryBio();
    if (::PEM_write_bio_X509(bio.get(), x509) != 1) {
      throw std::runtime_error("PEM_write_bio_X509 failed");
    }
    char* data = nullptr;
    const long len = BIO_get_mem_data(bio.get(), &data);
    out.certPem.assign(data, static_cast<std::size_t>(len));
  }
  {
    auto bio = MakeMemoryBio();
    if (::PEM_write_bio_PrivateKey(bio.get(), pkey, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
      throw std::runtime_error("PEM_write_bio_PrivateKey failed");
    }
    char* data = nullptr;
    const long len = BIO_get_mem_data(bio.get(), &data);
    out.keyPem.assign(data, static_cast<std::size_t>(len));
  }
  return out;
}

void Sign(X509* x509, EVP_PKEY* signingKey) {
  if (::X509_sign(x509, signingKey, ::EVP_sha256()) <= 0) {
    throw std::runtime_error("X509_sign failed");
  }
}

}  // namespace

CertKeyPem MakeEphemeralCertKey(const char* commonName, int validSeconds, KeyAlgorithm alg) {
  auto pkey = GenerateKey(alg);
  auto x509 = NewCertificate(commonName, validSeconds, pkey.get());
  ::X509_set_issuer_name(x509.get(), ::X509_get_subject_name(x509.get()));
  AddExtension(x509.get(), x509.get(), NID_subject_alt_name, "DNS:localhost,IP:127.0.0.1");
  Sign(x509.get(), pkey.get());
  return ToPem(x509.get(), pkey.get());
}

CertKeyPem MakeCertificateAuthority(const char* commonName, int validSeconds) {
  auto pkey = GenerateKey(KeyAlgorithm::EcdsaP256);
  auto x509 = NewCertificate(commonName, validSeconds, pkey.get());
  ::X509_set_issuer_name(x509.get(), ::X509_get_subject_name(x509.get()));
  AddExtension(x509.get(), x509.get(), NID_basic_constraints, "critical,CA:TRUE");
  AddExtension(x509.get(), x509.get(), NID_key_usage, "critical,keyCertSign,cRLSign");
  AddExtension(x509.get(), x509.get(), NID_subject_key_identifier, "hash");
  Sign(x509.get(), pkey.get());
  return ToPem(x509.get(), pkey.get());
}

CertKeyPem MakeSignedCertKey(const CertKeyPem& issuer, const char* commonName, int validSeconds, KeyAlgorithm alg) {
  auto issuerCertBio = MakeMemBio(issuer.certPem.data(), static_cast<int>(issuer.certPem.size()));
  auto issuerKeyBio = MakeMemBio(issuer.keyPem.data(), static_cast<int>(issuer.keyPem.size()));
  X509Ptr issuerCert(::PEM_read_bio_X509(issuerCertBio.get(), nullptr, nullptr, nullptr), ::X509_free);
  PKeyPtr issuerKey(::PEM_read_bio_PrivateKey(issuerKeyBio.get(), nullptr, nullptr, nullptr), ::EVP_PKEY_free);
  if (!issuerCert || !issuerKey) {
    throw std::runtime_error("invalid issuer PEM material");
  }

  auto pkey = GenerateKey(alg);
  auto x509 = NewCertificate(commonName, validSeconds, pkey.get());
  ::X509_set_issuer_name(x509.get(), ::X509_get_subject_name(issuerCert.get()));
  AddExtension(x509.get(), issuerCert.get(), NID_basic_constraints, "CA:FALSE");
  AddExtension(x509.get(), issuerCert.get(), NID_authority_key_identifier, "keyid:always");
  Sign(x509.get(), issuerKey.get());
  return ToPem(x509.get(), pkey.get());
}

}  // namespace portico::test
