#pragma once
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <memory>
#include <string>
#include <string_view>
namespace beacon::node::crypto {

struct EVP_PKEY_Deleter {
    void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};
struct EVP_PKEY_CTX_Deleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
struct EVP_MD_CTX_Deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
struct X509_Deleter {
    void operator()(X509* cert) const { X509_free(cert); }
};
struct BIO_Deleter {
    void operator()(BIO* bio) const { BIO_free_all(bio); }
};
struct BIGNUM_Deleter {
    void operator()(BIGNUM* bn) const { BN_free(bn); }
};
struct OPENSSL_String_Deleter {
    void operator()(char* str) const { OPENSSL_free(str); }
};

using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, EVP_PKEY_Deleter>;
using EVP_PKEY_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_Deleter>;
using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter>;
using X509_ptr = std::unique_ptr<X509, X509_Deleter>;
using BIO_ptr = std::unique_ptr<BIO, BIO_Deleter>;
using BIGNUM_ptr = std::unique_ptr<BIGNUM, BIGNUM_Deleter>;
using OPENSSL_String_ptr = std::unique_ptr<char, OPENSSL_String_Deleter>;

/**
 * @brief Pops the oldest entry of the thread's OpenSSL error queue as text
 *
 * The rest of the queue is cleared so a later call starts clean.
 */
[[nodiscard]] std::string GetOpenSSLError();

/**
 * @brief Read-only memory BIO over text that outlives the BIO
 */
[[nodiscard]] BIO_ptr MakeReadBio(std::string_view text);

/**
 * @brief Drains a memory BIO into a string
 */
[[nodiscard]] std::string DrainBio(BIO* bio);

}
