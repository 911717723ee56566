#include "beacon/crypto/openssl_handles.hpp"
#include "beacon/core/constants.hpp"
#include <openssl/buffer.h>
#include <openssl/err.h>
#include <limits>
namespace beacon::node::crypto {
using OpenSSL = OpenSSLConstants;

std::string GetOpenSSLError() {
    const unsigned long err = ERR_get_error();
    ERR_clear_error();
    if (err == OpenSSL::NO_ERROR) {
        return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
    }
    char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    return std::string(buffer);
}

BIO_ptr MakeReadBio(const std::string_view text) {
    if (text.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return BIO_ptr(nullptr);
    }
    return BIO_ptr(BIO_new_mem_buf(text.data(), static_cast<int>(text.size())));
}

std::string DrainBio(BIO* bio) {
    BUF_MEM* mem = nullptr;
    BIO_get_mem_ptr(bio, &mem);
    if (mem == nullptr || mem->data == nullptr) {
        return {};
    }
    return std::string(mem->data, mem->length);
}

}
