// meter/crypto_utils.cpp
#include "crypto_utils.hpp"
#include <memory>
#include <stdexcept>
#include <vector>
#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/x509.h>

namespace {

bool read_certificate(BIO* bio) {
    if (!bio) return false;
    std::unique_ptr<X509, decltype(&X509_free)> cert(
        PEM_read_bio_X509(bio, nullptr, nullptr, nullptr), X509_free);
    return cert != nullptr;
}

}

std::string random_hex(size_t bytes) {
    std::vector<unsigned char> buf(bytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }

    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes * 2);
    for (unsigned char b : buf) {
        out += digits[b >> 4];
        out += digits[b & 0x0f];
    }
    return out;
}

bool is_pem_certificate(const std::string& pem) {
    if (pem.empty()) return false;
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(
        BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), BIO_free);
    return read_certificate(bio.get());
}

bool is_pem_certificate_file(const std::string& path) {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new_file(path.c_str(), "r"), BIO_free);
    return read_certificate(bio.get());
}
