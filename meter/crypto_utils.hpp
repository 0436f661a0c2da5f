// meter/crypto_utils.hpp
#pragma once
#include <string>
#include <cstddef>

// Hex string of `bytes` random bytes from the OpenSSL CSPRNG.
// Throws std::runtime_error if the generator is not seeded.
std::string random_hex(size_t bytes);

// True if `pem` holds at least one PEM encoded X.509 certificate.
bool is_pem_certificate(const std::string& pem);

bool is_pem_certificate_file(const std::string& path);
