#include "security/password_hasher.hpp"
#include "core/base64.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>

namespace tenantdb {

std::vector<uint8_t> PasswordHasher::derive(std::string_view password, const uint8_t* salt, size_t salt_len) {
    std::vector<uint8_t> out(kHashSize);
    if (PKCS5_PBKDF2_HMAC(
            password.data(), static_cast<int>(password.size()),
            salt, static_cast<int>(salt_len),
            static_cast<int>(kIterations),
            EVP_sha256(),
            static_cast<int>(kHashSize), out.data()) != 1) {
        throw std::runtime_error("PKCS5_PBKDF2_HMAC failed");
    }
    return out;
}

std::string PasswordHasher::hash(std::string_view password) {
    std::vector<uint8_t> salt(kSaltSize);
    if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return hash_with_salt(password, salt);
}

std::string PasswordHasher::hash_with_salt(std::string_view password, const std::vector<uint8_t>& salt) {
    if (salt.size() != kSaltSize) {
        throw std::invalid_argument("Password salt must be 16 bytes");
    }
    const auto derived = derive(password, salt.data(), salt.size());

    std::vector<uint8_t> combined;
    combined.reserve(kSaltSize + kHashSize);
    combined.insert(combined.end(), salt.begin(), salt.end());
    combined.insert(combined.end(), derived.begin(), derived.end());
    return base64::encode(combined);
}

bool PasswordHasher::verify(std::string_view password, std::string_view stored_hash) {
    const auto decoded = base64::decode(stored_hash);
    if (!decoded || decoded->size() != kSaltSize + kHashSize) {
        return false;
    }

    const auto derived = derive(password, decoded->data(), kSaltSize);
    return CRYPTO_memcmp(derived.data(), decoded->data() + kSaltSize, kHashSize) == 0;
}

} // namespace tenantdb
