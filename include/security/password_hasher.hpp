#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tenantdb {

/**
 * @brief PBKDF2-HMAC-SHA256 password hashes for tenant owner accounts.
 *
 * Stored form: base64(salt || hash), 16-byte salt, 32-byte hash,
 * 100000 iterations.
 */
class PasswordHasher {
public:
    static constexpr size_t kSaltSize = 16;
    static constexpr size_t kHashSize = 32;
    static constexpr uint32_t kIterations = 100000;

    // Hash with a fresh random salt
    [[nodiscard]] static std::string hash(std::string_view password);

    // Hash with a caller-provided salt (deterministic)
    [[nodiscard]] static std::string hash_with_salt(std::string_view password,
                                                    const std::vector<uint8_t>& salt);

    // Constant-time comparison; false for any malformed stored hash
    [[nodiscard]] static bool verify(std::string_view password, std::string_view stored_hash);

private:
    static std::vector<uint8_t> derive(std::string_view password, const uint8_t* salt, size_t salt_len);
};

} // namespace tenantdb
