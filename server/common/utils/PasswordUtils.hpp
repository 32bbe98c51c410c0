#pragma once

/**
 * @brief 操作员密码哈希（PBKDF2-HMAC-SHA256）
 *
 * 存储格式 "<salt hex>$<hash hex>"，写在 custom_config.operators[].password_hash。
 * 生成方式：hazard-monitor --hash-password <明文>
 */
class PasswordUtils {
public:
    static constexpr int SALT_BYTES = 16;
    static constexpr int ITERATIONS = 10000;
    static constexpr int HASH_BYTES = 32;

    /**
     * @throws std::runtime_error 随机数源不可用
     */
    static std::string hashPassword(const std::string& password) {
        std::array<unsigned char, SALT_BYTES> salt{};
        if (RAND_bytes(salt.data(), SALT_BYTES) != 1) {
            throw std::runtime_error("RAND_bytes failed while generating password salt");
        }
        std::vector<unsigned char> saltBytes(salt.begin(), salt.end());
        return toHex(saltBytes) + "$" + derive(password, saltBytes);
    }

    static bool verifyPassword(const std::string& password, const std::string& stored) {
        auto sep = stored.find('$');
        if (sep == std::string::npos || sep == 0) return false;

        auto salt = fromHex(std::string_view(stored).substr(0, sep));
        if (!salt) return false;

        auto expected = std::string_view(stored).substr(sep + 1);
        auto actual = derive(password, *salt);
        return actual.size() == expected.size()
            && CRYPTO_memcmp(actual.data(), expected.data(), actual.size()) == 0;
    }

private:
    static std::string derive(const std::string& password, const std::vector<unsigned char>& salt) {
        std::vector<unsigned char> out(HASH_BYTES);
        PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          ITERATIONS, EVP_sha256(), HASH_BYTES, out.data());
        return toHex(out);
    }

    static std::string toHex(const std::vector<unsigned char>& bytes) {
        static constexpr char digits[] = "0123456789abcdef";
        std::string hex;
        hex.reserve(bytes.size() * 2);
        for (auto b : bytes) {
            hex.push_back(digits[b >> 4]);
            hex.push_back(digits[b & 0x0f]);
        }
        return hex;
    }

    static std::optional<std::vector<unsigned char>> fromHex(std::string_view hex) {
        if (hex.size() % 2 != 0) return std::nullopt;
        std::vector<unsigned char> bytes(hex.size() / 2);
        for (size_t i = 0; i < bytes.size(); ++i) {
            auto [ptr, ec] = std::from_chars(hex.data() + 2 * i, hex.data() + 2 * i + 2, bytes[i], 16);
            if (ec != std::errc() || ptr != hex.data() + 2 * i + 2) return std::nullopt;
        }
        return bytes;
    }
};
