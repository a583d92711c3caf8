#pragma once

#include <string>
#include <string_view>

#include "matreg/core/errors.hpp"

namespace matreg::security {

    struct StrengthCheck {
        bool ok{false};
        const char* reason{""}; // static text, "OK" when ok
    };

    // At least 8 characters with an uppercase letter, a lowercase letter and a digit.
    [[nodiscard]] StrengthCheck password_strength(std::string_view password) noexcept;

    inline constexpr unsigned kTemporaryPasswordLength = 12;

    // Password capability injected into account operations.
    class PasswordHasher {
    public:
        virtual ~PasswordHasher() = default;

        // Self-describing encoded hash (algorithm, parameters and salt included).
        [[nodiscard]] virtual matreg::core::Status hash(std::string_view password, std::string* out) const noexcept = 0;

        // False on mismatch and on a malformed stored hash.
        [[nodiscard]] virtual bool verify(std::string_view password, std::string_view stored) const noexcept = 0;

        [[nodiscard]] virtual StrengthCheck strength_check(std::string_view password) const noexcept {
            return password_strength(password);
        }

        [[nodiscard]] virtual matreg::core::Status generate_temporary(std::string* out) const noexcept = 0;
    };

    // Argon2id through libsodium's crypto_pwhash_str at the interactive limits.
    class SodiumPasswordHasher final : public PasswordHasher {
    public:
        [[nodiscard]] matreg::core::Status hash(std::string_view password, std::string* out) const noexcept override;
        [[nodiscard]] bool verify(std::string_view password, std::string_view stored) const noexcept override;
        // Always passes password_strength.
        [[nodiscard]] matreg::core::Status generate_temporary(std::string* out) const noexcept override;
    };

} // namespace matreg::security
