#include "matreg/security/password.hpp"

#include <cctype>
#include <cstdint>
#include <string>
#include <utility>

#include <sodium.h>

namespace matreg::security {
    namespace {
        constexpr char kAlphabet[] =
            "abcdefghijklmnopqrstuvwxyz"
            "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
            "0123456789"
            "!@#$%^&*";

        constexpr int kTemporaryMaxDraws = 64;

        [[nodiscard]] matreg::core::Status ensure_sodium() noexcept {
            if (sodium_init() < 0) {
                return matreg::core::make_status(matreg::core::StatusDomain::External, matreg::core::StatusCode::Unavailable);
            }
            return matreg::core::ok_status();
        }
    } // namespace

    StrengthCheck password_strength(std::string_view password) noexcept {
        if (password.size() < 8) {
            return {false, "password must be at least 8 characters long"};
        }
        bool upper = false;
        bool lower = false;
        bool digit = false;
        for (const char c : password) {
            const auto u = static_cast<unsigned char>(c);
            upper = upper || std::isupper(u) != 0;
            lower = lower || std::islower(u) != 0;
            digit = digit || std::isdigit(u) != 0;
        }
        if (!upper) {
            return {false, "password must contain an uppercase letter"};
        }
        if (!lower) {
            return {false, "password must contain a lowercase letter"};
        }
        if (!digit) {
            return {false, "password must contain a digit"};
        }
        return {true, "OK"};
    }

    matreg::core::Status SodiumPasswordHasher::hash(std::string_view password, std::string* out) const noexcept {
        if (out == nullptr) {
            return matreg::core::make_status(matreg::core::StatusDomain::Security, matreg::core::StatusCode::Invalid);
        }
        const matreg::core::Status init = ensure_sodium();
        if (!matreg::core::is_ok(init)) {
            return init;
        }

        char encoded[crypto_pwhash_STRBYTES];
        const int rc = crypto_pwhash_str(encoded,
            password.data(),
            static_cast<unsigned long long>(password.size()),
            crypto_pwhash_OPSLIMIT_INTERACTIVE,
            crypto_pwhash_MEMLIMIT_INTERACTIVE);
        if (rc != 0) {
            return matreg::core::make_status(matreg::core::StatusDomain::Security, matreg::core::StatusCode::Crypto);
        }
        try {
            out->assign(encoded);
        } catch (const std::exception&) {
            sodium_memzero(encoded, sizeof(encoded));
            return matreg::core::make_status(matreg::core::StatusDomain::Security, matreg::core::StatusCode::Unavailable);
        }
        sodium_memzero(encoded, sizeof(encoded));
        return matreg::core::ok_status();
    }

    bool SodiumPasswordHasher::verify(std::string_view password, std::string_view stored) const noexcept {
        if (!matreg::core::is_ok(ensure_sodium())) {
            return false;
        }
        // crypto_pwhash_str_verify wants a NUL-terminated string that fits in STRBYTES.
        if (stored.empty() || stored.size() >= crypto_pwhash_STRBYTES) {
            return false;
        }
        char encoded[crypto_pwhash_STRBYTES] = {};
        stored.copy(encoded, stored.size());
        return crypto_pwhash_str_verify(encoded, password.data(), static_cast<unsigned long long>(password.size())) == 0;
    }

    matreg::core::Status SodiumPasswordHasher::generate_temporary(std::string* out) const noexcept {
        if (out == nullptr) {
            return matreg::core::make_status(matreg::core::StatusDomain::Security, matreg::core::StatusCode::Invalid);
        }
        const matreg::core::Status init = ensure_sodium();
        if (!matreg::core::is_ok(init)) {
            return init;
        }
        try {
            // Redraw until the result passes password_strength; about 1 in 9 draws does not.
            std::string pw(kTemporaryPasswordLength, '\0');
            for (int attempt = 0; attempt < kTemporaryMaxDraws; ++attempt) {
                for (char& c : pw) {
                    c = kAlphabet[randombytes_uniform(static_cast<uint32_t>(sizeof(kAlphabet) - 1))];
                }
                if (password_strength(pw).ok) {
                    *out = std::move(pw);
                    return matreg::core::ok_status();
                }
            }
        } catch (const std::exception&) {
            return matreg::core::make_status(matreg::core::StatusDomain::Security, matreg::core::StatusCode::Unavailable);
        }
        return matreg::core::make_status(matreg::core::StatusDomain::Security, matreg::core::StatusCode::Crypto);
    }

} // namespace matreg::security
