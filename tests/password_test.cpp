#include <cctype>
#include <cstring>
#include <string>

#include <gtest/gtest.h>

#include "matreg/security/password.hpp"

using namespace matreg::security;
using matreg::core::is_ok;

namespace {

constexpr const char* kAdminHash =
    "$argon2id$v=19$m=65536,t=2,p=1$bJxKLYNeTmUlkIhgXvcLrw$08UoOFqxhPe/1CNqhFidqZl/TWXTSENmfMPJCPlm4Dk";

} // namespace

TEST(PasswordStrength, Rules) {
    EXPECT_FALSE(password_strength("Ab1").ok);
    EXPECT_FALSE(password_strength("abcdefg1").ok);
    EXPECT_FALSE(password_strength("ABCDEFG1").ok);
    EXPECT_FALSE(password_strength("Abcdefgh").ok);

    const StrengthCheck good = password_strength("Abcdefg1");
    EXPECT_TRUE(good.ok);
    EXPECT_STREQ(good.reason, "OK");

    EXPECT_NE(std::strstr(password_strength("short").reason, "8"), nullptr);
}

TEST(SodiumPasswordHasher, HashAndVerify) {
    const SodiumPasswordHasher hasher;
    std::string h1;
    ASSERT_TRUE(is_ok(hasher.hash("Secret123", &h1)));
    EXPECT_EQ(h1.rfind("$argon2id$", 0), 0u);
    EXPECT_TRUE(hasher.verify("Secret123", h1));
    EXPECT_FALSE(hasher.verify("secret123", h1));

    // Salted: the same password never hashes the same way twice.
    std::string h2;
    ASSERT_TRUE(is_ok(hasher.hash("Secret123", &h2)));
    EXPECT_NE(h1, h2);
    EXPECT_TRUE(hasher.verify("Secret123", h2));
}

TEST(SodiumPasswordHasher, VerifiesBootstrapHash) {
    const SodiumPasswordHasher hasher;
    EXPECT_TRUE(hasher.verify("admin", kAdminHash));
    EXPECT_FALSE(hasher.verify("Admin", kAdminHash));
}

TEST(SodiumPasswordHasher, MalformedHashDoesNotVerify) {
    const SodiumPasswordHasher hasher;
    EXPECT_FALSE(hasher.verify("x", ""));
    EXPECT_FALSE(hasher.verify("x", "not-a-hash"));
    EXPECT_FALSE(hasher.verify("x", std::string(1024, 'a')));
}

TEST(SodiumPasswordHasher, TemporaryPasswords) {
    const SodiumPasswordHasher hasher;
    std::string a;
    std::string b;
    ASSERT_TRUE(is_ok(hasher.generate_temporary(&a)));
    ASSERT_TRUE(is_ok(hasher.generate_temporary(&b)));
    EXPECT_EQ(a.size(), kTemporaryPasswordLength);
    EXPECT_NE(a, b);
    for (const char c : a) {
        const bool allowed = std::isalnum(static_cast<unsigned char>(c)) != 0 || std::strchr("!@#$%^&*", c) != nullptr;
        EXPECT_TRUE(allowed) << c;
    }
}

TEST(SodiumPasswordHasher, TemporaryPasswordsPassStrengthRule) {
    const SodiumPasswordHasher hasher;
    for (int i = 0; i < 200; ++i) {
        std::string pw;
        ASSERT_TRUE(is_ok(hasher.generate_temporary(&pw)));
        EXPECT_TRUE(password_strength(pw).ok) << pw << ": " << password_strength(pw).reason;
    }
}
