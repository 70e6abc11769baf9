#include <gtest/gtest.h>
#include "cipher/Null/null.hpp"
#include "cipher/Caesar/caesar.hpp"
#include "cipher/Vignere/vignere.hpp"
#include "utils/errors.hpp"
#include <string>
#include <vector>

// ------------------------------------------------------------
// NullCipher
// ------------------------------------------------------------
TEST(NullCipher, IdentityEverywhere)
{
    NullCipher cipher("any key at all");
    const std::string text = "Mixed case, digits 123 & punctuation!";

    EXPECT_EQ(cipher.prepare(text), text);
    EXPECT_EQ(cipher.encrypt(text), text);
    EXPECT_EQ(cipher.decrypt(text), text);
    EXPECT_EQ(NullCipher().encrypt(""), "");
}

// ------------------------------------------------------------
// CaesarCipher
// ------------------------------------------------------------
TEST(CaesarCipher, KeyLetterGivesShift)
{
    CaesarCipher b("B");
    EXPECT_EQ(b.shift(), 1);
    EXPECT_EQ(b.encrypt("A"), "B");
    EXPECT_EQ(b.encrypt("Z"), "A");

    // only the first letter counts
    EXPECT_EQ(CaesarCipher("DOG").shift(), 3);
}

TEST(CaesarCipher, ClassicVector)
{
    CaesarCipher cipher(3);
    std::string prepped = cipher.prepare("Hello, world");
    EXPECT_EQ(prepped, "HELLOWORLD");
    EXPECT_EQ(cipher.encrypt(prepped), "KHOORZRUOG");
    EXPECT_EQ(cipher.decrypt("KHOORZRUOG"), "HELLOWORLD");
}

TEST(CaesarCipher, IntegerShiftReducedModulo26)
{
    EXPECT_EQ(CaesarCipher(27).shift(), 1);
    EXPECT_EQ(CaesarCipher(-1).shift(), 25);
    EXPECT_EQ(CaesarCipher(-1).encrypt("A"), "Z");
}

// shift 0 is clean() followed by the identity
TEST(CaesarCipher, ZeroShiftIsNullAfterClean)
{
    CaesarCipher zero(0);
    CaesarCipher keyA("A");
    const std::string text = "Attack at dawn!";

    EXPECT_EQ(zero.encrypt(zero.prepare(text)), "ATTACKATDAWN");
    EXPECT_EQ(keyA.encrypt(keyA.prepare(text)), "ATTACKATDAWN");
}

TEST(CaesarCipher, KeyIsNotCleaned)
{
    const std::vector<std::string> badKeys = { "", " ", "a", "aB", "#A", " B" };
    for (const auto& k : badKeys) {
        EXPECT_THROW(CaesarCipher{ k }, ConstructionError) << "key '" << k << "'";
    }

    const std::vector<std::string> goodKeys = { "B", "ABCDEF", "XYZ", "Qq" };
    for (const auto& k : goodKeys) {
        EXPECT_NO_THROW(CaesarCipher{ k }) << "key '" << k << "'";
    }
}

TEST(CaesarCipher, EncryptRejectsUnpreparedText)
{
    CaesarCipher cipher("C");
    EXPECT_THROW(cipher.encrypt("abc"), InvalidInputError);
    EXPECT_THROW(cipher.decrypt("A B"), InvalidInputError);
}

// ------------------------------------------------------------
// VignereCipher
// ------------------------------------------------------------
TEST(VignereCipher, ClassicVector)
{
    VignereCipher cipher("LEMON");
    std::string prepped = cipher.prepare("attack at dawn");
    EXPECT_EQ(prepped, "ATTACKATDAWN");
    EXPECT_EQ(cipher.encrypt(prepped), "LXFOPVEFRNHR");
    EXPECT_EQ(cipher.decrypt("LXFOPVEFRNHR"), "ATTACKATDAWN");
}

TEST(VignereCipher, SingleLetterKeyActsLikeCaesar)
{
    VignereCipher vignere("D");
    CaesarCipher caesar("D");
    EXPECT_EQ(vignere.encrypt("HELLOWORLD"), caesar.encrypt("HELLOWORLD"));
}

TEST(VignereCipher, KeyMustAlreadyBeClean)
{
    const std::vector<std::string> badKeys = { "", " ", " ABCD", "ABCd", "aBCD", "AB-CD" };
    for (const auto& k : badKeys) {
        EXPECT_THROW(VignereCipher{ k }, ConstructionError) << "key '" << k << "'";
    }

    const std::vector<std::string> goodKeys = { "A", "ABCD", "ZYXWVUTSR" };
    for (const auto& k : goodKeys) {
        EXPECT_NO_THROW(VignereCipher{ k }) << "key '" << k << "'";
    }
}

TEST(VignereCipher, EmptyTextPassesThrough)
{
    VignereCipher cipher("KEY");
    EXPECT_EQ(cipher.encrypt(""), "");
    EXPECT_EQ(cipher.decrypt(""), "");
}
