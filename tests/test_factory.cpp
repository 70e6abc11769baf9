#include <gtest/gtest.h>
#include "core/cipherFactory.hpp"
#include "utils/errors.hpp"
#include <string>
#include <vector>

TEST(CipherFactory, NamesInKindOrder)
{
    const std::vector<std::string> expected = {
        "CAESAR_CIPHER", "NULL_CIPHER", "PLAYFAIR_CIPHER", "PSEUDO_ONE_TIME_PAD", "VIGNERE_CIPHER"
    };
    EXPECT_EQ(CipherFactory::kindNames(), expected);
}

TEST(CipherFactory, ParseKindRoundTripsNames)
{
    for (const auto& name : CipherFactory::kindNames()) {
        EXPECT_EQ(CipherFactory::kindName(CipherFactory::parseKind(name)), name);
    }
    EXPECT_EQ(CipherFactory::parseKind("playfair_cipher"), CipherKind::PLAYFAIR_CIPHER);
}

TEST(CipherFactory, ParseKindRejectsUnknown)
{
    EXPECT_THROW(CipherFactory::parseKind("ENIGMA"), UnknownCipherNameError);
    EXPECT_THROW(CipherFactory::parseKind(""), UnknownCipherNameError);
    EXPECT_THROW(CipherFactory::parseKind("CAESAR"), UnknownCipherNameError);
}

// create() builds the variant alternative matching the kind
TEST(CipherFactory, CreateBuildsMatchingKind)
{
    for (const auto& name : CipherFactory::kindNames()) {
        CipherKind kind = CipherFactory::parseKind(name);
        CipherInstance cipher = CipherFactory::create(kind, "KEY");
        EXPECT_EQ(kindOf(cipher), kind) << name;
    }
    EXPECT_TRUE(std::holds_alternative<PlayfairCipher>(CipherFactory::create(CipherKind::PLAYFAIR_CIPHER, "")));
}

TEST(CipherFactory, CreateRejectsBadKeys)
{
    EXPECT_THROW(CipherFactory::create(CipherKind::CAESAR_CIPHER, "a"), ConstructionError);
    EXPECT_THROW(CipherFactory::create(CipherKind::VIGNERE_CIPHER, "ABCd"), ConstructionError);
    EXPECT_NO_THROW(CipherFactory::create(CipherKind::PSEUDO_ONE_TIME_PAD, ""));
    EXPECT_NO_THROW(CipherFactory::create(CipherKind::NULL_CIPHER, ""));
}

// dispatch through the variant reaches the right cipher
TEST(CipherFactory, DispatchUsesLiveAlternative)
{
    CipherInstance caesar = CipherFactory::create(CipherKind::CAESAR_CIPHER, "D");
    EXPECT_EQ(prepare(caesar, "hello!"), "HELLO");
    EXPECT_EQ(encrypt(caesar, "HELLO"), "KHOOR");
    EXPECT_EQ(decrypt(caesar, "KHOOR"), "HELLO");

    CipherInstance none = CipherFactory::create(CipherKind::NULL_CIPHER, "D");
    EXPECT_EQ(prepare(none, "hello!"), "hello!");
}
