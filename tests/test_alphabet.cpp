#include <gtest/gtest.h>
#include "utils/Alphabet.hpp"
#include "utils/errors.hpp"

// clean drops case, blanks and punctuation
TEST(Alphabet, CleanStripsNonLetters)
{
    EXPECT_EQ(utils::clean(""), "");
    EXPECT_EQ(utils::clean("a1! B"), "AB");
    EXPECT_EQ(utils::clean("  Call me Ishmael.\n"), "CALLMEISHMAEL");
    EXPECT_EQ(utils::clean("123 !?"), "");
}

// clean is idempotent
TEST(Alphabet, CleanIdempotent)
{
    const std::string once = utils::clean("Some years ago -- never mind how long");
    EXPECT_EQ(utils::clean(once), once);
}

TEST(Alphabet, ModAlwaysNonNegative)
{
    EXPECT_EQ(utils::mod(-1, 26), 25);
    EXPECT_EQ(utils::mod(5, 26), 5);
    EXPECT_EQ(utils::mod(26, 26), 0);
    EXPECT_EQ(utils::mod(-27, 26), 25);
    EXPECT_EQ(utils::mod(7, 1), 0);
}

TEST(Alphabet, ModRejectsSmallModulus)
{
    EXPECT_THROW(utils::mod(5, 0), InvalidInputError);
    EXPECT_THROW(utils::mod(5, -3), InvalidInputError);
}

TEST(Alphabet, ShiftCharWrapsAround)
{
    EXPECT_EQ(utils::shift('A', 1), 'B');
    EXPECT_EQ(utils::shift('Z', 1), 'A');
    EXPECT_EQ(utils::shift('A', -1), 'Z');
    EXPECT_EQ(utils::shift('M', 26 * 3), 'M');
}

TEST(Alphabet, ShiftRejectsNonAlphabet)
{
    EXPECT_THROW(utils::shift('a', 1), InvalidInputError);
    EXPECT_THROW(utils::shift(' ', 1), InvalidInputError);
    EXPECT_THROW(utils::shift(std::string("AB C"), 1), InvalidInputError);
}

TEST(Alphabet, ShiftString)
{
    EXPECT_EQ(utils::shift(std::string("HELLO"), 3), "KHOOR");
    EXPECT_EQ(utils::shift(std::string("KHOOR"), -3), "HELLO");
    EXPECT_EQ(utils::shift(std::string(""), 5), "");
}

TEST(Alphabet, GroupSplitsEveryN)
{
    EXPECT_EQ(utils::group("ABCDE", 2), "AB CD E");
    EXPECT_EQ(utils::group("ABCDEF", 2), "AB CD EF");
    EXPECT_EQ(utils::group("ABCDEFGHIJ", 5), "ABCDE FGHIJ");
    EXPECT_EQ(utils::group("ABC", 1), "A B C");
    EXPECT_EQ(utils::group("ABC", 10), "ABC");
    EXPECT_EQ(utils::group("", 3), "");
}

// regrouping grouped text gives the same grouping
TEST(Alphabet, GroupIgnoresExistingSpaces)
{
    EXPECT_EQ(utils::group("AB CD E", 2), "AB CD E");
    EXPECT_EQ(utils::group("AB CD E", 3), "ABC DE");
}

TEST(Alphabet, GroupRejectsSmallSize)
{
    EXPECT_THROW(utils::group("ABC", 0), InvalidInputError);
    EXPECT_THROW(utils::group("", -1), InvalidInputError);
}
