#pragma once
#include <array>
#include <string>

// Playfair digram cipher over a 5x5 key square (I and J share a cell).
class PlayfairCipher
{
public:
    static constexpr int SIZE = 5;
    using Matrix = std::array<std::array<char, SIZE>, SIZE>;

    // Square = clean(key) + ALPHABET, J -> I, first occurrences only, row-major.
    // An empty key gives the plain alphabet square.
    explicit PlayfairCipher(const std::string& key);

    // clean, J -> I, split identical pairs with a filler, pad to even length.
    // The filler is 'X' ('Q' when splitting "XX"); the pad is 'Z' ('X' after a
    // trailing 'Z'), so the result never holds a same-letter digram.
    std::string prepare(const std::string& cleartext) const;

    // Both expect prepare() output: even length, letters of the square only,
    // no same-letter digram. Anything else throws InvalidInputError.
    std::string encrypt(const std::string& preptext) const;
    std::string decrypt(const std::string& ciphertext) const;

    const Matrix& matrix() const { return square; }

    // the 25 square letters in row-major order
    std::string keySquare() const;

private:
    static constexpr int ENCRYPT = 1;
    static constexpr int DECRYPT = -1;

    std::string transform(const std::string& text, int delta) const;

    Matrix square{};
    // ALPHABET index -> row * SIZE + col, -1 for J
    std::array<int, 26> position{};
};
