#include "cipher/Playfair/playfair.hpp"
#include "utils/Alphabet.hpp"
#include "utils/errors.hpp"
#include <algorithm>

namespace {

    std::string mergeJ(std::string text)
    {
        std::replace(text.begin(), text.end(), 'J', 'I');
        return text;
    }

} // namespace

PlayfairCipher::PlayfairCipher(const std::string& key)
{
    // key letters in front of the alphabet, then drop repeats
    std::string allLetters = mergeJ(utils::clean(key) + utils::ALPHABET);

    std::string letters;
    std::array<bool, 26> seen{};
    for (char c : allLetters) {
        int idx = utils::indexOf(c);
        if (!seen[idx]) {
            seen[idx] = true;
            letters.push_back(c);
        }
    }

    position.fill(-1);
    for (int i = 0; i < SIZE * SIZE; ++i) {
        square[i / SIZE][i % SIZE] = letters[i];
        position[utils::indexOf(letters[i])] = i;
    }
}

std::string PlayfairCipher::keySquare() const
{
    std::string out;
    out.reserve(SIZE * SIZE);
    for (const auto& row : square)
        out.append(row.begin(), row.end());
    return out;
}

std::string PlayfairCipher::prepare(const std::string& cleartext) const
{
    std::string text = mergeJ(utils::clean(cleartext));

    size_t i = 0;
    while (i + 1 < text.size()) {
        if (text[i] == text[i + 1])
            text.insert(i + 1, 1, text[i] == 'X' ? 'Q' : 'X');
        i += 2;
    }
    if (text.size() % 2 == 1)
        text.push_back(text.back() == 'Z' ? 'X' : 'Z');
    return text;
}

std::string PlayfairCipher::encrypt(const std::string& preptext) const
{
    return transform(preptext, ENCRYPT);
}

std::string PlayfairCipher::decrypt(const std::string& ciphertext) const
{
    return transform(ciphertext, DECRYPT);
}

std::string PlayfairCipher::transform(const std::string& text, int delta) const
{
    if (text.size() % 2 != 0)
        throw InvalidInputError("Playfair text must have even length");

    std::string out(text);
    for (size_t i = 0; i < out.size(); i += 2) {
        char c0 = out[i];
        char c1 = out[i + 1];
        if (c0 == c1)
            throw InvalidInputError("Same-letter digraph, cannot encrypt/decrypt");

        int i0 = utils::indexOf(c0);
        int i1 = utils::indexOf(c1);
        int p0 = i0 < 0 ? -1 : position[i0];
        int p1 = i1 < 0 ? -1 : position[i1];
        if (p0 < 0 || p1 < 0)
            throw InvalidInputError("Digraph '" + out.substr(i, 2) + "' not in key square");

        int row0 = p0 / SIZE, col0 = p0 % SIZE;
        int row1 = p1 / SIZE, col1 = p1 % SIZE;

        if (row0 == row1) {
            c0 = square[row0][utils::mod(col0 + delta, SIZE)];
            c1 = square[row1][utils::mod(col1 + delta, SIZE)];
        }
        else if (col0 == col1) {
            c0 = square[utils::mod(row0 + delta, SIZE)][col0];
            c1 = square[utils::mod(row1 + delta, SIZE)][col1];
        }
        else {
            // rectangle: same for both directions
            c0 = square[row0][col1];
            c1 = square[row1][col0];
        }
        out[i] = c0;
        out[i + 1] = c1;
    }
    return out;
}
