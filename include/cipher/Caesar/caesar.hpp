#pragma once
#include <string>

// Classical Caesar cipher: every letter moves a fixed distance along ALPHABET.
class CaesarCipher
{
public:
    // shift is reduced modulo 26; negative values shift leftward, 0 is the null cipher
    explicit CaesarCipher(int shift);

    // shift = position of key[0] in ALPHABET. The key is not cleaned,
    // so a lowercase or punctuation first character is rejected.
    explicit CaesarCipher(const std::string& key);

    std::string prepare(const std::string& cleartext) const;
    std::string encrypt(const std::string& preptext) const;
    std::string decrypt(const std::string& ciphertext) const;

    int shift() const { return amount; }

private:
    int amount;
};
