#pragma once
#include <string>

// Identity cipher. The key is accepted so every kind builds the same way.
class NullCipher
{
public:
    NullCipher() = default;
    explicit NullCipher(const std::string& key);

    std::string prepare(const std::string& cleartext) const;
    std::string encrypt(const std::string& preptext) const;
    std::string decrypt(const std::string& ciphertext) const;
};
