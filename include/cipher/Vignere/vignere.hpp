#pragma once
#include <string>
#include <vector>

// Classical Vignere cipher. The key must already be pure ALPHABET letters;
// letter i of the text moves by the position of key[i mod keylen].
class VignereCipher
{
public:
    explicit VignereCipher(const std::string& key);

    std::string prepare(const std::string& cleartext) const;
    std::string encrypt(const std::string& preptext) const;
    std::string decrypt(const std::string& ciphertext) const;

private:
    static constexpr int FORWARD = 1;
    static constexpr int BACKWARD = -1;

    std::string vignereShift(const std::string& text, int direction) const;

    std::vector<int> shifts;
};
