#include "cipher/Caesar/caesar.hpp"
#include "utils/Alphabet.hpp"
#include "utils/errors.hpp"

CaesarCipher::CaesarCipher(int shift)
    : amount(utils::mod(shift, static_cast<int>(utils::ALPHABET.size())))
{
}

CaesarCipher::CaesarCipher(const std::string& key)
    : amount(0)
{
    if (key.empty())
        throw ConstructionError("Caesar key must be a non-empty string");

    amount = utils::indexOf(key[0]);
    if (amount < 0)
        throw ConstructionError("First character of Caesar key not in ALPHABET");
}

std::string CaesarCipher::prepare(const std::string& cleartext) const
{
    return utils::clean(cleartext);
}

std::string CaesarCipher::encrypt(const std::string& preptext) const
{
    return utils::shift(preptext, amount);
}

std::string CaesarCipher::decrypt(const std::string& ciphertext) const
{
    return utils::shift(ciphertext, -amount);
}
