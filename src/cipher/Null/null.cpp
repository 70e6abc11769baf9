#include "cipher/Null/null.hpp"

NullCipher::NullCipher(const std::string& /*key*/)
{
}

std::string NullCipher::prepare(const std::string& cleartext) const
{
    return cleartext;
}

std::string NullCipher::encrypt(const std::string& preptext) const
{
    return preptext;
}

std::string NullCipher::decrypt(const std::string& ciphertext) const
{
    return ciphertext;
}
