#include "cipher/Vignere/vignere.hpp"
#include "utils/Alphabet.hpp"
#include "utils/errors.hpp"

VignereCipher::VignereCipher(const std::string& key)
{
    if (key.empty())
        throw ConstructionError("Vignere key is empty");
    if (utils::clean(key) != key)
        throw ConstructionError("Vignere key contains a non-ALPHABET character");

    shifts.reserve(key.size());
    for (char c : key)
        shifts.push_back(utils::indexOf(c));
}

std::string VignereCipher::prepare(const std::string& cleartext) const
{
    return utils::clean(cleartext);
}

std::string VignereCipher::encrypt(const std::string& preptext) const
{
    return vignereShift(preptext, FORWARD);
}

std::string VignereCipher::decrypt(const std::string& ciphertext) const
{
    return vignereShift(ciphertext, BACKWARD);
}

std::string VignereCipher::vignereShift(const std::string& text, int direction) const
{
    std::string out(text);
    for (size_t i = 0; i < out.size(); ++i)
        out[i] = utils::shift(out[i], direction * shifts[i % shifts.size()]);
    return out;
}
