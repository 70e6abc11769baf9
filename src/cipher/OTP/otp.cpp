#include "cipher/OTP/otp.hpp"
#include "utils/Alphabet.hpp"
#include "utils/errors.hpp"

PseudoOneTimePad::PseudoOneTimePad(uint64_t seed)
    : prng(seed)
{
}

PseudoOneTimePad::PseudoOneTimePad(const std::string& key)
    : prng(utils::deriveSeed(key))
{
}

std::string PseudoOneTimePad::prepare(const std::string& cleartext) const
{
    return utils::clean(cleartext);
}

std::string PseudoOneTimePad::encrypt(const std::string& preptext)
{
    return transform(preptext, ENCRYPT);
}

std::string PseudoOneTimePad::decrypt(const std::string& ciphertext)
{
    return transform(ciphertext, DECRYPT);
}

std::string PseudoOneTimePad::transform(const std::string& text, int direction)
{
    // reject bad input before any draw, so the pad position is untouched
    for (char c : text) {
        if (utils::indexOf(c) < 0)
            throw InvalidInputError(std::string("Argument ('") + c + "') not in ALPHABET");
    }

    const int letters = static_cast<int>(utils::ALPHABET.size());
    std::string out(text);
    for (char& c : out)
        c = utils::shift(c, direction * prng.nextBelow(letters));
    return out;
}
