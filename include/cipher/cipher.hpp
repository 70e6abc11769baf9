#pragma once
#include <string>
#include <variant>

#include "cipher/Null/null.hpp"
#include "cipher/Caesar/caesar.hpp"
#include "cipher/Vignere/vignere.hpp"
#include "cipher/Playfair/playfair.hpp"
#include "cipher/OTP/otp.hpp"
#include "utils/enums.hpp"

// One live cipher. Key material is fixed at construction; a new key or kind
// means a new instance. Move-only because PseudoOneTimePad is.
using CipherInstance = std::variant<
	NullCipher,
	CaesarCipher,
	VignereCipher,
	PlayfairCipher,
	PseudoOneTimePad>;

// Call order is prepare -> encrypt on the sending side, decrypt on the
// receiving side; decrypt(encrypt(p)) == p for every p returned by prepare.
std::string prepare(const CipherInstance& cipher, const std::string& cleartext);
std::string encrypt(CipherInstance& cipher, const std::string& preptext);
std::string decrypt(CipherInstance& cipher, const std::string& ciphertext);

CipherKind kindOf(const CipherInstance& cipher);
