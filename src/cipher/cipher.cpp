#include "cipher/cipher.hpp"
#include <type_traits>

namespace {

	template<typename>
	inline constexpr bool always_false = false;

} // namespace

std::string prepare(const CipherInstance& cipher, const std::string& cleartext)
{
	return std::visit([&](const auto& c) { return c.prepare(cleartext); }, cipher);
}

std::string encrypt(CipherInstance& cipher, const std::string& preptext)
{
	return std::visit([&](auto& c) { return c.encrypt(preptext); }, cipher);
}

std::string decrypt(CipherInstance& cipher, const std::string& ciphertext)
{
	return std::visit([&](auto& c) { return c.decrypt(ciphertext); }, cipher);
}

CipherKind kindOf(const CipherInstance& cipher)
{
	return std::visit([](const auto& c) -> CipherKind {
		using T = std::decay_t<decltype(c)>;
		if constexpr (std::is_same_v<T, NullCipher>) {
			return CipherKind::NULL_CIPHER;
		} else if constexpr (std::is_same_v<T, CaesarCipher>) {
			return CipherKind::CAESAR_CIPHER;
		} else if constexpr (std::is_same_v<T, VignereCipher>) {
			return CipherKind::VIGNERE_CIPHER;
		} else if constexpr (std::is_same_v<T, PlayfairCipher>) {
			return CipherKind::PLAYFAIR_CIPHER;
		} else if constexpr (std::is_same_v<T, PseudoOneTimePad>) {
			return CipherKind::PSEUDO_ONE_TIME_PAD;
		} else {
			static_assert(always_false<T>, "CipherInstance alternative without a CipherKind");
		}
	}, cipher);
}
