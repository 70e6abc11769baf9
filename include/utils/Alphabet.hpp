#pragma once
#include <string>

namespace utils {

	// The 26 symbols every character cipher works over.
	inline const std::string ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";

	// Trims, uppercases and drops every character not in ALPHABET.
	std::string clean(const std::string& text);

	// Mathematical modulo, result in [0, modulus). Throws if modulus < 1.
	int mod(int n, int modulus);

	// Position of c in ALPHABET, or -1.
	int indexOf(char c);

	// Letter n positions past c, with wrap-around.
	char shift(char c, int n);
	std::string shift(const std::string& text, int n);

	// "ABCDE", 2 -> "AB CD E". Existing spaces are dropped first.
	std::string group(const std::string& text, int n);

} // namespace utils
