#include "utils/Alphabet.hpp"
#include "utils/DataConverter.hpp"
#include "utils/errors.hpp"

namespace utils {

	std::string clean(const std::string& text) {
		std::string upper = DataConverter::ToUpper(DataConverter::Trim(text));
		std::string out;
		out.reserve(upper.size());
		for (char c : upper) {
			if (c >= 'A' && c <= 'Z')
				out.push_back(c);
		}
		return out;
	}

	int mod(int n, int modulus) {
		if (modulus < 1)
			throw InvalidInputError("modulus cannot be < 1");
		// n % modulus lies in (-modulus, modulus)
		return ((n % modulus) + modulus) % modulus;
	}

	int indexOf(char c) {
		if (c < 'A' || c > 'Z')
			return -1;
		return c - 'A';
	}

	char shift(char c, int n) {
		int pos = indexOf(c);
		if (pos < 0)
			throw InvalidInputError(std::string("Argument ('") + c + "') not in ALPHABET");
		return ALPHABET[mod(pos + n, static_cast<int>(ALPHABET.size()))];
	}

	std::string shift(const std::string& text, int n) {
		std::string out(text);
		for (char& c : out)
			c = shift(c, n);
		return out;
	}

	std::string group(const std::string& text, int n) {
		if (n < 1)
			throw InvalidInputError("groups must have 1 or more letters");

		std::string out;
		out.reserve(text.size() + text.size() / n);
		int inGroup = 0;
		for (char c : text) {
			if (c == ' ')
				continue;
			if (inGroup == n) {
				out.push_back(' ');
				inGroup = 0;
			}
			out.push_back(c);
			++inGroup;
		}
		return out;
	}

} // namespace utils
