#include "utils/RNG.hpp"
#include "utils/DataConverter.hpp"
#include "utils/errors.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace utils {

	uint64_t PRNG::randomUint64() {
		auto bytes = randomBytes(8);
		uint64_t val = 0;
		for (int i = 0; i < 8; i++) {
			val = (val << 8) | bytes[i];
		}
		return val;
	}

	uint32_t PRNG::randomUint32() {
		auto bytes = randomBytes(4);
		uint32_t val = 0;
		for (int i = 0; i < 4; i++) {
			val = (val << 8) | bytes[i];
		}
		return val;
	}

	int PRNG::nextBelow(int bound) {
		if (bound < 1)
			throw InvalidInputError("bound must be >= 1");

		// largest multiple of bound not above 2^32
		const uint64_t range = 0x100000000ULL;
		const uint64_t limit = range - (range % static_cast<uint64_t>(bound));
		uint64_t r;
		do {
			r = randomUint32();
		} while (r >= limit);
		return static_cast<int>(r % static_cast<uint64_t>(bound));
	}

	Sha1PRNG::Sha1PRNG(uint64_t seed) {
		auto seedBytes = DataConverter::Uint64ToBytes(seed);
		state = sha1(seedBytes.data(), seedBytes.size());
	}

	Sha1PRNG::Digest Sha1PRNG::sha1(const uint8_t* data, size_t size) {
		Digest out{};
		unsigned int outLen = 0;
		if (EVP_Digest(data, size, out.data(), &outLen, EVP_sha1(), nullptr) != 1) {
			throw std::runtime_error("EVP_Digest(SHA1) failed");
		}
		if (outLen != DIGEST_SIZE) {
			throw std::runtime_error("EVP_Digest(SHA1) returned unexpected length");
		}
		return out;
	}

	void Sha1PRNG::nextBlock() {
		block = sha1(state.data(), state.size());

		// state = state + block + 1, big-endian with carry
		unsigned carry = 1;
		for (int i = static_cast<int>(DIGEST_SIZE) - 1; i >= 0; --i) {
			unsigned v = static_cast<unsigned>(state[i]) + block[i] + carry;
			state[i] = static_cast<uint8_t>(v & 0xFF);
			carry = v >> 8;
		}
		used = 0;
	}

	std::vector<uint8_t> Sha1PRNG::randomBytes(size_t size) {
		std::vector<uint8_t> data(size);
		for (size_t i = 0; i < size; i++) {
			if (used == DIGEST_SIZE)
				nextBlock();
			data[i] = block[used++];
		}
		return data;
	}

	namespace {

		int32_t stringHash(const std::string& s) {
			uint32_t h = 0;
			for (unsigned char c : s)
				h = 31 * h + c;
			return static_cast<int32_t>(h);
		}

		uint64_t reverseBits(uint64_t v) {
			uint64_t r = 0;
			for (int i = 0; i < 64; i++) {
				r = (r << 1) | (v & 1U);
				v >>= 1;
			}
			return r;
		}

	} // namespace

	uint64_t deriveSeed(const std::string& key) {
		// sign extension of the 32-bit hashes is part of the seed format
		int64_t hash0 = 0;
		int64_t hash1 = 0;
		if (key.size() <= 32) {
			hash0 = stringHash(key);
		}
		else {
			hash0 = stringHash(key.substr(0, 32));
			hash1 = stringHash(key.substr(32));
		}
		return static_cast<uint64_t>(hash0) ^ reverseBits(static_cast<uint64_t>(hash1));
	}

} // namespace utils
