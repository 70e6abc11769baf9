#pragma once
#include <array>
#include <vector>
#include <string>
#include <cstdint>


namespace utils {


	class PRNG {
	public:
		virtual ~PRNG() = default;
		virtual std::vector<uint8_t> randomBytes(size_t size) = 0;
		virtual uint64_t randomUint64();
		virtual uint32_t randomUint32();
		// Uniform value in [0, bound), rejection sampled. Throws InvalidInputError if bound < 1.
		int nextBelow(int bound);
	};


	// Deterministic generator built on SHA-1 (OpenSSL EVP).
	// The whole output sequence is a function of the seed given at construction;
	// there is no reseed, peek or rewind. Copying is disabled so that a stream
	// position is never duplicated by accident.
	class Sha1PRNG : public PRNG {
	public:
		static constexpr size_t DIGEST_SIZE = 20;

		explicit Sha1PRNG(uint64_t seed);

		Sha1PRNG(const Sha1PRNG&) = delete;
		Sha1PRNG& operator=(const Sha1PRNG&) = delete;
		Sha1PRNG(Sha1PRNG&&) noexcept = default;
		Sha1PRNG& operator=(Sha1PRNG&&) noexcept = default;

		std::vector<uint8_t> randomBytes(size_t size) override;

	private:
		using Digest = std::array<uint8_t, DIGEST_SIZE>;

		static Digest sha1(const uint8_t* data, size_t size);
		void nextBlock();

		Digest state{};
		Digest block{};
		size_t used = DIGEST_SIZE; // bytes of block already handed out
	};


	// 64-bit seed from a pass phrase: 32-bit string hash of the first 32
	// characters in the low half, XOR the bit-reversed hash of the rest.
	uint64_t deriveSeed(const std::string& key);


} // namespace utils
