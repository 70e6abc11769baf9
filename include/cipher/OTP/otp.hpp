#pragma once
#include <cstdint>
#include <string>
#include "utils/RNG.hpp"

// One time pad whose pad comes from a seeded Sha1PRNG.
//
// The generator is seeded in the constructor, before anything else touches
// it, so two instances built from the same key produce the same pad no
// matter when they were created. Each processed letter consumes exactly one
// draw; sender and receiver stay in step only while they process the same
// number of letters in the same order. There is no resynchronisation.
//
// Instances are move-only: a copy would silently fork the pad position.
class PseudoOneTimePad
{
public:
    // any 64-bit value, negative Java-style longs included
    explicit PseudoOneTimePad(uint64_t seed);

    // seed derived with utils::deriveSeed(); any string, empty included
    explicit PseudoOneTimePad(const std::string& key);

    PseudoOneTimePad(const PseudoOneTimePad&) = delete;
    PseudoOneTimePad& operator=(const PseudoOneTimePad&) = delete;
    PseudoOneTimePad(PseudoOneTimePad&&) noexcept = default;
    PseudoOneTimePad& operator=(PseudoOneTimePad&&) noexcept = default;

    std::string prepare(const std::string& cleartext) const;
    std::string encrypt(const std::string& preptext);
    std::string decrypt(const std::string& ciphertext);

private:
    static constexpr int ENCRYPT = 1;
    static constexpr int DECRYPT = -1;

    std::string transform(const std::string& text, int direction);

    utils::Sha1PRNG prng;
};
