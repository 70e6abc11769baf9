#pragma once
#include <stdexcept>
#include <string>

// Proposed (kind, key) pair cannot form a cipher.
class ConstructionError : public std::invalid_argument {
public:
    explicit ConstructionError(const std::string& what)
        : std::invalid_argument(what) {
    }
};

// Cipher name does not match any supported kind.
class UnknownCipherNameError : public ConstructionError {
public:
    explicit UnknownCipherNameError(const std::string& name)
        : ConstructionError("'" + name + "' is not a cipher name") {
    }
};

// Bad argument at call time (modulus, group size, non-alphabet char, digram).
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what)
        : std::invalid_argument(what) {
    }
};

// Option target name not recognised.
class UnknownOptionError : public std::invalid_argument {
public:
    explicit UnknownOptionError(const std::string& name)
        : std::invalid_argument("'" + name + "' is not an option") {
    }
};
