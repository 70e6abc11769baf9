#pragma once
#include <string>
#include <vector>
#include <cipher/cipher.hpp>
#include <utils/enums.hpp>

class CipherFactory {
public:
    // Throws ConstructionError if key is not valid for kind.
    static CipherInstance create(CipherKind kind, const std::string& key);

    // Case-insensitive. Throws UnknownCipherNameError.
    static CipherKind parseKind(const std::string& name);

    static std::string kindName(CipherKind kind);

    // every cipher name, in CipherKind order
    static std::vector<std::string> kindNames();
};
