#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <cipher/cipher.hpp>
#include <core/cipherFactory.hpp>
#include <utils/DataConverter.hpp>
#include <utils/errors.hpp>

using FactoryFn = std::function<CipherInstance(const std::string&)>;

namespace {

    struct RegistryEntry {
        CipherKind kind;
        std::string name;
        FactoryFn make;
    };

    template<typename T>
    FactoryFn maker() {
        return [](const std::string& key) { return CipherInstance(std::in_place_type<T>, key); };
    }

    const std::vector<RegistryEntry>& getRegistry() {
        static const std::vector<RegistryEntry> registry = {
            {CipherKind::CAESAR_CIPHER,       "CAESAR_CIPHER",       maker<CaesarCipher>()},
            {CipherKind::NULL_CIPHER,         "NULL_CIPHER",         maker<NullCipher>()},
            {CipherKind::PLAYFAIR_CIPHER,     "PLAYFAIR_CIPHER",     maker<PlayfairCipher>()},
            {CipherKind::PSEUDO_ONE_TIME_PAD, "PSEUDO_ONE_TIME_PAD", maker<PseudoOneTimePad>()},
            {CipherKind::VIGNERE_CIPHER,      "VIGNERE_CIPHER",      maker<VignereCipher>()}
        };
        return registry;
    }

    const RegistryEntry& entryFor(CipherKind kind) {
        for (const auto& entry : getRegistry()) {
            if (entry.kind == kind)
                return entry;
        }
        // only reachable with a value cast outside the enum's range
        throw UnknownCipherNameError(std::to_string(static_cast<int>(kind)));
    }

} // namespace

CipherInstance CipherFactory::create(CipherKind kind, const std::string& key) {
    return entryFor(kind).make(key);
}

CipherKind CipherFactory::parseKind(const std::string& name) {
    const std::string upper = DataConverter::ToUpper(name);
    for (const auto& entry : getRegistry()) {
        if (entry.name == upper)
            return entry.kind;
    }
    throw UnknownCipherNameError(name);
}

std::string CipherFactory::kindName(CipherKind kind) {
    return entryFor(kind).name;
}

std::vector<std::string> CipherFactory::kindNames() {
    std::vector<std::string> names;
    for (const auto& entry : getRegistry())
        names.push_back(entry.name);
    return names;
}
