#include "core/cipherManager.hpp"
#include "core/cipherFactory.hpp"
#include "utils/DataConverter.hpp"
#include "utils/errors.hpp"
#include <algorithm>
#include <exception>
#include <utility>

const std::vector<std::string>& CipherManager::trueSynonyms() {
    static const std::vector<std::string> trues = { "TRUE", "YES", "ON", "1" };
    return trues;
}

const std::vector<std::string>& CipherManager::falseSynonyms() {
    static const std::vector<std::string> falses = { "FALSE", "NO", "OFF", "0" };
    return falses;
}

CipherManager::CipherManager()
    : CipherManager(false, CipherKind::NULL_CIPHER, "KEY") {
}

CipherManager::CipherManager(bool enabled, CipherKind kind, const std::string& key)
    : cfg{ enabled, kind, key },
      cipher(CipherFactory::create(kind, key)) {
}

CipherManager::CipherManager(bool enabled, const std::string& cipherName, const std::string& key)
    : CipherManager(enabled, CipherFactory::parseKind(cipherName), key) {
}

void CipherManager::commit(CipherConfig candidate) {
    // build first; nothing below the factory call can throw
    CipherInstance next = CipherFactory::create(candidate.kind, candidate.key);
    cfg = std::move(candidate);
    cipher = std::move(next);
}

void CipherManager::setEnabled(bool enabled) {
    cfg.enabled = enabled;
}

void CipherManager::setEnabled(const std::string& str) {
    const std::string upper = DataConverter::ToUpper(str);
    const auto& trues = trueSynonyms();
    const auto& falses = falseSynonyms();
    if (std::find(trues.begin(), trues.end(), upper) != trues.end()) {
        setEnabled(true);
    }
    else if (std::find(falses.begin(), falses.end(), upper) != falses.end()) {
        setEnabled(false);
    }
    else {
        throw InvalidInputError("'" + str + "' not a boolean synonym");
    }
}

void CipherManager::setCipher(CipherKind kind) {
    setCipherOptions(kind);
}

void CipherManager::setCipher(const std::string& cipherName) {
    setCipherOptions(CipherFactory::parseKind(cipherName));
}

void CipherManager::setKey(const std::string& key) {
    setCipherOptions(std::nullopt, key);
}

void CipherManager::setCipherOptions(std::optional<CipherKind> kind,
    std::optional<std::string> key,
    std::optional<bool> enabled) {
    if (!kind && !key) {
        if (enabled)
            setEnabled(*enabled);
        return;
    }

    CipherConfig candidate = cfg;
    if (kind)
        candidate.kind = *kind;
    if (key)
        candidate.key = std::move(*key);
    if (enabled)
        candidate.enabled = *enabled;
    commit(std::move(candidate));
}

std::string CipherManager::process(const OptionCommand& command) {
    std::string reply;

    if (!command.isQuery()) {
        try {
            switch (command.target) {
            case OptionTarget::CIPHER_KEY:
                setKey(*command.value);
                break;
            case OptionTarget::CIPHER_NAME:
                setCipher(*command.value);
                break;
            case OptionTarget::CIPHER_ENABLE:
                setEnabled(*command.value);
                break;
            }
        }
        catch (const std::exception& e) {
            reply = "FAIL: " + std::string(e.what()) + ". ";
        }
    }

    std::string value;
    switch (command.target) {
    case OptionTarget::CIPHER_KEY:
        value = cfg.key;
        break;
    case OptionTarget::CIPHER_NAME:
        value = CipherFactory::kindName(cfg.kind);
        break;
    case OptionTarget::CIPHER_ENABLE:
        value = cfg.enabled ? "true" : "false";
        break;
    }
    return reply + "option " + OptionCommand::targetName(command.target) + " = " + value;
}

std::string CipherManager::prepare(const std::string& cleartext) const {
    return ::prepare(cipher, cleartext);
}

std::string CipherManager::encrypt(const std::string& preptext) {
    return ::encrypt(cipher, preptext);
}

std::string CipherManager::decrypt(const std::string& ciphertext) {
    return ::decrypt(cipher, ciphertext);
}
