#pragma once
#include <optional>
#include <string>
#include <vector>

#include <cipher/cipher.hpp>
#include <message/optionCommand.hpp>
#include <utils/enums.hpp>

struct CipherConfig {
    bool enabled = false;
    CipherKind kind = CipherKind::NULL_CIPHER;
    std::string key = "KEY";
};

/**
 * Holds the cipher options of one conversation and the cipher built from them.
 *
 * Every change is validate-then-commit: a candidate config and cipher are
 * built aside, and the live pair is replaced only when construction
 * succeeded. On failure the previous options and cipher stay in place and
 * the error propagates.
 *
 * Not thread-safe. A manager belongs to a single conversation stream; the
 * pseudo one time pad inside it advances on every encrypt/decrypt.
 */
class CipherManager {
public:
    // disabled, NULL_CIPHER, key "KEY"
    CipherManager();
    CipherManager(bool enabled, CipherKind kind, const std::string& key);
    CipherManager(bool enabled, const std::string& cipherName, const std::string& key);

    bool isEnabled() const { return cfg.enabled; }
    CipherKind getCipherName() const { return cfg.kind; }
    const std::string& getKey() const { return cfg.key; }
    const CipherConfig& config() const { return cfg; }

    void setEnabled(bool enabled);
    // TRUE/YES/ON/1 or FALSE/NO/OFF/0, any case. Throws InvalidInputError otherwise.
    void setEnabled(const std::string& str);
    void setEnabled(const char* str) { setEnabled(std::string(str)); }

    void setCipher(CipherKind kind);
    void setCipher(const std::string& cipherName);
    void setKey(const std::string& key);

    // Unset fields keep their current value. A kind or key change rebuilds
    // the cipher (and so restarts a pseudo one time pad); enabled alone does not.
    void setCipherOptions(std::optional<CipherKind> kind,
        std::optional<std::string> key = std::nullopt,
        std::optional<bool> enabled = std::nullopt);

    // Applies a set request, or answers a query, and reports the option:
    // "option <TARGET> = <value>", prefixed with "FAIL: <reason>. " when the
    // set was rejected. The reported value is always the current one.
    std::string process(const OptionCommand& command);

    std::string prepare(const std::string& cleartext) const;
    std::string encrypt(const std::string& preptext);
    std::string decrypt(const std::string& ciphertext);

    static const std::vector<std::string>& trueSynonyms();
    static const std::vector<std::string>& falseSynonyms();

private:
    void commit(CipherConfig candidate);

    CipherConfig cfg;
    CipherInstance cipher;
};
