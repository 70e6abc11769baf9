#include <CLI/CLI.hpp>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <cipher/cipher.hpp>
#include <core/cipherFactory.hpp>
#include <core/cipherManager.hpp>
#include <message/optionCommand.hpp>
#include <utils/Alphabet.hpp>
#include <utils/DataConverter.hpp>
#include <utils/RNG.hpp>

CipherInstance buildCipher(CipherKind kind, const std::string& key, const std::optional<int64_t>& seed) {
    if (seed) {
        if (kind != CipherKind::PSEUDO_ONE_TIME_PAD) {
            throw std::runtime_error("--seed only applies to PSEUDO_ONE_TIME_PAD");
        }
        return CipherInstance(std::in_place_type<PseudoOneTimePad>, static_cast<uint64_t>(*seed));
    }
    return CipherFactory::create(kind, key);
}

std::string removeSpaces(const std::string& text) {
    std::string out;
    for (char c : text) {
        if (c != ' ') out.push_back(c);
    }
    return out;
}

std::string format(const std::string& text, int groupSize) {
    return groupSize > 0 ? utils::group(text, groupSize) : text;
}

// Local manager encrypts, mirror manager plays the peer and decrypts,
// so pseudo one time pad streams advance in lockstep.
int runInteractive(CipherManager& local, CipherManager& mirror, int groupSize) {
    std::string line;
    std::cout << "> " << std::flush;
    while (std::getline(std::cin, line)) {
        auto tokens = DataConverter::SplitWhitespace(line);
        if (tokens.empty()) {
            std::cout << "> " << std::flush;
            continue;
        }

        const std::string command = DataConverter::ToUpper(tokens[0]);
        if (command == "QUIT" || command == "LOGOUT") {
            break;
        }

        try {
            if (command == "OPTION") {
                OptionCommand option = OptionCommand::parseLine(line);
                std::cout << local.process(option) << "\n";
                mirror.process(option);
            }
            else if (local.isEnabled()) {
                std::string prepped = local.prepare(line);
                std::string encrypted = local.encrypt(prepped);
                std::string decrypted = mirror.decrypt(encrypted);
                std::cout << "Prepped   > " << format(prepped, groupSize) << "\n"
                          << "Encrypted > " << format(encrypted, groupSize) << "\n"
                          << "Decrypted > " << format(decrypted, groupSize) << "\n";
            }
            else {
                std::cout << "Text > " << line << "\n";
            }
        }
        catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
        }
        std::cout << "> " << std::flush;
    }
    return 0;
}

int main(int argc, char** argv) {
    CLI::App app{"Clack Cipher CLI - classical character ciphers"};

    std::string cipherName = "NULL_CIPHER";
    std::string key = "KEY";
    std::optional<int64_t> seed;
    std::string text;
    std::string operation = "roundtrip";
    int groupSize = 0;
    bool interactive = false;
    bool enable = false;

    std::string cipherList;
    for (const auto& name : CipherFactory::kindNames()) {
        cipherList += (cipherList.empty() ? "" : ", ") + name;
    }

    // Cipher options
    app.add_option("--cipher,-c", cipherName, "Cipher (" + cipherList + ")");
    app.add_option("--key,-k", key, "Cipher key");
    app.add_option("--seed", seed, "Raw 64-bit seed for PSEUDO_ONE_TIME_PAD");

    // Text options
    app.add_option("--text,-t", text, "Text to prepare/encrypt/decrypt");
    app.add_option("--operation,-o", operation, "Operation (prep, encrypt, decrypt, roundtrip)");
    app.add_option("--group,-g", groupSize, "Print output in groups of N letters (0 = off)")
        ->check(CLI::NonNegativeNumber);

    // Session options
    app.add_flag("--interactive,-i", interactive, "Read OPTION commands and chat text from stdin");
    app.add_flag("--enable,-e", enable, "Start the interactive session with the cipher enabled");

    CLI11_PARSE(app, argc, argv);

    try {
        const CipherKind kind = CipherFactory::parseKind(cipherName);

        if (interactive) {
            CipherManager local(enable, kind, key);
            CipherManager mirror(enable, kind, key);
            std::cerr << "[*] " << CipherFactory::kindName(kind)
                      << (enable ? " enabled" : " disabled") << ", key '" << key << "'\n";
            if (kind == CipherKind::PSEUDO_ONE_TIME_PAD) {
                std::cerr << "[*] pad seed " << DataConverter::Uint64ToHex(utils::deriveSeed(key)) << "\n";
            }
            return runInteractive(local, mirror, groupSize);
        }

        CipherInstance cipher = buildCipher(kind, key, seed);

        if (operation == "prep") {
            std::cout << format(prepare(cipher, text), groupSize) << std::endl;
        }
        else if (operation == "encrypt") {
            std::cout << format(encrypt(cipher, prepare(cipher, text)), groupSize) << std::endl;
        }
        else if (operation == "decrypt") {
            std::string ciphertext = kind == CipherKind::NULL_CIPHER ? text : removeSpaces(text);
            std::cout << format(decrypt(cipher, ciphertext), groupSize) << std::endl;
        }
        else if (operation == "roundtrip") {
            // the peer gets its own instance; a pad must never be shared
            CipherInstance peer = buildCipher(kind, key, seed);
            std::string prepped = prepare(cipher, text);
            std::string encrypted = encrypt(cipher, prepped);
            std::string decrypted = decrypt(peer, encrypted);
            std::cout << "Prepped   > " << format(prepped, groupSize) << "\n"
                      << "Encrypted > " << format(encrypted, groupSize) << "\n"
                      << "Decrypted > " << format(decrypted, groupSize) << std::endl;
            if (decrypted != prepped) {
                throw std::runtime_error("round trip mismatch");
            }
        }
        else {
            throw std::runtime_error("Unknown operation: " + operation + ". Use prep, encrypt, decrypt or roundtrip");
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
