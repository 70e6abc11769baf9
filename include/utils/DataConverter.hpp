#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <sstream>

class DataConverter {
public:
    // TEXT

    // ASCII a-z -> A-Z, every other byte unchanged
    static std::string ToUpper(const std::string& input) {
        std::string out(input);
        for (char& c : out) {
            if (c >= 'a' && c <= 'z')
                c = static_cast<char>(c - 'a' + 'A');
        }
        return out;
    }

    // strips leading/trailing blanks (space, tab, CR, LF, FF, VT)
    static std::string Trim(const std::string& input) {
        static const char* blanks = " \t\r\n\f\v";
        auto start = input.find_first_not_of(blanks);
        if (start == std::string::npos)
            return "";
        auto end = input.find_last_not_of(blanks);
        return input.substr(start, end - start + 1);
    }

    // splits on runs of whitespace, no empty tokens
    static std::vector<std::string> SplitWhitespace(const std::string& input) {
        std::vector<std::string> tokens;
        std::istringstream iss(input);
        std::string tok;
        while (iss >> tok)
            tokens.push_back(tok);
        return tokens;
    }

    // BYTES <-> HEX

    static std::string BytesToHex(const std::vector<uint8_t>& bytes) {
        static const char* hex = "0123456789ABCDEF";
        std::string out;
        out.reserve(bytes.size() * 2);

        for (uint8_t b : bytes) {
            out.push_back(hex[b >> 4]);
            out.push_back(hex[b & 0x0F]);
        }
        return out;
    }

    // uint64 -> 8 bytes big-endian
    static std::vector<uint8_t> Uint64ToBytes(uint64_t value) {
        std::vector<uint8_t> bytes(8);
        for (size_t i = 0; i < 8; ++i) {
            bytes[i] = static_cast<uint8_t>((value >> ((7 - i) * 8)) & 0xFF);
        }
        return bytes;
    }

    static std::string Uint64ToHex(uint64_t value) {
        return BytesToHex(Uint64ToBytes(value));
    }
};
