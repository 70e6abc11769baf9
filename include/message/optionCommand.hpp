#pragma once
#include <optional>
#include <string>
#include <vector>
#include "utils/enums.hpp"

// Set-or-query request for one cipher option, as typed by a user:
//   OPTION CIPHER_NAME              -> query
//   OPTION CIPHER_NAME PLAYFAIR_CIPHER -> set
struct OptionCommand {
    OptionTarget target = OptionTarget::CIPHER_KEY;
    std::optional<std::string> value;

    // an absent or empty value is a query
    bool isQuery() const { return !value || value->empty(); }

    // args are the tokens after the OPTION keyword: {target} or {target, value}
    static OptionCommand parse(const std::vector<std::string>& args);

    // whole input line, OPTION keyword included (case-insensitive)
    static OptionCommand parseLine(const std::string& line);

    static OptionTarget parseTarget(const std::string& name);
    static std::string targetName(OptionTarget target);
};
