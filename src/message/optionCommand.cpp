#include "message/optionCommand.hpp"
#include "utils/DataConverter.hpp"
#include "utils/errors.hpp"

OptionCommand OptionCommand::parse(const std::vector<std::string>& args)
{
    if (args.empty() || args.size() > 2)
        throw InvalidInputError("Invalid OPTION syntax");

    OptionCommand command;
    command.target = parseTarget(args[0]);
    if (args.size() == 2)
        command.value = args[1];
    return command;
}

OptionCommand OptionCommand::parseLine(const std::string& line)
{
    auto tokens = DataConverter::SplitWhitespace(line);
    if (tokens.empty() || DataConverter::ToUpper(tokens[0]) != "OPTION")
        throw InvalidInputError("Invalid OPTION syntax");
    tokens.erase(tokens.begin());
    return parse(tokens);
}

OptionTarget OptionCommand::parseTarget(const std::string& name)
{
    const std::string upper = DataConverter::ToUpper(name);
    if (upper == "CIPHER_KEY")
        return OptionTarget::CIPHER_KEY;
    if (upper == "CIPHER_NAME")
        return OptionTarget::CIPHER_NAME;
    if (upper == "CIPHER_ENABLE")
        return OptionTarget::CIPHER_ENABLE;
    throw UnknownOptionError(name);
}

std::string OptionCommand::targetName(OptionTarget target)
{
    switch (target) {
    case OptionTarget::CIPHER_KEY:
        return "CIPHER_KEY";
    case OptionTarget::CIPHER_NAME:
        return "CIPHER_NAME";
    case OptionTarget::CIPHER_ENABLE:
        return "CIPHER_ENABLE";
    }
    throw UnknownOptionError(std::to_string(static_cast<int>(target)));
}
