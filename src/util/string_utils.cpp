#include "util/string_utils.hpp"

#include <cctype>
#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <vector>

std::string trim(const std::string& input) {
    auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    std::size_t start = 0;
    while (start < input.size() && isSpace(input[start])) {
        ++start;
    }

    std::size_t end = input.size();
    while (end > start && isSpace(input[end - 1])) {
        --end;
    }

    return input.substr(start, end - start);
}

std::string join(const std::vector<std::string>& inputs, const std::string& connector) {
    std::string output;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        if (i > 0) {
            output += connector;
        }
        output += inputs[i];
    }
    return output;
}

std::vector<std::string> parseTokens(const std::string& input, char delimiter) {
    std::vector<std::string> tokens;

    std::size_t tokenStart = 0;
    while (tokenStart <= input.size()) {
        std::size_t tokenEnd = input.find(delimiter, tokenStart);
        if (tokenEnd == std::string::npos) {
            tokenEnd = input.size();
        }

        // Empty and whitespace-only tokens are dropped
        std::string token = trim(input.substr(tokenStart, tokenEnd - tokenStart));
        if (!token.empty()) {
            tokens.push_back(token);
        }

        tokenStart = tokenEnd + 1;
    }

    return tokens;
}

std::optional<int> parseInt(const std::string& input) {
    try {
        std::size_t charactersRead = 0;
        int value = std::stoi(input, &charactersRead);
        if (charactersRead != input.size()) {
            return std::nullopt;
        }
        return value;
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}
