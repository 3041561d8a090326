#include "test_utils.hpp"

std::vector<std::string> split(const std::string& str, const char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream tokenStream(str);

    while (std::getline(tokenStream, token, delimiter)) {
        tokens.push_back(token);
    }

    return tokens;
}

std::string trim(const std::string& str) {
    std::string token = str;
    // Trim leading and trailing whitespace
    token.erase(0, token.find_first_not_of(" \t\n\r"));
    token.erase(token.find_last_not_of(" \t\n\r") + 1);
    return token;
}

std::vector<std::string> rendered_lines(const std::string& output) {
    std::vector<std::string> result;
    for (const auto& chunk : split(output, '\r')) {
        const std::string line = trim(chunk);
        if (!line.empty()) {
            result.push_back(line);
        }
    }
    return result;
}
