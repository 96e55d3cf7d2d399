#include "text_utils.hpp"

#include <cctype>

namespace linecalc {

namespace {
bool isSpace(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}
}

std::string trim(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && isSpace(text[begin])) {
        ++begin;
    }
    while (end > begin && isSpace(text[end - 1])) {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

std::string toLower(std::string_view text) {
    std::string result(text);
    for (char& ch : result) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return result;
}

std::vector<std::string> splitWhitespace(std::string_view text) {
    std::vector<std::string> parts;
    std::size_t index = 0;
    while (index < text.size()) {
        while (index < text.size() && isSpace(text[index])) {
            ++index;
        }
        std::size_t start = index;
        while (index < text.size() && !isSpace(text[index])) {
            ++index;
        }
        if (index > start) {
            parts.emplace_back(text.substr(start, index - start));
        }
    }
    return parts;
}

std::string joinWithSpaces(const std::vector<std::string>& parts) {
    std::string result;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += ' ';
        }
        result += parts[i];
    }
    return result;
}

bool isValidIdentifier(std::string_view name) {
    if (name.empty() || !std::isalpha(static_cast<unsigned char>(name.front()))) {
        return false;
    }
    for (char ch : name) {
        if (!std::isalnum(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return true;
}

std::size_t countCodePoints(std::string_view text) {
    std::size_t count = 0;
    for (char ch : text) {
        if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

} // namespace linecalc
