// File: src/normalize/normalizer.cpp
#include "normalize/normalizer.hpp"
#include <array>
#include <cctype>

namespace dedupe {

namespace {

bool IsWordChar(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) != 0 || c == '_';
}

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

std::string Trim(const std::string& str) {
    size_t begin = 0;
    size_t end = str.size();
    while (begin < end && IsSpace(str[begin])) ++begin;
    while (end > begin && IsSpace(str[end - 1])) --end;
    return str.substr(begin, end - begin);
}

// Order matters only for which suffix is tried first; stripping repeats
const std::array<const char*, 8> kLegalSuffixes = {
    "inc", "corp", "corporation", "llc", "ltd", "limited", "co", "company"
};

bool StripSuffix(std::string& name, const std::string& suffix) {
    if (name.size() < suffix.size()) {
        return false;
    }
    size_t start = name.size() - suffix.size();
    if (name.compare(start, suffix.size(), suffix) != 0) {
        return false;
    }
    // Word boundary before the suffix
    if (start > 0 && IsWordChar(name[start - 1])) {
        return false;
    }
    name = Trim(name.substr(0, start));
    return true;
}

} // namespace

std::string NormalizeString(const std::string& str) {
    if (str.empty()) {
        return std::string();
    }

    std::string lowered;
    lowered.reserve(str.size());
    for (char c : str) {
        lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    std::string trimmed = Trim(lowered);

    std::string result;
    result.reserve(trimmed.size());
    bool in_space = false;
    for (char c : trimmed) {
        if (IsSpace(c)) {
            if (!in_space) {
                result += ' ';
                in_space = true;
            }
        } else if (IsWordChar(c)) {
            result += c;
            in_space = false;
        }
        // Anything else is dropped without ending a whitespace run
    }

    return result;
}

std::string NormalizeCompanyName(const std::string& name) {
    std::string result = NormalizeString(name);

    bool stripped = true;
    while (stripped && !result.empty()) {
        stripped = false;
        for (const char* suffix : kLegalSuffixes) {
            if (StripSuffix(result, suffix)) {
                stripped = true;
            }
        }
    }

    return result;
}

} // namespace dedupe
