// File: src/similarity/field_similarity.cpp
#include "similarity/field_similarity.hpp"
#include "normalize/normalizer.hpp"
#include <rapidfuzz/fuzz.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <unordered_map>

namespace dedupe {

namespace {

std::string RemoveWhitespace(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            result += c;
        }
    }
    return result;
}

// Piecewise-linear tolerance curve shared by value and date similarity
double ToleranceCurve(double diff, double tolerance, double outer_multiple) {
    if (tolerance <= 0.0) {
        return diff == 0.0 ? 1.0 : 0.0;
    }

    if (diff <= tolerance) {
        return 1.0 - (diff / tolerance) * 0.3;
    }

    double max_diff = tolerance * outer_multiple;
    if (diff > max_diff) {
        return 0.0;
    }

    return 0.7 - ((diff - tolerance) / (max_diff - tolerance)) * 0.7;
}

} // namespace

double DiceCoefficient(const std::string& a, const std::string& b) {
    std::string first = RemoveWhitespace(a);
    std::string second = RemoveWhitespace(b);

    if (first == second) {
        return 1.0;
    }
    if (first.size() < 2 || second.size() < 2) {
        return 0.0;
    }

    std::unordered_map<std::string, int> first_bigrams;
    for (size_t i = 0; i + 1 < first.size(); ++i) {
        ++first_bigrams[first.substr(i, 2)];
    }

    int intersection = 0;
    for (size_t i = 0; i + 1 < second.size(); ++i) {
        auto it = first_bigrams.find(second.substr(i, 2));
        if (it != first_bigrams.end() && it->second > 0) {
            --it->second;
            ++intersection;
        }
    }

    return (2.0 * intersection) / static_cast<double>(first.size() + second.size() - 2);
}

double FuzzyStringSimilarity(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) {
        return 0.0;
    }

    std::string norm1 = NormalizeString(a);
    std::string norm2 = NormalizeString(b);

    if (norm1.empty() || norm2.empty()) {
        return 0.0;
    }
    if (norm1 == norm2) {
        return 100.0;
    }

    // Canonical argument order keeps every scorer symmetric
    if (norm2 < norm1) {
        std::swap(norm1, norm2);
    }

    double scores[] = {
        rapidfuzz::fuzz::ratio(norm1, norm2),
        rapidfuzz::fuzz::partial_ratio(norm1, norm2),
        rapidfuzz::fuzz::token_sort_ratio(norm1, norm2),
        rapidfuzz::fuzz::token_set_ratio(norm1, norm2),
        DiceCoefficient(norm1, norm2) * 100.0,
    };

    double best = *std::max_element(std::begin(scores), std::end(scores));
    return std::clamp(best, 0.0, 100.0);
}

double DealNameSimilarity(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) {
        return 0.0;
    }
    return FuzzyStringSimilarity(a, b) / 100.0;
}

double CustomerNameSimilarity(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) {
        return 0.0;
    }
    return FuzzyStringSimilarity(NormalizeCompanyName(a), NormalizeCompanyName(b)) / 100.0;
}

double DescriptionSimilarity(const std::string& a, const std::string& b) {
    return FuzzyStringSimilarity(a, b) / 100.0;
}

double ValueSimilarity(std::optional<double> a, std::optional<double> b,
                       double tolerance_percent) {
    if (!a || !b || *a == 0.0 || *b == 0.0) {
        return 0.0;
    }
    if (!std::isfinite(*a) || !std::isfinite(*b)) {
        return 0.0;
    }
    if (*a == *b) {
        return 1.0;
    }

    double average = (*a + *b) / 2.0;
    if (average == 0.0) {
        return 0.0;
    }

    double percent_diff = std::abs(*a - *b) / std::abs(average) * 100.0;
    return ToleranceCurve(percent_diff, tolerance_percent, 3.0);
}

double DateSimilarity(const std::optional<Date>& a, const std::optional<Date>& b,
                      double tolerance_days) {
    if (!a || !b) {
        return 0.0;
    }
    if (*a == *b) {
        return 1.0;
    }

    double day_diff = std::abs(a->DaysSince(*b));
    return ToleranceCurve(day_diff, tolerance_days, 4.0);
}

double SetSimilarity(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    if (a.empty() || b.empty()) {
        return 0.0;
    }

    std::set<std::string> set_a(a.begin(), a.end());
    std::set<std::string> set_b(b.begin(), b.end());

    size_t intersection = 0;
    for (const auto& item : set_a) {
        if (set_b.count(item) > 0) {
            ++intersection;
        }
    }

    size_t union_size = set_a.size() + set_b.size() - intersection;
    if (union_size == 0) {
        return 0.0;
    }

    return static_cast<double>(intersection) / static_cast<double>(union_size);
}

double ProductSimilarity(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::vector<std::string> norm_a;
    std::vector<std::string> norm_b;
    norm_a.reserve(a.size());
    norm_b.reserve(b.size());

    for (const auto& product : a) norm_a.push_back(NormalizeString(product));
    for (const auto& product : b) norm_b.push_back(NormalizeString(product));

    return SetSimilarity(norm_a, norm_b);
}

double ContactSimilarity(const std::vector<ContactRecord>& a, const std::vector<ContactRecord>& b) {
    auto emails = [](const std::vector<ContactRecord>& contacts) {
        std::vector<std::string> result;
        for (const auto& contact : contacts) {
            if (!contact.email || contact.email->empty()) {
                continue;
            }
            std::string lowered;
            lowered.reserve(contact.email->size());
            for (char c : *contact.email) {
                lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            result.push_back(std::move(lowered));
        }
        return result;
    };

    return SetSimilarity(emails(a), emails(b));
}

} // namespace dedupe
