// File: src/normalize/normalizer.hpp
#pragma once

#include <string>

namespace dedupe {

/// Canonicalize a string for comparison
///
/// Lowercases, trims, strips every character that is neither a word
/// character ([A-Za-z0-9_]) nor whitespace, then collapses whitespace runs
/// to a single space. Total: empty input yields an empty string.
std::string NormalizeString(const std::string& str);

/// Canonicalize a company name
///
/// Applies NormalizeString, then repeatedly strips a trailing legal-entity
/// suffix (inc, corp, corporation, llc, ltd, limited, co, company) that
/// starts at a word boundary, trimming after each strip.
///
/// Example: "Acme Holdings Co., Inc." -> "acme holdings"
std::string NormalizeCompanyName(const std::string& name);

} // namespace dedupe
