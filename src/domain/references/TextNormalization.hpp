/**
 * @file TextNormalization.hpp
 * @brief String helpers shared by the reference pipeline stages.
 */

#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace citewalker::domain::references {

/** @brief ASCII lower-casing. */
std::string ToLower(const std::string& input);

/** @brief Removes leading and trailing whitespace. */
std::string Trim(const std::string& input);

/** @brief Replaces every whitespace run with a single space. */
std::string CollapseWhitespace(const std::string& input);

/**
 * @brief Collapses whitespace and strips leading/trailing " .,;:".
 *
 * Applied to full text, title and venue before scoring.
 */
std::string CleanReferenceText(const std::string& input);

/** @brief Splits on newlines, keeping empty lines and dropping '\r'. */
std::vector<std::string> SplitLines(const std::string& input);

/**
 * @brief Lower-cased whitespace tokens with edge punctuation removed.
 *
 * "Analysis." and "analysis" yield the same token.
 */
std::unordered_set<std::string> WordSet(const std::string& input);

/**
 * @brief Jaccard similarity of the word sets of two strings.
 * @return 0.0 if either string is empty, 1.0 on case-insensitive equality.
 */
double JaccardSimilarity(const std::string& a, const std::string& b);

/** @brief True if the lower-cased haystack contains any of the needles. */
bool ContainsAny(const std::string& haystack, const std::vector<std::string>& needles);

} // namespace citewalker::domain::references
