#pragma once
#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace textutil {

// trim, lowercase, collapse inner whitespace runs to a single space
std::string normalize_key(const std::string& s);

// normalize every entry, drop empties, de-dupe
std::set<std::string> normalize_set(const std::vector<std::string>& items);

// classic Levenshtein distance over bytes (insert/delete/substitute cost 1)
size_t edit_distance(const std::string& a, const std::string& b);

// 1 - edit_distance / max(|a|, |b|), in [0,1]. Two empty strings are identical (1.0).
// Callers are expected to pass normalized keys.
double similarity(const std::string& a, const std::string& b);

}
