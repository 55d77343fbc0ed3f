#pragma once
#include <string>
#include <unordered_set>
#include <vector>

namespace textutil {

// lowercase, keep letters/digits, turn everything else into spaces, collapse spaces
std::string normalize(const std::string& s);

// split normalized text into tokens
std::vector<std::string> tokenize(const std::string& normalized);

// normalize + tokenize + drop stopwords (and optionally fold plurals).
// a folded token is checked against the stopwords again.
std::vector<std::string> analyze(
    const std::string& text,
    const std::unordered_set<std::string>& stopwords,
    bool fold_plurals = false
);

// Harman "S" stemmer: strips English plural endings.
// The first applicable rule wins; tokens of 3 chars or fewer are returned as is.
//   -ies -> -y   (unless -eies / -aies)
//   -es  -> -e   (unless -aes / -ees / -oes)
//   -s   -> ""   (unless -us / -ss)
std::string fold_plural(const std::string& token);

// lowercase + drop all whitespace: "Johnny Depp" -> "johnnydepp"
std::string compact_name(const std::string& s);

}
