#pragma once
#include <string>
#include <unordered_set>

namespace textutil {

// the common 318-word English stopword list
const std::unordered_set<std::string>& english_stopwords();

// one word per line; blank lines and lines starting with '#' are skipped.
// words are lowercased and trimmed. throws std::runtime_error if the file can't be read.
std::unordered_set<std::string> load_stopwords(const std::string& path);

}
