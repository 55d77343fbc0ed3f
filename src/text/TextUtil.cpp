#include "text/TextUtil.hpp"
#include <cctype>

namespace textutil {

std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (unsigned char ch : s) {
        unsigned char c = static_cast<unsigned char>(std::tolower(ch));

        bool keep = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');

        if (keep) {
            out.push_back(static_cast<char>(c));
            prev_space = false;
        } else {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
        }
    }

    // trim trailing space
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::vector<std::string> tokenize(const std::string& normalized) {
    std::vector<std::string> tokens;
    std::string cur;

    for (char c : normalized) {
        if (c == ' ') {
            if (!cur.empty()) {
                tokens.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) tokens.push_back(cur);
    return tokens;
}

std::vector<std::string> analyze(
    const std::string& text,
    const std::unordered_set<std::string>& stopwords,
    bool fold_plurals
) {
    auto toks = tokenize(normalize(text));

    std::vector<std::string> out;
    out.reserve(toks.size());
    for (auto& t : toks) {
        if (stopwords.count(t)) continue;
        if (fold_plurals) {
            t = fold_plural(t);
            if (stopwords.count(t)) continue;  // "names" -> "name"
        }
        if (!t.empty()) out.push_back(std::move(t));
    }
    return out;
}

static bool ends_with(const std::string& s, const char* suffix, size_t len) {
    return s.size() >= len && s.compare(s.size() - len, len, suffix) == 0;
}

std::string fold_plural(const std::string& token) {
    const size_t n = token.size();
    if (n <= 3) return token;

    if (ends_with(token, "ies", 3) && !ends_with(token, "eies", 4) && !ends_with(token, "aies", 4)) {
        return token.substr(0, n - 3) + "y";
    }
    if (ends_with(token, "es", 2) && !ends_with(token, "aes", 3) &&
        !ends_with(token, "ees", 3) && !ends_with(token, "oes", 3)) {
        return token.substr(0, n - 1);
    }
    if (ends_with(token, "s", 1) && !ends_with(token, "us", 2) && !ends_with(token, "ss", 2)) {
        return token.substr(0, n - 1);
    }
    return token;
}

std::string compact_name(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char ch : s) {
        if (std::isspace(ch)) continue;
        out.push_back(static_cast<char>(std::tolower(ch)));
    }
    return out;
}

}
