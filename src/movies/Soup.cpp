#include "movies/Soup.hpp"
#include "text/TextUtil.hpp"

namespace movies {

std::optional<std::string> director(const Movie& m) {
    for (const auto& c : m.crew) {
        if (c.job && *c.job == "Director") return c.name;
    }
    return std::nullopt;
}

static void append_names(std::vector<std::string>& out, const std::vector<Credit>& list, size_t max_items) {
    size_t n = 0;
    for (const auto& c : list) {
        if (n >= max_items) break;
        ++n;
        std::string tok = textutil::compact_name(c.name);
        if (!tok.empty()) out.push_back(std::move(tok));
    }
}

std::vector<std::string> soup_tokens(const Movie& m, const SoupConfig& cfg) {
    std::vector<std::string> out;
    append_names(out, m.keywords, cfg.max_items);
    append_names(out, m.cast, cfg.max_items);

    if (auto d = director(m)) {
        std::string tok = textutil::compact_name(*d);
        if (!tok.empty()) out.push_back(std::move(tok));
    }

    append_names(out, m.genres, cfg.max_items);
    return out;
}

}  // namespace movies
