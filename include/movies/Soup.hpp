#pragma once
#include "movies/Movie.hpp"
#include <optional>
#include <string>
#include <vector>

namespace movies {

struct SoupConfig {
    size_t max_items = 3;  // keep the first N of cast / keywords / genres
};

// first crew member whose job is "Director"
std::optional<std::string> director(const Movie& m);

// keywords, cast, director, genres as compacted tokens ("Tom Hanks" -> "tomhanks")
std::vector<std::string> soup_tokens(const Movie& m, const SoupConfig& cfg = {});

}  // namespace movies
