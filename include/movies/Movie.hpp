#pragma once
#include <optional>
#include <string>
#include <vector>

namespace movies {

// one entry of a cast / crew / genre / keyword list
struct Credit {
    std::string name;
    std::optional<std::string> job;  // crew only, e.g. "Director"
};

struct Movie {
    long long id = 0;
    std::string title;
    std::optional<std::string> overview;  // absent in some datasets
    std::vector<Credit> cast;             // billing order
    std::vector<Credit> crew;
    std::vector<Credit> genres;
    std::vector<Credit> keywords;
};

}  // namespace movies
