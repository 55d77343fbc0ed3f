#pragma once
#include "movies/Movie.hpp"
#include <string>
#include <vector>

namespace movies {

class MovieCorpus {
public:
    // JSON array of movie objects; throws std::runtime_error naming the bad field
    static MovieCorpus load_json(const std::string& path);
    static MovieCorpus from_json_text(const std::string& text);

    const std::vector<Movie>& movies() const { return m_movies; }
    size_t size() const { return m_movies.size(); }

    std::vector<std::string> titles() const;
    std::vector<std::string> overviews() const;  // missing overview -> ""

private:
    std::vector<Movie> m_movies;
};

}  // namespace movies
