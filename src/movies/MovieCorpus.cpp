#include "movies/MovieCorpus.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace movies {

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::optional<std::string> optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string or null");
    }
    return j.at(key).get<std::string>();
}

// entries are either {"name": ..., "job": ...} objects or bare strings
static Credit parseCredit(const json& j, const std::string& where) {
    Credit c;
    if (j.is_string()) {
        c.name = j.get<std::string>();
        return c;
    }
    require_object(j, where);
    c.name = require_string(j, "name", where);
    c.job = optional_string(j, "job", where);
    return c;
}

static std::vector<Credit> parseCredits(const json& j, const char* key, const std::string& where) {
    std::vector<Credit> out;
    if (!j.contains(key) || j.at(key).is_null()) return out;

    const json& arr = j.at(key);
    if (!arr.is_array()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an array");
    }
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        std::ostringstream oss;
        oss << where << "." << key << "[" << i << "]";
        out.push_back(parseCredit(arr.at(i), oss.str()));
    }
    return out;
}

static Movie parseMovie(const json& j, size_t pos, const std::string& where) {
    require_object(j, where);

    Movie m;
    m.id = (long long)pos;
    if (j.contains("id") && !j.at("id").is_null()) {
        if (!j.at("id").is_number_integer()) {
            throw std::runtime_error(where + ".id must be an integer");
        }
        m.id = j.at("id").get<long long>();
    }
    m.title    = require_string(j, "title", where);
    m.overview = optional_string(j, "overview", where);
    m.cast     = parseCredits(j, "cast", where);
    m.crew     = parseCredits(j, "crew", where);
    m.genres   = parseCredits(j, "genres", where);
    m.keywords = parseCredits(j, "keywords", where);
    return m;
}

MovieCorpus MovieCorpus::from_json_text(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }

    if (!j.is_array()) {
        throw std::runtime_error("root must be an array");
    }

    MovieCorpus c;
    c.m_movies.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        std::ostringstream oss;
        oss << "root[" << i << "]";
        c.m_movies.push_back(parseMovie(j.at(i), i, oss.str()));
    }
    return c;
}

MovieCorpus MovieCorpus::load_json(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open corpus file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return from_json_text(ss.str());
}

std::vector<std::string> MovieCorpus::titles() const {
    std::vector<std::string> out;
    out.reserve(m_movies.size());
    for (const auto& m : m_movies) out.push_back(m.title);
    return out;
}

std::vector<std::string> MovieCorpus::overviews() const {
    std::vector<std::string> out;
    out.reserve(m_movies.size());
    for (const auto& m : m_movies) out.push_back(m.overview.value_or(""));
    return out;
}

}  // namespace movies
