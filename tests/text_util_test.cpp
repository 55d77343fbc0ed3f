//! Tokenizer, plural folding and stopword loading.

#include "text/Stopwords.hpp"
#include "text/TextUtil.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

// ============================================================================
// normalize / tokenize
// ============================================================================

TEST(TextUtilTest, NormalizeLowercasesAndCollapsesSeparators) {
    EXPECT_EQ(textutil::normalize("Hello,  World!! 42"), "hello world 42");
    EXPECT_EQ(textutil::normalize("  --Toy_Story--  "), "toy story");
    EXPECT_EQ(textutil::normalize(""), "");
}

TEST(TextUtilTest, TokenizeSplitsOnSpaces) {
    auto toks = textutil::tokenize("a toy story about toys");
    ASSERT_EQ(toks.size(), 5u);
    EXPECT_EQ(toks[0], "a");
    EXPECT_EQ(toks[4], "toys");
    EXPECT_TRUE(textutil::tokenize("").empty());
}

TEST(TextUtilTest, AnalyzeDropsStopwords) {
    std::unordered_set<std::string> stop = {"a", "about"};
    auto toks = textutil::analyze("A toy STORY, about toys.", stop);
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[0], "toy");
    EXPECT_EQ(toks[1], "story");
    EXPECT_EQ(toks[2], "toys");
}

TEST(TextUtilTest, AnalyzeFoldsPluralsWhenAsked) {
    auto toks = textutil::analyze("toys and stories", {"and"}, true);
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0], "toy");
    EXPECT_EQ(toks[1], "story");
}

TEST(TextUtilTest, FoldedStopwordsAreDropped) {
    auto toks = textutil::analyze("names parts calls dragons", textutil::english_stopwords(), true);
    ASSERT_EQ(toks.size(), 1u);
    EXPECT_EQ(toks[0], "dragon");

    auto unfolded = textutil::analyze("names parts", textutil::english_stopwords(), false);
    EXPECT_EQ(unfolded.size(), 2u);
}

// ============================================================================
// fold_plural
// ============================================================================

TEST(FoldPluralTest, Rules) {
    EXPECT_EQ(textutil::fold_plural("toys"), "toy");
    EXPECT_EQ(textutil::fold_plural("stories"), "story");
    EXPECT_EQ(textutil::fold_plural("horses"), "horse");
    EXPECT_EQ(textutil::fold_plural("toes"), "toe");
    EXPECT_EQ(textutil::fold_plural("glass"), "glass");
    EXPECT_EQ(textutil::fold_plural("status"), "status");
    EXPECT_EQ(textutil::fold_plural("bus"), "bus");
    EXPECT_EQ(textutil::fold_plural("drama"), "drama");
}

TEST(TextUtilTest, CompactName) {
    EXPECT_EQ(textutil::compact_name("Johnny Depp"), "johnnydepp");
    EXPECT_EQ(textutil::compact_name(" Science\tFiction "), "sciencefiction");
}

// ============================================================================
// stopwords
// ============================================================================

TEST(StopwordsTest, EnglishList) {
    const auto& s = textutil::english_stopwords();
    EXPECT_EQ(s.size(), 318u);
    EXPECT_TRUE(s.count("the"));
    EXPECT_TRUE(s.count("about"));
    EXPECT_FALSE(s.count("movie"));
}

TEST(StopwordsTest, LoadFromFile) {
    fs::path p = fs::temp_directory_path() / "moviesim_stopwords_test.txt";
    {
        std::ofstream out(p);
        out << "# custom list\n  Foo \n\nbar\n";
    }
    auto s = textutil::load_stopwords(p.string());
    fs::remove(p);

    EXPECT_EQ(s.size(), 2u);
    EXPECT_TRUE(s.count("foo"));
    EXPECT_TRUE(s.count("bar"));
}

TEST(StopwordsTest, MissingFileThrows) {
    EXPECT_THROW(textutil::load_stopwords("/nonexistent/moviesim/stop.txt"), std::runtime_error);
}
