//! Vectorizer: vocabulary order, weighting, determinism.

#include "moviesim/Errors.hpp"
#include "moviesim/Vectorizer.hpp"
#include "text/Stopwords.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace moviesim;

TEST(VectorizerTest, RawCountSingleDocument) {
    auto fit = Vectorizer::fit({"The cat sat on the mat with the cat"}, Weighting::RawCount,
                               textutil::english_stopwords());

    // the / on / with are stopwords
    ASSERT_EQ(fit.vocabulary.size(), 3u);
    EXPECT_EQ(fit.vocabulary.term(0), "cat");
    EXPECT_EQ(fit.vocabulary.term(1), "mat");
    EXPECT_EQ(fit.vocabulary.term(2), "sat");

    ASSERT_EQ(fit.matrix.rows.size(), 1u);
    const auto& row = fit.matrix.rows[0];
    ASSERT_EQ(row.size(), 3u);
    EXPECT_EQ(row[0].first, 0u);
    EXPECT_FLOAT_EQ(row[0].second, 2.0f);
    EXPECT_FLOAT_EQ(row[1].second, 1.0f);
    EXPECT_FLOAT_EQ(row[2].second, 1.0f);
    EXPECT_FALSE(fit.matrix.normalized);
    EXPECT_EQ(fit.matrix.dim, 3u);
}

TEST(VectorizerTest, VocabularyIsLexicographic) {
    auto fit = Vectorizer::fit({"zebra apple", "mango"}, Weighting::RawCount, {});
    ASSERT_EQ(fit.vocabulary.size(), 3u);
    EXPECT_EQ(*fit.vocabulary.index_of("apple"), 0u);
    EXPECT_EQ(*fit.vocabulary.index_of("mango"), 1u);
    EXPECT_EQ(*fit.vocabulary.index_of("zebra"), 2u);
    EXPECT_FALSE(fit.vocabulary.index_of("kiwi").has_value());
}

TEST(VectorizerTest, TfidfUsesSmoothedIdf) {
    auto fit = Vectorizer::fit({"apple banana", "apple cherry"}, Weighting::Tfidf, {});

    ASSERT_EQ(fit.idf.size(), 3u);
    EXPECT_NEAR(fit.idf[0], 1.0, 1e-12);                            // apple, df=2
    EXPECT_NEAR(fit.idf[1], std::log(3.0 / 2.0) + 1.0, 1e-12);      // banana, df=1

    const auto& row = fit.matrix.rows[0];
    ASSERT_EQ(row.size(), 2u);
    EXPECT_NEAR(row[0].second / row[1].second, 1.0 / fit.idf[1], 1e-5);
    EXPECT_TRUE(fit.matrix.normalized);
}

TEST(VectorizerTest, TfidfRowsAreUnitLength) {
    auto fit = Vectorizer::fit(
        {"a toy story about toys", "a story about a war", "toys and war stories", "a quiet drama"},
        Weighting::Tfidf, {});

    for (const auto& row : fit.matrix.rows) {
        EXPECT_NEAR(sparse::dot(row, row), 1.0, 1e-5);
    }
}

TEST(VectorizerTest, EmptyDocumentYieldsZeroRow) {
    auto fit = Vectorizer::fit({"space opera", "", "the of and"}, Weighting::Tfidf,
                               textutil::english_stopwords());
    ASSERT_EQ(fit.matrix.rows.size(), 3u);
    EXPECT_TRUE(fit.matrix.rows[1].empty());
    EXPECT_TRUE(fit.matrix.rows[2].empty());
}

TEST(VectorizerTest, FitIsDeterministic) {
    std::vector<std::string> docs = {"heist crew vault", "vault of secrets", "crew of pirates"};
    auto a = Vectorizer::fit(docs, Weighting::Tfidf, {});
    auto b = Vectorizer::fit(docs, Weighting::Tfidf, {});

    EXPECT_TRUE(a.vocabulary == b.vocabulary);
    EXPECT_EQ(a.matrix.rows, b.matrix.rows);
}

TEST(VectorizerTest, EmptyCorpusThrows) {
    EXPECT_THROW(Vectorizer::fit({}, Weighting::Tfidf, {}), EmptyCorpusError);
    EXPECT_THROW(Vectorizer::fit({}, Weighting::Tfidf, {}), InvalidArgumentError);
    EXPECT_THROW(Vectorizer::fit_tokens({}, VectorizerConfig{}), EmptyCorpusError);
}

TEST(VectorizerTest, FitTokensKeepsTokensAsGiven) {
    VectorizerConfig cfg;
    cfg.mode = Weighting::RawCount;
    cfg.stopwords = {"drop"};

    auto fit = Vectorizer::fit_tokens({{"tomhanks", "", "drop", "tomhanks"}, {"sciencefiction"}}, cfg);
    ASSERT_EQ(fit.vocabulary.size(), 2u);
    EXPECT_EQ(fit.vocabulary.term(0), "sciencefiction");
    EXPECT_EQ(fit.vocabulary.term(1), "tomhanks");
    ASSERT_EQ(fit.matrix.rows[0].size(), 1u);
    EXPECT_FLOAT_EQ(fit.matrix.rows[0][0].second, 2.0f);
}

TEST(VectorizerTest, TransformMatchesFittedRow) {
    std::vector<std::string> docs = {"haunted house ghost", "ghost ship", "space station"};
    auto fit = Vectorizer::fit(docs, Weighting::Tfidf, {});

    auto v = fit.transform("haunted house ghost");
    EXPECT_EQ(v, fit.matrix.rows[0]);

    auto unknown = fit.transform("completely unseen words");
    EXPECT_TRUE(unknown.empty());
}
