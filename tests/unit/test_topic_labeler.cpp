#include <gtest/gtest.h>
#include "discovery/topic_labeler.hpp"
#include <algorithm>

using namespace nx;

class TopicLabelerTest : public ::testing::Test {
protected:
    std::vector<LabelDocument> corpus;

    void SetUp() override {
        corpus = {
            {"Graph neural networks for chemistry", "Message passing over molecular graphs."},
            {"Graph neural networks for traffic", "Message passing over road graphs."},
            {"Graph neural networks for recommendation", "Message passing over interaction graphs."},
            {"Protein folding with AlphaFold", "Structure prediction from sequences."},
            {"Protein folding with AlphaFold and diffusion", "Structure prediction with generative priors."},
            {"Protein folding dynamics", "Structure prediction over time."}
        };
    }
};

// ==========================================
// Token helpers
// ==========================================

TEST(TopicLabelerHelpersTest, TokenizeLowercasesAndTrimsHyphens) {
    auto tokens = TopicLabeler::tokenize("Self-Supervised -learning, GPT-4!");
    EXPECT_EQ(tokens, (std::vector<std::string>{"self-supervised", "learning", "gpt-4"}));
    EXPECT_TRUE(TopicLabeler::tokenize(" -- ").empty());
}

TEST(TopicLabelerHelpersTest, TokenizeKeepsUtf8Words) {
    auto tokens = TopicLabeler::tokenize("Schr\xC3\xB6" "dinger bridges, na\xC3\xAF" "ve Bayes");
    EXPECT_EQ(tokens, (std::vector<std::string>{
        "schr\xC3\xB6" "dinger", "bridges", "na\xC3\xAF" "ve", "bayes"}));
    EXPECT_EQ(TopicLabeler::title_case("schr\xC3\xB6" "dinger bridges"), "Schr\xC3\xB6" "dinger Bridges");
}

TEST_F(TopicLabelerTest, Utf8TitlesFormWholePhrases) {
    corpus = {
        {"Schr\xC3\xB6" "dinger bridges for generation", ""},
        {"Schr\xC3\xB6" "dinger bridges in imaging", ""},
        {"Schr\xC3\xB6" "dinger bridges and transport", ""}
    };
    TopicLabeler labeler(corpus, "");
    auto phrases = labeler.recurring_phrases({0, 1, 2});
    ASSERT_FALSE(phrases.empty());
    EXPECT_EQ(phrases.front(), "schr\xC3\xB6" "dinger bridges");
}

TEST(TopicLabelerHelpersTest, StopwordsIncludeGenericResearchWords) {
    EXPECT_TRUE(TopicLabeler::is_stopword("the"));
    EXPECT_TRUE(TopicLabeler::is_stopword("model"));
    EXPECT_TRUE(TopicLabeler::is_stopword("learning"));
    EXPECT_FALSE(TopicLabeler::is_stopword("transformer"));
}

TEST(TopicLabelerHelpersTest, TitleCaseKeepsMinorWordsAndAcronyms) {
    EXPECT_EQ(TopicLabeler::title_case("graph neural networks"), "Graph Neural Networks");
    EXPECT_EQ(TopicLabeler::title_case("theory of mind"), "Theory of Mind");
    EXPECT_EQ(TopicLabeler::title_case("of mice"), "Of Mice");
    EXPECT_EQ(TopicLabeler::title_case("self-supervised BERT"), "Self-Supervised BERT");
}

// ==========================================
// Layers
// ==========================================

TEST_F(TopicLabelerTest, RecurringPhrasePreferredAndDeduplicated) {
    TopicLabeler labeler(corpus, "deep learning");
    auto phrases = labeler.recurring_phrases({0, 1, 2});
    ASSERT_FALSE(phrases.empty());
    EXPECT_EQ(phrases.front(), "graph neural networks");
    // Sub-phrases of a kept phrase are dropped
    EXPECT_EQ(std::count(phrases.begin(), phrases.end(), "graph neural"), 0);
    EXPECT_EQ(std::count(phrases.begin(), phrases.end(), "neural networks"), 0);
}

TEST_F(TopicLabelerTest, TechnicalTermsNeedTwoDocuments) {
    TopicLabeler labeler(corpus, "");
    auto terms = labeler.technical_terms({3, 4, 5});
    ASSERT_FALSE(terms.empty());
    EXPECT_EQ(terms.front(), "AlphaFold");

    EXPECT_TRUE(labeler.technical_terms({0, 1, 2}).empty());
}

TEST_F(TopicLabelerTest, WeightedTermsSkipQueryWords) {
    TopicLabeler labeler(corpus, "message passing");
    auto terms = labeler.weighted_terms({0, 1, 2});
    EXPECT_EQ(std::count(terms.begin(), terms.end(), "message"), 0);
    EXPECT_EQ(std::count(terms.begin(), terms.end(), "passing"), 0);
    EXPECT_GT(std::count(terms.begin(), terms.end(), "graph"), 0);
    EXPECT_LE(terms.size(), 8u);
}

// ==========================================
// Labels
// ==========================================

TEST_F(TopicLabelerTest, LabelsClusterFromItsPhrase) {
    TopicLabeler labeler(corpus, "deep learning");
    TopicLabel gnn = labeler.label({0, 1, 2});
    EXPECT_EQ(gnn.title, "Graph Neural Networks");
    ASSERT_FALSE(gnn.keywords.empty());
    EXPECT_EQ(gnn.keywords.front(), "graph neural networks");
    EXPECT_LE(gnn.keywords.size(), 5u);
    EXPECT_EQ(gnn.description.rfind("3 articles focusing on graph neural networks", 0), 0u);
    EXPECT_NE(gnn.description.find("Most representative: \"Graph neural networks for chemistry\""),
              std::string::npos);

    TopicLabel protein = labeler.label({3, 4, 5});
    EXPECT_EQ(protein.title, "Protein Folding");
}

TEST_F(TopicLabelerTest, QueryOnlyPhrasesAreNotTitles) {
    TopicLabeler labeler(corpus, "graph neural networks");
    TopicLabel label = labeler.label({0, 1, 2});
    EXPECT_EQ(label.title.find("Graph Neural Networks"), std::string::npos);
    EXPECT_FALSE(label.title.empty());
}

TEST(TopicLabelerFallbackTest, GenericTitlesFallBack) {
    TopicLabeler labeler({{"The study", ""}, {"A study", ""}}, "");
    TopicLabel label = labeler.label({0, 1});
    EXPECT_EQ(label.title, "Research Cluster");
    EXPECT_TRUE(label.keywords.empty());
    EXPECT_EQ(label.description, "2 articles. Most representative: \"The study\"");

    EXPECT_EQ(labeler.label({}).title, "Research Cluster");
}

TEST(TopicLabelerFallbackTest, DisambiguatesRepeatedTitles) {
    std::vector<TopicLabel> labels = {
        {"Graph Neural Networks", "", {"graph neural networks", "chemistry"}},
        {"Graph Neural Networks", "", {"graph neural networks", "traffic"}},
        {"Graph Neural Networks", "", {"graph neural networks"}},
        {"Protein Folding", "", {"protein folding"}}
    };
    TopicLabeler::disambiguate(labels);
    EXPECT_EQ(labels[0].title, "Graph Neural Networks");
    EXPECT_EQ(labels[1].title, "Graph Neural Networks (Traffic)");
    EXPECT_EQ(labels[2].title, "Graph Neural Networks (3)");
    EXPECT_EQ(labels[3].title, "Protein Folding");
}
