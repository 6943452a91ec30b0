#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

namespace nx {

/**
 * @brief Text of one clustered document as seen by the labeler
 */
struct LabelDocument {
    std::string title;
    std::string summary;
};

/**
 * @brief Human-readable label of a topic
 */
struct TopicLabel {
    std::string title;
    std::string description;
    std::vector<std::string> keywords;      ///< Best first, at most five
};

/**
 * @brief Layered keyword extraction for topic clusters
 *
 * Candidates are tried in order of specificity:
 *   1. recurring 2-3 word title phrases that are distinctive for the cluster
 *   2. technical terms (acronyms, CamelCase names, hyphenated compounds,
 *      -former / -net / -gan model names)
 *   3. frequent terms discounted by their document frequency in the corpus
 * Stopwords, generic research vocabulary and phrases made only of query
 * words are filtered at every layer.
 */
class TopicLabeler {
public:
    TopicLabeler(std::vector<LabelDocument> corpus, const std::string& query);

    /**
     * @brief Label one cluster
     *
     * @param members Corpus indices, most central first
     */
    TopicLabel label(const std::vector<size_t>& members) const;

    /**
     * @brief Make titles unique by appending a distinguishing keyword or ordinal
     */
    static void disambiguate(std::vector<TopicLabel>& labels);

    // Exposed for tests
    static std::vector<std::string> tokenize(const std::string& text);
    static bool is_stopword(const std::string& lower_word);
    static std::string title_case(const std::string& phrase);

    std::vector<std::string> recurring_phrases(const std::vector<size_t>& members) const;
    std::vector<std::string> technical_terms(const std::vector<size_t>& members) const;
    std::vector<std::string> weighted_terms(const std::vector<size_t>& members) const;

private:
    std::vector<LabelDocument> corpus_;
    std::set<std::string> query_words_;

    std::map<std::string, int> term_df_;    ///< Unigram document frequency over title + summary
    std::map<std::string, int> phrase_df_;  ///< 2-3 gram frequency over titles
    std::map<std::string, int> tech_df_;    ///< Technical-term document frequency (lower-cased)

    bool only_query_words(const std::vector<std::string>& words) const;
    bool acceptable_phrase(const std::vector<std::string>& words) const;
};

} // namespace nx
