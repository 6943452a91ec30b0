#include "discovery/topic_labeler.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace nx {

namespace {

const std::unordered_set<std::string>& english_stopwords() {
    static const std::unordered_set<std::string> words = {
        "a", "an", "the", "and", "or", "but", "nor", "in", "on", "at", "to", "for", "of",
        "with", "by", "from", "into", "onto", "over", "under", "about", "as", "via", "per",
        "this", "that", "these", "those", "it", "its", "is", "are", "was", "were", "be",
        "been", "being", "have", "has", "had", "do", "does", "did", "will", "would",
        "could", "should", "can", "may", "might", "must", "shall", "we", "our", "us",
        "you", "your", "they", "their", "them", "he", "she", "his", "her", "i", "my",
        "not", "no", "yes", "all", "any", "some", "each", "every", "more", "most", "less",
        "such", "than", "then", "so", "also", "only", "both", "between", "through",
        "while", "when", "where", "which", "who", "whom", "what", "why", "how", "if",
        "there", "here", "out", "up", "down", "off", "again", "further", "once", "other",
        "own", "same", "too", "very", "just", "s", "t", "vs", "versus", "without",
        "within", "across", "against", "among", "after", "before", "during", "toward",
        "towards", "upon", "whether", "one", "two", "three", "first", "second", "new"
    };
    return words;
}

const std::unordered_set<std::string>& generic_words() {
    static const std::unordered_set<std::string> words = {
        "paper", "papers", "study", "studies", "work", "works", "research", "approach",
        "approaches", "method", "methods", "methodology", "result", "results", "analysis",
        "evaluation", "evaluating", "experiment", "experiments", "experimental",
        "performance", "based", "using", "used", "use", "uses", "propose", "proposed",
        "proposes", "present", "presents", "presented", "show", "shows", "shown",
        "novel", "improving", "improved", "improve", "improves", "towards", "problem",
        "problems", "task", "tasks", "framework", "frameworks", "technique", "techniques",
        "application", "applications", "case", "survey", "review", "introduction",
        "effective", "efficient", "simple", "general", "large", "scale", "data",
        "dataset", "datasets", "model", "models", "modeling", "modelling", "system",
        "systems", "toward", "understanding", "learning", "via", "recent", "existing",
        "demonstrate", "demonstrates", "provide", "provides", "achieve", "achieves",
        "state", "art", "different", "various", "several", "many", "however", "thus",
        "well", "also", "first", "can", "make", "makes", "need", "needs", "post", "thread"
    };
    return words;
}

const std::unordered_set<std::string>& suffix_exclusions() {
    static const std::unordered_set<std::string> words = {
        "internet", "planet", "planets", "magnet", "magnets", "cabinet", "helmet",
        "organ", "began", "slogan", "japan", "vegan", "formers", "former", "net", "nets"
    };
    return words;
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) || c == '-' || c == '.';
    });
}

bool is_generic(const std::string& lower) {
    return generic_words().count(lower) > 0;
}

// UTF-8 continuation and lead bytes stay inside words
bool is_word_byte(unsigned char c) {
    return std::isalnum(c) || c >= 0x80;
}

// Whitespace-separated words with surrounding punctuation stripped; case kept.
std::vector<std::string> raw_words(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string word;
    while (in >> word) {
        size_t begin = 0;
        size_t end = word.size();
        while (begin < end && !is_word_byte(static_cast<unsigned char>(word[begin]))) ++begin;
        while (end > begin && !is_word_byte(static_cast<unsigned char>(word[end - 1]))) --end;
        if (end > begin) out.push_back(word.substr(begin, end - begin));
    }
    return out;
}

std::string join(const std::vector<std::string>& words, size_t from, size_t count, const char* sep) {
    std::string out;
    for (size_t i = from; i < from + count; ++i) {
        if (i > from) out += sep;
        out += words[i];
    }
    return out;
}

bool contains_word_sequence(const std::string& haystack, const std::string& needle) {
    std::string h = " " + to_lower(haystack) + " ";
    std::string n = " " + to_lower(needle) + " ";
    return h.find(n) != std::string::npos;
}

// Canonical key and display form of a technical term, or an empty key.
std::pair<std::string, std::string> classify_technical(const std::string& word) {
    if (word.size() < 2) return {"", ""};

    // Acronyms: LLM, LLMs, BERT, GPT-4
    std::string stem = word;
    if (stem.size() > 2 && stem.back() == 's') {
        std::string head = stem.substr(0, stem.size() - 1);
        if (std::all_of(head.begin(), head.end(), [](unsigned char c) {
                return std::isupper(c) || std::isdigit(c) || c == '-';
            })) {
            stem = head;
        }
    }
    int upper = 0;
    bool acronym_chars = true;
    for (unsigned char c : stem) {
        if (std::isupper(c)) ++upper;
        else if (!std::isdigit(c) && c != '-') acronym_chars = false;
    }
    if (acronym_chars && upper >= 2 && stem.size() <= 8) {
        std::string lower = to_lower(stem);
        if (english_stopwords().count(lower) == 0) return {lower, stem};
    }

    // CamelCase names: RoBERTa, PyTorch, AlphaFold
    if (std::isupper(static_cast<unsigned char>(word[0]))) {
        bool seen_lower = false;
        for (size_t i = 1; i < word.size(); ++i) {
            unsigned char c = static_cast<unsigned char>(word[i]);
            if (std::islower(c)) seen_lower = true;
            else if (std::isupper(c) && seen_lower) return {to_lower(word), word};
        }
    }

    std::string lower = to_lower(word);

    // Hyphenated compounds: self-supervised, zero-shot
    size_t dash = lower.find('-');
    if (dash != std::string::npos && dash > 0 && dash + 1 < lower.size()) {
        std::vector<std::string> parts;
        std::stringstream ss(lower);
        std::string part;
        bool well_formed = true;
        bool meaningful = false;
        while (std::getline(ss, part, '-')) {
            if (part.size() < 2 || !std::all_of(part.begin(), part.end(), [](unsigned char c) {
                    return std::isalpha(c);
                })) {
                well_formed = false;
                break;
            }
            if (english_stopwords().count(part) == 0 && !is_generic(part)) meaningful = true;
            parts.push_back(part);
        }
        if (well_formed && meaningful && parts.size() >= 2) return {lower, lower};
    }

    // Model-name suffixes: Transformer, ResNet, CycleGAN
    if (lower.size() >= 5 && suffix_exclusions().count(lower) == 0) {
        std::string singular = ends_with(lower, "s") ? lower.substr(0, lower.size() - 1) : lower;
        if (ends_with(singular, "former") || ends_with(singular, "net") || ends_with(singular, "gan")) {
            std::string display = ends_with(word, "s") && singular != lower ? word.substr(0, word.size() - 1) : word;
            return {singular, display};
        }
    }
    return {"", ""};
}

struct Scored {
    std::string text;
    double score;
};

void sort_scored(std::vector<Scored>& items) {
    std::sort(items.begin(), items.end(), [](const Scored& a, const Scored& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.text < b.text;
    });
}

double distinctiveness(int cluster_count, size_t cluster_size, int corpus_count, size_t corpus_size) {
    double cluster_share = static_cast<double>(cluster_count) / static_cast<double>(cluster_size);
    double corpus_share = static_cast<double>(std::max(corpus_count, cluster_count)) /
                          static_cast<double>(corpus_size);
    return std::log(1.0 + cluster_share / corpus_share);
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

TopicLabeler::TopicLabeler(std::vector<LabelDocument> corpus, const std::string& query)
    : corpus_(std::move(corpus)) {
    for (const auto& w : tokenize(query)) {
        query_words_.insert(w);
        if (ends_with(w, "s") && w.size() > 3) query_words_.insert(w.substr(0, w.size() - 1));
        else query_words_.insert(w + "s");
    }

    for (const auto& doc : corpus_) {
        std::set<std::string> terms;
        for (const auto& w : tokenize(doc.title + " " + doc.summary)) terms.insert(w);
        for (const auto& t : terms) term_df_[t]++;

        std::set<std::string> phrases;
        auto words = tokenize(doc.title);
        for (size_t len = 2; len <= 3; ++len) {
            for (size_t i = 0; i + len <= words.size(); ++i) {
                phrases.insert(join(words, i, len, " "));
            }
        }
        for (const auto& p : phrases) phrase_df_[p]++;

        std::set<std::string> techs;
        for (const auto& w : raw_words(doc.title + " " + doc.summary)) {
            auto tech = classify_technical(w);
            if (!tech.first.empty()) techs.insert(tech.first);
        }
        for (const auto& t : techs) tech_df_[t]++;
    }
}

// ============================================================================
// Token Helpers
// ============================================================================

std::vector<std::string> TopicLabeler::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    auto flush = [&]() {
        while (!current.empty() && current.back() == '-') current.pop_back();
        size_t lead = 0;
        while (lead < current.size() && current[lead] == '-') ++lead;
        if (lead < current.size()) tokens.push_back(current.substr(lead));
        current.clear();
    };
    for (unsigned char c : text) {
        if (is_word_byte(c) || c == '-') {
            current += c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

bool TopicLabeler::is_stopword(const std::string& lower_word) {
    return english_stopwords().count(lower_word) > 0 || is_generic(lower_word);
}

std::string TopicLabeler::title_case(const std::string& phrase) {
    static const std::unordered_set<std::string> minor = {"of", "and", "for", "in", "on", "to", "the", "with", "a"};
    std::istringstream in(phrase);
    std::string word;
    std::string out;
    bool first = true;
    while (in >> word) {
        bool has_upper = std::any_of(word.begin(), word.end(), [](unsigned char c) { return std::isupper(c); });
        if (!has_upper && !(minor.count(word) && !first)) {
            bool start = true;
            for (auto& ch : word) {
                if (start && std::isalpha(static_cast<unsigned char>(ch))) {
                    ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
                }
                start = (ch == '-');
            }
        }
        if (!first) out += " ";
        out += word;
        first = false;
    }
    return out;
}

bool TopicLabeler::only_query_words(const std::vector<std::string>& words) const {
    if (query_words_.empty()) return false;
    return std::all_of(words.begin(), words.end(), [this](const std::string& w) {
        return query_words_.count(w) > 0 || english_stopwords().count(w) > 0;
    });
}

bool TopicLabeler::acceptable_phrase(const std::vector<std::string>& words) const {
    if (words.empty()) return false;
    if (english_stopwords().count(words.front()) || english_stopwords().count(words.back())) return false;
    bool meaningful = false;
    for (const auto& w : words) {
        if (all_digits(w)) return false;
        if (w.size() > 2 && !is_stopword(w)) meaningful = true;
    }
    return meaningful && !only_query_words(words);
}

// ============================================================================
// Layers
// ============================================================================

std::vector<std::string> TopicLabeler::recurring_phrases(const std::vector<size_t>& members) const {
    if (members.size() < 2 || corpus_.empty()) return {};

    std::map<std::string, int> counts;
    std::map<std::string, size_t> lengths;
    for (size_t idx : members) {
        auto words = tokenize(corpus_[idx].title);
        std::set<std::string> seen;
        for (size_t len = 2; len <= 3; ++len) {
            for (size_t i = 0; i + len <= words.size(); ++i) {
                std::vector<std::string> gram(words.begin() + static_cast<long>(i),
                                              words.begin() + static_cast<long>(i + len));
                if (!acceptable_phrase(gram)) continue;
                std::string phrase = join(words, i, len, " ");
                if (seen.insert(phrase).second) {
                    counts[phrase]++;
                    lengths[phrase] = len;
                }
            }
        }
    }

    const bool whole_corpus = members.size() >= corpus_.size();
    std::vector<Scored> scored;
    for (const auto& [phrase, count] : counts) {
        if (count < 2) continue;
        auto df = phrase_df_.find(phrase);
        int corpus_count = df == phrase_df_.end() ? count : df->second;
        double cluster_share = static_cast<double>(count) / static_cast<double>(members.size());
        double corpus_share = static_cast<double>(corpus_count) / static_cast<double>(corpus_.size());
        if (!whole_corpus && cluster_share <= corpus_share) continue;
        double score = count * distinctiveness(count, members.size(), corpus_count, corpus_.size()) *
                       (1.0 + 0.25 * static_cast<double>(lengths[phrase] - 1));
        scored.push_back({phrase, score});
    }
    sort_scored(scored);

    std::vector<std::string> kept;
    for (const auto& s : scored) {
        bool overlaps = std::any_of(kept.begin(), kept.end(), [&](const std::string& k) {
            return contains_word_sequence(k, s.text) || contains_word_sequence(s.text, k);
        });
        if (!overlaps) kept.push_back(s.text);
        if (kept.size() >= 5) break;
    }
    return kept;
}

std::vector<std::string> TopicLabeler::technical_terms(const std::vector<size_t>& members) const {
    if (members.empty() || corpus_.empty()) return {};

    std::map<std::string, int> counts;
    std::map<std::string, std::string> display;
    for (size_t idx : members) {
        std::set<std::string> seen;
        for (const auto& w : raw_words(corpus_[idx].title + " " + corpus_[idx].summary)) {
            auto tech = classify_technical(w);
            if (tech.first.empty()) continue;
            if (query_words_.count(tech.first) || is_stopword(tech.first)) continue;
            if (seen.insert(tech.first).second) {
                counts[tech.first]++;
                display.emplace(tech.first, tech.second);
            }
        }
    }

    const int min_docs = members.size() >= 2 ? 2 : 1;
    const bool whole_corpus = members.size() >= corpus_.size();
    std::vector<Scored> scored;
    for (const auto& [term, count] : counts) {
        if (count < min_docs) continue;
        auto df = tech_df_.find(term);
        int corpus_count = df == tech_df_.end() ? count : df->second;
        double cluster_share = static_cast<double>(count) / static_cast<double>(members.size());
        double corpus_share = static_cast<double>(corpus_count) / static_cast<double>(corpus_.size());
        if (!whole_corpus && cluster_share <= corpus_share) continue;
        scored.push_back({display[term], count * distinctiveness(count, members.size(), corpus_count, corpus_.size())});
    }
    sort_scored(scored);

    std::vector<std::string> out;
    for (const auto& s : scored) {
        out.push_back(s.text);
        if (out.size() >= 5) break;
    }
    return out;
}

std::vector<std::string> TopicLabeler::weighted_terms(const std::vector<size_t>& members) const {
    if (members.empty() || corpus_.empty()) return {};

    std::map<std::string, double> tf;
    std::map<std::string, int> docs;
    for (size_t idx : members) {
        std::set<std::string> in_doc;
        for (const auto& w : tokenize(corpus_[idx].title + " " + corpus_[idx].summary)) in_doc.insert(w);
        std::set<std::string> in_title;
        for (const auto& w : tokenize(corpus_[idx].title)) in_title.insert(w);

        for (const auto& w : in_doc) {
            if (w.size() < 3 || is_stopword(w) || all_digits(w) || query_words_.count(w)) continue;
            docs[w]++;
            tf[w] += in_title.count(w) ? 1.5 : 1.0;
        }
    }

    const int min_docs = members.size() >= 2 ? 2 : 1;
    const double n = static_cast<double>(corpus_.size());
    std::vector<Scored> scored;
    for (const auto& [term, weight] : tf) {
        if (docs[term] < min_docs) continue;
        auto df = term_df_.find(term);
        double d = df == term_df_.end() ? 1.0 : static_cast<double>(df->second);
        double idf = std::log((n + 1.0) / (d + 1.0)) + 1.0;
        scored.push_back({term, weight * idf});
    }
    sort_scored(scored);

    std::vector<std::string> out;
    for (const auto& s : scored) {
        out.push_back(s.text);
        if (out.size() >= 8) break;
    }
    return out;
}

// ============================================================================
// Labeling
// ============================================================================

TopicLabel TopicLabeler::label(const std::vector<size_t>& members) const {
    TopicLabel result;
    if (members.empty()) {
        result.title = "Research Cluster";
        result.description = "No articles available";
        return result;
    }

    auto phrases = recurring_phrases(members);
    auto techs = technical_terms(members);
    auto terms = weighted_terms(members);

    auto add_keyword = [&](const std::string& k) {
        if (result.keywords.size() >= 5) return;
        for (const auto& existing : result.keywords) {
            if (contains_word_sequence(existing, k) || contains_word_sequence(k, existing)) return;
        }
        result.keywords.push_back(k);
    };
    for (const auto& p : phrases) add_keyword(p);
    for (const auto& t : techs) add_keyword(t);
    for (const auto& t : terms) add_keyword(t);

    if (!phrases.empty()) {
        result.title = title_case(phrases.front());
    } else if (!techs.empty()) {
        result.title = title_case(techs.front());
        if (!terms.empty() && !contains_word_sequence(techs.front(), terms.front())) {
            result.title += " " + title_case(terms.front());
        }
    } else if (terms.size() >= 2) {
        result.title = title_case(terms[0]) + " and " + title_case(terms[1]);
    } else if (terms.size() == 1) {
        result.title = title_case(terms[0]);
    } else {
        result.title = "Research Cluster";
    }
    if (result.title.size() > 60) {
        result.title = result.title.substr(0, 57) + "...";
    }

    std::ostringstream desc;
    desc << members.size() << (members.size() == 1 ? " article" : " articles");
    if (!result.keywords.empty()) {
        desc << " focusing on ";
        size_t shown = std::min<size_t>(3, result.keywords.size());
        for (size_t i = 0; i < shown; ++i) {
            if (i > 0) desc << (i + 1 == shown ? " and " : ", ");
            desc << result.keywords[i];
        }
    }
    desc << ". Most representative: \"" << corpus_[members.front()].title << "\"";
    result.description = desc.str();
    return result;
}

void TopicLabeler::disambiguate(std::vector<TopicLabel>& labels) {
    std::map<std::string, int> seen;
    std::set<std::string> used;
    for (const auto& l : labels) used.insert(to_lower(l.title));

    for (auto& l : labels) {
        std::string key = to_lower(l.title);
        int occurrence = ++seen[key];
        if (occurrence == 1) continue;

        std::string candidate;
        for (const auto& k : l.keywords) {
            if (contains_word_sequence(l.title, k)) continue;
            std::string attempt = l.title + " (" + title_case(k) + ")";
            if (!used.count(to_lower(attempt))) {
                candidate = attempt;
                break;
            }
        }
        for (int ordinal = occurrence; candidate.empty(); ++ordinal) {
            std::string attempt = l.title + " (" + std::to_string(ordinal) + ")";
            if (!used.count(to_lower(attempt))) candidate = attempt;
        }
        l.title = candidate;
        used.insert(to_lower(candidate));
    }
}

} // namespace nx
