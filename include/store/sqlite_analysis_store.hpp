#pragma once

#include "store/analysis_store.hpp"
#include <memory>
#include <mutex>
#include <string>

struct sqlite3;

namespace nx {

/**
 * @brief SQLite-backed AnalysisStore
 *
 * One connection guarded by a mutex. Foreign keys are enabled so deleting an
 * analysis cascades to its topics and topic/article links. ":memory:" opens
 * a private in-memory database.
 */
class SqliteAnalysisStore : public AnalysisStore {
public:
    explicit SqliteAnalysisStore(const std::string& path);
    ~SqliteAnalysisStore() override;

    SqliteAnalysisStore(const SqliteAnalysisStore&) = delete;
    SqliteAnalysisStore& operator=(const SqliteAnalysisStore&) = delete;

    void create_analysis(const Analysis& stub) override;
    bool update_status(const std::string& id, AnalysisStatus status) override;
    bool update_classification(const std::string& id, AnalysisType type, const std::string& feed_url) override;
    bool mark_failed(const std::string& id, const std::string& stage, const std::string& reason) override;
    bool commit_results(const std::string& id, const std::vector<Topic>& topics, int total_articles_processed) override;
    std::string upsert_article(const Article& article) override;
    std::optional<Analysis> get_analysis(const std::string& id) override;
    std::vector<Analysis> list_analyses(int limit, int offset) override;
    int count_analyses() override;
    bool delete_analysis(const std::string& id) override;
    int count_articles() override;
    std::vector<SimilarTopic> find_similar_topics(const std::string& topic_id, int limit) override;

    const std::string& path() const { return path_; }

private:
    struct Closer {
        void operator()(sqlite3* db) const;
    };

    std::string path_;
    std::unique_ptr<sqlite3, Closer> db_;
    std::mutex mutex_;

    void initialize_schema();
    void exec(const char* sql);

    // Callers hold mutex_
    std::optional<AnalysisStatus> current_status(const std::string& id);
    std::string upsert_article_locked(const Article& article);
    std::vector<Topic> load_topics(const std::string& analysis_id);
    std::vector<Article> load_articles(const std::string& topic_id);
};

} // namespace nx
