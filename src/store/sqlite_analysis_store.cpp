#include "store/sqlite_analysis_store.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cmath>
#include <cstring>

namespace nx {

namespace {

struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

// Prepared statement with throwing bind/step helpers
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
            throw PersistenceFailure(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
        }
        stmt_.reset(raw);
    }

    Statement& bind_text(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_.get(), index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind_optional_text(int index, const std::string& value) {
        if (value.empty()) {
            check(sqlite3_bind_null(stmt_.get(), index));
            return *this;
        }
        return bind_text(index, value);
    }

    Statement& bind_int(int index, int64_t value) {
        check(sqlite3_bind_int64(stmt_.get(), index, value));
        return *this;
    }

    Statement& bind_floats(int index, const std::vector<float>& values) {
        if (values.empty()) {
            check(sqlite3_bind_null(stmt_.get(), index));
        } else {
            check(sqlite3_bind_blob(stmt_.get(), index, values.data(),
                                    static_cast<int>(values.size() * sizeof(float)), SQLITE_TRANSIENT));
        }
        return *this;
    }

    /// true while rows remain
    bool step() {
        int rc = sqlite3_step(stmt_.get());
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw PersistenceFailure(std::string("Statement failed: ") + sqlite3_errmsg(db_));
    }

    void run() {
        while (step()) {
        }
    }

    int changes() const { return sqlite3_changes(db_); }

    std::string text(int col) const {
        const unsigned char* v = sqlite3_column_text(stmt_.get(), col);
        return v ? reinterpret_cast<const char*>(v) : "";
    }

    int64_t integer(int col) const { return sqlite3_column_int64(stmt_.get(), col); }

    bool is_null(int col) const { return sqlite3_column_type(stmt_.get(), col) == SQLITE_NULL; }

    std::vector<float> floats(int col) const {
        std::vector<float> out;
        const void* blob = sqlite3_column_blob(stmt_.get(), col);
        int bytes = sqlite3_column_bytes(stmt_.get(), col);
        if (blob && bytes > 0) {
            out.resize(static_cast<size_t>(bytes) / sizeof(float));
            std::memcpy(out.data(), blob, out.size() * sizeof(float));
        }
        return out;
    }

private:
    sqlite3* db_;
    std::unique_ptr<sqlite3_stmt, StatementFinalizer> stmt_;

    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw PersistenceFailure(std::string("Failed to bind parameter: ") + sqlite3_errmsg(db_));
        }
    }
};

// BEGIN IMMEDIATE ... COMMIT, rolled back unless committed
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        exec_or_throw("BEGIN IMMEDIATE");
    }

    ~Transaction() {
        if (!committed_) {
            char* err = nullptr;
            if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
                log::error("store", std::string("Rollback failed: ") + (err ? err : "unknown error"));
            }
            sqlite3_free(err);
        }
    }

    void commit() {
        exec_or_throw("COMMIT");
        committed_ = true;
    }

private:
    sqlite3* db_;
    bool committed_ = false;

    void exec_or_throw(const char* sql) {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string message = err ? err : sqlite3_errmsg(db_);
            sqlite3_free(err);
            throw PersistenceFailure(std::string(sql) + " failed: " + message);
        }
    }
};

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS analysis (
    id TEXT PRIMARY KEY,
    query TEXT NOT NULL,
    type TEXT,
    status TEXT NOT NULL,
    feed_url TEXT,
    total_articles_processed INTEGER NOT NULL DEFAULT 0,
    created_at INTEGER NOT NULL,
    failure_stage TEXT,
    failure_reason TEXT
);
CREATE INDEX IF NOT EXISTS idx_analysis_created_at ON analysis(created_at DESC);

CREATE TABLE IF NOT EXISTS topic (
    id TEXT PRIMARY KEY,
    analysis_id TEXT NOT NULL REFERENCES analysis(id) ON DELETE CASCADE,
    title TEXT NOT NULL,
    description TEXT,
    article_count INTEGER NOT NULL DEFAULT 0,
    relevance INTEGER NOT NULL DEFAULT 0 CHECK (relevance BETWEEN 0 AND 100),
    position INTEGER NOT NULL DEFAULT 0,
    embedding BLOB
);
CREATE INDEX IF NOT EXISTS idx_topic_analysis_id ON topic(analysis_id);

CREATE TABLE IF NOT EXISTS article (
    id TEXT PRIMARY KEY,
    external_id TEXT NOT NULL UNIQUE,
    title TEXT NOT NULL,
    link TEXT,
    snippet TEXT,
    embedding BLOB
);

CREATE TABLE IF NOT EXISTS topic_article (
    topic_id TEXT NOT NULL REFERENCES topic(id) ON DELETE CASCADE,
    article_id TEXT NOT NULL REFERENCES article(id) ON DELETE CASCADE,
    position INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY (topic_id, article_id)
);
CREATE INDEX IF NOT EXISTS idx_topic_article_article_id ON topic_article(article_id);
)SQL";

Analysis read_analysis_row(const Statement& s) {
    Analysis a;
    a.id = s.text(0);
    a.query = s.text(1);
    if (!s.is_null(2)) a.type = string_to_analysis_type(s.text(2));
    a.status = string_to_status(s.text(3));
    a.feed_url = s.text(4);
    a.total_articles_processed = static_cast<int>(s.integer(5));
    a.created_at_ms = s.integer(6);
    a.failure_stage = s.text(7);
    a.failure_reason = s.text(8);
    return a;
}

constexpr const char* kAnalysisColumns =
    "id, query, type, status, feed_url, total_articles_processed, created_at, failure_stage, failure_reason";

double cosine(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0;
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na <= 0.0 || nb <= 0.0) return 0.0;
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

} // anonymous namespace

// ============================================================================
// Connection
// ============================================================================

void SqliteAnalysisStore::Closer::operator()(sqlite3* db) const {
    sqlite3_close(db);
}

SqliteAnalysisStore::SqliteAnalysisStore(const std::string& path)
    : path_(path) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    db_.reset(raw);
    if (rc != SQLITE_OK) {
        std::string message = raw ? sqlite3_errmsg(raw) : "out of memory";
        throw PersistenceFailure("Failed to open database '" + path + "': " + message);
    }
    initialize_schema();
}

SqliteAnalysisStore::~SqliteAnalysisStore() = default;

void SqliteAnalysisStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_.get(), sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : sqlite3_errmsg(db_.get());
        sqlite3_free(err);
        throw PersistenceFailure("SQL error: " + message);
    }
}

void SqliteAnalysisStore::initialize_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    exec("PRAGMA foreign_keys = ON");
    exec("PRAGMA busy_timeout = 5000");
    if (path_ != ":memory:") {
        exec("PRAGMA journal_mode = WAL");
    }
    exec(kSchema);
}

// ============================================================================
// Analysis Lifecycle
// ============================================================================

void SqliteAnalysisStore::create_analysis(const Analysis& stub) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement s(db_.get(),
        "INSERT OR IGNORE INTO analysis (id, query, type, status, feed_url, total_articles_processed, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)");
    s.bind_text(1, stub.id).bind_text(2, stub.query);
    s.bind_optional_text(3, stub.type ? analysis_type_to_string(*stub.type) : "");
    s.bind_text(4, status_to_string(stub.status));
    s.bind_optional_text(5, stub.feed_url);
    s.bind_int(6, stub.total_articles_processed);
    s.bind_int(7, stub.created_at_ms);
    s.run();
}

std::optional<AnalysisStatus> SqliteAnalysisStore::current_status(const std::string& id) {
    Statement s(db_.get(), "SELECT status FROM analysis WHERE id = ?");
    s.bind_text(1, id);
    if (!s.step()) return std::nullopt;
    return string_to_status(s.text(0));
}

bool SqliteAnalysisStore::update_status(const std::string& id, AnalysisStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto current = current_status(id);
    if (!current || is_terminal(*current) || status_rank(status) <= status_rank(*current)) {
        return false;
    }
    Statement s(db_.get(), "UPDATE analysis SET status = ? WHERE id = ?");
    s.bind_text(1, status_to_string(status)).bind_text(2, id);
    s.run();
    return s.changes() > 0;
}

bool SqliteAnalysisStore::update_classification(const std::string& id, AnalysisType type, const std::string& feed_url) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement s(db_.get(),
        "UPDATE analysis SET type = ?, feed_url = ? WHERE id = ? AND status NOT IN ('COMPLETED', 'FAILED')");
    s.bind_text(1, analysis_type_to_string(type)).bind_text(2, feed_url).bind_text(3, id);
    s.run();
    return s.changes() > 0;
}

bool SqliteAnalysisStore::mark_failed(const std::string& id, const std::string& stage, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement s(db_.get(),
        "UPDATE analysis SET status = 'FAILED', failure_stage = ?, failure_reason = ? "
        "WHERE id = ? AND status NOT IN ('COMPLETED', 'FAILED')");
    s.bind_text(1, stage).bind_text(2, reason).bind_text(3, id);
    s.run();
    return s.changes() > 0;
}

std::string SqliteAnalysisStore::upsert_article_locked(const Article& article) {
    if (article.external_id.empty()) {
        throw PersistenceFailure("Article has no external id");
    }
    Statement insert(db_.get(),
        "INSERT OR IGNORE INTO article (id, external_id, title, link, snippet, embedding) VALUES (?, ?, ?, ?, ?, ?)");
    insert.bind_text(1, article.id.empty() ? generate_uuid() : article.id);
    insert.bind_text(2, article.external_id);
    insert.bind_text(3, article.title);
    insert.bind_optional_text(4, article.link);
    insert.bind_optional_text(5, article.snippet);
    insert.bind_floats(6, article.embedding);
    insert.run();

    Statement select(db_.get(), "SELECT id FROM article WHERE external_id = ?");
    select.bind_text(1, article.external_id);
    if (!select.step()) {
        throw PersistenceFailure("Article '" + article.external_id + "' missing after insert");
    }
    return select.text(0);
}

std::string SqliteAnalysisStore::upsert_article(const Article& article) {
    std::lock_guard<std::mutex> lock(mutex_);
    return upsert_article_locked(article);
}

bool SqliteAnalysisStore::commit_results(
    const std::string& id,
    const std::vector<Topic>& topics,
    int total_articles_processed
) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        Transaction tx(db_.get());

        auto current = current_status(id);
        if (!current || is_terminal(*current)) {
            return false;
        }

        int position = 0;
        for (const auto& topic : topics) {
            Statement t(db_.get(),
                "INSERT OR IGNORE INTO topic (id, analysis_id, title, description, article_count, relevance, position, embedding) "
                "VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
            t.bind_text(1, topic.id).bind_text(2, id).bind_text(3, topic.title);
            t.bind_optional_text(4, topic.description);
            t.bind_int(5, static_cast<int64_t>(topic.articles.size()));
            t.bind_int(6, std::max(0, std::min(100, topic.relevance)));
            t.bind_int(7, position++);
            t.bind_floats(8, topic.embedding);
            t.run();

            int article_position = 0;
            for (const auto& article : topic.articles) {
                std::string article_id = upsert_article_locked(article);
                Statement link(db_.get(),
                    "INSERT OR IGNORE INTO topic_article (topic_id, article_id, position) VALUES (?, ?, ?)");
                link.bind_text(1, topic.id).bind_text(2, article_id).bind_int(3, article_position++);
                link.run();
            }
        }

        Statement done(db_.get(),
            "UPDATE analysis SET total_articles_processed = ?, status = 'COMPLETED' WHERE id = ?");
        done.bind_int(1, total_articles_processed).bind_text(2, id);
        done.run();

        tx.commit();
        return true;
    } catch (const PersistenceFailure&) {
        throw;
    } catch (const std::exception& e) {
        throw PersistenceFailure(std::string("Failed to commit results: ") + e.what());
    }
}

// ============================================================================
// Reads
// ============================================================================

std::vector<Article> SqliteAnalysisStore::load_articles(const std::string& topic_id) {
    Statement s(db_.get(),
        "SELECT a.id, a.external_id, a.title, a.link, a.snippet, a.embedding "
        "FROM topic_article ta JOIN article a ON a.id = ta.article_id "
        "WHERE ta.topic_id = ? ORDER BY ta.position, a.id");
    s.bind_text(1, topic_id);

    std::vector<Article> articles;
    while (s.step()) {
        Article a;
        a.id = s.text(0);
        a.external_id = s.text(1);
        a.title = s.text(2);
        a.link = s.text(3);
        a.snippet = s.text(4);
        a.embedding = s.floats(5);
        articles.push_back(std::move(a));
    }
    return articles;
}

std::vector<Topic> SqliteAnalysisStore::load_topics(const std::string& analysis_id) {
    Statement s(db_.get(),
        "SELECT t.id, t.title, t.description, t.relevance, t.embedding, "
        "(SELECT COUNT(*) FROM topic_article ta WHERE ta.topic_id = t.id) "
        "FROM topic t WHERE t.analysis_id = ? ORDER BY t.position, t.relevance DESC, t.title");
    s.bind_text(1, analysis_id);

    std::vector<Topic> topics;
    while (s.step()) {
        Topic t;
        t.id = s.text(0);
        t.analysis_id = analysis_id;
        t.title = s.text(1);
        t.description = s.text(2);
        t.relevance = static_cast<int>(s.integer(3));
        t.embedding = s.floats(4);
        t.article_count = static_cast<int>(s.integer(5));
        topics.push_back(std::move(t));
    }
    for (auto& t : topics) {
        t.articles = load_articles(t.id);
    }
    return topics;
}

std::optional<Analysis> SqliteAnalysisStore::get_analysis(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string("SELECT ") + kAnalysisColumns + " FROM analysis WHERE id = ?";
    Statement s(db_.get(), sql.c_str());
    s.bind_text(1, id);
    if (!s.step()) return std::nullopt;

    Analysis a = read_analysis_row(s);
    a.topics = load_topics(id);
    return a;
}

std::vector<Analysis> SqliteAnalysisStore::list_analyses(int limit, int offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string("SELECT ") + kAnalysisColumns +
                      " FROM analysis ORDER BY created_at DESC, rowid DESC LIMIT ? OFFSET ?";
    Statement s(db_.get(), sql.c_str());
    s.bind_int(1, std::max(0, limit)).bind_int(2, std::max(0, offset));

    std::vector<Analysis> out;
    while (s.step()) {
        out.push_back(read_analysis_row(s));
    }
    return out;
}

int SqliteAnalysisStore::count_analyses() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement s(db_.get(), "SELECT COUNT(*) FROM analysis");
    return s.step() ? static_cast<int>(s.integer(0)) : 0;
}

bool SqliteAnalysisStore::delete_analysis(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement s(db_.get(), "DELETE FROM analysis WHERE id = ?");
    s.bind_text(1, id);
    s.run();
    return s.changes() > 0;
}

int SqliteAnalysisStore::count_articles() {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement s(db_.get(), "SELECT COUNT(*) FROM article");
    return s.step() ? static_cast<int>(s.integer(0)) : 0;
}

std::vector<SimilarTopic> SqliteAnalysisStore::find_similar_topics(const std::string& topic_id, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement target(db_.get(), "SELECT analysis_id, embedding FROM topic WHERE id = ?");
    target.bind_text(1, topic_id);
    if (!target.step()) {
        throw NotFound("Topic not found: " + topic_id);
    }
    const std::string analysis_id = target.text(0);
    const std::vector<float> reference = target.floats(1);
    if (reference.empty() || limit <= 0) {
        return {};
    }

    Statement s(db_.get(),
        "SELECT t.id, t.analysis_id, t.title, t.description, t.relevance, t.embedding, "
        "(SELECT COUNT(*) FROM topic_article ta WHERE ta.topic_id = t.id) "
        "FROM topic t WHERE t.id <> ? AND t.analysis_id <> ? AND t.embedding IS NOT NULL");
    s.bind_text(1, topic_id).bind_text(2, analysis_id);

    std::vector<SimilarTopic> out;
    while (s.step()) {
        SimilarTopic st;
        st.topic.id = s.text(0);
        st.topic.analysis_id = s.text(1);
        st.topic.title = s.text(2);
        st.topic.description = s.text(3);
        st.topic.relevance = static_cast<int>(s.integer(4));
        st.topic.embedding = s.floats(5);
        st.topic.article_count = static_cast<int>(s.integer(6));
        st.similarity = cosine(reference, st.topic.embedding);
        out.push_back(std::move(st));
    }

    std::sort(out.begin(), out.end(), [](const SimilarTopic& a, const SimilarTopic& b) {
        if (a.similarity != b.similarity) return a.similarity > b.similarity;
        return a.topic.id < b.topic.id;
    });
    if (out.size() > static_cast<size_t>(limit)) {
        out.resize(static_cast<size_t>(limit));
    }
    return out;
}

} // namespace nx
