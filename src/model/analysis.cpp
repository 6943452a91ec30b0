#include "model/analysis.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace nx {

AnalysisStatus string_to_status(const std::string& s) {
    if (s == "PENDING") return AnalysisStatus::PENDING;
    if (s == "CLASSIFYING") return AnalysisStatus::CLASSIFYING;
    if (s == "FETCHING_ARTICLES") return AnalysisStatus::FETCHING_ARTICLES;
    if (s == "EMBEDDING_ARTICLES") return AnalysisStatus::EMBEDDING_ARTICLES;
    if (s == "DISCOVERING_TOPICS") return AnalysisStatus::DISCOVERING_TOPICS;
    if (s == "COMPLETED") return AnalysisStatus::COMPLETED;
    if (s == "FAILED") return AnalysisStatus::FAILED;
    throw std::invalid_argument("Unknown analysis status: " + s);
}

AnalysisType string_to_analysis_type(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "research") return AnalysisType::RESEARCH;
    if (lower == "community") return AnalysisType::COMMUNITY;
    throw std::invalid_argument("Unknown analysis type: " + s);
}

std::string generate_uuid() {
    static std::mutex mutex;
    static std::mt19937_64 engine(std::random_device{}());

    uint64_t hi = 0;
    uint64_t lo = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        hi = engine();
        lo = engine();
    }

    // Version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << static_cast<uint32_t>(hi >> 32) << "-"
       << std::setw(4) << static_cast<uint32_t>((hi >> 16) & 0xFFFF) << "-"
       << std::setw(4) << static_cast<uint32_t>(hi & 0xFFFF) << "-"
       << std::setw(4) << static_cast<uint32_t>(lo >> 48) << "-"
       << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string format_timestamp(int64_t epoch_ms) {
    std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
    int millis = static_cast<int>(epoch_ms % 1000);
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << "." << std::setw(3) << std::setfill('0') << millis << "Z";
    return ss.str();
}

void to_json(json& j, const Article& article) {
    j = json{
        {"id", article.id},
        {"title", article.title},
        {"link", article.link},
        {"snippet", article.snippet}
    };
}

void to_json(json& j, const Topic& topic) {
    j = json{
        {"id", topic.id},
        {"title", topic.title},
        {"description", topic.description},
        {"article_count", topic.article_count},
        {"relevance", topic.relevance},
        {"articles", topic.articles}
    };
}

json analysis_to_json(const Analysis& analysis, bool include_topics) {
    json j;
    j["id"] = analysis.id;
    j["status"] = status_to_string(analysis.status);
    j["query"] = analysis.query;
    j["type"] = analysis.type ? json(analysis_type_to_string(*analysis.type)) : json(nullptr);
    j["feed_url"] = analysis.feed_url.empty() ? json(nullptr) : json(analysis.feed_url);
    j["total_articles_processed"] = analysis.total_articles_processed;
    j["created_at"] = format_timestamp(analysis.created_at_ms);
    if (include_topics) {
        j["topics"] = analysis.topics;
    }
    return j;
}

} // namespace nx
