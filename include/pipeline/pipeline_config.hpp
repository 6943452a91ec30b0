#pragma once

#include "collab/http_collaborators.hpp"
#include "discovery/topic_engine.hpp"
#include <optional>
#include <string>

namespace nx {

// ============================================================================
// Service Configuration
// ============================================================================

/**
 * @brief Configuration of the analysis service
 */
struct PipelineConfig {
    // Collaborators
    std::string genai_base_url = "http://localhost:8000";     ///< Classification + embeddings
    std::string fetcher_base_url = "http://localhost:8200";   ///< Article fetch
    int request_timeout_seconds = 60;       ///< Per collaborator call
    int max_retries = 3;                    ///< Total attempts for transient failures
    int retry_backoff_ms = 250;             ///< First backoff; doubled per attempt

    // Storage
    std::string database_path = "nx.db";    ///< ":memory:" for a throwaway store

    // HTTP API
    std::string listen_address = "0.0.0.0";
    int listen_port = 8080;

    // Pipeline
    int pipeline_timeout_seconds = 300;     ///< Deadline for a whole analysis
    int embedding_batch_size = 64;          ///< Texts per embedding call
    int discovery_threads = 2;              ///< Discovery worker pool size

    // Analysis defaults
    int default_max_articles = 100;
    int default_min_cluster_size = 2;
    std::optional<int> default_nr_topics;
    int max_articles_per_topic = 75;
    unsigned int random_seed = 42;          ///< Random projection seed
    std::string default_research_category = "cs.CL";
    std::string default_community_category = "MachineLearning";

    bool verbose = false;

    /**
     * @brief Load configuration from JSON file
     *
     * Missing keys keep their defaults.
     */
    static PipelineConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Defaults overridden by NX_* environment variables
     */
    static PipelineConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    /// Collaborator client settings derived from this configuration.
    CollaboratorConfig collaborator_config() const;

    /// Engine settings derived from this configuration.
    DiscoveryConfig discovery_config() const;
};

/**
 * @brief Load config from the given path, then .nx_config.json in the
 * current and two parent directories, then the environment
 */
PipelineConfig load_config_with_fallback(const std::string& config_path = "");

} // namespace nx
