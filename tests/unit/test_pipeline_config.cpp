#include <gtest/gtest.h>
#include "pipeline/pipeline_config.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace nx;

class PipelineConfigTest : public ::testing::Test {
protected:
    std::string path;

    void SetUp() override {
        path = ::testing::TempDir() + "nx_config_test.json";
        unsetenv("NX_GENAI_URL");
        unsetenv("NX_PORT");
        unsetenv("NX_VERBOSE");
    }

    void TearDown() override {
        std::remove(path.c_str());
        unsetenv("NX_GENAI_URL");
        unsetenv("NX_PORT");
        unsetenv("NX_VERBOSE");
    }
};

TEST_F(PipelineConfigTest, DefaultsAreValid) {
    PipelineConfig config;
    std::string error;
    EXPECT_TRUE(config.validate(error)) << error;
    EXPECT_EQ(config.listen_port, 8080);
    EXPECT_EQ(config.pipeline_timeout_seconds, 300);
    EXPECT_FALSE(config.default_nr_topics.has_value());
}

TEST_F(PipelineConfigTest, FileRoundTrip) {
    PipelineConfig config;
    config.genai_base_url = "http://genai:9000";
    config.database_path = "/var/lib/nx/analyses.db";
    config.default_nr_topics = 6;
    config.max_articles_per_topic = 20;
    config.to_json_file(path);

    PipelineConfig loaded = PipelineConfig::from_json_file(path);
    EXPECT_EQ(loaded.genai_base_url, "http://genai:9000");
    EXPECT_EQ(loaded.database_path, "/var/lib/nx/analyses.db");
    EXPECT_EQ(loaded.default_nr_topics.value_or(0), 6);
    EXPECT_EQ(loaded.max_articles_per_topic, 20);
    EXPECT_EQ(loaded.fetcher_base_url, config.fetcher_base_url);
}

TEST_F(PipelineConfigTest, MissingFileThrows) {
    EXPECT_THROW(PipelineConfig::from_json_file(path + ".missing"), std::runtime_error);
}

TEST_F(PipelineConfigTest, EnvironmentOverridesDefaults) {
    setenv("NX_GENAI_URL", "http://env-genai", 1);
    setenv("NX_PORT", "9191", 1);
    setenv("NX_VERBOSE", "true", 1);
    PipelineConfig config = PipelineConfig::from_environment();
    EXPECT_EQ(config.genai_base_url, "http://env-genai");
    EXPECT_EQ(config.listen_port, 9191);
    EXPECT_TRUE(config.verbose);

    setenv("NX_PORT", "not-a-port", 1);
    EXPECT_EQ(PipelineConfig::from_environment().listen_port, 8080);
}

TEST_F(PipelineConfigTest, FallbackPrefersExplicitFile) {
    {
        std::ofstream out(path);
        out << R"({"listen_port": 7000})";
    }
    EXPECT_EQ(load_config_with_fallback(path).listen_port, 7000);

    {
        std::ofstream out(path);
        out << "{ broken";
    }
    setenv("NX_PORT", "7100", 1);
    EXPECT_EQ(load_config_with_fallback(path).listen_port, 7100);
}

TEST_F(PipelineConfigTest, ValidationCatchesBadValues) {
    std::string error;

    PipelineConfig no_url;
    no_url.fetcher_base_url.clear();
    EXPECT_FALSE(no_url.validate(error));
    EXPECT_FALSE(error.empty());

    PipelineConfig bad_port;
    bad_port.listen_port = 70000;
    EXPECT_FALSE(bad_port.validate(error));

    PipelineConfig bad_topics;
    bad_topics.default_nr_topics = 0;
    EXPECT_FALSE(bad_topics.validate(error));

    PipelineConfig bad_threads;
    bad_threads.discovery_threads = 0;
    EXPECT_FALSE(bad_threads.validate(error));
}

TEST_F(PipelineConfigTest, DerivedConfigsCarrySettings) {
    PipelineConfig config;
    config.request_timeout_seconds = 12;
    config.max_retries = 5;
    config.default_min_cluster_size = 4;
    config.max_articles_per_topic = 30;
    config.random_seed = 99;

    CollaboratorConfig collab = config.collaborator_config();
    EXPECT_EQ(collab.timeout_seconds, 12);
    EXPECT_EQ(collab.max_retries, 5);
    EXPECT_EQ(collab.genai_base_url, config.genai_base_url);

    DiscoveryConfig discovery = config.discovery_config();
    EXPECT_EQ(discovery.min_cluster_size, 4);
    EXPECT_EQ(discovery.max_articles_per_topic, 30);
    EXPECT_EQ(discovery.reduction.seed, 99u);
}
