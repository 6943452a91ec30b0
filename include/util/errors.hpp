#pragma once

#include <stdexcept>
#include <string>

namespace nx {

// ============================================================================
// Pipeline Stages
// ============================================================================

/**
 * @brief Stage of the analysis pipeline in which a failure occurred
 */
enum class PipelineStage {
    Validation,
    Classification,
    Fetch,
    Embedding,
    Discovery,
    Persistence,
    Timeout
};

inline std::string pipeline_stage_to_string(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Validation: return "validation";
        case PipelineStage::Classification: return "classification";
        case PipelineStage::Fetch: return "fetch";
        case PipelineStage::Embedding: return "embedding";
        case PipelineStage::Discovery: return "discovery";
        case PipelineStage::Persistence: return "persistence";
        case PipelineStage::Timeout: return "timeout";
        default: return "unknown";
    }
}

// ============================================================================
// Exception Hierarchy
// ============================================================================

/**
 * @brief Base class of every error raised by the service
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// Request rejected before anything was persisted.
class InvalidRequest : public Error {
public:
    explicit InvalidRequest(const std::string& message) : Error(message) {}
};

/// Unknown analysis or topic id.
class NotFound : public Error {
public:
    explicit NotFound(const std::string& message) : Error(message) {}
};

/**
 * @brief Raised by the HTTP collaborator clients
 *
 * transient() is true for transport failures, 5xx and 429 responses; those
 * are the only failures the retry policy repeats.
 */
class CollaboratorError : public Error {
public:
    CollaboratorError(const std::string& message, long http_status, bool transient)
        : Error(message), http_status_(http_status), transient_(transient) {}

    long http_status() const { return http_status_; }
    bool transient() const { return transient_; }

private:
    long http_status_;
    bool transient_;
};

/**
 * @brief Failure of one pipeline stage; always moves the analysis to FAILED
 */
class PipelineError : public Error {
public:
    PipelineError(PipelineStage stage, const std::string& message)
        : Error(message), stage_(stage) {}

    PipelineStage stage() const { return stage_; }

private:
    PipelineStage stage_;
};

class ClassificationFailure : public PipelineError {
public:
    explicit ClassificationFailure(const std::string& message)
        : PipelineError(PipelineStage::Classification, message) {}
};

class FetchFailure : public PipelineError {
public:
    explicit FetchFailure(const std::string& message)
        : PipelineError(PipelineStage::Fetch, message) {}
};

class EmbeddingFailure : public PipelineError {
public:
    explicit EmbeddingFailure(const std::string& message)
        : PipelineError(PipelineStage::Embedding, message) {}
};

class DiscoveryFailure : public PipelineError {
public:
    explicit DiscoveryFailure(const std::string& message)
        : PipelineError(PipelineStage::Discovery, message) {}
};

class PersistenceFailure : public PipelineError {
public:
    explicit PersistenceFailure(const std::string& message)
        : PipelineError(PipelineStage::Persistence, message) {}
};

class PipelineTimeout : public PipelineError {
public:
    explicit PipelineTimeout(const std::string& message)
        : PipelineError(PipelineStage::Timeout, message) {}
};

} // namespace nx
