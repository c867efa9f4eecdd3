#pragma once
#include <stdexcept>
#include <string>

namespace hsn_assistance {

// Bad or missing configuration, unknown backend/strategy names. Fatal at startup.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// A collaborator (vector store, graph database, model endpoint) failed.
// Aborts the current turn; the caller may retry.
class UpstreamError : public std::runtime_error {
public:
    explicit UpstreamError(const std::string& msg) : std::runtime_error(msg) {}
};

class VectorStoreError : public UpstreamError {
public:
    explicit VectorStoreError(const std::string& msg) : UpstreamError(msg) {}
};

class GraphBackendError : public UpstreamError {
public:
    explicit GraphBackendError(const std::string& msg) : UpstreamError(msg) {}
};

class EmbeddingError : public UpstreamError {
public:
    explicit EmbeddingError(const std::string& msg) : UpstreamError(msg) {}
};

class RerankError : public UpstreamError {
public:
    explicit RerankError(const std::string& msg) : UpstreamError(msg) {}
};

class GenerationError : public UpstreamError {
public:
    explicit GenerationError(const std::string& msg) : UpstreamError(msg) {}
};

} // namespace hsn_assistance
