#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include "vector_store.hpp"
#include "embedding_service.hpp"

// Forward declare FAISS Index
namespace faiss { struct Index; }

namespace hsn_assistance {

// HNSW index over L2-normalised embeddings with inner-product metric, so
// cosine distance is 1 - inner product. Document metadata lives in a JSON
// side-car next to the index.
class FaissVectorStore : public VectorStore {
public:
    FaissVectorStore(int dimension, std::shared_ptr<EmbeddingProvider> embedder);
    ~FaissVectorStore() override;

    void initialize(const std::vector<HsnDocument>& documents) override;
    std::vector<RetrievedDocument> query(const std::string& text, int top_k) override;
    std::optional<HsnDocument> get_document(const std::string& document_id) const override;
    size_t size() const override;

    void save(const std::string& path) const;
    void load(const std::string& path);

    // True when both faiss.index and metadata.json exist under path.
    static bool exists(const std::string& path);

private:
    int dimension_;
    std::shared_ptr<EmbeddingProvider> embedder_;
    std::unique_ptr<faiss::Index> index_;

    std::vector<HsnDocument> documents_;
    std::unordered_map<std::string, size_t> id_to_position_;

    mutable std::shared_mutex index_mutex_;

    void reset_index();
};

} // namespace hsn_assistance
