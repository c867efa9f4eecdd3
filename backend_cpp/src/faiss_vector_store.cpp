#include "faiss_vector_store.hpp"
#include "errors.hpp"
#include "SystemMonitor.hpp"
#include <faiss/IndexHNSW.h>
#include <faiss/index_io.h>
#include <faiss/utils/distances.h>
#include <faiss/impl/FaissException.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace hsn_assistance {

FaissVectorStore::FaissVectorStore(int dimension, std::shared_ptr<EmbeddingProvider> embedder)
    : dimension_(dimension), embedder_(std::move(embedder)) {
    if (dimension_ <= 0) throw ConfigError("vector_store.dimension must be positive");
    if (!embedder_) throw ConfigError("FaissVectorStore requires an embedding provider");
    reset_index();
}

FaissVectorStore::~FaissVectorStore() {
}

void FaissVectorStore::reset_index() {
    auto idx = new faiss::IndexHNSWFlat(dimension_, 32, faiss::METRIC_INNER_PRODUCT);
    idx->hnsw.efConstruction = 40;
    idx->hnsw.efSearch = 64;
    index_.reset(idx);
}

void FaissVectorStore::initialize(const std::vector<HsnDocument>& documents) {
    if (documents.empty()) {
        spdlog::warn("⚠️ Vector store initialised with an empty document set.");
        return;
    }

    auto start = std::chrono::high_resolution_clock::now();
    std::vector<std::string> texts;
    texts.reserve(documents.size());
    for (const auto& doc : documents) texts.push_back(doc.text);

    auto embeddings = embedder_->embed_batch(texts);
    if (embeddings.size() != documents.size()) {
        throw VectorStoreError("Embedding count does not match document count");
    }

    std::vector<float> vectors_flat;
    vectors_flat.reserve(documents.size() * dimension_);
    for (const auto& e : embeddings) {
        if (static_cast<int>(e.size()) != dimension_) {
            throw VectorStoreError("Embedding dimension " + std::to_string(e.size()) +
                                   " does not match index dimension " + std::to_string(dimension_));
        }
        vectors_flat.insert(vectors_flat.end(), e.begin(), e.end());
    }

    faiss::fvec_renorm_L2(dimension_, documents.size(), vectors_flat.data());

    std::unique_lock lock(index_mutex_);
    reset_index();
    documents_.clear();
    id_to_position_.clear();

    try {
        index_->add(static_cast<faiss::idx_t>(documents.size()), vectors_flat.data());
    } catch (const faiss::FaissException& e) {
        throw VectorStoreError(std::string("FAISS add failed: ") + e.what());
    }

    for (const auto& doc : documents) {
        id_to_position_[doc.document_id] = documents_.size();
        documents_.push_back(doc);
    }

    spdlog::info("✅ Indexed {} documents in FAISS ({:.2f} ms)", documents_.size(),
                 std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start).count());
}

std::vector<RetrievedDocument> FaissVectorStore::query(const std::string& text, int top_k) {
    if (top_k <= 0) return {};

    auto start = std::chrono::high_resolution_clock::now();
    std::vector<float> query_vec = embedder_->embed(text);
    if (static_cast<int>(query_vec.size()) != dimension_) {
        throw VectorStoreError("Query embedding has dimension " + std::to_string(query_vec.size()));
    }
    faiss::fvec_renorm_L2(dimension_, 1, query_vec.data());

    std::shared_lock lock(index_mutex_);
    if (index_->ntotal == 0) return {};

    int k = std::min<int>(top_k, static_cast<int>(index_->ntotal));
    std::vector<float> scores(k);
    std::vector<faiss::idx_t> indices(k);

    try {
        index_->search(1, query_vec.data(), k, scores.data(), indices.data());
    } catch (const faiss::FaissException& e) {
        throw VectorStoreError(std::string("FAISS search failed: ") + e.what());
    }

    std::vector<RetrievedDocument> results;
    for (int i = 0; i < k; ++i) {
        if (indices[i] < 0 || static_cast<size_t>(indices[i]) >= documents_.size()) continue;
        const auto& doc = documents_[indices[i]];
        double distance = 1.0 - static_cast<double>(scores[i]);

        RetrievedDocument r;
        r.id = doc.document_id;
        r.text = doc.text;
        r.metadata = doc.metadata;
        r.score = 1.0 - distance;
        results.push_back(std::move(r));
    }

    SystemMonitor::global_vector_latency_ms.store(
        std::chrono::duration<double, std::milli>(std::chrono::high_resolution_clock::now() - start).count());
    return results;
}

std::optional<HsnDocument> FaissVectorStore::get_document(const std::string& document_id) const {
    std::shared_lock lock(index_mutex_);
    auto it = id_to_position_.find(document_id);
    if (it == id_to_position_.end()) return std::nullopt;
    return documents_[it->second];
}

size_t FaissVectorStore::size() const {
    std::shared_lock lock(index_mutex_);
    return documents_.size();
}

bool FaissVectorStore::exists(const std::string& path) {
    fs::path dir(path);
    return fs::exists(dir / "faiss.index") && fs::exists(dir / "metadata.json");
}

void FaissVectorStore::save(const std::string& path) const {
    fs::path dir(path);
    fs::create_directories(dir);

    std::shared_lock lock(index_mutex_);
    try {
        faiss::write_index(index_.get(), (dir / "faiss.index").string().c_str());
    } catch (const faiss::FaissException& e) {
        throw VectorStoreError(std::string("Failed to write FAISS index: ") + e.what());
    }

    json metadata = json::array();
    for (const auto& doc : documents_) {
        metadata.push_back(doc.to_json());
    }

    std::ofstream meta_file(dir / "metadata.json");
    if (!meta_file.is_open()) {
        throw VectorStoreError("Cannot write " + (dir / "metadata.json").string());
    }
    meta_file << metadata.dump(2);
    spdlog::info("💾 Saved vector store ({} documents) to {}", documents_.size(), path);
}

void FaissVectorStore::load(const std::string& path) {
    fs::path dir(path);

    std::unique_ptr<faiss::Index> loaded;
    try {
        loaded.reset(faiss::read_index((dir / "faiss.index").string().c_str()));
    } catch (const faiss::FaissException& e) {
        throw VectorStoreError(std::string("Failed to read FAISS index: ") + e.what());
    }
    if (loaded->d != dimension_) {
        throw VectorStoreError("Stored index dimension " + std::to_string(loaded->d) +
                               " does not match configured dimension " + std::to_string(dimension_));
    }

    std::ifstream meta_file(dir / "metadata.json");
    if (!meta_file.is_open()) {
        throw VectorStoreError("Missing " + (dir / "metadata.json").string());
    }

    std::vector<HsnDocument> docs;
    try {
        for (const auto& j_doc : json::parse(meta_file)) {
            docs.push_back(HsnDocument::from_json(j_doc));
        }
    } catch (const json::exception& e) {
        throw VectorStoreError(std::string("Malformed vector store metadata: ") + e.what());
    }

    if (static_cast<size_t>(loaded->ntotal) != docs.size()) {
        throw VectorStoreError("Vector store metadata holds " + std::to_string(docs.size()) +
                               " documents but the index holds " + std::to_string(loaded->ntotal));
    }

    std::unique_lock lock(index_mutex_);
    index_ = std::move(loaded);
    documents_ = std::move(docs);
    id_to_position_.clear();
    for (size_t i = 0; i < documents_.size(); ++i) {
        id_to_position_[documents_[i].document_id] = i;
    }
    spdlog::info("✅ Loaded FAISS index with {} documents from {}", documents_.size(), path);
}

} // namespace hsn_assistance
