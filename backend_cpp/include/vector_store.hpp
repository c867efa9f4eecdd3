#pragma once
#include <string>
#include <vector>
#include <optional>
#include "hsn_document.hpp"

namespace hsn_assistance {

// External vector store contract. Implementations must tolerate concurrent
// query() calls once initialize() has returned.
class VectorStore {
public:
    virtual ~VectorStore() = default;

    virtual void initialize(const std::vector<HsnDocument>& documents) = 0;

    // Ranked by descending score, at most top_k results.
    virtual std::vector<RetrievedDocument> query(const std::string& text, int top_k) = 0;

    virtual std::optional<HsnDocument> get_document(const std::string& document_id) const = 0;

    virtual size_t size() const = 0;
};

} // namespace hsn_assistance
