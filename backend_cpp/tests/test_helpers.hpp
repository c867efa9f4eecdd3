#pragma once
#include <gmock/gmock.h>
#include <string>
#include <vector>
#include "vector_store.hpp"
#include "relevance_model.hpp"
#include "generation_service.hpp"
#include "embedding_service.hpp"
#include "hsn_document.hpp"

namespace hsn_assistance::testing {

class MockVectorStore : public VectorStore {
public:
    MOCK_METHOD(void, initialize, (const std::vector<HsnDocument>&), (override));
    MOCK_METHOD(std::vector<RetrievedDocument>, query, (const std::string&, int), (override));
    MOCK_METHOD(std::optional<HsnDocument>, get_document, (const std::string&), (const, override));
    MOCK_METHOD(size_t, size, (), (const, override));
};

class MockRelevanceModel : public RelevanceModel {
public:
    MOCK_METHOD(std::vector<double>, score, (const std::string&, const std::vector<std::string>&), (override));
};

class MockGeneratorBackend : public GeneratorBackend {
public:
    MOCK_METHOD(std::string, generate, (const std::string&), (override));
};

class MockEmbeddingProvider : public EmbeddingProvider {
public:
    MOCK_METHOD(std::vector<float>, embed, (const std::string&), (override));
    MOCK_METHOD(std::vector<std::vector<float>>, embed_batch, (const std::vector<std::string>&), (override));
};

// Chapter 40 style record: code 4001xxxx under heading 4001, subheading 400110.
inline HsnRecord make_record(const std::string& code,
                             const std::string& subheading,
                             const std::string& item_description) {
    HsnRecord r;
    r.hsn_code = code;
    r.chapter = code.substr(0, 2);
    r.heading = code.substr(0, 4);
    r.subheading = subheading;
    r.item_description = item_description;
    r.chapter_description = "Rubber and articles thereof";
    r.heading_description = "Natural rubber, balata, gutta-percha";
    r.subheading_description = "Natural rubber latex";
    return r;
}

inline RetrievedDocument make_doc(const std::string& code, double score, const std::string& text = "") {
    RetrievedDocument d;
    d.id = document_id_for_code(code);
    d.metadata = make_record(code, code.substr(0, 6), "Item " + code);
    d.text = text.empty() ? d.metadata.item_description : text;
    d.score = score;
    return d;
}

inline HsnDocument make_hsn_document(const HsnRecord& record) {
    HsnDocument d;
    d.document_id = document_id_for_code(record.hsn_code);
    d.text = "HSN Code: " + record.hsn_code + ". " + record.item_description;
    d.metadata = record;
    return d;
}

} // namespace hsn_assistance::testing
