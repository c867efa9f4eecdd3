#pragma once
#include <string>
#include <vector>

namespace hsn_assistance {

// Pairwise (query, text) relevance scorer used for second-stage re-ranking.
class RelevanceModel {
public:
    virtual ~RelevanceModel() = default;

    // One score per text, same order as the input. Higher is more relevant.
    virtual std::vector<double> score(const std::string& query, const std::vector<std::string>& texts) = 0;
};

// Cross-encoder served over HTTP:
//   POST url {query, documents, model} -> {results: [{index, relevance_score}]}
class CrossEncoderClient : public RelevanceModel {
public:
    CrossEncoderClient(std::string url, std::string model, int timeout_ms = 10000);

    std::vector<double> score(const std::string& query, const std::vector<std::string>& texts) override;

    static std::string build_request(const std::string& query,
                                     const std::vector<std::string>& texts,
                                     const std::string& model);

    // Maps the service's index-tagged results back onto input order.
    // Throws RerankError on malformed bodies or out-of-range indices.
    static std::vector<double> parse_response(const std::string& body, size_t expected);

private:
    std::string url_;
    std::string model_;
    int timeout_ms_;
};

// Offline scorer: fraction of distinct query tokens found in the text.
class LexicalRelevanceModel : public RelevanceModel {
public:
    std::vector<double> score(const std::string& query, const std::vector<std::string>& texts) override;

    static std::vector<std::string> tokenize(const std::string& text);
};

} // namespace hsn_assistance
