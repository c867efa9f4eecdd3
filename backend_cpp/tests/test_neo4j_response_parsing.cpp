#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "graph/neo4j_graph.hpp"
#include "errors.hpp"

using namespace hsn_assistance;
using json = nlohmann::json;
using ::testing::HasSubstr;

TEST(Neo4jResponseTest, MakeStatementCarriesParameters) {
    auto stmt = Neo4jGraphBackend::make_statement("MATCH (n {id: $id}) RETURN n", {{"id", "code_1"}});
    EXPECT_EQ(stmt["statement"], "MATCH (n {id: $id}) RETURN n");
    EXPECT_EQ(stmt["parameters"]["id"], "code_1");

    auto bare = Neo4jGraphBackend::make_statement("RETURN 1");
    EXPECT_TRUE(bare["parameters"].is_object());
    EXPECT_TRUE(bare["parameters"].empty());
}

TEST(Neo4jResponseTest, ExtractsRowsPerStatement) {
    std::string body = R"({
        "results": [
            {"columns": ["id", "label", "description"],
             "data": [
                {"row": ["sub_400110", "Subheading", "Latex"], "meta": [null, null, null]},
                {"row": ["code_40011010", "HSNCode", "Prevulcanised"], "meta": [null, null, null]}
             ]},
            {"columns": ["count"], "data": [{"row": [7]}]}
        ],
        "errors": []
    })";

    auto results = Neo4jGraphBackend::extract_results(body);
    ASSERT_EQ(results.size(), 2u);

    auto first = Neo4jGraphBackend::rows_of(results, 0);
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[1][0], "code_40011010");
    EXPECT_EQ(first[1][1], "HSNCode");

    auto second = Neo4jGraphBackend::rows_of(results, 1);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0][0], 7);

    EXPECT_TRUE(Neo4jGraphBackend::rows_of(results, 5).empty());
}

TEST(Neo4jResponseTest, ReportedErrorsRaiseGraphBackendError) {
    std::string body = R"({
        "results": [],
        "errors": [{"code": "Neo.ClientError.Statement.SyntaxError", "message": "Invalid input 'X'"}]
    })";

    try {
        Neo4jGraphBackend::extract_results(body);
        FAIL() << "expected GraphBackendError";
    } catch (const GraphBackendError& e) {
        EXPECT_THAT(e.what(), HasSubstr("Neo.ClientError.Statement.SyntaxError"));
        EXPECT_THAT(e.what(), HasSubstr("Invalid input"));
    }
}

TEST(Neo4jResponseTest, MalformedBodyIsAnUpstreamFailure) {
    EXPECT_THROW(Neo4jGraphBackend::extract_results("<html>502 Bad Gateway</html>"), UpstreamError);
}

TEST(Neo4jResponseTest, MissingResultsYieldsEmptyArray) {
    auto results = Neo4jGraphBackend::extract_results(R"({"errors": []})");
    EXPECT_TRUE(results.is_array());
    EXPECT_TRUE(results.empty());
}

TEST(Neo4jBackendTest, ClosedBackendRefusesCalls) {
    Neo4jSettings settings;
    settings.uri = "http://127.0.0.1:1/";
    Neo4jGraphBackend backend(settings);
    EXPECT_FALSE(backend.supports_direct_traversal());
    EXPECT_EQ(backend.name(), "neo4j");

    backend.close();
    EXPECT_THROW(backend.get_node("code_40011010"), GraphBackendError);
}
