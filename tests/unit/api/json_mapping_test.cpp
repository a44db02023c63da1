#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "rag_api/json_mapping.hpp"
#include "rag_api/server.hpp"

namespace rag_tests {

using namespace rag_api;

class JsonMappingTest : public ::testing::Test {
 protected:
  rag_core::RetrieverOptions defaults_{3, 0.1f, false};
};

TEST_F(JsonMappingTest, RequestTakesDefaultsForMissingFields) {
  rag_core::RetrievalRequest request =
      retrieval_request_from_json({{"query", "how are chunks cut?"}}, defaults_);

  EXPECT_EQ(request.query_text, "how are chunks cut?");
  EXPECT_EQ(request.top_k, 3u);
  EXPECT_FLOAT_EQ(request.score_threshold, 0.1f);
  EXPECT_FALSE(request.dedupe_by_document);
  EXPECT_TRUE(request.filters.empty());
}

TEST_F(JsonMappingTest, RequestReadsAllFields) {
  nlohmann::json body = {
      {"query", "q"},
      {"top_k", 7},
      {"score_threshold", 0.5},
      {"dedupe_by_document", true},
      {"filters", {{{"namespace", "source_document"}, {"allow", nlohmann::json::array({"a.md", "b.md"})}}}}};

  rag_core::RetrievalRequest request = retrieval_request_from_json(body, defaults_);

  EXPECT_EQ(request.top_k, 7u);
  EXPECT_FLOAT_EQ(request.score_threshold, 0.5f);
  EXPECT_TRUE(request.dedupe_by_document);
  ASSERT_EQ(request.filters.size(), 1u);
  EXPECT_EQ(request.filters[0].namespace_name, "source_document");
  EXPECT_EQ(request.filters[0].allow, (std::vector<std::string>{"a.md", "b.md"}));
}

TEST_F(JsonMappingTest, InvalidRequestsAreBadRequests) {
  EXPECT_THROW(retrieval_request_from_json(nlohmann::json::array(), defaults_), BadRequestError);
  EXPECT_THROW(retrieval_request_from_json(nlohmann::json::object(), defaults_), BadRequestError);
  EXPECT_THROW(retrieval_request_from_json({{"query", 42}}, defaults_), BadRequestError);
  EXPECT_THROW(retrieval_request_from_json({{"query", "q"}, {"top_k", 0}}, defaults_),
               BadRequestError);
  EXPECT_THROW(retrieval_request_from_json({{"query", "q"}, {"top_k", 2000000000}}, defaults_),
               BadRequestError);
  EXPECT_THROW(retrieval_request_from_json({{"query", "q"}, {"top_k", 5000000000LL}}, defaults_),
               BadRequestError);
  EXPECT_THROW(retrieval_request_from_json({{"query", "q"}, {"filters", "source_document"}},
                                           defaults_),
               BadRequestError);
  EXPECT_THROW(
      retrieval_request_from_json({{"query", "q"}, {"filters", {{{"allow", {"x"}}}}}}, defaults_),
      BadRequestError);
}

TEST_F(JsonMappingTest, LargestAllowedTopKIsAccepted) {
  nlohmann::json body = {{"query", "q"}, {"top_k", rag_core::MAX_TOP_K}};
  EXPECT_EQ(retrieval_request_from_json(body, defaults_).top_k, rag_core::MAX_TOP_K);
}

TEST_F(JsonMappingTest, ResultCarriesContextAndWarnings) {
  // Arrange
  rag_core::RetrievalResult result;
  result.corpus_version = "v3";
  rag_core::HydratedChunk chunk;
  chunk.chunk_id = "c1";
  chunk.score = 0.75f;
  chunk.text = "Chunk text";
  chunk.document_name = "guide.md";
  chunk.index_in_document = 2;
  chunk.start_offset = 1700;
  result.chunks.push_back(chunk);
  result.events.push_back({rag_core::EventLevel::Warning, "Retriever", "missing details", "c9"});
  result.events.push_back({rag_core::EventLevel::Debug, "Retriever", "noise", ""});

  // Act
  nlohmann::json json = retrieval_result_to_json(result);

  // Assert
  EXPECT_EQ(json["corpus_version"], "v3");
  ASSERT_EQ(json["results"].size(), 1u);
  EXPECT_EQ(json["results"][0]["chunk_id"], "c1");
  EXPECT_EQ(json["results"][0]["document_name"], "guide.md");
  EXPECT_EQ(json["results"][0]["start_offset"], 1700);
  EXPECT_EQ(json["context"], "[1] (source: guide.md)\nChunk text\n\n");
  ASSERT_EQ(json["warnings"].size(), 1u);
  EXPECT_EQ(json["warnings"][0]["chunk_id"], "c9");
}

TEST_F(JsonMappingTest, ManifestSummaryOmitsDocumentList) {
  rag_core::CorpusManifest manifest;
  manifest.version = "v1";
  manifest.record_count = 12;
  manifest.documents.push_back({"a.md", "hash", 12});

  nlohmann::json json = manifest_summary_to_json(manifest);

  EXPECT_EQ(json["version"], "v1");
  EXPECT_EQ(json["record_count"], 12);
  EXPECT_EQ(json["document_count"], 1);
  EXPECT_FALSE(json.contains("documents"));
}

TEST_F(JsonMappingTest, RunRecordEmbedsParsedSummary) {
  rag_core::RunRecord run{"r1", "s", "f", "v1", "published", R"({"chunks_embedded": 4})"};
  nlohmann::json json = run_record_to_json(run);
  EXPECT_EQ(json["summary"]["chunks_embedded"], 4);

  run.summary_json = "not json";
  EXPECT_TRUE(run_record_to_json(run)["summary"].is_null());
}

TEST(ServerAddressTest, ParsesHostAndPort) {
  auto [host, port] = Server::parse_address("0.0.0.0:8080");
  EXPECT_EQ(host, "0.0.0.0");
  EXPECT_EQ(port, 8080);

  EXPECT_THROW(Server::parse_address("localhost"), std::invalid_argument);
  EXPECT_THROW(Server::parse_address("localhost:http"), std::invalid_argument);
}

}  // namespace rag_tests
