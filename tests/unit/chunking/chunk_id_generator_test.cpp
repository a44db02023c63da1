#include <gtest/gtest.h>

#include <regex>

#include "rag_core/chunking/chunk_id_generator.hpp"
#include "rag_core/errors.hpp"

namespace rag_tests {

using namespace rag_core;

namespace {
const std::regex kUuidShape("^[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$");
}

TEST(ChunkIdGeneratorTest, ContentIdsAreStableAndUuidShaped) {
  ChunkIdGenerator generator(ChunkIdPolicy::ContentDerived);

  const std::string first = generator.generate("manual.md", 2, 1700, "chunk text");
  const std::string second = generator.generate("manual.md", 2, 1700, "chunk text");

  EXPECT_EQ(first, second);
  EXPECT_TRUE(std::regex_match(first, kUuidShape)) << first;
}

TEST(ChunkIdGeneratorTest, ContentIdsDependOnEveryField) {
  ChunkIdGenerator generator(ChunkIdPolicy::ContentDerived);
  const std::string base = generator.generate("manual.md", 2, 1700, "chunk text");

  EXPECT_NE(base, generator.generate("other.md", 2, 1700, "chunk text"));
  EXPECT_NE(base, generator.generate("manual.md", 3, 1700, "chunk text"));
  EXPECT_NE(base, generator.generate("manual.md", 2, 1701, "chunk text"));
  EXPECT_NE(base, generator.generate("manual.md", 2, 1700, "chunk text!"));
}

TEST(ChunkIdGeneratorTest, FieldBoundariesAreUnambiguous) {
  ChunkIdGenerator generator(ChunkIdPolicy::ContentDerived);
  EXPECT_NE(generator.generate("a1", 2, 0, "x"), generator.generate("a", 12, 0, "x"));
}

TEST(ChunkIdGeneratorTest, RandomIdsAreVersion4Uuids) {
  ChunkIdGenerator generator(ChunkIdPolicy::Random);

  const std::string first = generator.generate("manual.md", 0, 0, "text");
  const std::string second = generator.generate("manual.md", 0, 0, "text");

  EXPECT_NE(first, second);
  EXPECT_TRUE(std::regex_match(first, kUuidShape)) << first;
  EXPECT_EQ(first[14], '4');
}

TEST(ChunkIdGeneratorTest, PolicyParsing) {
  EXPECT_EQ(chunk_id_policy_from_string("content"), ChunkIdPolicy::ContentDerived);
  EXPECT_EQ(chunk_id_policy_from_string("random"), ChunkIdPolicy::Random);
  EXPECT_EQ(to_string(ChunkIdPolicy::Random), "random");
  EXPECT_THROW(chunk_id_policy_from_string("sequential"), ConfigurationError);
}

}  // namespace rag_tests
