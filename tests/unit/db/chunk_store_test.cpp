#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <filesystem>
#include <string>
#include <vector>

#include "codelens_core/db/chunk_store.hpp"
#include "common/utilities_test.hpp"

namespace codelens_core {

using codelens_tests::TEST_DIMENSION;
using codelens_tests::TestUtilities;

class ChunkStoreTest : public codelens_tests::ChunkStoreTestBase {
 protected:
  static std::vector<std::string> ids_of(const std::vector<ChunkMatch>& matches) {
    std::vector<std::string> ids;
    for (const auto& m : matches) {
      ids.push_back(m.chunk.id);
    }
    return ids;
  }
};

TEST_F(ChunkStoreTest, Initialize_CreatesDatabaseFile) {
  EXPECT_TRUE(store_->is_open());
  EXPECT_TRUE(std::filesystem::exists(store_->database_path()));
  EXPECT_EQ(store_->database_path().filename(), ChunkStore::DATABASE_FILE_NAME);
}

TEST_F(ChunkStoreTest, Initialize_TwiceIsNoOp) {
  store_->insert_chunks({TestUtilities::create_test_chunk("a", "src/a.ts", "alpha")});

  EXPECT_NO_THROW(store_->initialize());
  EXPECT_EQ(store_->get_stats().total_chunks, 1u);
}

TEST_F(ChunkStoreTest, Initialize_InaccessiblePathThrowsStorageUnavailable) {
  // Arrange: a regular file where the storage directory should be
  auto blocker = temp_dir_ / "not_a_dir";
  TestUtilities::write_file(blocker, "occupied");
  ChunkStoreOptions options = make_options();
  options.storage_path = blocker / "store";
  ChunkStore store(options);

  // Act & Assert
  EXPECT_THROW(store.initialize(), StorageUnavailableError);
  EXPECT_FALSE(store.is_open());
}

TEST_F(ChunkStoreTest, Operations_BeforeInitializeThrow) {
  ChunkStoreOptions options = make_options();
  options.storage_path = temp_dir_ / "uninitialized";
  ChunkStore store(options);

  EXPECT_THROW(store.get_stats(), ChunkStoreError);
  EXPECT_THROW(store.search(TestUtilities::axis_vector(0), 1), ChunkStoreError);
}

TEST_F(ChunkStoreTest, Constructor_RejectsZeroDimension) {
  ChunkStoreOptions options = make_options();
  options.dimension = 0;
  EXPECT_THROW(ChunkStore store(options), std::invalid_argument);
}

TEST_F(ChunkStoreTest, InsertChunks_RoundTripsAllFields) {
  // Arrange
  CodeChunk chunk = TestUtilities::create_test_chunk(
      "src/math.ts#add", "src/math.ts", "export function add(a, b) {\n  return a + b;\n}",
      TestUtilities::axis_vector(1), ChunkKind::Function, 3, "add");
  chunk.dependencies = {"src/types.ts", "src/util.ts"};

  // Act
  store_->insert_chunks({chunk});
  auto loaded = store_->get_chunk("src/math.ts#add");

  // Assert
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->file_path, "src/math.ts");
  EXPECT_EQ(loaded->name, "add");
  EXPECT_EQ(loaded->content, chunk.content);
  EXPECT_EQ(loaded->kind, ChunkKind::Function);
  EXPECT_EQ(loaded->loc, 3);
  EXPECT_EQ(loaded->complexity, 3);
  EXPECT_EQ(loaded->dependencies, chunk.dependencies);
  EXPECT_EQ(loaded->embedding, chunk.embedding);
}

TEST_F(ChunkStoreTest, InsertChunks_EmptyContentIsStored) {
  store_->insert_chunks({TestUtilities::create_test_chunk("empty", "src/e.ts", "")});

  auto loaded = store_->get_chunk("empty");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->content, "");
}

TEST_F(ChunkStoreTest, InsertChunks_UpsertsById) {
  store_->insert_chunks({TestUtilities::create_test_chunk("x", "src/x.ts", "first version",
                                                          TestUtilities::axis_vector(0))});
  store_->insert_chunks({TestUtilities::create_test_chunk("x", "src/x.ts", "second version",
                                                          TestUtilities::axis_vector(2))});

  EXPECT_EQ(store_->get_stats().total_chunks, 1u);
  EXPECT_EQ(store_->get_chunk("x")->content, "second version");

  auto matches = store_->search(TestUtilities::axis_vector(2), 1);
  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].chunk.id, "x");
  EXPECT_NEAR(matches[0].similarity, 1.0f, 1e-5);
}

TEST_F(ChunkStoreTest, InsertChunks_WrongDimensionFailsWithoutChangingState) {
  // Arrange
  store_->insert_chunks({TestUtilities::create_test_chunk("keep", "src/k.ts", "kept")});
  CodeChunk bad = TestUtilities::create_test_chunk("bad", "src/b.ts", "bad",
                                                   std::vector<float>(TEST_DIMENSION + 1, 0.5f));

  // Act & Assert
  try {
    store_->insert_chunks({bad});
    FAIL() << "Expected DimensionMismatchError";
  } catch (const DimensionMismatchError& e) {
    EXPECT_EQ(e.expected_dimension(), TEST_DIMENSION);
    EXPECT_THAT(e.rejected_ids(), ::testing::ElementsAre("bad"));
  }
  EXPECT_EQ(store_->get_stats().total_chunks, 1u);
  EXPECT_FALSE(store_->get_chunk("bad").has_value());
  EXPECT_EQ(store_->search(TestUtilities::axis_vector(0), 10).size(), 1u);
}

TEST_F(ChunkStoreTest, InsertChunks_MixedBatchCommitsValidChunks) {
  std::vector<CodeChunk> batch = {
      TestUtilities::create_test_chunk("good1", "src/g.ts", "one"),
      TestUtilities::create_test_chunk("short", "src/g.ts", "two", std::vector<float>(3, 1.0f)),
      TestUtilities::create_test_chunk("good2", "src/g.ts", "three"),
  };

  EXPECT_THROW(store_->insert_chunks(batch), DimensionMismatchError);

  EXPECT_TRUE(store_->get_chunk("good1").has_value());
  EXPECT_TRUE(store_->get_chunk("good2").has_value());
  EXPECT_FALSE(store_->get_chunk("short").has_value());
}

TEST_F(ChunkStoreTest, Search_ReturnsNearerOfTwoChunks) {
  // Arrange: the query leans towards the second axis
  store_->insert_chunks({
      TestUtilities::create_test_chunk("first", "src/a.ts", "a", TestUtilities::axis_vector(0, 0.1f)),
      TestUtilities::create_test_chunk("second", "src/b.ts", "b", TestUtilities::axis_vector(1, 0.1f)),
  });

  // Act
  auto matches = store_->search(TestUtilities::axis_vector(1, 0.2f), 1);

  // Assert
  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].chunk.id, "second");
}

TEST(ChunkStoreInnerProductTest, Search_ScaledQueryReturnsExactlyOneChunk) {
  // Arrange
  auto dir = TestUtilities::create_temp_test_dir("chunk_store_ip");
  ChunkStoreOptions options;
  options.storage_path = dir / "store";
  options.dimension = TEST_DIMENSION;
  options.metric = SimilarityMetric::InnerProduct;
  options.pool_size = 1;
  ChunkStore store(options);
  store.initialize();
  store.insert_chunks({
      TestUtilities::create_test_chunk("low", "src/l.ts", "l", std::vector<float>(TEST_DIMENSION, 0.1f)),
      TestUtilities::create_test_chunk("high", "src/h.ts", "h", std::vector<float>(TEST_DIMENSION, 0.2f)),
  });

  // Act
  auto matches = store.search(std::vector<float>(TEST_DIMENSION, 0.15f), 1);

  // Assert: raw dot products 0.12 and 0.24
  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].chunk.id, "high");
  EXPECT_NEAR(matches[0].similarity, 0.15f * 0.2f * TEST_DIMENSION, 1e-5);

  store.close();
  TestUtilities::cleanup_temp_dir(dir);
}

TEST_F(ChunkStoreTest, Search_TiesBreakByAscendingId) {
  // Identical embeddings give identical similarity
  store_->insert_chunks({
      TestUtilities::create_test_chunk("zeta", "src/z.ts", "z", TestUtilities::axis_vector(3)),
      TestUtilities::create_test_chunk("alpha", "src/a.ts", "a", TestUtilities::axis_vector(3)),
      TestUtilities::create_test_chunk("mid", "src/m.ts", "m", TestUtilities::axis_vector(3)),
  });

  auto matches = store_->search(TestUtilities::axis_vector(3), 3);

  EXPECT_THAT(ids_of(matches), ::testing::ElementsAre("alpha", "mid", "zeta"));
}

TEST_F(ChunkStoreTest, Search_IsDeterministicAcrossCalls) {
  store_->insert_chunks(TestUtilities::create_test_chunks(10, "src/many.ts"));
  auto query = TestUtilities::create_test_vector("query");

  auto first = ids_of(store_->search(query, 5));
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(ids_of(store_->search(query, 5)), first);
  }
}

TEST_F(ChunkStoreTest, Search_EmptyStoreReturnsNothing) {
  EXPECT_TRUE(store_->search(TestUtilities::axis_vector(0), 5).empty());
}

TEST_F(ChunkStoreTest, Search_FewerThanKWhenPopulationIsSmall) {
  store_->insert_chunks(TestUtilities::create_test_chunks(2, "src/two.ts"));

  EXPECT_EQ(store_->search(TestUtilities::axis_vector(0), 10).size(), 2u);
}

TEST_F(ChunkStoreTest, Search_WrongQueryDimensionThrows) {
  store_->insert_chunks(TestUtilities::create_test_chunks(1, "src/one.ts"));

  EXPECT_THROW(store_->search(std::vector<float>(TEST_DIMENSION - 1, 1.0f), 1),
               DimensionMismatchError);
}

TEST_F(ChunkStoreTest, Search_AppliesFilterBeforeTruncating) {
  // Arrange: the best match is a class, the function is further away
  store_->insert_chunks({
      TestUtilities::create_test_chunk("cls", "src/a.ts", "class", TestUtilities::axis_vector(0),
                                       ChunkKind::Class, 1),
      TestUtilities::create_test_chunk("fn", "src/b.ts", "function",
                                       TestUtilities::axis_vector(0, 0.5f), ChunkKind::Function,
                                       7),
  });
  ChunkFilter filter;
  filter.kinds = {ChunkKind::Function};

  // Act
  auto matches = store_->search(TestUtilities::axis_vector(0), 1, filter);

  // Assert
  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].chunk.id, "fn");
}

TEST_F(ChunkStoreTest, Search_FiltersByPathTypeComplexityAndExclusion) {
  store_->insert_chunks({
      TestUtilities::create_test_chunk("ts_simple", "src/a.ts", "a", {}, ChunkKind::Function, 1),
      TestUtilities::create_test_chunk("ts_complex", "src/b.ts", "b", {}, ChunkKind::Function, 9),
      TestUtilities::create_test_chunk("cpp", "src/c.cpp", "c", {}, ChunkKind::Function, 5),
  });
  auto query = TestUtilities::create_test_vector("q");

  ChunkFilter by_type;
  by_type.file_types = {"cpp"};
  EXPECT_THAT(ids_of(store_->search(query, 10, by_type)), ::testing::ElementsAre("cpp"));

  ChunkFilter by_complexity;
  by_complexity.min_complexity = 5;
  EXPECT_THAT(ids_of(store_->search(query, 10, by_complexity)),
              ::testing::UnorderedElementsAre("ts_complex", "cpp"));

  ChunkFilter by_path;
  by_path.file_path = "src/a.ts";
  EXPECT_THAT(ids_of(store_->search(query, 10, by_path)), ::testing::ElementsAre("ts_simple"));

  ChunkFilter excluding;
  excluding.file_types = {".ts"};
  excluding.exclude_files = {"src/b.ts"};
  EXPECT_THAT(ids_of(store_->search(query, 10, excluding)),
              ::testing::ElementsAre("ts_simple"));
}

TEST_F(ChunkStoreTest, UpdateFile_ReplacesChunksOfOneFile) {
  store_->insert_chunks(TestUtilities::create_test_chunks(3, "src/old.ts"));
  store_->insert_chunks(TestUtilities::create_test_chunks(1, "src/other.ts"));

  store_->update_file("src/old.ts",
                      {TestUtilities::create_test_chunk("src/old.ts#new", "src/old.ts", "fresh")});

  auto stats = store_->get_stats();
  EXPECT_EQ(stats.total_chunks, 2u);
  EXPECT_EQ(stats.total_files, 2u);
  EXPECT_FALSE(store_->get_chunk("src/old.ts#chunk0").has_value());
  EXPECT_TRUE(store_->get_chunk("src/old.ts#new").has_value());
  EXPECT_EQ(store_->search(TestUtilities::axis_vector(0), 10).size(), 2u);
}

TEST_F(ChunkStoreTest, DeleteFile_RemovesFromStorageAndIndex) {
  store_->insert_chunks(TestUtilities::create_test_chunks(2, "src/gone.ts"));
  store_->insert_chunks(TestUtilities::create_test_chunks(1, "src/stay.ts"));

  EXPECT_EQ(store_->delete_file("src/gone.ts"), 2u);

  auto matches = store_->search(TestUtilities::axis_vector(0), 10);
  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].chunk.file_path, "src/stay.ts");
  EXPECT_EQ(store_->delete_file("src/gone.ts"), 0u);
}

TEST_F(ChunkStoreTest, DeleteChunks_RemovesOnlyGivenIds) {
  store_->insert_chunks(TestUtilities::create_test_chunks(3, "src/f.ts"));

  EXPECT_EQ(store_->delete_chunks({"src/f.ts#chunk1", "missing"}), 1u);

  auto all = store_->get_all_chunks();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].id, "src/f.ts#chunk0");
  EXPECT_EQ(all[1].id, "src/f.ts#chunk2");
}

TEST_F(ChunkStoreTest, GetAllChunks_ReturnsInsertionOrder) {
  store_->insert_chunks({TestUtilities::create_test_chunk("b", "src/b.ts", "b")});
  store_->insert_chunks({TestUtilities::create_test_chunk("a", "src/a.ts", "a")});
  store_->insert_chunks({TestUtilities::create_test_chunk("c", "src/c.ts", "c")});

  auto all = store_->get_all_chunks();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].id, "b");
  EXPECT_EQ(all[1].id, "a");
  EXPECT_EQ(all[2].id, "c");
}

TEST_F(ChunkStoreTest, GetStats_ReportsCountsAndDiskUsage) {
  store_->insert_chunks(TestUtilities::create_test_chunks(3, "src/one.ts"));
  store_->insert_chunks(TestUtilities::create_test_chunks(2, "src/two.ts"));

  auto stats = store_->get_stats();

  EXPECT_EQ(stats.total_chunks, 5u);
  EXPECT_EQ(stats.total_files, 2u);
  EXPECT_EQ(stats.dimension, TEST_DIMENSION);
  EXPECT_GT(stats.disk_bytes, 0u);
}

TEST_F(ChunkStoreTest, Clear_RemovesEverything) {
  store_->insert_chunks(TestUtilities::create_test_chunks(4, "src/c.ts"));

  store_->clear();

  EXPECT_EQ(store_->get_stats().total_chunks, 0u);
  EXPECT_TRUE(store_->search(TestUtilities::axis_vector(0), 5).empty());
}

TEST_F(ChunkStoreTest, Close_LaterOperationsThrowStoreClosed) {
  store_->close();

  EXPECT_FALSE(store_->is_open());
  EXPECT_THROW(store_->insert_chunks(TestUtilities::create_test_chunks(1, "src/x.ts")),
               StoreClosedError);
  EXPECT_THROW(store_->search(TestUtilities::axis_vector(0), 1), StoreClosedError);
  EXPECT_THROW(store_->get_stats(), StoreClosedError);
  EXPECT_THROW(store_->initialize(), StoreClosedError);
}

TEST_F(ChunkStoreTest, Close_TwiceIsNoOp) {
  store_->close();
  EXPECT_NO_THROW(store_->close());
}

TEST_F(ChunkStoreTest, Reopen_RebuildsIndexFromDisk) {
  // Arrange
  store_->insert_chunks({
      TestUtilities::create_test_chunk("near", "src/n.ts", "n", TestUtilities::axis_vector(4)),
      TestUtilities::create_test_chunk("far", "src/f.ts", "f", TestUtilities::axis_vector(5)),
  });
  store_->close();

  // Act
  auto reopened = std::make_shared<ChunkStore>(make_options());
  reopened->initialize();
  auto matches = reopened->search(TestUtilities::axis_vector(4), 1);

  // Assert
  EXPECT_EQ(reopened->get_stats().total_chunks, 2u);
  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].chunk.id, "near");
  reopened->close();
}

TEST(SimilarityMetricTest, ParsesKnownNames) {
  EXPECT_EQ(similarity_metric_from_string("cosine"), SimilarityMetric::Cosine);
  EXPECT_EQ(similarity_metric_from_string("inner_product"), SimilarityMetric::InnerProduct);
  EXPECT_EQ(similarity_metric_from_string("dot"), SimilarityMetric::InnerProduct);
  EXPECT_THROW(similarity_metric_from_string("euclidean"), std::invalid_argument);
  EXPECT_EQ(to_string(SimilarityMetric::InnerProduct), "inner_product");
}

}  // namespace codelens_core
