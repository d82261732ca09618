#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <cmath>
#include <future>
#include <thread>

#include "codelens_core/search/hybrid_search_engine.hpp"
#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"

namespace codelens_core {

using codelens_tests::MockEmbeddingProvider;
using codelens_tests::TEST_DIMENSION;
using codelens_tests::TestUtilities;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

// Blocks inside embed() until released, then reports no embedding
class BlockingEmbeddingProvider : public EmbeddingProvider {
 public:
  explicit BlockingEmbeddingProvider(std::shared_future<void> release)
      : release_(std::move(release)) {}

  std::vector<float> embed(const std::string& /*text*/) override {
    release_.wait();
    finished_ = true;
    throw EmbeddingError("released without an embedding");
  }

  size_t dimension() const override { return TEST_DIMENSION; }

  bool finished() const { return finished_; }

 private:
  std::shared_future<void> release_;
  std::atomic<bool> finished_{false};
};

std::vector<std::string> ids_of(const std::vector<SearchResult>& results) {
  std::vector<std::string> ids;
  for (const auto& r : results) {
    ids.push_back(r.chunk.id);
  }
  return ids;
}

}  // namespace

class HybridSearchEngineTest : public codelens_tests::ChunkStoreTestBase {
 protected:
  void SetUp() override {
    ChunkStoreTestBase::SetUp();
    store_->insert_chunks({
        TestUtilities::create_test_chunk("auth#login", "src/auth.ts",
                                         "function login(user) { return validateUser(user); }",
                                         TestUtilities::axis_vector(0), ChunkKind::Function, 2,
                                         "login"),
        TestUtilities::create_test_chunk("auth#logout", "src/auth.ts",
                                         "function logout(session) { session.destroy(); }",
                                         TestUtilities::axis_vector(1), ChunkKind::Function, 1,
                                         "logout"),
        TestUtilities::create_test_chunk("db#query", "src/db.ts",
                                         "function query(sql) { return pool.query(sql); }",
                                         TestUtilities::axis_vector(2), ChunkKind::Function, 1,
                                         "query"),
        TestUtilities::create_test_chunk("api#Router", "src/api.ts",
                                         "class Router { route(path) { return login(path); } }",
                                         TestUtilities::axis_vector(3), ChunkKind::Class, 4,
                                         "Router"),
    });

    embedder_ = std::make_shared<NiceMock<MockEmbeddingProvider>>();
    engine_ = std::make_unique<HybridSearchEngine>(store_, embedder_);
    engine_->build_keyword_index_from_store();
    // api imports auth, auth imports db
    engine_->set_dependency_graph(
        {{"src/api.ts", {"src/auth.ts"}}, {"src/auth.ts", {"src/db.ts"}}, {"src/db.ts", {}}});
  }

  void TearDown() override {
    engine_.reset();
    ChunkStoreTestBase::TearDown();
  }

  std::shared_ptr<NiceMock<MockEmbeddingProvider>> embedder_;
  std::unique_ptr<HybridSearchEngine> engine_;
};

TEST_F(HybridSearchEngineTest, NormalizeWeights_ScalesToUnitSum) {
  SearchWeights normalized = HybridSearchEngine::normalize_weights({2.0, 1.0, 1.0});

  EXPECT_DOUBLE_EQ(normalized.vector, 0.5);
  EXPECT_DOUBLE_EQ(normalized.keyword, 0.25);
  EXPECT_DOUBLE_EQ(normalized.dependency, 0.25);
}

TEST_F(HybridSearchEngineTest, Search_NegativeWeightThrowsBeforeAnyLookup) {
  EXPECT_CALL(*embedder_, embed(_)).Times(0);

  SearchQuery query;
  query.text = "login";
  query.weights = SearchWeights{0.5, -0.1, 0.6};

  EXPECT_THROW(engine_->search(query), InvalidWeightsError);
}

TEST_F(HybridSearchEngineTest, Search_AllZeroWeightsReturnsEmpty) {
  SearchQuery query;
  query.text = "login";
  query.weights = SearchWeights{0.0, 0.0, 0.0};

  EXPECT_TRUE(engine_->search(query).empty());
}

TEST_F(HybridSearchEngineTest, Search_VectorOnlyWeightsNeverScoreOtherSignals) {
  // Arrange: every signal has input available
  SearchQuery query;
  query.text = "login session query";
  query.embedding = TestUtilities::axis_vector(0);
  query.file_path = "src/api.ts";
  query.weights = SearchWeights{1.0, 0.0, 0.0};
  query.top_k = 10;

  // Act
  auto results = engine_->search(query);

  // Assert
  ASSERT_FALSE(results.empty());
  EXPECT_EQ(results[0].chunk.id, "auth#login");
  EXPECT_DOUBLE_EQ(results[0].score, 1.0);
  for (const auto& r : results) {
    EXPECT_TRUE(!r.breakdown.keyword || *r.breakdown.keyword == 0.0);
    EXPECT_TRUE(!r.breakdown.dependency || *r.breakdown.dependency == 0.0);
    EXPECT_THAT(r.matched_by, ElementsAre(SearchStrategy::Vector));
  }
}

TEST_F(HybridSearchEngineTest, Search_VectorScoreMapsCosineToUnitInterval) {
  SearchQuery query;
  query.embedding = TestUtilities::axis_vector(0);
  query.weights = SearchWeights{1.0, 0.0, 0.0};
  query.top_k = 4;

  auto results = engine_->search(query);

  // Orthogonal chunks sit at cosine 0, which maps to 0.5
  ASSERT_EQ(results.size(), 4u);
  EXPECT_DOUBLE_EQ(*results[0].breakdown.vector, 1.0);
  EXPECT_NEAR(*results[1].breakdown.vector, 0.5, 1e-6);
  EXPECT_THAT(ids_of(results), ElementsAre("auth#login", "api#Router", "auth#logout", "db#query"));
}

TEST_F(HybridSearchEngineTest, Search_KeywordScoreUsesOverlapAndFrequencyBoost) {
  SearchQuery query;
  query.text = "login session";
  query.weights = SearchWeights{0.0, 1.0, 0.0};

  auto results = engine_->search(query);

  // login: one of two terms, tf 2 in content+name. logout: session twice.
  const double expected = 0.5 * (1.0 + 0.05 * std::log1p(2.0));
  ASSERT_GE(results.size(), 2u);
  EXPECT_EQ(results[0].chunk.id, "auth#login");
  EXPECT_EQ(results[1].chunk.id, "auth#logout");
  EXPECT_NEAR(*results[0].breakdown.keyword, expected, 1e-9);
  EXPECT_NEAR(*results[1].breakdown.keyword, expected, 1e-9);
}

TEST_F(HybridSearchEngineTest, Search_KeywordSignalHonoursFilter) {
  SearchQuery query;
  query.text = "login";
  query.weights = SearchWeights{0.0, 1.0, 0.0};
  query.filter.kinds = {ChunkKind::Class};

  auto results = engine_->search(query);

  EXPECT_THAT(ids_of(results), ElementsAre("api#Router"));
}

TEST_F(HybridSearchEngineTest, Search_DependencyScoreDecaysPerHop) {
  SearchQuery query;
  query.file_path = "src/api.ts";
  query.weights = SearchWeights{0.0, 0.0, 1.0};
  query.top_k = 10;

  auto results = engine_->search(query);

  ASSERT_EQ(results.size(), 3u);
  EXPECT_THAT(ids_of(results), ElementsAre("auth#login", "auth#logout", "db#query"));
  EXPECT_DOUBLE_EQ(*results[0].breakdown.dependency, 1.0);
  EXPECT_DOUBLE_EQ(*results[2].breakdown.dependency, 0.5);
}

TEST_F(HybridSearchEngineTest, Search_CombinesSignalsWithNormalizedWeights) {
  SearchQuery query;
  query.text = "login";
  query.embedding = TestUtilities::axis_vector(0);
  query.file_path = "src/api.ts";
  query.weights = SearchWeights{2.0, 1.0, 1.0};

  auto results = engine_->search(query);

  ASSERT_FALSE(results.empty());
  const SearchResult& top = results[0];
  EXPECT_EQ(top.chunk.id, "auth#login");
  EXPECT_THAT(top.matched_by, ElementsAre(SearchStrategy::Vector, SearchStrategy::Keyword,
                                          SearchStrategy::Dependency));
  EXPECT_DOUBLE_EQ(top.weights.vector, 0.5);
  const double expected = 0.5 * *top.breakdown.vector + 0.25 * *top.breakdown.keyword +
                          0.25 * *top.breakdown.dependency;
  EXPECT_NEAR(top.score, expected, 1e-9);
}

TEST_F(HybridSearchEngineTest, Search_IsDeterministicAcrossCalls) {
  SearchQuery query;
  query.text = "function return login session";
  query.embedding = TestUtilities::create_test_vector("query");
  query.file_path = "src/auth.ts";
  query.top_k = 4;

  auto first = ids_of(engine_->search(query));
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(ids_of(engine_->search(query)), first);
  }
}

TEST_F(HybridSearchEngineTest, Search_EmbedsQueryTextThroughProvider) {
  EXPECT_CALL(*embedder_, embed("find logout"))
      .WillOnce(Return(TestUtilities::axis_vector(1)));

  SearchQuery query;
  query.text = "find logout";
  query.weights = SearchWeights{1.0, 0.0, 0.0};
  query.top_k = 1;

  auto results = engine_->search(query);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].chunk.id, "auth#logout");
}

TEST_F(HybridSearchEngineTest, Search_ProviderFailureSkipsVectorSignal) {
  EXPECT_CALL(*embedder_, embed(_)).WillOnce(Throw(EmbeddingError("model offline")));

  SearchQuery query;
  query.text = "logout";

  auto results = engine_->search(query);

  ASSERT_FALSE(results.empty());
  EXPECT_EQ(results[0].chunk.id, "auth#logout");
  EXPECT_THAT(results[0].matched_by, ElementsAre(SearchStrategy::Keyword));
}

TEST_F(HybridSearchEngineTest, Search_TimeoutReturnsPartialResults) {
  // Arrange
  std::promise<void> release;
  auto blocking = std::make_shared<BlockingEmbeddingProvider>(release.get_future().share());
  HybridSearchEngine engine(store_, blocking);
  engine.build_keyword_index_from_store();

  SearchQuery query;
  query.text = "logout";
  query.timeout = std::chrono::milliseconds(100);

  // Act
  auto results = engine.search(query);

  // Assert
  ASSERT_FALSE(results.empty());
  EXPECT_EQ(results[0].chunk.id, "auth#logout");
  EXPECT_THAT(results[0].matched_by, ElementsAre(SearchStrategy::Keyword));
  EXPECT_GE(engine.pending_signals(), 1u);
  release.set_value();
}

TEST_F(HybridSearchEngineTest, Search_AbandonedSignalIsJoinedWhenEngineIsDestroyed) {
  // Arrange
  std::promise<void> release;
  auto blocking = std::make_shared<BlockingEmbeddingProvider>(release.get_future().share());
  std::weak_ptr<BlockingEmbeddingProvider> watcher = blocking;

  {
    HybridSearchEngine engine(store_, std::move(blocking));
    SearchQuery query;
    query.text = "logout";
    query.timeout = std::chrono::milliseconds(20);
    (void)engine.search(query);
    EXPECT_FALSE(watcher.lock()->finished());

    // Act: the destructor waits for the running signal
    release.set_value();
  }

  // Assert: the signal finished and released everything it captured
  EXPECT_TRUE(watcher.expired());
}

TEST_F(HybridSearchEngineTest, Search_ClosedStoreThrowsStoreClosed) {
  store_->close();

  SearchQuery query;
  query.text = "logout";
  query.embedding = TestUtilities::axis_vector(1);

  EXPECT_THROW(engine_->search(query), StoreClosedError);

  query.timeout = std::chrono::milliseconds(500);
  EXPECT_THROW(engine_->search(query), StoreClosedError);
}

TEST_F(HybridSearchEngineTest, Search_WrongLengthQueryEmbeddingThrows) {
  EXPECT_CALL(*embedder_, embed(_)).Times(0);

  SearchQuery query;
  query.text = "logout";
  query.embedding = std::vector<float>(TEST_DIMENSION + 1, 0.1f);

  try {
    engine_->search(query);
    FAIL() << "Expected DimensionMismatchError";
  } catch (const DimensionMismatchError& e) {
    EXPECT_EQ(e.expected_dimension(), TEST_DIMENSION);
  }
}

TEST_F(HybridSearchEngineTest, Search_ProviderEmbeddingOfWrongLengthSkipsVectorSignal) {
  EXPECT_CALL(*embedder_, embed(_)).WillOnce(Return(std::vector<float>(TEST_DIMENSION - 1, 0.1f)));

  SearchQuery query;
  query.text = "logout";

  auto results = engine_->search(query);

  ASSERT_FALSE(results.empty());
  EXPECT_THAT(results[0].matched_by, ElementsAre(SearchStrategy::Keyword));
}

TEST_F(HybridSearchEngineTest, Search_TopKBoundsResults) {
  SearchQuery query;
  query.text = "function";
  query.top_k = 2;
  EXPECT_EQ(engine_->search(query).size(), 2u);

  query.top_k = 0;
  EXPECT_TRUE(engine_->search(query).empty());
}

TEST_F(HybridSearchEngineTest, UpdateFileIndex_ReplacesStoreAndKeywordEntries) {
  engine_->update_file_index(
      "src/db.ts", {TestUtilities::create_test_chunk("db#migrate", "src/db.ts",
                                                     "function migrate(schema) {}",
                                                     TestUtilities::axis_vector(5))});

  EXPECT_FALSE(store_->get_chunk("db#query").has_value());
  EXPECT_TRUE(store_->get_chunk("db#migrate").has_value());

  SearchQuery query;
  query.text = "migrate";
  query.weights = SearchWeights{0.0, 1.0, 0.0};
  EXPECT_THAT(ids_of(engine_->search(query)), ElementsAre("db#migrate"));
  query.text = "sql";
  EXPECT_TRUE(engine_->search(query).empty());
}

TEST_F(HybridSearchEngineTest, UpdateFileIndex_RejectedChunksStayOutOfBothIndexes) {
  std::vector<CodeChunk> chunks = {
      TestUtilities::create_test_chunk("db#good", "src/db.ts", "function goodone() {}",
                                       TestUtilities::axis_vector(6)),
      TestUtilities::create_test_chunk("db#bad", "src/db.ts", "function badone() {}",
                                       std::vector<float>(TEST_DIMENSION * 2, 1.0f)),
  };

  EXPECT_THROW(engine_->update_file_index("src/db.ts", chunks), DimensionMismatchError);

  EXPECT_EQ(engine_->keyword_index_size(), 4u);
  SearchQuery query;
  query.text = "goodone badone";
  query.weights = SearchWeights{0.0, 1.0, 0.0};
  EXPECT_THAT(ids_of(engine_->search(query)), ElementsAre("db#good"));
}

TEST_F(HybridSearchEngineTest, Stats_TrackSearchesAndStrategyHits) {
  SearchQuery keyword_query;
  keyword_query.text = "login";
  keyword_query.weights = SearchWeights{0.0, 1.0, 0.0};
  engine_->search(keyword_query);

  SearchQuery dependency_query;
  dependency_query.file_path = "src/api.ts";
  dependency_query.weights = SearchWeights{0.0, 0.0, 1.0};
  engine_->search(dependency_query);

  SearchStats stats = engine_->get_stats();
  EXPECT_EQ(stats.total_searches, 2u);
  EXPECT_EQ(stats.keyword_hits, 1u);
  EXPECT_EQ(stats.dependency_hits, 1u);
  EXPECT_EQ(stats.vector_hits, 0u);
  EXPECT_GE(stats.average_latency_ms, 0.0);

  engine_->reset_stats();
  EXPECT_EQ(engine_->get_stats().total_searches, 0u);
}

TEST_F(HybridSearchEngineTest, ExplainSearch_DescribesEachResult) {
  EXPECT_EQ(engine_->explain_search({}), "No results");

  SearchQuery query;
  query.text = "logout";
  query.weights = SearchWeights{0.0, 1.0, 0.0};
  auto results = engine_->search(query);
  std::string explanation = engine_->explain_search(results);

  EXPECT_THAT(explanation, HasSubstr("Search explanation (1 results)"));
  EXPECT_THAT(explanation, HasSubstr("#1 auth#logout (src/auth.ts:logout)"));
  EXPECT_THAT(explanation, HasSubstr("keyword"));
  EXPECT_THAT(explanation, HasSubstr("matched by: keyword"));
}

TEST(HybridSearchEngineOptionsTest, Constructor_RejectsInvalidOptions) {
  HybridSearchOptions bad_weights;
  bad_weights.default_weights = SearchWeights{-1.0, 1.0, 1.0};
  EXPECT_THROW(HybridSearchEngine(nullptr, nullptr, bad_weights), InvalidWeightsError);

  HybridSearchOptions bad_top_k;
  bad_top_k.default_top_k = 0;
  EXPECT_THROW(HybridSearchEngine(nullptr, nullptr, bad_top_k), std::invalid_argument);

  HybridSearchOptions no_workers;
  no_workers.signal_workers = 0;
  EXPECT_THROW(HybridSearchEngine(nullptr, nullptr, no_workers), std::invalid_argument);
}

TEST(HybridSearchEngineOptionsTest, DefaultWeightsAreStoredNormalized) {
  HybridSearchOptions options;
  options.default_weights = SearchWeights{0.0, 3.0, 1.0};
  HybridSearchEngine engine(nullptr, nullptr, options);
  engine.build_keyword_index({TestUtilities::create_test_chunk("only", "src/only.ts",
                                                               "function standalone() {}")});

  SearchQuery query;
  query.text = "standalone";
  auto results = engine.search(query);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_DOUBLE_EQ(results[0].weights.keyword, 0.75);
  EXPECT_DOUBLE_EQ(results[0].weights.dependency, 0.25);
  EXPECT_DOUBLE_EQ(results[0].score, 0.75 * *results[0].breakdown.keyword);
}

TEST(HybridSearchEngineOptionsTest, WorksWithoutStoreForKeywordSearch) {
  HybridSearchEngine engine(nullptr);
  engine.build_keyword_index({TestUtilities::create_test_chunk("only", "src/only.ts",
                                                               "function standalone() {}")});

  SearchQuery query;
  query.text = "standalone";
  auto results = engine.search(query);

  EXPECT_THAT(ids_of(results), ElementsAre("only"));
  EXPECT_THROW(engine.build_keyword_index_from_store(), std::logic_error);
}

}  // namespace codelens_core
