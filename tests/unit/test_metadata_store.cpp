#include <gtest/gtest.h>
#include "fastpack/storage/memory_metadata_store.hpp"
#include "fastpack/storage/sqlite_metadata_store.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <thread>
#include <vector>

using namespace fastpack::storage;
using fastpack::core::ErrorCode;

enum class Backend { Memory, Sqlite };

class MetadataStoreTest : public ::testing::TestWithParam<Backend> {
protected:
    void SetUp() override {
        if (GetParam() == Backend::Memory) {
            store_ = std::make_shared<MemoryMetadataStore>();
            return;
        }
        
        // Parameterized test names contain '/'.
        std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::replace(name.begin(), name.end(), '/', '_');
        test_dir_ = std::filesystem::temp_directory_path() / ("fastpack_metadata_" + name);
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        
        auto sqlite = std::make_shared<SqliteMetadataStore>(test_dir_ / "metadata.db");
        ASSERT_TRUE(sqlite->initialize());
        store_ = sqlite;
    }
    
    void TearDown() override {
        store_.reset();
        if (!test_dir_.empty()) {
            std::filesystem::remove_all(test_dir_);
        }
    }
    
    std::shared_ptr<MetadataStore> store_;
    std::filesystem::path test_dir_;
};

TEST_P(MetadataStoreTest, GetMissingKeyIsNotFound) {
    std::string value = "untouched";
    auto result = store_->get("upload:missing", value);
    EXPECT_EQ(result.error, ErrorCode::NOT_FOUND);
}

TEST_P(MetadataStoreTest, PutOverwrites) {
    ASSERT_TRUE(store_->put("upload:a", "first"));
    ASSERT_TRUE(store_->put("upload:a", "second"));
    
    std::string value;
    ASSERT_TRUE(store_->get("upload:a", value));
    EXPECT_EQ(value, "second");
}

TEST_P(MetadataStoreTest, ValuesAreBinarySafe) {
    std::string blob("a\0b\xff\x01", 5);
    ASSERT_TRUE(store_->put("blob", blob));
    
    std::string value;
    ASSERT_TRUE(store_->get("blob", value));
    ASSERT_EQ(value.size(), 5u);
    EXPECT_EQ(value, blob);
}

TEST_P(MetadataStoreTest, EmptyValueRoundTrips) {
    ASSERT_TRUE(store_->put("empty", ""));
    std::string value = "x";
    ASSERT_TRUE(store_->get("empty", value));
    EXPECT_TRUE(value.empty());
}

TEST_P(MetadataStoreTest, RemoveIsIdempotent) {
    ASSERT_TRUE(store_->put("k", "v"));
    EXPECT_TRUE(store_->remove("k"));
    EXPECT_TRUE(store_->remove("k"));
    
    std::string value;
    EXPECT_EQ(store_->get("k", value).error, ErrorCode::NOT_FOUND);
}

TEST_P(MetadataStoreTest, InsertIfAbsentKeepsFirstValue) {
    bool inserted = false;
    ASSERT_TRUE(store_->insert_if_absent("id", "one", inserted));
    EXPECT_TRUE(inserted);
    
    ASSERT_TRUE(store_->insert_if_absent("id", "two", inserted));
    EXPECT_FALSE(inserted);
    
    std::string value;
    ASSERT_TRUE(store_->get("id", value));
    EXPECT_EQ(value, "one");
}

TEST_P(MetadataStoreTest, AbsentCounterReadsZero) {
    int64_t value = 42;
    ASSERT_TRUE(store_->read_counter("chunks:none", value));
    EXPECT_EQ(value, 0);
}

TEST_P(MetadataStoreTest, IncrementReturnsNewValue) {
    int64_t value = 0;
    ASSERT_TRUE(store_->increment("chunks:u", 1, value));
    EXPECT_EQ(value, 1);
    ASSERT_TRUE(store_->increment("chunks:u", 5, value));
    EXPECT_EQ(value, 6);
    ASSERT_TRUE(store_->increment("chunks:u", -2, value));
    EXPECT_EQ(value, 4);
    
    ASSERT_TRUE(store_->read_counter("chunks:u", value));
    EXPECT_EQ(value, 4);
}

TEST_P(MetadataStoreTest, CountersAndValuesAreSeparate) {
    ASSERT_TRUE(store_->put("shared", "text"));
    int64_t value = 0;
    ASSERT_TRUE(store_->increment("shared", 3, value));
    
    std::string text;
    ASSERT_TRUE(store_->get("shared", text));
    EXPECT_EQ(text, "text");
    
    ASSERT_TRUE(store_->remove_counter("shared"));
    ASSERT_TRUE(store_->read_counter("shared", value));
    EXPECT_EQ(value, 0);
    ASSERT_TRUE(store_->get("shared", text));
}

TEST_P(MetadataStoreTest, ConcurrentIncrementsAreNotLost) {
    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 50;
    
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < PER_THREAD; ++i) {
                int64_t ignored = 0;
                EXPECT_TRUE(store_->increment("chunks:busy", 1, ignored));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    
    int64_t value = 0;
    ASSERT_TRUE(store_->read_counter("chunks:busy", value));
    EXPECT_EQ(value, THREADS * PER_THREAD);
}

TEST_P(MetadataStoreTest, ConcurrentInsertIfAbsentHasOneWinner) {
    constexpr int THREADS = 8;
    std::atomic<int> winners{0};
    
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([this, t, &winners] {
            bool inserted = false;
            EXPECT_TRUE(store_->insert_if_absent("upload:race", std::to_string(t), inserted));
            if (inserted) {
                winners++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    
    EXPECT_EQ(winners.load(), 1);
}

INSTANTIATE_TEST_SUITE_P(Backends, MetadataStoreTest,
                         ::testing::Values(Backend::Memory, Backend::Sqlite),
                         [](const ::testing::TestParamInfo<Backend>& info) {
                             return info.param == Backend::Memory ? "Memory" : "Sqlite";
                         });

TEST(MemoryMetadataStoreTest, TracksOperationsAndWrites) {
    MemoryMetadataStore store(4);
    ASSERT_TRUE(store.put("a", "1"));
    ASSERT_TRUE(store.put("b", "2"));
    
    std::string value;
    ASSERT_TRUE(store.get("a", value));
    
    EXPECT_EQ(store.size(), 2u);
    EXPECT_TRUE(store.contains("a"));
    EXPECT_FALSE(store.contains("c"));
    EXPECT_EQ(store.write_count(), 2u);
    EXPECT_EQ(store.operation_count(), 3u);
}

TEST(SqliteMetadataStoreTest, UninitializedStoreReportsMetadataError) {
    SqliteMetadataStore store(std::filesystem::temp_directory_path() / "fastpack_never_opened.db");
    std::string value;
    EXPECT_EQ(store.get("k", value).error, ErrorCode::METADATA_ERROR);
}

TEST(SqliteMetadataStoreTest, ValuesPersistAcrossReopen) {
    auto dir = std::filesystem::temp_directory_path() / "fastpack_metadata_reopen";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    
    {
        SqliteMetadataStore store(dir / "metadata.db");
        ASSERT_TRUE(store.initialize());
        ASSERT_TRUE(store.put("upload:p", "record"));
        int64_t value = 0;
        ASSERT_TRUE(store.increment("chunks:p", 7, value));
    }
    
    {
        SqliteMetadataStore store(dir / "metadata.db");
        ASSERT_TRUE(store.initialize());
        std::string record;
        ASSERT_TRUE(store.get("upload:p", record));
        EXPECT_EQ(record, "record");
        int64_t value = 0;
        ASSERT_TRUE(store.read_counter("chunks:p", value));
        EXPECT_EQ(value, 7);
    }
    
    std::filesystem::remove_all(dir);
}
