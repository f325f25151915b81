#include "chunkd/storage/chunk_io.hpp"
#include "chunkd/storage/worker_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using chunkd::ErrorKind;
using chunkd::storage::ChunkIoExecutor;
using chunkd::storage::WorkerPool;
using chunkd::transfer::ChunkRange;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("chunkd_chunk_io_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

} // namespace

TEST(ChunkIoExecutorTest, AppendCreatesAndExtends) {
    const auto dir = create_temp_dir();
    const auto path = dir / "data.bin";
    ChunkIoExecutor io;

    auto first = io.append(path, bytes("abcd"));
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value(), 4u);

    auto second = io.append(path, bytes("ef"));
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value(), 6u);

    EXPECT_EQ(read_file(path), "abcdef");
    fs::remove_all(dir);
}

TEST(ChunkIoExecutorTest, ReadRangeReturnsShortTail) {
    const auto dir = create_temp_dir();
    const auto path = dir / "data.bin";
    ChunkIoExecutor io;
    ASSERT_TRUE(io.append(path, bytes("0123456789")).is_ok());

    auto middle = io.read_range(path, ChunkRange{2, 3});
    ASSERT_TRUE(middle.is_ok());
    EXPECT_EQ(middle.value(), bytes("234"));

    auto tail = io.read_range(path, ChunkRange{8, 4});
    ASSERT_TRUE(tail.is_ok());
    EXPECT_EQ(tail.value(), bytes("89"));

    fs::remove_all(dir);
}

TEST(ChunkIoExecutorTest, StoredSize) {
    const auto dir = create_temp_dir();
    const auto path = dir / "data.bin";

    auto missing = ChunkIoExecutor::stored_size(path);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);

    // A directory is not a stored file
    auto directory = ChunkIoExecutor::stored_size(dir);
    ASSERT_TRUE(directory.is_error());
    EXPECT_EQ(directory.error().kind, ErrorKind::NotFound);

    ChunkIoExecutor io;
    ASSERT_TRUE(io.append(path, bytes("xyz")).is_ok());
    auto size = ChunkIoExecutor::stored_size(path);
    ASSERT_TRUE(size.is_ok());
    EXPECT_EQ(size.value(), 3u);

    fs::remove_all(dir);
}

TEST(ChunkIoExecutorTest, ReadFromMissingFileIsIoError) {
    const auto dir = create_temp_dir();
    ChunkIoExecutor io;

    auto result = io.read_range(dir / "nope.bin", ChunkRange{0, 4});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::IoError);
    // Client-facing detail never carries the path
    EXPECT_EQ(result.error().detail.find(dir.string()), std::string::npos);

    fs::remove_all(dir);
}

TEST(ChunkIoExecutorTest, OffloadsToWorkerPool) {
    const auto dir = create_temp_dir();
    const auto path = dir / "pooled.bin";
    WorkerPool pool(2);
    ChunkIoExecutor io(&pool);
    EXPECT_TRUE(io.offloads());

    ASSERT_TRUE(io.append(path, bytes("pooled")).is_ok());
    auto read = io.read_range(path, ChunkRange{0, 6});
    ASSERT_TRUE(read.is_ok());
    EXPECT_EQ(read.value(), bytes("pooled"));

    pool.shutdown();
    auto refused = io.append(path, bytes("late"));
    ASSERT_TRUE(refused.is_error());
    EXPECT_EQ(refused.error().kind, ErrorKind::IoError);
    EXPECT_EQ(read_file(path), "pooled");

    fs::remove_all(dir);
}

TEST(WorkerPoolTest, RunsSubmittedTasks) {
    WorkerPool pool(3);
    EXPECT_EQ(pool.size(), 3u);
    EXPECT_TRUE(pool.is_running());

    std::atomic<int> ran{0};
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        auto submitted = pool.submit([i, &ran]() {
            ran++;
            return i * 2;
        });
        ASSERT_TRUE(submitted.is_ok());
        futures.push_back(std::move(submitted.value()));
    }

    int sum = 0;
    for (auto& future : futures) {
        sum += future.get();
    }
    EXPECT_EQ(sum, 380);
    EXPECT_EQ(ran.load(), 20);
}

TEST(WorkerPoolTest, ShutdownDrainsQueuedWork) {
    std::atomic<int> ran{0};
    {
        WorkerPool pool(1);
        for (int i = 0; i < 10; ++i) {
            auto submitted = pool.submit([&ran]() { ran++; });
            ASSERT_TRUE(submitted.is_ok());
        }
        pool.shutdown();
        EXPECT_FALSE(pool.is_running());
        EXPECT_TRUE(pool.submit([]() {}).is_error());
    }
    EXPECT_EQ(ran.load(), 10);
}

TEST(WorkerPoolTest, ZeroThreadsStillRuns) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    auto submitted = pool.submit([]() { return 5; });
    ASSERT_TRUE(submitted.is_ok());
    EXPECT_EQ(submitted.value().get(), 5);
}
