#include "chunkd/events/components.hpp"
#include "chunkd/events/event_bus.hpp"
#include "chunkd/events/events.hpp"
#include "chunkd/storage/worker_pool.hpp"
#include "chunkd/transfer/part_planner.hpp"
#include "chunkd/transfer/service.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using chunkd::Error;
using chunkd::ErrorKind;
using chunkd::Result;
using chunkd::events::EventBus;
using chunkd::events::MetricsComponent;
using chunkd::storage::WorkerPool;
using chunkd::transfer::PartPlanner;
using chunkd::transfer::PartRequest;
using chunkd::transfer::TransferConfig;
using chunkd::transfer::TransferService;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("chunkd_service_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

TransferConfig small_config(const fs::path& dir) {
    TransferConfig config;
    config.upload_directory = dir;
    config.chunk_size = 4;
    config.max_parts = 3;
    config.max_file_size = 10;
    config.worker_pool_size = 2;
    return config;
}

PartRequest make_part(const std::string& name, const std::string& data, uint32_t number, uint32_t total) {
    PartRequest part;
    part.file_name = name;
    part.data.assign(data.begin(), data.end());
    part.part_number = number;
    part.total_parts = total;
    return part;
}

std::vector<std::string> download_all(TransferService& service, const std::string& name) {
    std::vector<std::string> chunks;
    auto stream = service.download_file(name);
    EXPECT_TRUE(stream.is_ok());
    if (stream.is_error()) {
        return chunks;
    }
    while (true) {
        auto next = stream.value().next();
        if (next.is_error() || !next.value()) {
            break;
        }
        chunks.emplace_back(next.value()->begin(), next.value()->end());
    }
    return chunks;
}

} // namespace

TEST(TransferServiceTest, UploadThenDownload) {
    const auto dir = create_temp_dir();
    EventBus bus;
    WorkerPool pool(2);
    TransferService service(small_config(dir), bus, &pool);

    auto first = service.upload_part(make_part("a.bin", "abcd", 1, 2));
    ASSERT_TRUE(first.is_ok()) << first.error().detail;
    EXPECT_EQ(first.value().message, "Part 1/2 uploaded");

    auto second = service.upload_part(make_part("a.bin", "ef", 2, 2));
    ASSERT_TRUE(second.is_ok()) << second.error().detail;
    EXPECT_EQ(second.value().message, "Upload complete");

    EXPECT_EQ(download_all(service, "a.bin"), (std::vector<std::string>{"abcd", "ef"}));

    auto resume = service.resume_point("a.bin");
    ASSERT_TRUE(resume.is_ok());
    EXPECT_EQ(resume.value().chunk_index, 1u);

    fs::remove_all(dir);
}

TEST(TransferServiceTest, ConcurrentUploadsOfDistinctFiles) {
    const auto dir = create_temp_dir();
    auto config = small_config(dir);
    config.max_parts = 10;
    config.max_file_size = 64;

    EventBus bus;
    MetricsComponent metrics(bus);
    WorkerPool pool(4);
    TransferService service(config, bus, &pool);

    constexpr int kUploads = 16;
    constexpr uint32_t kParts = 10;

    // 9 full parts plus a 1-byte tail: 37 bytes, distinct per file
    auto content_of = [](int index) {
        std::string content;
        for (int i = 0; i < 37; ++i) {
            content.push_back(static_cast<char>('a' + (index + i) % 26));
        }
        return content;
    };

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kUploads; ++t) {
        threads.emplace_back([&, t] {
            const std::string name = "file_" + std::to_string(t) + ".bin";
            const std::string content = content_of(t);
            for (uint32_t part = 1; part <= kParts; ++part) {
                const auto offset = static_cast<size_t>(part - 1) * 4;
                auto receipt = service.upload_part(make_part(name, content.substr(offset, 4), part, kParts));
                if (receipt.is_error() || receipt.value().complete != (part == kParts)) {
                    ++failures;
                    return;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    for (int t = 0; t < kUploads; ++t) {
        const auto path = dir / ("file_" + std::to_string(t) + ".bin");
        EXPECT_EQ(fs::file_size(path), 37u);
        EXPECT_EQ(read_file(path), content_of(t));
    }
    EXPECT_EQ(metrics.get_stats().uploads_completed.load(), static_cast<uint64_t>(kUploads));
    EXPECT_EQ(metrics.get_stats().parts_stored.load(), static_cast<uint64_t>(kUploads) * kParts);

    fs::remove_all(dir);
}

TEST(TransferServiceTest, CreatesUploadDirectory) {
    const auto dir = create_temp_dir() / "nested" / "uploads";
    EventBus bus;
    TransferService service(small_config(dir), bus);

    EXPECT_TRUE(fs::is_directory(dir));
    auto files = service.list_files();
    ASSERT_TRUE(files.is_ok());
    EXPECT_TRUE(files.value().empty());

    fs::remove_all(dir.parent_path().parent_path());
}

TEST(TransferServiceTest, ListAndSearch) {
    const auto dir = create_temp_dir();
    EventBus bus;
    TransferService service(small_config(dir), bus);

    ASSERT_TRUE(service.upload_part(make_part("Holiday.JPG", "abc", 1, 1)).is_ok());
    ASSERT_TRUE(service.upload_part(make_part("notes.txt", "n", 1, 1)).is_ok());

    auto files = service.list_files();
    ASSERT_TRUE(files.is_ok());
    EXPECT_EQ(files.value(), (std::vector<std::string>{"Holiday.JPG", "notes.txt"}));

    auto found = service.search_files("holiday");
    ASSERT_TRUE(found.is_ok());
    EXPECT_EQ(found.value(), (std::vector<std::string>{"Holiday.JPG"}));

    auto none = service.search_files("zip");
    ASSERT_TRUE(none.is_error());
    EXPECT_EQ(none.error().kind, ErrorKind::NotFound);

    fs::remove_all(dir);
}

TEST(TransferServiceTest, PlannerUploadsThroughService) {
    const auto dir = create_temp_dir();
    const auto source_dir = create_temp_dir();
    {
        std::ofstream out(source_dir / "local.bin", std::ios::binary);
        out << "0123456789";
    }

    EventBus bus;
    TransferService service(small_config(dir), bus);
    PartPlanner planner(service.config().chunk_size);

    auto sink = [&service](PartRequest&& part) -> Result<void, Error> {
        auto stored = service.upload_part(part);
        if (stored.is_error()) {
            return chunkd::Err<void>(stored.error());
        }
        return chunkd::Ok();
    };

    // Interrupted after the first part, then resumed from the reported index
    int calls = 0;
    auto interrupted = planner.split(source_dir / "local.bin", "remote.bin", 0,
        [&](PartRequest&& part) -> Result<void, Error> {
            if (++calls > 1) {
                return chunkd::Fail<void>(ErrorKind::IoError, "connection lost");
            }
            return sink(std::move(part));
        });
    ASSERT_TRUE(interrupted.is_error());

    auto resume = service.resume_point("remote.bin");
    ASSERT_TRUE(resume.is_ok());
    EXPECT_EQ(resume.value().chunk_index, 1u);

    auto finished = planner.split(source_dir / "local.bin", "remote.bin", resume.value().chunk_index, sink);
    ASSERT_TRUE(finished.is_ok()) << finished.error().detail;
    EXPECT_EQ(finished.value(), 2u);
    EXPECT_EQ(read_file(dir / "remote.bin"), "0123456789");

    fs::remove_all(dir);
    fs::remove_all(source_dir);
}

TEST(TransferServiceTest, EventsFeedMetrics) {
    const auto dir = create_temp_dir();
    EventBus bus;
    MetricsComponent metrics(bus);
    TransferService service(small_config(dir), bus);

    ASSERT_TRUE(service.upload_part(make_part("m.bin", "abcd", 1, 2)).is_ok());
    ASSERT_TRUE(service.upload_part(make_part("m.bin", "abcd", 1, 2)).is_error());
    ASSERT_TRUE(service.upload_part(make_part("m.bin", "ef", 2, 2)).is_ok());

    EXPECT_EQ(download_all(service, "m.bin").size(), 2u);

    // Dropped after the first chunk
    {
        auto stream = service.download_file("m.bin");
        ASSERT_TRUE(stream.is_ok());
        ASSERT_TRUE(stream.value().next().is_ok());
    }

    EXPECT_TRUE(service.download_file("missing.bin").is_error());

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.parts_stored.load(), 2u);
    EXPECT_EQ(stats.parts_rejected.load(), 1u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 6u);
    EXPECT_EQ(stats.uploads_completed.load(), 1u);
    EXPECT_EQ(stats.downloads_started.load(), 2u);
    EXPECT_EQ(stats.downloads_completed.load(), 1u);
    EXPECT_EQ(stats.downloads_aborted.load(), 1u);
    EXPECT_EQ(stats.bytes_downloaded.load(), 6u + 4u);

    fs::remove_all(dir);
}

TEST(TransferServiceTest, RejectionEventCarriesError) {
    const auto dir = create_temp_dir();
    EventBus bus;
    TransferService service(small_config(dir), bus);

    std::vector<ErrorKind> rejected;
    bus.subscribe<chunkd::events::PartRejectedEvent>([&rejected](const chunkd::events::PartRejectedEvent& e) {
        rejected.push_back(e.error.kind);
    });

    EXPECT_TRUE(service.upload_part(make_part("r.bin", "abcd", 1, 4)).is_error());
    EXPECT_TRUE(service.upload_part(make_part("r.bin", "abcde", 1, 1)).is_error());

    EXPECT_EQ(rejected, (std::vector<ErrorKind>{ErrorKind::CountLimit, ErrorKind::PartTooLarge}));
    EXPECT_FALSE(fs::exists(dir / "r.bin"));

    fs::remove_all(dir);
}
