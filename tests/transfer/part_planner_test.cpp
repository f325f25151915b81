#include "chunkd/transfer/part_planner.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using chunkd::Error;
using chunkd::ErrorKind;
using chunkd::Fail;
using chunkd::Ok;
using chunkd::Result;
using chunkd::transfer::PartPlanner;
using chunkd::transfer::PartRequest;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("chunkd_planner_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

} // namespace

TEST(PartPlannerTest, TotalParts) {
    EXPECT_EQ(PartPlanner::total_parts_for(0, 4), 1u);
    EXPECT_EQ(PartPlanner::total_parts_for(1, 4), 1u);
    EXPECT_EQ(PartPlanner::total_parts_for(4, 4), 1u);
    EXPECT_EQ(PartPlanner::total_parts_for(5, 4), 2u);
    EXPECT_EQ(PartPlanner::total_parts_for(12, 4), 3u);
}

TEST(PartPlannerTest, SplitsIntoFullPartsAndShortTail) {
    const auto dir = create_temp_dir();
    write_file(dir / "src.bin", "abcdefghij");

    std::vector<PartRequest> parts;
    PartPlanner planner(4);
    auto emitted = planner.split(dir / "src.bin", "dest.bin", 0, [&parts](PartRequest&& part) -> Result<void, Error> {
        parts.push_back(std::move(part));
        return Ok();
    });

    ASSERT_TRUE(emitted.is_ok());
    EXPECT_EQ(emitted.value(), 3u);
    ASSERT_EQ(parts.size(), 3u);

    const std::vector<std::string> expected{"abcd", "efgh", "ij"};
    for (size_t i = 0; i < parts.size(); ++i) {
        EXPECT_EQ(parts[i].file_name, "dest.bin");
        EXPECT_EQ(parts[i].part_number, i + 1);
        EXPECT_EQ(parts[i].total_parts, 3u);
        EXPECT_EQ(std::string(parts[i].data.begin(), parts[i].data.end()), expected[i]);
    }

    fs::remove_all(dir);
}

TEST(PartPlannerTest, ResumesFromStartIndex) {
    const auto dir = create_temp_dir();
    write_file(dir / "src.bin", "abcdefghij");

    std::vector<uint32_t> numbers;
    PartPlanner planner(4);
    auto emitted = planner.split(dir / "src.bin", "dest.bin", 2, [&numbers](PartRequest&& part) -> Result<void, Error> {
        numbers.push_back(part.part_number);
        EXPECT_EQ(std::string(part.data.begin(), part.data.end()), "ij");
        return Ok();
    });

    ASSERT_TRUE(emitted.is_ok());
    EXPECT_EQ(numbers, (std::vector<uint32_t>{3}));

    auto beyond = planner.split(dir / "src.bin", "dest.bin", 3, [](PartRequest&&) -> Result<void, Error> {
        return Ok();
    });
    ASSERT_TRUE(beyond.is_error());
    EXPECT_EQ(beyond.error().kind, ErrorKind::InvalidArgument);

    fs::remove_all(dir);
}

TEST(PartPlannerTest, EmptyFileIsOneEmptyPart) {
    const auto dir = create_temp_dir();
    write_file(dir / "empty.bin", "");

    std::vector<PartRequest> parts;
    PartPlanner planner(4);
    auto emitted = planner.split(dir / "empty.bin", "empty.bin", 0, [&parts](PartRequest&& part) -> Result<void, Error> {
        parts.push_back(std::move(part));
        return Ok();
    });

    ASSERT_TRUE(emitted.is_ok());
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].part_number, 1u);
    EXPECT_EQ(parts[0].total_parts, 1u);
    EXPECT_TRUE(parts[0].data.empty());

    fs::remove_all(dir);
}

TEST(PartPlannerTest, StopsAtFirstSinkError) {
    const auto dir = create_temp_dir();
    write_file(dir / "src.bin", "abcdefghij");

    int calls = 0;
    PartPlanner planner(4);
    auto emitted = planner.split(dir / "src.bin", "dest.bin", 0, [&calls](PartRequest&&) -> Result<void, Error> {
        if (++calls == 2) {
            return Fail<void>(ErrorKind::Conflict, "Expected part 1, got part 2");
        }
        return Ok();
    });

    ASSERT_TRUE(emitted.is_error());
    EXPECT_EQ(emitted.error().kind, ErrorKind::Conflict);
    EXPECT_EQ(calls, 2);

    fs::remove_all(dir);
}

TEST(PartPlannerTest, MissingSourceIsNotFound) {
    const auto dir = create_temp_dir();
    PartPlanner planner(4);
    auto emitted = planner.split(dir / "missing.bin", "x", 0, [](PartRequest&&) -> Result<void, Error> {
        return Ok();
    });
    ASSERT_TRUE(emitted.is_error());
    EXPECT_EQ(emitted.error().kind, ErrorKind::NotFound);

    fs::remove_all(dir);
}
