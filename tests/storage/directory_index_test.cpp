#include "chunkd/storage/directory_index.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using chunkd::ErrorKind;
using chunkd::storage::DirectoryIndex;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("chunkd_index_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void touch(const fs::path& path) {
    std::ofstream out(path, std::ios::binary);
    out << "x";
}

} // namespace

TEST(DirectoryIndexTest, EmptyAndMissingDirectoriesListNothing) {
    const auto dir = create_temp_dir();

    auto empty = DirectoryIndex(dir).list();
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.value().empty());

    auto missing = DirectoryIndex(dir / "not-there").list();
    ASSERT_TRUE(missing.is_ok());
    EXPECT_TRUE(missing.value().empty());

    fs::remove_all(dir);
}

TEST(DirectoryIndexTest, ListsRegularFilesSorted) {
    const auto dir = create_temp_dir();
    touch(dir / "zeta.txt");
    touch(dir / "Alpha.bin");
    touch(dir / "movie.mkv");
    fs::create_directories(dir / "subdir");

    auto listed = DirectoryIndex(dir).list();
    ASSERT_TRUE(listed.is_ok());
    EXPECT_EQ(listed.value(), (std::vector<std::string>{"Alpha.bin", "movie.mkv", "zeta.txt"}));

    fs::remove_all(dir);
}

TEST(DirectoryIndexTest, SearchIgnoresCase) {
    const auto dir = create_temp_dir();
    touch(dir / "Report-2024.PDF");
    touch(dir / "report-draft.txt");
    touch(dir / "photo.jpg");

    DirectoryIndex index(dir);
    auto matches = index.search("REPORT");
    ASSERT_TRUE(matches.is_ok());
    EXPECT_EQ(matches.value(), (std::vector<std::string>{"Report-2024.PDF", "report-draft.txt"}));

    auto pdf = index.search(".pdf");
    ASSERT_TRUE(pdf.is_ok());
    EXPECT_EQ(pdf.value(), (std::vector<std::string>{"Report-2024.PDF"}));

    fs::remove_all(dir);
}

TEST(DirectoryIndexTest, SearchErrors) {
    const auto dir = create_temp_dir();
    touch(dir / "photo.jpg");
    DirectoryIndex index(dir);

    auto empty_query = index.search("");
    ASSERT_TRUE(empty_query.is_error());
    EXPECT_EQ(empty_query.error().kind, ErrorKind::InvalidArgument);

    auto no_match = index.search("video");
    ASSERT_TRUE(no_match.is_error());
    EXPECT_EQ(no_match.error().kind, ErrorKind::NotFound);
    EXPECT_EQ(no_match.error().detail, "No matching files found.");

    fs::remove_all(dir);
}
