#include "chunkd/core/config.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using chunkd::ServerConfig;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("chunkd_config_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

fs::path write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
    return path;
}

// argv for apply_command_line; the strings must outlive the call
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "chunkd_server");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
    }

    int argc() { return static_cast<int>(pointers_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

} // namespace

TEST(ServerConfigTest, DefaultsAreValid) {
    ServerConfig config;
    EXPECT_TRUE(config.validate().is_ok());
    EXPECT_EQ(config.transfer.chunk_size, 1024u * 1024u);
    EXPECT_EQ(config.transfer.max_file_size, 100u * 1024u * 1024u);
    EXPECT_EQ(config.transfer.max_parts, 100u);
    EXPECT_EQ(config.transfer.worker_pool_size, 5u);
    EXPECT_TRUE(config.transfer.strict_part_order);
    EXPECT_EQ(config.port, 8000);
    EXPECT_GT(config.max_request_body(), config.transfer.chunk_size);
}

TEST(ServerConfigTest, ValidateRejectsBadRanges) {
    ServerConfig zero_chunk;
    zero_chunk.transfer.chunk_size = 0;
    EXPECT_TRUE(zero_chunk.validate().is_error());

    ServerConfig small_quota;
    small_quota.transfer.max_file_size = small_quota.transfer.chunk_size - 1;
    EXPECT_TRUE(small_quota.validate().is_error());

    ServerConfig no_parts;
    no_parts.transfer.max_parts = 0;
    EXPECT_TRUE(no_parts.validate().is_error());

    ServerConfig no_workers;
    no_workers.transfer.worker_pool_size = 0;
    EXPECT_TRUE(no_workers.validate().is_error());
    no_workers.transfer.offload_io = false;
    EXPECT_TRUE(no_workers.validate().is_ok());

    ServerConfig bad_level;
    bad_level.log_level = "chatty";
    EXPECT_TRUE(bad_level.validate().is_error());
}

TEST(ServerConfigTest, LoadsJsonFile) {
    const auto dir = create_temp_dir();
    const auto path = write_file(dir / "chunkd.json", R"({
        "upload_directory": "/srv/files",
        "chunk_size": 4096,
        "max_file_size": 65536,
        "max_parts": 16,
        "strict_part_order": false,
        "port": 9100,
        "log_level": "debug",
        "unrelated": true
    })");

    ServerConfig config;
    auto result = chunkd::load_config_file(path, config);
    ASSERT_TRUE(result.is_ok()) << result.error();

    EXPECT_EQ(config.transfer.upload_directory, fs::path("/srv/files"));
    EXPECT_EQ(config.transfer.chunk_size, 4096u);
    EXPECT_EQ(config.transfer.max_file_size, 65536u);
    EXPECT_EQ(config.transfer.max_parts, 16u);
    EXPECT_FALSE(config.transfer.strict_part_order);
    EXPECT_EQ(config.port, 9100);
    EXPECT_EQ(config.log_level, "debug");
    // Absent keys keep their defaults
    EXPECT_EQ(config.transfer.worker_pool_size, 5u);

    fs::remove_all(dir);
}

TEST(ServerConfigTest, RejectsMistypedJson) {
    const auto dir = create_temp_dir();

    ServerConfig config;
    auto wrong_type = chunkd::load_config_file(write_file(dir / "a.json", R"({"chunk_size": "big"})"), config);
    EXPECT_TRUE(wrong_type.is_error());

    auto not_object = chunkd::load_config_file(write_file(dir / "b.json", "[1, 2, 3]"), config);
    EXPECT_TRUE(not_object.is_error());

    auto missing = chunkd::load_config_file(dir / "missing.json", config);
    EXPECT_TRUE(missing.is_error());

    auto big_port = chunkd::load_config_file(write_file(dir / "c.json", R"({"port": 70000})"), config);
    EXPECT_TRUE(big_port.is_error());

    auto big_parts = chunkd::load_config_file(write_file(dir / "d.json", R"({"max_parts": 4294967396})"), config);
    EXPECT_TRUE(big_parts.is_error());

    auto big_timeout = chunkd::load_config_file(
        write_file(dir / "e.json", R"({"io_timeout_seconds": 4294967296})"), config);
    EXPECT_TRUE(big_timeout.is_error());

    EXPECT_EQ(config.port, 8000);
    EXPECT_EQ(config.transfer.max_parts, 100u);
    EXPECT_EQ(config.io_timeout_seconds, 30);

    fs::remove_all(dir);
}

TEST(ServerConfigTest, FailedLoadLeavesConfigUntouched) {
    const auto dir = create_temp_dir();
    const auto path = write_file(dir / "chunkd.json", R"({
        "chunk_size": 4096,
        "port": 9100,
        "log_level": 3
    })");

    ServerConfig config;
    auto result = chunkd::load_config_file(path, config);
    ASSERT_TRUE(result.is_error());

    EXPECT_EQ(config.transfer.chunk_size, 1024u * 1024u);
    EXPECT_EQ(config.port, 8000);
    EXPECT_EQ(config.log_level, "info");

    fs::remove_all(dir);
}

TEST(ServerConfigTest, FlagsOverrideFile) {
    const auto dir = create_temp_dir();
    const auto path = write_file(dir / "chunkd.json", R"({"port": 9100, "chunk_size": 4096})");

    Args args{"--port", "9200", "--config", path.string(), "--max-parts", "7", "--lenient-order"};
    ServerConfig config;
    bool show_help = true;
    auto result = chunkd::apply_command_line(args.argc(), args.argv(), config, show_help);
    ASSERT_TRUE(result.is_ok()) << result.error();

    EXPECT_FALSE(show_help);
    EXPECT_EQ(config.port, 9200);
    EXPECT_EQ(config.transfer.chunk_size, 4096u);
    EXPECT_EQ(config.transfer.max_parts, 7u);
    EXPECT_FALSE(config.transfer.strict_part_order);

    fs::remove_all(dir);
}

TEST(ServerConfigTest, CommandLineErrors) {
    ServerConfig config;
    bool show_help = false;

    Args unknown{"--frobnicate", "1"};
    EXPECT_TRUE(chunkd::apply_command_line(unknown.argc(), unknown.argv(), config, show_help).is_error());

    Args negative{"--chunk-size", "-4"};
    EXPECT_TRUE(chunkd::apply_command_line(negative.argc(), negative.argv(), config, show_help).is_error());

    Args port{"--port", "70000"};
    EXPECT_TRUE(chunkd::apply_command_line(port.argc(), port.argv(), config, show_help).is_error());

    Args dangling{"--port"};
    EXPECT_TRUE(chunkd::apply_command_line(dangling.argc(), dangling.argv(), config, show_help).is_error());

    Args parts{"--max-parts", "4294967396"};
    EXPECT_TRUE(chunkd::apply_command_line(parts.argc(), parts.argv(), config, show_help).is_error());
    EXPECT_EQ(config.transfer.max_parts, 100u);

    Args huge{"--workers", "99999999999999999999"};
    EXPECT_TRUE(chunkd::apply_command_line(huge.argc(), huge.argv(), config, show_help).is_error());
}

TEST(ServerConfigTest, HelpFlag) {
    Args args{"--help"};
    ServerConfig config;
    bool show_help = false;
    ASSERT_TRUE(chunkd::apply_command_line(args.argc(), args.argv(), config, show_help).is_ok());
    EXPECT_TRUE(show_help);
    EXPECT_NE(chunkd::usage("chunkd_server").find("--chunk-size"), std::string::npos);
}
