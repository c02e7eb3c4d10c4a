// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hoist/cli/commands.hpp>
#include <hoist/core/failed_manifest.hpp>
#include <hoist/io/error.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace hoist::cli;
using hoist::core::UploadErrc;
using hoist::io::IoErrc;

namespace fs = std::filesystem;

namespace {

CliArgs parse(std::vector<std::string> words) {
    words.insert(words.begin(), "hoist");
    std::vector<char*> argv;
    for (auto& w : words) {
        argv.push_back(w.data());
    }
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

void write_file(const fs::path& path, std::size_t size) {
    std::ofstream out(path, std::ios::binary);
    for (std::size_t i = 0; i < size; ++i) {
        out.put(static_cast<char>(i * 7));
    }
}

// Collects everything written to std::cout while alive
class CoutCapture {
public:
    CoutCapture() : previous_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(previous_); }

    [[nodiscard]] std::string text() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

} // namespace

TEST_CASE("parse_args - positionals and defaults", "[cli]") {
    auto args = parse({"https://example.com/api", "store", "model.bin"});

    CHECK(args.error.empty());
    CHECK(args.destination == "https://example.com/api");
    CHECK(args.operation == "store");
    CHECK(args.file == "model.bin");
    CHECK(args.offset == 0);
    CHECK(args.chunk_offset == 0);
    CHECK(args.chunk_size == hoist::core::DEFAULT_CHUNK_SIZE);
    CHECK_FALSE(args.parallel);
    CHECK_FALSE(args.auto_resume);
    CHECK_FALSE(args.max_retries.has_value());
}

TEST_CASE("parse_args - options", "[cli]") {
    auto args = parse({"-o", "100", "--chunk-offset", "4", "-n", "ic", "-a", "--max-retries", "5",
                       "-p", "--max-concurrent", "8", "--target-rate", "2.5",
                       "--retry-chunks", "model.bin.failed", "--chunk-size", "1000",
                       "--command", "tool {file}", "-c", "hoist.json", "-V",
                       "dest", "op", "model.bin"});

    REQUIRE(args.error.empty());
    CHECK(args.offset == 100);
    CHECK(args.chunk_offset == 4);
    CHECK(args.network == "ic");
    CHECK(args.auto_resume);
    CHECK(args.max_retries == 5u);
    CHECK(args.parallel);
    CHECK(args.max_concurrent == 8u);
    CHECK(args.target_rate_mibs == 2.5);
    CHECK(args.retry_chunks == "model.bin.failed");
    CHECK(args.chunk_size == 1000);
    CHECK(args.command == "tool {file}");
    CHECK(args.config_path == "hoist.json");
    CHECK(args.verbose);
    CHECK(args.file == "model.bin");
}

TEST_CASE("parse_args - help and version short-circuit", "[cli]") {
    CHECK(parse({"-h"}).help);
    CHECK(parse({"--version"}).version);
    CHECK(parse({"--bogus", "-h"}).help);
}

TEST_CASE("parse_args - errors", "[cli]") {
    SECTION("Missing positionals") {
        CHECK_FALSE(parse({"dest", "op"}).error.empty());
    }

    SECTION("Too many positionals") {
        CHECK_THAT(parse({"a", "b", "c", "d"}).error, Catch::Matchers::ContainsSubstring("'d'"));
    }

    SECTION("Bad number") {
        CHECK_THAT(parse({"--offset", "ten", "a", "b", "c"}).error,
                   Catch::Matchers::ContainsSubstring("invalid byte offset"));
        CHECK_FALSE(parse({"--chunk-size", "0", "a", "b", "c"}).error.empty());
        CHECK_FALSE(parse({"--target-rate", "fast", "a", "b", "c"}).error.empty());
    }

    SECTION("Missing value") {
        CHECK_THAT(parse({"a", "b", "c", "--max-retries"}).error,
                   Catch::Matchers::ContainsSubstring("missing value"));
    }

    SECTION("Unknown option") {
        CHECK_THAT(parse({"--turbo", "a", "b", "c"}).error,
                   Catch::Matchers::ContainsSubstring("unknown option"));
    }
}

TEST_CASE("build_config", "[cli]") {
    SECTION("Command line overrides") {
        auto args = parse({"-a", "--max-retries", "6", "--max-concurrent", "2", "--target-rate", "1",
                           "dest", "op", "model.bin"});
        auto config = build_config(args);
        REQUIRE(config.has_value());
        CHECK(config->auto_resume);
        CHECK(config->max_retries == 6);
        CHECK(config->max_concurrent == 2);
        CHECK(config->target_rate_bps == Catch::Approx(hoist::core::MIB));
        CHECK(config->failed_manifest_path == "model.bin.failed");
    }

    SECTION("Config file underneath the command line") {
        const std::string path = "cli_test_config.json";
        {
            std::ofstream out(path);
            out << R"({"max_retries": 9, "max_concurrent": 3, "failed_manifest": "custom.failed"})";
        }
        auto args = parse({"-c", path, "--max-concurrent", "5", "dest", "op", "model.bin"});
        auto config = build_config(args);
        REQUIRE(config.has_value());
        CHECK(config->max_retries == 9);
        CHECK(config->max_concurrent == 5);
        CHECK(config->failed_manifest_path == "custom.failed");
        fs::remove(path);
    }

    SECTION("Invalid values are rejected") {
        auto args = parse({"--max-retries", "0", "dest", "op", "model.bin"});
        auto config = build_config(args);
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error() == UploadErrc::invalid_config);
    }

    SECTION("Missing config file") {
        auto args = parse({"-c", "nope.json", "dest", "op", "model.bin"});
        auto config = build_config(args);
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error() == IoErrc::file_not_found);
    }
}

TEST_CASE("Resume and retry hints", "[cli]") {
    SECTION("Resume hint") {
        auto args = parse({"-n", "ic", "--max-retries", "5", "backend", "append", "my model.bin"});
        CHECK(resume_hint("hoist", args, 12) ==
              "hoist backend append 'my model.bin' --network ic --chunk-offset 12 --autoresume --max-retries 5");
    }

    SECTION("Resume hint keeps the byte offset") {
        auto args = parse({"-o", "4096", "backend", "append", "model.bin"});
        CHECK(resume_hint("hoist", args, 3) ==
              "hoist backend append model.bin --offset 4096 --chunk-offset 3 --autoresume");
    }

    SECTION("Rerun hint") {
        auto args = parse({"-p", "--max-retries", "2", "--max-concurrent", "6",
                           "https://example.com/api", "store", "model.bin"});
        CHECK(rerun_hint("hoist", args) ==
              "hoist https://example.com/api store model.bin --parallel --max-retries 2 --max-concurrent 6");
    }

    SECTION("Retry hint") {
        auto args = parse({"-p", "https://example.com/api", "store", "model.bin"});
        CHECK(retry_hint("hoist", args, "model.bin.failed") ==
              "hoist https://example.com/api store model.bin --parallel --retry-chunks model.bin.failed");
    }
}

TEST_CASE("upload - in-memory dry run", "[cli]") {
    const fs::path input = "cli_test_input.bin";
    write_file(input, 10'000);

    SECTION("Sequential") {
        auto args = parse({"-q", "--chunk-size", "1024", "mem://test", "op", input.string()});
        REQUIRE(args.error.empty());
        auto result = upload("hoist", args);
        REQUIRE(result.has_value());
        CHECK(*result == 0);
    }

    SECTION("Parallel from a byte offset") {
        auto args = parse({"-q", "-p", "--max-concurrent", "3", "--chunk-size", "999", "-o", "17",
                           "mem://test", "op", input.string()});
        auto result = upload("hoist", args);
        REQUIRE(result.has_value());
        CHECK(*result == 0);
    }

    SECTION("Offset past the end") {
        auto args = parse({"-q", "-o", "20000", "mem://test", "op", input.string()});
        auto result = upload("hoist", args);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == UploadErrc::invalid_offset);
    }

    fs::remove(input);
}

TEST_CASE("upload - failures", "[cli]") {
    const fs::path input = "cli_test_fail.bin";
    write_file(input, 3'000);

    SECTION("Missing file") {
        auto args = parse({"-q", "mem://test", "op", "no_such_input.bin"});
        auto result = upload("hoist", args);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == IoErrc::file_not_found);
    }

    SECTION("Destination without a transfer") {
        auto args = parse({"-q", "backend", "op", input.string()});
        auto result = upload("hoist", args);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == UploadErrc::invalid_destination);
    }

    SECTION("Partial failure writes the manifest and exits 1") {
        const std::string manifest = input.string() + ".failed";
        hoist::core::FailedManifest::remove(manifest);

        // Chunk 1 always fails
        auto args = parse({"-q", "-p", "--max-retries", "1", "--chunk-size", "1000",
                           "--command", "test {id} -ne 1", "backend", "op", input.string()});
        auto result = upload("hoist", args);
        REQUIRE(result.has_value());
        CHECK(*result == 1);

        auto saved = hoist::core::FailedManifest::load(manifest);
        REQUIRE(saved.has_value());
        CHECK(saved->chunk_ids == std::vector<std::uint32_t>{1});

        SECTION("Retrying the manifest succeeds and removes it") {
            auto retry = parse({"-q", "-p", "--chunk-size", "1000", "--retry-chunks", manifest,
                                "--command", "true", "backend", "op", input.string()});
            auto second = upload("hoist", retry);
            REQUIRE(second.has_value());
            CHECK(*second == 0);
            CHECK_FALSE(hoist::core::FailedManifest::exists(manifest));
        }

        hoist::core::FailedManifest::remove(manifest);
    }

    SECTION("Sequential failure without auto-resume prints the resume command") {
        // Chunk 2 fails, chunks 0 and 1 land
        auto args = parse({"-q", "--chunk-size", "1000",
                           "--command", "test {id} -ne 2", "backend", "op", input.string()});
        CoutCapture out;
        auto result = upload("hoist", args);
        REQUIRE(result.has_value());
        CHECK(*result == 1);
        CHECK_THAT(out.text(), Catch::Matchers::ContainsSubstring("To resume"));
        CHECK_THAT(out.text(), Catch::Matchers::ContainsSubstring("--chunk-offset 2 --autoresume"));
    }

    SECTION("Resume index counts chunks skipped by --chunk-offset") {
        auto args = parse({"-q", "--chunk-size", "1000", "--chunk-offset", "1",
                           "--command", "test {id} -ne 2", "backend", "op", input.string()});
        CoutCapture out;
        auto result = upload("hoist", args);
        REQUIRE(result.has_value());
        CHECK(*result == 1);
        CHECK_THAT(out.text(), Catch::Matchers::ContainsSubstring("--chunk-offset 2 --autoresume"));
    }

    SECTION("Parallel run with every chunk failing prints the rerun command") {
        const std::string manifest = input.string() + ".failed";
        hoist::core::FailedManifest::remove(manifest);

        auto args = parse({"-q", "-p", "--max-retries", "1", "--chunk-size", "1000",
                           "--command", "false", "backend", "op", input.string()});
        CoutCapture out;
        auto result = upload("hoist", args);
        REQUIRE(result.has_value());
        CHECK(*result == 1);
        CHECK_THAT(out.text(), Catch::Matchers::ContainsSubstring("To upload the file again"));
        CHECK_THAT(out.text(), Catch::Matchers::ContainsSubstring("--parallel --max-retries 1"));
        CHECK_FALSE(hoist::core::FailedManifest::exists(manifest));
    }

    SECTION("Sequential interruption exits 1") {
        auto args = parse({"-q", "-a", "--max-retries", "1", "--chunk-size", "1000",
                           "--command", "false", "backend", "op", input.string()});
        auto result = upload("hoist", args);
        REQUIRE(result.has_value());
        CHECK(*result == 1);
    }

    fs::remove(input);
}
