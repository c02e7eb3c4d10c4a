// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hoist/core/chunker.hpp>
#include <hoist/core/config.hpp>
#include <numeric>

using namespace hoist::core;

namespace {

Bytes make_data(std::size_t n) {
    Bytes data(n);
    std::iota(data.begin(), data.end(), std::uint8_t{0});
    return data;
}

Bytes join(const std::vector<Bytes>& chunks) {
    Bytes out;
    for (const auto& c : chunks) {
        out.insert(out.end(), c.begin(), c.end());
    }
    return out;
}

} // namespace

TEST_CASE("split - chunk boundaries", "[chunker]") {
    SECTION("Ten bytes in threes") {
        auto chunks = split(make_data(10), 3);
        REQUIRE(chunks.has_value());
        REQUIRE(chunks->size() == 4);
        CHECK((*chunks)[0] == Bytes{0, 1, 2});
        CHECK((*chunks)[1] == Bytes{3, 4, 5});
        CHECK((*chunks)[2] == Bytes{6, 7, 8});
        CHECK((*chunks)[3] == Bytes{9});
    }

    SECTION("Exact multiple has no short tail") {
        auto chunks = split(make_data(9), 3);
        REQUIRE(chunks.has_value());
        CHECK(chunks->size() == 3);
        CHECK(chunks->back().size() == 3);
    }

    SECTION("Chunk larger than data") {
        auto chunks = split(make_data(5), 100);
        REQUIRE(chunks.has_value());
        REQUIRE(chunks->size() == 1);
        CHECK(chunks->front().size() == 5);
    }

    SECTION("Default payload ceiling") {
        auto chunks = split(Bytes(MAX_PAYLOAD_SIZE * 2 + 1), DEFAULT_CHUNK_SIZE);
        REQUIRE(chunks.has_value());
        REQUIRE(chunks->size() == 3);
        CHECK((*chunks)[0].size() == 2'000'000);
        CHECK((*chunks)[2].size() == 1);
    }
}

TEST_CASE("split - offsets", "[chunker]") {
    const auto data = make_data(10);

    SECTION("Offset chunking equals chunking the suffix") {
        auto from_offset = split(data, 3, 4);
        Bytes suffix(data.begin() + 4, data.end());
        auto from_suffix = split(suffix, 3, 0);
        REQUIRE(from_offset.has_value());
        REQUIRE(from_suffix.has_value());
        CHECK(*from_offset == *from_suffix);
    }

    SECTION("Concatenation reproduces the tail") {
        auto chunks = split(data, 4, 3);
        REQUIRE(chunks.has_value());
        CHECK(join(*chunks) == Bytes(data.begin() + 3, data.end()));
    }

    SECTION("Offset at the end yields nothing") {
        auto chunks = split(data, 3, 10);
        REQUIRE(chunks.has_value());
        CHECK(chunks->empty());
    }

    SECTION("Offset past the end yields nothing") {
        auto chunks = split(data, 3, 50);
        REQUIRE(chunks.has_value());
        CHECK(chunks->empty());
    }

    SECTION("Empty input") {
        auto chunks = split(Bytes{}, 3);
        REQUIRE(chunks.has_value());
        CHECK(chunks->empty());
    }
}

TEST_CASE("split - zero chunk size is rejected", "[chunker]") {
    auto chunks = split(make_data(10), 0);
    REQUIRE_FALSE(chunks.has_value());
    CHECK(chunks.error() == UploadErrc::invalid_chunk_size);
}

TEST_CASE("to_chunk_info", "[chunker]") {
    auto chunks = split(make_data(10), 3);
    REQUIRE(chunks.has_value());
    auto infos = to_chunk_info(std::move(*chunks));

    REQUIRE(infos.size() == 4);
    for (std::size_t i = 0; i < infos.size(); ++i) {
        CHECK(infos[i].id == i);
        CHECK(infos[i].size == infos[i].data.size());
    }
    CHECK(infos[3].data == Bytes{9});
}

TEST_CASE("skip_chunks", "[chunker]") {
    auto infos = to_chunk_info(*split(make_data(10), 2));  // IDs 0..4

    SECTION("Drops the leading chunks, keeps IDs") {
        auto rest = skip_chunks(infos, 2);
        REQUIRE(rest.size() == 3);
        CHECK(rest.front().id == 2);
        CHECK(rest.back().id == 4);
    }

    SECTION("Skip everything") {
        CHECK(skip_chunks(infos, 5).empty());
        CHECK(skip_chunks(infos, 99).empty());
    }

    SECTION("Skip nothing") {
        CHECK(skip_chunks(infos, 0).size() == 5);
    }
}

TEST_CASE("filter_by_ids", "[chunker]") {
    auto infos = to_chunk_info(*split(make_data(10), 2));  // IDs 0..4

    SECTION("Manifest 1,3 keeps exactly those") {
        const std::vector<std::uint32_t> ids{1, 3};
        auto kept = filter_by_ids(infos, ids);
        REQUIRE(kept.size() == 2);
        CHECK(kept[0].id == 1);
        CHECK(kept[1].id == 3);
        CHECK(kept[0].data == Bytes{2, 3});
    }

    SECTION("Order follows the chunks, not the ID list") {
        const std::vector<std::uint32_t> ids{4, 0};
        auto kept = filter_by_ids(infos, ids);
        REQUIRE(kept.size() == 2);
        CHECK(kept[0].id == 0);
        CHECK(kept[1].id == 4);
    }

    SECTION("Unknown IDs are ignored") {
        const std::vector<std::uint32_t> ids{2, 42};
        auto kept = filter_by_ids(infos, ids);
        REQUIRE(kept.size() == 1);
        CHECK(kept[0].id == 2);
    }

    SECTION("Empty ID list") {
        CHECK(filter_by_ids(infos, {}).empty());
    }
}
