#include <doctest/doctest.h>
#include <pngme/chunk_types.hh>
#include <pngme/container.hh>
#include <pngme/exceptions.hh>
#include <pngme/parse_options.hh>

#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngme;
using test_utils::make_chunk;
using test_utils::png_bytes;

namespace {
    struct warning {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    parse_options collecting(std::vector<warning>& out, bool strict = true) {
        parse_options opts;
        opts.strict = strict;
        opts.on_warning = [&out](std::uint64_t offset, std::string_view category, std::string_view message) {
            out.push_back({offset, std::string(category), std::string(message)});
        };
        return opts;
    }
}

TEST_CASE("default options") {
    parse_options opts;
    CHECK(opts.strict);
    CHECK(opts.max_chunk_size == 0xFFFFFFFFu);
    CHECK_FALSE(static_cast<bool>(opts.on_warning));

    // warn() without a handler is a no-op
    CHECK_NOTHROW(opts.warn(0, "crc", "ignored"));
}

TEST_CASE("lenient crc handling") {
    auto good = make_chunk("tEXt", "good");
    auto bad_bytes = make_chunk("tEXt", "bad").as_bytes();
    bad_bytes.back() ^= 0xFF;
    const auto stream = png_bytes({good.as_bytes(), bad_bytes});

    SUBCASE("strict mode fails") {
        std::vector<warning> warnings;
        CHECK_THROWS_AS((void)container::parse(stream, collecting(warnings)), parse_error);
        CHECK(warnings.empty());
    }

    SUBCASE("lenient mode keeps the chunk with a recomputed crc") {
        std::vector<warning> warnings;
        auto png = container::parse(stream, collecting(warnings, false));

        REQUIRE(png.chunks().size() == 2);
        const auto& kept = png.chunks()[1];
        CHECK(kept.data_as_string() == "bad");
        CHECK(kept.crc() == make_chunk("tEXt", "bad").crc());

        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0].category == "crc");
        CHECK(warnings[0].offset == signature.size() + good.serialized_size());
        CHECK(warnings[0].message.find("tEXt") != std::string::npos);
    }

    SUBCASE("lenient mode still rejects truncation") {
        auto cut = stream;
        cut.resize(cut.size() - 1);
        std::vector<warning> warnings;
        try {
            (void)container::parse(cut, collecting(warnings, false));
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.kind() == error_kind::truncated_input);
        }
    }
}

TEST_CASE("max chunk size") {
    const auto record = make_chunk("IDAT", std::string(100, 'x')).as_bytes();

    SUBCASE("strict mode rejects oversized chunks") {
        parse_options opts;
        opts.max_chunk_size = 64;
        try {
            (void)chunk::parse(record, opts);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.kind() == error_kind::chunk_too_large);
        }
    }

    SUBCASE("limit is inclusive") {
        parse_options opts;
        opts.max_chunk_size = 100;
        CHECK_NOTHROW((void)chunk::parse(record, opts));
    }

    SUBCASE("lenient mode warns and continues") {
        std::vector<warning> warnings;
        auto opts = collecting(warnings, false);
        opts.max_chunk_size = 64;
        auto c = chunk::parse(record, opts);
        CHECK(c.length() == 100);
        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0].category == "size_limit");
        CHECK(warnings[0].offset == 0);
    }
}

TEST_CASE("diagnostic warnings") {
    SUBCASE("reserved bit") {
        std::vector<warning> warnings;
        auto c = chunk::parse(make_chunk("Rust", "x").as_bytes(), collecting(warnings));
        CHECK_FALSE(c.type().is_valid());
        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0].category == "reserved_bit");
    }

    SUBCASE("chunks after IEND") {
        const auto iend = make_chunk("IEND", "").as_bytes();
        const auto text = make_chunk("tEXt", "late").as_bytes();
        std::vector<warning> warnings;
        auto png = container::parse(png_bytes({iend, text}), collecting(warnings));

        CHECK(png.chunks().size() == 2);
        REQUIRE(warnings.size() == 1);
        CHECK(warnings[0].category == "order");
        CHECK(warnings[0].offset == signature.size() + iend.size());
    }

    SUBCASE("well-formed stream is quiet") {
        std::vector<warning> warnings;
        (void)container::parse(test_utils::sample_png(), collecting(warnings));
        CHECK(warnings.empty());
    }
}
