//
// Byte counting and sticky failure of counting_reader
//

#include <doctest/doctest.h>
#include <shp/counting_reader.hh>
#include <shp/exceptions.hh>
#include "test_utils.hh"

using namespace shp;

TEST_CASE("counting_reader counts and decodes") {
    SUBCASE("mixed byte orders") {
        test::probe_source src(test::byte_builder().be32(9994).le32(1000).f64(-12.5).str());
        counting_reader in(src);

        std::int32_t be = 0;
        std::int32_t le = 0;
        double d = 0;
        CHECK(in.read(be, byte_order::big));
        CHECK(in.read(le, byte_order::little));
        CHECK(in.read(d, byte_order::little));

        CHECK(be == 9994);
        CHECK(le == 1000);
        CHECK(d == -12.5);
        CHECK(in.count() == 16);
        CHECK(in.offset() == 16);
        CHECK(in.good());
        CHECK(in.message().empty());
    }

    SUBCASE("reset_count keeps the absolute offset") {
        test::probe_source src(std::string(10, 'x'));
        counting_reader in(src);
        char buf[4];
        CHECK(in.read(buf, 4));
        in.reset_count();
        CHECK(in.read(buf, 4));
        CHECK(in.count() == 4);
        CHECK(in.offset() == 8);
    }

    SUBCASE("zero sized read succeeds without touching the source") {
        test::probe_source src("");
        counting_reader in(src);
        CHECK(in.read(nullptr, 0));
        CHECK(src.read_calls == 0);
        CHECK(in.good());
    }
}

TEST_CASE("counting_reader latches the first failure") {
    SUBCASE("end at a read boundary is eof") {
        test::probe_source src("abcd");
        counting_reader in(src);
        std::int32_t v = 0;
        CHECK(in.read(v, byte_order::big));
        CHECK_FALSE(in.read(v, byte_order::big));
        CHECK(in.state() == read_state::eof);
        CHECK(in.at_eof());
        CHECK(in.count() == 4);
    }

    SUBCASE("partial read is truncated") {
        test::probe_source src("abcdef");
        counting_reader in(src);
        double d = 0;
        CHECK_FALSE(in.read(d, byte_order::little));
        CHECK(in.state() == read_state::truncated);
        CHECK(in.count() == 6);
        CHECK(in.message().find("requested 8 bytes, got 6") != std::string::npos);
    }

    SUBCASE("source exception becomes failed") {
        test::probe_source src("abcdefgh", 4);
        counting_reader in(src);
        std::int32_t v = 0;
        CHECK(in.read(v, byte_order::little));
        CHECK_FALSE(in.read(v, byte_order::little));
        CHECK(in.state() == read_state::failed);
        CHECK(in.message().find("simulated read failure") != std::string::npos);
    }

    SUBCASE("later reads never reach the source") {
        test::probe_source src("ab");
        counting_reader in(src);
        std::int32_t v = 7;
        CHECK_FALSE(in.read(v, byte_order::big));
        int calls = src.read_calls;

        CHECK_FALSE(in.read(v, byte_order::big));
        CHECK_FALSE(in.discard(10));
        CHECK(src.read_calls == calls);
        CHECK(v == 7);
        CHECK(in.state() == read_state::truncated);
    }

    SUBCASE("only eof can be cleared") {
        test::probe_source empty("");
        counting_reader at_end(empty);
        char c;
        CHECK_FALSE(at_end.read(&c, 1));
        at_end.clear_eof();
        CHECK(at_end.good());

        test::probe_source short_src("a");
        counting_reader truncated(short_src);
        char two[2];
        CHECK_FALSE(truncated.read(two, 2));
        truncated.clear_eof();
        CHECK(truncated.state() == read_state::truncated);
    }
}

TEST_CASE("counting_reader discard") {
    SUBCASE("discards across scratch buffer boundaries") {
        test::probe_source src(std::string(10000, 'p') + "TAIL");
        counting_reader in(src);
        CHECK(in.discard(10000));
        char tail[4];
        CHECK(in.read(tail, 4));
        CHECK(std::string(tail, 4) == "TAIL");
        CHECK(in.count() == 10004);
    }

    SUBCASE("zero bytes is a no-op") {
        test::probe_source src("");
        counting_reader in(src);
        CHECK(in.discard(0));
        CHECK(in.good());
    }

    SUBCASE("running out after some bytes is truncated, not eof") {
        test::probe_source src(std::string(5000, 'p'));
        counting_reader in(src);
        CHECK_FALSE(in.discard(8192));
        CHECK(in.state() == read_state::truncated);
    }

    SUBCASE("nothing left at all is eof") {
        test::probe_source src("");
        counting_reader in(src);
        CHECK_FALSE(in.discard(3));
        CHECK(in.at_eof());
    }
}
