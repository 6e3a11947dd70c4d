#include <catch2/catch_test_macros.hpp>

#include <canif/canif.hpp>

#include <string>

using namespace canif;

namespace {

    // Breaks out of any token: an unfinished python repr holding both kinds of quote.
    constexpr std::string_view kSpanner = "<\"'>";

    PrinterOptions with_indent(const std::uint32_t width) {
        PrinterOptions opt {};
        opt.indent = width;
        return opt;
    }

    std::string without_spanner(std::string text) {
        const auto at = text.find(kSpanner);
        REQUIRE(at != std::string::npos);
        text.erase(at, kSpanner.size());
        return text;
    }

} // namespace

TEST_CASE("canif recovery echoes the unparsed input", "[canif][recovery]") {
    ParseError err {};
    const auto out = reformat("[1, 2, <\"'>3]", with_indent(0), &err);

    CHECK(err.code == ErrorCode::UnexpectedToken);
    CHECK(err.position == 7);
    CHECK(err.input == "[1, 2, <\"'>3]");
    CHECK(out == "[1, 2, <\"'>3]");
}

TEST_CASE("canif recovery keeps documents printed before the error", "[canif][recovery]") {
    ParseError err {};
    const auto out = reformat("{a:1}\n[1,  2 3]", with_indent(0), &err);

    CHECK_FALSE(err.ok());
    CHECK(err.position == 13);
    CHECK(out == "{a: 1}\n[1, 23]");
}

TEST_CASE("canif recovery indented", "[canif][recovery]") {
    ParseError err {};
    const auto out = reformat("{a: [1, (2,), x y]}", with_indent(2), &err);

    CHECK(err.to_string() == "Position 16: expected `]`, found 'y]}'");
    CHECK(out == "{\n  a: [\n    1,\n    (\n      2,\n    ),\n    xy]}");
}

TEST_CASE("canif recovery replays a failed lookahead", "[canif][recovery]") {
    ParseError err {};
    const auto out = reformat("{[1, 2 3]: 4}", with_indent(0), &err);

    CHECK(err.position == 7);
    CHECK(out == "{[1, 23]: 4}");
}

TEST_CASE("canif recovery in json output", "[canif][recovery]") {
    ParseError err {};
    const auto out = reformat<JsonPrinter>("{a: 1, 'b': [x, <\"'>]}", with_indent(0), &err);

    CHECK_FALSE(err.ok());
    CHECK(out == "{\"a\": 1, \"b\": [\"$$x\", <\"'>]}");
}

TEST_CASE("canif recovery json keeps a half-read key", "[canif][recovery]") {
    ParseError err {};
    const auto out = reformat<JsonPrinter>("{a: 1, (1, <\"'>): 2}", with_indent(0), &err);

    CHECK_FALSE(err.ok());
    CHECK(out == "{\"a\": 1, [1, <\"'>): 2}");
}

TEST_CASE("canif recovery round trip with an inserted spanner", "[canif][recovery]") {
    const std::string fixtures[] = {
        "{a: [1, 2.5, -3e2], b: (True, None), c: {x, y}, d: f(1, k=v), e: [1,,3], h: (1,), 7: Foo.bar()}",
        "[undefined, {1: (2, 3), (4,): [[], ()]}, NotImplemented, g(, 1, z=[0])]",
    };

    for (const auto& original : fixtures) {
        for (const auto width : {0u, 4u}) {
            const auto opt = with_indent(width);
            const auto expected = reformat(original, opt);

            std::size_t checked = 0;
            for (std::size_t i = 0; i <= original.size(); ++i) {
                auto broken = original;
                broken.insert(i, kSpanner);

                ParseError err {};
                const auto recovered = reformat(broken, opt, &err);
                if (err.ok())
                    continue;

                INFO("spanner at " << i << ": " << broken);
                CHECK(err.position <= i);
                CHECK(reformat(without_spanner(recovered), opt) == expected);
                ++checked;
            }
            CHECK(checked > original.size() / 2);
        }
    }
}

TEST_CASE("canif recovery reports depth errors", "[canif][recovery]") {
    const std::string text = "[[[[1]]]]";

    VerbatimPrinter<StringSink> printer(StringSink {}, with_indent(0));
    const auto err = translate(printer, text, false, ParserOptions {.max_depth = 2});

    CHECK(err.code == ErrorCode::DepthExceeded);
    CHECK(printer.finish() == text);
}
