#include <catch2/catch_test_macros.hpp>

#include <canif/canif.hpp>

#include <sstream>
#include <string>

using namespace canif;

namespace {

    PrinterOptions flat() {
        PrinterOptions opt {};
        opt.indent = 0;
        return opt;
    }

    PrinterOptions indented(const std::uint32_t width, const bool trailing_commas = true) {
        PrinterOptions opt {};
        opt.indent = width;
        opt.trailing_commas = trailing_commas;
        return opt;
    }

    std::string verbatim(const std::string_view text, const PrinterOptions opt) {
        ParseError err {};
        auto out = reformat(text, opt, &err);
        INFO(err.to_string());
        REQUIRE(err.ok());
        return out;
    }

    std::string json(const std::string_view text, const PrinterOptions opt) {
        ParseError err {};
        auto out = reformat<JsonPrinter>(text, opt, &err);
        INFO(err.to_string());
        REQUIRE(err.ok());
        return out;
    }

} // namespace

TEST_CASE("canif verbatim flat layout", "[canif][printer]") {
    CHECK(verbatim("{a:1,'b':[1,2,],}", flat()) == "{a: 1, 'b': [1, 2]}\n");
    CHECK(verbatim("new Date( 1 , tz = 'UTC' )", flat()) == "new Date(1, tz='UTC')\n");
    CHECK(verbatim("{ a ,b }", flat()) == "{a, b}\n");
    CHECK(verbatim("[ /a b/g , <Foo 'x y'> ,None]", flat()) == "[/a b/g, <Foo 'x y'>, None]\n");
    CHECK(verbatim("[] // nothing\n", flat()) == "[]\n");
}

TEST_CASE("canif verbatim keeps literals as written", "[canif][printer]") {
    CHECK(verbatim("[+1, 007, -0.50, 5.12e-17, 1E3]", flat()) == "[+1, 007, -0.50, 5.12e-17, 1E3]\n");
    CHECK(verbatim("[\"a\\u0041\", 'it\\'s']", flat()) == "[\"a\\u0041\", 'it\\'s']\n");
    CHECK(verbatim("[True, false, undefined, NotImplemented]", flat()) == "[True, false, undefined, NotImplemented]\n");
}

TEST_CASE("canif verbatim holes and tuples keep their commas", "[canif][printer]") {
    CHECK(verbatim("[1,,,]", flat()) == "[1, , ,]\n");
    CHECK(verbatim("[,]", flat()) == "[,]\n");
    CHECK(verbatim("(1,)", flat()) == "(1,)\n");
    CHECK(verbatim("(1, 2,)", flat()) == "(1, 2)\n");

    CHECK(verbatim("(1,)", indented(2)) == "(\n  1,\n)\n");
    CHECK(verbatim("(1,)", indented(2, false)) == "(\n  1,\n)\n");
    CHECK(verbatim("[1,,]", indented(4)) == "[\n    1,\n    ,\n]\n");
    CHECK(verbatim("[1,,]", indented(4, false)) == "[\n    1,\n    ,\n]\n");
}

TEST_CASE("canif verbatim indented layout", "[canif][printer]") {
    const std::string text = R"({"a": [1, 2], "b": {}})";

    CHECK(verbatim(text, indented(4)) == "{\n    \"a\": [\n        1,\n        2,\n    ],\n    \"b\": {},\n}\n");
    CHECK(verbatim(text, indented(4, false)) == "{\n    \"a\": [\n        1,\n        2\n    ],\n    \"b\": {}\n}\n");
    CHECK(verbatim("[[], (), {}, f()]", indented(4)) == "[\n    [],\n    (),\n    {},\n    f(),\n]\n");
}

TEST_CASE("canif verbatim calls and sets indented", "[canif][printer]") {
    CHECK(verbatim("f(1, k=[2])", indented(2)) == "f(\n  1,\n  k=[\n    2,\n  ],\n)\n");
    CHECK(verbatim("{x, y}", indented(2, false)) == "{\n  x,\n  y\n}\n");
}

TEST_CASE("canif verbatim multiple documents", "[canif][printer]") {
    CHECK(verbatim("1 2\n[3]", flat()) == "1\n2\n[3]\n");
    CHECK(verbatim("", flat()).empty());
    CHECK(verbatim("  // just a comment\n", flat()).empty());
}

TEST_CASE("canif single document mode", "[canif][printer]") {
    ParseError err {};
    const auto out = reformat("1 2", flat(), &err, true);
    CHECK(err.code == ErrorCode::TrailingContent);
    CHECK(err.position == 2);
    CHECK(out == "1\n2");

    CHECK(reformat("[1]  ", flat(), &err, true) == "[1]\n");
    CHECK(err.ok());
}

TEST_CASE("canif formatting is idempotent", "[canif][printer]") {
    const std::string inputs[] = {
        "{a: [1, 2,, (3,)], 'b': f(x, y=[{}]), c: {1, 2}, d: <Obj 'q'>, e: /re/i}",
        "[new Date(0), ObjectId('ab'), OrderedDict([('a', 1)])]",
        "((), [,], {}, ({},))",
    };

    for (const auto& text : inputs) {
        for (const auto& opt : {flat(), indented(2), indented(4, false)}) {
            const auto once = verbatim(text, opt);
            CHECK(verbatim(once, opt) == once);
        }
    }
}

TEST_CASE("canif json printer rewrites python syntax", "[canif][printer][json]") {
    CHECK(json("(1, 2)", flat()) == "[1, 2]\n");
    CHECK(json("{1}", flat()) == "{\"$set\": [1]}\n");
    CHECK(json("x", flat()) == "\"$$x\"\n");
    CHECK(json(R"(/a\/b/i)", flat()) == "{\"$regex\": \"a/b\", \"$options\": \"i\"}\n");
    CHECK(json("/x/", flat()) == "{\"$regex\": \"x\"}\n");
    CHECK(json("<Foo 1>", flat()) == "\"$repr<Foo 1>\"\n");
    CHECK(json("[undefined, NotImplemented, None, True]", flat()) == "[\"$undefined\", \"$NotImplemented\", null, true]\n");
    CHECK(json("'it\\'s'", flat()) == "\"it's\"\n");
}

TEST_CASE("canif json printer calls", "[canif][printer][json]") {
    CHECK(json("ObjectId('abc')", flat()) == "{\"$oid\": [\"abc\"]}\n");
    CHECK(json("Date(0)", flat()) == "{\"$date\": [0]}\n");
    CHECK(json("f(1, k=v)", flat()) == "{\"$$f\": [1], \"$kwargs\": {\"k\": \"$$v\"}}\n");
    CHECK(json("f()", flat()) == "{\"$$f\": []}\n");
    CHECK(json("f(,1)", flat()) == "{\"$$f\": [null, 1]}\n");
}

TEST_CASE("canif json printer keys", "[canif][printer][json]") {
    CHECK(json("{1: 2, (1, 2): 3, 'a': 4, b: 5}", flat()) == "{\"1\": 2, \"[1, 2]\": 3, \"a\": 4, \"b\": 5}\n");
    CHECK(json("{None: 1}", flat()) == "{\"null\": 1}\n");
    CHECK(json("{{a: 1}: 2}", indented(2)) == "{\n  \"{\\\"a\\\": 1}\": 2\n}\n");
}

TEST_CASE("canif json printer numbers and holes", "[canif][printer][json]") {
    CHECK(json("[+1, 007, -0.50, 5.12e-17]", flat()) == "[1, 7, -0.50, 5.12e-17]\n");
    CHECK(json("[1,,]", flat()) == "[1, null]\n");
    CHECK(json("[,]", flat()) == "[null]\n");
}

TEST_CASE("canif json printer layout", "[canif][printer][json]") {
    CHECK(json("{a: [1, 2], b: {}}", indented(2)) == "{\n  \"a\": [\n    1,\n    2\n  ],\n  \"b\": {}\n}\n");
    // trailing commas are never valid JSON
    CHECK(json("(1,)", indented(2, true)) == "[\n  1\n]\n");
}

TEST_CASE("canif json printer ensure_ascii", "[canif][printer][json]") {
    auto opt = flat();
    opt.ensure_ascii = true;
    CHECK(json("'\xc3\xa9'", opt) == "\"\\u00e9\"\n");
    CHECK(json("'\xc3\xa9'", flat()) == "\"\xc3\xa9\"\n");
}

TEST_CASE("canif json printer agrees with the value encoder", "[canif][printer][json]") {
    const std::string inputs[] = {
        "{a: [1, 2,, (3,)], 'b': f(x, y=[{}]), c: {1, 2}, d: <Obj 'q'>, e: /re/i}",
        "{1: 2, (1, 2): 3, 'a': 4, b: 5}",
        "[undefined, 5.12e-17, -0, 'caf\xc3\xa9', {}]",
    };

    for (const auto& text : inputs) {
        Value v;
        const auto err = parse_to_value(text, v);
        REQUIRE(err.ok());

        CHECK(json(text, flat()) == encode(v) + "\n");
        CHECK(json(text, indented(4)) == encode(v, true) + "\n");
    }
}

TEST_CASE("canif printers replay recorded events", "[canif][printer]") {
    const std::string text = "[f(1, a={b}), (2,), , 'x']";

    Lexer lexer(text);
    Recorder r;
    Parser parser(lexer, r);
    REQUIRE(parser.document());

    JsonPrinter<StringSink> printer(StringSink {}, flat());
    REQUIRE(r.replay(printer));
    CHECK(printer.finish() == json(text, flat()).substr(0, json(text, flat()).size() - 1));
}

TEST_CASE("canif stream sink", "[canif][printer]") {
    std::ostringstream os;
    VerbatimPrinter<StreamSink> printer(StreamSink {&os}, flat());

    const auto err = translate(printer, "[1,2] {a:1}");
    REQUIRE(err.ok());
    CHECK(printer.finish());
    CHECK(os.str() == "[1, 2]\n{a: 1}\n");
}

TEST_CASE("canif printer rejects unbalanced events", "[canif][printer]") {
    VerbatimPrinter<StringSink> printer(StringSink {}, flat());
    CHECK_FALSE(printer.on_array_end());
    CHECK(printer.error().code == ErrorCode::BuilderInvalidState);
}
