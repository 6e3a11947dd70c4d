#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <canif/canif.hpp>

#include <limits>
#include <string>

using namespace canif;

namespace {

    Value parse(const std::string_view text) {
        Value v;
        const auto err = parse_to_value(text, v);
        INFO(err.to_string());
        REQUIRE(err.ok());
        return v;
    }

    std::string to_json(const std::string_view text) {
        return encode(parse(text));
    }

} // namespace

TEST_CASE("canif value scalars", "[canif][value]") {
    const auto v = parse("[null, True, 42, -1.5, 'x', 99999999999999999999]");
    REQUIRE(v.is_array());
    REQUIRE(v.size() == 6);

    CHECK(v.at(0)->is_null());
    CHECK(v.at(1)->as_bool());
    CHECK(v.at(2)->as_i64() == 42);
    CHECK(v.at(3)->as_double() == Catch::Approx(-1.5));
    CHECK(v.at(4)->as_string() == "x");

    // out of int64 range: a double that still prints as written
    CHECK_FALSE(v.at(5)->try_i64().has_value());
    CHECK(v.at(5)->number().kind == NumberKind::Double);
    CHECK(v.at(5)->raw_number() == "99999999999999999999");

    CHECK(v.at(6) == nullptr);
    CHECK(v.at(4)->as_i64(7) == 7);
}

TEST_CASE("canif value encodings", "[canif][value]") {
    CHECK(to_json("{1}") == R"({"$set": [1]})");
    CHECK(to_json("x") == R"("$$x")");
    CHECK(to_json("<Foo 1>") == R"("$repr<Foo 1>")");
    CHECK(to_json("/a+/gi") == R"({"$regex": "a+", "$options": "gi"})");
    CHECK(to_json("[undefined, NotImplemented]") == R"(["$undefined", "$NotImplemented"])");
    CHECK(to_json("(1, (2,))") == "[1, [2]]");
    CHECK(to_json("[1,,]") == "[1, null]");
}

TEST_CASE("canif value keeps number literals", "[canif][value]") {
    CHECK(to_json("[5.12e-17, -0.50, +3, 010, 1E+2]") == "[5.12e-17, -0.50, 3, 10, 1E+2]");
    CHECK(to_json("12345678901234567890123") == "12345678901234567890123");
}

TEST_CASE("canif value mapping keys", "[canif][value]") {
    const auto v = parse("{1: 2, (1, 2): 3, 'a': 4, b: 5, None: 6, {x}: 7}");
    REQUIRE(v.is_object());

    CHECK(v.find("1") != nullptr);
    CHECK(v.find("[1, 2]") != nullptr);
    CHECK(v.find("a")->as_i64() == 4);
    CHECK(v.find("b")->as_i64() == 5);
    CHECK(v.find("null")->as_i64() == 6);
    CHECK(v.find(R"({"$set": ["$$x"]})")->as_i64() == 7);
    CHECK(v.find("missing") == nullptr);
}

TEST_CASE("canif value duplicate keys keep the first position", "[canif][value]") {
    const auto v = parse("{a: 1, b: 2, a: 3}");
    REQUIRE(v.members().size() == 2);
    CHECK(v.members()[0].key == "a");
    CHECK(v.members()[0].value.as_i64() == 3);
    CHECK(encode(v) == R"({"a": 3, "b": 2})");
}

TEST_CASE("canif value special calls", "[canif][value]") {
    CHECK(to_json("Date('2020-01-01')") == R"({"$date": "2020-01-01"})");
    CHECK(to_json("ObjectId('5f3a')") == R"({"$oid": "5f3a"})");
    CHECK(to_json("Date(1, 2)") == R"({"$date": [1, 2]})");
    CHECK(to_json("Date(tz='UTC')") == R"({"$date": [], "$kwargs": {"tz": "UTC"}})");

    CHECK(to_json("OrderedDict()") == "{}");
    CHECK(to_json("OrderedDict([('b', 1), ('a', 2)])") == R"({"b": 1, "a": 2})");
    CHECK(to_json("OrderedDict({x: 1})") == R"({"x": 1})");
    // not a list of pairs: kept as an ordinary call
    CHECK(to_json("OrderedDict([1])") == R"({"$$OrderedDict": [[1]]})");

    CHECK(to_json("f(1, a=2)") == R"({"$$f": [1], "$kwargs": {"a": 2}})");
    CHECK(to_json("Foo.bar()") == R"({"$$Foo.bar": []})");
}

TEST_CASE("canif value builder without unwrapping", "[canif][value]") {
    Lexer lexer("[Date(0), OrderedDict()]");
    ValueBuilder builder(ValueBuilder::Options {.unwrap_special_calls = false});
    Parser parser(lexer, builder);
    REQUIRE(parser.document());

    CHECK(encode(builder.root()) == R"([{"$date": [0]}, {"$$OrderedDict": []}])");
}

TEST_CASE("canif value builder checks event order", "[canif][value]") {
    SECTION("separator without a value") {
        ValueBuilder b;
        REQUIRE(b.on_document_begin());
        REQUIRE(b.on_mapping_begin());
        CHECK_FALSE(b.on_mapping_key());
        CHECK(b.error().code == ErrorCode::BuilderMissingValue);
    }

    SECTION("mapping closed after a key") {
        ValueBuilder b;
        REQUIRE(b.on_document_begin());
        REQUIRE(b.on_mapping_begin());
        REQUIRE(b.on_integer("1", 1));
        REQUIRE(b.on_mapping_key());
        CHECK_FALSE(b.on_mapping_end());
        CHECK(b.error().code == ErrorCode::BuilderDanglingKey);
    }

    SECTION("two values without a separator") {
        ValueBuilder b;
        REQUIRE(b.on_document_begin());
        REQUIRE(b.on_integer("1", 1));
        CHECK_FALSE(b.on_integer("2", 2));
        CHECK(b.error().code == ErrorCode::BuilderInvalidState);
    }

    SECTION("mismatched close") {
        ValueBuilder b;
        REQUIRE(b.on_document_begin());
        REQUIRE(b.on_array_begin(ArrayKind::List));
        CHECK_FALSE(b.on_set_end());
        CHECK(b.error().code == ErrorCode::BuilderInvalidState);
    }

    SECTION("empty document") {
        ValueBuilder b;
        REQUIRE(b.on_document_begin());
        CHECK_FALSE(b.on_document_end());
        CHECK(b.error().code == ErrorCode::BuilderMissingValue);
    }
}

TEST_CASE("canif value equality and mutation", "[canif][value]") {
    auto v = parse("{a: [1, 2.0], b: 'x'}");
    CHECK(v == parse("{b: 'x', a: [1, 2]}"));
    CHECK_FALSE(v == parse("{a: [1, 2.5], b: 'x'}"));

    v.set("c", Value::make_bool(true));
    v.find("a")->push_back(Value {});
    CHECK(encode(v) == R"({"a": [1, 2.0, null], "b": "x", "c": true})");

    const auto copy = v;
    CHECK(copy == v);
}

TEST_CASE("canif value encoder layout", "[canif][value]") {
    auto v = Value::make_object();
    v.set("k", Value::make_array({Value::make_integer(1), Value::make_object(), Value::make_array()}));

    CHECK(encode(v) == R"({"k": [1, {}, []]})");
    CHECK(encode(v, true) == "{\n    \"k\": [\n        1,\n        {},\n        []\n    ]\n}");

    PrinterOptions two {};
    two.indent = 2;
    CHECK(encode(v, two, nullptr) == "{\n  \"k\": [\n    1,\n    {},\n    []\n  ]\n}");
}

TEST_CASE("canif value encoder numbers without a literal", "[canif][value]") {
    CHECK(encode(Value::make_double(0.1)) == "0.1");
    CHECK(encode(Value::make_integer(-7)) == "-7");

    ParseError err {};
    CHECK(encode(Value::make_double(std::numeric_limits<double>::infinity()), PrinterOptions {}, &err).empty());
    CHECK(err.code == ErrorCode::WriterFailed);
}

TEST_CASE("canif value encoder ensure_ascii", "[canif][value]") {
    PrinterOptions opt {};
    opt.indent = 0;
    opt.ensure_ascii = true;
    CHECK(encode(Value::make_string("caf\xc3\xa9"), opt, nullptr) == "\"caf\\u00e9\"");
    CHECK(encode(Value::make_string("tab\there")) == "\"tab\\there\"");
}

TEST_CASE("canif document", "[canif][value]") {
    const std::string text = "{a: OrderedDict([('x', 1)])}";
    auto doc = Document::parse(text);
    REQUIRE(doc);
    CHECK(doc.root().find("a")->find("x")->as_i64() == 1);

    const auto root = doc.take_root();
    CHECK(root.is_object());

    const std::string bad = "{a: }";
    const auto broken = Document::parse(bad);
    CHECK_FALSE(broken.ok());
    CHECK(broken.error().code == ErrorCode::ExpectedExpression);
    CHECK(broken.error().position == 4);
    CHECK(broken.root().is_null());
}

TEST_CASE("canif parse_to_value requires a single document", "[canif][value]") {
    Value v;
    CHECK(parse_to_value("1 2", v).code == ErrorCode::TrailingContent);
    CHECK(parse_to_value("", v).code == ErrorCode::ExpectedExpression);
    CHECK(parse_to_value(" 3 // three", v).ok());
    CHECK(v.as_i64() == 3);
}
