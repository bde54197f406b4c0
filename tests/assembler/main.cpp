#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <JsonPipe/jsonpipe.hpp>

using namespace JsonPipe;

void value_tests() {
    Object o{{"a", 1}, {"b", "x"}};
    assert(o.size() == 2);
    assert(o.contains("a") && !o.contains("c"));
    assert(o.find("b")->as_string() == "x");

    o.set("a", Value(Array{true, nullptr}));
    assert(o.size() == 2);
    assert(o.members()[0].key == "a");
    assert(o.members()[0].value.is_array());

    assert(o.erase("a") && !o.erase("a"));
    assert(o.size() == 1);

    // member order does not matter for equality
    assert((Object{{"x", 1}, {"y", 2}} == Object{{"y", 2}, {"x", 1}}));
    assert(!(Object{{"x", 1}} == Object{{"x", 2}}));

    Value v(42);
    assert(v.is_number() && v.as_number() == 42.0);
    assert(Value().is_null());
    assert(Value("s").type() == ValueType::string);
    assert(value_type_to_string(Value(Object{}).type()) == "object");
    assert(!(Value(1) == Value("1")));
}

void parse_tests() {
    auto r = Parse(R"({"a":[1,2.5,-3e2],"b":{"c":null,"d":true},"e":"x\ny"})");
    assert(r);
    const Value & v = r.value();
    assert(v.is_object());
    assert(v.find("a")->as_array().size() == 3);
    assert(v.find("a")->as_array()[1].as_number() == 2.5);
    assert(v.find("a")->as_array()[2].as_number() == -300.0);
    assert(v.find("b")->find("c")->is_null());
    assert(v.find("b")->find("d")->as_bool());
    assert(v.find("e")->as_string() == "x\ny");

    // scalars at the top level
    assert(Parse("\"hi\"").value().as_string() == "hi");
    assert(Parse(" 7 ").value().as_number() == 7.0);
    assert(Parse("false").value() == Value(false));
    assert(Parse("null").value().is_null());

    // duplicate keys: last value wins, first position kept
    auto dup = Parse(R"({"a":1,"b":2,"a":3})");
    assert(dup);
    assert(Serialize(dup.value()) == R"({"a":3,"b":2})");

    // malformed input
    auto bad = Parse(R"({"a":})");
    assert(!bad);
    assert(bad.error() == StreamError::MALFORMED_INPUT);
    assert(bad.failure().tokenizerError() == TokenizerError::EXPECTED_VALUE);
    assert(bad.failure().offset() == 5);

    auto mismatched = Parse("[1}");
    assert(!mismatched && mismatched.error() == StreamError::MISMATCHED_CLOSE);

    auto trailing = Parse("[1] [2]");
    assert(!trailing && trailing.failure().tokenizerError() == TokenizerError::EXCESS_CHARACTERS);

    auto empty = Parse("");
    assert(!empty && empty.error() == StreamError::MALFORMED_INPUT);
}

void number_tests() {
    assert(Assembler::ParseNumber("0") == 0.0);
    assert(Assembler::ParseNumber("-12.5e1") == -125.0);
    assert(std::isinf(Assembler::ParseNumber("1e400")) && Assembler::ParseNumber("1e400") > 0);
    assert(std::isinf(Assembler::ParseNumber("-1e400")) && Assembler::ParseNumber("-1e400") < 0);

    AssemblerOptions opts;
    opts.numberAsString = true;
    auto r = Parse("[1.50, 12345678901234567890]", opts);
    assert(r);
    assert(r.value().as_array()[0] == Value("1.50"));
    assert(r.value().as_array()[1].as_string() == "12345678901234567890");
}

void reviver_tests() {
    std::vector<std::string> keys;
    AssemblerOptions opts;
    opts.reviver = [&](std::string_view key, Value v) -> std::optional<Value> {
        keys.emplace_back(key);
        if(key == "secret") {
            return std::nullopt;
        }
        if(v.is_number()) {
            return Value(v.as_number() * 2);
        }
        return v;
    };
    auto r = Parse(R"({"a":1,"secret":"pw","b":[10,20]})", opts);
    assert(r);
    assert(Serialize(r.value()) == R"({"a":2,"b":[20,40]})");
    // children first, root last with an empty key
    assert((keys == std::vector<std::string>{"a", "secret", "0", "1", "b", ""}));

    // array slots keep their source index when an earlier one is dropped
    keys.clear();
    AssemblerOptions dropFirst;
    dropFirst.reviver = [&](std::string_view key, Value v) -> std::optional<Value> {
        keys.emplace_back(key);
        if(v.is_null()) {
            return std::nullopt;
        }
        return v;
    };
    auto arr = Parse("[null, 1, 2]", dropFirst);
    assert(arr && Serialize(arr.value()) == "[1,2]");
    assert((keys == std::vector<std::string>{"0", "1", "2", ""}));

    // dropping the root leaves null
    AssemblerOptions dropAll;
    dropAll.reviver = [](std::string_view, Value) -> std::optional<Value> { return std::nullopt; };
    auto none = Parse("{\"a\":1}", dropAll);
    assert(none && none.value().is_null());
}

void incremental_tests() {
    Assembler a;
    assert(a.done() && a.depth() == 0);

    const std::vector<Token> tokens = {
        {TokenKind::startObject, ""},
        {TokenKind::keyValue, "a"},
        {TokenKind::startArray, ""},
        {TokenKind::numberValue, "1"},
        {TokenKind::startObject, ""},
        {TokenKind::keyValue, "b"},
    };
    for(const Token & t : tokens) {
        assert(a.consume(t));
    }
    assert(!a.done());
    assert(a.depth() == 3);
    assert(a.key() && *a.key() == "b");
    assert(path::ToJsonPath(a.path()) == "$.a[1]");
    assert(path::JoinPath(a.path(), ".") == "a.1");

    // fragments are not the assembler's business
    assert(!a.consume({TokenKind::stringFragment, "x"}));

    // abandon the half-built object and finish the rest
    a.dropToLevel(2);
    assert(a.depth() == 2);
    assert(a.consume({TokenKind::endArray, ""}));
    assert(a.consume({TokenKind::endObject, ""}));
    assert(a.done() && a.failure());
    assert(Serialize(a.take()) == R"({"a":[1]})");

    Assembler m;
    m.consume({TokenKind::startArray, ""});
    m.consume({TokenKind::endObject, ""});
    assert(!m.failure());
    assert(m.failure().error() == StreamError::MISMATCHED_CLOSE);

    // as a pipeline stage, one output per top-level value
    TokenizerOptions streaming;
    streaming.jsonStreaming = true;
    auto p = pipeline::gen(MakeParser(streaming), Assembler());
    std::vector<Value> out;
    auto sink = [&](Value && v) { out.push_back(std::move(v)); };
    assert(p.push("1 [2] {\"c\"", sink) == pipeline::Outcome::ok);
    assert(p.push(":3}", sink) == pipeline::Outcome::ok);
    assert(p.finish(sink) == pipeline::Outcome::ok);
    assert(out.size() == 3);
    assert(out[0] == Value(1));
    assert(out[1] == Value(Array{2}));
    assert(out[2] == Value(Object{{"c", 3}}));
}

void serialize_tests() {
    assert(Serialize(Value()) == "null");
    assert(Serialize(Value(Array{1, 2.5, "q\"\\\n", false})) == R"([1,2.5,"q\"\\\n",false])");
    assert(Serialize(Value(std::string("\x01"))) == R"("\u0001")");
    assert(Serialize(Value(INFINITY)) == "null");

    const std::string doc = R"({"k":[{"x":null},-0.25,"\u00e9"],"z":{}})";
    auto r = Parse(doc);
    assert(r);
    assert(Serialize(r.value()) == "{\"k\":[{\"x\":null},-0.25,\"\xC3\xA9\"],\"z\":{}}");

    std::string out = "prefix:";
    Serialize(Value(true), out);
    assert(out == "prefix:true");
}

// Fragment-only options must not reach the assembler
void tokenizer_options_tests() {
    const std::string doc = R"({"a":1,"b":[2,"x"],"c":"yz"})";
    TokenizerOptions unpacked[4];
    unpacked[0].packKeys = false;
    unpacked[1].packStrings = false;
    unpacked[2].packNumbers = false;
    unpacked[3].packValues(false).streamValues(false);
    for(const TokenizerOptions & opts : unpacked) {
        auto r = ParseDocument(std::make_unique<StringSource>(doc, 4), {}, opts);
        assert(r);
        assert(Serialize(r.value()) == doc);
    }

    auto nums = ParseDocument(std::make_unique<StringSource>("[1,2,\"x\"]"), {}, unpacked[2]);
    assert(nums && Serialize(nums.value()) == R"([1,2,"x"])");
}

void surrogate_tests() {
    auto lone = Parse(R"(["\ud800","a\udc00b"])");
    assert(lone);
    assert(lone.value() == Value(Array{"\xEF\xBF\xBD", "a\xEF\xBF\xBD" "b"}));

    auto pair = Parse(R"("\ud83d\ude00")");
    assert(pair && pair.value() == Value("\xF0\x9F\x98\x80"));
}

int main()
{
    value_tests();
    parse_tests();
    number_tests();
    reviver_tests();
    incremental_tests();
    serialize_tests();
    tokenizer_options_tests();
    surrogate_tests();
    std::cout << "assembler tests passed" << std::endl;
}
