#include <cassert>
#include <iostream>
#include <memory>
#include <regex>
#include <string>
#include <vector>

#include <JsonPipe/jsonpipe.hpp>

using namespace JsonPipe;

ValuesResult pick(const std::string & json, FilterOptions filter, TokenizerOptions tokenizer = {}) {
    // small chunks so paths cross chunk boundaries
    return PickValues(std::make_unique<StringSource>(json, 5), std::move(filter), {}, tokenizer);
}

FilterOptions literal(std::string path) {
    FilterOptions f;
    f.filter = std::move(path);
    return f;
}

std::string joined(const ValuesResult & r) {
    std::string out;
    for(const Value & v : r.values()) {
        if(!out.empty()) out += ' ';
        out += Serialize(v);
    }
    return out;
}

// Ignore() runs in front of an assembler, the result is the document minus the matches
DocumentResult without(const std::string & json, FilterOptions filter) {
    Cursor cursor(std::make_unique<StringSource>(json, 3),
                  pipeline::gen(MakeParser(), Ignore(std::move(filter)), Assembler()));
    auto v = cursor.next();
    if(!cursor.failure()) {
        return cursor.failure();
    }
    assert(v);
    return std::move(*v);
}

void pick_literal_tests() {
    const std::string doc = R"({"a":{"b":[1,2,3],"c":4},"b":5})";

    auto r = pick(doc, literal("a.b"));
    assert(r);
    assert(r.values().size() == 1);
    assert(r.values()[0] == Value(Array{1, 2, 3}));

    auto exact = pick(R"({"a":{"b":[1,2,3]},"c":1})", literal("a.b"));
    assert(exact && exact.values().size() == 1);
    assert(Serialize(exact.values()[0]) == "[1,2,3]");

    // packed-only tokens select the same values
    TokenizerOptions packed;
    packed.streamValues(false);
    auto p = pick(doc, literal("a.b"), packed);
    assert(p && joined(p) == "[1,2,3]");

    // fragment-only options still yield complete values
    TokenizerOptions unpacked;
    unpacked.packValues(false);
    auto u = pick(R"({"a":{"b":[1,"x"]},"k":"v"})", literal("a.b"), unpacked);
    assert(u && joined(u) == R"([1,"x"])");

    assert(joined(pick(doc, literal("a.c"))) == "4");
    assert(joined(pick(doc, literal("b"))) == "5");

    // a path selects itself, not a sibling sharing its prefix
    assert(joined(pick(R"({"ab":1,"a":2,"abc":{"a":3}})", literal("a"))) == "2");

    // array elements by index
    auto items = pick(R"({"items":[{"id":1},{"id":2},{"id":3}]})", literal("items.1"));
    assert(items && joined(items) == R"({"id":2})");

    // nested arrays
    assert(joined(pick("[[1,2],[3,[4,5]]]", literal("1.1.0"))) == "4");

    // custom separator
    FilterOptions slash = literal("a/b");
    slash.pathSeparator = "/";
    assert(joined(pick(doc, slash)) == "[1,2,3]");

    // no filter: the whole document
    assert(joined(pick(doc, FilterOptions{})) == R"({"a":{"b":[1,2,3],"c":4},"b":5})");
}

void pick_pattern_tests() {
    const std::string doc = R"({"items":[{"id":1,"n":"x"},{"id":2},{"name":"id"}]})";

    FilterOptions re;
    re.filter = std::regex(R"(^items\.\d+\.id$)");
    auto r = pick(doc, re);
    assert(r && joined(r) == "1 2");

    FilterOptions strings;
    strings.filter = PathPredicate([](const PathStack &, const Token & t) {
        return t.kind == TokenKind::startString || t.kind == TokenKind::stringValue;
    });
    auto s = pick(R"(["a",1,{"k":"b"},[true,"c"]])", strings);
    assert(s && joined(s) == R"("a" "b" "c")");

    FilterOptions deep;
    deep.filter = PathPredicate([](const PathStack & stack, const Token &) {
        return stack.size() == 2 && stack[1].is_array() && !stack[1].pending;
    });
    auto d = pick(R"({"x":[1,2],"y":{"z":[3]}})", deep);
    assert(d && joined(d) == "1 2");
}

void pick_once_tests() {
    FilterOptions first;
    first.filter = std::regex(R"(^\d+$)");
    first.once = true;
    auto r = pick("[1,2,3]", first);
    assert(r && joined(r) == "1");

    FilterOptions firstObject = literal("list.0");
    firstObject.once = true;
    auto o = pick(R"({"list":[{"a":[1]},{"a":[2]}],"list2":0})", firstObject);
    assert(o && joined(o) == R"({"a":[1]})");
}

void require_match_tests() {
    FilterOptions missing = literal("missing");
    missing.requireMatch = true;
    auto r = pick(R"({"a":1})", missing);
    assert(!r);
    assert(r.error() == StreamError::PATH_NOT_FOUND);

    FilterOptions present = literal("a");
    present.requireMatch = true;
    assert(pick(R"({"a":1})", present));

    // without requireMatch nothing matched is just an empty result
    auto empty = pick(R"({"a":1})", literal("missing"));
    assert(empty && empty.values().empty());

    // malformed input still wins over a missing path
    auto bad = pick(R"({"a":)", missing);
    assert(!bad && bad.error() == StreamError::MALFORMED_INPUT);
}

void ignore_tests() {
    auto r = without(R"({"a":1,"b":{"x":[1,2]},"c":"s"})", literal("b"));
    assert(r);
    assert(Serialize(r.value()) == R"({"a":1,"c":"s"})");

    auto arr = without("[0,1,2]", literal("1"));
    assert(arr && Serialize(arr.value()) == "[0,2]");

    FilterOptions ids;
    ids.filter = std::regex(R"(\.id$)");
    auto nested = without(R"({"users":[{"id":1,"name":"a"},{"id":2,"name":"b"}]})", ids);
    assert(nested);
    assert(Serialize(nested.value()) == R"({"users":[{"name":"a"},{"name":"b"}]})");

    // ignoring nothing keeps the document intact
    auto same = without(R"({"k":[true,null,"v"]})", literal("zzz"));
    assert(same && Serialize(same.value()) == R"({"k":[true,null,"v"]})");

    FilterOptions firstOnly = literal("0");
    firstOnly.once = true;
    auto once = without("[[1],[2]]", firstOnly);
    assert(once && Serialize(once.value()) == "[[2]]");
}

void stage_tests() {
    // Filter used directly as a stage
    Filter f = Pick(literal("a"));
    auto p = pipeline::gen(MakeParser(), std::move(f));
    std::vector<Token> out;
    auto sink = [&](Token && t) { out.push_back(std::move(t)); };
    assert(p.push(R"({"b":0,"a":tr)", sink) == pipeline::Outcome::ok);
    assert(p.push("ue}", sink) == pipeline::Outcome::ok);
    assert(p.finish(sink) == pipeline::Outcome::ok);
    assert(out.size() == 1 && out[0].kind == TokenKind::trueValue);
    assert(p.get<1>().matched());
    assert(p.get<1>().stack().empty());
}

int main()
{
    pick_literal_tests();
    pick_pattern_tests();
    pick_once_tests();
    require_match_tests();
    ignore_tests();
    stage_tests();
    std::cout << "filter tests passed" << std::endl;
}
