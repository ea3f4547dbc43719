// modkit_doc Document model tests

#include <catch2/catch_test_macros.hpp>
#include <modkit/document/document.hpp>

#include <stdexcept>
#include <string>

using namespace modkit_doc;

TEST_CASE("Document construction", "[document][model]") {
    SECTION("default is null") {
        Document doc;
        REQUIRE(doc.is_scalar());
        REQUIRE(doc.is_null());
        REQUIRE(doc.kind() == DocumentKind::Scalar);
    }

    SECTION("scalars") {
        REQUIRE(Document(true).as_scalar()->type_name() == std::string("bool"));
        REQUIRE(Document(42).as_scalar()->type_name() == std::string("integer"));
        REQUIRE(Document(1.5).as_scalar()->type_name() == std::string("number"));
        REQUIRE(Document("guard").as_scalar()->type_name() == std::string("string"));
        REQUIRE(Document(nullptr).as_scalar()->type_name() == std::string("null"));
    }

    SECTION("containers") {
        Document obj = Document::object();
        Document arr = Document::array();
        REQUIRE(obj.is_object());
        REQUIRE(obj.as_object()->empty());
        REQUIRE(arr.is_array());
        REQUIRE(arr.as_array()->empty());
        REQUIRE(obj.as_array() == nullptr);
        REQUIRE_FALSE(obj.is_null());
    }
}

TEST_CASE("Object preserves insertion order", "[document][model]") {
    Object object;
    object.set("zeta", 1);
    object.set("alpha", 2);
    object.set("mid", 3);

    REQUIRE(object.size() == 3);
    REQUIRE(object.keys() == std::vector<std::string>{"zeta", "alpha", "mid"});

    SECTION("set on an existing key overwrites in place") {
        object.set("alpha", 20);
        REQUIRE(object.size() == 3);
        REQUIRE(object.keys()[1] == "alpha");
        REQUIRE(*object.find("alpha") == Document(20));
    }

    SECTION("erase") {
        REQUIRE(object.erase("zeta"));
        REQUIRE_FALSE(object.erase("zeta"));
        REQUIRE(object.keys() == std::vector<std::string>{"alpha", "mid"});
        REQUIRE(object.value_at(0) == Document(2));
    }

    SECTION("dump follows key order") {
        REQUIRE(Document(object).dump() == R"({"zeta":1,"alpha":2,"mid":3})");
    }
}

TEST_CASE("Array operations", "[document][model]") {
    Array array;
    array.push_back(1);
    array.push_back(3);
    array.insert(1, 2);
    array.insert(3, 4);

    REQUIRE(array.size() == 4);
    REQUIRE(Document(array).dump() == "[1,2,3,4]");

    array.erase(0);
    REQUIRE(array.at(0) == Document(2));
    REQUIRE(array.size() == 3);

    SECTION("out of range access") {
        REQUIRE_THROWS_AS(array.at(3), std::out_of_range);
        REQUIRE(array.find(3) == nullptr);
        REQUIRE(array.find(2) != nullptr);
        REQUIRE(*array.find(2) == Document(4));
    }
}

TEST_CASE("Document parse and dump", "[document][json]") {
    SECTION("round trip keeps key order") {
        const std::string text = R"({"name":"Guard","stats":{"hp":100,"speed":1.5},"tags":["npc",null,true]})";
        auto doc = Document::parse(text);
        REQUIRE(doc);
        REQUIRE(doc->dump() == text);
    }

    SECTION("non-negative integers compare equal to constructed integers") {
        auto doc = Document::parse("7");
        REQUIRE(doc);
        REQUIRE(*doc == Document(7));
    }

    SECTION("large unsigned integers survive") {
        auto doc = Document::parse("18446744073709551615");
        REQUIRE(doc);
        REQUIRE(doc->dump() == "18446744073709551615");
    }

    SECTION("invalid JSON") {
        auto doc = Document::parse("{\"a\":");
        REQUIRE(doc.is_err());
        REQUIRE(doc.error().code() == modkit_core::ErrorCode::ParseError);
    }

    SECTION("nested equality") {
        auto a = Document::parse(R"({"a":[1,{"b":2}]})");
        auto b = Document::parse(R"({"a":[1,{"b":2}]})");
        auto c = Document::parse(R"({"a":[1,{"b":3}]})");
        REQUIRE(*a == *b);
        REQUIRE_FALSE(*a == *c);
    }
}

TEST_CASE("Document copies are deep", "[document][model]") {
    auto original = Document::parse(R"({"list":[1,2]})").value();
    Document copy = original;

    copy.as_object()->find("list")->as_array()->push_back(3);

    REQUIRE(original.dump() == R"({"list":[1,2]})");
    REQUIRE(copy.dump() == R"({"list":[1,2,3]})");
}
