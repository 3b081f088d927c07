#include <doctest/doctest.h>
#include "Scratch.hpp"

#include <memory>
#include <optional>
#include <string>

using namespace SS;

TEST_SUITE("scratch") {

TEST_CASE("Scratch Add") {
    Scratch scratch;

    SUBCASE("absent key stores the addend verbatim") {
        CHECK_FALSE(scratch.add("x", 5).has_value());
        auto value = scratch.get("x");
        REQUIRE(value.has_value());
        CHECK(*value == Value{5});
    }

    SUBCASE("numbers are summed") {
        scratch.set("n", 2);
        CHECK_FALSE(scratch.add("n", 3).has_value());
        CHECK(scratch.get("n") == std::optional<Value>{5});

        CHECK_FALSE(scratch.add("n", 0.5).has_value());
        auto value = scratch.get("n");
        REQUIRE(value.has_value());
        REQUIRE(value->asFloat() != nullptr);
        CHECK(*value->asFloat() == doctest::Approx(5.5));
    }

    SUBCASE("strings are concatenated") {
        scratch.set("s", "foo");
        CHECK_FALSE(scratch.add("s", "bar").has_value());
        CHECK(scratch.get("s") == std::optional<Value>{"foobar"});
    }

    SUBCASE("sequences are extended") {
        scratch.set("arr", Sequence{1, 2});
        CHECK_FALSE(scratch.add("arr", 3).has_value());
        CHECK(scratch.get("arr") == std::optional<Value>{Sequence{1, 2, 3}});

        CHECK_FALSE(scratch.add("arr", Sequence{4, 5}).has_value());
        CHECK(scratch.get("arr") == std::optional<Value>{Sequence{1, 2, 3, 4, 5}});
    }

    SUBCASE("sequence elements may be heterogeneous and only one level is flattened") {
        scratch.set("mixed", Sequence{});
        CHECK_FALSE(scratch.add("mixed", "a").has_value());
        CHECK_FALSE(scratch.add("mixed", Sequence{1.5, Sequence{true}}).has_value());
        CHECK(scratch.get("mixed") == std::optional<Value>{Sequence{"a", 1.5, Sequence{true}}});
    }

    SUBCASE("first add of a sequence establishes append mode") {
        CHECK_FALSE(scratch.add("tags", Sequence{"x"}).has_value());
        CHECK_FALSE(scratch.add("tags", "y").has_value());
        CHECK(scratch.get("tags") == std::optional<Value>{Sequence{"x", "y"}});
    }

    SUBCASE("incompatible scalars fail and leave the value untouched") {
        scratch.set("m", 5);
        auto error = scratch.add("m", "text");
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::ArithmeticError);
        CHECK(scratch.get("m") == std::optional<Value>{5});

        scratch.set("b", true);
        auto boolError = scratch.add("b", true);
        REQUIRE(boolError.has_value());
        CHECK(boolError->code == Error::Code::ArithmeticError);
        CHECK(scratch.get("b") == std::optional<Value>{true});
    }

    SUBCASE("text that is not valid UTF-8 is stored byte for byte") {
        std::string const latin1{"caf\xe9"};
        CHECK_FALSE(scratch.add("word", latin1).has_value());
        CHECK(scratch.get("word") == std::optional<Value>{latin1});

        scratch.set("t", "caf");
        CHECK_FALSE(scratch.add("t", std::string{"\xe9"}).has_value());
        auto value = scratch.get("t");
        REQUIRE(value.has_value());
        REQUIRE(value->asText() != nullptr);
        CHECK(*value->asText() == latin1);

        CHECK_FALSE(scratch.setInMap("grp", latin1, latin1).has_value());
        auto values = scratch.getSortedMapValues("grp");
        REQUIRE(values.has_value());
        CHECK(*values == std::optional<Sequence>{Sequence{latin1}});
    }

    SUBCASE("adding a sequence onto a scalar is an arithmetic error") {
        scratch.set("n", 1);
        auto error = scratch.add("n", Sequence{2});
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::ArithmeticError);
        CHECK(scratch.get("n") == std::optional<Value>{1});
    }
}

TEST_CASE("Scratch Set and Get") {
    Scratch scratch;

    SUBCASE("missing keys read as absent") {
        CHECK_FALSE(scratch.get("missing").has_value());
        CHECK_FALSE(scratch.contains("missing"));
        CHECK(scratch.size() == 0);
    }

    SUBCASE("set overwrites regardless of shape") {
        scratch.set("k", 1);
        scratch.set("k", "one");
        CHECK(scratch.get("k") == std::optional<Value>{"one"});
        scratch.set("k", Sequence{1});
        CHECK(scratch.get("k") == std::optional<Value>{Sequence{1}});
        CHECK(scratch.setInMap("grp", "a", 1) == std::nullopt);
        scratch.set("grp", 3);
        CHECK(scratch.get("grp") == std::optional<Value>{3});
        CHECK(scratch.size() == 2);
    }

    SUBCASE("repeated set is stable") {
        for (int i = 0; i < 10; ++i) {
            scratch.set("stable", "v");
            CHECK(scratch.get("stable") == std::optional<Value>{"v"});
        }
        CHECK(scratch.size() == 1);
    }

    SUBCASE("an empty stored value is not absent") {
        scratch.set("empty", "");
        CHECK(scratch.contains("empty"));
        CHECK(scratch.get("empty") == std::optional<Value>{""});
    }

    SUBCASE("get returns a copy") {
        scratch.set("list", Sequence{1});
        auto copy = scratch.get("list");
        REQUIRE(copy.has_value());
        copy->asSequence()->push_back(2);
        CHECK(scratch.get("list") == std::optional<Value>{Sequence{1}});
    }
}

TEST_CASE("Scratch map aggregation") {
    Scratch scratch;

    SUBCASE("values come back ordered by map key") {
        CHECK(scratch.setInMap("grp", "b", 2) == std::nullopt);
        CHECK(scratch.setInMap("grp", "a", 1) == std::nullopt);
        auto sorted = scratch.getSortedMapValues("grp");
        REQUIRE(sorted.has_value());
        REQUIRE(sorted->has_value());
        CHECK(**sorted == Sequence{1, 2});
    }

    SUBCASE("later writes to a map key overwrite earlier ones") {
        CHECK(scratch.setInMap("grp", "a", 1) == std::nullopt);
        CHECK(scratch.setInMap("grp", "a", "again") == std::nullopt);
        auto sorted = scratch.getSortedMapValues("grp");
        REQUIRE(sorted.has_value());
        REQUIRE(sorted->has_value());
        CHECK(**sorted == Sequence{"again"});
    }

    SUBCASE("ordering is deterministic across calls") {
        for (auto const* key : {"delta", "alpha", "charlie", "bravo", "echo"})
            CHECK(scratch.setInMap("letters", key, key) == std::nullopt);
        auto first  = scratch.getSortedMapValues("letters");
        auto second = scratch.getSortedMapValues("letters");
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        CHECK(**first == Sequence{"alpha", "bravo", "charlie", "delta", "echo"});
        CHECK(**first == **second);
    }

    SUBCASE("absent key reads as absent without error") {
        auto sorted = scratch.getSortedMapValues("missing");
        REQUIRE(sorted.has_value());
        CHECK_FALSE(sorted->has_value());
    }

    SUBCASE("the mapping itself is visible through get") {
        CHECK(scratch.setInMap("grp", "a", 1) == std::nullopt);
        auto value = scratch.get("grp");
        REQUIRE(value.has_value());
        REQUIRE(value->asMapping() != nullptr);
        CHECK(value->asMapping()->size() == 1);
    }
}

TEST_CASE("Scratch rejects mixing mappings with other shapes") {
    Scratch scratch;

    SUBCASE("setInMap onto a scalar") {
        scratch.set("k", 5);
        auto error = scratch.setInMap("k", "a", 1);
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::TypeMismatch);
        CHECK(scratch.get("k") == std::optional<Value>{5});
    }

    SUBCASE("setInMap onto a sequence") {
        scratch.set("k", Sequence{1});
        auto error = scratch.setInMap("k", "a", 1);
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::TypeMismatch);
    }

    SUBCASE("add onto a mapping") {
        CHECK(scratch.setInMap("grp", "a", 1) == std::nullopt);
        auto error = scratch.add("grp", 1);
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::TypeMismatch);
        auto sorted = scratch.getSortedMapValues("grp");
        REQUIRE(sorted.has_value());
        CHECK(**sorted == Sequence{1});
    }

    SUBCASE("add a mapping onto a scalar") {
        scratch.set("n", 1);
        auto error = scratch.add("n", Mapping{});
        REQUIRE(error.has_value());
        CHECK(error->code == Error::Code::TypeMismatch);
        CHECK(scratch.get("n") == std::optional<Value>{1});
    }

    SUBCASE("a mapping appended to a sequence is a plain element") {
        scratch.set("list", Sequence{});
        CHECK_FALSE(scratch.add("list", Mapping{}).has_value());
        auto value = scratch.get("list");
        REQUIRE(value.has_value());
        REQUIRE(value->asSequence() != nullptr);
        REQUIRE(value->asSequence()->size() == 1);
        CHECK(value->asSequence()->front().isMapping());
    }

    SUBCASE("sorted map values of a non-mapping") {
        scratch.set("k", "text");
        auto sorted = scratch.getSortedMapValues("k");
        REQUIRE_FALSE(sorted.has_value());
        CHECK(sorted.error().code == Error::Code::TypeMismatch);
    }
}

TEST_CASE("makeScratch returns independent empty stores") {
    auto first  = makeScratch();
    auto second = makeScratch();
    REQUIRE(first != nullptr);
    REQUIRE(second != nullptr);
    CHECK(first.get() != second.get());

    first->set("k", 1);
    CHECK(first->contains("k"));
    CHECK_FALSE(second->contains("k"));
    CHECK(second->size() == 0);
}

}
