#include <catch2/catch_test_macros.hpp>

#include <reactree/types/array.h>
#include <reactree/types/object.h>
#include <reactree/util/errors.h>

#include <cmath>
#include <limits>

TEST_CASE("Value - primitive behaviour", "[types][value]") {
    using namespace reactree;

    Value v1{1};
    REQUIRE(v1.is_int());
    REQUIRE(v1.is_number());
    REQUIRE_FALSE(v1.is_reference());
    REQUIRE(v1.as_int() == 1);
    REQUIRE(v1.as_number() == 1.0);
    REQUIRE_THROWS_AS(v1.as_string(), bad_value_access);

    REQUIRE(Value{}.is_undefined());
    REQUIRE(Value{nullptr}.is_null());
    REQUIRE(Value{"text"}.as_string() == "text");
    REQUIRE(Value{2.5}.as_double() == 2.5);
}

TEST_CASE("Value - truthiness", "[types][value]") {
    using namespace reactree;

    REQUIRE_FALSE(Value{}.truthy());
    REQUIRE_FALSE(Value{nullptr}.truthy());
    REQUIRE_FALSE(Value{false}.truthy());
    REQUIRE_FALSE(Value{0}.truthy());
    REQUIRE_FALSE(Value{std::numeric_limits<double>::quiet_NaN()}.truthy());
    REQUIRE_FALSE(Value{""}.truthy());
    REQUIRE(Value{"a"}.truthy());
    REQUIRE(Value{Object::make()}.truthy());
    REQUIRE(Value{Array::make()}.truthy());
}

TEST_CASE("Value - objects and arrays compare by identity", "[types][value]") {
    using namespace reactree;

    auto a = Object::make({{"x", 1}});
    auto b = Object::make({{"x", 1}});
    REQUIRE(same_value(Value{a}, Value{a}));
    REQUIRE_FALSE(same_value(Value{a}, Value{b}));

    // Different types are never the same value
    REQUIRE_FALSE(same_value(Value{1}, Value{1.0}));
    REQUIRE_FALSE(same_value(Value{}, Value{nullptr}));

    auto nan = std::numeric_limits<double>::quiet_NaN();
    REQUIRE(same_value(Value{nan}, Value{nan}));
}

TEST_CASE("Value - a null shared pointer is the null value", "[types][value]") {
    using namespace reactree;

    REQUIRE(Value{object_s_ptr{}}.is_null());
    REQUIRE(Value{array_s_ptr{}}.is_null());
}

TEST_CASE("Value - diagnostic rendering", "[types][value]") {
    using namespace reactree;

    auto nested = Object::make({{"name", "n"}, {"items", Array::make({1, "two"})}});
    REQUIRE(Value{nested}.to_string() == R"({name: "n", items: [1, "two"]})");
    REQUIRE(Value{nested}.to_string(0) == "{...}");
}

TEST_CASE("Object - plain property bag", "[types][object]") {
    using namespace reactree;

    auto object = Object::make({{"b", 1}, {"a", 2}});
    REQUIRE(object->keys() == std::vector<std::string>{"b", "a"});
    REQUIRE(object->get("missing").is_undefined());

    object->put("c", 3);
    REQUIRE(object->size() == 3);
    REQUIRE(object->remove("b"));
    REQUIRE_FALSE(object->remove("b"));
    REQUIRE(object->keys() == std::vector<std::string>{"a", "c"});
    REQUIRE(object->get("c").as_int() == 3);
    REQUIRE(Value{object}.to_string() == "{a: 2, c: 3}");

    object->freeze();
    object->put("d", 4);
    REQUIRE_FALSE(object->has("d"));
}
