#include <catch2/catch_test_macros.hpp>

#include <syncdl/types/error_type.h>
#include <syncdl/types/response_path.h>
#include <syncdl/types/value.h>

#include <fmt/format.h>

#include <stdexcept>
#include <variant>

TEST_CASE("Objects keep insertion order", "[value]") {
    using namespace syncdl;
    Object object{{"z", 1}, {"a", 2}};
    object.insert_or_assign("m", 3);
    object.insert_or_assign("z", 4);

    REQUIRE(object.keys() == std::vector<std::string>{"z", "a", "m"});
    REQUIRE(object.at("z") == Value{4});
    REQUIRE(object.erase("a"));
    REQUIRE_FALSE(object.erase("a"));
    REQUIRE_FALSE(object.contains("a"));
    REQUIRE_THROWS_AS(object.at("a"), std::out_of_range);
}

TEST_CASE("Values report their kind and render as JSON", "[value]") {
    using namespace syncdl;
    Value value{Object{{"name", "Ada \"the\" first"},
                       {"age", 36},
                       {"score", 1.5},
                       {"tags", List{"x", true, nullptr}},
                       {"nested", Object{}}}};

    REQUIRE(value.is_object());
    REQUIRE(value.get("age")->is_int());
    REQUIRE(value.get("age")->as_float() == 36.0);
    REQUIRE(value.get("missing") == nullptr);
    REQUIRE(Value{}.get("anything") == nullptr);
    REQUIRE(value.to_string() ==
            R"({"name":"Ada \"the\" first","age":36,"score":1.5,"tags":["x",true,null],"nested":{}})");
    REQUIRE(fmt::format("{}", Value{List{1, 2}}) == "[1,2]");
    REQUIRE(to_string(Value::Kind::LIST) == "List");
}

TEST_CASE("Value equality compares kind and content", "[value]") {
    using namespace syncdl;
    REQUIRE(Value{1} == Value{std::int64_t{1}});
    REQUIRE_FALSE(Value{1} == Value{1.0});
    REQUIRE(Value{} == Value{null});
    REQUIRE(Value{Object{{"a", 1}, {"b", 2}}} == Value{Object{{"a", 1}, {"b", 2}}});
    REQUIRE_FALSE(Value{Object{{"a", 1}, {"b", 2}}} == Value{Object{{"b", 2}, {"a", 1}}});
    REQUIRE_THROWS_AS(Value{"text"}.as_int(), std::bad_variant_access);
}

TEST_CASE("Response paths render keys and indices", "[value]") {
    using namespace syncdl;
    ResponsePath root;
    auto path = root.add_key("users", "Query").add_index(0).add_key("name", "User");

    REQUIRE(root.empty());
    REQUIRE(path.depth() == 3);
    REQUIRE(path.to_string() == "users[0].name");
    REQUIRE(path.type_name() == "User");
    REQUIRE(path.parent().to_string() == "users[0]");
    REQUIRE(std::get<std::size_t>(path.parent().key()) == 0);
    REQUIRE(path.as_list() == std::vector<PathElement>{std::string{"users"}, std::size_t{0}, std::string{"name"}});
    REQUIRE(path == ResponsePath{}.add_key("users").add_index(0).add_key("name"));
}

TEST_CASE("Located errors keep the path they were first raised at", "[value]") {
    using namespace syncdl;
    auto inner = ResponsePath{}.add_key("user").add_key("nickname");
    auto raw = std::make_exception_ptr(std::runtime_error("no nickname"));

    auto located = LocatedError::locate(raw, inner);
    REQUIRE(located.message() == "no nickname");
    REQUIRE(std::string{located.what()} == "no nickname (at user.nickname)");
    REQUIRE(located.original_error() == raw);

    auto relocated = LocatedError::locate(std::make_exception_ptr(located), ResponsePath{}.add_key("user"));
    REQUIRE(relocated.path() == inner);
    REQUIRE(relocated.to_value().to_string() == R"({"message":"no nickname","path":["user","nickname"]})");

    auto unknown = LocatedError::locate(std::make_exception_ptr(42), inner);
    REQUIRE_FALSE(unknown.message().empty());
}

TEST_CASE("Execution results omit errors when there are none", "[value]") {
    using namespace syncdl;
    ExecutionResult result{Value{Object{{"x", 1}}}, {}};
    REQUIRE_FALSE(result.has_errors());
    REQUIRE(result.to_value().to_string() == R"({"data":{"x":1}})");
}
