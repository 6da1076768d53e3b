// tests/codec/test_tagged_enum.cpp
#define BOOST_TEST_MODULE TaggedEnumTests
#include <boost/test/unit_test.hpp>

#include <exception>
#include <string>
#include <vector>

#include "cart_types.hpp"
#include "enumtag/codec/tagged_enum.hpp"

namespace calc {

struct Expression {
    virtual ~Expression() = default;
    virtual int eval() const = 0;
    virtual std::string str() const = 0;
};

// Recursive enum: its Add and Sub variants hold Expr operands
struct Expr {
    enumtag::VariantSlot<Expression> value;

    static enumtag::codec::EnumDescription describe();
};

struct Num : Expression {
    int value = 0;

    int eval() const override { return value; }
    std::string str() const override { return std::to_string(value); }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Num, value)

struct Add : Expression {
    Expr left;
    Expr right;

    int eval() const override {
        return left.value->eval() + right.value->eval();
    }
    std::string str() const override {
        return "(" + left.value->str() + " + " + right.value->str() + ")";
    }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Add, left, right)

struct Sub : Expression {
    Expr left;
    Expr right;

    int eval() const override {
        return left.value->eval() - right.value->eval();
    }
    std::string str() const override {
        return "(" + left.value->str() + " - " + right.value->str() + ")";
    }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Sub, left, right)

enumtag::codec::EnumDescription Expr::describe() {
    return enumtag::codec::describe<Expr>()
        .value_slot(&Expr::value)
        .variants("op")
        .variant<Num>("num")
        .variant<Add>("add")
        .variant<Sub>("sub");
}

Expr num(int n) {
    Num value;
    value.value = n;
    return Expr{value};
}

}  // namespace calc

namespace {

struct Broken {
    enumtag::VariantSlot<cart::Event> value;

    static enumtag::codec::EnumDescription describe() {
        return enumtag::codec::describe<Broken>()
            .variants("type")
            .variant<cart::Checkout>("checkout");
    }
};

struct Cart {
    std::string owner;
    std::vector<cart::ShoppingCartEvent> events;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Cart, owner, events)

}  // namespace

BOOST_AUTO_TEST_SUITE(ShoppingCartTests)

BOOST_AUTO_TEST_CASE(test_unmarshal_checkout) {
    cart::ShoppingCartEvent event;
    enumtag::unmarshal_json(R"({"type":"checkout"})", &event);
    BOOST_CHECK(event.value.holds<cart::Checkout>());
}

BOOST_AUTO_TEST_CASE(test_unmarshal_item_added) {
    cart::ShoppingCartEvent event;
    enumtag::unmarshal_json(
        R"({"type":"item_added","value":{"item_id":"xyz","quantity":5}})",
        &event);
    const auto *added = event.value.get_if<cart::ItemAdded>();
    BOOST_REQUIRE(added != nullptr);
    BOOST_CHECK_EQUAL(added->item_id, "xyz");
    BOOST_CHECK_EQUAL(added->quantity, 5);
}

BOOST_AUTO_TEST_CASE(test_unmarshal_unknown_tag) {
    cart::ShoppingCartEvent event;
    try {
        enumtag::unmarshal_json(R"({"type":"bogus"})", &event);
        BOOST_FAIL("expected UnknownTagException");
    } catch (const enumtag::codec::UnknownTagException &e) {
        BOOST_CHECK(std::string(e.what()).find("bogus") != std::string::npos);
    }
    BOOST_CHECK(!event.value.has_value());
}

BOOST_AUTO_TEST_CASE(test_unmarshal_null_destination) {
    BOOST_CHECK_THROW(enumtag::unmarshal_json<cart::ShoppingCartEvent>(
                          R"({"type":"checkout"})", nullptr),
                      enumtag::codec::InvalidTargetException);
}

BOOST_AUTO_TEST_CASE(test_marshal_round_trip) {
    const std::vector<std::string> inputs{
        R"({"type":"item_added","value":{"item_id":"xyz","quantity":5}})",
        R"({"type":"item_removed","value":{"item_id":"xyz"}})",
        R"({"type":"checkout","value":{}})",
    };
    for (const auto &input : inputs) {
        cart::ShoppingCartEvent event;
        enumtag::unmarshal_json(input, &event);
        const std::string output = enumtag::marshal_json(event);
        BOOST_CHECK_EQUAL(output, input);
        BOOST_CHECK(nlohmann::json::parse(output) ==
                    nlohmann::json::parse(input));
    }
}

BOOST_AUTO_TEST_CASE(test_marshal_tag_first) {
    cart::ShoppingCartEvent event{cart::ItemAdded("abc", 2)};
    const std::string output = enumtag::marshal_json(event);
    BOOST_CHECK_EQUAL(output.find(R"("type")"), 1u);
    BOOST_CHECK(output.find(R"("type")") < output.find(R"("value")"));
}

BOOST_AUTO_TEST_CASE(test_embedded_round_trip) {
    cart::Letters letters;
    enumtag::unmarshal_json(R"({"type":"abc","A":"foo","B":"bar","C":"qux"})",
                            &letters);
    BOOST_CHECK_EQUAL(enumtag::marshal_json(letters),
                      R"({"type":"abc","A":"foo","B":"bar","C":"qux"})");
}

BOOST_AUTO_TEST_CASE(test_marshal_untagged) {
    cart::ShoppingCartEvent event;
    BOOST_CHECK_THROW(enumtag::marshal_json(event),
                      enumtag::codec::UntaggedVariantException);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonIntegrationTests)

BOOST_AUTO_TEST_CASE(test_enum_inside_plain_json) {
    cart::ShoppingCartEvent event{cart::ItemAdded("xyz", 5)};
    nlohmann::json j = event;
    BOOST_CHECK_EQUAL(j["type"].get<std::string>(), "item_added");
    BOOST_CHECK_EQUAL(j["value"]["quantity"].get<int>(), 5);

    auto decoded = j.get<cart::ShoppingCartEvent>();
    BOOST_REQUIRE(decoded.value.holds<cart::ItemAdded>());
    BOOST_CHECK_EQUAL(decoded.value.get<cart::ItemAdded>().item_id, "xyz");
}

BOOST_AUTO_TEST_CASE(test_enum_as_struct_field) {
    Cart cart_value;
    cart_value.owner = "alice";
    cart_value.events.emplace_back(cart::ShoppingCartEvent{cart::ItemAdded("xyz", 1)});
    cart_value.events.emplace_back(cart::ShoppingCartEvent{cart::Checkout{}});

    nlohmann::json j = cart_value;
    BOOST_CHECK_EQUAL(j.dump(),
                      R"({"events":[{"type":"item_added","value":{"item_id":"xyz","quantity":1}},{"type":"checkout","value":{}}],"owner":"alice"})");

    auto decoded = j.get<Cart>();
    BOOST_CHECK_EQUAL(decoded.owner, "alice");
    BOOST_REQUIRE_EQUAL(decoded.events.size(), 2u);
    BOOST_CHECK(decoded.events[0].value.holds<cart::ItemAdded>());
    BOOST_CHECK(decoded.events[1].value.holds<cart::Checkout>());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(RecursiveEnumTests)

BOOST_AUTO_TEST_CASE(test_decode_expression_tree) {
    const std::string input =
        R"({"op":"add","left":{"op":"num","value":3},)"
        R"("right":{"op":"sub","left":{"op":"num","value":5},)"
        R"("right":{"op":"num","value":2}}})";

    calc::Expr expr;
    enumtag::unmarshal_json(input, &expr);
    BOOST_REQUIRE(expr.value.holds<calc::Add>());
    BOOST_CHECK_EQUAL(expr.value->str(), "(3 + (5 - 2))");
    BOOST_CHECK_EQUAL(expr.value->eval(), 6);
    BOOST_CHECK_EQUAL(enumtag::marshal_json(expr), input);
}

BOOST_AUTO_TEST_CASE(test_encode_expression_tree) {
    calc::Sub sub;
    sub.left = calc::num(10);
    sub.right = calc::num(4);
    calc::Expr expr{sub};

    BOOST_CHECK_EQUAL(
        enumtag::marshal_json(expr),
        R"({"op":"sub","left":{"op":"num","value":10},"right":{"op":"num","value":4}})");
}

BOOST_AUTO_TEST_CASE(test_nested_unknown_tag) {
    calc::Expr expr;
    try {
        enumtag::unmarshal_json(
            R"({"op":"add","left":{"op":"mul"},"right":{"op":"num","value":1}})",
            &expr);
        BOOST_FAIL("expected VariantDecodeException");
    } catch (const enumtag::codec::VariantDecodeException &e) {
        BOOST_CHECK_EQUAL(e.variant_type(), "calc::Add");
        BOOST_CHECK_THROW(std::rethrow_if_nested(e),
                          enumtag::codec::UnknownTagException);
    }
    BOOST_CHECK(!expr.value.has_value());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ValidateTests)

BOOST_AUTO_TEST_CASE(test_validate_well_formed) {
    BOOST_CHECK_NO_THROW(enumtag::validate<cart::ShoppingCartEvent>());
    BOOST_CHECK_NO_THROW(enumtag::validate<cart::Letters>());
    BOOST_CHECK_NO_THROW(enumtag::validate<calc::Expr>());
}

BOOST_AUTO_TEST_CASE(test_validate_leaves_cache_untouched) {
    auto &registry = enumtag::codec::SchemaRegistry::instance();
    registry.configure(enumtag::codec::CodecConfig{});
    registry.clear();

    BOOST_CHECK_NO_THROW(enumtag::validate<cart::ShoppingCartEvent>());
    BOOST_CHECK_EQUAL(registry.cached_count(), 0u);

    enumtag::marshal_json(cart::ShoppingCartEvent{cart::Checkout{}});
    BOOST_CHECK_EQUAL(registry.cached_count(), 1u);
    registry.clear();
}

BOOST_AUTO_TEST_CASE(test_validate_malformed) {
    BOOST_CHECK_THROW(enumtag::validate<Broken>(),
                      enumtag::codec::MalformedSchemaException);

    Broken broken{cart::Checkout{}};
    BOOST_CHECK_THROW(enumtag::marshal_json(broken),
                      enumtag::codec::MalformedSchemaException);
    BOOST_CHECK_THROW(enumtag::unmarshal_json(R"({"type":"checkout"})", &broken),
                      enumtag::codec::MalformedSchemaException);
}

BOOST_AUTO_TEST_SUITE_END()
