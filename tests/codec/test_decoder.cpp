// tests/codec/test_decoder.cpp
#define BOOST_TEST_MODULE DecoderTests
#include <boost/test/unit_test.hpp>

#include <exception>
#include <string>
#include <vector>

#include "cart_types.hpp"
#include "enumtag/codec/decoder.hpp"
#include "enumtag/codec/schema_introspector.hpp"

using namespace enumtag::codec;

namespace {

struct Anything {
    VariantSlot<> value;
};

EnumSchema anything_schema() {
    return SchemaIntrospector::derive(
        describe<Anything>()
            .value_slot(&Anything::value, "value")
            .variants("type")
            .variant<std::string>("string")
            .variant<int>("int")
            .variant<std::vector<std::string>>("Vector", "vec"));
}

// Returns the message of the exception nested inside `e`, or an empty string
std::string nested_message(const std::exception &e) {
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception &cause) {
        return cause.what();
    }
    return {};
}

}  // namespace

BOOST_AUTO_TEST_SUITE(NestedDecodeTests)

BOOST_AUTO_TEST_CASE(test_decode_primitive_variants) {
    const auto schema = anything_schema();
    Decoder decoder(schema);
    Anything target;

    decoder.decode(R"({"type":"string","value":"hello"})", &target);
    BOOST_REQUIRE(target.value.holds<std::string>());
    BOOST_CHECK_EQUAL(target.value.get<std::string>(), "hello");

    decoder.decode(R"({"type":"int","value":42})", &target);
    BOOST_REQUIRE(target.value.holds<int>());
    BOOST_CHECK_EQUAL(target.value.get<int>(), 42);

    decoder.decode(R"({"value":["a","b"],"type":"vec"})", &target);
    const auto *names = target.value.get_if<std::vector<std::string>>();
    BOOST_REQUIRE(names != nullptr);
    BOOST_REQUIRE_EQUAL(names->size(), 2u);
    BOOST_CHECK_EQUAL((*names)[0], "a");
    BOOST_CHECK_EQUAL((*names)[1], "b");
}

BOOST_AUTO_TEST_CASE(test_decode_struct_variant) {
    const auto schema = SchemaIntrospector::derive(cart::ShoppingCartEvent::describe());
    Decoder decoder(schema);
    cart::ShoppingCartEvent event;

    decoder.decode(
        R"({"type":"item_added","value":{"item_id":"xyz","quantity":5}})",
        &event);
    const auto *added = event.value.get_if<cart::ItemAdded>();
    BOOST_REQUIRE(added != nullptr);
    BOOST_CHECK_EQUAL(added->item_id, "xyz");
    BOOST_CHECK_EQUAL(added->quantity, 5);
    BOOST_CHECK_EQUAL(event.value->describe_event(), "added 5 x xyz");
}

BOOST_AUTO_TEST_CASE(test_absent_value_yields_zero_value) {
    const auto schema = SchemaIntrospector::derive(cart::ShoppingCartEvent::describe());
    cart::ShoppingCartEvent event;

    Decoder(schema).decode(R"({"type":"checkout"})", &event);
    BOOST_CHECK(event.value.holds<cart::Checkout>());
    BOOST_CHECK_EQUAL((*event.value).describe_event(), "checkout");
}

BOOST_AUTO_TEST_CASE(test_null_value_yields_zero_value) {
    const auto schema = SchemaIntrospector::derive(cart::ShoppingCartEvent::describe());
    cart::ShoppingCartEvent event;

    Decoder(schema).decode(R"({"type":"item_added","value":null})", &event);
    const auto *added = event.value.get_if<cart::ItemAdded>();
    BOOST_REQUIRE(added != nullptr);
    BOOST_CHECK(added->item_id.empty());
    BOOST_CHECK_EQUAL(added->quantity, 0);
}

BOOST_AUTO_TEST_CASE(test_decode_from_document) {
    const auto schema = SchemaIntrospector::derive(cart::ShoppingCartEvent::describe());
    cart::ShoppingCartEvent event;

    Json document = {{"type", "item_removed"},
                     {"value", {{"item_id", "abc"}}}};
    Decoder(schema).decode_document(document, &event);
    BOOST_REQUIRE(event.value.holds<cart::ItemRemoved>());
    BOOST_CHECK_EQUAL(event.value.get<cart::ItemRemoved>().item_id, "abc");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(EmbeddedDecodeTests)

BOOST_AUTO_TEST_CASE(test_decode_embedded_variants) {
    const auto schema = SchemaIntrospector::derive(cart::Letters::describe());
    Decoder decoder(schema);
    cart::Letters letters;

    decoder.decode(R"({"type":"abc","A":"foo","B":"bar","C":"qux"})", &letters);
    const auto *abc = letters.value.get_if<cart::ABC>();
    BOOST_REQUIRE(abc != nullptr);
    BOOST_CHECK_EQUAL(abc->A, "foo");
    BOOST_CHECK_EQUAL(abc->B, "bar");
    BOOST_CHECK_EQUAL(abc->C, "qux");

    decoder.decode(R"({"D":"1","type":"def","E":"2"})", &letters);
    const auto *def = letters.value.get_if<cart::DEF>();
    BOOST_REQUIRE(def != nullptr);
    BOOST_CHECK_EQUAL(def->D, "1");
    BOOST_CHECK_EQUAL(def->E, "2");
    BOOST_CHECK(def->F.empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(DecodeErrorTests)

BOOST_AUTO_TEST_CASE(test_unknown_tag_leaves_destination_untouched) {
    const auto schema = SchemaIntrospector::derive(cart::ShoppingCartEvent::describe());
    cart::ShoppingCartEvent event{cart::Checkout{}};

    try {
        Decoder(schema).decode(R"({"type":"bogus"})", &event);
        BOOST_FAIL("expected UnknownTagException");
    } catch (const UnknownTagException &e) {
        BOOST_CHECK_EQUAL(e.tag(), "bogus");
        BOOST_CHECK_EQUAL(error_code_name(e.code()), "UnknownTag");
        BOOST_CHECK_EQUAL(e.enum_name(), "cart::ShoppingCartEvent");
        BOOST_CHECK(std::string(e.what()).find("\"bogus\"") !=
                    std::string::npos);
    }
    BOOST_CHECK(event.value.holds<cart::Checkout>());
}

BOOST_AUTO_TEST_CASE(test_bad_value_keeps_cause) {
    const auto schema = SchemaIntrospector::derive(cart::ShoppingCartEvent::describe());
    cart::ShoppingCartEvent event{cart::Checkout{}};

    try {
        Decoder(schema).decode(
            R"({"type":"item_added","value":{"item_id":"xyz","quantity":"five"}})",
            &event);
        BOOST_FAIL("expected VariantDecodeException");
    } catch (const VariantDecodeException &e) {
        BOOST_CHECK_EQUAL(e.variant_type(), "cart::ItemAdded");
        BOOST_CHECK(e.code() == ErrorCode::VARIANT_DECODE_FAILED);
        BOOST_CHECK(!nested_message(e).empty());
        BOOST_CHECK(std::string(e.what()).find(nested_message(e)) !=
                    std::string::npos);
    }
    BOOST_CHECK(event.value.holds<cart::Checkout>());
}

BOOST_AUTO_TEST_CASE(test_bad_embedded_value) {
    const auto schema = SchemaIntrospector::derive(cart::Letters::describe());
    cart::Letters letters;

    BOOST_CHECK_THROW(
        Decoder(schema).decode(R"({"type":"abc","A":17})", &letters),
        VariantDecodeException);
    BOOST_CHECK(!letters.value.has_value());
}

BOOST_AUTO_TEST_CASE(test_invalid_json) {
    const auto schema = anything_schema();
    Anything target;

    try {
        Decoder(schema).decode(R"({"type":)", &target);
        BOOST_FAIL("expected TagExtractionException");
    } catch (const TagExtractionException &e) {
        BOOST_CHECK_EQUAL(e.tag_field(), "type");
        BOOST_CHECK(!nested_message(e).empty());
    }
}

BOOST_AUTO_TEST_CASE(test_malformed_envelopes) {
    const auto schema = anything_schema();
    Decoder decoder(schema);
    Anything target;

    const std::vector<std::string> inputs{
        R"(["type","int"])",
        R"("int")",
        R"({"value":1})",
        R"({"type":3,"value":1})",
        R"({"type":null})",
    };
    for (const auto &input : inputs) {
        BOOST_TEST_CONTEXT("input " << input) {
            BOOST_CHECK_THROW(decoder.decode(input, &target),
                              TagExtractionException);
        }
    }
    BOOST_CHECK(!target.value.has_value());
}

BOOST_AUTO_TEST_CASE(test_missing_tag_message) {
    const auto schema = anything_schema();
    Anything target;

    try {
        Decoder(schema).decode(R"({"value":1})", &target);
        BOOST_FAIL("expected TagExtractionException");
    } catch (const TagExtractionException &e) {
        BOOST_CHECK_EQUAL(std::string(e.what()),
                          "enumtag: unmarshaling enum tag from field \"type\": "
                          "field is missing");
    }
}

BOOST_AUTO_TEST_CASE(test_tag_is_case_sensitive) {
    const auto schema = anything_schema();
    Anything target;
    BOOST_CHECK_THROW(Decoder(schema).decode(R"({"type":"INT","value":1})",
                                             &target),
                      UnknownTagException);
}

BOOST_AUTO_TEST_CASE(test_null_destination) {
    const auto schema = anything_schema();
    BOOST_CHECK_THROW(
        Decoder(schema).decode(R"({"type":"int","value":1})", nullptr),
        InvalidTargetException);
    BOOST_CHECK_THROW(Decoder(schema).decode_document(Json::object(), nullptr),
                      InvalidTargetException);
}

BOOST_AUTO_TEST_SUITE_END()
