#include <exception>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "enumtag/codec/tagged_enum.hpp"
#include "enumtag/config/config.hpp"
#include "enumtag/log/logger.hpp"

// Capability shared by every shopping cart event
struct CartEvent {
    virtual ~CartEvent() = default;
    virtual void apply(std::vector<std::string>& cart) const = 0;
};

struct ItemAdded : CartEvent {
    std::string item_id;
    int quantity = 0;

    void apply(std::vector<std::string>& cart) const override {
        for (int i = 0; i < quantity; ++i) {
            cart.push_back(item_id);
        }
    }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ItemAdded, item_id, quantity)

struct Checkout : CartEvent {
    void apply(std::vector<std::string>& cart) const override {
        std::cout << "Checking out " << cart.size() << " items" << std::endl;
        cart.clear();
    }
};

template <typename BasicJsonType>
void to_json(BasicJsonType& j, const Checkout&) {
    j = BasicJsonType::object();
}

template <typename BasicJsonType>
void from_json(const BasicJsonType&, Checkout&) {}

struct ShoppingCartEvent {
    enumtag::VariantSlot<CartEvent> value;

    static enumtag::codec::EnumDescription describe() {
        return enumtag::codec::describe<ShoppingCartEvent>()
            .value_slot(&ShoppingCartEvent::value, "value")
            .variants("type")
            .inline_variant<ItemAdded>("item_added")
            .variant<Checkout>("checkout");
    }
};

// Prints an error and every nested cause, outermost first
void print_error(const std::exception& e, int depth = 0) {
    std::cerr << std::string(depth * 2, ' ') << e.what() << std::endl;
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& cause) {
        print_error(cause, depth + 1);
    }
}

int main(int argc, char* argv[]) {
    using namespace enumtag;

    auto log_config = std::make_shared<log::LogConfig>();
    log::Logger::init(*log_config);

    std::cout << "=== Shopping Cart Event Demo ===" << std::endl;

    try {
        // Optional config file with "log" and "enumtag" sections
        auto& config_manager = config::ConfigManager::instance();
        config_manager.register_configuration_properties(log_config);
        config_manager.register_configuration_properties(
            std::make_shared<codec::CodecConfig>());
        if (argc > 1) {
            config_manager.load_config(argv[1]);
        }

        auto& registry = codec::SchemaRegistry::instance();
        registry.bind(config_manager);
        registry.register_enum<ShoppingCartEvent>();
        registry.validate_all();

        const std::vector<std::string> stream{
            R"({"type":"item_added","value":{"item_id":"xyz","quantity":2}})",
            R"({"type":"item_added","value":{"item_id":"abc","quantity":1}})",
            R"({"type":"refund"})",
            R"({"type":"item_added","value":{"item_id":"abc","quantity":"x"}})",
            R"({"type":"checkout"})",
        };

        std::vector<std::string> cart;
        for (const auto& input : stream) {
            ShoppingCartEvent event;
            try {
                unmarshal_json(input, &event);
            } catch (const codec::EnumTagException& e) {
                std::cerr << "Skipping event " << input << ":" << std::endl;
                print_error(e, 1);
                continue;
            }

            event.value->apply(cart);
            std::cout << "Applied " << marshal_json(event) << ", cart has "
                      << cart.size() << " items" << std::endl;
        }
    } catch (const std::exception& e) {
        print_error(e);
        log::Logger::shutdown();
        return 1;
    }

    log::Logger::shutdown();
    return 0;
}
