#include <exception>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>

#include "enumtag/codec/tagged_enum.hpp"
#include "enumtag/log/logger.hpp"

struct Node {
    virtual ~Node() = default;
    virtual double eval() const = 0;
    virtual std::string str() const = 0;
};

// Tagged enum whose binary variants hold further Exprs. Variants are
// embedded, so an expression reads {"op": "add", "left": ..., "right": ...}.
struct Expr {
    enumtag::VariantSlot<Node> value;

    static enumtag::codec::EnumDescription describe();
};

struct Literal : Node {
    double value = 0;

    double eval() const override { return value; }
    std::string str() const override {
        std::string text = std::to_string(value);
        text.erase(text.find_last_not_of('0') + 1);
        if (text.back() == '.') {
            text.pop_back();
        }
        return text;
    }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Literal, value)

struct Binary : Node {
    Expr left;
    Expr right;

    std::string format(const char* op) const {
        return "(" + left.value->str() + " " + op + " " + right.value->str() +
               ")";
    }
};

struct Add : Binary {
    double eval() const override {
        return left.value->eval() + right.value->eval();
    }
    std::string str() const override { return format("+"); }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Add, left, right)

struct Sub : Binary {
    double eval() const override {
        return left.value->eval() - right.value->eval();
    }
    std::string str() const override { return format("-"); }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Sub, left, right)

struct Mul : Binary {
    double eval() const override {
        return left.value->eval() * right.value->eval();
    }
    std::string str() const override { return format("*"); }
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Mul, left, right)

enumtag::codec::EnumDescription Expr::describe() {
    return enumtag::codec::describe<Expr>()
        .value_slot(&Expr::value)
        .variants("op")
        .variant<Literal>("lit")
        .variant<Add>("add")
        .variant<Sub>("sub")
        .variant<Mul>("mul");
}

int main(int argc, char* argv[]) {
    enumtag::log::LogConfig log_config;
    log_config.global_level = enumtag::log::LogConfig::LogLevel::WARN;
    enumtag::log::Logger::init(log_config);

    const std::string input =
        argc > 1 ? argv[1]
                 : R"({"op":"add","left":{"op":"lit","value":3},)"
                   R"("right":{"op":"sub","left":{"op":"lit","value":5},)"
                   R"("right":{"op":"lit","value":2}}})";

    int status = 0;
    try {
        Expr expr;
        enumtag::unmarshal_json(input, &expr);
        std::cout << expr.value->str() << " = " << expr.value->eval()
                  << std::endl;

        // Build (expr * 2) and encode it back
        Mul doubled;
        doubled.left = expr;
        Literal two;
        two.value = 2;
        doubled.right = Expr{two};
        Expr product{doubled};

        nlohmann::json document = product;
        std::cout << document.dump(2) << std::endl;
        std::cout << product.value->str() << " = " << product.value->eval()
                  << std::endl;
    } catch (const enumtag::codec::EnumTagException& e) {
        std::cerr << e.what() << std::endl;
        try {
            std::rethrow_if_nested(e);
        } catch (const std::exception& cause) {
            std::cerr << "  caused by: " << cause.what() << std::endl;
        }
        status = 1;
    }

    enumtag::log::Logger::shutdown();
    return status;
}
