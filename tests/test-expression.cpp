#include "piperpc/errors.hpp"
#include "piperpc/expression.hpp"

#include <cmath>
#include <cstdio>
#include <string>

#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

static std::string rejection(const std::string & expression) {
    try {
        piperpc::evaluate_expression(expression);
    } catch (const piperpc::InvalidExpression & e) {
        return e.what();
    }
    return "";
}

void test_arithmetic() {
    assert(near(piperpc::evaluate_expression("2 + 2"), 4));
    assert(near(piperpc::evaluate_expression("10 + 5 * 2"), 20));
    assert(near(piperpc::evaluate_expression("(10 + 5) * 2"), 30));
    assert(near(piperpc::evaluate_expression("10 / 4"), 2.5));
    assert(near(piperpc::evaluate_expression("8 - 3 - 2"), 3));
    assert(near(piperpc::evaluate_expression("16 / 4 / 2"), 2));
    assert(near(piperpc::evaluate_expression("-3 + 5"), 2));
    assert(near(piperpc::evaluate_expression("-(2 + 3) * -2"), 10));
    assert(near(piperpc::evaluate_expression("+.5 + 1."), 1.5));
    assert(near(piperpc::evaluate_expression("  ((7))  "), 7));
    assert(near(piperpc::evaluate_expression("0.1 + 0.2"), 0.3));
}

void test_rejections() {
    assert(rejection("") == "empty expression");
    assert(rejection("   ") == "empty expression");
    assert(rejection("10 / 0") == "division by zero at position 3");
    assert(rejection("1 / (2 - 2)") == "division by zero at position 2");
    assert(rejection("2 ** 3") == "unexpected character '*' at position 3");
    assert(rejection("7 // 2") == "unexpected character '/' at position 3");
    assert(rejection("7 % 2") == "unexpected character '%' at position 2");
    assert(rejection("1.2.3") == "unexpected character '.' at position 3");
    assert(rejection("2e5") == "unexpected character 'e' at position 1");
    assert(rejection("(1 + 2") == "unbalanced '(' at position 0");
    assert(rejection("1 + 2)") == "unexpected character ')' at position 5");
    assert(rejection("1 +") == "unexpected end of expression");
    assert(rejection(".") == "invalid number at position 0");

    // no names are ever resolved or executed
    assert(rejection("__import__('os').system('id')") == "unexpected character '_' at position 0");
    assert(rejection("import os") == "unexpected character 'i' at position 0");
    assert(rejection("abs(-1)") == "unexpected character 'a' at position 0");
    assert(rejection("pow(2, 3)") == "unexpected character 'p' at position 0");
}

void test_nesting_limit() {
    std::string deep(1000, '(');
    deep += "1";
    deep += std::string(1000, ')');
    assert(rejection(deep) == "expression nested too deeply");

    std::string signs(1000, '-');
    signs += "1";
    assert(rejection(signs) == "expression nested too deeply");
}

void test_format_number() {
    assert(piperpc::format_number(20) == "20");
    assert(piperpc::format_number(5) == "5");
    assert(piperpc::format_number(-4) == "-4");
    assert(piperpc::format_number(-0.0) == "0");
    assert(piperpc::format_number(2.5) == "2.5");
    assert(piperpc::format_number(0.1 + 0.2) == "0.3");
    assert(piperpc::format_number(1.0 / 3.0) == "0.333333333333333");
    assert(piperpc::format_number(1e20) == "1e+20");
}

int main() {
    test_arithmetic();
    test_rejections();
    test_nesting_limit();
    test_format_number();

    printf("test-expression: all tests passed\n");

    return 0;
}
