#include "piperpc/expression.hpp"
#include "piperpc/errors.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace piperpc {

namespace {

// nesting limit for parentheses and unary signs
constexpr int max_depth = 256;

// expr   := term (('+' | '-') term)*
// term   := unary (('*' | '/') unary)*
// unary  := ('+' | '-') unary | primary
// primary:= number | '(' expr ')'
class expression_parser {
public:
    explicit expression_parser(const std::string & text) : text(text) {}

    double parse() {
        skip_spaces();
        if (pos >= text.size()) {
            throw InvalidExpression("empty expression");
        }

        double value = parse_expr();

        skip_spaces();
        if (pos < text.size()) {
            fail_unexpected();
        }
        return value;
    }

private:
    double parse_expr() {
        double value = parse_term();
        while (true) {
            skip_spaces();
            if (peek() == '+') {
                ++pos;
                value += parse_term();
            } else if (peek() == '-') {
                ++pos;
                value -= parse_term();
            } else {
                return value;
            }
        }
    }

    double parse_term() {
        double value = parse_unary();
        while (true) {
            skip_spaces();
            if (peek() == '*') {
                ++pos;
                if (peek() == '*') {
                    fail_unexpected();
                }
                value *= parse_unary();
            } else if (peek() == '/') {
                const size_t op_pos = pos++;
                if (peek() == '/') {
                    fail_unexpected();
                }
                double divisor = parse_unary();
                if (divisor == 0.0) {
                    throw InvalidExpression("division by zero at position " + std::to_string(op_pos));
                }
                value /= divisor;
            } else {
                return value;
            }
        }
    }

    double parse_unary() {
        skip_spaces();
        if (peek() == '+' || peek() == '-') {
            const bool negate = peek() == '-';
            ++pos;
            enter();
            double value = parse_unary();
            --depth;
            return negate ? -value : value;
        }
        return parse_primary();
    }

    double parse_primary() {
        skip_spaces();

        if (pos >= text.size()) {
            throw InvalidExpression("unexpected end of expression");
        }

        if (peek() == '(') {
            const size_t open_pos = pos++;
            enter();
            double value = parse_expr();
            --depth;
            skip_spaces();
            if (peek() != ')') {
                if (pos >= text.size()) {
                    throw InvalidExpression("unbalanced '(' at position " + std::to_string(open_pos));
                }
                fail_unexpected();
            }
            ++pos;
            return value;
        }

        if (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '.') {
            return parse_number();
        }

        fail_unexpected();
        return 0.0;
    }

    double parse_number() {
        const size_t start = pos;
        size_t n_digits = 0;

        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            ++pos;
            ++n_digits;
        }
        if (peek() == '.') {
            ++pos;
            while (std::isdigit(static_cast<unsigned char>(peek()))) {
                ++pos;
                ++n_digits;
            }
        }

        if (n_digits == 0) {
            throw InvalidExpression("invalid number at position " + std::to_string(start));
        }
        // reject "1.2.3" and "2e5": only plain decimal literals are numbers
        if (peek() == '.' || std::isalpha(static_cast<unsigned char>(peek())) || peek() == '_') {
            fail_unexpected();
        }

        const std::string literal = text.substr(start, pos - start);
        return std::strtod(literal.c_str(), nullptr);
    }

    void enter() {
        if (++depth > max_depth) {
            throw InvalidExpression("expression nested too deeply");
        }
    }

    char peek() const {
        return pos < text.size() ? text[pos] : '\0';
    }

    void skip_spaces() {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
    }

    [[noreturn]] void fail_unexpected() const {
        if (pos >= text.size()) {
            throw InvalidExpression("unexpected end of expression");
        }
        const unsigned char c = static_cast<unsigned char>(text[pos]);
        if (std::isprint(c)) {
            throw InvalidExpression(std::string("unexpected character '") + text[pos] + "' at position " + std::to_string(pos));
        }
        char code[8];
        std::snprintf(code, sizeof(code), "0x%02x", c);
        throw InvalidExpression(std::string("unexpected byte ") + code + " at position " + std::to_string(pos));
    }

    const std::string & text;
    size_t pos   = 0;
    int    depth = 0;
};

} // namespace

double evaluate_expression(const std::string & expression) {
    expression_parser parser(expression);
    double value = parser.parse();
    if (!std::isfinite(value)) {
        throw InvalidExpression("result is not a finite number");
    }
    return value;
}

std::string format_number(double value) {
    char buf[64];
    if (value == std::floor(value) && std::fabs(value) < 1e15) {
        // avoid printing "-0"
        std::snprintf(buf, sizeof(buf), "%.0f", value == 0.0 ? 0.0 : value);
    } else {
        std::snprintf(buf, sizeof(buf), "%.15g", value);
    }
    return buf;
}

} // namespace piperpc
