#pragma once

#include <string>

namespace piperpc {

// Evaluates an arithmetic expression made of numeric literals, + - * /,
// unary signs and parentheses. Anything else (identifiers, operators such
// as ** or %, unbalanced parentheses, division by zero) throws
// InvalidExpression. Nothing is ever executed.
double evaluate_expression(const std::string & expression);

// Integral values print without a fraction ("20"), others with up to 15
// significant digits ("2.5").
std::string format_number(double value);

} // namespace piperpc
