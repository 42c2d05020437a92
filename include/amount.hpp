#pragma once

#include <string>

#include <boost/multiprecision/cpp_int.hpp>

namespace betme {

// Native value. Arithmetic past 2^256 throws std::overflow_error, going below zero
// throws std::range_error.
using Amount = boost::multiprecision::checked_uint256_t;

Amount parseAmount(const std::string& text);
std::string formatAmount(const Amount& amount);

} // namespace betme
