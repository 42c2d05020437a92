#include "amount.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace betme {

Amount parseAmount(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("amount must not be empty");
    }
    bool digitsOnly = std::all_of(text.begin(), text.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
    if (!digitsOnly) {
        throw std::invalid_argument("amount must be a non-negative decimal integer: " + text);
    }
    // cpp_int treats a leading 0 as an octal prefix; amounts are always decimal.
    const auto firstNonZero = text.find_first_not_of('0');
    if (firstNonZero == std::string::npos) {
        return Amount(0);
    }
    // The checked type throws std::overflow_error past 2^256.
    return Amount(text.substr(firstNonZero).c_str());
}

std::string formatAmount(const Amount& amount) {
    return amount.str();
}

} // namespace betme
