// REFINDEX - Core Types Implementation
// Copyright (c) 2024 REFINDEX Developers
// MIT License

#include "refindex/core/types.h"

#include <algorithm>

namespace refindex {

std::string U128ToString(U128 value) {
    if (value == 0) {
        return "0";
    }
    std::string result;
    while (value > 0) {
        result.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(result.begin(), result.end());
    return result;
}

bool ParseU128(const std::string& str, U128& out) {
    if (str.empty()) {
        return false;
    }
    const U128 max = ~static_cast<U128>(0);
    U128 value = 0;
    for (char c : str) {
        if (c < '0' || c > '9') {
            return false;
        }
        unsigned digit = static_cast<unsigned>(c - '0');
        if (value > (max - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

} // namespace refindex
