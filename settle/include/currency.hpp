#pragma once

#include "decimal.hpp"
#include <string>
#include <vector>

// ISO 4217 minor-unit lookup
class Currency {
public:
    // Decimal places for a currency code; unknown codes default to 2
    static int decimal_places(const std::string& code);

    // Smallest representable unit, e.g. 0.01 for USD and 1 for VND
    static Decimal smallest_unit(const std::string& code);

    static bool is_known(const std::string& code);

    static std::vector<std::string> supported_codes();
};
