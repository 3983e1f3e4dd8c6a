#include "currency.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace {

const std::map<std::string, int>& precision_table() {
    static const std::map<std::string, int> table = {
        // Zero decimal currencies
        {"BIF", 0}, {"CLP", 0}, {"DJF", 0}, {"GNF", 0}, {"ISK", 0}, {"JPY", 0},
        {"KMF", 0}, {"KRW", 0}, {"PYG", 0}, {"RWF", 0}, {"UGX", 0}, {"VND", 0},
        {"VUV", 0}, {"XAF", 0}, {"XOF", 0}, {"XPF", 0},
        // Three decimal currencies
        {"BHD", 3}, {"IQD", 3}, {"JOD", 3}, {"KWD", 3}, {"LYD", 3}, {"OMR", 3}, {"TND", 3},
        // Two decimal currencies
        {"AUD", 2}, {"CAD", 2}, {"CHF", 2}, {"CNY", 2}, {"EUR", 2}, {"GBP", 2},
        {"HKD", 2}, {"INR", 2}, {"MXN", 2}, {"NZD", 2}, {"SEK", 2}, {"SGD", 2},
        {"THB", 2}, {"USD", 2},
    };
    return table;
}

std::string to_upper(std::string code) {
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return code;
}

}  // namespace

int Currency::decimal_places(const std::string& code) {
    const auto& table = precision_table();
    auto it = table.find(to_upper(code));
    return it == table.end() ? 2 : it->second;
}

Decimal Currency::smallest_unit(const std::string& code) {
    return Decimal::pow10(-decimal_places(code));
}

bool Currency::is_known(const std::string& code) {
    return precision_table().count(to_upper(code)) > 0;
}

std::vector<std::string> Currency::supported_codes() {
    std::vector<std::string> codes;
    for (const auto& [code, places] : precision_table()) {
        codes.push_back(code);
    }
    return codes;
}
