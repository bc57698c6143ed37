#include "number_format.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>

std::string format_number(double d) {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
    if (d == 0.0) return "0";  // also folds -0

    // The shortest scientific form fixes the significant digits and the exponent.
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::scientific);
    std::string text(buf, res.ptr);

    std::string sign;
    if (text[0] == '-') {
        sign = "-";
        text.erase(0, 1);
    }
    std::string::size_type e = text.find('e');
    int exponent = std::atoi(text.c_str() + e + 1);
    std::string digits = text.substr(0, e);
    if (digits.size() > 1) digits.erase(1, 1);  // drop the '.'

    int k = static_cast<int>(digits.size());
    int n = exponent + 1;  // digits before the decimal point

    if (exponent >= -6 && exponent < 21) {
        if (k <= n) return sign + digits + std::string(n - k, '0');
        if (n > 0) return sign + digits.substr(0, n) + "." + digits.substr(n);
        return sign + "0." + std::string(-n, '0') + digits;
    }

    std::string mantissa = digits.substr(0, 1);
    if (k > 1) mantissa += "." + digits.substr(1);
    return sign + mantissa + "e" + (exponent < 0 ? "-" : "+") + std::to_string(std::abs(exponent));
}
