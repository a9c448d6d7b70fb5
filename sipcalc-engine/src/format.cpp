#include "format.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace sipcalc {

std::string format_decimal(double value, int places) {
    const double scale = std::pow(10.0, places);
    double scaled = std::round(value * scale);
    if (scaled == 0.0) {
        scaled = 0.0;   // drop negative zero
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(places) << scaled / scale;
    return oss.str();
}

double round_currency(double value) {
    double rounded = std::round(value);
    return rounded == 0.0 ? 0.0 : rounded;
}

std::string format_inr(double value) {
    double rounded = round_currency(value);
    bool negative = rounded < 0.0;

    std::ostringstream digits_stream;
    digits_stream << std::fixed << std::setprecision(0) << std::fabs(rounded);
    const std::string digits = digits_stream.str();

    // Last three digits form one group, the rest are grouped in pairs
    std::string grouped;
    if (digits.size() <= 3) {
        grouped = digits;
    } else {
        const std::string tail = digits.substr(digits.size() - 3);
        std::string head = digits.substr(0, digits.size() - 3);
        std::string head_grouped;
        while (head.size() > 2) {
            head_grouped = "," + head.substr(head.size() - 2) + head_grouped;
            head.erase(head.size() - 2);
        }
        grouped = head + head_grouped + "," + tail;
    }

    return std::string("₹") + (negative ? "-" : "") + grouped;
}

} // namespace sipcalc
