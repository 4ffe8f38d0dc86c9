#pragma once

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <boost/multiprecision/cpp_dec_float.hpp>

namespace PaperPerp::Utils::Numeric
{
    // Base-10 fixed precision number used for every money amount in the ledger.
    using Decimal = boost::multiprecision::number<
        boost::multiprecision::cpp_dec_float<34>,
        boost::multiprecision::et_off>;

    inline Decimal from_string(const std::string& text) {
        try {
            return Decimal(text);
        }
        catch (const std::runtime_error&) {
            throw std::invalid_argument("Not a decimal number: '" + text + "'");
        }
    }

    // Doubles come from indicator math; go through the shortest 15 digit text
    // so 0.1 becomes exactly 0.1 instead of its binary expansion.
    inline Decimal from_double(double value) {
        if (!std::isfinite(value)) {
            throw std::invalid_argument("Cannot convert non-finite value to Decimal");
        }
        std::ostringstream oss;
        oss << std::setprecision(15) << value;
        return Decimal(oss.str());
    }

    inline double to_double(const Decimal& value) {
        return value.convert_to<double>();
    }

    // Fixed notation with the given number of decimals, for logs and CSV files
    inline std::string to_string(const Decimal& value, int decimals = 8) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(decimals) << value;
        std::string text = oss.str();
        if (text.find('.') != std::string::npos) {
            while (!text.empty() && text.back() == '0') text.pop_back();
            if (!text.empty() && text.back() == '.') text.pop_back();
        }
        if (text == "-0") text = "0";
        return text;
    }

    // Nearest multiple of tick (half away from zero). tick <= 0 leaves value unchanged.
    inline Decimal round_to_tick(const Decimal& value, const Decimal& tick) {
        if (tick <= 0) return value;
        return boost::multiprecision::round(value / tick) * tick;
    }

    // Largest multiple of step not above |value|, sign kept.
    inline Decimal floor_to_step(const Decimal& value, const Decimal& step) {
        if (step <= 0) return value;
        Decimal units = boost::multiprecision::floor(boost::multiprecision::abs(value) / step);
        return value < 0 ? -(units * step) : units * step;
    }

    inline Decimal abs(const Decimal& value) {
        return boost::multiprecision::abs(value);
    }
}
