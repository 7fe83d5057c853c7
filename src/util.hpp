#pragma once

#include <cstddef>
#include <iomanip>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/integer.hpp>

namespace ptndle::util {

/*
Given the bits needed to hold the type, returns the fastest/smallest unsigned/signed type that holds it
*/
template <int Bits, bool Least = true, bool Unsigned = true>
struct TypeMaker {
private:
    using UnsignedT = std::conditional_t<Least, typename boost::uint_t<Bits>::least, typename boost::uint_t<Bits>::fast>;
    using SignedT = std::conditional_t<Least, typename boost::int_t<Bits>::least, typename boost::int_t<Bits>::fast>;

public:
    using Type = std::conditional_t<Unsigned, UnsignedT, SignedT>;
};

enum class Color : char { GREEN, YELLOW, RED, NONE };

// Wraps text in an ANSI SGR colour sequence
inline std::string paint(std::string_view text, Color color) {
    constexpr std::string_view reset = "\x1b[0m";
    std::string_view code;
    switch (color) {
        case Color::GREEN: code = "\x1b[32m"; break;
        case Color::YELLOW: code = "\x1b[33m"; break;
        case Color::RED: code = "\x1b[31m"; break;
        case Color::NONE: return std::string{text};
    }
    std::string out;
    out.reserve(code.size() + text.size() + reset.size());
    out.append(code).append(text).append(reset);
    return out;
}

// Splits on runs of whitespace, dropping empty tokens
inline std::vector<std::string> splitWhitespace(std::string_view text) {
    std::string trimmed = boost::algorithm::trim_copy(std::string{text});
    std::vector<std::string> tokens;
    if (trimmed.empty()) return tokens;
    boost::algorithm::split(tokens, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
    return tokens;
}

inline std::string trim(std::string_view text) {
    return boost::algorithm::trim_copy(std::string{text});
}

inline bool equalsIgnoreCase(std::string_view left, std::string_view right) {
    return boost::algorithm::iequals(left, right);
}

// Joins the names of a range of sinners (anything with a .name member) with ", "
template <typename Range>
std::string joinNames(const Range& range) {
    std::string out;
    bool printedOne = false;
    for (const auto& item : range) {
        if (printedOne) out += ", ";
        printedOne = true;
        out += item.name;
    }
    return out;
}

inline void showProgressBar(std::ostream& out, size_t current, size_t total, size_t barWidth = 50) {
    double progress = total == 0 ? 1.0 : static_cast<double>(current) / total;
    size_t pos = static_cast<size_t>(barWidth * progress);

    out << "\r[";
    for (size_t i = 0; i < barWidth; ++i) {
        if (i < pos) out << "=";
        else if (i == pos) out << ">";
        else out << " ";
    }
    out << "] "
        << std::fixed << std::setprecision(2)
        << std::setw(6) << (progress * 100.0) << "%   "
        << std::flush;
}

}  // namespace ptndle::util
