#include "safe_math.hh"
#include <limits>

namespace pledge {

std::optional<amount_t> mul_div(
    const amount_t& a,
    std::uint64_t b,
    std::uint64_t denominator) {

    if (denominator == 0) {
        return std::nullopt;
    }

    using boost::multiprecision::uint512_t;
    uint512_t product = static_cast<uint512_t>(a) * b;
    uint512_t quotient = product / denominator;

    if (quotient > static_cast<uint512_t>(std::numeric_limits<amount_t>::max())) {
        return std::nullopt;
    }
    return static_cast<amount_t>(quotient);
}

}  // namespace pledge
