#pragma once

#include "core/types.hh"
#include <cstdint>
#include <optional>

namespace pledge {

// ============================================================================
// Checked Arithmetic
// ============================================================================
//
// Every helper returns std::nullopt instead of wrapping. Callers turn an empty
// result into ARITHMETIC_OVERFLOW (or a more specific rejection) before any
// state is touched.

[[nodiscard]] constexpr std::optional<std::uint64_t> checked_add(std::uint64_t a, std::uint64_t b) {
    std::uint64_t r = a + b;
    if (r < a) {
        return std::nullopt;
    }
    return r;
}

[[nodiscard]] constexpr std::optional<std::uint64_t> checked_sub(std::uint64_t a, std::uint64_t b) {
    if (b > a) {
        return std::nullopt;
    }
    return a - b;
}

[[nodiscard]] constexpr std::optional<std::uint64_t> checked_mul(std::uint64_t a, std::uint64_t b) {
    if (a == 0 || b == 0) {
        return std::uint64_t{0};
    }
    std::uint64_t r = a * b;
    if (r / a != b) {
        return std::nullopt;
    }
    return r;
}

[[nodiscard]] constexpr std::optional<std::uint64_t> checked_div(std::uint64_t a, std::uint64_t b) {
    if (b == 0) {
        return std::nullopt;
    }
    return a / b;
}

// Token amounts (256-bit)
[[nodiscard]] inline std::optional<amount_t> checked_add(const amount_t& a, const amount_t& b) {
    amount_t r = a + b;
    if (r < a) {
        return std::nullopt;
    }
    return r;
}

[[nodiscard]] inline std::optional<amount_t> checked_sub(const amount_t& a, const amount_t& b) {
    if (b > a) {
        return std::nullopt;
    }
    return amount_t{a - b};
}

// floor(a * b / denominator) with a 512-bit intermediate product.
// Empty when denominator is zero or the quotient does not fit in 256 bits.
[[nodiscard]] std::optional<amount_t> mul_div(
    const amount_t& a,
    std::uint64_t b,
    std::uint64_t denominator);

}  // namespace pledge
