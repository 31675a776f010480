#ifndef VALIDATION_HPP
#define VALIDATION_HPP

//internal
#include <stdint.h>
#include <optional>
#include <string>
#include <string_view>

//external
#include <boost/regex.hpp>
#include <magic_enum.hpp>

namespace cnpj
{
    // Number of digits in a complete CNPJ including both check digits
    inline constexpr size_t cnpj_length{14};
    // Number of leading digits the check digits are computed from
    inline constexpr size_t base_length{12};

    // The first rule a CNPJ candidate failed, VALID if it failed none
    enum validation_status : uint_fast8_t
    {
        VALID = 0,
        ABSENT,
        WRONG_LENGTH,
        REPEATED_DIGITS,
        CHECKSUM_MISMATCH
    };

    // Remove every symbol except the ASCII digits keeping the order of the remaining ones
    std::string sanitize(std::string_view candidate);

    // Determine if the given candidate is a structurally valid CNPJ
    // Punctuation is ignored so "04.252.011/0001-10" and "04252011000110" are equally valid
    // Never throws: absent, malformed or mistyped input is just not valid
    bool is_valid(const std::optional<std::string>& candidate);

    // Same checks as is_valid but report the reason of the rejection
    validation_status check(const std::optional<std::string>& candidate);

    // Calculate a single check digit of the 12 or 13 digits base by the weighted sum modulo 11
    // Throw std::invalid_argument if the base has another length or contains non-digits
    int calc_digit(std::string_view base);

    // Calculate both check digits of the 12 digits base, e.g. "042520110001" -> "10"
    std::string compute_check_digits(std::string_view base);
}

#endif
