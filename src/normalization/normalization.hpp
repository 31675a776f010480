#ifndef NORMALIZATION_HPP
#define NORMALIZATION_HPP

//local
#include <validation/validation.hpp>

//internal
#include <optional>
#include <string>
#include <string_view>

namespace cnpj
{
    // Largest value representable by 14 digits
    inline constexpr uint64_t max_cnpj_value{99'999'999'999'999};

    // Transform the given candidate to 14 digits string padded with leading zeros
    // e.g. "04.252.011/0001-10" -> "04252011000110", "1" -> "00000000000001"
    // The check digits are not verified, use is_valid for that
    // Absent candidate gives absent result
    // Throw std::invalid_argument if the candidate contains no digits
    // Throw std::out_of_range if the digits represent a number longer than 14 digits
    std::optional<std::string> normalize(const std::optional<std::string>& candidate);

    // Normalize the given candidate and put it into the "NN.NNN.NNN/NNNN-NN" mask
    // Throw the same exceptions as normalize
    std::string mask(std::string_view candidate);
}

#endif
