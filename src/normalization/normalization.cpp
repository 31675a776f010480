#include <normalization/normalization.hpp>

//internal
#include <charconv>
#include <format>
#include <stdexcept>

namespace cnpj
{
std::optional<std::string> normalize(const std::optional<std::string>& candidate)
{
    if (!candidate)
    {
        return std::nullopt;
    }

    const std::string digits{sanitize(*candidate)};

    if (digits.empty())
    {
        throw std::invalid_argument{std::format(
            "CNPJ candidate \"{}\" does not contain any digit", *candidate)};
    }

    uint64_t value{0};
    const auto [last_parsed, error] = std::from_chars(digits.data(), digits.data() + digits.size(), value);

    // Leading zeros are insignificant so only the value itself is limited
    if (error == std::errc::result_out_of_range || value > max_cnpj_value)
    {
        throw std::out_of_range{std::format(
            "CNPJ candidate \"{}\" exceeds {} digits", *candidate, cnpj_length)};
    }

    if (error != std::errc{})
    {
        throw std::invalid_argument{std::format(
            "CNPJ candidate \"{}\" can not be parsed as a number", *candidate)};
    }

    return std::format("{:0{}}", value, cnpj_length);
}

std::string mask(std::string_view candidate)
{
    const std::string digits{*normalize(std::string{candidate})};

    return std::format("{}.{}.{}/{}-{}",
        digits.substr(0, 2),
        digits.substr(2, 3),
        digits.substr(5, 3),
        digits.substr(8, 4),
        digits.substr(12, 2));
}
}
