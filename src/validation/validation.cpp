#include <validation/validation.hpp>

//internal
#include <algorithm>
#include <array>
#include <format>
#include <iterator>
#include <stdexcept>

namespace cnpj
{
namespace
{
    constexpr std::array<int, 12> first_digit_weights{5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};
    constexpr std::array<int, 13> second_digit_weights{6, 5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};

    // Matches any byte that is not an ASCII digit, so multibyte UTF-8 symbols are removed entirely
    const boost::regex non_digit_regex{R"([^0-9])"};
}

std::string sanitize(std::string_view candidate)
{
    std::string digits;
    digits.reserve(candidate.size());

    boost::regex_replace(
        std::back_inserter(digits),
        candidate.begin(),
        candidate.end(),
        non_digit_regex,
        "");

    return digits;
}

bool is_valid(const std::optional<std::string>& candidate)
{
    return check(candidate) == validation_status::VALID;
}

validation_status check(const std::optional<std::string>& candidate)
{
    if (!candidate)
    {
        return validation_status::ABSENT;
    }

    const std::string digits{sanitize(*candidate)};

    if (digits.size() != cnpj_length)
    {
        return validation_status::WRONG_LENGTH;
    }

    // Sequences like 00000000000000 pass the checksum but are never issued
    if (std::all_of(digits.begin(), digits.end(), [&digits](char digit){ return digit == digits.front(); }))
    {
        return validation_status::REPEATED_DIGITS;
    }

    const std::string_view digits_view{digits};

    if (compute_check_digits(digits_view.substr(0, base_length)) != digits_view.substr(base_length))
    {
        return validation_status::CHECKSUM_MISMATCH;
    }

    return validation_status::VALID;
}

int calc_digit(std::string_view base)
{
    if (base.size() != first_digit_weights.size() && base.size() != second_digit_weights.size())
    {
        throw std::invalid_argument{std::format(
            "Check digit base must contain 12 or 13 digits but {} were given", base.size())};
    }

    const int* weights{base.size() == first_digit_weights.size() 
        ? first_digit_weights.data() 
        : second_digit_weights.data()};

    int sum{0};

    for (size_t i = 0; i < base.size(); ++i)
    {
        if (base[i] < '0' || base[i] > '9')
        {
            throw std::invalid_argument{std::format(
                "Check digit base must contain only digits but \"{}\" was given", base)};
        }

        sum += (base[i] - '0') * weights[i];
    }

    // Both remainders 0 and 1 turn into the digit 0
    int remainder{sum % 11};
    return remainder < 2 ? 0 : 11 - remainder;
}

std::string compute_check_digits(std::string_view base)
{
    if (base.size() != base_length)
    {
        throw std::invalid_argument{std::format(
            "CNPJ base must contain 12 digits but {} were given", base.size())};
    }

    std::string extended_base{base};
    extended_base.push_back(static_cast<char>('0' + calc_digit(base)));
    extended_base.push_back(static_cast<char>('0' + calc_digit(extended_base)));

    return extended_base.substr(base_length);
}
}
