//local
#include <config.hpp>
#include <logging/logger.hpp>
#include <validation/validation.hpp>

//internal
#include <iostream>

int main(int argc, char* argv[])
{
    try
    {
        config::init();
    }
    catch (const std::exception& error)
    {
        std::cerr << error.what() << std::endl;
        return 1;
    }

    if (argc > 2)
    {
        LOG_WARNING << "Only the first of " << argc - 1 << " arguments is checked";
    }

    // Check the built-in sample if nothing was passed
    const std::string value{argc > 1 ? argv[1] : config::sample_cnpj};
    const cnpj::validation_status status{cnpj::check(value)};

    LOG_DEBUG << "\"" << value << "\" is checked with the status " << magic_enum::enum_name(status);

    // The exit code does not depend on the validation result
    std::cout << value << " -> " << std::boolalpha << (status == cnpj::VALID) << std::endl;

    return 0;
}
