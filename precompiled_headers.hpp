#ifndef PRECOMPILED_HEADERS_HPP
#define PRECOMPILED_HEADERS_HPP

#include <array>
#include <charconv>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdint.h>
#include <string>
#include <string_view>

#include <boost/regex.hpp>
#include <magic_enum.hpp>
#include <boost/json.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <config.hpp>
#include <logging/logger.hpp>

#endif
