#include "tile_config/coercion.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string_view>

#include <fmt/format.h>

namespace tile_config {

namespace {

std::string_view trim(std::string_view text) {
    constexpr std::string_view k_whitespace{" \t\n\r\f\v"};
    const std::size_t first = text.find_first_not_of(k_whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const std::size_t last = text.find_last_not_of(k_whitespace);
    return text.substr(first, last - first + 1);
}

// std::stoi and friends skip leading whitespace and ignore trailing junk; both
// are rejected here so "12abc" fails the way a strict parse should.
int parse_whole_int(std::string_view raw_text, int base, std::string_view literal) {
    const std::string text{trim(raw_text)};
    if (text.empty()) {
        throw std::invalid_argument(fmt::format("invalid base-{} integer: '{}'", base, literal));
    }
    std::size_t consumed = 0;
    int parsed_value = 0;
    try {
        parsed_value = std::stoi(text, &consumed, base);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument(fmt::format("invalid base-{} integer: '{}'", base, literal));
    }
    if (consumed != text.size()) {
        throw std::invalid_argument(fmt::format("invalid base-{} integer: '{}'", base, literal));
    }
    return parsed_value;
}

}  // namespace

int to_int(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::boolean:
            return value.get<bool>() ? 1 : 0;
        case nlohmann::json::value_t::number_integer: {
            const auto raw_value = value.get<std::int64_t>();
            if (raw_value < std::numeric_limits<int>::min() || raw_value > std::numeric_limits<int>::max()) {
                throw std::out_of_range(fmt::format("integer {} is out of range", raw_value));
            }
            return static_cast<int>(raw_value);
        }
        case nlohmann::json::value_t::number_unsigned: {
            const auto raw_value = value.get<std::uint64_t>();
            if (raw_value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
                throw std::out_of_range(fmt::format("integer {} is out of range", raw_value));
            }
            return static_cast<int>(raw_value);
        }
        case nlohmann::json::value_t::number_float: {
            const double raw_value = value.get<double>();
            if (!std::isfinite(raw_value)) {
                throw std::invalid_argument(fmt::format("cannot convert {} to an integer", raw_value));
            }
            const double truncated = std::trunc(raw_value);
            if (truncated < static_cast<double>(std::numeric_limits<int>::min())
                || truncated > static_cast<double>(std::numeric_limits<int>::max())) {
                throw std::out_of_range(fmt::format("number {} is out of integer range", raw_value));
            }
            return static_cast<int>(truncated);
        }
        case nlohmann::json::value_t::string: {
            const auto& text = value.get_ref<const std::string&>();
            return parse_whole_int(text, 10, text);
        }
        default:
            throw std::invalid_argument(
                fmt::format("expected an integer, a numeric string or a boolean, not {}", value.type_name())
            );
    }
}

double to_double(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::boolean:
            return value.get<bool>() ? 1.0 : 0.0;
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return value.get<double>();
        case nlohmann::json::value_t::string: {
            const auto& raw_text = value.get_ref<const std::string&>();
            const std::string text{trim(raw_text)};
            std::size_t consumed = 0;
            double parsed_value = 0.0;
            try {
                parsed_value = std::stod(text, &consumed);
            } catch (const std::invalid_argument&) {
                throw std::invalid_argument(fmt::format("invalid number: '{}'", raw_text));
            }
            if (text.empty() || consumed != text.size()) {
                throw std::invalid_argument(fmt::format("invalid number: '{}'", raw_text));
            }
            return parsed_value;
        }
        default:
            throw std::invalid_argument(
                fmt::format("expected a number, a numeric string or a boolean, not {}", value.type_name())
            );
    }
}

bool to_bool(const nlohmann::json& value) noexcept {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return false;
        case nlohmann::json::value_t::boolean:
            return value.get<bool>();
        case nlohmann::json::value_t::number_integer:
            return value.get<std::int64_t>() != 0;
        case nlohmann::json::value_t::number_unsigned:
            return value.get<std::uint64_t>() != 0;
        case nlohmann::json::value_t::number_float:
            return value.get<double>() != 0.0;
        case nlohmann::json::value_t::string:
        case nlohmann::json::value_t::array:
        case nlohmann::json::value_t::object:
        case nlohmann::json::value_t::binary:
            return !value.empty();
    }
    return false;
}

std::string to_string(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

int parse_octal(const nlohmann::json& value) {
    if (!value.is_string()) {
        throw std::invalid_argument(
            fmt::format("octal value must be a string, not: {}", value.dump())
        );
    }
    const auto& raw_text = value.get_ref<const std::string&>();
    std::string_view text = trim(raw_text);
    std::string sign{};
    if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
        sign = std::string{text.front()};
        text.remove_prefix(1);
    }
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'o' || text[1] == 'O')) {
        text.remove_prefix(2);
    }
    if (text.empty() || text.front() == '-' || text.front() == '+') {
        throw std::invalid_argument(fmt::format("invalid base-8 integer: '{}'", raw_text));
    }
    return parse_whole_int(sign + std::string{text}, 8, raw_text);
}

}  // namespace tile_config
