//! # Scalar Property Builders Implementation

#include "spec/property.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace argspec::spec {

namespace {

auto is_absent(const SpecValue* raw) -> bool {
    return raw == nullptr || raw->is_null();
}

auto has_whitespace(std::string_view text) -> bool {
    return std::any_of(text.begin(), text.end(),
                       [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

auto field_error(std::string_view field, std::string_view what) -> std::string {
    std::string msg(field);
    msg += " should be ";
    msg += what;
    return msg;
}

} // namespace

auto value_parser_name(ValueParser parser) -> const char* {
    switch (parser) {
    case ValueParser::String:
        return "string";
    case ValueParser::Integer:
        return "integer";
    case ValueParser::Float:
        return "float";
    }
    return "string";
}

auto value_matches_parser(const SpecValue& value, ValueParser parser) -> bool {
    switch (parser) {
    case ValueParser::String:
        return value.is_string();
    case ValueParser::Integer:
        return value.is_integer();
    case ValueParser::Float:
        return value.is_number();
    }
    return false;
}

namespace property {

auto build_string(std::string_view field, const SpecValue* raw, OptString default_value)
    -> Result<OptString, std::string> {
    if (is_absent(raw)) {
        return default_value;
    }
    if (!raw->is_string()) {
        return field_error(field, "a string");
    }
    return OptString(raw->as_string());
}

auto build_bool(std::string_view field, const SpecValue* raw, bool default_value)
    -> Result<bool, std::string> {
    if (is_absent(raw)) {
        return default_value;
    }
    if (!raw->is_bool()) {
        return field_error(field, "a boolean");
    }
    return raw->as_bool();
}

auto build_command_name(std::string_view field, const SpecValue* raw)
    -> Result<OptString, std::string> {
    if (is_absent(raw)) {
        return OptString();
    }
    if (!raw->is_string()) {
        return field_error(field, "a string");
    }

    const std::string& name = raw->as_string();
    if (name.empty() || has_whitespace(name) || name.front() == '-') {
        return field_error(field, "a non-empty string without whitespace not starting with '-'");
    }
    return OptString(name);
}

auto build_short(std::string_view field, const SpecValue* raw) -> Result<OptString, std::string> {
    if (is_absent(raw)) {
        return OptString();
    }

    constexpr const char* expected = "a single letter or digit, optionally prefixed by '-'";
    if (!raw->is_string()) {
        return field_error(field, expected);
    }

    std::string_view text = raw->as_string();
    if (text.size() == 2 && text.front() == '-') {
        text.remove_prefix(1);
    }
    if (text.size() != 1 || !std::isalnum(static_cast<unsigned char>(text.front()))) {
        return field_error(field, expected);
    }
    return OptString(std::string(text));
}

auto build_long(std::string_view field, const SpecValue* raw) -> Result<OptString, std::string> {
    if (is_absent(raw)) {
        return OptString();
    }

    constexpr const char* expected =
        "a non-empty name without whitespace or '=', optionally prefixed by '--'";
    if (!raw->is_string()) {
        return field_error(field, expected);
    }

    std::string_view text = raw->as_string();
    if (text.starts_with("--")) {
        text.remove_prefix(2);
    }
    if (text.empty() || text.front() == '-' || has_whitespace(text) ||
        text.find('=') != std::string_view::npos) {
        return field_error(field, expected);
    }
    return OptString(std::string(text));
}

auto build_value_name(std::string_view field, const SpecValue* raw, OptString default_value)
    -> Result<OptString, std::string> {
    if (is_absent(raw)) {
        return default_value;
    }
    if (!raw->is_string() || raw->as_string().empty()) {
        return field_error(field, "a non-empty string");
    }
    return OptString(raw->as_string());
}

auto build_parser(std::string_view field, const SpecValue* raw)
    -> Result<ValueParser, std::string> {
    if (is_absent(raw)) {
        return ValueParser::String;
    }

    if (raw->is_string()) {
        const std::string& name = raw->as_string();
        for (auto parser : {ValueParser::String, ValueParser::Integer, ValueParser::Float}) {
            if (name == value_parser_name(parser)) {
                return parser;
            }
        }
    }
    return field_error(field, "one of \"string\", \"integer\", \"float\"");
}

} // namespace property

} // namespace argspec::spec
