#pragma once
#include <linegrep/constants.hpp>
#include <string>
#include <string_view>

/// Strips trailing line terminators, leaving any other whitespace alone
std::string_view rtrim_line_terminators(const std::string_view &s);

void rtrim_line_terminators_in_place(std::string &s);
