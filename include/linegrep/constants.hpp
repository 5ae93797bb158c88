#pragma once
#include <cstddef>
#include <string_view>

constexpr static inline std::string_view NAME = "lg";
constexpr static inline std::string_view DESCRIPTION =
    "Search lines of a stream for a regex pattern";
constexpr static inline std::string_view VERSION = "0.1.0";
constexpr static inline std::string_view LINE_TERMINATORS = "\r\n";
// hs_scan takes an `unsigned int` length
constexpr static inline std::size_t MAX_LINE_LENGTH = 0xFFFFFFFFu;
