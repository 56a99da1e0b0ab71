#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <cstddef>
#include <string>

// Parse a decimal integer from a string.
// Format: optional '+' or '-' followed by digits; trailing characters are invalid.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
long parse_long(const std::string& value, long min, long max, bool& ok);

// Parse a boolean option value.
// Format: true/false, yes/no, on/off or 1/0 (case-insensitive). An empty
// string counts as true so that a bare `key:` in a config file enables it.
// Invalid input: anything else sets ok=false and returns false.
bool parse_bool(const std::string& value, bool& ok);

// Parse byte size from a string with optional unit suffix.
// Format: unsigned integer followed by optional units B, KB, MB, GB or TB (case-insensitive).
// Bounds: inclusive [min, max] bytes.
// Invalid input: bad unit, parse failure, or out-of-range sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok);

#endif // PARSE_UTILS_HPP
