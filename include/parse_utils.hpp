#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <chrono>
#include <cstddef>
#include <string>

namespace pathmon {

// Parse a size_t from a string.
// Format: decimal digits only.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok);

// Parse a byte count with an optional unit suffix.
// Format: unsigned integer followed by B, K/KB, M/MB, G/GB, T/TB or P/PB
// (case-insensitive, powers of 1024).
// Bounds: inclusive [min, max] bytes.
// Invalid input: bad unit, overflow, parse failure or out-of-range sets
// ok=false and returns 0.
size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok);

// Parse a duration like "90", "30m" or "2h".
// Format: non-negative integer followed by s (default), m, h, d or w.
// Invalid input: parse failure or a negative value sets ok=false and returns 0s.
std::chrono::seconds parse_duration(const std::string& value, bool& ok);

} // namespace pathmon

#endif // PARSE_UTILS_HPP
