/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Common string operations used across webid-tls modules.
 */

#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace webid {
namespace utils {

/**
 * @brief Convert string to lowercase (ASCII only)
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Convert string to uppercase (ASCII only)
 *
 * @param str Input string
 * @return Uppercase string
 */
std::string toUpper(const std::string& str);

/**
 * @brief Case-insensitive ASCII equality
 *
 * @param a First string
 * @param b Second string
 * @return true if both strings are equal ignoring ASCII case
 */
bool equalsIgnoreCase(const std::string& a, const std::string& b);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Remove every whitespace character
 *
 * Used for base64 blobs that arrive wrapped over several lines.
 */
std::string removeWhitespace(const std::string& str);

/**
 * @brief Check if string starts with prefix
 */
bool startsWith(const std::string& str, const std::string& prefix);

/**
 * @brief Check if string ends with suffix
 */
bool endsWith(const std::string& str, const std::string& suffix);

/**
 * @brief Convert binary data to lowercase hex string
 *
 * @param data Binary data
 * @param len Number of bytes
 * @return Hex string (2 chars per byte), empty for null/empty input
 */
std::string bytesToHex(const uint8_t* data, size_t len);

} // namespace utils
} // namespace webid
