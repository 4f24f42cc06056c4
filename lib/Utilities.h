#ifndef PAYPROC_UTILITIES_H
#define PAYPROC_UTILITIES_H

#include "ResultOrError.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace payproc {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Strip leading and trailing whitespace (spaces, tabs, CR, LF)
 */
std::string trim(const std::string &str);

/**
 * Split a string on a single-character delimiter. Empty fields are kept, so
 * "a,,b" yields three fields.
 */
std::vector<std::string> split(const std::string &str, char delimiter);

std::string toLower(const std::string &str);

/**
 * Parse an unsigned integer from a string. The whole string must be consumed;
 * no sign, no whitespace.
 * @return true if parsing succeeded and the value fits the target type
 */
bool parseUInt16(const std::string &str, uint16_t &value);
bool parseUInt32(const std::string &str, uint32_t &value);

/**
 * Load and parse a JSON configuration file
 * @param configPath Path to the JSON configuration file
 * @return Roe<nlohmann::json> with the parsed document or an error
 */
Roe<nlohmann::json> loadJsonFile(const std::string &configPath);

} // namespace utl
} // namespace payproc

#endif // PAYPROC_UTILITIES_H
