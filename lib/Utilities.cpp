#include "Utilities.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace payproc {
namespace utl {

std::string trim(const std::string &str) {
  const char *whitespace = " \t\r\n";
  auto begin = str.find_first_not_of(whitespace);
  if (begin == std::string::npos) {
    return "";
  }
  auto end = str.find_last_not_of(whitespace);
  return str.substr(begin, end - begin + 1);
}

std::vector<std::string> split(const std::string &str, char delimiter) {
  std::vector<std::string> fields;
  size_t start = 0;
  while (true) {
    size_t pos = str.find(delimiter, start);
    if (pos == std::string::npos) {
      fields.push_back(str.substr(start));
      break;
    }
    fields.push_back(str.substr(start, pos - start));
    start = pos + 1;
  }
  return fields;
}

std::string toLower(const std::string &str) {
  std::string result = str;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

template <typename T> static bool parseUnsigned(const std::string &str, T &value) {
  if (str.empty()) {
    return false;
  }
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size();
}

bool parseUInt16(const std::string &str, uint16_t &value) {
  return parseUnsigned(str, value);
}

bool parseUInt32(const std::string &str, uint32_t &value) {
  return parseUnsigned(str, value);
}

Roe<nlohmann::json> loadJsonFile(const std::string &configPath) {
  if (!std::filesystem::exists(configPath)) {
    return Error(1, "Configuration file not found: " + configPath);
  }

  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    return Error(2, "Failed to open configuration file: " + configPath);
  }

  std::string content((std::istreambuf_iterator<char>(configFile)),
                      std::istreambuf_iterator<char>());
  configFile.close();

  nlohmann::json config;
  try {
    config = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON: " + std::string(e.what()));
  }

  return config;
}

} // namespace utl
} // namespace payproc
