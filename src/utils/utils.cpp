#include "utils.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {

std::vector<std::string> split_string(const std::string &text,
                                      char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    tokens.push_back(current_token);
  }
  return tokens;
}

std::optional<bool> parse_bool(std::string_view value) {
  std::string val_str = to_lower_copy(trim_copy(value));
  if (val_str == "true" || val_str == "1" || val_str == "yes" ||
      val_str == "on")
    return true;
  if (val_str == "false" || val_str == "0" || val_str == "no" ||
      val_str == "off")
    return false;
  return std::nullopt;
}

std::string to_lower_copy(std::string_view value) {
  std::string out{value};
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

std::string to_upper_copy(std::string_view value) {
  std::string out{value};
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return out;
}

uint64_t get_current_time_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string format_decimal(double value, int max_decimals) {
  if (std::isnan(value))
    return "nan";
  if (std::isinf(value))
    return value < 0 ? "-inf" : "inf";

  std::ostringstream oss;
  oss << std::fixed << std::setprecision(max_decimals) << value;
  std::string text = oss.str();

  if (text.find('.') != std::string::npos) {
    while (!text.empty() && text.back() == '0')
      text.pop_back();
    if (!text.empty() && text.back() == '.')
      text.pop_back();
  }
  if (text == "-0")
    text = "0";
  return text;
}

} // namespace Utils
