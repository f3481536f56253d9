#pragma once

#include <string>
#include <vector>
#include <sstream>

namespace utils {

  inline std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
      return std::string();
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
  }

  inline std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> result;
    std::istringstream ss{s};
    std::string item;
    while (std::getline(ss, item, sep))
      result.push_back(item);
    if (!s.empty() && s.back() == sep)
      result.push_back(std::string());
    return result;
  }

}
