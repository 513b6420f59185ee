#include <algorithm>

#include "switches.hh"

template <>
int extractValue(std::string str) {
  return std::atoi(str.c_str());
}

template <>
size_t extractValue(std::string str) {
  return std::atoi(str.c_str());
}

template <>
double extractValue(std::string str) {
  return std::strtod(str.c_str(), nullptr);
}

template <>
bool extractValue(std::string str) {
  return !(str == "0" || str == "false" || str == "no" || str == "off");
}

template <>
std::string extractValue(std::string str) {
  return str;
}

std::string switchName(const std::string &sw) {
  if (sw.size() < 3 || sw[0] != '-' || sw[1] != '-')
    return "";
  auto eq = sw.find('=');
  if (eq == std::string::npos)
    return sw.substr(2);
  return sw.substr(2, eq - 2);
}

std::vector<std::string> collectSwitches(int argc, char **argv, int first,
                                         const std::vector<std::string> &known) {
  std::vector<std::string> switches;
  for (int i = first; i < argc; ++i) {
    std::string sw = argv[i];
    auto name = switchName(sw);
    if (name.empty())
      throw std::invalid_argument("Invalid switch: " + sw);
    if (std::find(known.begin(), known.end(), name) == known.end())
      throw std::invalid_argument("Unknown switch: " + sw);
    switches.push_back(sw);
  }
  return switches;
}

bool parseFlag(const std::vector<std::string> &switches, std::string s) {
  bool value;
  return parseSwitch<bool>(switches, s, &value, true) && value;
}
