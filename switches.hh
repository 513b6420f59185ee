#pragma once

#include <stdexcept>
#include <string>
#include <vector>

template <typename T>
T extractValue(std::string str) {
  throw std::runtime_error("extractValue not defined for this type");
}

template <> int extractValue(std::string str);
template <> size_t extractValue(std::string str);
template <> double extractValue(std::string str);
template <> bool extractValue(std::string str);
template <> std::string extractValue(std::string str);

// Switch name of a `--name` or `--name=value` argument
std::string switchName(const std::string &sw);

// Collects argv[first..] as switches; throws std::invalid_argument on
// anything that is not of the form `--name[=value]` or whose name is not
// in `known`.
std::vector<std::string> collectSwitches(int argc, char **argv, int first,
                                         const std::vector<std::string> &known);

// Returns true when `--s` is present. A bare `--s` sets *value to
// default_value, `--s=x` sets it to x; a missing switch also gives the default.
template <typename T>
bool parseSwitch(const std::vector<std::string> &switches, std::string s,
                 T *value = nullptr, T default_value = T()) {
  size_t length = s.size();
  for (const auto &sw : switches)
    if (switchName(sw) == s) {
      if (value) {
        if (sw.size() > length + 2 && sw[length+2] == '=')
          *value = extractValue<T>(sw.substr(length + 3));
        else
          *value = default_value;
      }
      return true;
    }
  if (value)
    *value = default_value;
  return false;
}

// On/off switch: `--s` and `--s=yes` are on, `--s=no` and a missing switch are off
bool parseFlag(const std::vector<std::string> &switches, std::string s);
