#include <gtest/gtest.h>

#include "switches.hh"

TEST(Switches, ValuesAndDefaults) {
  std::vector<std::string> switches = { "--degree=5", "--fit=lsq", "--tolerance=1e-4", "--shell" };
  size_t degree;
  std::string fit;
  double tolerance, smoothness;
  EXPECT_TRUE(parseSwitch<size_t>(switches, "degree", &degree, 3));
  EXPECT_EQ(degree, 5u);
  EXPECT_TRUE(parseSwitch<std::string>(switches, "fit", &fit, "kernel"));
  EXPECT_EQ(fit, "lsq");
  EXPECT_TRUE(parseSwitch<double>(switches, "tolerance", &tolerance, 1e-6));
  EXPECT_DOUBLE_EQ(tolerance, 1e-4);
  EXPECT_FALSE(parseSwitch<double>(switches, "smoothness", &smoothness, 0.25));
  EXPECT_DOUBLE_EQ(smoothness, 0.25);
  EXPECT_TRUE(parseSwitch<bool>(switches, "shell"));
  EXPECT_FALSE(parseSwitch<bool>(switches, "ruled"));
}

TEST(Switches, NameMustMatchExactly) {
  std::vector<std::string> switches = { "--no-compatibility", "--fitness=2" };
  EXPECT_FALSE(parseSwitch<bool>(switches, "no-c"));
  EXPECT_FALSE(parseSwitch<bool>(switches, "fit"));
  EXPECT_TRUE(parseSwitch<bool>(switches, "no-compatibility"));
  EXPECT_EQ(switchName("--fitness=2"), "fitness");
  EXPECT_EQ(switchName("-x"), "");
}

TEST(Switches, BoolValues) {
  bool value;
  parseSwitch<bool>({ "--check=off" }, "check", &value, true);
  EXPECT_FALSE(value);
  parseSwitch<bool>({ "--check" }, "check", &value, true);
  EXPECT_TRUE(value);
  parseSwitch<bool>({ "--check=1" }, "check", &value, false);
  EXPECT_TRUE(value);
}

TEST(Switches, CollectRejectsUnknown) {
  const char *args[] = { "bladeloft", "case", "label", "--shell", "--fit=lsq" };
  auto argv = const_cast<char **>(args);
  auto switches = collectSwitches(5, argv, 3, { "shell", "fit" });
  EXPECT_EQ(switches.size(), 2u);
  EXPECT_THROW(collectSwitches(5, argv, 2, { "shell", "fit" }), std::invalid_argument);
  EXPECT_THROW(collectSwitches(5, argv, 3, { "shell" }), std::invalid_argument);
}

TEST(Switches, Flags) {
  std::vector<std::string> switches = { "--shell", "--ruled=false", "--no-check=0", "--no-close=yes" };
  EXPECT_TRUE(parseFlag(switches, "shell"));
  EXPECT_FALSE(parseFlag(switches, "ruled"));
  EXPECT_FALSE(parseFlag(switches, "no-check"));
  EXPECT_TRUE(parseFlag(switches, "no-close"));
  EXPECT_FALSE(parseFlag(switches, "no-compatibility"));
}
