#ifndef MLFQ_SIM_CONFIG_TEST_HPP
#define MLFQ_SIM_CONFIG_TEST_HPP

#include <cppunit/TestFixture.h>

namespace CppUnit { class Test; }

class ConfigTest : public CppUnit::TestFixture {
public:
  void setUp() override;
  void tearDown() override;

  void test_defaults();
  void test_parse_policies();
  void test_parse_quanta();
  void test_default_quanta();
  void test_env_overrides();
  void test_env_levels_regenerates_quanta();
  void test_env_quanta_sets_levels();
  void test_env_ignores_bad_values();
  void test_env_clamps_levels();
  void test_base_levels_clamped();
  void test_env_long_quanta_truncated();

  static CppUnit::Test* Suite();
};

#endif // MLFQ_SIM_CONFIG_TEST_HPP
