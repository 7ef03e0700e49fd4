#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK
#endif

#include <boost/test/unit_test.hpp>

#include "dolog.hh"

static bool init_unit_test()
{
  /* keep the test output readable */
  proxyproto::logging::LoggingConfiguration::setSyslog(false);
  return true;
}

// entry point:
int main(int argc, char* argv[])
{
  setenv("BOOST_TEST_RANDOM", "1", 1); // NOLINT(concurrency-mt-unsafe)
  return boost::unit_test::unit_test_main(&init_unit_test, argc, argv);
}
