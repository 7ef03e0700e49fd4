#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#include <boost/test/unit_test.hpp>

#include <iostream>
#include <sstream>

#include "dolog.hh"
#include "proxy-protocol-handler.hh"
#include "proxy-protocol-metrics.hh"
#include "proxyproto-configuration.hh"

using namespace boost;
using namespace proxyproto;

/* every test starts from, and goes back to, the default configuration */
struct ConfigurationFixture
{
  ConfigurationFixture()
  {
    reset();
  }
  ~ConfigurationFixture()
  {
    reset();
  }
  ConfigurationFixture(const ConfigurationFixture&) = delete;
  ConfigurationFixture(ConfigurationFixture&&) = delete;
  ConfigurationFixture& operator=(const ConfigurationFixture&) = delete;
  ConfigurationFixture& operator=(ConfigurationFixture&&) = delete;

  static void reset()
  {
    configuration::updateRuntimeConfiguration([](configuration::RuntimeConfiguration& config) {
      config = configuration::RuntimeConfiguration();
    });
    logging::LoggingConfiguration::setSyslog(false);
    logging::LoggingConfiguration::setLogTimestamps(false);
    logging::LoggingConfiguration::setStructuredLogging(false);
  }
};

BOOST_FIXTURE_TEST_SUITE(test_proxy_protocol_handler_cc, ConfigurationFixture)

static const ComboAddress s_remote("192.0.2.1:4242");

static PacketBuffer toBuffer(const std::string& str)
{
  return PacketBuffer(str.begin(), str.end());
}

BOOST_AUTO_TEST_CASE(test_defaults)
{
  const auto config = configuration::getCurrentRuntimeConfiguration();
  BOOST_CHECK_EQUAL(config.d_proxyProtocolMaximumSize, 512U);
  BOOST_CHECK(config.d_acceptV1);
  BOOST_CHECK(config.d_acceptV2);
  BOOST_CHECK(config.d_verifyChecksum);
  BOOST_CHECK(!config.d_verbose);

  configuration::updateRuntimeConfiguration([](configuration::RuntimeConfiguration& runtime) {
    runtime.d_acceptV1 = false;
  });
  BOOST_CHECK(!configuration::getCurrentRuntimeConfiguration().d_acceptV1);

  /* a mutator that throws does not change anything */
  BOOST_CHECK_THROW(configuration::updateRuntimeConfiguration([](configuration::RuntimeConfiguration& runtime) {
    runtime.d_acceptV2 = false;
    throw std::runtime_error("nope");
  }),
                    std::runtime_error);
  BOOST_CHECK(configuration::getCurrentRuntimeConfiguration().d_acceptV2);
}

BOOST_AUTO_TEST_CASE(test_yaml)
{
  BOOST_REQUIRE(configuration::loadConfigurationFromYAMLString(R"(
maximum-size: 128
accept-v1: false
verify-checksum: false
verbose: true
log-timestamps: true
)"));
  auto config = configuration::getCurrentRuntimeConfiguration();
  BOOST_CHECK_EQUAL(config.d_proxyProtocolMaximumSize, 128U);
  BOOST_CHECK(!config.d_acceptV1);
  BOOST_CHECK(config.d_acceptV2);
  BOOST_CHECK(!config.d_verifyChecksum);
  BOOST_CHECK(config.d_verbose);
  BOOST_CHECK(logging::LoggingConfiguration::getLogTimestamps());

  /* an empty document changes nothing */
  BOOST_CHECK(configuration::loadConfigurationFromYAMLString(""));
  BOOST_CHECK_EQUAL(configuration::getCurrentRuntimeConfiguration().d_proxyProtocolMaximumSize, 128U);

  BOOST_CHECK(configuration::loadConfigurationFromYAMLString("structured-logging: true"));
  BOOST_CHECK(logging::LoggingConfiguration::getStructuredLogging());
  BOOST_CHECK_EQUAL(logging::LoggingConfiguration::getStructuredLoggingLevelPrefix(), "prio");
}

BOOST_AUTO_TEST_CASE(test_yaml_invalid)
{
  /* not a map */
  BOOST_CHECK(!configuration::loadConfigurationFromYAMLString("- maximum-size"));
  /* not YAML */
  BOOST_CHECK(!configuration::loadConfigurationFromYAMLString("maximum-size: [1"));
  /* unknown setting */
  BOOST_CHECK(!configuration::loadConfigurationFromYAMLString("maximum-sizes: 128"));
  /* wrong types */
  BOOST_CHECK(!configuration::loadConfigurationFromYAMLString("maximum-size: lots"));
  BOOST_CHECK(!configuration::loadConfigurationFromYAMLString("accept-v1: maybe"));
  BOOST_CHECK(!configuration::loadConfigurationFromYAMLString("maximum-size: 0"));
  BOOST_CHECK(!configuration::loadConfigurationFromYAML("/nonexistent/proxyproto.yml"));

  /* one invalid value and nothing is applied */
  BOOST_CHECK(!configuration::loadConfigurationFromYAMLString(R"(
maximum-size: 64
accept-v2: false
verify-checksum: sometimes
)"));
  const auto config = configuration::getCurrentRuntimeConfiguration();
  BOOST_CHECK_EQUAL(config.d_proxyProtocolMaximumSize, 512U);
  BOOST_CHECK(config.d_acceptV2);
  BOOST_CHECK(config.d_verifyChecksum);
}

BOOST_AUTO_TEST_CASE(test_consumes_header)
{
  const std::string payload("GET / HTTP/1.1\r\n");
  const auto parsedBefore = metrics::g_stats.headersParsed.load();
  const auto v1Before = metrics::g_stats.v1Headers.load();
  const auto v2Before = metrics::g_stats.v2Headers.load();

  auto buffer = toBuffer("PROXY TCP4 192.0.2.2 198.51.100.1 56324 443\r\n" + payload);
  auto result = handleProxyProtocol(s_remote, buffer);
  BOOST_REQUIRE(result.isComplete());
  BOOST_CHECK_EQUAL(getVersion(result.getHeader()), 1U);
  BOOST_CHECK_EQUAL(getAddresses(result.getHeader()).getSource().toStringWithPort(), "192.0.2.2:56324");
  BOOST_CHECK(buffer == toBuffer(payload));

  buffer = toBuffer(makeProxyHeader(true, ComboAddress("[2001:db8::1]:1234"), ComboAddress("[2001:db8::2]:443"), {}) + payload);
  result = handleProxyProtocol(s_remote, buffer);
  BOOST_REQUIRE(result.isComplete());
  BOOST_CHECK_EQUAL(getVersion(result.getHeader()), 2U);
  BOOST_CHECK(buffer == toBuffer(payload));

  BOOST_CHECK_EQUAL(metrics::g_stats.headersParsed.load(), parsedBefore + 2);
  BOOST_CHECK_EQUAL(metrics::g_stats.v1Headers.load(), v1Before + 1);
  BOOST_CHECK_EQUAL(metrics::g_stats.v2Headers.load(), v2Before + 1);

  const auto localBefore = metrics::g_stats.localCommands.load();
  buffer = toBuffer(makeLocalProxyHeader());
  result = handleProxyProtocol(s_remote, buffer);
  BOOST_REQUIRE(result.isComplete());
  BOOST_CHECK(buffer.empty());
  BOOST_CHECK_EQUAL(metrics::g_stats.localCommands.load(), localBefore + 1);
}

BOOST_AUTO_TEST_CASE(test_partial_and_invalid)
{
  const auto partialBefore = metrics::g_stats.partialReads.load();
  auto buffer = toBuffer("PROXY TCP4 192.0.2.2");
  const auto copy = buffer;
  auto result = handleProxyProtocol(s_remote, buffer);
  BOOST_CHECK(result.isPartial());
  BOOST_CHECK(buffer == copy);
  BOOST_CHECK_EQUAL(metrics::g_stats.partialReads.load(), partialBefore + 1);

  const auto invalidBefore = metrics::g_stats.proxyProtocolInvalid.load();
  buffer = toBuffer("HELO example.com\r\n");
  result = handleProxyProtocol(s_remote, buffer);
  BOOST_REQUIRE(result.isInvalid());
  BOOST_CHECK(result.getError() == ErrorKind::InvalidSignature);
  BOOST_CHECK_EQUAL(buffer.size(), 18U);
  BOOST_CHECK_EQUAL(metrics::g_stats.proxyProtocolInvalid.load(), invalidBefore + 1);
}

BOOST_AUTO_TEST_CASE(test_maximum_size)
{
  configuration::updateRuntimeConfiguration([](configuration::RuntimeConfiguration& config) {
    config.d_proxyProtocolMaximumSize = 32;
  });
  const auto oversizedBefore = metrics::g_stats.oversizedHeaders.load();

  /* complete, but too large */
  auto buffer = toBuffer("PROXY TCP4 192.0.2.2 198.51.100.1 56324 443\r\n");
  auto result = handleProxyProtocol(s_remote, buffer);
  BOOST_REQUIRE(result.isInvalid());
  BOOST_CHECK(result.getError() == ErrorKind::HeaderTooLong);

  /* the announced length is already too large, no need to wait */
  Version2Builder builder(Command::Proxy, Protocol::Stream, ComboAddress("192.0.2.2:1234"), ComboAddress("198.51.100.1:443"));
  builder.writeAuthority("a-rather-long-authority.example.com");
  buffer = toBuffer(builder.build().substr(0, 16));
  result = handleProxyProtocol(s_remote, buffer);
  BOOST_REQUIRE(result.isInvalid());
  BOOST_CHECK(result.getError() == ErrorKind::HeaderTooLong);

  BOOST_CHECK_EQUAL(metrics::g_stats.oversizedHeaders.load(), oversizedBefore + 2);

  /* a small one still goes through */
  buffer = toBuffer(makeLocalProxyHeader());
  BOOST_CHECK(handleProxyProtocol(s_remote, buffer).isComplete());
}

/* captures what is written to std::cout while it is alive */
struct CoutCapture
{
  CoutCapture() :
    d_previous(std::cout.rdbuf(d_output.rdbuf()))
  {
  }
  ~CoutCapture()
  {
    std::cout.rdbuf(d_previous);
  }
  CoutCapture(const CoutCapture&) = delete;
  CoutCapture(CoutCapture&&) = delete;
  CoutCapture& operator=(const CoutCapture&) = delete;
  CoutCapture& operator=(CoutCapture&&) = delete;

  [[nodiscard]] std::string get() const
  {
    return d_output.str();
  }

private:
  std::ostringstream d_output;
  std::streambuf* d_previous;
};

BOOST_AUTO_TEST_CASE(test_maximum_size_logging)
{
  configuration::updateRuntimeConfiguration([](configuration::RuntimeConfiguration& config) {
    config.d_proxyProtocolMaximumSize = 32;
    config.d_verbose = true;
  });

  /* 45 bytes */
  auto buffer = toBuffer("PROXY TCP4 192.0.2.2 198.51.100.1 56324 443\r\n");
  std::string logged;
  {
    CoutCapture capture;
    auto result = handleProxyProtocol(s_remote, buffer);
    BOOST_CHECK(result.getError() == ErrorKind::HeaderTooLong);
    logged = capture.get();
  }
  BOOST_CHECK_MESSAGE(logged.find("is 45 bytes") != std::string::npos, logged);
  BOOST_CHECK_MESSAGE(logged.find("maximum size (32)") != std::string::npos, logged);
}

BOOST_AUTO_TEST_CASE(test_version_rejected)
{
  BOOST_REQUIRE(configuration::loadConfigurationFromYAMLString("accept-v1: false"));
  const auto rejectedBefore = metrics::g_stats.versionRejected.load();

  auto buffer = toBuffer("PROXY UNKNOWN\r\n");
  auto result = handleProxyProtocol(s_remote, buffer);
  BOOST_REQUIRE(result.isInvalid());
  BOOST_CHECK(result.getError() == ErrorKind::VersionNotAccepted);
  BOOST_CHECK_EQUAL(buffer.size(), 15U);

  buffer = toBuffer(makeLocalProxyHeader());
  BOOST_CHECK(handleProxyProtocol(s_remote, buffer).isComplete());

  BOOST_CHECK_EQUAL(metrics::g_stats.versionRejected.load(), rejectedBefore + 1);
}

BOOST_AUTO_TEST_CASE(test_checksum)
{
  Version2Builder builder(Command::Proxy, Protocol::Stream, ComboAddress("192.0.2.2:1234"), ComboAddress("198.51.100.1:443"));
  builder.addChecksum();
  auto header = builder.build();

  auto buffer = toBuffer(header);
  BOOST_CHECK(handleProxyProtocol(s_remote, buffer).isComplete());

  /* corrupt the source address */
  header.at(16) = static_cast<char>(header.at(16) ^ 0xFF);
  const auto failuresBefore = metrics::g_stats.checksumFailures.load();
  buffer = toBuffer(header);
  auto result = handleProxyProtocol(s_remote, buffer);
  BOOST_REQUIRE(result.isInvalid());
  BOOST_CHECK(result.getError() == ErrorKind::ChecksumMismatch);
  BOOST_CHECK_EQUAL(metrics::g_stats.checksumFailures.load(), failuresBefore + 1);

  /* unless verification has been disabled */
  configuration::updateRuntimeConfiguration([](configuration::RuntimeConfiguration& config) {
    config.d_verifyChecksum = false;
  });
  buffer = toBuffer(header);
  BOOST_CHECK(handleProxyProtocol(s_remote, buffer).isComplete());
}

BOOST_AUTO_TEST_SUITE_END()
