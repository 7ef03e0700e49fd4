#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#include <boost/test/unit_test.hpp>

#include <memory>

#include "proxy-protocol-v1.hh"

using namespace boost;
using namespace proxyproto;

BOOST_AUTO_TEST_SUITE(test_proxy_protocol_v1_cc)

static ErrorKind parseError(const std::string& header)
{
  auto result = parseVersion1Header(header);
  BOOST_REQUIRE_MESSAGE(result.isInvalid(), "'" << header << "' should have been refused");
  return result.getError();
}

BOOST_AUTO_TEST_CASE(test_build)
{
  {
    Version1Header header(ProxyAddresses(ComboAddress("192.168.0.1:56324"), ComboAddress("192.168.0.11:443")));
    BOOST_CHECK_EQUAL(header.toString(), "PROXY TCP4 192.168.0.1 192.168.0.11 56324 443\r\n");
    BOOST_CHECK(!header.isUnknown());
  }

  {
    Version1Header header(ProxyAddresses(ComboAddress("[2001:db8::1]:0"), ComboAddress("[::1]:65535")));
    BOOST_CHECK_EQUAL(header.toString(), "PROXY TCP6 2001:db8::1 ::1 0 65535\r\n");
  }

  {
    Version1Header header{ProxyAddresses()};
    BOOST_CHECK_EQUAL(header.toString(), "PROXY UNKNOWN\r\n");
    BOOST_CHECK(header.isUnknown());
  }

  {
    /* no room for UNIX sockets in the text format */
    Version1Header header(ProxyAddresses(ProxyAddresses::makeUnixAddress("/a"), ProxyAddresses::makeUnixAddress("/b")));
    BOOST_CHECK_EQUAL(header.toString(), "PROXY UNKNOWN\r\n");
    BOOST_CHECK(header.getAddresses().isUnspecified());
  }

  {
    /* the longest possible header still fits */
    Version1Header header(ProxyAddresses(ComboAddress("[ffff:ffff:ffff:ffff:ffff:ffff:ffff:fffe]:65535"), ComboAddress("[ffff:ffff:ffff:ffff:ffff:ffff:ffff:ffff]:65535")));
    BOOST_CHECK_LE(header.toString().size(), s_proxyProtocolV1MaximumSize);
    auto result = parseVersion1Header(header.toString());
    BOOST_REQUIRE(result.isComplete());
    BOOST_CHECK(result.getHeader() == header);
  }
}

BOOST_AUTO_TEST_CASE(test_roundtrip)
{
  const std::vector<ProxyAddresses> addresses{
    ProxyAddresses(),
    ProxyAddresses(ComboAddress("0.0.0.0:0"), ComboAddress("255.255.255.255:65535")),
    ProxyAddresses(ComboAddress("10.0.0.1:1"), ComboAddress("10.0.0.2:2")),
    ProxyAddresses(ComboAddress("[2001:db8::1]:4242"), ComboAddress("[2001:db8::2]:53")),
    ProxyAddresses(ComboAddress("[::ffff:192.0.2.1]:80"), ComboAddress("[::]:8080")),
  };

  for (const auto& address : addresses) {
    Version1Header built(address);
    auto result = parseVersion1Header(built.toString());
    BOOST_REQUIRE(result.isComplete());
    BOOST_CHECK_EQUAL(result.getConsumed(), built.toString().size());
    BOOST_CHECK(result.getHeader().getAddresses() == address);
    BOOST_CHECK_EQUAL(result.getHeader().toString(), built.toString());
  }
}

BOOST_AUTO_TEST_CASE(test_parse)
{
  {
    auto result = parseVersion1Header(std::string("PROXY TCP4 192.168.0.1 192.168.0.11 56324 443\r\nGET / HTTP/1.1\r\n"));
    BOOST_REQUIRE(result.isComplete());
    BOOST_CHECK_EQUAL(result.getConsumed(), 47U);
    const auto& addresses = result.getHeader().getAddresses();
    BOOST_CHECK(addresses.getSource() == ComboAddress("192.168.0.1:56324"));
    BOOST_CHECK(addresses.getDestination() == ComboAddress("192.168.0.11:443"));
    BOOST_CHECK_EQUAL(result.getHeader().toString(), "PROXY TCP4 192.168.0.1 192.168.0.11 56324 443\r\n");
  }

  {
    /* anything after UNKNOWN is ignored */
    auto result = parseVersion1Header(std::string("PROXY UNKNOWN ffff:f...f:ffff ffff:f...f:ffff 65535 65535\r\n"));
    BOOST_REQUIRE(result.isComplete());
    BOOST_CHECK(result.getHeader().isUnknown());
    BOOST_CHECK_EQUAL(result.getConsumed(), 59U);
  }

  {
    /* the parsed header does not depend on the input buffer */
    auto input = std::make_unique<std::string>("PROXY TCP6 2001:db8::1 2001:db8::2 1 2\r\n");
    auto result = parseVersion1Header(*input);
    input.reset();
    BOOST_REQUIRE(result.isComplete());
    BOOST_CHECK_EQUAL(result.getHeader().toString(), "PROXY TCP6 2001:db8::1 2001:db8::2 1 2\r\n");
  }
}

BOOST_AUTO_TEST_CASE(test_incomplete)
{
  for (const std::string partial : {"", "PRO", "PROXY ", "PROXY TCP4 192.168.0.1", "PROXY TCP4 192.168.0.1 192.168.0.11 56324 443", "PROXY TCP4 192.168.0.1 192.168.0.11 56324 443\r"}) {
    auto result = parseVersion1Header(partial);
    BOOST_CHECK_MESSAGE(result.isPartial(), "'" << partial << "' should be partial");
    BOOST_CHECK_GT(result.getMissing(), 0U);
  }

  BOOST_CHECK_EQUAL(parseVersion1Header(std::string("PROXY UNKNOWN\r")).getMissing(), 1U);
}

BOOST_AUTO_TEST_CASE(test_too_long)
{
  std::string header("PROXY UNKNOWN ");
  header.append(s_proxyProtocolV1MaximumSize - header.size() - 2, 'a');
  header.append("\r\n");
  BOOST_REQUIRE_EQUAL(header.size(), s_proxyProtocolV1MaximumSize);
  BOOST_CHECK(parseVersion1Header(header).isComplete());

  std::string tooLong("PROXY UNKNOWN ");
  tooLong.append(s_proxyProtocolV1MaximumSize - tooLong.size() - 1, 'a');
  tooLong.append("\r\n");
  BOOST_CHECK(parseError(tooLong) == ErrorKind::HeaderTooLong);

  /* no need to wait for the CRLF once the limit is reached */
  std::string noCRLF("PROXY TCP4 ");
  noCRLF.append(200, '1');
  BOOST_CHECK(parseError(noCRLF) == ErrorKind::HeaderTooLong);
}

BOOST_AUTO_TEST_CASE(test_invalid)
{
  BOOST_CHECK(parseError("proxy TCP4 192.168.0.1 192.168.0.11 56324 443\r\n") == ErrorKind::InvalidSignature);
  BOOST_CHECK(parseError("PROXY\tTCP4") == ErrorKind::InvalidSignature);
  BOOST_CHECK(parseError("XPROXY") == ErrorKind::InvalidSignature);

  BOOST_CHECK(parseError("PROXY TCP5 192.168.0.1 192.168.0.11 56324 443\r\n") == ErrorKind::InvalidProtocol);
  BOOST_CHECK(parseError("PROXY tcp4 192.168.0.1 192.168.0.11 56324 443\r\n") == ErrorKind::InvalidProtocol);
  BOOST_CHECK(parseError("PROXY UNKNOWNX\r\n") == ErrorKind::InvalidProtocol);
  BOOST_CHECK(parseError("PROXY \r\n") == ErrorKind::InvalidProtocol);

  BOOST_CHECK(parseError("PROXY TCP4\r\n") == ErrorKind::MalformedHeader);
  BOOST_CHECK(parseError("PROXY TCP4 192.168.0.1 192.168.0.11 56324\r\n") == ErrorKind::MalformedHeader);
  BOOST_CHECK(parseError("PROXY TCP4 192.168.0.1 192.168.0.11 56324 443 80\r\n") == ErrorKind::MalformedHeader);
  BOOST_CHECK(parseError("PROXY TCP4  192.168.0.1 192.168.0.11 56324 443\r\n") == ErrorKind::MalformedHeader);
  BOOST_CHECK(parseError("PROXY TCP4 192.168.0.1 192.168.0.11 56324 443 \r\n") == ErrorKind::MalformedHeader);
  BOOST_CHECK(parseError("PROXY TCP4 192.168.0.1 192.168.0.11 56324 443\n") == ErrorKind::MalformedHeader);
  BOOST_CHECK(parseError("PROXY TCP4 192.168.0.1\r192.168.0.11 56324 443\r\n") == ErrorKind::MalformedHeader);

  BOOST_CHECK(parseError("PROXY TCP4 192.168.0.01 192.168.0.11 56324 443\r\n") == ErrorKind::MalformedAddress);
  BOOST_CHECK(parseError("PROXY TCP4 2001:db8::1 192.168.0.11 56324 443\r\n") == ErrorKind::MalformedAddress);
  BOOST_CHECK(parseError("PROXY TCP6 192.168.0.1 2001:db8::1 56324 443\r\n") == ErrorKind::MalformedAddress);
  BOOST_CHECK(parseError("PROXY TCP4 192.168.0.256 192.168.0.11 56324 443\r\n") == ErrorKind::MalformedAddress);

  BOOST_CHECK(parseError("PROXY TCP4 192.168.0.1 192.168.0.11 08080 443\r\n") == ErrorKind::MalformedPort);
  BOOST_CHECK(parseError("PROXY TCP4 192.168.0.1 192.168.0.11 56324 05\r\n") == ErrorKind::MalformedPort);
  BOOST_CHECK(parseError("PROXY TCP4 192.168.0.1 192.168.0.11 65536 443\r\n") == ErrorKind::MalformedPort);
  BOOST_CHECK(parseError("PROXY TCP4 192.168.0.1 192.168.0.11 -1 443\r\n") == ErrorKind::MalformedPort);
}

BOOST_AUTO_TEST_SUITE_END()
