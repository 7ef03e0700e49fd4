#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#include <boost/test/unit_test.hpp>

#include "iputils.hh"
#include "proxy-protocol.hh"

using namespace boost;
using namespace proxyproto;
using std::string;

BOOST_AUTO_TEST_SUITE(test_proxy_protocol_cc)

#define BINARY(s) (std::string(s, sizeof(s) - 1))

#define PROXYMAGIC "\x0D\x0A\x0D\x0A\x00\x0D\x0A\x51\x55\x49\x54\x0A"

BOOST_AUTO_TEST_CASE(test_roundtrip)
{
  std::vector<Tlv> values;

  bool ptcp = true;
  ComboAddress src("65.66.67.68:18762"); // 18762 = 0x494a = "IJ"
  ComboAddress dest("69.70.71.72:19276"); // 19276 = 0x4b4c = "KL"
  auto proxyheader = makeProxyHeader(ptcp, src, dest, values);

  BOOST_CHECK_EQUAL(proxyheader, BINARY(PROXYMAGIC "\x21" // version | command
                                                   "\x11" // ipv4=0x10 | TCP=0x1
                                                   "\x00\x0c" // 4 bytes IPv4 * 2 + 2 port numbers = 8 + 2 * 2 =12 = 0xc
                                                   "ABCD" // 65.66.67.68
                                                   "EFGH" // 69.70.71.72
                                                   "IJ" // src port
                                                   "KL" // dst port
                                                   ));

  auto result = parseProxyHeader(proxyheader);
  BOOST_REQUIRE(result.isComplete());
  BOOST_CHECK_EQUAL(result.getConsumed(), 28U);
  BOOST_CHECK_EQUAL(isProxyHeaderComplete(proxyheader), 28);

  const auto& header = std::get<Version2Header>(result.getHeader());
  BOOST_CHECK(header.getCommand() == Command::Proxy);
  BOOST_CHECK(header.getProtocol() == Protocol::Stream);
  BOOST_CHECK(header.getAddresses().getSource() == src);
  BOOST_CHECK(header.getAddresses().getDestination() == dest);
}

BOOST_AUTO_TEST_CASE(test_local_proxy_header)
{
  auto payload = makeLocalProxyHeader();

  BOOST_CHECK_EQUAL(payload, BINARY(PROXYMAGIC "\x20" // version | command
                                               "\x00" // protocol family and address are set to 0
                                               "\x00\x00" // no content
                                               ));

  auto result = parseProxyHeader(payload);
  BOOST_REQUIRE(result.isComplete());
  BOOST_CHECK_EQUAL(result.getConsumed(), 16U);

  const auto& header = std::get<Version2Header>(result.getHeader());
  BOOST_CHECK(header.isLocal());
  BOOST_CHECK(header.getProtocol() == Protocol::Unspecified);
  BOOST_CHECK(header.getAddresses().isUnspecified());
  BOOST_CHECK_EQUAL(header.getValues().size(), 0U);
}

BOOST_AUTO_TEST_CASE(test_tlv_values_content_len_signedness)
{
  std::string largeValue;
  /* this value will make the content length parsing fail in case of signedness mistake */
  largeValue.resize(65128, 'A');
  const std::vector<Tlv> values = {{uint8_t(0), "foo"}, {uint8_t(255), largeValue}};

  const bool tcp = false;
  const ComboAddress src("[2001:db8::1]:0");
  const ComboAddress dest("[::1]:65535");
  const auto payload = makeProxyHeader(tcp, src, dest, values);

  auto result = parseProxyHeader(payload);
  BOOST_REQUIRE(result.isComplete());
  BOOST_CHECK_EQUAL(result.getConsumed(), 16U + 36U + 6U + 65131U);

  const auto& header = std::get<Version2Header>(result.getHeader());
  BOOST_CHECK(header.getProtocol() == Protocol::Datagram);
  BOOST_CHECK(header.getAddresses().getSource() == src);
  BOOST_CHECK(header.getAddresses().getDestination() == dest);
  BOOST_REQUIRE_EQUAL(header.getValues().size(), values.size());
  for (size_t idx = 0; idx < values.size(); idx++) {
    BOOST_CHECK_EQUAL(header.getValues().at(idx).type, values.at(idx).type);
    BOOST_CHECK_EQUAL(header.getValues().at(idx).content, values.at(idx).content);
  }
}

BOOST_AUTO_TEST_CASE(test_tlv_values_length_signedness)
{
  std::string largeValue;
  /* this value will make the TLV length parsing fail in case of signedness mistake */
  largeValue.resize(65000, 'A');
  const std::vector<Tlv> values = {{uint8_t(0), "foo"}, {uint8_t(255), largeValue}};

  const bool tcp = false;
  const ComboAddress src("[2001:db8::1]:0");
  const ComboAddress dest("[::1]:65535");
  const auto payload = makeProxyHeader(tcp, src, dest, values);

  auto result = parseProxyHeader(payload);
  BOOST_REQUIRE(result.isComplete());
  BOOST_CHECK_EQUAL(result.getConsumed(), 16U + 36U + 6U + 65003U);

  const auto& header = std::get<Version2Header>(result.getHeader());
  BOOST_REQUIRE_EQUAL(header.getValues().size(), values.size());
  for (size_t idx = 0; idx < values.size(); idx++) {
    BOOST_CHECK_EQUAL(header.getValues().at(idx).type, values.at(idx).type);
    BOOST_CHECK_EQUAL(header.getValues().at(idx).content, values.at(idx).content);
  }
}

BOOST_AUTO_TEST_CASE(test_parsing_invalid_headers)
{
  const std::vector<Tlv> noValues;

  const bool tcp = false;
  const ComboAddress src("[2001:db8::1]:0");
  const ComboAddress dest("[::1]:65535");
  const auto payload = makeProxyHeader(tcp, src, dest, noValues);

  {
    /* just checking that everything works */
    BOOST_CHECK_EQUAL(isProxyHeaderComplete(payload), 52);
  }

  {
    /* too short (not even full header) */
    std::string truncated = payload;
    truncated.resize(15);
    BOOST_CHECK_EQUAL(isProxyHeaderComplete(truncated), -1);
  }

  {
    /* too short (missing address part) */
    std::string truncated = payload;
    truncated.resize(/* full header */ 16 + /* two IPv6s + port */ 36 - /* truncation */ 1);
    BOOST_CHECK_EQUAL(isProxyHeaderComplete(truncated), -1);
  }

  {
    /* too short (missing TLV) */
    const std::vector<Tlv> values = {{uint8_t(0), "foo"}, {uint8_t(255), "bar"}};
    const auto payloadWithValues = makeProxyHeader(tcp, src, dest, values);

    std::string truncated = payloadWithValues;
    truncated.resize(/* full header */ 16 + /* two IPv6s + port */ 36 + /* TLV 1 */ 6 + /* TLV 2 */ 6 - /* truncation */ 2);
    BOOST_CHECK_EQUAL(isProxyHeaderComplete(truncated), -2);
  }

  {
    /* invalid magic */
    std::string invalid = payload;
    invalid.at(4) = 42;
    BOOST_CHECK_EQUAL(isProxyHeaderComplete(invalid), 0);
    BOOST_CHECK(parseProxyHeader(invalid).getError() == ErrorKind::InvalidSignature);
  }

  {
    /* invalid version */
    std::string invalid = payload;
    invalid.at(12) = 0x10 | 0x01;
    BOOST_CHECK_EQUAL(isProxyHeaderComplete(invalid), 0);
    BOOST_CHECK(parseProxyHeader(invalid).getError() == ErrorKind::UnsupportedVersion);
  }

  {
    /* invalid command */
    std::string invalid = payload;
    invalid.at(12) = 0x20 | 0x02;
    BOOST_CHECK_EQUAL(isProxyHeaderComplete(invalid), 0);
    BOOST_CHECK(parseProxyHeader(invalid).getError() == ErrorKind::InvalidCommand);
  }

  {
    /* invalid family */
    std::string invalid = payload;
    invalid.at(13) = (0x04 << 4) | 0x01 /* STREAM */;
    BOOST_CHECK_EQUAL(isProxyHeaderComplete(invalid), 0);
    BOOST_CHECK(parseProxyHeader(invalid).getError() == ErrorKind::InvalidAddressFamily);
  }

  {
    /* invalid protocol */
    std::string invalid = payload;
    invalid.at(13) = (0x02 /* AF_INET6 */ << 4) | 0x03;
    BOOST_CHECK_EQUAL(isProxyHeaderComplete(invalid), 0);
    BOOST_CHECK(parseProxyHeader(invalid).getError() == ErrorKind::InvalidProtocol);
  }

  {
    /* TLV advertised len gets out of bounds */
    const std::vector<Tlv> values = {{uint8_t(0), "foo"}, {uint8_t(255), "bar"}};
    const auto payloadWithValues = makeProxyHeader(tcp, src, dest, values);
    std::string invalid = payloadWithValues;
    /* full header (16) + two IPv6s + port (36) + TLV (6) TLV 2 (6) */
    invalid.at(59) += 1;
    BOOST_CHECK_EQUAL(isProxyHeaderComplete(invalid), 0);
    BOOST_CHECK(parseProxyHeader(invalid).getError() == ErrorKind::TruncatedTlv);
  }
}

BOOST_AUTO_TEST_CASE(test_dispatch)
{
  {
    /* nothing yet */
    const std::string empty;
    auto result = parseProxyHeader(empty);
    BOOST_CHECK(result.isPartial());
    BOOST_CHECK_GT(result.getMissing(), 0U);
  }

  {
    const std::string text("PROXY UNKNOWN\r\n");
    auto result = parseProxyHeader(text);
    BOOST_REQUIRE(result.isComplete());
    BOOST_CHECK_EQUAL(getVersion(result.getHeader()), 1U);
    BOOST_CHECK(getAddresses(result.getHeader()).isUnspecified());
  }

  {
    auto result = parseProxyHeader(makeLocalProxyHeader());
    BOOST_REQUIRE(result.isComplete());
    BOOST_CHECK_EQUAL(getVersion(result.getHeader()), 2U);
  }

  {
    /* neither a v1 nor a v2 prefix */
    BOOST_CHECK(parseProxyHeader(std::string("GET / HTTP/1.1\r\n")).getError() == ErrorKind::InvalidSignature);
    BOOST_CHECK(parseProxyHeader(std::string("P")).isPartial());
    BOOST_CHECK(parseProxyHeader(std::string("\r\n\r")).isPartial());
    BOOST_CHECK(parseProxyHeader(std::string("\r\n\n")).getError() == ErrorKind::InvalidSignature);
    BOOST_CHECK(parseProxyHeader(std::string("proxy ")).getError() == ErrorKind::InvalidSignature);
  }
}

BOOST_AUTO_TEST_CASE(test_every_prefix_is_partial)
{
  const std::vector<std::string> headers{
    "PROXY UNKNOWN\r\n",
    "PROXY TCP4 192.168.0.1 192.168.0.11 56324 443\r\n",
    "PROXY TCP6 2001:db8::1 ::1 65535 0\r\n",
    makeLocalProxyHeader(),
    makeProxyHeader(true, ComboAddress("192.0.2.1:4242"), ComboAddress("192.0.2.2:53"), {{TlvType::ALPN, "h2"}, {TlvType::Authority, "example.com"}}),
  };

  for (const auto& header : headers) {
    for (size_t len = 0; len < header.size(); len++) {
      const auto prefix = header.substr(0, len);
      auto result = parseProxyHeader(prefix);
      BOOST_CHECK_MESSAGE(result.isPartial(), "prefix of size " << len << " of a " << header.size() << "-byte header is not partial");
      if (result.isPartial()) {
        /* never asks for more than the header actually needs */
        BOOST_CHECK_LE(len + result.getMissing(), header.size());
      }
    }

    /* trailing data is not part of the header */
    auto result = parseProxyHeader(header + "payload");
    BOOST_REQUIRE(result.isComplete());
    BOOST_CHECK_EQUAL(result.getConsumed(), header.size());
  }
}

BOOST_AUTO_TEST_CASE(test_parse_is_idempotent)
{
  const std::vector<std::string> inputs{
    "PROXY TCP4 192.168.0.1 192.168.0.11 56324 443\r\nGET /",
    "PROXY TCP4 192.168.0.1 192.168.0.11 056324 443\r\n",
    "PROXY TCP4 192.168.0",
    makeProxyHeader(false, ComboAddress("[2001:db8::1]:53"), ComboAddress("[2001:db8::2]:53"), {{uint8_t(0xE0), "custom"}}),
  };

  for (const auto& input : inputs) {
    const auto first = parseProxyHeader(input);
    const auto second = parseProxyHeader(input);
    BOOST_CHECK(first == second);
  }
}

BOOST_AUTO_TEST_CASE(test_scenarios)
{
  {
    auto result = parseProxyHeader(std::string("PROXY UNKNOWN\r\n"));
    BOOST_REQUIRE(result.isComplete());
    BOOST_CHECK_EQUAL(result.getConsumed(), 15U);
    BOOST_CHECK(std::get<Version1Header>(result.getHeader()).isUnknown());
  }

  {
    auto result = parseProxyHeader(std::string("PROXY TCP4 192.168.0.1 192.168.0.11 56324 443\r\n"));
    BOOST_REQUIRE(result.isComplete());
    BOOST_CHECK_EQUAL(result.getConsumed(), 47U);
    const auto& addresses = getAddresses(result.getHeader());
    BOOST_CHECK(addresses.getFamily() == AddressFamily::IPv4);
    BOOST_CHECK(addresses.getSource() == ComboAddress("192.168.0.1:56324"));
    BOOST_CHECK(addresses.getDestination() == ComboAddress("192.168.0.11:443"));
  }

  const auto v2 = BINARY(PROXYMAGIC "\x21\x11\x00\x0c"
                                    "\x7f\x00\x00\x01"
                                    "\x7f\x00\x00\x02"
                                    "\x03\xe8"
                                    "\x07\xd0");
  {
    auto result = parseProxyHeader(v2);
    BOOST_REQUIRE(result.isComplete());
    BOOST_CHECK_EQUAL(result.getConsumed(), 28U);
    const auto& header = std::get<Version2Header>(result.getHeader());
    BOOST_CHECK(header == Version2Header(Command::Proxy, Protocol::Stream, ProxyAddresses(ComboAddress("127.0.0.1:1000"), ComboAddress("127.0.0.2:2000"))));
  }

  {
    auto result = parseProxyHeader(v2.substr(0, 20));
    BOOST_REQUIRE(result.isPartial());
    BOOST_CHECK_EQUAL(result.getMissing(), 8U);
  }

  {
    /* L = 5, the only TLV claims 10 bytes of value */
    const auto truncated = BINARY(PROXYMAGIC "\x21\x01\x00\x05"
                                             "\x01\x00\x0a"
                                             "ab");
    auto result = parseProxyHeader(truncated);
    BOOST_REQUIRE(result.isInvalid());
    BOOST_CHECK(result.getError() == ErrorKind::TruncatedTlv);
  }

  {
    Version2Builder builder(0x21, Protocol::Stream, ProxyAddresses(ComboAddress("127.0.0.1:1000"), ComboAddress("127.0.0.2:2000")));
    const std::string tooLarge(70000, 'x');
    try {
      builder.writeTlv(uint8_t(0x01), tooLarge);
      BOOST_FAIL("A 70000-byte value should have been refused");
    }
    catch (const ProxyProtocolException& e) {
      BOOST_CHECK(e.getKind() == ErrorKind::TlvTooLarge);
    }
  }
}

BOOST_AUTO_TEST_SUITE_END()
