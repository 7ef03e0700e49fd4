#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#include <boost/test/unit_test.hpp>

#include "proxy-protocol.hh"

using namespace boost;
using namespace proxyproto;

BOOST_AUTO_TEST_SUITE(test_proxy_protocol_v2_cc)

#define BINARY(s) (std::string(s, sizeof(s) - 1))

#define PROXYMAGIC "\x0D\x0A\x0D\x0A\x00\x0D\x0A\x51\x55\x49\x54\x0A"

static const ProxyAddresses s_ipv4(ComboAddress("127.0.0.1:1000"), ComboAddress("127.0.0.2:2000"));
static const ProxyAddresses s_ipv6(ComboAddress("[2001:db8::1]:4242"), ComboAddress("[2001:db8::2]:443"));

BOOST_AUTO_TEST_CASE(test_build)
{
  Version2Builder builder(Command::Proxy, Protocol::Stream, s_ipv4);
  builder.writeALPN("h2");

  BOOST_CHECK_EQUAL(builder.build(), BINARY(PROXYMAGIC "\x21\x11\x00\x11"
                                                       "\x7f\x00\x00\x01"
                                                       "\x7f\x00\x00\x02"
                                                       "\x03\xe8"
                                                       "\x07\xd0"
                                                       "\x01\x00\x02"
                                                       "h2"));
  BOOST_CHECK_EQUAL(builder.getValuesSize(), 5U);

  Version2Builder datagram(Command::Proxy, Protocol::Datagram, s_ipv6);
  const auto payload = datagram.build();
  BOOST_CHECK_EQUAL(payload.size(), 16U + 36U);
  BOOST_CHECK_EQUAL(static_cast<uint8_t>(payload.at(13)), 0x22);
}

BOOST_AUTO_TEST_CASE(test_roundtrip)
{
  const std::vector<std::pair<Command, Protocol>> kinds{
    {Command::Proxy, Protocol::Stream},
    {Command::Proxy, Protocol::Datagram},
    {Command::Proxy, Protocol::Unspecified},
    {Command::Local, Protocol::Unspecified},
  };
  const std::vector<ProxyAddresses> addresses{
    ProxyAddresses(),
    s_ipv4,
    s_ipv6,
    ProxyAddresses(ProxyAddresses::makeUnixAddress("/run/client.sock"), ProxyAddresses::makeUnixAddress("/run/server.sock")),
  };

  for (const auto& [command, protocol] : kinds) {
    for (const auto& address : addresses) {
      Version2Builder builder(command, protocol, address);
      builder.writeTlv(uint8_t(0xE1), "first");
      builder.writeAuthority("example.com");
      builder.writeTlv(uint8_t(0xE1), "second");
      const auto payload = builder.build();

      auto result = parseVersion2Header(payload);
      BOOST_REQUIRE(result.isComplete());
      BOOST_CHECK_EQUAL(result.getConsumed(), payload.size());
      const auto& header = result.getHeader();
      BOOST_CHECK(header.getCommand() == command);
      BOOST_CHECK(header.getProtocol() == protocol);
      BOOST_CHECK(header.getAddresses() == address);
      BOOST_REQUIRE_EQUAL(header.getValues().size(), 3U);
      /* insertion order is kept */
      BOOST_CHECK_EQUAL(header.getValues().at(0).content, "first");
      BOOST_CHECK_EQUAL(header.getValues().at(2).content, "second");
      BOOST_CHECK_EQUAL(*header.getFirstValue(0xE1), "first");
      BOOST_CHECK_EQUAL(*header.getFirstValue(TlvType::Authority), "example.com");
      BOOST_CHECK(!header.getFirstValue(TlvType::ALPN));
      BOOST_CHECK(header == builder.getHeader());
      BOOST_CHECK_EQUAL(header.getRaw(), payload);
    }
  }
}

BOOST_AUTO_TEST_CASE(test_builder_limits)
{
  {
    Version2Builder builder(Command::Proxy, Protocol::Stream, s_ipv4);
    try {
      builder.writeTlv(uint8_t(0x01), std::string(70000, 'x'));
      BOOST_FAIL("A 70000-byte value should have been refused");
    }
    catch (const ProxyProtocolException& e) {
      BOOST_CHECK(e.getKind() == ErrorKind::TlvTooLarge);
    }
    /* nothing was added */
    BOOST_CHECK_EQUAL(builder.getValuesSize(), 0U);
  }

  {
    /* 65535 - 36 bytes are left for the values of an IPv6 header */
    Version2Builder builder(Command::Proxy, Protocol::Stream, s_ipv6);
    builder.writeTlv(uint8_t(0xE0), std::string(65535 - 36 - 3 - 3, 'x'));
    try {
      builder.writeTlv(uint8_t(0xE0), "a");
      BOOST_FAIL("Going over the maximum header size should have been refused");
    }
    catch (const ProxyProtocolException& e) {
      BOOST_CHECK(e.getKind() == ErrorKind::TooManyTlvBytes);
    }
    /* but this one fits exactly */
    builder.writeTlv(uint8_t(0xE0), "");
    BOOST_CHECK_EQUAL(builder.getValuesSize(), 65535U - 36U);

    const auto payload = builder.build();
    BOOST_CHECK_EQUAL(payload.size(), 16U + 65535U);
    auto result = parseVersion2Header(payload);
    BOOST_REQUIRE(result.isComplete());
    BOOST_CHECK_EQUAL(result.getHeader().getValues().size(), 2U);
  }

  {
    Version2Builder builder(Command::Proxy, Protocol::Stream, s_ipv4);
    BOOST_CHECK_NO_THROW(builder.writeUniqueID(std::string(128, 'u')));
    BOOST_CHECK_THROW(builder.writeUniqueID(std::string(129, 'u')), ProxyProtocolException);
  }

  try {
    Version2Builder builder(0x11, Protocol::Stream, s_ipv4);
    BOOST_FAIL("Version 1 should have been refused");
  }
  catch (const ProxyProtocolException& e) {
    BOOST_CHECK(e.getKind() == ErrorKind::UnsupportedVersion);
  }

  try {
    Version2Builder builder(0x2F, Protocol::Stream, s_ipv4);
    BOOST_FAIL("An invalid command should have been refused");
  }
  catch (const ProxyProtocolException& e) {
    BOOST_CHECK(e.getKind() == ErrorKind::InvalidCommand);
  }

  BOOST_CHECK_THROW(Version2Builder(Command::Proxy, Protocol::Stream, ComboAddress("127.0.0.1:53"), ComboAddress("[::1]:53")), ProxyProtocolException);
}

BOOST_AUTO_TEST_CASE(test_incomplete_and_early_rejection)
{
  const auto payload = Version2Builder(Command::Proxy, Protocol::Stream, s_ipv6).writeNetworkNamespace("blue").build();

  for (size_t len = 0; len < payload.size(); len++) {
    auto result = parseVersion2Header(payload.substr(0, len));
    BOOST_REQUIRE(result.isPartial());
    if (len >= s_proxyProtocolMinimumHeaderSize) {
      /* the exact size is known once the length has been read */
      BOOST_CHECK_EQUAL(len + result.getMissing(), payload.size());
    }
  }

  /* a wrong version is refused before the header is complete */
  auto wrongVersion = payload.substr(0, 13);
  wrongVersion.at(12) = 0x11;
  BOOST_CHECK(parseVersion2Header(wrongVersion).getError() == ErrorKind::UnsupportedVersion);

  auto wrongFamily = payload.substr(0, 14);
  wrongFamily.at(13) = 0x41;
  BOOST_CHECK(parseVersion2Header(wrongFamily).getError() == ErrorKind::InvalidAddressFamily);

  /* and a wrong signature as soon as the first wrong byte is there */
  BOOST_CHECK(parseVersion2Header(BINARY("\x0D\x0A\x0D\x0B")).getError() == ErrorKind::InvalidSignature);
}

BOOST_AUTO_TEST_CASE(test_address_block_too_short)
{
  /* IPv4 needs 12 bytes */
  const auto proxy = BINARY(PROXYMAGIC "\x21\x11\x00\x08"
                                       "\x7f\x00\x00\x01"
                                       "\x7f\x00\x00\x02");
  BOOST_CHECK(parseVersion2Header(proxy).getError() == ErrorKind::MalformedAddress);
  /* no need to wait for the rest */
  BOOST_CHECK(parseVersion2Header(proxy.substr(0, 16)).getError() == ErrorKind::MalformedAddress);

  /* LOCAL does not get a pass, the address block still has to fit */
  const auto local = BINARY(PROXYMAGIC "\x20\x11\x00\x08"
                                       "\x7f\x00\x00\x01"
                                       "\x7f\x00\x00\x02"
                                       "payload");
  BOOST_CHECK(parseVersion2Header(local).getError() == ErrorKind::MalformedAddress);
  BOOST_CHECK(parseVersion2Header(local.substr(0, 16)).getError() == ErrorKind::MalformedAddress);

  /* a LOCAL IPv4 header too short for its addresses, whose single value claims more than the length */
  const auto localOverrun = BINARY(PROXYMAGIC "\x20\x11\x00\x05"
                                              "\x01\x00\x0a"
                                              "AA");
  BOOST_CHECK(parseVersion2Header(localOverrun).getError() == ErrorKind::MalformedAddress);
  BOOST_CHECK_EQUAL(isProxyHeaderComplete(localOverrun), 0);

  /* without a family there is no address block, and the value overruns the chain */
  const auto unspecOverrun = BINARY(PROXYMAGIC "\x20\x00\x00\x05"
                                               "\x01\x00\x0a"
                                               "AA");
  BOOST_CHECK(parseVersion2Header(unspecOverrun).getError() == ErrorKind::TruncatedTlv);
}

BOOST_AUTO_TEST_CASE(test_local_with_addresses)
{
  /* the addresses of a LOCAL header are decoded, it is up to the application to ignore them */
  const auto payload = Version2Builder(Command::Local, Protocol::Stream, s_ipv4).build();
  BOOST_CHECK_EQUAL(static_cast<uint8_t>(payload.at(12)), 0x20);
  auto result = parseVersion2Header(payload);
  BOOST_REQUIRE(result.isComplete());
  BOOST_CHECK(result.getHeader().isLocal());
  BOOST_CHECK(result.getHeader().getAddresses() == s_ipv4);
}

BOOST_AUTO_TEST_CASE(test_unspecified_family_values)
{
  /* no address block, everything is a TLV */
  const auto payload = BINARY(PROXYMAGIC "\x21\x00\x00\x07"
                                         "\x02\x00\x04"
                                         "host");
  auto result = parseVersion2Header(payload);
  BOOST_REQUIRE(result.isComplete());
  BOOST_CHECK(result.getHeader().getAddresses().isUnspecified());
  BOOST_CHECK_EQUAL(*result.getHeader().getFirstValue(TlvType::Authority), "host");
}

BOOST_AUTO_TEST_CASE(test_ssl)
{
  SSLTlv ssl;
  ssl.client = SSLClientSSL | SSLClientCertificateSession;
  ssl.verify = 0;
  ssl.values = {{TlvType::SSLVersion, "TLSv1.3"}, {TlvType::SSLKeyAlgorithm, "RSA2048"}};

  const auto payload = Version2Builder(Command::Proxy, Protocol::Stream, s_ipv4).writeSSL(ssl).build();
  auto result = parseVersion2Header(payload);
  BOOST_REQUIRE(result.isComplete());
  auto parsed = result.getHeader().getSSL();
  BOOST_REQUIRE(parsed);
  BOOST_CHECK(*parsed == ssl);
  BOOST_CHECK_EQUAL(*parsed->getKeyAlgorithm(), "RSA2048");

  {
    /* an SSL value too short to be decoded */
    const auto broken = Version2Builder(Command::Proxy, Protocol::Stream, s_ipv4).writeTlv(TlvType::SSL, "\x01").build();
    auto brokenResult = parseVersion2Header(broken);
    BOOST_REQUIRE(brokenResult.isComplete());
    BOOST_CHECK(!brokenResult.getHeader().getSSL());
  }

  BOOST_CHECK(!Version2Builder(Command::Proxy, Protocol::Stream, s_ipv4).getHeader().getSSL());
}

BOOST_AUTO_TEST_CASE(test_checksum)
{
  Version2Builder builder(Command::Proxy, Protocol::Stream, s_ipv6);
  builder.writeALPN("http/1.1");
  builder.addChecksum();
  builder.writeUniqueID("abcdef");
  const auto payload = builder.build();

  auto result = parseVersion2Header(payload);
  BOOST_REQUIRE(result.isComplete());
  const auto& header = result.getHeader();
  BOOST_REQUIRE(header.getFirstValue(TlvType::CRC32C));
  BOOST_CHECK(*header.verifyChecksum());
  BOOST_CHECK(builder.getHeader() == header);

  /* flipping any byte of the header breaks the checksum */
  for (size_t idx = s_proxyProtocolMinimumHeaderSize; idx < payload.size(); idx++) {
    auto corrupted = payload;
    corrupted.at(idx) = static_cast<char>(corrupted.at(idx) ^ 0x01);
    auto corruptedResult = parseVersion2Header(corrupted);
    if (!corruptedResult.isComplete()) {
      continue;
    }
    auto valid = corruptedResult.getHeader().verifyChecksum();
    if (valid) {
      BOOST_CHECK_MESSAGE(!*valid, "flipping byte " << idx << " did not break the checksum");
    }
  }

  /* no checksum, nothing to verify */
  auto noChecksum = parseVersion2Header(Version2Builder(Command::Proxy, Protocol::Stream, s_ipv6).build());
  BOOST_REQUIRE(noChecksum.isComplete());
  BOOST_CHECK(!noChecksum.getHeader().verifyChecksum());

  /* a checksum value of the wrong size never matches */
  auto wrongSize = parseVersion2Header(Version2Builder(Command::Proxy, Protocol::Stream, s_ipv6).writeTlv(TlvType::CRC32C, "abc").build());
  BOOST_REQUIRE(wrongSize.isComplete());
  BOOST_CHECK(!*wrongSize.getHeader().verifyChecksum());

  /* adding it twice does not add a second value */
  Version2Builder twice(Command::Proxy, Protocol::Stream, s_ipv4);
  twice.addChecksum().addChecksum();
  BOOST_CHECK_EQUAL(twice.getHeader().getValues().size(), 1U);
}

BOOST_AUTO_TEST_SUITE_END()
