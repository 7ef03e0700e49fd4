#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#include <boost/test/unit_test.hpp>

#include "proxy-protocol-errors.hh"
#include "proxy-protocol-tlv.hh"

using namespace boost;
using namespace proxyproto;

BOOST_AUTO_TEST_SUITE(test_proxy_protocol_tlv_cc)

#define BINARY(s) (std::string(s, sizeof(s) - 1))

static views::UnsignedCharView toView(const std::string& str)
{
  return {str.data(), str.size()};
}

BOOST_AUTO_TEST_CASE(test_reader)
{
  const auto chain = BINARY("\x01\x00\x02"
                            "h2"
                            "\x04\x00\x00"
                            "\xe0\x00\x03"
                            "abc");
  TlvReader reader(toView(chain));
  uint8_t type{0};
  views::UnsignedCharView value;

  BOOST_REQUIRE(reader.next(type, value) == TlvReader::Status::Record);
  BOOST_CHECK_EQUAL(type, 0x01);
  BOOST_CHECK_EQUAL(value.toString(), "h2");
  BOOST_CHECK_EQUAL(reader.getPosition(), 5U);

  /* empty value */
  BOOST_REQUIRE(reader.next(type, value) == TlvReader::Status::Record);
  BOOST_CHECK_EQUAL(type, 0x04);
  BOOST_CHECK(value.empty());

  /* unknown types are kept as they are */
  BOOST_REQUIRE(reader.next(type, value) == TlvReader::Status::Record);
  BOOST_CHECK_EQUAL(type, 0xe0);
  BOOST_CHECK_EQUAL(value.toString(), "abc");

  BOOST_CHECK(reader.next(type, value) == TlvReader::Status::End);
  BOOST_CHECK(reader.next(type, value) == TlvReader::Status::End);

  reader.rewind();
  BOOST_CHECK_EQUAL(reader.getPosition(), 0U);
  BOOST_REQUIRE(reader.next(type, value) == TlvReader::Status::Record);
  BOOST_CHECK_EQUAL(value.toString(), "h2");
}

BOOST_AUTO_TEST_CASE(test_truncated_chains)
{
  uint8_t type{0};
  views::UnsignedCharView value;

  {
    /* the value is longer than what is left */
    const auto chain = BINARY("\x01\x00\x0a"
                              "ab");
    TlvReader reader(toView(chain));
    BOOST_CHECK(reader.next(type, value) == TlvReader::Status::Truncated);
    /* and it stays that way */
    BOOST_CHECK(reader.next(type, value) == TlvReader::Status::Truncated);
    BOOST_CHECK_EQUAL(reader.getPosition(), 0U);
  }

  {
    /* a couple of stray bytes after a valid record */
    const auto chain = BINARY("\x01\x00\x01"
                              "a"
                              "\x02\x00");
    std::vector<Tlv> values;
    BOOST_CHECK(!parseTlvChain(toView(chain), values));
    BOOST_REQUIRE_EQUAL(values.size(), 1U);
    BOOST_CHECK(values.at(0) == Tlv(TlvType::ALPN, "a"));
  }

  {
    std::vector<Tlv> values;
    BOOST_CHECK(parseTlvChain(views::UnsignedCharView(), values));
    BOOST_CHECK(values.empty());
  }
}

BOOST_AUTO_TEST_CASE(test_append)
{
  std::string out;
  appendTlv(out, 0x02, "example.com");
  BOOST_CHECK_EQUAL(out, BINARY("\x02\x00\x0b"
                                "example.com"));

  appendTlv(out, 0x04, "");
  BOOST_CHECK_EQUAL(out.size(), 14U + 3U);

  std::vector<Tlv> values;
  BOOST_REQUIRE(parseTlvChain(toView(out), values));
  BOOST_REQUIRE_EQUAL(values.size(), 2U);
  BOOST_CHECK(values.at(0).isType(TlvType::Authority));
  BOOST_CHECK_EQUAL(values.at(0).content, "example.com");
  BOOST_CHECK(values.at(1).isType(TlvType::NoOp));

  try {
    appendTlv(out, 0x01, std::string(65536, 'a'));
    BOOST_FAIL("A value larger than 65535 bytes should have been refused");
  }
  catch (const ProxyProtocolException& e) {
    BOOST_CHECK(e.getKind() == ErrorKind::TlvTooLarge);
  }
  BOOST_CHECK_NO_THROW(appendTlv(out, 0x01, std::string(65535, 'a')));
}

BOOST_AUTO_TEST_CASE(test_ssl)
{
  SSLTlv ssl;
  ssl.client = SSLClientSSL | SSLClientCertificateConnection;
  ssl.verify = 0;
  ssl.values = {{TlvType::SSLVersion, "TLSv1.3"}, {TlvType::SSLCommonName, "client.example.com"}, {TlvType::SSLCipher, "TLS_AES_128_GCM_SHA256"}};

  const auto content = makeSSLTlvContent(ssl);
  BOOST_CHECK_EQUAL(content.substr(0, 5), BINARY("\x03\x00\x00\x00\x00"));

  SSLTlv parsed;
  BOOST_REQUIRE(parseSSLTlv(toView(content), parsed));
  BOOST_CHECK(parsed == ssl);
  BOOST_CHECK(parsed.connectedWithSSL());
  BOOST_CHECK(parsed.certificateVerified());
  BOOST_CHECK_EQUAL(*parsed.getVersion(), "TLSv1.3");
  BOOST_CHECK_EQUAL(*parsed.getCommonName(), "client.example.com");
  BOOST_CHECK_EQUAL(*parsed.getCipher(), "TLS_AES_128_GCM_SHA256");
  BOOST_CHECK(!parsed.getSignatureAlgorithm());
  BOOST_CHECK(!parsed.getKeyAlgorithm());

  /* verify result is big-endian */
  const auto failed = BINARY("\x01\x00\x00\x00\x2a");
  BOOST_REQUIRE(parseSSLTlv(toView(failed), parsed));
  BOOST_CHECK_EQUAL(parsed.verify, 42U);
  BOOST_CHECK(!parsed.certificateVerified());
  BOOST_CHECK(parsed.values.empty());

  /* too short for the fixed part */
  BOOST_CHECK(!parseSSLTlv(toView(BINARY("\x01\x00\x00\x00")), parsed));
  /* truncated sub-TLV */
  BOOST_CHECK(!parseSSLTlv(toView(BINARY("\x01\x00\x00\x00\x00\x21\x00\x07TLS")), parsed));
}

BOOST_AUTO_TEST_CASE(test_ssl_nesting_is_not_expanded)
{
  SSLTlv inner;
  inner.client = SSLClientSSL;
  inner.values = {{TlvType::SSLVersion, "TLSv1.2"}};

  SSLTlv outer;
  outer.client = SSLClientSSL;
  outer.values = {{TlvType::SSL, makeSSLTlvContent(inner)}};

  SSLTlv parsed;
  BOOST_REQUIRE(parseSSLTlv(toView(makeSSLTlvContent(outer)), parsed));
  BOOST_REQUIRE_EQUAL(parsed.values.size(), 1U);
  BOOST_CHECK(parsed.values.at(0).isType(TlvType::SSL));
  BOOST_CHECK_EQUAL(parsed.values.at(0).content, makeSSLTlvContent(inner));
  BOOST_CHECK(!parsed.getVersion());
}

BOOST_AUTO_TEST_CASE(test_crc32c)
{
  /* well-known check value of CRC-32C */
  const std::string check("123456789");
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  BOOST_CHECK_EQUAL(computeCRC32C(reinterpret_cast<const uint8_t*>(check.data()), check.size()), 0xE3069283U);
  BOOST_CHECK_EQUAL(computeCRC32C(nullptr, 0), 0U);
}

BOOST_AUTO_TEST_SUITE_END()
