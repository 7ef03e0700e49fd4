#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#include <boost/test/unit_test.hpp>

#include "proxy-protocol-addresses.hh"
#include "proxy-protocol-errors.hh"

using namespace boost;
using namespace proxyproto;

BOOST_AUTO_TEST_SUITE(test_proxy_protocol_addresses_cc)

BOOST_AUTO_TEST_CASE(test_families)
{
  ProxyAddresses unspecified;
  BOOST_CHECK(unspecified.isUnspecified());
  BOOST_CHECK_EQUAL(unspecified.getBlockSize(), 0U);
  BOOST_CHECK_EQUAL(unspecified.toString(), "unspecified");
  BOOST_CHECK_THROW(unspecified.getSource(), std::runtime_error);

  ProxyAddresses ipv4(ComboAddress("192.0.2.1:4242"), ComboAddress("192.0.2.2:53"));
  BOOST_CHECK(ipv4.getFamily() == AddressFamily::IPv4);
  BOOST_CHECK(ipv4.isInet());
  BOOST_CHECK_EQUAL(ipv4.getBlockSize(), 12U);
  BOOST_CHECK_EQUAL(ipv4.toString(), "192.0.2.1:4242 -> 192.0.2.2:53");
  BOOST_CHECK_THROW(ipv4.getUnixSource(), std::runtime_error);

  ProxyAddresses ipv6(ComboAddress("[2001:db8::1]:4242"), ComboAddress("[2001:db8::2]:53"));
  BOOST_CHECK(ipv6.getFamily() == AddressFamily::IPv6);
  BOOST_CHECK_EQUAL(ipv6.getBlockSize(), 36U);
  BOOST_CHECK_EQUAL(ipv6.toString(), "[2001:db8::1]:4242 -> [2001:db8::2]:53");

  ProxyAddresses unixAddresses(ProxyAddresses::makeUnixAddress("/run/client.sock"), ProxyAddresses::makeUnixAddress("/run/server.sock"));
  BOOST_CHECK(unixAddresses.getFamily() == AddressFamily::Unix);
  BOOST_CHECK_EQUAL(unixAddresses.getBlockSize(), 216U);
  BOOST_CHECK_EQUAL(unixAddresses.toString(), "/run/client.sock -> /run/server.sock");
  BOOST_CHECK_THROW(unixAddresses.getDestination(), std::runtime_error);

  BOOST_CHECK(ipv4 != ipv6);
  BOOST_CHECK(ipv4 != unspecified);
  BOOST_CHECK(ipv4 == ProxyAddresses(ComboAddress("192.0.2.1:4242"), ComboAddress("192.0.2.2:53")));
  BOOST_CHECK(ipv4 != ProxyAddresses(ComboAddress("192.0.2.1:4243"), ComboAddress("192.0.2.2:53")));
  BOOST_CHECK(unspecified == ProxyAddresses());
}

BOOST_AUTO_TEST_CASE(test_mismatched_families)
{
  try {
    ProxyAddresses mixed(ComboAddress("192.0.2.1:4242"), ComboAddress("[2001:db8::2]:53"));
    BOOST_FAIL("Mixing an IPv4 source with an IPv6 destination should have been refused");
  }
  catch (const ProxyProtocolException& e) {
    BOOST_CHECK(e.getKind() == ErrorKind::InvalidAddressForFamily);
  }
}

BOOST_AUTO_TEST_CASE(test_unix_addresses)
{
  auto abstract = ProxyAddresses::makeUnixAddress(std::string("\0abstract", 9));
  ProxyAddresses addresses(abstract, ProxyAddresses::makeUnixAddress("/tmp/dest"));
  BOOST_CHECK_EQUAL(addresses.toString(), "@abstract -> /tmp/dest");
  BOOST_CHECK_EQUAL(addresses.getUnixSource().at(1), 'a');

  BOOST_CHECK_NO_THROW(ProxyAddresses::makeUnixAddress(std::string(108, 'a')));
  BOOST_CHECK_THROW(ProxyAddresses::makeUnixAddress(std::string(109, 'a')), ProxyProtocolException);
}

BOOST_AUTO_TEST_CASE(test_from_sockaddrs)
{
  ComboAddress source("192.0.2.1:4242");
  ComboAddress destination("192.0.2.2:53");
  // NOLINTBEGIN(cppcoreguidelines-pro-type-reinterpret-cast)
  auto inet = ProxyAddresses::fromSockaddrs(reinterpret_cast<const struct sockaddr*>(&source.sin4), source.getSocklen(), reinterpret_cast<const struct sockaddr*>(&destination.sin4), destination.getSocklen());
  BOOST_CHECK(inet == ProxyAddresses(source, destination));

  struct sockaddr_un unixSource{};
  unixSource.sun_family = AF_UNIX;
  strncpy(unixSource.sun_path, "/run/a.sock", sizeof(unixSource.sun_path) - 1);
  struct sockaddr_un unixDestination{};
  unixDestination.sun_family = AF_UNIX;
  strncpy(unixDestination.sun_path, "/run/b.sock", sizeof(unixDestination.sun_path) - 1);
  auto unixAddresses = ProxyAddresses::fromSockaddrs(reinterpret_cast<const struct sockaddr*>(&unixSource), sizeof(unixSource), reinterpret_cast<const struct sockaddr*>(&unixDestination), sizeof(unixDestination));
  BOOST_CHECK(unixAddresses.getFamily() == AddressFamily::Unix);
  BOOST_CHECK_EQUAL(unixAddresses.toString(), "/run/a.sock -> /run/b.sock");

  ComboAddress ipv6("[2001:db8::1]:53");
  BOOST_CHECK_THROW(ProxyAddresses::fromSockaddrs(reinterpret_cast<const struct sockaddr*>(&source.sin4), source.getSocklen(), reinterpret_cast<const struct sockaddr*>(&ipv6.sin6), ipv6.getSocklen()), ProxyProtocolException);
  // NOLINTEND(cppcoreguidelines-pro-type-reinterpret-cast)
}

BOOST_AUTO_TEST_SUITE_END()
