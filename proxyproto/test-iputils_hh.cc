#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_NO_MAIN
#include <boost/test/unit_test.hpp>

#include "iputils.hh"

using namespace boost;

BOOST_AUTO_TEST_SUITE(test_iputils_hh)

BOOST_AUTO_TEST_CASE(test_ComboAddress)
{
  ComboAddress local("127.0.0.1", 53);
  BOOST_CHECK(local == local);
  BOOST_CHECK_EQUAL(local.sin4.sin_family, AF_INET);
  BOOST_CHECK_EQUAL(local.sin4.sin_port, htons(53));
  BOOST_CHECK_EQUAL(local.sin4.sin_addr.s_addr, htonl(0x7f000001UL));

  ComboAddress remote("130.161.33.15", 53);
  BOOST_CHECK(!(local == remote));
  BOOST_CHECK_EQUAL(remote.sin4.sin_port, htons(53));

  ComboAddress withport("213.244.168.210:53");
  BOOST_CHECK_EQUAL(withport.sin4.sin_port, htons(53));

  ComboAddress withportO("213.244.168.210:53", 5300);
  BOOST_CHECK_EQUAL(withportO.sin4.sin_port, htons(53));

  withport = ComboAddress("[::]:53");
  BOOST_CHECK_EQUAL(withport.sin4.sin_port, htons(53));

  withport = ComboAddress("[::]:5300", 53);
  BOOST_CHECK_EQUAL(withport.sin4.sin_port, htons(5300));

  ComboAddress defaultport("213.244.168.210");
  BOOST_CHECK_EQUAL(defaultport.sin4.sin_port, htons(0));

  defaultport = ComboAddress("[::1]");
  BOOST_CHECK_EQUAL(defaultport.sin4.sin_port, htons(0));

  defaultport = ComboAddress("::1");
  BOOST_CHECK_EQUAL(defaultport.sin4.sin_port, htons(0));
  BOOST_CHECK(defaultport.isIPv6());

  // Verify that 2 'empty' ComboAddresses are equal
  ComboAddress a = ComboAddress();
  ComboAddress b = ComboAddress();
  BOOST_CHECK(a == b);

  // Verify that 2 ComboAddresses are not the same
  ComboAddress c = ComboAddress("127.0.0.1:53");
  ComboAddress d = ComboAddress("127.0.0.1:52");
  ComboAddress e = ComboAddress("127.0.0.2:53");

  BOOST_CHECK(a != c);
  BOOST_CHECK(c != d);
  BOOST_CHECK(c != e);
  BOOST_CHECK(d != e);
  BOOST_CHECK(!(a != b));

  // Verify that we don't allow invalid port numbers
  BOOST_CHECK_THROW(ComboAddress("127.0.0.1:70000"), std::runtime_error); // Port no. too high
  BOOST_CHECK_THROW(ComboAddress("127.0.0.1:-6"), std::runtime_error); // Port no. too low
  BOOST_CHECK_THROW(ComboAddress("[::1]:70000"), std::runtime_error); // Port no. too high
  BOOST_CHECK_THROW(ComboAddress("[::1]:-6"), std::runtime_error); // Port no. too low
  BOOST_CHECK_THROW(ComboAddress("not an address"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_ComboAddressToString)
{
  BOOST_CHECK_EQUAL(ComboAddress("192.0.2.1:53").toString(), "192.0.2.1");
  BOOST_CHECK_EQUAL(ComboAddress("192.0.2.1:53").toStringWithPort(), "192.0.2.1:53");
  BOOST_CHECK_EQUAL(ComboAddress("[2001:DB8::1]:443").toString(), "2001:db8::1");
  BOOST_CHECK_EQUAL(ComboAddress("[2001:db8::1]:443").toStringWithPort(), "[2001:db8::1]:443");
  BOOST_CHECK_EQUAL(ComboAddress("::ffff:192.0.2.1").toString(), "::ffff:192.0.2.1");
}

BOOST_AUTO_TEST_CASE(test_StrictIPv4)
{
  struct sockaddr_in addr{};
  BOOST_CHECK_EQUAL(makeStrictIPv4sockaddr("192.168.0.1", &addr), 0);
  BOOST_CHECK_EQUAL(addr.sin_addr.s_addr, htonl(0xc0a80001UL));
  BOOST_CHECK_EQUAL(makeStrictIPv4sockaddr("0.0.0.0", &addr), 0);
  BOOST_CHECK_EQUAL(makeStrictIPv4sockaddr("255.255.255.255", &addr), 0);

  /* leading zeros, which inet_aton would read as octal */
  BOOST_CHECK_EQUAL(makeStrictIPv4sockaddr("192.168.0.01", &addr), -1);
  BOOST_CHECK_EQUAL(makeStrictIPv4sockaddr("010.0.0.1", &addr), -1);
  BOOST_CHECK_EQUAL(makeStrictIPv4sockaddr("00.0.0.1", &addr), -1);

  BOOST_CHECK_EQUAL(makeStrictIPv4sockaddr("256.0.0.1", &addr), -1);
  BOOST_CHECK_EQUAL(makeStrictIPv4sockaddr("1.2.3", &addr), -1);
  BOOST_CHECK_EQUAL(makeStrictIPv4sockaddr("1.2.3.4.5", &addr), -1);
  BOOST_CHECK_EQUAL(makeStrictIPv4sockaddr("1.2.3.4.", &addr), -1);
  BOOST_CHECK_EQUAL(makeStrictIPv4sockaddr("1..3.4", &addr), -1);
  BOOST_CHECK_EQUAL(makeStrictIPv4sockaddr(" 1.2.3.4", &addr), -1);
  BOOST_CHECK_EQUAL(makeStrictIPv4sockaddr("1.2.3.4 ", &addr), -1);
  BOOST_CHECK_EQUAL(makeStrictIPv4sockaddr("1.2.3.+4", &addr), -1);
  BOOST_CHECK_EQUAL(makeStrictIPv4sockaddr("", &addr), -1);
}

BOOST_AUTO_TEST_CASE(test_StrictIPv6)
{
  struct sockaddr_in6 addr{};
  BOOST_CHECK_EQUAL(makeStrictIPv6sockaddr("2001:db8::1", &addr), 0);
  BOOST_CHECK_EQUAL(addr.sin6_family, AF_INET6);
  BOOST_CHECK_EQUAL(makeStrictIPv6sockaddr("::", &addr), 0);
  BOOST_CHECK_EQUAL(makeStrictIPv6sockaddr("2001:0db8:0000:0000:0000:0000:0000:0001", &addr), 0);
  BOOST_CHECK_EQUAL(makeStrictIPv6sockaddr("::ffff:192.0.2.1", &addr), 0);

  BOOST_CHECK_EQUAL(makeStrictIPv6sockaddr("::ffff:192.0.2.01", &addr), -1);
  BOOST_CHECK_EQUAL(makeStrictIPv6sockaddr("[2001:db8::1]", &addr), -1);
  BOOST_CHECK_EQUAL(makeStrictIPv6sockaddr("fe80::1%eth0", &addr), -1);
  BOOST_CHECK_EQUAL(makeStrictIPv6sockaddr("2001:db8:::1", &addr), -1);
  BOOST_CHECK_EQUAL(makeStrictIPv6sockaddr("192.0.2.1", &addr), -1);
  BOOST_CHECK_EQUAL(makeStrictIPv6sockaddr("", &addr), -1);
}

BOOST_AUTO_TEST_CASE(test_StrictPort)
{
  BOOST_CHECK_EQUAL(*parseStrictPort("0"), 0U);
  BOOST_CHECK_EQUAL(*parseStrictPort("443"), 443U);
  BOOST_CHECK_EQUAL(*parseStrictPort("65535"), 65535U);

  BOOST_CHECK(!parseStrictPort("65536"));
  BOOST_CHECK(!parseStrictPort("05"));
  BOOST_CHECK(!parseStrictPort("08080"));
  BOOST_CHECK(!parseStrictPort("00"));
  BOOST_CHECK(!parseStrictPort("-1"));
  BOOST_CHECK(!parseStrictPort("+1"));
  BOOST_CHECK(!parseStrictPort("1a"));
  BOOST_CHECK(!parseStrictPort("100000"));
  BOOST_CHECK(!parseStrictPort(""));
}

BOOST_AUTO_TEST_CASE(test_makeComboAddressFromRaw)
{
  const std::string raw4("\xc0\x00\x02\x01", 4);
  auto address = makeComboAddressFromRaw(4, raw4.data(), raw4.size());
  BOOST_CHECK(address == ComboAddress("192.0.2.1"));
  BOOST_CHECK_EQUAL(address.toByteString(), raw4);

  const auto raw6 = ComboAddress("2001:db8::1").toByteString();
  BOOST_CHECK_EQUAL(raw6.size(), 16U);
  BOOST_CHECK(makeComboAddressFromRaw(6, raw6.data(), raw6.size()) == ComboAddress("2001:db8::1"));

  BOOST_CHECK_THROW(makeComboAddressFromRaw(4, raw6.data(), raw6.size()), std::runtime_error);
  BOOST_CHECK_THROW(makeComboAddressFromRaw(5, raw4.data(), raw4.size()), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_ComboAddressFromSockaddr)
{
  struct sockaddr_in6 addr6{};
  BOOST_REQUIRE_EQUAL(makeStrictIPv6sockaddr("2001:db8::2", &addr6), 0);
  addr6.sin6_port = htons(853);
  ComboAddress fromSockaddr(&addr6);
  BOOST_CHECK(fromSockaddr == ComboAddress("[2001:db8::2]:853"));
  BOOST_CHECK_EQUAL(fromSockaddr.getSocklen(), sizeof(struct sockaddr_in6));

  struct sockaddr_in addr4{};
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  BOOST_CHECK_THROW(ComboAddress(reinterpret_cast<const struct sockaddr*>(&addr4), sizeof(addr4)), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
