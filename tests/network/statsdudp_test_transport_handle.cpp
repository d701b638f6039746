// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of statsdudp, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>
#include "statsdudp_test_net_utils.hpp"

using statsdudp::network::ByteView;
using statsdudp::network::UdpTransportHandle;

TEST_CASE("UdpTransportHandle delivers datagrams to loopback", "[transport][udp]")
{
  statsdudp::test::initializeTestLogging();
  testnet::UdpReceiver receiver;
  UdpTransportHandle handle(statsdudp::test::loopbackEndpoint(receiver.port()));

  REQUIRE(handle.isOpen());
  REQUIRE(handle.endpoint().toString() == "127.0.0.1:" + std::to_string(receiver.port()));

  const std::string first = "page.views:1|c";
  const std::string second = "users.online:42|g|#region:eu";
  handle.sendTo(ByteView::of(first));
  handle.sendTo(ByteView::of(second));

  auto got = receiver.receiveMany(2);
  REQUIRE(got.size() == 2);
  REQUIRE(got[0] == first);
  REQUIRE(got[1] == second);

  auto stats = handle.stats();
  REQUIRE(stats.datagramsSent == 2);
  REQUIRE(stats.bytesSent == first.size() + second.size());
  REQUIRE(stats.sendErrors == 0);
}

TEST_CASE("UdpTransportHandle sends only the viewed bytes", "[transport][udp][view]")
{
  testnet::UdpReceiver receiver;
  UdpTransportHandle handle(statsdudp::test::loopbackEndpoint(receiver.port()));

  const std::string payload = "skip\nkeep.me:1|c\nskip";
  handle.sendTo(ByteView::of(payload).subview(5, 11));

  auto got = receiver.receive();
  REQUIRE(got.has_value());
  REQUIRE(*got == "keep.me:1|c");
}

TEST_CASE("UdpTransportHandle close", "[transport][udp][close]")
{
  testnet::UdpReceiver receiver;
  UdpTransportHandle handle(statsdudp::test::loopbackEndpoint(receiver.port()));

  handle.close();
  REQUIRE_FALSE(handle.isOpen());

  SECTION("Close is idempotent")
  {
    REQUIRE_NOTHROW(handle.close());
    REQUIRE_NOTHROW(handle.close());
    REQUIRE_FALSE(handle.isOpen());
  }

  SECTION("Send after close fails with EBADF")
  {
    const std::string data = "late:1|c";
    try
    {
      handle.sendTo(ByteView::of(data));
      FAIL("expected TransportError");
    }
    catch (const statsdudp::TransportError &e)
    {
      REQUIRE(e.sysErrno() == EBADF);
      REQUIRE(std::string(e.what()).find("closed") != std::string::npos);
    }
    REQUIRE(handle.stats().sendErrors == 1);
    REQUIRE(handle.stats().datagramsSent == 0);
  }
}

TEST_CASE("UdpTransportHandle resolves names before opening", "[transport][udp][resolve]")
{
  testnet::UdpReceiver receiver;

  SECTION("Literal destination")
  {
    UdpTransportHandle handle("127.0.0.1", receiver.port());
    const std::string data = "resolved:1|c";
    handle.sendTo(ByteView::of(data));
    auto got = receiver.receive();
    REQUIRE(got.has_value());
    REQUIRE(*got == data);
  }

  SECTION("Injected lookup")
  {
    statsdudp::network::EndpointResolver resolver(
      [](const std::string &)
      {
        in_addr addr{};
        addr.s_addr = htonl(INADDR_LOOPBACK);
        return std::vector<statsdudp::network::ResolvedAddress>{
          statsdudp::network::ResolvedAddress::ipv4(addr)};
      });
    UdpTransportHandle handle("statsd.local", receiver.port(), resolver);
    REQUIRE(handle.endpoint().addressString() == "127.0.0.1");
  }

  SECTION("Resolution failure surfaces at construction")
  {
    REQUIRE_THROWS_AS(UdpTransportHandle("999.999.999.999", 8125),
                      statsdudp::AddressResolutionError);
  }
}

TEST_CASE("UdpTransportHandle applies the send buffer size", "[transport][udp][config]")
{
  testnet::UdpReceiver receiver;
  UdpTransportHandle::Config cfg;
  cfg.soSndBuf = 64 * 1024;
  UdpTransportHandle handle(statsdudp::test::loopbackEndpoint(receiver.port()), cfg);

  const std::string data = "buffered:1|c";
  REQUIRE_NOTHROW(handle.sendTo(ByteView::of(data)));
  REQUIRE(receiver.receive().value_or("") == data);
}

TEST_CASE("UdpTransportHandle reports oversized datagrams", "[transport][udp][error]")
{
  testnet::UdpReceiver receiver;
  UdpTransportHandle handle(statsdudp::test::loopbackEndpoint(receiver.port()));

  // Larger than any UDP datagram can be
  const std::string huge(70000, 'x');
  try
  {
    handle.sendTo(ByteView::of(huge));
    FAIL("expected TransportError");
  }
  catch (const statsdudp::TransportError &e)
  {
    REQUIRE(e.sysErrno() == EMSGSIZE);
  }
  REQUIRE(handle.stats().sendErrors == 1);
  REQUIRE(handle.isOpen());
}
