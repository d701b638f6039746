// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of statsdudp, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using statsdudp::network::ByteView;
using statsdudp::network::PayloadSplitter;

namespace
{

std::vector<std::string> splitToStrings(const std::string &payload, std::size_t limit)
{
  std::vector<std::string> out;
  for (const auto &chunk : PayloadSplitter::split(ByteView::of(payload), limit))
  {
    out.push_back(chunk.toString());
  }
  return out;
}

std::string join(const std::vector<std::string> &parts)
{
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i)
  {
    if (i > 0)
    {
      out += '\n';
    }
    out += parts[i];
  }
  return out;
}

} // namespace

TEST_CASE("Payload within the limit is returned whole", "[splitter][fits]")
{
  const std::string payload = "page.views:1|c\nusers.online:42|g";

  SECTION("Exactly at the limit")
  {
    auto chunks = PayloadSplitter::split(ByteView::of(payload), payload.size());
    REQUIRE(chunks.size() == 1);
    REQUIRE(chunks[0].data() == ByteView::of(payload).data());
    REQUIRE(chunks[0].size() == payload.size());
  }

  SECTION("Below the limit")
  {
    REQUIRE(splitToStrings(payload, 8192) == std::vector<std::string>{payload});
  }

  SECTION("Empty payload produces one empty chunk")
  {
    auto chunks = splitToStrings("", 10);
    REQUIRE(chunks.size() == 1);
    REQUIRE(chunks[0].empty());
  }
}

TEST_CASE("Limit zero disables splitting", "[splitter][unlimited]")
{
  std::string payload;
  payload.reserve(1024 * 1024);
  while (payload.size() < 1024 * 1024)
  {
    payload += "metric.name:1|c\n";
  }
  payload.resize(1024 * 1024);

  auto chunks = PayloadSplitter::split(ByteView::of(payload), 0);
  REQUIRE(chunks.size() == 1);
  REQUIRE(chunks[0].size() == payload.size());
  REQUIRE(chunks[0].toString() == payload);
}

TEST_CASE("Splitting keeps whole lines", "[splitter][lines]")
{
  const std::string payload = "abcde\nfghij\nklmno";

  SECTION("Limit 10 puts one line per chunk")
  {
    REQUIRE(splitToStrings(payload, 10) == std::vector<std::string>{"abcde", "fghij", "klmno"});
  }

  SECTION("Limit 12 packs the largest prefix that fits")
  {
    REQUIRE(splitToStrings(payload, 12) == std::vector<std::string>{"abcde\nfghij", "klmno"});
  }

  SECTION("Newline exactly at the limit index is a split point")
  {
    // index 5 is '\n'; prefix "abcde" has size 5
    REQUIRE(splitToStrings(payload, 5) == std::vector<std::string>{"abcde", "fghij", "klmno"});
  }
}

TEST_CASE("Rejoining chunks reconstructs the payload", "[splitter][rejoin]")
{
  std::vector<std::string> lines;
  for (int i = 0; i < 200; ++i)
  {
    lines.push_back("service.request.latency." + std::to_string(i) + ":" +
                    std::to_string(i * 7) + "|ms|#env:test");
  }
  const std::string payload = join(lines);

  for (std::size_t limit : {64u, 100u, 512u, 1432u})
  {
    auto chunks = splitToStrings(payload, limit);
    REQUIRE(chunks.size() > 1);
    REQUIRE(join(chunks) == payload);
    for (const auto &chunk : chunks)
    {
      REQUIRE(chunk.size() <= limit);
      REQUIRE_FALSE(chunk.empty());
    }
  }
}

TEST_CASE("Oversized segments pass through unsplit", "[splitter][oversized]")
{
  SECTION("No newline at all")
  {
    REQUIRE(splitToStrings("abcdefg", 5) == std::vector<std::string>{"abcdefg"});
  }

  SECTION("Newline only past the limit")
  {
    REQUIRE(splitToStrings("abcdefg\nxy", 5) == std::vector<std::string>{"abcdefg\nxy"});
  }

  SECTION("Oversized tail after a good split")
  {
    REQUIRE(splitToStrings("ab\ncdefghij", 4) == std::vector<std::string>{"ab", "cdefghij"});
  }

  SECTION("Leading newline is never a split point")
  {
    REQUIRE(splitToStrings("\nabcdefg", 4) == std::vector<std::string>{"\nabcdefg"});
  }
}

TEST_CASE("Trailing newline handling", "[splitter][trailing]")
{
  SECTION("Split on the final newline leaves no empty chunk")
  {
    REQUIRE(splitToStrings("abcdefghi\n", 9) == std::vector<std::string>{"abcdefghi"});
  }

  SECTION("A tail that fits is sent as-is")
  {
    REQUIRE(splitToStrings("abcde\nfghij\n", 10) ==
            std::vector<std::string>{"abcde", "fghij\n"});
  }
}

TEST_CASE("Chunks are views into the original buffer", "[splitter][views]")
{
  const std::string payload = "abcde\nfghij\nklmno";
  ByteView whole = ByteView::of(payload);
  auto chunks = PayloadSplitter::split(whole, 10);
  REQUIRE(chunks.size() == 3);

  std::size_t expectedOffset = 0;
  for (const auto &chunk : chunks)
  {
    REQUIRE(chunk.base() == whole.base());
    REQUIRE(chunk.offset() == expectedOffset);
    expectedOffset += chunk.size() + 1;
  }

  SECTION("Views into a sub-range keep the absolute offset")
  {
    statsdudp::network::ByteBuffer buffer{'x', 'x', 'a', '\n', 'b', 'c', 'x'};
    ByteView inner(buffer.data(), 2, 4); // "a\nbc"
    auto parts = PayloadSplitter::split(inner, 2);
    REQUIRE(parts.size() == 2);
    REQUIRE(parts[0].offset() == 2);
    REQUIRE(parts[0].toString() == "a");
    REQUIRE(parts[1].offset() == 4);
    REQUIRE(parts[1].toString() == "bc");
  }
}

TEST_CASE("findSplitPoint scans from the limit down to one", "[splitter][scan]")
{
  const std::string text = "a\nb\ncdef";
  ByteView view = ByteView::of(text);
  REQUIRE(PayloadSplitter::findSplitPoint(view, 5) == 3);
  REQUIRE(PayloadSplitter::findSplitPoint(view, 2) == 1);
  REQUIRE(PayloadSplitter::findSplitPoint(ByteView::of(std::string("\nabc")), 2) == 0);
}
