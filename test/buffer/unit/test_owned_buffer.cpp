/***
 * Name: test_owned_buffer
 * Purpose: OwnedBuffer construction, byte access, consuming conversions and comparisons.
 */
#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "stackbridge/buffer/HostAlloc.h"
#include "stackbridge/buffer/OwnedBuffer.h"
#include "stackbridge/exceptions/encode_error.h"

using stackbridge::buffer::OwnedBuffer;

static const std::string_view kFooNulBar("foo\0bar", 7);

TEST(OwnedBuffer, EmptyUsesNullSentinel) {
  const OwnedBuffer a = OwnedBuffer::from_bytes(std::string_view());
  EXPECT_EQ(a.data(), nullptr);
  EXPECT_EQ(a.size(), 0u);
  EXPECT_TRUE(a.is_empty());
  EXPECT_STREQ(a.c_str(), "");
  const OwnedBuffer b;
  EXPECT_EQ(b.data(), nullptr);
  EXPECT_EQ(OwnedBuffer::empty().data(), nullptr);
  const auto raw = OwnedBuffer::from_bytes(std::vector<unsigned char>{}).non_owning().raw();
  EXPECT_EQ(raw.data, nullptr);
  EXPECT_EQ(raw.size, 0u);
}

TEST(OwnedBuffer, BytesRoundTripIncludingNulAndHighBytes) {
  const std::vector<std::string> samples = {std::string(), std::string("abc"), std::string(kFooNulBar),
                                            std::string("\xFF\xFE\x80", 3), std::string(1, '\0')};
  for (const auto& s : samples) {
    const OwnedBuffer buf = OwnedBuffer::from_bytes(s);
    EXPECT_EQ(buf.as_bytes(), s);
    EXPECT_EQ(buf.size(), s.size());
    EXPECT_EQ(OwnedBuffer::from_bytes(s).into_bytes().view(), s);
  }
}

TEST(OwnedBuffer, TerminatorFollowsContent) {
  const OwnedBuffer buf = OwnedBuffer::from_bytes(kFooNulBar);
  ASSERT_NE(buf.data(), nullptr);
  EXPECT_EQ(buf.data()[7], '\0');
  EXPECT_STREQ(buf.c_str(), "foo");
}

TEST(OwnedBuffer, FooNulBarScenario) {
  OwnedBuffer buf = OwnedBuffer::from_bytes(std::vector<unsigned char>{0x66, 0x6f, 0x6f, 0x00, 0x62, 0x61, 0x72});
  EXPECT_EQ(buf.as_bytes(), kFooNulBar);
  auto bytes = std::move(buf).into_bytes();
  EXPECT_EQ(bytes.size(), 7u);
  EXPECT_EQ(bytes.to_vector(), (std::vector<unsigned char>{0x66, 0x6f, 0x6f, 0x00, 0x62, 0x61, 0x72}));
  EXPECT_TRUE(buf.is_empty());
}

TEST(OwnedBuffer, IntoBytesTransfersTheAllocation) {
  OwnedBuffer buf("payload");
  const char* before = buf.data();
  const auto stats = stackbridge::buffer::buffer_stats();
  auto bytes = std::move(buf).into_bytes();
  EXPECT_EQ(reinterpret_cast<const char*>(bytes.data()), before);
  EXPECT_EQ(stackbridge::buffer::buffer_stats().numAllocated, stats.numAllocated);
  EXPECT_EQ(buf.data(), nullptr);
}

TEST(OwnedBuffer, ConstructorsFromTextAndChars) {
  EXPECT_EQ(OwnedBuffer("abc").as_bytes(), "abc");
  EXPECT_EQ(OwnedBuffer(std::string("x\0y", 3)).size(), 3u);
  EXPECT_EQ(OwnedBuffer('z').as_bytes(), "z");
  EXPECT_EQ(OwnedBuffer::from_char(U'é').as_bytes(), "\xC3\xA9");
  EXPECT_EQ(OwnedBuffer::from_char(U'\U0001F600').size(), 4u);
  EXPECT_THROW(OwnedBuffer::from_char(static_cast<char32_t>(0xD800)), stackbridge::exceptions::EncodeError);
  EXPECT_THROW(OwnedBuffer::from_char(static_cast<char32_t>(0x110000)), stackbridge::exceptions::EncodeError);
}

TEST(OwnedBuffer, CloneIsIndependent) {
  auto* original = new OwnedBuffer("shared?");
  const OwnedBuffer copy = original->clone();
  EXPECT_NE(copy.data(), original->data());
  delete original;
  EXPECT_EQ(copy.as_bytes(), "shared?");

  OwnedBuffer a("one");
  OwnedBuffer b(a);
  b = OwnedBuffer("two");
  EXPECT_EQ(a, std::string_view("one"));
  EXPECT_EQ(b, std::string_view("two"));
}

TEST(OwnedBuffer, MovedFromIsEmpty) {
  OwnedBuffer a("moved");
  OwnedBuffer b(std::move(a));
  EXPECT_EQ(a.data(), nullptr);
  EXPECT_EQ(b.as_bytes(), "moved");
  OwnedBuffer c;
  c = std::move(b);
  EXPECT_TRUE(b.is_empty());
  EXPECT_EQ(c.as_bytes(), "moved");
}

TEST(OwnedBuffer, EqualityOrderingAndHash) {
  const OwnedBuffer a("abc");
  const OwnedBuffer b("abc");
  const OwnedBuffer c("abd");
  const OwnedBuffer prefix("ab");
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
  EXPECT_LT(a, c);
  EXPECT_LT(prefix, a);
  EXPECT_GE(c, a);
  EXPECT_LT(OwnedBuffer(), prefix);
  EXPECT_LT(OwnedBuffer::from_bytes(std::string_view("\x01", 1)), OwnedBuffer::from_bytes(std::string_view("\xFF", 1)));
  EXPECT_EQ(a.hash(), b.hash());
  std::unordered_set<OwnedBuffer> set;
  set.insert(a);
  set.insert(b);
  set.insert(c);
  EXPECT_EQ(set.size(), 2u);
}

TEST(OwnedBuffer, ReleaseAndAdopt) {
  sb_buffer raw = OwnedBuffer("handoff").release();
  ASSERT_NE(raw.data, nullptr);
  EXPECT_EQ(raw.size, 7u);
  const OwnedBuffer back = OwnedBuffer::adopt(raw);
  EXPECT_EQ(back.as_bytes(), "handoff");
  EXPECT_TRUE(OwnedBuffer::adopt(sb_buffer{nullptr, 0}).is_empty());
}

TEST(OwnedBuffer, PathRoundTrip) {
  const std::filesystem::path p("/tmp/some dir/file.txt");
  const OwnedBuffer buf = OwnedBuffer::from_path(p);
  EXPECT_EQ(buf.as_bytes(), "/tmp/some dir/file.txt");
  EXPECT_EQ(buf.to_path(), p);
}
