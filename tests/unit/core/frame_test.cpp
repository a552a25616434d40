#include <vieweval/core/frame.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace vc = vieweval::core;

TEST(Frame, DefaultEmpty) {
  vc::Frame f;
  EXPECT_EQ(f.width(), 0u);
  EXPECT_EQ(f.height(), 0u);
  EXPECT_TRUE(f.empty());
  EXPECT_FALSE(f.valid());
  EXPECT_EQ(f.size_bytes(), 0u);
}

TEST(Frame, ConstructFromBuffer) {
  std::vector<std::byte> buf(100 * 100 * 3);
  vc::Frame f(100, 100, vc::PixelFormat::RGB8, std::move(buf));
  EXPECT_EQ(f.width(), 100u);
  EXPECT_EQ(f.height(), 100u);
  EXPECT_EQ(f.format(), vc::PixelFormat::RGB8);
  EXPECT_FALSE(f.empty());
  EXPECT_TRUE(f.valid());
  EXPECT_EQ(f.data().size(), 100u * 100 * 3);
}

TEST(Frame, ShortBufferIsInvalid) {
  std::vector<std::byte> buf(10 * 10 * 3);
  vc::Frame f(10, 10, vc::PixelFormat::RGBA8, std::move(buf));
  EXPECT_FALSE(f.valid());
}

TEST(Frame, MinBytes) {
  EXPECT_EQ(vc::Frame::min_bytes(10, 10, vc::PixelFormat::Grayscale8), 100u);
  EXPECT_EQ(vc::Frame::min_bytes(10, 10, vc::PixelFormat::RGB8), 300u);
  EXPECT_EQ(vc::Frame::min_bytes(10, 10, vc::PixelFormat::BGRA8), 400u);
  EXPECT_EQ(vc::Frame::min_bytes(10, 10, vc::PixelFormat::Unknown), 0u);
}

TEST(Frame, StrideAndSize) {
  vc::Frame rgba(7, 3, vc::PixelFormat::BGRA8,
                 std::vector<std::byte>(vc::Frame::min_bytes(7, 3, vc::PixelFormat::BGRA8)));
  EXPECT_EQ(rgba.channels(), 4u);
  EXPECT_EQ(rgba.stride(), 28u);

  vc::Frame gray(7, 3, vc::PixelFormat::Grayscale8, std::vector<std::byte>(21));
  EXPECT_TRUE(gray.same_size(rgba));
  EXPECT_FALSE(gray.same_size(vc::Frame{}));
}
