#include "raster.h"

#include <gtest/gtest.h>

#include <climits>
#include <stdexcept>
#include <utility>
#include <vector>

using icongen::Canvas;
using icongen::Color;
using icongen::Rgba;

namespace
{
  const Color kRed{200, 10, 20};
  const Color kBlue{5, 6, 250};

  bool is_set(const Canvas &c, int x, int y)
  {
    return c.pixel(x, y).a != 0;
  }

  int count_set(const Canvas &c)
  {
    int n = 0;
    for (int y = 0; y < c.height(); ++y)
      for (int x = 0; x < c.width(); ++x)
        n += is_set(c, x, y) ? 1 : 0;
    return n;
  }
} // namespace

TEST(Canvas, StartsTransparentBlack)
{
  Canvas c(7, 3);
  EXPECT_EQ(c.width(), 7);
  EXPECT_EQ(c.height(), 3);
  EXPECT_EQ(c.pixels().channels, 4u);
  ASSERT_EQ(c.pixels().data.size(), 7u * 3u * 4u);
  for (uint8_t v : c.pixels().data)
    EXPECT_EQ(v, 0);
}

TEST(Canvas, RejectsNonPositiveSize)
{
  EXPECT_THROW(Canvas(0, 10), std::invalid_argument);
  EXPECT_THROW(Canvas(10, 0), std::invalid_argument);
  EXPECT_THROW(Canvas(-1, 5), std::invalid_argument);
}

TEST(Canvas, SetPixelWritesRgba)
{
  Canvas c(4, 4);
  c.set_pixel(1, 2, 10, 20, 30, 40);
  EXPECT_EQ(c.pixel(1, 2), (Rgba{10, 20, 30, 40}));
  c.set_pixel(3, 3, 1, 2, 3);
  EXPECT_EQ(c.pixel(3, 3), (Rgba{1, 2, 3, 255}));
  EXPECT_EQ(count_set(c), 2);
}

TEST(Canvas, SetPixelOutOfRangeIsNoOp)
{
  Canvas c(5, 5);
  c.fill_rect(1, 1, 2, 2, kRed);
  const std::vector<uint8_t> before = c.pixels().data;

  const std::pair<int, int> outside[] = {
      {-1, 0}, {0, -1}, {5, 0}, {0, 5}, {5, 5}, {-100, -100}, {1000, 2}, {2, 1000}};
  for (const auto &p : outside)
    c.set_pixel(p.first, p.second, 255, 255, 255);

  EXPECT_EQ(c.pixels().data, before);
}

TEST(Canvas, FillRectEmptyIsNoOp)
{
  Canvas c(4, 4);
  c.fill_rect(0, 0, 0, 0, kRed);
  c.fill_rect(1, 1, 0, 3, kRed);
  c.fill_rect(1, 1, 3, -2, kRed);
  EXPECT_EQ(count_set(c), 0);
}

TEST(Canvas, FillRectCoversHalfOpenBox)
{
  Canvas c(6, 6);
  c.fill_rect(1, 2, 3, 2, kRed);
  for (int y = 0; y < 6; ++y)
  {
    for (int x = 0; x < 6; ++x)
    {
      const bool inside = x >= 1 && x < 4 && y >= 2 && y < 4;
      EXPECT_EQ(is_set(c, x, y), inside) << x << "," << y;
    }
  }
  EXPECT_EQ(c.pixel(2, 3), (Rgba{200, 10, 20, 255}));
}

TEST(Canvas, FillRectClipsAtEdges)
{
  Canvas c(4, 4);
  c.fill_rect(-2, -2, 4, 4, kRed);
  EXPECT_EQ(count_set(c), 4);
  EXPECT_TRUE(is_set(c, 0, 0));
  EXPECT_TRUE(is_set(c, 1, 1));
  EXPECT_FALSE(is_set(c, 2, 2));

  c.fill_rect(3, 3, 100, 100, kBlue);
  EXPECT_EQ(count_set(c), 5);
}

TEST(Canvas, FillCircleRadiusZeroIsCenterOnly)
{
  Canvas c(5, 5);
  c.fill_circle(2, 3, 0, kRed);
  EXPECT_EQ(count_set(c), 1);
  EXPECT_TRUE(is_set(c, 2, 3));
}

TEST(Canvas, FillCircleRadiusOneIsPlusShape)
{
  Canvas c(5, 5);
  c.fill_circle(2, 2, 1, kRed);
  const std::pair<int, int> expected[] = {{2, 1}, {1, 2}, {2, 2}, {3, 2}, {2, 3}};
  for (const auto &p : expected)
    EXPECT_TRUE(is_set(c, p.first, p.second)) << p.first << "," << p.second;
  EXPECT_EQ(count_set(c), 5);
}

TEST(Canvas, FillCircleMatchesDistanceTest)
{
  const int cx = 10, cy = 9;
  for (int r = 0; r <= 8; ++r)
  {
    Canvas c(21, 21);
    c.fill_circle(cx, cy, r, kBlue);
    for (int y = 0; y < c.height(); ++y)
    {
      for (int x = 0; x < c.width(); ++x)
      {
        const int dx = x - cx, dy = y - cy;
        EXPECT_EQ(is_set(c, x, y), dx * dx + dy * dy <= r * r) << "r=" << r << " at " << x << "," << y;
      }
    }
  }
}

TEST(Canvas, FillCircleNegativeRadiusIsNoOp)
{
  Canvas c(5, 5);
  c.fill_circle(2, 2, -1, kRed);
  EXPECT_EQ(count_set(c), 0);
}

TEST(Canvas, FillCircleClipsAtEdges)
{
  Canvas c(4, 4);
  c.fill_circle(0, 0, 2, kRed);
  // (0,0) (1,0) (2,0) (0,1) (1,1) (0,2)
  EXPECT_EQ(count_set(c), 6);
  EXPECT_FALSE(is_set(c, 2, 1));
}

TEST(Canvas, FillRoundRectShape)
{
  Canvas c(12, 10);
  c.fill_round_rect(1, 1, 10, 8, 2, kRed);

  // 角は欠け、辺の中央は塗られる
  EXPECT_FALSE(is_set(c, 1, 1));
  EXPECT_FALSE(is_set(c, 10, 1));
  EXPECT_FALSE(is_set(c, 1, 8));
  EXPECT_FALSE(is_set(c, 10, 8));
  EXPECT_TRUE(is_set(c, 5, 1));
  EXPECT_TRUE(is_set(c, 5, 8));
  EXPECT_TRUE(is_set(c, 1, 4));
  EXPECT_TRUE(is_set(c, 10, 4));
  EXPECT_TRUE(is_set(c, 3, 1));
  EXPECT_TRUE(is_set(c, 1, 3));

  // 箱の外には書き込まない
  for (int x = 0; x < 12; ++x)
  {
    EXPECT_FALSE(is_set(c, x, 0));
    EXPECT_FALSE(is_set(c, x, 9));
  }
  for (int y = 0; y < 10; ++y)
  {
    EXPECT_FALSE(is_set(c, 0, y));
    EXPECT_FALSE(is_set(c, 11, y));
  }
}

TEST(Canvas, FillRoundRectRadiusZeroIsRect)
{
  Canvas a(8, 8);
  Canvas b(8, 8);
  a.fill_round_rect(1, 2, 5, 4, 0, kRed);
  b.fill_rect(1, 2, 5, 4, kRed);
  // 半径 0 の円は各角の 1 画素のみで、矩形の内側に収まる
  EXPECT_EQ(a.pixels().data, b.pixels().data);
}

TEST(Canvas, LaterDrawsOverwriteEarlier)
{
  Canvas c(4, 4);
  c.set_pixel(1, 1, 9, 9, 9, 7);
  c.fill_rect(0, 0, 4, 4, kRed);
  EXPECT_EQ(c.pixel(1, 1), (Rgba{200, 10, 20, 255}));
  c.fill_circle(1, 1, 0, kBlue);
  EXPECT_EQ(c.pixel(1, 1), (Rgba{5, 6, 250, 255}));
  EXPECT_EQ(c.pixel(2, 2), (Rgba{200, 10, 20, 255}));

  // 順序を入れ替えると結果が変わる
  Canvas d(4, 4);
  d.fill_circle(1, 1, 0, kBlue);
  d.fill_rect(0, 0, 4, 4, kRed);
  EXPECT_NE(c.pixels().data, d.pixels().data);
}

TEST(Canvas, DrawWaveFollowsSine)
{
  Canvas c(40, 20);
  c.draw_wave(4, 8, 32, 2, 2, kRed);
  // 両端と頂点
  EXPECT_TRUE(is_set(c, 4, 8));
  EXPECT_TRUE(is_set(c, 4, 9));
  EXPECT_FALSE(is_set(c, 4, 10));
  EXPECT_TRUE(is_set(c, 20, 10));
  EXPECT_TRUE(is_set(c, 20, 11));
  EXPECT_FALSE(is_set(c, 20, 9));
  EXPECT_TRUE(is_set(c, 36, 8));
  // 2*sin(π/4) = 1.41 -> 1
  EXPECT_TRUE(is_set(c, 12, 9));
  EXPECT_TRUE(is_set(c, 12, 10));
  EXPECT_EQ(count_set(c), 33 * 2);
}

TEST(Canvas, DrawWaveEmptySpanIsNoOp)
{
  Canvas c(8, 8);
  c.draw_wave(1, 1, 0, 2, 2, kRed);
  c.draw_wave(1, 1, 5, 2, 0, kRed);
  EXPECT_EQ(count_set(c), 0);
}

TEST(Canvas, DrawWaveScansOnlyVisibleColumns)
{
  Canvas c(8, 8);
  // 2 億列のうち見えるのは 0..7 だけ
  c.draw_wave(0, 0, 200000000, 0, 1, kRed);
  EXPECT_EQ(count_set(c), 8);
  for (int x = 0; x < 8; ++x)
    EXPECT_TRUE(is_set(c, x, 0)) << x;
}

TEST(Canvas, DrawWaveNearIntLimits)
{
  Canvas c(8, 8);
  c.draw_wave(INT_MAX - 2, 0, 4, 1, 0, kRed);
  c.draw_wave(INT_MAX - 2, 0, 4, 0, INT_MAX, kRed);
  EXPECT_EQ(count_set(c), 0);

  // 最後の 4 列だけが 0..3 に来る
  c.draw_wave(-(INT_MAX - 3), 2, INT_MAX, 0, 1, kBlue);
  EXPECT_EQ(count_set(c), 4);
  for (int x = 0; x < 4; ++x)
    EXPECT_TRUE(is_set(c, x, 2)) << x;

  c.draw_wave(0, INT_MAX, INT_MAX, INT_MAX, INT_MAX, kRed);
  EXPECT_EQ(count_set(c), 4);
}

TEST(Canvas, FillRoundRectHugeRadius)
{
  Canvas c(8, 8);
  c.fill_round_rect(0, 0, 10, 10, 2000000000, kRed);
  EXPECT_EQ(count_set(c), 0);

  c.fill_round_rect(INT_MAX, INT_MAX, INT_MAX, INT_MAX, INT_MAX, kRed);
  c.fill_round_rect(INT_MIN, INT_MIN, INT_MAX, INT_MAX, 0, kRed);
  EXPECT_EQ(count_set(c), 0);

  // 幅と高さがキャンバスを大きく超えても中央の矩形で全面が塗られる
  c.fill_round_rect(-1000000000, -1000000000, INT_MAX, INT_MAX, 1, kBlue);
  EXPECT_EQ(count_set(c), 64);
}

TEST(Canvas, PixelOutsideIsTransparent)
{
  Canvas c(2, 2);
  c.fill_rect(0, 0, 2, 2, kRed);
  EXPECT_EQ(c.pixel(-1, 0), Rgba{});
  EXPECT_EQ(c.pixel(2, 0), Rgba{});
}

TEST(Canvas, ReleaseMovesBuffer)
{
  Canvas c(3, 2);
  c.fill_rect(0, 0, 3, 2, kBlue);
  icongen::PixelBuffer buf = c.release();
  EXPECT_EQ(buf.width, 3u);
  EXPECT_EQ(buf.height, 2u);
  EXPECT_TRUE(buf.is_rgba());
  EXPECT_EQ(buf.data[0], 5);
  EXPECT_EQ(buf.data[3], 255);
}
