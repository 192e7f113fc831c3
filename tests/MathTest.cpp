#include "Math.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cmath>

using Math::double2;

namespace
{
constexpr double EPS = 1e-9;

const std::array<double2, 6> SAMPLE_VECTORS {
  double2(3.0, 4.0),
  double2(-1.0, 0.0),
  double2(0.0, -7.5),
  double2(1e-8, -2e-8),
  double2(1e6, 1e6),
  double2(-0.3, 0.7)
};

double cross(const double2& a, const double2& b) { return a.x * b.y - a.y * b.x; }
double dot(const double2& a, const double2& b) { return a.x * b.x + a.y * b.y; }
}

TEST(MathTest, LengthOfPythagoreanTriple)
{
  EXPECT_DOUBLE_EQ(Math::length(double2(3.0, 4.0)), 5.0);
  EXPECT_DOUBLE_EQ(Math::length(double2(0.0, 0.0)), 0.0);
}

TEST(MathTest, DistanceIsSymmetric)
{
  for (const auto& a : SAMPLE_VECTORS)
  {
    for (const auto& b : SAMPLE_VECTORS)
    {
      EXPECT_EQ(Math::distance(a, b), Math::distance(b, a));
    }
  }
  EXPECT_DOUBLE_EQ(Math::distance(double2(1.0, 1.0), double2(4.0, 5.0)), 5.0);
}

TEST(MathTest, NormalizeGivesUnitVector)
{
  for (const auto& v : SAMPLE_VECTORS)
  {
    const auto n = Math::normalize(v);
    EXPECT_NEAR(Math::length(n), 1.0, EPS);
    EXPECT_NEAR(cross(n, v), 0.0, EPS * Math::length(v));
    EXPECT_GT(dot(n, v), 0.0);
  }
}

TEST(MathTest, NormalizeZeroVectorStaysZero)
{
  const auto n = Math::normalize(double2(0.0, 0.0));
  EXPECT_EQ(n.x, 0.0);
  EXPECT_EQ(n.y, 0.0);
}

TEST(MathTest, LimitClampsMagnitudeAndKeepsDirection)
{
  for (const auto& v : SAMPLE_VECTORS)
  {
    for (double max : { 0.1, 1.0, 5.0, 100.0 })
    {
      const auto l = Math::limit(v, max);
      EXPECT_LE(Math::length(l), max + EPS);
      EXPECT_NEAR(cross(Math::normalize(l), Math::normalize(v)), 0.0, EPS);
      EXPECT_GT(dot(l, v), 0.0);
    }
  }
}

TEST(MathTest, LimitLeavesShortVectorUnchanged)
{
  const double2 v(0.3, -0.4);
  EXPECT_EQ(Math::limit(v, 0.6), v);
  EXPECT_EQ(Math::limit(v, 1.0), v);
}

TEST(MathTest, LimitToZeroGivesZeroVector)
{
  const auto l = Math::limit(double2(2.0, -3.0), 0.0);
  EXPECT_EQ(l.x, 0.0);
  EXPECT_EQ(l.y, 0.0);

  EXPECT_EQ(Math::limit(double2(0.0, 0.0), 0.0), double2(0.0, 0.0));
}

TEST(MathTest, HeadingFollowsAtan2)
{
  EXPECT_EQ(Math::heading(double2(0.0, 0.0)), 0.0);
  EXPECT_DOUBLE_EQ(Math::heading(double2(1.0, 0.0)), 0.0);
  EXPECT_DOUBLE_EQ(Math::heading(double2(0.0, 2.0)), Math::PI / 2.0);
  EXPECT_DOUBLE_EQ(Math::heading(double2(-1.0, 0.0)), Math::PI);
  EXPECT_DOUBLE_EQ(Math::heading(double2(0.0, -3.0)), -Math::PI / 2.0);
}

TEST(MathTest, VectorOperators)
{
  double2 v(1.0, 2.0);
  v += double2(2.0, 3.0);
  EXPECT_EQ(v, double2(3.0, 5.0));
  v -= double2(1.0, 1.0);
  EXPECT_EQ(v, double2(2.0, 4.0));
  v *= 0.5;
  EXPECT_EQ(v, double2(1.0, 2.0));
  v /= 2.0;
  EXPECT_EQ(v, double2(0.5, 1.0));
  EXPECT_EQ(-v, double2(-0.5, -1.0));
  EXPECT_EQ(2.0 * v, v * 2.0);
  EXPECT_NE(v, double2(0.0, 0.0));
}
