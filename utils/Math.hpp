#pragma once

#include <cmath>

namespace Math
{
static constexpr double PI = 3.14159265358979323846;

template <typename T>
struct Vector2
{
  T x;
  T y;

  constexpr Vector2()
      : x(0)
      , y(0) {};
  constexpr Vector2(T vx, T vy)
      : x(vx)
      , y(vy) {};

  Vector2& operator+=(const Vector2& other)
  {
    x += other.x;
    y += other.y;
    return *this;
  }

  Vector2& operator-=(const Vector2& other)
  {
    x -= other.x;
    y -= other.y;
    return *this;
  }

  Vector2& operator*=(T scalar)
  {
    x *= scalar;
    y *= scalar;
    return *this;
  }

  Vector2& operator/=(T scalar)
  {
    x /= scalar;
    y /= scalar;
    return *this;
  }
};

template <typename T>
constexpr Vector2<T> operator+(const Vector2<T>& a, const Vector2<T>& b) { return { a.x + b.x, a.y + b.y }; }

template <typename T>
constexpr Vector2<T> operator-(const Vector2<T>& a, const Vector2<T>& b) { return { a.x - b.x, a.y - b.y }; }

template <typename T>
constexpr Vector2<T> operator-(const Vector2<T>& a) { return { -a.x, -a.y }; }

template <typename T>
constexpr Vector2<T> operator*(const Vector2<T>& a, T s) { return { a.x * s, a.y * s }; }

template <typename T>
constexpr Vector2<T> operator*(T s, const Vector2<T>& a) { return { a.x * s, a.y * s }; }

template <typename T>
constexpr Vector2<T> operator/(const Vector2<T>& a, T s) { return { a.x / s, a.y / s }; }

template <typename T>
constexpr bool operator==(const Vector2<T>& a, const Vector2<T>& b) { return a.x == b.x && a.y == b.y; }

template <typename T>
constexpr bool operator!=(const Vector2<T>& a, const Vector2<T>& b) { return !(a == b); }

using double2 = Vector2<double>;
using float2 = Vector2<float>;
using int2 = Vector2<int>;

// Magnitude, sqrt(x^2 + y^2)
template <typename T>
T length(const Vector2<T>& v)
{
  return std::sqrt(v.x * v.x + v.y * v.y);
}

// Euclidean distance, symmetric in its arguments
template <typename T>
T distance(const Vector2<T>& a, const Vector2<T>& b)
{
  return length(b - a);
}

// Unit vector with the same direction, zero vector stays zero
template <typename T>
Vector2<T> normalize(const Vector2<T>& v)
{
  const T mag = length(v);
  if (mag == T(0))
    return { T(0), T(0) };

  return { v.x / mag, v.y / mag };
}

// Clamps the magnitude of v to max, direction is kept
template <typename T>
Vector2<T> limit(const Vector2<T>& v, T max)
{
  if (length(v) <= max)
    return v;

  return normalize(v) * max;
}

// Angle of v in radians, atan2(0, 0) gives 0
template <typename T>
T heading(const Vector2<T>& v)
{
  return std::atan2(v.y, v.x);
}
}
