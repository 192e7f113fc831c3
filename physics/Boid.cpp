#include "Boid.hpp"
#include "Utils.hpp"

#include <cmath>

using namespace Physics;

Boid::Boid(double x, double y)
    : m_position(x, y)
    , m_acceleration(0.0, 0.0)
    , m_maxSpeed(DEFAULT_MAX_SPEED)
    , m_maxForce(DEFAULT_MAX_FORCE)
{
  const double angle = Utils::RandomAngle();
  m_velocity = { std::cos(angle), std::sin(angle) };
}

Boid::Boid(const Math::double2& position, const Math::double2& velocity)
    : m_position(position)
    , m_velocity(velocity)
    , m_acceleration(0.0, 0.0)
    , m_maxSpeed(DEFAULT_MAX_SPEED)
    , m_maxForce(DEFAULT_MAX_FORCE)
{
}

bool Boid::isNeighbor(const Boid& other, double perceptionRadius, double& dist) const
{
  dist = Math::distance(m_position, other.m_position);

  // Strict bounds, self and coincident boids are skipped
  return dist > 0.0 && dist < perceptionRadius;
}

Math::double2 Boid::steerTowards(const Math::double2& desiredDirection, double forceWeight) const
{
  const Math::double2 desired = Math::normalize(desiredDirection) * m_maxSpeed;
  const Math::double2 steer = Math::limit(desired - m_velocity, m_maxForce);
  return steer * forceWeight;
}

Math::double2 Boid::separation(const BoidList& boids, double perceptionRadius, double forceWeight) const
{
  Math::double2 steer(0.0, 0.0);
  int count = 0;

  for (const auto& other : boids)
  {
    double dist = 0.0;
    if (!other || !isNeighbor(*other, perceptionRadius, dist))
      continue;

    // Pointing away from the neighbor, closer ones push harder
    Math::double2 away = Math::normalize(m_position - other->m_position);
    steer += away * (1.0 / dist);
    ++count;
  }

  if (count == 0)
    return { 0.0, 0.0 };

  steer /= static_cast<double>(count);
  return steerTowards(steer, forceWeight);
}

Math::double2 Boid::alignment(const BoidList& boids, double perceptionRadius, double forceWeight) const
{
  Math::double2 avgVelocity(0.0, 0.0);
  int count = 0;

  for (const auto& other : boids)
  {
    double dist = 0.0;
    if (!other || !isNeighbor(*other, perceptionRadius, dist))
      continue;

    avgVelocity += other->m_velocity;
    ++count;
  }

  if (count == 0)
    return { 0.0, 0.0 };

  avgVelocity /= static_cast<double>(count);
  return steerTowards(avgVelocity, forceWeight);
}

Math::double2 Boid::cohesion(const BoidList& boids, double perceptionRadius, double forceWeight) const
{
  Math::double2 centerOfMass(0.0, 0.0);
  int count = 0;

  for (const auto& other : boids)
  {
    double dist = 0.0;
    if (!other || !isNeighbor(*other, perceptionRadius, dist))
      continue;

    centerOfMass += other->m_position;
    ++count;
  }

  if (count == 0)
    return { 0.0, 0.0 };

  centerOfMass /= static_cast<double>(count);
  return seek(centerOfMass, forceWeight);
}

Math::double2 Boid::seek(const Math::double2& target, double forceWeight) const
{
  return steerTowards(target - m_position, forceWeight);
}

void Boid::update()
{
  // Order matters, acceleration is clamped before the velocity add
  // and velocity after it, so speed never exceeds max speed
  m_acceleration = Math::limit(m_acceleration, m_maxForce);

  m_velocity += m_acceleration;
  m_velocity = Math::limit(m_velocity, m_maxSpeed);

  m_position += m_velocity;

  m_acceleration = { 0.0, 0.0 };
}

void Boid::wrapAround(double width, double height)
{
  // Reaching the upper bound already counts as leaving the world
  if (m_position.x >= width)
    m_position.x = 0.0;
  if (m_position.x < 0.0)
    m_position.x = width;

  if (m_position.y >= height)
    m_position.y = 0.0;
  if (m_position.y < 0.0)
    m_position.y = height;
}
