#pragma once

#include "Math.hpp"

#include <memory>
#include <vector>

namespace Physics
{
class Boid;

// Ordered collection of boids, membership is by pointer identity
using BoidList = std::vector<std::shared_ptr<Boid>>;

// Default per-boid limits
static constexpr double DEFAULT_MAX_SPEED = 4.0;
static constexpr double DEFAULT_MAX_FORCE = 0.2;

// One flocking entity following Craig Reynolds boids laws, 1987
// Unit mass, forces are accumulated into acceleration and consumed by update()
class Boid
{
  public:
  // Random unit velocity
  Boid(double x, double y);
  Boid(const Math::double2& position, const Math::double2& velocity);
  ~Boid() = default;

  const Math::double2& position() const { return m_position; }
  void setPosition(const Math::double2& position) { m_position = position; }

  const Math::double2& velocity() const { return m_velocity; }
  void setVelocity(const Math::double2& velocity) { m_velocity = velocity; }

  const Math::double2& acceleration() const { return m_acceleration; }

  double maxSpeed() const { return m_maxSpeed; }
  void setMaxSpeed(double maxSpeed) { m_maxSpeed = maxSpeed; }

  double maxForce() const { return m_maxForce; }
  void setMaxForce(double maxForce) { m_maxForce = maxForce; }

  // Direction of travel in radians
  double heading() const { return Math::heading(m_velocity); }

  // Steering rules, neighbors are the boids strictly inside (0, perceptionRadius)
  // Weight is applied last, after the max force clamp
  Math::double2 separation(const BoidList& boids, double perceptionRadius, double forceWeight) const;
  Math::double2 alignment(const BoidList& boids, double perceptionRadius, double forceWeight) const;
  Math::double2 cohesion(const BoidList& boids, double perceptionRadius, double forceWeight) const;

  void applyForce(const Math::double2& force) { m_acceleration += force; }

  // Integrates acceleration into velocity and position, then clears acceleration
  void update();

  // Teleports to the opposite side once outside [0, width) x [0, height)
  void wrapAround(double width, double height);

  private:
  bool isNeighbor(const Boid& other, double perceptionRadius, double& dist) const;
  Math::double2 steerTowards(const Math::double2& desiredDirection, double forceWeight) const;
  Math::double2 seek(const Math::double2& target, double forceWeight) const;

  Math::double2 m_position;
  Math::double2 m_velocity;
  Math::double2 m_acceleration;

  double m_maxSpeed;
  double m_maxForce;
};
}
