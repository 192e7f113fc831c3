#pragma once

#include "Boid.hpp"
#include "FlockParams.hpp"
#include "Math.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace Physics
{
// What the renderer needs from each boid
struct BoidRenderState
{
  Math::double2 position;
  double heading;
};

// Owns the flock and steps it forward, one update() call per frame
// Not thread-safe, the flock must not be modified during update()
class Simulation
{
  public:
  Simulation(double width, double height);
  ~Simulation() = default;

  void addBoid(std::shared_ptr<Boid> boid);
  // First occurrence only, no-op if absent
  void removeBoid(const std::shared_ptr<Boid>& boid);
  void clear() { m_boids.clear(); }

  const BoidList& boids() const { return m_boids; }
  size_t nbBoids() const { return m_boids.size(); }

  double width() const { return m_width; }
  double height() const { return m_height; }

  FlockParams& params() { return m_params; }
  const FlockParams& params() const { return m_params; }

  void update() { update(m_params); }

  // Boids are processed one after the other in insertion order,
  // each one reading the already updated state of the previous ones
  void update(const FlockParams& params);

  std::vector<BoidRenderState> renderStates() const;

  private:
  BoidList m_boids;

  double m_width;
  double m_height;

  FlockParams m_params;
};
}
