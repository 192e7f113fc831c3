#pragma once

#include "Boid.hpp"
#include "Model.hpp"
#include "Simulation.hpp"

#include <cstddef>
#include <memory>
#include <random>
#include <vector>

namespace Physics
{
// Boids flocking on the CPU, Craig Reynolds rules with full pairwise neighbor scan
class FlockModel : public Model
{
  public:
  explicit FlockModel(ModelParams params);
  ~FlockModel() override = default;

  void update() override;

  // Restores every parameter to its default value, existing boids are kept
  void reset() override;

  size_t nbParticles() const override { return m_simulation.nbBoids(); }

  std::vector<BoidRenderState> renderStates() const override { return m_simulation.renderStates(); }

  const Simulation& simulation() const { return m_simulation; }

  // Live knobs
  void setSeparationForce(double separation);
  double separationForce() const { return m_simulation.params().separationForce; }

  void setAlignmentForce(double alignment);
  double alignmentForce() const { return m_simulation.params().alignmentForce; }

  void setCohesionForce(double cohesion);
  double cohesionForce() const { return m_simulation.params().cohesionForce; }

  void setPerceptionRadius(double radius);
  double perceptionRadius() const { return m_simulation.params().perceptionRadius; }

  // Applied to all current boids and to the ones spawned later
  void setMaxSpeed(double maxSpeed);
  double maxSpeed() const { return m_maxSpeed; }

  // Spawns boids at random positions or removes them from the end of the flock
  void setNbBoids(size_t nbBoids);

  protected:
  void updateModelWithInputJson() override;

  private:
  void applyMaxSpeed(double maxSpeed);
  void applyNbBoids(size_t nbBoids);
  std::shared_ptr<Boid> spawnBoid();
  void writeParamsToJson();

  Simulation m_simulation;

  double m_maxSpeed;

  std::mt19937 m_randomEngine;
};
}
