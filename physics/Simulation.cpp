#include "Simulation.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

using namespace Physics;

Simulation::Simulation(double width, double height)
    : m_width(width)
    , m_height(height)
{
}

void Simulation::addBoid(std::shared_ptr<Boid> boid)
{
  if (!boid)
    return;

  m_boids.push_back(std::move(boid));
}

void Simulation::removeBoid(const std::shared_ptr<Boid>& boid)
{
  auto it = std::find(m_boids.begin(), m_boids.end(), boid);
  if (it != m_boids.end())
    m_boids.erase(it);
}

void Simulation::update(const FlockParams& params)
{
  for (const auto& boid : m_boids)
  {
    const auto sep = boid->separation(m_boids, params.perceptionRadius, params.separationForce);
    const auto align = boid->alignment(m_boids, params.perceptionRadius, params.alignmentForce);
    const auto coh = boid->cohesion(m_boids, params.perceptionRadius, params.cohesionForce);

    boid->applyForce(sep);
    boid->applyForce(align);
    boid->applyForce(coh);

    boid->update();

    boid->wrapAround(m_width, m_height);
  }
}

std::vector<BoidRenderState> Simulation::renderStates() const
{
  std::vector<BoidRenderState> states;
  states.reserve(m_boids.size());

  std::transform(m_boids.cbegin(), m_boids.cend(), std::back_inserter(states),
      [](const std::shared_ptr<Boid>& boid) -> BoidRenderState { return { boid->position(), boid->heading() }; });

  return states;
}
