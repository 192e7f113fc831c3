#include "FlockModel.hpp"
#include "Logging.hpp"
#include "Parameters.hpp"

#include <algorithm>
#include <cmath>

using namespace Physics;

#define NODE_FORCES "Flocking Forces"
#define NODE_SIMULATION "Simulation Parameters"

#define PARAM_SEPARATION "Separation"
#define PARAM_ALIGNMENT "Alignment"
#define PARAM_COHESION "Cohesion"
#define PARAM_PERCEPTION_RADIUS "Perception Radius"
#define PARAM_MAX_SPEED "Max Speed"
#define PARAM_BOID_COUNT "Boid Count"

namespace Physics
{
// Ranges are UI hints only, the model accepts anything
static const json initJson // clang-format off
{
  { NODE_FORCES, {
      { PARAM_SEPARATION, { 1.5, 0.0, 5.0 } },
      { PARAM_ALIGNMENT, { 1.0, 0.0, 5.0 } },
      { PARAM_COHESION, { 1.0, 0.0, 5.0 } }
    }
  },
  { NODE_SIMULATION, {
      { PARAM_PERCEPTION_RADIUS, { 100.0, 10.0, 200.0 } },
      { PARAM_MAX_SPEED, { DEFAULT_MAX_SPEED, 1.0, 10.0 } },
      { PARAM_BOID_COUNT, { (int)Utils::DEFAULT_NB_BOIDS, 10, 500 } }
    }
  }
}; // clang-format on
}

namespace
{
// Non-finite or non-positive counts give an empty flock
size_t toNbBoids(double nbBoids)
{
  if (!std::isfinite(nbBoids) || nbBoids <= 0.0)
    return 0;

  return (size_t)std::min(nbBoids, (double)Utils::MAX_NB_BOIDS);
}
}

FlockModel::FlockModel(ModelParams params)
    : Model(json(initJson))
    , m_simulation(params.worldSize.x, params.worldSize.y)
    , m_maxSpeed(DEFAULT_MAX_SPEED)
    , m_randomEngine(params.seed != 0 ? params.seed : std::random_device {}())
{
  m_init = true;

  reset();
}

void FlockModel::update()
{
  if (!m_init || m_pause)
    return;

  m_simulation.update();
}

void FlockModel::reset()
{
  if (!m_init)
    return;

  m_inputJson = initJson;

  updateModelWithInputJson();

  LOG_INFO("Flock reset to default parameters, {} boids", m_simulation.nbBoids());
}

void FlockModel::updateModelWithInputJson()
{
  if (!m_init)
    return;

  // Everything is read first, a bad path or type throws before the model is touched
  const auto& forcesJson = m_inputJson.at(NODE_FORCES);
  const auto& simJson = m_inputJson.at(NODE_SIMULATION);

  FlockParams params;
  params.separationForce = forcesJson.at(PARAM_SEPARATION).at(0).get<double>();
  params.alignmentForce = forcesJson.at(PARAM_ALIGNMENT).at(0).get<double>();
  params.cohesionForce = forcesJson.at(PARAM_COHESION).at(0).get<double>();
  params.perceptionRadius = simJson.at(PARAM_PERCEPTION_RADIUS).at(0).get<double>();

  const double maxSpeed = simJson.at(PARAM_MAX_SPEED).at(0).get<double>();
  const double nbBoids = simJson.at(PARAM_BOID_COUNT).at(0).get<double>();

  m_simulation.params() = params;
  applyMaxSpeed(maxSpeed);
  applyNbBoids(toNbBoids(nbBoids));

  // Tree follows what was applied, count back to an integer leaf
  writeParamsToJson();
}

void FlockModel::writeParamsToJson()
{
  const auto& params = m_simulation.params();

  auto& forcesJson = m_inputJson[NODE_FORCES];
  forcesJson[PARAM_SEPARATION][0] = params.separationForce;
  forcesJson[PARAM_ALIGNMENT][0] = params.alignmentForce;
  forcesJson[PARAM_COHESION][0] = params.cohesionForce;

  auto& simJson = m_inputJson[NODE_SIMULATION];
  simJson[PARAM_PERCEPTION_RADIUS][0] = params.perceptionRadius;
  simJson[PARAM_MAX_SPEED][0] = m_maxSpeed;
  simJson[PARAM_BOID_COUNT][0] = (int)m_simulation.nbBoids();
}

void FlockModel::setSeparationForce(double separation)
{
  m_simulation.params().separationForce = separation;
  writeParamsToJson();
}

void FlockModel::setAlignmentForce(double alignment)
{
  m_simulation.params().alignmentForce = alignment;
  writeParamsToJson();
}

void FlockModel::setCohesionForce(double cohesion)
{
  m_simulation.params().cohesionForce = cohesion;
  writeParamsToJson();
}

void FlockModel::setPerceptionRadius(double radius)
{
  m_simulation.params().perceptionRadius = radius;
  writeParamsToJson();
}

void FlockModel::setMaxSpeed(double maxSpeed)
{
  applyMaxSpeed(maxSpeed);
  writeParamsToJson();
}

void FlockModel::setNbBoids(size_t nbBoids)
{
  applyNbBoids(nbBoids);
  writeParamsToJson();
}

void FlockModel::applyMaxSpeed(double maxSpeed)
{
  m_maxSpeed = maxSpeed;

  for (const auto& boid : m_simulation.boids())
    boid->setMaxSpeed(maxSpeed);
}

void FlockModel::applyNbBoids(size_t nbBoids)
{
  const size_t currNbBoids = m_simulation.nbBoids();

  if (nbBoids > currNbBoids)
  {
    for (size_t i = currNbBoids; i < nbBoids; ++i)
      m_simulation.addBoid(spawnBoid());
  }
  else
  {
    // Removed from the end
    while (m_simulation.nbBoids() > nbBoids)
    {
      const auto lastBoid = m_simulation.boids().back();
      m_simulation.removeBoid(lastBoid);
    }
  }

  if (nbBoids != currNbBoids)
    LOG_DEBUG("Boids count changed from {} to {}", currNbBoids, nbBoids);
}

std::shared_ptr<Boid> FlockModel::spawnBoid()
{
  const double width = m_simulation.width();
  const double height = m_simulation.height();

  Math::double2 pos;
  pos.x = (width > 0.0) ? Utils::RandomUniform(0.0, width, m_randomEngine) : 0.0;
  pos.y = (height > 0.0) ? Utils::RandomUniform(0.0, height, m_randomEngine) : 0.0;

  const double angle = Utils::RandomAngle(m_randomEngine);
  Math::double2 vel(std::cos(angle), std::sin(angle));

  auto boid = std::make_shared<Boid>(pos, vel);
  boid->setMaxSpeed(m_maxSpeed);

  return boid;
}
