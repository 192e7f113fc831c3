#include "Engine.hpp"
#include "GLSL.hpp"
#include "Logging.hpp"

#include <algorithm>

using namespace Render;

// Tip on +x, base on -x, scaled by boid size in shader
static constexpr std::array<float, 6> RefBoidTriangle {
  1.0f, 0.0f,
  -1.0f, -0.5f,
  -1.0f, 0.5f
};

Engine::Engine(EngineParams params)
    : m_worldSize(params.worldSize)
    , m_boidSize(params.boidSize)
    , m_boidColor({ 0.0f, 100.0f / 255.0f, 200.0f / 255.0f })
    , m_nbBoids(0)
    , m_init(false)
{
  glEnable(GL_MULTISAMPLE);
  glDisable(GL_DEPTH_TEST);

  buildShaders();

  if (!m_boidShader->isValid())
  {
    LOG_ERROR("Render: Cannot build boids shader");
    return;
  }

  glGenVertexArrays(1, &m_VAO);
  glBindVertexArray(m_VAO);

  initBoids();

  m_init = true;
}

Engine::~Engine()
{
  if (!m_init)
    return;

  glDeleteBuffers(1, &m_boidShapeVBO);
  glDeleteBuffers(1, &m_boidStateVBO);
  glDeleteVertexArrays(1, &m_VAO);
}

void Engine::buildShaders()
{
  m_boidShader = std::make_unique<Shader>(Render::BoidVertShader, Render::BoidFragShader);
}

void Engine::initBoids()
{
  // Same triangle for every boid
  glGenBuffers(1, &m_boidShapeVBO);
  glBindBuffer(GL_ARRAY_BUFFER, m_boidShapeVBO);
  glBufferData(GL_ARRAY_BUFFER, sizeof(RefBoidTriangle), RefBoidTriangle.data(), GL_STATIC_DRAW);
  glVertexAttribPointer(m_boidLocalPosAttribIndex, 2, GL_FLOAT, GL_FALSE, 2 * sizeof(float), nullptr);
  glEnableVertexAttribArray(m_boidLocalPosAttribIndex);
  glBindBuffer(GL_ARRAY_BUFFER, 0);

  // Filled at each frame from the simulation
  glGenBuffers(1, &m_boidStateVBO);
  glBindBuffer(GL_ARRAY_BUFFER, m_boidStateVBO);
  glBufferData(GL_ARRAY_BUFFER, 0, nullptr, GL_DYNAMIC_DRAW);
  glVertexAttribPointer(m_boidStateAttribIndex, 3, GL_FLOAT, GL_FALSE, 3 * sizeof(float), nullptr);
  glEnableVertexAttribArray(m_boidStateAttribIndex);
  glVertexAttribDivisor(m_boidStateAttribIndex, 1);
  glBindBuffer(GL_ARRAY_BUFFER, 0);
}

void Engine::setBoids(const std::vector<Physics::BoidRenderState>& boids)
{
  if (!m_init)
    return;

  m_boidStates.resize(boids.size());
  std::transform(boids.cbegin(), boids.cend(), m_boidStates.begin(),
      [](const Physics::BoidRenderState& boid) -> std::array<float, 3> { return { (float)boid.position.x, (float)boid.position.y, (float)boid.heading }; });

  m_nbBoids = m_boidStates.size();

  glBindBuffer(GL_ARRAY_BUFFER, m_boidStateVBO);
  glBufferData(GL_ARRAY_BUFFER, sizeof(std::array<float, 3>) * m_boidStates.size(), m_boidStates.data(), GL_DYNAMIC_DRAW);
  glBindBuffer(GL_ARRAY_BUFFER, 0);
}

void Engine::draw()
{
  if (!m_init || m_nbBoids == 0)
    return;

  glBindVertexArray(m_VAO);

  m_boidShader->activate();

  m_boidShader->setUniform("u_worldSize", m_worldSize);
  m_boidShader->setUniform("u_boidSize", m_boidSize);
  m_boidShader->setUniform("u_boidColor", m_boidColor);

  glDrawArraysInstanced(GL_TRIANGLES, 0, 3, (GLsizei)m_nbBoids);

  m_boidShader->deactivate();

  glBindVertexArray(0);
}
