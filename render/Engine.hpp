#pragma once

#include "Math.hpp"
#include "Shader.hpp"
#include "Simulation.hpp"

#include <array>
#include <glad/glad.h>
#include <memory>
#include <vector>

namespace Render
{
struct EngineParams
{
  Math::float2 worldSize = { 0.0f, 0.0f };
  float boidSize = 8.0f;
};

// Draws the flock as triangles pointing along their heading
class Engine
{
  public:
  Engine(EngineParams params);
  ~Engine();

  bool isInit() const { return m_init; }

  // Per-frame upload of the boids to draw
  void setBoids(const std::vector<Physics::BoidRenderState>& boids);
  void draw();

  inline float getBoidSize() const { return m_boidSize; }
  inline void setBoidSize(float boidSize) { m_boidSize = boidSize; }

  inline const std::array<float, 3>& getBoidColor() const { return m_boidColor; }
  inline void setBoidColor(const std::array<float, 3>& color) { m_boidColor = color; }

  inline Math::float2 worldSize() const { return m_worldSize; }

  private:
  void buildShaders();
  void initBoids();

  const GLuint m_boidLocalPosAttribIndex { 0 };
  const GLuint m_boidStateAttribIndex { 1 };

  GLuint m_VAO;
  GLuint m_boidShapeVBO;
  GLuint m_boidStateVBO;

  std::unique_ptr<Shader> m_boidShader;

  Math::float2 m_worldSize;
  float m_boidSize;
  std::array<float, 3> m_boidColor;

  size_t m_nbBoids;
  // x, y, heading per boid
  std::vector<std::array<float, 3>> m_boidStates;

  bool m_init;
};
}
