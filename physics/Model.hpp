#pragma once

#include "Math.hpp"
#include "Simulation.hpp"
#include "Utils.hpp"

#include <cstddef>
#include <vector>

namespace Physics
{
struct ModelParams
{
  // Bounds of the world, fixed for the model lifetime
  Math::double2 worldSize = { 0.0, 0.0 };
  // Seed of the model random engine, 0 picks a random one
  unsigned int seed = 0;
};

// Abstract class defining physical model foundations to implement
// Parameters exposed to the UI live in a json tree of [value, min, max] leaves
class Model
{
  public:
  explicit Model(json js = {})
      : m_init(false)
      , m_pause(false)
      , m_inputJson(js) {};

  virtual ~Model() = default;

  virtual size_t nbParticles() const = 0;

  virtual void update() = 0;
  virtual void reset() = 0;

  bool isInit() const { return m_init; }

  void pause(bool pause) { m_pause = pause; }
  bool onPause() const { return m_pause; }

  // Read-only snapshot for rendering, in simulation order
  virtual std::vector<BoidRenderState> renderStates() const = 0;

  json getInputJson() const { return m_inputJson; }

  // Merge-patches the parameters tree and pushes it into the model
  // Returns false and keeps the previous tree if the patch cannot be applied
  bool updateInputJson(const json& newJson);

  protected:
  // Throws json::exception on a malformed tree, before modifying anything
  virtual void updateModelWithInputJson() = 0;

  bool m_init;
  bool m_pause;

  // Container for model parameters available in UI
  json m_inputJson;
};
}
