#pragma once

#include "Model.hpp"

#include <memory>

namespace UI
{
class FlockWidget
{
  public:
  explicit FlockWidget(std::shared_ptr<Physics::Model> physicsEngine)
      : m_physicsEngine(physicsEngine) {};
  virtual ~FlockWidget() = default;

  void display();

  private:
  std::weak_ptr<Physics::Model> m_physicsEngine;
};
}
