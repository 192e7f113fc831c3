#pragma once

#include "Engine.hpp"
#include "FlockWidget.hpp"
#include "GraphicsWidget.hpp"
#include "Model.hpp"

#include <SDL.h>
#include <imgui.h>
#include <memory>
#include <string>

namespace App
{
class FlockApp
{
  public:
  // Optional json file patching the default flock parameters
  explicit FlockApp(const std::string& configFilePath = "");
  ~FlockApp() = default;
  void run();
  bool isInit() const { return m_init; }

  private:
  bool initWindow();
  bool initGraphicsEngine();
  bool initPhysicsEngine();
  bool initFlockWidget();
  bool initGraphicsWidget();
  bool loadConfigFile(const std::string& configFilePath);
  bool closeWindow();
  bool checkSDLStatus();
  void displayMainWidget();

  std::shared_ptr<Physics::Model> m_physicsEngine;
  std::unique_ptr<Render::Engine> m_graphicsEngine;
  std::unique_ptr<UI::FlockWidget> m_flockWidget;
  std::unique_ptr<UI::GraphicsWidget> m_graphicsWidget;

  SDL_Window* m_window;
  SDL_GLContext m_OGLContext;

  std::string m_nameApp;

  // FPS (Frame per second or framerate)
  // User-defined target framerate
  int m_targetFps;
  // Real framerate
  // can be lower than target depending on the physics simulation cost
  float m_currFps;

  ImVec4 m_backGroundColor;
  bool m_init;
};

}
