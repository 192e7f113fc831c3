#include "FlockApp.hpp"

#include "FlockModel.hpp"

#include "Logging.hpp"
#include "Parameters.hpp"
#include "Utils.hpp"

#include <imgui.h>
#include <imgui_impl_opengl3.h>
#include <imgui_impl_sdl.h>

#include <glad/glad.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>

constexpr auto GLSL_VERSION = "#version 330";

namespace App
{
bool FlockApp::initWindow()
{
  // Setup SDL
  if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
  {
    LOG_ERROR("Error: {}", SDL_GetError());
    return false;
  }

  // GL 3.3 + GLSL 330, needed for instanced drawing
#if __APPLE__
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, SDL_GL_CONTEXT_FORWARD_COMPATIBLE_FLAG);
#else
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, 0);
#endif
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
  SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);

  // Create window with graphics context
  SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
  SDL_GL_SetAttribute(SDL_GL_MULTISAMPLEBUFFERS, 1);
  SDL_GL_SetAttribute(SDL_GL_MULTISAMPLESAMPLES, 4);
  SDL_WindowFlags window_flags = (SDL_WindowFlags)(SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI | SDL_WINDOW_SHOWN);
  m_window = SDL_CreateWindow(m_nameApp.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, Utils::WORLD_WIDTH, Utils::WORLD_HEIGHT, window_flags);
  if (!m_window)
  {
    LOG_ERROR("Error: {}", SDL_GetError());
    return false;
  }

  m_OGLContext = SDL_GL_CreateContext(m_window);
  if (!m_OGLContext)
  {
    LOG_ERROR("Error: {}", SDL_GetError());
    return false;
  }

  SDL_GL_MakeCurrent(m_window, m_OGLContext);
  SDL_GL_SetSwapInterval(1); // Enable vsync

  // Initialize OpenGL loader
  bool err = gladLoadGL() == 0;

  if (err)
  {
    LOG_ERROR("Failed to initialize OpenGL loader!");
    return false;
  }

  IMGUI_CHECKVERSION();
  ImGui::CreateContext();

  ImGui::StyleColorsDark();

  ImGui_ImplSDL2_InitForOpenGL(m_window, m_OGLContext);
  ImGui_ImplOpenGL3_Init(GLSL_VERSION);

  ImGuiIO& io = ImGui::GetIO();
  io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

  return true;
}

bool FlockApp::closeWindow()
{
  ImGui_ImplOpenGL3_Shutdown();
  ImGui_ImplSDL2_Shutdown();
  ImGui::DestroyContext();

  SDL_GL_DeleteContext(m_OGLContext);
  SDL_DestroyWindow(m_window);
  SDL_Quit();

  return true;
}

bool FlockApp::checkSDLStatus()
{
  bool stopRendering = false;

  SDL_Event event;
  while (SDL_PollEvent(&event))
  {
    ImGui_ImplSDL2_ProcessEvent(&event);
    switch (event.type)
    {
    case SDL_QUIT:
    {
      stopRendering = true;
      break;
    }
    case SDL_WINDOWEVENT:
    {
      if (event.window.event == SDL_WINDOWEVENT_CLOSE && event.window.windowID == SDL_GetWindowID(m_window))
      {
        stopRendering = true;
      }
      break;
    }
    case SDL_KEYDOWN:
    {
      if (ImGui::GetIO().WantCaptureKeyboard)
        break;

      if (event.key.keysym.sym == SDLK_SPACE)
      {
        bool isPaused = m_physicsEngine->onPause();
        m_physicsEngine->pause(!isPaused);
      }
      break;
    }
    }
  }
  return stopRendering;
}

FlockApp::FlockApp(const std::string& configFilePath)
    : m_window(nullptr)
    , m_OGLContext(nullptr)
    , m_nameApp("Flock2D " + Utils::GetVersions())
    , m_targetFps(Utils::MAX_TARGET_FPS)
    , m_currFps((float)Utils::MAX_TARGET_FPS)
    , m_backGroundColor(20.0f / 255.0f, 20.0f / 255.0f, 20.0f / 255.0f, 1.00f)
    , m_init(false)
{
  if (!initWindow())
  {
    LOG_ERROR("Failed to initialize application window");
    return;
  }

  if (!initGraphicsEngine())
  {
    LOG_ERROR("Failed to initialize graphics engine");
    return;
  }

  if (!initGraphicsWidget())
  {
    LOG_ERROR("Failed to initialize graphics widget");
    return;
  }

  if (!initPhysicsEngine())
  {
    LOG_ERROR("Failed to initialize physics engine");
    return;
  }

  if (!initFlockWidget())
  {
    LOG_ERROR("Failed to initialize flock widget");
    return;
  }

  if (!configFilePath.empty() && !loadConfigFile(configFilePath))
  {
    LOG_ERROR("Config file {} ignored, running with default parameters", configFilePath);
  }

  LOG_INFO("Application correctly initialized");

  m_init = true;
}

bool FlockApp::initGraphicsEngine()
{
  Render::EngineParams params;
  params.worldSize = { (float)Utils::WORLD_WIDTH, (float)Utils::WORLD_HEIGHT };

  m_graphicsEngine = std::make_unique<Render::Engine>(params);

  return (m_graphicsEngine.get() != nullptr && m_graphicsEngine->isInit());
}

bool FlockApp::initGraphicsWidget()
{
  m_graphicsWidget = std::make_unique<UI::GraphicsWidget>(m_graphicsEngine.get());

  return (m_graphicsWidget.get() != nullptr);
}

bool FlockApp::initPhysicsEngine()
{
  Physics::ModelParams params;
  params.worldSize = { (double)Utils::WORLD_WIDTH, (double)Utils::WORLD_HEIGHT };

  if (m_physicsEngine)
  {
    LOG_DEBUG("Physics engine already existing, resetting it");
    m_physicsEngine.reset();
  }

  m_physicsEngine = std::make_shared<Physics::FlockModel>(params);

  return (m_physicsEngine.get() != nullptr && m_physicsEngine->isInit());
}

bool FlockApp::initFlockWidget()
{
  m_flockWidget = std::make_unique<UI::FlockWidget>(m_physicsEngine);

  return (m_flockWidget.get() != nullptr);
}

bool FlockApp::loadConfigFile(const std::string& configFilePath)
{
  json configJson;
  if (!Utils::LoadJsonFile(configFilePath, configJson))
    return false;

  if (!m_physicsEngine->updateInputJson(configJson))
    return false;

  LOG_INFO("Parameters loaded from {}", configFilePath);

  return true;
}

void FlockApp::run()
{
  auto start = std::chrono::steady_clock::now();

  bool stopRendering = false;
  while (!stopRendering)
  {
    stopRendering = checkSDLStatus();

    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplSDL2_NewFrame(m_window);
    ImGui::NewFrame();

    displayMainWidget();

    m_graphicsWidget->display();
    m_flockWidget->display();

    ImGuiIO& io = ImGui::GetIO();
    glViewport(0, 0, (int)io.DisplaySize.x, (int)io.DisplaySize.y);
    glClearColor(m_backGroundColor.x, m_backGroundColor.y, m_backGroundColor.z, m_backGroundColor.w);
    glClear(GL_COLOR_BUFFER_BIT);

    // Slowing down physics engine if target fps is lower than current fps
    auto now = std::chrono::steady_clock::now();
    auto timeSpent = now - start;
    const int targetFps = std::max(1, m_targetFps);
    if (timeSpent > std::chrono::milliseconds(1000 / targetFps))
    {
      auto msSpent = std::chrono::duration_cast<std::chrono::milliseconds>(timeSpent).count();
      m_currFps = (msSpent > 0) ? 1000.0f / msSpent : (float)targetFps;

      m_physicsEngine->update();

      m_graphicsEngine->setBoids(m_physicsEngine->renderStates());

      start = now;
    }

    m_graphicsEngine->draw();

    ImGui::Render();

    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    SDL_GL_SwapWindow(m_window);
  }

  closeWindow();
}

void FlockApp::displayMainWidget()
{
  // First default pos
  ImGui::SetNextWindowPos(ImVec2(15, 12), ImGuiCond_FirstUseEver);

  ImGui::Begin("Main Widget", nullptr, ImGuiWindowFlags_AlwaysAutoResize);
  ImGui::PushItemWidth(150);

  bool isOnPaused = m_physicsEngine->onPause();
  std::string pauseRun = isOnPaused ? "  Start  " : "  Pause  ";
  if (ImGui::Button(pauseRun.c_str()))
  {
    m_physicsEngine->pause(!isOnPaused);
  }

  ImGui::Spacing();
  ImGui::Separator();
  ImGui::Spacing();

  ImGui::SliderInt("Target FPS", &m_targetFps, 1, Utils::MAX_TARGET_FPS);

  ImGui::Text(" %.3f ms/frame (%.1f FPS) ", 1000.0f / m_currFps, m_currFps);

  ImGui::PopItemWidth();
  ImGui::End();
}

} // End namespace App

int main(int argc, char** argv)
{
  Utils::InitializeLogger();

  App::FlockApp app((argc > 1) ? std::string(argv[1]) : std::string());

  if (!app.isInit())
    return EXIT_FAILURE;

  app.run();

  return EXIT_SUCCESS;
}
