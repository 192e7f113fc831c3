#include "FlockWidget.hpp"
#include "Logging.hpp"

#include <imgui.h>
#include <string>

namespace
{
void drawImguiSliderInt(const std::string& name, json& js)
{
  int intVal = js.at(0);
  int minVal = js.at(1);
  int maxVal = js.at(2);
  if (ImGui::SliderInt(name.c_str(), &intVal, minVal, maxVal))
  {
    js.at(0) = intVal;
  }
}

void drawImguiSliderFloat(const std::string& name, json& js)
{
  float floatVal = js.at(0);
  float minVal = js.at(1);
  float maxVal = js.at(2);
  std::string precision = floatVal <= 0.1f ? "%.4f" : "%.2f";
  if (ImGui::SliderFloat(name.c_str(), &floatVal, minVal, maxVal, precision.c_str()))
  {
    js.at(0) = floatVal;
  }
}

void drawImguiObjectFromJson(json& js)
{
  for (auto& el : js.items())
  {
    auto& val = el.value();
    if (val.is_object())
    {
      ImGui::Spacing();
      ImGui::Text("%s", el.key().c_str());
      ImGui::Indent(15.0f);
      // Recursive call
      drawImguiObjectFromJson(val);
      ImGui::Unindent(15.0f);
      ImGui::Spacing();
    }
    else if (val.is_array() && val.size() == 3 && val[0].is_number_integer())
    {
      // cannot directly access json array items by reference
      drawImguiSliderInt(el.key(), val);
    }
    else if (val.is_array() && val.size() == 3 && val[0].is_number_float())
    {
      drawImguiSliderFloat(el.key(), val);
    }
  }
}

void displayAbout()
{
  if (!ImGui::CollapsingHeader("About"))
    return;

  ImGui::TextWrapped("Emergent flocking from three local rules applied to each boid at every frame.");
  ImGui::Spacing();
  ImGui::BulletText("Separation: avoid crowding neighbors");
  ImGui::BulletText("Alignment: steer towards average heading");
  ImGui::BulletText("Cohesion: move toward center of mass");
  ImGui::Spacing();
  ImGui::TextWrapped("Higher separation spreads boids apart, higher alignment coordinates their movement "
                     "and higher cohesion tightens formations. The perception radius controls how far "
                     "a boid sees its neighbors.");
}
}

void UI::FlockWidget::display()
{
  auto physicsEngine = m_physicsEngine.lock();

  if (!physicsEngine)
    return;

  // First default pos
  ImGui::SetNextWindowPos(ImVec2(15, 200), ImGuiCond_FirstUseEver);

  ImGui::Begin("Simulation Controls", nullptr, ImGuiWindowFlags_AlwaysAutoResize);
  ImGui::PushItemWidth(150);

  ImGui::Value("Boids", (int)physicsEngine->nbParticles());

  // Retrieve input json from the physics engine with all available parameters
  json js = physicsEngine->getInputJson();
  // Draw all items from input json
  drawImguiObjectFromJson(js);
  // Update physics engine with new parameters values if any
  if (!physicsEngine->updateInputJson(js))
  {
    LOG_ERROR("Parameters from UI rejected by the physics engine");
  }

  ImGui::Spacing();

  if (ImGui::Button(" Reset to Defaults "))
  {
    physicsEngine->reset();
  }

  ImGui::Spacing();
  ImGui::Separator();

  displayAbout();

  ImGui::PopItemWidth();
  ImGui::End();
}
