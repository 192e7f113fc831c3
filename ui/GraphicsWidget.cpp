#include "GraphicsWidget.hpp"

#include <imgui.h>

void UI::GraphicsWidget::display()
{
  if (!m_graphicsEngine)
    return;

  // First default pos
  ImGui::SetNextWindowPos(ImVec2(15, 520), ImGuiCond_FirstUseEver);

  ImGui::Begin("Graphics Widget", nullptr, ImGuiWindowFlags_AlwaysAutoResize);
  ImGui::PushItemWidth(150);

  const auto worldSize = m_graphicsEngine->worldSize();
  ImGui::Text(" World %.0f x %.0f", worldSize.x, worldSize.y);
  ImGui::Spacing();

  float boidSize = m_graphicsEngine->getBoidSize();
  if (ImGui::SliderFloat("Boid size", &boidSize, 2.0f, 20.0f, "%.1f"))
  {
    m_graphicsEngine->setBoidSize(boidSize);
  }

  auto boidColor = m_graphicsEngine->getBoidColor();
  if (ImGui::ColorEdit3("Boid color", boidColor.data()))
  {
    m_graphicsEngine->setBoidColor(boidColor);
  }

  ImGui::PopItemWidth();
  ImGui::End();
}
