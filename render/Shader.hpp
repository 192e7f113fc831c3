#pragma once

#include "Math.hpp"

#include <array>
#include <glad/glad.h>
#include <string>

namespace Render
{
class Shader
{
  public:
  Shader(const char* vert, const char* frag);
  ~Shader();

  bool isValid() const { return m_isValid; }

  void activate();
  void deactivate();

  // activate shader program before calling these functions
  void setUniform(const std::string& name, float value) const;
  void setUniform(const std::string& name, const Math::float2& vec) const;
  void setUniform(const std::string& name, const std::array<float, 3>& vec) const;

  private:
  GLint getUniformLocation(const std::string& name) const;

  bool compileShader(GLenum type, const char* source);
  GLuint m_programID;
  bool m_isValid;
};
}
