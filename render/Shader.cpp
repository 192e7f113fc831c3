#include "Shader.hpp"
#include "Logging.hpp"

#include <vector>

using namespace Render;

Shader::Shader(const char* vert, const char* frag)
    : m_isValid(false)
{
  m_programID = glCreateProgram();

  if (!compileShader(GL_VERTEX_SHADER, vert) || !compileShader(GL_FRAGMENT_SHADER, frag))
    return;

  glLinkProgram(m_programID);

  GLint status;
  glGetProgramiv(m_programID, GL_LINK_STATUS, &status);

  if (status == GL_FALSE)
  {
    LOG_ERROR("Render: Shader linking failed");
    return;
  }

  m_isValid = true;
}

Shader::~Shader()
{
  if (m_programID != 0)
    glDeleteProgram(m_programID);
}

bool Shader::compileShader(GLenum type, const char* source)
{
  GLuint shaderID = glCreateShader(type);

  glShaderSource(shaderID, 1, &source, nullptr);
  glCompileShader(shaderID);

  GLint status;
  glGetShaderiv(shaderID, GL_COMPILE_STATUS, &status);

  if (status == GL_FALSE)
  {
    GLint logLength = 0;
    glGetShaderiv(shaderID, GL_INFO_LOG_LENGTH, &logLength);
    std::vector<GLchar> infoLog(logLength > 0 ? logLength : 1, '\0');
    glGetShaderInfoLog(shaderID, (GLsizei)infoLog.size(), nullptr, infoLog.data());

    LOG_ERROR("Render: Shader creation failed {}", infoLog.data());
    glDeleteShader(shaderID);
    return false;
  }

  glAttachShader(m_programID, shaderID);
  glDeleteShader(shaderID);

  return true;
}

void Shader::activate()
{
  glUseProgram(m_programID);
}

void Shader::deactivate()
{
  glUseProgram(0);
}

GLint Shader::getUniformLocation(const std::string& name) const
{
  return glGetUniformLocation(m_programID, name.c_str());
}

void Shader::setUniform(const std::string& name, float value) const
{
  glUniform1f(getUniformLocation(name), value);
}

void Shader::setUniform(const std::string& name, const Math::float2& vec) const
{
  glUniform2f(getUniformLocation(name), vec.x, vec.y);
}

void Shader::setUniform(const std::string& name, const std::array<float, 3>& vec) const
{
  glUniform3f(getUniformLocation(name), vec[0], vec[1], vec[2]);
}
