#include "Model.hpp"
#include "Logging.hpp"

bool Physics::Model::updateInputJson(const json& newJson)
{
  // No modification
  if (json::diff(m_inputJson, newJson).empty())
    return true;

  json previousJson = m_inputJson;
  m_inputJson.merge_patch(newJson);

  try
  {
    updateModelWithInputJson();
  }
  catch (const json::exception& e)
  {
    LOG_ERROR("Invalid model parameters, keeping previous ones: {}", e.what());
    m_inputJson = previousJson;
    return false;
  }

  LOG_DEBUG("Model parameters updated");

  return true;
}
