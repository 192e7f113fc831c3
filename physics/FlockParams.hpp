#pragma once

namespace Physics
{
// Tunables read by the simulation at every tick
// No validation, any value is accepted
struct FlockParams
{
  double separationForce = 1.5;
  double alignmentForce = 1.0;
  double cohesionForce = 1.0;
  double perceptionRadius = 100.0;
};
}
