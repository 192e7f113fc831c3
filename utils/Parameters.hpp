#pragma once

#include <cstddef>

namespace Utils
{
// Size of the world the boids evolve in, also the initial window size
static constexpr int WORLD_WIDTH = 1280;
static constexpr int WORLD_HEIGHT = 720;

// Number of boids spawned when the application starts or is reset
static constexpr size_t DEFAULT_NB_BOIDS = 50;
// Upper bound of boids count accepted from the parameters tree
static constexpr size_t MAX_NB_BOIDS = 100000;

// Upper bound of the target framerate slider
static constexpr int MAX_TARGET_FPS = 60;
}
