#pragma once

namespace Render
{
// One triangle per boid, instanced
// World coordinates, origin top left and y pointing down
constexpr char BoidVertShader[] = R"(#version 330 core
    layout(location = 0) in vec2 aLocalPos;
    layout(location = 1) in vec3 aBoidState;

    uniform vec2 u_worldSize;
    uniform float u_boidSize;

    void main()
    {
        float c = cos(aBoidState.z);
        float s = sin(aBoidState.z);
        vec2 local = u_boidSize * aLocalPos;
        vec2 worldPos = aBoidState.xy + vec2(c * local.x - s * local.y, s * local.x + c * local.y);

        vec2 ndc = vec2(2.0 * worldPos.x / u_worldSize.x - 1.0, 1.0 - 2.0 * worldPos.y / u_worldSize.y);
        gl_Position = vec4(ndc, 0.0, 1.0);
    }
    )";

constexpr char BoidFragShader[] = R"(#version 330 core
    uniform vec3 u_boidColor;

    out vec4 fragColor;

    void main()
    {
        fragColor = vec4(u_boidColor, 1.0);
    }
    )";
}
