/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#define GLM_ENABLE_EXPERIMENTAL

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtx/quaternion.hpp>

struct CameraInput {
    bool forward = false;
    bool backward = false;
    bool left = false;
    bool right = false;
    bool roll_left = false;
    bool roll_right = false;
};

class Camera {
public:
    glm::vec3 position{-2.0f, 1.0f, 0.0f};

    float move_speed = 0.5f;

    // Radians per pixel
    float mouse_sensitivity = 0.0025f;

    float fov_y = glm::radians(45.0f);
    float z_near = 0.1f;
    float z_far = 100.0f;

    glm::quat orientation{1.0f, 0.0f, 0.0f, 0.0f};

    // dx -> yaw around local up, dy -> pitch around local right
    void look(float dx, float dy);

    // One fixed simulation step of keyboard movement.
    void step(const CameraInput &in, float dt);

    glm::mat4 view() const;
    // Vulkan clip space: Y flipped, depth 0..1.
    glm::mat4 projection(float aspect) const;

    glm::vec3 forward() const { return glm::normalize(orientation * glm::vec3(0, 0, -1)); }
    glm::vec3 right() const { return glm::normalize(orientation * glm::vec3(1, 0, 0)); }
    glm::vec3 up() const { return glm::normalize(orientation * glm::vec3(0, 1, 0)); }
};
