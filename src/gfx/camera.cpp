/*
 * Copyright (c) 2026 Maciej Torhan <https://github.com/m-torhan>
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "gfx/camera.hpp"

void Camera::look(float dx, float dy) {
    const glm::quat q_yaw = glm::angleAxis(-dx * mouse_sensitivity, up());
    const glm::quat q_pitch = glm::angleAxis(dy * mouse_sensitivity, right());

    orientation = glm::normalize(q_yaw * q_pitch * orientation);
}

void Camera::step(const CameraInput &in, float dt) {
    const float v = move_speed * dt;
    const glm::vec3 fw = forward();
    const glm::vec3 rt = right();

    if (in.forward) {
        position += fw * v;
    }
    if (in.backward) {
        position -= fw * v;
    }
    if (in.right) {
        position += rt * v;
    }
    if (in.left) {
        position -= rt * v;
    }

    const float roll_speed = glm::radians(120.0f); // deg/s
    float dr = 0.0f;
    if (in.roll_left) {
        dr += roll_speed * dt;
    }
    if (in.roll_right) {
        dr -= roll_speed * dt;
    }
    if (dr != 0.0f) {
        orientation = glm::normalize(glm::angleAxis(dr, fw) * orientation);
    }
}

glm::mat4 Camera::view() const {
    const glm::mat4 R = glm::toMat4(orientation);
    const glm::mat4 T = glm::translate(glm::mat4(1.0f), position);
    return glm::inverse(T * R);
}

glm::mat4 Camera::projection(float aspect) const {
    glm::mat4 p = glm::perspectiveRH_ZO(fov_y, aspect, z_near, z_far);
    p[1][1] *= -1.0f;
    return p;
}
