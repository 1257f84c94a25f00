#pragma once

#include "whiteboard/core/types.h"
#include <cstdint>
#include <string>

// One sample of a DOM pointer stream, in stage-relative screen pixels.
struct PointerInput {
    std::int32_t pointerId = 0;
    PointerType type = PointerType::Mouse;
    std::int32_t button = 0;   // PointerEvent.button (0 primary, 1 middle)
    float screenX = 0.0f;
    float screenY = 0.0f;
    bool shift = false;
    std::string targetId;      // shape under the pointer, empty for bare canvas
};

struct WheelInput {
    float screenX = 0.0f;
    float screenY = 0.0f;
    float deltaY = 0.0f;
};

struct KeyInput {
    std::string key;           // KeyboardEvent.key
    bool ctrl = false;
    bool shift = false;
};
