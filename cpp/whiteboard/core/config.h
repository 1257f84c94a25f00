#ifndef WHITEBOARD_CORE_CONFIG_H
#define WHITEBOARD_CORE_CONFIG_H

#include "whiteboard/interaction/interaction_constants.h"
#include <string>

// Runtime tunables. Defaults match interaction_constants.h and the web
// client's creation styles; the host may override them before mounting.
struct BoardConfig {
    float minScale = interaction_constants::MIN_SCALE;
    float maxScale = interaction_constants::MAX_SCALE;
    float wheelScaleFactor = interaction_constants::WHEEL_SCALE_FACTOR;
    float eraserRadius = interaction_constants::ERASER_RADIUS;
    double saveDebounceMs = interaction_constants::SAVE_DEBOUNCE_MS;
    float minTransformSize = interaction_constants::MIN_TRANSFORM_SIZE;
    float minTransformFontSize = interaction_constants::MIN_TRANSFORM_FONT_SIZE;

    // Creation defaults
    std::string penStroke = "#ffffff";
    std::string lineStroke = "#ffffff";
    std::string rectFill = "transparent";
    std::string rectStroke = "#80f20d";
    std::string circleStroke = "#00f3ff";
    float circleStrokeWidth = 3.0f;
    float circleInitialRadius = 1.0f;
    std::string textFill = "#ffffff";
    float textFontSize = 24.0f;
    std::string textPlaceholder = "Double click to edit";
};

#endif // WHITEBOARD_CORE_CONFIG_H
