/**
 * @file UiRenderer.hpp
 * @brief Main entry point for the Dear ImGui UI rendering.
 */

#pragma once

#include "ui/AppState.hpp"

namespace writher::ui {

/**
 * @brief Main UI rendering entry point. Call once per frame, on the coordination loop.
 * @param app The shared application state.
 */
void DrawUI(AppState& app);

} // namespace writher::ui
