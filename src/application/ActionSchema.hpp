/**
 * @file ActionSchema.hpp
 * @brief Tool schema sent to the function-calling backend.
 */

#pragma once

#include <nlohmann/json.hpp>

namespace writher::application {

/**
 * @brief Builds the "tools" array describing every supported action.
 *
 * The names and required fields here are the only ones ActionResolver accepts.
 */
nlohmann::json BuildToolSchema();

} // namespace writher::application
