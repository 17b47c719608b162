/**
 * @file TextInjector.hpp
 * @brief Interface for pasting dictated text into the foreground application.
 */

#pragma once

#include <string>

namespace writher::domain {

class TextInjector {
public:
    virtual ~TextInjector() = default;

    /**
     * @brief Pastes text into the focused window, restoring the clipboard afterwards.
     * @throws WritherError(InjectionFailed) when the text could not be delivered.
     */
    virtual void paste(const std::string& text) = 0;
};

} // namespace writher::domain
