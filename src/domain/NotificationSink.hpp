/**
 * @file NotificationSink.hpp
 * @brief Interface for the OS notification facility.
 */

#pragma once

#include <string>

namespace writher::domain {

class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    /**
     * @brief Shows a desktop notification. Fire-and-forget.
     * @return False when the notification facility rejected the request.
     */
    virtual bool fire(const std::string& title, const std::string& body) = 0;
};

} // namespace writher::domain
