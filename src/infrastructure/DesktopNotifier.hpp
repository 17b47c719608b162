/**
 * @file DesktopNotifier.hpp
 * @brief Desktop notifications through notify-send.
 */

#pragma once

#include "domain/NotificationSink.hpp"

namespace writher::infrastructure {

class DesktopNotifier : public domain::NotificationSink {
public:
    bool fire(const std::string& title, const std::string& body) override;
};

} // namespace writher::infrastructure
