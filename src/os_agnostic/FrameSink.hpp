/**
 * @file FrameSink.hpp
 * @brief Where rendered frames go to be shown.
 */

#pragma once

#include "Frame.hpp"
#include <string>
#include <utility>

/**
 * @brief Outcome of one delivery. An empty error means the frame was shown.
 */
struct DeliveryStatus {
    bool ok{true};
    std::string error;

    static DeliveryStatus success() { return {}; }
    static DeliveryStatus failure(std::string why) { return {false, std::move(why)}; }
};

/**
 * @brief A display that accepts whole frames (panel driver, terminal, window).
 *
 * Implementations are not expected to be reentrant: only the single active
 * scroll controller calls deliver(). A failed delivery may be reported either
 * by returning a failure status or by throwing; either way it counts as one
 * missed frame.
 */
class FrameSink {
public:
    virtual ~FrameSink() = default;

    virtual DeliveryStatus deliver(const Frame& frame) = 0;
};
