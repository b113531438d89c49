/**
 * @file FrameRenderer.hpp
 * @brief Turns a text layout and a scroll offset into one display frame.
 */

#pragma once

#include "DisplayConfig.hpp"
#include "Frame.hpp"
#include "LayoutEngine.hpp"

#include <cstdint>

/**
 * @brief Render the viewport for one scroll position.
 *
 * Fills the background, then draws each line centred horizontally at its
 * cumulative y plus @p offset. Lines wholly above the viewport are skipped
 * but still advance the running y; drawing stops at the first line below it. No state and no side effects: identical
 * arguments give identical frames.
 *
 * @param layout Lines produced by layoutText() with the same config.
 * @param offset Signed distance of the layout's top edge from the viewport's top.
 * @param config Geometry, font size and colours.
 */
Frame renderFrame(const TextLayout& layout, std::int64_t offset, const DisplayConfig& config);
