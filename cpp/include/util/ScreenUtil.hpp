#pragma once

namespace util {

/*
 * Width of the attached terminal, or kDefaultScreenWidth when stdout is not a terminal.
 */
int get_screen_width();

constexpr int kDefaultScreenWidth = 100;

}  // namespace util

#include "inline/util/ScreenUtil.inl"
