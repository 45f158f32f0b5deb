#pragma once

#include "bsp/basic.hpp"
#include "bspd/compiler/problem.hpp"

namespace bspd {

// Convert a compiler position to a BSP range.
//
// Compiler lines are 1-based and BSP lines 0-based, so every line field that
// is present is shifted down by one; columns pass through unchanged. Missing
// start fields fall back to `line`, then `pointer`, then 0. Missing end fields
// fall back to `line` and `pointer` as well, and finally to the resolved start,
// which makes a pointer-only position an empty range at the pointer.
auto ToBspRange(const ProblemPosition& position) -> bsp::Range;

}  // namespace bspd
