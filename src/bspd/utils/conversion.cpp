#include "bspd/utils/conversion.hpp"

#include <optional>

namespace bspd {

namespace {

auto CorrectLine(std::optional<int> line) -> std::optional<int> {
  if (!line) {
    return std::nullopt;
  }
  return *line - 1;
}

}  // namespace

auto ToBspRange(const ProblemPosition& position) -> bsp::Range {
  const auto line = CorrectLine(position.line);

  bsp::Position start{
      .line = CorrectLine(position.start_line).or_else([&] {
        return line;
      }).value_or(0),
      .character = position.start_column.or_else([&] {
        return position.pointer;
      }).value_or(0)};

  // End defaults resolve against the already computed start
  bsp::Position end{
      .line = CorrectLine(position.end_line).or_else([&] {
        return line;
      }).value_or(start.line),
      .character = position.end_column.or_else([&] {
        return position.pointer;
      }).value_or(start.character)};

  return bsp::Range{.start = start, .end = end};
}

}  // namespace bspd
