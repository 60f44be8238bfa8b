// stacksynth/construct/ids.hpp - Stable ids for constructs and tokens
//
// Constructs and tokens live in arrays owned by their ConstructTree and are
// addressed by index, never by pointer, so cross references between
// constructs need no shared ownership.
//
#pragma once

#include <cstdint>
#include <functional>

namespace stacksynth
{

/**
 * Index of a construct within its tree (declaration order).
 *
 * `tree` is the serial of the owning ConstructTree, so an id handed to
 * another tree is rejected instead of addressing whichever construct sits at
 * the same index there.
 */
struct NodeId
{
  static constexpr uint32_t k_invalid_value = UINT32_MAX;

  uint32_t value = k_invalid_value;
  uint32_t tree = 0;

  [[nodiscard]] static constexpr NodeId invalid() noexcept { return NodeId{}; }

  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid_value; }

  [[nodiscard]] constexpr bool operator==(NodeId other) const noexcept
  {
    return value == other.value && tree == other.tree;
  }
  [[nodiscard]] constexpr bool operator!=(NodeId other) const noexcept
  {
    return !(*this == other);
  }
  [[nodiscard]] constexpr bool operator<(NodeId other) const noexcept
  {
    return value < other.value;
  }
};

/**
 * Weak reference to a token.
 *
 * `tree` is the serial of the ConstructTree that minted the token, so a token
 * carried into another tree is detected as dangling instead of silently
 * aliasing an unrelated construct.
 */
struct TokenRef
{
  uint32_t tree = 0;
  uint32_t index = 0;

  [[nodiscard]] constexpr bool operator==(TokenRef other) const noexcept
  {
    return tree == other.tree && index == other.index;
  }
  [[nodiscard]] constexpr bool operator!=(TokenRef other) const noexcept
  {
    return !(*this == other);
  }
};

}  // namespace stacksynth

namespace std
{

template <>
struct hash<stacksynth::NodeId>
{
  size_t operator()(stacksynth::NodeId id) const noexcept { return hash<uint32_t>{}(id.value); }
};

}  // namespace std
