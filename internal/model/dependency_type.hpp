#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace trailmap::model {

enum class DependencyType : std::uint8_t {
  kBlocks      = 0,
  kParentChild = 1,
  kRelated     = 2,
};

/*
  BLOCKS and PARENT_CHILD form the blocking subgraph, which must stay acyclic.
  RELATED is informational and never takes part in blocking or cycle checks.
*/
constexpr bool IsBlockingType(DependencyType type) {
  return type == DependencyType::kBlocks || type == DependencyType::kParentChild;
}

constexpr std::string_view ToString(DependencyType type) {
  switch (type) {
    case DependencyType::kBlocks:
      return "blocks";
    case DependencyType::kParentChild:
      return "parent_child";
    case DependencyType::kRelated:
      return "related";
  }
  return "unknown";
}

constexpr std::optional<DependencyType> ParseDependencyType(std::string_view value) {
  if (value == "blocks") return DependencyType::kBlocks;
  if (value == "parent_child") return DependencyType::kParentChild;
  if (value == "related") return DependencyType::kRelated;
  return std::nullopt;
}

} // namespace trailmap::model
