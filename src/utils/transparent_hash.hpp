#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace microbatch_server {

// Heterogeneous lookup for string-keyed unordered containers.
struct TransparentHash {
  using is_transparent = void;

  auto operator()(std::string_view key) const noexcept -> std::size_t
  {
    return std::hash<std::string_view>{}(key);
  }

  auto operator()(const std::string& key) const noexcept -> std::size_t
  {
    return (*this)(std::string_view{key});
  }
};

}  // namespace microbatch_server
