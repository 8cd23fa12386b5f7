#pragma once
#include <tokenlock/schema/instance_state.hpp>
#include <tokenlock/schema/primitives.hpp>
#include <optional>
#include <string_view>

namespace tokenlock::storage {

template <typename Library>
struct storage {
  /// Load the persisted instance (contract fields and, once created, the
  /// lockup record), or std::nullopt for a fresh store.
  std::optional<tokenlock::schema::instance_state_t> load_instance_state()
      const;

  /// Atomically persist contract fields and lockup record.
  void save_instance_state(
      const tokenlock::schema::instance_state_t& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

/// Open an existing store read-only. Fails instead of creating one.
template <typename Library>
storage<Library> open_storage_read_only(const std::string_view& path);

}  // namespace tokenlock::storage
