#pragma once

#include <string>
#include <string_view>
#include <memory>
#include <optional>
#include <functional>
#include <filesystem>
#include <cstdint>

#include "vinforge/core/store/sequence_store.hpp"
#include "vinforge/core/store/status.hpp"


namespace vinforge::core::store {

/*
===============================================================================
 Backend selection
===============================================================================

Decides once, at start-up, which SequenceStore a process uses:

  VINFORGE_KV_URL and VINFORGE_KV_TOKEN both set and non-empty
      -> RemoteStore over TCP (safe for any number of instances)
  otherwise
      -> FileStore at `file_path`, else VINFORGE_SEQUENCE_FILE, else
         data/chassis_sequences.json (single instance only)

A malformed URL is a configuration error. It is reported and no store is
returned: falling back to the file would silently give every instance its
own counters.

The environment is read through an injectable lookup so tests never touch
the process environment.
===============================================================================
*/

inline constexpr std::string_view ENV_KV_URL        = "VINFORGE_KV_URL";
inline constexpr std::string_view ENV_KV_TOKEN      = "VINFORGE_KV_TOKEN";
inline constexpr std::string_view ENV_SEQUENCE_FILE = "VINFORGE_SEQUENCE_FILE";

// Returns the variable's value, or nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

// Lookup over the real process environment
[[nodiscard]] EnvLookup process_environment();


enum class SelectError : std::uint8_t {
    None = 0,
    InvalidUrl
};

[[nodiscard]]
inline constexpr std::string_view to_string(SelectError e) noexcept {
    switch (e) {
    case SelectError::None:       return "None";
    case SelectError::InvalidUrl: return "InvalidUrl";
    default:                      return "Unknown";
    }
}

struct Selection {
    SelectError error = SelectError::None;
    std::string message;
    Backend backend = Backend::File;
    std::unique_ptr<SequenceStore> store;   // null on error

    [[nodiscard]] bool ok() const noexcept { return error == SelectError::None && store != nullptr; }
};

// Which backend the environment asks for, without building anything
[[nodiscard]] Backend configured_backend(const EnvLookup& env);

[[nodiscard]] Selection select_store(const EnvLookup& env, const std::filesystem::path& file_path = {});

[[nodiscard]]
inline Selection select_store() {
    return select_store(process_environment());
}

} // namespace vinforge::core::store
