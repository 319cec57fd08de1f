#pragma once

#include "core/types.hh"
#include "core/logging.hh"
#include <optional>
#include <string>
#include <string_view>

namespace pledge {

// ============================================================================
// Ledger Configuration - fixed at construction, immutable afterwards
// ============================================================================

struct LedgerConfig {
    Address token;       // token held in custody
    Address authority;   // the only caller allowed to slash
    Address instance;    // ledger identity; custody account and bond-id salt

    enum class Validation {
        VALID,
        ZERO_TOKEN,
        ZERO_AUTHORITY,
        ZERO_INSTANCE,
        INSTANCE_IS_BURN_SINK,
    };
    [[nodiscard]] Validation validate() const;

    bool operator==(const LedgerConfig&) const = default;
};

[[nodiscard]] std::string_view config_validation_string(LedgerConfig::Validation v);

// ============================================================================
// Node Configuration - everything a host process needs to start a ledger
// ============================================================================

struct NodeConfig {
    LedgerConfig ledger;
    LogConfig log;
};

// Parses `key = value` lines. Blank lines and `#` comments are ignored.
// Recognized keys:
//   token, authority, instance        32-byte hex addresses (required)
//   log.level                         trace|debug|info|warn|error|fatal|off
//   log.file                          path; enables the file sink
//   log.colors, log.async             true|false
// Unknown keys and malformed values are rejected.
[[nodiscard]] std::optional<NodeConfig> parse_config(std::string_view text);

[[nodiscard]] std::optional<NodeConfig> load_config(const std::string& path);

}  // namespace pledge
