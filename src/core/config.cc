#include "config.hh"
#include <fstream>
#include <sstream>

namespace pledge {

// ============================================================================
// LedgerConfig
// ============================================================================

LedgerConfig::Validation LedgerConfig::validate() const {
    if (token.is_zero()) {
        return Validation::ZERO_TOKEN;
    }
    if (authority.is_zero()) {
        return Validation::ZERO_AUTHORITY;
    }
    if (instance.is_zero()) {
        return Validation::ZERO_INSTANCE;
    }
    if (instance == burn_sink_address()) {
        return Validation::INSTANCE_IS_BURN_SINK;
    }
    return Validation::VALID;
}

std::string_view config_validation_string(LedgerConfig::Validation v) {
    switch (v) {
        case LedgerConfig::Validation::VALID: return "valid";
        case LedgerConfig::Validation::ZERO_TOKEN: return "zero_token";
        case LedgerConfig::Validation::ZERO_AUTHORITY: return "zero_authority";
        case LedgerConfig::Validation::ZERO_INSTANCE: return "zero_instance";
        case LedgerConfig::Validation::INSTANCE_IS_BURN_SINK: return "instance_is_burn_sink";
    }
    return "unknown";
}

// ============================================================================
// Config File Parsing
// ============================================================================

namespace {

std::string_view trim(std::string_view s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::optional<bool> parse_bool(std::string_view value) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    return std::nullopt;
}

}  // namespace

std::optional<NodeConfig> parse_config(std::string_view text) {
    NodeConfig config;
    bool have_token = false;
    bool have_authority = false;
    bool have_instance = false;

    std::size_t line_no = 0;
    while (!text.empty()) {
        auto eol = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text = (eol == std::string_view::npos) ? std::string_view{} : text.substr(eol + 1);
        ++line_no;

        auto hash = line.find('#');
        if (hash != std::string_view::npos) {
            line = line.substr(0, hash);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            log::core.warn() << "config line " << line_no << ": expected key = value";
            return std::nullopt;
        }
        auto key = trim(line.substr(0, eq));
        auto value = trim(line.substr(eq + 1));

        bool ok = true;
        if (key == "token" || key == "authority" || key == "instance") {
            auto addr = Address::from_hex(value);
            ok = addr.has_value();
            if (ok) {
                if (key == "token") {
                    config.ledger.token = *addr;
                    have_token = true;
                } else if (key == "authority") {
                    config.ledger.authority = *addr;
                    have_authority = true;
                } else {
                    config.ledger.instance = *addr;
                    have_instance = true;
                }
            }
        } else if (key == "log.level") {
            auto level = parse_log_level(value);
            ok = level.has_value();
            if (ok) config.log.default_level = *level;
        } else if (key == "log.file") {
            ok = !value.empty();
            config.log.file_enabled = ok;
            config.log.file_path = std::string(value);
        } else if (key == "log.colors") {
            auto b = parse_bool(value);
            ok = b.has_value();
            if (ok) config.log.console_colors = *b;
        } else if (key == "log.async") {
            auto b = parse_bool(value);
            ok = b.has_value();
            if (ok) config.log.async_logging = *b;
        } else {
            log::core.warn() << "config line " << line_no << ": unknown key '" << key << "'";
            return std::nullopt;
        }

        if (!ok) {
            log::core.warn() << "config line " << line_no << ": bad value for '" << key << "'";
            return std::nullopt;
        }
    }

    if (!have_token || !have_authority || !have_instance) {
        log::core.warn("config: token, authority and instance are required");
        return std::nullopt;
    }

    auto validation = config.ledger.validate();
    if (validation != LedgerConfig::Validation::VALID) {
        log::core.warn() << "config rejected: " << config_validation_string(validation);
        return std::nullopt;
    }

    return config;
}

std::optional<NodeConfig> load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        log::core.warn() << "cannot open config file " << path;
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_config(buffer.str());
}

}  // namespace pledge
