// STARDUST - Engine Settings
// Copyright (c) 2024 STARDUST Developers
// MIT License
//
// Typed view of the engine configuration file:
//
//   [network]  hrp, id
//   [rent]     vbytecost, keyfactor, datafactor
//   [confirm]  interval_ms, backoff, max_interval_ms, max_attempts, max_wait_ms
//   [signer]   kdf_iterations
//   [log]      level
//
// Missing keys keep their defaults; a present but malformed value is an error.

#ifndef STARDUST_WALLET_SETTINGS_H
#define STARDUST_WALLET_SETTINGS_H

#include "stardust/core/protocol.h"
#include "stardust/util/config.h"
#include "stardust/util/logging.h"
#include "stardust/wallet/confirmation.h"
#include "stardust/wallet/signer.h"

#include <cstdint>
#include <string>

namespace stardust {
namespace wallet {

struct EngineSettings {
    ProtocolParameters protocol;
    ConfirmationPolicy confirmation;
    uint32_t kdfIterations{DEFAULT_KDF_ITERATIONS};
    util::LogLevel logLevel{util::LogLevel::Info};
};

struct SettingsResult {
    bool success{false};
    std::string error;
    EngineSettings settings;

    static SettingsResult Success(const EngineSettings& s) {
        SettingsResult r;
        r.success = true;
        r.settings = s;
        return r;
    }

    static SettingsResult Failure(const std::string& msg) {
        SettingsResult r;
        r.error = msg;
        return r;
    }
};

/// Read settings from parsed configuration
SettingsResult LoadSettings(const util::ConfigManager& config);

/// Parse `path` and read settings from it
SettingsResult LoadSettingsFile(const std::string& path);

} // namespace wallet
} // namespace stardust

#endif // STARDUST_WALLET_SETTINGS_H
