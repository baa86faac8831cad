// STARDUST - Engine Settings Implementation
// Copyright (c) 2024 STARDUST Developers
// MIT License

#include "stardust/wallet/settings.h"

#include <cctype>
#include <limits>

namespace stardust {
namespace wallet {

namespace {

std::string Describe(const util::ConfigManager& config, const std::string& key) {
    auto entry = config.GetEntry(key);
    std::string where;
    if (entry && entry->lineNumber > 0) {
        where = " (" + entry->source + ":" + std::to_string(entry->lineNumber) + ")";
    }
    return "Invalid value for " + key + where;
}

/// Unsigned value within [minValue, maxValue]; false if present and malformed
template<typename T>
bool ReadUnsigned(const util::ConfigManager& config, const std::string& key,
                  T& out, uint64_t minValue, std::string& error) {
    if (!config.HasKey(key)) {
        return true;
    }
    auto value = config.TryGetUInt(key);
    if (!value || *value < minValue ||
        *value > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        error = Describe(config, key);
        return false;
    }
    out = static_cast<T>(*value);
    return true;
}

bool ReadMillis(const util::ConfigManager& config, const std::string& key,
                std::chrono::milliseconds& out, std::string& error) {
    uint32_t ms = static_cast<uint32_t>(out.count());
    if (!ReadUnsigned(config, key, ms, 1, error)) {
        return false;
    }
    out = std::chrono::milliseconds(ms);
    return true;
}

bool IsValidHrp(const std::string& hrp) {
    if (hrp.empty() || hrp.size() > 83) {
        return false;
    }
    for (char c : hrp) {
        if (c < 33 || c > 126 || std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace

SettingsResult LoadSettings(const util::ConfigManager& config) {
    EngineSettings settings;
    std::string error;

    // Network
    if (auto hrp = config.TryGetString("network.hrp")) {
        if (!IsValidHrp(*hrp)) {
            return SettingsResult::Failure(Describe(config, "network.hrp"));
        }
        settings.protocol.bech32Hrp = *hrp;
    }
    if (auto name = config.TryGetString("network.id")) {
        if (name->empty()) {
            return SettingsResult::Failure(Describe(config, "network.id"));
        }
        settings.protocol.networkName = *name;
    }

    // Rent structure
    RentStructure& rent = settings.protocol.rentStructure;
    if (!ReadUnsigned(config, "rent.vbytecost", rent.vByteCost, 0, error) ||
        !ReadUnsigned(config, "rent.keyfactor", rent.vByteFactorKey, 0, error) ||
        !ReadUnsigned(config, "rent.datafactor", rent.vByteFactorData, 0, error)) {
        return SettingsResult::Failure(error);
    }

    // Confirmation policy
    ConfirmationPolicy& policy = settings.confirmation;
    if (!ReadMillis(config, "confirm.interval_ms", policy.initialInterval, error) ||
        !ReadMillis(config, "confirm.max_interval_ms", policy.maxInterval, error) ||
        !ReadMillis(config, "confirm.max_wait_ms", policy.maxWait, error) ||
        !ReadUnsigned(config, "confirm.max_attempts", policy.maxAttempts, 1, error)) {
        return SettingsResult::Failure(error);
    }
    if (config.HasKey("confirm.backoff")) {
        auto backoff = config.TryGetDouble("confirm.backoff");
        if (!backoff || *backoff < 1.0) {
            return SettingsResult::Failure(Describe(config, "confirm.backoff"));
        }
        policy.backoffMultiplier = *backoff;
    }
    if (policy.maxInterval < policy.initialInterval) {
        return SettingsResult::Failure(
            "confirm.max_interval_ms must not be below confirm.interval_ms");
    }

    // Signer
    if (!ReadUnsigned(config, "signer.kdf_iterations", settings.kdfIterations, 1, error)) {
        return SettingsResult::Failure(error);
    }

    // Logging
    if (auto level = config.TryGetString("log.level")) {
        if (!util::ParseLogLevel(*level, settings.logLevel)) {
            return SettingsResult::Failure(Describe(config, "log.level"));
        }
    }

    return SettingsResult::Success(settings);
}

SettingsResult LoadSettingsFile(const std::string& path) {
    util::ConfigManager config;
    util::ConfigParseResult parsed = config.ParseFile(path);
    if (!parsed.success) {
        std::string msg = parsed.errorMessage;
        if (parsed.errorLine > 0) {
            msg += " at " + parsed.errorFile + ":" + std::to_string(parsed.errorLine);
        }
        return SettingsResult::Failure(msg);
    }
    return LoadSettings(config);
}

} // namespace wallet
} // namespace stardust
