#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Ordinal label of a USD value against the configured thresholds.
// Callers drop values below thresholds.low before classifying.
Significance classify_significance(double value_usd, const Thresholds& thresholds = Thresholds{});

// "<chain>:<hash>:<lowercase wallet>". Stable across reprocessing.
std::string generate_event_id(const Transfer& transfer, const std::string& wallet);

WhaleEvent create_event(const Transfer& transfer,
                        const std::string& wallet,
                        const std::optional<std::string>& wallet_label,
                        EventType type,
                        const Thresholds& thresholds,
                        int64_t created_at_ms);

// Stamps created_at with the current wall clock.
WhaleEvent create_event(const Transfer& transfer,
                        const std::string& wallet,
                        const std::optional<std::string>& wallet_label,
                        EventType type,
                        const Thresholds& thresholds = Thresholds{});

// Embedded transfer column
nlohmann::json transfer_to_json(const Transfer& transfer);
Transfer transfer_from_json(const nlohmann::json& j);
