// === Gateway Interchange =====================================================
//
// Bulk import of gateway definitions from JSON and export of the registry to
// JSON or CSV. Import creates gateways (or updates them when asked to) and
// reports failures per entry; one bad entry never aborts the rest.

#pragma once

#include <string>
#include <vector>

#include <json/json.h>

#include "device_pool/event_sink.hpp"
#include "device_pool/gateway.hpp"
#include "device_pool/gateway_registry.hpp"
#include "device_pool/roles.hpp"

namespace device_pool {

struct ImportError final {
    std::string gateway_id{};                    /**< Empty when the entry carried no id. */
    std::size_t index{};                         /**< Position of the entry in the input array. */
    std::string message{};
};

struct ImportReport final {
    std::vector<GatewayId> created{};
    std::vector<GatewayId> updated{};
    std::vector<GatewayId> skipped{};            /**< Already present and `update_existing` was off. */
    std::vector<ImportError> errors{};
};

/**
 * @brief Import gateways from @p json_text.
 *
 * Accepts either a bare array of gateway objects or an object with a
 * `gateways` array. Entries are applied parents first, so a child may appear
 * before its parent in the input. One `gateway_imported` summary event is
 * published on @p event_sink in addition to the registry's per-gateway events.
 *
 * @throws AccessDeniedError unless @p actor is an admin.
 * @throws std::invalid_argument when @p json_text is not valid JSON of that shape.
 */
ImportReport import_gateways(GatewayRegistry& registry,
                             EventSink& event_sink,
                             const Principal& actor,
                             const std::string& json_text,
                             bool update_existing,
                             TimePoint now);

/** @brief Serialise one gateway with the interchange field names. */
[[nodiscard]] Json::Value to_json(const Gateway& gateway);

/** @brief `{"gateways": [...], "count": n, "format": "json"}` for gateways matching @p filter. */
[[nodiscard]] std::string export_gateways_json(const GatewayRegistry& registry, const GatewayFilter& filter = {});

/** @brief RFC 4180 CSV with a header row; tags and features are embedded as JSON arrays. */
[[nodiscard]] std::string export_gateways_csv(const GatewayRegistry& registry, const GatewayFilter& filter = {});

}  // namespace device_pool
