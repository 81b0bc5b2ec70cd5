#include "device_pool/gateway_interchange.hpp"

#include <algorithm>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "device_pool/logging.hpp"

namespace device_pool {

namespace {
struct PendingEntry final {
    std::size_t index{};
    Json::Value entry{};
    Gateway gateway{};
};

std::optional<std::string> optional_string(const Json::Value& entry, const char* key) {
    if (!entry.isMember(key) || entry[key].isNull()) {
        return std::nullopt;
    }
    if (!entry[key].isString()) {
        throw std::invalid_argument(std::string{"Field '"} + key + "' must be a string");
    }
    return entry[key].asString();
}

std::optional<int> optional_int(const Json::Value& entry, const char* key) {
    if (!entry.isMember(key) || entry[key].isNull()) {
        return std::nullopt;
    }
    if (!entry[key].isInt()) {
        throw std::invalid_argument(std::string{"Field '"} + key + "' must be an integer");
    }
    return entry[key].asInt();
}

std::optional<bool> optional_bool(const Json::Value& entry, const char* key) {
    if (!entry.isMember(key) || entry[key].isNull()) {
        return std::nullopt;
    }
    if (!entry[key].isBool()) {
        throw std::invalid_argument(std::string{"Field '"} + key + "' must be a boolean");
    }
    return entry[key].asBool();
}

std::optional<std::vector<std::string>> optional_strings(const Json::Value& entry, const char* key) {
    if (!entry.isMember(key) || entry[key].isNull()) {
        return std::nullopt;
    }
    const Json::Value& values = entry[key];
    if (!values.isArray()) {
        throw std::invalid_argument(std::string{"Field '"} + key + "' must be an array of strings");
    }
    std::vector<std::string> strings;
    for (const Json::Value& value : values) {
        if (!value.isString()) {
            throw std::invalid_argument(std::string{"Field '"} + key + "' must be an array of strings");
        }
        strings.push_back(value.asString());
    }
    return strings;
}

GatewayType require_gateway_type(const std::string& text) {
    const auto gateway_type = parse_gateway_type(text);
    if (!gateway_type.has_value()) {
        throw std::invalid_argument("Unknown gateway_type '" + text + "'");
    }
    return *gateway_type;
}

std::string entry_id(const Json::Value& entry) {
    if (entry.isObject() && entry.isMember("gateway_id") && entry["gateway_id"].isString()) {
        return entry["gateway_id"].asString();
    }
    return {};
}

Gateway gateway_from_entry(const Json::Value& entry) {
    if (!entry.isObject()) {
        throw std::invalid_argument("Gateway entry must be a JSON object");
    }
    Gateway gateway{};
    gateway.gateway_id = optional_string(entry, "gateway_id").value_or("");
    gateway.name = optional_string(entry, "name").value_or("");
    gateway.description = optional_string(entry, "description").value_or("");
    if (const auto gateway_type = optional_string(entry, "gateway_type")) {
        gateway.gateway_type = require_gateway_type(*gateway_type);
    }
    gateway.parent_gateway_id = optional_string(entry, "parent_gateway_id");
    if (const auto status = optional_string(entry, "status")) {
        const auto parsed = parse_gateway_status(*status);
        if (!parsed.has_value()) {
            throw std::invalid_argument("Unknown gateway status '" + *status + "'");
        }
        gateway.status = *parsed;
    }
    gateway.hostname = optional_string(entry, "hostname").value_or("");
    gateway.ip_address = optional_string(entry, "ip_address").value_or("");
    gateway.ssh_port = optional_int(entry, "ssh_port").value_or(gateway.ssh_port);
    gateway.api_port = optional_int(entry, "api_port").value_or(gateway.api_port);
    gateway.location = optional_string(entry, "location").value_or("");
    gateway.region = optional_string(entry, "region").value_or("");
    gateway.environment = optional_string(entry, "environment").value_or("");
    gateway.max_targets = optional_int(entry, "max_targets");
    gateway.max_concurrent_sessions = optional_int(entry, "max_concurrent_sessions");
    gateway.features = optional_strings(entry, "features").value_or(std::vector<std::string>{});
    gateway.tags = optional_strings(entry, "tags").value_or(std::vector<std::string>{});
    gateway.is_active = optional_bool(entry, "is_active").value_or(true);
    return gateway;
}

/** @brief Only the fields present in @p entry; an explicit null parent detaches. */
GatewayUpdate update_from_entry(const Json::Value& entry) {
    GatewayUpdate update{};
    update.name = optional_string(entry, "name");
    update.description = optional_string(entry, "description");
    if (const auto gateway_type = optional_string(entry, "gateway_type")) {
        update.gateway_type = require_gateway_type(*gateway_type);
    }
    if (entry.isMember("parent_gateway_id") && entry["parent_gateway_id"].isNull()) {
        update.clear_parent = true;
    } else {
        update.parent_gateway_id = optional_string(entry, "parent_gateway_id");
    }
    update.hostname = optional_string(entry, "hostname");
    update.ip_address = optional_string(entry, "ip_address");
    update.ssh_port = optional_int(entry, "ssh_port");
    update.api_port = optional_int(entry, "api_port");
    update.location = optional_string(entry, "location");
    update.region = optional_string(entry, "region");
    update.environment = optional_string(entry, "environment");
    update.max_targets = optional_int(entry, "max_targets");
    update.max_concurrent_sessions = optional_int(entry, "max_concurrent_sessions");
    update.features = optional_strings(entry, "features");
    update.tags = optional_strings(entry, "tags");
    update.is_active = optional_bool(entry, "is_active");
    return update;
}

Json::Value parse_document(const std::string& json_text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(json_text.data(), json_text.data() + json_text.size(), &root, &errors)) {
        throw std::invalid_argument("Gateway import is not valid JSON: " + errors);
    }
    if (root.isObject() && root.isMember("gateways")) {
        root = root["gateways"];
    }
    if (!root.isArray()) {
        throw std::invalid_argument("Gateway import must be an array or an object with a 'gateways' array");
    }
    return root;
}

Json::Value string_array(const std::vector<std::string>& strings) {
    Json::Value values(Json::arrayValue);
    for (const std::string& value : strings) {
        values.append(value);
    }
    return values;
}

std::string compact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

std::string csv_field(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted{"\""};
    for (const char character : field) {
        if (character == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(character);
    }
    quoted.push_back('"');
    return quoted;
}

std::string optional_number(const std::optional<int>& value) {
    return value.has_value() ? std::to_string(*value) : std::string{};
}
}  // namespace

ImportReport import_gateways(GatewayRegistry& registry,
                             EventSink& event_sink,
                             const Principal& actor,
                             const std::string& json_text,
                             bool update_existing,
                             TimePoint now) {
    require_role(actor, Role::Admin, "import gateways");
    const Json::Value entries = parse_document(json_text);
    auto logger = get_logger();

    ImportReport report{};
    std::vector<PendingEntry> pending;
    for (Json::ArrayIndex index = 0; index < entries.size(); ++index) {
        const Json::Value& entry = entries[index];
        try {
            Gateway gateway = gateway_from_entry(entry);
            if (gateway.gateway_id.empty()) {
                throw std::invalid_argument("Gateway entry is missing gateway_id");
            }
            pending.push_back(PendingEntry{index, entry, std::move(gateway)});
        } catch (const std::exception& error) {
            report.errors.push_back(ImportError{entry_id(entry), index, error.what()});
        }
    }

    // Parents first: an entry is ready once its parent is no longer waiting in this batch.
    while (!pending.empty()) {
        std::set<GatewayId> waiting;
        for (const PendingEntry& item : pending) {
            waiting.insert(item.gateway.gateway_id);
        }
        const auto iterator_ready = std::stable_partition(pending.begin(), pending.end(), [&](const PendingEntry& item) {
            return !item.gateway.parent_gateway_id.has_value() || waiting.count(*item.gateway.parent_gateway_id) == 0U;
        });
        if (iterator_ready == pending.begin()) {
            for (const PendingEntry& item : pending) {
                report.errors.push_back(ImportError{item.gateway.gateway_id, item.index, "Parent chain forms a cycle within the import"});
            }
            break;
        }

        std::vector<PendingEntry> ready(std::make_move_iterator(pending.begin()), std::make_move_iterator(iterator_ready));
        pending.erase(pending.begin(), iterator_ready);
        for (PendingEntry& item : ready) {
            const GatewayId gateway_id = item.gateway.gateway_id;
            try {
                if (registry.exists(gateway_id)) {
                    if (!update_existing) {
                        report.skipped.push_back(gateway_id);
                        continue;
                    }
                    (void)registry.update_gateway(actor, gateway_id, update_from_entry(item.entry), now);
                    report.updated.push_back(gateway_id);
                } else {
                    (void)registry.create_gateway(actor, std::move(item.gateway), now);
                    report.created.push_back(gateway_id);
                }
            } catch (const std::exception& error) {
                logger->warn(R"({{"component":"gateway_interchange","gateway":{},"index":{},"error":{}}})", json_quote(gateway_id), item.index, json_quote(error.what()));
                report.errors.push_back(ImportError{gateway_id, item.index, error.what()});
            }
        }
    }

    logger->info(R"({{"component":"gateway_interchange","action":"import","created":{},"updated":{},"skipped":{},"errors":{}}})",
                 report.created.size(),
                 report.updated.size(),
                 report.skipped.size(),
                 report.errors.size());

    LifecycleEvent event{};
    event.type = event_type::k_gateway_imported;
    event.subjects["user"] = std::to_string(actor.user_id);
    event.details["created"] = std::to_string(report.created.size());
    event.details["updated"] = std::to_string(report.updated.size());
    event.details["skipped"] = std::to_string(report.skipped.size());
    event.details["errors"] = std::to_string(report.errors.size());
    event.occurred_at = now;
    publish_event(event_sink, event, *logger);
    return report;
}

Json::Value to_json(const Gateway& gateway) {
    Json::Value value;
    value["gateway_id"] = gateway.gateway_id;
    value["name"] = gateway.name;
    value["description"] = gateway.description;
    value["gateway_type"] = std::string{to_string(gateway.gateway_type)};
    value["parent_gateway_id"] = gateway.parent_gateway_id.has_value() ? Json::Value(*gateway.parent_gateway_id) : Json::Value();
    value["status"] = std::string{to_string(gateway.status)};
    value["hostname"] = gateway.hostname;
    value["ip_address"] = gateway.ip_address;
    value["ssh_port"] = gateway.ssh_port;
    value["api_port"] = gateway.api_port;
    value["location"] = gateway.location;
    value["region"] = gateway.region;
    value["environment"] = gateway.environment;
    value["max_targets"] = gateway.max_targets.has_value() ? Json::Value(*gateway.max_targets) : Json::Value();
    value["current_targets"] = gateway.current_targets;
    value["max_concurrent_sessions"] = gateway.max_concurrent_sessions.has_value() ? Json::Value(*gateway.max_concurrent_sessions) : Json::Value();
    value["current_sessions"] = gateway.current_sessions;
    value["health_score"] = gateway.health_score.has_value() ? Json::Value(*gateway.health_score) : Json::Value();
    value["tags"] = string_array(gateway.tags);
    value["features"] = string_array(gateway.features);
    value["created_at"] = format_timestamp(gateway.created_at);
    value["updated_at"] = format_timestamp(gateway.updated_at);
    value["is_active"] = gateway.is_active;
    return value;
}

std::string export_gateways_json(const GatewayRegistry& registry, const GatewayFilter& filter) {
    const std::vector<Gateway> gateways = registry.list(filter);
    Json::Value root;
    Json::Value items(Json::arrayValue);
    for (const Gateway& gateway : gateways) {
        items.append(to_json(gateway));
    }
    root["gateways"] = items;
    root["count"] = static_cast<Json::UInt64>(gateways.size());
    root["format"] = "json";

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, root);
}

std::string export_gateways_csv(const GatewayRegistry& registry, const GatewayFilter& filter) {
    std::ostringstream output;
    output << "gateway_id,name,description,gateway_type,parent_gateway_id,status,hostname,ip_address,ssh_port,api_port,"
              "location,region,environment,max_targets,current_targets,max_concurrent_sessions,current_sessions,tags,"
              "features,created_at,updated_at,is_active\r\n";
    for (const Gateway& gateway : registry.list(filter)) {
        const std::vector<std::string> fields{gateway.gateway_id,
                                              gateway.name,
                                              gateway.description,
                                              std::string{to_string(gateway.gateway_type)},
                                              gateway.parent_gateway_id.value_or(""),
                                              std::string{to_string(gateway.status)},
                                              gateway.hostname,
                                              gateway.ip_address,
                                              std::to_string(gateway.ssh_port),
                                              std::to_string(gateway.api_port),
                                              gateway.location,
                                              gateway.region,
                                              gateway.environment,
                                              optional_number(gateway.max_targets),
                                              std::to_string(gateway.current_targets),
                                              optional_number(gateway.max_concurrent_sessions),
                                              std::to_string(gateway.current_sessions),
                                              compact(string_array(gateway.tags)),
                                              compact(string_array(gateway.features)),
                                              format_timestamp(gateway.created_at),
                                              format_timestamp(gateway.updated_at),
                                              gateway.is_active ? "true" : "false"};
        for (std::size_t column = 0; column < fields.size(); ++column) {
            if (column != 0U) {
                output << ',';
            }
            output << csv_field(fields[column]);
        }
        output << "\r\n";
    }
    return output.str();
}

}  // namespace device_pool
