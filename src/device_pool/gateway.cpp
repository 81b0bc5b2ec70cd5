#include "device_pool/gateway.hpp"

#include <algorithm>
#include <cctype>

namespace device_pool {

namespace {
std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char character) {
        return static_cast<char>(std::tolower(character));
    });
    return text;
}

bool contains_ignoring_case(const std::string& haystack, const std::string& needle) {
    return lowercase(haystack).find(lowercase(needle)) != std::string::npos;
}

template <typename Value>
bool any_of_or_empty(const std::vector<Value>& accepted, Value value) {
    return accepted.empty() || std::find(accepted.begin(), accepted.end(), value) != accepted.end();
}
}  // namespace

bool matches(const Gateway& gateway, const GatewayFilter& filter) {
    if (!any_of_or_empty(filter.statuses, gateway.status) || !any_of_or_empty(filter.gateway_types, gateway.gateway_type)) {
        return false;
    }
    if (filter.is_active.has_value() && gateway.is_active != *filter.is_active) {
        return false;
    }
    for (const std::string& tag : filter.tags) {
        if (std::find(gateway.tags.begin(), gateway.tags.end(), tag) == gateway.tags.end()) {
            return false;
        }
    }
    if (filter.region.has_value() && gateway.region != *filter.region) {
        return false;
    }
    if (filter.location.has_value() && gateway.location != *filter.location) {
        return false;
    }
    if (filter.environment.has_value() && gateway.environment != *filter.environment) {
        return false;
    }
    if (filter.parent_gateway_id.has_value() && gateway.parent_gateway_id != filter.parent_gateway_id) {
        return false;
    }
    if (filter.health_score_min.has_value() && (!gateway.health_score.has_value() || *gateway.health_score < *filter.health_score_min)) {
        return false;
    }
    if (filter.search.has_value() && !filter.search->empty()) {
        const std::string& needle = *filter.search;
        if (!contains_ignoring_case(gateway.name, needle) && !contains_ignoring_case(gateway.gateway_id, needle) &&
            !contains_ignoring_case(gateway.description, needle)) {
            return false;
        }
    }
    return true;
}

}  // namespace device_pool
