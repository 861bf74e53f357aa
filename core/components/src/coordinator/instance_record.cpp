#include "poolhub/core/coordinator/instance_record.hpp"

#include <chrono>
#include <sstream>

namespace poolhub::core::coordinator {

using common::ErrorCode;

namespace {

Json::Value counts_to_json(const std::map<std::string, uint64_t>& counts) {
    Json::Value node(Json::objectValue);
    for (const auto& [kind, count] : counts) {
        node[kind] = static_cast<Json::UInt64>(count);
    }
    return node;
}

std::map<std::string, uint64_t> counts_from_json(const Json::Value& node) {
    std::map<std::string, uint64_t> counts;
    if (!node.isObject()) {
        return counts;
    }
    for (const auto& kind : node.getMemberNames()) {
        counts[kind] = node[kind].asUInt64();
    }
    return counts;
}

}  // anonymous namespace

Json::Value InstanceRecord::to_json() const {
    Json::Value root(Json::objectValue);
    root["id"]        = id;
    root["hostname"]  = hostname;
    root["pid"]       = static_cast<Json::Int64>(pid);
    root["startedAt"] = static_cast<Json::Int64>(started_at);
    root["lastSeen"]  = static_cast<Json::Int64>(last_seen);
    root["poolSizes"] = counts_to_json(pool_sizes);
    root["inUse"]     = counts_to_json(in_use);

    Json::Value health_node(Json::objectValue);
    health_node["score"]       = health.score;
    health_node["memoryUsage"] = health.memory_usage;
    health_node["poolHealthy"] = health.pool_healthy;
    root["health"]             = health_node;

    Json::Value caps(Json::objectValue);
    caps["memoryLimit"]  = static_cast<Json::UInt64>(capabilities.memory_limit);
    caps["cpuCores"]     = capabilities.cpu_cores;
    root["capabilities"] = caps;

    return root;
}

common::Result<InstanceRecord> InstanceRecord::from_json(const Json::Value& node) {
    if (!node.isObject()) {
        return common::err<InstanceRecord>(ErrorCode::DESERIALIZE_FAILED,
                                           "instance record is not an object");
    }

    try {
        InstanceRecord record;
        record.id = node.get("id", "").asString();
        if (record.id.empty()) {
            return common::err<InstanceRecord>(ErrorCode::DESERIALIZE_FAILED,
                                               "instance record has no id");
        }
        record.hostname   = node.get("hostname", "").asString();
        record.pid        = node.get("pid", Json::Int64(0)).asInt64();
        record.started_at = node.get("startedAt", Json::Int64(0)).asInt64();
        record.last_seen  = node.get("lastSeen", Json::Int64(0)).asInt64();
        record.pool_sizes = counts_from_json(node["poolSizes"]);
        record.in_use     = counts_from_json(node["inUse"]);

        const auto& health_node = node["health"];
        if (health_node.isObject()) {
            record.health.score        = health_node.get("score", 1.0).asDouble();
            record.health.memory_usage = health_node.get("memoryUsage", 0.0).asDouble();
            record.health.pool_healthy = health_node.get("poolHealthy", true).asBool();
        }

        const auto& caps = node["capabilities"];
        if (caps.isObject()) {
            record.capabilities.memory_limit = caps.get("memoryLimit", Json::UInt64(0)).asUInt64();
            record.capabilities.cpu_cores    = caps.get("cpuCores", 1u).asUInt();
        }
        return record;
    } catch (const Json::Exception& e) {
        return common::err<InstanceRecord>(ErrorCode::DESERIALIZE_FAILED,
                                           std::string("invalid instance record: ") + e.what());
    }
}

std::string InstanceRecord::serialize() const {
    return encode_json(to_json());
}

common::Result<InstanceRecord> InstanceRecord::parse(std::string_view text) {
    auto decoded = decode_json(text);
    if (decoded.is_error()) {
        return common::err<InstanceRecord>(decoded.error());
    }
    return from_json(decoded.value());
}

// ============================================================================
// JSON HELPERS
// ============================================================================

std::string encode_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

common::Result<Json::Value> decode_json(std::string_view text) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream{std::string{text}};

    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        return common::err<Json::Value>(ErrorCode::DESERIALIZE_FAILED,
                                        "JSON parse error: " + errors);
    }
    return root;
}

int64_t unix_now() noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace poolhub::core::coordinator
