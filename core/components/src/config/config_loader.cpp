/**
 * @file config_loader.cpp
 * @brief Configuration loader implementation
 */

#include "poolhub/core/config/config_loader.hpp"

#include <poolhub/common/debug.hpp>

#include <yaml-cpp/yaml.h>
#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>

namespace poolhub::core::config {

using namespace common::debug;
using common::ErrorCode;

namespace {
constexpr std::string_view LOG_CAT = category::CONFIG;
}  // namespace

// ============================================================================
// FACTORY
// ============================================================================

std::unique_ptr<ConfigLoader> create_config_loader() {
    return std::make_unique<ConfigLoaderImpl>();
}

// ============================================================================
// FORMAT DETECTION
// ============================================================================

ConfigFormat ConfigLoader::detect_format(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".json") {
        return ConfigFormat::JSON;
    }
    return ConfigFormat::YAML;
}

ConfigFormat ConfigLoader::detect_format_from_content(std::string_view content) {
    size_t pos = 0;
    while (pos < content.size() && std::isspace(static_cast<unsigned char>(content[pos]))) {
        ++pos;
    }

    if (pos < content.size() && (content[pos] == '{' || content[pos] == '[')) {
        return ConfigFormat::JSON;
    }
    return ConfigFormat::YAML;
}

// ============================================================================
// PARSING HELPERS
// ============================================================================

namespace {

bool has_value(const YAML::Node& node, const std::string& key) {
    auto value = node[key];
    return value && !value.IsNull();
}

template <typename T>
T yaml_get(const YAML::Node& node, const std::string& key, T default_value) {
    if (has_value(node, key)) {
        return node[key].as<T>();
    }
    return default_value;
}

std::chrono::milliseconds yaml_get_ms(const YAML::Node& node, const std::string& key,
                                      std::chrono::milliseconds default_value) {
    if (has_value(node, key)) {
        return std::chrono::milliseconds(node[key].as<int64_t>());
    }
    return default_value;
}

std::chrono::seconds yaml_get_sec(const YAML::Node& node, const std::string& key,
                                  std::chrono::seconds default_value) {
    if (has_value(node, key)) {
        return std::chrono::seconds(node[key].as<int64_t>());
    }
    return default_value;
}

void require_map(const YAML::Node& node, const std::string& path) {
    if (!node.IsNull() && !node.IsMap()) {
        throw std::invalid_argument(path + " must be a mapping");
    }
}

memory::GcStrategy parse_gc_strategy(const std::string& str) {
    static const std::map<std::string, memory::GcStrategy> map = {
        {"adaptive", memory::GcStrategy::ADAPTIVE},
        {"conservative", memory::GcStrategy::CONSERVATIVE},
        {"aggressive", memory::GcStrategy::AGGRESSIVE},
        {"disabled", memory::GcStrategy::DISABLED},
    };
    auto it = map.find(str);
    if (it == map.end()) {
        throw std::invalid_argument("unknown memory.gc_strategy: " + str);
    }
    return it->second;
}

CoordinatorBackendType parse_backend_type(const std::string& str) {
    static const std::map<std::string, CoordinatorBackendType> map = {
        {"none", CoordinatorBackendType::NONE},
        {"redis", CoordinatorBackendType::REDIS},
        {"memory", CoordinatorBackendType::MEMORY},
    };
    auto it = map.find(str);
    if (it == map.end()) {
        throw std::invalid_argument("unknown coordinator.backend: " + str);
    }
    return it->second;
}

// ============================================================================
// SECTION PARSERS
// ============================================================================

LoggingConfig parse_logging(const YAML::Node& node) {
    require_map(node, "logging");
    LoggingConfig config;
    config.level             = yaml_get<std::string>(node, "level", config.level);
    config.output            = yaml_get<std::string>(node, "output", config.output);
    config.file_path         = yaml_get<std::string>(node, "file_path", config.file_path);
    config.max_file_size_mb  = yaml_get<uint32_t>(node, "max_file_size_mb", config.max_file_size_mb);
    config.max_files         = yaml_get<uint32_t>(node, "max_files", config.max_files);
    config.include_timestamp = yaml_get<bool>(node, "include_timestamp", config.include_timestamp);
    config.include_thread_id = yaml_get<bool>(node, "include_thread_id", config.include_thread_id);

    if (has_value(node, "categories")) {
        const auto& categories = node["categories"];
        require_map(categories, "logging.categories");
        for (const auto& entry : categories) {
            config.categories[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
    }
    return config;
}

/// Overlays the keys present in @p node on @p config
pool::PoolConfig parse_pool(const YAML::Node& node, pool::PoolConfig config,
                            const std::string& path) {
    require_map(node, path);
    config.initial_size     = yaml_get<size_t>(node, "initial_size", config.initial_size);
    config.max_size         = yaml_get<size_t>(node, "max_size", config.max_size);
    config.emergency_limit  = yaml_get<size_t>(node, "emergency_limit", config.emergency_limit);
    config.min_size         = yaml_get<size_t>(node, "min_size", config.min_size);
    config.hard_ceiling     = yaml_get<size_t>(node, "hard_ceiling", config.hard_ceiling);
    config.scale_threshold  = yaml_get<double>(node, "scale_threshold", config.scale_threshold);
    config.growth_factor    = yaml_get<double>(node, "growth_factor", config.growth_factor);
    config.auto_shrink      = yaml_get<bool>(node, "auto_shrink", config.auto_shrink);
    config.shrink_threshold = yaml_get<double>(node, "shrink_threshold", config.shrink_threshold);
    config.shrink_factor    = yaml_get<double>(node, "shrink_factor", config.shrink_factor);

    if (has_value(node, "cooldown_seconds")) {
        auto seconds    = node["cooldown_seconds"].as<double>();
        config.cooldown = std::chrono::milliseconds(std::llround(seconds * 1000.0));
    }
    return config;
}

PoolsConfig parse_pools(const YAML::Node& node) {
    require_map(node, "pools");
    PoolsConfig config;
    if (has_value(node, "defaults")) {
        config.defaults = parse_pool(node["defaults"], config.defaults, "pools.defaults");
    }

    if (has_value(node, "kinds")) {
        const auto kinds = node["kinds"];
        if (!kinds.IsMap()) {
            throw std::invalid_argument("pools.kinds must be a mapping");
        }
        for (const auto& entry : kinds) {
            auto name = entry.first.as<std::string>();
            config.kinds[name] = parse_pool(entry.second, config.defaults, "pools.kinds." + name);
        }
    }
    return config;
}

memory::MonitorConfig parse_memory(const YAML::Node& node) {
    require_map(node, "memory");
    memory::MonitorConfig config;
    config.enabled = yaml_get<bool>(node, "enabled", config.enabled);

    if (has_value(node, "memory_limit_bytes")) {
        const auto limit = node["memory_limit_bytes"];
        if (limit.IsScalar() && limit.Scalar() == "none") {
            config.memory_limit_bytes  = 0;
            config.detect_cgroup_limit = false;
        } else {
            config.memory_limit_bytes  = limit.as<uint64_t>();
            config.detect_cgroup_limit = true;
        }
    }

    config.check_interval = yaml_get_ms(node, "check_interval_ms", config.check_interval);

    if (has_value(node, "tier_ratios")) {
        const auto ratios = node["tier_ratios"];
        require_map(ratios, "memory.tier_ratios");
        config.ratios.medium   = yaml_get<double>(ratios, "medium", config.ratios.medium);
        config.ratios.high     = yaml_get<double>(ratios, "high", config.ratios.high);
        config.ratios.critical = yaml_get<double>(ratios, "critical", config.ratios.critical);
    }

    if (has_value(node, "adjustment_factors")) {
        const auto factors = node["adjustment_factors"];
        require_map(factors, "memory.adjustment_factors");
        config.factors.low      = yaml_get<double>(factors, "low", config.factors.low);
        config.factors.medium   = yaml_get<double>(factors, "medium", config.factors.medium);
        config.factors.high     = yaml_get<double>(factors, "high", config.factors.high);
        config.factors.critical = yaml_get<double>(factors, "critical", config.factors.critical);
    }

    if (has_value(node, "gc_strategy")) {
        config.gc_strategy = parse_gc_strategy(node["gc_strategy"].as<std::string>());
    }
    config.history_size = yaml_get<size_t>(node, "history_size", config.history_size);

    if (has_value(node, "tracked_lifetimes")) {
        const auto lifetimes = node["tracked_lifetimes"];
        require_map(lifetimes, "memory.tracked_lifetimes");
        for (const auto& entry : lifetimes) {
            config.tracked_lifetimes[entry.first.as<std::string>()] =
                std::chrono::seconds(entry.second.as<int64_t>());
        }
    }
    config.default_tracked_lifetime =
        yaml_get_sec(node, "default_tracked_lifetime", config.default_tracked_lifetime);
    return config;
}

CoordinatorConfig parse_coordinator(const YAML::Node& node) {
    require_map(node, "coordinator");
    CoordinatorConfig config;
    if (has_value(node, "backend")) {
        config.backend = parse_backend_type(node["backend"].as<std::string>());
    }

    auto& endpoint    = config.endpoint;
    endpoint.host     = yaml_get<std::string>(node, "host", endpoint.host);
    endpoint.port     = yaml_get<uint16_t>(node, "port", endpoint.port);
    endpoint.timeout  = yaml_get_ms(node, "timeout_ms", endpoint.timeout);
    endpoint.password = yaml_get<std::string>(node, "password", endpoint.password);
    endpoint.database = yaml_get<uint32_t>(node, "database", endpoint.database);

    config.key_prefix         = yaml_get<std::string>(node, "key_prefix", config.key_prefix);
    config.reconnect_backoff  = yaml_get_ms(node, "reconnect_backoff_ms", config.reconnect_backoff);
    config.heartbeat_ttl      = yaml_get_sec(node, "heartbeat_ttl", config.heartbeat_ttl);
    config.leader_election    = yaml_get<bool>(node, "leader_election", config.leader_election);
    config.leader_ttl         = yaml_get_sec(node, "leader_ttl", config.leader_ttl);
    config.sync_interval      = yaml_get_ms(node, "sync_interval_ms", config.sync_interval);
    config.rebalance_interval = yaml_get_sec(node, "rebalance_interval", config.rebalance_interval);
    return config;
}

ApplicationConfig parse_application(const YAML::Node& root) {
    require_map(root, "configuration root");
    ApplicationConfig config;
    config.instance_id   = yaml_get<std::string>(root, "instance_id", config.instance_id);
    config.tick_interval = yaml_get_ms(root, "tick_interval_ms", config.tick_interval);

    if (has_value(root, "logging")) {
        config.logging = parse_logging(root["logging"]);
    }
    if (has_value(root, "pools")) {
        config.pools = parse_pools(root["pools"]);
    }
    if (has_value(root, "memory")) {
        config.memory = parse_memory(root["memory"]);
    }
    if (has_value(root, "coordinator")) {
        config.coordinator = parse_coordinator(root["coordinator"]);
    }
    return config;
}

// ============================================================================
// JSON <-> YAML TREE
// ============================================================================

std::string format_real(double value) {
    std::ostringstream out;
    out << std::setprecision(15) << value;
    return out.str();
}

/// Maps a JSON document onto YAML nodes with every scalar as a plain string
YAML::Node to_yaml(const Json::Value& value) {
    switch (value.type()) {
        case Json::objectValue: {
            YAML::Node node(YAML::NodeType::Map);
            for (const auto& name : value.getMemberNames()) {
                node[name] = to_yaml(value[name]);
            }
            return node;
        }
        case Json::arrayValue: {
            YAML::Node node(YAML::NodeType::Sequence);
            for (const auto& item : value) {
                node.push_back(to_yaml(item));
            }
            return node;
        }
        case Json::intValue:
            return YAML::Node(std::to_string(value.asInt64()));
        case Json::uintValue:
            return YAML::Node(std::to_string(value.asUInt64()));
        case Json::realValue:
            return YAML::Node(format_real(value.asDouble()));
        case Json::booleanValue:
            return YAML::Node(value.asBool() ? "true" : "false");
        case Json::stringValue:
            return YAML::Node(value.asString());
        case Json::nullValue:
        default:
            return YAML::Node(YAML::NodeType::Null);
    }
}

void emit_yaml(YAML::Emitter& out, const Json::Value& value) {
    switch (value.type()) {
        case Json::objectValue:
            out << YAML::BeginMap;
            for (const auto& name : value.getMemberNames()) {
                out << YAML::Key << name << YAML::Value;
                emit_yaml(out, value[name]);
            }
            out << YAML::EndMap;
            break;
        case Json::arrayValue:
            out << YAML::BeginSeq;
            for (const auto& item : value) {
                emit_yaml(out, item);
            }
            out << YAML::EndSeq;
            break;
        case Json::intValue:
            out << value.asInt64();
            break;
        case Json::uintValue:
            out << value.asUInt64();
            break;
        case Json::realValue:
            out << format_real(value.asDouble());
            break;
        case Json::booleanValue:
            out << value.asBool();
            break;
        case Json::stringValue:
            out << YAML::DoubleQuoted << value.asString();
            break;
        case Json::nullValue:
        default:
            out << YAML::Null;
            break;
    }
}

// ============================================================================
// SERIALIZATION
// ============================================================================

Json::Value pool_to_json(const pool::PoolConfig& config) {
    Json::Value node(Json::objectValue);
    node["initial_size"]     = Json::UInt64(config.initial_size);
    node["max_size"]         = Json::UInt64(config.max_size);
    node["emergency_limit"]  = Json::UInt64(config.emergency_limit);
    node["min_size"]         = Json::UInt64(config.min_size);
    node["hard_ceiling"]     = Json::UInt64(config.hard_ceiling);
    node["scale_threshold"]  = config.scale_threshold;
    node["growth_factor"]    = config.growth_factor;
    node["cooldown_seconds"] = static_cast<double>(config.cooldown.count()) / 1000.0;
    node["auto_shrink"]      = config.auto_shrink;
    node["shrink_threshold"] = config.shrink_threshold;
    node["shrink_factor"]    = config.shrink_factor;
    return node;
}

Json::Value application_to_json(const ApplicationConfig& config) {
    Json::Value root(Json::objectValue);
    root["instance_id"]      = config.instance_id;
    root["tick_interval_ms"] = Json::Int64(config.tick_interval.count());

    auto& log_node                = root["logging"];
    log_node["level"]             = config.logging.level;
    log_node["output"]            = config.logging.output;
    log_node["file_path"]         = config.logging.file_path;
    log_node["max_file_size_mb"]  = config.logging.max_file_size_mb;
    log_node["max_files"]         = config.logging.max_files;
    log_node["include_timestamp"] = config.logging.include_timestamp;
    log_node["include_thread_id"] = config.logging.include_thread_id;
    for (const auto& [name, level] : config.logging.categories) {
        log_node["categories"][name] = level;
    }

    auto& pool_node       = root["pools"];
    pool_node["defaults"] = pool_to_json(config.pools.defaults);
    pool_node["kinds"]    = Json::Value(Json::objectValue);
    for (const auto& [name, kind] : config.pools.kinds) {
        pool_node["kinds"][name] = pool_to_json(kind);
    }

    const auto& mem      = config.memory;
    auto& mem_node       = root["memory"];
    mem_node["enabled"]  = mem.enabled;
    if (mem.memory_limit_bytes == 0 && !mem.detect_cgroup_limit) {
        mem_node["memory_limit_bytes"] = "none";
    } else {
        mem_node["memory_limit_bytes"] = Json::UInt64(mem.memory_limit_bytes);
    }
    mem_node["check_interval_ms"]              = Json::Int64(mem.check_interval.count());
    mem_node["tier_ratios"]["medium"]          = mem.ratios.medium;
    mem_node["tier_ratios"]["high"]            = mem.ratios.high;
    mem_node["tier_ratios"]["critical"]        = mem.ratios.critical;
    mem_node["adjustment_factors"]["low"]      = mem.factors.low;
    mem_node["adjustment_factors"]["medium"]   = mem.factors.medium;
    mem_node["adjustment_factors"]["high"]     = mem.factors.high;
    mem_node["adjustment_factors"]["critical"] = mem.factors.critical;
    mem_node["gc_strategy"]  = std::string(memory::gc_strategy_name(mem.gc_strategy));
    mem_node["history_size"] = Json::UInt64(mem.history_size);
    mem_node["tracked_lifetimes"] = Json::Value(Json::objectValue);
    for (const auto& [kind, lifetime] : mem.tracked_lifetimes) {
        mem_node["tracked_lifetimes"][kind] = Json::Int64(lifetime.count());
    }
    mem_node["default_tracked_lifetime"] = Json::Int64(mem.default_tracked_lifetime.count());

    const auto& coord                   = config.coordinator;
    auto& coord_node                    = root["coordinator"];
    coord_node["backend"]               = std::string(backend_type_name(coord.backend));
    coord_node["host"]                  = coord.endpoint.host;
    coord_node["port"]                  = coord.endpoint.port;
    coord_node["timeout_ms"]            = Json::Int64(coord.endpoint.timeout.count());
    coord_node["password"]              = coord.endpoint.password;
    coord_node["database"]              = coord.endpoint.database;
    coord_node["key_prefix"]            = coord.key_prefix;
    coord_node["reconnect_backoff_ms"]  = Json::Int64(coord.reconnect_backoff.count());
    coord_node["heartbeat_ttl"]         = Json::Int64(coord.heartbeat_ttl.count());
    coord_node["leader_election"]       = coord.leader_election;
    coord_node["leader_ttl"]            = Json::Int64(coord.leader_ttl.count());
    coord_node["sync_interval_ms"]      = Json::Int64(coord.sync_interval.count());
    coord_node["rebalance_interval"]    = Json::Int64(coord.rebalance_interval.count());
    return root;
}

}  // namespace

// ============================================================================
// IMPLEMENTATION
// ============================================================================

common::Result<std::string> ConfigLoaderImpl::read_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return common::err<std::string>(ErrorCode::CONFIG_FILE_NOT_FOUND,
                                        "Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return common::err<std::string>(ErrorCode::OS_ERROR,
                                        "Failed to open configuration file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

common::Result<void> ConfigLoaderImpl::write_file(const std::filesystem::path& path,
                                                  std::string_view content) {
    auto parent = path.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return common::err(ErrorCode::OS_ERROR,
                               "Failed to create directory: " + parent.string());
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        return common::err(ErrorCode::OS_ERROR,
                           "Failed to open file for writing: " + path.string());
    }

    file << content;
    if (!file.good()) {
        return common::err(ErrorCode::OS_ERROR, "Failed to write to file: " + path.string());
    }
    return common::ok();
}

ConfigFormat ConfigLoaderImpl::resolve_format(const std::filesystem::path& path,
                                              ConfigFormat format) {
    if (format == ConfigFormat::AUTO) {
        return detect_format(path);
    }
    return format;
}

common::Result<ApplicationConfig> ConfigLoaderImpl::load(const std::filesystem::path& path,
                                                         ConfigFormat format) {
    POOLHUB_LOG_DEBUG(LOG_CAT, "Loading configuration from " << path.string());

    auto content = read_file(path);
    if (content.is_error()) {
        return common::err<ApplicationConfig>(content.error());
    }
    return parse(content.value(), resolve_format(path, format));
}

common::Result<ApplicationConfig> ConfigLoaderImpl::parse(std::string_view content,
                                                          ConfigFormat format) {
    if (format == ConfigFormat::AUTO) {
        format = detect_format_from_content(content);
    }

    try {
        if (format == ConfigFormat::JSON) {
            Json::Value root;
            Json::CharReaderBuilder builder;
            std::string errors;
            std::istringstream stream{std::string{content}};

            if (!Json::parseFromStream(builder, stream, &root, &errors)) {
                return common::err<ApplicationConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                                      "JSON parse error: " + errors);
            }
            return parse_application(to_yaml(root));
        }

        return parse_application(YAML::Load(std::string(content)));
    } catch (const std::exception& e) {
        return common::err<ApplicationConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                              std::string("Parse error: ") + e.what());
    }
}

common::Result<std::string> ConfigLoaderImpl::serialize(const ApplicationConfig& config,
                                                        ConfigFormat format) {
    auto root = application_to_json(config);

    if (format == ConfigFormat::JSON) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        return Json::writeString(builder, root);
    }

    YAML::Emitter out;
    emit_yaml(out, root);
    if (!out.good()) {
        return common::err<std::string>(ErrorCode::CONFIG_INVALID,
                                        "YAML emitter error: " + out.GetLastError());
    }
    return std::string(out.c_str());
}

common::Result<void> ConfigLoaderImpl::save(const ApplicationConfig& config,
                                            const std::filesystem::path& path,
                                            ConfigFormat format) {
    auto content = serialize(config, resolve_format(path, format));
    if (content.is_error()) {
        return common::err(content.error());
    }
    return write_file(path, content.value());
}

// ============================================================================
// VALIDATION
// ============================================================================

common::Result<void> ConfigLoaderImpl::validate(const ApplicationConfig& config) {
    static const std::set<std::string> levels = {"trace", "debug", "info", "warn", "warning",
                                                 "error", "fatal", "off"};
    static const std::set<std::string> outputs = {"console", "file", "both"};

    if (levels.count(config.logging.level) == 0) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE,
                           "logging.level: unknown level '" + config.logging.level + "'");
    }
    if (outputs.count(config.logging.output) == 0) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE,
                           "logging.output: must be console, file or both");
    }
    if (config.logging.output != "console" && config.logging.file_path.empty()) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE,
                           "logging.file_path: required for file output");
    }
    static const std::set<std::string> categories = {
        std::string(common::debug::category::GENERAL),
        std::string(common::debug::category::POOL),
        std::string(common::debug::category::MEMORY),
        std::string(common::debug::category::COORDINATOR),
        std::string(common::debug::category::CONFIG),
        std::string(common::debug::category::LIFECYCLE),
    };
    for (const auto& [name, level] : config.logging.categories) {
        if (categories.count(name) == 0) {
            return common::err(ErrorCode::CONFIG_INVALID_VALUE,
                               "logging.categories: unknown category '" + name + "'");
        }
        if (levels.count(level) == 0) {
            return common::err(ErrorCode::CONFIG_INVALID_VALUE,
                               "logging.categories." + name + ": unknown level '" + level + "'");
        }
    }
    if (config.tick_interval.count() <= 0) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE, "tick_interval_ms: must be positive");
    }

    if (auto result = config.pools.defaults.validate(); result.is_error()) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE,
                           "pools.defaults: " + result.message());
    }
    for (const auto& [name, kind] : config.pools.kinds) {
        if (auto result = kind.validate(); result.is_error()) {
            return common::err(ErrorCode::CONFIG_INVALID_VALUE,
                               "pools.kinds." + name + ": " + result.message());
        }
    }

    if (auto result = config.memory.validate(); result.is_error()) {
        return result;
    }

    const auto& coord = config.coordinator;
    if (coord.backend == CoordinatorBackendType::REDIS && coord.endpoint.host.empty()) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE, "coordinator.host: required");
    }
    if (coord.endpoint.port == 0) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE, "coordinator.port: must be non-zero");
    }
    if (coord.endpoint.timeout.count() <= 0) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE,
                           "coordinator.timeout_ms: must be positive");
    }
    if (coord.heartbeat_ttl.count() <= 0) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE,
                           "coordinator.heartbeat_ttl: must be positive");
    }
    if (coord.leader_ttl.count() <= 0) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE,
                           "coordinator.leader_ttl: must be positive");
    }
    if (coord.sync_interval.count() < 0 || coord.rebalance_interval.count() < 0) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE,
                           "coordinator intervals must not be negative");
    }
    return common::ok();
}

}  // namespace poolhub::core::config
