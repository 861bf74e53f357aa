#include "poolhub/core/coordinator/redis_coordinator.hpp"

#include <poolhub/common/debug.hpp>

#include <algorithm>
#include <cerrno>
#include <charconv>

#include <hiredis/hiredis.h>
#include <sys/time.h>

namespace poolhub::core::coordinator {

using namespace common::debug;

namespace {
constexpr std::string_view LOG_CAT = category::COORDINATOR;

constexpr const char* RENEW_IF_OWNER_SCRIPT =
    "if redis.call('get', KEYS[1]) == ARGV[1] then "
    "return redis.call('expire', KEYS[1], ARGV[2]) else return 0 end";

constexpr const char* DELETE_IF_OWNER_SCRIPT =
    "if redis.call('get', KEYS[1]) == ARGV[1] then "
    "return redis.call('del', KEYS[1]) else return 0 end";

constexpr const char* SCAN_BATCH = "100";

struct timeval to_timeval(std::chrono::milliseconds ms) {
    struct timeval tv{};
    tv.tv_sec  = static_cast<time_t>(ms.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
    return tv;
}

bool is_string(const redisReply* reply) {
    return reply != nullptr &&
           (reply->type == REDIS_REPLY_STRING || reply->type == REDIS_REPLY_STATUS);
}

std::string text(const redisReply* reply) {
    return std::string(reply->str, reply->len);
}

bool is_ok(const redisReply* reply) {
    return reply != nullptr && reply->type == REDIS_REPLY_STATUS && text(reply) == "OK";
}

bool is_positive_integer(const redisReply* reply) {
    return reply != nullptr && reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

std::optional<std::string> string_value(const redisReply* reply) {
    if (reply == nullptr || reply->type != REDIS_REPLY_STRING) {
        return std::nullopt;
    }
    return text(reply);
}

/// Read timeouts surface as REDIS_ERR_TIMEOUT, or as EAGAIN on older releases
bool timed_out(const redisContext* context, int saved_errno) {
    if (context->err == REDIS_ERR_TIMEOUT) {
        return true;
    }
    return context->err == REDIS_ERR_IO && (saved_errno == EAGAIN || saved_errno == EWOULDBLOCK);
}
}  // anonymous namespace

RedisCoordinator::RedisCoordinator(RedisCoordinatorConfig config) : config_(std::move(config)) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto pong = execute_locked({"PING"});
    if (!pong) {
        POOLHUB_LOG_DEBUG(LOG_CAT, "Initial connection to " << config_.endpoint.address()
                                                            << " deferred");
    }
}

RedisCoordinator::~RedisCoordinator() {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect_locked();
}

std::string RedisCoordinator::prefixed(std::string_view key) const {
    if (config_.key_prefix.empty()) {
        return std::string(key);
    }
    return config_.key_prefix + ":" + std::string(key);
}

// ============================================================================
// CONNECTION MANAGEMENT
// ============================================================================

bool RedisCoordinator::ensure_connected_locked() {
    if (context_ != nullptr) {
        return true;
    }

    auto now = std::chrono::steady_clock::now();
    if (retry_after_ && now < *retry_after_) {
        return false;
    }

    auto tv            = to_timeval(config_.endpoint.timeout);
    redisContext* ctx  = redisConnectWithTimeout(config_.endpoint.host.c_str(),
                                                 config_.endpoint.port, tv);
    if (ctx == nullptr || ctx->err != 0) {
        std::string reason = ctx ? ctx->errstr : "cannot allocate redis context";
        if (ctx != nullptr) {
            redisFree(ctx);
        }
        mark_unavailable_locked("connect failed: " + reason);
        return false;
    }
    if (redisSetTimeout(ctx, tv) != REDIS_OK) {
        std::string reason = ctx->errstr;
        redisFree(ctx);
        mark_unavailable_locked("cannot set command timeout: " + reason);
        return false;
    }
    context_ = ctx;

    if (!config_.endpoint.password.empty()) {
        auto reply = send_locked({"AUTH", config_.endpoint.password}, std::chrono::milliseconds(0));
        if (!is_ok(reply.get())) {
            std::string reason =
                reply ? "AUTH rejected: " + text(reply.get()) : std::string(context_->errstr);
            disconnect_locked();
            mark_unavailable_locked(reason);
            return false;
        }
    }

    if (config_.endpoint.database != 0) {
        auto reply = send_locked({"SELECT", std::to_string(config_.endpoint.database)},
                                 std::chrono::milliseconds(0));
        if (!is_ok(reply.get())) {
            std::string reason = reply ? "SELECT " + std::to_string(config_.endpoint.database) +
                                             " rejected: " + text(reply.get())
                                       : std::string(context_->errstr);
            disconnect_locked();
            mark_unavailable_locked(reason);
            return false;
        }
    }

    retry_after_.reset();
    POOLHUB_LOG_DEBUG(LOG_CAT, "Socket opened to " << config_.endpoint.address());
    return true;
}

void RedisCoordinator::disconnect_locked() noexcept {
    if (context_ != nullptr) {
        redisFree(context_);
        context_ = nullptr;
    }
}

void RedisCoordinator::mark_unavailable_locked(const std::string& reason) {
    retry_after_ = std::chrono::steady_clock::now() + config_.reconnect_backoff;
    link_up_     = false;
    if (!warned_) {
        POOLHUB_LOG_WARN(LOG_CAT, "Coordinator unavailable at " << config_.endpoint.address()
                                                                << ": " << reason
                                                                << ", running standalone");
        warned_ = true;
    } else {
        POOLHUB_LOG_DEBUG(LOG_CAT, "Coordinator still unavailable: " << reason);
    }
}

RedisCoordinator::ReplyPtr RedisCoordinator::send_locked(const std::vector<std::string>& args,
                                                         std::chrono::milliseconds extra_wait) {
    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }

    if (extra_wait.count() > 0 &&
        redisSetTimeout(context_, to_timeval(config_.endpoint.timeout + extra_wait)) != REDIS_OK) {
        return ReplyPtr(nullptr, freeReplyObject);
    }

    errno = 0;
    ReplyPtr reply(static_cast<redisReply*>(redisCommandArgv(
                       context_, static_cast<int>(argv.size()), argv.data(), argvlen.data())),
                   freeReplyObject);

    if (reply && extra_wait.count() > 0 &&
        redisSetTimeout(context_, to_timeval(config_.endpoint.timeout)) != REDIS_OK) {
        POOLHUB_LOG_DEBUG(LOG_CAT, "Could not restore command timeout: " << context_->errstr);
    }
    return reply;
}

RedisCoordinator::ReplyPtr RedisCoordinator::execute_locked(const std::vector<std::string>& args,
                                                            std::chrono::milliseconds extra_wait) {
    if (!ensure_connected_locked()) {
        return ReplyPtr(nullptr, freeReplyObject);
    }

    auto reply = send_locked(args, extra_wait);
    if (!reply) {
        int saved_errno    = errno;
        bool stalled       = timed_out(context_, saved_errno);
        std::string reason = context_->errstr;
        disconnect_locked();

        // A stalled server gets no second full timeout; a dropped link gets one retry
        if (stalled) {
            mark_unavailable_locked(args.front() + " timed out: " + reason);
            return reply;
        }

        POOLHUB_LOG_DEBUG(LOG_CAT, args.front() << " failed (" << reason
                                                << "), reconnecting once");
        if (!ensure_connected_locked()) {
            return reply;
        }
        reply = send_locked(args, extra_wait);
        if (!reply) {
            reason = context_->errstr;
            disconnect_locked();
            mark_unavailable_locked(args.front() + " failed: " + reason);
            return reply;
        }
    }

    if (!link_up_) {
        if (warned_) {
            POOLHUB_LOG_INFO(LOG_CAT, "Coordinator connection restored to "
                                          << config_.endpoint.address());
        } else {
            POOLHUB_LOG_INFO(LOG_CAT, "Connected to Redis coordinator at "
                                          << config_.endpoint.address());
        }
        link_up_ = true;
        warned_  = false;
    }

    if (reply->type == REDIS_REPLY_ERROR) {
        POOLHUB_LOG_DEBUG(LOG_CAT, args.front() << " rejected: " << text(reply.get()));
    }
    return reply;
}

bool RedisCoordinator::is_connected() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = execute_locked({"PING"});
    return reply && reply->type == REDIS_REPLY_STATUS && text(reply.get()) == "PONG";
}

// ============================================================================
// INSTANCES
// ============================================================================

bool RedisCoordinator::register_instance(const InstanceRecord& record, std::chrono::seconds ttl) {
    if (record.id.empty() || ttl.count() <= 0) {
        return false;
    }

    InstanceRecord stamped = record;
    stamped.last_seen      = unix_now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = execute_locked({"SETEX", prefixed(keys::instance(record.id)),
                                 std::to_string(ttl.count()), stamped.serialize()});
    return is_ok(reply.get());
}

bool RedisCoordinator::unregister_instance(const std::string& instance_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_positive_integer(
        execute_locked({"DEL", prefixed(keys::instance(instance_id))}).get());
}

std::vector<InstanceRecord> RedisCoordinator::get_active_instances() {
    std::vector<InstanceRecord> instances;

    std::lock_guard<std::mutex> lock(mutex_);
    auto pattern = prefixed(keys::instance("*"));

    // SCAN returns full server-side names, so no prefixing below
    std::vector<std::string> names;
    std::string cursor = "0";
    do {
        auto page = execute_locked({"SCAN", cursor, "MATCH", pattern, "COUNT", SCAN_BATCH});
        if (!page || page->type != REDIS_REPLY_ARRAY || page->elements != 2 ||
            !is_string(page->element[0]) || page->element[1]->type != REDIS_REPLY_ARRAY) {
            return instances;
        }
        cursor = text(page->element[0]);
        for (size_t i = 0; i < page->element[1]->elements; ++i) {
            const redisReply* name = page->element[1]->element[i];
            if (is_string(name)) {
                names.push_back(text(name));
            }
        }
    } while (cursor != "0");

    // A key may be reported more than once while the server rehashes
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    if (names.empty()) {
        return instances;
    }

    std::vector<std::string> mget{"MGET"};
    mget.insert(mget.end(), names.begin(), names.end());
    auto values = execute_locked(mget);
    if (!values || values->type != REDIS_REPLY_ARRAY) {
        return instances;
    }

    for (size_t i = 0; i < values->elements && i < names.size(); ++i) {
        auto raw = string_value(values->element[i]);
        if (!raw) {
            continue;  // expired between SCAN and MGET
        }
        auto parsed = InstanceRecord::parse(*raw);
        if (parsed.is_success()) {
            instances.push_back(std::move(parsed).value());
        } else {
            POOLHUB_LOG_DEBUG(LOG_CAT, "Skipping unreadable record " << names[i] << ": "
                                                                      << parsed.message());
        }
    }
    return instances;
}

// ============================================================================
// LEADERSHIP
// ============================================================================

bool RedisCoordinator::acquire_leadership(const std::string& instance_id,
                                          std::chrono::seconds ttl) {
    if (instance_id.empty() || ttl.count() <= 0) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto key   = prefixed(keys::LEADER);
    auto ttl_s = std::to_string(ttl.count());

    auto claimed = execute_locked({"SET", key, instance_id, "NX", "EX", ttl_s});
    if (!claimed) {
        return false;
    }
    if (is_ok(claimed.get())) {
        return true;
    }

    return is_positive_integer(
        execute_locked({"EVAL", RENEW_IF_OWNER_SCRIPT, "1", key, instance_id, ttl_s}).get());
}

bool RedisCoordinator::release_leadership(const std::string& instance_id) {
    if (instance_id.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return is_positive_integer(
        execute_locked({"EVAL", DELETE_IF_OWNER_SCRIPT, "1", prefixed(keys::LEADER), instance_id})
            .get());
}

std::optional<std::string> RedisCoordinator::get_current_leader() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto holder = string_value(execute_locked({"GET", prefixed(keys::LEADER)}).get());
    if (holder && holder->empty()) {
        return std::nullopt;
    }
    return holder;
}

// ============================================================================
// QUEUES
// ============================================================================

bool RedisCoordinator::push(const std::string& key, const Json::Value& item) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = execute_locked({"LPUSH", prefixed(keys::queue(key)), encode_json(item)});
    return reply && reply->type == REDIS_REPLY_INTEGER;
}

std::optional<Json::Value> RedisCoordinator::pop(const std::string& key,
                                                 std::chrono::seconds timeout) {
    std::optional<std::string> raw;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto queue_key = prefixed(keys::queue(key));
        if (timeout.count() > 0) {
            auto reply = execute_locked({"BRPOP", queue_key, std::to_string(timeout.count())},
                                        timeout);
            if (reply && reply->type == REDIS_REPLY_ARRAY && reply->elements == 2) {
                raw = string_value(reply->element[1]);
            }
        } else {
            raw = string_value(execute_locked({"RPOP", queue_key}).get());
        }
    }

    if (!raw) {
        return std::nullopt;
    }
    auto decoded = decode_json(*raw);
    if (decoded.is_error()) {
        POOLHUB_LOG_DEBUG(LOG_CAT, "Dropping unreadable queue item: " << decoded.message());
        return std::nullopt;
    }
    return std::move(decoded).value();
}

size_t RedisCoordinator::get_queue_length(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reply = execute_locked({"LLEN", prefixed(keys::queue(key))});
    if (!reply || reply->type != REDIS_REPLY_INTEGER || reply->integer < 0) {
        return 0;
    }
    return static_cast<size_t>(reply->integer);
}

// ============================================================================
// KEY/VALUE
// ============================================================================

std::optional<std::string> RedisCoordinator::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return string_value(execute_locked({"GET", prefixed(key)}).get());
}

bool RedisCoordinator::set(const std::string& key, const std::string& value,
                           std::chrono::seconds ttl) {
    if (ttl.count() < 0) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (ttl.count() > 0) {
        return is_ok(
            execute_locked({"SETEX", prefixed(key), std::to_string(ttl.count()), value}).get());
    }
    return is_ok(execute_locked({"SET", prefixed(key), value}).get());
}

bool RedisCoordinator::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_positive_integer(execute_locked({"DEL", prefixed(key)}).get());
}

// ============================================================================
// GLOBAL COUNTERS
// ============================================================================

int64_t RedisCoordinator::get_global_counter(const std::string& kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto raw =
        string_value(execute_locked({"GET", prefixed(keys::global_pool_size(kind))}).get());
    if (!raw) {
        return 0;
    }

    int64_t value  = 0;
    auto [ptr, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
    if (ec != std::errc() || ptr != raw->data() + raw->size()) {
        return 0;
    }
    return value;
}

bool RedisCoordinator::adjust_global_counter(const std::string& kind, int64_t delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key   = prefixed(keys::global_pool_size(kind));
    auto reply = execute_locked({"INCRBY", key, std::to_string(delta)});
    if (!reply || reply->type != REDIS_REPLY_INTEGER) {
        return false;
    }
    if (!is_positive_integer(
            execute_locked({"EXPIRE", key, std::to_string(GLOBAL_COUNTER_TTL.count())}).get())) {
        POOLHUB_LOG_DEBUG(LOG_CAT, "Could not refresh TTL of " << key);
    }
    return true;
}

}  // namespace poolhub::core::coordinator
