#include "flycache/cache/redis/RedisConnection.hpp"
#include "flycache/logging/Logging.hpp"
#include <cerrno>
#include <cstring>
#include <thread>
#include <poll.h>
#include <sys/time.h>
#include <hiredis/hiredis.h>

namespace flycache {
namespace cache {

namespace {

const char* kLoggerName = "redisconnection";
const char* kAdapterName = "RedisAdapter";

struct ReplyDeleter {
    void operator()(redisReply* reply) const {
        if (reply) freeReplyObject(reply);
    }
};
using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

timeval toTimeval(std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return tv;
}

// Аргументы команды в формате argv/argvlen для hiredis
struct ArgvView {
    std::vector<const char*> argv;
    std::vector<size_t> lengths;

    explicit ArgvView(const std::vector<std::string>& args) {
        argv.reserve(args.size());
        lengths.reserve(args.size());
        for (const auto& arg : args) {
            argv.push_back(arg.data());
            lengths.push_back(arg.size());
        }
    }
    int argc() const { return static_cast<int>(argv.size()); }
};

RedisReply convertReply(const redisReply* reply) {
    RedisReply result;
    if (!reply) {
        return result;
    }

    switch (reply->type) {
        case REDIS_REPLY_STRING:
            result.type = RedisReply::Type::String;
            break;
        case REDIS_REPLY_STATUS:
            result.type = RedisReply::Type::Status;
            break;
        case REDIS_REPLY_ERROR:
            result.type = RedisReply::Type::Error;
            break;
        case REDIS_REPLY_INTEGER:
            result.type = RedisReply::Type::Integer;
            break;
        case REDIS_REPLY_NIL:
            result.type = RedisReply::Type::Nil;
            break;
        case REDIS_REPLY_ARRAY:
            result.type = RedisReply::Type::Array;
            break;
        default:
            // Типы RESP3 приводятся к ближайшему RESP2-представлению
            result.type = reply->elements > 0 ? RedisReply::Type::Array
                        : reply->str          ? RedisReply::Type::String
                                              : RedisReply::Type::Integer;
            break;
    }

    if (reply->str) {
        result.str.assign(reply->str, reply->len);
    }
    result.integer = reply->integer;
    for (size_t i = 0; i < reply->elements; ++i) {
        result.elements.push_back(convertReply(reply->element[i]));
    }
    return result;
}

// Компонент, от имени которого сообщаются ошибки соединения
const char* componentFor(const std::string& role) {
    return role == "command" ? kAdapterName : "RedisPubSub";
}

std::string commandName(const std::vector<std::string>& args) {
    return args.empty() ? std::string{} : args.front();
}

} // namespace

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Reconnecting: return "reconnecting";
    }
    return "unknown";
}

void RedisConnection::ContextDeleter::operator()(redisContext* context) const {
    if (context) redisFree(context);
}

RedisConnection::RedisConnection(RedisAdapterConfig config, std::string role)
    : config_(std::move(config))
    , retryStrategy_(config_.effectiveRetryStrategy())
    , role_(std::move(role)) {
    if (!config_.validate()) {
        throw ValidationError("Invalid Redis connection configuration", "config",
                              "host non-empty, 0 < port <= 65535, db >= 0, timeouts > 0",
                              componentFor(role_));
    }
}

RedisConnection::~RedisConnection() {
    disconnect();
}

void RedisConnection::connect() {
    throwIfClosed();

    std::lock_guard<std::mutex> lock(mutex_);
    if (context_) {
        return;
    }
    connectWithRetryLocked(everConnected_ ? ConnectionState::Reconnecting
                                          : ConnectionState::Connecting);
}

void RedisConnection::disconnect() {
    if (closed_.exchange(true)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (context_) {
        // QUIT без ожидания ответа: соединение закрывается в любом случае
        ArgvView quit({"QUIT"});
        redisAppendCommandArgv(context_.get(), quit.argc(), quit.argv.data(), quit.lengths.data());
        int done = 0;
        redisBufferWrite(context_.get(), &done);
    }
    dropContextLocked();
    state_ = ConnectionState::Disconnected;

    logging::getLogger(kLoggerName)->info("Redis {} connection to {}:{} closed",
                                          role_, config_.host, config_.port);
}

RedisReply RedisConnection::command(const std::vector<std::string>& args, const std::string& method,
                                    const std::string& key, std::optional<double> ttl) {
    throwIfClosed();
    if (!config_.enableOfflineQueue && state_ != ConnectionState::Connected) {
        throw connectionError("Redis connection is not ready", "offline queue disabled");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ArgvView view(args);

    for (unsigned retry = 0;; ++retry) {
        ensureConnectedLocked();

        ReplyPtr reply(static_cast<redisReply*>(
            redisCommandArgv(context_.get(), view.argc(), view.argv.data(), view.lengths.data())));
        if (reply) {
            RedisReply result = convertReply(reply.get());
            if (result.isError()) {
                throw OperationError("Redis " + commandName(args) + " operation failed",
                                     method, key, ttl, result.str, componentFor(role_));
            }
            return result;
        }

        const std::string reason = context_->errstr;
        dropContextLocked();
        state_ = ConnectionState::Reconnecting;
        logging::getLogger(kLoggerName)->warn("Redis {} transport error on {}: {} (retry {}/{})",
                                              role_, commandName(args), reason, retry,
                                              config_.maxRetriesPerRequest);

        if (retry >= config_.maxRetriesPerRequest) {
            throw OperationError("Redis " + commandName(args) + " operation failed",
                                 method, key, ttl, reason, componentFor(role_));
        }
    }
}

std::vector<RedisReply> RedisConnection::pipeline(const std::vector<std::vector<std::string>>& commands,
                                                  const std::string& method) {
    if (commands.empty()) {
        return {};
    }

    throwIfClosed();
    if (!config_.enableOfflineQueue && state_ != ConnectionState::Connected) {
        throw connectionError("Redis connection is not ready", "offline queue disabled");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string batch = std::to_string(commands.size()) + " commands";

    for (unsigned retry = 0;; ++retry) {
        ensureConnectedLocked();

        bool transportOk = true;
        for (const auto& args : commands) {
            ArgvView view(args);
            if (redisAppendCommandArgv(context_.get(), view.argc(), view.argv.data(),
                                       view.lengths.data()) != REDIS_OK) {
                transportOk = false;
                break;
            }
        }

        std::vector<RedisReply> replies;
        std::string firstError;
        if (transportOk) {
            replies.reserve(commands.size());
            for (size_t i = 0; i < commands.size(); ++i) {
                void* raw = nullptr;
                if (redisGetReply(context_.get(), &raw) != REDIS_OK) {
                    transportOk = false;
                    break;
                }
                ReplyPtr reply(static_cast<redisReply*>(raw));
                replies.push_back(convertReply(reply.get()));
                if (replies.back().isError() && firstError.empty()) {
                    firstError = replies.back().str;
                }
            }
        }

        if (transportOk) {
            if (!firstError.empty()) {
                throw OperationError("Redis pipeline operation failed", method, batch,
                                     std::nullopt, firstError, componentFor(role_));
            }
            return replies;
        }

        const std::string reason = context_->errstr;
        dropContextLocked();
        state_ = ConnectionState::Reconnecting;
        logging::getLogger(kLoggerName)->warn("Redis {} transport error in pipeline: {} (retry {}/{})",
                                              role_, reason, retry, config_.maxRetriesPerRequest);

        if (retry >= config_.maxRetriesPerRequest) {
            throw OperationError("Redis pipeline operation failed", method, batch,
                                 std::nullopt, reason, componentFor(role_));
        }
    }
}

bool RedisConnection::trySend(const std::vector<std::string>& args) {
    if (closed_) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!context_) {
        return false;
    }

    ArgvView view(args);
    if (redisAppendCommandArgv(context_.get(), view.argc(), view.argv.data(),
                               view.lengths.data()) != REDIS_OK) {
        return false;
    }

    int done = 0;
    while (!done) {
        if (redisBufferWrite(context_.get(), &done) != REDIS_OK) {
            logging::getLogger(kLoggerName)->warn("Redis {} write failed on {}: {}",
                                                  role_, commandName(args), context_->errstr);
            dropContextLocked();
            state_ = ConnectionState::Reconnecting;
            return false;
        }
    }
    return true;
}

std::optional<RedisReply> RedisConnection::readPushed(std::chrono::milliseconds wait) {
    int fd = -1;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!context_) {
            throw connectionError("Redis subscriber is not connected", "no socket");
        }

        void* raw = nullptr;
        if (redisGetReplyFromReader(context_.get(), &raw) != REDIS_OK) {
            const std::string reason = context_->errstr;
            dropContextLocked();
            state_ = ConnectionState::Reconnecting;
            throw connectionError("Redis subscriber protocol error", reason);
        }
        if (raw) {
            ReplyPtr reply(static_cast<redisReply*>(raw));
            return convertReply(reply.get());
        }
        fd = context_->fd;
    }

    pollfd descriptor{};
    descriptor.fd = fd;
    descriptor.events = POLLIN;
    const int ready = ::poll(&descriptor, 1, static_cast<int>(wait.count()));
    if (ready == 0) {
        return std::nullopt;
    }
    if (ready < 0) {
        if (errno == EINTR) {
            return std::nullopt;
        }
        throw connectionError("Redis subscriber poll failed", std::strerror(errno));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // Контекст мог быть заменен, пока поток ждал в poll()
    if (!context_ || context_->fd != fd) {
        return std::nullopt;
    }

    if (redisBufferRead(context_.get()) != REDIS_OK) {
        const std::string reason = context_->errstr;
        dropContextLocked();
        state_ = ConnectionState::Reconnecting;
        throw connectionError("Redis subscriber connection lost", reason);
    }

    void* raw = nullptr;
    if (redisGetReplyFromReader(context_.get(), &raw) != REDIS_OK) {
        const std::string reason = context_->errstr;
        dropContextLocked();
        state_ = ConnectionState::Reconnecting;
        throw connectionError("Redis subscriber protocol error", reason);
    }
    if (!raw) {
        return std::nullopt;
    }
    ReplyPtr reply(static_cast<redisReply*>(raw));
    return convertReply(reply.get());
}

void RedisConnection::reconnect() {
    throwIfClosed();

    std::lock_guard<std::mutex> lock(mutex_);
    dropContextLocked();
    connectWithRetryLocked(ConnectionState::Reconnecting);
}

RedisConnection::ContextPtr RedisConnection::openOnce() {
    ContextPtr context(redisConnectWithTimeout(config_.host.c_str(), config_.port,
                                               toTimeval(config_.connectTimeout)));
    if (!context) {
        throw connectionError("Failed to connect to Redis", "cannot allocate redis context");
    }
    if (context->err) {
        throw connectionError("Failed to connect to Redis", context->errstr);
    }

    if (redisSetTimeout(context.get(), toTimeval(config_.commandTimeout)) != REDIS_OK) {
        throw connectionError("Failed to configure Redis connection", context->errstr);
    }

    auto handshake = [&](const std::vector<std::string>& args) {
        ArgvView view(args);
        ReplyPtr reply(static_cast<redisReply*>(
            redisCommandArgv(context.get(), view.argc(), view.argv.data(), view.lengths.data())));
        if (!reply) {
            throw connectionError("Redis " + args.front() + " failed", context->errstr);
        }
        RedisReply result = convertReply(reply.get());
        if (result.isError()) {
            throw connectionError("Redis " + args.front() + " rejected", result.str);
        }
        return result;
    };

    if (!config_.password.empty()) {
        if (config_.username.empty()) {
            handshake({"AUTH", config_.password});
        } else {
            handshake({"AUTH", config_.username, config_.password});
        }
    }
    if (config_.db != 0) {
        handshake({"SELECT", std::to_string(config_.db)});
    }

    const RedisReply pong = handshake({"PING"});
    if (pong.str != "PONG") {
        throw connectionError("Redis PING did not return PONG", pong.str);
    }
    return context;
}

void RedisConnection::connectWithRetryLocked(ConnectionState during) {
    auto logger = logging::getLogger(kLoggerName);
    state_ = during;

    for (unsigned attempt = 1;; ++attempt) {
        attempts_ = attempt;
        try {
            context_ = openOnce();
            state_ = ConnectionState::Connected;
            attempts_ = 0;
            everConnected_ = true;
            logger->info("Redis {} connection to {}:{} established (db {})",
                         role_, config_.host, config_.port, config_.db);
            return;
        } catch (const ConnectionError& e) {
            const auto delay = retryStrategy_(attempt);
            if (!delay) {
                state_ = ConnectionState::Disconnected;
                logger->error("Redis {} connection to {}:{} failed after {} attempts: {}",
                              role_, config_.host, config_.port, attempt, e.reason());
                throw connectionError("Failed to connect to Redis at " + config_.host + ":" +
                                      std::to_string(config_.port), e.reason());
            }

            logger->warn("Redis {} connection attempt {} failed: {}; retrying in {}ms",
                         role_, attempt, e.reason(), delay->count());

            // Ожидание короткими интервалами, чтобы disconnect() не ждал всю задержку
            const auto until = std::chrono::steady_clock::now() + *delay;
            while (std::chrono::steady_clock::now() < until) {
                if (closed_) {
                    state_ = ConnectionState::Disconnected;
                    throw connectionError("Redis connection closed", "disconnect() during reconnect");
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
    }
}

void RedisConnection::ensureConnectedLocked() {
    if (closed_) {
        throw connectionError("Redis connection closed", "disconnect() was called");
    }
    if (context_) {
        return;
    }
    if (!everConnected_) {
        throw connectionError("Redis connection not established", "connect() was not called");
    }
    connectWithRetryLocked(ConnectionState::Reconnecting);
}

void RedisConnection::dropContextLocked() {
    context_.reset();
}

void RedisConnection::throwIfClosed() const {
    if (closed_) {
        throw connectionError("Redis connection closed", "disconnect() was called");
    }
}

ConnectionError RedisConnection::connectionError(const std::string& message,
                                                 const std::string& reason) const {
    return ConnectionError(message, config_.host, config_.port, reason,
                           componentFor(role_));
}

} // namespace cache
} // namespace flycache
