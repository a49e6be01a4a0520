#include <iostream>
#include <sdlmodel/sdlmodel.hpp>
#include <rtlog/rtlog.h>
#include <SDL3/SDL_log.h>

constexpr auto MAX_NUM_LOG_MESSAGES = 128;
constexpr auto MAX_LOG_MESSAGE_LENGTH = 1024;

static std::atomic<std::size_t> log_serial{ 0 };

struct LogContext {
    sdlmodel::Logger::LogLevel level;
    const sdlmodel::Logger* owner;
    const void* logger;
};

using RealtimeLogger = rtlog::Logger<LogContext, MAX_NUM_LOG_MESSAGES, MAX_LOG_MESSAGE_LENGTH, log_serial, rtlog::MultiRealtimeWriterQueueType>;
static RealtimeLogger rt_logger;

void sdlmodel::Logger::log(LogLevel level, const char *format, ...) {
    va_list args;
    va_start(args, format);
    logv(level, format, args);
    va_end(args);
}

class CallbackMessageFunctor
{
public:
    CallbackMessageFunctor() = default;
    CallbackMessageFunctor(const CallbackMessageFunctor&) = delete;
    CallbackMessageFunctor(CallbackMessageFunctor&&) = delete;
    CallbackMessageFunctor& operator=(const CallbackMessageFunctor&) = delete;
    CallbackMessageFunctor& operator=(CallbackMessageFunctor&&) = delete;

#if WIN32
    void operator()(const LogContext& data, size_t serial, const char* format, ...)
#else
    void operator()(const LogContext& data, size_t serial, const char* format, ...) __attribute__ ((format (printf, 4, 5)))
#endif
    {
        std::array<char, MAX_LOG_MESSAGE_LENGTH> buffer;

        va_list args;
        va_start(args, format);
        vsnprintf(buffer.data(), buffer.size(), format, args);
        va_end(args);
        for (auto& func : data.owner->callbacks) {
            func(data.level, serial, buffer.data());
        }
    }
};

static CallbackMessageFunctor ForwardToCallbacks;

rtlog::LogProcessingThread<RealtimeLogger, CallbackMessageFunctor>* getLaunchedLoggerThread() {
    static rtlog::LogProcessingThread thread(rt_logger, ForwardToCallbacks, std::chrono::milliseconds(10));
    return &thread;
}

class sdlmodel::Logger::Impl {
    Logger* owner;

public:
    explicit Impl(Logger* owner) :
        owner(owner) {
        initializeGlobalLogger();
    }
    ~Impl() {
        getLaunchedLoggerThread()->Stop();
    }

    void initializeGlobalLogger();

    void logv(LogLevel level, const char *format, va_list args) {
        rt_logger.Logv(LogContext{.level = level, .owner = owner, .logger = &rt_logger}, format, args);
    }
};


sdlmodel::Logger::Logger() {
    impl = new Impl(this);
}

sdlmodel::Logger::~Logger() {
    delete impl;
}

static const char* levelString(sdlmodel::Logger::LogLevel level) {
    switch (level) {
        case sdlmodel::Logger::LogLevel::INFO: return "I";
        case sdlmodel::Logger::LogLevel::WARNING: return "W";
        case sdlmodel::Logger::LogLevel::ERROR: return "E";
        case sdlmodel::Logger::LogLevel::DIAGNOSTIC: return "D";
    }
    return "";
}

void sdlmodel::Logger::Impl::initializeGlobalLogger() {
    static std::atomic<bool> loggerInitialized{false};

    if (!loggerInitialized.exchange(true)) {
        owner->callbacks.emplace_back([](sdlmodel::Logger::LogLevel level, size_t serial, const char* s) {
            switch (level) {
                // too much by default
                case LogLevel::DIAGNOSTIC: break;
                default:
                    std::cerr << "[sdlmodel #" << serial << " (" << levelString(level) << ")]: " << s << std::endl;
                    break;
            }
        });
        getLaunchedLoggerThread();
    }
}

void sdlmodel::Logger::logv(LogLevel level, const char *format, va_list args) {
    impl->logv(level, format, args);
}

void sdlmodel::Logger::stopDefaultLogger() {
    getLaunchedLoggerThread()->Stop();
}

static sdlmodel::Logger::LogLevel convertFromSdlLogPriority(SDL_LogPriority priority) {
    switch (priority) {
        case SDL_LOG_PRIORITY_CRITICAL:
        case SDL_LOG_PRIORITY_ERROR: return sdlmodel::Logger::LogLevel::ERROR;
        case SDL_LOG_PRIORITY_WARN: return sdlmodel::Logger::LogLevel::WARNING;
        case SDL_LOG_PRIORITY_INFO: return sdlmodel::Logger::LogLevel::INFO;
        default: return sdlmodel::Logger::LogLevel::DIAGNOSTIC;
    }
}

static void on_sdl_log(void* userData, int category, SDL_LogPriority priority, const char* message) {
    auto logger = static_cast<sdlmodel::Logger*>(userData);
    logger->log(convertFromSdlLogPriority(priority), "SDL(%d): %s", category, message);
}

void sdlmodel::Logger::captureSdlLogOutput() {
    SDL_SetLogOutputFunction(on_sdl_log, global());
}

#define DEFINE_DEFAULT_LOGGER(UPPER, CAMEL) \
void sdlmodel::Logger::log##CAMEL(const char *format, ...) { \
va_list args; \
va_start(args, format); \
impl->logv(UPPER, format, args); \
va_end(args); \
}

DEFINE_DEFAULT_LOGGER(ERROR , Error)
DEFINE_DEFAULT_LOGGER(WARNING , Warning)
DEFINE_DEFAULT_LOGGER(INFO , Info)
DEFINE_DEFAULT_LOGGER(DIAGNOSTIC , Diagnostic)


static sdlmodel::Logger instance{};
sdlmodel::Logger* sdlmodel::Logger::global() {
    return &instance;
}
