#pragma once

#include <cstdarg>
#include <cstdint>
#include <string>
#include <functional>
#include <vector>
#if !WIN32
#include <pthread.h>
#endif

namespace sdlmodel {

    class Logger {
    public:
        class Impl;

#undef ERROR
        enum LogLevel {
            DIAGNOSTIC,
            INFO,
            WARNING,
            ERROR
        };

        static Logger* global();
        void logError(const char* format, ...);
        void logWarning(const char* format, ...);
        void logInfo(const char* format, ...);
        void logDiagnostic(const char* format, ...);
        static void stopDefaultLogger();

        // Routes SDL_Log* output into the global logger.
        static void captureSdlLogOutput();

        Logger();
        ~Logger();

        void log(LogLevel level, const char* format, ...);
        void logv(LogLevel level, const char* format, va_list args);

        std::vector<std::function<void(LogLevel level, size_t serial, const char* s)>> callbacks;

    private:
        Impl *impl{nullptr};
    };

    inline void setCurrentThreadNameIfPossible(std::string const threadName) {
#if __APPLE__
        pthread_setname_np(threadName.c_str());
#elif defined(__unix__)
        pthread_setname_np(pthread_self(), threadName.c_str());
#endif
    }

}
