#pragma once

#include <functional>
#include <atomic>
#include <mutex>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <array>
#include <format>
#include <chrono>

/*! Log forwarding for the engine wrapper libraries.
 *
 *  The wrappers don't link the application's logger. They write through this
 *  shim, and the application installs a callback that forwards each line
 *  into logfault. Without a callback, lines go to std::clog.
 */

namespace qdt::logfwd {

// Same order as logfault::LogLevel
enum class Level { NONE, ERROR, WARN, NOTICE, INFO, DEBUG, TRACE };

struct SourceLoc {
    const char* file{};
    int line{};
    const char* func{};
};

using callback_t = std::function<void(Level lvl, SourceLoc loc, std::string_view msg, std::string_view tag)>;

inline std::string_view to_name(Level l) {
    constexpr static auto names = std::to_array<std::string_view>({
        ""/* None*/, "ERROR", "WARN", "NOTICE", "INFO", "DEBUG", "TRACE"
    });

    return names.at(static_cast<size_t>(l));
}

} // ns

template <>
struct std::formatter<qdt::logfwd::Level> : std::formatter<std::string_view> {
    auto format(qdt::logfwd::Level l, std::format_context& ctx) const {
        return std::formatter<std::string_view>::format(qdt::logfwd::to_name(l), ctx);
    }
};

namespace qdt::logfwd {

struct Sink {
    std::mutex mutex;
    callback_t cb;
    std::string tag;
    std::atomic<Level> level{Level::INFO};
};

inline Sink& sink() {
    static Sink s;
    return s;
}

inline void setCallback(callback_t cb, std::string_view tag) {
    auto& s = sink();
    std::lock_guard lock{s.mutex};
    s.tag = tag;
    s.cb = std::move(cb);
}

inline void setLevel(Level lvl) noexcept {
    sink().level = lvl;
}

inline Level level() noexcept {
    return sink().level.load(std::memory_order_relaxed);
}

class Log {
public:
    Log(Level lvl, SourceLoc loc) : lvl_(lvl), loc_(loc) {}
    ~Log() { flush(); }

    std::ostream& Line() { return ss_; }

private:
    void flush() noexcept {
        const auto msg = ss_.str();
        if (msg.empty()) return;

        auto& s = sink();
        std::lock_guard lock{s.mutex};
        if (s.cb) {
            s.cb(lvl_, loc_, msg, s.tag);
            return;
        }

        std::clog << std::format("{:%FT%T} [{}] {} {}", std::chrono::system_clock::now(), lvl_, s.tag, msg)
                  << std::endl;
    }

    Level lvl_;
    SourceLoc loc_;
    std::ostringstream ss_;
};

#ifdef _LOGFAULT_H
inline void forwardToLogfault(Level lvl, SourceLoc loc, std::string_view msg, std::string_view tag) {
    const auto lf_level = static_cast<logfault::LogLevel>(lvl);
    if (::logfault::LogManager::Instance().IsRelevant(lf_level)) {
        ::logfault::Log(lf_level, loc.file, loc.line, loc.func).Line() << tag << ' ' << msg;
    }
}
#endif

} // namespace qdt::logfwd

#if defined(QDT_LOGFWD_ENABLE_LOGGING) && QDT_LOGFWD_ENABLE_LOGGING

#if defined(__GNUC__) || defined(__clang__)
#define QDT_LOGFWD_FUNC __PRETTY_FUNCTION__
#else
#define QDT_LOGFWD_FUNC __func__
#endif

#define QDT_LOGFWD_RELEVANT(lvl) \
    (lvl <= qdt::logfwd::level())

#define QDT_LOGFWD_LOG(lvl) \
    QDT_LOGFWD_RELEVANT(qdt::logfwd::Level::lvl) && qdt::logfwd::Log(qdt::logfwd::Level::lvl, {}).Line()

#define QDT_LOGFWD_LOG_N(lvl) \
    QDT_LOGFWD_RELEVANT(qdt::logfwd::Level::lvl) && qdt::logfwd::Log(qdt::logfwd::Level::lvl, {__FILE__, __LINE__, QDT_LOGFWD_FUNC}).Line()

#define LOG_ERROR  QDT_LOGFWD_LOG(ERROR)
#define LOG_WARN   QDT_LOGFWD_LOG(WARN)
#define LOG_INFO   QDT_LOGFWD_LOG(INFO)
#define LOG_DEBUG  QDT_LOGFWD_LOG(DEBUG)
#define LOG_TRACE  QDT_LOGFWD_LOG(TRACE)

#define LOG_ERROR_N  QDT_LOGFWD_LOG_N(ERROR)
#define LOG_WARN_N   QDT_LOGFWD_LOG_N(WARN)
#define LOG_INFO_N   QDT_LOGFWD_LOG_N(INFO)
#define LOG_DEBUG_N  QDT_LOGFWD_LOG_N(DEBUG)
#define LOG_TRACE_N  QDT_LOGFWD_LOG_N(TRACE)

#endif // QDT_LOGFWD_ENABLE_LOGGING
