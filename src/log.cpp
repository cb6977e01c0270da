#include "log.hpp"

#include <array>
#include <atomic>
#include <cassert>
#include <cstdlib>
#include <ctime>
#include <thread>

#include <unistd.h>

#include "mpscqueue.hpp"

namespace slog {
namespace {
    MpscQueue<std::string>& logQueue()
    {
        static MpscQueue<std::string> queue;
        return queue;
    }

    std::atomic<bool>& logThreadRunning()
    {
        static std::atomic<bool> running;
        return running;
    }

    std::thread& logThread()
    {
        static std::thread t;
        return t;
    }

    void writeLine(const std::string& line)
    {
        [[maybe_unused]] auto ignore = ::write(STDERR_FILENO, line.data(), line.size());
    }

    void logThreadFunc()
    {
        auto& queue = logQueue();
        auto& running = logThreadRunning();
        while (true) {
            const auto line = queue.consume();
            if (!line) {
                if (!running.load()) {
                    return;
                }
                ::usleep(100);
                continue;
            }
            writeLine(*line);
        }
    }

    void logAtExit()
    {
        logThreadRunning().store(false);
        logThread().join();
        // Whatever got queued after the thread saw running = false
        while (auto line = logQueue().consume()) {
            writeLine(*line);
        }
    }

    bool& logThreadStarted()
    {
        static bool started = false;
        return started;
    }

    std::string quoteIfNeeded(const std::string& value)
    {
        if (!value.empty() && value.find_first_of(" \"=") == std::string::npos) {
            return value;
        }
        std::string ret = "\"";
        for (const auto ch : value) {
            if (ch == '"' || ch == '\\') {
                ret.push_back('\\');
            }
            ret.push_back(ch);
        }
        ret.push_back('"');
        return ret;
    }
}

std::string_view toString(Severity severity)
{
    static constexpr std::array strings { "DEBUG", "INFO", "WARNING", "ERROR", "FATAL" };
    const auto idx = static_cast<int>(severity);
    if (idx < 0 || static_cast<size_t>(idx) >= strings.size()) {
        return "INVALID";
    }
    return strings[idx];
}

void setLogLevel(Severity severity)
{
    detail::getCurrentLogLevel() = severity;
}

void init(Severity severity)
{
    // Check that thread is default-constructed (not running yet)
    assert(logThread().get_id() == std::thread::id());
    setLogLevel(severity);
    logThreadRunning().store(true);
    logThread() = std::thread { logThreadFunc };
    logThreadStarted() = true;
    std::atexit(logAtExit);
}

namespace detail {
    StringStreamBuf::StringStreamBuf(size_t initialSize)
        : str_(initialSize, 0)
    {
        str_.resize(0);
    }

    std::streamsize StringStreamBuf::xsputn(const char* s, std::streamsize n)
    {
        str_.append(s, n);
        return n;
    }

    void StringStreamBuf::clear()
    {
        str_.clear();
    }

    std::string& StringStreamBuf::string()
    {
        return str_;
    }

    Severity& getCurrentLogLevel()
    {
        static Severity severity = Severity::Info;
        return severity;
    }

    void replaceDateTime(char* buffer, size_t size, const char* format)
    {
        const auto t = std::time(nullptr);
        ::tm lt;
        ::localtime_r(&t, &lt);
        [[maybe_unused]] const auto n = std::strftime(buffer, size, format, &lt);
        assert(n > 0);
    }

    void log(std::string str)
    {
        if (!logThreadStarted()) {
            writeLine(str);
            return;
        }
        logQueue().produce(std::move(str));
    }
}

LogRecorder::LogRecorder(std::string prefix, Severity severity)
    : prefix_(std::move(prefix))
    , severity_(severity)
{
}

void LogRecorder::record(std::string_view event, const Fields& fields)
{
    if (static_cast<int>(severity_) < static_cast<int>(detail::getCurrentLogLevel())) {
        return;
    }
    std::string line = prefix_;
    line.append(event);
    for (const auto& [key, value] : fields) {
        line.append(" ");
        line.append(key);
        line.append("=");
        line.append(quoteIfNeeded(value));
    }
    detail::log(severity_, toString(severity_), line);
}

LogRecorder& LogRecorder::getDefault()
{
    static LogRecorder recorder("ACME: ");
    return recorder;
}
}
