#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace slog {
enum class Severity { Debug, Info, Warning, Error, Fatal };

void init(Severity severity = Severity::Info);
void setLogLevel(Severity severity);
std::string_view toString(Severity severity);

namespace detail {
    // We use a custom string buf, so we can preallocate and clear to reuse the same buffer
    class StringStreamBuf : public std::streambuf {
    public:
        StringStreamBuf(size_t initialSize);

        std::streamsize xsputn(const char* s, std::streamsize n) override;

        void clear();
        std::string& string();

    private:
        std::string str_;
    };

    Severity& getCurrentLogLevel();

    void replaceDateTime(char* buffer, size_t size, const char* format);

    void log(std::string str);

    // This is thread-safe. Lines are formatted on the calling thread and written out by the log
    // thread (or synchronously if init has not been called, e.g. in tests).
    template <typename... Args>
    void log(Severity severity, std::string_view severityStr, Args&&... args)
    {
        if (static_cast<int>(severity) < static_cast<int>(getCurrentLogLevel())) {
            return;
        }
        thread_local StringStreamBuf buf(1024);
        thread_local std::ostream os(&buf);
        buf.clear();
        static constexpr std::string_view dtDummy = "YYYY-mm-dd HH:MM:SS";
        (os << "[" << dtDummy << "] [" << severityStr << "] " << ... << args) << "\n";
        replaceDateTime(buf.string().data() + 1, dtDummy.size() + 1, "%F %T");
        //  Restore the char that was overwritten with null by strftime (so silly)
        buf.string().data()[1 + dtDummy.size()] = ']';
        log(buf.string());
    }
}

template <typename... Args>
void debug(Args&&... args)
{
    detail::log(Severity::Debug, "DEBUG", std::forward<Args>(args)...);
}

template <typename... Args>
void info(Args&&... args)
{
    detail::log(Severity::Info, "INFO", std::forward<Args>(args)...);
}

template <typename... Args>
void warning(Args&&... args)
{
    detail::log(Severity::Warning, "WARNING", std::forward<Args>(args)...);
}

template <typename... Args>
void error(Args&&... args)
{
    detail::log(Severity::Error, "ERROR", std::forward<Args>(args)...);
}

template <typename... Args>
void fatal(Args&&... args)
{
    detail::log(Severity::Fatal, "FATAL", std::forward<Args>(args)...);
}

using Fields = std::vector<std::pair<std::string_view, std::string>>;

// Structured diagnostic events (an event name plus key/value pairs). Components that emit
// these take a Recorder& so tests can capture them and the CLI can route them to the log.
class Recorder {
public:
    virtual ~Recorder() = default;

    virtual void record(std::string_view event, const Fields& fields) = 0;
};

// Writes "<event> key=value key=value" to the log
class LogRecorder : public Recorder {
public:
    LogRecorder(std::string prefix, Severity severity = Severity::Debug);

    void record(std::string_view event, const Fields& fields) override;

    static LogRecorder& getDefault();

private:
    std::string prefix_;
    Severity severity_;
};

class NullRecorder : public Recorder {
public:
    void record(std::string_view, const Fields&) override { }
};
}
