#include "util.hpp"

#include <cstdio>
#include <filesystem>
#include <memory>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "log.hpp"

namespace fs = std::filesystem;

std::string errnoToString(int err)
{
    return std::make_error_code(static_cast<std::errc>(err)).message();
}

std::optional<std::string> readFile(const std::string& path)
{
    auto f = std::unique_ptr<FILE, decltype(&std::fclose)>(
        std::fopen(path.c_str(), "rb"), &std::fclose);
    if (!f) {
        slog::error("Could not open file: '", path, "'");
        return std::nullopt;
    }

    const auto fd = ::fileno(f.get());
    if (fd == -1) {
        slog::error("Could not retrieve file descriptor for file: '", path, "'");
        return std::nullopt;
    }

    struct ::stat st;
    if (::fstat(fd, &st)) {
        slog::error("Could not stat file: '", path, "'");
        return std::nullopt;
    }

    // fopen-ing a directory in read-only mode will actually not fail!
    // And it will return a size of 0x7fffffffffffffff, which is bad.
    if (!S_ISREG(st.st_mode)) {
        slog::error("'", path, "' is not a regular file");
        return std::nullopt;
    }

    std::string buf(static_cast<size_t>(st.st_size), '\0');
    if (std::fread(buf.data(), 1, buf.size(), f.get()) != buf.size()) {
        slog::error("Error reading file: '", path, "'");
        return std::nullopt;
    }
    return buf;
}

bool writeFile(const std::string& path, std::string_view contents, bool privateFile)
{
    const auto tmpPath = path + ".tmp";
    const auto fd = ::open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
        privateFile ? 0600 : 0644);
    if (fd == -1) {
        slog::error("Could not open '", tmpPath, "' for writing: ", errnoToString(errno));
        return false;
    }

    size_t cursor = 0;
    while (cursor < contents.size()) {
        const auto res = ::write(fd, contents.data() + cursor, contents.size() - cursor);
        if (res < 0) {
            if (errno == EINTR) {
                continue;
            }
            slog::error("Could not write '", tmpPath, "': ", errnoToString(errno));
            ::close(fd);
            return false;
        }
        cursor += static_cast<size_t>(res);
    }

    if (::fsync(fd) != 0) {
        slog::error("Could not sync '", tmpPath, "': ", errnoToString(errno));
        ::close(fd);
        return false;
    }
    if (::close(fd) != 0) {
        slog::error("Could not close '", tmpPath, "': ", errnoToString(errno));
        return false;
    }

    if (::rename(tmpPath.c_str(), path.c_str()) != 0) {
        slog::error("Could not rename '", tmpPath, "' to '", path, "': ", errnoToString(errno));
        return false;
    }
    return true;
}

bool prepareDirectories(const std::string& path)
{
    const auto dir = fs::path(path).parent_path();
    if (dir.empty()) {
        return true;
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        slog::error("Could not create directories '", dir.string(), "': ", ec.message());
        return false;
    }
    return true;
}
