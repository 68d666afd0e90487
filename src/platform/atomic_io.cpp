#include "vtm/platform.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#endif

namespace vtm {

namespace fs = std::filesystem;

namespace {

#ifndef _WIN32
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}
#endif

// Sibling temp name so the final rename never crosses a filesystem
std::string temp_path_for(const std::string& path) {
    static const char kHex[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string name = path + ".vtm-tmp-";
    for (int i = 0; i < 8; ++i) {
        name += kHex[dis(gen)];
    }
    return name;
}

// Removes the temp file unless the write was committed
class TempFileGuard {
public:
    explicit TempFileGuard(std::string path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        if (!committed_) std::remove(path_.c_str());
    }
    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    const std::string& path() const { return path_; }
    void commit() { committed_ = true; }

private:
    std::string path_;
    bool committed_ = false;
};

#ifndef _WIN32
std::string write_all(int fd, const std::string& content) {
    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::string("write failed: ") + strerror(errno);
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
    return "";
}
#endif

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;
    TempFileGuard temp(temp_path_for(path));

#ifdef _WIN32
    {
        std::ofstream out(temp.path(), std::ios::binary);
        if (!out.write(content.data(), static_cast<std::streamsize>(content.size()))) {
            result.error = "cannot write temp file " + temp.path();
            return result;
        }
    }
    if (!MoveFileExA(temp.path().c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        result.error = "cannot replace " + path;
        return result;
    }
#else
    int fd = open(temp.path().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "cannot create temp file: " + std::string(strerror(errno));
        return result;
    }

    std::string write_error = write_all(fd, content);
    bool synced = write_error.empty() && fsync_fd(fd);
    close(fd);
    if (!write_error.empty()) {
        result.error = write_error;
        return result;
    }
    if (!synced) {
        result.error = "fsync failed for " + temp.path();
        return result;
    }

    if (std::rename(temp.path().c_str(), path.c_str()) != 0) {
        result.error = "cannot replace " + path + ": " + strerror(errno);
        return result;
    }

    std::string dir_path = get_parent_directory(path);
    fsync_directory(dir_path.empty() ? "." : dir_path);
#endif

    temp.commit();
    result.ok = true;
    return result;
}

AtomicWriteResult atomic_create_directory(const std::string& path) {
    AtomicWriteResult result;

    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        result.error = ec.message();
        return result;
    }

#ifndef _WIN32
    std::string parent = get_parent_directory(path);
    if (!parent.empty()) {
        fsync_directory(parent);
    }
#endif

    result.ok = true;
    return result;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    if (base.empty()) return rel;
    fs::path p(base);
    p /= rel;
    return p.string();
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;

    std::error_code ec;
    if (!fs::is_directory(path, ec)) return entries;

    for (const auto& entry : fs::directory_iterator(path, ec)) {
        entries.push_back(entry.path().filename().string());
    }

    return entries;
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

bool remove_empty_directory(const std::string& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec) || !fs::is_empty(path, ec)) return false;
    return fs::remove(path, ec);
}

std::optional<std::uintmax_t> file_size(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return size;
}

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

namespace {

std::tm to_utc_tm(std::chrono::system_clock::time_point tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm_buf);
#endif
    return tm_buf;
}

} // namespace

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    std::tm tm_buf = to_utc_tm(tp);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

std::string format_date(std::chrono::system_clock::time_point tp) {
    std::tm tm_buf = to_utc_tm(tp);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm_buf);
    return buf;
}

std::string get_current_timestamp() {
    return format_timestamp(std::chrono::system_clock::now());
}

std::optional<std::chrono::system_clock::time_point> parse_timestamp(const std::string& s) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d",
                    &year, &month, &day, &hour, &minute, &second) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;

#ifdef _WIN32
    std::time_t t = _mkgmtime(&tm_buf);
#else
    std::time_t t = timegm(&tm_buf);
#endif
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t);
}

} // namespace vtm
