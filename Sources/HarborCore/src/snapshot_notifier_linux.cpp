#include "harbor/snapshot_notifier.hpp"
#include "harbor/log.hpp"

#if defined(__linux__)

#include <sys/inotify.h>
#include <sys/select.h>
#include <unistd.h>
#include <fcntl.h>
#include <climits>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

namespace harbor {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // namespace

// Watches "<db>-snapshot" for IN_CLOSE_WRITE. A post rewrites the file with
// the origin instance id; the listener reads it back after each event.
class inotify_snapshot_notifier final : public snapshot_notifier {
public:
    explicit inotify_snapshot_notifier(const std::string& db_path)
        : signal_path_(db_path + "-snapshot") {
        int fd = open(signal_path_.c_str(), O_CREAT | O_WRONLY, 0644);
        if (fd < 0) {
            LOG_WARN("xproc", "Cannot create %s: %s", signal_path_.c_str(), strerror(errno));
        } else {
            close(fd);
        }
    }

    ~inotify_snapshot_notifier() override {
        unsubscribe();
    }

    void post(const std::string& origin_instance) override {
        int fd = open(signal_path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (fd < 0) {
            LOG_ERROR("xproc", "Failed to open %s: %s", signal_path_.c_str(), strerror(errno));
            return;
        }
        ssize_t written = write(fd, origin_instance.data(), origin_instance.size());
        if (written != static_cast<ssize_t>(origin_instance.size())) {
            LOG_WARN("xproc", "Short write to %s", signal_path_.c_str());
        }
        close(fd);
        LOG_DEBUG("xproc", "Posted snapshot notice from %s", origin_instance.c_str());
    }

    void subscribe(callback fn) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (subscribed_.load()) return;

        if (pipe(wake_pipe_) != 0) {
            LOG_ERROR("xproc", "pipe failed: %s", strerror(errno));
            return;
        }
        inotify_fd_ = inotify_init1(IN_CLOEXEC);
        if (inotify_fd_ < 0) {
            LOG_ERROR("xproc", "inotify_init1 failed: %s", strerror(errno));
            release_fds();
            return;
        }
        watch_fd_ = inotify_add_watch(inotify_fd_, signal_path_.c_str(), IN_CLOSE_WRITE);
        if (watch_fd_ < 0) {
            LOG_ERROR("xproc", "inotify_add_watch(%s) failed: %s", signal_path_.c_str(), strerror(errno));
            release_fds();
            return;
        }

        callback_ = std::move(fn);
        subscribed_.store(true);
        thread_ = std::thread([this] { run(); });
        LOG_DEBUG("xproc", "Watching %s", signal_path_.c_str());
    }

    void unsubscribe() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!subscribed_.exchange(false)) return;

        char byte = 0;
        if (write(wake_pipe_[1], &byte, 1) != 1) {
            LOG_WARN("xproc", "Failed to wake listener: %s", strerror(errno));
        }
        if (thread_.joinable()) {
            thread_.join();
        }
        if (watch_fd_ >= 0) {
            inotify_rm_watch(inotify_fd_, watch_fd_);
            watch_fd_ = -1;
        }
        release_fds();
        callback_ = nullptr;
    }

    [[nodiscard]] bool is_subscribed() const noexcept override {
        return subscribed_.load();
    }

private:
    void run() {
        char buf[sizeof(struct inotify_event) + NAME_MAX + 1];
        while (subscribed_.load()) {
            fd_set fds;
            FD_ZERO(&fds);
            FD_SET(inotify_fd_, &fds);
            FD_SET(wake_pipe_[0], &fds);

            int ret = select(std::max(inotify_fd_, wake_pipe_[0]) + 1, &fds, nullptr, nullptr, nullptr);
            if (ret < 0) {
                if (errno == EINTR) continue;
                LOG_ERROR("xproc", "select failed: %s", strerror(errno));
                break;
            }
            if (FD_ISSET(wake_pipe_[0], &fds)) {
                break;
            }
            if (FD_ISSET(inotify_fd_, &fds)) {
                if (read(inotify_fd_, buf, sizeof(buf)) > 0) {
                    deliver();
                }
            }
        }
    }

    void deliver() {
        std::string origin;
        int fd = open(signal_path_.c_str(), O_RDONLY);
        if (fd >= 0) {
            char chunk[128];
            ssize_t n;
            while ((n = read(fd, chunk, sizeof(chunk))) > 0) {
                origin.append(chunk, static_cast<size_t>(n));
            }
            close(fd);
        }
        if (callback_) {
            callback_(origin);
        }
    }

    void release_fds() {
        close_fd(inotify_fd_);
        close_fd(wake_pipe_[0]);
        close_fd(wake_pipe_[1]);
    }

    std::string signal_path_;
    std::mutex mutex_;
    int inotify_fd_ = -1;
    int watch_fd_ = -1;
    int wake_pipe_[2] = {-1, -1};
    std::atomic<bool> subscribed_{false};
    callback callback_;
    std::thread thread_;
};

std::unique_ptr<snapshot_notifier> make_snapshot_notifier(const std::string& db_path) {
    if (db_path.empty() || db_path == ":memory:") {
        return nullptr;
    }
    return std::make_unique<inotify_snapshot_notifier>(db_path);
}

} // namespace harbor

#else

namespace harbor {

std::unique_ptr<snapshot_notifier> make_snapshot_notifier(const std::string& db_path) {
    LOG_INFO("xproc", "No snapshot notifier on this platform (%s)", db_path.c_str());
    return nullptr;
}

} // namespace harbor

#endif
