/*
 * bctd — Command pipe
 * (c) 2025 bctd contributors
 *
 * The FIFO is opened O_RDONLY|O_NONBLOCK and waited on with ppoll(). A fresh
 * descriptor reports nothing until a writer shows up; once every writer has
 * closed it reports POLLHUP and read() returns 0. Each `echo 40 > pipe` is
 * therefore one open/poll/read/EOF cycle; the descriptor is dropped at EOF and
 * the next nextLine() call opens a new one.
 *
 * The stop signals stay blocked outside ppoll() and are only unblocked by its
 * mask, so a signal that arrives before the wait still interrupts it.
 */

#include "include/CommandPipe.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <cerrno>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>

namespace bct {

static const char* fileTypeName(mode_t m) {
    if (S_ISREG(m))  return "regular file";
    if (S_ISDIR(m))  return "directory";
    if (S_ISLNK(m))  return "symlink";
    if (S_ISSOCK(m)) return "socket";
    if (S_ISCHR(m))  return "character device";
    if (S_ISBLK(m))  return "block device";
    if (S_ISFIFO(m)) return "fifo";
    return "unknown";
}

CommandPipe::CommandPipe(std::string path, mode_t mode,
                         std::optional<uid_t> uid, std::optional<gid_t> gid)
    : path_(std::move(path)),
      mode_(mode),
      uid_(uid),
      gid_(gid) {}

CommandPipe::~CommandPipe() {
    close();
}

bool CommandPipe::ensure(std::string* err) {
    auto fail = [&](const std::string& m) { if (err) *err = m; return false; };

    // lstat: a symlink here would send chown/chmod to its target.
    struct stat st{};
    if (::lstat(path_.c_str(), &st) == 0) {
        if (!S_ISFIFO(st.st_mode)) {
            return fail(path_ + " exists and is a " + fileTypeName(st.st_mode) + ", not a FIFO");
        }
        LOG_DEBUG("pipe: %s exists (owner %u:%u mode %s)", path_.c_str(),
                  static_cast<unsigned>(st.st_uid), static_cast<unsigned>(st.st_gid),
                  util::formatOctalMode(st.st_mode & 07777).c_str());
    } else if (errno == ENOENT) {
        if (::mkfifo(path_.c_str(), mode_) != 0) {
            return fail("mkfifo " + path_ + ": " + util::errnoString(errno));
        }
        LOG_INFO("pipe: created %s", path_.c_str());
    } else {
        return fail("lstat " + path_ + ": " + util::errnoString(errno));
    }

    if (uid_ || gid_) {
        const uid_t u = uid_ ? *uid_ : static_cast<uid_t>(-1);
        const gid_t g = gid_ ? *gid_ : static_cast<gid_t>(-1);
        if (::chown(path_.c_str(), u, g) != 0) {
            return fail("chown " + path_ + ": " + util::errnoString(errno));
        }
        LOG_INFO("pipe: owner set to %s:%s",
                 uid_ ? std::to_string(*uid_).c_str() : "-",
                 gid_ ? std::to_string(*gid_).c_str() : "-");
    }

    // mkfifo() honours the umask; chmod() does not.
    if (::chmod(path_.c_str(), mode_) != 0) {
        return fail("chmod " + path_ + ": " + util::errnoString(errno));
    }
    LOG_DEBUG("pipe: mode set to %s", util::formatOctalMode(mode_).c_str());
    return true;
}

void CommandPipe::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    buf_.clear();
}

bool CommandPipe::takeBufferedLine(std::string& line) {
    const size_t nl = buf_.find('\n');
    if (nl == std::string::npos) {
        if (buf_.size() < kMaxLineBytes) return false;
        line.swap(buf_);
        buf_.clear();
    } else {
        line.assign(buf_, 0, nl);
        buf_.erase(0, nl + 1);
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

CommandPipe::ReadStatus CommandPipe::nextLine(std::string& line, std::string* err,
                                              const sigset_t* waitMask) {
    for (;;) {
        if (takeBufferedLine(line)) return ReadStatus::Line;

        if (fd_ < 0) {
            const int fd = ::open(path_.c_str(), O_RDONLY | O_NONBLOCK | O_NOFOLLOW | O_CLOEXEC);
            if (fd < 0) {
                if (errno == EINTR) return ReadStatus::Interrupted;
                if (err) *err = "open " + path_ + ": " + util::errnoString(errno);
                return ReadStatus::Error;
            }
            struct stat st{};
            if (::fstat(fd, &st) != 0 || !S_ISFIFO(st.st_mode)) {
                ::close(fd);
                if (err) *err = path_ + " is no longer a FIFO";
                return ReadStatus::Error;
            }
            fd_ = fd;
            LOG_TRACE("pipe: opened, waiting for a writer");
        }

        struct pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        if (::ppoll(&pfd, 1, nullptr, waitMask) < 0) {
            if (errno == EINTR) return ReadStatus::Interrupted;
            if (err) *err = "poll " + path_ + ": " + util::errnoString(errno);
            close();
            return ReadStatus::Error;
        }

        char chunk[256];
        const ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buf_.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            ::close(fd_);
            fd_ = -1;
            // An unterminated last line still counts; it must not be glued
            // to whatever the next writer sends.
            if (!buf_.empty() && buf_.back() != '\n') buf_.push_back('\n');
            if (takeBufferedLine(line)) return ReadStatus::Line;
            return ReadStatus::Eof;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
        if (errno == EINTR) return ReadStatus::Interrupted;
        if (err) *err = "read " + path_ + ": " + util::errnoString(errno);
        close();
        return ReadStatus::Error;
    }
}

} // namespace bct
