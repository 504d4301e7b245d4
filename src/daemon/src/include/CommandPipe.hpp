/*
 * bctd — Command pipe (named FIFO the daemon reads requests from)
 * (c) 2025 bctd contributors
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <signal.h>
#include <sys/types.h>

namespace bct {

class CommandPipe {
public:
    enum class ReadStatus {
        Line,         // `line` holds one request, newline stripped
        Eof,          // last writer went away; the next call reopens
        Interrupted,  // a signal arrived while waiting
        Error         // *err says why; the descriptor has been dropped
    };

    /* Longest line buffered before it is handed out unterminated. */
    static constexpr size_t kMaxLineBytes = 1024;

    CommandPipe(std::string path, mode_t mode,
                std::optional<uid_t> uid, std::optional<gid_t> gid);
    ~CommandPipe();

    CommandPipe(const CommandPipe&) = delete;
    CommandPipe& operator=(const CommandPipe&) = delete;

    /*
     * Create the FIFO if missing, refuse any other file type (symlinks
     * included) at the path, then apply owner/group/mode. Runs on every start so the pipe converges
     * to the configured policy.
     */
    bool ensure(std::string* err);

    /*
     * Waits until a full line, end-of-stream, a signal or an error. While
     * waiting the signal mask is `waitMask` (nullptr: leave it unchanged).
     */
    ReadStatus nextLine(std::string& line, std::string* err,
                        const sigset_t* waitMask = nullptr);

    /* Drop the read descriptor and any partial line. */
    void close();

    const std::string& path() const noexcept { return path_; }
    bool isOpen() const noexcept { return fd_ >= 0; }

private:
    bool takeBufferedLine(std::string& line);

    std::string          path_;
    mode_t               mode_;
    std::optional<uid_t> uid_;
    std::optional<gid_t> gid_;

    int         fd_{-1};
    std::string buf_;
};

} // namespace bct
