#include "piperpc/connection.hpp"
#include "piperpc/errors.hpp"
#include "piperpc/log.hpp"

#include <algorithm>
#include <chrono>
#include <climits>
#include <csignal>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/wait.h>
#include <unistd.h>

namespace piperpc {

namespace {

std::string errno_message(const char * what, int err = errno) {
    return std::string(what) + ": " + std::strerror(err);
}

// writes to a peer that went away must fail with EPIPE instead of killing us
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, []() {
        ::signal(SIGPIPE, SIG_IGN);
    });
}

void set_nonblocking(int fd) {
    const int flags = fcntl(fd, F_GETFL);
    if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
        throw ConnectionError(errno_message("fcntl"));
    }
}

void close_fd(int & fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool wait_for_exit(pid_t pid, int timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        int status = 0;
        pid_t rc = waitpid(pid, &status, WNOHANG);
        if (rc == pid || (rc < 0 && errno == ECHILD)) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

} // namespace

const char * connection_state_name(connection_state state) {
    switch (state) {
        case connection_state::disconnected: return "disconnected";
        case connection_state::connecting:   return "connecting";
        case connection_state::open:         return "open";
        case connection_state::closing:      return "closing";
    }
    return "unknown";
}

Connection::Connection() : cur_state(connection_state::disconnected) {
}

Connection::~Connection() {
    close();
}

void Connection::open_wake_pipe() {
    if (pipe2(wake_pipe, O_CLOEXEC | O_NONBLOCK) == -1) {
        throw ConnectionError(errno_message("pipe"));
    }
}

std::unique_ptr<Connection> Connection::spawn(const std::string & command,
                                              const std::vector<std::string> & args,
                                              int grace_period_ms) {
    ignore_sigpipe();

    std::unique_ptr<Connection> conn(new Connection());
    conn->cur_state       = connection_state::connecting;
    conn->grace_period_ms = grace_period_ms;
    conn->open_wake_pipe();

    int stdin_pipe[2]  = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        close_fd(stdin_pipe[0]);  close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]); close_fd(stdout_pipe[1]);
        close_fd(status_pipe[0]); close_fd(status_pipe[1]);
    };

    // all ends are close-on-exec; the child only keeps what dup2 installs
    if (pipe2(stdin_pipe, O_CLOEXEC) == -1 || pipe2(stdout_pipe, O_CLOEXEC) == -1 || pipe2(status_pipe, O_CLOEXEC) == -1) {
        const int err = errno;
        close_all();
        throw ConnectionError(errno_message("pipe", err));
    }

    // prepare argv before fork so the child does not allocate
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(command.c_str()));
    for (const auto & arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        const int err = errno;
        close_all();
        throw ConnectionError(errno_message("fork", err));
    }

    if (pid == 0) {
        // Child process - become the server
        dup2(stdin_pipe[0],  STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);

        execvp(command.c_str(), argv.data());

        // exec failed: report errno through the status pipe
        int err = errno;
        ssize_t n = ::write(status_pipe[1], &err, sizeof(err));
        _exit(n == (ssize_t) sizeof(err) ? 127 : 126);
    }

    // Parent process - set up communication
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(status_pipe[1]);

    // the status pipe reports EOF on a successful exec, errno otherwise
    int     child_errno = 0;
    ssize_t n           = 0;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n > 0) {
        int status = 0;
        waitpid(pid, &status, 0);
        close_all();
        throw ConnectionError("failed to start '" + command + "': " + std::strerror(child_errno));
    }

    try {
        set_nonblocking(stdin_pipe[1]);
    } catch (const ConnectionError &) {
        close_all();
        kill(pid, SIGKILL);
        int status = 0;
        waitpid(pid, &status, 0);
        throw;
    }

    conn->child_pid = pid;
    conn->read_fd   = stdout_pipe[0];
    conn->write_fd  = stdin_pipe[1];
    conn->cur_state = connection_state::open;

    PIPERPC_LOG_DEBUG("%s: started '%s' (pid %d)\n", __func__, command.c_str(), (int) pid);

    return conn;
}

std::unique_ptr<Connection> Connection::connect(const std::string & socket_path) {
    ignore_sigpipe();

    sockaddr_un addr{};
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        throw ConnectionError("socket path too long: " + socket_path);
    }

    std::unique_ptr<Connection> conn(new Connection());
    conn->cur_state = connection_state::connecting;
    conn->open_wake_pipe();

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw ConnectionError(errno_message("socket"));
    }

    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path.c_str());

    int rc = 0;
    do {
        rc = ::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
    } while (rc < 0 && errno == EINTR);

    if (rc < 0) {
        const int err = errno;
        ::close(fd);
        throw ConnectionError("failed to connect to " + socket_path + ": " + std::strerror(err));
    }

    try {
        set_nonblocking(fd);
    } catch (const ConnectionError &) {
        ::close(fd);
        throw;
    }

    conn->read_fd   = fd;
    conn->write_fd  = fd;
    conn->is_socket = true;
    conn->cur_state = connection_state::open;

    PIPERPC_LOG_DEBUG("%s: connected to %s\n", __func__, socket_path.c_str());

    return conn;
}

std::unique_ptr<Connection> Connection::adopt(int read_fd, int write_fd, bool owns_fds) {
    if (read_fd < 0 || write_fd < 0) {
        throw ConnectionError("cannot adopt an invalid descriptor");
    }

    ignore_sigpipe();

    // descriptors we do not own (our own stdout) keep their blocking mode
    if (owns_fds) {
        set_nonblocking(write_fd);
    }

    std::unique_ptr<Connection> conn(new Connection());
    conn->open_wake_pipe();
    conn->nonblocking_write = owns_fds;
    conn->read_fd   = read_fd;
    conn->write_fd  = write_fd;
    conn->owns_fds  = owns_fds;
    conn->is_socket = read_fd == write_fd;
    conn->cur_state = connection_state::open;

    return conn;
}

void Connection::write_line(const std::string & line, int timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(std::max(timeout_ms, 0));

    std::unique_lock<std::timed_mutex> lock(write_mutex, std::defer_lock);
    if (timeout_ms < 0) {
        lock.lock();
    } else if (!lock.try_lock_until(deadline)) {
        throw Timeout("write timed out after " + std::to_string(timeout_ms) + " ms waiting for another writer");
    }

    if (cur_state.load() != connection_state::open || write_fd < 0) {
        throw ConnectionClosed("connection is not open");
    }
    if (write_broken) {
        throw ConnectionError("stream is out of sync after an interrupted write");
    }

    std::string data = line;
    if (data.empty() || data.back() != '\n') {
        data += '\n';
    }

    const char * p   = data.data();
    size_t       len = data.size();

    // a partially written line corrupts the framing for every later write
    auto interrupted = [&]() {
        if (p != data.data()) {
            write_broken = true;
        }
    };

    pollfd fds[2];
    fds[0].fd     = write_fd;
    fds[0].events = POLLOUT;
    fds[1].fd     = wake_pipe[0];
    fds[1].events = POLLIN;

    while (len > 0) {
        if (cur_state.load() != connection_state::open) {
            interrupted();
            throw ConnectionClosed("connection closed during write");
        }

        int wait_ms = -1;
        if (timeout_ms >= 0) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                interrupted();
                throw Timeout("write timed out after " + std::to_string(timeout_ms) + " ms");
            }
            wait_ms = (int) std::min<long long>(remaining, INT_MAX);
        }

        fds[0].revents = 0;
        fds[1].revents = 0;

        int rc = ::poll(fds, 2, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            interrupted();
            throw ConnectionError(errno_message("poll"));
        }
        if (rc == 0) {
            continue;
        }

        if (fds[1].revents != 0) {
            // woken by close()
            interrupted();
            throw ConnectionClosed("connection closed during write");
        }

        if (fds[0].revents == 0) {
            continue;
        }

        // a blocking descriptor only takes what fits without waiting
        const size_t chunk = nonblocking_write ? len : std::min<size_t>(len, PIPE_BUF);

        ssize_t w = ::write(write_fd, p, chunk);
        if (w < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            interrupted();
            throw ConnectionError(errno_message("write"));
        }
        p   += w;
        len -= (size_t) w;
    }
}

bool Connection::read_line(std::string & line) {
    std::lock_guard<std::mutex> lock(read_mutex);

    while (true) {
        if (cur_state.load() != connection_state::open) {
            return false;
        }

        auto pos = buffer.find('\n');
        if (pos != std::string::npos) {
            line.assign(buffer, 0, pos);
            buffer.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return true;
        }

        if (eof_seen) {
            // unterminated trailing fragment
            if (!buffer.empty()) {
                line.swap(buffer);
                buffer.clear();
                return true;
            }
            return false;
        }

        if (!fill_buffer()) {
            eof_seen = true;
        }
    }
}

bool Connection::fill_buffer() {
    pollfd fds[2];
    fds[0].fd     = read_fd;
    fds[0].events = POLLIN;
    fds[1].fd     = wake_pipe[0];
    fds[1].events = POLLIN;

    while (true) {
        fds[0].revents = 0;
        fds[1].revents = 0;

        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            PIPERPC_LOG_ERROR("%s: %s\n", __func__, errno_message("poll").c_str());
            return false;
        }

        if (fds[1].revents != 0) {
            // woken by close()
            return false;
        }

        if (fds[0].revents != 0) {
            char chunk[4096];
            ssize_t n = ::read(read_fd, chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) {
                    continue;
                }
                PIPERPC_LOG_ERROR("%s: %s\n", __func__, errno_message("read").c_str());
                return false;
            }
            if (n == 0) {
                return false;
            }
            buffer.append(chunk, (size_t) n);
            return true;
        }
    }
}

void Connection::close() {
    std::lock_guard<std::mutex> close_lock(close_mutex);

    if (cur_state.load() == connection_state::disconnected) {
        return;
    }
    cur_state = connection_state::closing;

    if (wake_pipe[1] >= 0) {
        const char c = 1;
        if (::write(wake_pipe[1], &c, 1) < 0 && errno != EAGAIN) {
            PIPERPC_LOG_WARN("%s: %s\n", __func__, errno_message("wake reader").c_str());
        }
    }

    // closing our write end is the graceful shutdown request: the peer sees EOF.
    // A writer blocked in poll() has been woken above and gives up the lock.
    {
        std::lock_guard<std::timed_mutex> lock(write_mutex);
        if (is_socket) {
            if (read_fd >= 0) {
                ::shutdown(read_fd, SHUT_WR);
            }
        } else if (owns_fds) {
            close_fd(write_fd);
        }
    }

    if (child_pid > 0) {
        terminate_child();
    }

    {
        std::lock_guard<std::mutex> lock(read_mutex);
        release_fds();
    }

    cur_state = connection_state::disconnected;
}

void Connection::terminate_child() {
    if (!wait_for_exit(child_pid, grace_period_ms)) {
        PIPERPC_LOG_WARN("%s: pid %d did not exit after %d ms, sending SIGTERM\n", __func__, (int) child_pid, grace_period_ms);
        kill(child_pid, SIGTERM);

        if (!wait_for_exit(child_pid, 100)) {
            kill(child_pid, SIGKILL);
            int status = 0;
            waitpid(child_pid, &status, 0);
        }
    }

    PIPERPC_LOG_DEBUG("%s: pid %d exited\n", __func__, (int) child_pid);
    child_pid = -1;
}

void Connection::release_fds() {
    if (owns_fds) {
        if (write_fd != read_fd) {
            close_fd(write_fd);
        }
        close_fd(read_fd);
    }
    read_fd  = -1;
    write_fd = -1;

    close_fd(wake_pipe[0]);
    close_fd(wake_pipe[1]);
    buffer.clear();
}

} // namespace piperpc
