#pragma once

#include <sys/types.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace piperpc {

enum class connection_state {
    disconnected,
    connecting,
    open,
    closing,
};

const char * connection_state_name(connection_state state);

// A line-oriented byte stream to the remote side. Owns at most one child
// process and the descriptors it was given; never shared between two peers.
class Connection {
public:
    static constexpr int default_grace_period_ms = 2000;

    // Starts `command` with its stdin/stdout bound to pipes. The child's
    // stderr is inherited and never parsed. Throws ConnectionError.
    static std::unique_ptr<Connection> spawn(const std::string & command,
                                             const std::vector<std::string> & args = {},
                                             int grace_period_ms = default_grace_period_ms);

    // Connects to a server listening on a Unix domain socket. Throws ConnectionError.
    static std::unique_ptr<Connection> connect(const std::string & socket_path);

    // Wraps descriptors that are already open (our own stdin/stdout, a socket,
    // test pipes). When read_fd == write_fd the descriptor is treated as a socket.
    static std::unique_ptr<Connection> adopt(int read_fd, int write_fd, bool owns_fds = true);

    ~Connection();

    Connection(const Connection &) = delete;
    Connection & operator=(const Connection &) = delete;

    // Writes the line and a terminating '\n' (unless already present).
    // Waits at most timeout_ms for the peer to drain the stream (forever when
    // negative). Throws ConnectionClosed if the connection is not open or is
    // closed meanwhile, Timeout, ConnectionError if the write fails. After an
    // interrupted partial write every later write throws ConnectionError.
    void write_line(const std::string & line, int timeout_ms = -1);

    // Blocks until a full line is available. Returns false at end of stream
    // or once close() has been called. The terminator is stripped.
    bool read_line(std::string & line);

    // Closes the write side, gives the child grace_period_ms to exit, then
    // SIGTERM, then SIGKILL. Wakes a blocked reader or writer. Idempotent.
    void close();

    connection_state state() const { return cur_state.load(); }
    bool is_open() const { return state() == connection_state::open; }

    pid_t pid() const { return child_pid; }

private:
    Connection();

    void open_wake_pipe();
    bool fill_buffer();
    void terminate_child();
    void release_fds();

    std::atomic<connection_state> cur_state;

    pid_t child_pid         = -1;
    int   read_fd           = -1;
    int   write_fd          = -1;
    int   wake_pipe[2]      = {-1, -1};
    bool  owns_fds          = true;
    bool  is_socket         = false;
    bool  eof_seen          = false;
    bool  write_broken      = false;
    bool  nonblocking_write = true;
    int   grace_period_ms   = default_grace_period_ms;

    std::string buffer;

    std::mutex       read_mutex;
    std::timed_mutex write_mutex;
    std::mutex       close_mutex;
};

} // namespace piperpc
