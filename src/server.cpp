#include "piperpc/server.hpp"
#include "piperpc/errors.hpp"
#include "piperpc/log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace piperpc {

Server::Server(const Dispatcher & dispatcher) : dispatcher(dispatcher) {
}

int Server::run(Connection & connection) {
    std::string line;

    while (connection.read_line(line)) {
        if (is_blank(line)) {
            continue;
        }

        PIPERPC_LOG_DEBUG("%s: received: %s\n", __func__, line.c_str());

        Message request;
        try {
            request = decode(line);
        } catch (const MalformedMessage & e) {
            PIPERPC_LOG_ERROR("%s: JSON parse error: %s\n", __func__, e.what());
            skipped++;
            continue;
        } catch (const ProtocolViolation & e) {
            PIPERPC_LOG_ERROR("%s: invalid message: %s\n", __func__, e.what());
            skipped++;
            continue;
        }

        if (request.is_response()) {
            PIPERPC_LOG_WARN("%s: ignoring response message, this side only answers requests\n", __func__);
            skipped++;
            continue;
        }

        Message response = dispatcher.dispatch(request);
        handled++;

        if (request.is_notification()) {
            if (response.is_error()) {
                PIPERPC_LOG_DEBUG("%s: notification %s: %s\n", __func__, request.method.c_str(), response.error_message.c_str());
            }
            continue;
        }

        try {
            connection.write_line(encode(response));
        } catch (const Error & e) {
            PIPERPC_LOG_ERROR("%s: failed to send response: %s\n", __func__, e.what());
            return 1;
        }
    }

    PIPERPC_LOG_INFO("%s: end of input, %zu requests handled, %zu lines skipped\n", __func__, handled, skipped);
    return 0;
}

int Server::listen(const std::string & socket_path) {
    sockaddr_un addr{};
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        PIPERPC_LOG_ERROR("%s: socket path too long: %s\n", __func__, socket_path.c_str());
        return 1;
    }

    int server_fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd < 0) {
        PIPERPC_LOG_ERROR("%s: socket: %s\n", __func__, std::strerror(errno));
        return 1;
    }

    ::unlink(socket_path.c_str());

    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path.c_str());

    if (::bind(server_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        PIPERPC_LOG_ERROR("%s: bind %s: %s\n", __func__, socket_path.c_str(), std::strerror(errno));
        ::close(server_fd);
        return 1;
    }

    if (::listen(server_fd, 8) < 0) {
        PIPERPC_LOG_ERROR("%s: listen: %s\n", __func__, std::strerror(errno));
        ::close(server_fd);
        ::unlink(socket_path.c_str());
        return 1;
    }

    PIPERPC_LOG_INFO("%s: listening on %s\n", __func__, socket_path.c_str());

    while (true) {
        int client_fd = ::accept4(server_fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            PIPERPC_LOG_ERROR("%s: accept: %s\n", __func__, std::strerror(errno));
            break;
        }

        PIPERPC_LOG_INFO("%s: client connected\n", __func__);

        // one connection at a time: a pipe is never multiplexed between clients
        std::unique_ptr<Connection> connection;
        try {
            connection = Connection::adopt(client_fd, client_fd);
        } catch (const ConnectionError & e) {
            PIPERPC_LOG_ERROR("%s: %s\n", __func__, e.what());
            ::close(client_fd);
            continue;
        }
        if (run(*connection) != 0) {
            PIPERPC_LOG_WARN("%s: connection ended with a write failure\n", __func__);
        }
        connection->close();

        PIPERPC_LOG_INFO("%s: client disconnected\n", __func__);
    }

    ::close(server_fd);
    ::unlink(socket_path.c_str());
    return 1;
}

} // namespace piperpc
