#pragma once

#include "piperpc/connection.hpp"
#include "piperpc/dispatcher.hpp"

#include <cstddef>
#include <string>

namespace piperpc {

// The responding side: reads one request per line, dispatches it and
// writes one response per line.
class Server {
public:
    explicit Server(const Dispatcher & dispatcher);

    // Serves the connection until end of stream. Lines that fail to decode
    // are logged and skipped without a response. Returns 0 at end of
    // stream, 1 if a response could not be written.
    int run(Connection & connection);

    // Listens on a Unix domain socket and serves one connection at a time.
    // Returns only on a listen/accept failure.
    int listen(const std::string & socket_path);

    size_t n_handled() const { return handled; }
    size_t n_skipped() const { return skipped; }

private:
    const Dispatcher & dispatcher;

    size_t handled = 0;
    size_t skipped = 0;
};

} // namespace piperpc
