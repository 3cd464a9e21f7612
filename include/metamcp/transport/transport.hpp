#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>

namespace metamcp {

using MessageCallback = std::function<void(JsonRpcMessage)>;
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract message channel between a client and a tool host.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start the transport. Blocks until shutdown or end of input.
    virtual void start(MessageCallback on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Queue a message for the remote peer.
    virtual void send(const JsonRpcMessage& msg) = 0;

    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace metamcp
