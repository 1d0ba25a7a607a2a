#pragma once

#include "core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace dbgate {

/**
 * @brief One forwarded byte stream to the remote target
 *
 * Non-blocking: read/write return 0 when the call would block.
 */
class IForwardChannel {
public:
    virtual ~IForwardChannel() = default;

    // > 0 bytes read, 0 would block, -1 on EOF or error
    [[nodiscard]] virtual long read(char* buf, size_t n) = 0;

    // >= 0 bytes accepted (0 would block), -1 on error
    [[nodiscard]] virtual long write(const char* buf, size_t n) = 0;

    // Descriptor to poll for incoming data, -1 when there is none
    [[nodiscard]] virtual int poll_fd() const { return -1; }

    virtual void close() = 0;
};

/**
 * @brief Opens forwarded channels to host:port on the far side
 */
class IChannelOpener {
public:
    virtual ~IChannelOpener() = default;

    [[nodiscard]] virtual Result<std::unique_ptr<IForwardChannel>> open_channel(
        const std::string& remote_host, uint16_t remote_port,
        const std::string& origin_host, uint16_t origin_port) = 0;
};

} // namespace dbgate
