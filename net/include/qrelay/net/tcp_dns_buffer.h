#pragma once

#include <optional>

#include "qrelay/common/defs.h"

namespace qrelay {

/**
 * Collects one length-prefixed DNS message out of stream chunks.
 * The prefix is kept in the buffer until the message is extracted.
 */
class TcpDnsBuffer {
public:
    /**
     * Append as much of `data` as the current message needs
     * @return the part of `data` after the end of the current message
     */
    Uint8View store(Uint8View data);

    /**
     * @return the message without its prefix, if complete. The buffer is emptied then.
     */
    std::optional<Uint8Vector> extract_packet();

    /**
     * @return number of bytes of the current message received so far, prefix included
     */
    [[nodiscard]] size_t pending() const {
        return m_buffer.size();
    }

private:
    Uint8Vector m_buffer;

    [[nodiscard]] size_t expected_size() const;
};

} // namespace qrelay
