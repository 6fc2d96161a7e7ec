/*
 * Transport Interface
 *
 * A transport carries RTP for sessions it opened on the SessionManager and
 * reports back through SessionManager::on_transport_writable / _failure /
 * _closed. All calls happen on the dispatch loop thread.
 */

#ifndef TRANSPORT_H
#define TRANSPORT_H

#include "../media_types.h"
#include <cstdint>

using SessionId = uint64_t;

enum class SendResult {
    Sent,
    WouldBlock,   // Keep the packet; retry after on_transport_writable()
    Failed        // Session is torn down with TransportFailure
};

class Transport {
public:
    virtual ~Transport() = default;

    virtual const char* name() const = 0;

    // Send one RTP packet of media `media_index` with the session's SSRC
    virtual SendResult send(SessionId session, size_t media_index, const Packet& packet, uint32_t ssrc) = 0;

    // Session was torn down; release its resources and report
    // on_transport_closed() once done (may be immediate)
    virtual void close_session(SessionId session) = 0;
};

#endif // TRANSPORT_H
