#pragma once

#include <cstdint>
#include <memory>
#include <span>

#include "hub_context.h"
#include "loss_concealer.h"
#include "voice_codec.h"

// Inbound UDP audio: decode the header, count it, let the arbiter decide, then conceal losses
// and hand PCM to the browsers. Runs on the thread that owns the receive socket.
class AudioReceiver {
public:
    AudioReceiver(HubContext& ctx, std::unique_ptr<FrameDecoder> decoder);

    void on_datagram(std::span<const uint8_t> datagram);

    // Receiving -> Idle after rx_timeout of silence; called from housekeeping
    void check_idle();

    const LossConcealer::Stats& concealment_stats() const {
        return concealer_.stats();
    }

private:
    HubContext&                   ctx_;
    std::unique_ptr<FrameDecoder> decoder_;
    LossConcealer                 concealer_;
    uint64_t                      rx_events_ = 0;
};
