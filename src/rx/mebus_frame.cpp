#include "wxrx/rx/mebus_frame.hpp"

#include "wxrx/debug.hpp"

namespace wxrx::rx {

DecodeOutcome<MebusRecord> decode_mebus_packet(std::span<const utils::BitBuffer> repeats) {
    using Out = DecodeOutcome<MebusRecord>;
    WXRX_INFOF("DECODE");
    if (repeats.empty()) {
        WXRX_WARNF("Frame contains no data");
        return Out::fail(DecodeError::FrameIncomplete);
    }
    for (size_t i = 1; i < repeats.size(); ++i) {
        if (!(repeats[i] == repeats[0])) {
            WXRX_WARNF("Frame %zu is not equal to first one", i);
            return Out::fail(DecodeError::RepeatMismatch);
        }
    }

    utils::BitBuffer bits = repeats[0];
    bits.rewind();
    auto id = bits.pop_msb(11);
    auto setkey = bits.pop_msb(1);
    auto channel = bits.pop_msb(2);
    auto temp = bits.pop_msb(12);
    auto hum = bits.pop_msb(8);
    if (!id || !setkey || !channel || !temp || !hum) {
        WXRX_WARNF("data exhausted");
        return Out::fail(DecodeError::FrameIncomplete);
    }

    int t = static_cast<int>(*temp);
    if (t >= 2048) t -= 4096; // 12 bit two's complement

    MebusRecord r;
    r.id = static_cast<uint16_t>(*id);
    r.setkey = static_cast<uint8_t>(*setkey);
    r.channel = static_cast<uint8_t>(*channel);
    r.temperature = t / 10.0;
    r.humidity = static_cast<uint8_t>(*hum);
    return Out::ok(r);
}

} // namespace wxrx::rx
