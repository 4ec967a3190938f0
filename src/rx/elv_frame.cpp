#include "wxrx/rx/elv_frame.hpp"

#include "wxrx/constants.hpp"
#include "wxrx/debug.hpp"
#include "wxrx/utils/nibble_check.hpp"

namespace wxrx::rx {

namespace {

std::optional<uint8_t> pop_nibble(utils::BitBuffer& bits) {
    auto v = bits.pop_lsb(4);
    if (!v) {
        WXRX_WARNF("data exhausted");
        return std::nullopt;
    }
    return static_cast<uint8_t>(*v);
}

// End of nibble marker. Distinguishes a 0 from a missing bit.
DecodeError expect_eon(utils::BitBuffer& bits) {
    auto v = bits.pop_lsb(1);
    if (!v) {
        WXRX_WARNF("data exhausted");
        return DecodeError::FrameIncomplete;
    }
    if (*v != 1) {
        WXRX_WARNF("end of nibble is not 1");
        return DecodeError::FramingError;
    }
    return DecodeError::None;
}

} // namespace

DecodeOutcome<ElvNibbles> read_elv_nibbles(utils::BitBuffer& bits) {
    using Out = DecodeOutcome<ElvNibbles>;
    ElvNibbles nb;
    utils::NibbleCheck check;

    auto type = pop_nibble(bits);
    if (!type) return Out::fail(DecodeError::FrameIncomplete);
    if (auto e = expect_eon(bits); e != DecodeError::None) return Out::fail(e);
    // XOR and sum cover the whole nibble, the type only its low 3 bits
    nb.sensor_type = *type & 7;
    check.add(nb.sensor_type);

    nb.count = ELV_SENSOR_NIBBLES[nb.sensor_type];
    for (uint8_t i = 0; i < nb.count; ++i) {
        auto v = pop_nibble(bits);
        if (!v) return Out::fail(DecodeError::FrameIncomplete);
        if (auto e = expect_eon(bits); e != DecodeError::None) return Out::fail(e);
        nb.n[i] = *v;
        check.add(*v);
    }

    if (!check.xor_ok()) {
        WXRX_WARNF("Check is not 0 but %u", unsigned(check.xor_acc));
        return Out::fail(DecodeError::ChecksumMismatch);
    }

    auto sum_read = pop_nibble(bits);
    if (!sum_read) return Out::fail(DecodeError::FrameIncomplete);
    if (!check.sum_ok(*sum_read)) {
        WXRX_WARNF("Sum read is %u but computed is %u", unsigned(*sum_read), unsigned(check.expected_sum()));
        return Out::fail(DecodeError::SumMismatch);
    }
    return Out::ok(nb);
}

ElvRecord elv_record_from_nibbles(const ElvNibbles& nb) {
    const auto& d = nb.n;
    ElvRecord r;
    r.sensor_type = nb.sensor_type;
    r.sensor_type_name = ELV_SENSOR_NAMES[nb.sensor_type];
    r.address = d[0] & 7;

    double t = d[3] * 10 + d[2] + d[1] / 10.0;
    r.temperature = (d[0] & 8) ? -t : t;

    switch (nb.sensor_type) {
    case 1:
    case 4:
        r.humidity = d[6] * 10 + d[5] + d[4] / 10.0;
        if (nb.sensor_type == 4)
            r.pressure = 200 + d[9] * 100 + d[8] * 10 + d[7];
        break;
    case 7:
        // Kombi: whole-percent humidity
        r.humidity = d[5] * 10 + d[4];
        r.wind = d[8] * 10 + d[7] + d[6] / 10.0;
        r.rain_sum = static_cast<uint32_t>(d[11]) * 256 + d[10] * 16 + d[9];
        r.rain_detect = (d[0] & 2) != 0;
        break;
    default:
        break;
    }
    return r;
}

DecodeOutcome<ElvRecord> decode_elv_frame(utils::BitBuffer& bits) {
    WXRX_INFOF("DECODE");
    bits.rewind();
    auto nb = read_elv_nibbles(bits);
    if (!nb.record) return DecodeOutcome<ElvRecord>::fail(nb.error);
    return DecodeOutcome<ElvRecord>::ok(elv_record_from_nibbles(*nb.record));
}

} // namespace wxrx::rx
