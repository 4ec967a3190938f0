#include "wxrx/types.hpp"

namespace wxrx {

const char* to_string(RxState st) {
    switch (st) {
    case RxState::WAIT: return "WAIT";
    case RxState::SYNC: return "SYNC";
    case RxState::START: return "START";
    case RxState::DATA: return "DATA";
    case RxState::REPEAT_1: return "REPEAT_1";
    case RxState::REPEAT_2: return "REPEAT_2";
    }
    return "?";
}

const char* to_string(DecodeError err) {
    switch (err) {
    case DecodeError::None: return "none";
    case DecodeError::SyncFailure: return "sync failure";
    case DecodeError::InvalidPulse: return "invalid pulse";
    case DecodeError::EdgeNotFound: return "edge not found";
    case DecodeError::FramingError: return "framing error";
    case DecodeError::FrameIncomplete: return "frame incomplete";
    case DecodeError::FrameOverflow: return "frame overflow";
    case DecodeError::ChecksumMismatch: return "checksum mismatch";
    case DecodeError::SumMismatch: return "sum mismatch";
    case DecodeError::RepeatMismatch: return "repeat mismatch";
    }
    return "?";
}

} // namespace wxrx
