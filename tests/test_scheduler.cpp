#include <gtest/gtest.h>

#include <vector>

#include "wxrx/rx/scheduler.hpp"

using namespace wxrx;
using namespace wxrx::rx;

namespace {

ProtocolDescriptor run_desc() {
  ProtocolDescriptor d;
  d.name = "run";
  d.sync_by_run = true;
  d.sync_bit = 0;
  d.min_sync_run = 7;
  d.start_bit = 1;
  d.min_frame_bits = 34;
  d.max_frame_bits = 64;
  return d;
}

ProtocolDescriptor repeat_desc() {
  ProtocolDescriptor d;
  d.name = "repeat";
  d.start_bit = 1;
  d.repeats = true;
  d.repeat_bit = 0;
  d.min_frame_bits = 34;
  d.max_frame_bits = 64;
  d.max_repeats = 3;
  return d;
}

Action feed_bits(EngineContext& ctx, const ProtocolDescriptor& d, DecodeStats& st, size_t n, uint8_t bit) {
  Action a = Action::None;
  for (size_t i = 0; i < n && a == Action::None; ++i) a = step(ctx, d, Symbol::data(bit), st);
  return a;
}

void enter_data_by_run(EngineContext& ctx, const ProtocolDescriptor& d, DecodeStats& st) {
  step(ctx, d, Symbol::acquire(), st);
  feed_bits(ctx, d, st, 7, 0);
  step(ctx, d, Symbol::data(1), st);
}

} // namespace

TEST(Scheduler, FreshContextIsReset) {
  EngineContext ctx;
  EXPECT_TRUE(is_reset(ctx));
  EXPECT_EQ(ctx.state, RxState::WAIT);
}

TEST(Scheduler, WaitIgnoresEverythingButAcquire) {
  EngineContext ctx;
  DecodeStats st;
  auto d = run_desc();
  step(ctx, d, Symbol::data(1), st);
  step(ctx, d, Symbol::end_of_frame(), st);
  step(ctx, d, Symbol::invalid(DecodeError::InvalidPulse), st);
  EXPECT_TRUE(is_reset(ctx));
  EXPECT_EQ(st.count(DecodeError::InvalidPulse), 0u);
  step(ctx, d, Symbol::acquire(), st);
  EXPECT_EQ(ctx.state, RxState::SYNC);
  EXPECT_EQ(st.syncs, 1u);
}

TEST(Scheduler, SyncRunNeedsMinimumLength) {
  EngineContext ctx;
  DecodeStats st;
  auto d = run_desc();
  step(ctx, d, Symbol::acquire(), st);
  feed_bits(ctx, d, st, 6, 0);
  step(ctx, d, Symbol::data(1), st);
  EXPECT_EQ(ctx.state, RxState::SYNC);
  EXPECT_EQ(ctx.sync_count, 6);
  step(ctx, d, Symbol::data(0), st);
  step(ctx, d, Symbol::data(1), st);
  EXPECT_EQ(ctx.state, RxState::DATA);
  EXPECT_TRUE(ctx.bits.empty());
}

TEST(Scheduler, FrameDecodeAfterEndOfFrame) {
  EngineContext ctx;
  DecodeStats st;
  auto d = run_desc();
  enter_data_by_run(ctx, d, st);
  feed_bits(ctx, d, st, 40, 1);
  EXPECT_EQ(ctx.bits.size(), 40u);
  EXPECT_EQ(step(ctx, d, Symbol::end_of_frame(), st), Action::DecodeFrame);
  // context is left for the caller to decode
  EXPECT_EQ(ctx.state, RxState::DATA);
  EXPECT_EQ(ctx.bits.size(), 40u);
  EXPECT_EQ(st.frames, 1u);
}

TEST(Scheduler, ShortFrameResetsSilently) {
  EngineContext ctx;
  DecodeStats st;
  auto d = run_desc();
  enter_data_by_run(ctx, d, st);
  feed_bits(ctx, d, st, 10, 1);
  EXPECT_EQ(step(ctx, d, Symbol::end_of_frame(), st), Action::None);
  EXPECT_TRUE(is_reset(ctx));
  EXPECT_EQ(st.last_error, DecodeError::None);
  EXPECT_EQ(st.frames, 0u);
}

TEST(Scheduler, InvalidSymbolResets) {
  EngineContext ctx;
  DecodeStats st;
  auto d = run_desc();
  enter_data_by_run(ctx, d, st);
  feed_bits(ctx, d, st, 12, 0);
  step(ctx, d, Symbol::invalid(DecodeError::EdgeNotFound), st);
  EXPECT_TRUE(is_reset(ctx));
  EXPECT_EQ(st.count(DecodeError::EdgeNotFound), 1u);
  EXPECT_EQ(st.last_error, DecodeError::EdgeNotFound);
}

TEST(Scheduler, EdgeLossDuringSyncIsSyncFailure) {
  EngineContext ctx;
  DecodeStats st;
  auto d = run_desc();
  step(ctx, d, Symbol::acquire(), st);
  feed_bits(ctx, d, st, 3, 0);
  step(ctx, d, Symbol::end_of_frame(), st);
  EXPECT_TRUE(is_reset(ctx));
  EXPECT_EQ(st.count(DecodeError::SyncFailure), 1u);
}

TEST(Scheduler, OverflowingFrameIsDropped) {
  EngineContext ctx;
  DecodeStats st;
  auto d = run_desc();
  enter_data_by_run(ctx, d, st);
  feed_bits(ctx, d, st, d.max_frame_bits, 1);
  EXPECT_EQ(ctx.bits.size(), d.max_frame_bits);
  step(ctx, d, Symbol::data(1), st);
  EXPECT_TRUE(is_reset(ctx));
  EXPECT_EQ(st.count(DecodeError::FrameOverflow), 1u);
}

TEST(Scheduler, LockedStartBitMustMatch) {
  EngineContext ctx;
  DecodeStats st;
  auto d = repeat_desc();
  step(ctx, d, Symbol::acquire(), st);
  // run-length sync bits mean nothing for a locked protocol
  feed_bits(ctx, d, st, 8, 0);
  EXPECT_EQ(ctx.state, RxState::SYNC);
  step(ctx, d, Symbol::locked(), st);
  EXPECT_EQ(ctx.state, RxState::START);
  step(ctx, d, Symbol::data(0), st);
  EXPECT_TRUE(is_reset(ctx));
  EXPECT_EQ(st.count(DecodeError::FramingError), 1u);
}

TEST(Scheduler, RepeatedFramesCollectUntilEndOfPacket) {
  EngineContext ctx;
  DecodeStats st;
  auto d = repeat_desc();
  step(ctx, d, Symbol::acquire(), st);
  step(ctx, d, Symbol::locked(), st);
  step(ctx, d, Symbol::data(1), st);
  ASSERT_EQ(ctx.state, RxState::DATA);
  feed_bits(ctx, d, st, 34, 1);
  EXPECT_EQ(step(ctx, d, Symbol::end_of_frame(), st), Action::None);
  EXPECT_EQ(ctx.state, RxState::REPEAT_1);
  ASSERT_EQ(ctx.repeats.size(), 1u);
  EXPECT_TRUE(ctx.bits.empty());

  // a repeated frame gap before the separator pulse is ignored
  step(ctx, d, Symbol::end_of_frame(), st);
  EXPECT_EQ(ctx.state, RxState::REPEAT_1);
  step(ctx, d, Symbol::pulse(), st);
  EXPECT_EQ(ctx.state, RxState::REPEAT_2);
  step(ctx, d, Symbol::data(0), st);
  EXPECT_EQ(ctx.state, RxState::START);
  step(ctx, d, Symbol::data(1), st);
  feed_bits(ctx, d, st, 34, 1);
  step(ctx, d, Symbol::end_of_frame(), st);
  step(ctx, d, Symbol::pulse(), st);
  step(ctx, d, Symbol::end_of_frame(), st);
  EXPECT_EQ(ctx.state, RxState::REPEAT_2);
  EXPECT_EQ(step(ctx, d, Symbol::end_of_packet(), st), Action::DecodePacket);
  EXPECT_EQ(ctx.repeats.size(), 2u);
  EXPECT_EQ(st.frames, 2u);
}

TEST(Scheduler, EndOfPacketWithoutSeparatorDecodes) {
  EngineContext ctx;
  DecodeStats st;
  auto d = repeat_desc();
  step(ctx, d, Symbol::acquire(), st);
  step(ctx, d, Symbol::locked(), st);
  step(ctx, d, Symbol::data(1), st);
  feed_bits(ctx, d, st, 34, 1);
  step(ctx, d, Symbol::end_of_frame(), st);
  ASSERT_EQ(ctx.state, RxState::REPEAT_1);
  EXPECT_EQ(step(ctx, d, Symbol::end_of_packet(), st), Action::DecodePacket);
  EXPECT_EQ(ctx.repeats.size(), 1u);
}

TEST(Scheduler, WrongRepeatBitResets) {
  EngineContext ctx;
  DecodeStats st;
  auto d = repeat_desc();
  step(ctx, d, Symbol::acquire(), st);
  step(ctx, d, Symbol::locked(), st);
  step(ctx, d, Symbol::data(1), st);
  feed_bits(ctx, d, st, 34, 0);
  step(ctx, d, Symbol::end_of_frame(), st);
  step(ctx, d, Symbol::pulse(), st);
  step(ctx, d, Symbol::data(1), st);
  EXPECT_TRUE(is_reset(ctx));
  EXPECT_EQ(st.count(DecodeError::FramingError), 1u);
}

TEST(Scheduler, RepeatSetIsBounded) {
  EngineContext ctx;
  DecodeStats st;
  auto d = repeat_desc();
  step(ctx, d, Symbol::acquire(), st);
  step(ctx, d, Symbol::locked(), st);
  for (size_t i = 0; i < d.max_repeats; ++i) {
    step(ctx, d, Symbol::data(1), st);
    feed_bits(ctx, d, st, 34, 1);
    step(ctx, d, Symbol::end_of_frame(), st);
    step(ctx, d, Symbol::pulse(), st);
    step(ctx, d, Symbol::data(0), st);
  }
  EXPECT_EQ(ctx.repeats.size(), d.max_repeats);
  step(ctx, d, Symbol::data(1), st);
  feed_bits(ctx, d, st, 34, 1);
  step(ctx, d, Symbol::end_of_frame(), st);
  EXPECT_TRUE(is_reset(ctx));
  EXPECT_EQ(st.count(DecodeError::FrameOverflow), 1u);
}

TEST(Scheduler, FinishDecodesPendingFrame) {
  auto d = run_desc();
  {
    EngineContext ctx;
    DecodeStats st;
    enter_data_by_run(ctx, d, st);
    feed_bits(ctx, d, st, 34, 1);
    EXPECT_EQ(finish(ctx, d, st), Action::DecodeFrame);
  }
  {
    EngineContext ctx;
    DecodeStats st;
    enter_data_by_run(ctx, d, st);
    feed_bits(ctx, d, st, 33, 1);
    EXPECT_EQ(finish(ctx, d, st), Action::None);
    EXPECT_TRUE(is_reset(ctx));
  }
  {
    EngineContext ctx;
    DecodeStats st;
    step(ctx, d, Symbol::acquire(), st);
    EXPECT_EQ(finish(ctx, d, st), Action::None);
    EXPECT_TRUE(is_reset(ctx));
  }
}

TEST(Scheduler, FinishCollectsPendingRepeat) {
  auto d = repeat_desc();
  EngineContext ctx;
  DecodeStats st;
  step(ctx, d, Symbol::acquire(), st);
  step(ctx, d, Symbol::locked(), st);
  step(ctx, d, Symbol::data(1), st);
  feed_bits(ctx, d, st, 34, 1);
  EXPECT_EQ(finish(ctx, d, st), Action::DecodePacket);
  ASSERT_EQ(ctx.repeats.size(), 1u);
  EXPECT_EQ(ctx.repeats[0].size(), 34u);
}
