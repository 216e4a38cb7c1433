#include "commands/AtomicCommands.hpp"
#include "core/ResultAccumulator.hpp"
#include "model/WellSet.hpp"

#include "Fixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace pipetgen;
using namespace pipetgen::test;
using commands::PipettingArgs;
using protocols::ErrorKind;
using protocols::WarningKind;
using ::testing::ElementsAre;

class AtomicTest : public ::testing::Test {
protected:
  void SetUp() override {
    ctx = makeContext();
    state = stateWithTip(*ctx);
    state.tips[kP300Multi] = true;
  }

  PipettingArgs pipetting(const std::string& pipette, double volume, const std::string& labware,
                          const std::string& well) const {
    return PipettingArgs{ pipette, volume, labware, well, 10.0, 1.0 };
  }

  std::shared_ptr<const model::StaticContext> ctx;
  model::SimulationState state;
};

//---well geometry-----------------------------------------------------------

TEST(well_set, single_channel_touches_only_its_well) {
  const auto plate = model::gridLabware("plate", 8, 12, 10.0, 200.0);
  EXPECT_THAT(model::channelWells(plate, "C3", 1), ElementsAre("C3"));
}

TEST(well_set, eight_channels_cover_the_column) {
  const auto plate = model::gridLabware("plate", 8, 12, 10.0, 200.0);
  EXPECT_THAT(model::channelWells(plate, "A1", 8),
              ElementsAre("A1", "B1", "C1", "D1", "E1", "F1", "G1", "H1"));
}

TEST(well_set, eight_channels_skip_rows_on_384_layout) {
  const auto plate = model::gridLabware("plate384", 16, 24, 11.0, 100.0);
  EXPECT_THAT(model::channelWells(plate, "A1", 8),
              ElementsAre("A1", "C1", "E1", "G1", "I1", "K1", "M1", "O1"));
  EXPECT_THAT(model::channelWells(plate, "B2", 8),
              ElementsAre("B2", "D2", "F2", "H2", "J2", "L2", "N2", "P2"));
}

TEST(well_set, eight_channels_below_row_a_run_off_the_column) {
  const auto plate = model::gridLabware("plate", 8, 12, 10.0, 200.0);
  EXPECT_TRUE(model::channelWells(plate, "B1", 8).empty());

  const auto plate384 = model::gridLabware("plate384", 16, 24, 11.0, 100.0);
  EXPECT_TRUE(model::channelWells(plate384, "C1", 8).empty());
}

TEST(well_set, reservoir_puts_every_channel_in_one_well) {
  const auto trough = model::gridLabware("trough", 1, 12, 40.0, 15000.0);
  EXPECT_EQ(model::channelWells(trough, "A5", 8), std::vector<std::string>(8, "A5"));
}

TEST(well_set, unknown_well_touches_nothing) {
  const auto plate = model::gridLabware("plate", 8, 12, 10.0, 200.0);
  EXPECT_TRUE(model::channelWells(plate, "Z1", 1).empty());
}

TEST(well_set, multichannel_pick_up_only_from_row_a) {
  const auto rack = model::gridLabware("rack", 8, 3, 50.0, 300.0);
  EXPECT_THAT(model::pickUpCandidates(rack, 8), ElementsAre("A1", "A2", "A3"));
  EXPECT_EQ(model::pickUpCandidates(rack, 1).size(), 24u);
  EXPECT_EQ(model::pickUpCandidates(rack, 1)[1], "B1");
}

//---atomic creators---------------------------------------------------------

TEST_F(AtomicTest, aspirate_validates_pipette_then_labware_then_well) {
  auto r = commands::aspirate(pipetting("ghost", 10, "nowhere", "Z9"), *ctx, state);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.error().kind, ErrorKind::PipetteDoesNotExist);

  r = commands::aspirate(pipetting(kP300Single, 10, "nowhere", "Z9"), *ctx, state);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.error().kind, ErrorKind::LabwareDoesNotExist);

  r = commands::aspirate(pipetting(kP300Single, 10, kSourcePlate, "Z9"), *ctx, state);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.error().kind, ErrorKind::WellDoesNotExist);
}

TEST_F(AtomicTest, aspirate_over_pipette_max_fails) {
  const auto r = commands::aspirate(pipetting(kP300Single, 300.5, kSourcePlate, "A1"), *ctx, state);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.error().kind, ErrorKind::PipetteVolumeExceeded);
}

TEST_F(AtomicTest, aspirate_without_tip_fails) {
  state.tips[kP300Single] = false;
  const auto r = commands::aspirate(pipetting(kP300Single, 10, kSourcePlate, "A1"), *ctx, state);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.error().kind, ErrorKind::InsufficientTips);
}

TEST_F(AtomicTest, aspirate_emits_instruction_without_touching_input_state) {
  state.liquids[{ kSourcePlate, "A1" }] = model::WellContents{ 100.0, { "dye" } };
  const auto before = state;

  const auto r = commands::aspirate(pipetting(kP300Single, 30, kSourcePlate, "A1"), *ctx, state);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(state, before);

  const auto* a = r.success().instruction.as<protocols::Aspirate>();
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->well, "A1");
  EXPECT_DOUBLE_EQ(a->volume, 30.0);
  EXPECT_DOUBLE_EQ(a->flowRate, 10.0);
  EXPECT_DOUBLE_EQ(a->offsetFromBottomMm, 1.0);

  const auto& next = r.success().nextState;
  EXPECT_DOUBLE_EQ(next.contents(kSourcePlate, "A1")->volume, 70.0);
  EXPECT_EQ(next.tipContents.at(kP300Single).count("dye"), 1u);
}

TEST_F(AtomicTest, eight_channel_aspirate_lowers_whole_column) {
  for (const char* well : { "A1", "B1", "C1", "D1", "E1", "F1", "G1", "H1" })
    state.liquids[{ kSourcePlate, well }] = model::WellContents{ 50.0, {} };

  const auto r = commands::aspirate(pipetting(kP300Multi, 10, kSourcePlate, "A1"), *ctx, state);
  ASSERT_TRUE(r.ok());
  for (const char* well : { "A1", "B1", "C1", "D1", "E1", "F1", "G1", "H1" })
    EXPECT_DOUBLE_EQ(r.success().nextState.contents(kSourcePlate, well)->volume, 40.0) << well;
  EXPECT_EQ(r.success().nextState.contents(kSourcePlate, "A2"), nullptr);
}

TEST_F(AtomicTest, eight_channel_aspirate_from_reservoir_draws_eight_times) {
  state.liquids[{ kTrough, "A1" }] = model::WellContents{ 100.0, {} };
  const auto r = commands::aspirate(pipetting(kP300Multi, 10, kTrough, "A1"), *ctx, state);
  ASSERT_TRUE(r.ok());
  EXPECT_DOUBLE_EQ(r.success().nextState.contents(kTrough, "A1")->volume, 20.0);
}

TEST_F(AtomicTest, aspirate_from_untracked_well_warns) {
  const auto r = commands::aspirate(pipetting(kP300Single, 10, kSourcePlate, "D4"), *ctx, state);
  ASSERT_TRUE(r.ok());
  ASSERT_EQ(r.success().warnings.size(), 1u);
  EXPECT_EQ(r.success().warnings[0].kind, WarningKind::AspirateFromPristineWell);
  EXPECT_EQ(r.success().nextState.contents(kSourcePlate, "D4"), nullptr);
}

TEST_F(AtomicTest, aspirate_more_than_well_holds_warns_and_empties_well) {
  state.liquids[{ kSourcePlate, "A1" }] = model::WellContents{ 20.0, { "dye" } };
  const auto r = commands::aspirate(pipetting(kP300Single, 50, kSourcePlate, "A1"), *ctx, state);
  ASSERT_TRUE(r.ok());
  ASSERT_EQ(r.success().warnings.size(), 1u);
  EXPECT_EQ(r.success().warnings[0].kind, WarningKind::AspirateMoreThanWellContents);
  const auto* a1 = r.success().nextState.contents(kSourcePlate, "A1");
  ASSERT_NE(a1, nullptr);
  EXPECT_DOUBLE_EQ(a1->volume, 0.0);
  EXPECT_TRUE(a1->liquidIds.empty());
}

TEST_F(AtomicTest, dispense_over_well_max_warns) {
  state.liquids[{ kDestPlate, "A1" }] = model::WellContents{ 300.0, {} };
  const auto r = commands::dispense(pipetting(kP300Single, 100, kDestPlate, "A1"), *ctx, state);
  ASSERT_TRUE(r.ok());
  ASSERT_EQ(r.success().warnings.size(), 1u);
  EXPECT_EQ(r.success().warnings[0].kind, WarningKind::OverMaxWellVolume);
  EXPECT_DOUBLE_EQ(r.success().nextState.contents(kDestPlate, "A1")->volume, 400.0);
}

TEST_F(AtomicTest, trash_is_never_tracked) {
  const auto r = commands::dispense(pipetting(kP300Single, 100, kTrash, "A1"), *ctx, state);
  ASSERT_TRUE(r.ok());
  EXPECT_TRUE(r.success().nextState.liquids.empty());
}

TEST_F(AtomicTest, air_gaps_do_not_move_liquid) {
  state.liquids[{ kSourcePlate, "A1" }] = model::WellContents{ 100.0, {} };
  auto r = commands::airGap(pipetting(kP300Single, 5, kSourcePlate, "A1"), *ctx, state);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.success().instruction.kind(), protocols::InstructionKind::AirGap);
  EXPECT_EQ(r.success().nextState, state);

  r = commands::dispenseAirGap(pipetting(kP300Single, 5, kDestPlate, "A1"), *ctx, state);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.success().instruction.kind(), protocols::InstructionKind::DispenseAirGap);
  EXPECT_EQ(r.success().nextState, state);
}

TEST_F(AtomicTest, negative_delay_is_invalid) {
  const auto r = commands::delay(commands::DelayArgs{ -1.0 }, *ctx, state);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(AtomicTest, blowout_clears_tip_contents) {
  state.tipContents[kP300Single] = { "dye" };
  const auto r = commands::blowout(
      commands::BlowoutArgs{ kP300Single, kTrash, "A1", 46.43, kTrashDepth }, *ctx, state);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.success().nextState.tipContents.count(kP300Single), 0u);
}

TEST_F(AtomicTest, touch_tip_requires_tip) {
  state.tips[kP300Single] = false;
  const auto r = commands::touchTip(commands::TouchTipArgs{ kP300Single, kSourcePlate, "A1", 9.5 },
                                    *ctx, state);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.error().kind, ErrorKind::InsufficientTips);
}

TEST_F(AtomicTest, pick_up_consumes_rack_well) {
  const auto r =
      commands::pickUpTip(commands::PickUpTipArgs{ kP300Single, kTiprack1, "C2" }, *ctx, state);
  ASSERT_TRUE(r.ok());
  EXPECT_FALSE(r.success().nextState.tipAvailable(kTiprack1, "C2"));

  const auto again = commands::pickUpTip(commands::PickUpTipArgs{ kP300Single, kTiprack1, "C2" },
                                         *ctx, r.success().nextState);
  ASSERT_FALSE(again.ok());
  EXPECT_EQ(again.error().kind, ErrorKind::InsufficientTips);
}

TEST_F(AtomicTest, pick_up_from_a_plate_is_invalid) {
  const auto r =
      commands::pickUpTip(commands::PickUpTipArgs{ kP300Single, kSourcePlate, "A1" }, *ctx, state);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(AtomicTest, eight_channel_dispense_below_row_a_fails) {
  const auto r = commands::dispense(pipetting(kP300Multi, 10, kDestPlate, "B2"), *ctx, state);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.error().kind, ErrorKind::WellDoesNotExist);
}

TEST_F(AtomicTest, eight_channel_pick_up_below_row_a_fails) {
  state.tips[kP300Multi] = false;
  const auto r =
      commands::pickUpTip(commands::PickUpTipArgs{ kP300Multi, kTiprack2, "B1" }, *ctx, state);
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.error().kind, ErrorKind::WellDoesNotExist);
  EXPECT_TRUE(state.tipAvailable(kTiprack2, "B1"));
}

TEST_F(AtomicTest, drop_tip_releases_the_tip) {
  const auto r =
      commands::dropTip(commands::DropTipArgs{ kP300Single, kTrash, "A1" }, *ctx, state);
  ASSERT_TRUE(r.ok());
  EXPECT_FALSE(r.success().nextState.hasTip(kP300Single));
  EXPECT_EQ(r.success().instruction, dropTipCmd());
}

//---accumulator-------------------------------------------------------------

TEST_F(AtomicTest, accumulator_threads_state_between_steps) {
  core::ResultAccumulator acc(*ctx, state);
  acc.chain(commands::dispense, pipetting(kP300Single, 40, kDestPlate, "B2"));
  acc.chain(commands::aspirate, pipetting(kP300Single, 15, kDestPlate, "B2"));

  const auto result = std::move(acc).finish();
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.success().instructions.size(), 2u);
  EXPECT_DOUBLE_EQ(result.success().finalState.contents(kDestPlate, "B2")->volume, 25.0);
}

TEST_F(AtomicTest, accumulator_ignores_steps_after_first_failure) {
  core::ResultAccumulator acc(*ctx, state);
  acc.chain(commands::delay, commands::DelayArgs{ 1.0 });
  acc.chain(commands::aspirate, pipetting(kP300Single, 10, "nowhere", "A1"));
  acc.chain(commands::aspirate, pipetting("ghost", 10, kSourcePlate, "A1"));
  EXPECT_TRUE(acc.failed());
  EXPECT_EQ(acc.instructionCount(), 1u);

  const auto result = std::move(acc).finish();
  ASSERT_FALSE(result.ok());
  ASSERT_EQ(result.failure().errors.size(), 1u);
  EXPECT_EQ(result.failure().errors[0].kind, ErrorKind::LabwareDoesNotExist);
  EXPECT_THROW(result.success(), std::logic_error);
}
