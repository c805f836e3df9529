#include <gtest/gtest.h>

#include <string>

extern "C" {
#include "fsm/fsm.h"
}

namespace {

enum { IDLE = 1, ACTIVE, DONE };
enum { START = 1, STOP, NESTED };

struct Recorder {
  std::string log;
  fsm_t* fsm = nullptr;
  bool nested_result = true;
};

void onExit(fsm_context_t ctx) { static_cast<Recorder*>(ctx)->log += "x"; }
void onEnter(fsm_context_t ctx) { static_cast<Recorder*>(ctx)->log += "e"; }

// Попытка обработать событие изнутри колбэка
void onEnterNested(fsm_context_t ctx) {
  auto* rec = static_cast<Recorder*>(ctx);
  rec->nested_result = fsm_process_event(rec->fsm, STOP);
}

const fsm_transition_t kTable[] = {
    {IDLE, START, ACTIVE, onExit, onEnter},
    {ACTIVE, STOP, DONE, onExit, onEnter},
    {ACTIVE, NESTED, ACTIVE, nullptr, onEnterNested},
    {DONE, FSM_EVENT_NONE, IDLE, nullptr, onEnter},
};
constexpr size_t kTableSize = sizeof(kTable) / sizeof(kTable[0]);

}  // namespace

class FsmTest : public ::testing::Test {
 protected:
  fsm_t fsm{};
  Recorder rec;

  void SetUp() override {
    rec.fsm = &fsm;
    ASSERT_TRUE(fsm_init(&fsm, &rec, kTable, kTableSize, IDLE));
  }

  void TearDown() override { fsm_destroy(&fsm); }
};

TEST(FsmInitTest, RejectsMissingTable) {
  fsm_t fsm{};
  EXPECT_FALSE(fsm_init(nullptr, nullptr, kTable, kTableSize, IDLE));
  EXPECT_FALSE(fsm_init(&fsm, nullptr, nullptr, kTableSize, IDLE));
  EXPECT_FALSE(fsm_init(&fsm, nullptr, kTable, 0, IDLE));
  EXPECT_EQ(fsm_current(nullptr), -1);
}

TEST_F(FsmTest, StartStateWithoutCallbacks) {
  EXPECT_EQ(fsm_current(&fsm), IDLE);
  EXPECT_TRUE(rec.log.empty()) << "on_enter must not run for the start state";
}

TEST_F(FsmTest, TransitionRunsExitThenEnter) {
  EXPECT_TRUE(fsm_process_event(&fsm, START));
  EXPECT_EQ(fsm_current(&fsm), ACTIVE);
  EXPECT_EQ(rec.log, "xe");
}

TEST_F(FsmTest, UnknownEventIsIgnored) {
  EXPECT_FALSE(fsm_process_event(&fsm, STOP));
  EXPECT_EQ(fsm_current(&fsm), IDLE);
  EXPECT_TRUE(rec.log.empty());
}

TEST_F(FsmTest, NestedEventIsRejected) {
  ASSERT_TRUE(fsm_process_event(&fsm, START));
  EXPECT_TRUE(fsm_process_event(&fsm, NESTED));
  EXPECT_FALSE(rec.nested_result) << "Recursive processing must be refused";
  EXPECT_EQ(fsm_current(&fsm), ACTIVE);

  EXPECT_TRUE(fsm_process_event(&fsm, STOP)) << "Guard is released afterwards";
  EXPECT_EQ(fsm_current(&fsm), DONE);
}

TEST_F(FsmTest, UpdateFollowsNoneTransition) {
  fsm_update(&fsm);
  EXPECT_EQ(fsm_current(&fsm), IDLE) << "IDLE has no automatic transition";

  ASSERT_TRUE(fsm_process_event(&fsm, START));
  ASSERT_TRUE(fsm_process_event(&fsm, STOP));
  rec.log.clear();
  fsm_update(&fsm);
  EXPECT_EQ(fsm_current(&fsm), IDLE);
  EXPECT_EQ(rec.log, "e");
}

TEST_F(FsmTest, DestroyedMachineIgnoresEvents) {
  fsm_destroy(&fsm);
  EXPECT_FALSE(fsm_process_event(&fsm, START));
  fsm_update(&fsm);
  fsm_destroy(nullptr);
  EXPECT_EQ(fsm_current(&fsm), IDLE);
}
