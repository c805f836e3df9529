#include <gtest/gtest.h>

#include "fake_view.hpp"
#include "gsnake_input.hpp"
#include "gsnake_view.hpp"

using gsnake::Command;
using gsnake::GameState;
using gsnake_test::fake;
using gsnake_test::fake_view;

/* ===== Раскладка клавиш ===== */

TEST(MapKeyTest, WasdInBothCases) {
  EXPECT_EQ(gsnake::map_key('w'), Command::UP);
  EXPECT_EQ(gsnake::map_key('W'), Command::UP);
  EXPECT_EQ(gsnake::map_key('a'), Command::LEFT);
  EXPECT_EQ(gsnake::map_key('A'), Command::LEFT);
  EXPECT_EQ(gsnake::map_key('s'), Command::DOWN);
  EXPECT_EQ(gsnake::map_key('S'), Command::DOWN);
  EXPECT_EQ(gsnake::map_key('d'), Command::RIGHT);
  EXPECT_EQ(gsnake::map_key('D'), Command::RIGHT);
}

TEST(MapKeyTest, QuitKeys) {
  EXPECT_EQ(gsnake::map_key('q'), Command::QUIT);
  EXPECT_EQ(gsnake::map_key('Q'), Command::QUIT);
  EXPECT_EQ(gsnake::map_key(VIEW_KEY_ESC), Command::QUIT);
}

TEST(MapKeyTest, OtherKeysAreIgnored) {
  EXPECT_EQ(gsnake::map_key(' '), Command::NONE);
  EXPECT_EQ(gsnake::map_key('p'), Command::NONE);
  EXPECT_EQ(gsnake::map_key('\n'), Command::NONE);
  EXPECT_EQ(gsnake::map_key(0), Command::NONE);
}

TEST(MapKeyTest, DirectionVectors) {
  EXPECT_EQ(gsnake::to_direction(Command::UP), gsnake::kUp);
  EXPECT_EQ(gsnake::to_direction(Command::DOWN), gsnake::kDown);
  EXPECT_EQ(gsnake::to_direction(Command::LEFT), gsnake::kLeft);
  EXPECT_EQ(gsnake::to_direction(Command::RIGHT), gsnake::kRight);
  EXPECT_TRUE(gsnake::to_direction(Command::QUIT).isZero());
  EXPECT_TRUE(gsnake::to_direction(Command::NONE).isZero());

  EXPECT_TRUE(gsnake::is_direction(Command::LEFT));
  EXPECT_FALSE(gsnake::is_direction(Command::QUIT));
  EXPECT_FALSE(gsnake::is_direction(Command::NONE));
}

/* ===== Выборка событий ===== */

class DispatchTest : public ::testing::Test {
 protected:
  GameState state{8, 8, 5};
  ViewHandle_t handle = nullptr;

  void SetUp() override {
    gsnake_test::reset_fake();
    ViewConfig_t config{};
    config.width = 10;
    config.height = 10;
    config.fps = 30;
    handle = fake_view.init(&config);
    ASSERT_NE(handle, nullptr);
  }
};

TEST_F(DispatchTest, DrainsAllPendingEvents) {
  fake().pushKey('d');
  fake().pushKey('x');
  fake().pushKey('w');

  const auto result = gsnake::dispatch_pending(fake_view, handle, state);
  EXPECT_FALSE(result.quit);
  EXPECT_EQ(result.directions, 2);
  EXPECT_TRUE(fake().script.empty());

  // Первый ход без блокировки, второй — поворот с блокировкой
  EXPECT_EQ(state.direction(), gsnake::kUp);
  EXPECT_TRUE(state.moveLocked());
}

TEST_F(DispatchTest, StopsAtQuit) {
  fake().pushKey('a');
  fake().pushKey('q');
  fake().pushKey('d');

  const auto result = gsnake::dispatch_pending(fake_view, handle, state);
  EXPECT_TRUE(result.quit);
  EXPECT_EQ(result.directions, 1);
  EXPECT_EQ(fake().script.size(), 1u) << "Events after quit stay queued";
  EXPECT_EQ(state.direction(), gsnake::kLeft);
}

TEST_F(DispatchTest, SkipsKeyReleases) {
  fake().pushKey('s', 0);
  fake().pushKey('q', 0);

  const auto result = gsnake::dispatch_pending(fake_view, handle, state);
  EXPECT_FALSE(result.quit);
  EXPECT_EQ(result.directions, 0);
  EXPECT_TRUE(state.direction().isZero());
}

TEST_F(DispatchTest, EmptyQueueIsANoOp) {
  const auto result = gsnake::dispatch_pending(fake_view, handle, state);
  EXPECT_FALSE(result.quit);
  EXPECT_EQ(result.directions, 0);
  EXPECT_EQ(fake().polls, 1);
}

TEST_F(DispatchTest, PollErrorIsReported) {
  fake().poll_result = VIEW_ERROR;
  try {
    gsnake::dispatch_pending(fake_view, handle, state);
    FAIL() << "ViewError expected";
  } catch (const gsnake::ViewError& e) {
    EXPECT_EQ(e.result(), VIEW_ERROR);
    EXPECT_NE(std::string(e.what()).find("poll_input"), std::string::npos);
  }
}
