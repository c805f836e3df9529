#include <gtest/gtest.h>

#include <vector>

#include "fake_view.hpp"
#include "gsnake_session.hpp"
#include "gsnake_view.hpp"

using gsnake::GameConfig;
using gsnake::Outcome;
using gsnake::Session;
using gsnake::SessionState;
using gsnake::SessionStatus;
using gsnake_test::fake;
using gsnake_test::fake_view;

// Сессия на поле 6x8 без реального ожидания
class SessionTest : public ::testing::Test {
 protected:
  GameConfig config;
  std::vector<int> waits;

  void SetUp() override {
    gsnake_test::reset_fake();
    config.rows = 6;
    config.cols = 8;
    config.seed = 2024;
  }

  gsnake::WaitFn Recorder() {
    return [this](int ms) { waits.push_back(ms); };
  }
};

TEST_F(SessionTest, QuitBeforeFirstMoveCancels) {
  fake().pushKey('q');
  Session session(config, fake_view, 40, 20, Recorder());
  EXPECT_EQ(session.current(), SessionState::WAITING);

  const auto result = session.run();
  EXPECT_EQ(result.status, SessionStatus::CANCELLED);
  EXPECT_EQ(result.score, 0);
  EXPECT_EQ(result.ticks, 0);
  EXPECT_EQ(result.outcome, Outcome::RUNNING);
  EXPECT_EQ(session.current(), SessionState::QUIT);

  EXPECT_EQ(fake().inits, 1);
  EXPECT_EQ(fake().shutdowns, 1) << "View must be closed on quit";
  EXPECT_EQ(fake().renders, 1) << "Initial frame only";
}

TEST_F(SessionTest, ViewGetsZonesAndPalette) {
  config.snake_color = "green";
  fake().pushKey(VIEW_KEY_ESC);
  Session session(config, fake_view, 40, 20, Recorder());
  session.run();

  EXPECT_EQ(fake().width, 40);
  EXPECT_EQ(fake().height, 20);
  EXPECT_EQ(fake().fps, GSNAKE_VIEW_FPS);
  EXPECT_EQ(fake().title, "GridSnake");
  ASSERT_EQ(fake().palette.size(), static_cast<std::size_t>(VIEW_COLOR_COUNT));
  EXPECT_EQ(fake().palette[VIEW_COLOR_SNAKE], "green");
  EXPECT_EQ(fake().palette[VIEW_COLOR_FOOD], "red");

  ASSERT_EQ(fake().zones.count("score"), 1u);
  ASSERT_EQ(fake().zones.count("field"), 1u);
  EXPECT_EQ(fake().zones["score"].h, 3);
  EXPECT_EQ(fake().zones["field"].y, 3);
  EXPECT_EQ(fake().zones["field"].h, 16);

  EXPECT_EQ(fake().last_text, "Score: 0");
  EXPECT_EQ(fake().last_cells.size(), 48u);
  EXPECT_FALSE(fake().last_sprites.empty());
}

TEST_F(SessionTest, IdleWaitUntilFirstMove) {
  fake().pushPause();
  fake().pushPause();
  fake().pushKey('p');
  fake().pushKey('q');
  Session session(config, fake_view, 40, 20, Recorder());
  session.run();

  ASSERT_EQ(waits.size(), 2u);
  EXPECT_EQ(waits[0], 1000 / GSNAKE_VIEW_FPS);
  EXPECT_EQ(waits[1], 1000 / GSNAKE_VIEW_FPS);
}

TEST_F(SessionTest, ReleasedKeyDoesNotStartTheGame) {
  fake().pushKey('d', 0);
  fake().pushKey('q');
  Session session(config, fake_view, 40, 20, Recorder());

  EXPECT_EQ(session.run().status, SessionStatus::CANCELLED);
  EXPECT_EQ(session.ticks(), 0);
}

TEST_F(SessionTest, StraightRunEndsAtTheWall) {
  Session probe(config, fake_view, 40, 20, Recorder());
  const int head_col = probe.state().head().col;

  fake().pushKey('d');
  Session session(config, fake_view, 40, 20, Recorder());
  ASSERT_EQ(session.state().head().col, head_col) << "Same seed, same start";

  const auto result = session.run();
  EXPECT_EQ(result.status, SessionStatus::FINISHED);
  EXPECT_EQ(result.outcome, Outcome::CRASHED);
  EXPECT_EQ(session.current(), SessionState::ENDED);
  EXPECT_EQ(result.ticks, config.cols - head_col);
  EXPECT_EQ(result.score, session.state().score());
  EXPECT_EQ(session.state().head().col, config.cols - 1);

  ASSERT_EQ(static_cast<long>(waits.size()), result.ticks);
  EXPECT_EQ(waits.front(), 425) << "First tick delay for length 1";
  EXPECT_EQ(fake().renders, 1 + static_cast<int>(result.ticks) + 1);
  EXPECT_EQ(fake().shutdowns, 1);
}

TEST_F(SessionTest, QuitDuringPlayCancels) {
  Session session(config, fake_view, 40, 20, Recorder());
  const bool room_right = session.state().head().col < config.cols - 1;

  fake().pushKey(room_right ? 'd' : 'a');
  fake().pushPause();
  fake().pushKey('q');

  const auto result = session.run();
  EXPECT_EQ(result.status, SessionStatus::CANCELLED);
  EXPECT_EQ(result.ticks, 1);
  EXPECT_EQ(session.current(), SessionState::QUIT);
  EXPECT_FALSE(session.state().ended());
  EXPECT_EQ(fake().shutdowns, 1);
}

TEST_F(SessionTest, InitFailureIsAViewError) {
  fake().fail_init = true;
  Session session(config, fake_view, 40, 20, Recorder());
  EXPECT_THROW(session.run(), gsnake::ViewError);
  EXPECT_EQ(fake().shutdowns, 0);
}

TEST_F(SessionTest, RenderFailureClosesTheView) {
  fake().render_result = VIEW_ERROR;
  Session session(config, fake_view, 40, 20, Recorder());

  try {
    session.run();
    FAIL() << "ViewError expected";
  } catch (const gsnake::ViewError& e) {
    EXPECT_EQ(e.result(), VIEW_ERROR);
  }
  EXPECT_EQ(fake().shutdowns, 1);
}

TEST_F(SessionTest, TinyGridIsRejected) {
  config.rows = 1;
  EXPECT_THROW(Session(config, fake_view, 40, 20, Recorder()),
               gsnake::InvalidDimensions);
}
