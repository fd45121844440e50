#include <gtest/gtest.h>

#include <algorithm>
#include <deque>
#include <memory>
#include <set>
#include <utility>

extern "C" {
#include "../arcade_snake.h"
#include "../../common/arcade_cmn.h"
}

#include "../arcade_snake_internals.hpp"
#include "test_helpers.hpp"

using arcade::Cell;
using arcade::CollisionKind;
using arcade::GameStats;
using arcade::Heading;
using arcade::PowerUp;
using arcade::PowerUpKind;
using arcade::SnakeGame;
using arcade::SnakeState;

namespace {

// Конфигурация без случайных событий во время игры.
SnakeConfig_t QuietConfig(int width_cells = 40, int height_cells = 30) {
  SnakeConfig_t cfg;
  snake_default_config(&cfg);
  cfg.pixel_width = width_cells * cfg.cell_size;
  cfg.pixel_height = height_cells * cfg.cell_size;
  cfg.max_obstacles = 0;
  cfg.powerup_probability = 0.0;
  cfg.obstacle_growth_probability = 0.0;
  cfg.seed = 42;
  return cfg;
}

bool Contains(const std::deque<Cell>& cells, const Cell& c) {
  return std::find(cells.begin(), cells.end(), c) != cells.end();
}

}  // namespace

// Модель с пустым полем: змейка и еда задаются в каждом тесте.
class SnakeModelTest : public ::testing::Test {
 protected:
  std::unique_ptr<SnakeGame> game;

  void SetUp() override { Make(QuietConfig()); }

  void Make(const SnakeConfig_t& cfg) {
    game = std::make_unique<SnakeGame>(cfg);
    game->set_obstacles_for_testing({});
    game->set_power_ups_for_testing({});
  }

  // Змейка [(5,5),(4,5),(3,5)] головой вправо.
  void PlaceDefaultSnake() {
    game->set_snake_for_testing({{5, 5}, {4, 5}, {3, 5}}, Heading::RIGHT);
  }

  void Tick(int n = 1) {
    for (int i = 0; i < n; ++i) {
      game->step();
    }
  }
};

/* ===== Начальное состояние ===== */

TEST(SnakeInitTest, InitialStateWithDefaults) {
  SnakeConfig_t cfg;
  snake_default_config(&cfg);
  cfg.seed = 7;
  SnakeGame game(cfg);

  EXPECT_EQ(game.gridWidth(), 40);
  EXPECT_EQ(game.gridHeight(), 30);
  EXPECT_EQ(game.state(), SnakeState::RUNNING);
  EXPECT_EQ(game.stats().score, 0) << "Счёт в начале игры равен 0";
  EXPECT_EQ(game.stats().level, 1) << "Уровень в начале игры равен 1";
  EXPECT_EQ(game.stats().speed, SNAKE_SPEED_INITIAL);
  EXPECT_FALSE(game.stats().invincible);
  EXPECT_EQ(game.heading(), Heading::RIGHT);
  EXPECT_EQ(game.lastCollision(), CollisionKind::NONE);
  EXPECT_TRUE(game.powerUps().empty());

  const std::deque<Cell> expected{{20, 15}, {19, 15}, {18, 15}};
  EXPECT_EQ(game.snake(), expected) << "Голова в центре, тело тянется влево";

  ASSERT_TRUE(game.food().has_value());
  EXPECT_FALSE(Contains(game.snake(), *game.food()));

  EXPECT_EQ(game.obstacleCap(), 20u);
  EXPECT_EQ(game.obstacles().size(), game.obstacleCap());

  std::set<std::pair<int, int>> unique;
  for (const auto& o : game.obstacles()) {
    EXPECT_FALSE(Contains(game.snake(), o)) << "Препятствие на змейке: " << o;
    EXPECT_NE(o, *game.food()) << "Препятствие на еде";
    EXPECT_GE(o.x, 0);
    EXPECT_LT(o.x, game.gridWidth());
    EXPECT_GE(o.y, 0);
    EXPECT_LT(o.y, game.gridHeight());
    unique.insert({o.x, o.y});
  }
  EXPECT_EQ(unique.size(), game.obstacles().size()) << "Препятствия не повторяются";
}

TEST(SnakeInitTest, ObstacleCapLimitedByArea) {
  SnakeConfig_t cfg = QuietConfig(10, 5);
  cfg.max_obstacles = 20;
  SnakeGame game(cfg);

  EXPECT_EQ(game.obstacleCap(), 5u) << "Не больше одной клетки из десяти";
  EXPECT_EQ(game.obstacles().size(), 5u);
}

TEST(SnakeInitTest, SameSeedSameLayout) {
  SnakeConfig_t cfg;
  snake_default_config(&cfg);
  cfg.seed = 1234;

  SnakeGame a(cfg);
  SnakeGame b(cfg);

  EXPECT_EQ(a.food(), b.food());
  EXPECT_EQ(a.obstacles(), b.obstacles());
}

TEST(SnakeInitTest, FullGridLeavesNoFood) {
  // Поле 2 x 1: змейка длиной 2 занимает его целиком.
  SnakeConfig_t cfg = QuietConfig(2, 1);
  SnakeGame game(cfg);

  EXPECT_EQ(game.snake().size(), 2u);
  EXPECT_FALSE(game.food().has_value()) << "Свободных клеток нет: еды нет";
  EXPECT_TRUE(game.obstacles().empty());
}

/* ===== Движение ===== */

TEST_F(SnakeModelTest, MovesOneCellPerStep) {
  PlaceDefaultSnake();
  game->set_food_for_testing(Cell{30, 20});

  Tick(1);

  const std::deque<Cell> expected{{6, 5}, {5, 5}, {4, 5}};
  EXPECT_EQ(game->snake(), expected);
  EXPECT_EQ(game->ticks(), 1u);
  EXPECT_EQ(game->stats().score, 0);
}

TEST_F(SnakeModelTest, TurnAppliesOnNextStep) {
  PlaceDefaultSnake();
  game->set_food_for_testing(std::nullopt);

  EXPECT_TRUE(game->setHeading(Heading::UP));
  Tick(1);

  EXPECT_EQ(game->snake().front(), (Cell{5, 4}));
}

TEST_F(SnakeModelTest, ReverseHeadingRejected) {
  PlaceDefaultSnake();

  EXPECT_FALSE(game->setHeading(Heading::LEFT)) << "Разворот на 180° запрещён";
  EXPECT_EQ(game->heading(), Heading::RIGHT);
}

TEST_F(SnakeModelTest, DoubleTurnWithinOneTickRejected) {
  PlaceDefaultSnake();
  game->set_food_for_testing(std::nullopt);

  // Вверх, а затем влево до шага: влево противоположно последнему движению.
  EXPECT_TRUE(game->setHeading(Heading::UP));
  EXPECT_FALSE(game->setHeading(Heading::LEFT));
  EXPECT_EQ(game->heading(), Heading::UP);

  Tick(1);
  EXPECT_EQ(game->state(), SnakeState::RUNNING);
  EXPECT_TRUE(game->setHeading(Heading::LEFT)) << "После шага вверх влево можно";
}

TEST_F(SnakeModelTest, HandleInputChangesHeading) {
  PlaceDefaultSnake();

  SnakeGame::handle_input(game.get(), Down, false);
  EXPECT_EQ(game->heading(), Heading::DOWN);

  SnakeGame::handle_input(game.get(), Action, false);
  EXPECT_EQ(game->heading(), Heading::DOWN) << "Action змейкой не используется";
}

/* ===== Еда, счёт, уровень, скорость ===== */

TEST_F(SnakeModelTest, EatingFoodGrowsAndScores) {
  PlaceDefaultSnake();
  game->set_food_for_testing(Cell{6, 5});

  Tick(1);

  const std::deque<Cell> expected{{6, 5}, {5, 5}, {4, 5}, {3, 5}};
  EXPECT_EQ(game->snake(), expected) << "Хвост остаётся на месте при поедании";
  EXPECT_EQ(game->stats().score, 10);
  EXPECT_EQ(game->highScore(), 10);

  ASSERT_TRUE(game->food().has_value()) << "Еда появляется заново";
  EXPECT_FALSE(Contains(game->snake(), *game->food()));
}

TEST_F(SnakeModelTest, LengthGrowsOnlyOnFoodTicks) {
  SnakeConfig_t cfg = QuietConfig();
  cfg.seed = 99;
  Make(cfg);

  int eaten = 0;
  for (int i = 0; i < 500 && game->state() == SnakeState::RUNNING; ++i) {
    const std::size_t before = game->snake().size();
    const auto food = game->food();
    ASSERT_TRUE(food.has_value());

    // Жадно к еде; если поворот отклонён, уходим в сторону к центру поля.
    const Cell head = game->snake().front();
    Heading want = Heading::UP;
    Heading aside = Heading::UP;
    if (head.x != food->x) {
      want = head.x < food->x ? Heading::RIGHT : Heading::LEFT;
      aside = head.y < game->gridHeight() / 2 ? Heading::DOWN : Heading::UP;
    } else {
      want = head.y < food->y ? Heading::DOWN : Heading::UP;
      aside = head.x < game->gridWidth() / 2 ? Heading::RIGHT : Heading::LEFT;
    }
    if (!game->setHeading(want)) {
      game->setHeading(aside);
    }

    const Cell next = arcade::translate(head, game->heading());
    Tick(1);
    if (game->state() != SnakeState::RUNNING) break;

    const std::size_t after = game->snake().size();
    if (next == *food) {
      EXPECT_EQ(after, before + 1) << "Рост на тике с едой";
      ++eaten;
    } else {
      EXPECT_EQ(after, before) << "Длина без еды не меняется";
    }
    if (game->food()) {
      EXPECT_FALSE(Contains(game->snake(), *game->food()));
    }
  }
  EXPECT_GT(eaten, 0);
}

TEST_F(SnakeModelTest, LevelTwoExactlyAtFifty) {
  PlaceDefaultSnake();
  GameStats stats;
  stats.score = 30;
  game->set_stats_for_testing(stats);

  game->set_food_for_testing(Cell{6, 5});
  Tick(1);
  EXPECT_EQ(game->stats().score, 40);
  EXPECT_EQ(game->stats().level, 1);

  game->set_food_for_testing(Cell{7, 5});
  Tick(1);
  EXPECT_EQ(game->stats().score, 50);
  EXPECT_EQ(game->stats().level, 2) << "Уровень 2 ровно на 50 очках";
  EXPECT_EQ(game->stats().speed, SNAKE_SPEED_INITIAL + 1);
}

TEST_F(SnakeModelTest, FoodTickCatchesUpSeveralLevels) {
  PlaceDefaultSnake();
  GameStats stats;
  stats.score = 2 * SNAKE_BONUS_SCORE - SNAKE_FOOD_SCORE;
  game->set_stats_for_testing(stats);

  game->set_food_for_testing(Cell{6, 5});
  Tick(1);

  EXPECT_EQ(game->stats().score, 100);
  EXPECT_EQ(game->stats().level, 3) << "Уровень догоняет счёт за один тик";
}

TEST_F(SnakeModelTest, FoodSpeedIsCapped) {
  PlaceDefaultSnake();
  GameStats stats;
  stats.score = 990;
  stats.level = 20;
  game->set_stats_for_testing(stats);
  game->set_food_for_testing(Cell{6, 5});

  Tick(1);

  EXPECT_EQ(game->stats().speed, SNAKE_SPEED_FOOD_CAP);
}

/* ===== Бонусы ===== */

TEST_F(SnakeModelTest, SpeedPowerUp) {
  PlaceDefaultSnake();
  game->set_food_for_testing(std::nullopt);
  game->set_power_ups_for_testing({PowerUp{{6, 5}, PowerUpKind::SPEED}});

  Tick(1);

  EXPECT_EQ(game->stats().speed, SNAKE_SPEED_INITIAL + SNAKE_SPEED_BOOST);
  EXPECT_TRUE(game->powerUps().empty()) << "Бонус исчезает после сбора";
}

TEST_F(SnakeModelTest, SpeedPowerUpCapped) {
  PlaceDefaultSnake();
  game->set_food_for_testing(std::nullopt);
  GameStats stats;
  stats.speed = SNAKE_SPEED_MAX - 1;
  game->set_stats_for_testing(stats);
  game->set_power_ups_for_testing({PowerUp{{6, 5}, PowerUpKind::SPEED}});

  Tick(1);

  EXPECT_EQ(game->stats().speed, SNAKE_SPEED_MAX);
}

TEST_F(SnakeModelTest, BonusPowerUpAddsScore) {
  PlaceDefaultSnake();
  game->set_food_for_testing(std::nullopt);
  game->set_power_ups_for_testing({PowerUp{{6, 5}, PowerUpKind::BONUS_SCORE}});

  Tick(1);

  EXPECT_EQ(game->stats().score, SNAKE_BONUS_SCORE);
  EXPECT_EQ(game->highScore(), SNAKE_BONUS_SCORE);
  EXPECT_EQ(game->snake().size(), 3u) << "Бонус не удлиняет змейку";
}

TEST_F(SnakeModelTest, InvincibilityLastsExactDuration) {
  // Поле 400 x 30, чтобы пройти вправо больше 300 клеток.
  Make(QuietConfig(400, 30));
  PlaceDefaultSnake();
  game->set_food_for_testing(std::nullopt);
  game->set_power_ups_for_testing({PowerUp{{6, 5}, PowerUpKind::INVINCIBLE}});

  Tick(1);
  ASSERT_TRUE(game->stats().invincible);
  EXPECT_EQ(game->stats().invincible_ticks, SNAKE_DEFAULT_INVINCIBLE_TICKS);

  Tick(SNAKE_DEFAULT_INVINCIBLE_TICKS - 1);
  EXPECT_TRUE(game->stats().invincible);
  EXPECT_EQ(game->stats().invincible_ticks, 1);

  Tick(1);
  EXPECT_FALSE(game->stats().invincible)
      << "Неуязвимость заканчивается ровно через 300 тиков";
  EXPECT_EQ(game->stats().invincible_ticks, 0);
  EXPECT_EQ(game->state(), SnakeState::RUNNING);
}

TEST_F(SnakeModelTest, PowerUpSpawnsAfterFood) {
  SnakeConfig_t cfg = QuietConfig();
  cfg.powerup_probability = 1.0;
  Make(cfg);
  PlaceDefaultSnake();
  game->set_food_for_testing(Cell{6, 5});

  Tick(1);

  ASSERT_EQ(game->powerUps().size(), 1u);
  const PowerUp& p = game->powerUps().front();
  EXPECT_FALSE(Contains(game->snake(), p.cell));
  ASSERT_TRUE(game->food().has_value());
  EXPECT_NE(p.cell, *game->food());
}

/* ===== Препятствия ===== */

TEST_F(SnakeModelTest, ObstaclesGrowUpToCap) {
  SnakeConfig_t cfg = QuietConfig();
  cfg.max_obstacles = 20;
  cfg.obstacle_growth_probability = 1.0;
  Make(cfg);
  PlaceDefaultSnake();
  game->set_food_for_testing(Cell{30, 20});

  Tick(1);

  EXPECT_EQ(game->obstacles().size(), 20u);
  for (const auto& o : game->obstacles()) {
    EXPECT_FALSE(Contains(game->snake(), o));
    EXPECT_NE(o, (Cell{30, 20}));
  }

  Tick(1);
  EXPECT_EQ(game->obstacles().size(), 20u) << "Больше предела не растёт";
}

/* ===== Столкновения ===== */

TEST_F(SnakeModelTest, WallCollision) {
  game->set_snake_for_testing({{39, 5}, {38, 5}, {37, 5}}, Heading::RIGHT);
  game->set_food_for_testing(std::nullopt);

  Tick(1);

  EXPECT_EQ(game->state(), SnakeState::OVER);
  EXPECT_EQ(game->lastCollision(), CollisionKind::WALL);
  EXPECT_EQ(game->snake().front(), (Cell{39, 5})) << "Змейка не сдвигается";
  EXPECT_EQ(game->ticks(), 0u);
}

TEST_F(SnakeModelTest, WallCheckedBeforeObstacle) {
  game->set_snake_for_testing({{0, 5}, {1, 5}, {2, 5}}, Heading::LEFT);
  game->set_obstacles_for_testing({{-1, 5}});

  Tick(1);

  EXPECT_EQ(game->lastCollision(), CollisionKind::WALL);
}

TEST_F(SnakeModelTest, ObstacleCollision) {
  PlaceDefaultSnake();
  game->set_obstacles_for_testing({{6, 5}});

  Tick(1);

  EXPECT_EQ(game->state(), SnakeState::OVER);
  EXPECT_EQ(game->lastCollision(), CollisionKind::OBSTACLE);
}

TEST_F(SnakeModelTest, InvincibleSnakePassesObstacles) {
  PlaceDefaultSnake();
  game->set_obstacles_for_testing({{6, 5}});
  GameStats stats;
  stats.invincible = true;
  stats.invincible_ticks = 10;
  game->set_stats_for_testing(stats);

  Tick(1);

  EXPECT_EQ(game->state(), SnakeState::RUNNING);
  EXPECT_EQ(game->snake().front(), (Cell{6, 5}));
  EXPECT_EQ(game->stats().invincible_ticks, 9);
}

TEST_F(SnakeModelTest, InvincibleSnakeStillHitsWall) {
  game->set_snake_for_testing({{39, 5}, {38, 5}, {37, 5}}, Heading::RIGHT);
  GameStats stats;
  stats.invincible = true;
  stats.invincible_ticks = 10;
  game->set_stats_for_testing(stats);

  Tick(1);

  EXPECT_EQ(game->lastCollision(), CollisionKind::WALL);
}

TEST_F(SnakeModelTest, SelfCollision) {
  game->set_snake_for_testing({{5, 5}, {5, 6}, {4, 6}, {4, 5}, {3, 5}},
                              Heading::LEFT);

  Tick(1);

  EXPECT_EQ(game->state(), SnakeState::OVER);
  EXPECT_EQ(game->lastCollision(), CollisionKind::SELF);
}

TEST_F(SnakeModelTest, MovingIntoTailIsSelfCollision) {
  // Хвост ещё не ушёл, когда проверяется новая голова.
  game->set_snake_for_testing({{5, 5}, {5, 6}, {4, 6}, {4, 5}}, Heading::LEFT);
  game->set_food_for_testing(std::nullopt);

  Tick(1);

  EXPECT_EQ(game->lastCollision(), CollisionKind::SELF);
}

TEST(SnakeNarrowGridTest, OneCellWideGridEndsOnFirstStep) {
  SnakeConfig_t cfg = QuietConfig(1, 30);
  SnakeGame game(cfg);

  ASSERT_EQ(game.gridWidth(), 1);
  EXPECT_EQ(game.snake().size(), 1u) << "На узком поле змейка короче";

  game.step();

  EXPECT_EQ(game.state(), SnakeState::OVER);
  EXPECT_EQ(game.lastCollision(), CollisionKind::WALL);
}

TEST_F(SnakeModelTest, StepAfterGameOverDoesNothing) {
  PlaceDefaultSnake();
  game->set_obstacles_for_testing({{6, 5}});
  Tick(1);
  ASSERT_TRUE(game->isOver());

  const auto frozen = game->snake();
  Tick(5);
  EXPECT_EQ(game->snake(), frozen) << "После GAME OVER поле замирает";
}

/* ===== Пауза, Terminate, сброс ===== */

TEST_F(SnakeModelTest, PauseFreezesAndResumes) {
  PlaceDefaultSnake();
  game->set_food_for_testing(std::nullopt);

  game->togglePause();
  EXPECT_EQ(game->state(), SnakeState::PAUSED);
  EXPECT_EQ(SnakeGame::get_info(game.get())->pause, 1);

  Tick(3);
  EXPECT_EQ(game->snake().front(), (Cell{5, 5})) << "На паузе змейка стоит";

  game->togglePause();
  EXPECT_EQ(game->state(), SnakeState::RUNNING);
  EXPECT_EQ(SnakeGame::get_info(game.get())->pause, 0);

  Tick(1);
  EXPECT_EQ(game->snake().front(), (Cell{6, 5}));
}

TEST_F(SnakeModelTest, TerminateEndsGame) {
  PlaceDefaultSnake();

  game->terminate();

  EXPECT_TRUE(game->isOver());
  EXPECT_EQ(game->lastCollision(), CollisionKind::TERMINATED);
  EXPECT_EQ(SnakeGame::get_info(game.get())->collision,
            ARCADE_COLLISION_TERMINATED);
}

TEST_F(SnakeModelTest, TerminateWhilePaused) {
  game->togglePause();
  game->terminate();

  EXPECT_TRUE(game->isOver());
  EXPECT_EQ(SnakeGame::get_info(game.get())->pause, 0);
}

TEST_F(SnakeModelTest, StartIgnoredWhileRunning) {
  PlaceDefaultSnake();
  SnakeGame::handle_input(game.get(), Start, false);

  EXPECT_EQ(game->state(), SnakeState::RUNNING);
  EXPECT_EQ(game->snake().front(), (Cell{5, 5})) << "Start не сбрасывает партию";
}

TEST_F(SnakeModelTest, ResetKeepsHighScore) {
  PlaceDefaultSnake();
  GameStats stats;
  stats.score = 110;
  stats.level = 3;
  game->set_stats_for_testing(stats);
  game->set_food_for_testing(Cell{6, 5});
  Tick(1);
  ASSERT_EQ(game->highScore(), 120);

  game->reset();

  EXPECT_EQ(game->state(), SnakeState::RUNNING);
  EXPECT_EQ(game->stats().score, 0);
  EXPECT_EQ(game->stats().level, 1);
  EXPECT_EQ(game->highScore(), 120) << "Рекорд переживает сброс";
  EXPECT_EQ(game->snake().size(), static_cast<std::size_t>(SNAKE_INITIAL_LENGTH));
  EXPECT_EQ(game->ticks(), 0u);
  EXPECT_EQ(game->lastCollision(), CollisionKind::NONE);
}

TEST_F(SnakeModelTest, StartAfterGameOverRestarts) {
  PlaceDefaultSnake();
  game->set_obstacles_for_testing({{6, 5}});
  Tick(1);
  ASSERT_TRUE(game->isOver());

  SnakeGame::handle_input(game.get(), Start, false);

  EXPECT_EQ(game->state(), SnakeState::RUNNING);
  EXPECT_EQ(game->snake().front(), (Cell{20, 15}));
}

/* ===== Снимок GameInfo_t ===== */

TEST_F(SnakeModelTest, InfoFieldShowsEntities) {
  PlaceDefaultSnake();
  game->set_food_for_testing(Cell{10, 10});
  game->set_obstacles_for_testing({{0, 0}});
  game->set_power_ups_for_testing({PowerUp{{1, 1}, PowerUpKind::INVINCIBLE}});

  const GameInfo_t* info = SnakeGame::get_info(game.get());
  ASSERT_NE(info, nullptr);
  EXPECT_EQ(info->rows, 30);
  EXPECT_EQ(info->cols, 40);
  EXPECT_EQ(info->field[5][5], ARCADE_CELL_HEAD);
  EXPECT_EQ(info->field[5][4], ARCADE_CELL_BODY);
  EXPECT_EQ(info->field[5][3], ARCADE_CELL_BODY);
  EXPECT_EQ(info->field[10][10], ARCADE_CELL_FOOD);
  EXPECT_EQ(info->field[0][0], ARCADE_CELL_OBSTACLE);
  EXPECT_EQ(info->field[1][1], ARCADE_CELL_POWERUP_INVINCIBLE);
  EXPECT_EQ(info->field[29][39], ARCADE_CELL_EMPTY);
  EXPECT_TRUE(arcade_is_valid_game_info(info));

  // Поле: непрерывный блок: field[0] подходит для ELEMENT_MATRIX.
  EXPECT_EQ(info->field[0][5 * info->cols + 5], ARCADE_CELL_HEAD);
}

/* ===== C API ===== */

TEST(SnakeApiTest, NullSafety) {
  snake_destroy(nullptr);
  snake_handle_input(nullptr, Start, false);
  snake_update(nullptr);
  EXPECT_EQ(snake_get_info(nullptr), nullptr);
  EXPECT_EQ(snake_create_with_config(nullptr), nullptr);
}

TEST(SnakeApiTest, CreateWithDefaults) {
  void* game = snake_create();
  ASSERT_NE(game, nullptr);

  const GameInfo_t* info = snake_get_info(game);
  ASSERT_NE(info, nullptr);
  EXPECT_NE(info->field, nullptr);
  EXPECT_EQ(info->score, 0);
  EXPECT_EQ(info->high_score, 0);
  EXPECT_EQ(info->level, 1);
  EXPECT_EQ(info->speed, SNAKE_SPEED_INITIAL);
  EXPECT_EQ(info->pause, 0);
  EXPECT_EQ(info->game_over, 0);
  EXPECT_TRUE(arcade_is_valid_game_info(info));

  int heads = 0;
  int food = 0;
  for (int y = 0; y < info->rows; ++y) {
    for (int x = 0; x < info->cols; ++x) {
      if (info->field[y][x] == ARCADE_CELL_HEAD) ++heads;
      if (info->field[y][x] == ARCADE_CELL_FOOD) ++food;
    }
  }
  EXPECT_EQ(heads, 1);
  EXPECT_EQ(food, 1);

  snake_destroy(game);
}

TEST(SnakeApiTest, InvalidConfigRejected) {
  SnakeConfig_t cfg;
  snake_default_config(&cfg);
  cfg.cell_size = 0;
  EXPECT_EQ(snake_create_with_config(&cfg), nullptr);
}

TEST(SnakeApiTest, TerminateAndRestartThroughApi) {
  SnakeConfig_t cfg = QuietConfig();
  void* game = snake_create_with_config(&cfg);
  ASSERT_NE(game, nullptr);

  snake_update(game);
  snake_handle_input(game, Terminate, false);
  const GameInfo_t* over = snake_get_info(game);
  EXPECT_EQ(over->game_over, 1);
  EXPECT_EQ(over->collision, ARCADE_COLLISION_TERMINATED);

  snake_handle_input(game, Start, false);
  const GameInfo_t* restarted = snake_get_info(game);
  EXPECT_EQ(restarted->game_over, 0);
  EXPECT_EQ(restarted->collision, ARCADE_COLLISION_NONE);
  EXPECT_EQ(restarted->score, 0);

  snake_destroy(game);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
