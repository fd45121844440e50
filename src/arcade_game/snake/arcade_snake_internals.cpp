/**
 * @file arcade_snake_internals.cpp
 * @brief Реализация модели игры "Змейка" на C++17
 *
 * Содержит реализацию класса `arcade::SnakeGame`:
 * - управление состоянием через конечный автомат (FSM)
 * - игровой тик: движение, столкновения, еда, бонусы, препятствия
 * - счёт, уровень, скорость и таймер неуязвимости
 * - синхронизация снимка GameInfo_t для отрисовки
 * - мост к C API через непрозрачные указатели (void*)
 *
 * Архитектурные особенности:
 * - **Единое состояние партии**: всё изменяемое лежит в `GameState`;
 *   reset() заменяет его целиком.
 * - **FSM на основе таблицы переходов**: `transitions_` описывает все
 *   допустимые переходы, у каждого перехода свой колбэк входа.
 * - **Детерминизм**: единственный источник случайности: `rng_`,
 *   зерно берётся из конфигурации.
 *
 * @note Все методы модели помечены `noexcept`: исключения не пересекают
 *       границу C. Исключение: конструктор (std::bad_alloc, std::runtime_error),
 *       его перехватывает create().
 *
 * @see arcade_snake_internals.hpp: объявление класса и типов
 * @see arcade_snake.cpp          : C API обёртка (extern "C")
 */

#include "arcade_snake_internals.hpp"

#include <algorithm>
#include <new>
#include <stdexcept>
#include <utility>

#include "../common/arcade_cmn.h"
#include "../common/arcade_log.h"

#define TAG "snake"

namespace arcade {

namespace {

unsigned int resolveSeed(unsigned int seed) {
  if (seed != 0) return seed;
  std::random_device rd;
  return rd();
}

int cellCodeFor(PowerUpKind kind) noexcept {
  switch (kind) {
    case PowerUpKind::SPEED:
      return ARCADE_CELL_POWERUP_SPEED;
    case PowerUpKind::INVINCIBLE:
      return ARCADE_CELL_POWERUP_INVINCIBLE;
    case PowerUpKind::BONUS_SCORE:
      return ARCADE_CELL_POWERUP_BONUS;
  }
  return ARCADE_CELL_EMPTY;
}

int collisionCodeFor(CollisionKind kind) noexcept {
  switch (kind) {
    case CollisionKind::NONE:
      return ARCADE_COLLISION_NONE;
    case CollisionKind::WALL:
      return ARCADE_COLLISION_WALL;
    case CollisionKind::OBSTACLE:
      return ARCADE_COLLISION_OBSTACLE;
    case CollisionKind::SELF:
      return ARCADE_COLLISION_SELF;
    case CollisionKind::TERMINATED:
      return ARCADE_COLLISION_TERMINATED;
  }
  return ARCADE_COLLISION_NONE;
}

template <typename Container>
bool containsCell(const Container& cells, const Cell& c) {
  return std::find(cells.begin(), cells.end(), c) != cells.end();
}

}  // namespace

/**
 * @internal
 * @brief Таблица переходов конечного автомата игры
 *
 * Каждая запись: { текущее_состояние, событие, новое_состояние, on_exit,
 * on_enter }.
 *
 * - RUNNING + PAUSE_TOGGLE → PAUSED: пауза.
 * - PAUSED + PAUSE_TOGGLE → RUNNING: продолжение.
 * - RUNNING + COLLISION → OVER: столкновение на тике.
 * - RUNNING/PAUSED + TERMINATE → OVER: игрок сдался.
 * - OVER + START → RUNNING: новая игра по кнопке Start.
 * - любое + RESET → RUNNING: явный reset() из кода.
 *
 * @note START в RUNNING и PAUSED перехода не имеет и молча игнорируется.
 */
const fsm_transition_t SnakeGame::transitions_[] = {
    {to_fsm_state(SnakeState::RUNNING), to_fsm_event(SnakeEvent::PAUSE_TOGGLE),
     to_fsm_state(SnakeState::PAUSED), nullptr, &SnakeGame::on_pause_enter_},

    {to_fsm_state(SnakeState::PAUSED), to_fsm_event(SnakeEvent::PAUSE_TOGGLE),
     to_fsm_state(SnakeState::RUNNING), nullptr, &SnakeGame::on_resume_enter_},

    {to_fsm_state(SnakeState::RUNNING), to_fsm_event(SnakeEvent::COLLISION),
     to_fsm_state(SnakeState::OVER), nullptr, &SnakeGame::on_over_enter_},

    {to_fsm_state(SnakeState::RUNNING), to_fsm_event(SnakeEvent::TERMINATE),
     to_fsm_state(SnakeState::OVER), nullptr, &SnakeGame::on_over_enter_},

    {to_fsm_state(SnakeState::PAUSED), to_fsm_event(SnakeEvent::TERMINATE),
     to_fsm_state(SnakeState::OVER), nullptr, &SnakeGame::on_over_enter_},

    {to_fsm_state(SnakeState::OVER), to_fsm_event(SnakeEvent::START),
     to_fsm_state(SnakeState::RUNNING), nullptr, &SnakeGame::on_reset_enter_},

    {to_fsm_state(SnakeState::RUNNING), to_fsm_event(SnakeEvent::RESET),
     to_fsm_state(SnakeState::RUNNING), nullptr, &SnakeGame::on_reset_enter_},

    {to_fsm_state(SnakeState::PAUSED), to_fsm_event(SnakeEvent::RESET),
     to_fsm_state(SnakeState::RUNNING), nullptr, &SnakeGame::on_reset_enter_},

    {to_fsm_state(SnakeState::OVER), to_fsm_event(SnakeEvent::RESET),
     to_fsm_state(SnakeState::RUNNING), nullptr, &SnakeGame::on_reset_enter_},
};

/**
 * @brief Создаёт новый экземпляр игры
 * @param[in] config Конфигурация; nullptr: значения по умолчанию.
 * @return Непрозрачный указатель или nullptr, если конфигурация некорректна
 *         или не хватило памяти.
 *
 * @warning Освобождать только через destroy().
 */
void* SnakeGame::create(const SnakeConfig_t* config) noexcept {
  SnakeConfig_t effective;
  if (config != nullptr) {
    effective = *config;
  } else {
    snake_default_config(&effective);
  }

  ConfigResult_t check = snake_validate_config(&effective);
  if (check != CONFIG_OK) {
    ARCADE_LOG_ERROR(TAG, "invalid config: %s", snake_config_error_str(check));
    return nullptr;
  }

  try {
    return new SnakeGame(effective);
  } catch (const std::exception& e) {
    ARCADE_LOG_ERROR(TAG, "failed to create game: %s", e.what());
    return nullptr;
  }
}

void SnakeGame::destroy(void* game) noexcept {
  if (game != nullptr) {
    delete static_cast<SnakeGame*>(game);
  }
}

/**
 * @brief Обрабатывает действие пользователя
 *
 * Действие преобразуется в событие (mapActionToEvent_()) и передаётся в
 * processEvent_(). Флаг `hold` змейкой не используется.
 *
 * @note Разворот на 180° отклоняется в setHeading().
 * @note Start действует только в состоянии OVER.
 */
void SnakeGame::handle_input(void* game, UserAction_t action,
                             bool hold) noexcept {
  (void)hold;
  if (game == nullptr) return;
  auto* self = static_cast<SnakeGame*>(game);
  SnakeEvent event = self->mapActionToEvent_(action);
  if (event != SnakeEvent::NONE) {
    self->processEvent_(event);
  }
}

void SnakeGame::update(void* game) noexcept {
  if (game == nullptr) return;
  static_cast<SnakeGame*>(game)->step();
}

/**
 * @brief Снимок состояния для отрисовки
 *
 * Перед возвратом синхронизирует info_ с моделью (updateFieldState_()).
 * Указатель остаётся валидным до следующего update() или destroy().
 */
const GameInfo_t* SnakeGame::get_info(const void* game) noexcept {
  if (game == nullptr) {
    return nullptr;
  }
  // Снимок кэшируется в самом объекте: синхронизация меняет только info_.
  auto* self = const_cast<SnakeGame*>(static_cast<const SnakeGame*>(game));
  self->updateFieldState_();
  return &self->info_;
}

SnakeGame::SnakeGame(const SnakeConfig_t& config)
    : config_(config),
      placement_(config.pixel_width / config.cell_size,
                 config.pixel_height / config.cell_size),
      rng_(resolveSeed(config.seed)) {
  info_ = arcade_create_game_info(placement_.height(), placement_.width());
  if (info_.field == nullptr) {
    throw std::bad_alloc();
  }

  if (!fsm_init(&fsm_, this, transitions_,
                sizeof(transitions_) / sizeof(transitions_[0]),
                to_fsm_state(SnakeState::RUNNING))) {
    arcade_destroy_game_info(&info_);
    throw std::runtime_error("fsm initialization failed");
  }

  state_ = makeInitialState_();
  updateFieldState_();

  ARCADE_LOG_INFO(TAG, "game created: grid %dx%d, %zu obstacles, seed %u",
                  gridWidth(), gridHeight(), state_.obstacles.size(),
                  config_.seed);
}

SnakeGame::~SnakeGame() noexcept {
  fsm_destroy(&fsm_);
  arcade_destroy_game_info(&info_);
}

/**
 * @private
 * @brief Начальное состояние партии
 *
 * - змейка длиной SNAKE_INITIAL_LENGTH (на узком поле короче), голова в
 *   центре поля, тело тянется влево, направление: вправо
 * - еда вне змейки
 * - препятствия до obstacleCap(), вне змейки и еды
 * - бонусов нет, счёт 0, уровень 1, скорость SNAKE_SPEED_INITIAL
 */
GameState SnakeGame::makeInitialState_() noexcept {
  GameState s;

  const int start_x = gridWidth() / 2;
  const int start_y = gridHeight() / 2;
  const int length = std::min(SNAKE_INITIAL_LENGTH, start_x + 1);

  for (int i = 0; i < length; ++i) {
    s.snake.emplace_back(start_x - i, start_y);
  }
  s.heading = Heading::RIGHT;
  s.moved_heading = Heading::RIGHT;

  s.food = placement_.generateFood(s.snake, s.obstacles, s.power_ups, rng_);
  placement_.generateObstacles(s.snake, s.food, s.power_ups, s.obstacles,
                               obstacleCap(), rng_);
  return s;
}

void SnakeGame::resetState_() noexcept {
  GameState fresh = makeInitialState_();
  state_ = std::move(fresh);
  paused_ = false;
  ARCADE_LOG_INFO(TAG, "game reset, high score %d", high_score_);
}

std::size_t SnakeGame::obstacleCap() const noexcept {
  const std::size_t by_area = placement_.area() / SNAKE_OBSTACLE_AREA_DIVISOR;
  return std::min(static_cast<std::size_t>(config_.max_obstacles), by_area);
}

/**
 * @brief Один игровой тик
 *
 * Порядок действий:
 * 1. Новая голова = голова + направление.
 * 2. Столкновения: стена, препятствие (если нет неуязвимости), тело до
 *    перемещения. Первое найденное завершает игру, дальше ничего не
 *    применяется.
 * 3. Голова добавляется в начало.
 * 4. Еда: счёт, новая еда, скорость, шанс бонуса, уровень. Иначе хвост
 *    удаляется.
 * 5. Таймер неуязвимости.
 * 6. Сбор бонуса в клетке головы.
 * 7. Шанс дорастить препятствия до предела.
 */
void SnakeGame::step() noexcept {
  if (state() != SnakeState::RUNNING || state_.snake.empty()) {
    return;
  }

  state_.moved_heading = state_.heading;
  const Cell new_head = translate(state_.snake.front(), state_.heading);

  CollisionKind hit = detectCollision_(new_head);
  if (hit != CollisionKind::NONE) {
    handleCollision_(hit);
    return;
  }

  ++state_.ticks;
  state_.snake.push_front(new_head);

  if (state_.food && *state_.food == new_head) {
    eatFood_();
  } else {
    state_.snake.pop_back();
  }

  tickInvincibility_();
  collectPowerUp_(new_head);
  growObstacles_();
  updateHighScore_();
}

CollisionKind SnakeGame::detectCollision_(const Cell& head) const noexcept {
  if (!placement_.contains(head)) {
    return CollisionKind::WALL;
  }
  if (!state_.stats.invincible && containsCell(state_.obstacles, head)) {
    return CollisionKind::OBSTACLE;
  }
  // Тело до перемещения, включая хвост.
  if (containsCell(state_.snake, head)) {
    return CollisionKind::SELF;
  }
  return CollisionKind::NONE;
}

void SnakeGame::handleCollision_(CollisionKind kind) noexcept {
  state_.collision = kind;
  processEvent_(SnakeEvent::COLLISION);  // RUNNING → OVER
}

/**
 * @private
 * @brief Голова попала на еду
 *
 * Змейка уже выросла (хвост не удалён). Если свободных клеток для новой еды
 * нет, еда пропадает до конца партии.
 */
void SnakeGame::eatFood_() noexcept {
  GameStats& stats = state_.stats;
  stats.score += SNAKE_FOOD_SCORE;

  state_.food = placement_.generateFood(state_.snake, state_.obstacles,
                                        state_.power_ups, rng_);

  stats.speed =
      std::min(SNAKE_SPEED_INITIAL + stats.score / SNAKE_SPEED_SCORE_STEP,
               SNAKE_SPEED_FOOD_CAP);

  placement_.maybeGeneratePowerUp(state_.snake, state_.obstacles, state_.food,
                                  state_.power_ups, config_.powerup_probability,
                                  rng_);

  while (stats.score >= stats.level * SNAKE_LEVEL_STEP) {
    ++stats.level;
    ARCADE_LOG_INFO(TAG, "level %d reached at score %d", stats.level,
                    stats.score);
  }
}

void SnakeGame::tickInvincibility_() noexcept {
  GameStats& stats = state_.stats;
  if (stats.invincible_ticks > 0) {
    --stats.invincible_ticks;
    if (stats.invincible_ticks == 0) {
      stats.invincible = false;
      ARCADE_LOG_DEBUG(TAG, "invincibility expired");
    }
  }
}

void SnakeGame::collectPowerUp_(const Cell& head) noexcept {
  auto& power_ups = state_.power_ups;
  auto it = std::find_if(power_ups.begin(), power_ups.end(),
                         [&head](const PowerUp& p) { return p.cell == head; });
  if (it == power_ups.end()) {
    return;
  }

  PowerUpKind kind = it->kind;
  power_ups.erase(it);
  applyPowerUp_(kind);
  ARCADE_LOG_INFO(TAG, "power-up %s collected at (%d, %d)", toString(kind),
                  head.x, head.y);
}

void SnakeGame::applyPowerUp_(PowerUpKind kind) noexcept {
  GameStats& stats = state_.stats;
  switch (kind) {
    case PowerUpKind::SPEED:
      stats.speed = std::min(stats.speed + SNAKE_SPEED_BOOST, SNAKE_SPEED_MAX);
      break;
    case PowerUpKind::INVINCIBLE:
      stats.invincible = true;
      stats.invincible_ticks = config_.invincible_ticks;
      break;
    case PowerUpKind::BONUS_SCORE:
      stats.score += SNAKE_BONUS_SCORE;
      break;
  }
}

void SnakeGame::growObstacles_() noexcept {
  const std::size_t cap = obstacleCap();
  if (state_.obstacles.size() >= cap) {
    return;
  }

  std::bernoulli_distribution growth(config_.obstacle_growth_probability);
  if (!growth(rng_)) {
    return;
  }

  std::size_t added =
      placement_.generateObstacles(state_.snake, state_.food, state_.power_ups,
                                   state_.obstacles, cap, rng_);
  ARCADE_LOG_DEBUG(TAG, "%zu obstacles added, %zu total", added,
                   state_.obstacles.size());
}

void SnakeGame::updateHighScore_() noexcept {
  if (state_.stats.score > high_score_) {
    high_score_ = state_.stats.score;
  }
}

bool SnakeGame::setHeading(Heading heading) noexcept {
  if (isOpposite(heading, state_.moved_heading)) {
    return false;
  }
  state_.heading = heading;
  return true;
}

void SnakeGame::reset() noexcept { processEvent_(SnakeEvent::RESET); }

void SnakeGame::togglePause() noexcept {
  processEvent_(SnakeEvent::PAUSE_TOGGLE);
}

void SnakeGame::terminate() noexcept { processEvent_(SnakeEvent::TERMINATE); }

/**
 * @private
 * @brief Синхронизирует info_ с моделью
 *
 * Порядок заполнения поля: препятствия, бонусы, еда, тело, голова: поздние
 * слои перекрывают ранние (при неуязвимости голова может стоять на
 * препятствии). Клетки вне сетки пропускаются.
 */
void SnakeGame::updateFieldState_() noexcept {
  const int rows = info_.rows;
  const int cols = info_.cols;
  arcade_clear_field(info_.field, rows, cols);

  auto put = [&](const Cell& c, int value) {
    if (c.x >= 0 && c.x < cols && c.y >= 0 && c.y < rows) {
      info_.field[c.y][c.x] = value;
    }
  };

  for (const auto& obstacle : state_.obstacles) {
    put(obstacle, ARCADE_CELL_OBSTACLE);
  }
  for (const auto& power_up : state_.power_ups) {
    put(power_up.cell, cellCodeFor(power_up.kind));
  }
  if (state_.food) {
    put(*state_.food, ARCADE_CELL_FOOD);
  }
  for (std::size_t i = 1; i < state_.snake.size(); ++i) {
    put(state_.snake[i], ARCADE_CELL_BODY);
  }
  if (!state_.snake.empty()) {
    put(state_.snake.front(), ARCADE_CELL_HEAD);
  }

  const GameStats& stats = state_.stats;
  info_.score = stats.score;
  info_.high_score = high_score_;
  info_.level = stats.level;
  info_.speed = stats.speed;
  info_.pause = paused_ ? 1 : 0;
  info_.invincible = stats.invincible ? 1 : 0;
  info_.invincible_ticks = stats.invincible_ticks;
  info_.game_over = isOver() ? 1 : 0;
  info_.collision = collisionCodeFor(state_.collision);
}

SnakeEvent SnakeGame::mapActionToEvent_(UserAction_t action) const noexcept {
  switch (action) {
    case Start:
      return SnakeEvent::START;
    case Pause:
      return SnakeEvent::PAUSE_TOGGLE;
    case Terminate:
      return SnakeEvent::TERMINATE;
    case Left:
      return SnakeEvent::MOVE_LEFT;
    case Right:
      return SnakeEvent::MOVE_RIGHT;
    case Up:
      return SnakeEvent::MOVE_UP;
    case Down:
      return SnakeEvent::MOVE_DOWN;
    case Action:
      return SnakeEvent::NONE;
  }
  return SnakeEvent::NONE;
}

void SnakeGame::processEvent_(SnakeEvent ev) noexcept {
  switch (ev) {
    case SnakeEvent::NONE:
      return;
    case SnakeEvent::MOVE_LEFT:
      setHeading(Heading::LEFT);
      return;
    case SnakeEvent::MOVE_RIGHT:
      setHeading(Heading::RIGHT);
      return;
    case SnakeEvent::MOVE_UP:
      setHeading(Heading::UP);
      return;
    case SnakeEvent::MOVE_DOWN:
      setHeading(Heading::DOWN);
      return;
    case SnakeEvent::TERMINATE:
      if (state() != SnakeState::OVER) {
        state_.collision = CollisionKind::TERMINATED;
      }
      break;
    default:
      break;
  }
  fsm_process_event(&fsm_, to_fsm_event(ev));
}

void SnakeGame::on_pause_enter_(fsm_context_t ctx) {
  static_cast<SnakeGame*>(ctx)->paused_ = true;
}

void SnakeGame::on_resume_enter_(fsm_context_t ctx) {
  static_cast<SnakeGame*>(ctx)->paused_ = false;
}

void SnakeGame::on_over_enter_(fsm_context_t ctx) {
  auto* self = static_cast<SnakeGame*>(ctx);
  self->paused_ = false;
  self->updateHighScore_();
  ARCADE_LOG_INFO(TAG, "game over (%s): score %d, length %zu, %llu ticks",
                  toString(self->state_.collision), self->state_.stats.score,
                  self->state_.snake.size(),
                  static_cast<unsigned long long>(self->state_.ticks));
}

void SnakeGame::on_reset_enter_(fsm_context_t ctx) {
  static_cast<SnakeGame*>(ctx)->resetState_();
}

#ifdef SNAKE_TEST_ACCESS
void SnakeGame::set_snake_for_testing(std::deque<Cell> body, Heading heading) {
  state_.snake = std::move(body);
  state_.heading = heading;
  state_.moved_heading = heading;
}

void SnakeGame::set_food_for_testing(std::optional<Cell> food) {
  state_.food = food;
}

void SnakeGame::set_obstacles_for_testing(std::vector<Cell> obstacles) {
  state_.obstacles = std::move(obstacles);
}

void SnakeGame::set_power_ups_for_testing(std::vector<PowerUp> power_ups) {
  state_.power_ups = std::move(power_ups);
}

void SnakeGame::set_stats_for_testing(const GameStats& stats) {
  state_.stats = stats;
}
#endif

}  // namespace arcade
