/**
 * @file arcade_snake_internals.hpp
 * @brief Внутренняя C++ модель игры "Змейка"
 *
 * Класс `arcade::SnakeGame` владеет всем состоянием игры и реализует
 * игровой тик:
 * - движение змейки на одну клетку по текущему направлению
 * - столкновения в порядке стена -> препятствие -> тело
 * - еда, рост, счёт, уровень, скорость
 * - бонусы (скорость, неуязвимость, очки) и таймер неуязвимости
 * - постепенное появление новых препятствий
 *
 * Состояния RUNNING / PAUSED / OVER переключаются таблицей переходов
 * универсального FSM (fsm.h). Для C-кода класс доступен только через
 * статические методы create / destroy / handle_input / update / get_info,
 * которые вызывает обёртка arcade_snake.cpp.
 *
 * @note Не потокобезопасен: все вызовы из одного потока.
 * @see arcade_snake.h: C API
 * @see snake_placement.hpp: размещение сущностей
 */

#ifndef ARCADE_SNAKE_INTERNALS_HPP
#define ARCADE_SNAKE_INTERNALS_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <random>
#include <vector>

extern "C" {
#include "../../fsm/fsm.h"
}

#include "arcade_snake.h"
#include "snake_placement.hpp"
#include "snake_types.hpp"

namespace arcade {

/**
 * @brief Состояния игры. Значения совпадают с fsm_state_t.
 */
enum class SnakeState : int {
  RUNNING = 0,
  PAUSED,
  OVER,
};

/**
 * @brief События FSM. Значение 0 зарезервировано под FSM_EVENT_NONE.
 *
 * MOVE_* не являются переходами FSM: они меняют направление напрямую.
 */
enum class SnakeEvent : int {
  NONE = FSM_EVENT_NONE,
  START,
  PAUSE_TOGGLE,
  COLLISION,
  TERMINATE,
  RESET,
  MOVE_LEFT,
  MOVE_RIGHT,
  MOVE_UP,
  MOVE_DOWN,
};

constexpr fsm_state_t to_fsm_state(SnakeState s) noexcept {
  return static_cast<fsm_state_t>(s);
}

constexpr fsm_event_t to_fsm_event(SnakeEvent e) noexcept {
  return static_cast<fsm_event_t>(e);
}

constexpr SnakeState from_fsm_state(fsm_state_t s) noexcept {
  return static_cast<SnakeState>(s);
}

/**
 * @brief Полное изменяемое состояние одной партии.
 *
 * reset() строит новый экземпляр и заменяет им текущий одним
 * присваиванием, поэтому частично сброшенное состояние не наблюдается.
 */
struct GameState {
  std::deque<Cell> snake;        ///< Голова: front()
  Heading heading = Heading::RIGHT;        ///< Применяется на следующем шаге
  Heading moved_heading = Heading::RIGHT;  ///< Направление последнего шага
  std::optional<Cell> food;      ///< Пусто, если свободных клеток не осталось
  std::vector<Cell> obstacles;
  std::vector<PowerUp> power_ups;
  GameStats stats;
  CollisionKind collision = CollisionKind::NONE;
  std::uint64_t ticks = 0;       ///< Выполненные шаги в состоянии RUNNING
};

class SnakeGame {
 public:
  /**
   * @brief Новая партия в состоянии RUNNING.
   *
   * @param config Проверенная конфигурация (snake_validate_config() == OK).
   * @throws std::bad_alloc если не удалось выделить поле GameInfo_t.
   * @throws std::runtime_error если не удалось инициализировать FSM.
   */
  explicit SnakeGame(const SnakeConfig_t& config);
  ~SnakeGame() noexcept;

  SnakeGame(const SnakeGame&) = delete;
  SnakeGame& operator=(const SnakeGame&) = delete;
  SnakeGame(SnakeGame&&) = delete;
  SnakeGame& operator=(SnakeGame&&) = delete;

  // ---- Мост для C API ----

  static void* create(const SnakeConfig_t* config) noexcept;
  static void destroy(void* game) noexcept;
  static void handle_input(void* game, UserAction_t action, bool hold) noexcept;
  static void update(void* game) noexcept;
  static const GameInfo_t* get_info(const void* game) noexcept;

  // ---- Модель ----

  /**
   * @brief Один игровой тик. Ничего не делает вне состояния RUNNING.
   */
  void step() noexcept;

  /**
   * @brief Запросить смену направления на следующем шаге.
   *
   * Направление, противоположное направлению последнего шага, отклоняется.
   *
   * @return true, если запрос принят.
   */
  bool setHeading(Heading heading) noexcept;

  /**
   * @brief Начать новую партию из любого состояния.
   *
   * Рекорд (high score) сохраняется.
   */
  void reset() noexcept;

  void togglePause() noexcept;

  /// Игрок сдаётся: RUNNING/PAUSED -> OVER.
  void terminate() noexcept;

  const std::deque<Cell>& snake() const noexcept { return state_.snake; }
  const std::optional<Cell>& food() const noexcept { return state_.food; }
  const std::vector<Cell>& obstacles() const noexcept {
    return state_.obstacles;
  }
  const std::vector<PowerUp>& powerUps() const noexcept {
    return state_.power_ups;
  }
  const GameStats& stats() const noexcept { return state_.stats; }
  Heading heading() const noexcept { return state_.heading; }
  CollisionKind lastCollision() const noexcept { return state_.collision; }
  std::uint64_t ticks() const noexcept { return state_.ticks; }
  int highScore() const noexcept { return high_score_; }

  SnakeState state() const noexcept {
    return from_fsm_state(fsm_current(&fsm_));
  }
  bool isOver() const noexcept { return state() == SnakeState::OVER; }

  int gridWidth() const noexcept { return placement_.width(); }
  int gridHeight() const noexcept { return placement_.height(); }

  /// Предел числа препятствий: min(max_obstacles, площадь / 10).
  std::size_t obstacleCap() const noexcept;

  const SnakeConfig_t& config() const noexcept { return config_; }

#ifdef SNAKE_TEST_ACCESS
  // Для тестов: сборка произвольного состояния.
  void set_snake_for_testing(std::deque<Cell> body, Heading heading);
  void set_food_for_testing(std::optional<Cell> food);
  void set_obstacles_for_testing(std::vector<Cell> obstacles);
  void set_power_ups_for_testing(std::vector<PowerUp> power_ups);
  void set_stats_for_testing(const GameStats& stats);
#endif

 private:
  GameState makeInitialState_() noexcept;
  void resetState_() noexcept;

  CollisionKind detectCollision_(const Cell& head) const noexcept;
  void handleCollision_(CollisionKind kind) noexcept;
  void eatFood_() noexcept;
  void tickInvincibility_() noexcept;
  void collectPowerUp_(const Cell& head) noexcept;
  void applyPowerUp_(PowerUpKind kind) noexcept;
  void growObstacles_() noexcept;
  void updateHighScore_() noexcept;

  void updateFieldState_() noexcept;

  SnakeEvent mapActionToEvent_(UserAction_t action) const noexcept;
  void processEvent_(SnakeEvent ev) noexcept;

  static void on_pause_enter_(fsm_context_t ctx);
  static void on_resume_enter_(fsm_context_t ctx);
  static void on_over_enter_(fsm_context_t ctx);
  static void on_reset_enter_(fsm_context_t ctx);

  static const fsm_transition_t transitions_[];

  SnakeConfig_t config_;
  Placement placement_;
  std::mt19937 rng_;
  GameState state_;
  int high_score_ = 0;
  bool paused_ = false;
  GameInfo_t info_;
  fsm_t fsm_;
};

}  // namespace arcade

#endif  // ARCADE_SNAKE_INTERNALS_HPP
