/**
 * @file snake_types.hpp
 * @brief Базовые типы модели "Змейка": клетка, направление, бонусы, статистика
 *
 * Все типы: простые значения без владения ресурсами. Используются моделью
 * (SnakeGame), модулем размещения (Placement) и тестами.
 */

#ifndef ARCADE_SNAKE_TYPES_HPP
#define ARCADE_SNAKE_TYPES_HPP

#include <cstdint>

#include "snakepref.h"

namespace arcade {

/**
 * @brief Клетка сетки (x: столбец, y: строка).
 */
struct Cell {
  int x = 0;
  int y = 0;

  constexpr Cell() noexcept = default;
  constexpr Cell(int x_, int y_) noexcept : x(x_), y(y_) {}

  constexpr bool operator==(const Cell& other) const noexcept {
    return x == other.x && y == other.y;
  }
  constexpr bool operator!=(const Cell& other) const noexcept {
    return !(*this == other);
  }
};

/**
 * @brief Направление движения: единичный вектор вдоль одной из осей.
 *
 * Ось Y направлена вниз, как на экране: UP = (0, -1), DOWN = (0, 1).
 */
enum class Heading : std::uint8_t { UP, DOWN, LEFT, RIGHT };

constexpr Heading opposite(Heading h) noexcept {
  switch (h) {
    case Heading::UP:
      return Heading::DOWN;
    case Heading::DOWN:
      return Heading::UP;
    case Heading::LEFT:
      return Heading::RIGHT;
    case Heading::RIGHT:
      return Heading::LEFT;
  }
  return h;
}

constexpr bool isOpposite(Heading a, Heading b) noexcept {
  return opposite(a) == b;
}

/// Клетка, соседняя с `c` по направлению `h`. Границы не проверяются.
constexpr Cell translate(const Cell& c, Heading h) noexcept {
  switch (h) {
    case Heading::UP:
      return {c.x, c.y - 1};
    case Heading::DOWN:
      return {c.x, c.y + 1};
    case Heading::LEFT:
      return {c.x - 1, c.y};
    case Heading::RIGHT:
      return {c.x + 1, c.y};
  }
  return c;
}

/**
 * @brief Вид бонуса. Эффект применяется через исчерпывающий switch.
 */
enum class PowerUpKind : std::uint8_t {
  SPEED,        ///< +3 к скорости, не выше SNAKE_SPEED_MAX
  INVINCIBLE,   ///< Неуязвимость к препятствиям на invincible_ticks тиков
  BONUS_SCORE,  ///< +50 очков
};

constexpr int kPowerUpKindCount = 3;

struct PowerUp {
  Cell cell;
  PowerUpKind kind = PowerUpKind::SPEED;

  constexpr bool operator==(const PowerUp& other) const noexcept {
    return cell == other.cell && kind == other.kind;
  }
};

/**
 * @brief Причина перехода в GAME OVER.
 *
 * Проверки выполняются в порядке WALL -> OBSTACLE -> SELF, побеждает первая.
 */
enum class CollisionKind : std::uint8_t {
  NONE,
  WALL,
  OBSTACLE,
  SELF,
  TERMINATED,  ///< Игрок сдался (Terminate)
};

struct GameStats {
  int score = 0;
  int level = 1;
  int speed = SNAKE_SPEED_INITIAL;
  bool invincible = false;
  int invincible_ticks = 0;
};

inline const char* toString(PowerUpKind kind) noexcept {
  switch (kind) {
    case PowerUpKind::SPEED:
      return "speed";
    case PowerUpKind::INVINCIBLE:
      return "invincible";
    case PowerUpKind::BONUS_SCORE:
      return "bonus";
  }
  return "unknown";
}

inline const char* toString(CollisionKind kind) noexcept {
  switch (kind) {
    case CollisionKind::NONE:
      return "none";
    case CollisionKind::WALL:
      return "wall";
    case CollisionKind::OBSTACLE:
      return "obstacle";
    case CollisionKind::SELF:
      return "self";
    case CollisionKind::TERMINATED:
      return "terminated";
  }
  return "unknown";
}

}  // namespace arcade

#endif  // ARCADE_SNAKE_TYPES_HPP
