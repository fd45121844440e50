/**
 * @file snake_placement.hpp
 * @brief Размещение сущностей на сетке: еда, препятствия, бонусы
 *
 * Модуль не хранит состояние игры: он получает занятые клетки от вызывающей
 * стороны и возвращает новую свободную клетку. Случайность берётся из
 * генератора, которым владеет SnakeGame, поэтому при фиксированном зерне
 * размещение воспроизводимо.
 *
 * Алгоритм placeRandom():
 * 1. Если свободных клеток нет: результат пустой ("разместить некуда").
 * 2. До SNAKE_PLACEMENT_MAX_ATTEMPTS равновероятных попыток (rejection
 *    sampling).
 * 3. Если все попытки неудачны (сетка почти заполнена): перебираются
 *    свободные клетки, и одна выбирается равновероятно.
 */

#ifndef ARCADE_SNAKE_PLACEMENT_HPP
#define ARCADE_SNAKE_PLACEMENT_HPP

#include <cstddef>
#include <deque>
#include <optional>
#include <random>
#include <unordered_set>
#include <vector>

#include "snake_types.hpp"

namespace arcade {

/**
 * @brief Множество занятых клеток сетки (ключ: y * width + x).
 *
 * Клетки вне сетки не добавляются: на них всё равно ничего нельзя разместить.
 */
class OccupiedCells {
 public:
  OccupiedCells(int width, int height) noexcept
      : width_(width), height_(height) {}

  void add(const Cell& c);
  void add(const std::deque<Cell>& cells);
  void add(const std::vector<Cell>& cells);
  void add(const std::vector<PowerUp>& power_ups);
  void add(const std::optional<Cell>& cell);

  bool contains(const Cell& c) const noexcept;
  std::size_t size() const noexcept { return keys_.size(); }

 private:
  bool inside_(const Cell& c) const noexcept {
    return c.x >= 0 && c.y >= 0 && c.x < width_ && c.y < height_;
  }

  int width_;
  int height_;
  std::unordered_set<int> keys_;
};

class Placement {
 public:
  Placement(int width, int height) noexcept : width_(width), height_(height) {}

  int width() const noexcept { return width_; }
  int height() const noexcept { return height_; }
  std::size_t area() const noexcept {
    if (width_ <= 0 || height_ <= 0) return 0;
    return static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_);
  }

  bool contains(const Cell& c) const noexcept {
    return c.x >= 0 && c.y >= 0 && c.x < width_ && c.y < height_;
  }

  /**
   * @brief Случайная клетка сетки вне `exclusions`.
   * @return Пустое значение, если свободных клеток нет.
   */
  std::optional<Cell> placeRandom(const OccupiedCells& exclusions,
                                  std::mt19937& rng) const;

  /**
   * @brief Клетка для еды, не совпадающая со змейкой, препятствиями и
   * бонусами.
   */
  std::optional<Cell> generateFood(const std::deque<Cell>& snake,
                                   const std::vector<Cell>& obstacles,
                                   const std::vector<PowerUp>& power_ups,
                                   std::mt19937& rng) const;

  /**
   * @brief Дополнить `existing` препятствиями до `max_count`.
   *
   * Уже размещённые препятствия сохраняются. Новые не совпадают со змейкой,
   * едой, бонусами и друг с другом. Если место кончилось, заполнение
   * останавливается раньше.
   *
   * @return Количество добавленных препятствий.
   */
  std::size_t generateObstacles(const std::deque<Cell>& snake,
                                const std::optional<Cell>& food,
                                const std::vector<PowerUp>& power_ups,
                                std::vector<Cell>& existing,
                                std::size_t max_count,
                                std::mt19937& rng) const;

  /**
   * @brief С вероятностью `probability` добавить бонус случайного вида.
   *
   * @return true, если бонус добавлен в `existing`.
   */
  bool maybeGeneratePowerUp(const std::deque<Cell>& snake,
                            const std::vector<Cell>& obstacles,
                            const std::optional<Cell>& food,
                            std::vector<PowerUp>& existing,
                            double probability, std::mt19937& rng) const;

 private:
  std::optional<Cell> scanFreeCells_(const OccupiedCells& exclusions,
                                     std::mt19937& rng) const;

  int width_;
  int height_;
};

}  // namespace arcade

#endif  // ARCADE_SNAKE_PLACEMENT_HPP
