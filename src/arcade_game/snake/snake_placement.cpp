/**
 * @file snake_placement.cpp
 * @brief Реализация размещения сущностей на сетке
 */

#include "snake_placement.hpp"

#include "../common/arcade_log.h"

#define TAG "placement"

namespace arcade {

void OccupiedCells::add(const Cell& c) {
  if (inside_(c)) {
    keys_.insert(c.y * width_ + c.x);
  }
}

void OccupiedCells::add(const std::deque<Cell>& cells) {
  for (const auto& c : cells) add(c);
}

void OccupiedCells::add(const std::vector<Cell>& cells) {
  for (const auto& c : cells) add(c);
}

void OccupiedCells::add(const std::vector<PowerUp>& power_ups) {
  for (const auto& p : power_ups) add(p.cell);
}

void OccupiedCells::add(const std::optional<Cell>& cell) {
  if (cell) add(*cell);
}

bool OccupiedCells::contains(const Cell& c) const noexcept {
  if (!inside_(c)) return false;
  return keys_.find(c.y * width_ + c.x) != keys_.end();
}

std::optional<Cell> Placement::placeRandom(const OccupiedCells& exclusions,
                                           std::mt19937& rng) const {
  if (width_ <= 0 || height_ <= 0) {
    return std::nullopt;
  }
  if (exclusions.size() >= area()) {
    return std::nullopt;
  }

  std::uniform_int_distribution<int> dx(0, width_ - 1);
  std::uniform_int_distribution<int> dy(0, height_ - 1);

  for (int attempt = 0; attempt < SNAKE_PLACEMENT_MAX_ATTEMPTS; ++attempt) {
    Cell candidate{dx(rng), dy(rng)};
    if (!exclusions.contains(candidate)) {
      return candidate;
    }
  }

  ARCADE_LOG_DEBUG(TAG, "random draws exhausted (%zu of %zu occupied), scanning",
                   exclusions.size(), area());
  return scanFreeCells_(exclusions, rng);
}

std::optional<Cell> Placement::scanFreeCells_(const OccupiedCells& exclusions,
                                              std::mt19937& rng) const {
  std::vector<Cell> free_cells;
  free_cells.reserve(area() - exclusions.size());

  for (int y = 0; y < height_; ++y) {
    for (int x = 0; x < width_; ++x) {
      if (!exclusions.contains({x, y})) {
        free_cells.emplace_back(x, y);
      }
    }
  }

  if (free_cells.empty()) {
    return std::nullopt;
  }

  std::uniform_int_distribution<std::size_t> pick(0, free_cells.size() - 1);
  return free_cells[pick(rng)];
}

std::optional<Cell> Placement::generateFood(
    const std::deque<Cell>& snake, const std::vector<Cell>& obstacles,
    const std::vector<PowerUp>& power_ups, std::mt19937& rng) const {
  OccupiedCells occupied(width_, height_);
  occupied.add(snake);
  occupied.add(obstacles);
  occupied.add(power_ups);

  auto cell = placeRandom(occupied, rng);
  if (!cell) {
    ARCADE_LOG_WARN(TAG, "no free cell for food");
  }
  return cell;
}

std::size_t Placement::generateObstacles(const std::deque<Cell>& snake,
                                         const std::optional<Cell>& food,
                                         const std::vector<PowerUp>& power_ups,
                                         std::vector<Cell>& existing,
                                         std::size_t max_count,
                                         std::mt19937& rng) const {
  OccupiedCells occupied(width_, height_);
  occupied.add(snake);
  occupied.add(food);
  occupied.add(power_ups);
  occupied.add(existing);

  std::size_t added = 0;
  while (existing.size() < max_count) {
    auto cell = placeRandom(occupied, rng);
    if (!cell) {
      ARCADE_LOG_WARN(TAG, "obstacle fill stopped at %zu of %zu",
                      existing.size(), max_count);
      break;
    }
    existing.push_back(*cell);
    occupied.add(*cell);
    ++added;
  }
  return added;
}

bool Placement::maybeGeneratePowerUp(const std::deque<Cell>& snake,
                                     const std::vector<Cell>& obstacles,
                                     const std::optional<Cell>& food,
                                     std::vector<PowerUp>& existing,
                                     double probability,
                                     std::mt19937& rng) const {
  std::bernoulli_distribution chance(probability);
  if (!chance(rng)) {
    return false;
  }

  OccupiedCells occupied(width_, height_);
  occupied.add(snake);
  occupied.add(obstacles);
  occupied.add(food);
  occupied.add(existing);

  auto cell = placeRandom(occupied, rng);
  if (!cell) {
    ARCADE_LOG_WARN(TAG, "no free cell for power-up");
    return false;
  }

  std::uniform_int_distribution<int> kind(0, kPowerUpKindCount - 1);
  PowerUp power_up{*cell, static_cast<PowerUpKind>(kind(rng))};
  existing.push_back(power_up);

  ARCADE_LOG_INFO(TAG, "power-up %s at (%d, %d)", toString(power_up.kind),
                  power_up.cell.x, power_up.cell.y);
  return true;
}

}  // namespace arcade
