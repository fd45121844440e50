/**
 * @file arcade_snake.cpp
 * @brief C API обёртка для C++ реализации arcade::SnakeGame
 *
 * Связывает класс arcade::SnakeGame с C-интерфейсом, которым пользуются
 * контроллер и модули отображения. Все функции объявлены как extern "C".
 *
 * Все функции помечены как noexcept, чтобы исключения C++ не пересекали
 * границу C/C++ (это привело бы к std::terminate()).
 *
 * @note Реальная логика игры находится в arcade_snake_internals.cpp.
 * @see arcade_snake.h, arcade_snake_internals.hpp
 */

#include "arcade_snake.h"
#include "arcade_snake_internals.hpp"

extern "C" {

void* snake_create(void) noexcept {
  return arcade::SnakeGame::create(nullptr);
}

void* snake_create_with_config(const SnakeConfig_t* config) noexcept {
  if (config == nullptr) return nullptr;
  return arcade::SnakeGame::create(config);
}

void snake_destroy(void* game) noexcept { arcade::SnakeGame::destroy(game); }

void snake_handle_input(void* game, UserAction_t action, bool hold) noexcept {
  arcade::SnakeGame::handle_input(game, action, hold);
}

void snake_update(void* game) noexcept { arcade::SnakeGame::update(game); }

const GameInfo_t* snake_get_info(const void* game) noexcept {
  return arcade::SnakeGame::get_info(game);
}

}  // extern "C"
