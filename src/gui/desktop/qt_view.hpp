#pragma once

extern "C" {
#include "../common/view.h"   // ViewInterface, ViewHandle_t, ElementData_t, InputEvent_t
}

/// Размер условной единицы разметки в пикселях (по горизонтали и вертикали).
/// Клетка матрицы занимает 2 x 1 единицы, т.е. квадрат 20 x 20.
constexpr int kQtUnitWidth = 10;
constexpr int kQtUnitHeight = 20;

/**
 * @brief Экземпляр Qt-интерфейса для ArcadeSnake.
 *
 * Требует созданного QApplication: без него init() возвращает nullptr.
 * Окно закрывается пользователем как обычно; закрытие приходит в
 * poll_input() как VIEW_KEY_QUIT.
 */
extern const ViewInterface qt_view;
