/**
 * @file desktop_main.cpp
 * @brief Точка входа оконной версии (Qt Widgets)
 *
 * Кадры запускает QTimer; после каждого кадра интервал таймера
 * пересчитывается по текущей скорости змейки.
 */

#include <QtCore/QTimer>
#include <QtWidgets/QApplication>

#include <cstdio>

#include "../gui/desktop/qt_view.hpp"

extern "C" {
#include "../controller/controller.h"
#include "options.h"
}

int main(int argc, char **argv) {
  AppOptions_t options;
  OptionsResult_t parsed = arcade_parse_options(argc, argv, nullptr, &options);
  if (parsed == OPTIONS_HELP) return 0;
  if (parsed != OPTIONS_OK) return 2;
  if (!arcade_apply_log_options(&options)) return 1;

  QApplication app(argc, argv);

  Controller_t controller;
  if (!controller_init(&controller, &qt_view, &options.config)) {
    std::fprintf(stderr, "cannot start the game window\n");
    arcade_log_close();
    return 1;
  }

  QTimer timer;
  QObject::connect(&timer, &QTimer::timeout, [&]() {
    if (!controller_tick(&controller)) {
      timer.stop();
      app.quit();
      return;
    }
    timer.setInterval(controller_frame_delay_ms(&controller));
  });
  timer.start(controller_frame_delay_ms(&controller));

  int rc = app.exec();
  controller_shutdown(&controller);
  arcade_log_close();
  return rc;
}
