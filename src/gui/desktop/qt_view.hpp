#pragma once

extern "C" {
#include "../common/view.h"   // ViewInterface, ViewHandle_t, ElementData_t, InputEvent_t
}

/**
 * @brief Экземпляр Qt-интерфейса для GridSnake.
 *
 * Реализует контракт ViewInterface, используя Qt-виджеты. Размер
 * поверхности в ViewConfig_t задаётся в пикселях окна.
 *
 * @note Перед init() должен существовать экземпляр QApplication.
 * @note События Qt обрабатываются внутри render() и poll_input().
 */
extern const ViewInterface qt_view;
