#ifndef GSNAKE_PREF_H
#define GSNAKE_PREF_H

/*
    Размеры игрового поля по умолчанию (строки и столбцы).
    Игра возможна только на поле не меньше 2x2.
*/
#define GSNAKE_DEFAULT_ROWS 12
#define GSNAKE_DEFAULT_COLS 12
#define GSNAKE_MIN_SIDE 2

/*
    Начальная задержка между тиками и нижняя граница, ниже которой
    задержка перестаёт пересчитываться (в миллисекундах).
*/
#define GSNAKE_STARTING_DELAY_MS 500
#define GSNAKE_DELAY_FLOOR_MS 250

/*
    Модификатор задержки: delay = start * MODIFIER^length
*/
#define GSNAKE_DELAY_MODIFIER 0.85

/*
    Цвета по умолчанию (имена цветов SVG/X11).
*/
#define GSNAKE_SNAKE_COLOR "white"
#define GSNAKE_FOOD_COLOR "red"
#define GSNAKE_BACKGROUND_COLOR "black"
#define GSNAKE_GRID_COLOR "white"

/*
    Размер окна desktop-интерфейса в пикселях.
*/
#define GSNAKE_WINDOW_WIDTH 800
#define GSNAKE_WINDOW_HEIGHT 800

/*
    Частота опроса ввода в ожидании первого хода.
*/
#define GSNAKE_VIEW_FPS 30

/*
    Каталог настроек и журнала в домашней директории пользователя.
*/
#define GSNAKE_HOME_DIR ".gridsnake"
#define GSNAKE_SETTINGS_FILE "settings.conf"
#define GSNAKE_LOG_FILE "gridsnake.log"

#endif
