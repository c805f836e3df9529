/**
 * @file view.h
 * @brief Публичный API модуля отображения GridSnake
 *
 * Абстрактный интерфейс (View) для любых видов отображения (CLI на ncurses,
 * desktop на Qt). View полностью изолирован от игровой модели: сессия
 * строит кадр по запросам к модели и передаёт его через этот API, а ввод
 * забирает через poll_input().
 *
 * Основные идеи:
 * - ViewHandle_t — абстрактный указатель на внутренний контекст интерфейса.
 * - Поверхность делится на именованные зоны ("score", "field").
 * - Элементы: текст, число, матрица тегов ячеек, набор спрайтов.
 * - Ввод описывается через InputEvent_t с логическими кодами клавиш.
 *
 * @defgroup View Публичный интерфейс библиотек отображения GridSnake
 * @{
 */

#ifndef VIEW_H
#define VIEW_H

#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @typedef ViewHandle_t
 * @brief Абстрактный указатель на внутренний контекст View-модуля.
 */
typedef void *ViewHandle_t;

/**
 * @enum ViewResult_t
 * @brief Результат выполнения операций View.
 */
typedef enum {
    VIEW_OK,              ///< Операция успешна
    VIEW_ERROR,           ///< Общая ошибка
    VIEW_INVALID_ID,      ///< Недопустимый element_id
    VIEW_BAD_DATA,        ///< Некорректные данные (например, NULL data при matrix)
    VIEW_NOT_INITIALIZED, ///< View не инициализирован
    VIEW_NO_EVENT         ///< Событие ввода отсутствует (для poll_input)
} ViewResult_t;

/**
 * @name Логические коды клавиш
 * Бэкенды переводят стрелки в WASD, закрытие окна — в VIEW_KEY_QUIT.
 * @{
 */
#define VIEW_KEY_UP    'w'
#define VIEW_KEY_LEFT  'a'
#define VIEW_KEY_DOWN  's'
#define VIEW_KEY_RIGHT 'd'
#define VIEW_KEY_QUIT  'q'
#define VIEW_KEY_ESC   27
/** @} */

/**
 * @struct InputEvent_t
 * @brief Событие ввода пользователя.
 *
 * @var InputEvent_t::key_code
 *     Логический код клавиши. Если событие отсутствует, key_code == 0.
 * @var InputEvent_t::key_state
 *     1 — нажата, 0 — отпущена.
 */
typedef struct {
    int key_code;
    int key_state;
} InputEvent_t;

/**
 * @enum ViewColor_t
 * @brief Индексы цветов палитры, передаваемой в ViewConfig_t.
 */
typedef enum {
    VIEW_COLOR_BACKGROUND = 0,
    VIEW_COLOR_GRID,
    VIEW_COLOR_SNAKE,
    VIEW_COLOR_FOOD,
    VIEW_COLOR_COUNT
} ViewColor_t;

/**
 * @struct Sprite_t
 * @brief Закрашенный квадрат в ячейке поля.
 *
 * Квадрат центрирован в ячейке, его сторона — scale_pct процентов
 * стороны ячейки.
 */
typedef struct {
    int         row;
    int         col;
    int         scale_pct;
    ViewColor_t color;
} Sprite_t;

/**
 * @enum ElementType_t
 * @brief Тип отрисовываемого элемента.
 */
typedef enum {
    ELEMENT_TEXT,   ///< const char* (поддерживает '\n')
    ELEMENT_NUMBER, ///< int
    ELEMENT_MATRIX, ///< двумерный массив тегов ячеек (row-major)
    ELEMENT_SPRITES ///< массив Sprite_t поверх сетки grid_rows x grid_cols
} ElementType_t;

/**
 * @struct ElementData_t
 * @brief Данные элемента. Заполняется поле content, соответствующее type.
 */
typedef struct ElementData_t {
    ElementType_t type;
    union {
        const char *text;      ///< для ELEMENT_TEXT
        int         number;    ///< для ELEMENT_NUMBER
        struct {               ///< для ELEMENT_MATRIX
            const int *data;   ///< указатель на данные (row-major)
            int        width;  ///< ширина матрицы
            int        height; ///< высота матрицы
        } matrix;
        struct {               ///< для ELEMENT_SPRITES
            const Sprite_t *data;
            int             count;
            int             grid_rows;
            int             grid_cols;
        } sprites;
    } content;
} ElementData_t;

/**
 * @struct ViewConfig_t
 * @brief Параметры инициализации View.
 *
 * Размеры поверхности задаются в единицах бэкенда: пиксели для Qt,
 * символы для CLI. Имена цветов — SVG/X11 ("white", "red", ...).
 */
typedef struct {
    int         width;
    int         height;
    int         fps;
    const char *title;
    const char *palette[VIEW_COLOR_COUNT];
} ViewConfig_t;

/**
 * @struct ViewInterface
 * @brief Таблица функций конкретного бэкенда отображения.
 */
typedef struct ViewInterface {
    int version; ///< Версия интерфейса (текущая: 2)

    /**
     * @brief Инициализация движка отображения.
     * @param config Размер поверхности, fps, заголовок и палитра
     * @return Контекст или NULL при ошибке
     */
    ViewHandle_t (*init)(const ViewConfig_t *config);

    /**
     * @brief Настраивает зону вывода.
     * @param handle     Контекст
     * @param element_id Имя зоны (макс. 31 символ)
     * @param x, y       Позиция в единицах поверхности
     * @param max_width  Ширина зоны
     * @param max_height Высота зоны
     * @return VIEW_OK при успехе
     *
     * @note Если зона уже существует — перезаписывается.
     */
    ViewResult_t (*configure_zone)(ViewHandle_t handle,
                                   const char   *element_id,
                                   int           x,
                                   int           y,
                                   int           max_width,
                                   int           max_height);

    /**
     * @brief Отрисовывает элемент в зону.
     *
     * В одной зоне хранится по одному элементу каждого типа; повторный
     * вызов с тем же типом заменяет элемент.
     *
     * @note Данные действительны только на время вызова — бэкенд копирует
     *       то, что ему нужно до render().
     */
    ViewResult_t (*draw_element)(ViewHandle_t          handle,
                                 const char            *element_id,
                                 const ElementData_t   *data);

    /**
     * @brief Выводит буфер на экран.
     */
    ViewResult_t (*render)(ViewHandle_t handle);

    /**
     * @brief Читает одно событие ввода без блокировки.
     * @return VIEW_OK при наличии события, VIEW_NO_EVENT — если нет
     */
    ViewResult_t (*poll_input)(ViewHandle_t handle, InputEvent_t *event);

    /**
     * @brief Завершает работу и освобождает ресурсы.
     * @note handle становится недействительным после вызова.
     */
    ViewResult_t (*shutdown)(ViewHandle_t handle);
} ViewInterface;

/* Текущая версия API */
#define VIEW_INTERFACE_VERSION 2

#ifdef __cplusplus
}
#endif

#endif // VIEW_H

/** @} */  // end of View module
