#include "qt_view.hpp"

#include <QtGui/QCloseEvent>
#include <QtGui/QFont>
#include <QtGui/QKeyEvent>
#include <QtGui/QPainter>
#include <QtWidgets/QApplication>
#include <QtWidgets/QMainWindow>
#include <QtWidgets/QWidget>

#include <array>
#include <cstring>
#include <map>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

#include "../common/layout.hpp"

using gsnake::layout::fit_grid;
using gsnake::layout::GridFit;
using gsnake::layout::Rect;
using gsnake::layout::RectF;
using gsnake::layout::score_font_size;
using gsnake::layout::sprite_rect;

// ---------- Внутренние структуры (скрыты за ViewHandle_t) ----------

// Копия элемента: ElementData_t ссылается на память вызывающего кода
struct StoredElement {
    ElementType_t type = ELEMENT_TEXT;
    std::string text;
    int number = 0;
    std::vector<int> cells;
    int width = 0;
    int height = 0;
    std::vector<Sprite_t> sprites;
};

using Palette = std::array<QColor, VIEW_COLOR_COUNT>;

class GameWidget : public QWidget {
    Q_OBJECT
public:
    explicit GameWidget(const Palette &palette, QWidget *parent = nullptr)
        : QWidget(parent), palette_(palette)
    {
        setFocusPolicy(Qt::StrongFocus);
    }

    void setElementData(const std::string &zone, const ElementData_t &data) {
        StoredElement &e = elements_[zone][data.type];
        e.type = data.type;
        switch (data.type) {
        case ELEMENT_TEXT:
            e.text = data.content.text ? data.content.text : "";
            break;
        case ELEMENT_NUMBER:
            e.number = data.content.number;
            break;
        case ELEMENT_MATRIX:
            e.width = data.content.matrix.width;
            e.height = data.content.matrix.height;
            e.cells.assign(data.content.matrix.data,
                           data.content.matrix.data + e.width * e.height);
            break;
        case ELEMENT_SPRITES:
            e.width = data.content.sprites.grid_cols;
            e.height = data.content.sprites.grid_rows;
            e.sprites.assign(data.content.sprites.data,
                             data.content.sprites.data + data.content.sprites.count);
            break;
        }
        update();   // запрос перерисовки
    }

    void setZone(const std::string &name, const Rect &zone) {
        zones_[name] = zone;
    }

    bool hasZone(const std::string &name) const {
        return zones_.find(name) != zones_.end();
    }

    // Очередь событий клавиатуры для poll_input()
    void pushInput(int key_code) {
        InputEvent_t ev{};
        ev.key_code = key_code;
        ev.key_state = 1;
        inputQueue_.push(ev);
    }

    bool popInput(InputEvent_t &out) {
        if (inputQueue_.empty())
            return false;
        out = inputQueue_.front();
        inputQueue_.pop();
        return true;
    }

protected:
    void paintEvent(QPaintEvent *) override {
        QPainter p(this);
        p.fillRect(rect(), palette_[VIEW_COLOR_BACKGROUND]);

        for (const auto &[name, zone] : zones_) {
            auto it = elements_.find(name);
            if (it == elements_.end())
                continue;
            // std::map упорядочен по типу: сетка рисуется раньше спрайтов
            for (const auto &[type, element] : it->second) {
                paintElement(p, zone, element);
            }
        }
    }

    void keyPressEvent(QKeyEvent *event) override {
        int code = 0;
        // Стрелки переводятся в те же логические коды, что и в CLI
        switch (event->key()) {
        case Qt::Key_Left:   code = VIEW_KEY_LEFT; break;
        case Qt::Key_Right:  code = VIEW_KEY_RIGHT; break;
        case Qt::Key_Up:     code = VIEW_KEY_UP; break;
        case Qt::Key_Down:   code = VIEW_KEY_DOWN; break;
        case Qt::Key_Escape: code = VIEW_KEY_ESC; break;
        default:
            code = event->text().isEmpty() ? 0 : event->text().at(0).toLatin1();
            break;
        }

        if (code != 0)
            pushInput(code);

        QWidget::keyPressEvent(event);
    }

private:
    void paintElement(QPainter &p, const Rect &zone, const StoredElement &e) {
        switch (e.type) {
        case ELEMENT_TEXT:
        case ELEMENT_NUMBER: {
            QFont font = p.font();
            font.setPixelSize(score_font_size(width(), height()));
            p.setFont(font);
            p.setPen(palette_[VIEW_COLOR_SNAKE]);
            const QString s = e.type == ELEMENT_TEXT
                                  ? QString::fromStdString(e.text)
                                  : QString::number(e.number);
            p.drawText(QRect(zone.x, zone.y, zone.w, zone.h), Qt::AlignCenter, s);
            break;
        }
        case ELEMENT_MATRIX: {
            const GridFit fit = fit_grid(zone, e.height, e.width);
            p.setPen(palette_[VIEW_COLOR_GRID]);
            p.setBrush(Qt::NoBrush);
            for (int row = 0; row < e.height; ++row) {
                for (int col = 0; col < e.width; ++col) {
                    p.drawRect(QRectF(fit.origin_x + fit.tile * col,
                                      fit.origin_y + fit.tile * row,
                                      fit.tile, fit.tile));
                }
            }
            break;
        }
        case ELEMENT_SPRITES: {
            const GridFit fit = fit_grid(zone, e.height, e.width);
            for (const Sprite_t &s : e.sprites) {
                const RectF r = sprite_rect(fit, s.row, s.col, s.scale_pct);
                p.fillRect(QRectF(r.x, r.y, r.w, r.h), palette_[s.color]);
            }
            break;
        }
        }
    }

    Palette palette_;
    std::unordered_map<std::string, Rect> zones_;
    std::unordered_map<std::string, std::map<ElementType_t, StoredElement>> elements_;
    std::queue<InputEvent_t> inputQueue_;
};

// Закрытие окна доставляется как команда выхода
class GameWindow : public QMainWindow {
public:
    using QMainWindow::QMainWindow;

    void setGameWidget(GameWidget *widget) {
        widget_ = widget;
        setCentralWidget(widget);
    }

protected:
    void closeEvent(QCloseEvent *event) override {
        if (widget_)
            widget_->pushInput(VIEW_KEY_QUIT);
        event->ignore();
    }

private:
    GameWidget *widget_ = nullptr;
};

// Контекст Qt-View
struct QtViewContext {
    int width;
    int height;
    int fps;
    GameWindow *window;
    GameWidget *widget;
};

static QColor colorFromName(const char *name, const QColor &fallback) {
    if (!name)
        return fallback;
    QColor c(QString::fromUtf8(name));
    return c.isValid() ? c : fallback;
}

// ---------- Реализация View_t для Qt ----------

static ViewHandle_t qt_init(const ViewConfig_t *config) {
    if (!config || config->width <= 0 || config->height <= 0 || config->fps < 1)
        return nullptr;

    if (!QApplication::instance()) {
        return nullptr;
    }

    Palette palette = {
        colorFromName(config->palette[VIEW_COLOR_BACKGROUND], Qt::black),
        colorFromName(config->palette[VIEW_COLOR_GRID], Qt::white),
        colorFromName(config->palette[VIEW_COLOR_SNAKE], Qt::white),
        colorFromName(config->palette[VIEW_COLOR_FOOD], Qt::red),
    };

    QtViewContext *ctx = new QtViewContext{};
    ctx->width = config->width;
    ctx->height = config->height;
    ctx->fps = config->fps;

    ctx->window = new GameWindow;
    ctx->window->setWindowTitle(QString::fromUtf8(config->title ? config->title : ""));
    ctx->window->setFixedSize(config->width, config->height);
    ctx->widget = new GameWidget(palette);
    ctx->window->setGameWidget(ctx->widget);

    // Показываем окно, но не блокируем
    ctx->window->show();
    ctx->widget->setFocus();
    QApplication::processEvents();

    return static_cast<ViewHandle_t>(ctx);
}

static ViewResult_t qt_configure_zone(ViewHandle_t handle,
                                      const char *element_id,
                                      int x, int y, int max_w, int max_h)
{
    if (!handle) return VIEW_NOT_INITIALIZED;
    if (!element_id || strlen(element_id) == 0) return VIEW_BAD_DATA;
    if (x < 0 || y < 0 || max_w <= 0 || max_h <= 0) return VIEW_BAD_DATA;

    QtViewContext *ctx = static_cast<QtViewContext*>(handle);
    ctx->widget->setZone(element_id, Rect{x, y, max_w, max_h});

    return VIEW_OK;
}

static ViewResult_t qt_draw_element(ViewHandle_t handle,
                                    const char *element_id,
                                    const ElementData_t *data)
{
    if (!handle) return VIEW_NOT_INITIALIZED;
    if (!element_id || !data) return VIEW_BAD_DATA;

    QtViewContext *ctx = static_cast<QtViewContext*>(handle);
    if (!ctx->widget->hasZone(element_id)) return VIEW_INVALID_ID;
    if (data->type == ELEMENT_MATRIX && !data->content.matrix.data) return VIEW_BAD_DATA;
    if (data->type == ELEMENT_SPRITES && !data->content.sprites.data &&
        data->content.sprites.count > 0) return VIEW_BAD_DATA;

    ctx->widget->setElementData(element_id, *data);

    return VIEW_OK;
}

static ViewResult_t qt_render(ViewHandle_t handle) {
    if (!handle) return VIEW_NOT_INITIALIZED;

    QtViewContext *ctx = static_cast<QtViewContext*>(handle);
    ctx->widget->update();  // явно запрашиваем перерисовку
    QApplication::processEvents();

    return VIEW_OK;
}

static ViewResult_t qt_poll_input(ViewHandle_t handle, InputEvent_t *event) {
    if (!handle) return VIEW_NOT_INITIALIZED;
    if (!event) return VIEW_ERROR;

    QtViewContext *ctx = static_cast<QtViewContext*>(handle);
    QApplication::processEvents();
    InputEvent_t ev{};
    if (ctx->widget->popInput(ev)) {
        *event = ev;
        return VIEW_OK;
    }

    return VIEW_NO_EVENT;
}

static ViewResult_t qt_shutdown(ViewHandle_t handle) {
    if (!handle) return VIEW_NOT_INITIALIZED;

    QtViewContext *ctx = static_cast<QtViewContext*>(handle);
    if (ctx->window) {
        ctx->window->hide();
        delete ctx->window;
    }
    delete ctx;

    return VIEW_OK;
}

// Экспортируемый экземпляр Qt-View
const ViewInterface qt_view = {
    VIEW_INTERFACE_VERSION,
    qt_init,
    qt_configure_zone,
    qt_draw_element,
    qt_render,
    qt_poll_input,
    qt_shutdown,
};

#include "qt_view.moc"
