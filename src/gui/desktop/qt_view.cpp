#include "qt_view.hpp"

#include <QtGui/QCloseEvent>
#include <QtGui/QKeyEvent>
#include <QtGui/QPainter>
#include <QtWidgets/QApplication>
#include <QtWidgets/QMainWindow>
#include <QtWidgets/QWidget>

#include <algorithm>
#include <cstring>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

extern "C" {
#include "../../arcade_game/arcade_game.h"
}

// ---------- Внутренние структуры (скрыты за ViewHandle_t) ----------

namespace {

struct Zone {
    int x, y, w, h;   // в пикселях
    std::string name;
};

// Копия содержимого зоны: Qt рисует позже, чем отдаёт данные контроллер.
struct ZoneContent {
    ElementType_t type = ELEMENT_TEXT;
    std::string text;
    int number = 0;
    std::vector<int> cells;
    int width = 0;
    int height = 0;
};

QColor colorForCell(int value) {
    switch (value) {
    case ARCADE_CELL_HEAD:               return QColor(0x7c, 0xfc, 0x00);
    case ARCADE_CELL_BODY:               return Qt::darkGreen;
    case ARCADE_CELL_FOOD:               return Qt::red;
    case ARCADE_CELL_OBSTACLE:           return Qt::lightGray;
    case ARCADE_CELL_POWERUP_SPEED:      return Qt::yellow;
    case ARCADE_CELL_POWERUP_INVINCIBLE: return Qt::cyan;
    case ARCADE_CELL_POWERUP_BONUS:      return Qt::magenta;
    default:                             return Qt::black;
    }
}

}  // namespace

class GameWidget : public QWidget {
    Q_OBJECT
public:
    explicit GameWidget(QWidget *parent = nullptr)
        : QWidget(parent)
    {
        setFocusPolicy(Qt::StrongFocus);
    }

    void setZone(const Zone &zone) {
        auto it = std::find_if(zones_.begin(), zones_.end(),
                               [&zone](const Zone &z) { return z.name == zone.name; });
        if (it != zones_.end())
            *it = zone;
        else
            zones_.push_back(zone);
    }

    bool hasZone(const std::string &name) const {
        return std::any_of(zones_.begin(), zones_.end(),
                           [&name](const Zone &z) { return z.name == name; });
    }

    void setContent(const std::string &id, ZoneContent content) {
        contents_[id] = std::move(content);
    }

    void pushInput(int key_code, int key_state) {
        inputQueue_.push(InputEvent_t{key_code, key_state});
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
        p.fillRect(rect(), Qt::black);

        for (const Zone &z : zones_) {
            QRect frame(z.x, z.y, z.w, z.h);
            p.setPen(Qt::white);
            p.drawRect(frame.adjusted(0, 0, -1, -1));
            p.setPen(Qt::yellow);
            p.drawText(frame.adjusted(6, 2, -6, 0), Qt::AlignLeft | Qt::AlignTop,
                       QString::fromStdString(z.name));

            auto it = contents_.find(z.name);
            if (it == contents_.end())
                continue;

            const ZoneContent &c = it->second;
            QRect inner = frame.adjusted(kQtUnitWidth, kQtUnitHeight,
                                         -kQtUnitWidth, -kQtUnitHeight / 2);
            p.setPen(Qt::white);

            switch (c.type) {
            case ELEMENT_TEXT:
                p.drawText(inner, Qt::AlignLeft | Qt::AlignTop,
                           QString::fromStdString(c.text));
                break;
            case ELEMENT_NUMBER:
                p.drawText(inner, Qt::AlignRight | Qt::AlignVCenter,
                           QString::number(c.number));
                break;
            case ELEMENT_MATRIX:
                paintMatrix_(p, frame, c);
                break;
            }
        }
    }

    void keyPressEvent(QKeyEvent *event) override {
        int code = VIEW_KEY_NONE;
        switch (event->key()) {
        case Qt::Key_Left:   code = VIEW_KEY_LEFT; break;
        case Qt::Key_Right:  code = VIEW_KEY_RIGHT; break;
        case Qt::Key_Up:     code = VIEW_KEY_UP; break;
        case Qt::Key_Down:   code = VIEW_KEY_DOWN; break;
        case Qt::Key_Return:
        case Qt::Key_Enter:
        case Qt::Key_Space:  code = VIEW_KEY_START; break;
        case Qt::Key_Escape: code = VIEW_KEY_QUIT; break;
        default:
            if (!event->text().isEmpty())
                code = event->text().at(0).toLower().toLatin1();
            break;
        }

        if (code != VIEW_KEY_NONE)
            pushInput(code, event->isAutoRepeat() ? 1 : 0);

        QWidget::keyPressEvent(event);
    }

private:
    // Рамка зоны занимает по единице с каждой стороны; клетка: 2 x 1 единицы.
    void paintMatrix_(QPainter &p, const QRect &frame, const ZoneContent &c) {
        const int cell = std::min(2 * kQtUnitWidth, kQtUnitHeight);
        const int left = frame.x() + kQtUnitWidth;
        const int top = frame.y() + kQtUnitHeight;

        for (int row = 0; row < c.height; ++row) {
            for (int col = 0; col < c.width; ++col) {
                int value = c.cells[static_cast<std::size_t>(row * c.width + col)];
                if (value == ARCADE_CELL_EMPTY)
                    continue;
                QRect r(left + col * cell, top + row * cell, cell, cell);
                p.fillRect(r.adjusted(1, 1, -1, -1), colorForCell(value));
            }
        }
    }

    std::vector<Zone> zones_;
    std::unordered_map<std::string, ZoneContent> contents_;
    std::queue<InputEvent_t> inputQueue_;
};

class GameWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit GameWindow(GameWidget *widget) : widget_(widget) {
        setWindowTitle("ArcadeSnake");
        setCentralWidget(widget_);
    }

protected:
    void closeEvent(QCloseEvent *event) override {
        widget_->pushInput(VIEW_KEY_QUIT, 0);
        event->ignore();
    }

private:
    GameWidget *widget_;
};

struct QtViewContext {
    int width;
    int height;
    int fps;
    GameWindow *window;
    GameWidget *widget;
};

// ---------- Реализация ViewInterface для Qt ----------

static ViewHandle_t qt_init(int width, int height, int fps) {
    if (width <= 0 || height <= 0 || fps < 1)
        return nullptr;

    if (!QApplication::instance())
        return nullptr;

    auto *ctx = new QtViewContext{};
    ctx->width = width;
    ctx->height = height;
    ctx->fps = fps;

    ctx->widget = new GameWidget;
    ctx->window = new GameWindow(ctx->widget);   // владеет widget
    ctx->window->setFixedSize(width * kQtUnitWidth, height * kQtUnitHeight);
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
    if (!element_id || std::strlen(element_id) == 0) return VIEW_BAD_DATA;
    if (x < 0 || y < 0 || max_w <= 0 || max_h <= 0) return VIEW_BAD_DATA;

    auto *ctx = static_cast<QtViewContext*>(handle);
    Zone z;
    z.x = x * kQtUnitWidth;
    z.y = y * kQtUnitHeight;
    z.w = max_w * kQtUnitWidth;
    z.h = max_h * kQtUnitHeight;
    z.name = element_id;
    ctx->widget->setZone(z);

    return VIEW_OK;
}

static ViewResult_t qt_draw_element(ViewHandle_t handle,
                                    const char *element_id,
                                    const ElementData_t *data)
{
    if (!handle) return VIEW_NOT_INITIALIZED;
    if (!element_id || !data) return VIEW_BAD_DATA;

    auto *ctx = static_cast<QtViewContext*>(handle);
    if (!ctx->widget->hasZone(element_id)) return VIEW_INVALID_ID;

    ZoneContent c;
    c.type = data->type;
    switch (data->type) {
    case ELEMENT_TEXT:
        if (!data->content.text) return VIEW_BAD_DATA;
        c.text = data->content.text;
        break;
    case ELEMENT_NUMBER:
        c.number = data->content.number;
        break;
    case ELEMENT_MATRIX: {
        const auto &m = data->content.matrix;
        if (!m.data || m.width <= 0 || m.height <= 0) return VIEW_BAD_DATA;
        c.width = m.width;
        c.height = m.height;
        c.cells.assign(m.data, m.data + static_cast<std::size_t>(m.width) * m.height);
        break;
    }
    default:
        return VIEW_BAD_DATA;
    }

    ctx->widget->setContent(element_id, std::move(c));
    return VIEW_OK;
}

static ViewResult_t qt_render(ViewHandle_t handle) {
    if (!handle) return VIEW_NOT_INITIALIZED;

    auto *ctx = static_cast<QtViewContext*>(handle);
    ctx->widget->update();
    return VIEW_OK;
}

static ViewResult_t qt_poll_input(ViewHandle_t handle, InputEvent_t *event) {
    if (!handle) return VIEW_NOT_INITIALIZED;
    if (!event) return VIEW_BAD_DATA;

    auto *ctx = static_cast<QtViewContext*>(handle);
    InputEvent_t ev{};
    if (ctx->widget->popInput(ev)) {
        *event = ev;
        return VIEW_OK;
    }

    return VIEW_NO_EVENT;
}

static ViewResult_t qt_shutdown(ViewHandle_t handle) {
    if (!handle) return VIEW_NOT_INITIALIZED;

    auto *ctx = static_cast<QtViewContext*>(handle);
    if (ctx->window) {
        ctx->window->hide();
        delete ctx->window;
    }
    delete ctx;

    return VIEW_OK;
}

const ViewInterface qt_view = {
    VIEW_INTERFACE_VERSION,
    qt_init,
    qt_configure_zone,
    qt_draw_element,
    qt_render,
    qt_poll_input,
    qt_shutdown
};

#include "qt_view.moc"
