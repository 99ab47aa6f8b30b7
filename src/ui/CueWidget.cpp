#include "CueWidget.hpp"
#include "core/Config.hpp"

#include <QFontMetrics>
#include <QPainter>

namespace lrc {

namespace {
QColor toQColor(const Color& c) {
    return QColor(c.r, c.g, c.b, c.a);
}
} // namespace

CueWidget::CueWidget(QWidget* parent) : QWidget(parent) {
    QPalette pal = palette();
    pal.setColor(QPalette::Window, Qt::black);
    setPalette(pal);
    setAutoFillBackground(true);
    setMinimumHeight(140);

    updateStyle();
}

CueWidget::~CueWidget() = default;

void CueWidget::setLines(const QString& current, const QString& next) {
    current_ = current;
    next_ = next;
    update();
}

void CueWidget::setComplete(bool complete) {
    complete_ = complete;
    update();
}

void CueWidget::updateStyle() {
    const auto& cfg = CONFIG_VIEW.cue();
    style_.font = QFont(QString::fromStdString(cfg.fontFamily));
    style_.font.setPixelSize(static_cast<int>(cfg.fontSize));
    style_.font.setBold(cfg.bold);

    style_.nextFont = style_.font;
    style_.nextFont.setPixelSize(static_cast<int>(cfg.fontSize * 2 / 3));
    style_.nextFont.setBold(false);

    style_.activeColor = toQColor(cfg.activeColor);
    style_.inactiveColor = toQColor(cfg.inactiveColor);
    style_.shadowColor = toQColor(cfg.shadowColor);
    update();
}

void CueWidget::paintEvent(QPaintEvent* event) {
    Q_UNUSED(event);
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setRenderHint(QPainter::TextAntialiasing);

    if (current_.isEmpty() && next_.isEmpty()) {
        painter.setPen(Qt::gray);
        painter.drawText(rect(),
                         Qt::AlignCenter,
                         complete_ ? "All lines synchronized"
                                   : "Load lyrics to begin");
        return;
    }

    int centerY = height() / 2;
    int nextY = centerY + QFontMetrics(style_.font).height();

    drawCentered(painter, current_, style_.font, centerY,
                 style_.activeColor, true);

    QColor dim = style_.inactiveColor;
    dim.setAlpha(160);
    drawCentered(painter, next_, style_.nextFont, nextY, dim, false);
}

void CueWidget::drawCentered(QPainter& painter,
                             const QString& text,
                             const QFont& font,
                             int centerY,
                             const QColor& color,
                             bool shadow) {
    if (text.isEmpty())
        return;

    painter.setFont(font);
    QFontMetrics fm(font);
    QString shown = fm.elidedText(text, Qt::ElideRight, width() - 24);
    int xPos = (width() - fm.horizontalAdvance(shown)) / 2;

    if (shadow) {
        painter.setPen(style_.shadowColor);
        painter.drawText(xPos + 2, centerY + 2, shown);
    }
    painter.setPen(color);
    painter.drawText(xPos, centerY, shown);
}

} // namespace lrc
