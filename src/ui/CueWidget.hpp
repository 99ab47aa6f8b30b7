#pragma once
// CueWidget.hpp - Large display of the line awaiting a tap and the one after

#include <QColor>
#include <QFont>
#include <QString>
#include <QWidget>

namespace lrc {

class CueWidget : public QWidget {
    Q_OBJECT

public:
    explicit CueWidget(QWidget* parent = nullptr);
    ~CueWidget() override;

    void setLines(const QString& current, const QString& next);
    void setComplete(bool complete);
    void updateStyle();

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    void drawCentered(QPainter& painter,
                      const QString& text,
                      const QFont& font,
                      int centerY,
                      const QColor& color,
                      bool shadow);

    QString current_;
    QString next_;
    bool complete_{false};

    struct Style {
        QFont font;
        QFont nextFont;
        QColor activeColor;
        QColor inactiveColor;
        QColor shadowColor;
    } style_;
};

} // namespace lrc
