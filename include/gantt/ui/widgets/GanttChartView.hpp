#pragma once

#include <QAbstractScrollArea>
#include <QDate>
#include <QString>
#include <QVector>
#include <optional>

#include "gantt/core/GanttState.hpp"
#include "gantt/core/MoveSession.hpp"
#include "gantt/core/ResizeSession.hpp"
#include "gantt/core/TaskTree.hpp"
#include "gantt/core/TimelineGeometry.hpp"

namespace gantt {
namespace core {
class GanttStore;
}

namespace ui {

class GanttChartView : public QAbstractScrollArea
{
    Q_OBJECT

public:
    explicit GanttChartView(core::GanttStore &store, QWidget *parent = nullptr);

    void setTimeline(const core::TimelineRange &range, core::ViewMode mode);
    void setZoomLevel(double zoomLevel);
    void setRows(QVector<core::VisibleRow> rows);
    void setSelectedTaskId(const QString &taskId);
    void setHeaderHeight(int height);

    double dayWidth() const;
    const core::TimelineRange &timeline() const { return m_range; }
    int verticalScrollValue() const;
    void setVerticalScrollValue(int value);

    // Cancels whichever bar gesture is running.
    void cancelInteraction();
    bool isInteracting() const;

signals:
    void editRequested(const QString &taskId);
    void zoomRequested(bool zoomIn);
    // A move or resize ended, by release or by cancel.
    void gestureFinished();

protected:
    void paintEvent(QPaintEvent *event) override;
    void resizeEvent(QResizeEvent *event) override;
    void wheelEvent(QWheelEvent *event) override;
    bool viewportEvent(QEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void mouseDoubleClickEvent(QMouseEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;

private:
    struct BarHit
    {
        int row = -1;
        core::ResizeHandle handle = core::ResizeHandle::None;
    };

    void updateScrollBars();
    QPointF sceneFromViewport(const QPoint &pos) const;
    QRectF barRect(int row) const;
    std::optional<BarHit> barAt(const QPointF &scenePos) const;
    void updateHoverCursor(const QPointF &scenePos);
    void paintHeader(QPainter &painter);
    void paintGrid(QPainter &painter);
    void paintBars(QPainter &painter);
    QString headerLabel(const QDate &date) const;
    bool isHeaderBoundary(const QDate &date) const;

    core::GanttStore &m_store;
    core::MoveSession m_move;
    core::ResizeSession m_resize;
    core::TimelineRange m_range;
    core::ViewMode m_viewMode = core::ViewMode::Day;
    double m_zoomLevel = core::DefaultZoomLevel;
    QVector<core::VisibleRow> m_rows;
    QString m_selectedTaskId;
    double m_headerHeight = 40.0;
};

} // namespace ui
} // namespace gantt
