#include "gantt/ui/widgets/GanttChartView.hpp"

#include <QFontMetrics>
#include <QHelpEvent>
#include <QKeyEvent>
#include <QLocale>
#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>
#include <QScrollBar>
#include <QToolTip>
#include <QWheelEvent>
#include <cmath>

#include "gantt/core/GanttStore.hpp"
#include "gantt/core/Logging.hpp"
#include "gantt/core/TaskFormatting.hpp"
#include "gantt/ui/models/TaskTreeModel.hpp"

namespace gantt {
namespace ui {

namespace {
constexpr double HandleZone = 6.0;
constexpr double BarVerticalPadding = 8.0;
constexpr double BarCornerRadius = 4.0;
constexpr double LabelMinWidth = 80.0;
constexpr double MinWeekendShadeWidth = 4.0;
} // namespace

GanttChartView::GanttChartView(core::GanttStore &store, QWidget *parent)
    : QAbstractScrollArea(parent)
    , m_store(store)
    , m_move(store)
    , m_resize(store)
{
    setMouseTracking(true);
    viewport()->setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setHorizontalScrollBarPolicy(Qt::ScrollBarAsNeeded);
    setVerticalScrollBarPolicy(Qt::ScrollBarAsNeeded);
    const QDate today = QDate::currentDate();
    m_range = core::timelineRangeFor(m_viewMode, today, today);
    updateScrollBars();
}

void GanttChartView::setTimeline(const core::TimelineRange &range, core::ViewMode mode)
{
    if (!range.start.isValid() || !range.end.isValid()) {
        return;
    }
    m_range = range;
    m_viewMode = mode;
    updateScrollBars();
    viewport()->update();
}

void GanttChartView::setZoomLevel(double zoomLevel)
{
    const double clamped = core::clampZoomLevel(zoomLevel);
    if (qFuzzyCompare(m_zoomLevel, clamped)) {
        return;
    }
    m_zoomLevel = clamped;
    updateScrollBars();
    viewport()->update();
}

void GanttChartView::setRows(QVector<core::VisibleRow> rows)
{
    m_rows = std::move(rows);
    updateScrollBars();
    viewport()->update();
}

void GanttChartView::setSelectedTaskId(const QString &taskId)
{
    if (m_selectedTaskId == taskId) {
        return;
    }
    m_selectedTaskId = taskId;
    viewport()->update();
}

void GanttChartView::setHeaderHeight(int height)
{
    if (height <= 0) {
        return;
    }
    m_headerHeight = height;
    updateScrollBars();
    viewport()->update();
}

double GanttChartView::dayWidth() const
{
    return core::effectiveDayWidth(m_range.baseDayWidth, m_zoomLevel);
}

int GanttChartView::verticalScrollValue() const
{
    if (auto *vbar = verticalScrollBar()) {
        return vbar->value();
    }
    return 0;
}

void GanttChartView::setVerticalScrollValue(int value)
{
    if (auto *vbar = verticalScrollBar()) {
        vbar->setValue(qBound(vbar->minimum(), value, vbar->maximum()));
    }
}

void GanttChartView::cancelInteraction()
{
    const bool wasInteracting = isInteracting();
    if (m_resize.isActive()) {
        m_resize.cancel();
    }
    if (m_move.isActive()) {
        m_move.cancel();
    }
    viewport()->unsetCursor();
    if (wasInteracting) {
        emit gestureFinished();
    }
}

bool GanttChartView::isInteracting() const
{
    return m_move.isActive() || m_resize.isActive();
}

void GanttChartView::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event);
    QPainter painter(viewport());
    painter.fillRect(viewport()->rect(), palette().base());

    paintGrid(painter);
    paintBars(painter);
    paintHeader(painter);
}

void GanttChartView::resizeEvent(QResizeEvent *event)
{
    QAbstractScrollArea::resizeEvent(event);
    updateScrollBars();
}

void GanttChartView::wheelEvent(QWheelEvent *event)
{
    if (event->modifiers().testFlag(Qt::ControlModifier)) {
        const int delta = event->angleDelta().y();
        if (delta != 0) {
            emit zoomRequested(delta > 0);
        }
        event->accept();
        return;
    }
    QAbstractScrollArea::wheelEvent(event);
}

bool GanttChartView::viewportEvent(QEvent *event)
{
    if (event->type() == QEvent::ToolTip) {
        auto *helpEvent = static_cast<QHelpEvent *>(event);
        const auto hit = barAt(sceneFromViewport(helpEvent->pos()));
        if (hit) {
            QToolTip::showText(helpEvent->globalPos(), core::taskToolTip(*m_rows.at(hit->row).task), viewport());
            return true;
        }
        QToolTip::hideText();
        event->ignore();
        return true;
    }
    return QAbstractScrollArea::viewportEvent(event);
}

void GanttChartView::mousePressEvent(QMouseEvent *event)
{
    if (event->button() != Qt::LeftButton) {
        QAbstractScrollArea::mousePressEvent(event);
        return;
    }
    setFocus(Qt::MouseFocusReason);
    const QPointF scenePos = sceneFromViewport(event->pos());
    const auto hit = barAt(scenePos);
    if (!hit) {
        QAbstractScrollArea::mousePressEvent(event);
        return;
    }
    const QString taskId = m_rows.at(hit->row).task->id;
    if (hit->handle != core::ResizeHandle::None) {
        m_resize.begin(taskId, hit->handle, scenePos.x(), dayWidth());
    } else {
        if (m_store.state().selectedTaskId != taskId) {
            m_store.dispatch(core::Action::selectTask(taskId));
        }
        if (m_move.begin(taskId, scenePos.x(), dayWidth())) {
            viewport()->setCursor(Qt::ClosedHandCursor);
        }
    }
    event->accept();
}

void GanttChartView::mouseMoveEvent(QMouseEvent *event)
{
    const QPointF scenePos = sceneFromViewport(event->pos());
    if (m_resize.isActive()) {
        m_resize.update(scenePos.x());
        event->accept();
        return;
    }
    if (m_move.isActive()) {
        m_move.update(scenePos.x());
        event->accept();
        return;
    }
    updateHoverCursor(scenePos);
    QAbstractScrollArea::mouseMoveEvent(event);
}

void GanttChartView::mouseReleaseEvent(QMouseEvent *event)
{
    if (event->button() != Qt::LeftButton || !isInteracting()) {
        QAbstractScrollArea::mouseReleaseEvent(event);
        return;
    }
    if (m_resize.isActive()) {
        m_resize.end();
    }
    if (m_move.isActive()) {
        m_move.end();
    }
    updateHoverCursor(sceneFromViewport(event->pos()));
    emit gestureFinished();
    event->accept();
}

void GanttChartView::mouseDoubleClickEvent(QMouseEvent *event)
{
    if (event->button() != Qt::LeftButton) {
        QAbstractScrollArea::mouseDoubleClickEvent(event);
        return;
    }
    const auto hit = barAt(sceneFromViewport(event->pos()));
    if (hit) {
        cancelInteraction();
        emit editRequested(m_rows.at(hit->row).task->id);
        event->accept();
        return;
    }
    QAbstractScrollArea::mouseDoubleClickEvent(event);
}

void GanttChartView::keyPressEvent(QKeyEvent *event)
{
    if (event->key() == Qt::Key_Escape && isInteracting()) {
        qCDebug(lcGanttUi) << "Bar gesture cancelled";
        cancelInteraction();
        event->accept();
        return;
    }
    QAbstractScrollArea::keyPressEvent(event);
}

void GanttChartView::updateScrollBars()
{
    const double contentWidth = m_range.dayCount() * dayWidth();
    const double contentHeight = m_headerHeight + m_rows.size() * TaskRowHeight;
    const int pageWidth = qMax(1, viewport()->width());
    const int pageHeight = qMax(1, viewport()->height());

    horizontalScrollBar()->setRange(0, qMax(0, static_cast<int>(std::ceil(contentWidth)) - pageWidth));
    horizontalScrollBar()->setPageStep(pageWidth);
    horizontalScrollBar()->setSingleStep(qMax(1, static_cast<int>(dayWidth())));

    verticalScrollBar()->setRange(0, qMax(0, static_cast<int>(std::ceil(contentHeight)) - pageHeight));
    verticalScrollBar()->setPageStep(pageHeight);
    verticalScrollBar()->setSingleStep(TaskRowHeight / 2);
}

QPointF GanttChartView::sceneFromViewport(const QPoint &pos) const
{
    return QPointF(pos) + QPointF(horizontalScrollBar()->value(), verticalScrollBar()->value());
}

QRectF GanttChartView::barRect(int row) const
{
    const auto &task = *m_rows.at(row).task;
    const auto geometry = core::taskPosition(task, m_range.start, dayWidth());
    const double top = m_headerHeight + row * TaskRowHeight + BarVerticalPadding;
    return QRectF(geometry.left, top, qMax(1.0, geometry.width), TaskRowHeight - 2 * BarVerticalPadding);
}

std::optional<GanttChartView::BarHit> GanttChartView::barAt(const QPointF &scenePos) const
{
    const double bodyY = scenePos.y() - m_headerHeight;
    if (bodyY < 0 || scenePos.y() - verticalScrollBar()->value() < m_headerHeight) {
        return std::nullopt;
    }
    const int row = static_cast<int>(bodyY / TaskRowHeight);
    if (row < 0 || row >= m_rows.size()) {
        return std::nullopt;
    }
    const QRectF rect = barRect(row);
    if (!rect.contains(scenePos)) {
        return std::nullopt;
    }
    BarHit hit;
    hit.row = row;
    // Narrow bars keep a grabbable body between the two edge zones.
    const double zone = qMin(HandleZone, rect.width() / 3.0);
    if (scenePos.x() <= rect.left() + zone) {
        hit.handle = core::ResizeHandle::Start;
    } else if (scenePos.x() >= rect.right() - zone) {
        hit.handle = core::ResizeHandle::End;
    }
    return hit;
}

void GanttChartView::updateHoverCursor(const QPointF &scenePos)
{
    const auto hit = barAt(scenePos);
    if (!hit) {
        viewport()->unsetCursor();
    } else if (hit->handle != core::ResizeHandle::None) {
        viewport()->setCursor(Qt::SizeHorCursor);
    } else {
        viewport()->setCursor(Qt::OpenHandCursor);
    }
}

void GanttChartView::paintHeader(QPainter &painter)
{
    const double xOffset = horizontalScrollBar()->value();
    const double width = dayWidth();
    const QRectF headerRect(0, 0, viewport()->width(), m_headerHeight);
    painter.fillRect(headerRect, palette().alternateBase());
    painter.setPen(palette().dark().color());
    painter.drawLine(QPointF(0, m_headerHeight - 0.5), QPointF(viewport()->width(), m_headerHeight - 0.5));
    if (width <= 0.0) {
        return;
    }

    const int firstDay = qMax(0, static_cast<int>(xOffset / width));
    const int lastDay = qMin(m_range.dayCount() - 1, static_cast<int>((xOffset + viewport()->width()) / width) + 1);
    const QFontMetrics metrics(painter.font());
    const QDate today = QDate::currentDate();
    for (int day = firstDay; day <= lastDay; ++day) {
        const QDate date = m_range.start.addDays(day);
        if (!isHeaderBoundary(date)) {
            continue;
        }
        const double x = day * width - xOffset;
        painter.setPen(palette().mid().color());
        painter.drawLine(QPointF(x, m_headerHeight * 0.5), QPointF(x, m_headerHeight));

        QFont font = painter.font();
        font.setBold(date == today);
        painter.setFont(font);
        painter.setPen(palette().windowText().color());
        const QString label = headerLabel(date);
        painter.drawText(QRectF(x + 3, 0, metrics.horizontalAdvance(label) + 8, m_headerHeight),
                         Qt::AlignLeft | Qt::AlignVCenter,
                         label);
        font.setBold(false);
        painter.setFont(font);
    }
}

void GanttChartView::paintGrid(QPainter &painter)
{
    const double xOffset = horizontalScrollBar()->value();
    const double yOffset = verticalScrollBar()->value();
    const double width = dayWidth();
    if (width <= 0.0) {
        return;
    }
    const double bodyTop = m_headerHeight;
    const double bodyBottom = viewport()->height();

    const int firstDay = qMax(0, static_cast<int>(xOffset / width));
    const int lastDay = qMin(m_range.dayCount() - 1, static_cast<int>((xOffset + viewport()->width()) / width) + 1);
    QColor weekendColor = palette().alternateBase().color().darker(105);
    for (int day = firstDay; day <= lastDay; ++day) {
        const QDate date = m_range.start.addDays(day);
        const double x = day * width - xOffset;
        if (width >= MinWeekendShadeWidth && date.dayOfWeek() >= 6) {
            painter.fillRect(QRectF(x, bodyTop, width, bodyBottom - bodyTop), weekendColor);
        }
        if (isHeaderBoundary(date)) {
            painter.setPen(palette().midlight().color());
            painter.drawLine(QPointF(x, bodyTop), QPointF(x, bodyBottom));
        }
    }

    painter.setPen(palette().midlight().color());
    for (int row = 0; row <= m_rows.size(); ++row) {
        const double y = bodyTop + row * TaskRowHeight - yOffset;
        if (y < bodyTop || y > bodyBottom) {
            continue;
        }
        painter.drawLine(QPointF(0, y), QPointF(viewport()->width(), y));
    }

    const int todayIndex = core::daysBetween(m_range.start, QDate::currentDate());
    if (todayIndex >= 0 && todayIndex < m_range.dayCount()) {
        const double x = todayIndex * width + width / 2.0 - xOffset;
        painter.setPen(QPen(QColor(QStringLiteral("#ef4444")), 2));
        painter.drawLine(QPointF(x, bodyTop), QPointF(x, bodyBottom));
    }
}

void GanttChartView::paintBars(QPainter &painter)
{
    const QPointF offset(horizontalScrollBar()->value(), verticalScrollBar()->value());
    const double bodyTop = m_headerHeight;

    painter.save();
    painter.setClipRect(QRectF(0, bodyTop, viewport()->width(), viewport()->height() - bodyTop));
    painter.setRenderHint(QPainter::Antialiasing, true);
    const QRectF visibleRect(0, bodyTop, viewport()->width(), viewport()->height() - bodyTop);

    for (int row = 0; row < m_rows.size(); ++row) {
        const auto &task = *m_rows.at(row).task;
        const QRectF rect = barRect(row).translated(-offset);
        if (!rect.intersects(visibleRect)) {
            continue;
        }

        const QColor color = task.color.isValid() ? task.color : palette().highlight().color();
        QColor trackColor = color;
        trackColor.setAlpha(110);
        const double radius = qMin(BarCornerRadius, rect.height() / 2.0);

        QPainterPath path;
        path.addRoundedRect(rect, radius, radius);
        painter.fillPath(path, trackColor);

        const double progressWidth = rect.width() * qBound(0, task.progress, 100) / 100.0;
        if (progressWidth > 0.0) {
            painter.save();
            painter.setClipPath(path, Qt::IntersectClip);
            painter.fillRect(QRectF(rect.left(), rect.top(), progressWidth, rect.height()), color);
            painter.restore();
        }

        if (task.id == m_selectedTaskId) {
            painter.setPen(QPen(palette().highlight().color().darker(130), 2));
            painter.setBrush(Qt::NoBrush);
            painter.drawRoundedRect(rect.adjusted(-1, -1, 1, 1), radius + 1, radius + 1);
        }

        if (rect.width() > LabelMinWidth) {
            painter.setPen(Qt::white);
            const QRectF textRect = rect.adjusted(6, 0, -6, 0);
            const QString label = painter.fontMetrics().elidedText(task.name,
                                                                   Qt::ElideRight,
                                                                   static_cast<int>(textRect.width()));
            painter.drawText(textRect, Qt::AlignLeft | Qt::AlignVCenter, label);
        }
    }
    painter.restore();
}

QString GanttChartView::headerLabel(const QDate &date) const
{
    switch (m_viewMode) {
    case core::ViewMode::Day:
        return QLocale().toString(date, QStringLiteral("ddd d"));
    case core::ViewMode::Week:
        return QLocale().toString(date, QStringLiteral("MMM d"));
    case core::ViewMode::Month:
        return QLocale().toString(date, QStringLiteral("MMM yyyy"));
    }
    return {};
}

bool GanttChartView::isHeaderBoundary(const QDate &date) const
{
    switch (m_viewMode) {
    case core::ViewMode::Day:
        return true;
    case core::ViewMode::Week:
        return date.dayOfWeek() == 7;
    case core::ViewMode::Month:
        return date.day() == 1;
    }
    return false;
}

} // namespace ui
} // namespace gantt
