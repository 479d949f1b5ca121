#include <QApplication>
#include <QCoreApplication>
#include <QString>

#include "version.h"

#include "gantt/ui/MainWindow.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Gantt Planner"));
    QCoreApplication::setApplicationName(QStringLiteral("Gantt Planner"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kGanttPlannerVersion));

    QApplication app(argc, argv);

    gantt::ui::MainWindow mainWindow;
    mainWindow.setWindowTitle(QObject::tr("Gantt Planner %1").arg(QString::fromLatin1(kGanttPlannerVersion)));
    mainWindow.show();

    return app.exec();
}
