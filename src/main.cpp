#include <QApplication>
#include <QCoreApplication>
#include <QMessageBox>
#include <QSettings>
#include <QString>

#include "version.h"

#include "timeslot/core/AppContext.hpp"
#include "timeslot/core/Errors.hpp"
#include "timeslot/core/TimeslotSettings.hpp"
#include "timeslot/ui/MainWindow.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Timeslot"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("timeslot.example.org"));
    QCoreApplication::setApplicationName(QStringLiteral("Timeslot Planner"));

    QApplication app(argc, argv);

    timeslot::core::TimeslotSettings settings;
    try {
        QSettings stored;
        settings = timeslot::core::TimeslotSettings::load(stored);
    } catch (const timeslot::core::InvalidConfigError &error) {
        QMessageBox::warning(nullptr,
                             QObject::tr("Timeslot Planner"),
                             QObject::tr("Invalid timeslot settings, using defaults:\n%1")
                                 .arg(QString::fromUtf8(error.what())));
    }

    timeslot::core::AppContext context(settings);
    context.seedDemoData();

    timeslot::ui::MainWindow mainWindow(context);
    mainWindow.setWindowTitle(QObject::tr("Timeslot Planner %1").arg(QString::fromLatin1(kTimeslotVersion)));
    mainWindow.resize(1024, 768);
    mainWindow.show();

    return app.exec();
}
