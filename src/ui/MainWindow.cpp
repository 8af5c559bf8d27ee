#include "timeslot/ui/MainWindow.hpp"

#include <QAction>
#include <QCalendarWidget>
#include <QDateEdit>
#include <QHeaderView>
#include <QSettings>
#include <QSignalBlocker>
#include <QStatusBar>
#include <QTableView>
#include <QToolBar>

#include "timeslot/core/AppContext.hpp"
#include "timeslot/core/EventScheduler.hpp"
#include "timeslot/ui/PlacementFormatter.hpp"
#include "timeslot/ui/models/TimeslotTableModel.hpp"
#include "timeslot/ui/viewmodels/DayScheduleViewModel.hpp"

namespace timeslot {
namespace ui {

MainWindow::MainWindow(core::AppContext &context, QWidget *parent)
    : QMainWindow(parent)
    , m_appContext(context)
    , m_formatter(std::make_unique<DefaultPlacementFormatter>())
    , m_viewModel(std::make_unique<DayScheduleViewModel>(context.scheduler()))
    , m_tableModel(std::make_unique<TimeslotTableModel>(*m_formatter))
{
    m_tableModel->setTimeFormat(m_appContext.settings().timeFormat);
    connect(m_viewModel.get(), &DayScheduleViewModel::gridChanged, this, [this](const core::Grid &grid) {
        m_tableModel->setGrid(grid);
        statusBar()->showMessage(tr("%n occasion(s)", nullptr, static_cast<int>(grid.placements().size())));
    });

    m_currentDate = QDate::currentDate();
    restoreScheduleState();
    setupUi();
    refreshSchedule();
}

MainWindow::~MainWindow()
{
    saveScheduleState();
}

void MainWindow::setupUi()
{
    addToolBar(createNavigationBar());

    m_tableView = new QTableView(this);
    m_tableView->setModel(m_tableModel.get());
    m_tableView->setSelectionMode(QAbstractItemView::SingleSelection);
    m_tableView->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_tableView->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
    connect(m_tableView, &QTableView::activated, this, &MainWindow::handleCellActivated);
    connect(m_tableView, &QTableView::clicked, this, &MainWindow::handleCellActivated);
    setCentralWidget(m_tableView);
    statusBar();
}

QToolBar *MainWindow::createNavigationBar()
{
    auto *toolbar = new QToolBar(tr("Navigation"), this);
    toolbar->setMovable(false);

    auto *backAction = toolbar->addAction(tr("Previous"));
    backAction->setShortcut(QKeySequence(Qt::ALT | Qt::Key_Left));
    connect(backAction, &QAction::triggered, this, &MainWindow::navigateBackward);

    auto *todayAction = toolbar->addAction(tr("Today"));
    todayAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_T));
    connect(todayAction, &QAction::triggered, this, &MainWindow::goToday);

    auto *forwardAction = toolbar->addAction(tr("Next"));
    forwardAction->setShortcut(QKeySequence(Qt::ALT | Qt::Key_Right));
    connect(forwardAction, &QAction::triggered, this, &MainWindow::navigateForward);

    toolbar->addSeparator();

    m_dateEdit = new QDateEdit(m_currentDate, toolbar);
    m_dateEdit->setCalendarPopup(true);
    m_dateEdit->calendarWidget()->setFirstDayOfWeek(m_appContext.settings().firstWeekday);
    connect(m_dateEdit, &QDateEdit::dateChanged, this, &MainWindow::setCurrentDate);
    toolbar->addWidget(m_dateEdit);

    auto *refreshAction = toolbar->addAction(tr("Refresh"));
    refreshAction->setShortcut(QKeySequence::Refresh);
    connect(refreshAction, &QAction::triggered, this, &MainWindow::refreshSchedule);

    return toolbar;
}

void MainWindow::goToday()
{
    setCurrentDate(QDate::currentDate());
}

void MainWindow::navigateForward()
{
    setCurrentDate(m_currentDate.addDays(1));
}

void MainWindow::navigateBackward()
{
    setCurrentDate(m_currentDate.addDays(-1));
}

void MainWindow::setCurrentDate(const QDate &date)
{
    if (!date.isValid() || date == m_currentDate) {
        return;
    }
    m_currentDate = date;
    if (m_dateEdit) {
        QSignalBlocker blocker(m_dateEdit);
        m_dateEdit->setDate(date);
    }
    refreshSchedule();
}

void MainWindow::refreshSchedule()
{
    m_viewModel->setDate(m_currentDate);
    m_viewModel->refresh();
    setWindowFilePath(m_currentDate.toString(Qt::ISODate));
}

void MainWindow::handleCellActivated(const QModelIndex &index)
{
    const auto *placement = m_tableModel->placementAt(index);
    if (!placement) {
        statusBar()->clearMessage();
        return;
    }
    const QString link = m_tableModel->data(index, TimeslotTableModel::LinkRole).toString();
    const auto &occasion = placement->occasion();
    statusBar()->showMessage(tr("%1: %2 - %3 %4")
                                 .arg(occasion.title,
                                      occasion.start.toString(Qt::ISODate),
                                      occasion.end.toString(Qt::ISODate),
                                      link));
}

void MainWindow::saveScheduleState() const
{
    QSettings settings;
    settings.setValue(QStringLiteral("schedule/currentDate"), m_currentDate);
}

void MainWindow::restoreScheduleState()
{
    QSettings settings;
    const QDate stored = settings.value(QStringLiteral("schedule/currentDate")).toDate();
    if (stored.isValid()) {
        m_currentDate = stored;
    }
}

} // namespace ui
} // namespace timeslot
