#pragma once

#include <QDate>
#include <QMainWindow>
#include <QModelIndex>
#include <memory>

class QDateEdit;
class QTableView;
class QToolBar;

namespace timeslot {
namespace core {
class AppContext;
}

namespace ui {

class DayScheduleViewModel;
class DefaultPlacementFormatter;
class TimeslotTableModel;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(core::AppContext &context, QWidget *parent = nullptr);
    ~MainWindow() override;

private:
    void setupUi();
    QToolBar *createNavigationBar();
    void goToday();
    void navigateForward();
    void navigateBackward();
    void setCurrentDate(const QDate &date);
    void refreshSchedule();
    void handleCellActivated(const QModelIndex &index);
    void saveScheduleState() const;
    void restoreScheduleState();

    core::AppContext &m_appContext;
    std::unique_ptr<DefaultPlacementFormatter> m_formatter;
    std::unique_ptr<DayScheduleViewModel> m_viewModel;
    std::unique_ptr<TimeslotTableModel> m_tableModel;
    QTableView *m_tableView = nullptr;
    QDateEdit *m_dateEdit = nullptr;
    QDate m_currentDate;
};

} // namespace ui
} // namespace timeslot
