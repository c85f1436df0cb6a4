#pragma once
#include "shellcontroller.h"
#include <QMainWindow>
#include <QHash>

class QAction;
class QActionGroup;
class QLabel;
class QLineEdit;
class QListWidget;
class QListWidgetItem;
class QMenu;
class QProgressBar;
class QStackedWidget;

namespace vrt {

// ── MainWindow ──
//
// Vertical tab list on the left, toolbar plus page stack on the right.
// Never mutates shell state itself: user actions become intents posted to
// the controller, and every repaint comes from a published view model.
class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(ShellController* controller, QWidget* parent = nullptr);

private slots:
    void newTab();
    void closeActiveTab();
    void togglePin();
    void goBack();
    void goForward();
    void reloadOrStop();
    void submitLocation();
    void about();

private:
    ShellController* m_controller;

    QListWidget*    m_tabList;
    QStackedWidget* m_pages;
    QWidget*        m_newTabPage;
    QListWidget*    m_pinnedList;
    QLineEdit*      m_location;
    QLabel*         m_statusLabel;
    QProgressBar*   m_progress;

    QAction* m_backAction;
    QAction* m_forwardAction;
    QAction* m_reloadAction;
    QAction* m_pinAction;
    QMenu*        m_themeMenu = nullptr;
    QActionGroup* m_themeGroup = nullptr;

    QHash<TabId, QWidget*> m_views;   // engine views in m_pages, by tab
    bool m_rendering = false;

    void createMenus();
    void createToolBar();
    void createTabList();
    void createNewTabPage();
    void rebuildThemeMenu();

    void onTabOpened(TabId id);
    void onTabRemoved(TabId id);
    void render(const ViewModel& vm);
    void renderTabList(const ViewModel& vm);
    void renderPinnedList(const ViewModel& vm);
    void renderActive(const ViewModel& vm);

    TabId activeTabId() const { return m_controller->viewModel().activeTabId; }
    TabId idForItem(const QListWidgetItem* item) const;
};

} // namespace vrt
