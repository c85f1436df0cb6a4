#include "mainwindow.h"
#include <QAbstractItemModel>
#include <QAction>
#include <QActionGroup>
#include <QApplication>
#include <QDebug>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QPalette>
#include <QProgressBar>
#include <QSplitter>
#include <QStackedWidget>
#include <QStatusBar>
#include <QStyle>
#include <QToolBar>
#include <QVBoxLayout>

namespace vrt {

static constexpr int kTabIdRole = Qt::UserRole;
static constexpr int kUrlRole   = Qt::UserRole + 1;

template < typename...Args >
inline QAction* Qt5Qt6AddAction(QMenu* menu, const QString &text, const QKeySequence &shortcut, const QIcon &icon, Args&&...args)
{
    QAction *result = menu->addAction(icon, text);
    if (!shortcut.isEmpty())
        result->setShortcut(shortcut);
    QObject::connect(result, &QAction::triggered, std::forward<Args>(args)...);
    return result;
}

static void applyGlobalTheme(const Theme& theme) {
    QPalette pal;
    pal.setColor(QPalette::Window,          theme.background);
    pal.setColor(QPalette::WindowText,      theme.text);
    pal.setColor(QPalette::Base,            theme.surface);
    pal.setColor(QPalette::AlternateBase,   theme.backgroundAlt);
    pal.setColor(QPalette::Text,            theme.text);
    pal.setColor(QPalette::Button,          theme.button);
    pal.setColor(QPalette::ButtonText,      theme.text);
    pal.setColor(QPalette::Highlight,       theme.tabActive);
    pal.setColor(QPalette::HighlightedText, theme.text);
    pal.setColor(QPalette::ToolTipBase,     theme.backgroundAlt);
    pal.setColor(QPalette::ToolTipText,     theme.text);
    pal.setColor(QPalette::Mid,             theme.tabHover);
    pal.setColor(QPalette::Dark,            theme.background);
    pal.setColor(QPalette::Light,           theme.textDim);
    pal.setColor(QPalette::Link,            theme.link);

    // Disabled group: Fusion reads these for disabled menu items, buttons, etc.
    pal.setColor(QPalette::Disabled, QPalette::WindowText,      theme.textMuted);
    pal.setColor(QPalette::Disabled, QPalette::Text,            theme.textMuted);
    pal.setColor(QPalette::Disabled, QPalette::ButtonText,      theme.textMuted);
    pal.setColor(QPalette::Disabled, QPalette::HighlightedText, theme.textMuted);
    pal.setColor(QPalette::Disabled, QPalette::Light,           theme.background);

    qApp->setPalette(pal);

    qApp->setStyleSheet(QStringLiteral(
        "QProgressBar { border: none; background: %1; max-height: 3px; }"
        "QProgressBar::chunk { background: %2; }"
        "QSplitter::handle { background: %3; }")
        .arg(theme.background.name(), theme.progress.name(), theme.border.name()));
}

MainWindow::MainWindow(ShellController* controller, QWidget* parent)
    : QMainWindow(parent), m_controller(controller)
{
    setWindowTitle("Verta");
    resize(1200, 800);

    m_pages = new QStackedWidget;
    createNewTabPage();
    createTabList();
    createToolBar();
    createMenus();

    auto* right = new QWidget;
    auto* rightLay = new QVBoxLayout(right);
    rightLay->setContentsMargins(0, 0, 0, 0);
    rightLay->setSpacing(0);
    m_progress = new QProgressBar;
    m_progress->setTextVisible(false);
    m_progress->setRange(0, 100);
    m_progress->hide();
    rightLay->addWidget(m_progress);
    rightLay->addWidget(m_pages, 1);

    auto* splitter = new QSplitter(Qt::Horizontal);
    splitter->addWidget(m_tabList);
    splitter->addWidget(right);
    splitter->setStretchFactor(1, 1);
    splitter->setSizes({220, 980});
    setCentralWidget(splitter);

    m_statusLabel = new QLabel;
    statusBar()->addWidget(m_statusLabel, 1);

    connect(m_controller, &ShellController::tabOpened,  this, &MainWindow::onTabOpened);
    connect(m_controller, &ShellController::tabRemoved, this, &MainWindow::onTabRemoved);
    connect(m_controller, &ShellController::viewModelChanged, this, &MainWindow::render);
    connect(m_controller, &ShellController::errorReported, this,
            [this](ShellError error, const QString& message) {
        statusBar()->showMessage(QStringLiteral("%1: %2")
                                 .arg(QString::fromLatin1(shellErrorToString(error)), message), 8000);
    });
    connect(m_controller->themes(), &ThemeEngine::themeChanged, this, [this](const Theme& t) {
        applyGlobalTheme(t);
        rebuildThemeMenu();
    });

    applyGlobalTheme(m_controller->themes()->current());
    rebuildThemeMenu();

    // Tabs opened before the window existed.
    for (const auto& t : m_controller->registry()->tabs())
        onTabOpened(t->id());
    render(m_controller->viewModel());
}

// ── Construction ──

void MainWindow::createMenus() {
    auto* file = menuBar()->addMenu("&File");
    Qt5Qt6AddAction(file, "New &Tab", QKeySequence::AddTab, QIcon(), this, &MainWindow::newTab);
    Qt5Qt6AddAction(file, "&Close Tab", QKeySequence(Qt::CTRL | Qt::Key_W), QIcon(), this, &MainWindow::closeActiveTab);
    file->addSeparator();
    Qt5Qt6AddAction(file, "E&xit", QKeySequence::Quit, QIcon(), this, &QWidget::close);

    auto* nav = menuBar()->addMenu("&Navigate");
    nav->addAction(m_backAction);
    nav->addAction(m_forwardAction);
    nav->addAction(m_reloadAction);
    nav->addSeparator();
    nav->addAction(m_pinAction);
    Qt5Qt6AddAction(nav, "Open &Location", QKeySequence(Qt::CTRL | Qt::Key_L), QIcon(), this, [this]() {
        m_location->setFocus();
        m_location->selectAll();
    });

    auto* view = menuBar()->addMenu("&View");
    m_themeMenu = view->addMenu("&Theme");

    auto* help = menuBar()->addMenu("&Help");
    Qt5Qt6AddAction(help, "&About Verta", QKeySequence::UnknownKey, QIcon(), this, &MainWindow::about);
}

void MainWindow::createToolBar() {
    auto* bar = addToolBar("Navigation");
    bar->setMovable(false);

    m_backAction    = bar->addAction(style()->standardIcon(QStyle::SP_ArrowBack), "Back");
    m_forwardAction = bar->addAction(style()->standardIcon(QStyle::SP_ArrowForward), "Forward");
    m_reloadAction  = bar->addAction(style()->standardIcon(QStyle::SP_BrowserReload), "Reload");
    m_backAction->setShortcut(QKeySequence::Back);
    m_forwardAction->setShortcut(QKeySequence::Forward);
    m_reloadAction->setShortcut(QKeySequence::Refresh);
    connect(m_backAction,    &QAction::triggered, this, &MainWindow::goBack);
    connect(m_forwardAction, &QAction::triggered, this, &MainWindow::goForward);
    connect(m_reloadAction,  &QAction::triggered, this, &MainWindow::reloadOrStop);

    m_location = new QLineEdit;
    m_location->setPlaceholderText("Search or enter address");
    m_location->setClearButtonEnabled(true);
    connect(m_location, &QLineEdit::returnPressed, this, &MainWindow::submitLocation);
    bar->addWidget(m_location);

    m_pinAction = bar->addAction("Pin");
    m_pinAction->setCheckable(true);
    connect(m_pinAction, &QAction::triggered, this, &MainWindow::togglePin);

    auto* add = bar->addAction("+");
    add->setToolTip("New Tab");
    connect(add, &QAction::triggered, this, &MainWindow::newTab);
}

void MainWindow::createTabList() {
    m_tabList = new QListWidget;
    m_tabList->setDragDropMode(QAbstractItemView::InternalMove);
    m_tabList->setDefaultDropAction(Qt::MoveAction);
    m_tabList->setSelectionMode(QAbstractItemView::SingleSelection);
    m_tabList->setContextMenuPolicy(Qt::CustomContextMenu);
    m_tabList->setMinimumWidth(160);

    connect(m_tabList, &QListWidget::currentItemChanged, this,
            [this](QListWidgetItem* current, QListWidgetItem*) {
        if (m_rendering || !current) return;
        TabId id = idForItem(current);
        if (id && id != activeTabId())
            m_controller->post(intent::ActivateTab{id});
    });

    // Drag-and-drop moves the row locally; the controller decides where the
    // tab really lands and the next render puts the row there.
    connect(m_tabList->model(), &QAbstractItemModel::rowsMoved, this,
            [this](const QModelIndex&, int start, int, const QModelIndex&, int row) {
        if (m_rendering) return;
        int dest = row > start ? row - 1 : row;
        QListWidgetItem* item = m_tabList->item(dest);
        if (!item) return;
        m_controller->post(intent::MoveTab{idForItem(item), dest});
    });

    connect(m_tabList, &QWidget::customContextMenuRequested, this, [this](const QPoint& pos) {
        QListWidgetItem* item = m_tabList->itemAt(pos);
        if (!item) return;
        const TabId id = idForItem(item);
        const TabSummary* s = m_controller->viewModel().find(id);
        if (!s) return;

        QMenu menu;
        menu.addAction(s->pinned ? "Unpin Tab" : "Pin Tab", this, [this, id, pinned = s->pinned]() {
            if (pinned) m_controller->post(intent::Unpin{id});
            else        m_controller->post(intent::Pin{id});
        });
        menu.addAction("Reload", this, [this, id]() { m_controller->post(intent::Reload{id}); });
        menu.addSeparator();
        menu.addAction("Close Tab", this, [this, id]() { m_controller->post(intent::CloseTab{id}); });
        menu.exec(m_tabList->viewport()->mapToGlobal(pos));
    });
}

void MainWindow::createNewTabPage() {
    m_newTabPage = new QWidget;
    auto* lay = new QVBoxLayout(m_newTabPage);
    lay->setContentsMargins(48, 32, 48, 32);

    auto* heading = new QLabel("Pinned");
    QFont f = heading->font();
    f.setPointSizeF(f.pointSizeF() * 1.4);
    heading->setFont(f);
    lay->addWidget(heading);

    m_pinnedList = new QListWidget;
    m_pinnedList->setDragDropMode(QAbstractItemView::InternalMove);
    m_pinnedList->setDefaultDropAction(Qt::MoveAction);
    m_pinnedList->setContextMenuPolicy(Qt::CustomContextMenu);
    lay->addWidget(m_pinnedList, 1);

    connect(m_pinnedList, &QListWidget::itemActivated, this, [this](QListWidgetItem* item) {
        const QString url = item->data(kUrlRole).toString();
        if (TabId id = activeTabId())
            m_controller->post(intent::Navigate{id, url});
        else
            m_controller->post(intent::NewTab{url, false});
    });
    connect(m_pinnedList->model(), &QAbstractItemModel::rowsMoved, this,
            [this](const QModelIndex&, int start, int, const QModelIndex&, int row) {
        if (m_rendering) return;
        m_controller->post(intent::ReorderPinned{start, row > start ? row - 1 : row});
    });
    connect(m_pinnedList, &QWidget::customContextMenuRequested, this, [this](const QPoint& pos) {
        QListWidgetItem* item = m_pinnedList->itemAt(pos);
        if (!item) return;
        const QString url = item->data(kUrlRole).toString();
        QMenu menu;
        menu.addAction("Open in New Tab", this, [this, url]() {
            m_controller->post(intent::NewTab{url, false});
        });
        menu.addAction("Remove", this, [this, url]() {
            m_controller->post(intent::UnpinUrl{url});
        });
        menu.exec(m_pinnedList->viewport()->mapToGlobal(pos));
    });

    m_pages->addWidget(m_newTabPage);
}

void MainWindow::rebuildThemeMenu() {
    if (!m_themeMenu) return;
    m_themeMenu->clear();
    delete m_themeGroup;
    m_themeGroup = new QActionGroup(this);
    m_themeGroup->setExclusive(true);

    const QString currentId = m_controller->themes()->currentId();
    for (const Theme& t : m_controller->themes()->themes()) {
        auto* act = m_themeMenu->addAction(t.name);
        act->setCheckable(true);
        act->setActionGroup(m_themeGroup);
        act->setChecked(t.id == currentId);
        connect(act, &QAction::triggered, this, [this, id = t.id]() {
            m_controller->post(intent::SetTheme{id});
        });
    }
}

// ── Tab views ──

void MainWindow::onTabOpened(TabId id) {
    if (m_views.contains(id)) return;
    Tab* t = m_controller->registry()->tab(id);
    if (!t || !t->engine()) return;
    QWidget* view = t->engine()->view();
    if (!view) return;
    m_pages->addWidget(view);
    m_views.insert(id, view);
}

void MainWindow::onTabRemoved(TabId id) {
    // The binding deletes its view, which also takes it out of the stack.
    m_views.remove(id);
}

// ── Rendering ──

void MainWindow::render(const ViewModel& vm) {
    m_rendering = true;
    renderTabList(vm);
    renderPinnedList(vm);
    renderActive(vm);
    m_rendering = false;
}

void MainWindow::renderTabList(const ViewModel& vm) {
    const Theme& theme = vm.theme;
    while (m_tabList->count() > vm.tabs.size())
        delete m_tabList->takeItem(m_tabList->count() - 1);
    while (m_tabList->count() < vm.tabs.size())
        m_tabList->addItem(new QListWidgetItem);

    for (int i = 0; i < vm.tabs.size(); i++) {
        const TabSummary& s = vm.tabs[i];
        QListWidgetItem* item = m_tabList->item(i);
        QString text = elideLabel(s.label);
        if (s.loadState == LoadState::Loading)
            text = QStringLiteral("⟳ ") + text;
        item->setText(text);
        item->setToolTip(s.loadState == LoadState::Failed
                         ? QStringLiteral("%1\n%2").arg(s.url, s.failureReason) : s.url);
        item->setData(kTabIdRole, QVariant::fromValue<qulonglong>(s.id));
        item->setForeground(s.loadState == LoadState::Failed ? theme.error
                            : s.active ? theme.text : theme.textMuted);
        QColor pinnedTint = theme.tabPinned;
        pinnedTint.setAlpha(48);
        item->setBackground(s.pinned ? pinnedTint : QColor(Qt::transparent));
        if (s.active)
            m_tabList->setCurrentRow(i);
    }
}

void MainWindow::renderPinnedList(const ViewModel& vm) {
    m_pinnedList->clear();
    for (const PinnedEntry& e : vm.pinnedEntries) {
        auto* item = new QListWidgetItem(e.title.isEmpty() ? e.url : e.title);
        item->setToolTip(e.url);
        item->setData(kUrlRole, e.url);
        item->setForeground(vm.theme.link);
        m_pinnedList->addItem(item);
    }
}

void MainWindow::renderActive(const ViewModel& vm) {
    const TabSummary* s = vm.find(vm.activeTabId);

    m_backAction->setEnabled(s && s->canGoBack);
    m_forwardAction->setEnabled(s && s->canGoForward);
    m_pinAction->setEnabled(s != nullptr);
    m_pinAction->setChecked(s && s->pinned);

    const bool loading = s && s->loadState == LoadState::Loading;
    m_reloadAction->setEnabled(s && s->engineAvailable && !s->isNewTabPage);
    m_reloadAction->setIcon(style()->standardIcon(loading ? QStyle::SP_BrowserStop
                                                          : QStyle::SP_BrowserReload));
    m_reloadAction->setText(loading ? "Stop" : "Reload");
    m_progress->setVisible(loading);
    m_progress->setValue(loading ? s->progress : 0);

    if (!s) {
        m_location->clear();
        m_pages->setCurrentWidget(m_newTabPage);
        m_statusLabel->clear();
        setWindowTitle("Verta");
        return;
    }

    if (!m_location->hasFocus())
        m_location->setText(s->isNewTabPage ? QString() : s->url);

    QWidget* view = m_views.value(s->id);
    m_pages->setCurrentWidget(s->isNewTabPage || !view ? m_newTabPage : view);

    switch (s->loadState) {
    case LoadState::Failed:
        m_statusLabel->setText(s->failureReason);
        break;
    case LoadState::Loading:
        m_statusLabel->setText(QStringLiteral("Loading %1").arg(s->url));
        break;
    default:
        m_statusLabel->setText(QString::fromLatin1(loadStateToString(s->loadState)));
        break;
    }
    setWindowTitle(QStringLiteral("%1 - Verta").arg(s->label));
}

TabId MainWindow::idForItem(const QListWidgetItem* item) const {
    return item ? item->data(kTabIdRole).value<qulonglong>() : 0;
}

// ── Actions ──

void MainWindow::newTab() {
    m_controller->post(intent::NewTab{QString(), false});
    m_location->setFocus();
}

void MainWindow::closeActiveTab() {
    if (TabId id = activeTabId())
        m_controller->post(intent::CloseTab{id});
}

void MainWindow::togglePin() {
    const TabSummary* s = m_controller->viewModel().find(activeTabId());
    if (!s) return;
    if (s->pinned) m_controller->post(intent::Unpin{s->id});
    else           m_controller->post(intent::Pin{s->id});
}

void MainWindow::goBack() {
    if (TabId id = activeTabId())
        m_controller->post(intent::GoBack{id});
}

void MainWindow::goForward() {
    if (TabId id = activeTabId())
        m_controller->post(intent::GoForward{id});
}

void MainWindow::reloadOrStop() {
    const TabSummary* s = m_controller->viewModel().find(activeTabId());
    if (!s) return;
    if (s->loadState == LoadState::Loading) m_controller->post(intent::Stop{s->id});
    else                                    m_controller->post(intent::Reload{s->id});
}

void MainWindow::submitLocation() {
    const QString text = m_location->text().trimmed();
    if (text.isEmpty()) return;
    if (TabId id = activeTabId())
        m_controller->post(intent::Navigate{id, text});
    else
        m_controller->post(intent::NewTab{text, false});
    m_location->clearFocus();
}

void MainWindow::about() {
    QMessageBox::about(this, "About Verta",
        QStringLiteral("<b>Verta</b><br>A vertical-tab browser shell.<br>"
                       "<span style='color:%1;'>Build " __DATE__ " " __TIME__ "</span>")
            .arg(m_controller->themes()->current().textDim.name()));
}

} // namespace vrt
