#pragma once

#include <QKeySequence>
#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>

class QAction;

// System-wide hotkeys registered with KGlobalAccel. One action per sequence,
// so a trigger can be attributed to the sequence that fired it.
class GlobalShortcuts final : public QObject
{
    Q_OBJECT
public:
    explicit GlobalShortcuts(QObject *parent = nullptr);

    // Returns how many sequences were accepted by the shortcut daemon. Bindings
    // the user changed in the system settings win over `showPanel` and
    // `toggleCollapse`; they survive releaseShortcuts() and process exit.
    int registerShortcuts(const QStringList &showPanel, const QStringList &toggleCollapse);
    // Drops the actions, leaving the daemon's bindings in place.
    void releaseShortcuts();
    // Erases the daemon's bindings, user changes included, and registers the
    // given sequences again.
    int resetShortcuts(const QStringList &showPanel, const QStringList &toggleCollapse);

    int actionCount() const { return m_actions.size(); }

    // Portable-text sequences ("Ctrl+Space", "Meta+1"). Unparseable entries are
    // dropped and reported through `rejected`.
    static QList<QKeySequence> parseSequences(const QStringList &specs, QStringList *rejected = nullptr);

signals:
    void showPanelRequested(const QString &sequence);
    void toggleCollapseRequested(const QString &sequence);

private:
    QAction *addShortcut(const QString &id, const QKeySequence &sequence, bool showPanel);

    QList<QAction *> m_actions;
};
