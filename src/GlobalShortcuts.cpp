#include "GlobalShortcuts.h"

#include "BestEffort.h"
#include "Logging.h"

#include <QAction>

#include <KGlobalAccel>

GlobalShortcuts::GlobalShortcuts(QObject *parent)
    : QObject(parent)
{
}

QList<QKeySequence> GlobalShortcuts::parseSequences(const QStringList &specs, QStringList *rejected)
{
    QList<QKeySequence> out;
    for (const auto &text : specs) {
        const QKeySequence seq = QKeySequence::fromString(text.trimmed(), QKeySequence::PortableText);
        bool valid = !seq.isEmpty();
        for (int i = 0; valid && i < seq.count(); ++i) {
            if (seq[i].key() == Qt::Key_unknown)
                valid = false;
        }
        if (valid && !out.contains(seq)) {
            out.append(seq);
        } else if (!valid && rejected) {
            rejected->append(text);
        }
    }
    return out;
}

QAction *GlobalShortcuts::addShortcut(const QString &id, const QKeySequence &sequence, bool showPanel)
{
    auto *action = new QAction(this);
    action->setObjectName(id);
    action->setText(showPanel ? tr("Show panel (%1)").arg(sequence.toString())
                              : tr("Toggle collapsed panel (%1)").arg(sequence.toString()));

    const QString seqText = sequence.toString(QKeySequence::PortableText);
    if (showPanel) {
        connect(action, &QAction::triggered, this, [this, seqText]() {
            qCInfo(lcShortcuts) << "global hotkey" << seqText << "triggered; focusing panel";
            emit showPanelRequested(seqText);
        });
    } else {
        connect(action, &QAction::triggered, this, [this, seqText]() {
            qCInfo(lcShortcuts) << seqText << "pressed via global shortcut";
            emit toggleCollapseRequested(seqText);
        });
    }

    const bool ok = KGlobalAccel::setGlobalShortcut(action, sequence);
    if (bestEffort(lcShortcuts(), "register global shortcut", ok)) {
        qCDebug(lcShortcuts) << "registered" << id << "as" << seqText;
    } else {
        qCWarning(lcShortcuts) << "shortcut" << seqText << "is taken or the shortcut daemon is unavailable";
    }

    m_actions.append(action);
    return ok ? action : nullptr;
}

int GlobalShortcuts::registerShortcuts(const QStringList &showPanel, const QStringList &toggleCollapse)
{
    releaseShortcuts();

    QStringList rejected;
    const auto showSeqs = parseSequences(showPanel, &rejected);
    const auto toggleSeqs = parseSequences(toggleCollapse, &rejected);
    for (const auto &bad : rejected)
        qCWarning(lcShortcuts) << "ignoring unparseable shortcut" << bad;

    int registered = 0;
    for (int i = 0; i < showSeqs.size(); ++i) {
        if (addShortcut(QStringLiteral("show-panel-%1").arg(i), showSeqs.at(i), true))
            ++registered;
    }
    for (int i = 0; i < toggleSeqs.size(); ++i) {
        if (addShortcut(QStringLiteral("toggle-collapse-%1").arg(i), toggleSeqs.at(i), false))
            ++registered;
    }

    qCInfo(lcShortcuts) << registered << "of" << (showSeqs.size() + toggleSeqs.size())
                        << "global shortcuts registered";
    return registered;
}

void GlobalShortcuts::releaseShortcuts()
{
    for (QAction *action : std::as_const(m_actions))
        action->deleteLater();
    m_actions.clear();
}

int GlobalShortcuts::resetShortcuts(const QStringList &showPanel, const QStringList &toggleCollapse)
{
    qCInfo(lcShortcuts) << "resetting global shortcuts to the configured sequences";
    for (QAction *action : std::as_const(m_actions))
        KGlobalAccel::self()->removeAllShortcuts(action);
    return registerShortcuts(showPanel, toggleCollapse);
}
