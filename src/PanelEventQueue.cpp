#include "PanelEventQueue.h"

#include "Logging.h"

QString panelEventName(PanelEvent::Kind kind)
{
    switch (kind) {
    case PanelEvent::Kind::ShowPanel:
        return QStringLiteral("show-panel");
    case PanelEvent::Kind::ToggleCollapse:
        return QStringLiteral("toggle-collapse");
    case PanelEvent::Kind::Quit:
        return QStringLiteral("quit");
    case PanelEvent::Kind::Relaunch:
        return QStringLiteral("relaunch");
    case PanelEvent::Kind::CloseRequested:
        return QStringLiteral("close-requested");
    case PanelEvent::Kind::EscapePressed:
        return QStringLiteral("escape-pressed");
    }
    return QStringLiteral("unknown");
}

PanelEventQueue::PanelEventQueue(QObject *parent)
    : QObject(parent)
{
    m_timer.setSingleShot(true);
    m_timer.setInterval(0);
    connect(&m_timer, &QTimer::timeout, this, &PanelEventQueue::flush);
}

void PanelEventQueue::setHandler(Handler handler)
{
    m_handler = std::move(handler);
}

void PanelEventQueue::post(PanelEvent event)
{
    qCDebug(lcApp) << "event queued:" << panelEventName(event.kind) << "from" << event.source;
    m_pending.emplace_back(std::move(event));
    if (!m_timer.isActive())
        m_timer.start();
}

void PanelEventQueue::flush()
{
    // Events posted by the handler land in m_pending and restart the timer.
    auto work = std::move(m_pending);
    m_pending.clear();
    for (const auto &event : work) {
        if (m_handler)
            m_handler(event);
        else
            qCWarning(lcApp) << "dropping" << panelEventName(event.kind) << "- no dispatcher";
    }
}
