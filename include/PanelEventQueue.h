#pragma once

#include <QObject>
#include <QString>
#include <QTimer>

#include <functional>
#include <vector>

struct PanelEvent {
    enum class Kind {
        ShowPanel,      // hotkey, tray click or "Show Window"
        ToggleCollapse, // toggle-collapse hotkey
        Quit,
        Relaunch,       // a second instance was started
        CloseRequested,
        EscapePressed,
    };

    Kind kind;
    QString source; // e.g. "tray", "hotkey:Ctrl+Space"
};

QString panelEventName(PanelEvent::Kind kind);

// Delivers posted events, in order, on the next event loop turn to one handler.
class PanelEventQueue final : public QObject
{
    Q_OBJECT
public:
    using Handler = std::function<void(const PanelEvent &)>;

    explicit PanelEventQueue(QObject *parent = nullptr);

    void setHandler(Handler handler);
    void post(PanelEvent event);

    int pendingCount() const { return static_cast<int>(m_pending.size()); }

private:
    void flush();

    QTimer m_timer;
    Handler m_handler;
    std::vector<PanelEvent> m_pending;
};
