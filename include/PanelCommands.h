#pragma once

#include "PanelModes.h"
#include "PanelPlacement.h"

#include <QString>

class PanelSurface;
class SettingsStore;

// User-triggered panel operations. A null `panel` means the window does not
// exist. Critical steps fail with false + errorString; showing, raising and
// keep-on-top are best-effort and only logged.
namespace PanelCommands {

bool positionTopCenter(PanelSurface *panel, int margin, PanelPlacement::Origin origin, bool keepOnTop,
                       QString *errorString);
bool positionEdgeCenter(PanelSurface *panel, PanelPlacement::Side side, int margin, bool keepOnTop,
                        QString *errorString);
bool center(PanelSurface *panel, QString *errorString);

struct ModeRequest {
    PanelMode mode = PanelMode::Expanded;
    PanelPlacement::Side side = PanelPlacement::Side::Right;
    bool customPositionsEnabled = false;
    int margin = PanelPlacement::kDefaultMargin;
    PanelPlacement::Origin origin = PanelPlacement::Origin::TopLeft;
    bool keepOnTop = true;
};

// Resizes the panel for the mode, then places it at the stored custom
// position when the mode allows one, otherwise at the mode's default anchor.
bool applyMode(PanelSurface *panel, const SettingsStore &store, const ModeRequest &request,
               QString *errorString);

void showPanel(PanelSurface *panel, bool keepOnTop);

} // namespace PanelCommands
