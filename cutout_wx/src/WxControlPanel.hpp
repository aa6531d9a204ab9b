#pragma once
#include <wx/wx.h>
#include <wx/spinctrl.h>
#include <wx/choice.h>
#include <wx/stattext.h>
#include <wx/tglbtn.h>
#include <wx/dnd.h>

#include "models/BrushMode.hpp"
#include "models/EditorSettings.hpp"

// Custom event declarations
wxDECLARE_EVENT(wxEVT_CUTOUT_BRUSH_CHANGED, wxCommandEvent);
wxDECLARE_EVENT(wxEVT_CUTOUT_BACKGROUND_CHANGED, wxCommandEvent);
wxDECLARE_EVENT(wxEVT_CUTOUT_OPEN_REQUESTED, wxCommandEvent);
wxDECLARE_EVENT(wxEVT_CUTOUT_UNDO_REQUESTED, wxCommandEvent);
wxDECLARE_EVENT(wxEVT_CUTOUT_REDO_REQUESTED, wxCommandEvent);
wxDECLARE_EVENT(wxEVT_CUTOUT_RESET_REQUESTED, wxCommandEvent);
wxDECLARE_EVENT(wxEVT_CUTOUT_CLEAR_REQUESTED, wxCommandEvent);
wxDECLARE_EVENT(wxEVT_CUTOUT_EXPORT_REQUESTED, wxCommandEvent);
wxDECLARE_EVENT(wxEVT_CUTOUT_COMPARE_TOGGLED, wxCommandEvent);

enum class BackgroundChoice
{
    Transparent = 0,
    Color = 1,
    Image = 2,
};

class WxImageDropTarget;

class WxControlPanel : public wxPanel
{
public:
    WxControlPanel(wxWindow* parent, const cutout::EditorSettings& settings);

    cutout::BrushMode getBrushMode() const;
    int getBrushSize() const;
    BackgroundChoice getBackgroundChoice() const;
    wxString getBackgroundColor() const;      // "#RRGGBB"
    wxString getBackgroundImagePath() const;  // empty until picked
    bool isComparisonEnabled() const;

    // Enables the history/export buttons to match the session
    void syncSessionState(bool hasImage, bool canUndo, bool canRedo);
    // Back to Transparent without firing an event (a new load resets the background)
    void resetBackground();
    void setLoading(bool loading);

private:
    void BuildUI(const cutout::EditorSettings& settings);
    void WireEvents();
    void UpdateBackgroundRows();
    void FireBackgroundChanged();
    void Post(const wxEventType& type, const wxString& payload = wxString());

    // Brush
    wxChoice* brushMode_ {nullptr};
    wxSpinCtrl* brushSize_ {nullptr};

    // Background
    wxChoice* bgChoice_ {nullptr};
    wxStaticBoxSizer* colorBox_ {nullptr};
    wxTextCtrl* hexEntry_ {nullptr};
    wxPanel* swatch_ {nullptr};
    wxStaticBoxSizer* imageBox_ {nullptr};
    wxButton* bgImageBtn_ {nullptr};
    wxStaticText* bgImageLabel_ {nullptr};
    wxString bgImagePath_;
    wxString lastValidHex_ {"#FFFFFF"};

    // Session actions
    wxButton* openBtn_ {nullptr};
    wxButton* undoBtn_ {nullptr};
    wxButton* redoBtn_ {nullptr};
    wxButton* resetBtn_ {nullptr};
    wxButton* clearBtn_ {nullptr};
    wxButton* exportBtn_ {nullptr};
    wxToggleButton* compareBtn_ {nullptr};
    wxStaticText* loadingLabel_ {nullptr};

    friend class WxImageDropTarget;
};

// Dropping an image file on the panel opens it
class WxImageDropTarget : public wxFileDropTarget
{
public:
    explicit WxImageDropTarget(WxControlPanel* owner) : owner_(owner) {}
    bool OnDropFiles(wxCoord, wxCoord, const wxArrayString& filenames) override;
private:
    WxControlPanel* owner_;
};
