#include "WxControlPanel.hpp"
#include <wx/filedlg.h>
#include <wx/sizer.h>
#include <wx/statline.h>
#include <wx/filename.h>
#include <wx/wrapsizer.h>
#include "util/ImageOps.hpp"

// Define custom events
wxDEFINE_EVENT(wxEVT_CUTOUT_BRUSH_CHANGED, wxCommandEvent);
wxDEFINE_EVENT(wxEVT_CUTOUT_BACKGROUND_CHANGED, wxCommandEvent);
wxDEFINE_EVENT(wxEVT_CUTOUT_OPEN_REQUESTED, wxCommandEvent);
wxDEFINE_EVENT(wxEVT_CUTOUT_UNDO_REQUESTED, wxCommandEvent);
wxDEFINE_EVENT(wxEVT_CUTOUT_REDO_REQUESTED, wxCommandEvent);
wxDEFINE_EVENT(wxEVT_CUTOUT_RESET_REQUESTED, wxCommandEvent);
wxDEFINE_EVENT(wxEVT_CUTOUT_CLEAR_REQUESTED, wxCommandEvent);
wxDEFINE_EVENT(wxEVT_CUTOUT_EXPORT_REQUESTED, wxCommandEvent);
wxDEFINE_EVENT(wxEVT_CUTOUT_COMPARE_TOGGLED, wxCommandEvent);

static const char* kImageWildcard =
    "Image files (*.png;*.jpg;*.jpeg;*.bmp;*.tiff;*.tif;*.webp)|*.png;*.jpg;*.jpeg;*.bmp;*.tiff;*.tif;*.webp|All files (*.*)|*.*";

static bool IsImagePath(const wxString& p)
{
    wxFileName fn(p);
    wxString ext = fn.GetExt().Lower();
    return ext == "png" || ext == "jpg" || ext == "jpeg" || ext == "bmp" || ext == "tif" || ext == "tiff" || ext == "webp";
}

static wxColour HexToColour(const wxString& hex)
{
    cv::Scalar bgra;
    if (!util::parseHexColor(std::string(hex.mb_str()), bgra)) return wxColour(255, 255, 255);
    return wxColour((unsigned char)bgra[2], (unsigned char)bgra[1], (unsigned char)bgra[0]);
}

bool WxImageDropTarget::OnDropFiles(wxCoord, wxCoord, const wxArrayString& filenames)
{
    for (auto& f : filenames)
    {
        if (!IsImagePath(f)) continue;
        owner_->Post(wxEVT_CUTOUT_OPEN_REQUESTED, f);
        return true;
    }
    return false;
}

WxControlPanel::WxControlPanel(wxWindow* parent, const cutout::EditorSettings& settings) : wxPanel(parent)
{
    BuildUI(settings);
    WireEvents();
    SetDropTarget(new WxImageDropTarget(this));
    syncSessionState(false, false, false);
}

void WxControlPanel::BuildUI(const cutout::EditorSettings& settings)
{
    auto* root = new wxBoxSizer(wxVERTICAL);

    // Section: Image
    auto* fileBox = new wxStaticBoxSizer(wxVERTICAL, this, "Image");
    openBtn_ = new wxButton(this, wxID_ANY, "Open Image...");
    fileBox->Add(openBtn_, 0, wxEXPAND | wxALL, 6);
    fileBox->Add(new wxStaticText(this, wxID_ANY, "or drop an image here"), 0, wxLEFT | wxBOTTOM, 6);
    loadingLabel_ = new wxStaticText(this, wxID_ANY, "Processing image...");
    loadingLabel_->Hide();
    fileBox->Add(loadingLabel_, 0, wxLEFT | wxBOTTOM, 6);
    root->Add(fileBox, 0, wxEXPAND | wxALL, 6);

    // Section: Brush
    auto* brushBox = new wxStaticBoxSizer(wxVERTICAL, this, "Brush");
    auto* modeRow = new wxBoxSizer(wxHORIZONTAL);
    modeRow->Add(new wxStaticText(this, wxID_ANY, "Mode:"), 0, wxALIGN_CENTER_VERTICAL | wxRIGHT, 6);
    brushMode_ = new wxChoice(this, wxID_ANY);
    brushMode_->Append("Erase");
    brushMode_->Append("Restore");
    brushMode_->SetSelection(static_cast<int>(settings.brushMode));
    modeRow->Add(brushMode_, 1);
    brushBox->Add(modeRow, 0, wxEXPAND | wxALL, 6);

    auto* sizeRow = new wxBoxSizer(wxHORIZONTAL);
    sizeRow->Add(new wxStaticText(this, wxID_ANY, "Size:"), 0, wxALIGN_CENTER_VERTICAL | wxRIGHT, 6);
    brushSize_ = new wxSpinCtrl(this, wxID_ANY, wxEmptyString, wxDefaultPosition, wxSize(90, -1), wxSP_ARROW_KEYS,
                                settings.minBrushSize, settings.maxBrushSize, settings.brushSize);
    sizeRow->Add(brushSize_, 0, wxRIGHT, 6);
    sizeRow->Add(new wxStaticText(this, wxID_ANY, "px"), 0, wxALIGN_CENTER_VERTICAL);
    brushBox->Add(sizeRow, 0, wxALL, 6);
    root->Add(brushBox, 0, wxEXPAND | wxLEFT | wxRIGHT, 6);

    // Section: Background
    auto* bgBox = new wxStaticBoxSizer(wxVERTICAL, this, "Background");
    bgChoice_ = new wxChoice(this, wxID_ANY);
    bgChoice_->Append("Transparent");
    bgChoice_->Append("Color");
    bgChoice_->Append("Image");
    bgChoice_->SetSelection(0);
    bgBox->Add(bgChoice_, 0, wxEXPAND | wxALL, 6);

    colorBox_ = new wxStaticBoxSizer(wxVERTICAL, this, "Color");
    auto* presets = new wxWrapSizer(wxHORIZONTAL);
    for (const char* hex : cutout::kPresetBackgroundColors)
    {
        auto* b = new wxButton(this, wxID_ANY, wxEmptyString, wxDefaultPosition, wxSize(26, 26), wxBORDER_SIMPLE);
        b->SetBackgroundColour(HexToColour(hex));
        b->SetToolTip(hex);
        const wxString value(hex);
        b->Bind(wxEVT_BUTTON, [this, value](wxCommandEvent&){
            hexEntry_->ChangeValue(value);
            lastValidHex_ = value;
            swatch_->SetBackgroundColour(HexToColour(value));
            swatch_->Refresh();
            FireBackgroundChanged();
        });
        presets->Add(b, 0, wxRIGHT | wxBOTTOM, 3);
    }
    colorBox_->Add(presets, 0, wxEXPAND | wxALL, 6);
    auto* hexRow = new wxBoxSizer(wxHORIZONTAL);
    hexRow->Add(new wxStaticText(this, wxID_ANY, "Hex:"), 0, wxALIGN_CENTER_VERTICAL | wxRIGHT, 6);
    hexEntry_ = new wxTextCtrl(this, wxID_ANY, lastValidHex_, wxDefaultPosition, wxSize(100, -1), wxTE_PROCESS_ENTER);
    hexRow->Add(hexEntry_, 0, wxRIGHT, 6);
    swatch_ = new wxPanel(this, wxID_ANY, wxDefaultPosition, wxSize(26, 26), wxBORDER_SIMPLE);
    swatch_->SetBackgroundColour(HexToColour(lastValidHex_));
    hexRow->Add(swatch_, 0, wxALIGN_CENTER_VERTICAL);
    colorBox_->Add(hexRow, 0, wxALL, 6);
    bgBox->Add(colorBox_, 0, wxEXPAND | wxALL, 6);

    imageBox_ = new wxStaticBoxSizer(wxVERTICAL, this, "Image");
    bgImageBtn_ = new wxButton(this, wxID_ANY, "Choose Background...");
    bgImageLabel_ = new wxStaticText(this, wxID_ANY, "(none)");
    imageBox_->Add(bgImageBtn_, 0, wxALL, 6);
    imageBox_->Add(bgImageLabel_, 0, wxLEFT | wxBOTTOM, 6);
    bgBox->Add(imageBox_, 0, wxEXPAND | wxALL, 6);
    root->Add(bgBox, 0, wxEXPAND | wxALL, 6);

    root->Add(new wxStaticLine(this), 0, wxEXPAND | wxALL, 6);

    // Section: Edit / output
    auto* histRow = new wxBoxSizer(wxHORIZONTAL);
    undoBtn_ = new wxButton(this, wxID_ANY, "Undo");
    redoBtn_ = new wxButton(this, wxID_ANY, "Redo");
    resetBtn_ = new wxButton(this, wxID_ANY, "Reset Mask");
    histRow->Add(undoBtn_, 0, wxRIGHT, 6);
    histRow->Add(redoBtn_, 0, wxRIGHT, 6);
    histRow->Add(resetBtn_, 0);
    root->Add(histRow, 0, wxALL, 6);

    compareBtn_ = new wxToggleButton(this, wxID_ANY, "Compare Before / After");
    root->Add(compareBtn_, 0, wxEXPAND | wxLEFT | wxRIGHT, 6);

    auto* outRow = new wxBoxSizer(wxHORIZONTAL);
    clearBtn_ = new wxButton(this, wxID_ANY, "Clear");
    exportBtn_ = new wxButton(this, wxID_ANY, "Export...");
    outRow->Add(clearBtn_, 0, wxRIGHT, 6);
    outRow->Add(exportBtn_, 1);
    root->Add(outRow, 0, wxEXPAND | wxALL, 6);

    SetSizer(root);
    UpdateBackgroundRows();
}

void WxControlPanel::WireEvents()
{
    openBtn_->Bind(wxEVT_BUTTON, [this](wxCommandEvent&){
        wxFileDialog dlg(this, "Open Image", wxEmptyString, wxEmptyString, kImageWildcard,
                         wxFD_OPEN | wxFD_FILE_MUST_EXIST);
        if (dlg.ShowModal() == wxID_OK) Post(wxEVT_CUTOUT_OPEN_REQUESTED, dlg.GetPath());
    });

    brushMode_->Bind(wxEVT_CHOICE, [this](wxCommandEvent&){ Post(wxEVT_CUTOUT_BRUSH_CHANGED); });
    brushSize_->Bind(wxEVT_SPINCTRL, [this](wxCommandEvent&){ Post(wxEVT_CUTOUT_BRUSH_CHANGED); });
    // Also react to direct text edits in the spin control
    brushSize_->Bind(wxEVT_TEXT, [this](wxCommandEvent&){ Post(wxEVT_CUTOUT_BRUSH_CHANGED); });

    bgChoice_->Bind(wxEVT_CHOICE, [this](wxCommandEvent&){
        UpdateBackgroundRows();
        FireBackgroundChanged();
    });
    auto commitHex = [this](wxCommandEvent& ev){
        cv::Scalar bgra;
        const wxString v = hexEntry_->GetValue().Trim(true).Trim(false);
        if (util::parseHexColor(std::string(v.mb_str()), bgra))
        {
            lastValidHex_ = v.StartsWith("#") ? v.Upper() : "#" + v.Upper();
            swatch_->SetBackgroundColour(HexToColour(lastValidHex_));
            swatch_->Refresh();
            FireBackgroundChanged();
        }
        ev.Skip();
    };
    hexEntry_->Bind(wxEVT_TEXT_ENTER, commitHex);
    hexEntry_->Bind(wxEVT_TEXT, commitHex);

    bgImageBtn_->Bind(wxEVT_BUTTON, [this](wxCommandEvent&){
        wxFileDialog dlg(this, "Choose Background Image", wxEmptyString, wxEmptyString, kImageWildcard,
                         wxFD_OPEN | wxFD_FILE_MUST_EXIST);
        if (dlg.ShowModal() != wxID_OK) return;
        bgImagePath_ = dlg.GetPath();
        bgImageLabel_->SetLabel(wxFileName(bgImagePath_).GetFullName());
        Layout();
        FireBackgroundChanged();
    });

    undoBtn_->Bind(wxEVT_BUTTON, [this](wxCommandEvent&){ Post(wxEVT_CUTOUT_UNDO_REQUESTED); });
    redoBtn_->Bind(wxEVT_BUTTON, [this](wxCommandEvent&){ Post(wxEVT_CUTOUT_REDO_REQUESTED); });
    resetBtn_->Bind(wxEVT_BUTTON, [this](wxCommandEvent&){ Post(wxEVT_CUTOUT_RESET_REQUESTED); });
    clearBtn_->Bind(wxEVT_BUTTON, [this](wxCommandEvent&){ Post(wxEVT_CUTOUT_CLEAR_REQUESTED); });
    exportBtn_->Bind(wxEVT_BUTTON, [this](wxCommandEvent&){ Post(wxEVT_CUTOUT_EXPORT_REQUESTED); });
    compareBtn_->Bind(wxEVT_TOGGLEBUTTON, [this](wxCommandEvent&){ Post(wxEVT_CUTOUT_COMPARE_TOGGLED); });
}

void WxControlPanel::UpdateBackgroundRows()
{
    const BackgroundChoice c = getBackgroundChoice();
    colorBox_->ShowItems(c == BackgroundChoice::Color);
    imageBox_->ShowItems(c == BackgroundChoice::Image);
    Layout();
}

void WxControlPanel::FireBackgroundChanged()
{
    Post(wxEVT_CUTOUT_BACKGROUND_CHANGED);
}

void WxControlPanel::Post(const wxEventType& type, const wxString& payload)
{
    wxCommandEvent ev(type);
    ev.SetString(payload);
    wxPostEvent(this, ev);
}

cutout::BrushMode WxControlPanel::getBrushMode() const
{
    return brushMode_->GetSelection() == 1 ? cutout::BrushMode::Restore : cutout::BrushMode::Erase;
}

int WxControlPanel::getBrushSize() const
{
    return brushSize_->GetValue();
}

BackgroundChoice WxControlPanel::getBackgroundChoice() const
{
    int sel = bgChoice_ ? bgChoice_->GetSelection() : 0;
    if (sel == 1) return BackgroundChoice::Color;
    if (sel == 2) return BackgroundChoice::Image;
    return BackgroundChoice::Transparent;
}

wxString WxControlPanel::getBackgroundColor() const
{
    return lastValidHex_;
}

wxString WxControlPanel::getBackgroundImagePath() const
{
    return bgImagePath_;
}

bool WxControlPanel::isComparisonEnabled() const
{
    return compareBtn_->GetValue();
}

void WxControlPanel::syncSessionState(bool hasImage, bool canUndo, bool canRedo)
{
    undoBtn_->Enable(hasImage && canUndo);
    redoBtn_->Enable(hasImage && canRedo);
    resetBtn_->Enable(hasImage);
    clearBtn_->Enable(hasImage);
    exportBtn_->Enable(hasImage);
    compareBtn_->Enable(hasImage);
    if (!hasImage) compareBtn_->SetValue(false);
}

void WxControlPanel::resetBackground()
{
    bgChoice_->SetSelection(0);
    UpdateBackgroundRows();
}

void WxControlPanel::setLoading(bool loading)
{
    loadingLabel_->Show(loading);
    openBtn_->Enable(!loading);
    Layout();
}
