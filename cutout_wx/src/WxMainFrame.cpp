#include "WxMainFrame.hpp"
#include <wx/sizer.h>
#include <wx/filename.h>
#include <wx/filedlg.h>
#include <opencv2/imgcodecs.hpp>
#include <exception>
#include <iostream>
#include <memory>
#include "WxControlPanel.hpp"
#include "WxPreviewPanel.hpp"
#include "util/ImageOps.hpp"

namespace
{
    enum MenuId
    {
        ID_OpenSegmented = wxID_HIGHEST + 1,
        ID_ResetMask,
    };

    const char* kImageWildcard =
        "Image files (*.png;*.jpg;*.jpeg;*.bmp;*.tiff;*.tif;*.webp)|*.png;*.jpg;*.jpeg;*.bmp;*.tiff;*.tif;*.webp|All files (*.*)|*.*";
}

wxBEGIN_EVENT_TABLE(WxMainFrame, wxFrame)
    EVT_MENU(wxID_OPEN, WxMainFrame::OnOpen)
    EVT_MENU(ID_OpenSegmented, WxMainFrame::OnOpenSegmented)
    EVT_MENU(wxID_SAVEAS, WxMainFrame::OnExport)
    EVT_MENU(wxID_UNDO, WxMainFrame::OnUndo)
    EVT_MENU(wxID_REDO, WxMainFrame::OnRedo)
    EVT_MENU(ID_ResetMask, WxMainFrame::OnResetMask)
    EVT_MENU(wxID_EXIT, WxMainFrame::OnQuit)
wxEND_EVENT_TABLE()

WxMainFrame::WxMainFrame(wxWindow* parent)
    : wxFrame(parent, wxID_ANY, "Cutout Editor", wxDefaultPosition, wxSize(1400, 900))
{
    SetMinSize(wxSize(1000, 700));
    BuildMenus();

    splitter_ = new wxSplitterWindow(this, wxID_ANY);
    controls_ = new WxControlPanel(splitter_, session_.settings());
    preview_  = new WxPreviewPanel(splitter_, session_);
    splitter_->SplitVertically(controls_, preview_, 340);
    splitter_->SetMinimumPaneSize(200);

    session_.setRedrawCallback([this](const cutout::PixelBuffer& frame){
        preview_->ShowPreview(frame);
        SyncControls();
    });

    WireControls();
    ApplyBrush();
}

WxMainFrame::~WxMainFrame()
{
    // Loaders call back into this frame; wait for them before anything is torn down.
    // A loader running the external segmenter blocks here until the script exits.
    if (!loaders_.empty())
    {
        std::cerr << "[WxMainFrame] waiting for " << loaders_.size() << " image load(s) to finish\n";
        wxBusyCursor wait;
        for (auto& entry : loaders_)
            if (entry.second.joinable()) entry.second.join();
        loaders_.clear();
    }
    session_.setRedrawCallback(nullptr);
    DestroyChildren();
}

void WxMainFrame::BuildMenus()
{
    auto* menuBar = new wxMenuBar();
    auto* fileMenu = new wxMenu();
    fileMenu->Append(wxID_OPEN, "&Open Image...\tCtrl+O");
    fileMenu->Append(ID_OpenSegmented, "Open &Segmented Result...");
    fileMenu->Append(wxID_SAVEAS, "&Export...\tCtrl+E");
    fileMenu->AppendSeparator();
#ifdef __WXMAC__
    fileMenu->Append(wxID_OSX_HIDE);
    fileMenu->Append(wxID_OSX_HIDEOTHERS);
    fileMenu->AppendSeparator();
#endif
    fileMenu->Append(wxID_EXIT);
    menuBar->Append(fileMenu, "&File");

    // wx maps Ctrl to Cmd on macOS
    auto* editMenu = new wxMenu();
    editMenu->Append(wxID_UNDO, "&Undo\tCtrl+Z");
    editMenu->Append(wxID_REDO, "&Redo\tCtrl+Y");
    editMenu->AppendSeparator();
    editMenu->Append(ID_ResetMask, "Reset &Mask");
    menuBar->Append(editMenu, "&Edit");
    SetMenuBar(menuBar);

    wxAcceleratorEntry entries[1];
    entries[0].Set(wxACCEL_CTRL | wxACCEL_SHIFT, (int)'Z', wxID_REDO);
    SetAcceleratorTable(wxAcceleratorTable(1, entries));
}

void WxMainFrame::WireControls()
{
    controls_->Bind(wxEVT_CUTOUT_OPEN_REQUESTED, [this](wxCommandEvent& ev){ StartLoad(ev.GetString()); });
    controls_->Bind(wxEVT_CUTOUT_BRUSH_CHANGED, [this](wxCommandEvent&){ ApplyBrush(); });
    controls_->Bind(wxEVT_CUTOUT_BACKGROUND_CHANGED, [this](wxCommandEvent&){ ApplyBackground(); });
    controls_->Bind(wxEVT_CUTOUT_UNDO_REQUESTED, [this](wxCommandEvent& ev){ OnUndo(ev); });
    controls_->Bind(wxEVT_CUTOUT_REDO_REQUESTED, [this](wxCommandEvent& ev){ OnRedo(ev); });
    controls_->Bind(wxEVT_CUTOUT_RESET_REQUESTED, [this](wxCommandEvent& ev){ OnResetMask(ev); });
    controls_->Bind(wxEVT_CUTOUT_EXPORT_REQUESTED, [this](wxCommandEvent&){ ExportResult(); });
    controls_->Bind(wxEVT_CUTOUT_COMPARE_TOGGLED, [this](wxCommandEvent&){
        preview_->SetComparison(controls_->isComparisonEnabled());
    });
    controls_->Bind(wxEVT_CUTOUT_CLEAR_REQUESTED, [this](wxCommandEvent&){
        session_.clear();
        currentImagePath_.clear();
        pendingImagePath_.clear();
        controls_->resetBackground();
        controls_->setLoading(false);
        preview_->SetComparison(false);
        SyncControls();
    });
}

void WxMainFrame::StartLoad(const wxString& imagePath, const wxString& segmentedPath)
{
    cutout::LoadRequest req;
    req.generation = session_.beginLoad();
    req.sourcePath = std::string(imagePath.mb_str());
    req.segmentedPath = std::string(segmentedPath.mb_str());
    pendingImagePath_ = imagePath;
    controls_->setLoading(true);
    preview_->SetStatus("Processing...");
    SyncControls();

    const cutout::EditorSettings settings = session_.settings();
    loaders_[req.generation] = std::thread([this, req, settings]() {
        auto images = std::make_shared<cutout::LoadedImages>();
        cutout::LoadFailure failure;
        bool ok = false;
        try
        {
            ok = cutout::prepareLoad(req, settings, *images, failure);
        }
        catch (const std::exception& e)
        {
            failure = {cutout::ErrorKind::DecodeFailure, e.what()};
        }
        const std::uint64_t gen = req.generation;
        if (ok) CallAfter([this, gen, images]() { OnLoadFinished(gen, *images); });
        else CallAfter([this, gen, failure]() { OnLoadFailed(gen, failure); });
    });
}

void WxMainFrame::ReapLoader(std::uint64_t generation)
{
    auto it = loaders_.find(generation);
    if (it == loaders_.end()) return;
    // CallAfter is the loader's last statement, so this join returns promptly
    if (it->second.joinable()) it->second.join();
    loaders_.erase(it);
}

void WxMainFrame::OnLoadFinished(std::uint64_t generation, const cutout::LoadedImages& images)
{
    ReapLoader(generation);
    const bool current = generation == session_.generation();
    const bool ok = session_.completeLoad(generation, images.source, images.segmented);
    if (!current) return;
    controls_->setLoading(false);
    if (!ok)
    {
        const auto& err = session_.lastError();
        preview_->SetStatus(err ? wxString::FromUTF8(err->message.c_str()) : wxString("Load failed"), true);
        SyncControls();
        return;
    }
    currentImagePath_ = pendingImagePath_;
    controls_->resetBackground();
    preview_->SetTitle(wxFileName(currentImagePath_).GetFullName() +
                       wxString::Format(" (%dx%d)", session_.source().width(), session_.source().height()));
    preview_->SetStatus(wxString::FromUTF8("\xE2\x9C\x93"));
    SyncControls();
}

void WxMainFrame::OnLoadFailed(std::uint64_t generation, const cutout::LoadFailure& failure)
{
    ReapLoader(generation);
    const bool current = generation == session_.generation();
    session_.failLoad(generation, failure.kind, failure.message);
    if (!current) return;
    controls_->setLoading(false);
    preview_->SetStatus("Failed to process image", true);
    SyncControls();
}

void WxMainFrame::ApplyBrush()
{
    session_.setBrushMode(controls_->getBrushMode());
    session_.setBrushSize(controls_->getBrushSize());
    preview_->RefreshBrush();
}

void WxMainFrame::ReportError(const std::exception& e)
{
    std::cerr << "[WxMainFrame] " << e.what() << "\n";
    preview_->SetStatus(wxString::FromUTF8(e.what()), true);
}

void WxMainFrame::ApplyBackground()
{
    try
    {
        SetSessionBackground();
    }
    catch (const cutout::EditorError& e)
    {
        ReportError(e);
    }
    catch (const cv::Exception& e)
    {
        ReportError(e);
    }
}

void WxMainFrame::SetSessionBackground()
{
    switch (controls_->getBackgroundChoice())
    {
        case BackgroundChoice::Transparent:
            session_.setBackground(cutout::TransparentBackground{});
            break;
        case BackgroundChoice::Color:
        {
            cv::Scalar bgra;
            if (!util::parseHexColor(std::string(controls_->getBackgroundColor().mb_str()), bgra)) return;
            cutout::SolidColorBackground solid;
            solid.color = cutout::Rgba{(std::uint8_t)bgra[2], (std::uint8_t)bgra[1], (std::uint8_t)bgra[0], 255};
            session_.setBackground(solid);
            break;
        }
        case BackgroundChoice::Image:
        {
            const wxString path = controls_->getBackgroundImagePath();
            if (path.IsEmpty()) return; // nothing picked yet
            cutout::ImageBackground bg;
            std::string error;
            if (!cutout::decodeImage(std::string(path.mb_str()), bg.image, error))
            {
                std::cerr << "[WxMainFrame] " << error << "\n";
                preview_->SetStatus("Failed to load background image", true);
                return;
            }
            session_.setBackground(std::move(bg));
            break;
        }
    }
}

void WxMainFrame::SyncControls()
{
    controls_->syncSessionState(session_.hasImage() && !session_.isLoading(), session_.canUndo(), session_.canRedo());
    if (auto* mb = GetMenuBar())
    {
        const bool ready = session_.hasImage() && !session_.isLoading();
        mb->Enable(wxID_UNDO, ready && session_.canUndo());
        mb->Enable(wxID_REDO, ready && session_.canRedo());
        mb->Enable(ID_ResetMask, ready);
        mb->Enable(wxID_SAVEAS, ready);
        mb->Enable(ID_OpenSegmented, !currentImagePath_.IsEmpty() || !pendingImagePath_.IsEmpty());
    }
}

void WxMainFrame::ExportResult()
{
    if (!session_.hasImage()) { preview_->SetStatus("No image loaded", true); return; }
    wxString defDir = currentImagePath_.IsEmpty() ? wxString() : wxFileName(currentImagePath_).GetPath();
    wxFileDialog dlg(this, "Export Result", defDir, session_.suggestedExportName(),
                     "PNG image (*.png)|*.png", wxFD_SAVE | wxFD_OVERWRITE_PROMPT);
    if (dlg.ShowModal() != wxID_OK) return;

    const std::string outPath(dlg.GetPath().mb_str());
    bool ok = false;
    try
    {
        cutout::PixelBuffer out = session_.exportComposite();
        ok = cv::imwrite(outPath, out.mat());
    }
    catch (const cutout::EditorError& e)
    {
        std::cerr << "[WxMainFrame] export failed: " << e.what() << "\n";
    }
    catch (const cv::Exception& e)
    {
        std::cerr << "[WxMainFrame] export failed: " << e.what() << "\n";
    }
    if (ok) preview_->SetStatus("Saved " + wxFileName(dlg.GetPath()).GetFullName());
    else preview_->SetStatus("Failed to save image", true);
}

void WxMainFrame::OnOpen(wxCommandEvent&)
{
    wxFileDialog dlg(this, "Open Image", wxEmptyString, wxEmptyString, kImageWildcard,
                     wxFD_OPEN | wxFD_FILE_MUST_EXIST);
    if (dlg.ShowModal() == wxID_OK) StartLoad(dlg.GetPath());
}

void WxMainFrame::OnOpenSegmented(wxCommandEvent&)
{
    const wxString image = currentImagePath_.IsEmpty() ? pendingImagePath_ : currentImagePath_;
    if (image.IsEmpty()) { preview_->SetStatus("Open an image first", true); return; }
    wxFileDialog dlg(this, "Open Segmented Result (RGBA)", wxFileName(image).GetPath(), wxEmptyString,
                     "PNG image (*.png)|*.png|All files (*.*)|*.*", wxFD_OPEN | wxFD_FILE_MUST_EXIST);
    if (dlg.ShowModal() == wxID_OK) StartLoad(image, dlg.GetPath());
}

void WxMainFrame::OnExport(wxCommandEvent&)
{
    ExportResult();
}

void WxMainFrame::OnUndo(wxCommandEvent&)
{
    try
    {
        if (!session_.undo()) SyncControls();
    }
    catch (const cutout::EditorError& e)
    {
        ReportError(e);
    }
}

void WxMainFrame::OnRedo(wxCommandEvent&)
{
    try
    {
        if (!session_.redo()) SyncControls();
    }
    catch (const cutout::EditorError& e)
    {
        ReportError(e);
    }
}

void WxMainFrame::OnResetMask(wxCommandEvent&)
{
    try
    {
        session_.resetMask();
    }
    catch (const cutout::EditorError& e)
    {
        ReportError(e);
    }
}

void WxMainFrame::OnQuit(wxCommandEvent&)
{
    Close(true);
}
