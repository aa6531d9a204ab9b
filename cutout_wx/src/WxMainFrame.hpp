#pragma once
#include <wx/wx.h>
#include <wx/splitter.h>
#include <cstdint>
#include <exception>
#include <map>
#include <thread>
#include "mask_session.hpp"
#include "segmenter.hpp"

class WxControlPanel;
class WxPreviewPanel;

class WxMainFrame : public wxFrame
{
public:
    explicit WxMainFrame(wxWindow* parent);
    ~WxMainFrame() override;

private:
    cutout::MaskSession session_;

    wxSplitterWindow* splitter_ {nullptr};
    WxControlPanel* controls_ {nullptr};
    WxPreviewPanel* preview_ {nullptr};

    // Data
    wxString currentImagePath_;
    wxString pendingImagePath_;
    // In-flight loader threads by load generation; joined when their result arrives
    std::map<std::uint64_t, std::thread> loaders_;

    wxDECLARE_EVENT_TABLE();

private:
    void BuildMenus();
    void WireControls();
    void StartLoad(const wxString& imagePath, const wxString& segmentedPath = wxString());
    void OnLoadFinished(std::uint64_t generation, const cutout::LoadedImages& images);
    void OnLoadFailed(std::uint64_t generation, const cutout::LoadFailure& failure);
    void ReapLoader(std::uint64_t generation);
    void ReportError(const std::exception& e);
    void ApplyBrush();
    void ApplyBackground();
    void SetSessionBackground();
    void SyncControls();
    void ExportResult();

    void OnOpen(wxCommandEvent&);
    void OnOpenSegmented(wxCommandEvent&);
    void OnExport(wxCommandEvent&);
    void OnUndo(wxCommandEvent&);
    void OnRedo(wxCommandEvent&);
    void OnResetMask(wxCommandEvent&);
    void OnQuit(wxCommandEvent&);
};
