#pragma once
#include <wx/wx.h>
#include <wx/timer.h>
#include <opencv2/core.hpp>

namespace cutout { class MaskSession; class PixelBuffer; }

class WxPreviewPanel : public wxPanel
{
public:
    WxPreviewPanel(wxWindow* parent, cutout::MaskSession& session);

    // Called from the session's redraw callback with the fresh composite
    void ShowPreview(const cutout::PixelBuffer& preview);
    void ClearPreview();
    void SetComparison(bool enabled);
    void SetStatus(const wxString& message, bool isError = false);
    void SetTitle(const wxString& title);
    // Brush outline follows the current brush size / mode
    void RefreshBrush();

private:
    void BuildUI();
    void LayoutImages();
    void ShowOverlay(const wxString& text, const wxColour& color, int durationMs = 1200);
    void OnSize(wxSizeEvent&);

    cutout::MaskSession& session_;
    wxStaticText* title_ {nullptr};
    class MaskCanvas* canvas_ {nullptr};
    wxStaticText* overlay_ {nullptr};
    wxTimer overlayHideTimer_;

    // Full working-resolution BGRA image currently on screen
    cv::Mat displayMat_;
    bool comparison_ {false};

    wxDECLARE_EVENT_TABLE();
};

// Draws the live preview scaled to fit and turns mouse input into brush strokes
class MaskCanvas : public wxPanel
{
public:
    MaskCanvas(WxPreviewPanel* owner, cutout::MaskSession& session);
    void SetImage(const wxBitmap& bmp, const wxSize& bufferSize);

protected:
    void OnPaint(wxPaintEvent&);
    void OnLeftDown(wxMouseEvent&);
    void OnLeftUp(wxMouseEvent&);
    void OnMotion(wxMouseEvent&);
    void OnLeave(wxMouseEvent&);
    void OnSize(wxSizeEvent&);

private:
    cutout::MaskSession& session_;
    wxBitmap bmp_;
    wxSize bufferSize_ {0,0}; // working-resolution image size
    wxPoint mouse_ {0,0};     // panel-space
    bool hover_ {false};

    // Helpers
    double ScaleFactor() const;         // panel pixels per buffer pixel (uniform)
    wxPoint ImageOriginOnPanel() const; // top-left of bitmap in panel
    cv::Point2d ToDisplay(const wxPoint& p) const;
    cv::Size2d DisplaySize() const;

    wxDECLARE_EVENT_TABLE();
};
