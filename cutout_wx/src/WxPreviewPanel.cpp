#include "WxPreviewPanel.hpp"
#include <wx/sizer.h>
#include <wx/image.h>
#include <wx/dcclient.h>
#include <wx/dcbuffer.h>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cstring>
#include <iostream>
#include "mask_session.hpp"
#include "compositor.hpp"
#include "util/ImageOps.hpp"

// Deep-copy convert Mat(BGRA) -> wxBitmap (RGB + alpha plane)
static wxBitmap ToWxBitmap(const cv::Mat& bgra)
{
    if (bgra.empty()) return wxBitmap();
    cv::Mat rgb; cv::cvtColor(bgra, rgb, cv::COLOR_BGRA2RGB);
    cv::Mat alpha; cv::extractChannel(bgra, alpha, 3);
    wxImage wi(rgb.cols, rgb.rows, false);
    std::memcpy(wi.GetData(), rgb.data, static_cast<size_t>(rgb.cols) * static_cast<size_t>(rgb.rows) * 3);
    wi.SetAlpha();
    std::memcpy(wi.GetAlpha(), alpha.data, static_cast<size_t>(alpha.cols) * static_cast<size_t>(alpha.rows));
    return wxBitmap(wi);
}

wxBEGIN_EVENT_TABLE(WxPreviewPanel, wxPanel)
    EVT_SIZE(WxPreviewPanel::OnSize)
wxEND_EVENT_TABLE()

WxPreviewPanel::WxPreviewPanel(wxWindow* parent, cutout::MaskSession& session)
    : wxPanel(parent), session_(session), overlayHideTimer_(this)
{
    BuildUI();
    overlayHideTimer_.Bind(wxEVT_TIMER, [this](wxTimerEvent&){ overlay_->Hide(); });
}

void WxPreviewPanel::BuildUI()
{
    auto* root = new wxBoxSizer(wxVERTICAL);
    title_ = new wxStaticText(this, wxID_ANY, "Preview");
    canvas_ = new MaskCanvas(this, session_);
    canvas_->SetMinSize(wxSize(400, 400));
    root->Add(title_, 0, wxALL, 8);
    root->Add(canvas_, 1, wxEXPAND | wxLEFT | wxRIGHT | wxBOTTOM, 8);

    // Overlay label centered (no opacity animation, simple timer)
    overlay_ = new wxStaticText(this, wxID_ANY, "", wxDefaultPosition, wxDefaultSize, wxALIGN_CENTER);
    overlay_->Hide();
    overlay_->SetBackgroundColour(wxColour(0,0,0,0));

    SetSizer(root);
}

void WxPreviewPanel::LayoutImages()
{
    if (displayMat_.empty())
    {
        canvas_->SetImage(wxNullBitmap, wxSize(0,0));
        return;
    }
    // Fit the working-resolution image inside the canvas
    wxSize client = canvas_->GetClientSize();
    cv::Size avail(std::max(1, client.x), std::max(1, client.y));
    cv::Size fit = util::fitWithin(displayMat_.size(), avail);
    cv::Mat resized;
    if (fit == displayMat_.size())
        resized = displayMat_;
    else
        cv::resize(displayMat_, resized, fit, 0, 0,
                   fit.width < displayMat_.cols ? cv::INTER_AREA : cv::INTER_LANCZOS4);
    canvas_->SetImage(ToWxBitmap(resized), wxSize(displayMat_.cols, displayMat_.rows));

    // Position overlay to cover full panel
    overlay_->SetSize(GetClientSize());
    overlay_->Move(0, 0);
}

void WxPreviewPanel::OnSize(wxSizeEvent& event)
{
    Layout();
    LayoutImages();
    event.Skip();
}

void WxPreviewPanel::ShowPreview(const cutout::PixelBuffer& preview)
{
    if (preview.empty()) { ClearPreview(); return; }
    if (comparison_ && session_.hasImage())
        displayMat_ = cutout::renderComparison(session_.source(), preview, 0.5).mat();
    else
        displayMat_ = preview.mat().clone();
    LayoutImages();
}

void WxPreviewPanel::ClearPreview()
{
    displayMat_.release();
    title_->SetLabel("Preview");
    LayoutImages();
}

void WxPreviewPanel::SetComparison(bool enabled)
{
    comparison_ = enabled;
    if (session_.hasImage()) ShowPreview(session_.preview());
}

void WxPreviewPanel::SetTitle(const wxString& title)
{
    title_->SetLabel(title);
}

void WxPreviewPanel::RefreshBrush()
{
    canvas_->Refresh();
}

void WxPreviewPanel::SetStatus(const wxString& message, bool isError)
{
    if (isError) ShowOverlay(message, wxColour(220, 50, 47), 1600);
    else ShowOverlay(message, wxColour(100, 100, 100), 800);
}

void WxPreviewPanel::ShowOverlay(const wxString& text, const wxColour& color, int durationMs)
{
    overlay_->SetLabel(text);
    overlay_->SetForegroundColour(color);
    overlay_->SetFont(wxFont(wxFontInfo(32).Bold()));
    overlay_->SetSize(GetClientSize());
    overlay_->CentreOnParent();
    overlay_->Show();
    overlayHideTimer_.StartOnce(durationMs);
}

// ===== MaskCanvas implementation =====

wxBEGIN_EVENT_TABLE(MaskCanvas, wxPanel)
    EVT_PAINT(MaskCanvas::OnPaint)
    EVT_LEFT_DOWN(MaskCanvas::OnLeftDown)
    EVT_LEFT_UP(MaskCanvas::OnLeftUp)
    EVT_MOTION(MaskCanvas::OnMotion)
    EVT_LEAVE_WINDOW(MaskCanvas::OnLeave)
    EVT_SIZE(MaskCanvas::OnSize)
wxEND_EVENT_TABLE()

MaskCanvas::MaskCanvas(WxPreviewPanel* owner, cutout::MaskSession& session)
    : wxPanel(owner), session_(session)
{
    SetBackgroundStyle(wxBG_STYLE_PAINT);
    SetCursor(wxCURSOR_CROSS);
}

void MaskCanvas::SetImage(const wxBitmap& bmp, const wxSize& bufferSize)
{
    bmp_ = bmp;
    bufferSize_ = bufferSize;
    Refresh();
}

void MaskCanvas::OnPaint(wxPaintEvent&)
{
    wxAutoBufferedPaintDC dc(this);
    dc.Clear();
    if (!bmp_.IsOk()) return;
    dc.DrawBitmap(bmp_, ImageOriginOnPanel(), true);

    if (hover_ && session_.hasImage())
    {
        const cutout::BrushState& brush = session_.brush();
        const int r = std::max(1, int(brush.radius * ScaleFactor() + 0.5));
        const wxColour c = brush.mode == cutout::BrushMode::Erase ? wxColour(220, 50, 47) : wxColour(0, 200, 80);
        dc.SetBrush(*wxTRANSPARENT_BRUSH);
        dc.SetPen(wxPen(c, 2));
        dc.DrawCircle(mouse_, r);
    }
}

void MaskCanvas::OnLeftDown(wxMouseEvent& e)
{
    SetFocus();
    mouse_ = e.GetPosition();
    if (!bmp_.IsOk()) return;
    try
    {
        session_.pointerDown(ToDisplay(mouse_), DisplaySize());
    }
    catch (const cutout::EditorError& err)
    {
        std::cerr << "[MaskCanvas] pointer down rejected: " << err.what() << "\n";
    }
}

void MaskCanvas::OnLeftUp(wxMouseEvent&)
{
    session_.pointerUp();
}

void MaskCanvas::OnMotion(wxMouseEvent& e)
{
    mouse_ = e.GetPosition();
    hover_ = true;
    if (e.LeftIsDown() && bmp_.IsOk())
    {
        try
        {
            session_.pointerMove(ToDisplay(mouse_), DisplaySize());
        }
        catch (const cutout::EditorError& err)
        {
            std::cerr << "[MaskCanvas] pointer move rejected: " << err.what() << "\n";
            session_.pointerUp();
        }
    }
    Refresh();
}

void MaskCanvas::OnLeave(wxMouseEvent&)
{
    hover_ = false;
    session_.pointerLeave();
    Refresh();
}

void MaskCanvas::OnSize(wxSizeEvent& event)
{
    Refresh();
    event.Skip();
}

double MaskCanvas::ScaleFactor() const
{
    if (!bmp_.IsOk() || bufferSize_.GetWidth() <= 0 || bufferSize_.GetHeight() <= 0) return 1.0;
    double sx = double(bmp_.GetWidth()) / double(bufferSize_.GetWidth());
    double sy = double(bmp_.GetHeight()) / double(bufferSize_.GetHeight());
    return std::min(sx, sy);
}

wxPoint MaskCanvas::ImageOriginOnPanel() const
{
    // Center the bitmap within panel
    wxSize cs = GetClientSize();
    int x = (cs.x - bmp_.GetWidth())/2; if (x < 0) x = 0;
    int y = (cs.y - bmp_.GetHeight())/2; if (y < 0) y = 0;
    return wxPoint(x,y);
}

cv::Point2d MaskCanvas::ToDisplay(const wxPoint& p) const
{
    wxPoint o = ImageOriginOnPanel();
    return cv::Point2d(p.x - o.x, p.y - o.y);
}

cv::Size2d MaskCanvas::DisplaySize() const
{
    // Rendered size right now, so mapping stays correct after resizes
    return cv::Size2d(bmp_.GetWidth(), bmp_.GetHeight());
}
