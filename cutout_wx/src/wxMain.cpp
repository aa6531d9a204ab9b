#include <wx/wx.h>
#include "WxMainFrame.hpp"
#include <wx/display.h>

class CutoutApp : public wxApp
{
public:
    bool OnInit() override
    {
        if (!wxApp::OnInit()) return false;
        wxInitAllImageHandlers();
        WxMainFrame* frame = new WxMainFrame(nullptr);

        // Most of the primary display, centered
        if (wxDisplay::GetCount() > 0) {
            wxDisplay d(0u);
            wxRect ar = d.GetClientArea();
            int w = (ar.GetWidth() * 85) / 100;
            int h = (ar.GetHeight() * 85) / 100;
            frame->SetSize(w, h);
            frame->Centre();
        }
        frame->Raise();
        frame->Show(true);
        return true;
    }
};

wxIMPLEMENT_APP(CutoutApp);
