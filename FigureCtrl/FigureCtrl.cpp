#include "FigureCtrl.h"

namespace FigPaint {

#define LLOG(x) // LOG(x)

// ==== utilities ==============================================================
static inline int ClampInt(int v, int lo, int hi) { return v < lo ? lo : (v > hi ? hi : v); }

// Simple stroke for Draw
static void StrokeRect(Draw& w, const Rect& r, int pen, Color c)
{
    w.DrawRect(r.left, r.top, r.GetWidth(), pen, c);
    w.DrawRect(r.left, r.bottom - pen, r.GetWidth(), pen, c);
    w.DrawRect(r.left, r.top + pen, pen, r.GetHeight() - 2 * pen, c);
    w.DrawRect(r.right - pen, r.top + pen, pen, r.GetHeight() - 2 * pen, c);
}

// Premultiplied-alpha swatch for DrawImage(); works with plain Draw.
static Image MakeAlphaOverlay(Size sz, Color c, int alpha /*0..255*/)
{
    alpha = ClampInt(alpha, 0, 255);

    ImageBuffer ib(sz);
    ib.SetKind(IMAGE_ALPHA);

    const int r_p = (c.GetR() * alpha + 127) / 255;
    const int g_p = (c.GetG() * alpha + 127) / 255;
    const int b_p = (c.GetB() * alpha + 127) / 255;
    const byte a  = (byte)alpha;

    for (int y = 0; y < sz.cy; ++y) {
        RGBA* row = ib[y];
        for (int x = 0; x < sz.cx; ++x) {
            row[x].r = (byte)r_p;
            row[x].g = (byte)g_p;
            row[x].b = (byte)b_p;
            row[x].a = a;
        }
    }
    return ib;
}

static const int zoom_steps[] = { 1, 2, 3, 4, 6, 8 };

const int* FigureCtrl::ZoomSteps() { return zoom_steps; }
int FigureCtrl::ZoomStepCount()    { return __countof(zoom_steps); }

Rect FigureCtrl::NormalizeRect(Rect r)
{
    if(r.left > r.right)   Swap(r.left, r.right);
    if(r.top  > r.bottom)  Swap(r.top,  r.bottom);
    return r;
}

// ==== ctor ===================================================================
FigureCtrl::FigureCtrl()
{
    background = DefaultBackground();
    AddFrame(sb);
    sb.WhenScroll = [&]{
        scroll_x = sb.GetX();
        scroll_y = sb.GetY();
        Refresh();
    };
    NoWantFocus();
    Reflow();
}

// ==== public API =============================================================
void FigureCtrl::SetFigure(const Figure& fig)
{
    figure.Create<Figure>(fig);
    LLOG("SetFigure " << fig);
    Invalidate();
}

void FigureCtrl::ClearFigure()
{
    figure.Clear();
    hover = Null;
    Invalidate();
}

void FigureCtrl::SetCanvasSize(Size sz)
{
    sz.cx = max(sz.cx, 1);
    sz.cy = max(sz.cy, 1);
    if(canvas == sz) return;
    canvas = sz;
    Reflow();
    Invalidate();
}

void FigureCtrl::SetBackground(RGBA c)
{
    background = c;
    Invalidate();
}

Image FigureCtrl::GetPicture() const
{
    if(figure.IsEmpty())
        return InitCanvas(canvas.cx, canvas.cy, [&](Point) { return background; });
    return RenderFigure(*figure, canvas.cx, canvas.cy, background);
}

void FigureCtrl::SetZoomIndex(int zi)
{
    zi = ClampInt(zi, 0, ZoomStepCount() - 1);
    if(zoom_i == zi) return;
    zoom_i = zi;
    Reflow();
    Invalidate();
    WhenZoom(zoom_i);
}

void FigureCtrl::SetShowBoundingBox(bool b) { show_bbox = b; Refresh(); }
void FigureCtrl::SetShowInvalid(bool b)     { show_invalid = b; Refresh(); }

// ==== layout / raster ========================================================
void FigureCtrl::Layout()
{
    Reflow();
}

void FigureCtrl::Reflow()
{
    Size sz = GetSize();
    Size total(canvas.cx * GetZoom(), canvas.cy * GetZoom());

    scroll_x = ClampInt(scroll_x, 0, max(0, total.cx - sz.cx));
    scroll_y = ClampInt(scroll_y, 0, max(0, total.cy - sz.cy));

    sb.Set(Point(scroll_x, scroll_y), sz, total);
}

void FigureCtrl::Invalidate()
{
    cache = Image();
    Refresh();
}

// Each canvas pixel becomes a zoom x zoom block; no smoothing.
Image FigureCtrl::RenderView() const
{
    const Image base = GetPicture();
    const int z = GetZoom();
    if(z == 1 || base.IsEmpty())
        return base;
    // base is already premultiplied, copy pixels as they are
    ImageBuffer ib(base.GetWidth() * z, base.GetHeight() * z);
    for(int y = 0; y < ib.GetHeight(); ++y) {
        const RGBA* src = base[y / z];
        RGBA* row = ib[y];
        for(int x = 0; x < ib.GetWidth(); ++x)
            row[x] = src[x / z];
    }
    return ib;
}

Point FigureCtrl::CanvasPoint(Point win) const
{
    const int z = GetZoom();
    return Point((win.x + scroll_x) / z, (win.y + scroll_y) / z);
}

Rect FigureCtrl::ViewRect(const Rect& box) const
{
    const int z = GetZoom();
    Rect r = NormalizeRect(box);
    return Rect(r.left * z - scroll_x, r.top * z - scroll_y,
                (r.right + 1) * z - scroll_x, (r.bottom + 1) * z - scroll_y);
}

// ==== events / interaction ===================================================
void FigureCtrl::MouseWheel(Point, int zdelta, dword keyflags)
{
    if(keyflags & K_CTRL) {
        SetZoomIndex(zoom_i + (zdelta > 0 ? +1 : -1));
        return;
    }

    const int step = max(8, 16 * GetZoom());
    int dir = (zdelta > 0) ? -1 : +1;
    const Size total(canvas.cx * GetZoom(), canvas.cy * GetZoom());

    if((keyflags & K_SHIFT) == K_SHIFT)
        sb.SetX(ClampInt(sb.GetX() + dir * step, 0, max(0, total.cx - GetSize().cx)));
    else
        sb.SetY(ClampInt(sb.GetY() + dir * step, 0, max(0, total.cy - GetSize().cy)));
    scroll_x = sb.GetX();
    scroll_y = sb.GetY();
    Refresh();
}

bool FigureCtrl::Key(dword key, int)
{
    // Delegate PageUp/Down, Home/End, Arrow to ScrollBars
    if(sb.Key(key)) {
        scroll_x = sb.GetX();
        scroll_y = sb.GetY();
        Refresh();
        return true;
    }
    return false;
}

void FigureCtrl::MouseLeave()
{
    if(!IsNull(hover)) {
        hover = Null;
        WhenLeave();
        Refresh();
    }
}

void FigureCtrl::MouseMove(Point p, dword)
{
    const Point cp = CanvasPoint(p);

    if(mouse_down && !drag_base.IsEmpty()) {
        const Point delta = cp - drag_origin;
        if(!dragging && (delta.x || delta.y))
            dragging = true;
        if(dragging) {
            figure.Create<Figure>(MoveFigure(*drag_base, delta));
            Invalidate();
        }
    }

    if(cp == hover)
        return;
    hover = cp;
    if(WhenHover && HasFigure() && cp.x < canvas.cx && cp.y < canvas.cy) {
        RGBA c;
        const bool covered = ColorAt(*figure, cp, c);
        WhenHover(cp, covered, covered ? c : background);
    }
    Refresh();
}

void FigureCtrl::LeftDown(Point p, dword)
{
    if(!drag_enabled || !HasFigure())
        return;
    SetCapture();
    mouse_down  = true;
    dragging    = false;
    drag_origin = CanvasPoint(p);
    drag_base.Create<Figure>(*figure);
}

void FigureCtrl::LeftUp(Point, dword)
{
    if(!mouse_down)
        return;
    if(dragging && HasFigure()) {
        LLOG("Moved to " << *figure << ", box " << GetBoundingBox(*figure));
        WhenMove(*figure);
    }
    dragging = false;
    mouse_down = false;
    drag_base.Clear();
    ReleaseCapture();
    Refresh();
}

void FigureCtrl::RightDown(Point p, dword)
{
    if(WhenBar)
        MenuBar::Execute(WhenBar, p);
}

// ==== painting ===============================================================
void FigureCtrl::Paint(Draw& w)
{
    Size sz = GetSize();
    w.DrawRect(sz, SColorFace());

    if(cache.IsEmpty())
        cache = RenderView();
    w.DrawImage(-scroll_x, -scroll_y, cache);

    if(!HasFigure())
        return;

    // Invalid figure tint (~15%)
    if(show_invalid && !CheckFigure(*figure))
        w.DrawImage(-scroll_x, -scroll_y, MakeAlphaOverlay(cache.GetSize(), LtRed(), 40));

    // Bounding box ring
    if(show_bbox)
        StrokeRect(w, ViewRect(GetBoundingBox(*figure)), 1, SColorHighlight());

    // Hover cell
    if(!IsNull(hover) && GetZoom() >= 3 && hover.x < canvas.cx && hover.y < canvas.cy)
        StrokeRect(w, ViewRect(Rect(hover, hover)), 1, SColorText());
}

} // namespace FigPaint
