#ifndef _FigureCtrl_FigureCtrl_h_
#define _FigureCtrl_FigureCtrl_h_

#include <CtrlLib/CtrlLib.h>
#include <FigPaint/FigPaint.h>

namespace FigPaint {

//----------------------------------------------------------------------------
//  Control
//----------------------------------------------------------------------------
// Shows a figure rasterized onto a fixed canvas, magnified by whole pixels.
class FigureCtrl : public Ctrl {
public:
    // --- Construction
    FigureCtrl();

    // --- Figure & canvas
    void          SetFigure(const Figure& fig);
    void          ClearFigure();
    bool          HasFigure() const              { return !figure.IsEmpty(); }
    const Figure& GetFigure() const              { return *figure; }

    void          SetCanvasSize(Size sz);
    Size          GetCanvasSize() const          { return canvas; }

    void          SetBackground(RGBA c);
    RGBA          GetBackground() const          { return background; }

    Image         GetPicture() const;            // 1:1 render, for export

    // --- Zoom
    void          SetZoomIndex(int zi);          // 0..(N-1)
    int           GetZoomIndex() const           { return zoom_i; }
    int           GetZoom() const                { return ZoomSteps()[zoom_i]; }
    static int    ZoomStepCount();

    // --- Visual toggles
    void          SetShowBoundingBox(bool b);
    bool          GetShowBoundingBox() const     { return show_bbox; }
    void          SetShowInvalid(bool b);        // red tint when CheckFigure fails
    bool          GetShowInvalid() const         { return show_invalid; }
    void          SetDragEnabled(bool b)         { drag_enabled = b; }
    bool          GetDragEnabled() const         { return drag_enabled; }

    // --- Events
    Event<Point, bool, RGBA> WhenHover;          // canvas point, covered, color
    Event<>                  WhenLeave;
    Event<const Figure&>     WhenMove;           // after a drag is released
    Event<int>               WhenZoom;           // zoom index changed
    Event<Bar&>              WhenBar;            // context menu

private:
    // ---- Ctrl overrides ----
    void   Paint(Draw& w) override;
    void   Layout() override;
    void   LeftDown(Point p, dword flags) override;
    void   LeftUp(Point p, dword flags) override;
    void   RightDown(Point p, dword flags) override;
    void   MouseMove(Point p, dword flags) override;
    void   MouseLeave() override;
    bool   Key(dword key, int) override;
    void   MouseWheel(Point p, int zdelta, dword keyflags) override;

    // ---- Layout / paint helpers ----
    void   Reflow();
    void   Invalidate();                  // drop cached raster
    Image  RenderView() const;            // canvas magnified by GetZoom()
    Point  CanvasPoint(Point win) const;  // window -> canvas pixel
    Rect   ViewRect(const Rect& box) const; // inclusive canvas box -> window rect
    static Rect NormalizeRect(Rect r);

private:
    // ---- Data ----
    One<Figure> figure;
    Size        canvas = Size(100, 150);
    RGBA        background;

    ScrollBars  sb;
    Image       cache;

    int   zoom_i = 2;                     // index into zoom steps

    bool  show_bbox    = true;
    bool  show_invalid = true;
    bool  drag_enabled = true;

    int   scroll_x = 0;
    int   scroll_y = 0;

    // interaction
    Point       hover = Null;             // canvas point under the mouse
    bool        mouse_down = false;
    bool        dragging   = false;
    Point       drag_origin;              // canvas coords
    One<Figure> drag_base;                // figure as it was at LeftDown

    static const int* ZoomSteps();
};

} // namespace FigPaint

#endif
