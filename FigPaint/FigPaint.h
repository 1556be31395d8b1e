#ifndef _FigPaint_FigPaint_h_
#define _FigPaint_FigPaint_h_

#include <Core/Core.h>
#include <Draw/Draw.h>

namespace FigPaint {

using namespace Upp;

//----------------------------------------------------------------------------
//  Colors (RGBA channels, 0..255 each)
//----------------------------------------------------------------------------
RGBA  Argb(int a, int r, int g, int b);   // channels clamped to 0..255
RGBA  ToArgb(Color c);                    // opaque
RGBA  AverageArgb(RGBA c1, RGBA c2);      // per-channel (c1 + c2) / 2, truncating

// Gray 128 on all color channels, fully opaque.
RGBA  DefaultBackground();

//----------------------------------------------------------------------------
//  Figure model
//----------------------------------------------------------------------------
enum class FigureKind { Circle, Rectangle, Mix };

// Immutable figure tree. A Mix owns both children; copies are deep.
class Figure : public Moveable<Figure> {
public:
    // --- Construction (no validation, see CheckFigure)
    static Figure Circle(Point center, int radius, RGBA color);
    static Figure Rectangle(Point top_left, Point bottom_right, RGBA color);
    static Figure Mix(Figure f1, Figure f2);

    Figure(const Figure& f);
    Figure(Figure&&) = default;
    Figure& operator=(const Figure& f);
    Figure& operator=(Figure&&) = default;

    FigureKind GetKind() const        { return kind; }

    // Circle
    Point      GetCenter() const      { return a; }
    int        GetRadius() const      { return radius; }
    // Rectangle
    Point      GetTopLeft() const     { return a; }
    Point      GetBottomRight() const { return b; }
    // Circle / Rectangle
    RGBA       GetColor() const       { return color; }
    // Mix
    const Figure& GetFirst() const    { return *first; }
    const Figure& GetSecond() const   { return *second; }

    int        GetDepth() const;      // 1 for a leaf
    String     ToString() const;

private:
    Figure() = default;

    FigureKind  kind = FigureKind::Circle;
    Point       a = Point(0, 0);      // center or top-left
    Point       b = Point(0, 0);      // bottom-right
    int         radius = 0;
    RGBA        color = RGBAZero();
    One<Figure> first;
    One<Figure> second;
};

//----------------------------------------------------------------------------
//  Geometry evaluator
//----------------------------------------------------------------------------
// Color of the figure at p. Returns false (leaving 'color' untouched) when
// nothing covers p. Where both Mix children cover p the colors are averaged.
bool   ColorAt(const Figure& fig, Point p, RGBA& color);

// Circle: radius >= 0. Rectangle: corners ordered. Mix: both children valid.
bool   CheckFigure(const Figure& fig);

Figure MoveFigure(const Figure& fig, Point delta);
Figure MoveFigure(const Figure& fig, int dx, int dy);

// Corner pair, both corners inclusive; rectangles are not normalized.
Rect   GetBoundingBox(const Figure& fig);

//----------------------------------------------------------------------------
//  Renderer / canvas
//----------------------------------------------------------------------------
// 'pixel' yields straight ARGB; the returned Image holds it premultiplied.
Image  InitCanvas(int cx, int cy, Function<RGBA (Point)> pixel);
Image  RenderFigure(const Figure& fig, int cx, int cy, RGBA background = DefaultBackground());

bool   SaveCanvas(const String& path, const Image& img);   // PNG
bool   MakePicture(const String& path, const Figure& fig, int cx, int cy,
                   RGBA background = DefaultBackground());

//----------------------------------------------------------------------------
//  Scene (JSON render job)
//----------------------------------------------------------------------------
struct Scene {
    One<Figure> figure;
    int         width      = 100;
    int         height     = 150;
    String      output     = "figure.png";
    RGBA        background = DefaultBackground();
    bool        validate   = false;   // refuse figures failing CheckFigure
};

bool   ValueToFigure(const Value& v, One<Figure>& fig);
Value  FigureToValue(const Figure& fig);

bool   LoadScene(const String& json, Scene& scene);
String StoreScene(const Scene& scene);

} // namespace FigPaint

#endif
