#include "FigPaint.h"

namespace FigPaint {

// ==== colors =================================================================
static inline int ClampInt(int v, int lo, int hi) { return v < lo ? lo : (v > hi ? hi : v); }

RGBA Argb(int a, int r, int g, int b)
{
    RGBA c;
    c.a = (byte)ClampInt(a, 0, 255);
    c.r = (byte)ClampInt(r, 0, 255);
    c.g = (byte)ClampInt(g, 0, 255);
    c.b = (byte)ClampInt(b, 0, 255);
    return c;
}

RGBA ToArgb(Color c)
{
    return Argb(255, c.GetR(), c.GetG(), c.GetB());
}

// Integer division truncates; channel sums are never negative.
RGBA AverageArgb(RGBA c1, RGBA c2)
{
    return Argb((c1.a + c2.a) / 2,
                (c1.r + c2.r) / 2,
                (c1.g + c2.g) / 2,
                (c1.b + c2.b) / 2);
}

RGBA DefaultBackground()
{
    return Argb(255, 128, 128, 128);
}

// ==== figure =================================================================
Figure Figure::Circle(Point center, int radius, RGBA color)
{
    Figure f;
    f.kind = FigureKind::Circle;
    f.a = center;
    f.radius = radius;
    f.color = color;
    return f;
}

Figure Figure::Rectangle(Point top_left, Point bottom_right, RGBA color)
{
    Figure f;
    f.kind = FigureKind::Rectangle;
    f.a = top_left;
    f.b = bottom_right;
    f.color = color;
    return f;
}

Figure Figure::Mix(Figure f1, Figure f2)
{
    Figure f;
    f.kind = FigureKind::Mix;
    f.first.Create<Figure>(pick(f1));
    f.second.Create<Figure>(pick(f2));
    return f;
}

Figure::Figure(const Figure& f)
    : kind(f.kind), a(f.a), b(f.b), radius(f.radius), color(f.color)
{
    if(!f.first.IsEmpty())
        first.Create<Figure>(*f.first);
    if(!f.second.IsEmpty())
        second.Create<Figure>(*f.second);
}

Figure& Figure::operator=(const Figure& f)
{
    if(this != &f) {
        Figure tmp(f);
        *this = pick(tmp);
    }
    return *this;
}

int Figure::GetDepth() const
{
    if(kind != FigureKind::Mix)
        return 1;
    return 1 + max(first->GetDepth(), second->GetDepth());
}

static String ArgbText(RGBA c)
{
    if(c.a == 255)
        return Format("%02x%02x%02x", (int)c.r, (int)c.g, (int)c.b);
    return Format("%02x%02x%02x%02x", (int)c.a, (int)c.r, (int)c.g, (int)c.b);
}

String Figure::ToString() const
{
    switch(kind) {
    case FigureKind::Circle:
        return Format("Circle((%d, %d), %d, %s)", a.x, a.y, radius, ArgbText(color));
    case FigureKind::Rectangle:
        return Format("Rectangle((%d, %d), (%d, %d), %s)", a.x, a.y, b.x, b.y, ArgbText(color));
    case FigureKind::Mix:
        return "Mix(" + first->ToString() + ", " + second->ToString() + ")";
    }
    return String();
}

} // namespace FigPaint
