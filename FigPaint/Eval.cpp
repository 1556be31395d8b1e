#include "FigPaint.h"

namespace FigPaint {

bool ColorAt(const Figure& fig, Point p, RGBA& color)
{
    switch(fig.GetKind()) {
    case FigureKind::Circle: {
        // squared distance, boundary included; a negative radius acts as |r|
        const Point c = fig.GetCenter();
        const int64 dx = (int64)p.x - c.x;
        const int64 dy = (int64)p.y - c.y;
        const int64 r  = fig.GetRadius();
        if(dx * dx + dy * dy > r * r)
            return false;
        color = fig.GetColor();
        return true;
    }
    case FigureKind::Rectangle: {
        // inverted corners can never satisfy both sides
        const Point tl = fig.GetTopLeft();
        const Point br = fig.GetBottomRight();
        if(p.x < tl.x || p.x > br.x || p.y < tl.y || p.y > br.y)
            return false;
        color = fig.GetColor();
        return true;
    }
    case FigureKind::Mix: {
        RGBA c1, c2;
        const bool in1 = ColorAt(fig.GetFirst(), p, c1);
        const bool in2 = ColorAt(fig.GetSecond(), p, c2);
        if(in1 && in2)
            color = AverageArgb(c1, c2);
        else if(in1)
            color = c1;
        else if(in2)
            color = c2;
        return in1 || in2;
    }
    }
    return false;
}

bool CheckFigure(const Figure& fig)
{
    switch(fig.GetKind()) {
    case FigureKind::Circle:
        return fig.GetRadius() >= 0;
    case FigureKind::Rectangle: {
        const Point tl = fig.GetTopLeft();
        const Point br = fig.GetBottomRight();
        return tl.x <= br.x && tl.y <= br.y;
    }
    case FigureKind::Mix:
        return CheckFigure(fig.GetFirst()) && CheckFigure(fig.GetSecond());
    }
    return false;
}

Figure MoveFigure(const Figure& fig, Point delta)
{
    switch(fig.GetKind()) {
    case FigureKind::Circle:
        return Figure::Circle(fig.GetCenter() + delta, fig.GetRadius(), fig.GetColor());
    case FigureKind::Rectangle:
        return Figure::Rectangle(fig.GetTopLeft() + delta, fig.GetBottomRight() + delta,
                                 fig.GetColor());
    case FigureKind::Mix:
        return Figure::Mix(MoveFigure(fig.GetFirst(), delta), MoveFigure(fig.GetSecond(), delta));
    }
    return fig;
}

Figure MoveFigure(const Figure& fig, int dx, int dy)
{
    return MoveFigure(fig, Point(dx, dy));
}

Rect GetBoundingBox(const Figure& fig)
{
    switch(fig.GetKind()) {
    case FigureKind::Circle: {
        const Point c = fig.GetCenter();
        const int   r = fig.GetRadius();
        return Rect(c.x - r, c.y - r, c.x + r, c.y + r);
    }
    case FigureKind::Rectangle:
        return Rect(fig.GetTopLeft(), fig.GetBottomRight());
    case FigureKind::Mix: {
        // Rect::Union would normalize and skip empty boxes; combine corners as-is
        const Rect r1 = GetBoundingBox(fig.GetFirst());
        const Rect r2 = GetBoundingBox(fig.GetSecond());
        return Rect(min(r1.left, r2.left), min(r1.top, r2.top),
                    max(r1.right, r2.right), max(r1.bottom, r2.bottom));
    }
    }
    return Rect(0, 0, 0, 0);
}

} // namespace FigPaint
