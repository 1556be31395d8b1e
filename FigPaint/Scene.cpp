#include "FigPaint.h"

namespace FigPaint {

// ==== JSON helpers ===========================================================
// ValueMap::operator[] yields a void Value for missing keys.
static inline bool   VB(const ValueMap& m, const char* k, bool def) { Value v = m[k]; return IsNumber(v) || v.GetType() == BOOL_V ? (bool)v : def; }
static inline String VS(const ValueMap& m, const char* k, const String& def) { Value v = m[k]; return IsString(v) ? (String)v : def; }

// Whole numbers in int range only; 1.5 or 1e12 are rejected, not truncated.
static bool ReadInt(const Value& v, int& out)
{
    if(!IsNumber(v))
        return false;
    const double d = v;
    if(d != floor(d) || d < INT_MIN || d > INT_MAX)
        return false;
    out = (int)d;
    return true;
}

// A missing key keeps 'out'.
static bool ReadInt(const ValueMap& m, const char* k, int& out)
{
    return IsVoid(m[k]) || ReadInt(m[k], out);
}

static bool ReadPoint(const Value& v, Point& p)
{
    if(!IsValueArray(v))
        return false;
    ValueArray a = v;
    return a.GetCount() == 2 && ReadInt(a[0], p.x) && ReadInt(a[1], p.y);
}

// [r, g, b] is opaque, [a, r, g, b] carries alpha first
static bool ReadColor(const Value& v, RGBA& c)
{
    if(!IsValueArray(v))
        return false;
    ValueArray a = v;
    const int n = a.GetCount();
    if(n != 3 && n != 4)
        return false;
    int ch[4] = { 255, 0, 0, 0 };
    for(int i = 0; i < n; ++i)
        if(!ReadInt(a[i], ch[4 - n + i]))
            return false;
    c = Argb(ch[0], ch[1], ch[2], ch[3]);
    return true;
}

static Value PointToValue(Point p)
{
    ValueArray a;
    a.Add(p.x);
    a.Add(p.y);
    return a;
}

static Value ArgbToValue(RGBA c)
{
    ValueArray a;
    a.Add((int)c.a);
    a.Add((int)c.r);
    a.Add((int)c.g);
    a.Add((int)c.b);
    return a;
}

// ==== figures ================================================================
bool ValueToFigure(const Value& v, One<Figure>& fig)
{
    if(!IsValueMap(v)) {
        RLOG("figure: expected an object, got " << AsJSON(v));
        return false;
    }
    const ValueMap m = v;
    const String type = ToLower(VS(m, "type", String()));

    RGBA color = Argb(255, 0, 0, 0);
    if(!IsVoid(m["color"]) && !ReadColor(m["color"], color)) {
        RLOG("figure: malformed color " << AsJSON(m["color"]));
        return false;
    }

    if(type == "circle") {
        Point center;
        if(!ReadPoint(m["center"], center)) {
            RLOG("circle: malformed center " << AsJSON(m["center"]));
            return false;
        }
        int radius = 0;
        if(!ReadInt(m, "radius", radius)) {
            RLOG("circle: malformed radius " << AsJSON(m["radius"]));
            return false;
        }
        fig.Create<Figure>(Figure::Circle(center, radius, color));
        return true;
    }

    if(type == "rectangle") {
        Point tl, br;
        if(!ReadPoint(m["topLeft"], tl) || !ReadPoint(m["bottomRight"], br)) {
            RLOG("rectangle: malformed corners " << AsJSON(m["topLeft"]) << " " << AsJSON(m["bottomRight"]));
            return false;
        }
        fig.Create<Figure>(Figure::Rectangle(tl, br, color));
        return true;
    }

    if(type == "mix") {
        One<Figure> f1, f2;
        if(!ValueToFigure(m["first"], f1) || !ValueToFigure(m["second"], f2)) {
            RLOG("mix: missing or malformed child");
            return false;
        }
        fig.Create<Figure>(Figure::Mix(pick(*f1), pick(*f2)));
        return true;
    }

    RLOG("figure: unknown type '" << type << "'");
    return false;
}

Value FigureToValue(const Figure& fig)
{
    ValueMap m;
    switch(fig.GetKind()) {
    case FigureKind::Circle:
        m.Add("type", "circle");
        m.Add("center", PointToValue(fig.GetCenter()));
        m.Add("radius", fig.GetRadius());
        m.Add("color", ArgbToValue(fig.GetColor()));
        break;
    case FigureKind::Rectangle:
        m.Add("type", "rectangle");
        m.Add("topLeft", PointToValue(fig.GetTopLeft()));
        m.Add("bottomRight", PointToValue(fig.GetBottomRight()));
        m.Add("color", ArgbToValue(fig.GetColor()));
        break;
    case FigureKind::Mix:
        m.Add("type", "mix");
        m.Add("first", FigureToValue(fig.GetFirst()));
        m.Add("second", FigureToValue(fig.GetSecond()));
        break;
    }
    return m;
}

// ==== scene ==================================================================
bool LoadScene(const String& json, Scene& scene)
{
    Value v = ParseJSON(~json);
    if(IsError(v)) {
        RLOG("LoadScene: " << GetErrorText(v));
        return false;
    }
    if(!IsValueMap(v)) {
        RLOG("LoadScene: top level must be an object");
        return false;
    }
    const ValueMap m = v;

    One<Figure> fig;
    if(!ValueToFigure(m["figure"], fig))
        return false;

    Point delta(0, 0);
    if(!IsVoid(m["move"]) && !ReadPoint(m["move"], delta)) {
        RLOG("LoadScene: malformed move " << AsJSON(m["move"]));
        return false;
    }

    RGBA background = DefaultBackground();
    if(!IsVoid(m["background"]) && !ReadColor(m["background"], background)) {
        RLOG("LoadScene: malformed background " << AsJSON(m["background"]));
        return false;
    }

    const Scene def;
    int width = def.width, height = def.height;
    if(!ReadInt(m, "width", width) || !ReadInt(m, "height", height)) {
        RLOG("LoadScene: malformed size " << AsJSON(m["width"]) << " x " << AsJSON(m["height"]));
        return false;
    }
    scene.width      = width;
    scene.height     = height;
    scene.output     = VS(m, "output", def.output);
    scene.validate   = VB(m, "validate", def.validate);
    scene.background = background;
    if(delta.x || delta.y)
        scene.figure.Create<Figure>(MoveFigure(*fig, delta));
    else
        scene.figure = pick(fig);
    return true;
}

String StoreScene(const Scene& scene)
{
    ValueMap m;
    m.Add("width", scene.width);
    m.Add("height", scene.height);
    m.Add("output", scene.output);
    m.Add("background", ArgbToValue(scene.background));
    m.Add("validate", scene.validate);
    if(!scene.figure.IsEmpty())
        m.Add("figure", FigureToValue(*scene.figure));
    return AsJSON(m, true);
}

} // namespace FigPaint
