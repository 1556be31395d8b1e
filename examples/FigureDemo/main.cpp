#include <CtrlLib/CtrlLib.h>
#include <FigureCtrl/FigureCtrl.h>

using namespace Upp;
using namespace FigPaint;


/*------------------------------------------------------------------------------
    Preset figures
------------------------------------------------------------------------------*/
static Figure SampleFigure()
{
    return Figure::Mix(Figure::Circle(Point(50, 50), 45, ToArgb(LtRed())),
                       Figure::Rectangle(Point(40, 40), Point(90, 110), ToArgb(LtBlue())));
}

static Figure NestedFigure()
{
    // three-way overlap in the middle: averaged twice
    Figure pair = Figure::Mix(Figure::Circle(Point(35, 55), 30, ToArgb(LtRed())),
                              Figure::Circle(Point(65, 55), 30, ToArgb(LtGreen())));
    return Figure::Mix(pair, Figure::Circle(Point(50, 85), 30, ToArgb(LtBlue())));
}

static Figure InvalidFigure()
{
    // negative radius still paints, inverted rectangle paints nothing
    return Figure::Mix(Figure::Circle(Point(50, 60), -30, ToArgb(Yellow())),
                       Figure::Rectangle(Point(90, 120), Point(10, 20), ToArgb(LtBlue())));
}

/*------------------------------------------------------------------------------
    Demo window (controls band + figure view + status bar)
------------------------------------------------------------------------------*/
struct DemoWin : TopWindow {
    // Layout
    Splitter   split;
    ParentCtrl controls;
    Label      status;

    // Top controls
    DropList   preset;        // Sample / Moved / Nested / Invalid
    SliderCtrl zoom;          // 0..5 (maps to FigureCtrl zoom steps)
    Option     chk_bbox;      // bounding box ring
    Option     chk_invalid;   // tint invalid figures
    Button     btn_load, btn_save, btn_json, btn_reset;

    // View
    FigureCtrl view;

    String     hover_text;

    DemoWin() {
        Title("FigPaint — Figure Demo").Sizeable().Zoomable();

        Add(split.VSizePos(0, 24));
        Add(status.HSizePos().BottomPos(0, 24));
        status.SetFrame(InsetFrame());

        split.Vert(controls, view);
        split.SetPos(1000); // small top band; 0..10000

        // ----- controls row layout
        controls.HSizePos().VSizePos();
        int x = 4, y = 4, h = 22, gap = 4;
        auto place = [&](Ctrl& c, int w){ controls.Add(c.LeftPos(x, w).TopPos(y, h)); x += w + gap; };

        preset.Add("Sample");
        preset.Add("Sample moved (-20, 20)");
        preset.Add("Nested mix");
        preset.Add("Invalid figure");
        preset.SetIndex(0);
        place(preset, 170);

        zoom.MinMax(0, FigureCtrl::ZoomStepCount() - 1);
        zoom <<= 2;
        place(zoom, 140);

        chk_bbox.SetLabel("Bounding box");  chk_bbox <<= true;    place(chk_bbox, 110);
        chk_invalid.SetLabel("Tint invalid"); chk_invalid <<= true; place(chk_invalid, 100);

        btn_load.SetLabel("Load scene...");
        btn_save.SetLabel("Save PNG...");
        btn_json.SetLabel("Copy JSON");
        btn_reset.SetLabel("Reset");
        place(btn_load,  100);
        place(btn_save,   90);
        place(btn_json,   90);
        place(btn_reset,  60);

        // ----- events
        preset.WhenAction      = [&]{ ApplyPreset(); };
        zoom.WhenAction        = [&]{ view.SetZoomIndex((int)~zoom); };
        chk_bbox.WhenAction    = [&]{ view.SetShowBoundingBox((bool)~chk_bbox); };
        chk_invalid.WhenAction = [&]{ view.SetShowInvalid((bool)~chk_invalid); };

        btn_load.WhenAction  = [&]{ LoadSceneFile(); };
        btn_save.WhenAction  = [&]{ SavePicture(); };
        btn_json.WhenAction  = [&]{ WriteClipboardText(StoreScene(CurrentScene())); };
        btn_reset.WhenAction = [&]{ ApplyPreset(); };

        view.WhenBar = [&](Bar& b){
            b.Add("Reset", [&]{ ApplyPreset(); });
            b.Add("Copy JSON", [&]{ btn_json.WhenAction(); });
            b.Separator();
            b.Add("Bounding box", [&]{ chk_bbox <<= !(bool)~chk_bbox; chk_bbox.WhenAction(); })
             .Check(view.GetShowBoundingBox());
        };

        view.WhenHover = [&](Point p, bool covered, RGBA c){
            hover_text = Format("(%d, %d)  %s  %d,%d,%d,%d", p.x, p.y,
                                covered ? "figure" : "background",
                                (int)c.a, (int)c.r, (int)c.g, (int)c.b);
            UpdateStatus();
        };
        view.WhenLeave = [&]{ hover_text.Clear(); UpdateStatus(); };
        view.WhenMove  = [&](const Figure&){ UpdateStatus(); };
        view.WhenZoom  = [&](int zi){ zoom <<= zi; };

        ApplyPreset();
    }

    void ApplyPreset() {
        view.SetCanvasSize(Size(100, 150));
        view.SetBackground(DefaultBackground());
        switch(preset.GetIndex()) {
        case 1:  view.SetFigure(MoveFigure(SampleFigure(), -20, 20)); break;
        case 2:  view.SetFigure(NestedFigure()); break;
        case 3:  view.SetFigure(InvalidFigure()); break;
        default: view.SetFigure(SampleFigure()); break;
        }
        UpdateStatus();
    }

    Scene CurrentScene() const {
        Scene s;
        s.figure.Create<Figure>(view.GetFigure());
        s.width = view.GetCanvasSize().cx;
        s.height = view.GetCanvasSize().cy;
        s.background = view.GetBackground();
        return s;
    }

    void LoadSceneFile() {
        FileSel fs; fs.Type("Scene", "*.json");
        if(!fs.ExecuteOpen("Load scene"))
            return;
        Scene s;
        if(!LoadScene(LoadFile(~fs), s)) {
            Exclamation("Scene could not be loaded.");
            return;
        }
        view.SetCanvasSize(Size(s.width, s.height));
        view.SetBackground(s.background);
        view.SetFigure(*s.figure);
        UpdateStatus();
    }

    void SavePicture() {
        FileSel fs; fs.Type("PNG", "*.png");
        if(!fs.ExecuteSaveAs("Save picture"))
            return;
        if(!SaveCanvas(~fs, view.GetPicture()))
            Exclamation("PNG export failed.");
    }

    void UpdateStatus() {
        if(!view.HasFigure()) {
            status.SetText(hover_text);
            return;
        }
        const Figure& f = view.GetFigure();
        const Rect box = GetBoundingBox(f);
        status.SetText(Format("Box: (%d, %d) - (%d, %d)    Depth: %d    %s    %s",
                              box.left, box.top, box.right, box.bottom, f.GetDepth(),
                              CheckFigure(f) ? "valid" : "INVALID", hover_text));
    }
};

GUI_APP_MAIN
{
    SetLanguage(GetSystemLNG());
    DemoWin().Run();
}
