#include "Fixtures.h"

using namespace FigPaint;

static const char* sample_scene = R"({
  "width": 120, "height": 160,
  "output": "figTest.png",
  "background": [10, 20, 30],
  "validate": true,
  "figure": { "type": "mix",
              "first":  { "type": "circle", "center": [50, 50], "radius": 45, "color": [255, 0, 0] },
              "second": { "type": "rectangle", "topLeft": [40, 40], "bottomRight": [90, 110],
                          "color": [255, 0, 0, 255] } }
})";

TEST(SceneTest, LoadsSample)
{
    Scene s;
    ASSERT_TRUE(LoadScene(sample_scene, s));
    ASSERT_FALSE(s.figure.IsEmpty());
    EXPECT_EQ(s.figure->ToString().ToStd(), SampleFigure().ToString().ToStd());
    EXPECT_EQ(s.width, 120);
    EXPECT_EQ(s.height, 160);
    EXPECT_EQ(s.output.ToStd(), "figTest.png");
    EXPECT_EQ(Channels(s.background), "255,10,20,30");
    EXPECT_TRUE(s.validate);
}

TEST(SceneTest, Defaults)
{
    Scene s;
    ASSERT_TRUE(LoadScene(R"({ "figure": { "type": "circle", "center": [1, 2] } })", s));
    EXPECT_EQ(s.width, 100);
    EXPECT_EQ(s.height, 150);
    EXPECT_EQ(s.output.ToStd(), "figure.png");
    EXPECT_EQ(Channels(s.background), Channels(DefaultBackground()));
    EXPECT_FALSE(s.validate);
    EXPECT_EQ(s.figure->GetRadius(), 0);
    EXPECT_EQ(Channels(s.figure->GetColor()), "255,0,0,0");
}

TEST(SceneTest, MoveIsApplied)
{
    Scene s;
    ASSERT_TRUE(LoadScene(R"({ "move": [-20, 20],
        "figure": { "type": "rectangle", "topLeft": [40, 40], "bottomRight": [90, 110] } })", s));
    EXPECT_EQ(GetBoundingBox(*s.figure), Rect(20, 60, 70, 130));
}

TEST(SceneTest, InvalidFiguresStillLoad)
{
    Scene s;
    ASSERT_TRUE(LoadScene(R"({ "figure": { "type": "circle", "center": [0, 0], "radius": -4 } })", s));
    EXPECT_FALSE(CheckFigure(*s.figure));
}

TEST(SceneTest, Errors)
{
    Scene s;
    EXPECT_FALSE(LoadScene("{ not json", s));
    EXPECT_FALSE(LoadScene("[1, 2]", s));
    EXPECT_FALSE(LoadScene(R"({ "width": 10 })", s));
    EXPECT_FALSE(LoadScene(R"({ "figure": { "type": "triangle" } })", s));
    EXPECT_FALSE(LoadScene(R"({ "figure": { "type": "circle", "center": [1] } })", s));
    EXPECT_FALSE(LoadScene(R"({ "figure": { "type": "circle", "center": [1, 2], "color": [1, 2] } })", s));
    EXPECT_FALSE(LoadScene(R"({ "figure": { "type": "mix",
        "first": { "type": "circle", "center": [1, 2] } } })", s));
    EXPECT_FALSE(LoadScene(R"({ "move": "left",
        "figure": { "type": "circle", "center": [1, 2] } })", s));
    EXPECT_TRUE(s.figure.IsEmpty());
}

TEST(SceneTest, NumbersMustBeWholeInts)
{
    Scene s;
    EXPECT_FALSE(LoadScene(R"({ "figure": { "type": "circle", "center": [1.5, 2] } })", s));
    EXPECT_FALSE(LoadScene(R"({ "figure": { "type": "circle", "center": [1, 2], "radius": 1e12 } })", s));
    EXPECT_FALSE(LoadScene(R"({ "figure": { "type": "circle", "center": [1, 2], "radius": "big" } })", s));
    EXPECT_FALSE(LoadScene(R"({ "width": 2.5,
        "figure": { "type": "circle", "center": [1, 2] } })", s));
    EXPECT_FALSE(LoadScene(R"({ "height": -3000000000,
        "figure": { "type": "circle", "center": [1, 2] } })", s));
    EXPECT_TRUE(s.figure.IsEmpty());

    ASSERT_TRUE(LoadScene(R"({ "width": 40.0,
        "figure": { "type": "circle", "center": [-2147483648, 2147483647], "radius": 3 } })", s));
    EXPECT_EQ(s.width, 40);
    EXPECT_EQ(s.figure->GetCenter(), Point(INT_MIN, INT_MAX));
}

TEST(SceneTest, StoreThenLoad)
{
    Scene s;
    s.figure.Create<Figure>(Figure::Mix(SampleFigure(),
                                        Figure::Circle(Point(5, 6), 7, Argb(100, 1, 2, 3))));
    s.width = 64;
    s.output = "out.png";
    s.background = Argb(200, 9, 8, 7);

    Scene back;
    ASSERT_TRUE(LoadScene(StoreScene(s), back));
    EXPECT_EQ(back.figure->ToString().ToStd(), s.figure->ToString().ToStd());
    EXPECT_EQ(back.width, 64);
    EXPECT_EQ(back.output.ToStd(), "out.png");
    EXPECT_EQ(Channels(back.background), "200,9,8,7");
}

TEST(SceneTest, FigureValueShape)
{
    const Value v = FigureToValue(Figure::Circle(Point(1, 2), 3, RedArgb()));
    ASSERT_TRUE(IsValueMap(v));
    const ValueMap m = v;
    EXPECT_EQ(((String)m["type"]).ToStd(), "circle");
    EXPECT_EQ((int)m["radius"], 3);
    EXPECT_EQ(AsJSON(m["color"]).ToStd(), "[255,255,0,0]");
}
