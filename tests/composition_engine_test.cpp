// tests/composition_engine_test.cpp
#include "composition/composition_engine.h"
#include "test_fakes.h"
#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

using namespace photobooth;
using composition::CompositionEngine;
using composition::CompositionError;
using composition::FilterType;

namespace {

const cv::Vec3b kRed(0, 0, 255);
const cv::Vec3b kBlue(255, 0, 0);

templates::Template singleFull() {
    templates::Template tpl;
    tpl.id = "single_full";
    tpl.name = "Single Full";
    tpl.slotCount = 1;
    tpl.rects.push_back(templates::SlotRect{10.0, 15.0, 80.0, 70.0});
    return tpl;
}

// Left half red, right half blue
cv::Mat splitImage(int width, int height) {
    cv::Mat image(height, width, CV_8UC3, cv::Scalar(255, 0, 0));
    image(cv::Rect(0, 0, width / 2, height)).setTo(cv::Scalar(0, 0, 255));
    return image;
}

void expectNear(const cv::Vec3b& actual, const cv::Vec3b& expected, int tolerance = 2) {
    for (int c = 0; c < 3; ++c) {
        EXPECT_NEAR(actual[c], expected[c], tolerance) << "channel " << c;
    }
}

} // namespace

TEST(CompositionEngineTest, SlotToPixelsTruncates) {
    cv::Rect r = CompositionEngine::slotToPixels(templates::SlotRect{25.0, 50.0, 50.0, 25.0});
    EXPECT_EQ(r, cv::Rect(620, 1754, 1240, 877));

    cv::Rect odd = CompositionEngine::slotToPixels(templates::SlotRect{0.0, 0.0, 33.35, 33.35}, 1000, 1000);
    EXPECT_EQ(odd, cv::Rect(0, 0, 333, 333));
}

TEST(CompositionEngineTest, CropToFillCentresWidePhoto) {
    cv::Mat canvas(100, 100, CV_8UC3, cv::Scalar(0, 0, 0));
    CompositionEngine::placeCropToFill(canvas, splitImage(40, 20), cv::Rect(10, 10, 20, 20));

    // Photo already covers the slot height; 10 columns are cut from each side
    EXPECT_EQ(canvas.at<cv::Vec3b>(15, 12), kRed);
    EXPECT_EQ(canvas.at<cv::Vec3b>(15, 27), kBlue);
    EXPECT_EQ(canvas.at<cv::Vec3b>(5, 5), cv::Vec3b(0, 0, 0));
    EXPECT_EQ(canvas.at<cv::Vec3b>(15, 31), cv::Vec3b(0, 0, 0));
}

TEST(CompositionEngineTest, CropToFillScalesTallPhotoToCoverWidth) {
    cv::Mat canvas(60, 60, CV_8UC3, cv::Scalar(0, 0, 0));
    cv::Mat tall(40, 10, CV_8UC3, cv::Scalar(10, 200, 30));
    const cv::Rect target(20, 20, 20, 20);
    CompositionEngine::placeCropToFill(canvas, tall, target);

    // No letterbox: every pixel of the slot is covered
    for (int y = target.y; y < target.y + target.height; ++y) {
        for (int x = target.x; x < target.x + target.width; ++x) {
            expectNear(canvas.at<cv::Vec3b>(y, x), cv::Vec3b(10, 200, 30));
        }
    }
    EXPECT_EQ(canvas.at<cv::Vec3b>(19, 30), cv::Vec3b(0, 0, 0));
    EXPECT_EQ(canvas.at<cv::Vec3b>(40, 30), cv::Vec3b(0, 0, 0));
}

TEST(CompositionEngineTest, CropToFillClipsToCanvas) {
    cv::Mat canvas(100, 100, CV_8UC3, cv::Scalar(0, 0, 0));
    cv::Mat photo(20, 20, CV_8UC3, cv::Scalar(1, 2, 3));
    EXPECT_NO_THROW(CompositionEngine::placeCropToFill(canvas, photo, cv::Rect(90, 90, 20, 20)));
    EXPECT_EQ(canvas.at<cv::Vec3b>(95, 95), cv::Vec3b(1, 2, 3));
    EXPECT_EQ(canvas.at<cv::Vec3b>(85, 85), cv::Vec3b(0, 0, 0));
}

TEST(CompositionEngineTest, FilterNoneLeavesPixels) {
    cv::Mat canvas = splitImage(8, 4);
    cv::Mat original = canvas.clone();
    CompositionEngine::applyFilter(canvas, FilterType::NONE);
    EXPECT_EQ(cv::norm(canvas, original, cv::NORM_INF), 0.0);
}

TEST(CompositionEngineTest, BlackAndWhiteDesaturates) {
    cv::Mat canvas = splitImage(8, 4);
    CompositionEngine::applyFilter(canvas, FilterType::BLACK_AND_WHITE);
    for (const cv::Point p : {cv::Point(1, 1), cv::Point(6, 2)}) {
        cv::Vec3b px = canvas.at<cv::Vec3b>(p);
        EXPECT_EQ(px[0], px[1]);
        EXPECT_EQ(px[1], px[2]);
    }
    // Red is brighter than blue in luminance
    EXPECT_GT(canvas.at<cv::Vec3b>(1, 1)[0], canvas.at<cv::Vec3b>(1, 6)[0]);
}

TEST(CompositionEngineTest, SepiaMapsBlackAndWhiteToToneEnds) {
    cv::Mat canvas(2, 2, CV_8UC3, cv::Scalar(0, 0, 0));
    canvas.at<cv::Vec3b>(1, 1) = cv::Vec3b(255, 255, 255);
    CompositionEngine::applyFilter(canvas, FilterType::SEPIA);

    EXPECT_EQ(canvas.at<cv::Vec3b>(0, 0), cv::Vec3b(0x0f, 0x1f, 0x2e));
    EXPECT_EQ(canvas.at<cv::Vec3b>(1, 1), cv::Vec3b(0xc1, 0xe1, 0xf4));
}

TEST(CompositionEngineTest, ComposesOnA4WithBackgroundColour) {
    test_support::TempDir dir;
    std::string photo = dir.file("photo.png");
    cv::imwrite(photo, cv::Mat(90, 160, CV_8UC3, cv::Scalar(0, 200, 0)));

    CompositionEngine engine;
    composition::CompositeImage image = engine.compose(singleFull(), {photo}, FilterType::NONE);

    EXPECT_EQ(image.pixels.cols, templates::kCanvasWidth);
    EXPECT_EQ(image.pixels.rows, templates::kCanvasHeight);
    EXPECT_EQ(image.pixels.type(), CV_8UC3);
    EXPECT_EQ(image.templateId, "single_full");
    EXPECT_EQ(image.filter, FilterType::NONE);
    EXPECT_EQ(image.pixels.at<cv::Vec3b>(5, 5), cv::Vec3b(34, 34, 34));
    expectNear(image.pixels.at<cv::Vec3b>(1750, 1240), cv::Vec3b(0, 200, 0));
}

TEST(CompositionEngineTest, MirrorsPhotosByDefault) {
    test_support::TempDir dir;
    std::string photo = dir.file("split.png");
    cv::imwrite(photo, splitImage(200, 100));
    cv::Rect slot = CompositionEngine::slotToPixels(singleFull().rects[0]);
    cv::Point nearLeft(slot.x + 100, slot.y + slot.height / 2);

    composition::CompositionSettings plain;
    plain.mirror = false;
    composition::CompositeImage raw = CompositionEngine(plain).compose(singleFull(), {photo}, FilterType::NONE);
    expectNear(raw.pixels.at<cv::Vec3b>(nearLeft), kRed);

    composition::CompositeImage mirrored = CompositionEngine().compose(singleFull(), {photo}, FilterType::NONE);
    expectNear(mirrored.pixels.at<cv::Vec3b>(nearLeft), kBlue);
}

TEST(CompositionEngineTest, PhotosGoToRectsInGivenOrder) {
    test_support::TempDir dir;
    std::string red = dir.file("red.png");
    std::string blue = dir.file("blue.png");
    cv::imwrite(red, cv::Mat(50, 50, CV_8UC3, cv::Scalar(0, 0, 255)));
    cv::imwrite(blue, cv::Mat(50, 50, CV_8UC3, cv::Scalar(255, 0, 0)));

    templates::Template duo;
    duo.id = "duo";
    duo.slotCount = 2;
    duo.rects = {templates::SlotRect{5, 5, 90, 40}, templates::SlotRect{5, 55, 90, 40}};

    composition::CompositeImage image = CompositionEngine().compose(duo, {blue, red}, FilterType::NONE);
    cv::Rect top = CompositionEngine::slotToPixels(duo.rects[0]);
    cv::Rect bottom = CompositionEngine::slotToPixels(duo.rects[1]);
    expectNear(image.pixels.at<cv::Vec3b>(top.y + top.height / 2, top.x + top.width / 2), kBlue);
    expectNear(image.pixels.at<cv::Vec3b>(bottom.y + bottom.height / 2, bottom.x + bottom.width / 2), kRed);
}

TEST(CompositionEngineTest, CompositionIsDeterministic) {
    test_support::TempDir dir;
    std::string photo = dir.file("split.png");
    cv::imwrite(photo, splitImage(120, 80));

    CompositionEngine engine;
    composition::CompositeImage first = engine.compose(singleFull(), {photo}, FilterType::SEPIA);
    composition::CompositeImage second = engine.compose(singleFull(), {photo}, FilterType::SEPIA);

    EXPECT_EQ(cv::norm(first.pixels, second.pixels, cv::NORM_INF), 0.0);
    EXPECT_EQ(first.encodeJpeg(95), second.encodeJpeg(95));
}

TEST(CompositionEngineTest, TemplateBackgroundIsResizedToCanvas) {
    test_support::TempDir dir;
    std::string photo = dir.file("photo.png");
    std::string background = dir.file("bg.png");
    cv::imwrite(photo, cv::Mat(40, 40, CV_8UC3, cv::Scalar(0, 0, 0)));
    cv::imwrite(background, cv::Mat(100, 70, CV_8UC3, cv::Scalar(0, 128, 255)));

    templates::Template tpl = singleFull();
    tpl.backgroundPath = background;
    composition::CompositeImage image = CompositionEngine().compose(tpl, {photo}, FilterType::NONE);
    expectNear(image.pixels.at<cv::Vec3b>(20, 20), cv::Vec3b(0, 128, 255));
}

TEST(CompositionEngineTest, RejectsMismatchAndUnreadableInput) {
    test_support::TempDir dir;
    std::string photo = dir.file("photo.png");
    cv::imwrite(photo, cv::Mat(40, 40, CV_8UC3, cv::Scalar(1, 1, 1)));
    CompositionEngine engine;

    EXPECT_THROW(engine.compose(singleFull(), {}, FilterType::NONE), CompositionError);
    EXPECT_THROW(engine.compose(singleFull(), {photo, photo}, FilterType::NONE), CompositionError);
    EXPECT_THROW(engine.compose(singleFull(), {dir.file("missing.jpg")}, FilterType::NONE), CompositionError);

    templates::Template bgMissing = singleFull();
    bgMissing.backgroundPath = dir.file("missing_bg.png");
    EXPECT_THROW(engine.compose(bgMissing, {photo}, FilterType::NONE), CompositionError);
}

TEST(CompositionEngineTest, FilterCycleOrder) {
    EXPECT_EQ(composition::cycleFilter(FilterType::NONE, 1), FilterType::BLACK_AND_WHITE);
    EXPECT_EQ(composition::cycleFilter(FilterType::BLACK_AND_WHITE, 1), FilterType::SEPIA);
    EXPECT_EQ(composition::cycleFilter(FilterType::SEPIA, 1), FilterType::NONE);
    EXPECT_EQ(composition::cycleFilter(FilterType::NONE, -1), FilterType::SEPIA);
}
