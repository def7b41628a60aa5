/*
 * Title cards in a mod graphic style: big text on black, a column of
 * colored stripes down the right edge, and optionally a few stars.
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#pragma once

#include <math.h>
#include <signal.h>
#include <unistd.h>
#include <string>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/highgui.hpp>


struct TitleCard
{
    static const unsigned kLines = 6;

    int width, height;
    int textX, textY;
    std::string lines[kLines];
    float seconds;
    bool stars;

    TitleCard(int width, int height, int textX, int textY, float seconds, bool stars = false)
        : width(width), height(height), textX(textX), textY(textY), seconds(seconds), stars(stars) {}
};


class TitleCardWindow
{
public:
    TitleCardWindow();

    void setHeadless(bool h) { headless = h; }
    bool isHeadless() const { return headless; }

    // Headless waits end early when this becomes nonzero
    void setStopFlag(const volatile sig_atomic_t *flag) { stopFlag = flag; }

    // Show a card for its duration (or just wait, when headless)
    void show(const TitleCard &card);

    // Draw a card into a new BGR image
    static cv::Mat render(const TitleCard &card);

    // Stripe palette, as BGR
    static const unsigned kPaletteSize = 10;
    static cv::Scalar paletteColor(unsigned i);

    static void drawStar(cv::Mat &image, int size, int x, int y, const cv::Scalar &bgr);

private:
    bool headless;
    const volatile sig_atomic_t *stopFlag;
};


/*****************************************************************************************
 *                                   Implementation
 *****************************************************************************************/


inline TitleCardWindow::TitleCardWindow()
    : headless(false),
      stopFlag(0)
{}

inline cv::Scalar TitleCardWindow::paletteColor(unsigned i)
{
    static const unsigned char rgb[kPaletteSize][3] = {
        { 235,  40,  72 },  // flash
        { 252,  79,  75 },  // carnival
        { 242, 122,  21 },  // vermillion orange
        { 255, 211,   0 },  // lemon chrome
        { 130, 199, 118 },  // grass green
        {   4, 202, 175 },  // capri
        {   1, 174, 214 },  // cyan blue
        { 117,  76, 155 },  // bright violet
        { 153,  42, 110 },  // plum
        { 242, 122, 157 },  // hot pink
    };

    const unsigned char *c = rgb[i % kPaletteSize];
    return cv::Scalar(c[2], c[1], c[0]);
}

inline void TitleCardWindow::drawStar(cv::Mat &image, int size, int x, int y, const cv::Scalar &bgr)
{
    // Five lines joining the points of a pentagram
    int a = int(size / (1 + cos(M_PI * 54 / 180)));
    int b = int(a * cos(M_PI * 72 / 180));
    int c = int(a * sin(M_PI * 72 / 180));

    cv::line(image, cv::Point(x, y + size - c), cv::Point(x + size, y + size - c), bgr, 5);
    cv::line(image, cv::Point(x + size, y + size - c), cv::Point(x + b, y + size), bgr, 5);
    cv::line(image, cv::Point(x + b, y + size), cv::Point(x + size / 2, y), bgr, 5);
    cv::line(image, cv::Point(x + size / 2, y), cv::Point(x + size - b, y + size), bgr, 5);
    cv::line(image, cv::Point(x + size - b, y + size), cv::Point(x, y + size - c), bgr, 5);
}

inline cv::Mat TitleCardWindow::render(const TitleCard &card)
{
    const int stripeWidth = 16;
    const int lineSpacing = 70;

    cv::Mat image(card.height, card.width, CV_8UC3, cv::Scalar(0, 0, 0));

    // Stripes, right to left
    for (unsigned i = 0; i < kPaletteSize; i++) {
        int x = card.width - int(i + 1) * stripeWidth;
        if (x < 0) {
            break;
        }
        cv::rectangle(image, cv::Rect(x, 0, stripeWidth, card.height), paletteColor(i), cv::FILLED);
    }

    if (card.stars) {
        drawStar(image, 60, 40, card.height - 110, paletteColor(3));
        drawStar(image, 40, card.width / 2, card.height - 90, paletteColor(5));
        drawStar(image, 50, card.width - 12 * stripeWidth - 60, 30, paletteColor(9));
    }

    for (unsigned i = 0; i < TitleCard::kLines; i++) {
        if (card.lines[i].empty()) {
            continue;
        }
        cv::putText(image, card.lines[i], cv::Point(card.textX, card.textY + int(i) * lineSpacing),
            cv::FONT_HERSHEY_COMPLEX, 1.25, cv::Scalar(0, 255, 255), 3);
    }

    return image;
}

inline void TitleCardWindow::show(const TitleCard &card)
{
    int ms = int(card.seconds * 1000);

    if (headless) {
        for (int left = ms; left > 0 && !(stopFlag && *stopFlag); left -= 50) {
            usleep((left < 50 ? left : 50) * 1000);
        }
        return;
    }

    const char *name = "LoungeLooker";
    cv::namedWindow(name, cv::WINDOW_AUTOSIZE);
    cv::imshow(name, render(card));
    cv::waitKey(ms > 0 ? ms : 1);
    cv::destroyWindow(name);
}
