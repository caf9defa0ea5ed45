#include "syntheticImages.hpp"
#include "vision/colorPlanes.hpp"
#include "vision/masks.hpp"
#include "vision/structuringElements.hpp"

#include <gtest/gtest.h>

namespace warlens::gtest {

using namespace warlens::vision;

TEST(Masks, ClassifiesDarkBrightAndWarmPixels) {
	cv::Mat frame = plainFrame();
	cv::rectangle(frame, cv::Rect(50, 50, 40, 40), cv::Scalar(0, 0, 0), cv::FILLED);       // dark
	cv::rectangle(frame, cv::Rect(200, 50, 40, 40), cv::Scalar(255, 255, 255), cv::FILLED); // bright
	cv::rectangle(frame, cv::Rect(350, 50, 40, 40), cv::Scalar(0, 100, 255), cv::FILLED);   // warm orange

	const SegmenterConfig cfg;
	const auto masks = buildMasks(prepareColorPlanes(frame), cfg);

	ASSERT_EQ(masks.dark.size(), frame.size());
	ASSERT_EQ(masks.dark.type(), CV_8U);

	EXPECT_EQ(masks.dark.at<uchar>(70, 70), 255);
	EXPECT_EQ(masks.dark.at<uchar>(70, 220), 0);
	EXPECT_EQ(masks.dark.at<uchar>(300, 300), 0);

	EXPECT_EQ(masks.bright.at<uchar>(70, 220), 255);
	EXPECT_EQ(masks.bright.at<uchar>(70, 70), 0);
	EXPECT_EQ(masks.bright.at<uchar>(300, 300), 0);

	// Trim mask is the union of dark, bright and warm pixels.
	EXPECT_EQ(masks.trim.at<uchar>(70, 70), 255);
	EXPECT_EQ(masks.trim.at<uchar>(70, 220), 255);
	EXPECT_EQ(masks.trim.at<uchar>(70, 370), 255);
	EXPECT_EQ(masks.trim.at<uchar>(300, 300), 0);
}

TEST(Masks, DarkMaskDropsSpeckles) {
	cv::Mat frame = plainFrame(1000, 1000);
	frame.at<cv::Vec3b>(500, 100) = cv::Vec3b(0, 0, 0);
	cv::rectangle(frame, cv::Rect(600, 600, 30, 30), cv::Scalar(0, 0, 0), cv::FILLED);

	const auto dark = buildDarkMask(prepareColorPlanes(frame), SegmenterConfig{});
	EXPECT_EQ(dark.at<uchar>(500, 100), 0);
	EXPECT_EQ(dark.at<uchar>(615, 615), 255);
}

TEST(Masks, StructuringElementsAreShared) {
	const cv::Mat a = seEllipse(5);
	const cv::Mat b = seEllipse(5);
	EXPECT_EQ(a.data, b.data);
	EXPECT_EQ(a.size(), cv::Size(5, 5));
	EXPECT_EQ(seRect(7, 1).size(), cv::Size(7, 1));
}

} // namespace warlens::gtest
