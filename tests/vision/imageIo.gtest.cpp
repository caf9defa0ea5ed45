#include "vision/imageIo.hpp"

#include <opencv2/imgcodecs.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace warlens::gtest {

using namespace warlens::vision;

class ImageIoTest : public ::testing::Test {
protected:
	void SetUp() override {
		m_dir = std::filesystem::temp_directory_path() / "warlens_image_io";
		std::filesystem::remove_all(m_dir);
		std::filesystem::create_directories(m_dir);
	}
	void TearDown() override { std::filesystem::remove_all(m_dir); }

	std::filesystem::path m_dir;
};

TEST_F(ImageIoTest, ReadImageThrowsForMissingFile) {
	EXPECT_THROW(readImage(m_dir / "missing.png"), ImageReadError);
}

TEST_F(ImageIoTest, TryReadImageReportsMissingAndCorruptFiles) {
	EXPECT_FALSE(tryReadImage(m_dir / "missing.png").has_value());

	const auto broken = m_dir / "broken.png";
	std::ofstream(broken) << "not an image";
	EXPECT_FALSE(tryReadImage(broken).has_value());
}

TEST_F(ImageIoTest, TryReadImageDecodesColor) {
	const auto path = m_dir / "gray.png";
	ASSERT_TRUE(cv::imwrite(path.string(), cv::Mat(10, 20, CV_8U, cv::Scalar(90))));

	const auto image = tryReadImage(path);
	ASSERT_TRUE(image.has_value());
	EXPECT_EQ(image->type(), CV_8UC3);
	EXPECT_EQ(image->size(), cv::Size(20, 10));
}

TEST_F(ImageIoTest, WriteRowCropsSkipsEmptyParts) {
	std::vector<RowSlice> rows(2);
	for (auto& row : rows) {
		row.left = cv::Mat(12, 30, CV_8UC3, cv::Scalar(10, 20, 30));
		row.mid  = cv::Mat(12, 10, CV_8UC3, cv::Scalar(200, 200, 200));
	}
	rows[0].right = cv::Mat(12, 25, CV_8UC3, cv::Scalar(0, 0, 0));

	const auto out = m_dir / "rows";
	EXPECT_EQ(writeRowCrops(out, rows), 5u);
	EXPECT_TRUE(std::filesystem::exists(out / "row01_left.png"));
	EXPECT_TRUE(std::filesystem::exists(out / "row01_right.png"));
	EXPECT_TRUE(std::filesystem::exists(out / "row02_mid.png"));
	EXPECT_FALSE(std::filesystem::exists(out / "row02_right.png"));
}

TEST_F(ImageIoTest, WriteRowCropsThrowsForUnusableDirectory) {
	const auto blocker = m_dir / "blocker";
	std::ofstream(blocker) << "file";

	std::vector<RowSlice> rows(1);
	rows[0].mid = cv::Mat(12, 10, CV_8UC3, cv::Scalar(1, 2, 3));
	EXPECT_THROW(writeRowCrops(blocker / "rows", rows), std::filesystem::filesystem_error);
}

} // namespace warlens::gtest
