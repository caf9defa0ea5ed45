#include "match/batchScope.hpp"
#include "match/descriptor.hpp"
#include "syntheticImages.hpp"

#include <opencv2/core.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

namespace warlens::gtest {

using namespace warlens::match;

TEST(Descriptor, HashIsDeterministic) {
	const cv::Mat crop = textCrop("Ragnar");
	EXPECT_EQ(imageHash64(crop), imageHash64(crop));
	EXPECT_EQ(imageHash64(crop), imageHash64(crop.clone()));
}

TEST(Descriptor, DescriptorIsBitExactOnIdenticalInput) {
	const cv::Mat crop = textCrop("Ragnar");
	const auto a       = buildDescriptor(crop, {256, 64});
	const auto b       = buildDescriptor(crop.clone(), {256, 64});

	EXPECT_EQ(a.hash, b.hash);
	ASSERT_EQ(a.profile.size(), b.profile.size());
	ASSERT_EQ(a.profile.type(), b.profile.type());
	EXPECT_EQ(cv::norm(a.profile, b.profile, cv::NORM_INF), 0.0);
	EXPECT_EQ(cv::norm(a.gray, b.gray, cv::NORM_INF), 0.0);
}

TEST(Descriptor, HashOfGradientHasExpectedBits) {
	// Brightness increasing to the right sets every bit.
	cv::Mat ramp(64, 256, CV_8U);
	for (int x = 0; x < ramp.cols; ++x) {
		ramp.col(x).setTo(x);
	}
	EXPECT_EQ(dhash64(ramp), ~std::uint64_t{0});

	cv::Mat flat(64, 256, CV_8U, cv::Scalar(128));
	EXPECT_EQ(dhash64(flat), 0u);
}

TEST(Descriptor, HammingDistance) {
	EXPECT_EQ(hamming64(0u, 0u), 0);
	EXPECT_EQ(hamming64(0xFFu, 0x0Fu), 4);
	EXPECT_EQ(hamming64(0x1234u, 0xF0F0u), hamming64(0xF0F0u, 0x1234u));
	EXPECT_EQ(hamming64(0u, ~std::uint64_t{0}), 64);
}

TEST(Descriptor, BuildsCanonicalFeatures) {
	const cv::Mat crop = textCrop("Ragnar", {300, 80});
	const auto desc    = buildDescriptor(crop, {256, 64});

	EXPECT_EQ(desc.width, 300);
	EXPECT_EQ(desc.height, 80);
	EXPECT_EQ(desc.gray.size(), cv::Size(256, 64));
	EXPECT_EQ(desc.gray.type(), CV_8U);
	EXPECT_EQ(desc.profile.size(), cv::Size(256, 1));
	EXPECT_NEAR(cv::norm(desc.profile), 1.0, 1e-4);
	EXPECT_EQ(desc.hash, imageHash64(crop));
}

TEST(Descriptor, BatchScopeReusesConversions) {
	const cv::Mat crop = textCrop("Ragnar");
	BatchScope scope;

	const auto a = buildDescriptor(crop, {256, 64}, &scope);
	const auto b = buildDescriptor(crop, {256, 64}, &scope);

	EXPECT_EQ(a.gray.data, b.gray.data);
	EXPECT_EQ(a.hash, b.hash);
	EXPECT_GT(scope.hits(), 0u);

	const auto plain = buildDescriptor(crop, {256, 64});
	EXPECT_EQ(cv::norm(plain.gray, a.gray, cv::NORM_INF), 0.0);
}

TEST(Descriptor, RejectsEmptyImage) {
	EXPECT_THROW(canonicalGray(cv::Mat(), {256, 64}), std::invalid_argument);
}

} // namespace warlens::gtest
