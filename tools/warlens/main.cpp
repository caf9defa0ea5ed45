#include "match/config.hpp"
#include "match/matcher.hpp"
#include "vision/config.hpp"
#include "vision/debugWriter.hpp"
#include "vision/imageIo.hpp"
#include "vision/segmenter.hpp"

#include <opencv2/core/utility.hpp>

#include <algorithm>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace warlens {

static const char* kKeys = "{help h usage ? |      | Print this message.}"
                           "{@command        |      | 'segment' or 'match'.}"
                           "{@input          |      | Screenshot or directory of screenshots (segment), name crop (match).}"
                           "{out o           | rows | Output directory of the row crops (segment).}"
                           "{debug d         |      | Directory for intermediate masks and overviews (segment).}"
                           "{config c        |      | YAML/JSON file with 'segmenter' and 'matcher' sections.}"
                           "{refs r          |      | Comma separated list of id=path reference crops (match).}";

static std::vector<std::filesystem::path> collectImages(const std::filesystem::path& input) {
	if (!std::filesystem::is_directory(input)) {
		return {input};
	}

	std::vector<std::filesystem::path> images;
	for (const auto& entry : std::filesystem::directory_iterator(input)) {
		const auto ext = entry.path().extension().string();
		if (entry.is_regular_file() && (ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".webp")) {
			images.push_back(entry.path());
		}
	}
	std::sort(images.begin(), images.end());
	return images;
}

//! Segment every image of the input as one sequence and write the crops of each row.
static int runSegment(const std::filesystem::path& input, const std::filesystem::path& outDir, const std::optional<std::filesystem::path>& debugDir,
                      const vision::SegmenterConfig& cfg) {
	const auto images = collectImages(input);
	if (images.empty()) {
		std::cerr << std::format("[Error] No images found in '{}'.\n", input.string());
		return 1;
	}

	vision::SequenceSegmenter segmenter(cfg);
	for (const auto& path : images) {
		const cv::Mat frame = vision::readImage(path);

		std::unique_ptr<vision::DebugWriter> debugger;
		if (debugDir) {
			debugger = std::make_unique<vision::DebugWriter>(*debugDir / path.stem());
		}

		const auto rows    = segmenter.run(frame, debugger.get());
		const auto written = vision::writeRowCrops(outDir / path.stem(), rows);
		std::cout << std::format("{}: {} rows, {} crops written\n", path.filename().string(), rows.size(), written);
	}
	return 0;
}

static std::vector<match::IdentityRef> parseRefs(const std::string& list) {
	std::vector<match::IdentityRef> refs;
	std::stringstream stream(list);
	std::string item;
	while (std::getline(stream, item, ',')) {
		const auto eq = item.find('=');
		if (eq == std::string::npos || eq == 0) {
			std::cerr << std::format("[Warning] Ignoring malformed reference '{}'. Expected id=path.\n", item);
			continue;
		}
		try {
			refs.push_back({std::stoi(item.substr(0, eq)), item.substr(eq + 1)});
		} catch (const std::exception&) {
			std::cerr << std::format("[Warning] Ignoring reference with invalid id '{}'.\n", item);
		}
	}
	return refs;
}

static int runMatch(const std::filesystem::path& query, const std::string& refList, const match::MatcherConfig& cfg) {
	const auto refs = parseRefs(refList);
	const match::Matcher matcher(cfg);

	const auto id = matcher.match(refs, vision::readImage(query));
	if (id) {
		std::cout << std::format("match {}\n", *id);
	} else {
		std::cout << "new\n";
	}
	return 0;
}

} // namespace warlens

int main(int argc, char** argv) {
	cv::CommandLineParser parser(argc, argv, warlens::kKeys);
	parser.about("WarLens battle report analysis");
	if (parser.has("help") || argc < 3) {
		parser.printMessage();
		return 0;
	}

	const auto command = parser.get<std::string>("@command");
	const auto input   = std::filesystem::path(parser.get<std::string>("@input"));
	const auto config  = parser.get<std::string>("config");
	if (!parser.check()) {
		parser.printErrors();
		return 1;
	}

	try {
		if (command == "segment") {
			const auto cfg = config.empty() ? warlens::vision::SegmenterConfig{} : warlens::vision::loadSegmenterConfig(config);
			const auto debug = parser.get<std::string>("debug");
			return warlens::runSegment(input, parser.get<std::string>("out"), debug.empty() ? std::nullopt : std::optional<std::filesystem::path>(debug), cfg);
		}
		if (command == "match") {
			const auto cfg = config.empty() ? warlens::match::MatcherConfig{} : warlens::match::loadMatcherConfig(config);
			return warlens::runMatch(input, parser.get<std::string>("refs"), cfg);
		}
	} catch (const warlens::vision::ImageReadError& e) {
		std::cerr << "[Error] " << e.what() << "\n";
		return 1;
	} catch (const warlens::ConfigError& e) {
		std::cerr << "[Error] " << e.what() << "\n";
		return 1;
	} catch (const std::filesystem::filesystem_error& e) {
		std::cerr << "[Error] " << e.what() << "\n";
		return 1;
	} catch (const cv::Exception& e) {
		std::cerr << "[Error] OpenCV: " << e.what() << "\n";
		return 1;
	}

	std::cerr << std::format("[Error] Unknown command '{}'.\n", command);
	parser.printMessage();
	return 1;
}
