#include "vision/config.hpp"

#include "Logging.hpp"

#include <format>
#include <string>

namespace warlens::vision {
namespace {

//! Ranges are stored as two element sequences: [begin, end].
void readRange(const ConfigReader& reader, const char* key, FracRange& value) {
	const auto node = reader[key];
	if (node.empty()) {
		return;
	}
	if (!node.isSeq() || node.size() != 2) {
		reader.fail(key, "expects [begin, end]");
	}

	value.begin = static_cast<double>(node[0]);
	value.end   = static_cast<double>(node[1]);
	if (value.end <= value.begin) {
		reader.fail(key, "end must be greater than begin");
	}
}

//! Hue ranges are stored as a sequence of [h, s, v, h, s, v] entries.
void readHueRanges(const ConfigReader& reader, const char* key, std::vector<HsvRange>& value) {
	const auto node = reader[key];
	if (!node.isSeq() || node.size() == 0) {
		return;
	}

	std::vector<HsvRange> ranges;
	for (const auto& entry : node) {
		if (!entry.isSeq() || entry.size() != 6) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[Config] Ignoring malformed hue range in '{}'.", key));
			continue;
		}
		ranges.push_back({{static_cast<double>(entry[0]), static_cast<double>(entry[1]), static_cast<double>(entry[2])},
		                  {static_cast<double>(entry[3]), static_cast<double>(entry[4]), static_cast<double>(entry[5])}});
	}
	if (!ranges.empty()) {
		value = std::move(ranges);
	}
}

void readNonNegative(const ConfigReader& reader, const char* key, int& value) {
	reader.read(key, value);
	if (value < 0) {
		reader.fail(key, std::format("must not be negative, got {}", value));
	}
}

} // namespace

SegmenterConfig loadSegmenterConfig(const std::filesystem::path& path) {
	const ConfigReader reader(path, "segmenter");
	SegmenterConfig cfg;

	readHueRanges(reader, "dialogHueRanges", cfg.dialogHueRanges);
	reader.readPositive("dialogCloseKernel", cfg.dialogCloseKernel);
	readNonNegative(reader, "dialogPad", cfg.dialogPad);
	reader.read("minDialogWidth", cfg.minDialogWidth);
	reader.read("minDialogHeight", cfg.minDialogHeight);
	reader.read("minDialogExtent", cfg.minDialogExtent);

	reader.read("darkSatMax", cfg.darkSatMax);
	reader.read("darkValMax", cfg.darkValMax);
	reader.read("darkChromaMax", cfg.darkChromaMax);
	reader.read("darkLightnessMax", cfg.darkLightnessMax);
	reader.read("darkMinAreaFrac", cfg.darkMinAreaFrac);
	reader.read("brightLightnessMin", cfg.brightLightnessMin);
	reader.read("brightChromaMax", cfg.brightChromaMax);
	reader.read("trimCloseFrac", cfg.trimCloseFrac);

	readRange(reader, "centerBand", cfg.centerBand);
	readRange(reader, "contentRange", cfg.contentRange);
	readRange(reader, "fallbackContentRange", cfg.fallbackContentRange);
	reader.read("workBandHalf", cfg.workBandHalf);
	readRange(reader, "hexHeight", cfg.hexHeight);
	readRange(reader, "hexAspect", cfg.hexAspect);
	reader.read("profilePeakFrac", cfg.profilePeakFrac);
	reader.read("profilePeakFloor", cfg.profilePeakFloor);
	reader.read("rowFwhmK", cfg.rowFwhmK);
	reader.read("rowExpandFrac", cfg.rowExpandFrac);
	readNonNegative(reader, "rowMinPad", cfg.rowMinPad);
	reader.read("fuseContourFrac", cfg.fuseContourFrac);
	reader.read("fuseProfileFrac", cfg.fuseProfileFrac);
	reader.read("clusterHeightFrac", cfg.clusterHeightFrac);
	reader.read("clusterSpacingFrac", cfg.clusterSpacingFrac);
	reader.read("clusterMinOverlap", cfg.clusterMinOverlap);
	readNonNegative(reader, "refineMinShift", cfg.refineMinShift);
	reader.read("minRows", cfg.minRows);

	reader.read("lockMidToGlobal", cfg.lockMidToGlobal);
	reader.read("rowHeightGain", cfg.rowHeightGain);
	reader.read("rowPadY", cfg.rowPadY);
	reader.read("midPadX", cfg.midPadX);
	reader.read("minMidWidthFrac", cfg.minMidWidthFrac);
	reader.read("minMidWidthRow", cfg.minMidWidthRow);

	readNonNegative(reader, "trimPad", cfg.trimPad);
	reader.readPositive("trimMinWidth", cfg.trimMinWidth);
	reader.readPositive("trimSmoothKernel", cfg.trimSmoothKernel);
	reader.read("trimPeakFrac", cfg.trimPeakFrac);
	reader.read("trimHeightFrac", cfg.trimHeightFrac);
	reader.read("trimEdgePeakFrac", cfg.trimEdgePeakFrac);
	readNonNegative(reader, "anchorGap", cfg.anchorGap);

	Logger().Log(Logging::LogLevel::Info, std::format("[Config] Loaded segmenter config '{}'.", path.string()));
	return cfg;
}

} // namespace warlens::vision
