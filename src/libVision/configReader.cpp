#include "vision/configReader.hpp"

#include <format>

namespace warlens {

ConfigReader::ConfigReader(const std::filesystem::path& path, const std::string& section) : m_path(path) {
	try {
		m_storage.open(path.string(), cv::FileStorage::READ);
	} catch (const cv::Exception& e) {
		throw ConfigError(std::format("Could not parse config '{}': {}", path.string(), e.what()));
	}
	if (!m_storage.isOpened()) {
		throw ConfigError(std::format("Could not open config '{}'.", path.string()));
	}

	const auto node = m_storage[section];
	m_root          = node.empty() ? m_storage.root() : node;
}

void ConfigReader::read(const char* key, double& value) const {
	const auto node = m_root[key];
	if (node.isReal() || node.isInt()) {
		value = static_cast<double>(node);
	}
}

void ConfigReader::read(const char* key, int& value) const {
	const auto node = m_root[key];
	if (node.isInt()) {
		value = static_cast<int>(node);
	}
}

void ConfigReader::read(const char* key, bool& value) const {
	const auto node = m_root[key];
	if (node.isInt()) {
		value = static_cast<int>(node) != 0;
	}
}

void ConfigReader::read(const char* key, std::size_t& value) const {
	const auto node = m_root[key];
	if (!node.isInt()) {
		return;
	}

	const int v = static_cast<int>(node);
	if (v < 0) {
		fail(key, std::format("must not be negative, got {}", v));
	}
	value = static_cast<std::size_t>(v);
}

void ConfigReader::read(const char* key, std::string& value) const {
	const auto node = m_root[key];
	if (node.isString()) {
		value = static_cast<std::string>(node);
	}
}

void ConfigReader::read(const char* key, std::vector<double>& value) const {
	const auto node = m_root[key];
	if (!node.isSeq()) {
		return;
	}

	std::vector<double> list;
	for (const auto& entry : node) {
		list.push_back(static_cast<double>(entry));
	}
	value = std::move(list);
}

void ConfigReader::read(const char* key, std::vector<int>& value) const {
	const auto node = m_root[key];
	if (!node.isSeq()) {
		return;
	}

	std::vector<int> list;
	for (const auto& entry : node) {
		list.push_back(static_cast<int>(entry));
	}
	value = std::move(list);
}

void ConfigReader::read(const char* key, std::vector<std::string>& value) const {
	const auto node = m_root[key];
	if (!node.isSeq()) {
		return;
	}

	std::vector<std::string> list;
	for (const auto& entry : node) {
		if (!entry.isString()) {
			fail(key, "expects a list of names");
		}
		list.push_back(static_cast<std::string>(entry));
	}
	value = std::move(list);
}

void ConfigReader::readPositive(const char* key, int& value) const {
	int v = value;
	read(key, v);
	if (v <= 0) {
		fail(key, std::format("must be positive, got {}", v));
	}
	value = v;
}

void ConfigReader::readPositive(const char* key, std::size_t& value) const {
	const auto node = m_root[key];
	if (node.isInt() && static_cast<int>(node) <= 0) {
		fail(key, std::format("must be positive, got {}", static_cast<int>(node)));
	}
	read(key, value);
}

void ConfigReader::fail(const char* key, const std::string& reason) const {
	throw ConfigError(std::format("Invalid '{}' in config '{}': {}.", key, m_path.string(), reason));
}

} // namespace warlens
