#pragma once

#include <opencv2/core/persistence.hpp>

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace warlens {

//! Raised when a configuration file cannot be read or holds an invalid value.
class ConfigError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/*! Typed access to one section of a YAML/JSON/XML file in cv::FileStorage format.
 * The read functions leave the target untouched if the key is absent or has the wrong type.
 */
class ConfigReader {
public:
	/*! \param [in] path    Config file.
	 *  \param [in] section Top level node to read from. The file root is used if the file has no such node.
	 *  \throws ConfigError if the file cannot be opened or parsed.
	 */
	ConfigReader(const std::filesystem::path& path, const std::string& section);

	ConfigReader(const ConfigReader&)            = delete;
	ConfigReader& operator=(const ConfigReader&) = delete;

	void read(const char* key, double& value) const;
	void read(const char* key, int& value) const;
	void read(const char* key, bool& value) const;
	void read(const char* key, std::size_t& value) const;
	void read(const char* key, std::string& value) const;
	void read(const char* key, std::vector<double>& value) const;
	void read(const char* key, std::vector<int>& value) const;
	void read(const char* key, std::vector<std::string>& value) const;

	//! Like read() but the value must be greater than zero.
	void readPositive(const char* key, int& value) const;
	void readPositive(const char* key, std::size_t& value) const;

	//! Raw node for composite values. Empty if absent.
	cv::FileNode operator[](const char* key) const { return m_root[key]; }

	//! Throws ConfigError naming the file and key.
	void fail(const char* key, const std::string& reason) const;

	const std::filesystem::path& path() const { return m_path; }

private:
	std::filesystem::path m_path;
	cv::FileStorage m_storage;
	cv::FileNode m_root;
};

} // namespace warlens
