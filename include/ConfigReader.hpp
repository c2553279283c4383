#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "LakeStrat.hpp"
#include "AnalysisConfig.hpp"
#include <string>
#include <map>
#include <vector>
#include <istream>

namespace LakeStrat {

/**
 * @brief INI-style configuration reader
 *
 * Configures every analysis threshold from a single text file:
 *
 *   [THERMOCLINE]
 *   seasonal_min_gradient = 0.1   # kg/m^3/m
 *
 * Lines starting with # or ; are comments, inline # comments are stripped.
 */
class ConfigReader {
public:
    ConfigReader();

    /// Load from file; false if the file cannot be opened
    bool loadFile(const std::string& filename);

    /// Load from a string holding INI text
    bool loadString(const std::string& text);

    /// Merge another file, its values override existing ones
    bool mergeFile(const std::string& filename);

    // Value accessors, the default is returned for missing or unparsable values
    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key, int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;
    std::vector<double> getDoubleArray(const std::string& section, const std::string& key) const;

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    /**
     * @brief Fill an analysis configuration
     *
     * Reads [ANALYSIS], [DENSITY], [THERMOCLINE], [METALIMNION], [WIND],
     * [FETCH] and [TIME_SERIES]. Keys that are absent keep the value already
     * in config. Returns false when an enumeration name is not recognised.
     */
    bool parseAnalysisConfig(AnalysisConfig& config) const;

    /// Check section names, enumeration names and parameter ranges
    ValidationResult validate() const;

    /// Write a template configuration with every key at its default
    static void generateTemplate(const std::string& filename);

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    bool parseStream(std::istream& in);
    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;
};

} // namespace LakeStrat

#endif // CONFIG_READER_HPP
