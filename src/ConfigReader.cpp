#include "ConfigReader.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace LakeStrat {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }
    return parseStream(file);
}

bool ConfigReader::loadString(const std::string& text) {
    std::istringstream in(text);
    return parseStream(in);
}

bool ConfigReader::parseStream(std::istream& in) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

bool ConfigReader::mergeFile(const std::string& filename) {
    ConfigReader other;
    if (!other.loadFile(filename)) {
        return false;
    }

    for (const auto& section : other.data) {
        for (const auto& key_val : section.second) {
            data[section.first][key_val.first] = key_val.second;
        }
    }
    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    std::cerr << "Warning: Cannot parse " << section << "." << key
              << " = '" << val << "' as integer" << std::endl;
    return default_val;
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    std::cerr << "Warning: Cannot parse " << section << "." << key
              << " = '" << val << "' as double" << std::endl;
    return default_val;
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::vector<double> ConfigReader::getDoubleArray(const std::string& section,
                                                 const std::string& key) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    auto tokens = split(val, ',');
    for (const auto& token : tokens) {
        try {
            result.push_back(std::stod(token));
        } catch (const std::exception&) {
            std::cerr << "Warning: Cannot parse '" << token << "' as double" << std::endl;
        }
    }
    return result;
}

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// =============================================================================
// Analysis Configuration
// =============================================================================

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

bool ConfigReader::parseAnalysisConfig(AnalysisConfig& config) const {
    bool ok = true;

    auto readEnum = [&](const std::string& section, const std::string& key, auto parser, auto& value) {
        if (!hasKey(section, key)) return;
        std::string name = upper(getString(section, key));
        if (!parser(name, value)) {
            std::cerr << "Warning: Unknown value '" << name << "' for "
                      << section << "." << key << std::endl;
            ok = false;
        }
    };

    // [ANALYSIS]
    config.seasonal = getBool("ANALYSIS", "seasonal", config.seasonal);
    config.schmidt_resolution = getDouble("ANALYSIS", "schmidt_resolution", config.schmidt_resolution);

    // [DENSITY]
    readEnum("DENSITY", "formula", parseDensityFormula, config.density.formula);
    config.density.salinity = getDouble("DENSITY", "salinity", config.density.salinity);
    config.density.check_range = getBool("DENSITY", "check_range", config.density.check_range);
    config.density.min_temperature = getDouble("DENSITY", "min_temperature", config.density.min_temperature);
    config.density.max_temperature = getDouble("DENSITY", "max_temperature", config.density.max_temperature);

    // [THERMOCLINE]
    ThermoclineConfig& tc = config.thermocline;
    tc.resolution = getDouble("THERMOCLINE", "resolution", tc.resolution);
    tc.mixed_cutoff = getDouble("THERMOCLINE", "mixed_cutoff", tc.mixed_cutoff);
    tc.stratified_min_gradient = getDouble("THERMOCLINE", "stratified_min_gradient",
                                           tc.stratified_min_gradient);
    tc.seasonal_min_gradient = getDouble("THERMOCLINE", "seasonal_min_gradient",
                                         tc.seasonal_min_gradient);
    tc.seasonal_peak_fraction = getDouble("THERMOCLINE", "seasonal_peak_fraction",
                                          tc.seasonal_peak_fraction);
    tc.plateau_tolerance = getDouble("THERMOCLINE", "plateau_tolerance", tc.plateau_tolerance);

    // [METALIMNION]
    MetalimnionConfig& mc = config.metalimnion;
    mc.gradient_fraction = getDouble("METALIMNION", "gradient_fraction", mc.gradient_fraction);
    mc.use_absolute_slope = getBool("METALIMNION", "use_absolute_slope", mc.use_absolute_slope);
    mc.absolute_slope = getDouble("METALIMNION", "absolute_slope", mc.absolute_slope);

    // [WIND]
    WindConfig& wc = config.wind;
    wc.sensor_height = getDouble("WIND", "sensor_height", wc.sensor_height);
    wc.air_density = getDouble("WIND", "air_density", wc.air_density);
    wc.von_karman = getDouble("WIND", "von_karman", wc.von_karman);
    readEnum("WIND", "drag_model", parseDragModel, wc.drag_model);
    wc.drag_low = getDouble("WIND", "drag_low", wc.drag_low);
    wc.drag_high = getDouble("WIND", "drag_high", wc.drag_high);
    wc.drag_threshold = getDouble("WIND", "drag_threshold", wc.drag_threshold);
    wc.constant_drag = getDouble("WIND", "drag_coefficient", wc.constant_drag);

    // [FETCH]
    readEnum("FETCH", "model", parseFetchModel, config.fetch.model);
    config.fetch.fetch_length = getDouble("FETCH", "length", config.fetch.fetch_length);

    // [TIME_SERIES]
    readEnum("TIME_SERIES", "wind_join", parseWindJoinPolicy, config.wind_join);
    readEnum("TIME_SERIES", "depth_policy", parseDepthPolicy, config.depth_policy);

    return ok;
}

ValidationResult ConfigReader::validate() const {
    static const std::vector<std::string> known = {
        "ANALYSIS", "DENSITY", "THERMOCLINE", "METALIMNION", "WIND", "FETCH", "TIME_SERIES"
    };

    ValidationResult result;
    for (const auto& section : getSections()) {
        if (std::find(known.begin(), known.end(), section) == known.end()) {
            result.warnings.push_back("Unknown section [" + section + "] is ignored");
        }
    }

    if (data.empty()) {
        result.warnings.push_back("Empty configuration - using defaults");
    }

    AnalysisConfig config;
    if (!parseAnalysisConfig(config)) {
        result.errors.push_back("Unrecognised enumeration value");
        result.valid = false;
    }

    ValidationResult ranges = config.validate();
    result.errors.insert(result.errors.end(), ranges.errors.begin(), ranges.errors.end());
    result.warnings.insert(result.warnings.end(), ranges.warnings.begin(), ranges.warnings.end());
    result.valid = result.valid && ranges.valid;

    return result;
}

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    const AnalysisConfig d;

    file << "# LakeStrat Configuration File\n";
    file << "# Depths in m, temperatures in C, densities in kg/m^3\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "[ANALYSIS]\n";
    file << "seasonal = " << (d.seasonal ? "true" : "false")
         << "                       # seasonal thermocline for layer bounds\n";
    file << "schmidt_resolution = " << d.schmidt_resolution << "              # m\n\n";

    file << "[DENSITY]\n";
    file << "formula = " << toString(d.density.formula)
         << "           # MARTIN_MCCUTCHEON, UNESCO\n";
    file << "salinity = " << d.density.salinity << "                          # non-zero selects UNESCO\n";
    file << "check_range = " << (d.density.check_range ? "true" : "false") << "\n";
    file << "min_temperature = " << d.density.min_temperature << "\n";
    file << "max_temperature = " << d.density.max_temperature << "\n\n";

    file << "[THERMOCLINE]\n";
    file << "resolution = " << d.thermocline.resolution << "                      # m, fine grid\n";
    file << "mixed_cutoff = " << d.thermocline.mixed_cutoff << "                      # C, smaller range is mixed\n";
    file << "stratified_min_gradient = " << d.thermocline.stratified_min_gradient << "\n";
    file << "seasonal_min_gradient = " << d.thermocline.seasonal_min_gradient << "           # kg/m^3/m\n";
    file << "seasonal_peak_fraction = " << d.thermocline.seasonal_peak_fraction << "         # of the strongest gradient\n";
    file << "plateau_tolerance = " << d.thermocline.plateau_tolerance << "\n\n";

    file << "[METALIMNION]\n";
    file << "gradient_fraction = " << d.metalimnion.gradient_fraction << "               # of the strongest gradient\n";
    file << "use_absolute_slope = " << (d.metalimnion.use_absolute_slope ? "true" : "false") << "\n";
    file << "absolute_slope = " << d.metalimnion.absolute_slope << "                  # kg/m^3/m\n\n";

    file << "[WIND]\n";
    file << "sensor_height = " << d.wind.sensor_height << "                    # m\n";
    file << "air_density = " << d.wind.air_density << "\n";
    file << "von_karman = " << d.wind.von_karman << "\n";
    file << "drag_model = " << toString(d.wind.drag_model) << "              # HICKS_1972, CONSTANT\n";
    file << "drag_low = " << d.wind.drag_low << "\n";
    file << "drag_high = " << d.wind.drag_high << "\n";
    file << "drag_threshold = " << d.wind.drag_threshold << "                    # m/s\n";
    file << "drag_coefficient = " << d.wind.constant_drag << "             # CONSTANT model\n\n";

    file << "[FETCH]\n";
    file << "model = " << toString(d.fetch.model)
         << "              # SQUARE_ROOT_AREA, CIRCLE_DIAMETER, SUPPLIED\n";
    file << "length = " << d.fetch.fetch_length << "                            # m, SUPPLIED model\n\n";

    file << "[TIME_SERIES]\n";
    file << "wind_join = " << toString(d.wind_join) << "                     # EXACT, LINEAR_INTERPOLATION\n";
    file << "depth_policy = " << toString(d.depth_policy) << "               # TOLERATE, REQUIRE_FIXED\n";
}

} // namespace LakeStrat
