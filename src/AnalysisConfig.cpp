#include "AnalysisConfig.hpp"
#include <string>

namespace LakeStrat {

ValidationResult AnalysisConfig::validate() const {
    ValidationResult result;

    auto error = [&result](const std::string& msg) {
        result.errors.push_back(msg);
        result.valid = false;
    };

    // Density
    if (density.check_range && density.min_temperature >= density.max_temperature) {
        error("Density temperature range is empty");
    }
    if (!(density.salinity >= 0.0)) {
        error("Salinity must be non-negative");
    }
    if (density.salinity > 0.0 && density.formula == DensityFormula::MARTIN_MCCUTCHEON) {
        result.warnings.push_back("Non-zero salinity selects the UNESCO formula");
    }

    // Thermocline search
    if (!(thermocline.resolution > 0.0)) {
        error("Thermocline resolution must be positive");
    }
    if (!(thermocline.mixed_cutoff >= 0.0)) {
        error("Mixed temperature cutoff must be non-negative");
    }
    if (!(thermocline.seasonal_min_gradient >= 0.0)) {
        error("Seasonal minimum gradient must be non-negative");
    }
    if (!(thermocline.seasonal_peak_fraction >= 0.0 && thermocline.seasonal_peak_fraction <= 1.0)) {
        error("Seasonal peak fraction must be within [0, 1]");
    }
    if (!(thermocline.plateau_tolerance >= 0.0)) {
        error("Plateau tolerance must be non-negative");
    }
    if (thermocline.resolution > 1.0) {
        result.warnings.push_back("Thermocline resolution coarser than 1 m");
    }

    // Metalimnion
    if (metalimnion.use_absolute_slope) {
        if (!(metalimnion.absolute_slope > 0.0)) {
            error("Metalimnion slope must be positive");
        }
    } else if (!(metalimnion.gradient_fraction > 0.0 && metalimnion.gradient_fraction <= 1.0)) {
        error("Metalimnion gradient fraction must be within (0, 1]");
    }

    // Wind
    if (!(wind.sensor_height > 0.0)) {
        error("Wind sensor height must be positive");
    }
    if (!(wind.von_karman > 0.0)) {
        error("von Karman constant must be positive");
    }
    if (!(wind.air_density > 0.0)) {
        error("Air density must be positive");
    }
    if (wind.drag_model == DragCoefficientModel::CONSTANT) {
        if (!(wind.constant_drag > 0.0)) {
            error("Drag coefficient must be positive");
        }
    } else if (!(wind.drag_low > 0.0 && wind.drag_high > 0.0)) {
        error("Drag coefficients must be positive");
    }

    // Fetch
    if (fetch.model == FetchModel::SUPPLIED && !(fetch.fetch_length > 0.0)) {
        error("Supplied fetch length must be positive");
    }

    if (!(schmidt_resolution > 0.0)) {
        error("Schmidt stability resolution must be positive");
    }

    return result;
}

// =============================================================================
// Enumeration Names
// =============================================================================

bool parseDensityFormula(const std::string& name, DensityFormula& value) {
    if (name == "MARTIN_MCCUTCHEON") value = DensityFormula::MARTIN_MCCUTCHEON;
    else if (name == "UNESCO") value = DensityFormula::UNESCO;
    else return false;
    return true;
}

bool parseDragModel(const std::string& name, DragCoefficientModel& value) {
    if (name == "HICKS_1972") value = DragCoefficientModel::HICKS_1972;
    else if (name == "CONSTANT") value = DragCoefficientModel::CONSTANT;
    else return false;
    return true;
}

bool parseFetchModel(const std::string& name, FetchModel& value) {
    if (name == "SQUARE_ROOT_AREA") value = FetchModel::SQUARE_ROOT_AREA;
    else if (name == "CIRCLE_DIAMETER") value = FetchModel::CIRCLE_DIAMETER;
    else if (name == "SUPPLIED") value = FetchModel::SUPPLIED;
    else return false;
    return true;
}

bool parseWindJoinPolicy(const std::string& name, WindJoinPolicy& value) {
    if (name == "EXACT") value = WindJoinPolicy::EXACT;
    else if (name == "LINEAR_INTERPOLATION") value = WindJoinPolicy::LINEAR_INTERPOLATION;
    else return false;
    return true;
}

bool parseDepthPolicy(const std::string& name, DepthPolicy& value) {
    if (name == "TOLERATE") value = DepthPolicy::TOLERATE;
    else if (name == "REQUIRE_FIXED") value = DepthPolicy::REQUIRE_FIXED;
    else return false;
    return true;
}

std::string toString(DensityFormula value) {
    return value == DensityFormula::UNESCO ? "UNESCO" : "MARTIN_MCCUTCHEON";
}

std::string toString(DragCoefficientModel value) {
    return value == DragCoefficientModel::CONSTANT ? "CONSTANT" : "HICKS_1972";
}

std::string toString(FetchModel value) {
    switch (value) {
        case FetchModel::SQUARE_ROOT_AREA: return "SQUARE_ROOT_AREA";
        case FetchModel::CIRCLE_DIAMETER:  return "CIRCLE_DIAMETER";
        case FetchModel::SUPPLIED:         return "SUPPLIED";
    }
    return "SQUARE_ROOT_AREA";
}

std::string toString(WindJoinPolicy value) {
    return value == WindJoinPolicy::LINEAR_INTERPOLATION ? "LINEAR_INTERPOLATION" : "EXACT";
}

std::string toString(DepthPolicy value) {
    return value == DepthPolicy::REQUIRE_FIXED ? "REQUIRE_FIXED" : "TOLERATE";
}

// =============================================================================
// PETSc Options Database
// =============================================================================

static PetscErrorCode getReal(const char prefix[], const char name[], double& value) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;
    PetscReal v;
    PetscBool set = PETSC_FALSE;

    ierr = PetscOptionsGetReal(nullptr, prefix, name, &v, &set); CHKERRQ(ierr);
    if (set) value = static_cast<double>(v);
    PetscFunctionReturn(0);
}

static PetscErrorCode getBool(const char prefix[], const char name[], bool& value) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;
    PetscBool v;
    PetscBool set = PETSC_FALSE;

    ierr = PetscOptionsGetBool(nullptr, prefix, name, &v, &set); CHKERRQ(ierr);
    if (set) value = (v == PETSC_TRUE);
    PetscFunctionReturn(0);
}

static PetscErrorCode getName(const char prefix[], const char name[],
                              std::string& value, bool& set) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;
    char buffer[PETSC_MAX_PATH_LEN];
    PetscBool found = PETSC_FALSE;

    ierr = PetscOptionsGetString(nullptr, prefix, name, buffer, sizeof(buffer), &found); CHKERRQ(ierr);
    set = (found == PETSC_TRUE);
    if (set) value = buffer;
    PetscFunctionReturn(0);
}

PetscErrorCode applyOptionsDatabase(AnalysisConfig& config, const char prefix[]) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;
    std::string name;
    bool set = false;

    ierr = getBool(prefix, "-seasonal", config.seasonal); CHKERRQ(ierr);

    ierr = getName(prefix, "-density_formula", name, set); CHKERRQ(ierr);
    if (set && !parseDensityFormula(name, config.density.formula)) {
        SETERRQ(PETSC_COMM_SELF, PETSC_ERR_ARG_OUTOFRANGE,
                "Unknown density formula, valid: MARTIN_MCCUTCHEON, UNESCO");
    }
    ierr = getReal(prefix, "-salinity", config.density.salinity); CHKERRQ(ierr);

    ierr = getReal(prefix, "-thermocline_resolution", config.thermocline.resolution); CHKERRQ(ierr);
    ierr = getReal(prefix, "-mixed_cutoff", config.thermocline.mixed_cutoff); CHKERRQ(ierr);
    ierr = getReal(prefix, "-seasonal_min_gradient", config.thermocline.seasonal_min_gradient); CHKERRQ(ierr);
    ierr = getReal(prefix, "-seasonal_peak_fraction", config.thermocline.seasonal_peak_fraction); CHKERRQ(ierr);

    ierr = getReal(prefix, "-meta_gradient_fraction", config.metalimnion.gradient_fraction); CHKERRQ(ierr);
    {
        PetscReal slope;
        PetscBool slope_set = PETSC_FALSE;
        ierr = PetscOptionsGetReal(nullptr, prefix, "-meta_slope", &slope, &slope_set); CHKERRQ(ierr);
        if (slope_set) {
            config.metalimnion.use_absolute_slope = true;
            config.metalimnion.absolute_slope = static_cast<double>(slope);
        }
    }

    ierr = getReal(prefix, "-wind_height", config.wind.sensor_height); CHKERRQ(ierr);
    ierr = getName(prefix, "-drag_model", name, set); CHKERRQ(ierr);
    if (set && !parseDragModel(name, config.wind.drag_model)) {
        SETERRQ(PETSC_COMM_SELF, PETSC_ERR_ARG_OUTOFRANGE,
                "Unknown drag model, valid: HICKS_1972, CONSTANT");
    }
    ierr = getReal(prefix, "-drag_coefficient", config.wind.constant_drag); CHKERRQ(ierr);

    ierr = getName(prefix, "-fetch_model", name, set); CHKERRQ(ierr);
    if (set && !parseFetchModel(name, config.fetch.model)) {
        SETERRQ(PETSC_COMM_SELF, PETSC_ERR_ARG_OUTOFRANGE,
                "Unknown fetch model, valid: SQUARE_ROOT_AREA, CIRCLE_DIAMETER, SUPPLIED");
    }
    ierr = getReal(prefix, "-fetch_length", config.fetch.fetch_length); CHKERRQ(ierr);

    ierr = getReal(prefix, "-schmidt_resolution", config.schmidt_resolution); CHKERRQ(ierr);

    ierr = getName(prefix, "-wind_join", name, set); CHKERRQ(ierr);
    if (set && !parseWindJoinPolicy(name, config.wind_join)) {
        SETERRQ(PETSC_COMM_SELF, PETSC_ERR_ARG_OUTOFRANGE,
                "Unknown wind join policy, valid: EXACT, LINEAR_INTERPOLATION");
    }
    ierr = getName(prefix, "-depth_policy", name, set); CHKERRQ(ierr);
    if (set && !parseDepthPolicy(name, config.depth_policy)) {
        SETERRQ(PETSC_COMM_SELF, PETSC_ERR_ARG_OUTOFRANGE,
                "Unknown depth policy, valid: TOLERATE, REQUIRE_FIXED");
    }

    PetscFunctionReturn(0);
}

} // namespace LakeStrat
