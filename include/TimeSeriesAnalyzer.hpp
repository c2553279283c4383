#ifndef TIME_SERIES_ANALYZER_HPP
#define TIME_SERIES_ANALYZER_HPP

#include "LakeStrat.hpp"
#include "AnalysisConfig.hpp"
#include "Bathymetry.hpp"
#include "StratificationDetector.hpp"
#include "TimeSeries.hpp"
#include "WaterDensity.hpp"
#include <mpi.h>
#include <functional>
#include <string>
#include <vector>

namespace LakeStrat {

/**
 * @brief Inputs of one row handed to a row function
 */
struct RowContext {
    size_t index;
    Timestamp time;
    const DepthProfile& profile;
    double wind_speed;            // NaN when no wind series is used
};

/**
 * @brief Applies per-profile analyses to every row of a temperature series
 *
 * Rows are distributed round-robin over the ranks of the communicator and
 * the partial tables are summed with MPI_Allreduce, so every rank returns
 * the complete table in input order. Without MPI the analyzer runs serially.
 *
 * A row never aborts the batch: missing inputs and analysis errors yield a
 * row of NaN values tagged with a RowStatus. Alignment of the wind series
 * and invalid arguments fail the whole call.
 */
class TimeSeriesAnalyzer {
public:
    using RowFunction = std::function<std::vector<double>(const RowContext&)>;

    /**
     * @throws InvalidInputError when the configuration does not validate
     */
    TimeSeriesAnalyzer(MPI_Comm comm, const Bathymetry& bathymetry,
                       const AnalysisConfig& config = AnalysisConfig());

    /**
     * @brief Evaluate fn on every row
     * @param temperature Temperature series
     * @param wind Optional wind series aligned with config.wind_join; rows
     *        without a finite wind value become MISSING_INPUT
     * @param columns Names of the values fn returns
     * @param fn Row function, must return columns.size() values
     * @throws AlignmentError when the wind series cannot be aligned
     */
    ResultTable apply(const TemperatureSeries& temperature, const ScalarSeries* wind,
                      const std::vector<std::string>& columns, const RowFunction& fn) const;

    // =========================================================================
    // Series Operations
    // =========================================================================

    /// Column "thermo.depth"
    ResultTable thermoclineDepth(const TemperatureSeries& temperature) const;

    /// Columns "top", "bottom"
    ResultTable metalimnionDepths(const TemperatureSeries& temperature) const;

    /// Column "schmidt.stability" (J/m²)
    ResultTable schmidtStability(const TemperatureSeries& temperature) const;

    /// Column "n2", buoyancy frequency squared at the thermocline (s⁻²)
    ResultTable buoyancyFrequency(const TemperatureSeries& temperature) const;

    /// Column "center.buoyancy" (m)
    ResultTable centerOfBuoyancy(const TemperatureSeries& temperature) const;

    /// Column "wtr", volume-weighted temperature of a fixed layer
    ResultTable layerTemperature(const TemperatureSeries& temperature,
                                 double top, double bottom) const;

    /**
     * @brief Column "wtr" with one layer per row
     * @throws InvalidInputError when layers.size() differs from the series
     */
    ResultTable layerTemperature(const TemperatureSeries& temperature,
                                 const std::vector<Layer>& layers) const;

    /// Column "uStar" (m/s)
    ResultTable uStar(const TemperatureSeries& temperature, const ScalarSeries& wind) const;

    /// Column "lake.number"
    ResultTable lakeNumber(const TemperatureSeries& temperature, const ScalarSeries& wind) const;

    /**
     * @brief Column "wedderburn.number"
     * @throws DomainError when the configured fetch length is undefined
     */
    ResultTable wedderburnNumber(const TemperatureSeries& temperature,
                                 const ScalarSeries& wind) const;

    const AnalysisConfig& getConfig() const { return config_; }
    const Bathymetry& getBathymetry() const { return bathymetry_; }
    const StratificationDetector& getDetector() const { return detector_; }

private:
    MPI_Comm comm_;
    Bathymetry bathymetry_;
    AnalysisConfig config_;
    WaterDensityModel density_model_;
    StratificationDetector detector_;

    /// Thermocline search that throws NotStratifiedError for mixed columns
    ThermoclineResult requireStratified(const DepthProfile& profile) const;

    struct LayerDensities {
        Layer metalimnion;
        double epilimnion;
        double hypolimnion;
    };
    LayerDensities layerDensities(const DepthProfile& profile) const;

    /// Density of the layer from the lake surface down to bottom
    double surfaceLayerDensity(const DepthProfile& profile, double bottom) const;

    void getRankAndSize(int& rank, int& size) const;
    void reportRowFailure(size_t index, Timestamp time, RowStatus status,
                          const char* what) const;
    void reportSummary(const ResultTable& table) const;
};

} // namespace LakeStrat

#endif // TIME_SERIES_ANALYZER_HPP
