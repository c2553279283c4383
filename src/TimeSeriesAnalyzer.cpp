#include "TimeSeriesAnalyzer.hpp"
#include "LayerIntegrator.hpp"
#include "StabilityIndices.hpp"
#include "StratErrors.hpp"
#include <petsc.h>
#include <algorithm>
#include <cmath>

namespace LakeStrat {

TimeSeriesAnalyzer::TimeSeriesAnalyzer(MPI_Comm comm, const Bathymetry& bathymetry,
                                       const AnalysisConfig& config)
    : comm_(comm), bathymetry_(bathymetry), config_(config),
      density_model_(config.density),
      detector_(density_model_, config.thermocline, config.metalimnion) {
    ValidationResult check = config_.validate();
    if (!check.valid) {
        throw InvalidInputError("TimeSeriesAnalyzer: " + check.errors.front());
    }
}

void TimeSeriesAnalyzer::getRankAndSize(int& rank, int& size) const {
    int initialized = 0, finalized = 0;
    MPI_Initialized(&initialized);
    MPI_Finalized(&finalized);

    rank = 0;
    size = 1;
    if (initialized && !finalized) {
        MPI_Comm_rank(comm_, &rank);
        MPI_Comm_size(comm_, &size);
    }
}

// =============================================================================
// Row Distribution
// =============================================================================

ResultTable TimeSeriesAnalyzer::apply(const TemperatureSeries& temperature,
                                      const ScalarSeries* wind,
                                      const std::vector<std::string>& columns,
                                      const RowFunction& fn) const {
    if (columns.empty()) {
        throw InvalidInputError("TimeSeriesAnalyzer: no output columns");
    }

    const size_t n = temperature.size();
    const size_t ncol = columns.size();

    std::vector<double> winds;
    if (wind) {
        winds = alignWind(temperature, *wind, config_.wind_join);
    }

    int rank, size;
    getRankAndSize(rank, size);

    // Rows owned by other ranks stay zero so the sum reproduces each value
    std::vector<double> values(n * ncol, 0.0);
    std::vector<int> status(n, 0);

    for (size_t i = static_cast<size_t>(rank); i < n; i += static_cast<size_t>(size)) {
        const ProfileRow& row = temperature.row(i);
        double ws = wind ? winds[i] : undefinedValue();

        RowStatus st = RowStatus::OK;
        std::string what;
        std::vector<double> out;

        if (row.profile.hasMissingValues() || (wind && !std::isfinite(ws))) {
            st = RowStatus::MISSING_INPUT;
            what = "missing temperature or wind observation";
        } else if (config_.depth_policy == DepthPolicy::REQUIRE_FIXED &&
                   !row.profile.sameDepths(temperature.row(0).profile)) {
            st = RowStatus::DEPTH_MISMATCH;
            what = "depths differ from the first row";
        } else {
            try {
                out = fn(RowContext{i, row.time, row.profile, ws});
                if (out.size() != ncol) {
                    st = RowStatus::FAILED;
                    what = "row function returned " + std::to_string(out.size()) +
                           " values for " + std::to_string(ncol) + " columns";
                }
            } catch (const StratificationError& e) {
                st = e.kind();
                what = e.what();
            } catch (const std::exception& e) {
                st = RowStatus::FAILED;
                what = e.what();
            }
        }

        if (st == RowStatus::OK) {
            std::copy(out.begin(), out.end(), values.begin() + i * ncol);
        } else {
            std::fill(values.begin() + i * ncol, values.begin() + (i + 1) * ncol,
                      undefinedValue());
            reportRowFailure(i, row.time, st, what.c_str());
        }
        status[i] = static_cast<int>(st);
    }

    if (size > 1 && n > 0) {
        MPI_Allreduce(MPI_IN_PLACE, values.data(), static_cast<int>(values.size()),
                      MPI_DOUBLE, MPI_SUM, comm_);
        MPI_Allreduce(MPI_IN_PLACE, status.data(), static_cast<int>(status.size()),
                      MPI_INT, MPI_SUM, comm_);
    }

    ResultTable table;
    table.columns = columns;
    table.rows.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        ResultRow r;
        r.time = temperature.row(i).time;
        r.values.assign(values.begin() + i * ncol, values.begin() + (i + 1) * ncol);
        r.status = static_cast<RowStatus>(status[i]);
        if (r.status != RowStatus::OK) {
            table.failed_rows++;
        }
        table.rows.push_back(std::move(r));
    }

    reportSummary(table);
    return table;
}

void TimeSeriesAnalyzer::reportRowFailure(size_t index, Timestamp time, RowStatus status,
                                          const char* what) const {
    PetscBool petsc_on = PETSC_FALSE;
    PetscInitialized(&petsc_on);
    if (!petsc_on) return;

    PetscInfo(nullptr, "Row %lld (t = %lld) %s: %s\n",
              static_cast<long long>(index), static_cast<long long>(time),
              rowStatusToString(status).c_str(), what);
}

void TimeSeriesAnalyzer::reportSummary(const ResultTable& table) const {
    PetscBool petsc_on = PETSC_FALSE;
    PetscInitialized(&petsc_on);
    if (!petsc_on) return;

    PetscPrintf(comm_, "TimeSeriesAnalyzer: %s over %lld rows, %lld undefined\n",
                table.columns.front().c_str(), static_cast<long long>(table.size()),
                static_cast<long long>(table.failed_rows));
    if (table.failed_rows == 0) return;

    for (int s = static_cast<int>(RowStatus::MISSING_INPUT);
         s <= static_cast<int>(RowStatus::FAILED); ++s) {
        size_t count = table.countStatus(static_cast<RowStatus>(s));
        if (count > 0) {
            PetscPrintf(comm_, "  %-16s %lld\n",
                        rowStatusToString(static_cast<RowStatus>(s)).c_str(),
                        static_cast<long long>(count));
        }
    }
}

// =============================================================================
// Shared Row Steps
// =============================================================================

ThermoclineResult TimeSeriesAnalyzer::requireStratified(const DepthProfile& profile) const {
    ThermoclineResult result = detector_.findThermocline(profile);
    if (!result.stratified) {
        throw NotStratifiedError("water column is not stratified");
    }
    return result;
}

TimeSeriesAnalyzer::LayerDensities
TimeSeriesAnalyzer::layerDensities(const DepthProfile& profile) const {
    ThermoclineResult thermo = requireStratified(profile);
    LayerIntegrator integrator(bathymetry_);

    LayerDensities d;
    d.metalimnion = detector_.metalimnionFromThermocline(thermo, config_.seasonal);
    d.epilimnion = surfaceLayerDensity(profile, d.metalimnion.top);

    // Metalimnion reaching the deepest sensor leaves that sensor as the hypolimnion
    if (d.metalimnion.bottom >= profile.maxDepth()) {
        d.hypolimnion = density_model_.density(profile.values.back());
    } else {
        d.hypolimnion = integrator.layerDensity(profile, d.metalimnion.bottom,
                                                bathymetry_.maxDepth(), density_model_);
    }
    return d;
}

double TimeSeriesAnalyzer::surfaceLayerDensity(const DepthProfile& profile,
                                               double bottom) const {
    // Layer ending at or above the shallowest sensor: that sensor represents it
    if (bottom <= profile.minDepth()) {
        return density_model_.density(profile.values.front());
    }
    LayerIntegrator integrator(bathymetry_);
    return integrator.layerDensity(profile, bathymetry_.minDepth(), bottom, density_model_);
}

// =============================================================================
// Series Operations
// =============================================================================

ResultTable TimeSeriesAnalyzer::thermoclineDepth(const TemperatureSeries& temperature) const {
    return apply(temperature, nullptr, {"thermo.depth"}, [this](const RowContext& ctx) {
        ThermoclineResult thermo = requireStratified(ctx.profile);
        return std::vector<double>{thermo.depthFor(config_.seasonal)};
    });
}

ResultTable TimeSeriesAnalyzer::metalimnionDepths(const TemperatureSeries& temperature) const {
    return apply(temperature, nullptr, {"top", "bottom"}, [this](const RowContext& ctx) {
        ThermoclineResult thermo = requireStratified(ctx.profile);
        Layer meta = detector_.metalimnionFromThermocline(thermo, config_.seasonal);
        return std::vector<double>{meta.top, meta.bottom};
    });
}

ResultTable TimeSeriesAnalyzer::schmidtStability(const TemperatureSeries& temperature) const {
    return apply(temperature, nullptr, {"schmidt.stability"}, [this](const RowContext& ctx) {
        return std::vector<double>{
            LakeStrat::schmidtStability(ctx.profile, bathymetry_, density_model_,
                                        config_.schmidt_resolution)};
    });
}

ResultTable TimeSeriesAnalyzer::buoyancyFrequency(const TemperatureSeries& temperature) const {
    return apply(temperature, nullptr, {"n2"}, [this](const RowContext& ctx) {
        ThermoclineResult thermo = requireStratified(ctx.profile);
        BuoyancyProfile n2 = LakeStrat::buoyancyFrequency(ctx.profile, density_model_);
        return std::vector<double>{buoyancyFrequencyAt(n2, thermo.depthFor(config_.seasonal))};
    });
}

ResultTable TimeSeriesAnalyzer::centerOfBuoyancy(const TemperatureSeries& temperature) const {
    return apply(temperature, nullptr, {"center.buoyancy"}, [this](const RowContext& ctx) {
        BuoyancyProfile n2 = LakeStrat::buoyancyFrequency(ctx.profile, density_model_);
        return std::vector<double>{LakeStrat::centerOfBuoyancy(n2)};
    });
}

ResultTable TimeSeriesAnalyzer::layerTemperature(const TemperatureSeries& temperature,
                                                 double top, double bottom) const {
    return apply(temperature, nullptr, {"wtr"}, [this, top, bottom](const RowContext& ctx) {
        LayerIntegrator integrator(bathymetry_);
        return std::vector<double>{integrator.layerTemperature(ctx.profile, top, bottom)};
    });
}

ResultTable TimeSeriesAnalyzer::layerTemperature(const TemperatureSeries& temperature,
                                                 const std::vector<Layer>& layers) const {
    if (layers.size() != temperature.size()) {
        throw InvalidInputError("layerTemperature: " + std::to_string(layers.size()) +
                                " layers for " + std::to_string(temperature.size()) + " rows");
    }
    return apply(temperature, nullptr, {"wtr"}, [this, &layers](const RowContext& ctx) {
        const Layer& layer = layers[ctx.index];
        LayerIntegrator integrator(bathymetry_);
        return std::vector<double>{
            integrator.layerTemperature(ctx.profile, layer.top, layer.bottom)};
    });
}

ResultTable TimeSeriesAnalyzer::uStar(const TemperatureSeries& temperature,
                                      const ScalarSeries& wind) const {
    return apply(temperature, &wind, {"uStar"}, [this](const RowContext& ctx) {
        // Mixed columns use the whole-column density
        double epi_bottom = bathymetry_.maxDepth();
        ThermoclineResult thermo = detector_.findThermocline(ctx.profile);
        if (thermo.stratified) {
            epi_bottom = detector_.metalimnionFromThermocline(thermo, config_.seasonal).top;
        }

        double epi_density = surfaceLayerDensity(ctx.profile, epi_bottom);
        return std::vector<double>{frictionVelocity(ctx.wind_speed, epi_density, config_.wind)};
    });
}

ResultTable TimeSeriesAnalyzer::lakeNumber(const TemperatureSeries& temperature,
                                           const ScalarSeries& wind) const {
    return apply(temperature, &wind, {"lake.number"}, [this](const RowContext& ctx) {
        LayerDensities d = layerDensities(ctx.profile);
        double u_star = frictionVelocity(ctx.wind_speed, d.epilimnion, config_.wind);
        double St = LakeStrat::schmidtStability(ctx.profile, bathymetry_, density_model_,
                                                config_.schmidt_resolution);
        return std::vector<double>{
            LakeStrat::lakeNumber(bathymetry_, u_star, St, d.metalimnion.top,
                                  d.metalimnion.bottom, d.hypolimnion)};
    });
}

ResultTable TimeSeriesAnalyzer::wedderburnNumber(const TemperatureSeries& temperature,
                                                 const ScalarSeries& wind) const {
    double fetch = fetchLength(bathymetry_.surfaceArea(), config_.fetch);

    return apply(temperature, &wind, {"wedderburn.number"}, [this, fetch](const RowContext& ctx) {
        LayerDensities d = layerDensities(ctx.profile);
        double u_star = frictionVelocity(ctx.wind_speed, d.epilimnion, config_.wind);
        return std::vector<double>{
            LakeStrat::wedderburnNumber(d.hypolimnion - d.epilimnion, d.metalimnion.top,
                                        u_star, d.hypolimnion, fetch)};
    });
}

} // namespace LakeStrat
