#ifndef STRAT_ERRORS_HPP
#define STRAT_ERRORS_HPP

#include "LakeStrat.hpp"
#include <stdexcept>
#include <string>

namespace LakeStrat {

/**
 * @brief Base class of all errors raised by the analysis core
 *
 * Each error carries the RowStatus that the time-series analyzer records
 * when the error aborts a single row.
 */
class StratificationError : public std::runtime_error {
public:
    StratificationError(RowStatus kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    RowStatus kind() const { return kind_; }

private:
    RowStatus kind_;
};

/// Query depth outside the bathymetry or measured range
class OutOfRangeError : public StratificationError {
public:
    explicit OutOfRangeError(const std::string& what)
        : StratificationError(RowStatus::OUT_OF_RANGE, what) {}
};

/// Input value outside its physically valid range
class DomainError : public StratificationError {
public:
    explicit DomainError(const std::string& what)
        : StratificationError(RowStatus::DOMAIN_ERROR, what) {}
};

/// Degenerate or zero-volume layer
class EmptyLayerError : public StratificationError {
public:
    explicit EmptyLayerError(const std::string& what)
        : StratificationError(RowStatus::EMPTY_LAYER, what) {}
};

/// Index mathematically undefined for the given inputs
class UndefinedIndexError : public StratificationError {
public:
    explicit UndefinedIndexError(const std::string& what)
        : StratificationError(RowStatus::UNDEFINED_INDEX, what) {}

protected:
    UndefinedIndexError(RowStatus kind, const std::string& what)
        : StratificationError(kind, what) {}
};

/// Water column has no thermocline
class NotStratifiedError : public UndefinedIndexError {
public:
    explicit NotStratifiedError(const std::string& what)
        : UndefinedIndexError(RowStatus::NOT_STRATIFIED, what) {}
};

/// Timestamps of two series do not line up
class AlignmentError : public StratificationError {
public:
    explicit AlignmentError(const std::string& what)
        : StratificationError(RowStatus::ALIGNMENT, what) {}
};

/// Malformed profile or table (sizes, ordering, missing values)
class InvalidInputError : public StratificationError {
public:
    explicit InvalidInputError(const std::string& what)
        : StratificationError(RowStatus::INVALID_INPUT, what) {}
};

} // namespace LakeStrat

#endif // STRAT_ERRORS_HPP
