#pragma once

#include <optional>
#include <string>
#include <utility>

namespace mc {
namespace molding {

enum class AnalysisErrorCode {
    InvalidGeometry,     // Non-positive or inconsistent dimensions
    InvalidMaterial,     // Missing or malformed material property
    InvalidConfig,       // Cavity count, safety factor, gate sizing or location
    InvalidMachine,      // Malformed machine catalog entry
    ComputationOverflow  // A derived value came out non-finite
};

inline const char* analysisErrorCodeToString(AnalysisErrorCode code) {
    switch (code) {
    case AnalysisErrorCode::InvalidGeometry: return "InvalidGeometry";
    case AnalysisErrorCode::InvalidMaterial: return "InvalidMaterial";
    case AnalysisErrorCode::InvalidConfig: return "InvalidConfig";
    case AnalysisErrorCode::InvalidMachine: return "InvalidMachine";
    case AnalysisErrorCode::ComputationOverflow: return "ComputationOverflow";
    }
    return "Unknown";
}

// Names the violated precondition
struct AnalysisError {
    AnalysisErrorCode code = AnalysisErrorCode::InvalidConfig;
    std::string message;

    std::string describe() const {
        return std::string(analysisErrorCodeToString(code)) + ": " + message;
    }
};

// Value or error from a calculation step
template <typename T>
struct Outcome {
    std::optional<T> value;
    AnalysisError error;

    bool success() const { return value.has_value(); }
    explicit operator bool() const { return success(); }

    const T& get() const { return *value; }

    static Outcome ok(T v) {
        Outcome o;
        o.value = std::move(v);
        return o;
    }

    static Outcome fail(AnalysisErrorCode code, std::string message) {
        Outcome o;
        o.error = {code, std::move(message)};
        return o;
    }

    static Outcome fail(AnalysisError err) {
        Outcome o;
        o.error = std::move(err);
        return o;
    }
};

} // namespace molding
} // namespace mc
