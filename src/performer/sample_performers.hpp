#pragma once

#include "engine/registry.hpp"

namespace fey::performer {

inline constexpr const char* kTimestamp = "fey.performer.Timestamp";
inline constexpr const char* kForward = "fey.performer.Forward";
inline constexpr const char* kLogger = "fey.performer.Logger";
inline constexpr const char* kFaulty = "fey.performer.Faulty";

auto register_sample_performers(fey::engine::PerformerRegistry& registry) -> void;

}  // namespace fey::performer
