#ifndef CLOTHSIM_SERIALIZATION_SNAPSHOT_JSON_HPP
#define CLOTHSIM_SERIALIZATION_SNAPSHOT_JSON_HPP

#include <nlohmann/json.hpp>
#include <cloth/constraint.hpp>
#include <simulation/render_snapshot.hpp>
#include "config_json.hpp"

namespace clothsim {

NLOHMANN_JSON_SERIALIZE_ENUM(ConstraintType, {
    {ConstraintType::Structural, "Structural"},
    {ConstraintType::Bending, "Bending"},
    {ConstraintType::Shear, "Shear"},
})

inline void to_json(nlohmann::json& j, const RenderSegment& segment) {
    j["a"] = segment.a;
    j["b"] = segment.b;
    j["type"] = segment.type;
}

inline void to_json(nlohmann::json& j, const RenderParticle& particle) {
    j["position"] = particle.position;
    j["pinned"] = particle.pinned;
}

inline nlohmann::json render_snapshot_to_json(const RenderSnapshot& snapshot) {
    nlohmann::json j;
    j["segments"] = snapshot.segments;
    j["particles"] = snapshot.particles;
    return j;
}

}  // namespace clothsim

#endif // CLOTHSIM_SERIALIZATION_SNAPSHOT_JSON_HPP
