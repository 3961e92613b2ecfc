#ifndef CLOTHSIM_CLOTH_BUILDER_HPP
#define CLOTHSIM_CLOTH_BUILDER_HPP

#include "cloth.hpp"
#include <cstdint>

namespace clothsim {

// Upper bound on width * height, keeping every grid index (up to
// y*width + x + 2*width) well inside ParticleId.
constexpr uint64_t kMaxParticleCount = uint64_t{1} << 20;

// Parameters of the rectangular grid topology.
// width and height are particle counts; both must be >= 2 and their
// product at most kMaxParticleCount.
struct ClothBuildConfig {
    uint32_t width = 40;
    uint32_t height = 25;
    float spacing = 15.0f;
    Vec2 origin{300.0f, 50.0f};
    float particle_mass = 1.0f;
};

// Builder for the particle/constraint graph of a hanging cloth.
// Row 0 is pinned. Each cell emits, where the target exists:
//   structural (x+1,y), bending (x+2,y), structural (x,y+1),
//   bending (x,y+2), shear (x,y)-(x+1,y+1) and (x+1,y)-(x,y+1).
class ClothBuilder {
public:
    // Throws std::invalid_argument if the config violates the input contract
    static Cloth build(const ClothBuildConfig& config);

private:
    explicit ClothBuilder(const ClothBuildConfig& config);

    void create_particles();
    void create_constraints();
    void add(ParticleId a, ParticleId b, ConstraintType type, float rest_length);

    ClothBuildConfig config_;
    Cloth cloth_;
};

}  // namespace clothsim

#endif // CLOTHSIM_CLOTH_BUILDER_HPP
