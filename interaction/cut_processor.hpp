#ifndef CLOTHSIM_INTERACTION_CUT_PROCESSOR_HPP
#define CLOTHSIM_INTERACTION_CUT_PROCESSOR_HPP

#include <cloth/cloth.hpp>
#include <cstddef>

namespace clothsim {

// Removes constraints whose segment passes within `radius` of `center`.
// Removal is permanent. Returns the number of constraints removed.
size_t cut_constraints(Cloth& cloth, const Vec2& center, float radius);

}  // namespace clothsim

#endif // CLOTHSIM_INTERACTION_CUT_PROCESSOR_HPP
