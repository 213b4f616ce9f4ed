#pragma once

// Umbrella header: 3D rotations as quaternions, with rotation matrices,
// Euler angles, rigid transforms, interpolation and text formatting.

#include "constexpr_math.hpp"
#include "dcm.hpp"
#include "euler.hpp"
#include "interpolation.hpp"
#include "matrix.hpp"
#include "quaternion.hpp"
#include "quaternion_format.hpp"
#include "random_rotation.hpp"
#include "transform.hpp"
