#pragma once

#include <nytl/vec.hpp>

namespace rlcam {
inline namespace types {

using nytl::Vec2;
using nytl::Vec3;

using nytl::Vec2f;
using nytl::Vec3f;
using nytl::Vec2d;
using nytl::Vec3d;
using nytl::Vec2ui;

} // namespace types
} // namespace rlcam
