#pragma once

#include <functional>

namespace aria
{

namespace ease
{
float linear(float t);
float ease_in(float t);
float ease_out(float t);
float ease_in_out(float t);
float ease_out_back(float t);
float decelerate(float t);

// Cubic-bezier easing factory (returns a stateless function object)
struct CubicBezier
{
    float x1, y1, x2, y2;
    float operator()(float t) const;
};

// Platform-standard curves used by the player surfaces
inline constexpr CubicBezier standard_ease_in{0.42f, 0.0f, 1.0f, 1.0f};
inline constexpr CubicBezier standard_ease_out{0.0f, 0.0f, 0.58f, 1.0f};
inline constexpr CubicBezier ease_out_cubic{0.215f, 0.61f, 0.355f, 1.0f};
inline constexpr CubicBezier ease_in_cubic{0.55f, 0.055f, 0.675f, 0.19f};
}   // namespace ease

// Accepts normalized t in [0,1], returns the eased value. Holds either a
// free function or a stateful curve such as CubicBezier.
using EasingFunc = std::function<float(float)>;

// Linear ramp of t across [start, end], clamped to [0,1].
float ramp(float t, float start, float end);

inline float lerp(float a, float b, float t)
{
    return a + (b - a) * t;
}

}   // namespace aria
