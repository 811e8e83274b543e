#include <algorithm>
#include <aria/easing.hpp>
#include <cmath>

namespace aria
{

namespace ease
{

float linear(float t)
{
    return t;
}

float ease_in(float t)
{
    // Cubic ease-in
    return t * t * t;
}

float ease_out(float t)
{
    // Cubic ease-out
    float u = 1.0f - t;
    return 1.0f - u * u * u;
}

float ease_in_out(float t)
{
    if (t < 0.5f)
    {
        return 4.0f * t * t * t;
    }
    float u = -2.0f * t + 2.0f;
    return 1.0f - u * u * u / 2.0f;
}

float ease_out_back(float t)
{
    // Overshoots by ~10% before settling on 1
    constexpr float c1 = 1.70158f;
    constexpr float c3 = c1 + 1.0f;
    float           u  = t - 1.0f;
    return 1.0f + c3 * u * u * u + c1 * u * u;
}

float decelerate(float t)
{
    return 1.0f - (1.0f - t) * (1.0f - t);
}

float CubicBezier::operator()(float t) const
{
    if (t <= 0.0f)
        return 0.0f;
    if (t >= 1.0f)
        return 1.0f;

    auto bezier = [](float u, float p1, float p2)
    {
        float inv = 1.0f - u;
        return 3.0f * inv * inv * u * p1 + 3.0f * inv * u * u * p2 + u * u * u;
    };

    // Newton-Raphson: find u with bezier_x(u) == t, then return bezier_y(u)
    float u         = t;
    bool  converged = false;
    for (int i = 0; i < 8; ++i)
    {
        float err = bezier(u, x1, x2) - t;
        if (std::abs(err) < 1e-6f)
        {
            converged = true;
            break;
        }
        float inv = 1.0f - u;
        float dx  = 3.0f * inv * inv * x1 + 6.0f * inv * u * (x2 - x1) + 3.0f * u * u * (1.0f - x2);
        if (std::abs(dx) < 1e-6f)
            break;
        u = std::clamp(u - err / dx, 0.0f, 1.0f);
    }

    // Flat slopes near the ends: fall back to bisection
    if (!converged)
    {
        float lo = 0.0f;
        float hi = 1.0f;
        for (int i = 0; i < 24; ++i)
        {
            u = 0.5f * (lo + hi);
            if (bezier(u, x1, x2) < t)
                lo = u;
            else
                hi = u;
        }
    }

    return bezier(u, y1, y2);
}

}   // namespace ease

float ramp(float t, float start, float end)
{
    if (end <= start)
        return t >= end ? 1.0f : 0.0f;
    return std::clamp((t - start) / (end - start), 0.0f, 1.0f);
}

}   // namespace aria
