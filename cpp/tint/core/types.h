#pragma once

#include <array>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace tint {

// Tracking identifier assigned by the tracking engine. 0 is never a valid id.
using WallId = std::uint64_t;
inline constexpr WallId kInvalidWallId = 0;

struct Vec3 {
    float x;
    float y;
    float z;
};

inline float distance(const Vec3& a, const Vec3& b) {
    const float dx = a.x - b.x;
    const float dy = a.y - b.y;
    const float dz = a.z - b.z;
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

// 4x4 column-major transform; translation lives in column 3 (m[12..14]).
struct Pose {
    std::array<float, 16> m{
        1.0f, 0.0f, 0.0f, 0.0f,
        0.0f, 1.0f, 0.0f, 0.0f,
        0.0f, 0.0f, 1.0f, 0.0f,
        0.0f, 0.0f, 0.0f, 1.0f,
    };

    static Pose identity() { return Pose{}; }

    static Pose fromTranslation(float x, float y, float z) {
        Pose p{};
        p.m[12] = x;
        p.m[13] = y;
        p.m[14] = z;
        return p;
    }

    Vec3 translation() const { return Vec3{m[12], m[13], m[14]}; }
    Vec3 column(int index) const {
        const int base = index * 4;
        return Vec3{m[base], m[base + 1], m[base + 2]};
    }

    bool operator==(const Pose& other) const { return m == other.m; }
    bool operator!=(const Pose& other) const { return !(*this == other); }
};

struct Extent {
    float width;
    float height;

    bool operator==(const Extent& other) const { return width == other.width && height == other.height; }
    bool operator!=(const Extent& other) const { return !(*this == other); }
};

enum class PlaneAlignment : std::uint32_t {
    Vertical = 0,
    Horizontal = 1,
    Other = 2,
};

// One tick's report of a detected planar surface. Never mutated after creation.
struct SurfaceObservation {
    WallId id;
    PlaneAlignment alignment;
    Extent extent;
    Pose pose;
};

using ObservationBatch = std::vector<SurfaceObservation>;

struct PaintColor {
    float r;
    float g;
    float b;
    float a = 1.0f;

    bool operator==(const PaintColor& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const PaintColor& other) const { return !(*this == other); }
};

enum class PaintFinish : std::uint32_t {
    Matte = 0,
    Satin = 1,
    Gloss = 2,
};

// Material parameters handed to the render adapter for each finish.
struct FinishProperties {
    float roughness;
    float metallic;
    float specular;
};

inline FinishProperties finishProperties(PaintFinish finish) {
    switch (finish) {
        case PaintFinish::Matte: return FinishProperties{0.9f, 0.0f, 0.1f};
        case PaintFinish::Satin: return FinishProperties{0.5f, 0.0f, 0.3f};
        case PaintFinish::Gloss: return FinishProperties{0.1f, 0.0f, 0.7f};
    }
    return FinishProperties{0.9f, 0.0f, 0.1f};
}

const char* finishName(PaintFinish finish);

enum class LimitedReason : std::uint32_t {
    Initializing = 0,
    ExcessiveMotion = 1,
    InsufficientFeatures = 2,
    Relocalizing = 3,
    Unavailable = 4,
};

const char* limitedReasonName(LimitedReason reason);

// Tracking quality as reported by the tracking engine.
struct TrackingQuality {
    enum class Kind : std::uint32_t {
        Initializing = 0,
        Normal = 1,
        Limited = 2,
        Unavailable = 3,
    };

    Kind kind = Kind::Normal;
    LimitedReason reason = LimitedReason::Initializing;

    static TrackingQuality normal() { return TrackingQuality{Kind::Normal, LimitedReason::Initializing}; }
    static TrackingQuality initializing() { return TrackingQuality{Kind::Initializing, LimitedReason::Initializing}; }
    static TrackingQuality limited(LimitedReason r) { return TrackingQuality{Kind::Limited, r}; }
    static TrackingQuality unavailable() { return TrackingQuality{Kind::Unavailable, LimitedReason::Unavailable}; }
};

// Unrecoverable session fault reported by the tracking engine.
struct TintFault {
    std::uint32_t code = 0;
    std::string message;

    bool operator==(const TintFault& other) const { return code == other.code && message == other.message; }
    bool operator!=(const TintFault& other) const { return !(*this == other); }
};

enum class TintError : std::uint32_t {
    Ok = 0,
    NotFound = 1,
    NoSelection = 2,
    Unchanged = 3,
    InvalidState = 4,
};

const char* errorName(TintError error);

} // namespace tint
