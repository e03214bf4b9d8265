/**
 * LevelPak - Common types and definitions
 * 
 * Decoded chunk records. Every record owns its nested sub-records by value
 * and is not mutated after the decoder returns it.
 */

#pragma once

#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <array>
#include <optional>
#include <utility>

namespace levelpak {

// ============================================================================
// Geometric aggregates
// ============================================================================
using Vector2 = glm::vec2;
using Vector3 = glm::vec3;
using Rgba = glm::vec4;     // r, g, b, a
using Matrix = glm::mat4;

/**
 * Axis-aligned box, stored min then max.
 */
struct BoundingBox {
    Vector3 min{0.0f};
    Vector3 max{0.0f};
};

// ============================================================================
// Chunk framing
// ============================================================================

/**
 * Closed set of chunk type codes found in level archives.
 */
enum class ChunkType : int32_t {
    GLProject = 1,
    MaterialObj = 5,            // Legacy single-material form
    ModelGroup = 1000,
    BoneObj = 1001,
    SPMesh = 1002,              // Single-part mesh
    Collision = 1003,
    AtomicMesh = 1004,
    SkinObj = 1005,
    GLCamera = 1006,
    LightObj = 1007,
    LevelObj = 1009,
    Materials = 1010,
    SectorOctree = 1011,
    World = 1012,
    AnimLib = 1017,
    OcclusionMesh = 1018,
    Occlusion = 1019,
    WpPoints = 1020,
    NavigationMesh = 1021,
    Zones = 1023,
    Area = 1024,
    LinkEmm = 1026,
    SpLights = 1029,
    Entities = 20000,
    Entity = 20001,
    Textures = 20002
};

/**
 * Chunk header: [type i32][size i32][version i32], followed by size payload bytes.
 */
struct ChunkHeader {
    static constexpr size_t ENCODED_SIZE = 12;
    
    ChunkType type = ChunkType::GLProject;
    int32_t size = 0;       // Payload byte length, not interpreted by the header decoder
    int32_t version = 0;
};

/**
 * Chunk of a recognized type that has no registered record decoder.
 * Carries a copy of its payload.
 */
struct RawChunk {
    ChunkHeader header;
    std::vector<uint8_t> payload;
};

// ============================================================================
// Material
// ============================================================================
constexpr size_t MATERIAL_SLOT_COUNT = 5;

struct BlendModes {
    int32_t source_mode = 0;
    int32_t destination_mode = 0;
};

struct AlphaTestMode {
    int32_t comparison_function = 0;
    float reference = 0.0f;
};

/**
 * Fixed material attribute block.
 * 
 * Field order and widths define the byte sequence the structural hash is
 * computed over (see serialize_attributes). Do not reorder.
 */
struct Attributes {
    uint32_t flags = 0;
    bool additive_lighting_model = false;
    Rgba colour{0.0f};
    Rgba specular{0.0f};
    float power = 0.0f;
    int32_t shading_mode = 0;
    bool depth_buffer_write = false;
    int32_t depth_buffer_comparison_mode = 0;
    bool blend = false;
    BlendModes blend_modes;
    bool alpha_test = false;
    AlphaTestMode alpha_test_mode;
    uint32_t owner = 0;
    uint32_t colour_buffer_write = 0;
    std::array<bool, MATERIAL_SLOT_COUNT> use_matrices{};
    std::array<int32_t, MATERIAL_SLOT_COUNT> generators{};
    std::array<uint32_t, MATERIAL_SLOT_COUNT> uv_sets{};
    std::array<uint32_t, MATERIAL_SLOT_COUNT> texture_hashes{};
    int32_t envmap_type = 0;
    float planar_sheer_envmap_distance = 0.0f;
};

/**
 * Texture bound to one material slot.
 */
struct MaterialTexture {
    uint32_t uv_set = 0;
    std::string name;
    int32_t format = 0;
    int32_t filter_mode = 0;    // Decoded for stream alignment; not used by consumers
    int32_t address_mode = 0;
    std::string mask_name;
    Rgba border_colour{0.0f};
    uint32_t hash = 0;
};

struct Material {
    uint32_t material_hash = 0;     // Stream-assigned identifier
    Attributes attributes;
    std::array<std::optional<MaterialTexture>, MATERIAL_SLOT_COUNT> textures;
    std::array<std::optional<Matrix>, MATERIAL_SLOT_COUNT> uv_transforms;
};

// ============================================================================
// Model part
// ============================================================================

/**
 * Sparse vertex. Which fields are present depends only on the owning
 * part's flags word; an absent field is std::nullopt, never a zero value.
 */
struct Vertex {
    std::optional<Vector3> position;
    std::optional<Vector3> normal;
    std::optional<uint32_t> reciprocal_homogeneous_w;
    std::optional<Rgba> diffuse;
    std::optional<float> weight;
    std::optional<std::pair<uint16_t, uint16_t>> indices;   // Bone index pair
    std::vector<Vector2> uvs;
};

struct ModelPart {
    uint32_t read_access_flags = 0;
    uint32_t vertex_read_flags = 0;
    uint32_t write_access_flags = 0;
    uint32_t vertex_write_flags = 0;
    uint32_t hint_flags = 0;
    uint32_t constant_flags = 0;
    uint32_t vertex_flags = 0;
    uint32_t render_flags = 0;
    uint16_t triangle_count = 0;
    uint16_t strip_count = 0;
    uint16_t strip_triangle_count = 0;
    uint32_t material_hash = 0;
    int32_t triangle_index0 = 0;
    int32_t triangle_index1 = 0;
    int32_t vertex_index0 = 0;
    int32_t vertex_index1 = 0;
    uint32_t layer_z = 0;
    uint32_t floor_flags = 0;
    uint32_t flags = 0;             // Vertex layout selector
    uint32_t lighting_id = 0;
    std::vector<Vertex> vertices;
};

// ============================================================================
// World
// ============================================================================
struct Floor {
    uint32_t occlusion_bsp = 0;
    BoundingBox ghost_camera;
};

struct World {
    uint32_t flags = 0;
    Rgba ambient{0.0f, 0.0f, 0.0f, 1.0f};
    std::vector<Floor> floors;
    int32_t zone_count = 0;
    bool have_occlusion_bsp = false;
    bool have_nulls = false;
    bool have_waypoints = false;
    bool have_mesh = false;
};

} // namespace levelpak
