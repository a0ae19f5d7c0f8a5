#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rfl/Attribute.hpp"
#include "rfl/Rename.hpp"

// Subset of the MJCF schema needed to pose and draw a model. Every attribute is kept as
// text and parsed by ModelFactory; elements and attributes not listed here are ignored.
namespace motionlib::thumb::mjcf {
    using Text = rfl::Attribute<std::optional<std::string>>;

    struct Compiler {
        Text angle;
        Text meshdir;
        Text assetdir;
        Text eulerseq;
    };

    struct Mesh {
        Text name;
        rfl::Rename<"class", Text> className;
        Text file;
        Text scale;
    };

    struct Material {
        Text name;
        rfl::Rename<"class", Text> className;
        Text rgba;
    };

    struct Asset {
        std::optional<std::vector<Mesh>> mesh;
        std::optional<std::vector<Material>> material;
    };

    struct Geom {
        Text name;
        rfl::Rename<"class", Text> className;
        Text type;
        Text size;
        Text pos;
        Text quat;
        Text euler;
        Text axisangle;
        Text xyaxes;
        Text zaxis;
        Text fromto;
        Text rgba;
        Text mesh;
        Text material;
        Text group;
    };

    struct Joint {
        Text name;
        rfl::Rename<"class", Text> className;
        Text type;
        Text axis;
        Text pos;
    };

    struct FreeJoint {
        Text name;
    };

    struct Camera {
        Text name;
        rfl::Rename<"class", Text> className;
        Text pos;
        Text quat;
        Text euler;
        Text axisangle;
        Text xyaxes;
        Text zaxis;
        Text fovy;
    };

    struct Include {
        Text file;
    };

    struct Body {
        Text name;
        Text childclass;
        Text pos;
        Text quat;
        Text euler;
        Text axisangle;
        Text xyaxes;
        Text zaxis;
        std::optional<std::vector<Joint>> joint;
        std::optional<std::vector<FreeJoint>> freejoint;
        std::optional<std::vector<Geom>> geom;
        std::optional<std::vector<Camera>> camera;
        std::optional<std::vector<Body>> body;
    };

    struct Default {
        rfl::Rename<"class", Text> className;
        std::optional<Geom> geom;
        std::optional<Joint> joint;
        std::optional<Mesh> mesh;
        rfl::Rename<"default", std::optional<std::vector<Default>>> children;
    };

    struct WorldBody {
        std::optional<std::vector<Geom>> geom;
        std::optional<std::vector<Camera>> camera;
        std::optional<std::vector<Body>> body;
        std::optional<std::vector<Include>> include;
    };

    // Root <mujoco> element. Included fragments share the root element, so the body, geom
    // and camera lists also collect elements of a fragment included inside <worldbody>.
    struct Mujoco {
        Text model;
        std::optional<std::vector<Compiler>> compiler;
        std::optional<std::vector<Include>> include;
        std::optional<std::vector<Asset>> asset;
        rfl::Rename<"default", std::optional<std::vector<Default>>> defaults;
        std::optional<std::vector<WorldBody>> worldbody;
        std::optional<std::vector<Geom>> geom;
        std::optional<std::vector<Camera>> camera;
        std::optional<std::vector<Body>> body;
    };
} // namespace motionlib::thumb::mjcf
