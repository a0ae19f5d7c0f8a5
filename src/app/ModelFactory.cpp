#include "ModelFactory.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <deque>
#include <format>
#include <fstream>
#include <iterator>
#include <unordered_map>

#include "MjcfDocument.hpp"
#include "raymath.h"
#include "rfl/xml.hpp"
#include "spdlog/spdlog.h"

namespace motionlib::thumb {
    namespace {
        constexpr auto kMaxIncludeDepth = 8;
        constexpr auto kMainClass = "main";
        // Groups 0-2 are drawn by default; higher groups usually hold collision geometry
        constexpr auto kFirstHiddenGroup = 3;

        using OptionalText = std::optional<std::string>;

        struct CompilerSettings {
            std::optional<bool> degrees;
            std::optional<std::string> eulerseq;
            std::optional<std::string> meshdir;
            std::optional<std::string> assetdir;
        };

        struct DefaultClass {
            mjcf::Geom geom;
            mjcf::Joint joint;
            mjcf::Mesh mesh;
        };

        void Inherit(mjcf::Text& own, const mjcf::Text& parent) {
            if (!own().has_value()) {
                own() = parent();
            }
        }

        template<typename Element>
        bool HasOrientation(const Element& element) {
            return element.quat().has_value() || element.euler().has_value() || element.axisangle().has_value() ||
                   element.xyaxes().has_value() || element.zaxis().has_value();
        }

        void InheritGeom(mjcf::Geom& own, const mjcf::Geom& parent) {
            Inherit(own.type, parent.type);
            Inherit(own.size, parent.size);
            Inherit(own.pos, parent.pos);
            Inherit(own.fromto, parent.fromto);
            Inherit(own.rgba, parent.rgba);
            Inherit(own.mesh, parent.mesh);
            Inherit(own.material, parent.material);
            Inherit(own.group, parent.group);
            if (!HasOrientation(own)) {
                Inherit(own.quat, parent.quat);
                Inherit(own.euler, parent.euler);
                Inherit(own.axisangle, parent.axisangle);
                Inherit(own.xyaxes, parent.xyaxes);
                Inherit(own.zaxis, parent.zaxis);
            }
        }

        void InheritJoint(mjcf::Joint& own, const mjcf::Joint& parent) {
            Inherit(own.type, parent.type);
            Inherit(own.axis, parent.axis);
            Inherit(own.pos, parent.pos);
        }

        void InheritMesh(mjcf::Mesh& own, const mjcf::Mesh& parent) {
            Inherit(own.scale, parent.scale);
        }

        Expected<std::vector<float>> ParseFloats(const OptionalText& text, const std::string_view attribute) {
            std::vector<float> values;
            if (!text) {
                return values;
            }

            const char* it = text->data();
            const char* const end = text->data() + text->size();
            while (it != end) {
                if (std::isspace(static_cast<unsigned char>(*it)) || *it == ',') {
                    ++it;
                    continue;
                }
                float value = 0.0f;
                const auto [next, ec] = std::from_chars(it, end, value);
                if (ec != std::errc{}) {
                    return Fail(ErrorKind::RenderFailure,
                                std::format("invalid number list '{}' in attribute '{}'", *text, attribute));
                }
                values.push_back(value);
                it = next;
            }
            return values;
        }

        Expected<std::optional<Vector3>> ParseVector3(const OptionalText& text, const std::string_view attribute) {
            auto values = ParseFloats(text, attribute);
            if (!values) {
                return std::unexpected(values.error());
            }
            if (values->empty()) {
                return std::optional<Vector3>{};
            }
            if (values->size() != 3) {
                return Fail(ErrorKind::RenderFailure,
                            std::format("attribute '{}' needs 3 numbers, got {}", attribute, values->size()));
            }
            return std::optional<Vector3>{Vector3{(*values)[0], (*values)[1], (*values)[2]}};
        }

        Quaternion AlignZ(const Vector3 direction) {
            const Vector3 up{0.0f, 0.0f, 1.0f};
            const Vector3 target = Vector3Normalize(direction);
            if (Vector3DotProduct(up, target) < -0.9999f) {
                return QuaternionFromAxisAngle(Vector3{1.0f, 0.0f, 0.0f}, PI);
            }
            return QuaternionFromVector3ToVector3(up, target);
        }

        Color ParseColor(const std::vector<float>& rgba) {
            const auto channel = [&](const size_t i, const float fallback) {
                const auto value = i < rgba.size() ? rgba[i] : fallback;
                return static_cast<unsigned char>(std::lround(std::clamp(value, 0.0f, 1.0f) * 255.0f));
            };
            return Color{channel(0, 0.5f), channel(1, 0.5f), channel(2, 0.5f), channel(3, 1.0f)};
        }

        std::optional<GeomShape> ParseShape(const std::string_view type) {
            if (type == "plane") return GeomShape::Plane;
            if (type == "sphere") return GeomShape::Sphere;
            if (type == "capsule") return GeomShape::Capsule;
            if (type == "ellipsoid") return GeomShape::Ellipsoid;
            if (type == "cylinder") return GeomShape::Cylinder;
            if (type == "box") return GeomShape::Box;
            if (type == "mesh") return GeomShape::Mesh;
            return std::nullopt;
        }

        std::optional<JointType> ParseJointType(const std::string_view type) {
            if (type == "free") return JointType::Free;
            if (type == "ball") return JointType::Ball;
            if (type == "slide") return JointType::Slide;
            if (type == "hinge") return JointType::Hinge;
            return std::nullopt;
        }

        Expected<mjcf::Mujoco> ReadDocument(const std::string& xml) {
            try {
                auto result = rfl::xml::read<mjcf::Mujoco>(xml);
                if (!result) {
                    return Fail(ErrorKind::RenderFailure, std::format("malformed model document: {}", result.error().what()));
                }
                return std::move(*result);
            }
            catch (const std::exception& e) {
                return Fail(ErrorKind::RenderFailure, std::format("malformed model document: {}", e.what()));
            }
        }

        Expected<std::string> ReadText(const std::filesystem::path& path) {
            std::ifstream file(path, std::ios::binary);
            if (!file) {
                return Fail(ErrorKind::RenderFailure, std::format("cannot open model document {}", path.string()));
            }
            return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        }

        // Two passes over the document and its includes: compiler, defaults and assets
        // first, then the body tree, so sections may appear in any order.
        class DocumentBuilder {
        public:
            explicit DocumentBuilder(std::filesystem::path baseDirectory)
                : base_(std::move(baseDirectory)) {}

            Expected<KinematicModel> build(mjcf::Mujoco root) {
                model_.bodies.push_back(BodySpec{.name = "world", .parent = -1, .local = MatrixIdentity()});
                classes_[kMainClass] = DefaultClass{};

                documents_.push_back(std::move(root));
                const auto& document = documents_.back();
                model_.name = document.model().value_or("");

                if (auto gathered = gather_(document, 0); !gathered) {
                    return std::unexpected(gathered.error());
                }
                if (auto assets = addAssets_(); !assets) {
                    return std::unexpected(assets.error());
                }
                for (const auto* world : worlds_) {
                    if (auto added = addWorld_(*world); !added) {
                        return std::unexpected(added.error());
                    }
                }
                return std::move(model_);
            }

        private:
            [[nodiscard]] bool degrees_() const { return compiler_.degrees.value_or(true); }

            Expected<const mjcf::Mujoco*> loadInclude_(const mjcf::Include& include, const int depth) {
                if (depth >= kMaxIncludeDepth) {
                    return Fail(ErrorKind::RenderFailure, "model includes are nested too deeply");
                }
                const auto& file = include.file();
                if (!file || file->empty()) {
                    return Fail(ErrorKind::RenderFailure, "include element without a file attribute");
                }
                const auto path = base_ / *file;
                std::error_code ec;
                if (!std::filesystem::is_regular_file(path, ec)) {
                    return Fail(ErrorKind::RenderFailure, std::format("missing included document {}", path.string()));
                }
                auto text = ReadText(path);
                if (!text) {
                    return std::unexpected(text.error());
                }
                auto document = ReadDocument(*text);
                if (!document) {
                    return Fail(ErrorKind::RenderFailure, std::format("{} ({})", document.error().message, path.string()));
                }
                documents_.push_back(std::move(*document));
                return &documents_.back();
            }

            Expected<void> gather_(const mjcf::Mujoco& document, const int depth) {
                for (const auto& compiler : document.compiler.value_or(std::vector<mjcf::Compiler>{})) {
                    if (const auto& angle = compiler.angle(); angle && !compiler_.degrees) {
                        compiler_.degrees = *angle != "radian";
                    }
                    if (const auto& seq = compiler.eulerseq(); seq && !compiler_.eulerseq) {
                        compiler_.eulerseq = *seq;
                    }
                    if (const auto& dir = compiler.meshdir(); dir && !compiler_.meshdir) {
                        compiler_.meshdir = *dir;
                    }
                    if (const auto& dir = compiler.assetdir(); dir && !compiler_.assetdir) {
                        compiler_.assetdir = *dir;
                    }
                }
                if (const auto& defaults = document.defaults(); defaults) {
                    for (const auto& entry : *defaults) {
                        addDefault_(entry, nullptr);
                    }
                }
                if (document.asset) {
                    for (const auto& asset : *document.asset) {
                        assets_.push_back(&asset);
                    }
                }
                if (document.worldbody) {
                    for (const auto& world : *document.worldbody) {
                        worlds_.push_back(&world);
                    }
                }
                if (document.include) {
                    for (const auto& include : *document.include) {
                        auto included = loadInclude_(include, depth + 1);
                        if (!included) {
                            return std::unexpected(included.error());
                        }
                        if (auto gathered = gather_(**included, depth + 1); !gathered) {
                            return gathered;
                        }
                    }
                }
                return {};
            }

            // The top-level <default> is the main class; nested classes start from their parent
            void addDefault_(const mjcf::Default& entry, const std::string* parentKey) {
                std::string key = kMainClass;
                if (parentKey) {
                    const auto& name = entry.className()();
                    if (!name) {
                        spdlog::debug("Ignoring nested default class without a name");
                        return;
                    }
                    key = *name;
                }

                DefaultClass resolved = classes_[parentKey ? *parentKey : std::string(kMainClass)];
                if (entry.geom) {
                    auto geom = *entry.geom;
                    InheritGeom(geom, resolved.geom);
                    resolved.geom = std::move(geom);
                }
                if (entry.joint) {
                    auto joint = *entry.joint;
                    InheritJoint(joint, resolved.joint);
                    resolved.joint = std::move(joint);
                }
                if (entry.mesh) {
                    auto mesh = *entry.mesh;
                    InheritMesh(mesh, resolved.mesh);
                    resolved.mesh = std::move(mesh);
                }
                classes_[key] = std::move(resolved);

                if (const auto& children = entry.children(); children) {
                    for (const auto& child : *children) {
                        addDefault_(child, &key);
                    }
                }
            }

            const DefaultClass& classFor_(const OptionalText& explicitClass, const std::string& activeClass) {
                const auto& name = explicitClass ? *explicitClass : activeClass;
                if (const auto it = classes_.find(name); it != classes_.end()) {
                    return it->second;
                }
                spdlog::warn("Unknown default class '{}', using defaults", name);
                return classes_[kMainClass];
            }

            [[nodiscard]] std::filesystem::path meshDirectory_() const {
                if (compiler_.meshdir) return base_ / *compiler_.meshdir;
                if (compiler_.assetdir) return base_ / *compiler_.assetdir;
                return base_;
            }

            Expected<void> addAssets_() {
                const auto directory = meshDirectory_();
                for (const auto* asset : assets_) {
                    for (const auto& material : asset->material.value_or(std::vector<mjcf::Material>{})) {
                        if (const auto& name = material.name(); name) {
                            auto rgba = ParseFloats(material.rgba(), "rgba");
                            if (!rgba) {
                                return std::unexpected(rgba.error());
                            }
                            materials_[*name] = rgba->empty() ? WHITE : ParseColor(*rgba);
                        }
                    }
                    for (auto mesh : asset->mesh.value_or(std::vector<mjcf::Mesh>{})) {
                        InheritMesh(mesh, classFor_(mesh.className()(), kMainClass).mesh);
                        const auto& file = mesh.file();
                        if (!file || file->empty()) {
                            spdlog::debug("Skipping mesh asset without a file");
                            continue;
                        }
                        auto scale = ParseVector3(mesh.scale(), "scale");
                        if (!scale) {
                            return std::unexpected(scale.error());
                        }
                        const auto path = std::filesystem::path(*file);
                        model_.meshes.push_back(MeshAsset{
                            .name = mesh.name().value_or(path.stem().string()),
                            .file = path.is_absolute() ? path : directory / path,
                            .scale = scale->value_or(Vector3One())
                        });
                    }
                }
                return {};
            }

            template<typename Element>
            Expected<Quaternion> rotation_(const Element& element) const {
                const auto toRadians = [this](const float angle) { return degrees_() ? angle * DEG2RAD : angle; };

                if (element.quat()) {
                    auto q = ParseFloats(element.quat(), "quat");
                    if (!q) return std::unexpected(q.error());
                    if (q->size() != 4) return Fail(ErrorKind::RenderFailure, "attribute 'quat' needs 4 numbers");
                    return QuaternionNormalize(Quaternion{(*q)[1], (*q)[2], (*q)[3], (*q)[0]});
                }
                if (element.axisangle()) {
                    auto a = ParseFloats(element.axisangle(), "axisangle");
                    if (!a) return std::unexpected(a.error());
                    if (a->size() != 4) return Fail(ErrorKind::RenderFailure, "attribute 'axisangle' needs 4 numbers");
                    return QuaternionFromAxisAngle(Vector3Normalize(Vector3{(*a)[0], (*a)[1], (*a)[2]}), toRadians((*a)[3]));
                }
                if (element.euler()) {
                    auto e = ParseFloats(element.euler(), "euler");
                    if (!e) return std::unexpected(e.error());
                    if (e->size() != 3) return Fail(ErrorKind::RenderFailure, "attribute 'euler' needs 3 numbers");
                    const auto sequence = compiler_.eulerseq.value_or("xyz");
                    if (sequence.size() != 3) return Fail(ErrorKind::RenderFailure, "compiler eulerseq needs 3 axes");

                    // Lower-case axes rotate with the frame, upper-case axes are fixed
                    auto result = QuaternionIdentity();
                    for (size_t i = 0; i < 3; ++i) {
                        const auto axisName = sequence[i];
                        Vector3 axis{};
                        switch (std::tolower(static_cast<unsigned char>(axisName))) {
                            case 'x': axis = Vector3{1.0f, 0.0f, 0.0f}; break;
                            case 'y': axis = Vector3{0.0f, 1.0f, 0.0f}; break;
                            case 'z': axis = Vector3{0.0f, 0.0f, 1.0f}; break;
                            default: return Fail(ErrorKind::RenderFailure, std::format("invalid eulerseq '{}'", sequence));
                        }
                        const auto step = QuaternionFromAxisAngle(axis, toRadians((*e)[i]));
                        result = std::islower(static_cast<unsigned char>(axisName)) ? QuaternionMultiply(result, step)
                                                                                     : QuaternionMultiply(step, result);
                    }
                    return QuaternionNormalize(result);
                }
                if (element.xyaxes()) {
                    auto a = ParseFloats(element.xyaxes(), "xyaxes");
                    if (!a) return std::unexpected(a.error());
                    if (a->size() != 6) return Fail(ErrorKind::RenderFailure, "attribute 'xyaxes' needs 6 numbers");
                    const auto x = Vector3Normalize(Vector3{(*a)[0], (*a)[1], (*a)[2]});
                    auto y = Vector3{(*a)[3], (*a)[4], (*a)[5]};
                    y = Vector3Normalize(Vector3Subtract(y, Vector3Scale(x, Vector3DotProduct(x, y))));
                    const auto z = Vector3CrossProduct(x, y);

                    Matrix basis = MatrixIdentity();
                    basis.m0 = x.x; basis.m1 = x.y; basis.m2 = x.z;
                    basis.m4 = y.x; basis.m5 = y.y; basis.m6 = y.z;
                    basis.m8 = z.x; basis.m9 = z.y; basis.m10 = z.z;
                    return QuaternionNormalize(QuaternionFromMatrix(basis));
                }
                if (element.zaxis()) {
                    auto z = ParseVector3(element.zaxis(), "zaxis");
                    if (!z) return std::unexpected(z.error());
                    return AlignZ(**z);
                }
                return QuaternionIdentity();
            }

            template<typename Element>
            Expected<Matrix> frame_(const Element& element) const {
                auto pos = ParseVector3(element.pos(), "pos");
                if (!pos) return std::unexpected(pos.error());
                auto rotation = rotation_(element);
                if (!rotation) return std::unexpected(rotation.error());

                const auto offset = pos->value_or(Vector3Zero());
                return MatrixMultiply(QuaternionToMatrix(*rotation), MatrixTranslate(offset.x, offset.y, offset.z));
            }

            Expected<void> addWorld_(const mjcf::WorldBody& world) {
                for (const auto& geom : world.geom.value_or(std::vector<mjcf::Geom>{})) {
                    if (auto added = addGeom_(geom, 0, kMainClass); !added) return added;
                }
                for (const auto& camera : world.camera.value_or(std::vector<mjcf::Camera>{})) {
                    if (auto added = addCamera_(camera, 0); !added) return added;
                }
                for (const auto& body : world.body.value_or(std::vector<mjcf::Body>{})) {
                    if (auto added = addBody_(body, 0, kMainClass); !added) return added;
                }
                for (const auto& include : world.include.value_or(std::vector<mjcf::Include>{})) {
                    auto fragment = loadInclude_(include, 1);
                    if (!fragment) {
                        return std::unexpected(fragment.error());
                    }
                    mjcf::WorldBody content;
                    content.geom = (*fragment)->geom;
                    content.camera = (*fragment)->camera;
                    content.body = (*fragment)->body;
                    if (auto added = addWorld_(content); !added) return added;
                }
                return {};
            }

            Expected<void> addBody_(const mjcf::Body& element, const int parent, const std::string& parentClass) {
                auto local = frame_(element);
                if (!local) return std::unexpected(local.error());

                const auto index = static_cast<int>(model_.bodies.size());
                const auto activeClass = element.childclass().value_or(parentClass);
                model_.bodies.push_back(BodySpec{
                    .name = element.name().value_or(std::format("body{}", index)),
                    .parent = parent,
                    .local = *local
                });

                for (const auto& freeJoint : element.freejoint.value_or(std::vector<mjcf::FreeJoint>{})) {
                    addJoint_(index, JointSpec{.name = freeJoint.name().value_or(""), .type = JointType::Free});
                }
                for (auto joint : element.joint.value_or(std::vector<mjcf::Joint>{})) {
                    InheritJoint(joint, classFor_(joint.className()(), activeClass).joint);
                    const auto typeName = joint.type().value_or("hinge");
                    const auto type = ParseJointType(typeName);
                    if (!type) {
                        return Fail(ErrorKind::RenderFailure, std::format("unsupported joint type '{}'", typeName));
                    }
                    auto axis = ParseVector3(joint.axis(), "axis");
                    if (!axis) return std::unexpected(axis.error());
                    auto anchor = ParseVector3(joint.pos(), "pos");
                    if (!anchor) return std::unexpected(anchor.error());

                    addJoint_(index, JointSpec{
                        .name = joint.name().value_or(""),
                        .type = *type,
                        .axis = Vector3Normalize(axis->value_or(Vector3{0.0f, 0.0f, 1.0f})),
                        .anchor = anchor->value_or(Vector3Zero())
                    });
                }
                for (const auto& geom : element.geom.value_or(std::vector<mjcf::Geom>{})) {
                    if (auto added = addGeom_(geom, index, activeClass); !added) return added;
                }
                for (const auto& camera : element.camera.value_or(std::vector<mjcf::Camera>{})) {
                    if (auto added = addCamera_(camera, index); !added) return added;
                }
                for (const auto& child : element.body.value_or(std::vector<mjcf::Body>{})) {
                    if (auto added = addBody_(child, index, activeClass); !added) return added;
                }
                return {};
            }

            void addJoint_(const int bodyIndex, JointSpec joint) {
                auto& body = model_.bodies[bodyIndex];
                joint.qposAddress = model_.qpos0.size();

                switch (joint.type) {
                    case JointType::Free: {
                        const auto& m = body.local;
                        const auto q = QuaternionFromMatrix(m);
                        model_.qpos0.insert(model_.qpos0.end(), {m.m12, m.m13, m.m14, q.w, q.x, q.y, q.z});
                        break;
                    }
                    case JointType::Ball:
                        model_.qpos0.insert(model_.qpos0.end(), {1.0, 0.0, 0.0, 0.0});
                        break;
                    case JointType::Slide:
                    case JointType::Hinge:
                        model_.qpos0.push_back(0.0);
                        break;
                }
                body.joints.push_back(std::move(joint));
            }

            Expected<void> addGeom_(const mjcf::Geom& element, const int bodyIndex, const std::string& activeClass) {
                auto geom = element;
                InheritGeom(geom, classFor_(geom.className()(), activeClass).geom);

                if (const auto& group = geom.group(); group) {
                    int value = 0;
                    const auto [ptr, ec] = std::from_chars(group->data(), group->data() + group->size(), value);
                    if (ec == std::errc{} && value >= kFirstHiddenGroup) {
                        return {};
                    }
                }

                const auto typeName = geom.type().value_or(geom.mesh() ? "mesh" : "sphere");
                const auto shape = ParseShape(typeName);
                if (!shape) {
                    spdlog::debug("Skipping geom of unsupported type '{}'", typeName);
                    return {};
                }

                auto size = ParseFloats(geom.size(), "size");
                if (!size) return std::unexpected(size.error());
                size->resize(3, 0.0f);

                auto rgba = ParseFloats(geom.rgba(), "rgba");
                if (!rgba) return std::unexpected(rgba.error());

                GeomSpec spec{
                    .name = geom.name().value_or(""),
                    .shape = *shape,
                    .size = Vector3{(*size)[0], (*size)[1], (*size)[2]},
                    .mesh = geom.mesh().value_or("")
                };
                if (!rgba->empty()) {
                    spec.color = ParseColor(*rgba);
                }
                else if (const auto& material = geom.material(); material && materials_.contains(*material)) {
                    spec.color = materials_[*material];
                }
                if (spec.color.a == 0) {
                    return {};
                }

                auto fromto = ParseFloats(geom.fromto(), "fromto");
                if (!fromto) return std::unexpected(fromto.error());
                if (fromto->size() == 6 && *shape != GeomShape::Sphere && *shape != GeomShape::Plane &&
                    *shape != GeomShape::Mesh) {
                    const Vector3 from{(*fromto)[0], (*fromto)[1], (*fromto)[2]};
                    const Vector3 to{(*fromto)[3], (*fromto)[4], (*fromto)[5]};
                    const auto axis = Vector3Subtract(to, from);
                    const auto halfLength = Vector3Length(axis) * 0.5f;
                    const auto center = Vector3Scale(Vector3Add(from, to), 0.5f);
                    spec.local = MatrixMultiply(QuaternionToMatrix(halfLength > 0.0f ? AlignZ(axis) : QuaternionIdentity()),
                                                MatrixTranslate(center.x, center.y, center.z));
                    if (*shape == GeomShape::Capsule || *shape == GeomShape::Cylinder) {
                        spec.size.y = halfLength;
                    }
                    else {
                        spec.size.z = halfLength;
                    }
                }
                else {
                    auto local = frame_(geom);
                    if (!local) return std::unexpected(local.error());
                    spec.local = *local;
                }

                model_.bodies[bodyIndex].geoms.push_back(std::move(spec));
                return {};
            }

            Expected<void> addCamera_(const mjcf::Camera& element, const int bodyIndex) {
                auto local = frame_(element);
                if (!local) return std::unexpected(local.error());
                auto fovy = ParseFloats(element.fovy(), "fovy");
                if (!fovy) return std::unexpected(fovy.error());

                model_.bodies[bodyIndex].cameras.push_back(CameraSpec{
                    .name = element.name().value_or(""),
                    .local = *local,
                    .fovy = fovy->empty() ? 45.0f : fovy->front()
                });
                return {};
            }

            std::filesystem::path base_;
            KinematicModel model_;
            CompilerSettings compiler_;
            std::deque<mjcf::Mujoco> documents_;
            std::vector<const mjcf::Asset*> assets_;
            std::vector<const mjcf::WorldBody*> worlds_;
            std::unordered_map<std::string, DefaultClass> classes_;
            std::unordered_map<std::string, Color> materials_;
        };
    }

    std::optional<CameraRef> KinematicModel::findCamera(const std::string_view name) const {
        for (size_t b = 0; b < bodies.size(); ++b) {
            for (size_t c = 0; c < bodies[b].cameras.size(); ++c) {
                if (bodies[b].cameras[c].name == name) {
                    return CameraRef{.body = b, .camera = c};
                }
            }
        }
        return std::nullopt;
    }

    const MeshAsset* KinematicModel::findMesh(const std::string_view name) const {
        const auto it = std::ranges::find(meshes, name, &MeshAsset::name);
        return it == meshes.end() ? nullptr : &*it;
    }

    Expected<KinematicModel> ModelFactory::build(const std::filesystem::path& document) const {
        auto text = ReadText(document);
        if (!text) {
            return std::unexpected(text.error());
        }
        auto model = build(*text, document.parent_path());
        if (!model) {
            return Fail(model.error().kind, std::format("{}: {}", document.filename().string(), model.error().message));
        }
        spdlog::debug("Loaded model {} with {} bodies, {} meshes and {} pose coordinates",
                      document.filename().string(), model->bodies.size(), model->meshes.size(), model->qposSize());
        return model;
    }

    Expected<KinematicModel> ModelFactory::build(const std::string& xml, const std::filesystem::path& baseDirectory) const {
        auto document = ReadDocument(xml);
        if (!document) {
            return std::unexpected(document.error());
        }
        DocumentBuilder builder(baseDirectory);
        return builder.build(std::move(*document));
    }

    std::vector<Matrix> ComputeBodyTransforms(const KinematicModel& model, const std::span<const double> qpos) {
        const auto coordinate = [&](const size_t address) {
            return static_cast<float>(address < qpos.size() ? qpos[address] : model.qpos0[address]);
        };
        const auto quaternionAt = [&](const size_t address) {
            const Quaternion q{coordinate(address + 1), coordinate(address + 2), coordinate(address + 3), coordinate(address)};
            const auto length = std::sqrt(q.x * q.x + q.y * q.y + q.z * q.z + q.w * q.w);
            return length > 1e-6f ? QuaternionNormalize(q) : QuaternionIdentity();
        };
        const auto aboutAnchor = [](const Matrix& motion, const Vector3 anchor) {
            return MatrixMultiply(MatrixMultiply(MatrixTranslate(-anchor.x, -anchor.y, -anchor.z), motion),
                                  MatrixTranslate(anchor.x, anchor.y, anchor.z));
        };

        std::vector<Matrix> world(model.bodies.size(), MatrixIdentity());
        for (size_t i = 1; i < model.bodies.size(); ++i) {
            const auto& body = model.bodies[i];
            const auto parent = body.parent >= 0 ? world[body.parent] : MatrixIdentity();
            auto transform = MatrixMultiply(body.local, parent);

            // Each joint moves the frame produced by the previous ones
            for (const auto& joint : body.joints) {
                const auto address = joint.qposAddress;
                switch (joint.type) {
                    case JointType::Free:
                        transform = MatrixMultiply(
                            MatrixMultiply(QuaternionToMatrix(quaternionAt(address + 3)),
                                           MatrixTranslate(coordinate(address), coordinate(address + 1), coordinate(address + 2))),
                            parent);
                        break;
                    case JointType::Ball:
                        transform = MatrixMultiply(aboutAnchor(QuaternionToMatrix(quaternionAt(address)), joint.anchor), transform);
                        break;
                    case JointType::Slide: {
                        const auto offset = Vector3Scale(joint.axis, coordinate(address));
                        transform = MatrixMultiply(MatrixTranslate(offset.x, offset.y, offset.z), transform);
                        break;
                    }
                    case JointType::Hinge:
                        transform = MatrixMultiply(aboutAnchor(MatrixRotate(joint.axis, coordinate(address)), joint.anchor),
                                                   transform);
                        break;
                }
            }
            world[i] = transform;
        }
        return world;
    }
} // namespace motionlib::thumb
