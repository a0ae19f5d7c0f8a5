#include <args.hxx>
#include <array>
#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <rfl/cbor.hpp>
#include <rfl/json.hpp>

#include "../shared/AssetId.hpp"
#include "../shared/Error.hpp"
#include "../shared/entities.hpp"
#include "../shared/index.hpp"
#include "Settings.hpp"
#include "ThumbnailPipeline.hpp"
#include "ThumbnailRenderer.hpp"
#include "Utils.hpp"
#include "services/MotionLibrary.hpp"

#ifndef MOTIONLIB_VERSION
#define MOTIONLIB_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;
using namespace motionlib;

namespace {

constexpr auto kExitOk = 0;
constexpr auto kExitInvalid = 1;
constexpr auto kExitRenderFailures = 2;
constexpr auto kExitStorage = 3;

int ExitCodeFor(const ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::NotFound:
        case ErrorKind::InvalidInput:
        case ErrorKind::IdentifierCollision:
            return kExitInvalid;
        case ErrorKind::RenderFailure:
            return kExitRenderFailures;
        case ErrorKind::StorageFailure:
            return kExitStorage;
    }
    return kExitStorage;
}

int Report(spdlog::logger& logger, const Error& error)
{
    logger.error("{}: {}", ErrorKindName(error.kind), error.message);
    return ExitCodeFor(error.kind);
}

int Report(spdlog::logger& logger, const thumb::BatchReport& report)
{
    if (report.failed() > 0) {
        logger.warn("{} of {} thumbnails failed", report.failed(), report.total);
        return kExitRenderFailures;
    }
    return kExitOk;
}

Expected<AssetCategory> CategoryArgument(const std::string& name)
{
    if (const auto category = ParseCategory(name)) {
        return *category;
    }
    return Fail(ErrorKind::InvalidInput, std::format("unknown category '{}', expected trajectories or models", name));
}

// Accepts a path relative to the store root or any filesystem path that lies inside it
fs::path StoreRelative(const AssetStore& store, const std::string& argument)
{
    const fs::path path(argument);
    std::error_code ec;
    if (path.is_absolute() || fs::exists(path, ec)) {
        const auto relative = CanonicalRelativePath(fs::absolute(store.root(), ec), fs::absolute(path, ec));
        if (!relative.empty()) {
            return relative;
        }
    }
    return path;
}

void PrintSummary(const AssetSummary& asset)
{
    std::cout << asset.id << "  " << asset.relativePath << "  " << asset.sizeBytes << " bytes";
    if (asset.category) {
        std::cout << "  [" << SanitizeString(*asset.category) << "]";
    }
    std::cout << "\n";
}

int ExportIndex(const MotionLibrary& library, const fs::path& output, const bool cbor, spdlog::logger& logger)
{
    auto index = library.buildIndex();
    if (const auto sanitized = SanitizeStrings(index); sanitized > 0) {
        logger.warn("Replaced invalid UTF-8 in {} string(s)", sanitized);
    }

    std::error_code ec;
    if (output.has_parent_path()) {
        fs::create_directories(output.parent_path(), ec);
    }
    std::ofstream file(output, std::ios::binary);
    if (!file) {
        return Report(logger, Error{.kind = ErrorKind::StorageFailure,
                                    .message = std::format("failed to open {} for writing", output.string())});
    }
    if (cbor) {
        rfl::cbor::write(index, file);
    }
    else {
        rfl::json::write(index, file);
    }
    file.close();
    if (!file) {
        return Report(logger, Error{.kind = ErrorKind::StorageFailure,
                                    .message = std::format("failed to write {}", output.string())});
    }

    logger.info("Exported {} trajectories and {} models to {}", index.trajectories.size(), index.models.size(),
                output.string());
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[])
{
    try {
        auto logger = spdlog::stdout_color_mt("motionlib-cli");
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
        spdlog::set_level(spdlog::level::info);

        args::ArgumentParser parser("motionlib CLI", "Store motion trajectories and MJCF models and render their thumbnails.");
        parser.RequireCommand(false);

        args::Group commands(parser, "commands");
        args::Command listCommand(commands, "list", "List trajectories or models");
        args::Positional<std::string> listCategory(listCommand, "category", "trajectories or models", args::Options::Required);
        args::ValueFlag<std::string> tagFlag(listCommand, "tag", "Only assets in this category tag", {"category"});
        args::Flag jsonFlag(listCommand, "json", "Print JSON instead of text", {"json"});

        args::Command importCommand(commands, "import", "Copy a file into the library");
        args::Positional<std::string> importCategory(importCommand, "category", "trajectories or models", args::Options::Required);
        args::Positional<std::string> importFile(importCommand, "file", "File to import", args::Options::Required);
        args::ValueFlag<std::string> groupFlag(importCommand, "name", "Category tag or model directory", {"group"});

        args::Command deleteCommand(commands, "delete", "Delete an asset and its thumbnail");
        args::Positional<std::string> deleteCategory(deleteCommand, "category", "trajectories or models", args::Options::Required);
        args::Positional<std::string> deleteId(deleteCommand, "id", "Asset identifier", args::Options::Required);

        args::Command filesCommand(commands, "files", "List the files of a model bundle");
        args::Positional<std::string> filesId(filesCommand, "model-id", "Model identifier", args::Options::Required);

        args::Command resolveCommand(commands, "resolve-file", "Resolve a file inside a model bundle");
        args::Positional<std::string> resolveId(resolveCommand, "model-id", "Model identifier", args::Options::Required);
        args::Positional<std::string> resolvePath(resolveCommand, "sub-path", "Path inside the bundle", args::Options::Required);

        args::Command thumbnailCommand(commands, "thumbnail", "Show the cached thumbnail of an asset");
        args::Positional<std::string> thumbnailCategory(thumbnailCommand, "category", "trajectories or models", args::Options::Required);
        args::Positional<std::string> thumbnailId(thumbnailCommand, "id", "Asset identifier", args::Options::Required);

        args::Command renderModelCommand(commands, "render-model", "Render a model thumbnail");
        args::Command renderTrajectoryCommand(commands, "render-trajectory", "Render a trajectory animation or a folder of them");
        args::Command renderAllCommand(commands, "render-all", "Render every model and trajectory");

        args::Command exportCommand(commands, "export-index", "Write the library index");
        args::Positional<std::string> exportPath(exportCommand, "out", "Output file", args::Options::Required);
        args::Flag cborFlag(exportCommand, "cbor", "Write CBOR instead of JSON", {"cbor"});

        args::Group arguments(parser, "options", args::Group::Validators::DontCare, args::Options::Global);
        args::HelpFlag helpFlag(arguments, "help", "Show this help message", {'h', "help"});
        args::Flag versionFlag(arguments, "version", "Print version", {"version"});
        args::Flag verboseFlag(arguments, "verbose", "Log debug details", {'v', "verbose"});
        args::Flag quietFlag(arguments, "quiet", "Only log warnings and errors", {'q', "quiet"});
        args::ValueFlag<std::string> dataDirFlag(arguments, "path", "Data directory (default $MOTIONLIB_DATA_DIR or ./data)", {"data-dir"});
        args::ValueFlag<std::string> configFlag(arguments, "path", "Settings file (default motionlib.json)", {"config"});
        args::ValueFlag<uint32_t> sizeFlag(arguments, "pixels", "Thumbnail size, 160 or 320", {"size"});

        args::Group renderOptions(parser, "render options", args::Group::Validators::DontCare, args::Options::Global);
        args::ValueFlag<std::string> modelFlag(renderOptions, "path", "Model document, relative to the models root", {"model"});
        args::ValueFlag<std::string> modelIdFlag(renderOptions, "id", "Model identifier", {"model-id"});
        args::ValueFlag<std::string> trajectoryFlag(renderOptions, "path", "Trajectory file or folder, relative to the trajectories root", {"trajectory"});
        args::ValueFlag<std::string> trajectoryIdFlag(renderOptions, "id", "Trajectory identifier", {"trajectory-id"});
        args::ValueFlag<std::string> poseFieldFlag(renderOptions, "name", "Pose array inside .npz files", {"pose-field"});
        args::ValueFlag<std::string> cameraFlag(renderOptions, "name", "Named camera of the model", {"camera"});
        args::ValueFlag<float> distanceFlag(renderOptions, "units", "Orbit camera distance", {"distance"});
        args::ValueFlag<float> azimuthFlag(renderOptions, "degrees", "Orbit camera azimuth", {"azimuth"});
        args::ValueFlag<float> elevationFlag(renderOptions, "degrees", "Orbit camera elevation", {"elevation"});
        args::NargsValueFlag<float> lookatFlag(renderOptions, "x y z", "Orbit camera look-at point", {"lookat"}, 3);

        try {
            parser.ParseCLI(argc, argv);
        } catch (const args::Completion& e) {
            std::cout << e.what();
            return kExitOk;
        } catch (const args::Help&) {
            std::cout << parser.Help() << std::endl;
            return kExitOk;
        } catch (const args::ParseError& error) {
            std::cerr << error.what() << std::endl;
            std::cerr << parser.Help() << std::endl;
            return kExitInvalid;
        } catch (const args::ValidationError& error) {
            std::cerr << error.what() << std::endl;
            std::cerr << parser.Help() << std::endl;
            return kExitInvalid;
        }

        if (verboseFlag) {
            spdlog::set_level(spdlog::level::debug);
        }
        else if (quietFlag) {
            spdlog::set_level(spdlog::level::warn);
        }

        if (versionFlag) {
            std::cout << "motionlib " << MOTIONLIB_VERSION << std::endl;
            return kExitOk;
        }

        SettingsOverrides overrides;
        if (dataDirFlag) overrides.dataDir = fs::path(args::get(dataDirFlag));
        if (configFlag) overrides.settingsFile = fs::path(args::get(configFlag));
        if (sizeFlag) overrides.thumbnailSize = args::get(sizeFlag);
        if (poseFieldFlag) overrides.poseField = args::get(poseFieldFlag);
        if (cameraFlag) overrides.camera.cameraName = args::get(cameraFlag);
        if (distanceFlag) overrides.camera.distance = args::get(distanceFlag);
        if (azimuthFlag) overrides.camera.azimuth = args::get(azimuthFlag);
        if (elevationFlag) overrides.camera.elevation = args::get(elevationFlag);
        if (lookatFlag) {
            const auto& values = args::get(lookatFlag);
            overrides.camera.lookat = std::array{values[0], values[1], values[2]};
        }

        auto settings = ResolveSettings(overrides);
        if (!settings) {
            return Report(*logger, settings.error());
        }
        logger->debug("motionlib CLI {} using data directory {}", MOTIONLIB_VERSION,
                      settings->library.dataRoot.string());

        MotionLibrary library(settings->library);

        if (listCommand) {
            auto category = CategoryArgument(args::get(listCategory));
            if (!category) return Report(*logger, category.error());

            std::optional<std::string> tag;
            if (tagFlag) tag = args::get(tagFlag);
            auto assets = library.store(*category).list(tag);
            if (jsonFlag) {
                for (auto& asset : assets) {
                    asset.name = SanitizeString(asset.name);
                    asset.relativePath = SanitizeString(asset.relativePath);
                    if (asset.category) asset.category = SanitizeString(*asset.category);
                }
                std::cout << rfl::json::write(assets) << std::endl;
            }
            else {
                for (const auto& asset : assets) {
                    PrintSummary(asset);
                }
                logger->info("{} {}", assets.size(), CategoryName(*category));
            }
            return kExitOk;
        }

        if (importCommand) {
            auto category = CategoryArgument(args::get(importCategory));
            if (!category) return Report(*logger, category.error());
            if (auto layout = library.ensureLayout(); !layout) return Report(*logger, layout.error());

            const fs::path source(args::get(importFile));
            auto bytes = ReadFileBytes(source);
            if (!bytes) {
                return Report(*logger, Error{.kind = ErrorKind::InvalidInput, .message = bytes.error().message});
            }
            SaveOptions options;
            if (groupFlag) options.group = args::get(groupFlag);

            auto saved = library.store(*category).save(source.filename().string(), *bytes, options);
            if (!saved) return Report(*logger, saved.error());
            PrintSummary(*saved);
            return kExitOk;
        }

        if (deleteCommand) {
            auto category = CategoryArgument(args::get(deleteCategory));
            if (!category) return Report(*logger, category.error());

            const auto& id = args::get(deleteId);
            auto removed = library.store(*category).remove(id);
            if (!removed) return Report(*logger, removed.error());
            if (!*removed) {
                return Report(*logger, Error{.kind = ErrorKind::NotFound,
                                             .message = std::format("{} {} not found", CategoryName(*category), id)});
            }
            logger->info("Deleted {} {}", CategoryName(*category), id);
            return kExitOk;
        }

        if (filesCommand) {
            const auto& id = args::get(filesId);
            const auto files = library.models().listDirectoryFiles(id);
            if (!files) {
                return Report(*logger, Error{.kind = ErrorKind::NotFound, .message = std::format("model {} not found", id)});
            }
            for (const auto& file : *files) {
                std::cout << SanitizeString(file) << "\n";
            }
            return kExitOk;
        }

        if (resolveCommand) {
            auto file = library.models().resolveDirectoryFile(args::get(resolveId), args::get(resolvePath));
            if (!file) return Report(*logger, file.error());
            std::cout << file->string() << "  " << ContentTypeFor(*file) << std::endl;
            return kExitOk;
        }

        if (thumbnailCommand) {
            auto category = CategoryArgument(args::get(thumbnailCategory));
            if (!category) return Report(*logger, category.error());

            const auto& id = args::get(thumbnailId);
            const auto thumbnail = library.thumbnails().Get(*category, id);
            if (!thumbnail) {
                return Report(*logger, Error{.kind = ErrorKind::NotFound,
                                             .message = std::format("no thumbnail for {} {}", CategoryName(*category), id)});
            }
            const auto format = ThumbnailFormatFromPath(*thumbnail);
            std::cout << thumbnail->string() << "  "
                      << (format ? ThumbnailMediaType(*format) : std::string_view{"application/octet-stream"}) << std::endl;
            return kExitOk;
        }

        if (exportCommand) {
            return ExportIndex(library, fs::path(args::get(exportPath)), args::get(cborFlag), *logger);
        }

        if (renderModelCommand || renderTrajectoryCommand || renderAllCommand) {
            if (auto layout = library.ensureLayout(); !layout) return Report(*logger, layout.error());

            thumb::ThumbnailRenderer renderer;
            thumb::ThumbnailPipeline pipeline(library, renderer, settings->render);
            const auto& camera = settings->camera;
            logger->info("Rendering {}x{} thumbnails into {}", settings->render.thumbnailSize,
                         settings->render.thumbnailSize, settings->library.thumbnailsRoot.string());

            if (renderModelCommand) {
                Expected<fs::path> result = Fail(ErrorKind::InvalidInput, "render-model needs --model or --model-id");
                if (modelIdFlag) {
                    result = pipeline.renderModelById(args::get(modelIdFlag), camera);
                }
                else if (modelFlag) {
                    result = pipeline.renderModel(StoreRelative(library.models(), args::get(modelFlag)), camera);
                }
                if (!result) return Report(*logger, result.error());
                std::cout << result->string() << std::endl;
                return kExitOk;
            }

            if (renderTrajectoryCommand) {
                if (!modelFlag) {
                    return Report(*logger, Error{.kind = ErrorKind::InvalidInput,
                                                 .message = "render-trajectory needs --model"});
                }
                const auto model = StoreRelative(library.models(), args::get(modelFlag));

                if (trajectoryIdFlag) {
                    auto result = pipeline.renderTrajectoryById(args::get(trajectoryIdFlag), model, camera);
                    if (!result) return Report(*logger, result.error());
                    std::cout << result->string() << std::endl;
                    return kExitOk;
                }
                if (!trajectoryFlag) {
                    return Report(*logger, Error{.kind = ErrorKind::InvalidInput,
                                                 .message = "render-trajectory needs --trajectory or --trajectory-id"});
                }

                const auto trajectory = StoreRelative(library.trajectories(), args::get(trajectoryFlag));
                std::error_code ec;
                if (fs::is_directory(library.trajectories().root() / trajectory, ec)) {
                    return Report(*logger, pipeline.renderTrajectoryFolder(trajectory, model, camera));
                }
                auto result = pipeline.renderTrajectory(trajectory, model, camera);
                if (!result) return Report(*logger, result.error());
                std::cout << result->string() << std::endl;
                return kExitOk;
            }

            auto report = pipeline.renderAllModels(camera);
            std::optional<fs::path> model;
            if (modelFlag) model = StoreRelative(library.models(), args::get(modelFlag));
            auto trajectories = pipeline.renderAllTrajectories(model, camera);
            if (trajectories) {
                report += *trajectories;
            }
            else if (!library.trajectories().list().empty()) {
                return Report(*logger, trajectories.error());
            }
            logger->info("Rendered {}/{} thumbnails", report.succeeded, report.total);
            return Report(*logger, report);
        }

        std::cout << parser.Help() << std::endl;
        return kExitOk;
    } catch (const std::exception& error) {
        std::cerr << "Fatal error: " << error.what() << std::endl;
        return kExitStorage;
    }
}
