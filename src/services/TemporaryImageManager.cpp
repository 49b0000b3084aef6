#include "services/TemporaryImageManager.hpp"

#include "services/ToolOutputParser.hpp"
#include "util/Logger.hpp"

#include <format>
#include <iostream>

namespace fs = std::filesystem;

namespace {

constexpr auto COMPONENT = "TemporaryImageManager";

auto ensure_directory(const fs::path& dir) -> std::expected<void, util::Error> {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(util::Error{
            util::ErrorKind::IO_FAILURE,
            std::format("Cannot create {}: {}", dir.string(), ec.message()), ec.value()});
    }
    return {};
}

auto exit_failure(std::string_view step, int exit_code) -> std::unexpected<util::Error> {
    return std::unexpected(util::Error{util::ErrorKind::PROCESS_EXIT_FAILURE,
                                       std::format("{} exited with {}", step, exit_code),
                                       exit_code});
}

}  // namespace

TemporaryImageManager::TemporaryImageManager(IProcessRunner& runner, DetachSupervisor& supervisor,
                                             const ToolCommands& tools)
    : runner_(runner), supervisor_(supervisor), tools_(tools) {}

auto TemporaryImageManager::create_and_attach(uint64_t sectors, const std::string& image_name,
                                              const fs::path& working_dir, Report& report)
    -> std::expected<TemporaryImage, util::Error> {
    const auto output_directory = working_dir / image_name;
    if (auto created = ensure_directory(output_directory); !created) {
        LOG_ERROR(COMPONENT, created.error().message);
        return std::unexpected(created.error());
    }

    TemporaryImage image{.image_path = output_directory / (image_name + ".sparseimage"),
                         .volume = {}};

    auto create = runner_.run_streamed({tools_.image_tool, "create", "-sectors",
                                        std::to_string(sectors), "-volname", image_name,
                                        image.image_path.string()},
                                       true, std::nullopt);
    if (!create) {
        return std::unexpected(create.error());
    }
    if (!create->succeeded()) {
        LOG_ERROR(COMPONENT, std::format("Creating {} failed", image.image_path.string()));
        return exit_failure("Image creation", create->exit_code);
    }

    auto attach =
        runner_.run_streamed({tools_.image_tool, "attach", image.image_path.string()}, true,
                             std::nullopt);
    if (!attach) {
        return std::unexpected(attach.error());
    }
    if (!attach->succeeded()) {
        LOG_ERROR(COMPONENT, std::format("Attaching {} failed", image.image_path.string()));
        return exit_failure("Image attach", attach->exit_code);
    }

    auto volume = tool_output::parse_attach_identifier(attach->output);
    if (!volume) {
        LOG_ERROR(COMPONENT, volume.error().message);
        return std::unexpected(volume.error());
    }
    image.volume = std::move(*volume);

    report.add_output_file(image.image_path);
    LOG_INFO(COMPONENT, std::format("{} attached as {}", image.image_path.string(), image.volume));
    return image;
}

auto TemporaryImageManager::convert(const fs::path& image_path, const std::string& image_name,
                                    const fs::path& destination_dir, Report& report)
    -> std::expected<fs::path, util::Error> {
    const auto output_directory = destination_dir / image_name;
    if (auto created = ensure_directory(output_directory); !created) {
        LOG_ERROR(COMPONENT, created.error().message);
        return std::unexpected(created.error());
    }
    const auto output_path = output_directory / (image_name + ".dmg");

    std::cout << "\nConverting " << image_path.string() << " -> " << output_path.string()
              << std::endl;

    auto result = runner_.run_streamed({tools_.image_tool, "convert", image_path.string(),
                                        "-format", tools_.compressed_format, "-o",
                                        output_path.string()},
                                       true, std::nullopt);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!result->succeeded()) {
        LOG_ERROR(COMPONENT, std::format("Converting {} failed", image_path.string()));
        return exit_failure("Image conversion", result->exit_code);
    }

    report.add_output_file(output_path);
    return output_path;
}

auto TemporaryImageManager::detach(const TemporaryImage& image, const DetachPolicy& policy)
    -> bool {
    return supervisor_.detach(image.volume, policy);
}
