#include "wheelsmith/wheel_builder.hpp"
#include "wheelsmith/collector.hpp"
#include "wheelsmith/dist_info.hpp"
#include "wheelsmith/metadata.hpp"
#include "wheelsmith/naming.hpp"
#include "wheelsmith/native_build.hpp"
#include "wheelsmith/platform.hpp"
#include "wheelsmith/zip_writer.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

#ifndef WHEELSMITH_VERSION
#define WHEELSMITH_VERSION "unknown"
#endif

namespace wheelsmith {

namespace fs = std::filesystem;

namespace {

WriteResult write_contents(ZipWriter& writer, const std::vector<FileEntry>& entries,
                           const ProjectConfig& project, const Tag& tag,
                           const std::string& metadata, const std::string& generator) {
    auto opened = writer.open();
    if (!opened.ok) return opened;

    for (const auto& entry : entries) {
        auto r = writer.write_file(entry);
        if (!r.ok) return r;
    }
    return write_dist_info(writer, project, tag, metadata, generator);
}

// 0644/0755 on the archive itself, independent of the process umask
WriteResult normalize_archive_permissions(const std::string& path) {
    WriteResult result;
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (!ec) {
        uint32_t mode = normalize_mode(static_cast<uint32_t>(status.permissions()));
        fs::permissions(path, static_cast<fs::perms>(mode), fs::perm_options::replace, ec);
    }
    if (ec) {
        result.kind = BuildError::ArchiveWriteFailure;
        result.error = "failed to set permissions on " + path + ": " + ec.message();
        return result;
    }
    result.ok = true;
    return result;
}

} // namespace

std::string default_generator() {
    return std::string("wheelsmith ") + WHEELSMITH_VERSION;
}

WheelBuilder::WheelBuilder(ProjectConfig project, WheelBuildOptions options)
    : project_(std::move(project)), options_(std::move(options)) {}

WheelBuildResult WheelBuilder::fail(WheelBuildResult& result, BuildError kind,
                                    const std::string& error) {
    result.ok = false;
    result.kind = kind;
    result.error = error;
    result.failed_state = state_;
    state_ = BuildState::Failed;
    spdlog::debug(" - Build failed while {}: {}", build_state_to_string(result.failed_state), error);
    return result;
}

WheelBuildResult WheelBuilder::build() {
    InterpreterTagProbe probe(options_.python);
    return build(probe);
}

WheelBuildResult WheelBuilder::build(HostTagProbe& probe) {
    WheelBuildResult result;
    state_ = BuildState::Init;

    spdlog::info(" - Building wheel");

    auto tag = resolve_tag(project_.requires_native_build(), project_.python, probe);
    if (!tag.ok) {
        return fail(result, tag.kind, tag.error);
    }
    result.tag = tag.tag;
    result.wheel_filename = wheel_filename(project_.name, project_.version, tag.tag.str());

    // Collecting
    state_ = BuildState::Collecting;
    auto collected = collect_files(project_);
    if (!collected.ok) {
        return fail(result, collected.kind, collected.error);
    }
    std::vector<FileEntry> entries = std::move(collected.entries);

    // Building
    if (project_.requires_native_build()) {
        state_ = BuildState::Building;

        NativeBuildOptions build_options;
        build_options.python = options_.python;
        build_options.timeout_seconds = options_.build_timeout_seconds;

        auto built = invoke_native_build(project_, entries, build_options);
        if (!built.ok) {
            return fail(result, built.kind, built.error);
        }
        merge_entries(entries, built.entries);
    }

    // Writing
    state_ = BuildState::Writing;

    std::string target_dir = options_.target_dir.empty()
        ? join_path(project_.root, "dist")
        : options_.target_dir;
    if (!create_directories(target_dir)) {
        return fail(result, BuildError::ArchiveWriteFailure,
                    "failed to create target directory: " + target_dir);
    }

    std::string final_path = join_path(target_dir, result.wheel_filename);
    std::string temp_path = make_temp_path(final_path);
    std::string generator = options_.generator.empty() ? default_generator() : options_.generator;
    std::string metadata = options_.metadata ? *options_.metadata : render_metadata(project_);
    std::string record_path = dist_info_name(project_.name, project_.version) + "/RECORD";

    RecordBuilder record;
    WriteResult written;
    {
        ZipWriter writer(temp_path, record);
        written = write_contents(writer, entries, project_, tag.tag, metadata, generator);

        // Finalizing
        if (written.ok) {
            state_ = BuildState::Finalizing;
            written = writer.write_record(record_path);
        }
        if (written.ok) {
            written = writer.close();
        }
    }
    if (written.ok) {
        written = normalize_archive_permissions(temp_path);
    }
    if (!written.ok) {
        if (path_exists(temp_path) && !remove_file(temp_path)) {
            spdlog::warn(" - Could not remove temporary file {}", temp_path);
        }
        return fail(result, written.kind, written.error);
    }

    auto moved = atomic_replace_file(temp_path, final_path);
    if (!moved.ok) {
        return fail(result, BuildError::ArchiveWriteFailure, moved.error);
    }

    state_ = BuildState::Done;
    result.ok = true;
    result.wheel_path = final_path;
    result.records = record.entries();

    spdlog::info(" - Built {}", result.wheel_filename);
    return result;
}

} // namespace wheelsmith
