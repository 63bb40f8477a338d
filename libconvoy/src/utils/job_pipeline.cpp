#include "../../include/job_pipeline.hpp"
#include "../../include/archive_stager.hpp"
#include "../../include/container_format.hpp"
#include "../../include/conversion_registry.hpp"
#include "../../include/disc_descriptor.hpp"
#include "../../include/engine_config.hpp"
#include "../../include/job_context.hpp"
#include "../../include/logger.hpp"
#include "../../include/output_placement.hpp"
#include "../../include/source_disposal.hpp"
#include "../../include/workspace.hpp"

#include <algorithm>

namespace convoy {

    namespace fs = std::filesystem;

    namespace {

        std::string job_tag(const JobContext& ctx) {
            return "job " + std::to_string(ctx.job_id());
        }

        // dependency paths that stay inside the descriptor folder once copied
        bool stays_below(const fs::path& dep) {
            return !dep.empty() && dep.is_relative() && *dep.begin() != "..";
        }

        StageResult check_dependencies(const fs::path& descriptor) {
            const auto deps = descriptor_dependencies(descriptor);
            if (!deps) {
                return StageResult::failure(JobError::Staging,
                                            "Cannot read descriptor \"" + descriptor.filename().string() + "\"");
            }
            std::error_code ec;
            for (const auto& dep : *deps) {
                const fs::path full = dep.is_absolute() ? dep : descriptor.parent_path() / dep;
                if (!fs::is_regular_file(full, ec)) {
                    return StageResult::failure(JobError::Staging,
                                                "Referenced file not found: \"" + dep.string() + "\"");
                }
            }
            return StageResult::success();
        }

        std::string join_exts(const std::vector<std::string>& exts) {
            std::string out;
            for (const auto& e : exts) {
                if (!out.empty()) out += ", ";
                out += e;
            }
            return out;
        }

    } // namespace

    bool JobPipeline::run(JobContext& ctx) const {
        const std::string tag = job_tag(ctx);
        ctx.started();
        Logger::log(LogLevel::Info, "Processing " + ctx.job().input_path.string() +
                    " with " + ctx.job().routine_id, tag);

        std::optional<Workspace> workspace;
        const auto fail = [&](const StageResult& r) {
            ctx.error("ERROR: " + r.message);
            Logger::log(LogLevel::Error, r.message, tag);
            if (workspace) workspace->cleanup();
            ctx.completed(false, r.error, r.message);
            return false;
        };

        // Preparing
        Prepared prepared;
        if (auto r = prepare(ctx, prepared, workspace); !r.ok()) return fail(r);

        // Staging
        fs::path staged_input;
        if (auto r = stage(ctx, *workspace, staged_input); !r.ok()) return fail(r);
        ctx.report_stage("Staged");

        // Converting
        if (auto r = convert(ctx, prepared, *workspace, staged_input); !r.ok()) return fail(r);
        ctx.report_stage("Converted");

        // Finalizing
        if (auto r = finalize(ctx, prepared, *workspace); !r.ok()) return fail(r);
        ctx.report_stage("Finalized");

        // Cleanup
        if (!workspace->cleanup()) {
            ctx.error("WARNING: temporary directory \"" + workspace->root().string() + "\" could not be removed.");
        }

        if (ctx.settings().delete_source_on_success &&
            prepared.routine->output_layout() != OutputLayout::Nothing) {
            dispose_sources(ctx);
        }

        std::string message = "Completed " + std::string(prepared.routine->description());
        if (!ctx.target_ext().empty()) message += " to ." + ctx.target_ext();
        Logger::log(LogLevel::Info, message, tag);
        ctx.completed(true, JobError::None, message);
        return true;
    }

    StageResult JobPipeline::prepare(JobContext& ctx, Prepared& prepared, std::optional<Workspace>& workspace) const {
        const auto& job = ctx.job();

        if (!job.settings_error.empty()) {
            return StageResult::failure(JobError::Setup, "Invalid settings: " + job.settings_error);
        }
        try {
            ctx.set_settings(EngineConfig::from_snapshot(job.settings));
        } catch (const SettingsError& e) {
            return StageResult::failure(JobError::Setup, std::string("Invalid settings: ") + e.what());
        }

        prepared.routine = registry_.find(job.routine_id);
        if (!prepared.routine) {
            return StageResult::failure(JobError::Setup, "Unknown conversion routine '" + job.routine_id + "'");
        }
        if (prepared.routine->output_layout() == OutputLayout::NamedFiles && job.primary_output_ext.empty()) {
            return StageResult::failure(JobError::Setup,
                                        "Routine '" + job.routine_id + "' needs a primary output extension");
        }

        prepared.base_name = job.input_path.stem().string();
        prepared.destination_dir = job.output_dir.empty() ? job.input_path.parent_path() : job.output_dir;
        if (prepared.destination_dir.empty()) prepared.destination_dir = ".";

        std::error_code ec;
        if (prepared.routine->output_layout() != OutputLayout::Nothing) {
            fs::create_directories(prepared.destination_dir, ec);
            if (ec) {
                return StageResult::failure(JobError::Setup, "Cannot create output directory \"" +
                                            prepared.destination_dir.string() + "\": " + ec.message());
            }
        }

        const fs::path base = Workspace::base_dir_for(ctx.settings(), job.input_path);
        workspace = Workspace::create(base, job.input_path, ec);
        if (!workspace) {
            return StageResult::failure(JobError::Setup, "Cannot create temporary directory in \"" +
                                        base.string() + "\": " + ec.message());
        }
        Logger::log(LogLevel::Debug, "Workspace: " + workspace->root().string(), job_tag(ctx));
        return StageResult::success();
    }

    StageResult JobPipeline::stage(JobContext& ctx, const Workspace& workspace, fs::path& staged_input) {
        const auto& job = ctx.job();
        const fs::path& input = job.input_path;
        std::error_code ec;

        if (!fs::exists(input, ec)) {
            return StageResult::failure(JobError::Staging, "Input not found: \"" + input.string() + "\"");
        }

        // dependencies relative to the descriptor folder
        std::vector<fs::path> deps;
        if (job.multi_file_input) {
            if (auto r = check_dependencies(input); !r.ok()) return r;
            const fs::path dir = input.parent_path();
            for (const auto& dep : descriptor_dependencies(input).value_or(std::vector<fs::path>{})) {
                deps.push_back(dir.empty() ? dep : dep.lexically_relative(dir));
            }
        }

        staged_input = input;
        if (ctx.settings().copy_locally) {
            if (!std::all_of(deps.begin(), deps.end(), stays_below)) {
                ctx.error("WARNING: \"" + input.filename().string() +
                          "\" references files outside its folder, processing in place.");
            } else {
                const fs::path target = workspace.staging_dir() / input.filename();
                ctx.output(">> Copying \"" + input.filename().string() + "\" to local temp...");
                if (fs::is_directory(input, ec)) {
                    fs::copy(input, target, fs::copy_options::recursive, ec);
                } else {
                    fs::copy_file(input, target, ec);
                }
                if (ec) {
                    return StageResult::failure(JobError::Staging, "Failed to copy \"" + input.string() +
                                                "\" to temp: " + ec.message());
                }
                for (const auto& dep : deps) {
                    const fs::path dest = workspace.staging_dir() / dep;
                    fs::create_directories(dest.parent_path(), ec);
                    if (!ec) fs::copy_file(input.parent_path() / dep, dest, fs::copy_options::overwrite_existing, ec);
                    if (ec) {
                        return StageResult::failure(JobError::Staging, "Failed to copy dependency \"" +
                                                    dep.string() + "\": " + ec.message());
                    }
                }
                staged_input = target;
            }
        }

        if (!job.archive_media_exts.empty() && fs::is_regular_file(staged_input, ec) &&
            detect_container_format(staged_input) != ContainerFormat::Unknown) {
            const fs::path unpacked = workspace.staging_dir() / "unpacked";
            ctx.output(">> Extracting archive \"" + staged_input.filename().string() + "\"...");
            if (!ctx.archive_stager().extract(staged_input, unpacked)) {
                return StageResult::failure(JobError::Staging, "Failed to extract archive \"" +
                                            staged_input.filename().string() + "\"");
            }
            const auto media = find_media_file(unpacked, job.archive_media_exts);
            if (!media) {
                return StageResult::failure(JobError::Staging, "No supported file (" +
                                            join_exts(job.archive_media_exts) + ") found in archive \"" +
                                            staged_input.filename().string() + "\"");
            }
            if (is_disc_descriptor(*media)) {
                if (auto r = check_dependencies(*media); !r.ok()) return r;
            }
            ctx.output(">> Using \"" + media->filename().string() + "\" from archive.");
            staged_input = *media;
        }

        Logger::log(LogLevel::Debug, "Staged input: " + staged_input.string(), job_tag(ctx));
        return StageResult::success();
    }

    StageResult JobPipeline::convert(JobContext& ctx, const Prepared& prepared, const Workspace& workspace,
                                     const fs::path& staged_input) {
        if (!prepared.routine->convert(staged_input, workspace.output_dir(), prepared.base_name, ctx)) {
            return StageResult::failure(JobError::Conversion, "Conversion failed for \"" +
                                        ctx.job().input_path.filename().string() + "\"");
        }
        return StageResult::success();
    }

    StageResult JobPipeline::finalize(JobContext& ctx, const Prepared& prepared, const Workspace& workspace) {
        const auto& job = ctx.job();
        const std::string tag = job_tag(ctx);
        std::error_code ec;

        switch (prepared.routine->output_layout()) {
            case OutputLayout::Nothing:
                return StageResult::success();

            case OutputLayout::Folder: {
                const auto placed = place_output(workspace.output_dir(), prepared.destination_dir / prepared.base_name,
                                                 job.overwrite_allowed);
                if (!placed.ok) return StageResult::failure(JobError::Finalize, placed.error);
                ctx.output(">> Extracted to \"" + placed.destination.string() + "\"");
                return StageResult::success();
            }

            case OutputLayout::NamedFiles:
                break;
        }

        const fs::path primary = workspace.output_dir() / (prepared.base_name + "." + job.primary_output_ext);
        const auto size = fs::file_size(primary, ec);
        if (ec || size == 0) {
            return StageResult::failure(JobError::Conversion, "Output file \"" + primary.filename().string() +
                                        "\" is missing or empty");
        }

        const auto placed = place_output(primary, prepared.destination_dir / primary.filename(), job.overwrite_allowed);
        if (!placed.ok) return StageResult::failure(JobError::Finalize, placed.error);
        ctx.output(">> Saved \"" + placed.destination.string() + "\"");
        Logger::log(LogLevel::Debug, "Placed " + placed.destination.string(), tag);

        std::vector<std::string> secondary;
        if (!job.secondary_output_ext.empty()) secondary.push_back(job.secondary_output_ext);
        if (job.primary_output_ext == "gdi") {
            for (const char* track_ext : {"bin", "raw"}) {
                if (std::find(secondary.begin(), secondary.end(), track_ext) == secondary.end()) {
                    secondary.emplace_back(track_ext);
                }
            }
        }

        for (const auto& ext : secondary) {
            for (const auto& file : find_outputs(workspace.output_dir(), ext)) {
                const fs::path relative = file.lexically_relative(workspace.output_dir());
                const auto moved = place_output(file, prepared.destination_dir / relative, job.overwrite_allowed);
                if (!moved.ok) {
                    ctx.error("WARNING: could not move \"" + relative.string() + "\": " + moved.error);
                    Logger::log(LogLevel::Warning, "Secondary output not moved: " + moved.error, tag);
                }
            }
        }
        return StageResult::success();
    }

    void JobPipeline::dispose_sources(JobContext& ctx) {
        const fs::path& input = ctx.job().input_path;
        std::vector<fs::path> targets = companion_files(input);
        targets.insert(targets.begin(), input);

        for (const auto& target : targets) {
            std::string detail;
            const auto method = dispose_source(target, detail);
            if (method == DisposalMethod::Failed) {
                ctx.error("WARNING: could not delete source \"" + target.filename().string() + "\": " + detail);
                Logger::log(LogLevel::Warning, "Source not deleted: " + target.string() + " (" + detail + ")",
                            job_tag(ctx));
            } else if (method != DisposalMethod::Missing) {
                ctx.output(">> Source \"" + target.filename().string() + "\" " + disposal_method_to_string(method));
            }
        }
    }

} // namespace convoy
