#include "../../include/external_routines.hpp"
#include "../../include/job_context.hpp"

namespace convoy {

namespace fs = std::filesystem;

std::string MaxcsoCompressRoutine::tool(const EngineConfig& settings) const {
    return settings.tool_maxcso;
}

bool MaxcsoCompressRoutine::convert(const fs::path& staged_input,
                                    const fs::path& workspace_dir,
                                    const std::string& base_name,
                                    JobContext& ctx) {
    const auto& s = ctx.settings();
    const fs::path output = workspace_dir / (base_name + ".cso");
    ctx.output(">> Compressing ISO to CSO: \"" + staged_input.filename().string() + "\"");

    const auto result = ctx.run_tool({s.tool_maxcso, staged_input.string(), "-o", output.string()});
    if (!result.launched || result.timed_out) return false;

    std::error_code ec;
    if (result.exit_code != 0) {
        // maxcso reports some recoverable sector issues through its exit code
        if (!fs::exists(output, ec)) {
            ctx.error("ERROR: maxcso compression failed and output CSO missing.");
            return false;
        }
        ctx.error("WARNING: maxcso returned an error code, but output CSO exists. Assuming success.");
    }
    return require_output(output, ctx);
}

} // namespace convoy
