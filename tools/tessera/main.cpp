/**
 * tessera - pack SVG icon directories into texture atlases
 * Usage: tessera [options] <input-dir>
 */

#include "options.hpp"
#include "tessera/atlas/packer.hpp"
#include "tessera/atlas/rasterizer.hpp"
#include "tessera/catalog/walker.hpp"
#include "tessera/core/logger.hpp"
#include <iostream>
#include <memory>

using namespace tessera;

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = cli::parse_arguments(args);
    if (parsed.is_err()) {
        std::cerr << "Error: " << parsed.error() << "\n\n" << cli::usage(argv[0]);
        return 2;
    }
    const cli::Options& options = parsed.value();
    if (options.show_help) {
        std::cout << cli::usage(argv[0]);
        return 0;
    }

    logging::init();
    if (options.verbose) {
        logging::set_level(LogLevel::Debug);
    } else if (options.quiet) {
        logging::set_level(LogLevel::Warn);
    } else {
        logging::set_level(LogLevel::Info);
    }

    if (options.log_file) {
        auto sink = std::make_unique<FileSink>(options.log_file->string().c_str());
        if (!sink->is_open()) {
            std::cerr << "Error: Cannot open log file: " << options.log_file->string() << "\n";
            logging::shutdown();
            return 2;
        }
        logging::add_sink(std::move(sink));
    }

    auto& log = logging::get("tessera");

    auto valid = options.config.validate();
    if (valid.is_err()) {
        log.error(valid.error().to_string());
        logging::shutdown();
        return 2;
    }

    auto discovered = catalog::discover(options.input_root, options.config.capacity());
    if (discovered.is_err()) {
        log.error(discovered.error().to_string());
        logging::shutdown();
        return 1;
    }
    const catalog::Discovery& discovery = discovered.value();

    if (discovery.categories.empty() && discovery.rejected.empty()) {
        log.warn_fmt("no icons found under {}", options.input_root.string());
    }

    atlas::SvgRasterizer rasterizer;
    atlas::AtlasPacker packer(options.config, rasterizer);

    auto batch = packer.run_batch(discovery.categories);
    if (batch.is_err()) {
        log.error(batch.error().to_string());
        logging::shutdown();
        return 2;
    }

    const atlas::BatchReport& report = batch.value();
    for (const auto& job : report.jobs) {
        if (job.status == atlas::JobStatus::Succeeded) {
            std::cout << job.atlas_path.string() << "\n";
        }
    }

    const usize failures = report.failed_count() + discovery.rejected.size();
    if (report.warning_count() > 0) {
        log.warn_fmt("{} icon(s) replaced by the fallback raster", report.warning_count());
    }
    if (failures > 0) {
        log.error_fmt("{} failure(s)", failures);
    }

    logging::shutdown();
    return failures > 0 ? 1 : 0;
}
