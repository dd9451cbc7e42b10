/**
 * Atlas packer job pipeline
 */

#include "tessera/atlas/packer.hpp"
#include "tessera/atlas/assembler.hpp"
#include "tessera/atlas/index.hpp"
#include "tessera/image/png_codec.hpp"
#include "tessera/core/logger.hpp"
#include <algorithm>
#include <chrono>
#include <fmt/format.h>
#include <future>
#include <string_view>
#include <system_error>

namespace tessera::atlas {

namespace fs = std::filesystem;

namespace {

Logger& logger() {
    return logging::get("packer");
}

fs::path temporary_path(const fs::path& path) {
    fs::path tmp = path;
    tmp += ".tmp";
    return tmp;
}

void remove_quietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        logger().warn_fmt("could not remove {}: {}", path.string(), ec.message());
    }
}

bool is_grid_token(std::string_view text) {
    const usize x = text.find('x');
    if (x == 0 || x == std::string_view::npos || x + 1 == text.size()) {
        return false;
    }
    return std::all_of(text.begin(), text.end(), [](char c) { return c == 'x' || (c >= '0' && c <= '9'); }) &&
           text.find('x', x + 1) == std::string_view::npos;
}

// Atlases of this size from earlier runs with another grid, except `keep`
void remove_stale_atlases(const fs::path& directory, u32 icon_size, const fs::path& keep) {
    constexpr std::string_view prefix = "texture_atlas_";
    const std::string suffix = fmt::format("_{}px.png", icon_size);

    std::error_code ec;
    std::vector<fs::path> stale;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (it->path() == keep || name.size() <= prefix.size() + suffix.size() ||
            !name.starts_with(prefix) || !name.ends_with(suffix)) {
            continue;
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        const std::string_view grid = std::string_view(name).substr(
            prefix.size(), name.size() - prefix.size() - suffix.size());
        if (is_grid_token(grid)) {
            stale.push_back(it->path());
        }
    }
    if (ec) {
        logger().warn_fmt("could not scan {}: {}", directory.string(), ec.message());
    }
    for (const auto& path : stale) {
        logger().info_fmt("removing stale atlas {}", path.string());
        remove_quietly(path);
    }
}

JobReport fail(JobReport report, PackError error) {
    logger().error_fmt("{} @ {}px failed: {}", report.category, report.icon_size, error.to_string());
    report.status = JobStatus::Failed;
    report.error = std::move(error);
    return report;
}

} // anonymous namespace

std::string atlas_file_name(u32 columns, u32 rows, u32 icon_size) {
    return fmt::format("texture_atlas_{}x{}_{}px.png", columns, rows, icon_size);
}

std::string index_file_name(u32 icon_size) {
    return fmt::format("icon_mapping_{}.txt", icon_size);
}

// ============================================================================
// BatchReport
// ============================================================================

usize BatchReport::count(JobStatus status) const {
    return static_cast<usize>(std::count_if(jobs.begin(), jobs.end(),
        [status](const JobReport& job) { return job.status == status; }));
}

usize BatchReport::warning_count() const {
    usize warnings = 0;
    for (const auto& job : jobs) {
        warnings += job.fallbacks.size();
    }
    return warnings;
}

// ============================================================================
// Single job
// ============================================================================

JobReport AtlasPacker::run_job(const Category& category, u32 icon_size) const {
    JobReport report;
    report.category = category.name;
    report.slug = category.slug;
    report.icon_size = icon_size;
    report.icon_count = category.icons.size();

    if (category.icons.empty()) {
        logger().info_fmt("{} @ {}px: no icons, skipping", category.name, icon_size);
        report.status = JobStatus::Skipped;
        report.error = PackError::empty_set(category.name + " has no icons");
        return report;
    }

    logger().info_fmt("{} @ {}px: packing {} icons", category.name, icon_size, category.icons.size());
    auto start = std::chrono::steady_clock::now();

    AtlasAssembler assembler(m_rasterizer, m_config.assembler_options());
    auto assembled = assembler.assemble(category.icons, m_config.grid_for(icon_size));
    if (assembled.is_err()) {
        return fail(std::move(report), std::move(assembled).error());
    }
    AssembledAtlas atlas = std::move(assembled).value();
    report.fallbacks = atlas.fallbacks;

    const fs::path directory = m_config.output_root / category.slug;
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        return fail(std::move(report), PackError::write_error(
            fmt::format("cannot create {}: {}", directory.string(), ec.message())));
    }

    const std::string atlas_name = atlas_file_name(atlas.layout.columns, atlas.layout.rows, icon_size);
    const fs::path atlas_path = directory / atlas_name;
    const fs::path index_path = directory / index_file_name(icon_size);
    const fs::path atlas_tmp = temporary_path(atlas_path);
    const fs::path index_tmp = temporary_path(index_path);

    auto written = image::write_png(atlas_tmp, atlas.canvas);
    if (written.is_ok()) {
        IndexHeader header{category.name, atlas_name, m_config.supersample};
        written = write_index_file(index_tmp, category.icons, atlas.layout, header);
    }
    if (written.is_err()) {
        remove_quietly(atlas_tmp);
        remove_quietly(index_tmp);
        return fail(std::move(report), std::move(written).error());
    }

    // Commit: atlas first, then index
    fs::rename(atlas_tmp, atlas_path, ec);
    if (ec) {
        remove_quietly(atlas_tmp);
        remove_quietly(index_tmp);
        return fail(std::move(report), PackError::write_error(
            fmt::format("cannot rename to {}: {}", atlas_path.string(), ec.message())));
    }
    fs::rename(index_tmp, index_path, ec);
    if (ec) {
        // No pair survives: the new atlas, the previous index and older atlases go
        remove_quietly(atlas_path);
        remove_quietly(index_tmp);
        std::error_code type_ec;
        if (fs::is_regular_file(index_path, type_ec)) {
            remove_quietly(index_path);
        }
        remove_stale_atlases(directory, icon_size, atlas_path);
        return fail(std::move(report), PackError::write_error(
            fmt::format("cannot rename to {}: {}", index_path.string(), ec.message())));
    }

    remove_stale_atlases(directory, icon_size, atlas_path);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    report.status = JobStatus::Succeeded;
    report.atlas_path = atlas_path;
    report.index_path = index_path;

    if (report.fallbacks.empty()) {
        logger().info_fmt("{} @ {}px: wrote {} ({}ms)", category.name, icon_size,
                          atlas_path.string(), elapsed.count());
    } else {
        logger().warn_fmt("{} @ {}px: wrote {} with {} fallback icon(s) ({}ms)", category.name,
                          icon_size, atlas_path.string(), report.fallbacks.size(), elapsed.count());
    }
    return report;
}

// ============================================================================
// Batch
// ============================================================================

PackResult<BatchReport> AtlasPacker::run_batch(const std::vector<Category>& categories) const {
    auto valid = m_config.validate();
    if (valid.is_err()) {
        return make_error(std::move(valid).error());
    }

    struct Job {
        const Category* category;
        u32 icon_size;
    };

    std::vector<Job> jobs;
    for (const auto& category : categories) {
        for (u32 size : m_config.icon_sizes) {
            jobs.push_back({&category, size});
        }
    }

    BatchReport batch;
    batch.jobs.resize(jobs.size());

    const usize workers = std::min<usize>(m_config.parallel_jobs, std::max<usize>(jobs.size(), 1));
    if (workers <= 1) {
        for (usize i = 0; i < jobs.size(); ++i) {
            batch.jobs[i] = run_job(*jobs[i].category, jobs[i].icon_size);
        }
    } else {
        std::vector<std::future<void>> tasks;
        tasks.reserve(workers);
        for (usize w = 0; w < workers; ++w) {
            tasks.push_back(std::async(std::launch::async, [&, w]() {
                for (usize i = w; i < jobs.size(); i += workers) {
                    batch.jobs[i] = run_job(*jobs[i].category, jobs[i].icon_size);
                }
            }));
        }
        for (auto& task : tasks) {
            task.get();
        }
    }

    logger().info_fmt("{} job(s): {} succeeded, {} skipped, {} failed",
                      batch.jobs.size(),
                      batch.count(JobStatus::Succeeded),
                      batch.count(JobStatus::Skipped),
                      batch.failed_count());
    return batch;
}

} // namespace tessera::atlas
