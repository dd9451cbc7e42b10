#pragma once

#include "config.hpp"
#include "icon_source.hpp"
#include "rasterizer.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::atlas {

// ============================================================================
// Category - one named icon set, packed once per configured size
// ============================================================================

struct Category {
    std::string name;
    std::string slug;   // Output directory name under PackerConfig::output_root
    IconSet icons;
};

// texture_atlas_{columns}x{rows}_{size}px.png
[[nodiscard]] std::string atlas_file_name(u32 columns, u32 rows, u32 icon_size);

// icon_mapping_{size}.txt
[[nodiscard]] std::string index_file_name(u32 icon_size);

// ============================================================================
// Job reports
// ============================================================================

enum class JobStatus : u8 {
    Succeeded,
    Skipped,    // Empty icon set, nothing written
    Failed
};

[[nodiscard]] constexpr std::string_view job_status_name(JobStatus status) {
    switch (status) {
        case JobStatus::Succeeded: return "succeeded";
        case JobStatus::Skipped:   return "skipped";
        case JobStatus::Failed:    return "failed";
    }
    return "unknown";
}

struct JobReport {
    std::string category;
    std::string slug;
    u32 icon_size{0};
    JobStatus status{JobStatus::Failed};

    std::filesystem::path atlas_path;
    std::filesystem::path index_path;
    usize icon_count{0};

    // Icons replaced by the fallback raster
    std::vector<std::string> fallbacks;

    std::optional<PackError> error;
};

struct BatchReport {
    std::vector<JobReport> jobs;

    [[nodiscard]] usize count(JobStatus status) const;
    [[nodiscard]] usize failed_count() const { return count(JobStatus::Failed); }
    [[nodiscard]] usize warning_count() const;
    [[nodiscard]] bool ok() const { return failed_count() == 0; }
};

// ============================================================================
// AtlasPacker - per (category, size) job pipeline
// ============================================================================

class AtlasPacker {
public:
    AtlasPacker(PackerConfig config, const IconRasterizer& rasterizer)
        : m_config(std::move(config))
        , m_rasterizer(rasterizer)
    {}

    [[nodiscard]] const PackerConfig& config() const noexcept { return m_config; }

    /**
     * Pack one category at one icon size.
     *
     * Writes output_root/<slug>/texture_atlas_*.png and icon_mapping_*.txt.
     * Both files go to temporary names first and are renamed only once both
     * were written; on failure nothing from this job is left behind. An empty
     * set is Skipped and writes nothing.
     */
    [[nodiscard]] JobReport run_job(const Category& category, u32 icon_size) const;

    /**
     * Run every (category, size) job, up to parallel_jobs at a time. Reports
     * are in category order, then size order. Fails only when the
     * configuration itself is invalid; job failures are in the report.
     */
    [[nodiscard]] PackResult<BatchReport> run_batch(const std::vector<Category>& categories) const;

private:
    PackerConfig m_config;
    const IconRasterizer& m_rasterizer;
};

} // namespace tessera::atlas
