/**
 * @file profile.hpp
 * @brief Scope timing for the physics phases
 *
 * Each system update opens a named section. Sections nest (a tick contains
 * integration, grid refresh and collision resolution), and the profiler keeps
 * call counts, total time and self time per section.
 *
 * Example usage:
 * @code
 * void CollisionResolverSystem::update(...) {
 *     RRECT_PROFILE_SCOPE("CollisionResolverSystem");
 *     // ... code ...
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stack>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide timing table. All methods are static.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated statistics for one named section
     */
    struct SectionStats {
        Duration total_time{0};        ///< Accumulated total time
        Duration self_time{0};         ///< Total time minus nested sections
        uint64_t call_count{0};        ///< Number of completed entries
        Duration min_time{Duration::max()};
        Duration max_time{0};

        std::string parent_name;       ///< Enclosing section, empty for roots
        std::vector<std::string> children;
    };

    /**
     * @brief Opens a section and makes it the current parent.
     */
    static void startSection(const std::string& name);

    /**
     * @brief Closes a section. Must match the innermost open section.
     */
    static void endSection(const std::string& name);

    /**
     * @brief Statistics for a section, or nullopt if it never ran.
     */
    static std::optional<SectionStats> getStats(const std::string& name);

    /**
     * @brief Prints the section tree with times and percentages to stdout.
     */
    static void printStats();

    /**
     * @brief Drops all recorded sections.
     */
    static void reset();

private:
    struct Section {
        TimePoint start_time;
        SectionStats stats;
    };

    std::unordered_map<std::string, Section> sections;
    std::stack<std::string> open_sections;

    Profiler() = default;

    static Profiler& instance();

    static void printNode(const std::string& name,
                          const std::string& prefix,
                          bool is_last,
                          Duration total_time);
};

/**
 * @brief RAII guard: starts a section on construction, ends it on destruction.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
};

} // namespace Profiling

#define RRECT_PROFILE_CONCAT_INNER(a, b) a##b
#define RRECT_PROFILE_CONCAT(a, b) RRECT_PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the enclosing scope under the given section name.
 */
#define RRECT_PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler RRECT_PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
