/**
 * @file profile.cpp
 * @brief Implementation of the section profiler described in profile.hpp
 */

#include "rrect/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Profiling {

Profiler& Profiler::instance() {
    static Profiler profiler;
    return profiler;
}

void Profiler::startSection(const std::string& name) {
    auto& self    = instance();
    auto& section = self.sections[name];
    section.start_time = Clock::now();

    std::string parentName;
    if (!self.open_sections.empty()) {
        parentName = self.open_sections.top();
    }

    // A section called from a different parent moves in the tree
    if (section.stats.parent_name != parentName) {
        if (!section.stats.parent_name.empty()) {
            auto& oldSiblings = self.sections[section.stats.parent_name].stats.children;
            oldSiblings.erase(std::remove(oldSiblings.begin(), oldSiblings.end(), name),
                              oldSiblings.end());
        }
        section.stats.parent_name = parentName;
    }

    if (!parentName.empty()) {
        auto& siblings = self.sections[parentName].stats.children;
        if (std::find(siblings.begin(), siblings.end(), name) == siblings.end()) {
            siblings.push_back(name);
        }
    }

    self.open_sections.push(name);
}

void Profiler::endSection(const std::string& name) {
    auto& self = instance();

    if (self.open_sections.empty() || self.open_sections.top() != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name
                  << "\") does not match the innermost open section.\n";
        return;
    }

    auto& stats = self.sections[name].stats;
    Duration const elapsed =
        std::chrono::duration_cast<Duration>(Clock::now() - self.sections[name].start_time);

    stats.total_time += elapsed;
    stats.self_time  += elapsed;
    stats.call_count += 1;
    stats.min_time = std::min(stats.min_time, elapsed);
    stats.max_time = std::max(stats.max_time, elapsed);

    if (!stats.parent_name.empty()) {
        self.sections[stats.parent_name].stats.self_time -= elapsed;
    }

    self.open_sections.pop();
}

std::optional<Profiler::SectionStats> Profiler::getStats(const std::string& name) {
    const auto& self = instance();
    auto it = self.sections.find(name);
    if (it == self.sections.end() || it->second.stats.call_count == 0) {
        return std::nullopt;
    }
    return it->second.stats;
}

void Profiler::printStats() {
    auto& self = instance();
    std::cout << "\nProfiling Statistics:\n";

    std::vector<std::string> roots;
    Duration totalTime{0};
    for (const auto& [name, section] : self.sections) {
        if (section.stats.parent_name.empty()) {
            roots.push_back(name);
            totalTime += section.stats.total_time;
        }
    }
    std::sort(roots.begin(), roots.end());

    for (size_t i = 0; i < roots.size(); ++i) {
        printNode(roots[i], "", i == roots.size() - 1, totalTime);
    }
}

void Profiler::printNode(const std::string& name,
                         const std::string& prefix,
                         bool isLast,
                         Duration totalTime)
{
    const auto& stats = instance().sections.at(name).stats;

    double totalPercent = 0.0;
    double selfPercent = 0.0;
    if (totalTime.count() > 0) {
        totalPercent = (stats.total_time.count() * 100.0) / totalTime.count();
        selfPercent  = (stats.self_time.count()  * 100.0) / totalTime.count();
    }

    double const totalMs = std::chrono::duration<double, std::milli>(stats.total_time).count();
    double const avgUs = stats.call_count > 0
        ? std::chrono::duration<double, std::micro>(stats.total_time).count() / stats.call_count
        : 0.0;

    std::cout << prefix << (isLast ? "└── " : "├── ")
              << name << " [" << stats.call_count << " calls] "
              << std::fixed << std::setprecision(2)
              << totalMs << "ms, avg " << avgUs << "us (total: "
              << totalPercent << "%, self: " << selfPercent << "%)\n";

    std::string const childPrefix = prefix + (isLast ? "    " : "│   ");
    for (size_t i = 0; i < stats.children.size(); ++i) {
        printNode(stats.children[i], childPrefix, i == stats.children.size() - 1, totalTime);
    }
}

void Profiler::reset() {
    auto& self = instance();
    self.sections.clear();
    while (!self.open_sections.empty()) {
        self.open_sections.pop();
    }
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
{
    Profiler::startSection(section_name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(section_name);
}

} // namespace Profiling
