// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include "PotentialFlow/utils/Profiler.hpp"
#include "PotentialFlow/utils/Logger.hpp"
#include <iomanip>
#include <algorithm>
#include <vector>
#include <sstream>

namespace pflow {

void Profiler::beginSession(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_CurrentSessionName = name;
    m_Results.clear();
    LOG_INFO("Profiler session started: '{}'", m_CurrentSessionName);
}

void Profiler::endSession() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    printResults();
    m_Results.clear();
    LOG_INFO("Profiler session ended: '{}'", m_CurrentSessionName);
}

void Profiler::submitResult(const ProfileResult& result) {
    std::lock_guard<std::mutex> lock(m_Mutex);

    auto it = m_Results.find(result.name);
    if (it == m_Results.end()) {
        ProfileResult first = result;
        first.minTime = result.totalTime;
        first.maxTime = result.totalTime;
        m_Results[result.name] = first;
    } else {
        it->second.count++;
        it->second.totalTime += result.totalTime;
        it->second.minTime = std::min(it->second.minTime, result.totalTime);
        it->second.maxTime = std::max(it->second.maxTime, result.totalTime);
    }
}

std::map<std::string, ProfileResult> Profiler::results() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    return m_Results;
}

void Profiler::printResults() {
    // build the whole table first so it is emitted as a single log record
    std::stringstream report;

    report << std::fixed << std::setprecision(3);
    report << "\n\n"
           << "==================== Profiler Report: " << m_CurrentSessionName << " ====================\n"
           << std::left << std::setw(40) << "Scope Name"
           << std::setw(12) << "Avg (ms)"
           << std::setw(12) << "Total (ms)"
           << std::setw(12) << "Min (ms)"
           << std::setw(12) << "Max (ms)"
           << std::setw(10) << "Calls" << "\n"
           << std::string(97, '-') << "\n";

    std::vector<ProfileResult> sorted_results;
    for (const auto& pair : m_Results) {
        sorted_results.push_back(pair.second);
    }
    std::sort(sorted_results.begin(), sorted_results.end(), [](const auto& a, const auto& b) {
        return a.totalTime > b.totalTime;
    });

    for (const auto& result : sorted_results) {
        double avgTime = result.count > 0 ? result.totalTime / result.count : 0.0;

        report << std::left << std::setw(40) << result.name
               << std::setw(12) << avgTime
               << std::setw(12) << result.totalTime
               << std::setw(12) << result.minTime
               << std::setw(12) << result.maxTime
               << std::setw(10) << result.count << "\n";
    }

    report << std::string(97, '=') << "\n";

    LOG_INFO("{}", report.str());
}

ProfileTimer::ProfileTimer(const char* name)
    : m_Name(name) {
    m_StartTimepoint = std::chrono::high_resolution_clock::now();
}

ProfileTimer::~ProfileTimer() {
    auto endTimepoint = std::chrono::high_resolution_clock::now();
    long long start = std::chrono::time_point_cast<std::chrono::microseconds>(m_StartTimepoint).time_since_epoch().count();
    long long end = std::chrono::time_point_cast<std::chrono::microseconds>(endTimepoint).time_since_epoch().count();
    double duration = (end - start) * 0.001;
    Profiler::get().submitResult({m_Name, 1, duration});
}

} // namespace pflow
